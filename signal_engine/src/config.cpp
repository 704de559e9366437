#include "config.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

Config Config::from_env() {
    Config cfg;

    cfg.rules_path = get_env("RULES_PATH", "config/rules.json");
    cfg.strict_batch = get_env_int("STRICT_BATCH", 0) != 0;

    cfg.service_name = get_env("SERVICE_NAME", "signal_engine");
    cfg.log_level = get_env("LOG_LEVEL", "info");

    return cfg;
}

void Config::validate() const {
    if (rules_path.empty()) {
        throw std::runtime_error("RULES_PATH is required");
    }
    if (!std::filesystem::exists(rules_path)) {
        throw std::runtime_error("Rules file not found: " + rules_path);
    }

    spdlog::info("Configuration validated successfully");
    spdlog::info("  Rules: {}", rules_path);
    spdlog::info("  Strict batch: {}", strict_batch ? "yes" : "no");
}
