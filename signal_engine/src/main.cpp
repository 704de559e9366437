#include "config.hpp"
#include "rule_table.hpp"
#include "price_book.hpp"
#include "pipeline.hpp"
#include "assembler.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <signal.h>
#include <atomic>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

std::atomic<bool> reload_requested{false};

void signal_handler(int signal) {
    if (signal == SIGHUP) {
        reload_requested = true;
    }
}

void setup_logging(const std::string& log_level) {
    // stdout carries the JSON records
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("signal_engine", console_sink);

    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

void emit(const std::string& input, const PipelineResult& result) {
    nlohmann::json out;
    if (result.is_valid()) {
        out = SignalAssembler::to_json(*result.record);
    } else {
        out = SignalAssembler::to_json(*result.error);
        out["input"] = input;
    }
    std::cout << out.dump() << std::endl;
}

int main(int argc, char* argv[]) {
    try {
        auto config = Config::from_env();

        setup_logging(config.log_level);

        spdlog::info("==============================================");
        spdlog::info("Signal Engine v1.0 ({})", config.service_name);
        spdlog::info("==============================================");

        config.validate();

        signal(SIGHUP, signal_handler);

        // Rule errors are fatal here: nothing can be computed without a table
        auto doc = load_json_file(config.rules_path);
        auto rules = std::make_shared<const RuleTable>(RuleTable::load(doc));
        SignalPipeline pipeline(rules, PriceBook::from_json(doc));

        std::vector<std::string> inputs(argv + 1, argv + argc);
        bool from_stdin = inputs.empty();

        auto handle = [&](const std::string& line) {
            if (reload_requested.exchange(false)) {
                if (pipeline.reload_file(config.rules_path)) {
                    spdlog::info("Reloaded {}", config.rules_path);
                }
            }
            std::string text = util::trim(line);
            if (text.empty() || text[0] == '#') return;
            emit(text, pipeline.process(text));
        };

        if (from_stdin) {
            std::string line;
            while (std::getline(std::cin, line)) {
                handle(line);
            }
        } else {
            for (const auto& input : inputs) {
                handle(input);
            }
        }

        spdlog::info("Done: {} signals, {} rejected",
                     pipeline.signals_generated(), pipeline.errors());

        if (config.strict_batch && pipeline.errors() > 0) {
            return 2;
        }
        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
