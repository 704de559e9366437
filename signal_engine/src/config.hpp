#pragma once

#include <string>
#include <cstdlib>
#include <stdexcept>

struct Config {
    // Rules
    std::string rules_path;

    // Batch behaviour
    bool strict_batch;  // non-zero exit when any instruction was rejected

    // Service
    std::string service_name;
    std::string log_level;

    static Config from_env();
    void validate() const;

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
};
