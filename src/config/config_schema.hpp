#pragma once

#include <string>

namespace runbox::config {

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 10000;
    int workers = 4;
};

struct LimitsConfig {
    int run_timeout_s = 5;
    int compile_timeout_s = 10;
    int max_code_chars = 10000;
    int max_output_chars = 50000;
    // 0 disables the limit
    int memory_limit_mb = 256;
    // negative means run_timeout_s + 1, 0 disables the limit
    int cpu_limit_s = -1;
};

struct WorkspaceConfig {
    // empty means <temp>/runbox
    std::string root;
};

struct LogSettings {
    std::string level = "info";
};

struct Config {
    ServerConfig server;
    LimitsConfig limits;
    WorkspaceConfig workspace;
    LogSettings log;
};

}  // namespace runbox::config
