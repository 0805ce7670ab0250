#include "config/config_loader.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>

#include "utils/logging.hpp"

namespace runbox::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::logic_error&) {
        utils::LogWarn("config", "ignoring non-integer value", {{"value", value}});
        return fallback;
    }
}

void ApplyInt(const nlohmann::json& section, const char* key, int& target) {
    if (section.contains(key) && section[key].is_number_integer()) {
        target = section[key].get<int>();
    }
}

void ApplyString(const nlohmann::json& section, const char* key, std::string& target) {
    if (section.contains(key) && section[key].is_string()) {
        target = section[key].get<std::string>();
    }
}

void ApplyEnvInt(const char* primary, const char* secondary, int& target) {
    const auto value = GetEnvFallback(primary, secondary);
    if (!value.empty()) {
        target = ParseInt(value, target);
    }
}

}  // namespace

std::filesystem::path DefaultConfigPath() {
    const auto explicit_path = GetEnv("RUNBOX_CONFIG");
    if (!explicit_path.empty()) {
        return explicit_path;
    }
    return GetHomePath() / ".runbox" / "config.json";
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("server") && data["server"].is_object()) {
        const auto& server = data["server"];
        ApplyString(server, "host", config.server.host);
        ApplyInt(server, "port", config.server.port);
        ApplyInt(server, "workers", config.server.workers);
    }

    if (data.contains("limits") && data["limits"].is_object()) {
        const auto& limits = data["limits"];
        ApplyInt(limits, "runTimeoutS", config.limits.run_timeout_s);
        ApplyInt(limits, "compileTimeoutS", config.limits.compile_timeout_s);
        ApplyInt(limits, "maxCodeChars", config.limits.max_code_chars);
        ApplyInt(limits, "maxOutputChars", config.limits.max_output_chars);
        ApplyInt(limits, "memoryLimitMb", config.limits.memory_limit_mb);
        ApplyInt(limits, "cpuLimitS", config.limits.cpu_limit_s);
    }

    if (data.contains("workspace") && data["workspace"].is_object()) {
        ApplyString(data["workspace"], "root", config.workspace.root);
    }

    if (data.contains("log") && data["log"].is_object()) {
        ApplyString(data["log"], "level", config.log.level);
    }
}

void ApplyConfigFromEnv(Config& config) {
    const auto host = GetEnvFallback("RUNBOX_SERVER__HOST", "RUNBOX_SERVER_HOST");
    if (!host.empty()) {
        config.server.host = host;
    }
    // PORT is what container platforms hand us.
    ApplyEnvInt("PORT", "RUNBOX_SERVER__PORT", config.server.port);
    ApplyEnvInt("RUNBOX_SERVER__WORKERS", "RUNBOX_SERVER_WORKERS", config.server.workers);

    ApplyEnvInt("RUNBOX_LIMITS__RUN_TIMEOUT_S", "RUNBOX_RUN_TIMEOUT_S", config.limits.run_timeout_s);
    ApplyEnvInt("RUNBOX_LIMITS__COMPILE_TIMEOUT_S", "RUNBOX_COMPILE_TIMEOUT_S",
                config.limits.compile_timeout_s);
    ApplyEnvInt("RUNBOX_LIMITS__MAX_CODE_CHARS", "RUNBOX_MAX_CODE_CHARS", config.limits.max_code_chars);
    ApplyEnvInt("RUNBOX_LIMITS__MAX_OUTPUT_CHARS", "RUNBOX_MAX_OUTPUT_CHARS",
                config.limits.max_output_chars);
    ApplyEnvInt("RUNBOX_LIMITS__MEMORY_LIMIT_MB", "RUNBOX_MEMORY_LIMIT_MB", config.limits.memory_limit_mb);
    ApplyEnvInt("RUNBOX_LIMITS__CPU_LIMIT_S", "RUNBOX_CPU_LIMIT_S", config.limits.cpu_limit_s);

    const auto workspace_root = GetEnvFallback("RUNBOX_WORKSPACE__ROOT", "RUNBOX_WORKSPACE_ROOT");
    if (!workspace_root.empty()) {
        config.workspace.root = workspace_root;
    }

    const auto log_level = GetEnvFallback("RUNBOX_LOG__LEVEL", "RUNBOX_LOG_LEVEL");
    if (!log_level.empty()) {
        config.log.level = log_level;
    }
}

Config LoadConfig(const std::filesystem::path& config_path) {
    Config config{};

    if (std::filesystem::exists(config_path)) {
        try {
            std::ifstream input(config_path);
            nlohmann::json data;
            input >> data;
            ApplyConfigFromJson(config, data);
        } catch (const nlohmann::json::exception& ex) {
            // Keep defaults on parse errors
            utils::LogWarn("config", "failed to parse config file",
                           {{"path", config_path.string()}, {"error", ex.what()}});
        }
    }

    ApplyConfigFromEnv(config);

    config.server.workers = std::max(1, config.server.workers);
    if (config.limits.cpu_limit_s < 0) {
        config.limits.cpu_limit_s = config.limits.run_timeout_s + 1;
    }
    return config;
}

Config LoadConfig() {
    return LoadConfig(DefaultConfigPath());
}

}  // namespace runbox::config
