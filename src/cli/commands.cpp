#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "api/json_codec.hpp"
#include "config/config_loader.hpp"
#include "engine/execution_engine.hpp"
#include "languages/language_registry.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"
#include "httplib.h"
#include "nlohmann/json.hpp"

namespace {

constexpr const char* kVersion = "1.0.0";
constexpr const char* kJsonContentType = "application/json";

volatile std::sig_atomic_t g_signal = 0;

void HandleSignal(int signal) {
    g_signal = signal;
}

void PrintUsage() {
    std::cout << "Usage:\n"
              << "  runbox serve\n"
              << "  runbox run <file> [--lang <id>] [--input <file>]\n"
              << "  runbox languages\n"
              << "  runbox check" << std::endl;
}

std::optional<std::string> ReadFile(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::in | std::ios::binary);
    if (!input.is_open()) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

void ApplyLogConfig(const runbox::config::Config& config) {
    runbox::utils::LogConfig log_config{};
    log_config.min_level = runbox::utils::ParseLogLevel(config.log.level, log_config.min_level);
    runbox::utils::SetLogConfig(log_config);
}

bool ReportMissingToolchains() {
    const auto missing = runbox::languages::LanguageRegistry::Instance().MissingToolchains();
    if (missing.empty()) {
        return false;
    }
    std::cerr << "[check] missing toolchains: " << runbox::utils::Join(missing, ", ") << std::endl;
    return true;
}

void SendJson(httplib::Response& res, int status, const nlohmann::json& body) {
    res.status = status;
    res.set_content(runbox::api::Dump(body), kJsonContentType);
}

int RunServer(const runbox::config::Config& config) {
    if (ReportMissingToolchains()) {
        std::cout << "Refusing to start: install the missing toolchains first." << std::endl;
        return 1;
    }

    const runbox::engine::ExecutionEngine engine(runbox::engine::EngineOptions::FromConfig(config));
    const auto& registry = runbox::languages::LanguageRegistry::Instance();

    httplib::Server http_server;
    const auto workers = static_cast<std::size_t>(config.server.workers);
    http_server.new_task_queue = [workers] { return new httplib::ThreadPool(workers); };
    http_server.set_default_headers({
        {"Access-Control-Allow-Origin", "*"},
        {"Access-Control-Allow-Headers", "Content-Type"},
        {"Access-Control-Allow-Methods", "GET, POST, OPTIONS"}});

    http_server.Get("/", [](const httplib::Request&, httplib::Response& res) {
        SendJson(res, 200, {
            {"name", "runbox"},
            {"version", kVersion},
            {"endpoints", {
                {"/health", "Health check"},
                {"/run", "Execute code (POST)"},
                {"/languages", "Supported languages (GET)"}}}});
    });

    http_server.Get("/health", [](const httplib::Request&, httplib::Response& res) {
        const auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        SendJson(res, 200, {
            {"status", "healthy"},
            {"version", kVersion},
            {"timestamp", static_cast<double>(now) / 1000.0}});
    });

    http_server.Get("/languages", [&registry](const httplib::Request&, httplib::Response& res) {
        SendJson(res, 200, runbox::api::LanguagesToJson(registry));
    });

    http_server.Options("/run", [](const httplib::Request&, httplib::Response& res) {
        res.status = 204;
    });

    http_server.Post("/run", [&engine](const httplib::Request& req, httplib::Response& res) {
        const auto parsed = runbox::api::ParseRequestBody(req.body);
        if (!parsed.ok) {
            SendJson(res, 400, {{"success", false}, {"error", parsed.error}});
            return;
        }
        const auto result = engine.Execute(parsed.request);
        SendJson(res, runbox::api::HttpStatusFor(result), runbox::api::ToJson(result));
    });

    http_server.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        runbox::utils::LogInfo("http", "request", {
            {"method", req.method},
            {"path", req.path},
            {"status", std::to_string(res.status)}});
    });

    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    const std::string host = config.server.host;
    const int port = config.server.port;
    std::atomic<bool> listen_failed{false};
    std::thread http_thread([&http_server, &listen_failed, host, port]() {
        if (!http_server.listen(host, port)) {
            runbox::utils::LogError("http", "failed to listen",
                                    {{"host", host}, {"port", std::to_string(port)}});
            listen_failed.store(true);
        }
    });

    std::cout << "runbox listening on " << host << ":" << port
              << " (workers=" << workers << "). Press Ctrl+C to stop." << std::endl;
    while (g_signal == 0 && !listen_failed.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    http_server.stop();
    if (http_thread.joinable()) {
        http_thread.join();
    }
    return listen_failed.load() ? 1 : 0;
}

int RunFile(const runbox::config::Config& config, const std::vector<std::string>& args) {
    if (args.empty()) {
        PrintUsage();
        return 1;
    }
    const std::filesystem::path source_path = args.front();
    std::string language;
    std::optional<std::filesystem::path> input_path;
    for (std::size_t i = 1; i < args.size(); ++i) {
        if (args[i] == "--lang" && i + 1 < args.size()) {
            language = args[++i];
        } else if (args[i] == "--input" && i + 1 < args.size()) {
            input_path = args[++i];
        } else {
            PrintUsage();
            return 1;
        }
    }

    const auto code = ReadFile(source_path);
    if (!code) {
        std::cout << "Failed to read " << source_path << std::endl;
        return 1;
    }
    runbox::engine::ExecutionRequest request{};
    request.code = *code;
    if (input_path) {
        const auto input = ReadFile(*input_path);
        if (!input) {
            std::cout << "Failed to read " << *input_path << std::endl;
            return 1;
        }
        request.input = *input;
    }
    if (language.empty()) {
        const auto* pipeline = runbox::languages::LanguageRegistry::Instance().LookupByExtension(
            source_path.extension().string());
        language = pipeline ? pipeline->id : source_path.extension().string();
    }
    request.language = language;

    const runbox::engine::ExecutionEngine engine(runbox::engine::EngineOptions::FromConfig(config));
    const auto result = engine.Execute(request);
    std::cout << runbox::api::Dump(runbox::api::ToJson(result), 2) << std::endl;
    return result.success ? 0 : 1;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return 1;
    }
    const std::string command = argv[1];
    const std::vector<std::string> args(argv + 2, argv + argc);

    const auto config = runbox::config::LoadConfig();
    ApplyLogConfig(config);

    if (command == "serve") {
        return RunServer(config);
    }
    if (command == "run") {
        return RunFile(config, args);
    }
    if (command == "languages") {
        std::cout << runbox::api::Dump(
            runbox::api::LanguagesToJson(runbox::languages::LanguageRegistry::Instance()), 2)
                  << std::endl;
        return 0;
    }
    if (command == "check") {
        if (ReportMissingToolchains()) {
            return 1;
        }
        std::cout << "All toolchains found." << std::endl;
        return 0;
    }
    PrintUsage();
    return 1;
}
