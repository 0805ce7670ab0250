#include "engine/execution_engine.hpp"

#include <algorithm>
#include <cstdint>
#include <exception>
#include <utility>

#include "engine/result_classifier.hpp"
#include "sandbox/workspace.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace runbox::engine {
namespace {

constexpr const char* kWorkspaceFailure = "internal error: failed to prepare execution workspace";
constexpr const char* kUnexpectedFailure = "internal error: execution failed";

}  // namespace

std::size_t CountCharacters(const std::string& text) {
    std::size_t count = 0;
    for (const unsigned char c : text) {
        // continuation bytes are 10xxxxxx
        if ((c & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

std::filesystem::path EngineOptions::DefaultWorkspaceRoot() {
    std::error_code ec;
    auto temp = std::filesystem::temp_directory_path(ec);
    if (ec) {
        temp = "/tmp";
    }
    return temp / "runbox";
}

EngineOptions EngineOptions::FromConfig(const config::Config& config) {
    EngineOptions options{};
    options.workspace_root = config.workspace.root.empty()
        ? DefaultWorkspaceRoot()
        : std::filesystem::path(config.workspace.root);
    options.run_timeout = std::chrono::seconds(config.limits.run_timeout_s);
    options.compile_timeout = std::chrono::seconds(config.limits.compile_timeout_s);
    options.max_code_chars = static_cast<std::size_t>(std::max(0, config.limits.max_code_chars));
    options.max_output_chars = static_cast<std::size_t>(std::max(0, config.limits.max_output_chars));
    if (config.limits.cpu_limit_s > 0) {
        options.run_limits.cpu_seconds = static_cast<std::uint64_t>(config.limits.cpu_limit_s);
    }
    if (config.limits.memory_limit_mb > 0) {
        options.run_limits.address_space_bytes =
            static_cast<std::uint64_t>(config.limits.memory_limit_mb) * 1024 * 1024;
    }
    return options;
}

ExecutionEngine::ExecutionEngine(EngineOptions options, const languages::LanguageRegistry& registry)
    : options_(std::move(options))
    , registry_(registry) {
    if (options_.workspace_root.empty()) {
        options_.workspace_root = EngineOptions::DefaultWorkspaceRoot();
    }
}

std::optional<std::string> ExecutionEngine::Validate(
    const ExecutionRequest& request,
    const languages::LanguagePipeline* pipeline) const {
    if (request.code.empty()) {
        return std::string("No code provided");
    }
    if (CountCharacters(request.code) > options_.max_code_chars) {
        return "Code too long (max " + std::to_string(options_.max_code_chars) + " chars)";
    }
    if (!pipeline) {
        return "Unsupported language: " + request.language;
    }
    return std::nullopt;
}

ExecutionResult ExecutionEngine::Execute(const ExecutionRequest& request) const {
    const auto started = std::chrono::steady_clock::now();
    const auto* pipeline = registry_.Lookup(request.language);
    const auto language = pipeline ? pipeline->id : request.language;

    ExecutionResult result{};
    if (const auto rejection = Validate(request, pipeline)) {
        result = ResultClassifier::InvalidRequest(language, *rejection);
    } else {
        try {
            result = RunPipeline(request, *pipeline);
        } catch (const sandbox::WorkspaceError& ex) {
            utils::LogError("engine", "workspace failure",
                            {{"language", language}, {"error", ex.what()}});
            result = ResultClassifier::InternalFailure(language, kWorkspaceFailure);
        } catch (const std::exception& ex) {
            utils::LogError("engine", "unexpected failure",
                            {{"language", language}, {"error", ex.what()}});
            result = ResultClassifier::InternalFailure(language, kUnexpectedFailure);
        }
    }
    result.duration = std::chrono::milliseconds(utils::ElapsedMs(started));

    utils::LogInfo("engine", "request done", {
        {"language", language},
        {"status", ToString(result.status)},
        {"phase", ToString(result.phase)},
        {"exit", std::to_string(result.exit_code)},
        {"duration_ms", std::to_string(result.duration.count())}});
    return result;
}

ExecutionResult ExecutionEngine::RunPipeline(const ExecutionRequest& request,
                                             const languages::LanguagePipeline& pipeline) const {
    auto workspace = sandbox::Workspace::Create(options_.workspace_root);
    const auto source_path = workspace.WriteSource(request.code, pipeline.source_extension);

    // Relative to the workspace so that diagnostics never show host paths.
    const auto source_arg = source_path.filename().string();
    const auto binary_arg = "./" + workspace.BinaryPath().filename().string();

    if (pipeline.HasCompileStage()) {
        sandbox::ExecSpec compile_spec{};
        compile_spec.command = languages::ExpandCommand(pipeline.compile_command, source_arg, binary_arg);
        compile_spec.working_dir = workspace.Path();
        compile_spec.timeout = options_.compile_timeout;
        compile_spec.max_output_chars = options_.max_output_chars;

        const auto compiled = sandbox::ProcessRunner::Run(compile_spec);
        if (compiled.spawn_failed) {
            utils::LogError("engine", "compiler did not start",
                            {{"language", pipeline.id}, {"error", compiled.error}});
            return ResultClassifier::InternalFailure(
                pipeline.id, "internal error: failed to start " + pipeline.id + " compiler");
        }
        utils::LogDebug("engine", "compile stage done", {
            {"language", pipeline.id},
            {"exit", std::to_string(compiled.exit_code)},
            {"duration_ms", std::to_string(compiled.duration.count())}});
        if (compiled.timed_out || compiled.exit_code != 0) {
            return ResultClassifier::CompileFailure(pipeline.id, compiled, options_.compile_timeout);
        }
    }

    sandbox::ExecSpec run_spec{};
    run_spec.command = languages::ExpandCommand(pipeline.run_command, source_arg, binary_arg);
    run_spec.working_dir = workspace.Path();
    run_spec.stdin_text = request.input;
    run_spec.timeout = options_.run_timeout;
    run_spec.max_output_chars = options_.max_output_chars;
    run_spec.limits = options_.run_limits;

    const auto ran = sandbox::ProcessRunner::Run(run_spec);
    if (ran.spawn_failed) {
        utils::LogError("engine", "program did not start",
                        {{"language", pipeline.id}, {"error", ran.error}});
        return ResultClassifier::InternalFailure(
            pipeline.id, "internal error: failed to start " + pipeline.id + " program");
    }
    return ResultClassifier::FromRun(pipeline.id, ran, options_.run_timeout);
}

}  // namespace runbox::engine
