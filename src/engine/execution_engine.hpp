#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

#include "config/config_schema.hpp"
#include "engine/execution_types.hpp"
#include "languages/language_registry.hpp"
#include "sandbox/process_runner.hpp"

namespace runbox::engine {

struct EngineOptions {
    std::filesystem::path workspace_root;
    std::chrono::seconds run_timeout{5};
    std::chrono::seconds compile_timeout{10};
    std::size_t max_code_chars = 10000;
    std::size_t max_output_chars = 50000;
    // Applied to the run stage only; compilers get no rlimits.
    sandbox::ResourceLimits run_limits;

    static EngineOptions FromConfig(const config::Config& config);
    static std::filesystem::path DefaultWorkspaceRoot();
};

// Validate -> compile (if the language has a compile stage) -> run -> classify.
// Stateless apart from its options, so one engine may serve many threads.
class ExecutionEngine {
public:
    explicit ExecutionEngine(
        EngineOptions options,
        const languages::LanguageRegistry& registry = languages::LanguageRegistry::Instance());

    // Always returns exactly one result; never throws for user input.
    ExecutionResult Execute(const ExecutionRequest& request) const;

    const EngineOptions& Options() const { return options_; }

private:
    std::optional<std::string> Validate(const ExecutionRequest& request,
                                        const languages::LanguagePipeline* pipeline) const;
    ExecutionResult RunPipeline(const ExecutionRequest& request,
                                const languages::LanguagePipeline& pipeline) const;

    EngineOptions options_;
    const languages::LanguageRegistry& registry_;
};

// Number of UTF-8 code points in text.
std::size_t CountCharacters(const std::string& text);

}  // namespace runbox::engine
