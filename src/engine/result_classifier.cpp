#include "engine/result_classifier.hpp"

#include <signal.h>

namespace runbox::engine {
namespace {

ExecutionResult Base(const std::string& language, ExecutionPhase phase) {
    ExecutionResult result{};
    result.language = language;
    result.phase = phase;
    return result;
}

void CopyStreams(ExecutionResult& result, const sandbox::ExecResult& exec) {
    result.output = exec.output;
    result.error = exec.error;
    result.output_truncated = exec.output_truncated;
    result.error_truncated = exec.error_truncated;
}

}  // namespace

ExecutionResult ResultClassifier::InvalidRequest(const std::string& language,
                                                 const std::string& reason) {
    auto result = Base(language, ExecutionPhase::kValidation);
    result.status = ExecutionStatus::kInvalidRequest;
    result.error = reason;
    result.exit_code = sandbox::kSentinelExitCode;
    return result;
}

ExecutionResult ResultClassifier::InternalFailure(const std::string& language,
                                                  const std::string& message) {
    auto result = Base(language, ExecutionPhase::kInternal);
    result.status = ExecutionStatus::kInternalError;
    result.error = message;
    result.exit_code = sandbox::kSentinelExitCode;
    return result;
}

ExecutionResult ResultClassifier::CompileFailure(const std::string& language,
                                                 const sandbox::ExecResult& compile,
                                                 std::chrono::seconds budget) {
    auto result = Base(language, ExecutionPhase::kCompilation);
    result.status = ExecutionStatus::kCompileError;
    if (compile.timed_out) {
        result.error = "compilation timed out after " + std::to_string(budget.count()) + "s";
        result.exit_code = sandbox::kSentinelExitCode;
        return result;
    }
    CopyStreams(result, compile);
    result.exit_code = compile.exit_code;
    return result;
}

ExecutionResult ResultClassifier::FromRun(const std::string& language,
                                          const sandbox::ExecResult& run,
                                          std::chrono::seconds budget) {
    auto result = Base(language, ExecutionPhase::kExecution);
    if (run.timed_out) {
        // Whatever the program printed before it was killed is discarded.
        result.status = ExecutionStatus::kTimeout;
        result.error = "execution timed out after " + std::to_string(budget.count()) + "s";
        result.exit_code = sandbox::kSentinelExitCode;
        return result;
    }

    CopyStreams(result, run);
    result.exit_code = run.exit_code;
    if (run.term_signal == SIGXCPU) {
        result.status = ExecutionStatus::kResourceLimit;
        if (result.error.empty()) {
            result.error = "cpu time limit exceeded";
        }
        return result;
    }
    if (run.exit_code == 0) {
        result.success = true;
        result.status = ExecutionStatus::kOk;
        return result;
    }
    result.status = ExecutionStatus::kRuntimeError;
    return result;
}

}  // namespace runbox::engine
