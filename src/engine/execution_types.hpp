#pragma once

#include <chrono>
#include <string>

namespace runbox::engine {

struct ExecutionRequest {
    std::string code;
    std::string language;
    std::string input;
};

enum class ExecutionStatus {
    kOk,
    kInvalidRequest,
    kCompileError,
    kRuntimeError,
    kTimeout,
    kResourceLimit,
    kInternalError
};

enum class ExecutionPhase {
    kValidation,
    kCompilation,
    kExecution,
    kInternal
};

inline const char* ToString(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::kOk: return "ok";
        case ExecutionStatus::kInvalidRequest: return "invalid_request";
        case ExecutionStatus::kCompileError: return "compile_error";
        case ExecutionStatus::kRuntimeError: return "runtime_error";
        case ExecutionStatus::kTimeout: return "timeout";
        case ExecutionStatus::kResourceLimit: return "resource_limit";
        case ExecutionStatus::kInternalError: return "internal_error";
    }
    return "unknown";
}

inline const char* ToString(ExecutionPhase phase) {
    switch (phase) {
        case ExecutionPhase::kValidation: return "validation";
        case ExecutionPhase::kCompilation: return "compilation";
        case ExecutionPhase::kExecution: return "execution";
        case ExecutionPhase::kInternal: return "internal";
    }
    return "unknown";
}

struct ExecutionResult {
    bool success = false;
    ExecutionStatus status = ExecutionStatus::kInternalError;
    ExecutionPhase phase = ExecutionPhase::kInternal;
    std::string output;
    std::string error;
    int exit_code = -1;
    std::string language;
    bool output_truncated = false;
    bool error_truncated = false;
    std::chrono::milliseconds duration{0};
};

}  // namespace runbox::engine
