#pragma once

#include <chrono>
#include <string>

#include "engine/execution_types.hpp"
#include "sandbox/process_runner.hpp"

namespace runbox::engine {

class ResultClassifier {
public:
    static ExecutionResult InvalidRequest(const std::string& language, const std::string& reason);

    // message must not contain host paths; it is returned to the caller as is.
    static ExecutionResult InternalFailure(const std::string& language, const std::string& message);

    static ExecutionResult CompileFailure(const std::string& language,
                                          const sandbox::ExecResult& compile,
                                          std::chrono::seconds budget);

    static ExecutionResult FromRun(const std::string& language,
                                   const sandbox::ExecResult& run,
                                   std::chrono::seconds budget);
};

}  // namespace runbox::engine
