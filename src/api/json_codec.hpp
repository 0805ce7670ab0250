#pragma once

#include <string>

#include "engine/execution_types.hpp"
#include "languages/language_registry.hpp"
#include "nlohmann/json.hpp"

namespace runbox::api {

struct ParsedRequest {
    bool ok = false;
    engine::ExecutionRequest request;
    std::string error;
};

// {"code": ..., "language": "python", "input": ""}; language and input are optional.
ParsedRequest ParseRequest(const nlohmann::json& body);
ParsedRequest ParseRequestBody(const std::string& body);

nlohmann::json ToJson(const engine::ExecutionResult& result);
nlohmann::json LanguagesToJson(const languages::LanguageRegistry& registry);

// Never throws on invalid UTF-8 coming from user programs.
std::string Dump(const nlohmann::json& value, int indent = -1);

// HTTP status for a result: 400, 408, 500 or 200.
int HttpStatusFor(const engine::ExecutionResult& result);

}  // namespace runbox::api
