#include "api/json_codec.hpp"

#include "utils/common.hpp"

namespace runbox::api {

ParsedRequest ParseRequest(const nlohmann::json& body) {
    ParsedRequest parsed{};
    if (!body.is_object()) {
        parsed.error = "No JSON body provided";
        return parsed;
    }
    if (!body.contains("code") || !body["code"].is_string()) {
        parsed.error = "No code provided";
        return parsed;
    }
    parsed.request.code = body["code"].get<std::string>();

    parsed.request.language = "python";
    if (body.contains("language") && !body["language"].is_null()) {
        if (!body["language"].is_string()) {
            parsed.error = "language must be a string";
            return parsed;
        }
        parsed.request.language = utils::ToLower(body["language"].get<std::string>());
    }

    if (body.contains("input") && !body["input"].is_null()) {
        if (!body["input"].is_string()) {
            parsed.error = "input must be a string";
            return parsed;
        }
        parsed.request.input = body["input"].get<std::string>();
    }

    parsed.ok = true;
    return parsed;
}

ParsedRequest ParseRequestBody(const std::string& body) {
    const auto data = nlohmann::json::parse(body, nullptr, false);
    if (data.is_discarded()) {
        ParsedRequest parsed{};
        parsed.error = "Malformed JSON body";
        return parsed;
    }
    return ParseRequest(data);
}

nlohmann::json ToJson(const engine::ExecutionResult& result) {
    return {
        {"success", result.success},
        {"status", engine::ToString(result.status)},
        {"phase", engine::ToString(result.phase)},
        {"output", result.output},
        {"error", result.error},
        {"exit_code", result.exit_code},
        {"language", result.language},
        {"output_truncated", result.output_truncated},
        {"error_truncated", result.error_truncated},
        {"duration_ms", result.duration.count()}
    };
}

nlohmann::json LanguagesToJson(const languages::LanguageRegistry& registry) {
    nlohmann::json items = nlohmann::json::array();
    for (const auto& pipeline : registry.List()) {
        items.push_back({
            {"id", pipeline.id},
            {"name", pipeline.display_name},
            {"extension", pipeline.source_extension},
            {"compiled", pipeline.HasCompileStage()}
        });
    }
    return {{"languages", items}};
}

std::string Dump(const nlohmann::json& value, int indent) {
    return value.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

int HttpStatusFor(const engine::ExecutionResult& result) {
    switch (result.status) {
        case engine::ExecutionStatus::kInvalidRequest: return 400;
        case engine::ExecutionStatus::kTimeout: return 408;
        case engine::ExecutionStatus::kInternalError: return 500;
        default: return 200;
    }
}

}  // namespace runbox::api
