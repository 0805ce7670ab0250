#include "languages/language_registry.hpp"

#include <utility>

#include "sandbox/process_compat.hpp"
#include "utils/common.hpp"

namespace runbox::languages {
namespace {

std::vector<LanguagePipeline> BuiltinPipelines() {
    return {
        LanguagePipeline{
            "python",
            "Python 3",
            ".py",
            {},
            {"python3", kSourcePlaceholder}},
        LanguagePipeline{
            "c",
            "C (GCC)",
            ".c",
            {"gcc", kSourcePlaceholder, "-o", kBinaryPlaceholder, "-lm"},
            {kBinaryPlaceholder}},
        LanguagePipeline{
            "cpp",
            "C++ (G++)",
            ".cpp",
            {"g++", kSourcePlaceholder, "-o", kBinaryPlaceholder, "-std=c++17"},
            {kBinaryPlaceholder}},
    };
}

std::string ReplaceAll(std::string value, const std::string& from, const std::string& to) {
    std::size_t pos = 0;
    while ((pos = value.find(from, pos)) != std::string::npos) {
        value.replace(pos, from.size(), to);
        pos += to.size();
    }
    return value;
}

bool IsPlaceholder(const std::string& arg) {
    return arg.find(kSourcePlaceholder) != std::string::npos
        || arg.find(kBinaryPlaceholder) != std::string::npos;
}

}  // namespace

std::vector<std::string> ExpandCommand(const std::vector<std::string>& command,
                                       const std::string& source_path,
                                       const std::string& binary_path) {
    std::vector<std::string> expanded;
    expanded.reserve(command.size());
    for (const auto& arg : command) {
        auto value = ReplaceAll(arg, kSourcePlaceholder, source_path);
        value = ReplaceAll(std::move(value), kBinaryPlaceholder, binary_path);
        expanded.push_back(std::move(value));
    }
    return expanded;
}

const LanguageRegistry& LanguageRegistry::Instance() {
    static const LanguageRegistry registry(BuiltinPipelines());
    return registry;
}

LanguageRegistry::LanguageRegistry(std::vector<LanguagePipeline> pipelines)
    : pipelines_(std::move(pipelines)) {}

const LanguagePipeline* LanguageRegistry::Lookup(const std::string& language_id) const {
    const auto wanted = utils::ToLower(language_id);
    for (const auto& pipeline : pipelines_) {
        if (pipeline.id == wanted) {
            return &pipeline;
        }
    }
    return nullptr;
}

const LanguagePipeline* LanguageRegistry::LookupByExtension(const std::string& extension) const {
    const auto wanted = utils::ToLower(extension);
    for (const auto& pipeline : pipelines_) {
        if (pipeline.source_extension == wanted) {
            return &pipeline;
        }
    }
    return nullptr;
}

std::vector<std::string> LanguageRegistry::MissingToolchains() const {
    std::vector<std::string> missing;
    auto check = [&missing](const std::vector<std::string>& command) {
        // Commands starting with a placeholder run the compiled artifact.
        if (command.empty() || IsPlaceholder(command.front())) {
            return;
        }
        const auto& program = command.front();
        if (sandbox::bp::search_path(program).empty()) {
            for (const auto& name : missing) {
                if (name == program) {
                    return;
                }
            }
            missing.push_back(program);
        }
    };
    for (const auto& pipeline : pipelines_) {
        check(pipeline.compile_command);
        check(pipeline.run_command);
    }
    return missing;
}

}  // namespace runbox::languages
