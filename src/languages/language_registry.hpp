#pragma once

#include <string>
#include <vector>

namespace runbox::languages {

// Placeholders substituted into command templates.
inline constexpr const char* kSourcePlaceholder = "{source}";
inline constexpr const char* kBinaryPlaceholder = "{binary}";

struct LanguagePipeline {
    std::string id;
    std::string display_name;
    std::string source_extension;
    std::vector<std::string> compile_command;  // empty when interpreted
    std::vector<std::string> run_command;

    bool HasCompileStage() const { return !compile_command.empty(); }
};

// Replaces placeholders in every argument of a command template.
std::vector<std::string> ExpandCommand(const std::vector<std::string>& command,
                                       const std::string& source_path,
                                       const std::string& binary_path);

class LanguageRegistry {
public:
    // Process-wide registry, built on first use and never mutated.
    static const LanguageRegistry& Instance();

    explicit LanguageRegistry(std::vector<LanguagePipeline> pipelines);

    // Case-insensitive lookup; nullptr when the language is not supported.
    const LanguagePipeline* Lookup(const std::string& language_id) const;
    // Maps a file extension such as ".cpp" back to a language.
    const LanguagePipeline* LookupByExtension(const std::string& extension) const;
    const std::vector<LanguagePipeline>& List() const { return pipelines_; }

    // Names of compilers and interpreters that cannot be found on PATH.
    std::vector<std::string> MissingToolchains() const;

private:
    std::vector<LanguagePipeline> pipelines_;
};

}  // namespace runbox::languages
