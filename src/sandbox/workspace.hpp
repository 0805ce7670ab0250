#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace runbox::sandbox {

class WorkspaceError : public std::runtime_error {
public:
    explicit WorkspaceError(const std::string& message)
        : std::runtime_error(message) {}
};

// A uniquely named directory owned by a single execution. The directory and
// everything compiled into it is removed when the object is destroyed.
class Workspace {
public:
    // Throws WorkspaceError if the directory cannot be created.
    static Workspace Create(const std::filesystem::path& root);

    Workspace(const Workspace&) = delete;
    Workspace& operator=(const Workspace&) = delete;
    Workspace(Workspace&& other) noexcept;
    Workspace& operator=(Workspace&& other) noexcept;
    ~Workspace();

    const std::filesystem::path& Path() const { return path_; }

    // Writes the code verbatim as program<extension>. Throws WorkspaceError.
    std::filesystem::path WriteSource(const std::string& code, const std::string& extension) const;
    std::filesystem::path BinaryPath() const;

    // Removes the directory now; safe to call more than once.
    void Destroy() noexcept;

private:
    explicit Workspace(std::filesystem::path path);

    std::filesystem::path path_;
};

}  // namespace runbox::sandbox
