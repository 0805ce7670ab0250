#include "sandbox/workspace.hpp"

#include <fstream>
#include <iomanip>
#include <cstdint>
#include <random>
#include <sstream>
#include <system_error>

#include "utils/logging.hpp"

namespace runbox::sandbox {
namespace {

constexpr const char* kProgramName = "program";
constexpr int kMaxCreateAttempts = 8;

std::string RandomToken() {
    thread_local std::mt19937_64 engine{std::random_device{}()};
    std::uniform_int_distribution<std::uint64_t> dist;
    std::ostringstream oss;
    oss << std::hex << std::setw(16) << std::setfill('0') << dist(engine);
    return oss.str();
}

// User code may chmod directories inside the workspace so that the server
// can no longer list or unlink their contents.
void RestoreOwnerAccess(const std::filesystem::path& root) {
    namespace fs = std::filesystem;
    std::error_code ec;
    fs::permissions(root, fs::perms::owner_all, fs::perm_options::add, ec);
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    const fs::recursive_directory_iterator end;
    while (!ec && it != end) {
        std::error_code status_ec;
        if (fs::is_directory(it->symlink_status(status_ec))) {
            // Must happen before increment() descends into it.
            std::error_code perms_ec;
            fs::permissions(it->path(), fs::perms::owner_all, fs::perm_options::add, perms_ec);
        }
        it.increment(ec);
    }
}

}  // namespace

Workspace Workspace::Create(const std::filesystem::path& root) {
    std::error_code ec;
    std::filesystem::create_directories(root, ec);
    if (ec) {
        throw WorkspaceError("failed to create workspace root " + root.string() + ": " + ec.message());
    }
    for (int attempt = 0; attempt < kMaxCreateAttempts; ++attempt) {
        auto path = root / ("run_" + RandomToken());
        // create_directory reports false if the name is already taken.
        if (std::filesystem::create_directory(path, ec)) {
            std::filesystem::permissions(path, std::filesystem::perms::owner_all,
                                         std::filesystem::perm_options::replace, ec);
            if (ec) {
                utils::LogWarn("workspace", "failed to restrict permissions",
                               {{"path", path.string()}, {"error", ec.message()}});
            }
            utils::LogDebug("workspace", "created", {{"path", path.string()}});
            return Workspace(std::move(path));
        }
        if (ec) {
            throw WorkspaceError("failed to create workspace " + path.string() + ": " + ec.message());
        }
    }
    throw WorkspaceError("failed to allocate a unique workspace under " + root.string());
}

Workspace::Workspace(std::filesystem::path path)
    : path_(std::move(path)) {}

Workspace::Workspace(Workspace&& other) noexcept
    : path_(std::move(other.path_)) {
    other.path_.clear();
}

Workspace& Workspace::operator=(Workspace&& other) noexcept {
    if (this != &other) {
        Destroy();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

Workspace::~Workspace() {
    Destroy();
}

std::filesystem::path Workspace::WriteSource(const std::string& code,
                                             const std::string& extension) const {
    const auto source_path = path_ / (std::string(kProgramName) + extension);
    std::ofstream output(source_path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!output.is_open()) {
        throw WorkspaceError("failed to open " + source_path.string() + " for writing");
    }
    output.write(code.data(), static_cast<std::streamsize>(code.size()));
    output.close();
    if (!output) {
        throw WorkspaceError("failed to write " + source_path.string());
    }
    return source_path;
}

std::filesystem::path Workspace::BinaryPath() const {
    return path_ / kProgramName;
}

void Workspace::Destroy() noexcept {
    if (path_.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
        utils::LogDebug("workspace", "retrying removal with owner access restored",
                        {{"path", path_.string()}, {"error", ec.message()}});
        RestoreOwnerAccess(path_);
        ec.clear();
        std::filesystem::remove_all(path_, ec);
    }
    if (ec) {
        utils::LogError("workspace", "failed to remove",
                        {{"path", path_.string()}, {"error", ec.message()}});
    } else {
        utils::LogDebug("workspace", "removed", {{"path", path_.string()}});
    }
    path_.clear();
}

}  // namespace runbox::sandbox
