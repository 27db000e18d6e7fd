/**
 * @file sandbox_builder.cpp
 * @brief SandboxBuilder implementation.
 * @author Dimitris Kafetzis
 */

#include "sandbox/sandbox_builder.hpp"

#include "sandbox/confined_path.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <system_error>
#include <vector>

namespace proc_sandbox {

namespace fs = std::filesystem;

namespace {

Error setup_error(const std::string& what, const fs::path& path, const std::error_code& ec) {
    return Error{ErrorKind::SandboxSetupError,
                 what + " " + path.string() + ": " + ec.message()};
}

}  // anonymous namespace

Result<void> write_file(const fs::path& path, std::string_view bytes, bool is_executable) {
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Error{ErrorKind::SandboxSetupError,
                         "Failed to open " + path.string() + " for writing"};
        }
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        if (!out) {
            return Error{ErrorKind::SandboxSetupError, "Failed to write " + path.string()};
        }
    }

    auto perms = is_executable ? fs::perms(0755) : fs::perms(0644);
    std::error_code ec;
    fs::permissions(path, perms, fs::perm_options::replace, ec);
    if (ec) return setup_error("Failed to set permissions on", path, ec);
    return {};
}

SandboxBuilder::SandboxBuilder(IDigestStore& store, const NamedCaches& caches,
                               fs::path base_root)
    : store_(store), caches_(caches), base_root_(std::move(base_root)) {}

Result<fs::path> SandboxBuilder::create_directory() const {
    std::error_code ec;
    fs::create_directories(base_root_, ec);
    if (ec) return setup_error("Failed to create sandbox root", base_root_, ec);

    std::string pattern = (base_root_ / "process-executionXXXXXX").string();
    std::vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back('\0');

    if (::mkdtemp(buf.data()) == nullptr) {
        return Error{ErrorKind::SandboxSetupError,
                     "Failed to create sandbox under " + base_root_.string() + ": "
                     + std::string(strerror(errno))};
    }
    return fs::path(buf.data());
}

Result<void> SandboxBuilder::prepare(const fs::path& sandbox_root,
                                     const ProcessRequest& request) const {
    if (!request.input_digest.is_empty()) {
        auto materialized = materialize(request.input_digest, sandbox_root);
        if (!materialized) return materialized;
    }

    auto parents = create_output_parents(sandbox_root, request);
    if (!parents) return parents;

    if (request.working_directory && !request.working_directory->empty()) {
        auto workdir = create_confined_directories(sandbox_root, *request.working_directory);
        if (!workdir) return workdir;
    }

    if (request.jdk_home) {
        std::error_code ec;
        auto link = sandbox_root / kJdkMountPoint;
        fs::create_directory_symlink(*request.jdk_home, link, ec);
        if (ec) return setup_error("Failed to link JDK home at", link, ec);
    }

    for (const auto& [name, mount_path] : request.append_only_caches) {
        auto mounted = caches_.mount(sandbox_root, name, mount_path);
        if (!mounted) return mounted;
    }
    return {};
}

Result<void> SandboxBuilder::materialize(const Digest& digest, const fs::path& dest) const {
    auto dir = store_.load_directory(digest);
    if (!dir) {
        return dir.error().with_kind(ErrorKind::MaterializationError,
                                     "Failed to load input tree " + digest.to_string());
    }

    for (const auto& file : dir->files) {
        auto bytes = store_.load_bytes(file.digest);
        if (!bytes) {
            return bytes.error().with_kind(ErrorKind::MaterializationError,
                                           "Failed to load input file " + file.name);
        }
        auto written = write_file(dest / file.name, *bytes, file.is_executable);
        if (!written) return written;
    }

    for (const auto& link : dir->symlinks) {
        std::error_code ec;
        fs::create_symlink(link.target, dest / link.name, ec);
        if (ec) return setup_error("Failed to create symlink", dest / link.name, ec);
    }

    for (const auto& sub : dir->directories) {
        auto child = dest / sub.name;
        std::error_code ec;
        fs::create_directory(child, ec);
        if (ec) return setup_error("Failed to create directory", child, ec);

        auto nested = materialize(sub.digest, child);
        if (!nested) return nested;
    }
    return {};
}

Result<void> SandboxBuilder::create_output_parents(const fs::path& sandbox_root,
                                                   const ProcessRequest& request) const {
    // Existing directories are reused, so a file output nested in a
    // directory output does not conflict.
    auto ensure_parent = [&](const std::string& rel) -> Result<void> {
        return create_confined_directories(sandbox_root, fs::path(rel).parent_path().string());
    };

    for (const auto& file : request.output_files) {
        auto created = ensure_parent(file);
        if (!created) return created;
    }
    for (const auto& dir : request.output_directories) {
        auto created = ensure_parent(dir);
        if (!created) return created;
    }
    return {};
}

}  // namespace proc_sandbox
