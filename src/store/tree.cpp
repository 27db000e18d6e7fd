/**
 * @file tree.cpp
 * @brief TreeCodec serialization and TreeBuilder.
 * @author Dimitris Kafetzis
 */

#include "store/tree.hpp"

#include "core/platform.hpp"
#include "store/digest.hpp"
#include "store/store.hpp"

#include <algorithm>
#include <set>

namespace proc_sandbox {

namespace {

enum class EntryKind : uint8_t {
    File = 1,
    Dir = 2,
    Symlink = 3
};

template <typename NodeT>
std::vector<NodeT> sorted_by_name(std::vector<NodeT> nodes) {
    std::sort(nodes.begin(), nodes.end(),
              [](const NodeT& a, const NodeT& b) { return a.name < b.name; });
    return nodes;
}

/**
 * @brief Bounds-checked reader over an encoded directory.
 */
class Reader {
public:
    explicit Reader(std::string_view data) : data_(data) {}

    [[nodiscard]] bool done() const noexcept { return pos_ == data_.size(); }

    bool u8(uint8_t& out) {
        if (data_.size() - pos_ < 1) return false;
        out = static_cast<uint8_t>(data_[pos_++]);
        return true;
    }

    bool u32(uint32_t& out) {
        if (data_.size() - pos_ < 4) return false;
        out = TreeCodec::get_u32(ptr());
        pos_ += 4;
        return true;
    }

    bool u64(uint64_t& out) {
        if (data_.size() - pos_ < 8) return false;
        out = TreeCodec::get_u64(ptr());
        pos_ += 8;
        return true;
    }

    bool str(std::string& out) {
        uint32_t len = 0;
        if (!u32(len) || data_.size() - pos_ < len) return false;
        out.assign(data_.substr(pos_, len));
        pos_ += len;
        return true;
    }

private:
    const unsigned char* ptr() const {
        return reinterpret_cast<const unsigned char*>(data_.data() + pos_);
    }

    std::string_view data_;
    size_t pos_{0};
};

Error corrupt(std::string_view what) {
    return Error{ErrorKind::CorruptTree, "Corrupt directory encoding: " + std::string(what)};
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Helper: big-endian encode/decode
// ─────────────────────────────────────────────

void TreeCodec::put_u64(std::string& buf, uint64_t val) {
    for (int i = 7; i >= 0; --i) {
        buf.push_back(static_cast<char>((val >> (i * 8)) & 0xFF));
    }
}

void TreeCodec::put_u32(std::string& buf, uint32_t val) {
    buf.push_back(static_cast<char>((val >> 24) & 0xFF));
    buf.push_back(static_cast<char>((val >> 16) & 0xFF));
    buf.push_back(static_cast<char>((val >> 8) & 0xFF));
    buf.push_back(static_cast<char>(val & 0xFF));
}

uint64_t TreeCodec::get_u64(const unsigned char* p) {
    uint64_t val = 0;
    for (int i = 0; i < 8; ++i) {
        val = (val << 8) | p[i];
    }
    return val;
}

uint32_t TreeCodec::get_u32(const unsigned char* p) {
    return (static_cast<uint32_t>(p[0]) << 24)
         | (static_cast<uint32_t>(p[1]) << 16)
         | (static_cast<uint32_t>(p[2]) << 8)
         | static_cast<uint32_t>(p[3]);
}

bool is_valid_entry_name(std::string_view name) noexcept {
    if (name.empty() || name == "." || name == "..") return false;
    return name.find('/') == std::string_view::npos
        && name.find('\0') == std::string_view::npos;
}

// ─────────────────────────────────────────────
// Encode
// ─────────────────────────────────────────────

std::string TreeCodec::encode(const Directory& dir) {
    std::string buf;

    auto put_str = [&buf](std::string_view s) {
        put_u32(buf, static_cast<uint32_t>(s.size()));
        buf.append(s);
    };

    for (const auto& file : sorted_by_name(dir.files)) {
        buf.push_back(static_cast<char>(EntryKind::File));
        put_str(file.name);
        put_str(file.digest.hash);
        put_u64(buf, file.digest.size_bytes);
        buf.push_back(file.is_executable ? 1 : 0);
    }
    for (const auto& sub : sorted_by_name(dir.directories)) {
        buf.push_back(static_cast<char>(EntryKind::Dir));
        put_str(sub.name);
        put_str(sub.digest.hash);
        put_u64(buf, sub.digest.size_bytes);
    }
    for (const auto& link : sorted_by_name(dir.symlinks)) {
        buf.push_back(static_cast<char>(EntryKind::Symlink));
        put_str(link.name);
        put_str(link.target);
    }
    return buf;
}

// ─────────────────────────────────────────────
// Decode
// ─────────────────────────────────────────────

Result<Directory> TreeCodec::decode(std::string_view bytes) {
    Directory dir;
    Reader reader(bytes);
    std::set<std::string> seen;
    uint8_t last_kind = 0;
    std::string last_name;

    while (!reader.done()) {
        uint8_t kind = 0;
        std::string name;
        if (!reader.u8(kind) || !reader.str(name)) return corrupt("truncated entry header");
        if (!is_valid_entry_name(name)) return corrupt("illegal entry name '" + name + "'");

        if (kind < last_kind || (kind == last_kind && name <= last_name)) {
            return corrupt("entries out of canonical order at '" + name + "'");
        }
        if (!seen.insert(name).second) return corrupt("duplicate entry '" + name + "'");
        last_kind = kind;
        last_name = name;

        switch (static_cast<EntryKind>(kind)) {
            case EntryKind::File: {
                FileNode node{.name = std::move(name)};
                uint8_t exec = 0;
                if (!reader.str(node.digest.hash) || !reader.u64(node.digest.size_bytes)
                    || !reader.u8(exec)) {
                    return corrupt("truncated file entry");
                }
                if (!is_valid_hash(node.digest.hash) || exec > 1) {
                    return corrupt("bad file entry '" + node.name + "'");
                }
                node.is_executable = exec == 1;
                dir.files.push_back(std::move(node));
                break;
            }
            case EntryKind::Dir: {
                DirectoryNode node{.name = std::move(name)};
                if (!reader.str(node.digest.hash) || !reader.u64(node.digest.size_bytes)) {
                    return corrupt("truncated directory entry");
                }
                if (!is_valid_hash(node.digest.hash)) {
                    return corrupt("bad directory digest for '" + node.name + "'");
                }
                dir.directories.push_back(std::move(node));
                break;
            }
            case EntryKind::Symlink: {
                SymlinkNode node{.name = std::move(name)};
                if (!reader.str(node.target) || node.target.empty()) {
                    return corrupt("bad symlink entry");
                }
                dir.symlinks.push_back(std::move(node));
                break;
            }
            default:
                return corrupt("unknown entry kind " + std::to_string(kind));
        }
    }
    return dir;
}

// ─────────────────────────────────────────────
// TreeBuilder
// ─────────────────────────────────────────────

struct TreeBuilder::Node {
    std::map<std::string, std::unique_ptr<Node>> dirs;
    std::map<std::string, FileNode> files;
    std::map<std::string, std::string> symlinks;

    [[nodiscard]] bool occupied_by_non_dir(const std::string& name) const {
        return files.contains(name) || symlinks.contains(name);
    }
};

TreeBuilder::TreeBuilder() : root_(std::make_unique<Node>()) {}
TreeBuilder::~TreeBuilder() = default;
TreeBuilder::TreeBuilder(TreeBuilder&&) noexcept = default;
TreeBuilder& TreeBuilder::operator=(TreeBuilder&&) noexcept = default;

Result<TreeBuilder::Node*> TreeBuilder::descend(std::string_view parent_path) {
    Node* node = root_.get();
    size_t pos = 0;
    while (pos < parent_path.size()) {
        size_t next = parent_path.find('/', pos);
        if (next == std::string_view::npos) next = parent_path.size();
        std::string part(parent_path.substr(pos, next - pos));
        pos = next + 1;

        if (node->occupied_by_non_dir(part)) {
            return Error{"Output path conflict: '" + part + "' is not a directory in "
                         + std::string(parent_path)};
        }
        auto& child = node->dirs[part];
        if (!child) child = std::make_unique<Node>();
        node = child.get();
    }
    return node;
}

namespace {

/// Split a normalized path into (parent, leaf).
std::pair<std::string_view, std::string_view> split_leaf(std::string_view path) {
    auto slash = path.rfind('/');
    if (slash == std::string_view::npos) return {std::string_view{}, path};
    return {path.substr(0, slash), path.substr(slash + 1)};
}

}  // anonymous namespace

Result<void> TreeBuilder::add_file(std::string_view path, const Digest& digest,
                                   bool is_executable) {
    auto normalized = normalize_relative_path(path);
    if (!normalized) return normalized.error();
    if (normalized->empty()) return Error{ErrorKind::InvalidRequest, "Empty output file path"};

    auto [parent, leaf] = split_leaf(*normalized);
    auto node = descend(parent);
    if (!node) return node.error();

    std::string name(leaf);
    if ((*node)->dirs.contains(name) || (*node)->symlinks.contains(name)) {
        return Error{"Output path conflict: '" + *normalized + "' is already captured"};
    }
    (*node)->files[name] = FileNode{.name = name, .digest = digest,
                                    .is_executable = is_executable};
    return {};
}

Result<void> TreeBuilder::add_symlink(std::string_view path, std::string target) {
    auto normalized = normalize_relative_path(path);
    if (!normalized) return normalized.error();
    if (normalized->empty()) return Error{ErrorKind::InvalidRequest, "Empty symlink path"};

    auto [parent, leaf] = split_leaf(*normalized);
    auto node = descend(parent);
    if (!node) return node.error();

    std::string name(leaf);
    if ((*node)->dirs.contains(name) || (*node)->files.contains(name)) {
        return Error{"Output path conflict: '" + *normalized + "' is already captured"};
    }
    (*node)->symlinks[name] = std::move(target);
    return {};
}

Result<void> TreeBuilder::add_directory(std::string_view path) {
    auto normalized = normalize_relative_path(path);
    if (!normalized) return normalized.error();

    auto node = descend(*normalized);
    if (!node) return node.error();
    return {};
}

bool TreeBuilder::empty() const noexcept {
    return root_->dirs.empty() && root_->files.empty() && root_->symlinks.empty();
}

namespace {

template <typename NodeT>
Result<Digest> persist_node(const NodeT& node, IDigestStore& store) {
    Directory dir;
    for (const auto& [name, file] : node.files) {
        dir.files.push_back(file);
    }
    for (const auto& [name, child] : node.dirs) {
        auto digest = persist_node(*child, store);
        if (!digest) return digest.error();
        dir.directories.push_back(DirectoryNode{.name = name, .digest = *digest});
    }
    for (const auto& [name, target] : node.symlinks) {
        dir.symlinks.push_back(SymlinkNode{.name = name, .target = target});
    }
    return store.save_directory(dir);
}

}  // anonymous namespace

Result<Digest> TreeBuilder::persist(IDigestStore& store) const {
    return persist_node(*root_, store);
}

}  // namespace proc_sandbox
