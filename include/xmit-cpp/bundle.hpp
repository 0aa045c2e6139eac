/// @file bundle.hpp
/// @brief Bundle construction: BundleNode tree, ContentTable and build_bundle.

#pragma once

#include <xmit-cpp/cancellation.hpp>
#include <xmit-cpp/types.hpp>

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <unordered_map>
#include <variant>

namespace xmit_cpp {

struct Project;

/// A node of the bundle tree: a file (its content hash) or a directory.
///
/// The tree never holds file bytes. Children are kept sorted by name so
/// the encoded form of a tree is deterministic.
struct BundleNode {
    using Children = std::map<std::string, BundleNode>;

    std::variant<ContentHash, Children> value{Children{}};

    static auto file(const ContentHash& hash) -> BundleNode { return BundleNode{hash}; }
    static auto directory(Children children = {}) -> BundleNode {
        return BundleNode{std::move(children)};
    }

    auto is_file() const -> bool { return std::holds_alternative<ContentHash>(value); }
    auto is_directory() const -> bool { return std::holds_alternative<Children>(value); }

    /// The content hash of a file node, or nullptr for a directory.
    auto hash() const -> const ContentHash* { return std::get_if<ContentHash>(&value); }

    /// The children of a directory node, or nullptr for a file.
    auto children() const -> const Children* { return std::get_if<Children>(&value); }
    auto children() -> Children* { return std::get_if<Children>(&value); }

    auto operator==(const BundleNode&) const -> bool = default;
};

/// Content hash to file bytes, filled while a bundle is built.
///
/// Identical content reached through several paths is stored once.
class ContentTable {
public:
    /// Store bytes under hash. Returns false if the hash was already present.
    auto insert(const ContentHash& hash, Bytes content) -> bool;

    /// The bytes stored for hash, or nullptr.
    auto find(const ContentHash& hash) const -> const Bytes*;

    auto contains(const ContentHash& hash) const -> bool { return entries_.contains(hash); }
    auto size() const -> std::size_t { return entries_.size(); }
    auto empty() const -> bool { return entries_.empty(); }

    /// Sum of the sizes of all stored blobs.
    auto total_bytes() const -> std::size_t { return total_bytes_; }

    void clear();

private:
    std::unordered_map<ContentHash, Bytes> entries_;
    std::size_t total_bytes_{0};
};

/// A built bundle: tree, content side-table, encoded tree and its hash.
struct Bundle {
    BundleNode root;
    ContentTable contents;
    Bytes encoded;          ///< CBOR encoding of root.
    ContentHash hash;       ///< hash_content(encoded); identifies the bundle.
    std::size_t file_count{0};
};

/// Encode a bundle tree. Directories are {1: {name: node}}, files {2: hash}.
auto encode_bundle_node(const BundleNode& node) -> Bytes;

/// The directory to publish: the project root or its launch directory.
///
/// @throws PublishError{configuration} if a configured launch directory
///         does not exist.
auto resolve_bundle_root(const Project& project) -> std::filesystem::path;

/// Walk root, hash every regular file and assemble the bundle.
///
/// A top-level ".git" directory is skipped. Files are read and hashed on
/// hash_threads workers (0 selects the hardware concurrency).
///
/// @throws PublishError{configuration} if root is not a directory or a
///         file cannot be read, PublishError{cancelled} if token is set.
auto build_bundle(const std::filesystem::path& root,
                  unsigned int hash_threads = 0,
                  const CancellationToken& token = {}) -> Bundle;

}  // namespace xmit_cpp
