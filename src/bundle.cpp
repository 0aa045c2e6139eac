#include <xmit-cpp/bundle.hpp>

#include <xmit-cpp/error.hpp>
#include <xmit-cpp/project.hpp>

#include "encoding/cbor.hpp"
#include "parallel_for.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <system_error>
#include <thread>
#include <vector>

namespace xmit_cpp {

namespace {

constexpr std::uint64_t key_children = 1;
constexpr std::uint64_t key_file_hash = 2;

// Version-control metadata skipped at the top level of the bundle root.
constexpr std::string_view vcs_directory = ".git";

auto to_cbor(const BundleNode& node) -> cbor::Value {
    if (const auto* hash = node.hash()) {
        return cbor::Value{cbor::Value::Map{
            {cbor::Value{key_file_hash}, cbor::Value{Bytes{hash->bytes.begin(), hash->bytes.end()}}},
        }};
    }
    auto entries = cbor::Value::Map{};
    for (const auto& [name, child] : *node.children()) {
        entries.emplace_back(cbor::Value{name}, to_cbor(child));
    }
    return cbor::Value{cbor::Value::Map{
        {cbor::Value{key_children}, cbor::Value{std::move(entries)}},
    }};
}

auto read_file(const std::filesystem::path& path) -> Bytes {
    auto in = std::ifstream{path, std::ios::binary};
    if (!in) {
        throw PublishError{ErrorKind::configuration, "Failed to open " + path.string()};
    }
    auto chars = std::vector<char>{std::istreambuf_iterator<char>{in},
                                   std::istreambuf_iterator<char>{}};
    if (in.bad()) {
        throw PublishError{ErrorKind::configuration, "Failed to read " + path.string()};
    }
    auto result = Bytes(chars.size());
    std::transform(chars.begin(), chars.end(), result.begin(),
        [](char c) { return static_cast<std::byte>(c); });
    return result;
}

// Relative paths of every regular file under root, top-level .git excluded.
auto collect_files(const std::filesystem::path& root) -> std::vector<std::filesystem::path> {
    auto files = std::vector<std::filesystem::path>{};
    auto ec = std::error_code{};
    auto it = std::filesystem::recursive_directory_iterator{root, ec};
    if (ec) {
        throw PublishError{ErrorKind::configuration,
            "Failed to list " + root.string() + ": " + ec.message()};
    }
    for (; it != std::filesystem::recursive_directory_iterator{}; it.increment(ec)) {
        if (ec) {
            throw PublishError{ErrorKind::configuration,
                "Failed to list " + root.string() + ": " + ec.message()};
        }
        const auto& entry = *it;
        if (it.depth() == 0 && entry.is_directory() && entry.path().filename() == vcs_directory) {
            it.disable_recursion_pending();
            continue;
        }
        if (entry.is_regular_file()) {
            files.push_back(entry.path().lexically_relative(root));
        }
    }
    return files;
}

void insert_file(BundleNode& root, const std::filesystem::path& relative, const ContentHash& hash) {
    auto* dir = &root;
    auto components = std::vector<std::string>{};
    for (const auto& part : relative) components.push_back(part.string());

    for (std::size_t i = 0; i + 1 < components.size(); ++i) {
        auto& children = *dir->children();
        dir = &children.try_emplace(components[i], BundleNode::directory()).first->second;
    }
    (*dir->children())[components.back()] = BundleNode::file(hash);
}

}  // namespace

// -- ContentTable -------------------------------------------------------------

auto ContentTable::insert(const ContentHash& hash, Bytes content) -> bool {
    auto size = content.size();
    auto [it, inserted] = entries_.try_emplace(hash, std::move(content));
    if (inserted) total_bytes_ += size;
    return inserted;
}

auto ContentTable::find(const ContentHash& hash) const -> const Bytes* {
    auto it = entries_.find(hash);
    return it == entries_.end() ? nullptr : &it->second;
}

void ContentTable::clear() {
    entries_.clear();
    total_bytes_ = 0;
}

// -- Bundle assembly ----------------------------------------------------------

auto encode_bundle_node(const BundleNode& node) -> Bytes {
    return cbor::encode(to_cbor(node));
}

auto resolve_bundle_root(const Project& project) -> std::filesystem::path {
    if (!project.launch_directory) return project.path;

    auto dir = project.path / *project.launch_directory;
    auto ec = std::error_code{};
    if (!std::filesystem::is_directory(dir, ec)) {
        throw PublishError{ErrorKind::configuration,
            "Configured launch directory \"" + *project.launch_directory +
            "\" does not exist. Please check your bob.directory setting in package.json."};
    }
    return dir;
}

auto build_bundle(const std::filesystem::path& root,
                  unsigned int hash_threads,
                  const CancellationToken& token) -> Bundle {
    token.throw_if_cancelled();

    auto ec = std::error_code{};
    if (!std::filesystem::is_directory(root, ec)) {
        throw PublishError{ErrorKind::configuration,
            "Bundle root is not a directory: " + root.string()};
    }

    auto files = collect_files(root);
    spdlog::debug("bundling {} files from {}", files.size(), root.string());

    struct Hashed {
        ContentHash hash;
        Bytes content;
    };
    auto hashed = std::vector<Hashed>(files.size());

    if (hash_threads == 0) hash_threads = std::max(std::thread::hardware_concurrency(), 1u);
    detail::parallel_for(hash_threads, files.size(), [&](std::size_t i) {
        token.throw_if_cancelled();
        auto content = read_file(root / files[i]);
        hashed[i].hash = hash_content(content);
        hashed[i].content = std::move(content);
    });
    token.throw_if_cancelled();

    auto bundle = Bundle{};
    bundle.root = BundleNode::directory();
    for (std::size_t i = 0; i < files.size(); ++i) {
        insert_file(bundle.root, files[i], hashed[i].hash);
        bundle.contents.insert(hashed[i].hash, std::move(hashed[i].content));
    }
    bundle.file_count = files.size();
    bundle.encoded = encode_bundle_node(bundle.root);
    bundle.hash = hash_content(bundle.encoded);

    spdlog::debug("bundle {}: {} files, {} unique blobs, {} bytes",
                  bundle.hash.to_hex(), bundle.file_count,
                  bundle.contents.size(), bundle.contents.total_bytes());
    return bundle;
}

}  // namespace xmit_cpp
