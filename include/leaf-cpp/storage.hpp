/// @file storage.hpp
/// @brief The key/value storage contract and its built-in backends.

#pragma once

#include <leaf-cpp/scheduler.hpp>
#include <leaf-cpp/types.hpp>

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace leaf_cpp {

/// A storage key: an ordered sequence of path elements.
/// Prefix queries match whole elements.
using StorageKey = std::vector<std::string>;

/// Join a key with '/' for logging.
auto to_string(const StorageKey& key) -> std::string;

/// True if `prefix` is a whole-element prefix of `key` (or equal to it).
auto has_prefix(const StorageKey& key, const StorageKey& prefix) -> bool;

/// One result of a range query.
struct StorageEntry {
    StorageKey key;
    std::optional<Bytes> data;

    auto operator==(const StorageEntry&) const -> bool = default;
};

/// The backend contract consumed by StorageManager.
///
/// Implementations report I/O failures by throwing
/// Exception{ErrorKind::storage_error}.
class StorageInterface {
public:
    virtual ~StorageInterface() = default;

    /// Load the bytes at `key`, or nullopt if there are none.
    virtual auto load(const StorageKey& key) -> Task<std::optional<Bytes>> = 0;

    /// Store `data` at `key`, replacing any previous value.
    virtual auto save(const StorageKey& key, Bytes data) -> Task<> = 0;

    /// Remove the value at `key`. Removing a missing key is not an error.
    virtual auto remove(const StorageKey& key) -> Task<> = 0;

    /// Every entry whose key starts with `prefix`, sorted by key.
    virtual auto load_range(const StorageKey& prefix) -> Task<std::vector<StorageEntry>> = 0;

    /// Remove every entry whose key starts with `prefix`.
    virtual auto remove_range(const StorageKey& prefix) -> Task<> = 0;
};

/// In-memory storage backed by an ordered map.
///
/// Every call yields one turn before touching the map, so that callers see
/// the same interleavings they would against real I/O.
class MemoryStorage : public StorageInterface {
public:
    auto load(const StorageKey& key) -> Task<std::optional<Bytes>> override;
    auto save(const StorageKey& key, Bytes data) -> Task<> override;
    auto remove(const StorageKey& key) -> Task<> override;
    auto load_range(const StorageKey& prefix) -> Task<std::vector<StorageEntry>> override;
    auto remove_range(const StorageKey& prefix) -> Task<> override;

    /// Every stored key, sorted.
    auto keys() const -> std::vector<StorageKey>;
    auto size() const -> std::size_t { return data_.size(); }

    /// Number of save() calls that have completed.
    auto write_count() const -> std::size_t { return write_count_; }

private:
    std::map<StorageKey, Bytes> data_;
    std::size_t write_count_{0};
};

/// Stores every key as one file below a root directory.
///
/// Key elements become path components. Characters outside
/// `[A-Za-z0-9_-]` are percent-escaped, so no element can escape the root
/// and the `.tmp` suffix of in-progress writes never collides with a key.
class FilesystemStorage : public StorageInterface {
public:
    explicit FilesystemStorage(std::filesystem::path root);

    auto root() const -> const std::filesystem::path& { return root_; }

    auto load(const StorageKey& key) -> Task<std::optional<Bytes>> override;
    auto save(const StorageKey& key, Bytes data) -> Task<> override;
    auto remove(const StorageKey& key) -> Task<> override;
    auto load_range(const StorageKey& prefix) -> Task<std::vector<StorageEntry>> override;
    auto remove_range(const StorageKey& prefix) -> Task<> override;

    /// The file path a key is stored at.
    auto path_for(const StorageKey& key) const -> std::filesystem::path;

private:
    std::filesystem::path root_;
};

/// Escape one key element for use as a file name.
auto escape_path_element(const std::string& element) -> std::string;

/// Reverse escape_path_element(); nullopt if the name is not a valid escape.
auto unescape_path_element(const std::string& name) -> std::optional<std::string>;

/// Prefixes every key with a fixed namespace before delegating.
///
/// Lets several independent data sets share one backend. Keys returned
/// from load_range() have the namespace stripped.
class NamespacedStorage : public StorageInterface {
public:
    NamespacedStorage(std::shared_ptr<StorageInterface> inner, StorageKey ns);

    auto load(const StorageKey& key) -> Task<std::optional<Bytes>> override;
    auto save(const StorageKey& key, Bytes data) -> Task<> override;
    auto remove(const StorageKey& key) -> Task<> override;
    auto load_range(const StorageKey& prefix) -> Task<std::vector<StorageEntry>> override;
    auto remove_range(const StorageKey& prefix) -> Task<> override;

private:
    auto prefixed(const StorageKey& key) const -> StorageKey;

    std::shared_ptr<StorageInterface> inner_;
    StorageKey namespace_;
};

}  // namespace leaf_cpp
