#include <leaf-cpp/storage.hpp>

namespace leaf_cpp {

NamespacedStorage::NamespacedStorage(std::shared_ptr<StorageInterface> inner, StorageKey ns)
    : inner_{std::move(inner)}, namespace_{std::move(ns)} {}

auto NamespacedStorage::prefixed(const StorageKey& key) const -> StorageKey {
    auto result = namespace_;
    result.insert(result.end(), key.begin(), key.end());
    return result;
}

auto NamespacedStorage::load(const StorageKey& key) -> Task<std::optional<Bytes>> {
    co_return co_await inner_->load(prefixed(key));
}

auto NamespacedStorage::save(const StorageKey& key, Bytes data) -> Task<> {
    co_await inner_->save(prefixed(key), std::move(data));
}

auto NamespacedStorage::remove(const StorageKey& key) -> Task<> {
    co_await inner_->remove(prefixed(key));
}

auto NamespacedStorage::load_range(const StorageKey& prefix) -> Task<std::vector<StorageEntry>> {
    auto entries = co_await inner_->load_range(prefixed(prefix));
    for (auto& entry : entries) {
        entry.key.erase(entry.key.begin(),
                        entry.key.begin() + static_cast<std::ptrdiff_t>(namespace_.size()));
    }
    co_return entries;
}

auto NamespacedStorage::remove_range(const StorageKey& prefix) -> Task<> {
    co_await inner_->remove_range(prefixed(prefix));
}

}  // namespace leaf_cpp
