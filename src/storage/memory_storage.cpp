#include <leaf-cpp/storage.hpp>

#include <algorithm>

namespace leaf_cpp {

auto to_string(const StorageKey& key) -> std::string {
    auto result = std::string{};
    for (const auto& element : key) {
        if (!result.empty()) result.push_back('/');
        result += element;
    }
    return result;
}

auto has_prefix(const StorageKey& key, const StorageKey& prefix) -> bool {
    return prefix.size() <= key.size() &&
           std::equal(prefix.begin(), prefix.end(), key.begin());
}

auto MemoryStorage::load(const StorageKey& key) -> Task<std::optional<Bytes>> {
    co_await next_turn();
    auto it = data_.find(key);
    if (it == data_.end()) co_return std::nullopt;
    co_return it->second;
}

auto MemoryStorage::save(const StorageKey& key, Bytes data) -> Task<> {
    co_await next_turn();
    data_[key] = std::move(data);
    ++write_count_;
}

auto MemoryStorage::remove(const StorageKey& key) -> Task<> {
    co_await next_turn();
    data_.erase(key);
}

auto MemoryStorage::load_range(const StorageKey& prefix) -> Task<std::vector<StorageEntry>> {
    co_await next_turn();
    auto result = std::vector<StorageEntry>{};
    // Keys sharing a prefix are contiguous and start at the prefix itself
    for (auto it = data_.lower_bound(prefix);
         it != data_.end() && has_prefix(it->first, prefix); ++it) {
        result.push_back(StorageEntry{.key = it->first, .data = it->second});
    }
    co_return result;
}

auto MemoryStorage::remove_range(const StorageKey& prefix) -> Task<> {
    co_await next_turn();
    auto first = data_.lower_bound(prefix);
    auto last = first;
    while (last != data_.end() && has_prefix(last->first, prefix)) ++last;
    data_.erase(first, last);
}

auto MemoryStorage::keys() const -> std::vector<StorageKey> {
    auto result = std::vector<StorageKey>{};
    result.reserve(data_.size());
    for (const auto& [key, value] : data_) result.push_back(key);
    return result;
}

}  // namespace leaf_cpp
