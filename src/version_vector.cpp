#include <leaf-cpp/version.hpp>

#include "storage/deserializer.hpp"
#include "storage/serializer.hpp"

#include <algorithm>

namespace leaf_cpp {

auto VersionVector::get(const ActorId& actor) const -> std::uint64_t {
    auto it = entries_.find(actor);
    return it == entries_.end() ? 0 : it->second;
}

void VersionVector::set(const ActorId& actor, std::uint64_t seq) {
    if (seq == 0) {
        entries_.erase(actor);
    } else {
        entries_[actor] = seq;
    }
}

void VersionVector::merge(const VersionVector& other) {
    for (const auto& [actor, seq] : other.entries_) {
        auto& mine = entries_[actor];
        mine = std::max(mine, seq);
    }
}

auto VersionVector::includes(const VersionVector& other) const -> bool {
    return std::ranges::all_of(other.entries_, [this](const auto& entry) {
        return get(entry.first) >= entry.second;
    });
}

auto VersionVector::encode() const -> Bytes {
    auto ser = storage::Serializer{};
    ser.write_version_vector(*this);
    return ser.take();
}

auto VersionVector::decode(std::span<const std::byte> data) -> std::optional<VersionVector> {
    auto de = storage::Deserializer{data};
    auto result = de.read_version_vector();
    if (!result || !de.at_end()) return std::nullopt;
    return result;
}

auto compare(const VersionVector& a, const VersionVector& b) -> VersionOrder {
    const auto a_has_b = a.includes(b);
    const auto b_has_a = b.includes(a);
    if (a_has_b && b_has_a) return VersionOrder::equal;
    if (b_has_a) return VersionOrder::before;
    if (a_has_b) return VersionOrder::after;
    return VersionOrder::concurrent;
}

}  // namespace leaf_cpp
