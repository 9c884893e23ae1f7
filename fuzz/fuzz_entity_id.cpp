// Fuzz target for EntityId text parsing and VersionVector decoding.

#include <leaf-cpp/entity_id.hpp>
#include <leaf-cpp/version.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <span>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto text = std::string_view(reinterpret_cast<const char*>(data), size);
    if (auto id = leaf_cpp::EntityId::try_parse(text)) {
        if (leaf_cpp::EntityId::parse(id->to_string()) != *id) std::abort();
    }

    const auto span = std::span<const std::byte>(
        reinterpret_cast<const std::byte*>(data), size);
    if (auto version = leaf_cpp::VersionVector::decode(span)) {
        auto encoded = version->encode();
        if (leaf_cpp::VersionVector::decode(encoded) != version) std::abort();
    }
    return 0;
}
