#include <leaf-cpp/entity_id.hpp>
#include <leaf-cpp/error.hpp>
#include <leaf-cpp/types.hpp>

#include "encoding/base32.hpp"

#include <cctype>
#include <cstring>

namespace leaf_cpp {

auto EntityId::random() -> EntityId {
    auto id = EntityId{};
    fill_random(id.bytes);
    return id;
}

auto EntityId::try_parse(std::string_view text) -> std::optional<EntityId> {
    if (!text.starts_with(prefix)) return std::nullopt;
    auto decoded = encoding::decode_base32(text.substr(prefix.size()));
    if (!decoded || decoded->size() != size) return std::nullopt;
    auto id = EntityId{};
    std::memcpy(id.bytes.data(), decoded->data(), size);
    return id;
}

auto EntityId::parse(std::string_view text) -> EntityId {
    if (!text.starts_with(prefix)) {
        throw Exception{ErrorKind::invalid_entity_id,
                        "entity id must start with `" + std::string{prefix} + "`"};
    }
    auto decoded = encoding::decode_base32(text.substr(prefix.size()));
    if (!decoded) {
        throw Exception{ErrorKind::invalid_entity_id,
                        "entity id contains a character outside the Crockford alphabet"};
    }
    if (decoded->size() != size) {
        throw Exception{ErrorKind::invalid_entity_id,
                        "invalid byte length for entity id (" + std::to_string(decoded->size()) +
                        "), expected 32"};
    }
    auto id = EntityId{};
    std::memcpy(id.bytes.data(), decoded->data(), size);
    return id;
}

auto EntityId::to_string() const -> std::string {
    auto encoded = encoding::encode_base32(bytes);
    for (auto& c : encoded) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return std::string{prefix} + encoded;
}

}  // namespace leaf_cpp
