#pragma once

// Update chunk serialization/deserialization.
//
// An update body contains:
//   1. the `from` version vector the delta was exported against
//   2. the exporter's full `to` version vector
//   3. ULEB128 change count, then the changes sorted by (actor, seq)
//
// Snapshots use the same body with an empty `from` and chunk type
// `snapshot`. Bodies above deflate_threshold are wrapped in a
// `compressed` chunk whose body is the inner type byte + raw DEFLATE.
//
// Internal header — not installed.

#include <leaf-cpp/change.hpp>
#include <leaf-cpp/update.hpp>
#include <leaf-cpp/version.hpp>

#include "chunk.hpp"
#include "compression.hpp"
#include "deserializer.hpp"
#include "serializer.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace leaf_cpp::storage {

struct DecodedUpdate {
    UpdateMeta meta;
    std::vector<Change> changes;
};

inline auto encode_update(const VersionVector& from, const VersionVector& to,
                          const std::vector<const Change*>& changes)
    -> std::vector<std::byte> {

    auto ser = Serializer{};
    ser.write_version_vector(from);
    ser.write_version_vector(to);
    ser.write_uleb128(changes.size());
    for (const auto* change : changes) {
        ser.write_change(*change);
    }
    auto body = ser.take();

    auto type = from.empty() ? ChunkType::snapshot : ChunkType::update;
    auto output = std::vector<std::byte>{};

    if (body.size() > deflate_threshold) {
        auto compressed = deflate_compress(body);
        if (compressed && compressed->size() + 1 < body.size()) {
            auto wrapped = std::vector<std::byte>{};
            wrapped.reserve(compressed->size() + 1);
            wrapped.push_back(static_cast<std::byte>(type));
            wrapped.insert(wrapped.end(), compressed->begin(), compressed->end());
            write_chunk(ChunkType::compressed, wrapped, output);
            return output;
        }
    }

    write_chunk(type, body, output);
    return output;
}

// Validate the envelope and return the (decompressed) body and its type.
inline auto unwrap_update_body(std::span<const std::byte> data)
    -> std::optional<std::pair<ChunkType, std::vector<std::byte>>> {

    auto header = parse_chunk_header(data);
    if (!header) return std::nullopt;
    if (!validate_chunk_checksum(*header, data)) return std::nullopt;
    // Exactly one chunk per buffer
    if (header->end_offset() != data.size()) return std::nullopt;

    auto body = data.subspan(header->body_offset, header->body_length);
    if (header->type != ChunkType::compressed) {
        return std::pair{header->type, std::vector<std::byte>(body.begin(), body.end())};
    }

    if (body.empty()) return std::nullopt;
    auto inner = static_cast<std::uint8_t>(body[0]);
    if (inner > static_cast<std::uint8_t>(ChunkType::update)) return std::nullopt;
    auto inflated = deflate_decompress(body.subspan(1));
    if (!inflated) return std::nullopt;
    return std::pair{static_cast<ChunkType>(inner), std::move(*inflated)};
}

// Decode an update. With header_only the changes are not parsed and
// `changes` is left empty.
inline auto decode_update(std::span<const std::byte> data, bool header_only = false)
    -> std::optional<DecodedUpdate> {

    auto unwrapped = unwrap_update_body(data);
    if (!unwrapped) return std::nullopt;
    const auto& [type, body] = *unwrapped;

    auto de = Deserializer{body};
    auto from = de.read_version_vector();
    if (!from) return std::nullopt;
    auto to = de.read_version_vector();
    if (!to) return std::nullopt;
    if ((type == ChunkType::snapshot) != from->empty()) return std::nullopt;

    auto count = de.read_uleb128();
    if (!count) return std::nullopt;

    auto result = DecodedUpdate{};
    result.meta = UpdateMeta{
        .kind = type == ChunkType::snapshot ? UpdateKind::snapshot : UpdateKind::update,
        .from = std::move(*from),
        .to = std::move(*to),
        .change_count = static_cast<std::size_t>(*count),
    };
    // Every change takes more than one byte
    if (*count > de.remaining()) return std::nullopt;
    if (header_only) return result;

    result.changes.reserve(static_cast<std::size_t>(*count));
    for (std::uint64_t i = 0; i < *count; ++i) {
        auto change = de.read_change();
        if (!change) return std::nullopt;
        result.changes.push_back(std::move(*change));
    }
    if (!de.at_end()) return std::nullopt;

    return result;
}

}  // namespace leaf_cpp::storage
