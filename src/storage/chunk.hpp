#pragma once

// The envelope around every update, snapshot and stored chunk:
//
//   "leaf"       4 bytes of magic
//   checksum     first 4 bytes of SHA-256(body)
//   type         1 byte, a ChunkType
//   length       ULEB128 byte length of the body
//   body
//
// Internal header — not installed.

#include "../crypto/sha256.hpp"
#include "../encoding/leb128.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace leaf_cpp::storage {

inline constexpr std::array<std::byte, 4> chunk_magic = {
    std::byte{'l'}, std::byte{'e'}, std::byte{'a'}, std::byte{'f'}
};

enum class ChunkType : std::uint8_t {
    snapshot   = 0x00,  ///< Body exported from the empty version.
    update     = 0x01,  ///< Body exported from a non-empty version.
    compressed = 0x02,  ///< Inner type byte, then a raw DEFLATE body.
};

using Checksum = std::array<std::byte, 4>;

struct ChunkHeader {
    ChunkType type;
    Checksum checksum;
    std::size_t body_offset;  ///< Where the body starts in the parsed buffer.
    std::size_t body_length;

    auto end_offset() const -> std::size_t { return body_offset + body_length; }
};

inline auto compute_chunk_checksum(std::span<const std::byte> body) -> Checksum {
    auto digest = crypto::sha256(body);
    auto result = Checksum{};
    std::copy_n(digest.begin(), result.size(), result.begin());
    return result;
}

/// Read the envelope fields at the start of `data`; the body itself is
/// neither bounds-checked nor verified. nullopt on bad magic, an unknown
/// type, or truncation.
inline auto parse_chunk_header(std::span<const std::byte> data) -> std::optional<ChunkHeader> {
    constexpr auto fixed_size = chunk_magic.size() + Checksum{}.size() + 1;
    if (data.size() < fixed_size) return std::nullopt;
    if (!std::equal(chunk_magic.begin(), chunk_magic.end(), data.begin())) return std::nullopt;

    auto header = ChunkHeader{};
    std::copy_n(data.begin() + chunk_magic.size(), header.checksum.size(),
                header.checksum.begin());

    auto type = std::to_integer<std::uint8_t>(data[fixed_size - 1]);
    if (type > static_cast<std::uint8_t>(ChunkType::compressed)) return std::nullopt;
    header.type = static_cast<ChunkType>(type);

    auto length = encoding::decode_uleb128(data.subspan(fixed_size));
    if (!length) return std::nullopt;
    header.body_offset = fixed_size + length->bytes_read;
    header.body_length = static_cast<std::size_t>(length->value);
    return header;
}

/// True if the body lies inside `data` and hashes to the header checksum.
inline auto validate_chunk_checksum(const ChunkHeader& header,
                                    std::span<const std::byte> data) -> bool {
    if (header.body_offset > data.size()) return false;
    if (header.body_length > data.size() - header.body_offset) return false;
    return compute_chunk_checksum(data.subspan(header.body_offset, header.body_length)) ==
           header.checksum;
}

/// Append one complete chunk holding `body` to `output`.
inline void write_chunk(ChunkType type, std::span<const std::byte> body,
                        std::vector<std::byte>& output) {
    auto checksum = compute_chunk_checksum(body);
    output.reserve(output.size() + body.size() + 20);
    output.insert(output.end(), chunk_magic.begin(), chunk_magic.end());
    output.insert(output.end(), checksum.begin(), checksum.end());
    output.push_back(std::byte{static_cast<std::uint8_t>(type)});
    encoding::encode_uleb128(body.size(), output);
    output.insert(output.end(), body.begin(), body.end());
}

}  // namespace leaf_cpp::storage
