#pragma once

// LEB128 variable-length integers, as used for every length, sequence
// number, counter and timestamp in the update format.
// Internal header — not installed.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace leaf_cpp::encoding {

/// A decoded integer and the number of input bytes it occupied.
template <typename T>
struct Leb128Result {
    T value;
    std::size_t bytes_read;
};

using DecodeResult = Leb128Result<std::uint64_t>;
using SignedDecodeResult = Leb128Result<std::int64_t>;

// The tenth byte of a 64-bit value carries a single payload bit.
inline constexpr std::size_t max_leb128_bytes = 10;

// -- Encoding -----------------------------------------------------------------

inline void encode_uleb128(std::uint64_t value, std::vector<std::byte>& output) {
    while (value >= 0x80) {
        output.push_back(static_cast<std::byte>((value & 0x7F) | 0x80));
        value >>= 7;
    }
    output.push_back(static_cast<std::byte>(value));
}

inline void encode_sleb128(std::int64_t value, std::vector<std::byte>& output) {
    for (;;) {
        auto low = static_cast<std::uint8_t>(value & 0x7F);
        value >>= 7;
        auto sign_clear = (low & 0x40) == 0;
        if ((value == 0 && sign_clear) || (value == -1 && !sign_clear)) {
            output.push_back(static_cast<std::byte>(low));
            return;
        }
        output.push_back(static_cast<std::byte>(low | 0x80));
    }
}

inline auto encode_uleb128(std::uint64_t value) -> std::vector<std::byte> {
    auto out = std::vector<std::byte>{};
    encode_uleb128(value, out);
    return out;
}

inline auto encode_sleb128(std::int64_t value) -> std::vector<std::byte> {
    auto out = std::vector<std::byte>{};
    encode_sleb128(value, out);
    return out;
}

// -- Decoding -----------------------------------------------------------------

/// nullopt on truncated input, or on a value that does not fit 64 bits.
inline auto decode_uleb128(std::span<const std::byte> input) -> std::optional<DecodeResult> {
    auto value = std::uint64_t{0};
    for (std::size_t i = 0; i < input.size() && i < max_leb128_bytes; ++i) {
        auto byte = std::to_integer<std::uint8_t>(input[i]);
        auto payload = static_cast<std::uint64_t>(byte & 0x7F);
        if (i == max_leb128_bytes - 1 && payload > 1) return std::nullopt;
        value |= payload << (7 * i);
        if ((byte & 0x80) == 0) return DecodeResult{.value = value, .bytes_read = i + 1};
    }
    return std::nullopt;
}

/// nullopt on truncated input, or on a value that does not fit 64 bits.
inline auto decode_sleb128(std::span<const std::byte> input) -> std::optional<SignedDecodeResult> {
    auto bits = std::uint64_t{0};
    for (std::size_t i = 0; i < input.size() && i < max_leb128_bytes; ++i) {
        auto byte = std::to_integer<std::uint8_t>(input[i]);
        auto payload = static_cast<std::uint64_t>(byte & 0x7F);
        // Last byte: only the sign bit, repeated, is allowed
        if (i == max_leb128_bytes - 1 && payload != 0 && payload != 0x7F) return std::nullopt;
        bits |= payload << (7 * i);
        if ((byte & 0x80) != 0) continue;

        auto used = 7 * (i + 1);
        if (used < 64 && (byte & 0x40) != 0) bits |= ~std::uint64_t{0} << used;
        return SignedDecodeResult{.value = static_cast<std::int64_t>(bits), .bytes_read = i + 1};
    }
    return std::nullopt;
}

}  // namespace leaf_cpp::encoding
