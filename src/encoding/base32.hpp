#pragma once

// Crockford base-32 encoding, as used for entity id text and chunk hashes.
//
// Alphabet: 0123456789ABCDEFGHJKMNPQRSTVWXYZ (no I, L, O, U). The encoder
// emits upper case without padding; trailing bits are zero-filled. The
// decoder accepts either case, maps O->0 and I/L->1, ignores '-', and
// rejects everything else. Trailing bits that do not make a whole byte
// are discarded.
//
// Internal header — not installed.

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace leaf_cpp::encoding {

inline constexpr std::string_view crockford_alphabet = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

// Encode bytes as Crockford base-32 (upper case, unpadded).
inline auto encode_base32(std::span<const std::byte> data) -> std::string {
    auto result = std::string{};
    result.reserve((data.size() * 8 + 4) / 5);

    auto buffer = std::uint32_t{0};
    auto bits = 0u;
    for (auto b : data) {
        buffer = (buffer << 8) | static_cast<std::uint8_t>(b);
        bits += 8;
        while (bits >= 5) {
            result.push_back(crockford_alphabet[(buffer >> (bits - 5)) & 0x1F]);
            bits -= 5;
        }
    }
    if (bits > 0) {
        result.push_back(crockford_alphabet[(buffer << (5 - bits)) & 0x1F]);
    }
    return result;
}

// Map one character to its 5-bit value, or nullopt if it is not part of
// the alphabet.
inline auto decode_base32_char(char c) -> std::optional<std::uint8_t> {
    static const auto table = []() {
        auto t = std::array<std::int8_t, 256>{};
        t.fill(-1);
        for (std::size_t i = 0; i < crockford_alphabet.size(); ++i) {
            auto upper = static_cast<unsigned char>(crockford_alphabet[i]);
            t[upper] = static_cast<std::int8_t>(i);
            if (upper >= 'A' && upper <= 'Z') {
                t[upper - 'A' + 'a'] = static_cast<std::int8_t>(i);
            }
        }
        t['O'] = t['o'] = 0;
        t['I'] = t['i'] = t['L'] = t['l'] = 1;
        return t;
    }();
    auto v = table[static_cast<unsigned char>(c)];
    if (v < 0) return std::nullopt;
    return static_cast<std::uint8_t>(v);
}

// Decode Crockford base-32. Returns nullopt on any invalid character.
inline auto decode_base32(std::string_view text) -> std::optional<std::vector<std::byte>> {
    auto result = std::vector<std::byte>{};
    result.reserve(text.size() * 5 / 8);

    auto buffer = std::uint32_t{0};
    auto bits = 0u;
    for (auto c : text) {
        if (c == '-') continue;
        auto v = decode_base32_char(c);
        if (!v) return std::nullopt;
        buffer = (buffer << 5) | *v;
        bits += 5;
        if (bits >= 8) {
            result.push_back(static_cast<std::byte>((buffer >> (bits - 8)) & 0xFF));
            bits -= 8;
        }
    }
    return result;
}

}  // namespace leaf_cpp::encoding
