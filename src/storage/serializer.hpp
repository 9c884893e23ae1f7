#pragma once

// Byte stream serializer for the leaf update format.
// Internal header — not installed.

#include <leaf-cpp/change.hpp>
#include <leaf-cpp/types.hpp>
#include <leaf-cpp/value.hpp>
#include <leaf-cpp/version.hpp>
#include "../encoding/leb128.hpp"

#include <bit>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace leaf_cpp::storage {

// Scalar tags. The order matches the ScalarValue alternatives.
enum class ScalarTag : std::uint8_t {
    null     = 0,
    boolean  = 1,
    int64    = 2,
    float64  = 3,
    string   = 4,
    bytes    = 5,
};

class Serializer {
public:
    void write_u8(std::uint8_t v) {
        data_.push_back(static_cast<std::byte>(v));
    }

    void write_bytes(std::span<const std::byte> bytes) {
        data_.insert(data_.end(), bytes.begin(), bytes.end());
    }

    // Fixed eight bytes, least significant first.
    void write_u64_le(std::uint64_t v) {
        for (int i = 0; i < 8; ++i) write_u8(static_cast<std::uint8_t>(v >> (8 * i)));
    }

    void write_uleb128(std::uint64_t value) {
        encoding::encode_uleb128(value, data_);
    }

    void write_sleb128(std::int64_t value) {
        encoding::encode_sleb128(value, data_);
    }

    void write_string(std::string_view s) {
        write_uleb128(s.size());
        write_bytes(std::as_bytes(std::span{s.data(), s.size()}));
    }

    void write_actor_id(const ActorId& id) {
        write_bytes(id.bytes);
    }

    // ULEB128 count, then (actor, ULEB128 seq) pairs in actor order.
    void write_version_vector(const VersionVector& v) {
        write_uleb128(v.size());
        for (const auto& [actor, seq] : v.entries()) {
            write_actor_id(actor);
            write_uleb128(seq);
        }
    }

    void write_scalar_value(const ScalarValue& sv) {
        std::visit([this](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Null>) {
                write_u8(static_cast<std::uint8_t>(ScalarTag::null));
            } else if constexpr (std::is_same_v<T, bool>) {
                write_u8(static_cast<std::uint8_t>(ScalarTag::boolean));
                write_u8(v ? 1 : 0);
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                write_u8(static_cast<std::uint8_t>(ScalarTag::int64));
                write_sleb128(v);
            } else if constexpr (std::is_same_v<T, double>) {
                write_u8(static_cast<std::uint8_t>(ScalarTag::float64));
                write_u64_le(std::bit_cast<std::uint64_t>(v));
            } else if constexpr (std::is_same_v<T, std::string>) {
                write_u8(static_cast<std::uint8_t>(ScalarTag::string));
                write_string(v);
            } else if constexpr (std::is_same_v<T, Bytes>) {
                write_u8(static_cast<std::uint8_t>(ScalarTag::bytes));
                write_uleb128(v.size());
                write_bytes(v);
            }
        }, sv);
    }

    void write_op(const Op& op) {
        write_u8(static_cast<std::uint8_t>(op.action));
        write_string(op.container);
        switch (op.action) {
            case OpType::put:
                write_string(op.key);
                write_scalar_value(op.value);
                break;
            case OpType::del:
                write_string(op.key);
                break;
            case OpType::increment:
                write_sleb128(std::get<std::int64_t>(op.value));
                break;
        }
    }

    void write_change(const Change& change) {
        write_actor_id(change.actor);
        write_uleb128(change.seq);
        write_uleb128(change.start_op);
        write_sleb128(change.timestamp);
        if (change.message) {
            write_u8(1);
            write_string(*change.message);
        } else {
            write_u8(0);
        }
        write_uleb128(change.operations.size());
        for (const auto& op : change.operations) {
            write_op(op);
        }
    }

    auto data() const -> const std::vector<std::byte>& { return data_; }
    auto take() -> std::vector<std::byte> { return std::move(data_); }

private:
    std::vector<std::byte> data_;
};

}  // namespace leaf_cpp::storage
