#pragma once

// Byte stream deserializer for the leaf update format.
// Every read returns nullopt on truncated or malformed input; nothing throws.
// Internal header — not installed.

#include <leaf-cpp/change.hpp>
#include <leaf-cpp/types.hpp>
#include <leaf-cpp/value.hpp>
#include <leaf-cpp/version.hpp>
#include "../encoding/leb128.hpp"
#include "serializer.hpp"

#include <algorithm>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace leaf_cpp::storage {

class Deserializer {
public:
    explicit Deserializer(std::span<const std::byte> data)
        : data_{data}, pos_{0} {}

    auto remaining() const -> std::size_t { return data_.size() - pos_; }
    auto pos() const -> std::size_t { return pos_; }
    auto at_end() const -> bool { return pos_ >= data_.size(); }

    auto read_u8() -> std::optional<std::uint8_t> {
        if (pos_ >= data_.size()) return std::nullopt;
        return static_cast<std::uint8_t>(data_[pos_++]);
    }

    auto read_bytes(std::size_t n) -> std::optional<std::span<const std::byte>> {
        if (n > remaining()) return std::nullopt;
        auto result = data_.subspan(pos_, n);
        pos_ += n;
        return result;
    }

    auto read_u64_le() -> std::optional<std::uint64_t> {
        auto bytes = read_bytes(8);
        if (!bytes) return std::nullopt;
        auto v = std::uint64_t{0};
        for (int i = 7; i >= 0; --i) v = (v << 8) | std::to_integer<std::uint64_t>((*bytes)[i]);
        return v;
    }

    auto read_uleb128() -> std::optional<std::uint64_t> {
        auto result = encoding::decode_uleb128(data_.subspan(pos_));
        if (!result) return std::nullopt;
        pos_ += result->bytes_read;
        return result->value;
    }

    auto read_sleb128() -> std::optional<std::int64_t> {
        auto result = encoding::decode_sleb128(data_.subspan(pos_));
        if (!result) return std::nullopt;
        pos_ += result->bytes_read;
        return result->value;
    }

    auto read_string() -> std::optional<std::string> {
        auto len = read_uleb128();
        if (!len || *len > remaining()) return std::nullopt;
        auto bytes = read_bytes(static_cast<std::size_t>(*len));
        if (!bytes) return std::nullopt;
        return std::string{reinterpret_cast<const char*>(bytes->data()), bytes->size()};
    }

    auto read_actor_id() -> std::optional<ActorId> {
        auto bytes = read_bytes(ActorId::size);
        if (!bytes) return std::nullopt;
        auto id = ActorId{};
        std::ranges::copy(*bytes, id.bytes.begin());
        return id;
    }

    // Rejects unsorted or duplicate actors and zero sequences so that every
    // vector has exactly one encoding.
    auto read_version_vector() -> std::optional<VersionVector> {
        auto count = read_uleb128();
        // Each entry needs at least 17 bytes
        if (!count || *count > remaining() / (ActorId::size + 1)) return std::nullopt;

        auto result = VersionVector{};
        auto previous = std::optional<ActorId>{};
        for (std::uint64_t i = 0; i < *count; ++i) {
            auto actor = read_actor_id();
            if (!actor) return std::nullopt;
            if (previous && !(*previous < *actor)) return std::nullopt;
            auto seq = read_uleb128();
            if (!seq || *seq == 0) return std::nullopt;
            result.set(*actor, *seq);
            previous = *actor;
        }
        return result;
    }

    auto read_scalar_value() -> std::optional<ScalarValue> {
        auto tag = read_u8();
        if (!tag) return std::nullopt;
        switch (static_cast<ScalarTag>(*tag)) {
            case ScalarTag::null:
                return ScalarValue{Null{}};
            case ScalarTag::boolean: {
                auto b = read_u8();
                if (!b || *b > 1) return std::nullopt;
                return ScalarValue{*b != 0};
            }
            case ScalarTag::int64: {
                auto v = read_sleb128();
                if (!v) return std::nullopt;
                return ScalarValue{*v};
            }
            case ScalarTag::float64: {
                auto bits = read_u64_le();
                if (!bits) return std::nullopt;
                return ScalarValue{std::bit_cast<double>(*bits)};
            }
            case ScalarTag::string: {
                auto s = read_string();
                if (!s) return std::nullopt;
                return ScalarValue{std::move(*s)};
            }
            case ScalarTag::bytes: {
                auto len = read_uleb128();
                if (!len || *len > remaining()) return std::nullopt;
                auto bytes = read_bytes(static_cast<std::size_t>(*len));
                if (!bytes) return std::nullopt;
                return ScalarValue{Bytes(bytes->begin(), bytes->end())};
            }
        }
        return std::nullopt;
    }

    auto read_op() -> std::optional<Op> {
        auto action = read_u8();
        if (!action) return std::nullopt;
        auto container = read_string();
        if (!container) return std::nullopt;

        auto op = Op{};
        op.container = std::move(*container);
        switch (static_cast<OpType>(*action)) {
            case OpType::put: {
                auto key = read_string();
                if (!key) return std::nullopt;
                auto value = read_scalar_value();
                if (!value) return std::nullopt;
                op.action = OpType::put;
                op.key = std::move(*key);
                op.value = std::move(*value);
                return op;
            }
            case OpType::del: {
                auto key = read_string();
                if (!key) return std::nullopt;
                op.action = OpType::del;
                op.key = std::move(*key);
                op.value = Null{};
                return op;
            }
            case OpType::increment: {
                auto delta = read_sleb128();
                if (!delta) return std::nullopt;
                op.action = OpType::increment;
                op.value = *delta;
                return op;
            }
        }
        return std::nullopt;
    }

    auto read_change() -> std::optional<Change> {
        auto actor = read_actor_id();
        if (!actor) return std::nullopt;
        auto seq = read_uleb128();
        if (!seq || *seq == 0) return std::nullopt;
        auto start_op = read_uleb128();
        if (!start_op || *start_op == 0) return std::nullopt;
        auto timestamp = read_sleb128();
        if (!timestamp) return std::nullopt;

        auto has_message = read_u8();
        if (!has_message || *has_message > 1) return std::nullopt;
        auto message = std::optional<std::string>{};
        if (*has_message == 1) {
            message = read_string();
            if (!message) return std::nullopt;
        }

        auto num_ops = read_uleb128();
        // Each op needs at least 2 bytes
        if (!num_ops || *num_ops > remaining() / 2) return std::nullopt;
        auto operations = std::vector<Op>{};
        operations.reserve(static_cast<std::size_t>(*num_ops));
        for (std::uint64_t i = 0; i < *num_ops; ++i) {
            auto op = read_op();
            if (!op) return std::nullopt;
            operations.push_back(std::move(*op));
        }

        return Change{
            .actor = *actor,
            .seq = *seq,
            .start_op = *start_op,
            .timestamp = *timestamp,
            .message = std::move(message),
            .operations = std::move(operations),
        };
    }

private:
    std::span<const std::byte> data_;
    std::size_t pos_;
};

}  // namespace leaf_cpp::storage
