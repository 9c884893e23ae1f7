#include <leaf-cpp/error.hpp>
#include <leaf-cpp/json.hpp>

#include <cctype>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace leaf_cpp {

namespace {

constexpr auto hex_digits = std::string_view{"0123456789abcdef"};
constexpr auto base64_alphabet =
    std::string_view{"ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/"};

auto to_hex(std::span<const std::byte> data) -> std::string {
    auto out = std::string{};
    out.reserve(data.size() * 2);
    for (auto b : data) {
        auto v = std::to_integer<unsigned>(b);
        out += hex_digits[v >> 4];
        out += hex_digits[v & 0xF];
    }
    return out;
}

auto hex_value(char c) -> unsigned {
    auto lower = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    auto pos = hex_digits.find(lower);
    if (pos == std::string_view::npos) {
        throw Exception{ErrorKind::decoding_error, "invalid hex character"};
    }
    return static_cast<unsigned>(pos);
}

// Parse exactly out.size() bytes of hex.
void from_hex(std::string_view hex, std::span<std::byte> out) {
    if (hex.size() != out.size() * 2) {
        throw Exception{ErrorKind::decoding_error, "hex string length mismatch"};
    }
    for (std::size_t i = 0; i < out.size(); ++i) {
        out[i] = std::byte(static_cast<unsigned char>(
            (hex_value(hex[2 * i]) << 4) | hex_value(hex[2 * i + 1])));
    }
}

auto actor_from_hex(std::string_view hex) -> ActorId {
    auto actor = ActorId{};
    from_hex(hex, actor.bytes);
    return actor;
}

auto to_base64(const Bytes& data) -> std::string {
    auto out = std::string{};
    out.reserve((data.size() + 2) / 3 * 4);
    auto acc = std::uint32_t{0};
    auto bits = 0;
    for (auto b : data) {
        acc = (acc << 8) | std::to_integer<std::uint32_t>(b);
        bits += 8;
        while (bits >= 6) {
            bits -= 6;
            out += base64_alphabet[(acc >> bits) & 0x3F];
        }
    }
    if (bits > 0) out += base64_alphabet[(acc << (6 - bits)) & 0x3F];
    while (out.size() % 4 != 0) out += '=';
    return out;
}

auto from_base64(std::string_view text) -> Bytes {
    while (!text.empty() && text.back() == '=') text.remove_suffix(1);
    auto out = Bytes{};
    out.reserve(text.size() * 3 / 4);
    auto acc = std::uint32_t{0};
    auto bits = 0;
    for (auto c : text) {
        auto pos = base64_alphabet.find(c);
        if (pos == std::string_view::npos) {
            throw Exception{ErrorKind::decoding_error, "invalid base64 character"};
        }
        acc = (acc << 6) | static_cast<std::uint32_t>(pos);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(std::byte(static_cast<unsigned char>((acc >> bits) & 0xFF)));
        }
    }
    return out;
}

}  // anonymous namespace

// -- ScalarValue --------------------------------------------------------------

void to_json(nlohmann::json& j, const ScalarValue& sv) {
    std::visit(overload{
        [&](Null) { j = nullptr; },
        [&](bool b) { j = b; },
        [&](std::int64_t i) { j = i; },
        [&](double d) { j = d; },
        [&](const std::string& s) { j = s; },
        [&](const Bytes& b) {
            j = nlohmann::json{{"__type", "bytes"}, {"value", to_base64(b)}};
        },
    }, sv);
}

void from_json(const nlohmann::json& j, ScalarValue& sv) {
    if (j.is_object() && j.value("__type", std::string{}) == "bytes") {
        sv = from_base64(j.at("value").get<std::string>());
        return;
    }
    if (j.is_null()) {
        sv = Null{};
    } else if (j.is_boolean()) {
        sv = j.get<bool>();
    } else if (j.is_number_unsigned()) {
        auto val = j.get<std::uint64_t>();
        if (val > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            throw Exception{ErrorKind::decoding_error, "integer out of range"};
        }
        sv = static_cast<std::int64_t>(val);
    } else if (j.is_number_integer()) {
        sv = j.get<std::int64_t>();
    } else if (j.is_number_float()) {
        sv = j.get<double>();
    } else if (j.is_string()) {
        sv = j.get<std::string>();
    } else {
        throw Exception{ErrorKind::decoding_error, "cannot convert JSON to ScalarValue"};
    }
}

// -- Identity types -----------------------------------------------------------

void to_json(nlohmann::json& j, const ActorId& id) {
    j = to_hex(id.bytes);
}

void from_json(const nlohmann::json& j, ActorId& id) {
    id = actor_from_hex(j.get<std::string>());
}

void to_json(nlohmann::json& j, const EntityId& id) {
    j = id.to_string();
}

void from_json(const nlohmann::json& j, EntityId& id) {
    id = EntityId::parse(j.get<std::string>());
}

void to_json(nlohmann::json& j, const VersionVector& version) {
    j = nlohmann::json::object();
    for (const auto& [actor, seq] : version.entries()) {
        j[to_hex(actor.bytes)] = seq;
    }
}

void from_json(const nlohmann::json& j, VersionVector& version) {
    version = VersionVector{};
    for (const auto& [key, value] : j.items()) {
        version.set(actor_from_hex(key), value.get<std::uint64_t>());
    }
}

// -- Compound types -----------------------------------------------------------

void to_json(nlohmann::json& j, const Op& op) {
    j = nlohmann::json{
        {"action", std::string{to_string_view(op.action)}},
        {"container", op.container},
    };
    switch (op.action) {
        case OpType::put:
            j["key"] = op.key;
            j["value"] = op.value;
            break;
        case OpType::del:
            j["key"] = op.key;
            break;
        case OpType::increment:
            j["delta"] = op.value;
            break;
    }
}

void to_json(nlohmann::json& j, const Change& c) {
    j = nlohmann::json{
        {"actor", c.actor},
        {"seq", c.seq},
        {"start_op", c.start_op},
        {"timestamp", c.timestamp},
        {"ops", c.operations},
    };
    if (c.message) {
        j["message"] = *c.message;
    }
}

void to_json(nlohmann::json& j, const UpdateMeta& meta) {
    j = nlohmann::json{
        {"kind", std::string{to_string_view(meta.kind)}},
        {"from", meta.from},
        {"to", meta.to},
        {"changes", meta.change_count},
    };
}

// -- Document export ----------------------------------------------------------

auto export_json(const Document& doc) -> nlohmann::json {
    auto result = nlohmann::json::object();
    for (const auto& container : doc.containers()) {
        auto entries = nlohmann::json::object();
        for (const auto& key : doc.keys(container)) {
            if (auto value = doc.get(container, key)) {
                entries[key] = *value;
            }
        }
        result[container] = nlohmann::json{
            {"entries", std::move(entries)},
            {"counter", doc.counter(container)},
        };
    }
    return result;
}

}  // namespace leaf_cpp
