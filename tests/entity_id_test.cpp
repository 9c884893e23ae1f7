#include <leaf-cpp/entity_id.hpp>
#include <leaf-cpp/error.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <cctype>
#include <string>
#include <unordered_set>

using namespace leaf_cpp;

namespace {

auto sequential_id() -> EntityId {
    auto id = EntityId{};
    for (std::size_t i = 0; i < EntityId::size; ++i) {
        id.bytes[i] = static_cast<std::byte>(i);
    }
    return id;
}

}  // namespace

TEST(EntityId, text_form_has_prefix_and_52_characters) {
    auto text = EntityId::random().to_string();
    ASSERT_TRUE(text.starts_with("leaf:"));
    // 256 bits in 5-bit groups
    EXPECT_EQ(text.size(), 5u + 52u);
}

TEST(EntityId, text_form_is_lower_case) {
    auto text = sequential_id().to_string();
    EXPECT_TRUE(std::ranges::none_of(text, [](char c) {
        return std::isupper(static_cast<unsigned char>(c));
    }));
}

TEST(EntityId, zero_id_encodes_as_zeros) {
    EXPECT_EQ(EntityId{}.to_string(), "leaf:" + std::string(52, '0'));
}

TEST(EntityId, parse_round_trips_byte_exact) {
    for (int i = 0; i < 50; ++i) {
        auto id = EntityId::random();
        EXPECT_EQ(EntityId::parse(id.to_string()), id);
    }
    EXPECT_EQ(EntityId::parse(sequential_id().to_string()), sequential_id());
}

TEST(EntityId, parse_is_case_insensitive) {
    auto id = sequential_id();
    auto text = id.to_string();
    auto upper = std::string{"leaf:"};
    for (auto c : text.substr(5)) upper.push_back(static_cast<char>(std::toupper(c)));
    EXPECT_EQ(EntityId::parse(upper), id);
}

TEST(EntityId, parse_accepts_crockford_aliases_and_hyphens) {
    auto zero = "leaf:" + std::string(52, '0');
    auto aliased = "leaf:" + std::string(26, 'o') + "-" + std::string(26, 'O');
    EXPECT_EQ(EntityId::parse(aliased), EntityId::parse(zero));
}

TEST(EntityId, parse_rejects_missing_prefix) {
    auto text = EntityId::random().to_string().substr(5);
    try {
        EntityId::parse(text);
        FAIL() << "expected an exception";
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), ErrorKind::invalid_entity_id);
    }
}

TEST(EntityId, parse_rejects_invalid_character) {
    auto text = EntityId::random().to_string();
    text[10] = 'u';  // not in the Crockford alphabet
    try {
        EntityId::parse(text);
        FAIL() << "expected an exception";
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), ErrorKind::invalid_entity_id);
    }
}

TEST(EntityId, parse_rejects_wrong_length) {
    auto text = EntityId::random().to_string();
    EXPECT_THROW(EntityId::parse(text.substr(0, text.size() - 2)), Exception);
    EXPECT_THROW(EntityId::parse(text + "0000"), Exception);
    EXPECT_THROW(EntityId::parse("leaf:"), Exception);
}

TEST(EntityId, try_parse_returns_nullopt_instead_of_throwing) {
    EXPECT_FALSE(EntityId::try_parse("nope").has_value());
    EXPECT_FALSE(EntityId::try_parse("leaf:!!").has_value());
    auto id = EntityId::random();
    EXPECT_EQ(EntityId::try_parse(id.to_string()), id);
}

TEST(EntityId, random_ids_are_distinct) {
    auto seen = std::unordered_set<EntityId>{};
    for (int i = 0; i < 1000; ++i) {
        EXPECT_TRUE(seen.insert(EntityId::random()).second);
    }
}

TEST(EntityId, ordering_follows_bytes) {
    auto a = EntityId{};
    auto b = EntityId{};
    b.bytes[31] = std::byte{1};
    EXPECT_LT(a, b);
    EXPECT_NE(a, b);
}
