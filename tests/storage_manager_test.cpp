#include <leaf-cpp/error.hpp>
#include <leaf-cpp/storage_manager.hpp>

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>

using namespace leaf_cpp;
using leaf_cpp::testing::run;
using leaf_cpp::testing::to_bytes;

namespace {

const auto Name = def_component<MapComponent>("name:01JNVY76XPH6Q5AVA385HP04G7");

void set_first_name(Entity& entity, const std::string& first) {
    entity.get_or_init(Name).set("first", first);
    entity.commit();
}

auto first_name(Entity& entity) -> std::optional<std::string> {
    auto name = entity.get(Name);
    if (!name) return std::nullopt;
    return name->get_as<std::string>("first");
}

// Memory storage whose single-key removals always fail.
class UndeletableStorage : public MemoryStorage {
public:
    auto remove(const StorageKey& /*key*/) -> Task<> override {
        co_await next_turn();
        throw Exception{ErrorKind::storage_error, "remove refused"};
    }
};

// Memory storage whose writes always fail.
class ReadOnlyStorage : public MemoryStorage {
public:
    auto save(const StorageKey& /*key*/, Bytes /*data*/) -> Task<> override {
        co_await next_turn();
        throw Exception{ErrorKind::storage_error, "read only"};
    }
};

}  // namespace

TEST(StorageManager, chunk_keys_follow_the_layout) {
    auto id = EntityId::random();
    auto key = StorageManager::chunk_key(id, ChunkInfo{.kind = ChunkKind::snapshot, .hash = "H"});
    EXPECT_EQ(key, (StorageKey{"data", id.to_string(), "snapshot", "H"}));
    EXPECT_EQ(StorageManager::entity_prefix(id), (StorageKey{"data", id.to_string()}));
}

TEST(StorageManager, load_of_unknown_entity_returns_false) {
    auto io = net::io_context{};
    auto manager = StorageManager{std::make_shared<MemoryStorage>()};
    auto entity = Entity{};
    EXPECT_FALSE(run(io, manager.load(entity)));
    EXPECT_TRUE(manager.loaded_chunks(entity.id()).empty());
    EXPECT_FALSE(manager.loaded_version(entity.id()).has_value());
}

TEST(StorageManager, saved_entity_loads_into_a_fresh_entity) {
    auto io = net::io_context{};
    auto storage = std::make_shared<MemoryStorage>();
    auto writer = StorageManager{storage};

    auto entity = Entity{};
    set_first_name(entity, "John");
    run(io, writer.save(entity));

    ASSERT_EQ(storage->size(), 1u);
    auto chunks = writer.loaded_chunks(entity.id());
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].kind, ChunkKind::snapshot);
    EXPECT_EQ(storage->keys()[0], StorageManager::chunk_key(entity.id(), chunks[0]));

    auto reader = StorageManager{storage};
    auto copy = Entity{entity.id()};
    EXPECT_TRUE(run(io, reader.load(copy)));
    EXPECT_EQ(first_name(copy), "John");
    EXPECT_EQ(reader.loaded_version(copy.id()), entity.doc().version());
    EXPECT_EQ(reader.loaded_chunks(copy.id()), chunks);
}

TEST(StorageManager, chunk_hash_is_the_content_hash) {
    auto io = net::io_context{};
    auto storage = std::make_shared<MemoryStorage>();
    auto manager = StorageManager{storage};
    auto entity = Entity{};
    set_first_name(entity, "John");
    run(io, manager.save(entity));

    auto chunk = manager.loaded_chunks(entity.id()).at(0);
    auto data = run(io, storage->load(StorageManager::chunk_key(entity.id(), chunk)));
    ASSERT_TRUE(data.has_value());
    EXPECT_EQ(chunk.size, data->size());
    EXPECT_EQ(chunk.hash.size(), 52u);
}

TEST(StorageManager, repeated_saves_leave_a_single_chunk) {
    auto io = net::io_context{};
    auto storage = std::make_shared<MemoryStorage>();
    auto manager = StorageManager{storage};
    auto entity = Entity{};

    for (auto first : {"A", "B", "C", "D"}) {
        set_first_name(entity, first);
        run(io, manager.save(entity));
    }
    EXPECT_EQ(storage->size(), 1u);

    auto copy = Entity{entity.id()};
    EXPECT_TRUE(run(io, StorageManager{storage}.load(copy)));
    EXPECT_EQ(first_name(copy), "D");
}

TEST(StorageManager, save_without_new_changes_writes_nothing) {
    auto io = net::io_context{};
    auto storage = std::make_shared<MemoryStorage>();
    auto manager = StorageManager{storage};
    auto entity = Entity{};
    set_first_name(entity, "John");

    run(io, manager.save(entity));
    run(io, manager.save(entity));
    EXPECT_EQ(storage->write_count(), 1u);

    // Nor after a load that saw the same version
    auto other = StorageManager{storage};
    auto copy = Entity{entity.id()};
    run(io, other.load(copy));
    run(io, other.save(copy));
    EXPECT_EQ(storage->write_count(), 1u);
}

TEST(StorageManager, empty_entity_is_not_written) {
    auto io = net::io_context{};
    auto storage = std::make_shared<MemoryStorage>();
    auto manager = StorageManager{storage};
    auto entity = Entity{};
    run(io, manager.save(entity));
    EXPECT_EQ(storage->write_count(), 0u);
}

TEST(StorageManager, chunks_from_other_writers_are_kept_until_loaded) {
    auto io = net::io_context{};
    auto storage = std::make_shared<MemoryStorage>();
    auto id = EntityId::random();

    auto first_manager = StorageManager{storage};
    auto first = Entity{id};
    set_first_name(first, "John");
    run(io, first_manager.save(first));

    auto second_manager = StorageManager{storage};
    auto second = Entity{id};
    second.get_or_init(Name).set("last", std::string{"Smith"});
    second.commit();
    run(io, second_manager.save(second));
    EXPECT_EQ(storage->size(), 2u);

    // The first manager never saw the second chunk, so it must keep it
    set_first_name(first, "Jane");
    run(io, first_manager.save(first));
    EXPECT_EQ(storage->size(), 2u);

    // A manager that loads both compacts them into one
    auto merged_manager = StorageManager{storage};
    auto merged = Entity{id};
    EXPECT_TRUE(run(io, merged_manager.load(merged)));
    EXPECT_EQ(merged_manager.loaded_chunks(id).size(), 2u);
    EXPECT_EQ(first_name(merged), "Jane");
    EXPECT_EQ(merged.get(Name)->get_as<std::string>("last"), "Smith");

    set_first_name(merged, "Jim");
    run(io, merged_manager.save(merged));
    EXPECT_EQ(storage->size(), 1u);
}

TEST(StorageManager, undecodable_chunks_are_skipped) {
    auto io = net::io_context{};
    auto storage = std::make_shared<MemoryStorage>();
    auto manager = StorageManager{storage};
    auto entity = Entity{};
    set_first_name(entity, "John");
    run(io, manager.save(entity));

    auto garbage_key = StorageManager::chunk_key(
        entity.id(), ChunkInfo{.kind = ChunkKind::incremental, .hash = "GARBAGE"});
    run(io, storage->save(garbage_key, to_bytes("not a chunk")));

    auto reader = StorageManager{storage};
    auto copy = Entity{entity.id()};
    EXPECT_TRUE(run(io, reader.load(copy)));
    EXPECT_EQ(first_name(copy), "John");
    EXPECT_EQ(reader.loaded_chunks(copy.id()).size(), 1u);
}

TEST(StorageManager, only_undecodable_chunks_load_as_nothing) {
    auto io = net::io_context{};
    auto storage = std::make_shared<MemoryStorage>();
    auto id = EntityId::random();
    run(io, storage->save(StorageManager::chunk_key(id, ChunkInfo{.hash = "X"}),
                          to_bytes("junk")));

    auto manager = StorageManager{storage};
    auto entity = Entity{id};
    EXPECT_FALSE(run(io, manager.load(entity)));
    EXPECT_TRUE(entity.doc().version().empty());
}

TEST(StorageManager, failed_removal_of_stale_chunks_is_tolerated) {
    auto io = net::io_context{};
    auto storage = std::make_shared<UndeletableStorage>();
    auto manager = StorageManager{storage};
    auto entity = Entity{};

    set_first_name(entity, "John");
    run(io, manager.save(entity));
    set_first_name(entity, "Jane");
    EXPECT_NO_THROW(run(io, manager.save(entity)));

    EXPECT_EQ(storage->size(), 2u);
    EXPECT_EQ(manager.loaded_chunks(entity.id()).size(), 1u);
    EXPECT_EQ(manager.loaded_version(entity.id()), entity.doc().version());
}

TEST(StorageManager, failed_write_propagates_and_keeps_the_index) {
    auto io = net::io_context{};
    auto manager = StorageManager{std::make_shared<ReadOnlyStorage>()};
    auto entity = Entity{};
    set_first_name(entity, "John");

    try {
        run(io, manager.save(entity));
        FAIL() << "expected an exception";
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), ErrorKind::storage_error);
    }
    EXPECT_FALSE(manager.loaded_version(entity.id()).has_value());
}

TEST(StorageManager, remove_deletes_every_chunk) {
    auto io = net::io_context{};
    auto storage = std::make_shared<MemoryStorage>();
    auto manager = StorageManager{storage};
    auto keep = Entity{};
    set_first_name(keep, "Keep");
    run(io, manager.save(keep));

    auto entity = Entity{};
    set_first_name(entity, "John");
    run(io, manager.save(entity));
    run(io, manager.remove(entity.id()));

    EXPECT_EQ(storage->size(), 1u);
    EXPECT_TRUE(manager.loaded_chunks(entity.id()).empty());
    auto copy = Entity{entity.id()};
    EXPECT_FALSE(run(io, StorageManager{storage}.load(copy)));
}

TEST(StorageManager, works_over_a_namespaced_storage) {
    auto io = net::io_context{};
    auto inner = std::make_shared<MemoryStorage>();
    auto manager = StorageManager{std::make_shared<NamespacedStorage>(inner, StorageKey{"tenant"})};
    auto entity = Entity{};
    set_first_name(entity, "John");
    run(io, manager.save(entity));

    ASSERT_EQ(inner->size(), 1u);
    EXPECT_EQ(inner->keys()[0][0], "tenant");
    EXPECT_EQ(inner->keys()[0][1], "data");
}
