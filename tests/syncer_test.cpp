#include <leaf-cpp/hub_peer.hpp>
#include <leaf-cpp/sync.hpp>

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

using namespace leaf_cpp;
using leaf_cpp::testing::drain;

namespace {

// Records everything a Syncer asks of its remote.
class FakeRemote : public SyncInterface {
public:
    auto subscribe(const EntityId& id, std::optional<VersionVector> version,
                   UpdateHandler handler) -> Unsubscribe override {
        subscriptions.emplace_back(id, std::move(version));
        handlers[id] = std::move(handler);
        return [this, id]() {
            handlers.erase(id);
            ++unsubscribes;
        };
    }

    void send_update(const EntityId& id, Bytes update) override {
        sent.emplace_back(id, std::move(update));
    }

    void deliver(const EntityId& id, const Bytes& update) {
        handlers.at(id)(id, update);
    }

    std::vector<std::pair<EntityId, std::optional<VersionVector>>> subscriptions;
    std::map<EntityId, UpdateHandler> handlers;
    std::vector<std::pair<EntityId, Bytes>> sent;
    int unsubscribes{0};
};

struct SyncerFixture {
    net::io_context io;
    std::shared_ptr<FakeRemote> remote = std::make_shared<FakeRemote>();
    std::shared_ptr<Syncer> syncer = std::make_shared<Syncer>(io.get_executor(), remote);
};

auto remote_snapshot(const std::string& first) -> Bytes {
    auto doc = Document{};
    doc.put("name", "first", first);
    doc.commit();
    return doc.export_snapshot();
}

}  // namespace

// -- Against a recording remote -----------------------------------------------

TEST(Syncer, new_entity_subscribes_without_a_version) {
    SyncerFixture f;
    auto entity = std::make_shared<Entity>();
    f.syncer->sync(entity);

    ASSERT_EQ(f.remote->subscriptions.size(), 1u);
    EXPECT_EQ(f.remote->subscriptions[0].first, entity->id());
    EXPECT_FALSE(f.remote->subscriptions[0].second.has_value());
    EXPECT_EQ(f.syncer->status(entity->id()), SyncStatus::subscribing);
    EXPECT_TRUE(f.syncer->is_syncing(entity->id()));
    EXPECT_EQ(f.syncer->session_count(), 1u);
    ASSERT_NE(f.syncer->initial_load(entity->id()), nullptr);
    EXPECT_FALSE(f.syncer->initial_load(entity->id())->notified());
}

TEST(Syncer, entity_with_history_subscribes_with_its_version) {
    SyncerFixture f;
    auto entity = std::make_shared<Entity>();
    entity->doc().increment("n", 1);
    entity->commit();
    f.syncer->sync(entity);

    ASSERT_EQ(f.remote->subscriptions.size(), 1u);
    EXPECT_EQ(f.remote->subscriptions[0].second, entity->doc().version());
}

TEST(Syncer, syncing_twice_is_a_no_op) {
    SyncerFixture f;
    auto entity = std::make_shared<Entity>();
    f.syncer->sync(entity);
    f.syncer->sync(entity);
    EXPECT_EQ(f.remote->subscriptions.size(), 1u);
    EXPECT_EQ(f.syncer->session_count(), 1u);
}

TEST(Syncer, unknown_entity_reports_idle) {
    SyncerFixture f;
    auto id = EntityId::random();
    EXPECT_EQ(f.syncer->status(id), SyncStatus::idle);
    EXPECT_FALSE(f.syncer->is_syncing(id));
    EXPECT_EQ(f.syncer->initial_load(id), nullptr);
    f.syncer->unsync(id);
}

TEST(Syncer, local_commits_are_forwarded_on_the_next_turn) {
    SyncerFixture f;
    auto entity = std::make_shared<Entity>();
    f.syncer->sync(entity);

    entity->doc().increment("n", 1);
    entity->commit();
    EXPECT_TRUE(f.remote->sent.empty());

    drain(f.io);
    ASSERT_EQ(f.remote->sent.size(), 1u);
    EXPECT_EQ(f.remote->sent[0].first, entity->id());
    auto meta = Document::inspect_update(f.remote->sent[0].second);
    ASSERT_TRUE(meta.has_value());
    EXPECT_EQ(meta->change_count, 1u);
}

TEST(Syncer, remote_update_is_merged_and_activates_the_session) {
    SyncerFixture f;
    auto entity = std::make_shared<Entity>();
    f.syncer->sync(entity);

    f.remote->deliver(entity->id(), remote_snapshot("John"));
    EXPECT_EQ(get_scalar<std::string>(entity->doc().get("name", "first")), "John");
    EXPECT_EQ(f.syncer->status(entity->id()), SyncStatus::active);
    EXPECT_TRUE(f.syncer->initial_load(entity->id())->notified());

    // Merged remote changes are not sent back
    drain(f.io);
    EXPECT_TRUE(f.remote->sent.empty());
}

TEST(Syncer, remote_missing_local_changes_receives_them) {
    SyncerFixture f;
    auto entity = std::make_shared<Entity>();
    entity->doc().put("name", "last", std::string{"Smith"});
    entity->commit();
    f.syncer->sync(entity);

    auto remote_doc = Document{};
    remote_doc.put("name", "first", std::string{"John"});
    remote_doc.commit();
    f.remote->deliver(entity->id(), remote_doc.export_snapshot());

    ASSERT_EQ(f.remote->sent.size(), 1u);
    ASSERT_TRUE(remote_doc.merge(f.remote->sent[0].second));
    EXPECT_EQ(remote_doc.version(), entity->doc().version());
    EXPECT_EQ(get_scalar<std::string>(remote_doc.get("name", "last")), "Smith");
}

TEST(Syncer, remote_that_has_everything_gets_nothing_back) {
    SyncerFixture f;
    auto entity = std::make_shared<Entity>();
    entity->doc().increment("n", 1);
    entity->commit();
    f.syncer->sync(entity);

    auto remote_doc = Document{};
    remote_doc.merge(entity->doc().export_snapshot());
    remote_doc.increment("n", 1);
    remote_doc.commit();
    f.remote->deliver(entity->id(), remote_doc.export_snapshot());
    drain(f.io);

    EXPECT_EQ(entity->doc().counter("n"), 2);
    EXPECT_TRUE(f.remote->sent.empty());
}

TEST(Syncer, malformed_remote_update_is_ignored) {
    SyncerFixture f;
    auto entity = std::make_shared<Entity>();
    f.syncer->sync(entity);

    f.remote->deliver(entity->id(), Bytes{std::byte{0xFF}});
    EXPECT_EQ(f.syncer->status(entity->id()), SyncStatus::subscribing);
    EXPECT_FALSE(f.syncer->initial_load(entity->id())->notified());
}

TEST(Syncer, unsync_stops_both_directions) {
    SyncerFixture f;
    auto entity = std::make_shared<Entity>();
    f.syncer->sync(entity);

    // A commit made before unsync is still sent
    entity->doc().increment("n", 1);
    entity->commit();
    f.syncer->unsync(entity->id());
    drain(f.io);

    EXPECT_EQ(f.remote->sent.size(), 1u);
    EXPECT_EQ(f.remote->unsubscribes, 1);
    EXPECT_TRUE(f.remote->handlers.empty());
    EXPECT_EQ(f.syncer->status(entity->id()), SyncStatus::idle);
    EXPECT_EQ(f.syncer->session_count(), 0u);

    entity->doc().increment("n", 1);
    entity->commit();
    drain(f.io);
    EXPECT_EQ(f.remote->sent.size(), 1u);
}

TEST(Syncer, destroyed_entity_ends_its_session) {
    SyncerFixture f;
    auto entity = std::make_shared<Entity>();
    auto id = entity->id();
    f.syncer->sync(entity);
    entity.reset();

    f.remote->deliver(id, remote_snapshot("John"));
    drain(f.io);
    EXPECT_EQ(f.syncer->session_count(), 0u);
    EXPECT_EQ(f.remote->unsubscribes, 1);
}

TEST(Syncer, released_entity_ends_its_session) {
    SyncerFixture f;
    auto entity = std::make_shared<Entity>();
    f.syncer->sync(entity);
    entity->release();

    f.remote->deliver(entity->id(), remote_snapshot("John"));
    drain(f.io);
    EXPECT_FALSE(f.syncer->is_syncing(entity->id()));
}

TEST(Syncer, destruction_unsubscribes_every_session) {
    SyncerFixture f;
    auto a = std::make_shared<Entity>();
    auto b = std::make_shared<Entity>();
    f.syncer->sync(a);
    f.syncer->sync(b);
    f.syncer.reset();

    EXPECT_EQ(f.remote->unsubscribes, 2);
    EXPECT_TRUE(f.remote->handlers.empty());
}

TEST(SyncStatus, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(SyncStatus::idle), "idle");
    EXPECT_EQ(to_string_view(SyncStatus::subscribing), "subscribing");
    EXPECT_EQ(to_string_view(SyncStatus::active), "active");
    EXPECT_EQ(to_string_view(SyncStatus::stopped), "stopped");
}

// -- Through a HubPeer --------------------------------------------------------

TEST(Syncer, two_replicas_converge_through_a_hub) {
    auto io = net::io_context{};
    auto storage = std::make_shared<MemoryStorage>();
    auto hub = std::make_shared<HubPeer>(io.get_executor(), std::vector<StorageConfig>{
        StorageConfig{.manager = std::make_shared<StorageManager>(storage)}});
    auto left_syncer = std::make_shared<Syncer>(io.get_executor(), hub);
    auto right_syncer = std::make_shared<Syncer>(io.get_executor(), hub);

    auto id = EntityId::random();
    auto left = std::make_shared<Entity>(id);
    auto right = std::make_shared<Entity>(id);

    // The right replica has an offline edit before it ever syncs
    right->doc().put("name", "last", std::string{"Smith"});
    right->commit();

    left_syncer->sync(left);
    drain(io);
    left->doc().put("name", "first", std::string{"John"});
    left->commit();
    drain(io);

    right_syncer->sync(right);
    drain(io);
    EXPECT_TRUE(right_syncer->initial_load(id)->notified());

    right->doc().increment("visits", 1);
    right->commit();
    drain(io);

    for (const auto& entity : {left, right}) {
        EXPECT_EQ(get_scalar<std::string>(entity->doc().get("name", "first")), "John");
        EXPECT_EQ(get_scalar<std::string>(entity->doc().get("name", "last")), "Smith");
        EXPECT_EQ(entity->doc().counter("visits"), 1);
    }
    EXPECT_EQ(left->doc().version(), right->doc().version());
    EXPECT_EQ(left->doc().export_snapshot(), right->doc().export_snapshot());
}

namespace {

// Passes through to a hub, counting the updates it hands back.
class CountingRemote : public SyncInterface {
public:
    explicit CountingRemote(std::shared_ptr<HubPeer> hub) : hub_{std::move(hub)} {}

    auto subscribe(const EntityId& id, std::optional<VersionVector> version,
                   UpdateHandler handler) -> Unsubscribe override {
        return open_subscription(id, std::move(version), std::move(handler)).unsubscribe;
    }

    void send_update(const EntityId& id, Bytes update) override {
        hub_->send_update(id, std::move(update));
    }

    auto open_subscription(const EntityId& id, std::optional<VersionVector> version,
                           UpdateHandler handler) -> Subscription override {
        return hub_->open_subscription(
            id, std::move(version),
            [this, handler = std::move(handler)](const EntityId& id,
                                                 std::span<const std::byte> update) {
                ++received;
                handler(id, update);
            });
    }

    void send_update_from(const EntityId& id, Bytes update,
                          std::optional<SubscriptionId> origin) override {
        hub_->send_update_from(id, std::move(update), origin);
    }

    int received{0};

private:
    std::shared_ptr<HubPeer> hub_;
};

}  // namespace

TEST(Syncer, own_updates_are_not_echoed_back) {
    auto io = net::io_context{};
    auto hub = std::make_shared<HubPeer>(io.get_executor(), std::vector<StorageConfig>{
        StorageConfig{.manager = std::make_shared<StorageManager>(std::make_shared<MemoryStorage>())}});
    auto writer_remote = std::make_shared<CountingRemote>(hub);
    auto reader_remote = std::make_shared<CountingRemote>(hub);
    auto writer = std::make_shared<Syncer>(io.get_executor(), writer_remote);
    auto reader = std::make_shared<Syncer>(io.get_executor(), reader_remote);

    auto id = EntityId::random();
    auto written = std::make_shared<Entity>(id);
    auto read = std::make_shared<Entity>(id);
    writer->sync(written);
    reader->sync(read);
    drain(io);
    const auto writer_before = writer_remote->received;
    const auto reader_before = reader_remote->received;

    written->doc().put("name", "first", std::string{"John"});
    written->commit();
    drain(io);

    EXPECT_EQ(writer_remote->received, writer_before);
    EXPECT_EQ(reader_remote->received, reader_before + 1);
    EXPECT_EQ(get_scalar<std::string>(read->doc().get("name", "first")), "John");
}
