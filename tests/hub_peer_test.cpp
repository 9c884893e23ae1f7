#include <leaf-cpp/hub_peer.hpp>

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace leaf_cpp;
using leaf_cpp::testing::drain;
using leaf_cpp::testing::run;

namespace {

struct HubFixture {
    net::io_context io;
    std::shared_ptr<MemoryStorage> storage = std::make_shared<MemoryStorage>();
    std::shared_ptr<StorageManager> manager = std::make_shared<StorageManager>(storage);
    std::shared_ptr<HubPeer> hub = std::make_shared<HubPeer>(
        io.get_executor(), std::vector<StorageConfig>{StorageConfig{.manager = manager}});
};

// Collects every update a subscription receives.
struct Inbox {
    std::vector<Bytes> updates;

    auto handler() -> UpdateHandler {
        return [this](const EntityId&, std::span<const std::byte> update) {
            updates.emplace_back(update.begin(), update.end());
        };
    }
};

auto snapshot_with_name(const std::string& first) -> Bytes {
    auto doc = Document{};
    doc.put("name", "first", first);
    doc.commit();
    return doc.export_snapshot();
}

// Merge every update into a fresh document.
auto replay(const std::vector<Bytes>& updates) -> Document {
    auto doc = Document{};
    for (const auto& u : updates) EXPECT_TRUE(doc.merge(u));
    return doc;
}

}  // namespace

TEST(HubPeer, subscription_to_unknown_entity_gets_no_initial_response) {
    HubFixture f;
    auto id = EntityId::random();
    auto inbox = Inbox{};
    auto unsub = f.hub->subscribe(id, std::nullopt, inbox.handler());
    drain(f.io);

    EXPECT_TRUE(inbox.updates.empty());
    EXPECT_EQ(f.hub->subscriber_count(id), 1u);
}

TEST(HubPeer, accepted_update_is_saved_and_forwarded) {
    HubFixture f;
    auto id = EntityId::random();
    auto a = Inbox{};
    auto b = Inbox{};
    auto unsub_a = f.hub->subscribe(id, std::nullopt, a.handler());
    auto unsub_b = f.hub->subscribe(id, std::nullopt, b.handler());
    drain(f.io);

    f.hub->send_update(id, snapshot_with_name("John"));
    drain(f.io);

    ASSERT_EQ(a.updates.size(), 1u);
    ASSERT_EQ(b.updates.size(), 1u);
    EXPECT_EQ(f.storage->size(), 1u);

    auto stored = Entity{id};
    EXPECT_TRUE(run(f.io, StorageManager{f.storage}.load(stored)));
    EXPECT_EQ(get_scalar<std::string>(stored.doc().get("name", "first")), "John");
}

TEST(HubPeer, late_subscriber_receives_a_snapshot) {
    HubFixture f;
    auto id = EntityId::random();
    f.hub->send_update(id, snapshot_with_name("John"));
    drain(f.io);

    auto inbox = Inbox{};
    auto unsub = f.hub->subscribe(id, std::nullopt, inbox.handler());
    drain(f.io);

    ASSERT_EQ(inbox.updates.size(), 1u);
    auto meta = Document::inspect_update(inbox.updates[0]);
    ASSERT_TRUE(meta.has_value());
    EXPECT_EQ(meta->kind, UpdateKind::snapshot);
    EXPECT_EQ(get_scalar<std::string>(replay(inbox.updates).get("name", "first")), "John");
}

TEST(HubPeer, subscriber_with_a_version_receives_only_the_missing_changes) {
    HubFixture f;
    auto id = EntityId::random();
    auto doc = Document{};
    doc.increment("n", 1);
    doc.commit();
    auto known = doc.version();
    f.hub->send_update(id, doc.export_snapshot());
    doc.increment("n", 1);
    doc.commit();
    f.hub->send_update(id, doc.export_delta(known));
    drain(f.io);

    auto inbox = Inbox{};
    auto unsub = f.hub->subscribe(id, known, inbox.handler());
    drain(f.io);

    ASSERT_EQ(inbox.updates.size(), 1u);
    auto meta = Document::inspect_update(inbox.updates[0]);
    ASSERT_TRUE(meta.has_value());
    EXPECT_EQ(meta->change_count, 1u);
    EXPECT_EQ(meta->to, doc.version());
}

TEST(HubPeer, update_is_not_echoed_to_its_origin) {
    HubFixture f;
    auto id = EntityId::random();
    auto sender = Inbox{};
    auto other = Inbox{};
    auto subscription = f.hub->open_subscription(id, std::nullopt, sender.handler());
    auto unsub = f.hub->subscribe(id, std::nullopt, other.handler());
    drain(f.io);

    f.hub->send_update_from(id, snapshot_with_name("John"), subscription.id);
    drain(f.io);

    EXPECT_TRUE(sender.updates.empty());
    EXPECT_EQ(other.updates.size(), 1u);
}

TEST(HubPeer, redundant_update_is_neither_saved_nor_forwarded) {
    HubFixture f;
    auto id = EntityId::random();
    auto inbox = Inbox{};
    auto unsub = f.hub->subscribe(id, std::nullopt, inbox.handler());
    auto update = snapshot_with_name("John");

    f.hub->send_update(id, update);
    drain(f.io);
    f.hub->send_update(id, update);
    drain(f.io);

    EXPECT_EQ(f.storage->write_count(), 1u);
    EXPECT_EQ(inbox.updates.size(), 1u);
}

TEST(HubPeer, malformed_update_is_dropped) {
    HubFixture f;
    auto id = EntityId::random();
    auto inbox = Inbox{};
    auto unsub = f.hub->subscribe(id, std::nullopt, inbox.handler());

    f.hub->send_update(id, Bytes{std::byte{1}, std::byte{2}});
    drain(f.io);

    EXPECT_EQ(f.storage->size(), 0u);
    EXPECT_TRUE(inbox.updates.empty());
}

TEST(HubPeer, throwing_subscriber_does_not_stop_the_others) {
    HubFixture f;
    auto id = EntityId::random();
    auto inbox = Inbox{};
    auto unsub_bad = f.hub->subscribe(id, std::nullopt,
        [](const EntityId&, std::span<const std::byte>) { throw std::runtime_error{"boom"}; });
    auto unsub_good = f.hub->subscribe(id, std::nullopt, inbox.handler());

    f.hub->send_update(id, snapshot_with_name("John"));
    drain(f.io);
    EXPECT_EQ(inbox.updates.size(), 1u);
    EXPECT_EQ(f.storage->size(), 1u);
}

TEST(HubPeer, unsubscribe_stops_delivery_and_cleans_up) {
    HubFixture f;
    auto id = EntityId::random();
    auto inbox = Inbox{};
    auto unsub = f.hub->subscribe(id, std::nullopt, inbox.handler());
    EXPECT_EQ(f.hub->subscriber_count(id), 1u);

    unsub();
    unsub();
    EXPECT_EQ(f.hub->subscriber_count(id), 0u);

    f.hub->send_update(id, snapshot_with_name("John"));
    drain(f.io);
    EXPECT_TRUE(inbox.updates.empty());
}

TEST(HubPeer, unsubscribe_before_initial_response_suppresses_it) {
    HubFixture f;
    auto id = EntityId::random();
    f.hub->send_update(id, snapshot_with_name("John"));
    drain(f.io);

    auto inbox = Inbox{};
    auto unsub = f.hub->subscribe(id, std::nullopt, inbox.handler());
    unsub();
    drain(f.io);
    EXPECT_TRUE(inbox.updates.empty());
}

TEST(HubPeer, sequential_updates_are_applied_in_order) {
    HubFixture f;
    auto id = EntityId::random();
    auto doc = Document{};
    auto unsub_local = doc.subscribe_local_updates([&](std::span<const std::byte> u) {
        f.hub->send_update(id, Bytes(u.begin(), u.end()));
    });
    for (int i = 0; i < 5; ++i) {
        doc.increment("n", 1);
        doc.commit();
    }
    drain(f.io);

    auto stored = Entity{id};
    run(f.io, StorageManager{f.storage}.load(stored));
    EXPECT_EQ(stored.doc().counter("n"), 5);
    EXPECT_EQ(stored.doc().queued_change_count(), 0u);
    EXPECT_EQ(f.storage->size(), 1u);
}

TEST(HubPeer, honours_storage_read_and_write_flags) {
    auto io = net::io_context{};
    auto readable = std::make_shared<MemoryStorage>();
    auto writable = std::make_shared<MemoryStorage>();
    auto hub = std::make_shared<HubPeer>(io.get_executor(), std::vector<StorageConfig>{
        StorageConfig{.manager = std::make_shared<StorageManager>(readable), .write = false},
        StorageConfig{.manager = std::make_shared<StorageManager>(writable), .read = false},
    });
    auto id = EntityId::random();

    // Seed the read-only storage directly
    auto seed = Entity{id};
    seed.doc().put("name", "first", std::string{"Seed"});
    seed.commit();
    run(io, StorageManager{readable}.save(seed));

    auto inbox = Inbox{};
    auto unsub = hub->subscribe(id, std::nullopt, inbox.handler());
    drain(io);
    ASSERT_EQ(inbox.updates.size(), 1u);

    hub->send_update(id, snapshot_with_name("John"));
    drain(io);
    EXPECT_EQ(readable->size(), 1u);
    EXPECT_EQ(readable->write_count(), 1u);
    EXPECT_EQ(writable->size(), 1u);

    // The written snapshot includes what was read
    auto stored = Entity{id};
    run(io, StorageManager{writable}.load(stored));
    EXPECT_EQ(stored.doc().length("name"), 1u);
    EXPECT_EQ(stored.doc().get_changes().size(), 2u);
}
