#include <leaf-cpp/protocol.hpp>

#include "test_support.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cstring>
#include <memory>
#include <string>
#include <vector>

using namespace leaf_cpp;
using leaf_cpp::testing::drain;
using leaf_cpp::testing::to_bytes;

namespace {

using json = nlohmann::json;

auto pack(const json& message) -> Bytes {
    auto packed = json::to_msgpack(message);
    auto result = Bytes(packed.size());
    std::memcpy(result.data(), packed.data(), packed.size());
    return result;
}

auto sample_version() -> VersionVector {
    auto v = VersionVector{};
    v.set(ActorId::random(), 3);
    v.set(ActorId::random(), 1);
    return v;
}

// A channel that records what is sent and lets the test inject messages.
class RecordingChannel : public BinaryChannel {
public:
    void send(Bytes message) override { sent.push_back(std::move(message)); }
    void on_receive(Receiver receiver) override { receiver_ = std::move(receiver); }

    void inject(const Bytes& message) { receiver_(message); }

    std::vector<Bytes> sent;

private:
    Receiver receiver_;
};

}  // namespace

// -- Codec --------------------------------------------------------------------

TEST(Protocol, subscribe_without_version_survives_encoding) {
    auto message = ClientMessage{SubscribeMessage{.entity_id = EntityId::random(), .version = std::nullopt}};
    EXPECT_EQ(decode_client_message(encode_message(message)), message);
}

TEST(Protocol, subscribe_with_version_survives_encoding) {
    auto message = ClientMessage{SubscribeMessage{.entity_id = EntityId::random(), .version = sample_version()}};
    EXPECT_EQ(decode_client_message(encode_message(message)), message);
}

TEST(Protocol, unsubscribe_and_send_update_survive_encoding) {
    auto unsubscribe = ClientMessage{UnsubscribeMessage{.entity_id = EntityId::random()}};
    EXPECT_EQ(decode_client_message(encode_message(unsubscribe)), unsubscribe);

    auto send = ClientMessage{SendUpdateMessage{.entity_id = EntityId::random(), .update = to_bytes("payload")}};
    EXPECT_EQ(decode_client_message(encode_message(send)), send);
}

TEST(Protocol, handle_update_survives_encoding) {
    auto message = HandleUpdateMessage{.entity_id = EntityId::random(), .update = to_bytes("payload")};
    EXPECT_EQ(decode_hub_message(encode_message(message)), message);
}

TEST(Protocol, wire_format_is_a_msgpack_map) {
    auto id = EntityId::random();
    auto bytes = encode_message(ClientMessage{SendUpdateMessage{.entity_id = id, .update = to_bytes("u")}});
    const auto* first = reinterpret_cast<const std::uint8_t*>(bytes.data());
    auto decoded = json::from_msgpack(first, first + bytes.size());

    EXPECT_EQ(decoded["type"], "sendUpdate");
    EXPECT_EQ(decoded["entityId"], id.to_string());
    ASSERT_TRUE(decoded["update"].is_binary());
    EXPECT_EQ(decoded["update"].get_binary().size(), 1u);
}

TEST(Protocol, malformed_input_decodes_to_nothing) {
    EXPECT_FALSE(decode_client_message(Bytes{}).has_value());
    EXPECT_FALSE(decode_client_message(to_bytes("\xc1garbage")).has_value());
    EXPECT_FALSE(decode_client_message(pack(json::array({1, 2}))).has_value());
    EXPECT_FALSE(decode_hub_message(Bytes{}).has_value());
}

TEST(Protocol, messages_with_bad_fields_are_rejected) {
    auto id = EntityId::random().to_string();
    EXPECT_FALSE(decode_client_message(pack({{"type", "subscribe"}})).has_value());
    EXPECT_FALSE(decode_client_message(pack({{"type", "subscribe"}, {"entityId", "leaf:nope"}})).has_value());
    EXPECT_FALSE(decode_client_message(pack({{"type", "subscribe"}, {"entityId", 7}})).has_value());
    EXPECT_FALSE(decode_client_message(pack({{"type", "explode"}, {"entityId", id}})).has_value());
    EXPECT_FALSE(decode_client_message(pack({{"entityId", id}})).has_value());
    // Update must be a binary
    EXPECT_FALSE(decode_client_message(
        pack({{"type", "sendUpdate"}, {"entityId", id}, {"update", "text"}})).has_value());
    EXPECT_FALSE(decode_client_message(pack({{"type", "sendUpdate"}, {"entityId", id}})).has_value());
}

TEST(Protocol, hub_decoder_rejects_client_messages) {
    auto bytes = encode_message(ClientMessage{
        SendUpdateMessage{.entity_id = EntityId::random(), .update = to_bytes("u")}});
    EXPECT_FALSE(decode_hub_message(bytes).has_value());
}

TEST(Protocol, undecodable_version_reads_as_no_version) {
    auto id = EntityId::random();
    auto bytes = pack({{"type", "subscribe"},
                       {"entityId", id.to_string()},
                       {"version", json::binary({0x05, 0x01})}});
    auto decoded = decode_client_message(bytes);
    ASSERT_TRUE(decoded.has_value());
    auto* subscribe = std::get_if<SubscribeMessage>(&*decoded);
    ASSERT_NE(subscribe, nullptr);
    EXPECT_EQ(subscribe->entity_id, id);
    EXPECT_FALSE(subscribe->version.has_value());
}

// -- LoopbackChannel ----------------------------------------------------------

TEST(LoopbackChannel, delivers_later_and_in_order) {
    auto io = net::io_context{};
    auto [a, b] = LoopbackChannel::create_pair(io.get_executor());
    auto received = std::vector<Bytes>{};
    b->on_receive([&](std::span<const std::byte> m) { received.emplace_back(m.begin(), m.end()); });

    a->send(to_bytes("one"));
    a->send(to_bytes("two"));
    EXPECT_TRUE(received.empty());
    EXPECT_EQ(a->sent_count(), 2u);

    drain(io);
    EXPECT_EQ(received, (std::vector<Bytes>{to_bytes("one"), to_bytes("two")}));
}

TEST(LoopbackChannel, close_stops_both_directions) {
    auto io = net::io_context{};
    auto [a, b] = LoopbackChannel::create_pair(io.get_executor());
    auto count = 0;
    a->on_receive([&](std::span<const std::byte>) { ++count; });
    b->on_receive([&](std::span<const std::byte>) { ++count; });

    a->send(to_bytes("in flight"));
    b->close();
    a->send(to_bytes("after"));
    b->send(to_bytes("after"));
    drain(io);

    EXPECT_EQ(count, 0);
    EXPECT_FALSE(a->is_open());
    EXPECT_FALSE(b->is_open());
}

// -- RemoteHub ----------------------------------------------------------------

TEST(RemoteHub, subscribe_and_last_unsubscribe_send_messages) {
    auto channel = std::make_shared<RecordingChannel>();
    auto remote = RemoteHub::create(channel);
    auto id = EntityId::random();
    auto version = sample_version();

    auto first = remote->subscribe(id, version, [](const EntityId&, std::span<const std::byte>) {});
    auto second = remote->subscribe(id, std::nullopt, [](const EntityId&, std::span<const std::byte>) {});
    ASSERT_EQ(channel->sent.size(), 2u);
    EXPECT_EQ(decode_client_message(channel->sent[0]),
              (ClientMessage{SubscribeMessage{.entity_id = id, .version = version}}));
    EXPECT_EQ(remote->subscriber_count(id), 2u);

    first();
    first();
    EXPECT_EQ(channel->sent.size(), 2u);
    second();
    ASSERT_EQ(channel->sent.size(), 3u);
    EXPECT_EQ(decode_client_message(channel->sent[2]),
              ClientMessage{UnsubscribeMessage{.entity_id = id}});
    EXPECT_EQ(remote->subscriber_count(id), 0u);
}

TEST(RemoteHub, send_update_sends_a_message) {
    auto channel = std::make_shared<RecordingChannel>();
    auto remote = RemoteHub::create(channel);
    auto id = EntityId::random();
    remote->send_update(id, to_bytes("u"));
    ASSERT_EQ(channel->sent.size(), 1u);
    EXPECT_EQ(decode_client_message(channel->sent[0]),
              (ClientMessage{SendUpdateMessage{.entity_id = id, .update = to_bytes("u")}}));
}

TEST(RemoteHub, incoming_updates_reach_the_entity_handlers) {
    auto channel = std::make_shared<RecordingChannel>();
    auto remote = RemoteHub::create(channel);
    auto id = EntityId::random();
    auto other = EntityId::random();
    auto received = std::vector<Bytes>{};
    auto unsub = remote->subscribe(id, std::nullopt,
        [&](const EntityId& from, std::span<const std::byte> update) {
            EXPECT_EQ(from, id);
            received.emplace_back(update.begin(), update.end());
        });

    channel->inject(encode_message(HandleUpdateMessage{.entity_id = id, .update = to_bytes("a")}));
    channel->inject(encode_message(HandleUpdateMessage{.entity_id = other, .update = to_bytes("b")}));
    channel->inject(to_bytes("garbage"));

    EXPECT_EQ(received, (std::vector<Bytes>{to_bytes("a")}));
}

// -- End to end ---------------------------------------------------------------

TEST(Protocol, clients_converge_through_a_hub_over_loopback_channels) {
    auto io = net::io_context{};
    auto hub = std::make_shared<HubPeer>(io.get_executor(), std::vector<StorageConfig>{
        StorageConfig{.manager = std::make_shared<StorageManager>(std::make_shared<MemoryStorage>())}});

    auto [client_a, server_a] = LoopbackChannel::create_pair(io.get_executor());
    auto [client_b, server_b] = LoopbackChannel::create_pair(io.get_executor());
    auto connection_a = HubConnection::create(hub, server_a);
    auto connection_b = HubConnection::create(hub, server_b);
    auto syncer_a = std::make_shared<Syncer>(io.get_executor(), RemoteHub::create(client_a));
    auto syncer_b = std::make_shared<Syncer>(io.get_executor(), RemoteHub::create(client_b));

    auto id = EntityId::random();
    auto a = std::make_shared<Entity>(id);
    auto b = std::make_shared<Entity>(id);
    syncer_a->sync(a);
    syncer_b->sync(b);
    drain(io);
    EXPECT_EQ(connection_a->subscription_count(), 1u);
    EXPECT_EQ(hub->subscriber_count(id), 2u);

    a->doc().put("name", "first", std::string{"John"});
    a->commit();
    drain(io);
    b->doc().increment("visits", 1);
    b->commit();
    drain(io);

    EXPECT_EQ(get_scalar<std::string>(b->doc().get("name", "first")), "John");
    EXPECT_EQ(a->doc().counter("visits"), 1);
    EXPECT_EQ(a->doc().export_snapshot(), b->doc().export_snapshot());

    // The sender's own update is not echoed back over its channel
    auto sent_to_a = server_a->sent_count();
    a->doc().increment("visits", 1);
    a->commit();
    drain(io);
    EXPECT_EQ(server_a->sent_count(), sent_to_a);
    EXPECT_EQ(b->doc().counter("visits"), 2);

    syncer_a->unsync(id);
    drain(io);
    EXPECT_EQ(connection_a->subscription_count(), 0u);
    EXPECT_EQ(hub->subscriber_count(id), 1u);
}

TEST(HubConnection, close_drops_its_subscriptions) {
    auto io = net::io_context{};
    auto hub = std::make_shared<HubPeer>(io.get_executor(), std::vector<StorageConfig>{});
    auto [client, server] = LoopbackChannel::create_pair(io.get_executor());
    auto connection = HubConnection::create(hub, server);
    auto id = EntityId::random();

    client->send(encode_message(ClientMessage{SubscribeMessage{.entity_id = id, .version = std::nullopt}}));
    client->send(encode_message(ClientMessage{SubscribeMessage{.entity_id = id, .version = std::nullopt}}));
    drain(io);
    EXPECT_EQ(connection->subscription_count(), 1u);
    EXPECT_EQ(hub->subscriber_count(id), 1u);

    connection->close();
    EXPECT_EQ(hub->subscriber_count(id), 0u);
}

TEST(HubConnection, malformed_client_messages_are_ignored) {
    auto io = net::io_context{};
    auto hub = std::make_shared<HubPeer>(io.get_executor(), std::vector<StorageConfig>{});
    auto [client, server] = LoopbackChannel::create_pair(io.get_executor());
    auto connection = HubConnection::create(hub, server);

    client->send(to_bytes("not msgpack at all"));
    drain(io);
    EXPECT_EQ(connection->subscription_count(), 0u);
    EXPECT_EQ(server->sent_count(), 0u);
}
