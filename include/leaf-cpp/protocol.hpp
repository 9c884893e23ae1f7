/// @file protocol.hpp
/// @brief The binary sync protocol and its client and hub endpoints.
///
/// Messages are MessagePack maps with a `type` field. Clients send
/// `subscribe`, `unsubscribe` and `sendUpdate`; the hub answers with
/// `handleUpdate`. Entity ids travel in their text form, versions and
/// updates as MessagePack binaries.

#pragma once

#include <leaf-cpp/entity_id.hpp>
#include <leaf-cpp/hub_peer.hpp>
#include <leaf-cpp/scheduler.hpp>
#include <leaf-cpp/sync.hpp>
#include <leaf-cpp/types.hpp>
#include <leaf-cpp/version.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <unordered_map>
#include <utility>
#include <variant>

namespace leaf_cpp {

// -- Messages -----------------------------------------------------------------

struct SubscribeMessage {
    EntityId entity_id;
    std::optional<VersionVector> version;

    auto operator==(const SubscribeMessage&) const -> bool = default;
};

struct UnsubscribeMessage {
    EntityId entity_id;

    auto operator==(const UnsubscribeMessage&) const -> bool = default;
};

struct SendUpdateMessage {
    EntityId entity_id;
    Bytes update;

    auto operator==(const SendUpdateMessage&) const -> bool = default;
};

/// The only message the hub sends.
struct HandleUpdateMessage {
    EntityId entity_id;
    Bytes update;

    auto operator==(const HandleUpdateMessage&) const -> bool = default;
};

using ClientMessage = std::variant<SubscribeMessage, UnsubscribeMessage, SendUpdateMessage>;

auto encode_message(const ClientMessage& message) -> Bytes;
auto encode_message(const HandleUpdateMessage& message) -> Bytes;

/// Decode a client message. Never throws; nullopt if malformed.
///
/// A subscribe whose version does not decode is read as a subscribe
/// without a version.
auto decode_client_message(std::span<const std::byte> data) -> std::optional<ClientMessage>;

/// Decode a hub message. Never throws; nullopt if malformed.
auto decode_hub_message(std::span<const std::byte> data) -> std::optional<HandleUpdateMessage>;

// -- Channels -----------------------------------------------------------------

/// One end of a bidirectional, message-oriented byte channel.
class BinaryChannel {
public:
    using Receiver = std::function<void(std::span<const std::byte>)>;

    virtual ~BinaryChannel() = default;

    /// Send one message to the other end.
    virtual void send(Bytes message) = 0;

    /// Set the callback for incoming messages, replacing any previous one.
    virtual void on_receive(Receiver receiver) = 0;
};

/// An in-process channel. Messages are delivered on a later turn of the
/// executor, in the order they were sent.
class LoopbackChannel : public BinaryChannel {
public:
    /// Create two connected ends.
    static auto create_pair(Executor executor)
        -> std::pair<std::shared_ptr<LoopbackChannel>, std::shared_ptr<LoopbackChannel>>;

    explicit LoopbackChannel(Executor executor);

    void send(Bytes message) override;
    void on_receive(Receiver receiver) override;

    /// Stop delivering messages in both directions.
    void close();

    auto is_open() const -> bool;

    auto sent_count() const -> std::size_t { return sent_count_; }

private:
    void deliver(Bytes message);

    Executor executor_;
    std::weak_ptr<LoopbackChannel> peer_;
    Receiver receiver_;
    bool open_{true};
    std::size_t sent_count_{0};
};

// -- Endpoints ----------------------------------------------------------------

/// Client side: a SyncInterface that talks to a hub over a channel.
///
/// Always create through create().
class RemoteHub : public SyncInterface, public std::enable_shared_from_this<RemoteHub> {
public:
    static auto create(std::shared_ptr<BinaryChannel> channel) -> std::shared_ptr<RemoteHub>;

    explicit RemoteHub(std::shared_ptr<BinaryChannel> channel);

    auto subscribe(const EntityId& id, std::optional<VersionVector> version,
                   UpdateHandler handler) -> Unsubscribe override;
    void send_update(const EntityId& id, Bytes update) override;

    auto subscriber_count(const EntityId& id) const -> std::size_t;

private:
    void receive(std::span<const std::byte> data);
    void remove_handler(const EntityId& id, std::uint64_t handler_id);

    std::shared_ptr<BinaryChannel> channel_;
    std::unordered_map<EntityId, std::map<std::uint64_t, UpdateHandler>> handlers_;
    std::uint64_t next_handler_{1};
};

/// Hub side: serves one client's channel from a HubPeer.
///
/// Create one per client connection. Updates a client sends are not
/// echoed back to that client. Always create through create().
class HubConnection : public std::enable_shared_from_this<HubConnection> {
public:
    static auto create(std::shared_ptr<HubPeer> hub, std::shared_ptr<BinaryChannel> channel)
        -> std::shared_ptr<HubConnection>;

    HubConnection(std::shared_ptr<HubPeer> hub, std::shared_ptr<BinaryChannel> channel);
    ~HubConnection();

    HubConnection(const HubConnection&) = delete;
    auto operator=(const HubConnection&) -> HubConnection& = delete;

    /// Drop every subscription this connection holds.
    void close();

    auto subscription_count() const -> std::size_t { return subscriptions_.size(); }

private:
    void receive(std::span<const std::byte> data);

    std::shared_ptr<HubPeer> hub_;
    std::shared_ptr<BinaryChannel> channel_;
    std::unordered_map<EntityId, HubPeer::Subscription> subscriptions_;
};

}  // namespace leaf_cpp
