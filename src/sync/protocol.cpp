#include <leaf-cpp/protocol.hpp>
#include <leaf-cpp/value.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstring>
#include <exception>
#include <string>
#include <vector>

namespace leaf_cpp {

namespace {

using json = nlohmann::json;

constexpr auto type_subscribe = "subscribe";
constexpr auto type_unsubscribe = "unsubscribe";
constexpr auto type_send_update = "sendUpdate";
constexpr auto type_handle_update = "handleUpdate";

auto to_binary(std::span<const std::byte> data) -> json {
    const auto* first = reinterpret_cast<const std::uint8_t*>(data.data());
    return json::binary(std::vector<std::uint8_t>(first, first + data.size()));
}

auto from_binary(const json& message, const char* field) -> std::optional<Bytes> {
    auto it = message.find(field);
    if (it == message.end() || !it->is_binary()) return std::nullopt;
    const auto& binary = it->get_binary();
    auto result = Bytes(binary.size());
    if (!binary.empty()) std::memcpy(result.data(), binary.data(), binary.size());
    return result;
}

auto pack(const json& message) -> Bytes {
    auto packed = json::to_msgpack(message);
    auto result = Bytes(packed.size());
    if (!packed.empty()) std::memcpy(result.data(), packed.data(), packed.size());
    return result;
}

auto unpack(std::span<const std::byte> data) -> std::optional<json> {
    const auto* first = reinterpret_cast<const std::uint8_t*>(data.data());
    try {
        auto message = json::from_msgpack(first, first + data.size(),
                                          /*strict=*/true, /*allow_exceptions=*/false);
        if (message.is_discarded() || !message.is_object()) return std::nullopt;
        return message;
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

auto read_type(const json& message) -> std::string {
    auto it = message.find("type");
    if (it == message.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

auto read_entity_id(const json& message) -> std::optional<EntityId> {
    auto it = message.find("entityId");
    if (it == message.end() || !it->is_string()) return std::nullopt;
    return EntityId::try_parse(it->get_ref<const std::string&>());
}

}  // namespace

// -- Codec --------------------------------------------------------------------

auto encode_message(const ClientMessage& message) -> Bytes {
    return pack(std::visit(overload{
        [](const SubscribeMessage& m) {
            auto j = json{{"type", type_subscribe}, {"entityId", m.entity_id.to_string()}};
            if (m.version) j["version"] = to_binary(m.version->encode());
            return j;
        },
        [](const UnsubscribeMessage& m) {
            return json{{"type", type_unsubscribe}, {"entityId", m.entity_id.to_string()}};
        },
        [](const SendUpdateMessage& m) {
            return json{{"type", type_send_update},
                        {"entityId", m.entity_id.to_string()},
                        {"update", to_binary(m.update)}};
        },
    }, message));
}

auto encode_message(const HandleUpdateMessage& message) -> Bytes {
    return pack(json{{"type", type_handle_update},
                     {"entityId", message.entity_id.to_string()},
                     {"update", to_binary(message.update)}});
}

auto decode_client_message(std::span<const std::byte> data) -> std::optional<ClientMessage> {
    auto message = unpack(data);
    if (!message) return std::nullopt;

    auto id = read_entity_id(*message);
    if (!id) return std::nullopt;

    auto type = read_type(*message);
    if (type == type_subscribe) {
        auto result = SubscribeMessage{.entity_id = *id, .version = std::nullopt};
        if (auto version = from_binary(*message, "version")) {
            result.version = VersionVector::decode(*version);
        }
        return result;
    }
    if (type == type_unsubscribe) {
        return UnsubscribeMessage{.entity_id = *id};
    }
    if (type == type_send_update) {
        auto update = from_binary(*message, "update");
        if (!update) return std::nullopt;
        return SendUpdateMessage{.entity_id = *id, .update = std::move(*update)};
    }
    return std::nullopt;
}

auto decode_hub_message(std::span<const std::byte> data) -> std::optional<HandleUpdateMessage> {
    auto message = unpack(data);
    if (!message || read_type(*message) != type_handle_update) return std::nullopt;

    auto id = read_entity_id(*message);
    auto update = from_binary(*message, "update");
    if (!id || !update) return std::nullopt;
    return HandleUpdateMessage{.entity_id = *id, .update = std::move(*update)};
}

// -- LoopbackChannel ----------------------------------------------------------

auto LoopbackChannel::create_pair(Executor executor)
    -> std::pair<std::shared_ptr<LoopbackChannel>, std::shared_ptr<LoopbackChannel>> {
    auto a = std::make_shared<LoopbackChannel>(executor);
    auto b = std::make_shared<LoopbackChannel>(executor);
    a->peer_ = b;
    b->peer_ = a;
    return {std::move(a), std::move(b)};
}

LoopbackChannel::LoopbackChannel(Executor executor) : executor_{std::move(executor)} {}

void LoopbackChannel::send(Bytes message) {
    if (!open_) return;
    auto peer = peer_.lock();
    if (!peer) return;
    ++sent_count_;
    net::post(executor_, [weak = std::weak_ptr<LoopbackChannel>{peer},
                          message = std::move(message)]() mutable {
        if (auto target = weak.lock()) target->deliver(std::move(message));
    });
}

void LoopbackChannel::deliver(Bytes message) {
    if (!open_ || !receiver_) return;
    // The receiver may replace itself
    auto receiver = receiver_;
    receiver(message);
}

void LoopbackChannel::on_receive(Receiver receiver) {
    receiver_ = std::move(receiver);
}

void LoopbackChannel::close() {
    open_ = false;
    if (auto peer = peer_.lock()) peer->open_ = false;
}

auto LoopbackChannel::is_open() const -> bool {
    return open_;
}

// -- RemoteHub ----------------------------------------------------------------

auto RemoteHub::create(std::shared_ptr<BinaryChannel> channel) -> std::shared_ptr<RemoteHub> {
    auto hub = std::make_shared<RemoteHub>(std::move(channel));
    hub->channel_->on_receive([weak = std::weak_ptr<RemoteHub>{hub}](std::span<const std::byte> data) {
        if (auto self = weak.lock()) self->receive(data);
    });
    return hub;
}

RemoteHub::RemoteHub(std::shared_ptr<BinaryChannel> channel) : channel_{std::move(channel)} {}

auto RemoteHub::subscribe(const EntityId& id, std::optional<VersionVector> version,
                          UpdateHandler handler) -> Unsubscribe {
    const auto handler_id = next_handler_++;
    handlers_[id].emplace(handler_id, std::move(handler));

    // Every subscribe gets its own initial response from the hub
    channel_->send(encode_message(SubscribeMessage{.entity_id = id, .version = std::move(version)}));

    return [weak = weak_from_this(), id, handler_id]() {
        if (auto self = weak.lock()) self->remove_handler(id, handler_id);
    };
}

void RemoteHub::remove_handler(const EntityId& id, std::uint64_t handler_id) {
    auto it = handlers_.find(id);
    if (it == handlers_.end() || it->second.erase(handler_id) == 0) return;
    if (it->second.empty()) {
        handlers_.erase(it);
        channel_->send(encode_message(UnsubscribeMessage{.entity_id = id}));
    }
}

void RemoteHub::send_update(const EntityId& id, Bytes update) {
    channel_->send(encode_message(SendUpdateMessage{.entity_id = id, .update = std::move(update)}));
}

auto RemoteHub::subscriber_count(const EntityId& id) const -> std::size_t {
    auto it = handlers_.find(id);
    return it == handlers_.end() ? 0 : it->second.size();
}

void RemoteHub::receive(std::span<const std::byte> data) {
    auto message = decode_hub_message(data);
    if (!message) {
        spdlog::warn("dropping malformed hub message ({} bytes)", data.size());
        return;
    }

    auto it = handlers_.find(message->entity_id);
    if (it == handlers_.end()) return;
    auto handlers = it->second;
    for (const auto& [handler_id, handler] : handlers) {
        try {
            handler(message->entity_id, message->update);
        } catch (const std::exception& e) {
            spdlog::error("update handler for {} failed: {}",
                          message->entity_id.to_string(), e.what());
        }
    }
}

// -- HubConnection ------------------------------------------------------------

auto HubConnection::create(std::shared_ptr<HubPeer> hub, std::shared_ptr<BinaryChannel> channel)
    -> std::shared_ptr<HubConnection> {
    auto connection = std::make_shared<HubConnection>(std::move(hub), std::move(channel));
    connection->channel_->on_receive(
        [weak = std::weak_ptr<HubConnection>{connection}](std::span<const std::byte> data) {
            if (auto self = weak.lock()) self->receive(data);
        });
    return connection;
}

HubConnection::HubConnection(std::shared_ptr<HubPeer> hub, std::shared_ptr<BinaryChannel> channel)
    : hub_{std::move(hub)}, channel_{std::move(channel)} {}

HubConnection::~HubConnection() {
    close();
}

void HubConnection::close() {
    auto subscriptions = std::move(subscriptions_);
    subscriptions_.clear();
    for (auto& [id, subscription] : subscriptions) {
        subscription.unsubscribe();
    }
}

void HubConnection::receive(std::span<const std::byte> data) {
    auto message = decode_client_message(data);
    if (!message) {
        spdlog::warn("dropping malformed client message ({} bytes)", data.size());
        return;
    }

    std::visit(overload{
        [this](SubscribeMessage& m) {
            // A repeated subscribe replaces the previous one
            if (auto it = subscriptions_.find(m.entity_id); it != subscriptions_.end()) {
                it->second.unsubscribe();
                subscriptions_.erase(it);
            }
            auto handler = [weak = weak_from_this()](const EntityId& id,
                                                     std::span<const std::byte> update) {
                auto self = weak.lock();
                if (!self) return;
                self->channel_->send(encode_message(HandleUpdateMessage{
                    .entity_id = id,
                    .update = Bytes(update.begin(), update.end()),
                }));
            };
            subscriptions_.emplace(
                m.entity_id, hub_->open_subscription(m.entity_id, std::move(m.version), handler));
        },
        [this](UnsubscribeMessage& m) {
            if (auto it = subscriptions_.find(m.entity_id); it != subscriptions_.end()) {
                it->second.unsubscribe();
                subscriptions_.erase(it);
            }
        },
        [this](SendUpdateMessage& m) {
            auto origin = std::optional<SubscriptionId>{};
            if (auto it = subscriptions_.find(m.entity_id); it != subscriptions_.end()) {
                origin = it->second.id;
            }
            hub_->send_update_from(m.entity_id, std::move(m.update), origin);
        },
    }, *message);
}

}  // namespace leaf_cpp
