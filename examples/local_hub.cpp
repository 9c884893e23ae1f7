// local_hub: two peers syncing one entity through a hub over a
// simulated network
//
// Demonstrates: HubPeer, HubConnection, RemoteHub, LoopbackChannel,
//               Syncer, concurrent edits converging

#include <leaf-cpp/json.hpp>
#include <leaf-cpp/leaf.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdio>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace leaf = leaf_cpp;

static const auto Name = leaf::def_component<leaf::MapComponent>("name:01JNVY76XPH6Q5AVA385HP04G7");
static const auto Visits =
    leaf::def_component<leaf::CounterComponent>("visits:01JNVYB0K9Q2ES0F0F7D5XHTHD");

// A client peer with its own in-memory storage, connected to the hub.
struct Client {
    std::shared_ptr<leaf::HubConnection> connection;
    std::shared_ptr<leaf::LocalPeer> peer;
};

static auto connect(leaf::Executor executor, const std::shared_ptr<leaf::HubPeer>& hub)
    -> Client {
    auto [client_end, hub_end] = leaf::LoopbackChannel::create_pair(executor);
    auto connection = leaf::HubConnection::create(hub, hub_end);
    auto syncer = std::make_shared<leaf::Syncer>(executor, leaf::RemoteHub::create(client_end));

    auto config = leaf::LocalPeerConfig{
        .storages = {leaf::StorageConfig{.manager = std::make_shared<leaf::StorageManager>(
            std::make_shared<leaf::MemoryStorage>())}},
        .syncers = {syncer},
        .create_after_timeout = std::chrono::seconds{2},
        .idle_timeout = std::nullopt,
    };
    return Client{
        .connection = std::move(connection),
        .peer = std::make_shared<leaf::LocalPeer>(executor, std::move(config)),
    };
}

static auto run_demo(leaf::Executor executor) -> leaf::Task<> {
    auto hub = std::make_shared<leaf::HubPeer>(executor, std::vector<leaf::StorageConfig>{
        leaf::StorageConfig{.manager = std::make_shared<leaf::StorageManager>(
            std::make_shared<leaf::MemoryStorage>())}});
    auto alice = connect(executor, hub);
    auto bob = connect(executor, hub);

    // --- Alice creates the entity ---
    auto a = co_await alice.peer->create();
    a->get_or_init(Name).set("first", std::string{"John"});
    a->commit();
    co_await leaf::sleep_for(std::chrono::milliseconds{10});

    // --- Bob opens it; the hub has a copy, so the open waits for it ---
    auto b = co_await bob.peer->open(a.id());
    std::printf("bob sees first=%s\n", b->get(Name)->get_as<std::string>("first")->c_str());

    // --- Concurrent edits ---
    a->get_or_init(Name).set("last", std::string{"Smith"});
    a->commit();
    b->get_or_init(Visits).increment(3);
    b->commit();
    co_await leaf::sleep_for(std::chrono::milliseconds{10});

    auto same = a->doc().export_snapshot() == b->doc().export_snapshot();
    std::printf("converged: %s\n", same ? "yes" : "no");
    std::printf("state: %s\n", leaf::export_json(a->doc()).dump(2).c_str());

    co_await alice.peer->close(a.id());
    co_await bob.peer->close(b.id());
    alice.connection->close();
    bob.connection->close();
}

int main() {
    spdlog::set_level(spdlog::level::debug);

    auto io = leaf::net::io_context{};
    auto done = leaf::net::co_spawn(io, run_demo(io.get_executor()), leaf::net::use_future);
    io.run();
    try {
        done.get();
    } catch (const leaf::Exception& e) {
        std::fprintf(stderr, "error: %s\n", e.what());
        return 1;
    }
    return 0;
}
