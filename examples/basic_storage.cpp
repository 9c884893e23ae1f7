// basic_storage: a LocalPeer persisting an entity to the filesystem
//
// Demonstrates: PeerOptions from JSON, FilesystemStorage, components,
//               close and reopen, export_json
//
// Build: cmake --build build
// Run:   ./build/basic_storage [directory]

#include <leaf-cpp/config.hpp>
#include <leaf-cpp/json.hpp>
#include <leaf-cpp/leaf.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>

namespace leaf = leaf_cpp;

static const auto Name = leaf::def_component<leaf::MapComponent>(
    "name:01JNVY76XPH6Q5AVA385HP04G7",
    [](leaf::MapComponent& map) { map.set("first", std::string{}); });
static const auto Visits =
    leaf::def_component<leaf::CounterComponent>("visits:01JNVYB0K9Q2ES0F0F7D5XHTHD");

static auto run_demo(leaf::Executor executor, std::filesystem::path root) -> leaf::Task<> {
    auto options = leaf::parse_peer_options(R"({
        "storage": {"writeDebounceMs": 50},
        "logLevel": "info"
    })");
    leaf::apply_log_level(options);

    auto storage = std::make_shared<leaf::FilesystemStorage>(root);
    auto manager = std::make_shared<leaf::StorageManager>(storage);
    auto peer = std::make_shared<leaf::LocalPeer>(
        executor, leaf::make_local_peer_config(executor, options, {manager}, {}));

    // --- Create an entity and edit it ---
    auto handle = co_await peer->create();
    const auto id = handle.id();
    handle->get_or_init(Name).set("first", std::string{"Alice"});
    handle->get_or_init(Visits).increment();
    handle->commit("first visit");
    std::printf("created %s\n", id.to_string().c_str());

    // Closing flushes the debounced save
    handle = {};
    co_await peer->close(id);
    std::printf("saved to %s\n", root.string().c_str());

    // --- Reopen it from disk ---
    auto reopened = co_await peer->open(id);
    reopened->get_or_init(Visits).increment();
    reopened->commit("second visit");
    std::printf("visits: %lld\n", static_cast<long long>(reopened->get(Visits)->value()));
    std::printf("state: %s\n", leaf::export_json(reopened->doc()).dump(2).c_str());
    co_await peer->close(id);

    std::printf("chunks on disk:\n");
    auto chunks = co_await storage->load_range(leaf::StorageManager::entity_prefix(id));
    for (const auto& entry : chunks) {
        std::printf("  %s\n", leaf::to_string(entry.key).c_str());
    }
}

int main(int argc, char** argv) {
    auto root = argc > 1 ? std::filesystem::path{argv[1]}
                         : std::filesystem::temp_directory_path() / "leaf-basic-storage";

    auto io = leaf::net::io_context{};
    auto done = leaf::net::co_spawn(io, run_demo(io.get_executor(), root),
                                    leaf::net::use_future);
    io.run();
    try {
        done.get();
    } catch (const leaf::Exception& e) {
        std::fprintf(stderr, "error: %s\n", e.what());
        return 1;
    }
    return 0;
}
