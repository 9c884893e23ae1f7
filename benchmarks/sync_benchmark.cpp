// leaf-cpp benchmarks: measures throughput of document edits, update
// encoding, storage compaction and hub round trips.

#include <leaf-cpp/leaf.hpp>

#include <benchmark/benchmark.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

using namespace leaf_cpp;

template <typename T>
static auto run(net::io_context& io, Task<T> task) -> T {
    auto future = net::co_spawn(io, std::move(task), net::use_future);
    io.restart();
    io.run();
    return future.get();
}

static auto make_doc(std::size_t keys) -> Document {
    auto doc = Document{};
    for (std::size_t i = 0; i < keys; ++i) {
        doc.put("fields", "key" + std::to_string(i), static_cast<std::int64_t>(i));
        doc.commit();
    }
    return doc;
}

// =============================================================================
// Document edits
// =============================================================================

static void bm_put_commit(benchmark::State& state) {
    auto doc = Document{};
    std::int64_t i = 0;
    for (auto _ : state) {
        doc.put("fields", "key", i++);
        doc.commit();
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_put_commit);

static void bm_transact_batch(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    auto doc = Document{};
    std::int64_t val = 0;
    for (auto _ : state) {
        doc.transact([&](Transaction& tx) {
            for (std::size_t i = 0; i < n; ++i) {
                tx.put("fields", "key" + std::to_string(i), val++);
            }
        });
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_transact_batch)->Range(10, 1000);

static void bm_counter_increment(benchmark::State& state) {
    auto doc = Document{};
    for (auto _ : state) {
        doc.increment("visits", 1);
        doc.commit();
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_counter_increment);

// =============================================================================
// Updates
// =============================================================================

static void bm_export_snapshot(benchmark::State& state) {
    auto doc = make_doc(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        benchmark::DoNotOptimize(doc.export_snapshot());
    }
}
BENCHMARK(bm_export_snapshot)->Range(10, 1000);

static void bm_merge_snapshot(benchmark::State& state) {
    auto snapshot = make_doc(static_cast<std::size_t>(state.range(0))).export_snapshot();
    for (auto _ : state) {
        auto doc = Document{};
        benchmark::DoNotOptimize(doc.merge(snapshot));
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * snapshot.size()));
}
BENCHMARK(bm_merge_snapshot)->Range(10, 1000);

static void bm_export_delta(benchmark::State& state) {
    auto doc = make_doc(1000);
    auto base = doc.version();
    doc.put("fields", "late", std::string{"edit"});
    doc.commit();
    for (auto _ : state) {
        benchmark::DoNotOptimize(doc.export_delta(base));
    }
}
BENCHMARK(bm_export_delta);

static void bm_inspect_update(benchmark::State& state) {
    auto snapshot = make_doc(1000).export_snapshot();
    for (auto _ : state) {
        benchmark::DoNotOptimize(Document::inspect_update(snapshot));
    }
}
BENCHMARK(bm_inspect_update);

// =============================================================================
// Storage
// =============================================================================

static void bm_storage_save(benchmark::State& state) {
    auto io = net::io_context{};
    auto manager = StorageManager{std::make_shared<MemoryStorage>()};
    auto entity = Entity{};
    std::int64_t i = 0;
    for (auto _ : state) {
        entity.doc().put("fields", "key", i++);
        entity.commit();
        run(io, manager.save(entity));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_storage_save);

static void bm_storage_load(benchmark::State& state) {
    auto io = net::io_context{};
    auto storage = std::make_shared<MemoryStorage>();
    auto source = Entity{};
    for (int i = 0; i < 100; ++i) {
        source.doc().put("fields", "key" + std::to_string(i), std::int64_t{i});
        source.commit();
    }
    run(io, StorageManager{storage}.save(source));

    for (auto _ : state) {
        auto entity = Entity{source.id()};
        benchmark::DoNotOptimize(run(io, StorageManager{storage}.load(entity)));
    }
}
BENCHMARK(bm_storage_load);

// =============================================================================
// Sync
// =============================================================================

static void bm_hub_round_trip(benchmark::State& state) {
    auto io = net::io_context{};
    auto hub = std::make_shared<HubPeer>(io.get_executor(), std::vector<StorageConfig>{
        StorageConfig{.manager = std::make_shared<StorageManager>(
            std::make_shared<MemoryStorage>())}});
    auto writer = std::make_shared<Entity>();
    auto reader = std::make_shared<Entity>(writer->id());
    auto writer_sync = std::make_shared<Syncer>(io.get_executor(), hub);
    auto reader_sync = std::make_shared<Syncer>(io.get_executor(), hub);
    writer_sync->sync(writer);
    reader_sync->sync(reader);

    std::int64_t i = 0;
    for (auto _ : state) {
        writer->doc().put("fields", "key", i++);
        writer->commit();
        io.restart();
        io.run();
    }
    if (reader->doc().version() != writer->doc().version()) {
        state.SkipWithError("reader did not converge");
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_hub_round_trip);
