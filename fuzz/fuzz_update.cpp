// Fuzz target for update decoding and Document::merge().
// A buffer that merges must re-export to a snapshot that merges into a
// fresh document with the same version.

#include "storage/update_chunk.hpp"

#include <leaf-cpp/document.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <span>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto span = std::span<const std::byte>(
        reinterpret_cast<const std::byte*>(data), size);

    auto header = leaf_cpp::storage::decode_update(span, /*header_only=*/true);
    auto full = leaf_cpp::storage::decode_update(span);
    if (full && !header) std::abort();

    auto doc = leaf_cpp::Document{};
    if (!doc.merge(span)) return 0;

    auto copy = leaf_cpp::Document{};
    if (!copy.merge(doc.export_snapshot())) std::abort();
    if (copy.version() != doc.version()) std::abort();
    return 0;
}
