// Fuzz target for the sync protocol codec. Decoding must never throw, and a
// decoded message must survive a re-encode.

#include <leaf-cpp/protocol.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <span>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto span = std::span<const std::byte>(
        reinterpret_cast<const std::byte*>(data), size);

    if (auto message = leaf_cpp::decode_client_message(span)) {
        auto again = leaf_cpp::decode_client_message(leaf_cpp::encode_message(*message));
        if (!again || *again != *message) std::abort();
    }
    if (auto message = leaf_cpp::decode_hub_message(span)) {
        auto again = leaf_cpp::decode_hub_message(leaf_cpp::encode_message(*message));
        if (!again || *again != *message) std::abort();
    }
    return 0;
}
