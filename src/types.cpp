#include <leaf-cpp/types.hpp>

#include <algorithm>
#include <cstring>
#include <random>

namespace leaf_cpp {

void fill_random(std::span<std::byte> out) {
    // random_device is backed by the OS entropy source on supported platforms
    thread_local auto device = std::random_device{};
    auto pos = std::size_t{0};
    while (pos < out.size()) {
        auto word = static_cast<std::uint32_t>(device());
        auto n = std::min(sizeof(word), out.size() - pos);
        std::memcpy(out.data() + pos, &word, n);
        pos += n;
    }
}

auto ActorId::random() -> ActorId {
    auto id = ActorId{};
    fill_random(id.bytes);
    return id;
}

}  // namespace leaf_cpp
