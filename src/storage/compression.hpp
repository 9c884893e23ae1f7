#pragma once

// Raw DEFLATE (windowBits -15, no zlib or gzip header) for update bodies.
// A body is compressed only when it is over the threshold and shrinks.
//
// Internal header — not installed.

#include <algorithm>
#include <cstddef>
#include <optional>
#include <span>
#include <vector>

#include <zlib.h>

namespace leaf_cpp::storage {

// Bodies up to this size are never compressed.
inline constexpr std::size_t deflate_threshold = 256;

// Inflating past this size is treated as malformed input.
inline constexpr std::size_t max_inflated_size = std::size_t{64} * 1024 * 1024;

namespace detail {

inline constexpr int raw_window_bits = -15;

// Owns a z_stream for one deflate or inflate pass.
class ZStream {
public:
    enum class Mode { deflate, inflate };

    explicit ZStream(Mode mode) : mode_{mode} {
        auto rc = mode == Mode::deflate
            ? ::deflateInit2(&stream_, Z_DEFAULT_COMPRESSION, Z_DEFLATED, raw_window_bits, 8,
                             Z_DEFAULT_STRATEGY)
            : ::inflateInit2(&stream_, raw_window_bits);
        ok_ = rc == Z_OK;
    }

    ~ZStream() {
        if (!ok_) return;
        if (mode_ == Mode::deflate) {
            ::deflateEnd(&stream_);
        } else {
            ::inflateEnd(&stream_);
        }
    }

    ZStream(const ZStream&) = delete;
    auto operator=(const ZStream&) -> ZStream& = delete;

    auto ok() const -> bool { return ok_; }
    auto get() -> z_stream* { return &stream_; }

    void set_input(std::span<const std::byte> input) {
        stream_.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(input.data()));
        stream_.avail_in = static_cast<uInt>(input.size());
    }

    void set_output(std::byte* out, std::size_t size) {
        stream_.next_out = reinterpret_cast<Bytef*>(out);
        stream_.avail_out = static_cast<uInt>(size);
    }

private:
    Mode mode_;
    z_stream stream_{};
    bool ok_{false};
};

}  // namespace detail

inline auto deflate_compress(std::span<const std::byte> input)
    -> std::optional<std::vector<std::byte>> {
    if (input.empty()) return std::vector<std::byte>{};

    auto stream = detail::ZStream{detail::ZStream::Mode::deflate};
    if (!stream.ok()) return std::nullopt;

    auto output = std::vector<std::byte>(
        ::deflateBound(stream.get(), static_cast<uLong>(input.size())));
    stream.set_input(input);
    stream.set_output(output.data(), output.size());
    if (::deflate(stream.get(), Z_FINISH) != Z_STREAM_END) return std::nullopt;

    output.resize(stream.get()->total_out);
    return output;
}

/// nullopt on a corrupt stream, or one that inflates past `limit`.
inline auto deflate_decompress(std::span<const std::byte> input,
                               std::size_t limit = max_inflated_size)
    -> std::optional<std::vector<std::byte>> {
    if (input.empty()) return std::nullopt;

    auto stream = detail::ZStream{detail::ZStream::Mode::inflate};
    if (!stream.ok()) return std::nullopt;
    stream.set_input(input);

    auto output = std::vector<std::byte>{};
    auto capacity = std::min(std::max(input.size() * 4, std::size_t{64}), limit);
    for (;;) {
        auto written = static_cast<std::size_t>(stream.get()->total_out);
        output.resize(capacity);
        stream.set_output(output.data() + written, capacity - written);

        auto rc = ::inflate(stream.get(), Z_FINISH);
        if (rc == Z_STREAM_END) break;
        if (rc != Z_OK && rc != Z_BUF_ERROR) return std::nullopt;
        // Out of room; anything else means the input ended early
        if (stream.get()->avail_out != 0 || capacity == limit) return std::nullopt;
        capacity = std::min(capacity * 2, limit);
    }

    output.resize(stream.get()->total_out);
    return output;
}

}  // namespace leaf_cpp::storage
