#include <leaf-cpp/error.hpp>
#include <leaf-cpp/storage.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <system_error>

namespace leaf_cpp {

namespace fs = std::filesystem;

namespace {

auto is_plain(unsigned char c) -> bool {
    return std::isalnum(c) != 0 || c == '-' || c == '_';
}

auto hex_value(char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

[[noreturn]] void throw_storage_error(const std::string& what, const fs::path& path,
                                      const std::error_code& ec) {
    throw Exception{ErrorKind::storage_error,
                    what + " " + path.string() + ": " + ec.message()};
}

auto read_file(const fs::path& path) -> Bytes {
    auto in = std::ifstream{path, std::ios::binary};
    if (!in) {
        throw Exception{ErrorKind::storage_error, "cannot open " + path.string()};
    }
    auto chars = std::vector<char>{std::istreambuf_iterator<char>{in},
                                   std::istreambuf_iterator<char>{}};
    if (in.bad()) {
        throw Exception{ErrorKind::storage_error, "cannot read " + path.string()};
    }
    auto data = Bytes(chars.size());
    std::ranges::transform(chars, data.begin(),
        [](char c) { return static_cast<std::byte>(c); });
    return data;
}

}  // namespace

auto escape_path_element(const std::string& element) -> std::string {
    static constexpr char hex[] = "0123456789ABCDEF";
    auto result = std::string{};
    result.reserve(element.size());
    for (auto ch : element) {
        auto c = static_cast<unsigned char>(ch);
        if (is_plain(c)) {
            result.push_back(static_cast<char>(c));
        } else {
            result.push_back('%');
            result.push_back(hex[c >> 4]);
            result.push_back(hex[c & 0x0F]);
        }
    }
    // An empty element still needs a file name
    if (result.empty()) result = "%";
    return result;
}

auto unescape_path_element(const std::string& name) -> std::optional<std::string> {
    if (name == "%") return std::string{};
    auto result = std::string{};
    result.reserve(name.size());
    for (std::size_t i = 0; i < name.size(); ++i) {
        if (name[i] != '%') {
            result.push_back(name[i]);
            continue;
        }
        if (i + 2 >= name.size()) return std::nullopt;
        auto hi = hex_value(name[i + 1]);
        auto lo = hex_value(name[i + 2]);
        if (hi < 0 || lo < 0) return std::nullopt;
        result.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
    }
    return result;
}

FilesystemStorage::FilesystemStorage(fs::path root) : root_{std::move(root)} {}

auto FilesystemStorage::path_for(const StorageKey& key) const -> fs::path {
    auto path = root_;
    for (const auto& element : key) {
        path /= escape_path_element(element);
    }
    return path;
}

auto FilesystemStorage::load(const StorageKey& key) -> Task<std::optional<Bytes>> {
    auto path = path_for(key);
    auto ec = std::error_code{};
    if (!fs::is_regular_file(path, ec)) {
        if (ec && ec != std::errc::no_such_file_or_directory) {
            throw_storage_error("cannot stat", path, ec);
        }
        co_return std::nullopt;
    }
    co_return read_file(path);
}

auto FilesystemStorage::save(const StorageKey& key, Bytes data) -> Task<> {
    auto path = path_for(key);
    auto ec = std::error_code{};
    fs::create_directories(path.parent_path(), ec);
    if (ec) throw_storage_error("cannot create directory", path.parent_path(), ec);

    // Write to a sibling and rename, so readers never see a partial file
    auto tmp = path;
    tmp += ".tmp";
    {
        auto out = std::ofstream{tmp, std::ios::binary | std::ios::trunc};
        if (!out) {
            throw Exception{ErrorKind::storage_error, "cannot open " + tmp.string()};
        }
        out.write(reinterpret_cast<const char*>(data.data()),
                  static_cast<std::streamsize>(data.size()));
        out.flush();
        if (!out) {
            throw Exception{ErrorKind::storage_error, "cannot write " + tmp.string()};
        }
    }
    fs::rename(tmp, path, ec);
    if (ec) throw_storage_error("cannot rename to", path, ec);
    co_return;
}

auto FilesystemStorage::remove(const StorageKey& key) -> Task<> {
    auto path = path_for(key);
    auto ec = std::error_code{};
    fs::remove(path, ec);
    if (ec) throw_storage_error("cannot remove", path, ec);
    co_return;
}

auto FilesystemStorage::load_range(const StorageKey& prefix) -> Task<std::vector<StorageEntry>> {
    auto result = std::vector<StorageEntry>{};
    auto base = path_for(prefix);
    auto ec = std::error_code{};

    if (fs::is_regular_file(base, ec)) {
        result.push_back(StorageEntry{.key = prefix, .data = read_file(base)});
        co_return result;
    }
    if (!fs::is_directory(base, ec)) co_return result;

    auto it = fs::recursive_directory_iterator{base, ec};
    if (ec) throw_storage_error("cannot list", base, ec);
    for (; it != fs::recursive_directory_iterator{}; it.increment(ec)) {
        if (ec) throw_storage_error("cannot list", base, ec);
        if (!it->is_regular_file()) continue;
        const auto& path = it->path();
        if (path.extension() == ".tmp") continue;

        auto key = prefix;
        auto valid = true;
        for (const auto& part : fs::relative(path, base)) {
            auto element = unescape_path_element(part.string());
            if (!element) {
                valid = false;
                break;
            }
            key.push_back(std::move(*element));
        }
        if (!valid) continue;
        result.push_back(StorageEntry{.key = std::move(key), .data = read_file(path)});
    }
    if (ec) throw_storage_error("cannot list", base, ec);

    std::ranges::sort(result, {}, &StorageEntry::key);
    co_return result;
}

auto FilesystemStorage::remove_range(const StorageKey& prefix) -> Task<> {
    auto path = path_for(prefix);
    auto ec = std::error_code{};
    fs::remove_all(path, ec);
    if (ec) throw_storage_error("cannot remove", path, ec);
    co_return;
}

}  // namespace leaf_cpp
