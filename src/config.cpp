#include <leaf-cpp/config.hpp>
#include <leaf-cpp/error.hpp>
#include <leaf-cpp/throttle.hpp>

#include <spdlog/spdlog.h>

#include <cstdint>
#include <fstream>
#include <sstream>
#include <string>

namespace leaf_cpp {

namespace {

auto read_millis(const nlohmann::json& j, const char* key)
    -> std::optional<std::chrono::milliseconds> {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    if (!it->is_number_integer() || it->get<std::int64_t>() < 0) {
        throw Exception{ErrorKind::invalid_config,
                        std::string{key} + " must be a non-negative integer"};
    }
    return std::chrono::milliseconds{it->get<std::int64_t>()};
}

auto read_bool(const nlohmann::json& j, const char* key, bool fallback) -> bool {
    auto it = j.find(key);
    if (it == j.end()) return fallback;
    if (!it->is_boolean()) {
        throw Exception{ErrorKind::invalid_config, std::string{key} + " must be a boolean"};
    }
    return it->get<bool>();
}

auto parse_level(const std::string& name) -> spdlog::level::level_enum {
    auto level = spdlog::level::from_str(name);
    // from_str answers "off" for names it does not know
    if (level == spdlog::level::off && name != "off") {
        throw Exception{ErrorKind::invalid_config, "unknown log level: " + name};
    }
    return level;
}

}  // namespace

void from_json(const nlohmann::json& j, PeerOptions& options) {
    if (!j.is_object()) {
        throw Exception{ErrorKind::invalid_config, "peer options must be a JSON object"};
    }

    options = PeerOptions{};
    options.create_after_timeout = read_millis(j, "createAfterTimeoutMs");
    options.idle_timeout = read_millis(j, "idleTimeoutMs");

    if (auto it = j.find("storage"); it != j.end()) {
        if (!it->is_object()) {
            throw Exception{ErrorKind::invalid_config, "storage must be a JSON object"};
        }
        options.storage.read = read_bool(*it, "read", true);
        options.storage.write = read_bool(*it, "write", true);
        options.storage.write_debounce = read_millis(*it, "writeDebounceMs");
    }

    if (auto it = j.find("logLevel"); it != j.end()) {
        if (!it->is_string()) {
            throw Exception{ErrorKind::invalid_config, "logLevel must be a string"};
        }
        options.log_level = parse_level(it->get<std::string>());
    }
}

void to_json(nlohmann::json& j, const PeerOptions& options) {
    j = nlohmann::json::object();
    if (options.create_after_timeout) {
        j["createAfterTimeoutMs"] = options.create_after_timeout->count();
    }
    if (options.idle_timeout) j["idleTimeoutMs"] = options.idle_timeout->count();

    auto storage = nlohmann::json{
        {"read", options.storage.read},
        {"write", options.storage.write},
    };
    if (options.storage.write_debounce) {
        storage["writeDebounceMs"] = options.storage.write_debounce->count();
    }
    j["storage"] = std::move(storage);

    if (options.log_level) {
        auto name = spdlog::level::to_string_view(*options.log_level);
        j["logLevel"] = std::string{name.data(), name.size()};
    }
}

auto parse_peer_options(std::string_view text) -> PeerOptions {
    auto j = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded()) {
        throw Exception{ErrorKind::invalid_config, "peer options are not valid JSON"};
    }
    return j.get<PeerOptions>();
}

auto load_peer_options(const std::filesystem::path& path) -> PeerOptions {
    auto file = std::ifstream{path};
    if (!file) {
        throw Exception{ErrorKind::invalid_config, "cannot read " + path.string()};
    }
    auto buffer = std::stringstream{};
    buffer << file.rdbuf();
    spdlog::debug("loading peer options from {}", path.string());
    return parse_peer_options(buffer.str());
}

void apply_log_level(const PeerOptions& options) {
    if (options.log_level) spdlog::set_level(*options.log_level);
}

auto make_local_peer_config(Executor executor, const PeerOptions& options,
                            const std::vector<std::shared_ptr<StorageManager>>& managers,
                            std::vector<std::shared_ptr<Syncer>> syncers) -> LocalPeerConfig {
    auto config = LocalPeerConfig{
        .storages = {},
        .syncers = std::move(syncers),
        .create_after_timeout = options.create_after_timeout,
        .idle_timeout = options.idle_timeout,
    };
    for (const auto& manager : managers) {
        auto storage = StorageConfig{
            .manager = manager,
            .read = options.storage.read,
            .write = options.storage.write,
            .throttle = nullptr,
        };
        if (options.storage.write_debounce) {
            storage.throttle =
                std::make_shared<DebounceThrottle>(executor, *options.storage.write_debounce);
        }
        config.storages.push_back(std::move(storage));
    }
    return config;
}

}  // namespace leaf_cpp
