/// @file config.hpp
/// @brief Peer options loadable from JSON, and wiring them into a LocalPeerConfig.
///
/// @code
/// {
///   "createAfterTimeoutMs": 2000,
///   "idleTimeoutMs": 60000,
///   "storage": {"read": true, "write": true, "writeDebounceMs": 250},
///   "logLevel": "info"
/// }
/// @endcode
/// Every key is optional. Unknown keys are ignored.

#pragma once

#include <leaf-cpp/local_peer.hpp>
#include <leaf-cpp/scheduler.hpp>
#include <leaf-cpp/storage_manager.hpp>
#include <leaf-cpp/sync.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/common.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace leaf_cpp {

/// How a peer treats the storages it is given.
struct StorageOptions {
    bool read{true};
    bool write{true};
    /// Coalesce saves per entity within this delay; unset saves on every change.
    std::optional<std::chrono::milliseconds> write_debounce;

    auto operator==(const StorageOptions&) const -> bool = default;
};

struct PeerOptions {
    std::optional<std::chrono::milliseconds> create_after_timeout;
    std::optional<std::chrono::milliseconds> idle_timeout;
    StorageOptions storage;
    std::optional<spdlog::level::level_enum> log_level;

    auto operator==(const PeerOptions&) const -> bool = default;
};

/// @throws Exception with ErrorKind::invalid_config on a wrong type or an
///   unknown log level.
void from_json(const nlohmann::json& j, PeerOptions& options);
void to_json(nlohmann::json& j, const PeerOptions& options);

/// Parse options from JSON text.
/// @throws Exception with ErrorKind::invalid_config.
auto parse_peer_options(std::string_view text) -> PeerOptions;

/// Read options from a JSON file.
/// @throws Exception with ErrorKind::invalid_config if the file cannot be
///   read or parsed.
auto load_peer_options(const std::filesystem::path& path) -> PeerOptions;

/// Set the default spdlog logger's level, if the options name one.
void apply_log_level(const PeerOptions& options);

/// Build a LocalPeerConfig that attaches every manager with the storage
/// options, each behind its own DebounceThrottle when a debounce is set.
auto make_local_peer_config(Executor executor, const PeerOptions& options,
                            const std::vector<std::shared_ptr<StorageManager>>& managers,
                            std::vector<std::shared_ptr<Syncer>> syncers) -> LocalPeerConfig;

}  // namespace leaf_cpp
