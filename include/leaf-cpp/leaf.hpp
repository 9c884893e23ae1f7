/// @file leaf.hpp
/// @brief Umbrella header for the leaf-cpp library.
///
/// Include this single header for access to all public types:
/// Entity, EntityId, Document, the storage backends, StorageManager,
/// Syncer, HubPeer, LocalPeer, the sync protocol, and Error.
/// JSON support lives in <leaf-cpp/json.hpp> and <leaf-cpp/config.hpp>.

#pragma once

#include <leaf-cpp/change.hpp>
#include <leaf-cpp/component.hpp>
#include <leaf-cpp/document.hpp>
#include <leaf-cpp/entity.hpp>
#include <leaf-cpp/entity_id.hpp>
#include <leaf-cpp/error.hpp>
#include <leaf-cpp/hub_peer.hpp>
#include <leaf-cpp/local_peer.hpp>
#include <leaf-cpp/op.hpp>
#include <leaf-cpp/protocol.hpp>
#include <leaf-cpp/scheduler.hpp>
#include <leaf-cpp/storage.hpp>
#include <leaf-cpp/storage_manager.hpp>
#include <leaf-cpp/sync.hpp>
#include <leaf-cpp/throttle.hpp>
#include <leaf-cpp/transaction.hpp>
#include <leaf-cpp/types.hpp>
#include <leaf-cpp/update.hpp>
#include <leaf-cpp/value.hpp>
#include <leaf-cpp/version.hpp>
