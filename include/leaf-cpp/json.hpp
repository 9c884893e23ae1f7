/// @file json.hpp
/// @brief nlohmann/json interoperability for leaf-cpp.
///
/// Provides ADL serialization (to_json/from_json) for the identity and
/// value types, and a diagnostic export of a document's state.

#pragma once

#include <leaf-cpp/change.hpp>
#include <leaf-cpp/document.hpp>
#include <leaf-cpp/entity_id.hpp>
#include <leaf-cpp/op.hpp>
#include <leaf-cpp/types.hpp>
#include <leaf-cpp/update.hpp>
#include <leaf-cpp/value.hpp>
#include <leaf-cpp/version.hpp>

#include <nlohmann/json.hpp>

namespace leaf_cpp {

// -- ScalarValue (variant) ----------------------------------------------------

void to_json(nlohmann::json& j, const ScalarValue& sv);
void from_json(const nlohmann::json& j, ScalarValue& sv);

// -- Identity types -----------------------------------------------------------

/// ActorId as a lower-case hex string.
void to_json(nlohmann::json& j, const ActorId& id);
void from_json(const nlohmann::json& j, ActorId& id);

/// EntityId in its `leaf:` text form.
void to_json(nlohmann::json& j, const EntityId& id);
void from_json(const nlohmann::json& j, EntityId& id);

/// VersionVector as an object mapping actor hex to sequence number.
void to_json(nlohmann::json& j, const VersionVector& version);
void from_json(const nlohmann::json& j, VersionVector& version);

// -- Compound types -----------------------------------------------------------

void to_json(nlohmann::json& j, const Op& op);
void to_json(nlohmann::json& j, const Change& c);
void to_json(nlohmann::json& j, const UpdateMeta& meta);

// -- Document export ----------------------------------------------------------

/// The document's state as
/// `{container: {"entries": {key: value}, "counter": n}}`.
/// Staged ops are included.
auto export_json(const Document& doc) -> nlohmann::json;

}  // namespace leaf_cpp
