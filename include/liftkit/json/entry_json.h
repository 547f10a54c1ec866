#pragma once

#include "liftkit/core/result.h"
#include "liftkit/model/document.h"
#include "liftkit/model/entry.h"
#include "liftkit/model/multitext.h"

#include <nlohmann/json.hpp>

#include <string>

namespace liftkit::json {

struct JsonError {
  std::string path;  // JSON pointer of the offending value, when known
  std::string message;
};

using EntryJsonResult = core::Result<model::Entry, JsonError>;

/// Multitext as {"lang": "text", ...}
[[nodiscard]] nlohmann::json multitext_to_json(const model::Multitext& text);

/// Serialize an Entry. Empty collections and absent optionals are omitted.
[[nodiscard]] nlohmann::json entry_to_json(const model::Entry& entry);

/// Deserialize an Entry edited by the host. "id" is required; every other key
/// is optional. Wrong value types are reported, never thrown.
[[nodiscard]] EntryJsonResult entry_from_json(const nlohmann::json& j);

/// Serialize a Document ({"header": {...}, "entries": [...]}).
[[nodiscard]] nlohmann::json document_to_json(const model::Document& document);

/// Serialize a Header.
[[nodiscard]] nlohmann::json header_to_json(const model::Header& header);

}  // namespace liftkit::json
