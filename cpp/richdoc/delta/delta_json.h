#ifndef RICHDOC_DELTA_DELTA_JSON_H
#define RICHDOC_DELTA_DELTA_JSON_H

#include "richdoc/delta/delta.h"
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

namespace richdoc::delta {

// Wire form: the "ops list" interchange format.
//   [{"insert": "Hello", "attributes": {"bold": true}},
//    {"insert": {"image": "https://..."}},
//    {"retain": 5, "attributes": {"header": null}},
//    {"delete": 2}]
// Attribute keys keep their insertion order, so encode/decode round-trips.

nlohmann::ordered_json deltaToJson(const Delta& delta);
nlohmann::ordered_json attributesToJson(const AttributeMap& attributes);

/**
 * Decode an ops list. Throws std::runtime_error on malformed records.
 */
Delta deltaFromJson(const nlohmann::ordered_json& json);
AttributeMap attributesFromJson(const nlohmann::ordered_json& json);

std::string deltaToJsonString(const Delta& delta, int indent = -1);
Delta deltaFromJsonString(std::string_view text);

} // namespace richdoc::delta

#endif // RICHDOC_DELTA_DELTA_JSON_H
