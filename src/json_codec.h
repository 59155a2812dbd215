#pragma once
// json_codec.h: Portable OSC structures <-> JSON carried on MQTT.
//
// Relay -> broker:
//   nil -> null, bool -> bool, int32/int64 -> integer, float/double -> number,
//   string -> string, time tag -> ISO-8601 string, blob -> base64 string.
// Broker -> relay:
//   null -> nil, bool -> bool, integer -> int32 (int64 when out of range),
//   other numbers -> float, string -> string. Nested arrays/objects are errors.
//
// Bundle shape: {"timetag": "...", "messages": [{"address", "arguments"}], "bundles": [...]}

#include <nlohmann/json.hpp>

#include <string>

#include "bundle_codec.h"
#include "oscbridge/osc_types.hpp"

namespace oscbridge {

// "immediate" for the immediate time tag, else RFC 3339 UTC with nanoseconds.
std::string format_timetag(TimeTag tag);
TimeTag parse_timetag(const std::string& text);

nlohmann::json argument_to_json(const Argument& arg);
nlohmann::json arguments_to_json(const ArgumentList& args);
ArgumentList arguments_from_json(const nlohmann::json& j);

nlohmann::json bundle_to_json(const ControlBundle& bundle);
ControlBundle bundle_from_json(const nlohmann::json& j);

// Parse an MQTT payload. Throw CodecError on malformed JSON or wrong shape.
ArgumentList parse_arguments(const std::string& payload);
ControlBundle parse_bundle(const std::string& payload);

// Serialise for MQTT. OSC strings are not guaranteed to be UTF-8; invalid
// bytes are written as U+FFFD instead of failing the whole payload.
std::string to_payload(const nlohmann::json& j);

std::string base64_encode(const Blob& data);

}  // namespace oscbridge
