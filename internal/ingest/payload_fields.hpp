#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <google/protobuf/struct.pb.h>

namespace telemetry::ingest {

/*
  Inbound payloads are JSON objects parsed into google.protobuf.Struct.
  Nothing about field presence or type is trusted: every read goes through
  the optional-returning helpers below.
*/
using Fields = google::protobuf::Struct;

// nullopt when the text is not a JSON object.
std::optional<Fields> ParsePayload(std::string_view payload);

const google::protobuf::Value* FindField(const Fields& fields, const std::string& key);

bool HasField(const Fields& fields, const std::string& key);

// Numbers, numeric strings and booleans; anything else is absent.
std::optional<double> CoerceDouble(const google::protobuf::Value& value);
std::optional<double> CoerceDouble(const google::protobuf::Value* value);

// Integers, integer-valued numbers, and strings holding either.
std::optional<std::int64_t> CoerceInteger(const google::protobuf::Value& value);
std::optional<std::int64_t> CoerceInteger(const google::protobuf::Value* value);

} // namespace telemetry::ingest
