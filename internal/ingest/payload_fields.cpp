#include "payload_fields.hpp"

#include <google/protobuf/util/json_util.h>

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace telemetry::ingest {

namespace {

std::string_view Trim(std::string_view text) {
  constexpr std::string_view kSpace = " \t\r\n";
  const auto                 first  = text.find_first_not_of(kSpace);
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = text.find_last_not_of(kSpace);
  return text.substr(first, last - first + 1);
}

// Plain decimal notation only; strtod alone would also take hex, inf and nan.
bool IsDecimalText(std::string_view text) {
  return !text.empty() && text.find_first_not_of("0123456789+-.eE") == std::string_view::npos &&
         text.find_first_of("0123456789") != std::string_view::npos;
}

std::optional<double> ParseDouble(std::string_view text) {
  const std::string trimmed(Trim(text));
  if (!IsDecimalText(trimmed)) {
    return std::nullopt;
  }

  char*        end    = nullptr;
  errno               = 0;
  const double parsed = std::strtod(trimmed.c_str(), &end);
  if (end == nullptr || *end != '\0' || errno == ERANGE) {
    return std::nullopt;
  }
  return parsed;
}

std::optional<std::int64_t> IntegralValue(double value) {
  if (!std::isfinite(value) || std::trunc(value) != value) {
    return std::nullopt;
  }
  if (value < static_cast<double>(std::numeric_limits<std::int64_t>::min()) ||
      value >= static_cast<double>(std::numeric_limits<std::int64_t>::max())) {
    return std::nullopt;
  }
  return static_cast<std::int64_t>(value);
}

std::optional<std::int64_t> ParseInteger(std::string_view text) {
  const std::string trimmed(Trim(text));
  if (trimmed.empty()) {
    return std::nullopt;
  }

  char* end = nullptr;
  errno     = 0;
  const long long parsed = std::strtoll(trimmed.c_str(), &end, 10);
  if (end != nullptr && *end == '\0' && errno != ERANGE) {
    return static_cast<std::int64_t>(parsed);
  }

  auto as_double = ParseDouble(trimmed);
  if (!as_double) {
    return std::nullopt;
  }
  return IntegralValue(*as_double);
}

} // namespace

std::optional<Fields> ParsePayload(std::string_view payload) {
  Fields fields;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(std::string(payload), &fields, options);
  if (!status.ok()) {
    return std::nullopt;
  }
  return fields;
}

const google::protobuf::Value* FindField(const Fields& fields, const std::string& key) {
  auto it = fields.fields().find(key);
  if (it == fields.fields().end()) {
    return nullptr;
  }
  return &it->second;
}

bool HasField(const Fields& fields, const std::string& key) {
  return FindField(fields, key) != nullptr;
}

std::optional<double> CoerceDouble(const google::protobuf::Value& value) {
  switch (value.kind_case()) {
    case google::protobuf::Value::kNumberValue:
      return value.number_value();
    case google::protobuf::Value::kStringValue:
      return ParseDouble(value.string_value());
    case google::protobuf::Value::kBoolValue:
      return value.bool_value() ? 1.0 : 0.0;
    default:
      return std::nullopt;
  }
}

std::optional<double> CoerceDouble(const google::protobuf::Value* value) {
  if (value == nullptr) {
    return std::nullopt;
  }
  return CoerceDouble(*value);
}

std::optional<std::int64_t> CoerceInteger(const google::protobuf::Value& value) {
  switch (value.kind_case()) {
    case google::protobuf::Value::kNumberValue:
      return IntegralValue(value.number_value());
    case google::protobuf::Value::kStringValue:
      return ParseInteger(value.string_value());
    case google::protobuf::Value::kBoolValue:
      return value.bool_value() ? 1 : 0;
    default:
      return std::nullopt;
  }
}

std::optional<std::int64_t> CoerceInteger(const google::protobuf::Value* value) {
  if (value == nullptr) {
    return std::nullopt;
  }
  return CoerceInteger(*value);
}

} // namespace telemetry::ingest
