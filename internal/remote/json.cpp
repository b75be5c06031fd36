#include "json.hpp"

#include <google/protobuf/util/json_util.h>

#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace purchase::remote::json {

bool Parse(const std::string& text, Value* out) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  return google::protobuf::util::JsonStringToMessage(text, out, options).ok();
}

std::string Serialize(const Value& value) {
  std::string out;
  if (!google::protobuf::util::MessageToJsonString(value, &out).ok()) return "null";
  return out;
}

std::string Serialize(const Struct& value) {
  std::string out;
  if (!google::protobuf::util::MessageToJsonString(value, &out).ok()) return "{}";
  return out;
}

const Value* Field(const Value& value, std::string_view key) {
  if (value.kind_case() != Value::kStructValue) return nullptr;
  const auto& fields = value.struct_value().fields();
  auto        it     = fields.find(std::string(key));
  if (it == fields.end() || it->second.kind_case() == Value::kNullValue) return nullptr;
  return &it->second;
}

const Value* Field(const Value* value, std::string_view key) {
  return value ? Field(*value, key) : nullptr;
}

const Value* Path(const Value& value, std::string_view dotted) {
  const Value* current = &value;
  while (current && !dotted.empty()) {
    const auto dot = dotted.find('.');
    current        = Field(*current, dotted.substr(0, dot));
    if (dot == std::string_view::npos) break;
    dotted.remove_prefix(dot + 1);
  }
  return current;
}

bool IsObject(const Value* value) {
  return value && value->kind_case() == Value::kStructValue;
}

bool IsList(const Value* value) {
  return value && value->kind_case() == Value::kListValue;
}

std::optional<std::int64_t> AsInt64(const Value* value) {
  if (!value) return std::nullopt;
  if (value->kind_case() == Value::kNumberValue) {
    const double d = value->number_value();
    // 2^63; anything at or past it does not fit, and ids are whole numbers
    constexpr double kLimit = 9223372036854775808.0;
    if (!std::isfinite(d) || std::fabs(d) >= kLimit || std::trunc(d) != d) return std::nullopt;
    return static_cast<std::int64_t>(d);
  }
  if (value->kind_case() == Value::kStringValue) {
    const auto& s = value->string_value();
    if (s.empty()) return std::nullopt;
    char* end = nullptr;
    errno     = 0;
    const long long parsed = std::strtoll(s.c_str(), &end, 10);
    if (errno != 0 || !end || *end != '\0') return std::nullopt;
    return static_cast<std::int64_t>(parsed);
  }
  return std::nullopt;
}

std::optional<double> AsDouble(const Value* value) {
  if (!value) return std::nullopt;
  if (value->kind_case() == Value::kNumberValue) return value->number_value();
  if (value->kind_case() == Value::kStringValue) {
    const auto& s = value->string_value();
    if (s.empty()) return std::nullopt;
    char*        end    = nullptr;
    const double parsed = std::strtod(s.c_str(), &end);
    if (!end || *end != '\0') return std::nullopt;
    return parsed;
  }
  return std::nullopt;
}

std::optional<std::string> AsString(const Value* value) {
  if (!value) return std::nullopt;
  switch (value->kind_case()) {
    case Value::kStringValue:
      return value->string_value();
    case Value::kNumberValue: {
      const double d = value->number_value();
      if (std::floor(d) == d && std::fabs(d) < 9.0e15) return std::to_string(static_cast<long long>(d));
      char buf[32];
      std::snprintf(buf, sizeof(buf), "%g", d);
      return std::string(buf);
    }
    case Value::kBoolValue:
      return std::string(value->bool_value() ? "true" : "false");
    default:
      return std::nullopt;
  }
}

std::optional<bool> AsBool(const Value* value) {
  if (!value) return std::nullopt;
  if (value->kind_case() == Value::kBoolValue) return value->bool_value();
  if (value->kind_case() == Value::kNumberValue) return value->number_value() != 0;
  if (value->kind_case() == Value::kStringValue) return value->string_value() == "true" || value->string_value() == "1";
  return std::nullopt;
}

std::int64_t Int64Or(const Value& object, std::string_view key, std::int64_t fallback) {
  return AsInt64(Field(object, key)).value_or(fallback);
}

double DoubleOr(const Value& object, std::string_view key, double fallback) {
  return AsDouble(Field(object, key)).value_or(fallback);
}

std::string StringOr(const Value& object, std::string_view key, std::string fallback) {
  auto s = AsString(Field(object, key));
  return s ? *s : std::move(fallback);
}

Value Number(double v) {
  Value out;
  out.set_number_value(v);
  return out;
}

Value Text(std::string v) {
  Value out;
  out.set_string_value(std::move(v));
  return out;
}

Value Null() {
  Value out;
  out.set_null_value(google::protobuf::NULL_VALUE);
  return out;
}

Value Bool(bool v) {
  Value out;
  out.set_bool_value(v);
  return out;
}

} // namespace purchase::remote::json
