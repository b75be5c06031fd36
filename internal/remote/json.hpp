#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <google/protobuf/struct.pb.h>

namespace purchase::remote::json {

/*
  Loosely-typed JSON access over google::protobuf::Value.

  Remote payloads are not schema-stable: numbers sometimes arrive as
  strings, keys come and go. The accessors below return nullptr /
  nullopt / defaults instead of throwing.
*/

using google::protobuf::ListValue;
using google::protobuf::Struct;
using google::protobuf::Value;

// false when text is not valid JSON
bool Parse(const std::string& text, Value* out);

std::string Serialize(const Value& value);
std::string Serialize(const Struct& value);

// Member of an object; nullptr when value is not an object, the key is absent or null.
const Value* Field(const Value& value, std::string_view key);
const Value* Field(const Value* value, std::string_view key);

// Walks "a.b.c".
const Value* Path(const Value& value, std::string_view dotted);

bool IsObject(const Value* value);
bool IsList(const Value* value);

std::optional<std::int64_t> AsInt64(const Value* value);
std::optional<double>       AsDouble(const Value* value);
std::optional<std::string>  AsString(const Value* value);
std::optional<bool>         AsBool(const Value* value);

// Convenience forms used by the wire mappers.
std::int64_t Int64Or(const Value& object, std::string_view key, std::int64_t fallback);
double       DoubleOr(const Value& object, std::string_view key, double fallback);
std::string  StringOr(const Value& object, std::string_view key, std::string fallback = {});

// Builders
Value Number(double v);
Value Text(std::string v);
Value Null();
Value Bool(bool v);

} // namespace purchase::remote::json
