#include "remote_error.hpp"

#include "internal/remote/json.hpp"

namespace purchase::remote {

const char* ToString(FailureKind kind) {
  switch (kind) {
    case FailureKind::kNetwork:
      return "network";
    case FailureKind::kAuthentication:
      return "auth";
    case FailureKind::kValidation:
      return "validation";
    case FailureKind::kServer:
      return "server";
    case FailureKind::kMalformed:
      return "malformed";
    case FailureKind::kRejected:
      return "rejected";
  }
  return "unknown";
}

std::string ExtractMessage(const google::protobuf::Value& body) {
  for (const char* key : {"message", "msg"}) {
    if (auto s = json::AsString(json::Field(body, key)); s && !s->empty()) return *s;
  }
  const auto* error = json::Field(body, "error");
  if (json::IsObject(error)) {
    if (auto s = json::AsString(json::Field(*error, "message")); s && !s->empty()) return *s;
  } else if (auto s = json::AsString(error); s && !s->empty()) {
    return *s;
  }
  return {};
}

FieldErrors ExtractFieldErrors(const google::protobuf::Value& body) {
  FieldErrors out;
  const auto* errors = json::Field(body, "errors");
  if (!json::IsObject(errors)) return out;

  for (const auto& [field, messages] : errors->struct_value().fields()) {
    if (messages.kind_case() == google::protobuf::Value::kListValue) {
      for (const auto& m : messages.list_value().values()) {
        if (auto s = json::AsString(&m)) out[field].push_back(*s);
      }
    } else if (auto s = json::AsString(&messages)) {
      out[field].push_back(*s);
    }
  }
  return out;
}

std::string FormatFieldErrors(const FieldErrors& errors) {
  std::string out;
  for (const auto& [field, messages] : errors) {
    for (const auto& message : messages) {
      if (!out.empty()) out += "; ";
      out += field + ": " + message;
    }
  }
  return out;
}

RemoteError ClassifyHttpFailure(int status, const std::string& body) {
  google::protobuf::Value parsed;
  const bool              has_body = json::Parse(body, &parsed);
  std::string             message  = has_body ? ExtractMessage(parsed) : std::string{};

  if (status == 401) {
    return RemoteError(FailureKind::kAuthentication, status, "Authentication failed. Please login again.");
  }
  if (status == 422) {
    auto fields = has_body ? ExtractFieldErrors(parsed) : FieldErrors{};
    if (!fields.empty()) {
      message = FormatFieldErrors(fields);
    } else if (message.empty()) {
      message = "Validation failed";
    }
    return RemoteError(FailureKind::kValidation, status, message, std::move(fields));
  }
  if (status == 408) {
    return RemoteError(FailureKind::kNetwork, status, message.empty() ? "Request timed out" : message);
  }
  if (status >= 500) {
    return RemoteError(FailureKind::kServer, status, message.empty() ? "Server error (" + std::to_string(status) + ")" : message);
  }
  if (status == 403 && message.empty()) message = "Permission denied";
  if (status == 404 && message.empty()) message = "Resource not found";
  if (message.empty()) message = "Request failed (" + std::to_string(status) + ")";
  return RemoteError(FailureKind::kRejected, status, message);
}

} // namespace purchase::remote
