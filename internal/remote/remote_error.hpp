#pragma once

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include <google/protobuf/struct.pb.h>

namespace purchase::remote {

enum class FailureKind {
  kNetwork,         // timeout, unreachable, DNS/TLS, 408
  kAuthentication,  // 401
  kValidation,      // 422
  kServer,          // 5xx
  kMalformed,       // unexpected shape, missing identifier
  kRejected,        // other 4xx (403, 404, ...)
};

const char* ToString(FailureKind kind);

// field -> messages, as reported by a 422 response
using FieldErrors = std::map<std::string, std::vector<std::string>>;

class RemoteError : public std::runtime_error {
 public:
  RemoteError(FailureKind kind, int status, const std::string& msg, FieldErrors field_errors = {})
      : std::runtime_error(msg), kind_(kind), status_(status), field_errors_(std::move(field_errors)) {
  }

  FailureKind Kind() const {
    return kind_;
  }

  // 0 when no response was received
  int Status() const {
    return status_;
  }

  const FieldErrors& Fields() const {
    return field_errors_;
  }

 private:
  FailureKind kind_;
  int         status_;
  FieldErrors field_errors_;
};

// Builds the error for a non-2xx response.
RemoteError ClassifyHttpFailure(int status, const std::string& body);

// "message", "msg", "error.message" or "error", first present.
std::string ExtractMessage(const google::protobuf::Value& body);

// errors: {field: [msg, ...]} or {field: msg}
FieldErrors ExtractFieldErrors(const google::protobuf::Value& body);

// "field: msg" lines joined by "; "
std::string FormatFieldErrors(const FieldErrors& errors);

} // namespace purchase::remote
