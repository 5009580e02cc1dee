#include "canonical_json.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <cinttypes>
#include <cmath>
#include <cstdio>
#include <vector>

#include "internal/util/errors.hpp"

namespace engram::entity {

namespace {

constexpr double kMaxExactInteger = 9007199254740992.0; // 2^53

void AppendString(std::string& out, std::string_view s) {
  out.push_back('"');
  for (unsigned char c : s) {
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\b':
        out += "\\b";
        break;
      case '\f':
        out += "\\f";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        if (c < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
          out += buf;
        } else {
          out.push_back(static_cast<char>(c));
        }
    }
  }
  out.push_back('"');
}

void AppendNumber(std::string& out, double d) {
  if (!std::isfinite(d)) {
    throw util::ValidationError("json", "non-finite number");
  }

  char buf[32];
  if (std::trunc(d) == d && std::fabs(d) < kMaxExactInteger) {
    std::snprintf(buf, sizeof(buf), "%" PRId64, static_cast<int64_t>(d));
  } else {
    std::snprintf(buf, sizeof(buf), "%.17g", d);
  }
  out += buf;
}

void AppendStruct(std::string& out, const google::protobuf::Struct& s);

void AppendValue(std::string& out, const google::protobuf::Value& v) {
  switch (v.kind_case()) {
    case google::protobuf::Value::kNullValue:
    case google::protobuf::Value::KIND_NOT_SET:
      out += "null";
      break;
    case google::protobuf::Value::kBoolValue:
      out += v.bool_value() ? "true" : "false";
      break;
    case google::protobuf::Value::kNumberValue:
      AppendNumber(out, v.number_value());
      break;
    case google::protobuf::Value::kStringValue:
      AppendString(out, v.string_value());
      break;
    case google::protobuf::Value::kStructValue:
      AppendStruct(out, v.struct_value());
      break;
    case google::protobuf::Value::kListValue: {
      out.push_back('[');
      bool first = true;
      for (const auto& item : v.list_value().values()) {
        if (!first) out.push_back(',');
        first = false;
        AppendValue(out, item);
      }
      out.push_back(']');
      break;
    }
  }
}

void AppendStruct(std::string& out, const google::protobuf::Struct& s) {
  // protobuf maps iterate in unspecified order
  std::vector<const std::string*> keys;
  keys.reserve(s.fields_size());
  for (const auto& [key, _] : s.fields()) keys.push_back(&key);
  std::sort(keys.begin(), keys.end(), [](const std::string* a, const std::string* b) {
    return *a < *b;
  });

  out.push_back('{');
  bool first = true;
  for (const auto* key : keys) {
    if (!first) out.push_back(',');
    first = false;
    AppendString(out, *key);
    out.push_back(':');
    AppendValue(out, s.fields().at(*key));
  }
  out.push_back('}');
}

} // namespace

std::string CanonicalJson(const google::protobuf::Value& value) {
  std::string out;
  AppendValue(out, value);
  return out;
}

std::string CanonicalJson(const google::protobuf::Struct& value) {
  std::string out;
  AppendStruct(out, value);
  return out;
}

google::protobuf::Value ParseJson(std::string_view json) {
  google::protobuf::Value value;
  auto status = google::protobuf::util::JsonStringToMessage(std::string(json), &value);
  if (!status.ok()) {
    throw util::ValidationError("json", status.ToString());
  }
  return value;
}

bool SameValue(const google::protobuf::Value& a, const google::protobuf::Value& b) {
  return CanonicalJson(a) == CanonicalJson(b);
}

} // namespace engram::entity
