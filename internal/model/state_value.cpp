#include "internal/model/state_value.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <charconv>
#include <cstdio>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace vigil::model {

std::string_view ToString(ValueKind kind) {
  switch (kind) {
    case ValueKind::kBool:
      return "bool";
    case ValueKind::kNumber:
      return "number";
    case ValueKind::kString:
      return "string";
    case ValueKind::kJson:
      return "json";
    case ValueKind::kNull:
    default:
      return "null";
  }
}

StateValue StateValue::Null() {
  return StateValue{};
}

StateValue StateValue::Bool(bool v) {
  StateValue s;
  s.kind_  = ValueKind::kBool;
  s.value_ = v;
  return s;
}

StateValue StateValue::Number(double v) {
  StateValue s;
  s.kind_  = ValueKind::kNumber;
  s.value_ = v;
  return s;
}

StateValue StateValue::String(std::string v) {
  StateValue s;
  s.kind_  = ValueKind::kString;
  s.value_ = std::move(v);
  return s;
}

StateValue StateValue::Json(std::string canonical_json) {
  StateValue s;
  s.kind_  = ValueKind::kJson;
  s.value_ = std::move(canonical_json);
  return s;
}

bool StateValue::AsBool() const {
  if (kind_ != ValueKind::kBool) throw util::InvalidState("state value is " + std::string(ToString(kind_)) + ", not bool");
  return std::get<bool>(value_);
}

double StateValue::AsNumber() const {
  if (kind_ != ValueKind::kNumber) throw util::InvalidState("state value is " + std::string(ToString(kind_)) + ", not number");
  return std::get<double>(value_);
}

const std::string& StateValue::AsString() const {
  if (kind_ != ValueKind::kString) throw util::InvalidState("state value is " + std::string(ToString(kind_)) + ", not string");
  return std::get<std::string>(value_);
}

const std::string& StateValue::AsJson() const {
  if (kind_ != ValueKind::kJson) throw util::InvalidState("state value is " + std::string(ToString(kind_)) + ", not json");
  return std::get<std::string>(value_);
}

std::string StateValue::Encode() const {
  switch (kind_) {
    case ValueKind::kBool:
      return std::get<bool>(value_) ? "true" : "false";
    case ValueKind::kNumber: {
      // %.17g round-trips every double
      char buf[32];
      const int n = std::snprintf(buf, sizeof(buf), "%.17g", std::get<double>(value_));
      return std::string(buf, static_cast<std::size_t>(n));
    }
    case ValueKind::kString:
    case ValueKind::kJson:
      return std::get<std::string>(value_);
    case ValueKind::kNull:
    default:
      return {};
  }
}

StateValue StateValue::Decode(ValueKind kind, std::string_view text) {
  switch (kind) {
    case ValueKind::kBool:
      return Bool(text == "true");
    case ValueKind::kNumber: {
      double v = 0;
      auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), v);
      if (ec != std::errc{}) {
        throw std::runtime_error("corrupt numeric state value: " + std::string(text));
      }
      return Number(v);
    }
    case ValueKind::kString:
      return String(std::string(text));
    case ValueKind::kJson:
      return Json(std::string(text));
    case ValueKind::kNull:
    default:
      return Null();
  }
}

StateValue StateValue::FromProto(const google::protobuf::Value& value) {
  switch (value.kind_case()) {
    case google::protobuf::Value::kBoolValue:
      return Bool(value.bool_value());
    case google::protobuf::Value::kNumberValue:
      return Number(value.number_value());
    case google::protobuf::Value::kStringValue:
      return String(value.string_value());
    case google::protobuf::Value::kStructValue:
    case google::protobuf::Value::kListValue: {
      std::string json;
      auto        status = google::protobuf::util::MessageToJsonString(value, &json);
      if (!status.ok()) {
        throw util::InvalidArgument("state value is not representable as JSON: " + std::string(status.message()));
      }
      return Json(std::move(json));
    }
    case google::protobuf::Value::kNullValue:
    case google::protobuf::Value::KIND_NOT_SET:
    default:
      return Null();
  }
}

void StateValue::ToProto(google::protobuf::Value* out) const {
  switch (kind_) {
    case ValueKind::kBool:
      out->set_bool_value(std::get<bool>(value_));
      return;
    case ValueKind::kNumber:
      out->set_number_value(std::get<double>(value_));
      return;
    case ValueKind::kString:
      out->set_string_value(std::get<std::string>(value_));
      return;
    case ValueKind::kJson: {
      auto status = google::protobuf::util::JsonStringToMessage(std::get<std::string>(value_), out);
      if (!status.ok()) {
        throw std::runtime_error("corrupt json state value: " + std::string(status.message()));
      }
      return;
    }
    case ValueKind::kNull:
    default:
      out->set_null_value(google::protobuf::NULL_VALUE);
      return;
  }
}

}  // namespace vigil::model
