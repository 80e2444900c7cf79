#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace google::protobuf {
class Value;
}

namespace vigil::model {

enum class ValueKind : std::uint8_t {
  kNull   = 0,
  kBool   = 1,
  kNumber = 2,
  kString = 3,
  // structured (object or list), held as canonical JSON text
  kJson = 4,
};

std::string_view ToString(ValueKind kind);

/*
  Kind-tagged player state value.

  The wire carries open JSON types; internally every value keeps its kind
  so a number written by one module never reads back as a string.
*/
class StateValue {
 public:
  StateValue() = default;

  static StateValue Null();
  static StateValue Bool(bool v);
  static StateValue Number(double v);
  static StateValue String(std::string v);
  static StateValue Json(std::string canonical_json);

  ValueKind Kind() const {
    return kind_;
  }

  bool               AsBool() const;
  double             AsNumber() const;
  const std::string& AsString() const;
  const std::string& AsJson() const;

  // Storage form: kind column plus text column.
  std::string Encode() const;
  static StateValue Decode(ValueKind kind, std::string_view text);

  static StateValue FromProto(const google::protobuf::Value& value);
  void              ToProto(google::protobuf::Value* out) const;

  bool operator==(const StateValue& other) const = default;

 private:
  ValueKind                                    kind_ = ValueKind::kNull;
  std::variant<std::monostate, bool, double, std::string> value_;
};

}  // namespace vigil::model
