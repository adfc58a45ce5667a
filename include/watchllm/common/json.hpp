#pragma once

#include "watchllm/common/result.hpp"

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace watchllm::common {

struct JsonMember;

/// Minimal JSON document value. Objects keep insertion order so serialized
/// events list their envelope fields first.
class JsonValue {
public:
  enum class Type { Null, Bool, Int, Double, String, Array, Object };

  JsonValue() = default;
  JsonValue(std::nullptr_t);
  JsonValue(bool value);
  JsonValue(int value);
  JsonValue(long value);
  JsonValue(long long value);
  JsonValue(unsigned value);
  JsonValue(unsigned long value);
  JsonValue(unsigned long long value);
  JsonValue(double value);
  JsonValue(const char *value);
  JsonValue(std::string value);
  JsonValue(std::string_view value);

  JsonValue(const JsonValue &other);
  JsonValue(JsonValue &&other) noexcept;
  JsonValue &operator=(const JsonValue &other);
  JsonValue &operator=(JsonValue &&other) noexcept;
  ~JsonValue();

  [[nodiscard]] static JsonValue array();
  [[nodiscard]] static JsonValue array(std::vector<JsonValue> items);
  [[nodiscard]] static JsonValue object();
  [[nodiscard]] static JsonValue object(std::initializer_list<JsonMember> members);
  [[nodiscard]] static JsonValue object(std::vector<JsonMember> members);
  [[nodiscard]] static JsonValue string_array(const std::vector<std::string> &items);

  [[nodiscard]] Type type() const { return type_; }
  [[nodiscard]] bool is_null() const { return type_ == Type::Null; }
  [[nodiscard]] bool is_bool() const { return type_ == Type::Bool; }
  [[nodiscard]] bool is_number() const { return type_ == Type::Int || type_ == Type::Double; }
  [[nodiscard]] bool is_string() const { return type_ == Type::String; }
  [[nodiscard]] bool is_array() const { return type_ == Type::Array; }
  [[nodiscard]] bool is_object() const { return type_ == Type::Object; }

  // Accessors never throw; a type mismatch yields the fallback.
  [[nodiscard]] bool as_bool(bool fallback = false) const;
  [[nodiscard]] std::int64_t as_int(std::int64_t fallback = 0) const;
  [[nodiscard]] double as_double(double fallback = 0.0) const;
  [[nodiscard]] std::string as_string(const std::string &fallback = "") const;

  [[nodiscard]] const std::vector<JsonValue> &items() const;
  [[nodiscard]] const std::vector<JsonMember> &members() const;
  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] bool empty() const;

  /// Object lookup; nullptr when absent or when this is not an object.
  [[nodiscard]] const JsonValue *find(std::string_view key) const;
  [[nodiscard]] bool contains(std::string_view key) const { return find(key) != nullptr; }
  /// Array lookup; nullptr when out of range or when this is not an array.
  [[nodiscard]] const JsonValue *at(std::size_t index) const;

  /// Insert or replace a member. A null value is promoted to an empty object first.
  JsonValue &set(std::string key, JsonValue value);
  /// Append an item. A null value is promoted to an empty array first.
  JsonValue &push_back(JsonValue value);

  [[nodiscard]] std::string dump() const;
  [[nodiscard]] static Result<JsonValue> parse(std::string_view text);

  friend bool operator==(const JsonValue &lhs, const JsonValue &rhs);

private:
  void dump_to(std::string &out) const;

  Type type_ = Type::Null;
  bool bool_ = false;
  std::int64_t int_ = 0;
  double double_ = 0.0;
  std::string string_;
  std::vector<JsonValue> items_;
  std::vector<JsonMember> members_;
};

struct JsonMember {
  std::string key;
  JsonValue value;
};

bool operator==(const JsonMember &lhs, const JsonMember &rhs);

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(std::string_view value);

} // namespace watchllm::common
