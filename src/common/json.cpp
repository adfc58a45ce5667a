#include "watchllm/common/json.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <utility>

namespace watchllm::common {

namespace {

const std::vector<JsonValue> kEmptyItems;
const std::vector<JsonMember> kEmptyMembers;

constexpr std::size_t kMaxParseDepth = 128;

void append_utf8(std::string &out, const std::uint32_t cp) {
  if (cp < 0x80U) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800U) {
    out.push_back(static_cast<char>(0xC0U | (cp >> 6U)));
    out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
  } else if (cp < 0x10000U) {
    out.push_back(static_cast<char>(0xE0U | (cp >> 12U)));
    out.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
  } else {
    out.push_back(static_cast<char>(0xF0U | (cp >> 18U)));
    out.push_back(static_cast<char>(0x80U | ((cp >> 12U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
  }
}

class Parser {
public:
  explicit Parser(std::string_view text) : text_(text) {}

  Result<JsonValue> parse_document() {
    JsonValue value;
    if (!parse_value(value, 0)) {
      return Result<JsonValue>::failure(error_at());
    }
    skip_ws();
    if (pos_ != text_.size()) {
      error_ = "trailing characters";
      return Result<JsonValue>::failure(error_at());
    }
    return Result<JsonValue>::success(std::move(value));
  }

private:
  std::string error_at() const {
    return "invalid json at offset " + std::to_string(pos_) + ": " + error_;
  }

  void skip_ws() {
    while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_])) != 0) {
      ++pos_;
    }
  }

  bool fail(std::string message) {
    error_ = std::move(message);
    return false;
  }

  bool consume_literal(std::string_view literal) {
    if (text_.substr(pos_, literal.size()) != literal) {
      return fail("unexpected token");
    }
    pos_ += literal.size();
    return true;
  }

  bool parse_value(JsonValue &out, const std::size_t depth) {
    if (depth > kMaxParseDepth) {
      return fail("nesting too deep");
    }
    skip_ws();
    if (pos_ >= text_.size()) {
      return fail("unexpected end of input");
    }
    const char ch = text_[pos_];
    switch (ch) {
    case '{':
      return parse_object(out, depth);
    case '[':
      return parse_array(out, depth);
    case '"': {
      std::string value;
      if (!parse_string(value)) {
        return false;
      }
      out = JsonValue(std::move(value));
      return true;
    }
    case 't':
      out = JsonValue(true);
      return consume_literal("true");
    case 'f':
      out = JsonValue(false);
      return consume_literal("false");
    case 'n':
      out = JsonValue(nullptr);
      return consume_literal("null");
    default:
      return parse_number(out);
    }
  }

  bool parse_object(JsonValue &out, const std::size_t depth) {
    ++pos_;
    out = JsonValue::object();
    skip_ws();
    if (pos_ < text_.size() && text_[pos_] == '}') {
      ++pos_;
      return true;
    }
    while (true) {
      skip_ws();
      if (pos_ >= text_.size() || text_[pos_] != '"') {
        return fail("expected object key");
      }
      std::string key;
      if (!parse_string(key)) {
        return false;
      }
      skip_ws();
      if (pos_ >= text_.size() || text_[pos_] != ':') {
        return fail("expected ':'");
      }
      ++pos_;
      JsonValue value;
      if (!parse_value(value, depth + 1)) {
        return false;
      }
      out.set(std::move(key), std::move(value));
      skip_ws();
      if (pos_ >= text_.size()) {
        return fail("unterminated object");
      }
      if (text_[pos_] == ',') {
        ++pos_;
        continue;
      }
      if (text_[pos_] == '}') {
        ++pos_;
        return true;
      }
      return fail("expected ',' or '}'");
    }
  }

  bool parse_array(JsonValue &out, const std::size_t depth) {
    ++pos_;
    out = JsonValue::array();
    skip_ws();
    if (pos_ < text_.size() && text_[pos_] == ']') {
      ++pos_;
      return true;
    }
    while (true) {
      JsonValue item;
      if (!parse_value(item, depth + 1)) {
        return false;
      }
      out.push_back(std::move(item));
      skip_ws();
      if (pos_ >= text_.size()) {
        return fail("unterminated array");
      }
      if (text_[pos_] == ',') {
        ++pos_;
        continue;
      }
      if (text_[pos_] == ']') {
        ++pos_;
        return true;
      }
      return fail("expected ',' or ']'");
    }
  }

  bool parse_hex4(std::uint32_t &out) {
    if (pos_ + 4 > text_.size()) {
      return fail("truncated unicode escape");
    }
    out = 0;
    for (std::size_t i = 0; i < 4; ++i) {
      const char ch = text_[pos_ + i];
      out <<= 4U;
      if (ch >= '0' && ch <= '9') {
        out |= static_cast<std::uint32_t>(ch - '0');
      } else if (ch >= 'a' && ch <= 'f') {
        out |= static_cast<std::uint32_t>(ch - 'a' + 10);
      } else if (ch >= 'A' && ch <= 'F') {
        out |= static_cast<std::uint32_t>(ch - 'A' + 10);
      } else {
        return fail("invalid unicode escape");
      }
    }
    pos_ += 4;
    return true;
  }

  bool parse_string(std::string &out) {
    ++pos_; // opening quote
    while (pos_ < text_.size()) {
      const char ch = text_[pos_++];
      if (ch == '"') {
        return true;
      }
      if (static_cast<unsigned char>(ch) < 0x20U) {
        return fail("control character in string");
      }
      if (ch != '\\') {
        out.push_back(ch);
        continue;
      }
      if (pos_ >= text_.size()) {
        break;
      }
      const char esc = text_[pos_++];
      switch (esc) {
      case '"':
      case '\\':
      case '/':
        out.push_back(esc);
        break;
      case 'b':
        out.push_back('\b');
        break;
      case 'f':
        out.push_back('\f');
        break;
      case 'n':
        out.push_back('\n');
        break;
      case 'r':
        out.push_back('\r');
        break;
      case 't':
        out.push_back('\t');
        break;
      case 'u': {
        std::uint32_t cp = 0;
        if (!parse_hex4(cp)) {
          return false;
        }
        if (cp >= 0xD800U && cp <= 0xDBFFU && pos_ + 6 <= text_.size() && text_[pos_] == '\\' &&
            text_[pos_ + 1] == 'u') {
          pos_ += 2;
          std::uint32_t low = 0;
          if (!parse_hex4(low)) {
            return false;
          }
          cp = 0x10000U + ((cp - 0xD800U) << 10U) + (low - 0xDC00U);
        }
        append_utf8(out, cp);
        break;
      }
      default:
        return fail("invalid escape");
      }
    }
    return fail("unterminated string");
  }

  bool parse_number(JsonValue &out) {
    const std::size_t start = pos_;
    bool is_float = false;
    if (pos_ < text_.size() && text_[pos_] == '-') {
      ++pos_;
    }
    while (pos_ < text_.size()) {
      const char ch = text_[pos_];
      if (std::isdigit(static_cast<unsigned char>(ch)) != 0) {
        ++pos_;
      } else if (ch == '.' || ch == 'e' || ch == 'E' || ch == '+' || ch == '-') {
        is_float = true;
        ++pos_;
      } else {
        break;
      }
    }
    if (pos_ == start) {
      return fail("unexpected character");
    }
    const std::string token(text_.substr(start, pos_ - start));
    if (!is_float) {
      std::int64_t parsed = 0;
      const auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), parsed);
      if (ec == std::errc() && ptr == token.data() + token.size()) {
        out = JsonValue(static_cast<long long>(parsed));
        return true;
      }
    }
    char *end = nullptr;
    const double parsed = std::strtod(token.c_str(), &end);
    if (end != token.c_str() + token.size()) {
      return fail("invalid number");
    }
    out = JsonValue(parsed);
    return true;
  }

  std::string_view text_;
  std::size_t pos_ = 0;
  std::string error_;
};

} // namespace

JsonValue::JsonValue(std::nullptr_t) {}
JsonValue::JsonValue(const bool value) : type_(Type::Bool), bool_(value) {}
JsonValue::JsonValue(const int value) : type_(Type::Int), int_(value) {}
JsonValue::JsonValue(const long value) : type_(Type::Int), int_(value) {}
JsonValue::JsonValue(const long long value) : type_(Type::Int), int_(value) {}
JsonValue::JsonValue(const unsigned value) : type_(Type::Int), int_(value) {}
JsonValue::JsonValue(const unsigned long value)
    : type_(Type::Int), int_(static_cast<std::int64_t>(value)) {}
JsonValue::JsonValue(const unsigned long long value)
    : type_(Type::Int), int_(static_cast<std::int64_t>(value)) {}
JsonValue::JsonValue(const double value) : type_(Type::Double), double_(value) {}
JsonValue::JsonValue(const char *value) : type_(Type::String), string_(value ? value : "") {}
JsonValue::JsonValue(std::string value) : type_(Type::String), string_(std::move(value)) {}
JsonValue::JsonValue(const std::string_view value) : type_(Type::String), string_(value) {}

JsonValue::JsonValue(const JsonValue &other) = default;
JsonValue::JsonValue(JsonValue &&other) noexcept = default;
JsonValue &JsonValue::operator=(const JsonValue &other) = default;
JsonValue &JsonValue::operator=(JsonValue &&other) noexcept = default;
JsonValue::~JsonValue() = default;

JsonValue JsonValue::array() {
  JsonValue value;
  value.type_ = Type::Array;
  return value;
}

JsonValue JsonValue::array(std::vector<JsonValue> items) {
  JsonValue value = array();
  value.items_ = std::move(items);
  return value;
}

JsonValue JsonValue::object() {
  JsonValue value;
  value.type_ = Type::Object;
  return value;
}

JsonValue JsonValue::object(const std::initializer_list<JsonMember> members) {
  JsonValue value = object();
  for (const auto &member : members) {
    value.set(member.key, member.value);
  }
  return value;
}

JsonValue JsonValue::object(std::vector<JsonMember> members) {
  JsonValue value = object();
  for (auto &member : members) {
    value.set(std::move(member.key), std::move(member.value));
  }
  return value;
}

JsonValue JsonValue::string_array(const std::vector<std::string> &items) {
  JsonValue value = array();
  value.items_.reserve(items.size());
  for (const auto &item : items) {
    value.items_.emplace_back(item);
  }
  return value;
}

bool JsonValue::as_bool(const bool fallback) const { return is_bool() ? bool_ : fallback; }

std::int64_t JsonValue::as_int(const std::int64_t fallback) const {
  if (type_ == Type::Int) {
    return int_;
  }
  if (type_ == Type::Double && std::isfinite(double_)) {
    return static_cast<std::int64_t>(double_);
  }
  return fallback;
}

double JsonValue::as_double(const double fallback) const {
  if (type_ == Type::Double) {
    return double_;
  }
  if (type_ == Type::Int) {
    return static_cast<double>(int_);
  }
  return fallback;
}

std::string JsonValue::as_string(const std::string &fallback) const {
  return is_string() ? string_ : fallback;
}

const std::vector<JsonValue> &JsonValue::items() const {
  return is_array() ? items_ : kEmptyItems;
}

const std::vector<JsonMember> &JsonValue::members() const {
  return is_object() ? members_ : kEmptyMembers;
}

std::size_t JsonValue::size() const {
  if (is_array()) {
    return items_.size();
  }
  if (is_object()) {
    return members_.size();
  }
  return 0;
}

bool JsonValue::empty() const { return size() == 0; }

const JsonValue *JsonValue::find(const std::string_view key) const {
  if (!is_object()) {
    return nullptr;
  }
  for (const auto &member : members_) {
    if (member.key == key) {
      return &member.value;
    }
  }
  return nullptr;
}

const JsonValue *JsonValue::at(const std::size_t index) const {
  if (!is_array() || index >= items_.size()) {
    return nullptr;
  }
  return &items_[index];
}

JsonValue &JsonValue::set(std::string key, JsonValue value) {
  if (is_null()) {
    type_ = Type::Object;
  }
  if (!is_object()) {
    return *this;
  }
  for (auto &member : members_) {
    if (member.key == key) {
      member.value = std::move(value);
      return *this;
    }
  }
  members_.push_back(JsonMember{std::move(key), std::move(value)});
  return *this;
}

JsonValue &JsonValue::push_back(JsonValue value) {
  if (is_null()) {
    type_ = Type::Array;
  }
  if (is_array()) {
    items_.push_back(std::move(value));
  }
  return *this;
}

std::string JsonValue::dump() const {
  std::string out;
  dump_to(out);
  return out;
}

void JsonValue::dump_to(std::string &out) const {
  switch (type_) {
  case Type::Null:
    out += "null";
    break;
  case Type::Bool:
    out += bool_ ? "true" : "false";
    break;
  case Type::Int:
    out += std::to_string(int_);
    break;
  case Type::Double: {
    if (!std::isfinite(double_)) {
      out += "null";
      break;
    }
    char buffer[32];
    const auto [ptr, ec] = std::to_chars(buffer, buffer + sizeof(buffer), double_);
    if (ec != std::errc()) {
      out += "null";
      break;
    }
    std::string_view text(buffer, static_cast<std::size_t>(ptr - buffer));
    out += text;
    if (text.find_first_of(".eE") == std::string_view::npos) {
      out += ".0";
    }
    break;
  }
  case Type::String:
    out.push_back('"');
    out += json_escape(string_);
    out.push_back('"');
    break;
  case Type::Array:
    out.push_back('[');
    for (std::size_t i = 0; i < items_.size(); ++i) {
      if (i > 0) {
        out.push_back(',');
      }
      items_[i].dump_to(out);
    }
    out.push_back(']');
    break;
  case Type::Object:
    out.push_back('{');
    for (std::size_t i = 0; i < members_.size(); ++i) {
      if (i > 0) {
        out.push_back(',');
      }
      out.push_back('"');
      out += json_escape(members_[i].key);
      out += "\":";
      members_[i].value.dump_to(out);
    }
    out.push_back('}');
    break;
  }
}

Result<JsonValue> JsonValue::parse(const std::string_view text) {
  Parser parser(text);
  return parser.parse_document();
}

bool operator==(const JsonValue &lhs, const JsonValue &rhs) {
  if (lhs.is_number() && rhs.is_number()) {
    if (lhs.type_ == JsonValue::Type::Int && rhs.type_ == JsonValue::Type::Int) {
      return lhs.int_ == rhs.int_;
    }
    return lhs.as_double() == rhs.as_double();
  }
  if (lhs.type_ != rhs.type_) {
    return false;
  }
  switch (lhs.type_) {
  case JsonValue::Type::Null:
    return true;
  case JsonValue::Type::Bool:
    return lhs.bool_ == rhs.bool_;
  case JsonValue::Type::String:
    return lhs.string_ == rhs.string_;
  case JsonValue::Type::Array:
    return lhs.items_ == rhs.items_;
  case JsonValue::Type::Object:
    return lhs.members_ == rhs.members_;
  default:
    return false;
  }
}

bool operator==(const JsonMember &lhs, const JsonMember &rhs) {
  return lhs.key == rhs.key && lhs.value == rhs.value;
}

std::string json_escape(const std::string_view value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    case '\b':
      escaped += "\\b";
      break;
    case '\f':
      escaped += "\\f";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20U) {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned>(ch));
        escaped += buffer;
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

} // namespace watchllm::common
