#include "core/json_utils.h"

#include <cctype>
#include <cmath>
#include <exception>
#include <iomanip>
#include <sstream>

namespace basket_engine {

namespace {

// 递归下降解析器；深度上限防止恶意/异常模型输出导致栈溢出。
class JsonParser {
 public:
  explicit JsonParser(const std::string& text) : text_(text) {}

  bool Parse(JsonValue* out_value, std::string* out_error) {
    if (out_value == nullptr) {
      if (out_error != nullptr) {
        *out_error = "out_value 为空";
      }
      return false;
    }
    SkipWhitespace();
    if (!ParseValue(out_value, 0, out_error)) {
      return false;
    }
    SkipWhitespace();
    if (cursor_ != text_.size()) {
      return Fail("JSON 尾部存在多余字符", out_error);
    }
    return true;
  }

 private:
  static constexpr int kMaxDepth = 64;

  bool ParseValue(JsonValue* out_value, int depth, std::string* out_error) {
    if (depth > kMaxDepth) {
      return Fail("JSON 嵌套层级过深", out_error);
    }
    if (cursor_ >= text_.size()) {
      return Fail("JSON 意外结束", out_error);
    }
    switch (text_[cursor_]) {
      case '{':
        return ParseObject(out_value, depth, out_error);
      case '[':
        return ParseArray(out_value, depth, out_error);
      case '"':
        out_value->type = JsonType::kString;
        return ParseString(&out_value->string_value, out_error);
      case 't':
      case 'f':
        out_value->type = JsonType::kBool;
        if (MatchLiteral("true")) {
          out_value->bool_value = true;
          return true;
        }
        if (MatchLiteral("false")) {
          out_value->bool_value = false;
          return true;
        }
        return Fail("JSON 布尔值解析失败", out_error);
      case 'n':
        out_value->type = JsonType::kNull;
        if (MatchLiteral("null")) {
          return true;
        }
        return Fail("JSON null 解析失败", out_error);
      default:
        break;
    }
    const char ch = text_[cursor_];
    if (ch == '-' || std::isdigit(static_cast<unsigned char>(ch)) != 0) {
      out_value->type = JsonType::kNumber;
      return ParseNumber(&out_value->number_value, out_error);
    }
    return Fail("JSON 非法值起始字符", out_error);
  }

  bool ParseObject(JsonValue* out_value, int depth, std::string* out_error) {
    ++cursor_;  // '{'
    out_value->type = JsonType::kObject;
    out_value->object_value.clear();
    SkipWhitespace();
    if (ConsumeIf('}')) {
      return true;
    }
    while (cursor_ < text_.size()) {
      std::string key;
      if (!ParseString(&key, out_error)) {
        return false;
      }
      SkipWhitespace();
      if (!Expect(':', out_error)) {
        return false;
      }
      SkipWhitespace();
      JsonValue value;
      if (!ParseValue(&value, depth + 1, out_error)) {
        return false;
      }
      out_value->object_value[key] = std::move(value);
      SkipWhitespace();
      if (ConsumeIf('}')) {
        return true;
      }
      if (!Expect(',', out_error)) {
        return false;
      }
      SkipWhitespace();
    }
    return Fail("JSON 对象缺少结束符", out_error);
  }

  bool ParseArray(JsonValue* out_value, int depth, std::string* out_error) {
    ++cursor_;  // '['
    out_value->type = JsonType::kArray;
    out_value->array_value.clear();
    SkipWhitespace();
    if (ConsumeIf(']')) {
      return true;
    }
    while (cursor_ < text_.size()) {
      JsonValue item;
      if (!ParseValue(&item, depth + 1, out_error)) {
        return false;
      }
      out_value->array_value.push_back(std::move(item));
      SkipWhitespace();
      if (ConsumeIf(']')) {
        return true;
      }
      if (!Expect(',', out_error)) {
        return false;
      }
      SkipWhitespace();
    }
    return Fail("JSON 数组缺少结束符", out_error);
  }

  static void AppendUtf8(unsigned int codepoint, std::string* out) {
    if (codepoint <= 0x7F) {
      out->push_back(static_cast<char>(codepoint));
    } else if (codepoint <= 0x7FF) {
      out->push_back(static_cast<char>(0xC0 | (codepoint >> 6U)));
      out->push_back(static_cast<char>(0x80 | (codepoint & 0x3FU)));
    } else if (codepoint <= 0xFFFF) {
      out->push_back(static_cast<char>(0xE0 | (codepoint >> 12U)));
      out->push_back(static_cast<char>(0x80 | ((codepoint >> 6U) & 0x3FU)));
      out->push_back(static_cast<char>(0x80 | (codepoint & 0x3FU)));
    } else {
      out->push_back(static_cast<char>(0xF0 | (codepoint >> 18U)));
      out->push_back(static_cast<char>(0x80 | ((codepoint >> 12U) & 0x3FU)));
      out->push_back(static_cast<char>(0x80 | ((codepoint >> 6U) & 0x3FU)));
      out->push_back(static_cast<char>(0x80 | (codepoint & 0x3FU)));
    }
  }

  bool ReadHex4(unsigned int* out_value, std::string* out_error) {
    if (cursor_ + 4 > text_.size()) {
      return Fail("JSON unicode 转义不完整", out_error);
    }
    unsigned int value = 0;
    for (int i = 0; i < 4; ++i) {
      const char hex = text_[cursor_++];
      value <<= 4U;
      if (hex >= '0' && hex <= '9') {
        value += static_cast<unsigned int>(hex - '0');
      } else if (hex >= 'a' && hex <= 'f') {
        value += static_cast<unsigned int>(hex - 'a' + 10);
      } else if (hex >= 'A' && hex <= 'F') {
        value += static_cast<unsigned int>(hex - 'A' + 10);
      } else {
        return Fail("JSON unicode 转义非法", out_error);
      }
    }
    *out_value = value;
    return true;
  }

  bool ParseString(std::string* out, std::string* out_error) {
    if (!Expect('"', out_error)) {
      return false;
    }
    out->clear();
    while (cursor_ < text_.size()) {
      const char ch = text_[cursor_++];
      if (ch == '"') {
        return true;
      }
      if (ch != '\\') {
        out->push_back(ch);
        continue;
      }
      if (cursor_ >= text_.size()) {
        return Fail("JSON 字符串转义不完整", out_error);
      }
      const char esc = text_[cursor_++];
      switch (esc) {
        case '"':
        case '\\':
        case '/':
          out->push_back(esc);
          break;
        case 'b':
          out->push_back('\b');
          break;
        case 'f':
          out->push_back('\f');
          break;
        case 'n':
          out->push_back('\n');
          break;
        case 'r':
          out->push_back('\r');
          break;
        case 't':
          out->push_back('\t');
          break;
        case 'u': {
          unsigned int codepoint = 0;
          if (!ReadHex4(&codepoint, out_error)) {
            return false;
          }
          // 代理对：高位 D800-DBFF 后必须紧跟 \uDC00-DFFF。
          if (codepoint >= 0xD800 && codepoint <= 0xDBFF) {
            if (!(ConsumeIf('\\') && ConsumeIf('u'))) {
              return Fail("JSON 代理对缺少低位", out_error);
            }
            unsigned int low = 0;
            if (!ReadHex4(&low, out_error)) {
              return false;
            }
            if (low < 0xDC00 || low > 0xDFFF) {
              return Fail("JSON 代理对低位非法", out_error);
            }
            codepoint = 0x10000 + ((codepoint - 0xD800) << 10U) + (low - 0xDC00);
          }
          AppendUtf8(codepoint, out);
          break;
        }
        default:
          return Fail("JSON 字符串转义字符非法", out_error);
      }
    }
    return Fail("JSON 字符串缺少结束引号", out_error);
  }

  bool ParseNumber(double* out_value, std::string* out_error) {
    const std::size_t begin = cursor_;
    ConsumeIf('-');
    if (!ConsumeDigits()) {
      return Fail("JSON 数字解析失败", out_error);
    }
    if (ConsumeIf('.') && !ConsumeDigits()) {
      return Fail("JSON 小数解析失败", out_error);
    }
    if (ConsumeIf('e') || ConsumeIf('E')) {
      if (!ConsumeIf('+')) {
        ConsumeIf('-');
      }
      if (!ConsumeDigits()) {
        return Fail("JSON 指数解析失败", out_error);
      }
    }
    try {
      *out_value = std::stod(text_.substr(begin, cursor_ - begin));
    } catch (const std::exception&) {
      return Fail("JSON 数字转换失败", out_error);
    }
    return true;
  }

  bool ConsumeDigits() {
    const std::size_t begin = cursor_;
    while (cursor_ < text_.size() &&
           std::isdigit(static_cast<unsigned char>(text_[cursor_])) != 0) {
      ++cursor_;
    }
    return cursor_ > begin;
  }

  bool MatchLiteral(const char* literal) {
    const std::size_t len = std::char_traits<char>::length(literal);
    if (text_.compare(cursor_, len, literal) != 0) {
      return false;
    }
    cursor_ += len;
    return true;
  }

  bool Expect(char ch, std::string* out_error) {
    if (cursor_ >= text_.size() || text_[cursor_] != ch) {
      return Fail(std::string("JSON 期望字符 '") + ch + "'", out_error);
    }
    ++cursor_;
    return true;
  }

  bool ConsumeIf(char ch) {
    if (cursor_ < text_.size() && text_[cursor_] == ch) {
      ++cursor_;
      return true;
    }
    return false;
  }

  void SkipWhitespace() {
    while (cursor_ < text_.size() &&
           std::isspace(static_cast<unsigned char>(text_[cursor_])) != 0) {
      ++cursor_;
    }
  }

  bool Fail(const std::string& message, std::string* out_error) const {
    if (out_error != nullptr) {
      *out_error = message + "，offset=" + std::to_string(cursor_);
    }
    return false;
  }

  const std::string& text_;
  std::size_t cursor_{0};
};

void SetError(std::string* out_error, const std::string& message) {
  if (out_error != nullptr) {
    *out_error = message;
  }
}

}  // namespace

bool ParseJson(const std::string& text,
               JsonValue* out_value,
               std::string* out_error) {
  JsonParser parser(text);
  return parser.Parse(out_value, out_error);
}

std::optional<std::string> ExtractJsonObject(const std::string& text) {
  const std::size_t begin = text.find('{');
  if (begin == std::string::npos) {
    return std::nullopt;
  }
  int depth = 0;
  bool in_string = false;
  bool escaped = false;
  for (std::size_t i = begin; i < text.size(); ++i) {
    const char ch = text[i];
    if (in_string) {
      if (escaped) {
        escaped = false;
      } else if (ch == '\\') {
        escaped = true;
      } else if (ch == '"') {
        in_string = false;
      }
      continue;
    }
    if (ch == '"') {
      in_string = true;
    } else if (ch == '{') {
      ++depth;
    } else if (ch == '}') {
      --depth;
      if (depth == 0) {
        return text.substr(begin, i - begin + 1);
      }
    }
  }
  return std::nullopt;
}

const JsonValue* JsonObjectField(const JsonValue* value, const std::string& key) {
  if (value == nullptr || value->type != JsonType::kObject) {
    return nullptr;
  }
  const auto it = value->object_value.find(key);
  if (it == value->object_value.end()) {
    return nullptr;
  }
  return &it->second;
}

const JsonValue* JsonArrayAt(const JsonValue* value, std::size_t index) {
  if (value == nullptr || value->type != JsonType::kArray ||
      index >= value->array_value.size()) {
    return nullptr;
  }
  return &value->array_value[index];
}

std::optional<std::string> JsonAsString(const JsonValue* value) {
  if (value == nullptr || value->type != JsonType::kString) {
    return std::nullopt;
  }
  return value->string_value;
}

std::optional<double> JsonAsNumber(const JsonValue* value) {
  if (value == nullptr) {
    return std::nullopt;
  }
  if (value->type == JsonType::kNumber) {
    return value->number_value;
  }
  // 模型偶尔把数值输出为字符串 "0.72"，这里宽容接受。
  if (value->type == JsonType::kString) {
    try {
      std::size_t consumed = 0;
      const double parsed = std::stod(value->string_value, &consumed);
      if (consumed == value->string_value.size()) {
        return parsed;
      }
    } catch (const std::exception&) {
      return std::nullopt;
    }
  }
  return std::nullopt;
}

std::optional<bool> JsonAsBool(const JsonValue* value) {
  if (value == nullptr) {
    return std::nullopt;
  }
  if (value->type == JsonType::kBool) {
    return value->bool_value;
  }
  if (value->type == JsonType::kString) {
    if (value->string_value == "true") {
      return true;
    }
    if (value->string_value == "false") {
      return false;
    }
  }
  return std::nullopt;
}

bool JsonRequireString(const JsonValue* object,
                       const std::string& key,
                       std::string* out_value,
                       std::string* out_error) {
  const auto text = JsonAsString(JsonObjectField(object, key));
  if (!text.has_value()) {
    SetError(out_error, "字段缺失或非字符串: " + key);
    return false;
  }
  if (out_value != nullptr) {
    *out_value = *text;
  }
  return true;
}

bool JsonRequireNumber(const JsonValue* object,
                       const std::string& key,
                       double min_value,
                       double max_value,
                       double* out_value,
                       std::string* out_error) {
  const auto number = JsonAsNumber(JsonObjectField(object, key));
  if (!number.has_value() || !std::isfinite(*number)) {
    SetError(out_error, "字段缺失或非数值: " + key);
    return false;
  }
  if (*number < min_value || *number > max_value) {
    std::ostringstream oss;
    oss << "字段越界: " << key << "=" << *number << " 不在 [" << min_value
        << ", " << max_value << "]";
    SetError(out_error, oss.str());
    return false;
  }
  if (out_value != nullptr) {
    *out_value = *number;
  }
  return true;
}

bool JsonReadStringArray(const JsonValue* object,
                         const std::string& key,
                         std::vector<std::string>* out_values,
                         std::string* out_error) {
  if (out_values == nullptr) {
    SetError(out_error, "out_values 为空");
    return false;
  }
  out_values->clear();
  const JsonValue* array = JsonObjectField(object, key);
  if (array == nullptr || array->type == JsonType::kNull) {
    return true;
  }
  if (array->type != JsonType::kArray) {
    SetError(out_error, "字段非数组: " + key);
    return false;
  }
  for (const auto& item : array->array_value) {
    if (item.type != JsonType::kString) {
      SetError(out_error, "数组元素非字符串: " + key);
      return false;
    }
    out_values->push_back(item.string_value);
  }
  return true;
}

bool JsonReadNumberMap(const JsonValue* object,
                       const std::string& key,
                       std::vector<std::pair<std::string, double>>* out_values,
                       std::string* out_error) {
  if (out_values == nullptr) {
    SetError(out_error, "out_values 为空");
    return false;
  }
  out_values->clear();
  const JsonValue* map = JsonObjectField(object, key);
  if (map == nullptr || map->type == JsonType::kNull) {
    return true;
  }
  if (map->type != JsonType::kObject) {
    SetError(out_error, "字段非对象: " + key);
    return false;
  }
  for (const auto& [name, value] : map->object_value) {
    const auto number = JsonAsNumber(&value);
    if (!number.has_value() || !std::isfinite(*number)) {
      SetError(out_error, key + "." + name + " 非数值");
      return false;
    }
    out_values->emplace_back(name, *number);
  }
  return true;
}

std::string JsonQuote(const std::string& text) {
  std::string out;
  out.reserve(text.size() + 2);
  out.push_back('"');
  for (const char ch : text) {
    switch (ch) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
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
      case '\b':
        out += "\\b";
        break;
      case '\f':
        out += "\\f";
        break;
      default:
        if (static_cast<unsigned char>(ch) < 0x20) {
          std::ostringstream oss;
          oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
              << static_cast<int>(static_cast<unsigned char>(ch));
          out += oss.str();
        } else {
          out.push_back(ch);
        }
    }
  }
  out.push_back('"');
  return out;
}

void JsonWriter::BeforeValue() {
  if (after_key_) {
    after_key_ = false;
    return;
  }
  if (!first_in_scope_.empty()) {
    if (!first_in_scope_.back()) {
      out_.push_back(',');
    }
    first_in_scope_.back() = false;
  }
}

JsonWriter& JsonWriter::BeginObject() {
  BeforeValue();
  out_.push_back('{');
  first_in_scope_.push_back(true);
  return *this;
}

JsonWriter& JsonWriter::EndObject() {
  out_.push_back('}');
  if (!first_in_scope_.empty()) {
    first_in_scope_.pop_back();
  }
  return *this;
}

JsonWriter& JsonWriter::BeginArray() {
  BeforeValue();
  out_.push_back('[');
  first_in_scope_.push_back(true);
  return *this;
}

JsonWriter& JsonWriter::EndArray() {
  out_.push_back(']');
  if (!first_in_scope_.empty()) {
    first_in_scope_.pop_back();
  }
  return *this;
}

JsonWriter& JsonWriter::Key(const std::string& key) {
  BeforeValue();
  out_ += JsonQuote(key);
  out_.push_back(':');
  after_key_ = true;
  return *this;
}

JsonWriter& JsonWriter::String(const std::string& value) {
  BeforeValue();
  out_ += JsonQuote(value);
  return *this;
}

JsonWriter& JsonWriter::Number(double value) {
  BeforeValue();
  if (!std::isfinite(value)) {
    out_ += "null";
    return *this;
  }
  std::ostringstream oss;
  oss << std::setprecision(17) << value;
  out_ += oss.str();
  return *this;
}

JsonWriter& JsonWriter::Integer(std::int64_t value) {
  BeforeValue();
  out_ += std::to_string(value);
  return *this;
}

JsonWriter& JsonWriter::Unsigned(std::uint64_t value) {
  BeforeValue();
  out_ += std::to_string(value);
  return *this;
}

JsonWriter& JsonWriter::Bool(bool value) {
  BeforeValue();
  out_ += value ? "true" : "false";
  return *this;
}

JsonWriter& JsonWriter::Null() {
  BeforeValue();
  out_ += "null";
  return *this;
}

}  // namespace basket_engine
