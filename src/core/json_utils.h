#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace basket_engine {

/// 轻量 JSON AST 节点类型。
enum class JsonType {
  kNull,
  kBool,
  kNumber,
  kString,
  kArray,
  kObject,
};

/// 轻量 JSON 值表示（对象/数组为递归结构）。
struct JsonValue {
  JsonType type{JsonType::kNull};
  bool bool_value{false};
  double number_value{0.0};
  std::string string_value;
  std::vector<JsonValue> array_value;
  std::unordered_map<std::string, JsonValue> object_value;
};

/**
 * @brief JSON 解析入口
 *
 * 用于两类输入：WAL 中的决策审计记录，以及语言模型的结构化输出。
 * 后者不可信，任何语法错误都必须返回 `false`，由调用方按分析师失败处理。
 */
bool ParseJson(const std::string& text,
               JsonValue* out_value,
               std::string* out_error);

/**
 * @brief 从模型原始输出中截取第一个完整的 JSON 对象
 *
 * 模型常在 JSON 前后附加说明文字或 ``` 代码块；这里按括号配对（跳过字符串内部）
 * 截取 `{...}`，找不到时返回 `std::nullopt`。
 */
std::optional<std::string> ExtractJsonObject(const std::string& text);

/// 获取对象字段；类型不符或字段不存在返回 `nullptr`。
const JsonValue* JsonObjectField(const JsonValue* value, const std::string& key);
/// 获取数组元素；越界返回 `nullptr`。
const JsonValue* JsonArrayAt(const JsonValue* value, std::size_t index);

std::optional<std::string> JsonAsString(const JsonValue* value);
std::optional<double> JsonAsNumber(const JsonValue* value);
std::optional<bool> JsonAsBool(const JsonValue* value);

// ---- schema 校验辅助：字段缺失/类型错误/越界都写入 out_error ----

bool JsonRequireString(const JsonValue* object,
                       const std::string& key,
                       std::string* out_value,
                       std::string* out_error);
bool JsonRequireNumber(const JsonValue* object,
                       const std::string& key,
                       double min_value,
                       double max_value,
                       double* out_value,
                       std::string* out_error);
/// 读取字符串数组；字段缺失视为空数组，元素非字符串视为错误。
bool JsonReadStringArray(const JsonValue* object,
                         const std::string& key,
                         std::vector<std::string>* out_values,
                         std::string* out_error);
/// 读取 `{token: number}` 对象；字段缺失视为空 map。
bool JsonReadNumberMap(const JsonValue* object,
                       const std::string& key,
                       std::vector<std::pair<std::string, double>>* out_values,
                       std::string* out_error);

/// JSON 字符串转义（含引号）。
std::string JsonQuote(const std::string& text);

/**
 * @brief 流式 JSON 写出器
 *
 * 只负责逗号/冒号与转义，不做结构合法性校验；调用方保证 Begin/End 配对。
 * 输出为单行紧凑格式，适合直接写入 WAL 行。
 */
class JsonWriter {
 public:
  JsonWriter& BeginObject();
  JsonWriter& EndObject();
  JsonWriter& BeginArray();
  JsonWriter& EndArray();
  JsonWriter& Key(const std::string& key);
  JsonWriter& String(const std::string& value);
  JsonWriter& Number(double value);
  JsonWriter& Integer(std::int64_t value);
  JsonWriter& Unsigned(std::uint64_t value);
  JsonWriter& Bool(bool value);
  JsonWriter& Null();

  const std::string& str() const { return out_; }

 private:
  void BeforeValue();

  std::string out_;
  std::vector<bool> first_in_scope_;  ///< 每层作用域是否尚未写入元素。
  bool after_key_{false};
};

}  // namespace basket_engine
