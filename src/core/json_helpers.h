/**
 * @file json_helpers.h
 * @brief JSON writing and parsing for analysis records and configuration.
 */

#pragma once

#include <cmath>
#include <cstdint>
#include <iomanip>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace chordgrid {
namespace json {

/**
 * @brief Escapes special characters in a string for JSON output.
 *
 * Handles `"`, `\`, newline, carriage return and tab.
 *
 * @param s The input string to escape.
 * @return The escaped string safe for JSON output.
 */
inline std::string escape(const std::string& s) {
  std::string result;
  result.reserve(s.size());
  for (char c : s) {
    switch (c) {
      case '"':
        result += "\\\"";
        break;
      case '\\':
        result += "\\\\";
        break;
      case '\n':
        result += "\\n";
        break;
      case '\r':
        result += "\\r";
        break;
      case '\t':
        result += "\\t";
        break;
      default:
        result += c;
        break;
    }
  }
  return result;
}

/**
 * @brief Shortest decimal text that parses back to the same double.
 *
 * Beat timestamps must survive a save/load cycle unchanged, so precision is
 * raised until std::stod reproduces the value. Non-finite values become null.
 *
 * @param v Value to format.
 * @return JSON number text.
 */
inline std::string formatDouble(double v) {
  if (!std::isfinite(v)) return "null";
  std::string text;
  for (int precision = 15; precision <= 17; ++precision) {
    std::ostringstream oss;
    oss << std::setprecision(precision) << v;
    text = oss.str();
    if (std::stod(text) == v) break;
  }
  return text;
}

/**
 * @brief A streaming JSON writer with optional pretty-print support.
 *
 * @example
 * ```cpp
 * std::ostringstream oss;
 * json::Writer w(oss);
 * w.beginObject()
 *     .write("recording_id", "abc")
 *     .beginArray("beats").value(0.5).value(1.0).endArray()
 * .endObject();
 * // Output: {"recording_id":"abc","beats":[0.5,1]}
 * ```
 */
class Writer {
 public:
  /**
   * @brief Constructs a JSON writer.
   * @param os The output stream to write JSON to.
   * @param pretty If true, output is formatted with newlines and indentation.
   * @param indent_size Number of spaces per indentation level (default: 2).
   */
  explicit Writer(std::ostream& os, bool pretty = false, int indent_size = 2)
      : os_(os), pretty_(pretty), indent_size_(indent_size) {}

  /**
   * @brief Begins a JSON object.
   * @param key Optional key name when nesting inside another object.
   * @return Reference to this writer for method chaining.
   */
  Writer& beginObject(const char* key = nullptr) {
    writeCommaIfNeeded();
    if (key) {
      writeKey(key);
    } else if (depth_ > 0) {
      writeNewlineIndent();
    }
    os_ << "{";
    pushContext();
    return *this;
  }

  /// @brief Ends the current JSON object.
  Writer& endObject() {
    popContext();
    writeNewlineIndent();
    os_ << "}";
    return *this;
  }

  /**
   * @brief Begins a JSON array property.
   * @param key Key name inside the current object.
   * @return Reference to this writer for method chaining.
   */
  Writer& beginArray(const char* key) {
    writeCommaIfNeeded();
    writeKey(key);
    os_ << "[";
    pushContext();
    return *this;
  }

  /// @brief Ends the current JSON array.
  Writer& endArray() {
    popContext();
    writeNewlineIndent();
    os_ << "]";
    return *this;
  }

  /**
   * @brief Writes an integer key-value pair.
   * @tparam T Integral type.
   */
  template <typename T, std::enable_if_t<std::is_integral_v<T>, int> = 0>
  Writer& write(const char* key, T value) {
    writeCommaIfNeeded();
    writeKey(key);
    os_ << value;
    return *this;
  }

  /// @brief Writes a floating-point key-value pair (round-trip precision).
  Writer& write(const char* key, double value) {
    writeCommaIfNeeded();
    writeKey(key);
    os_ << formatDouble(value);
    return *this;
  }

  /// @brief Writes a float key-value pair.
  Writer& write(const char* key, float value) { return write(key, static_cast<double>(value)); }

  /// @brief Writes a boolean key-value pair.
  Writer& write(const char* key, bool value) {
    writeCommaIfNeeded();
    writeKey(key);
    os_ << (value ? "true" : "false");
    return *this;
  }

  /// @brief Writes a string key-value pair (escaped and quoted).
  Writer& write(const char* key, const std::string& value) {
    writeCommaIfNeeded();
    writeKey(key);
    os_ << "\"" << escape(value) << "\"";
    return *this;
  }

  /// @brief Writes a string key-value pair (C-string overload).
  Writer& write(const char* key, const char* value) { return write(key, std::string(value)); }

  /// @brief Writes `"key": null`.
  Writer& writeNull(const char* key) {
    writeCommaIfNeeded();
    writeKey(key);
    os_ << "null";
    return *this;
  }

  /// @brief Writes a floating-point value to the current array.
  Writer& value(double v) {
    writeCommaIfNeeded();
    writeNewlineIndent();
    os_ << formatDouble(v);
    return *this;
  }

  /// @brief Writes a string value to the current array.
  Writer& value(const std::string& v) {
    writeCommaIfNeeded();
    writeNewlineIndent();
    os_ << "\"" << escape(v) << "\"";
    return *this;
  }

 private:
  void writeKey(const char* key) {
    writeNewlineIndent();
    os_ << "\"" << escape(key) << "\":";
    if (pretty_) os_ << " ";
  }

  void writeCommaIfNeeded() {
    if (!first_) os_ << ",";
    first_ = false;
  }

  void writeNewlineIndent() {
    if (pretty_) {
      os_ << "\n";
      for (int i = 0; i < depth_ * indent_size_; ++i) os_ << " ";
    }
  }

  void pushContext() {
    ++depth_;
    first_ = true;
  }

  void popContext() {
    --depth_;
    first_ = false;
  }

  std::ostream& os_;
  bool pretty_;
  int indent_size_;
  int depth_ = 0;
  bool first_ = true;
};

// ============================================================================
// Parser
// ============================================================================

/**
 * @brief Lenient JSON reader for analysis records and configuration.
 *
 * Parses one object or array. Scalars are kept as text and converted on
 * access; nested objects and arrays are kept as raw JSON and parsed on
 * demand with getObject() / getArray(). Malformed input yields an empty
 * parser; conversion failures return the supplied default.
 *
 * @example
 * ```cpp
 * json::Parser p(R"({"schema_version":2,"beats":[0.5,1.0],"bpm":null})");
 * p.getInt("schema_version");   // 2
 * p.getDoubleArray("beats");    // {0.5, 1.0}
 * p.isNull("bpm");              // true
 * ```
 */
class Parser {
 public:
  /// @brief Constructs a parser over a JSON object (or a nested array).
  explicit Parser(const std::string& json) : json_(json) {
    size_t pos = 0;
    skipWhitespace(pos);
    if (pos < json_.size() && json_[pos] == '[') {
      parseArray(pos);
    } else {
      parseObject(pos);
    }
  }

  /// @brief Check if a key exists.
  bool has(const std::string& key) const { return values_.find(key) != values_.end(); }

  /// @brief True if key exists and holds JSON null.
  bool isNull(const std::string& key) const {
    auto it = values_.find(key);
    return it != values_.end() && !it->second.quoted && it->second.text == "null";
  }

  /// @brief True if key exists and holds a quoted string.
  bool isString(const std::string& key) const {
    auto it = values_.find(key);
    return it != values_.end() && it->second.quoted;
  }

  /// @brief True if key exists and holds an object.
  bool isObject(const std::string& key) const {
    auto it = values_.find(key);
    return it != values_.end() && !it->second.quoted && !it->second.text.empty() &&
           it->second.text[0] == '{';
  }

  /// @brief Keys of the parsed object, in sorted order.
  std::vector<std::string> keys() const {
    std::vector<std::string> result;
    for (const auto& entry : values_) result.push_back(entry.first);
    return result;
  }

  /// @brief Get an integer value.
  int getInt(const std::string& key, int default_val = 0) const {
    auto text = scalar(key);
    if (!text) return default_val;
    try {
      return std::stoi(*text);
    } catch (const std::exception&) {
      return default_val;
    }
  }

  /// @brief Get an unsigned integer value.
  uint32_t getUint(const std::string& key, uint32_t default_val = 0) const {
    auto text = scalar(key);
    if (!text) return default_val;
    try {
      return static_cast<uint32_t>(std::stoul(*text));
    } catch (const std::exception&) {
      return default_val;
    }
  }

  /// @brief Get a double value.
  double getDouble(const std::string& key, double default_val = 0.0) const {
    auto text = scalar(key);
    if (!text) return default_val;
    try {
      return std::stod(*text);
    } catch (const std::exception&) {
      return default_val;
    }
  }

  /// @brief Get a float value.
  float getFloat(const std::string& key, float default_val = 0.0f) const {
    return static_cast<float>(getDouble(key, default_val));
  }

  /// @brief Get a boolean value.
  bool getBool(const std::string& key, bool default_val = false) const {
    auto text = scalar(key);
    if (!text) return default_val;
    if (*text == "true") return true;
    if (*text == "false") return false;
    return default_val;
  }

  /// @brief Get a string value (numbers are returned as their text).
  std::string getString(const std::string& key, const std::string& default_val = "") const {
    auto text = scalar(key);
    return text ? *text : default_val;
  }

  /// @brief Get a nested object as a new Parser (empty if absent or not an object).
  Parser getObject(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end() || it->second.quoted || it->second.text.empty() ||
        it->second.text[0] != '{') {
      return Parser("{}");
    }
    return Parser(it->second.text);
  }

  /// @brief Get array elements that are objects, one Parser each.
  std::vector<Parser> getArray(const std::string& key) const {
    std::vector<Parser> result;
    for (const auto& element : arrayElements(key)) {
      if (!element.quoted && !element.text.empty() && element.text[0] == '{') {
        result.emplace_back(element.text);
      }
    }
    return result;
  }

  /// @brief Get numeric array elements (non-numeric elements are skipped).
  std::vector<double> getDoubleArray(const std::string& key) const {
    std::vector<double> result;
    for (const auto& element : arrayElements(key)) {
      if (element.quoted) continue;
      try {
        result.push_back(std::stod(element.text));
      } catch (const std::exception&) {
        continue;
      }
    }
    return result;
  }

  /// @brief Get array elements as numbers; nulls and non-numbers become nullopt.
  std::vector<std::optional<double>> getOptionalDoubleArray(const std::string& key) const {
    std::vector<std::optional<double>> result;
    for (const auto& element : arrayElements(key)) {
      if (!element.quoted && element.text == "null") {
        result.push_back(std::nullopt);
        continue;
      }
      try {
        result.push_back(std::stod(element.text));
      } catch (const std::exception&) {
        result.push_back(std::nullopt);
      }
    }
    return result;
  }

  /// @brief Get string array elements (non-string elements are skipped).
  std::vector<std::string> getStringArray(const std::string& key) const {
    std::vector<std::string> result;
    for (const auto& element : arrayElements(key)) {
      if (element.quoted) result.push_back(element.text);
    }
    return result;
  }

 private:
  // Scalar text or raw nested JSON, plus whether it was a quoted string.
  struct Value {
    std::string text;
    bool quoted = false;
  };

  std::optional<std::string> scalar(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end()) return std::nullopt;
    if (!it->second.quoted && it->second.text == "null") return std::nullopt;
    return it->second.text;
  }

  std::vector<Value> arrayElements(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end() || it->second.quoted || it->second.text.empty() ||
        it->second.text[0] != '[') {
      return {};
    }
    Parser nested(it->second.text);
    return nested.elements_;
  }

  void parseObject(size_t& pos) {
    if (pos >= json_.size() || json_[pos] != '{') return;
    ++pos;

    while (pos < json_.size()) {
      skipWhitespace(pos);
      if (pos >= json_.size() || json_[pos] == '}') break;
      if (json_[pos] == ',') {
        ++pos;
        continue;
      }
      if (json_[pos] != '"') break;

      std::string key = parseString(pos);
      skipWhitespace(pos);
      if (pos >= json_.size() || json_[pos] != ':') break;
      ++pos;

      values_[key] = parseValue(pos);
    }
  }

  void parseArray(size_t& pos) {
    if (pos >= json_.size() || json_[pos] != '[') return;
    ++pos;

    while (pos < json_.size()) {
      skipWhitespace(pos);
      if (pos >= json_.size() || json_[pos] == ']') break;
      if (json_[pos] == ',') {
        ++pos;
        continue;
      }
      size_t before = pos;
      elements_.push_back(parseValue(pos));
      if (pos == before) break;
    }
  }

  void skipWhitespace(size_t& pos) const {
    while (pos < json_.size() &&
           (json_[pos] == ' ' || json_[pos] == '\t' || json_[pos] == '\n' || json_[pos] == '\r')) {
      ++pos;
    }
  }

  std::string parseString(size_t& pos) const {
    if (pos >= json_.size() || json_[pos] != '"') return "";
    ++pos;
    std::string result;
    while (pos < json_.size() && json_[pos] != '"') {
      if (json_[pos] == '\\' && pos + 1 < json_.size()) {
        ++pos;
        switch (json_[pos]) {
          case 'n':
            result += '\n';
            break;
          case 'r':
            result += '\r';
            break;
          case 't':
            result += '\t';
            break;
          default:
            result += json_[pos];
            break;
        }
      } else {
        result += json_[pos];
      }
      ++pos;
    }
    if (pos < json_.size()) ++pos;  // Skip closing quote
    return result;
  }

  Value parseValue(size_t& pos) {
    skipWhitespace(pos);
    if (pos >= json_.size()) return {};

    if (json_[pos] == '"') return {parseString(pos), true};

    if (json_[pos] == '{' || json_[pos] == '[') {
      size_t start = pos;
      skipNestedStructure(pos);
      return {json_.substr(start, pos - start), false};
    }

    // Number, boolean, or null
    std::string text;
    while (pos < json_.size() && json_[pos] != ',' && json_[pos] != '}' && json_[pos] != ']' &&
           json_[pos] != ' ' && json_[pos] != '\t' && json_[pos] != '\n' && json_[pos] != '\r') {
      text += json_[pos];
      ++pos;
    }
    return {text, false};
  }

  // Advance past a balanced {...} or [...] starting at pos.
  void skipNestedStructure(size_t& pos) const {
    int depth = 0;
    while (pos < json_.size()) {
      char c = json_[pos];
      if (c == '"') {
        ++pos;
        while (pos < json_.size() && json_[pos] != '"') {
          if (json_[pos] == '\\' && pos + 1 < json_.size()) ++pos;
          ++pos;
        }
      } else if (c == '{' || c == '[') {
        ++depth;
      } else if (c == '}' || c == ']') {
        if (--depth == 0) {
          ++pos;
          return;
        }
      }
      ++pos;
    }
  }

  std::string json_;
  std::map<std::string, Value> values_;
  std::vector<Value> elements_;
};

// ============================================================================
// Visitor-based serialization helpers
// ============================================================================

struct WriteVisitor {
  Writer& w;
  void operator()(const char* k, int v) { w.write(k, v); }
  void operator()(const char* k, uint32_t v) { w.write(k, v); }
  void operator()(const char* k, bool v) { w.write(k, v); }
  void operator()(const char* k, double v) { w.write(k, v); }
  template <typename E, std::enable_if_t<std::is_enum_v<E>, int> = 0>
  void operator()(const char* k, E v) {
    w.write(k, static_cast<int>(v));
  }
  template <typename T>
  void nested(const char* k, const T& obj) {
    w.beginObject(k);
    obj.writeTo(w);
    w.endObject();
  }
};

struct ReadVisitor {
  const Parser& p;
  void operator()(const char* k, int& v) { v = p.getInt(k, v); }
  void operator()(const char* k, uint32_t& v) { v = p.getUint(k, v); }
  void operator()(const char* k, bool& v) { v = p.getBool(k, v); }
  void operator()(const char* k, double& v) { v = p.getDouble(k, v); }
  template <typename E, std::enable_if_t<std::is_enum_v<E>, int> = 0>
  void operator()(const char* k, E& v) {
    v = static_cast<E>(p.getInt(k, static_cast<int>(v)));
  }
  template <typename T>
  void nested(const char* k, T& obj) {
    if (p.has(k)) obj.readFrom(p.getObject(k));
  }
};

}  // namespace json
}  // namespace chordgrid
