#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>
#include <utility>
#include <vector>

namespace rebuild {

// Minimal JSON value representation, parser and writer.
//
// Used for project requests, pipeline config overrides and the report itself.
//
// Notes:
//  - Strict JSON: no comments, no trailing commas.
//  - Numbers are parsed as double.
//  - Objects are stored as an ordered list of key/value pairs, so output key
//    order is exactly insertion order.
//
struct JsonValue {
  enum class Type : std::uint8_t {
    Null,
    Bool,
    Number,
    String,
    Array,
    Object,
  };

  Type type = Type::Null;

  bool boolValue = false;
  double numberValue = 0.0;
  std::string stringValue;
  std::vector<JsonValue> arrayValue;
  std::vector<std::pair<std::string, JsonValue>> objectValue;

  static JsonValue MakeNull();
  static JsonValue MakeBool(bool b);
  static JsonValue MakeNumber(double n);
  static JsonValue MakeString(std::string s);
  static JsonValue MakeArray();
  static JsonValue MakeObject();

  bool isNull() const { return type == Type::Null; }
  bool isBool() const { return type == Type::Bool; }
  bool isNumber() const { return type == Type::Number; }
  bool isString() const { return type == Type::String; }
  bool isArray() const { return type == Type::Array; }
  bool isObject() const { return type == Type::Object; }

  // Object/array builders. No-ops on the wrong type.
  void set(std::string key, JsonValue v);
  void push(JsonValue v);
};

const JsonValue* FindJsonMember(const JsonValue& obj, const std::string& key);
JsonValue* FindJsonMember(JsonValue& obj, const std::string& key);

bool ParseJson(const std::string& text, JsonValue& outValue, std::string& outError);

// Read and parse a whole file.
bool LoadJsonFile(const std::string& path, JsonValue& outValue, std::string& outError);

// Escape a string to be used inside a JSON string literal (without surrounding quotes).
std::string JsonEscape(const std::string& s);

// Shortest round-trip text for a finite double ("3", "0.25", "1e+21").
std::string JsonNumberText(double v);

struct JsonWriteOptions {
  // Pretty-print with newlines + indentation.
  bool pretty = true;

  // Spaces per indentation level when pretty-printing.
  int indent = 2;

  // Sort object keys lexicographically (useful for diffing configs).
  bool sortKeys = false;
};

// Serialize a JsonValue to a stream.
//
// Returns false on non-finite numbers (NaN/Inf) or stream failures.
bool WriteJson(std::ostream& os, const JsonValue& value, std::string& outError,
              const JsonWriteOptions& opt = {});

// Serialize a JsonValue to a string. Non-finite numbers are written as null.
std::string JsonStringify(const JsonValue& value, const JsonWriteOptions& opt = {});

// Convenience: write a JSON file (with a trailing newline).
bool WriteJsonFile(const std::string& path, const JsonValue& value, std::string& outError,
                   const JsonWriteOptions& opt = {});

} // namespace rebuild
