#include "rebuild/Json.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <ostream>
#include <sstream>

namespace rebuild {

JsonValue JsonValue::MakeNull()
{
  return JsonValue{};
}

JsonValue JsonValue::MakeBool(bool b)
{
  JsonValue v;
  v.type = Type::Bool;
  v.boolValue = b;
  return v;
}

JsonValue JsonValue::MakeNumber(double n)
{
  JsonValue v;
  v.type = Type::Number;
  v.numberValue = n;
  return v;
}

JsonValue JsonValue::MakeString(std::string s)
{
  JsonValue v;
  v.type = Type::String;
  v.stringValue = std::move(s);
  return v;
}

JsonValue JsonValue::MakeArray()
{
  JsonValue v;
  v.type = Type::Array;
  return v;
}

JsonValue JsonValue::MakeObject()
{
  JsonValue v;
  v.type = Type::Object;
  return v;
}

void JsonValue::set(std::string key, JsonValue v)
{
  if (!isObject()) return;
  for (auto& kv : objectValue) {
    if (kv.first == key) {
      kv.second = std::move(v);
      return;
    }
  }
  objectValue.emplace_back(std::move(key), std::move(v));
}

void JsonValue::push(JsonValue v)
{
  if (!isArray()) return;
  arrayValue.push_back(std::move(v));
}

const JsonValue* FindJsonMember(const JsonValue& obj, const std::string& key)
{
  if (!obj.isObject()) return nullptr;
  for (const auto& kv : obj.objectValue) {
    if (kv.first == key) return &kv.second;
  }
  return nullptr;
}

JsonValue* FindJsonMember(JsonValue& obj, const std::string& key)
{
  if (!obj.isObject()) return nullptr;
  for (auto& kv : obj.objectValue) {
    if (kv.first == key) return &kv.second;
  }
  return nullptr;
}

std::string JsonEscape(const std::string& s)
{
  std::string out;
  out.reserve(s.size() + 8);
  for (unsigned char ch : s) {
    switch (ch) {
    case '\\': out += "\\\\"; break;
    case '"': out += "\\\""; break;
    case '\b': out += "\\b"; break;
    case '\f': out += "\\f"; break;
    case '\n': out += "\\n"; break;
    case '\r': out += "\\r"; break;
    case '\t': out += "\\t"; break;
    default:
      if (ch < 0x20) {
        static const char* hex = "0123456789ABCDEF";
        out += "\\u00";
        out.push_back(hex[(ch >> 4) & 0xF]);
        out.push_back(hex[ch & 0xF]);
      } else {
        // UTF-8 bytes pass through unchanged.
        out.push_back(static_cast<char>(ch));
      }
      break;
    }
  }
  return out;
}

std::string JsonNumberText(double v)
{
  if (!std::isfinite(v)) return "null";
  if (v == 0.0) return "0"; // also folds -0

  char buf[64];
  const auto res = std::to_chars(buf, buf + sizeof(buf), v);
  if (res.ec != std::errc()) return "0";
  return std::string(buf, res.ptr);
}

namespace {

void AppendUtf8(std::string& out, unsigned int code)
{
  if (code <= 0x7F) {
    out.push_back(static_cast<char>(code));
  } else if (code <= 0x7FF) {
    out.push_back(static_cast<char>(0xC0 | (code >> 6)));
    out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
  } else if (code <= 0xFFFF) {
    out.push_back(static_cast<char>(0xE0 | (code >> 12)));
    out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (code >> 18)));
    out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
  }
}

struct Parser {
  const std::string& s;
  std::size_t i = 0;
  std::string err;

  explicit Parser(const std::string& str) : s(str) {}

  void skipWs()
  {
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i])) != 0) ++i;
  }

  char peek() const { return i < s.size() ? s[i] : '\0'; }

  bool consume(char c)
  {
    if (peek() != c) return false;
    ++i;
    return true;
  }

  bool fail(const std::string& msg)
  {
    std::ostringstream oss;
    oss << "JSON parse error @" << i << ": " << msg;
    err = oss.str();
    return false;
  }

  bool parseValue(JsonValue& out)
  {
    skipWs();
    const char c = peek();
    if (c == '\0') return fail("unexpected end of input");

    if (c == 'n') return parseLiteral("null", JsonValue::MakeNull(), out);
    if (c == 't') return parseLiteral("true", JsonValue::MakeBool(true), out);
    if (c == 'f') return parseLiteral("false", JsonValue::MakeBool(false), out);
    if (c == '"') {
      std::string tmp;
      if (!parseString(tmp)) return false;
      out = JsonValue::MakeString(std::move(tmp));
      return true;
    }
    if (c == '[') return parseArray(out);
    if (c == '{') return parseObject(out);
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c)) != 0) return parseNumber(out);

    return fail(std::string("unexpected character '") + c + "'");
  }

  bool parseLiteral(const char* word, JsonValue v, JsonValue& out)
  {
    const std::string w(word);
    if (s.compare(i, w.size(), w) != 0) return fail("expected '" + w + "'");
    i += w.size();
    out = std::move(v);
    return true;
  }

  bool parseNumber(JsonValue& out)
  {
    const std::size_t start = i;

    if (peek() == '-') ++i;

    if (peek() == '0') {
      ++i;
    } else {
      if (std::isdigit(static_cast<unsigned char>(peek())) == 0) return fail("expected digit");
      while (std::isdigit(static_cast<unsigned char>(peek())) != 0) ++i;
    }

    if (peek() == '.') {
      ++i;
      if (std::isdigit(static_cast<unsigned char>(peek())) == 0) return fail("expected digit after '.'");
      while (std::isdigit(static_cast<unsigned char>(peek())) != 0) ++i;
    }

    if (peek() == 'e' || peek() == 'E') {
      ++i;
      if (peek() == '+' || peek() == '-') ++i;
      if (std::isdigit(static_cast<unsigned char>(peek())) == 0) return fail("expected exponent digits");
      while (std::isdigit(static_cast<unsigned char>(peek())) != 0) ++i;
    }

    const std::string numStr = s.substr(start, i - start);
    errno = 0;
    char* end = nullptr;
    const double v = std::strtod(numStr.c_str(), &end);
    if (errno != 0 || end == numStr.c_str() || (end && *end != '\0')) return fail("invalid number");

    out = JsonValue::MakeNumber(v);
    return true;
  }

  bool parseHex4(unsigned int& code)
  {
    if (i + 4 > s.size()) return fail("invalid \\u escape");
    code = 0;
    for (int k = 0; k < 4; ++k) {
      const char h = s[i++];
      code <<= 4;
      if (h >= '0' && h <= '9') code |= static_cast<unsigned int>(h - '0');
      else if (h >= 'a' && h <= 'f') code |= static_cast<unsigned int>(h - 'a' + 10);
      else if (h >= 'A' && h <= 'F') code |= static_cast<unsigned int>(h - 'A' + 10);
      else return fail("invalid hex digit in \\u escape");
    }
    return true;
  }

  bool parseString(std::string& out)
  {
    skipWs();
    if (!consume('"')) return fail("expected string");

    std::string result;
    while (i < s.size()) {
      const char c = s[i++];
      if (c == '"') {
        out = std::move(result);
        return true;
      }
      if (c != '\\') {
        result.push_back(c);
        continue;
      }

      if (i >= s.size()) return fail("unterminated escape sequence");
      const char e = s[i++];
      switch (e) {
      case '"': result.push_back('"'); break;
      case '\\': result.push_back('\\'); break;
      case '/': result.push_back('/'); break;
      case 'b': result.push_back('\b'); break;
      case 'f': result.push_back('\f'); break;
      case 'n': result.push_back('\n'); break;
      case 'r': result.push_back('\r'); break;
      case 't': result.push_back('\t'); break;
      case 'u': {
        unsigned int code = 0;
        if (!parseHex4(code)) return false;
        // Surrogate pair.
        if (code >= 0xD800 && code <= 0xDBFF && s.compare(i, 2, "\\u") == 0) {
          i += 2;
          unsigned int low = 0;
          if (!parseHex4(low)) return false;
          if (low < 0xDC00 || low > 0xDFFF) return fail("invalid low surrogate");
          code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
        }
        AppendUtf8(result, code);
        break;
      }
      default: return fail("unknown escape sequence");
      }
    }

    return fail("unterminated string");
  }

  bool parseArray(JsonValue& out)
  {
    if (!consume('[')) return fail("expected '['");

    JsonValue arr = JsonValue::MakeArray();
    skipWs();
    if (consume(']')) {
      out = std::move(arr);
      return true;
    }

    while (true) {
      JsonValue v;
      if (!parseValue(v)) return false;
      arr.arrayValue.push_back(std::move(v));

      skipWs();
      if (consume(']')) break;
      if (!consume(',')) return fail("expected ',' or ']'");
    }

    out = std::move(arr);
    return true;
  }

  bool parseObject(JsonValue& out)
  {
    if (!consume('{')) return fail("expected '{'");

    JsonValue obj = JsonValue::MakeObject();
    skipWs();
    if (consume('}')) {
      out = std::move(obj);
      return true;
    }

    while (true) {
      std::string key;
      if (!parseString(key)) return false;

      skipWs();
      if (!consume(':')) return fail("expected ':'");

      JsonValue val;
      if (!parseValue(val)) return false;

      obj.objectValue.emplace_back(std::move(key), std::move(val));

      skipWs();
      if (consume('}')) break;
      if (!consume(',')) return fail("expected ',' or '}'");
    }

    out = std::move(obj);
    return true;
  }
};

struct Writer {
  std::ostream& os;
  const JsonWriteOptions& opt;
  bool strictNumbers = true;
  std::string err;

  void newline(int depth)
  {
    if (!opt.pretty) return;
    os << '\n';
    for (int k = 0; k < depth * std::max(0, opt.indent); ++k) os << ' ';
  }

  bool write(const JsonValue& v, int depth)
  {
    switch (v.type) {
    case JsonValue::Type::Null: os << "null"; break;
    case JsonValue::Type::Bool: os << (v.boolValue ? "true" : "false"); break;
    case JsonValue::Type::Number:
      if (!std::isfinite(v.numberValue) && strictNumbers) {
        err = "cannot serialize non-finite number";
        return false;
      }
      os << JsonNumberText(v.numberValue);
      break;
    case JsonValue::Type::String: os << '"' << JsonEscape(v.stringValue) << '"'; break;
    case JsonValue::Type::Array: {
      if (v.arrayValue.empty()) {
        os << "[]";
        break;
      }
      os << '[';
      for (std::size_t k = 0; k < v.arrayValue.size(); ++k) {
        if (k > 0) os << ',';
        newline(depth + 1);
        if (!write(v.arrayValue[k], depth + 1)) return false;
      }
      newline(depth);
      os << ']';
      break;
    }
    case JsonValue::Type::Object: {
      if (v.objectValue.empty()) {
        os << "{}";
        break;
      }

      std::vector<const std::pair<std::string, JsonValue>*> members;
      members.reserve(v.objectValue.size());
      for (const auto& kv : v.objectValue) members.push_back(&kv);
      if (opt.sortKeys) {
        std::stable_sort(members.begin(), members.end(),
                         [](const auto* a, const auto* b) { return a->first < b->first; });
      }

      os << '{';
      for (std::size_t k = 0; k < members.size(); ++k) {
        if (k > 0) os << ',';
        newline(depth + 1);
        os << '"' << JsonEscape(members[k]->first) << "\":";
        if (opt.pretty) os << ' ';
        if (!write(members[k]->second, depth + 1)) return false;
      }
      newline(depth);
      os << '}';
      break;
    }
    }
    return true;
  }
};

} // namespace

bool ParseJson(const std::string& text, JsonValue& outValue, std::string& outError)
{
  Parser p(text);
  JsonValue v;
  if (!p.parseValue(v)) {
    outError = p.err;
    return false;
  }
  p.skipWs();
  if (p.i != text.size()) {
    outError = "JSON parse error @" + std::to_string(p.i) + ": trailing characters";
    return false;
  }

  outValue = std::move(v);
  outError.clear();
  return true;
}

bool LoadJsonFile(const std::string& path, JsonValue& outValue, std::string& outError)
{
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    outError = "unable to open JSON file: " + path;
    return false;
  }
  std::ostringstream oss;
  oss << f.rdbuf();
  if (f.bad()) {
    outError = "read failed: " + path;
    return false;
  }
  if (!ParseJson(oss.str(), outValue, outError)) {
    outError = path + ": " + outError;
    return false;
  }
  return true;
}

bool WriteJson(std::ostream& os, const JsonValue& value, std::string& outError, const JsonWriteOptions& opt)
{
  Writer w{os, opt};
  if (!w.write(value, 0)) {
    outError = w.err;
    return false;
  }
  if (!os.good()) {
    outError = "JSON stream write failed";
    return false;
  }
  outError.clear();
  return true;
}

std::string JsonStringify(const JsonValue& value, const JsonWriteOptions& opt)
{
  std::ostringstream oss;
  Writer w{oss, opt};
  w.strictNumbers = false;
  (void)w.write(value, 0);
  return oss.str();
}

bool WriteJsonFile(const std::string& path, const JsonValue& value, std::string& outError,
                   const JsonWriteOptions& opt)
{
  std::ofstream f(path, std::ios::binary | std::ios::trunc);
  if (!f) {
    outError = "unable to open for writing: " + path;
    return false;
  }
  if (!WriteJson(f, value, outError, opt)) return false;
  f << '\n';
  if (!f) {
    outError = "write failed: " + path;
    return false;
  }
  return true;
}

} // namespace rebuild
