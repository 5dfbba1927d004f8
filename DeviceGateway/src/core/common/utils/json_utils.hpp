#pragma once

#include <cmath>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "mongoose.h"

namespace devgw::core::common::json {

// ---- writing ----

inline std::string Escape(std::string_view s) {
  std::string out;
  out.reserve(s.size() + 8);
  for (const char c : s) {
    switch (c) {
      case '\"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          const char hex[] = "0123456789abcdef";
          out += "\\u00";
          out += hex[(c >> 4) & 0x0f];
          out += hex[c & 0x0f];
        } else {
          out += c;
        }
    }
  }
  return out;
}

inline std::string Quote(std::string_view s) {
  std::string out;
  out.reserve(s.size() + 2);
  out.push_back('\"');
  out += Escape(s);
  out.push_back('\"');
  return out;
}

inline std::string Bool(bool v) { return v ? "true" : "false"; }

inline std::string Number(long long v) { return std::to_string(v); }
inline std::string Number(unsigned long long v) { return std::to_string(v); }
inline std::string Number(int v) { return std::to_string(v); }
inline std::string Number(long v) { return std::to_string(v); }
inline std::string Number(unsigned long v) { return std::to_string(v); }

inline std::string Number(double v) {
  const double iv = std::llround(v);
  if (std::fabs(v - iv) < 1e-9) return std::to_string(static_cast<long long>(iv));
  std::string s = std::to_string(v);
  while (!s.empty() && s.back() == '0') s.pop_back();
  if (!s.empty() && s.back() == '.') s.pop_back();
  if (s.empty()) return "0";
  return s;
}

inline std::string Object(std::initializer_list<std::pair<std::string, std::string>> fields) {
  std::string out;
  out.push_back('{');
  bool first = true;
  for (const auto& kv : fields) {
    if (!first) out.push_back(',');
    first = false;
    out += Quote(kv.first);
    out.push_back(':');
    out += kv.second;
  }
  out.push_back('}');
  return out;
}

inline std::string Object(const std::vector<std::pair<std::string, std::string>>& fields) {
  std::string out;
  out.push_back('{');
  bool first = true;
  for (const auto& kv : fields) {
    if (!first) out.push_back(',');
    first = false;
    out += Quote(kv.first);
    out.push_back(':');
    out += kv.second;
  }
  out.push_back('}');
  return out;
}

// Elements must already be encoded JSON values.
inline std::string Array(const std::vector<std::string>& items) {
  std::string out;
  out.push_back('[');
  bool first = true;
  for (const auto& item : items) {
    if (!first) out.push_back(',');
    first = false;
    out += item;
  }
  out.push_back(']');
  return out;
}

inline std::string StringArray(const std::vector<std::string>& items) {
  std::vector<std::string> quoted;
  quoted.reserve(items.size());
  for (const auto& s : items) quoted.push_back(Quote(s));
  return Array(quoted);
}

// ---- reading (mongoose mg_json_*) ----

enum class Kind { Missing, Invalid, Null, Bool, Number, String, Array, Object };

inline struct mg_str View(std::string_view s) { return mg_str_n(s.data(), s.size()); }

inline std::string_view ToView(const struct mg_str& s) { return std::string_view(s.buf, s.len); }

inline Kind KindAt(std::string_view json, const char* path) {
  int toklen = 0;
  const int ofs = mg_json_get(View(json), path, &toklen);
  if (ofs == MG_JSON_NOT_FOUND) return Kind::Missing;
  if (ofs < 0 || toklen <= 0) return Kind::Invalid;
  switch (json[static_cast<std::size_t>(ofs)]) {
    case '{': return Kind::Object;
    case '[': return Kind::Array;
    case '"': return Kind::String;
    case 't':
    case 'f': return Kind::Bool;
    case 'n': return Kind::Null;
    default: return Kind::Number;
  }
}

inline bool IsObject(std::string_view json) { return KindAt(json, "$") == Kind::Object; }

// Raw token text at `path` (objects and arrays included verbatim).
inline bool GetRaw(std::string_view json, const char* path, std::string& out) {
  int toklen = 0;
  const int ofs = mg_json_get(View(json), path, &toklen);
  if (ofs < 0 || toklen <= 0) return false;
  out.assign(json.data() + ofs, static_cast<std::size_t>(toklen));
  return true;
}

inline bool GetString(std::string_view json, const char* path, std::string& out) {
  char* s = mg_json_get_str(View(json), path);
  if (s == nullptr) return false;
  out = s;
  mg_free(s);
  return true;
}

inline std::string GetStringOr(std::string_view json, const char* path, std::string default_value) {
  std::string out;
  if (GetString(json, path, out)) return out;
  return default_value;
}

inline bool GetBool(std::string_view json, const char* path, bool& out) {
  return mg_json_get_bool(View(json), path, &out);
}

inline bool GetNumber(std::string_view json, const char* path, double& out) {
  return mg_json_get_num(View(json), path, &out);
}

// Fails on fractional values and on values outside the int64 range.
inline bool GetInt64(std::string_view json, const char* path, std::int64_t& out) {
  double v = 0.0;
  if (!GetNumber(json, path, v)) return false;
  if (std::floor(v) != v) return false;
  if (v < -9223372036854775808.0 || v >= 9223372036854775808.0) return false;
  out = static_cast<std::int64_t>(v);
  return true;
}

// Visits each member of an object token (key unquoted) or each element of an
// array token (key empty). Returns false if `token` is not an object/array.
inline bool ForEach(std::string_view token,
                    const std::function<void(std::string_view key, std::string_view value)>& fn) {
  if (token.empty() || (token.front() != '{' && token.front() != '[')) return false;
  const struct mg_str obj = View(token);
  struct mg_str key {};
  struct mg_str val {};
  std::size_t ofs = 0;
  while ((ofs = mg_json_next(obj, ofs, &key, &val)) > 0) {
    std::string_view k = ToView(key);
    if (k.size() >= 2 && k.front() == '"' && k.back() == '"') k = k.substr(1, k.size() - 2);
    fn(k, ToView(val));
  }
  return true;
}

inline bool GetStringArray(std::string_view json, const char* path, std::vector<std::string>& out) {
  std::string token;
  if (!GetRaw(json, path, token)) return false;
  if (token.front() != '[') return false;
  bool ok = true;
  std::vector<std::string> items;
  (void)ForEach(token, [&](std::string_view, std::string_view value) {
    std::string s;
    if (!GetString(value, "$", s)) {
      ok = false;
      return;
    }
    items.push_back(std::move(s));
  });
  if (!ok) return false;
  out = std::move(items);
  return true;
}

}  // namespace devgw::core::common::json
