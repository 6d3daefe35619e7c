// src/io/json.cpp
//
// JSON subset reader/writer used for result documents and the aggregated
// artifact. Recursive-descent parser over a string_view; values are built
// in place. See orr/io/json.h for the accepted grammar.

#include "orr/io/json.h"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <limits>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>

namespace orr {
namespace json {

namespace {

inline void SetErr(std::string* err, const std::string& msg) {
  if (err) *err = msg;
}

// Nesting cap; result documents are a handful of levels deep.
constexpr int kMaxDepth = 256;

void AppendUtf8(u32 cp, std::string* out) {
  if (cp < 0x80) {
    out->push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out->push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out->push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out->push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out->push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out->push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out->push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

class Parser {
 public:
  explicit Parser(std::string_view s) : s_(s) {}

  bool Parse(Value* out, std::string* err) {
    SkipWs();
    if (!ParseValue(out, 0)) {
      SetErr(err, "json parse: " + msg_ + " at offset " + std::to_string(i_));
      return false;
    }
    SkipWs();
    if (i_ != s_.size()) {
      SetErr(err, "json parse: trailing characters at offset " + std::to_string(i_));
      return false;
    }
    return true;
  }

 private:
  bool Fail(std::string msg) {
    msg_ = std::move(msg);
    return false;
  }

  void SkipWs() {
    while (i_ < s_.size()) {
      const char c = s_[i_];
      if (c == ' ' || c == '\n' || c == '\r' || c == '\t') {
        ++i_;
      } else {
        break;
      }
    }
  }

  bool Match(std::string_view kw) {
    if (s_.substr(i_, kw.size()) == kw) {
      i_ += kw.size();
      return true;
    }
    return false;
  }

  bool ParseValue(Value* out, int depth) {
    if (depth > kMaxDepth) return Fail("nesting too deep");
    SkipWs();
    if (i_ >= s_.size()) return Fail("unexpected end");

    const char c = s_[i_];
    if (c == '{') return ParseObject(out, depth);
    if (c == '[') return ParseArray(out, depth);
    if (c == '"') {
      out->type = Type::String;
      return ParseString(&out->str);
    }
    if (c == 't') {
      if (!Match("true")) return Fail("expected true");
      out->type = Type::Bool;
      out->b = true;
      return true;
    }
    if (c == 'f') {
      if (!Match("false")) return Fail("expected false");
      out->type = Type::Bool;
      out->b = false;
      return true;
    }
    if (c == 'n') {
      if (!Match("null")) return Fail("expected null");
      out->type = Type::Null;
      return true;
    }
    if (c == 'N') {
      if (!Match("NaN")) return Fail("expected NaN");
      out->type = Type::Number;
      out->num = std::numeric_limits<double>::quiet_NaN();
      return true;
    }
    if (c == 'I') {
      if (!Match("Infinity")) return Fail("expected Infinity");
      out->type = Type::Number;
      out->num = std::numeric_limits<double>::infinity();
      return true;
    }
    if (c == '-' || (c >= '0' && c <= '9')) return ParseNumber(out);

    return Fail(std::string("unexpected char '") + c + "'");
  }

  bool ParseHex4(u32* cp) {
    if (i_ + 4 > s_.size()) return Fail("bad \\u escape");
    u32 v = 0;
    for (int k = 0; k < 4; ++k) {
      const char h = s_[i_++];
      v <<= 4;
      if (h >= '0' && h <= '9') v |= static_cast<u32>(h - '0');
      else if (h >= 'a' && h <= 'f') v |= static_cast<u32>(h - 'a' + 10);
      else if (h >= 'A' && h <= 'F') v |= static_cast<u32>(h - 'A' + 10);
      else return Fail("bad \\u escape");
    }
    *cp = v;
    return true;
  }

  bool ParseString(std::string* out) {
    if (i_ >= s_.size() || s_[i_] != '"') return Fail("expected string");
    ++i_;
    std::string res;
    while (i_ < s_.size()) {
      const char c = s_[i_++];
      if (c == '"') {
        *out = std::move(res);
        return true;
      }
      if (c != '\\') {
        res.push_back(c);
        continue;
      }
      if (i_ >= s_.size()) return Fail("bad escape");
      const char e = s_[i_++];
      switch (e) {
        case '"': res.push_back('"'); break;
        case '\\': res.push_back('\\'); break;
        case '/': res.push_back('/'); break;
        case 'b': res.push_back('\b'); break;
        case 'f': res.push_back('\f'); break;
        case 'n': res.push_back('\n'); break;
        case 'r': res.push_back('\r'); break;
        case 't': res.push_back('\t'); break;
        case 'u': {
          u32 cp = 0;
          if (!ParseHex4(&cp)) return false;
          // Surrogate pair -> one code point; a lone surrogate becomes U+FFFD.
          if (cp >= 0xD800 && cp <= 0xDBFF && Match("\\u")) {
            u32 lo = 0;
            if (!ParseHex4(&lo)) return false;
            cp = (lo >= 0xDC00 && lo <= 0xDFFF) ? 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00) : 0xFFFD;
          } else if (cp >= 0xD800 && cp <= 0xDFFF) {
            cp = 0xFFFD;
          }
          AppendUtf8(cp, &res);
          break;
        }
        default:
          return Fail("unsupported escape");
      }
    }
    return Fail("unterminated string");
  }

  bool ParseNumber(Value* out) {
    const usize start = i_;
    if (s_[i_] == '-') {
      ++i_;
      if (Match("Infinity")) {
        out->type = Type::Number;
        out->num = -std::numeric_limits<double>::infinity();
        return true;
      }
    }
    const usize digits_start = i_;
    while (i_ < s_.size() && std::isdigit(static_cast<unsigned char>(s_[i_]))) ++i_;
    if (i_ == digits_start) return Fail("bad number");
    if (i_ < s_.size() && s_[i_] == '.') {
      ++i_;
      while (i_ < s_.size() && std::isdigit(static_cast<unsigned char>(s_[i_]))) ++i_;
    }
    if (i_ < s_.size() && (s_[i_] == 'e' || s_[i_] == 'E')) {
      ++i_;
      if (i_ < s_.size() && (s_[i_] == '+' || s_[i_] == '-')) ++i_;
      while (i_ < s_.size() && std::isdigit(static_cast<unsigned char>(s_[i_]))) ++i_;
    }

    // strtod rather than stod: overflow yields +-HUGE_VAL instead of throwing.
    const std::string token(s_.substr(start, i_ - start));
    char* end = nullptr;
    const double v = std::strtod(token.c_str(), &end);
    if (end != token.c_str() + token.size()) return Fail("bad number");
    out->type = Type::Number;
    out->num = v;
    return true;
  }

  bool ParseArray(Value* out, int depth) {
    ++i_;  // '['
    SkipWs();
    out->type = Type::Array;
    out->arr.clear();

    if (i_ < s_.size() && s_[i_] == ']') {
      ++i_;
      return true;
    }

    while (true) {
      Value v;
      if (!ParseValue(&v, depth + 1)) return false;
      out->arr.push_back(std::move(v));
      SkipWs();
      if (i_ >= s_.size()) return Fail("unterminated array");
      if (s_[i_] == ',') {
        ++i_;
        continue;
      }
      if (s_[i_] == ']') {
        ++i_;
        return true;
      }
      return Fail("expected , or ] in array");
    }
  }

  bool ParseObject(Value* out, int depth) {
    ++i_;  // '{'
    SkipWs();
    out->type = Type::Object;
    out->obj.clear();

    if (i_ < s_.size() && s_[i_] == '}') {
      ++i_;
      return true;
    }

    while (true) {
      SkipWs();
      std::string key;
      if (!ParseString(&key)) return false;
      SkipWs();
      if (i_ >= s_.size() || s_[i_] != ':') return Fail("expected :");
      ++i_;
      Value val;
      if (!ParseValue(&val, depth + 1)) return false;
      out->Set(std::move(key), std::move(val));
      SkipWs();
      if (i_ >= s_.size()) return Fail("unterminated object");
      if (s_[i_] == ',') {
        ++i_;
        continue;
      }
      if (s_[i_] == '}') {
        ++i_;
        return true;
      }
      return Fail("expected , or } in object");
    }
  }

  std::string_view s_;
  usize i_{0};
  std::string msg_;
};

}  // namespace

const Value* Value::Find(std::string_view key) const {
  if (type != Type::Object) return nullptr;
  for (const auto& m : obj) {
    if (m.first == key) return m.second.get();
  }
  return nullptr;
}

Value& Value::Set(std::string key, Value v) {
  if (type == Type::Null) type = Type::Object;
  for (auto& m : obj) {
    if (m.first == key) {
      *m.second = std::move(v);
      return *m.second;
    }
  }
  obj.emplace_back(std::move(key), std::make_unique<Value>(std::move(v)));
  return *obj.back().second;
}

bool Parse(std::string_view text, Value* out, std::string* err) {
  if (!out) {
    SetErr(err, "json::Parse: out is null");
    return false;
  }
  *out = Value();
  Parser p(text);
  return p.Parse(out, err);
}

bool ParseFile(const std::string& path, Value* out, std::string* err) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    SetErr(err, "Cannot open file: " + path);
    return false;
  }
  std::ostringstream buf;
  buf << in.rdbuf();
  if (in.bad()) {
    SetErr(err, "Read failed: " + path);
    return false;
  }
  return Parse(buf.str(), out, err);
}

bool GetNumber(const Value& v, double* out) {
  if (!out) return false;
  if (v.IsNumber()) {
    *out = v.num;
    return true;
  }
  if (v.IsString() && !v.str.empty()) {
    char* end = nullptr;
    const double x = std::strtod(v.str.c_str(), &end);
    if (end != v.str.c_str() + v.str.size()) return false;
    *out = x;
    return true;
  }
  return false;
}

bool GetString(const Value& v, std::string* out) {
  if (!out) return false;
  if (v.IsString()) {
    *out = v.str;
    return true;
  }
  return false;
}

bool GetFiniteNumber(const Value& obj, std::string_view key, double* out) {
  const Value* v = obj.Find(key);
  if (!v) return false;
  double x = 0.0;
  if (!GetNumber(*v, &x) || !std::isfinite(x)) return false;
  if (out) *out = x;
  return true;
}

// --------------------------
// Writer
// --------------------------

std::string Escape(std::string_view s) {
  std::ostringstream oss;
  for (char c : s) {
    switch (c) {
      case '"': oss << "\\\""; break;
      case '\\': oss << "\\\\"; break;
      case '\b': oss << "\\b"; break;
      case '\f': oss << "\\f"; break;
      case '\n': oss << "\\n"; break;
      case '\r': oss << "\\r"; break;
      case '\t': oss << "\\t"; break;
      default:
        // Control chars -> \u00XX
        if (static_cast<unsigned char>(c) < 0x20) {
          oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
              << static_cast<int>(static_cast<unsigned char>(c))
              << std::dec;
        } else {
          oss << c;
        }
    }
  }
  return oss.str();
}

std::string FormatDouble(double x) {
  if (!std::isfinite(x)) return "null";
  char buf[32];
  for (int prec = 15; prec <= 17; ++prec) {
    std::snprintf(buf, sizeof(buf), "%.*g", prec, x);
    if (std::strtod(buf, nullptr) == x) break;
  }
  return std::string(buf);
}

void Writer::Newline() {
  if (indent_ <= 0) return;
  (*out_) << '\n';
  for (usize i = 0; i < stack_.size() * static_cast<usize>(indent_); ++i) (*out_) << ' ';
}

void Writer::BeforeValue() {
  if (after_key_) {
    after_key_ = false;
    return;
  }
  if (stack_.empty()) return;
  Frame& f = stack_.back();
  if (f.count++ > 0) (*out_) << ',';
  Newline();
}

void Writer::BeginObject() {
  BeforeValue();
  (*out_) << '{';
  stack_.push_back(Frame{true, 0});
}

void Writer::EndObject() {
  const bool had_members = !stack_.empty() && stack_.back().count > 0;
  stack_.pop_back();
  if (had_members) Newline();
  (*out_) << '}';
}

void Writer::BeginArray() {
  BeforeValue();
  (*out_) << '[';
  stack_.push_back(Frame{false, 0});
}

void Writer::EndArray() {
  const bool had_items = !stack_.empty() && stack_.back().count > 0;
  stack_.pop_back();
  if (had_items) Newline();
  (*out_) << ']';
}

void Writer::Key(std::string_view k) {
  BeforeValue();
  (*out_) << '"' << Escape(k) << "\":" << (indent_ > 0 ? " " : "");
  after_key_ = true;
}

void Writer::String(std::string_view s) {
  BeforeValue();
  (*out_) << '"' << Escape(s) << '"';
}

void Writer::Number(double x) {
  BeforeValue();
  (*out_) << FormatDouble(x);
}

void Writer::Int(i64 x) {
  BeforeValue();
  (*out_) << x;
}

void Writer::Bool(bool x) {
  BeforeValue();
  (*out_) << (x ? "true" : "false");
}

void Writer::Null() {
  BeforeValue();
  (*out_) << "null";
}

}  // namespace json
}  // namespace orr
