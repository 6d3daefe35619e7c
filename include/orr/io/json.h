#pragma once
// orr/io/json.h
//
// Small JSON reader/writer (no external JSON dependency).
//
// Reader:
//  - Full JSON grammar plus the non-standard NaN / Infinity / -Infinity
//    tokens the harness writes for non-finite values, so such files still
//    parse (those values later read as "absent").
//  - Objects preserve member order; on duplicate keys the last one wins.
//
// Writer:
//  - Streaming, pretty-printed, with shortest round-trip number formatting.

#include "orr/core/types.h"

#include <iosfwd>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace orr {
namespace json {

enum class Type : u8 { Null, Bool, Number, String, Array, Object };

struct Value {
  using Member = std::pair<std::string, std::unique_ptr<Value>>;

  Value() = default;
  Value(Value&&) = default;
  Value& operator=(Value&&) = default;
  Value(const Value&) = delete;
  Value& operator=(const Value&) = delete;

  Type type{Type::Null};
  bool b{false};
  double num{0.0};
  std::string str;
  std::vector<Value> arr;
  std::vector<Member> obj;

  bool IsNull() const { return type == Type::Null; }
  bool IsBool() const { return type == Type::Bool; }
  bool IsNumber() const { return type == Type::Number; }
  bool IsString() const { return type == Type::String; }
  bool IsArray() const { return type == Type::Array; }
  bool IsObject() const { return type == Type::Object; }

  // Object member lookup; nullptr when not an object or the key is absent.
  const Value* Find(std::string_view key) const;

  // Insert or replace an object member (turns a Null value into an object).
  Value& Set(std::string key, Value v);
};

// Parse a full document. Returns false and sets err (with byte offset) on failure.
bool Parse(std::string_view text, Value* out, std::string* err = nullptr);

// Read a whole file and parse it.
bool ParseFile(const std::string& path, Value* out, std::string* err = nullptr);

// --------------------------
// Typed accessors
// --------------------------
inline const Value* Get(const Value& obj, std::string_view key) { return obj.Find(key); }

// Numbers, and strings holding a number ("12", "3.5"), are accepted.
bool GetNumber(const Value& v, double* out);

bool GetString(const Value& v, std::string* out);

// Finite number under `key` of an object; false when absent/null/non-numeric/non-finite.
bool GetFiniteNumber(const Value& obj, std::string_view key, double* out);

// --------------------------
// Writer
// --------------------------
std::string Escape(std::string_view s);

// Shortest decimal form that parses back to the same double ("0.95", "12", "1e-07").
std::string FormatDouble(double x);

class Writer {
 public:
  // indent = 0 writes compact JSON.
  explicit Writer(std::ostream* out, int indent = 2) : out_(out), indent_(indent) {}

  void BeginObject();
  void EndObject();
  void BeginArray();
  void EndArray();

  void Key(std::string_view k);

  void String(std::string_view s);
  void Number(double x);  // non-finite values are written as null
  void Int(i64 x);
  void Bool(bool x);
  void Null();

 private:
  struct Frame {
    bool is_object;
    usize count;
  };

  void BeforeValue();
  void Newline();

  std::ostream* out_;
  int indent_;
  std::vector<Frame> stack_;
  bool after_key_ = false;
};

}  // namespace json
}  // namespace orr
