#include "trialbox/jsonlite.hpp"

// Reader notes:
//   - Integers without fraction or exponent stay integral: a leading '-'
//     selects int64, anything else uint64. Exit codes rely on this so the
//     -1 sentinel survives a write/read cycle exactly.
//   - The first error wins; every production checks failed() before
//     consuming more input.
//
// Writer notes:
//   - Output is appended into one buffer; no streams, no locale.

#include <cstdio>
#include <stdexcept>

namespace trialbox::jsonlite {

namespace {

constexpr const char* kParseError = "json_parse_error";

bool is_digit(char c) { return c >= '0' && c <= '9'; }
bool is_space(char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; }

int hex_value(char c) {
  if (is_digit(c)) return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

void put_codepoint(std::string& out, std::uint32_t cp) {
  auto byte = [&out](std::uint32_t b) { out.push_back(static_cast<char>(b)); };
  if (cp <= 0x7F) {
    byte(cp);
    return;
  }
  if (cp <= 0x7FF) {
    byte(0xC0 | (cp >> 6));
  } else if (cp <= 0xFFFF) {
    byte(0xE0 | (cp >> 12));
    byte(0x80 | ((cp >> 6) & 0x3F));
  } else {
    byte(0xF0 | (cp >> 18));
    byte(0x80 | ((cp >> 12) & 0x3F));
    byte(0x80 | ((cp >> 6) & 0x3F));
  }
  byte(0x80 | (cp & 0x3F));
}

class Reader {
 public:
  explicit Reader(const std::string& text) : text_(text) {}

  Value document() {
    Value root = value();
    skip_space();
    if (!failed() && pos_ != text_.size()) fail("trailing data after document");
    return root;
  }

  const std::optional<JsonError>& error() const { return error_; }

 private:
  bool failed() const { return error_.has_value(); }
  bool at_end() const { return pos_ >= text_.size(); }
  char peek() const { return at_end() ? '\0' : text_[pos_]; }

  void fail(std::string message, const char* code = kParseError) {
    if (!error_) error_ = JsonError{code, std::move(message) + " at offset " + std::to_string(pos_)};
  }

  void skip_space() {
    while (!at_end() && is_space(text_[pos_])) ++pos_;
  }

  bool consume(char c) {
    skip_space();
    if (peek() != c) return false;
    ++pos_;
    return true;
  }

  bool literal(const char* word, size_t len) {
    if (text_.compare(pos_, len, word) != 0) return false;
    pos_ += len;
    return true;
  }

  void digits() {
    while (!at_end() && is_digit(text_[pos_])) ++pos_;
  }

  Value value() {
    skip_space();
    switch (peek()) {
      case '{': return Value{object()};
      case '[': return Value{array()};
      case '"': return Value{string()};
      case '\0':
        if (at_end()) {
          fail("unexpected end of input");
          return {};
        }
        break;
      default: break;
    }
    if (literal("true", 4)) return Value{true};
    if (literal("false", 5)) return Value{false};
    if (literal("null", 4)) return Value{nullptr};
    return number();
  }

  bool hex4(std::uint32_t& cp) {
    if (pos_ + 4 > text_.size()) return false;
    cp = 0;
    for (size_t k = 0; k < 4; ++k) {
      const int h = hex_value(text_[pos_ + k]);
      if (h < 0) return false;
      cp = (cp << 4) | static_cast<std::uint32_t>(h);
    }
    pos_ += 4;
    return true;
  }

  void unicode_escape(std::string& out) {
    std::uint32_t cp = 0;
    if (!hex4(cp)) return fail("bad \\u escape");
    const bool high = cp >= 0xD800 && cp <= 0xDBFF;
    if (high && text_.compare(pos_, 2, "\\u") == 0) {
      pos_ += 2;
      std::uint32_t low = 0;
      if (!hex4(low) || low < 0xDC00 || low > 0xDFFF) return fail("bad surrogate pair");
      cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
    }
    put_codepoint(out, cp);
  }

  std::string string() {
    std::string out;
    if (!consume('"')) {
      fail("expected string");
      return out;
    }
    while (!at_end()) {
      const char c = text_[pos_++];
      if (c == '"') return out;
      if (c != '\\') {
        out.push_back(c);
        continue;
      }
      if (at_end()) break;
      const char esc = text_[pos_++];
      switch (esc) {
        case 'n': out.push_back('\n'); break;
        case 't': out.push_back('\t'); break;
        case 'r': out.push_back('\r'); break;
        case 'b': out.push_back('\b'); break;
        case 'f': out.push_back('\f'); break;
        case 'u':
          unicode_escape(out);
          if (failed()) return {};
          break;
        default: out.push_back(esc); break;
      }
    }
    fail("unterminated string");
    return {};
  }

  Value number() {
    const size_t start = pos_;
    if (literal("NaN", 3) || literal("Infinity", 8) || literal("-Infinity", 9)) {
      pos_ = start;
      fail("non-finite numbers are not JSON");
      return {};
    }
    const bool negative = peek() == '-';
    if (negative) ++pos_;
    if (!is_digit(peek())) {
      pos_ = start;
      fail("unexpected token");
      return {};
    }
    digits();

    bool integral = true;
    if (peek() == '.') {
      integral = false;
      ++pos_;
      if (!is_digit(peek())) {
        fail("digit expected after '.'");
        return {};
      }
      digits();
    }
    if (peek() == 'e' || peek() == 'E') {
      integral = false;
      ++pos_;
      if (peek() == '+' || peek() == '-') ++pos_;
      if (!is_digit(peek())) {
        fail("digit expected in exponent");
        return {};
      }
      digits();
    }

    const std::string lexeme = text_.substr(start, pos_ - start);
    try {
      if (!integral) return Value{std::stod(lexeme)};
      if (negative) return Value{static_cast<std::int64_t>(std::stoll(lexeme))};
      return Value{static_cast<std::uint64_t>(std::stoull(lexeme))};
    } catch (const std::out_of_range&) {
      fail("number out of range: " + lexeme);
    } catch (const std::invalid_argument&) {
      fail("malformed number: " + lexeme);
    }
    return {};
  }

  Object object() {
    Object out;
    consume('{');
    if (consume('}')) return out;
    while (!failed()) {
      std::string key = string();
      if (failed()) break;
      if (out.count(key) != 0) {
        fail("duplicate key '" + key + "'", "json_duplicate_key");
        break;
      }
      if (!consume(':')) {
        fail("expected ':'");
        break;
      }
      Value item = value();
      if (failed()) break;
      out.emplace(std::move(key), std::move(item));
      if (consume('}')) break;
      if (!consume(',')) fail("expected ',' or '}'");
    }
    return out;
  }

  Array array() {
    Array out;
    consume('[');
    if (consume(']')) return out;
    while (!failed()) {
      out.push_back(value());
      if (failed()) break;
      if (consume(']')) break;
      if (!consume(',')) fail("expected ',' or ']'");
    }
    return out;
  }

  const std::string& text_;
  size_t pos_{0};
  std::optional<JsonError> error_;
};

void write_escaped(std::string& out, const std::string& s) {
  for (const char c : s) {
    switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
          out += buf;
        } else {
          out.push_back(c);
        }
    }
  }
}

void write_value(std::string& out, const Value& v);

struct Writer {
  std::string& out;

  void operator()(std::nullptr_t) const { out += "null"; }
  void operator()(bool b) const { out += b ? "true" : "false"; }
  void operator()(std::int64_t i) const { out += std::to_string(i); }
  void operator()(std::uint64_t u) const { out += std::to_string(u); }
  void operator()(double d) const { out += format_double(d); }
  void operator()(const std::string& s) const {
    out.push_back('"');
    write_escaped(out, s);
    out.push_back('"');
  }
  void operator()(const Object& obj) const {
    out.push_back('{');
    const char* sep = "";
    for (const auto& [key, item] : obj) {
      out += sep;
      (*this)(key);
      out.push_back(':');
      write_value(out, item);
      sep = ",";
    }
    out.push_back('}');
  }
  void operator()(const Array& arr) const {
    out.push_back('[');
    const char* sep = "";
    for (const auto& item : arr) {
      out += sep;
      write_value(out, item);
      sep = ",";
    }
    out.push_back(']');
  }
};

void write_value(std::string& out, const Value& v) { std::visit(Writer{out}, v.v); }

template <typename T>
const T* lookup(const Object& obj, const std::string& key) {
  const auto it = obj.find(key);
  return it == obj.end() ? nullptr : std::get_if<T>(&it->second.v);
}

}  // namespace

std::string format_double(double d) {
  char buf[64];
  const int n = std::snprintf(buf, sizeof(buf), "%.6f", d);
  if (n <= 0 || n >= static_cast<int>(sizeof(buf))) return "0.0";
  std::string text(buf, static_cast<size_t>(n));
  const size_t last = text.find_last_not_of('0');
  text.erase(last + 1);
  if (text.back() == '.') text.push_back('0');
  return text;
}

std::string to_json(const Value& v) {
  std::string out;
  write_value(out, v);
  return out;
}

std::string escape(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  write_escaped(out, s);
  return out;
}

Value parse_value(const std::string& text, std::optional<JsonError>* error) {
  Reader reader(text);
  Value root = reader.document();
  if (error) *error = reader.error();
  return reader.error() ? Value{} : root;
}

Object parse(const std::string& text, std::optional<JsonError>* error) {
  std::optional<JsonError> err;
  Value root = parse_value(text, &err);
  if (!err && !root.is_object()) err = JsonError{kParseError, "document root must be an object"};
  if (error) *error = err;
  if (err) return {};
  return std::get<Object>(std::move(root.v));
}

std::string get_string(const Object& obj, const std::string& key, const std::string& def) {
  const auto* s = lookup<std::string>(obj, key);
  return s ? *s : def;
}

bool get_bool(const Object& obj, const std::string& key, bool def) {
  const auto* b = lookup<bool>(obj, key);
  return b ? *b : def;
}

unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def) {
  const auto* u = lookup<std::uint64_t>(obj, key);
  return u ? *u : def;
}

std::int64_t get_i64(const Object& obj, const std::string& key, std::int64_t def) {
  if (const auto* i = lookup<std::int64_t>(obj, key)) return *i;
  if (const auto* u = lookup<std::uint64_t>(obj, key)) return static_cast<std::int64_t>(*u);
  return def;
}

std::vector<std::string> get_string_array(const Object& obj, const std::string& key) {
  std::vector<std::string> out;
  const auto* items = lookup<Array>(obj, key);
  if (!items) return out;
  for (const auto& item : *items) {
    if (const auto* s = std::get_if<std::string>(&item.v)) out.push_back(*s);
  }
  return out;
}

std::map<std::string, std::string> get_string_map(const Object& obj, const std::string& key) {
  std::map<std::string, std::string> out;
  const auto* nested = lookup<Object>(obj, key);
  if (!nested) return out;
  for (const auto& [k, item] : *nested) {
    if (const auto* s = std::get_if<std::string>(&item.v)) out.emplace(k, *s);
  }
  return out;
}

const Object* get_object(const Object& obj, const std::string& key) { return lookup<Object>(obj, key); }

}  // namespace trialbox::jsonlite
