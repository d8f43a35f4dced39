#include "absl/strings/str_cat.h"
#include "harness/escape.hpp"
#include "harness/templates.hpp"

namespace harness {

std::string CppTemplate::EncodeTestCases(const TestCases& test_cases) const {
  std::string encoded = "{\n";
  for (const proto::TestCase& test_case : test_cases) {
    absl::StrAppend(&encoded, "    {std::string(",
                    CStringLiteral(test_case.input()), ", ",
                    test_case.input().size(), "), std::string(",
                    CStringLiteral(test_case.expected()), ", ",
                    test_case.expected().size(), ")},\n");
  }
  return encoded + "}";
}

const std::map<int32_t, std::string>& CppTemplate::Dispatch() const {
  static const std::map<int32_t, std::string>* dispatch =
      new std::map<int32_t, std::string>{
          {kTwoSum, R"cpp(
  Value args = Reader("[" + input + "]").Parse();
  if (args.items.size() != 2) {
    throw std::invalid_argument("expected 2 arguments, got " +
                                std::to_string(args.items.size()));
  }
  std::vector<int> nums = ToIntVector(args.items[0]);
  int target = ToInt(args.items[1]);
  ::Solution solution;
  return ToJson(solution.twoSum(nums, target));
)cpp"},
          {kReverseString, R"cpp(
  std::vector<char> chars = ToCharVector(Reader(input).Parse());
  ::Solution solution;
  solution.reverseString(chars);
  return ToJson(chars);
)cpp"},
      };
  return *dispatch;
}

std::string CppTemplate::Assemble(const std::string& code,
                                  const std::string& test_cases,
                                  const std::string& dispatch) const {
  return absl::StrCat(R"cpp(#include <algorithm>
#include <cctype>
#include <climits>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <numeric>
#include <queue>
#include <set>
#include <sstream>
#include <stack>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

using namespace std;

)cpp",
                      code, "\n\n", R"cpp(namespace code_runner_harness {

const std::vector<std::pair<std::string, std::string>> kCases = )cpp",
                      test_cases, ";\n",
                      R"cpp(
struct Value {
  enum Kind { kNull, kBool, kNumber, kString, kArray };
  Kind kind = kNull;
  bool boolean = false;
  long long number = 0;
  std::string text;
  std::vector<Value> items;
};

// Reader for the JSON values used in test inputs.
class Reader {
 public:
  explicit Reader(std::string text) : text_(std::move(text)) {}

  Value Parse() {
    Value value = ParseValue();
    Skip();
    if (pos_ != text_.size()) {
      throw std::invalid_argument("unexpected input at " +
                                  std::to_string(pos_));
    }
    return value;
  }

 private:
  void Skip() {
    while (pos_ < text_.size() &&
           std::isspace(static_cast<unsigned char>(text_[pos_]))) {
      pos_++;
    }
  }

  bool Consume(char c) {
    Skip();
    if (pos_ < text_.size() && text_[pos_] == c) {
      pos_++;
      return true;
    }
    return false;
  }

  bool ConsumeWord(const char* word) {
    size_t len = std::strlen(word);
    if (text_.compare(pos_, len, word) != 0) return false;
    pos_ += len;
    return true;
  }

  Value ParseValue() {
    Skip();
    if (pos_ >= text_.size()) {
      throw std::invalid_argument("unexpected end of input");
    }
    Value value;
    char c = text_[pos_];
    if (c == '[') {
      pos_++;
      value.kind = Value::kArray;
      if (Consume(']')) return value;
      do {
        value.items.push_back(ParseValue());
      } while (Consume(','));
      if (!Consume(']')) {
        throw std::invalid_argument("expected ] at " + std::to_string(pos_));
      }
      return value;
    }
    if (c == '"') {
      value.kind = Value::kString;
      value.text = ParseString();
      return value;
    }
    if (ConsumeWord("true") || ConsumeWord("false")) {
      value.kind = Value::kBool;
      value.boolean = c == 't';
      return value;
    }
    if (ConsumeWord("null")) return value;
    size_t start = pos_;
    if (c == '-') pos_++;
    size_t digits = pos_;
    while (pos_ < text_.size() &&
           std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
      pos_++;
    }
    if (pos_ == digits) {
      throw std::invalid_argument("unexpected character at " +
                                  std::to_string(start));
    }
    value.kind = Value::kNumber;
    value.number = std::stoll(text_.substr(start, pos_ - start));
    return value;
  }

  void AppendUtf8(unsigned code, std::string* out) {
    if (code < 0x80) {
      *out += static_cast<char>(code);
    } else if (code < 0x800) {
      *out += static_cast<char>(0xc0 | (code >> 6));
      *out += static_cast<char>(0x80 | (code & 0x3f));
    } else {
      *out += static_cast<char>(0xe0 | (code >> 12));
      *out += static_cast<char>(0x80 | ((code >> 6) & 0x3f));
      *out += static_cast<char>(0x80 | (code & 0x3f));
    }
  }

  std::string ParseString() {
    std::string out;
    pos_++;
    while (true) {
      if (pos_ >= text_.size()) {
        throw std::invalid_argument("unterminated string");
      }
      char c = text_[pos_++];
      if (c == '"') return out;
      if (c != '\\') {
        out += c;
        continue;
      }
      if (pos_ >= text_.size()) {
        throw std::invalid_argument("unterminated string");
      }
      char escape = text_[pos_++];
      switch (escape) {
        case 'n': out += '\n'; break;
        case 'r': out += '\r'; break;
        case 't': out += '\t'; break;
        case 'b': out += '\b'; break;
        case 'f': out += '\f'; break;
        case '"':
        case '\\':
        case '/':
          out += escape;
          break;
        case 'u':
          if (pos_ + 4 > text_.size()) {
            throw std::invalid_argument("truncated escape");
          }
          for (size_t i = pos_; i < pos_ + 4; i++) {
            if (!std::isxdigit(static_cast<unsigned char>(text_[i]))) {
              throw std::invalid_argument("invalid escape");
            }
          }
          AppendUtf8(std::stoul(text_.substr(pos_, 4), nullptr, 16), &out);
          pos_ += 4;
          break;
        default:
          throw std::invalid_argument("invalid escape");
      }
    }
  }

  std::string text_;
  size_t pos_ = 0;
};

std::string Quote(const std::string& s) {
  std::string out = "\"";
  for (char c : s) {
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
          std::snprintf(buf, sizeof(buf), "\\u%04x", c);
          out += buf;
        } else {
          out += c;
        }
    }
  }
  return out + "\"";
}

// Length of the UTF-8 sequence at s[i], or 0 if it is not valid.
size_t Utf8SequenceLength(const std::string& s, size_t i) {
  unsigned char c = static_cast<unsigned char>(s[i]);
  if (c < 0x80) return 1;
  size_t len;
  unsigned long min;
  unsigned long code;
  if ((c & 0xe0) == 0xc0) {
    len = 2;
    min = 0x80;
    code = c & 0x1f;
  } else if ((c & 0xf0) == 0xe0) {
    len = 3;
    min = 0x800;
    code = c & 0x0f;
  } else if ((c & 0xf8) == 0xf0) {
    len = 4;
    min = 0x10000;
    code = c & 0x07;
  } else {
    return 0;
  }
  if (i + len > s.size()) return 0;
  for (size_t j = 1; j < len; j++) {
    unsigned char next = static_cast<unsigned char>(s[i + j]);
    if ((next & 0xc0) != 0x80) return 0;
    code = (code << 6) | (next & 0x3f);
  }
  if (code < min || code > 0x10ffff || (code >= 0xd800 && code <= 0xdfff)) {
    return 0;
  }
  return len;
}

bool IsValidUtf8(const std::string& s) {
  for (size_t i = 0; i < s.size();) {
    size_t len = Utf8SequenceLength(s, i);
    if (len == 0) return false;
    i += len;
  }
  return true;
}

// Replaces the bytes that are not valid UTF-8 with \xNN.
std::string EscapeInvalidUtf8(const std::string& s) {
  std::string out;
  for (size_t i = 0; i < s.size();) {
    size_t len = Utf8SequenceLength(s, i);
    if (len == 0) {
      char buf[8];
      std::snprintf(buf, sizeof(buf), "\\x%02x",
                    static_cast<unsigned char>(s[i]));
      out += buf;
      i++;
    } else {
      out.append(s, i, len);
      i += len;
    }
  }
  return out;
}

std::string ToJson(bool value) { return value ? "true" : "false"; }
std::string ToJson(int value) { return std::to_string(value); }
std::string ToJson(long value) { return std::to_string(value); }
std::string ToJson(long long value) { return std::to_string(value); }
std::string ToJson(char value) { return Quote(std::string(1, value)); }
std::string ToJson(const std::string& value) { return Quote(value); }

template <typename T>
std::string ToJson(const std::vector<T>& items) {
  std::string out = "[";
  for (size_t i = 0; i < items.size(); i++) {
    if (i) out += ",";
    out += ToJson(static_cast<const T&>(items[i]));
  }
  return out + "]";
}

int ToInt(const Value& value) {
  if (value.kind != Value::kNumber || value.number < INT_MIN ||
      value.number > INT_MAX) {
    throw std::invalid_argument("expected an integer");
  }
  return static_cast<int>(value.number);
}

std::vector<int> ToIntVector(const Value& value) {
  if (value.kind != Value::kArray) {
    throw std::invalid_argument("expected an array");
  }
  std::vector<int> result;
  for (const Value& item : value.items) result.push_back(ToInt(item));
  return result;
}

std::vector<char> ToCharVector(const Value& value) {
  if (value.kind != Value::kArray) {
    throw std::invalid_argument("expected an array");
  }
  std::vector<char> result;
  for (const Value& item : value.items) {
    if (item.kind != Value::kString || item.text.size() != 1 ||
        static_cast<unsigned char>(item.text[0]) >= 0x80) {
      throw std::invalid_argument("expected one-character ASCII strings");
    }
    result.push_back(item.text[0]);
  }
  return result;
}

std::string Run(const std::string& input) {)cpp",
                      dispatch, R"cpp(}

}  // namespace code_runner_harness

int main() {
  using code_runner_harness::kCases;
  using code_runner_harness::Quote;
  std::string out = "{\"success\":true,\"test_results\":[";
  for (size_t i = 0; i < kCases.size(); i++) {
    bool has_output = false;
    std::string output;
    std::string error;
    try {
      output = code_runner_harness::Run(kCases[i].first);
      has_output = code_runner_harness::IsValidUtf8(output);
      if (!has_output) error = "output is not valid UTF-8";
    } catch (const std::exception& e) {
      error = code_runner_harness::EscapeInvalidUtf8(e.what());
    } catch (...) {
      error = "unknown exception";
    }
    if (i) out += ",";
    out += "{\"testCase\":" + std::to_string(i + 1);
    out += ",\"input\":" + Quote(kCases[i].first);
    out += ",\"expected\":" + Quote(kCases[i].second);
    out += ",\"output\":" + (has_output ? Quote(output) : std::string("null"));
    out += std::string(",\"passed\":") +
           (has_output && output == kCases[i].second ? "true" : "false");
    out += ",\"error\":" + (has_output ? std::string("null") : Quote(error));
    out += "}";
  }
  out += "]}\n";
  std::fwrite(out.data(), 1, out.size(), stdout);
  std::fflush(stdout);
  return 0;
}
)cpp");
}

}  // namespace harness
