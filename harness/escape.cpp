#include "harness/escape.hpp"

#include "absl/strings/escaping.h"
#include "absl/strings/str_replace.h"

namespace harness {

std::string CStringLiteral(const std::string& str) {
  return "\"" + absl::StrReplaceAll(absl::CEscape(str), {{"?", "\\?"}}) +
         "\"";
}

std::string JavaStringLiteral(const std::string& str) {
  std::string literal = "\"";
  for (char ch : str) {
    unsigned char c = static_cast<unsigned char>(ch);
    switch (c) {
      case '\n':
        literal += "\\n";
        break;
      case '\r':
        literal += "\\r";
        break;
      case '\t':
        literal += "\\t";
        break;
      case '"':
        literal += "\\\"";
        break;
      case '\\':
        literal += "\\\\";
        break;
      default:
        if (c < 0x20 || c == 0x7f) {
          // Three octal digits, so that a following digit is never consumed.
          literal += '\\';
          literal += static_cast<char>('0' + ((c >> 6) & 7));
          literal += static_cast<char>('0' + ((c >> 3) & 7));
          literal += static_cast<char>('0' + (c & 7));
        } else {
          literal += ch;
        }
    }
  }
  return literal + "\"";
}

std::string PythonBytesLiteral(const std::string& str) {
  return "b\"" + absl::CEscape(str) + "\"";
}

}  // namespace harness
