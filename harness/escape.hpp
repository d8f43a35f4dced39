#ifndef HARNESS_ESCAPE_HPP
#define HARNESS_ESCAPE_HPP

#include <string>

// Test-case data reaches the harness only through these functions. Each one
// returns a complete literal (quotes included) that evaluates to exactly the
// bytes of its argument, whatever they contain.
namespace harness {

// A C or C++ string literal. Every non-printable byte, quote, backslash and
// question mark (trigraphs) is escaped; the literal may contain NUL bytes, so
// callers must carry the length separately.
std::string CStringLiteral(const std::string& str);

// A Java string literal for UTF-8 source files. Non-ASCII bytes are kept as
// they are, so the literal decodes to the same text when compiled with
// -encoding UTF-8.
std::string JavaStringLiteral(const std::string& str);

// A Python bytes literal, pure ASCII.
std::string PythonBytesLiteral(const std::string& str);

}  // namespace harness

#endif
