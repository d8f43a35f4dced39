#include "absl/strings/str_cat.h"
#include "harness/escape.hpp"
#include "harness/templates.hpp"

namespace harness {

std::string CTemplate::EncodeTestCases(const TestCases& test_cases) const {
  std::string encoded = "{\n";
  for (const proto::TestCase& test_case : test_cases) {
    absl::StrAppend(&encoded, "    {", CStringLiteral(test_case.input()), ", ",
                    test_case.input().size(), ", ",
                    CStringLiteral(test_case.expected()), ", ",
                    test_case.expected().size(), "},\n");
  }
  // Terminator, so that the array is never empty.
  return encoded + "    {NULL, 0, NULL, 0},\n}";
}

const std::map<int32_t, std::string>& CTemplate::Dispatch() const {
  static const std::map<int32_t, std::string>* dispatch =
      new std::map<int32_t, std::string>{
          {kTwoSum, R"c(
  size_t pos = 0;
  int* nums = NULL;
  int nums_size = 0;
  int target = 0;
  const char* error = code_runner_harness_parse_int_array(
      input, input_size, &pos, &nums, &nums_size);
  if (!error) error = code_runner_harness_expect(input, input_size, &pos, ',');
  if (!error) {
    error = code_runner_harness_parse_int(input, input_size, &pos, &target);
  }
  if (!error) error = code_runner_harness_expect_end(input, input_size, &pos);
  if (error) {
    free(nums);
    return error;
  }
  int return_size = 0;
  int* result = twoSum(nums, nums_size, target, &return_size);
  code_runner_harness_write_int_array(output, result, return_size);
  free(result);
  free(nums);
  return NULL;
)c"},
          {kReverseString, R"c(
  size_t pos = 0;
  char* chars = NULL;
  int chars_size = 0;
  const char* error = code_runner_harness_parse_char_array(
      input, input_size, &pos, &chars, &chars_size);
  if (!error) error = code_runner_harness_expect_end(input, input_size, &pos);
  if (error) {
    free(chars);
    return error;
  }
  reverseString(chars, chars_size);
  code_runner_harness_write_char_array(output, chars, chars_size);
  free(chars);
  return NULL;
)c"},
      };
  return *dispatch;
}

std::string CTemplate::Assemble(const std::string& code,
                                const std::string& test_cases,
                                const std::string& dispatch) const {
  return absl::StrCat(R"c(#include <ctype.h>
#include <limits.h>
#include <math.h>
#include <stdbool.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

)c",
                      code, "\n\n", R"c(struct code_runner_harness_case {
  const char* input;
  size_t input_size;
  const char* expected;
  size_t expected_size;
};

static const struct code_runner_harness_case code_runner_harness_cases[] = )c",
                      test_cases, ";\n",
                      R"c(
struct code_runner_harness_buffer {
  char* data;
  size_t size;
  size_t capacity;
};

static void code_runner_harness_append(struct code_runner_harness_buffer* buf,
                                       const char* data, size_t size) {
  if (buf->size + size + 1 > buf->capacity) {
    size_t capacity = buf->capacity ? buf->capacity : 64;
    while (buf->size + size + 1 > capacity) capacity *= 2;
    char* grown = (char*)realloc(buf->data, capacity);
    if (!grown) {
      fputs("harness: out of memory\n", stderr);
      exit(70);
    }
    buf->data = grown;
    buf->capacity = capacity;
  }
  memcpy(buf->data + buf->size, data, size);
  buf->size += size;
  buf->data[buf->size] = '\0';
}

static void code_runner_harness_append_str(
    struct code_runner_harness_buffer* buf, const char* str) {
  code_runner_harness_append(buf, str, strlen(str));
}

static void code_runner_harness_quote(struct code_runner_harness_buffer* buf,
                                      const char* data, size_t size) {
  code_runner_harness_append_str(buf, "\"");
  for (size_t i = 0; i < size; i++) {
    unsigned char c = (unsigned char)data[i];
    char escaped[8];
    switch (c) {
      case '"': code_runner_harness_append_str(buf, "\\\""); break;
      case '\\': code_runner_harness_append_str(buf, "\\\\"); break;
      case '\n': code_runner_harness_append_str(buf, "\\n"); break;
      case '\r': code_runner_harness_append_str(buf, "\\r"); break;
      case '\t': code_runner_harness_append_str(buf, "\\t"); break;
      case '\b': code_runner_harness_append_str(buf, "\\b"); break;
      case '\f': code_runner_harness_append_str(buf, "\\f"); break;
      default:
        if (c < 0x20) {
          snprintf(escaped, sizeof(escaped), "\\u%04x", c);
          code_runner_harness_append_str(buf, escaped);
        } else {
          code_runner_harness_append(buf, (const char*)&data[i], 1);
        }
    }
  }
  code_runner_harness_append_str(buf, "\"");
}

static int code_runner_harness_valid_utf8(const char* data, size_t size) {
  size_t i = 0;
  while (i < size) {
    unsigned char c = (unsigned char)data[i];
    size_t len;
    unsigned long min;
    unsigned long code;
    if (c < 0x80) {
      i++;
      continue;
    }
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
    if (i + len > size) return 0;
    for (size_t j = 1; j < len; j++) {
      unsigned char next = (unsigned char)data[i + j];
      if ((next & 0xc0) != 0x80) return 0;
      code = (code << 6) | (next & 0x3f);
    }
    if (code < min || code > 0x10ffff || (code >= 0xd800 && code <= 0xdfff)) {
      return 0;
    }
    i += len;
  }
  return 1;
}

static void code_runner_harness_skip(const char* s, size_t n, size_t* pos) {
  while (*pos < n && isspace((unsigned char)s[*pos])) (*pos)++;
}

static const char* code_runner_harness_expect(const char* s, size_t n,
                                              size_t* pos, char c) {
  code_runner_harness_skip(s, n, pos);
  if (*pos >= n || s[*pos] != c) return "unexpected character in input";
  (*pos)++;
  return NULL;
}

static const char* code_runner_harness_expect_end(const char* s, size_t n,
                                                  size_t* pos) {
  code_runner_harness_skip(s, n, pos);
  return *pos == n ? NULL : "unexpected trailing input";
}

static const char* code_runner_harness_parse_int(const char* s, size_t n,
                                                 size_t* pos, int* out) {
  code_runner_harness_skip(s, n, pos);
  int negative = 0;
  if (*pos < n && s[*pos] == '-') {
    negative = 1;
    (*pos)++;
  }
  size_t start = *pos;
  long long value = 0;
  while (*pos < n && isdigit((unsigned char)s[*pos])) {
    value = value * 10 + (s[*pos] - '0');
    if (value > (long long)INT_MAX + 1) return "integer out of range";
    (*pos)++;
  }
  if (*pos == start) return "expected an integer";
  if (negative) value = -value;
  if (value > INT_MAX || value < INT_MIN) return "integer out of range";
  *out = (int)value;
  return NULL;
}

static const char* code_runner_harness_parse_int_array(const char* s, size_t n,
                                                       size_t* pos, int** out,
                                                       int* count) {
  const char* error = code_runner_harness_expect(s, n, pos, '[');
  if (error) return "expected an array";
  int capacity = 8;
  *count = 0;
  *out = (int*)malloc(sizeof(int) * capacity);
  if (!*out) return "out of memory";
  code_runner_harness_skip(s, n, pos);
  if (*pos < n && s[*pos] == ']') {
    (*pos)++;
    return NULL;
  }
  while (1) {
    int value = 0;
    error = code_runner_harness_parse_int(s, n, pos, &value);
    if (error) return error;
    if (*count == capacity) {
      capacity *= 2;
      int* grown = (int*)realloc(*out, sizeof(int) * capacity);
      if (!grown) return "out of memory";
      *out = grown;
    }
    (*out)[(*count)++] = value;
    code_runner_harness_skip(s, n, pos);
    if (*pos < n && s[*pos] == ',') {
      (*pos)++;
      continue;
    }
    return code_runner_harness_expect(s, n, pos, ']');
  }
}

static const char* code_runner_harness_parse_char(const char* s, size_t n,
                                                  size_t* pos, char* out) {
  const char* error = code_runner_harness_expect(s, n, pos, '"');
  if (error) return "expected a string";
  if (*pos >= n) return "unterminated string";
  char c = s[(*pos)++];
  if (c == '\\') {
    if (*pos >= n) return "unterminated string";
    char escape = s[(*pos)++];
    switch (escape) {
      case 'n': c = '\n'; break;
      case 'r': c = '\r'; break;
      case 't': c = '\t'; break;
      case 'b': c = '\b'; break;
      case 'f': c = '\f'; break;
      case '"':
      case '\\':
      case '/':
        c = escape;
        break;
      case 'u': {
        if (*pos + 4 > n) return "truncated escape";
        char hex[5] = {0};
        memcpy(hex, s + *pos, 4);
        for (int i = 0; i < 4; i++) {
          if (!isxdigit((unsigned char)hex[i])) return "invalid escape";
        }
        long code = strtol(hex, NULL, 16);
        if (code >= 0x80) return "expected one-character ASCII strings";
        c = (char)code;
        *pos += 4;
        break;
      }
      default:
        return "invalid escape";
    }
  } else if (c == '"') {
    return "expected one-character ASCII strings";
  }
  if (*pos >= n || s[*pos] != '"') {
    return "expected one-character ASCII strings";
  }
  (*pos)++;
  *out = c;
  return NULL;
}

static const char* code_runner_harness_parse_char_array(const char* s, size_t n,
                                                        size_t* pos, char** out,
                                                        int* count) {
  const char* error = code_runner_harness_expect(s, n, pos, '[');
  if (error) return "expected an array";
  int capacity = 8;
  *count = 0;
  *out = (char*)malloc(capacity);
  if (!*out) return "out of memory";
  code_runner_harness_skip(s, n, pos);
  if (*pos < n && s[*pos] == ']') {
    (*pos)++;
    return NULL;
  }
  while (1) {
    char value = 0;
    error = code_runner_harness_parse_char(s, n, pos, &value);
    if (error) return error;
    if (*count == capacity) {
      capacity *= 2;
      char* grown = (char*)realloc(*out, capacity);
      if (!grown) return "out of memory";
      *out = grown;
    }
    (*out)[(*count)++] = value;
    code_runner_harness_skip(s, n, pos);
    if (*pos < n && s[*pos] == ',') {
      (*pos)++;
      continue;
    }
    return code_runner_harness_expect(s, n, pos, ']');
  }
}

static void code_runner_harness_write_int_array(
    struct code_runner_harness_buffer* buf, const int* items, int count) {
  if (!items) {
    code_runner_harness_append_str(buf, "null");
    return;
  }
  char number[16];
  code_runner_harness_append_str(buf, "[");
  for (int i = 0; i < count; i++) {
    if (i) code_runner_harness_append_str(buf, ",");
    snprintf(number, sizeof(number), "%d", items[i]);
    code_runner_harness_append_str(buf, number);
  }
  code_runner_harness_append_str(buf, "]");
}

static void code_runner_harness_write_char_array(
    struct code_runner_harness_buffer* buf, const char* items, int count) {
  code_runner_harness_append_str(buf, "[");
  for (int i = 0; i < count; i++) {
    if (i) code_runner_harness_append_str(buf, ",");
    code_runner_harness_quote(buf, &items[i], 1);
  }
  code_runner_harness_append_str(buf, "]");
}

static const char* code_runner_harness_run(
    const char* input, size_t input_size,
    struct code_runner_harness_buffer* output) {)c",
                      dispatch, R"c(}

int main(void) {
  struct code_runner_harness_buffer out = {NULL, 0, 0};
  char number[32];
  code_runner_harness_append_str(&out, "{\"success\":true,\"test_results\":[");
  for (size_t i = 0; code_runner_harness_cases[i].input != NULL; i++) {
    const struct code_runner_harness_case* test_case =
        &code_runner_harness_cases[i];
    struct code_runner_harness_buffer output = {NULL, 0, 0};
    const char* error = code_runner_harness_run(
        test_case->input, test_case->input_size, &output);
    if (!error && !code_runner_harness_valid_utf8(output.data, output.size)) {
      error = "output is not valid UTF-8";
    }
    if (i) code_runner_harness_append_str(&out, ",");
    snprintf(number, sizeof(number), "%zu", i + 1);
    code_runner_harness_append_str(&out, "{\"testCase\":");
    code_runner_harness_append_str(&out, number);
    code_runner_harness_append_str(&out, ",\"input\":");
    code_runner_harness_quote(&out, test_case->input, test_case->input_size);
    code_runner_harness_append_str(&out, ",\"expected\":");
    code_runner_harness_quote(&out, test_case->expected,
                              test_case->expected_size);
    if (error) {
      code_runner_harness_append_str(&out,
                                     ",\"output\":null,\"passed\":false");
      code_runner_harness_append_str(&out, ",\"error\":");
      code_runner_harness_quote(&out, error, strlen(error));
    } else {
      int passed = output.size == test_case->expected_size &&
                   (output.size == 0 ||
                    memcmp(output.data, test_case->expected, output.size) == 0);
      code_runner_harness_append_str(&out, ",\"output\":");
      code_runner_harness_quote(&out, output.size ? output.data : "",
                                output.size);
      code_runner_harness_append_str(&out, passed ? ",\"passed\":true"
                                                  : ",\"passed\":false");
      code_runner_harness_append_str(&out, ",\"error\":null");
    }
    code_runner_harness_append_str(&out, "}");
    free(output.data);
  }
  code_runner_harness_append_str(&out, "]}\n");
  fwrite(out.data, 1, out.size, stdout);
  fflush(stdout);
  free(out.data);
  return 0;
}
)c");
}

}  // namespace harness
