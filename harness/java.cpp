#include "absl/strings/str_cat.h"
#include "harness/escape.hpp"
#include "harness/templates.hpp"

namespace harness {

std::string JavaTemplate::EncodeTestCases(const TestCases& test_cases) const {
  std::string encoded = "{\n";
  for (const proto::TestCase& test_case : test_cases) {
    absl::StrAppend(&encoded, "      {", JavaStringLiteral(test_case.input()),
                    ", ", JavaStringLiteral(test_case.expected()), "},\n");
  }
  return encoded + "  }";
}

const std::map<int32_t, std::string>& JavaTemplate::Dispatch() const {
  static const std::map<int32_t, std::string>* dispatch =
      new std::map<int32_t, std::string>{
          {kTwoSum, R"java(
    java.util.List<?> args = asList(new JsonReader("[" + input + "]").parse());
    if (args.size() != 2) {
      throw new IllegalArgumentException(
          "expected 2 arguments, got " + args.size());
    }
    int[] nums = toIntArray(args.get(0));
    int target = toInt(args.get(1));
    return call("twoSum", new Class<?>[] {int[].class, int.class}, nums,
        target);
)java"},
          {kReverseString, R"java(
    char[] chars = toCharArray(new JsonReader(input).parse());
    call("reverseString", new Class<?>[] {char[].class}, (Object) chars);
    return chars;
)java"},
      };
  return *dispatch;
}

std::string JavaTemplate::Assemble(const std::string& code,
                                   const std::string& test_cases,
                                   const std::string& dispatch) const {
  return absl::StrCat("import java.util.*;\nimport java.io.*;\n\n", code,
                      "\n\n",
                      R"java(public class CodeRunnerHarness {
  private static final String[][] CASES = )java",
                      test_cases, ";\n",
                      R"java(
  private static Object run(String input) throws Throwable {)java",
                      dispatch, "  }\n",
                      R"java(
  // Reader for the JSON values used in test inputs.
  private static final class JsonReader {
    private final String text;
    private int pos = 0;

    JsonReader(String text) {
      this.text = text;
    }

    Object parse() {
      Object value = value();
      skip();
      if (pos != text.length()) {
        throw new IllegalArgumentException("unexpected input at " + pos);
      }
      return value;
    }

    private void skip() {
      while (pos < text.length() && Character.isWhitespace(text.charAt(pos))) {
        pos++;
      }
    }

    private boolean consume(char c) {
      skip();
      if (pos < text.length() && text.charAt(pos) == c) {
        pos++;
        return true;
      }
      return false;
    }

    private Object value() {
      skip();
      if (pos >= text.length()) {
        throw new IllegalArgumentException("unexpected end of input");
      }
      char c = text.charAt(pos);
      if (c == '[') {
        pos++;
        java.util.List<Object> items = new java.util.ArrayList<Object>();
        if (consume(']')) {
          return items;
        }
        do {
          items.add(value());
        } while (consume(','));
        if (!consume(']')) {
          throw new IllegalArgumentException("expected ] at " + pos);
        }
        return items;
      }
      if (c == '"') {
        return string();
      }
      if (text.startsWith("true", pos)) {
        pos += 4;
        return Boolean.TRUE;
      }
      if (text.startsWith("false", pos)) {
        pos += 5;
        return Boolean.FALSE;
      }
      if (text.startsWith("null", pos)) {
        pos += 4;
        return null;
      }
      int start = pos;
      if (c == '-') {
        pos++;
      }
      int digits = pos;
      while (pos < text.length() && Character.isDigit(text.charAt(pos))) {
        pos++;
      }
      if (pos == digits) {
        throw new IllegalArgumentException("unexpected character at " + start);
      }
      return Long.parseLong(text.substring(start, pos));
    }

    private String string() {
      StringBuilder sb = new StringBuilder();
      pos++;
      while (true) {
        if (pos >= text.length()) {
          throw new IllegalArgumentException("unterminated string");
        }
        char c = text.charAt(pos++);
        if (c == '"') {
          return sb.toString();
        }
        if (c != '\\') {
          sb.append(c);
          continue;
        }
        if (pos >= text.length()) {
          throw new IllegalArgumentException("unterminated string");
        }
        char escape = text.charAt(pos++);
        switch (escape) {
          case 'n': sb.append('\n'); break;
          case 'r': sb.append('\r'); break;
          case 't': sb.append('\t'); break;
          case 'b': sb.append('\b'); break;
          case 'f': sb.append('\f'); break;
          case '"':
          case '\\':
          case '/':
            sb.append(escape);
            break;
          case 'u':
            if (pos + 4 > text.length()) {
              throw new IllegalArgumentException("truncated escape");
            }
            for (int i = pos; i < pos + 4; i++) {
              if (Character.digit(text.charAt(i), 16) < 0) {
                throw new IllegalArgumentException("invalid escape");
              }
            }
            sb.append((char) Integer.parseInt(text.substring(pos, pos + 4), 16));
            pos += 4;
            break;
          default:
            throw new IllegalArgumentException("invalid escape");
        }
      }
    }
  }

  private static java.util.List<?> asList(Object value) {
    if (!(value instanceof java.util.List)) {
      throw new IllegalArgumentException("expected an array");
    }
    return (java.util.List<?>) value;
  }

  private static int toInt(Object value) {
    if (!(value instanceof Long)) {
      throw new IllegalArgumentException("expected an integer");
    }
    return Math.toIntExact((Long) value);
  }

  private static int[] toIntArray(Object value) {
    java.util.List<?> items = asList(value);
    int[] result = new int[items.size()];
    for (int i = 0; i < result.length; i++) {
      result[i] = toInt(items.get(i));
    }
    return result;
  }

  private static char[] toCharArray(Object value) {
    java.util.List<?> items = asList(value);
    char[] result = new char[items.size()];
    for (int i = 0; i < result.length; i++) {
      Object item = items.get(i);
      if (!(item instanceof String) || ((String) item).length() != 1) {
        throw new IllegalArgumentException("expected one-character strings");
      }
      result[i] = ((String) item).charAt(0);
    }
    return result;
  }

  private static Object call(String name, Class<?>[] types, Object... args)
      throws Throwable {
    Class<?> solution;
    try {
      solution = Class.forName("Solution");
    } catch (ClassNotFoundException e) {
      throw new IllegalStateException("class Solution is not defined");
    }
    java.lang.reflect.Method method;
    try {
      method = solution.getDeclaredMethod(name, types);
    } catch (NoSuchMethodException e) {
      throw new IllegalStateException("Solution." + name + " is not defined");
    }
    method.setAccessible(true);
    Object target = null;
    if (!java.lang.reflect.Modifier.isStatic(method.getModifiers())) {
      java.lang.reflect.Constructor<?> constructor =
          solution.getDeclaredConstructor();
      constructor.setAccessible(true);
      target = constructor.newInstance();
    }
    try {
      return method.invoke(target, args);
    } catch (java.lang.reflect.InvocationTargetException e) {
      throw e.getCause();
    }
  }

  private static boolean wellFormed(String s) {
    for (int i = 0; i < s.length(); i++) {
      char c = s.charAt(i);
      if (Character.isHighSurrogate(c)) {
        if (i + 1 >= s.length() || !Character.isLowSurrogate(s.charAt(i + 1))) {
          return false;
        }
        i++;
      } else if (Character.isLowSurrogate(c)) {
        return false;
      }
    }
    return true;
  }

  private static String replaceSurrogates(String s) {
    StringBuilder sb = new StringBuilder();
    for (int i = 0; i < s.length(); i++) {
      char c = s.charAt(i);
      if (Character.isHighSurrogate(c) && i + 1 < s.length()
          && Character.isLowSurrogate(s.charAt(i + 1))) {
        sb.append(c).append(s.charAt(++i));
      } else if (Character.isSurrogate(c)) {
        sb.append('\ufffd');
      } else {
        sb.append(c);
      }
    }
    return sb.toString();
  }

  private static void quote(StringBuilder sb, String s) {
    sb.append('"');
    for (int i = 0; i < s.length(); i++) {
      char c = s.charAt(i);
      switch (c) {
        case '"': sb.append("\\\""); break;
        case '\\': sb.append("\\\\"); break;
        case '\n': sb.append("\\n"); break;
        case '\r': sb.append("\\r"); break;
        case '\t': sb.append("\\t"); break;
        case '\b': sb.append("\\b"); break;
        case '\f': sb.append("\\f"); break;
        default:
          if (c < 0x20) {
            sb.append(String.format("\\u%04x", (int) c));
          } else {
            sb.append(c);
          }
      }
    }
    sb.append('"');
  }

  private static void write(StringBuilder sb, Object value) {
    if (value == null) {
      sb.append("null");
    } else if (value instanceof String) {
      quote(sb, (String) value);
    } else if (value instanceof Character) {
      quote(sb, value.toString());
    } else if (value instanceof Number || value instanceof Boolean) {
      sb.append(value);
    } else if (value instanceof int[]) {
      int[] items = (int[]) value;
      sb.append('[');
      for (int i = 0; i < items.length; i++) {
        if (i > 0) sb.append(',');
        sb.append(items[i]);
      }
      sb.append(']');
    } else if (value instanceof long[]) {
      long[] items = (long[]) value;
      sb.append('[');
      for (int i = 0; i < items.length; i++) {
        if (i > 0) sb.append(',');
        sb.append(items[i]);
      }
      sb.append(']');
    } else if (value instanceof char[]) {
      char[] items = (char[]) value;
      sb.append('[');
      for (int i = 0; i < items.length; i++) {
        if (i > 0) sb.append(',');
        quote(sb, String.valueOf(items[i]));
      }
      sb.append(']');
    } else if (value instanceof Object[]) {
      write(sb, java.util.Arrays.asList((Object[]) value));
    } else if (value instanceof Iterable) {
      sb.append('[');
      boolean first = true;
      for (Object item : (Iterable<?>) value) {
        if (!first) sb.append(',');
        first = false;
        write(sb, item);
      }
      sb.append(']');
    } else {
      throw new IllegalArgumentException(
          "cannot serialize " + value.getClass().getName());
    }
  }

  public static void main(String[] args) throws Exception {
    java.io.PrintStream out = new java.io.PrintStream(
        new java.io.FileOutputStream(java.io.FileDescriptor.out), false,
        "UTF-8");
    StringBuilder sb = new StringBuilder("{\"success\":true,\"test_results\":[");
    for (int i = 0; i < CASES.length; i++) {
      String output = null;
      String error = null;
      try {
        StringBuilder result = new StringBuilder();
        write(result, run(CASES[i][0]));
        if (!wellFormed(result.toString())) {
          throw new IllegalArgumentException("output is not valid UTF-8");
        }
        output = result.toString();
      } catch (Throwable t) {
        error = replaceSurrogates(
            t.getMessage() != null ? t.getMessage() : t.getClass().getName());
      }
      if (i > 0) sb.append(',');
      sb.append("{\"testCase\":").append(i + 1);
      sb.append(",\"input\":");
      quote(sb, CASES[i][0]);
      sb.append(",\"expected\":");
      quote(sb, CASES[i][1]);
      sb.append(",\"output\":");
      if (output == null) {
        sb.append("null");
      } else {
        quote(sb, output);
      }
      sb.append(",\"passed\":").append(output != null && output.equals(CASES[i][1]));
      sb.append(",\"error\":");
      if (error == null) {
        sb.append("null");
      } else {
        quote(sb, error);
      }
      sb.append('}');
    }
    sb.append("]}");
    out.println(sb);
    out.flush();
  }
}
)java");
}

}  // namespace harness
