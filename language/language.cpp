#include "language/language.hpp"

#include "absl/strings/str_replace.h"
#include "absl/strings/substitute.h"

namespace language {

namespace {

std::vector<Language> MakeRegistry() {
  std::vector<Language> languages(5);

  Language& javascript = languages[0];
  javascript.value = "javascript";
  javascript.label = "JavaScript";
  javascript.file_extension = ".js";
  javascript.base_image = "node:18-alpine";
  javascript.source_file = "main.js";
  javascript.toolchain = {"node"};
  javascript.limit_address_space = false;
  javascript.command = "node $0/main.js";

  Language& python = languages[1];
  python.value = "python";
  python.label = "Python";
  python.file_extension = ".py";
  python.base_image = "python:3.11-alpine";
  python.source_file = "main.py";
  python.toolchain = {"python3"};
  python.command = "python3 -I -B $0/main.py";

  Language& java = languages[2];
  java.value = "java";
  java.label = "Java";
  java.file_extension = ".java";
  java.base_image = "openjdk:17-alpine";
  java.source_file = "CodeRunnerHarness.java";
  java.toolchain = {"javac", "java"};
  java.limit_address_space = false;
  java.command =
      "javac -encoding UTF-8 -nowarn -d $1 $0/CodeRunnerHarness.java && "
      "java -Xss64m -cp $1 CodeRunnerHarness";

  Language& cpp = languages[3];
  cpp.value = "cpp";
  cpp.label = "C++";
  cpp.file_extension = ".cpp";
  cpp.base_image = "gcc:latest";
  cpp.source_file = "main.cpp";
  cpp.toolchain = {"g++"};
  cpp.command = "g++ -std=c++17 -O2 -pipe -o $1/main $0/main.cpp && $1/main";

  Language& c = languages[4];
  c.value = "c";
  c.label = "C";
  c.file_extension = ".c";
  c.base_image = "gcc:latest";
  c.source_file = "main.c";
  c.toolchain = {"gcc"};
  c.command = "gcc -std=gnu11 -O2 -pipe -o $1/main $0/main.c -lm && $1/main";

  return languages;
}

}  // namespace

std::string Language::Command(const std::string& source_dir,
                              const std::string& scratch_dir) const {
  return absl::Substitute(command, ShellQuote(source_dir),
                          ShellQuote(scratch_dir));
}

void Language::ToProto(proto::Language* out) const {
  out->set_value(value);
  out->set_label(label);
  out->set_file_extension(file_extension);
  out->set_base_image(base_image);
}

const std::vector<Language>& All() {
  static const std::vector<Language>* languages =
      new std::vector<Language>(MakeRegistry());
  return *languages;
}

const Language* Find(const std::string& value) {
  for (const Language& language : All()) {
    if (language.value == value) return &language;
  }
  return nullptr;
}

std::string ShellQuote(const std::string& str) {
  return "'" + absl::StrReplaceAll(str, {{"'", "'\\''"}}) + "'";
}

}  // namespace language
