#ifndef LANGUAGE_LANGUAGE_HPP
#define LANGUAGE_LANGUAGE_HPP

#include <string>
#include <vector>

#include "proto/execution.pb.h"

namespace language {

// A supported language. The registry is closed: adding a language means adding
// an entry in language.cpp and a harness template.
struct Language {
  std::string value;
  std::string label;
  std::string file_extension;
  std::string base_image;

  // Name of the harness file inside the sandbox.
  std::string source_file;

  // Commands that must be available on the PATH for the local backend.
  std::vector<std::string> toolchain;

  // Whether an address space limit can be applied to the toolchain. Runtimes
  // that reserve large virtual memory regions at startup (the JVM, V8) fail
  // under RLIMIT_AS.
  bool limit_address_space = true;

  // Shell command template that compiles (if needed) and runs the harness.
  // $0 is the directory holding source_file, $1 a writable scratch directory.
  std::string command;

  // Returns the shell command for the given directories.
  std::string Command(const std::string& source_dir,
                      const std::string& scratch_dir) const;

  void ToProto(proto::Language* out) const;
};

// Returns the language with the given value, or nullptr if it is not
// supported.
const Language* Find(const std::string& value);

// All supported languages, in registration order.
const std::vector<Language>& All();

// Quotes a string for /bin/sh.
std::string ShellQuote(const std::string& str);

}  // namespace language

#endif
