#ifndef EXECUTOR_LANGUAGE_HPP
#define EXECUTOR_LANGUAGE_HPP

#include <string>
#include <vector>

namespace executor {

enum class Language {
  PYTHON,
  JAVASCRIPT,
  TYPESCRIPT,
  RUST,
  GO,
  SHELL,
  RUBY,
  WASM  // A WebAssembly module, in text or binary format.
};

// Every language, in declaration order.
const std::vector<Language>& AllLanguages();

// Canonical lowercase name ("python", "javascript", ...).
std::string LanguageName(Language language);

// Parses a language name or one of its aliases (py, js, node, ts, rs,
// golang, bash, sh, rb, wat), ignoring case. Throws unsupported_input for
// unknown names.
Language ParseLanguage(const std::string& name);

}  // namespace executor

#endif
