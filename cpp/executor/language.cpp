#include "executor/language.hpp"

#include <map>
#include "executor/errors.hpp"
#include "util/misc.hpp"

namespace executor {

const std::vector<Language>& AllLanguages() {
  static const std::vector<Language> languages = {
      Language::PYTHON, Language::JAVASCRIPT, Language::TYPESCRIPT,
      Language::RUST,   Language::GO,         Language::SHELL,
      Language::RUBY,   Language::WASM};
  return languages;
}

std::string LanguageName(Language language) {
  switch (language) {
    case Language::PYTHON:
      return "python";
    case Language::JAVASCRIPT:
      return "javascript";
    case Language::TYPESCRIPT:
      return "typescript";
    case Language::RUST:
      return "rust";
    case Language::GO:
      return "go";
    case Language::SHELL:
      return "shell";
    case Language::RUBY:
      return "ruby";
    case Language::WASM:
      return "wasm";
  }
  return "unknown";
}

Language ParseLanguage(const std::string& name) {
  static const std::map<std::string, Language> aliases = {
      {"python", Language::PYTHON},     {"py", Language::PYTHON},
      {"javascript", Language::JAVASCRIPT}, {"js", Language::JAVASCRIPT},
      {"node", Language::JAVASCRIPT},   {"typescript", Language::TYPESCRIPT},
      {"ts", Language::TYPESCRIPT},     {"rust", Language::RUST},
      {"rs", Language::RUST},           {"go", Language::GO},
      {"golang", Language::GO},         {"shell", Language::SHELL},
      {"bash", Language::SHELL},        {"sh", Language::SHELL},
      {"ruby", Language::RUBY},         {"rb", Language::RUBY},
      {"wasm", Language::WASM},         {"wat", Language::WASM}};
  auto it = aliases.find(util::ToLower(name));
  if (it != aliases.end()) return it->second;
  std::string supported;
  for (Language language : AllLanguages()) {
    if (!supported.empty()) supported += ", ";
    supported += LanguageName(language);
  }
  throw unsupported_input("Unknown language: " + name +
                          ". Supported: " + supported);
}

}  // namespace executor
