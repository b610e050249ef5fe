#ifndef RUNTIME_SCRIPT_LEXER_HPP
#define RUNTIME_SCRIPT_LEXER_HPP

#include <string>
#include <vector>

namespace runtime {

struct ScriptToken {
  enum class Type { NUMBER, STRING, IDENTIFIER, KEYWORD, PUNCTUATOR, END };
  Type type = Type::END;
  // Identifier, keyword or punctuator text; decoded contents of strings.
  std::string text;
  double number = 0;
  int line = 1;
  // A line break separates this token from the previous one.
  bool newline_before = false;

  bool Is(Type t, const char* value) const {
    return type == t && text == value;
  }
  bool IsPunctuator(const char* value) const {
    return Is(Type::PUNCTUATOR, value);
  }
  bool IsKeyword(const char* value) const { return Is(Type::KEYWORD, value); }
};

// Splits a script into tokens, the last one being END. Throws a SyntaxError
// ScriptError on invalid input.
std::vector<ScriptToken> TokenizeScript(const std::string& source);

}  // namespace runtime

#endif
