#include "runtime/script_lexer.hpp"

#include <stdlib.h>
#include <string.h>

#include <unordered_set>

#include "absl/strings/ascii.h"
#include "runtime/value.hpp"

namespace runtime {

namespace {

const std::unordered_set<std::string>& Keywords() {
  static const auto* keywords = new std::unordered_set<std::string>{
      "let",   "const", "var",  "if",    "else",   "while",
      "for",   "break", "continue", "return", "throw", "true",
      "false", "null",  "undefined", "typeof"};
  return *keywords;
}

// Longest first.
const char* const kPunctuators[] = {
    "===", "!==", "==", "!=", "<=", ">=", "&&", "||", "++", "--", "+=", "-=",
    "*=",  "/=",  "%=", "{",  "}",  "(",  ")",  "[",  "]",  ";",  ",",  ".",
    "<",   ">",   "+",  "-",  "*",  "/",  "%",  "!",  "=",  "?",  ":"};

bool IsIdentifierStart(char c) {
  return absl::ascii_isalpha(c) || c == '_' || c == '$' ||
         static_cast<unsigned char>(c) >= 0x80;
}

bool IsIdentifierPart(char c) {
  return IsIdentifierStart(c) || absl::ascii_isdigit(c);
}

void AppendUtf8(uint32_t code_point, std::string* out) {
  if (code_point < 0x80) {
    out->push_back(code_point);
  } else if (code_point < 0x800) {
    out->push_back(0xC0 | (code_point >> 6));
    out->push_back(0x80 | (code_point & 0x3F));
  } else {
    out->push_back(0xE0 | (code_point >> 12));
    out->push_back(0x80 | ((code_point >> 6) & 0x3F));
    out->push_back(0x80 | (code_point & 0x3F));
  }
}

class Lexer {
 public:
  explicit Lexer(const std::string& source) : source_(source) {}

  std::vector<ScriptToken> Run() {
    std::vector<ScriptToken> tokens;
    bool newline = false;
    while (true) {
      newline |= SkipWhitespaceAndComments();
      ScriptToken token;
      token.line = line_;
      token.newline_before = newline;
      newline = false;
      if (pos_ >= source_.size()) {
        tokens.push_back(token);
        return tokens;
      }
      char c = source_[pos_];
      if (absl::ascii_isdigit(c) ||
          (c == '.' && pos_ + 1 < source_.size() &&
           absl::ascii_isdigit(source_[pos_ + 1]))) {
        ReadNumber(&token);
      } else if (c == '"' || c == '\'') {
        ReadString(&token);
      } else if (c == '`') {
        Fail("Template literals are not supported");
      } else if (IsIdentifierStart(c)) {
        size_t start = pos_;
        while (pos_ < source_.size() && IsIdentifierPart(source_[pos_])) {
          pos_++;
        }
        token.text = source_.substr(start, pos_ - start);
        token.type = Keywords().count(token.text)
                         ? ScriptToken::Type::KEYWORD
                         : ScriptToken::Type::IDENTIFIER;
      } else {
        ReadPunctuator(&token);
      }
      tokens.push_back(std::move(token));
    }
  }

 private:
  [[noreturn]] void Fail(const std::string& message) const {
    throw ScriptError("SyntaxError",
                      message + " (line " + std::to_string(line_) + ")");
  }

  // Returns true if a line break was skipped.
  bool SkipWhitespaceAndComments() {
    bool newline = false;
    while (pos_ < source_.size()) {
      char c = source_[pos_];
      if (c == '\n') {
        newline = true;
        line_++;
        pos_++;
      } else if (absl::ascii_isspace(c)) {
        pos_++;
      } else if (source_.compare(pos_, 2, "//") == 0) {
        while (pos_ < source_.size() && source_[pos_] != '\n') pos_++;
      } else if (source_.compare(pos_, 2, "/*") == 0) {
        size_t end = source_.find("*/", pos_ + 2);
        if (end == std::string::npos) Fail("Unterminated comment");
        for (size_t i = pos_; i < end; i++) {
          if (source_[i] == '\n') {
            newline = true;
            line_++;
          }
        }
        pos_ = end + 2;
      } else {
        break;
      }
    }
    return newline;
  }

  void ReadNumber(ScriptToken* token) {
    token->type = ScriptToken::Type::NUMBER;
    const char* start = source_.c_str() + pos_;
    char* end = nullptr;
    if (source_.compare(pos_, 2, "0x") == 0 ||
        source_.compare(pos_, 2, "0X") == 0) {
      token->number = static_cast<double>(strtoull(start + 2, &end, 16));
      if (end == start + 2) Fail("Invalid hexadecimal literal");
    } else {
      token->number = strtod(start, &end);
    }
    pos_ += end - start;
    if (pos_ < source_.size() && IsIdentifierStart(source_[pos_])) {
      Fail("Invalid or unexpected token");
    }
  }

  void ReadString(ScriptToken* token) {
    token->type = ScriptToken::Type::STRING;
    char quote = source_[pos_++];
    while (true) {
      if (pos_ >= source_.size() || source_[pos_] == '\n') {
        Fail("Unterminated string literal");
      }
      char c = source_[pos_++];
      if (c == quote) return;
      if (c != '\\') {
        token->text += c;
        continue;
      }
      if (pos_ >= source_.size()) Fail("Unterminated string literal");
      char escaped = source_[pos_++];
      switch (escaped) {
        case 'n':
          token->text += '\n';
          break;
        case 't':
          token->text += '\t';
          break;
        case 'r':
          token->text += '\r';
          break;
        case 'b':
          token->text += '\b';
          break;
        case '0':
          token->text += '\0';
          break;
        case 'u': {
          if (pos_ + 4 > source_.size()) Fail("Invalid Unicode escape");
          std::string hex = source_.substr(pos_, 4);
          for (char h : hex) {
            if (!absl::ascii_isxdigit(h)) Fail("Invalid Unicode escape");
          }
          AppendUtf8(strtoul(hex.c_str(), nullptr, 16), &token->text);
          pos_ += 4;
          break;
        }
        case '\n':
          line_++;
          break;
        default:
          token->text += escaped;
      }
    }
  }

  void ReadPunctuator(ScriptToken* token) {
    token->type = ScriptToken::Type::PUNCTUATOR;
    for (const char* punctuator : kPunctuators) {
      size_t len = strlen(punctuator);
      if (source_.compare(pos_, len, punctuator) == 0) {
        token->text = punctuator;
        pos_ += len;
        return;
      }
    }
    Fail(std::string("Invalid or unexpected token '") + source_[pos_] + "'");
  }

  const std::string& source_;
  size_t pos_ = 0;
  int line_ = 1;
};

}  // namespace

std::vector<ScriptToken> TokenizeScript(const std::string& source) {
  Lexer lexer(source);
  return lexer.Run();
}

}  // namespace runtime
