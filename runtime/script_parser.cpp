#include "runtime/script_parser.hpp"

#include <vector>

#include "runtime/script_lexer.hpp"
#include "runtime/value.hpp"

namespace runtime {

namespace {

using Token = ScriptToken;
using ExpressionPtr = std::unique_ptr<Expression>;
using StatementPtr = std::unique_ptr<Statement>;

class Parser {
 public:
  Parser(std::vector<Token> tokens, bool allow_return)
      : tokens_(std::move(tokens)), allow_return_(allow_return) {}

  std::unique_ptr<Program> Run() {
    std::unique_ptr<Program> program(new Program());
    while (Peek().type != Token::Type::END) {
      program->statements.push_back(ParseStatement());
    }
    return program;
  }

 private:
  // Bounds the recursion of the parser, and so of the interpreter.
  class DepthGuard {
   public:
    explicit DepthGuard(Parser* parser) : parser_(parser) {
      if (++parser_->depth_ > kMaxNestingDepth) {
        throw ScriptError("RangeError", "Maximum nesting depth exceeded");
      }
    }
    ~DepthGuard() { parser_->depth_--; }
    DepthGuard(const DepthGuard&) = delete;
    DepthGuard& operator=(const DepthGuard&) = delete;

   private:
    Parser* parser_;
  };

  const Token& Peek() const { return tokens_[pos_]; }
  const Token& Next() {
    const Token& token = tokens_[pos_];
    if (pos_ + 1 < tokens_.size()) pos_++;
    return token;
  }
  bool Accept(const char* punctuator) {
    if (!Peek().IsPunctuator(punctuator)) return false;
    Next();
    return true;
  }
  void Expect(const char* punctuator) {
    if (!Accept(punctuator)) Unexpected();
  }

  [[noreturn]] void Fail(const std::string& message) const {
    throw ScriptError("SyntaxError", message + " (line " +
                                         std::to_string(Peek().line) + ")");
  }

  [[noreturn]] void UnexpectedAt(size_t pos) {
    pos_ = pos;
    Unexpected();
  }

  [[noreturn]] void Unexpected() const {
    const Token& token = Peek();
    if (token.type == Token::Type::END) Fail("Unexpected end of input");
    if (token.type == Token::Type::STRING) Fail("Unexpected string");
    if (token.type == Token::Type::NUMBER) Fail("Unexpected number");
    Fail("Unexpected token '" + token.text + "'");
  }

  // Statements end with a semicolon, a line break, a closing brace or the end
  // of the input.
  void ConsumeTerminator() {
    if (Accept(";")) return;
    const Token& token = Peek();
    if (token.type == Token::Type::END || token.IsPunctuator("}") ||
        token.newline_before) {
      return;
    }
    Unexpected();
  }

  StatementPtr NewStatement(Statement::Kind kind) {
    StatementPtr statement(new Statement());
    statement->kind = kind;
    statement->line = Peek().line;
    return statement;
  }

  ExpressionPtr NewExpression(Expression::Kind kind, int line) {
    ExpressionPtr expression(new Expression());
    expression->kind = kind;
    expression->line = line;
    return expression;
  }

  StatementPtr ParseStatement() {
    DepthGuard guard(this);
    const Token& token = Peek();
    if (token.IsPunctuator("{")) return ParseBlock();
    if (token.IsPunctuator(";")) {
      StatementPtr statement = NewStatement(Statement::Kind::EMPTY);
      Next();
      return statement;
    }
    if (token.type == Token::Type::KEYWORD) {
      if (token.text == "let" || token.text == "const" || token.text == "var") {
        StatementPtr statement = ParseDeclaration();
        ConsumeTerminator();
        return statement;
      }
      if (token.text == "if") return ParseIf();
      if (token.text == "while") return ParseWhile();
      if (token.text == "for") return ParseFor();
      if (token.text == "break" || token.text == "continue") {
        StatementPtr statement = NewStatement(
            token.text == "break" ? Statement::Kind::BREAK
                                  : Statement::Kind::CONTINUE);
        if (loop_depth_ == 0) Fail("Illegal " + token.text + " statement");
        Next();
        ConsumeTerminator();
        return statement;
      }
      if (token.text == "return") {
        if (!allow_return_) Fail("Illegal return statement");
        StatementPtr statement = NewStatement(Statement::Kind::RETURN);
        Next();
        const Token& next = Peek();
        if (!next.IsPunctuator(";") && !next.IsPunctuator("}") &&
            next.type != Token::Type::END && !next.newline_before) {
          statement->expression = ParseExpression();
        }
        ConsumeTerminator();
        return statement;
      }
      if (token.text == "throw") {
        StatementPtr statement = NewStatement(Statement::Kind::THROW);
        Next();
        if (Peek().newline_before) Fail("Illegal newline after throw");
        statement->expression = ParseExpression();
        ConsumeTerminator();
        return statement;
      }
    }
    StatementPtr statement = NewStatement(Statement::Kind::EXPRESSION);
    statement->expression = ParseExpression();
    ConsumeTerminator();
    return statement;
  }

  StatementPtr ParseBlock() {
    StatementPtr block = NewStatement(Statement::Kind::BLOCK);
    Expect("{");
    while (!Peek().IsPunctuator("}")) {
      if (Peek().type == Token::Type::END) Unexpected();
      block->statements.push_back(ParseStatement());
    }
    Next();
    return block;
  }

  // Without the terminator, so that it can be used in for loops.
  StatementPtr ParseDeclaration() {
    StatementPtr statement = NewStatement(Statement::Kind::DECLARATION);
    statement->text = Next().text;
    do {
      size_t start = pos_;
      const Token& name = Next();
      if (name.type != Token::Type::IDENTIFIER) UnexpectedAt(start);
      ExpressionPtr initializer;
      if (Accept("=")) {
        initializer = ParseAssignment();
      } else if (statement->text == "const") {
        Fail("Missing initializer in const declaration");
      }
      statement->declarations.emplace_back(name.text, std::move(initializer));
    } while (Accept(","));
    return statement;
  }

  StatementPtr ParseIf() {
    StatementPtr statement = NewStatement(Statement::Kind::IF);
    Next();
    Expect("(");
    statement->expression = ParseExpression();
    Expect(")");
    statement->body = ParseStatement();
    if (Peek().IsKeyword("else")) {
      Next();
      statement->alternative = ParseStatement();
    }
    return statement;
  }

  StatementPtr ParseLoopBody() {
    loop_depth_++;
    StatementPtr body = ParseStatement();
    loop_depth_--;
    return body;
  }

  StatementPtr ParseWhile() {
    StatementPtr statement = NewStatement(Statement::Kind::WHILE);
    Next();
    Expect("(");
    statement->expression = ParseExpression();
    Expect(")");
    statement->body = ParseLoopBody();
    return statement;
  }

  StatementPtr ParseFor() {
    StatementPtr statement = NewStatement(Statement::Kind::FOR);
    Next();
    Expect("(");
    if (!Peek().IsPunctuator(";")) {
      const Token& token = Peek();
      if (token.IsKeyword("let") || token.IsKeyword("const") ||
          token.IsKeyword("var")) {
        statement->init = ParseDeclaration();
      } else {
        statement->init = NewStatement(Statement::Kind::EXPRESSION);
        statement->init->expression = ParseExpression();
      }
    }
    Expect(";");
    if (!Peek().IsPunctuator(";")) statement->expression = ParseExpression();
    Expect(";");
    if (!Peek().IsPunctuator(")")) statement->update = ParseExpression();
    Expect(")");
    statement->body = ParseLoopBody();
    return statement;
  }

  ExpressionPtr ParseExpression() { return ParseAssignment(); }

  static bool IsAssignable(const Expression& expression) {
    return expression.kind == Expression::Kind::IDENTIFIER ||
           expression.kind == Expression::Kind::MEMBER ||
           expression.kind == Expression::Kind::INDEX;
  }

  ExpressionPtr ParseAssignment() {
    DepthGuard guard(this);
    ExpressionPtr target = ParseConditional();
    static const char* const kOperators[] = {"=",  "+=", "-=",
                                             "*=", "/=", "%="};
    for (const char* op : kOperators) {
      if (!Peek().IsPunctuator(op)) continue;
      if (!IsAssignable(*target)) {
        Fail("Invalid left-hand side in assignment");
      }
      int line = Next().line;
      ExpressionPtr assignment =
          NewExpression(Expression::Kind::ASSIGNMENT, line);
      assignment->text = op;
      assignment->left = std::move(target);
      assignment->right = ParseAssignment();
      return assignment;
    }
    return target;
  }

  ExpressionPtr ParseConditional() {
    ExpressionPtr condition = ParseLogical(0);
    if (!Peek().IsPunctuator("?")) return condition;
    int line = Next().line;
    ExpressionPtr expression =
        NewExpression(Expression::Kind::CONDITIONAL, line);
    expression->condition = std::move(condition);
    expression->left = ParseAssignment();
    Expect(":");
    expression->right = ParseAssignment();
    return expression;
  }

  // Binary operators by increasing precedence.
  ExpressionPtr ParseLogical(int level) {
    static const std::vector<std::vector<const char*>>* levels =
        new std::vector<std::vector<const char*>>{
            {"||"},
            {"&&"},
            {"===", "!==", "==", "!="},
            {"<=", ">=", "<", ">"},
            {"+", "-"},
            {"*", "/", "%"}};
    if (level == static_cast<int>(levels->size())) return ParseUnary();
    ExpressionPtr left = ParseLogical(level + 1);
    while (true) {
      const char* matched = nullptr;
      for (const char* op : (*levels)[level]) {
        if (Peek().IsPunctuator(op)) matched = op;
      }
      if (matched == nullptr) return left;
      int line = Next().line;
      ExpressionPtr expression = NewExpression(
          level < 2 ? Expression::Kind::LOGICAL : Expression::Kind::BINARY,
          line);
      expression->text = matched;
      expression->left = std::move(left);
      expression->right = ParseLogical(level + 1);
      left = std::move(expression);
    }
  }

  ExpressionPtr ParseUnary() {
    DepthGuard guard(this);
    const Token& token = Peek();
    if (token.IsPunctuator("!") || token.IsPunctuator("-") ||
        token.IsPunctuator("+") || token.IsKeyword("typeof")) {
      ExpressionPtr expression =
          NewExpression(Expression::Kind::UNARY, token.line);
      expression->text = Next().text;
      expression->left = ParseUnary();
      return expression;
    }
    if (token.IsPunctuator("++") || token.IsPunctuator("--")) {
      ExpressionPtr expression =
          NewExpression(Expression::Kind::UPDATE, token.line);
      expression->text = Next().text;
      expression->number = 1;
      expression->left = ParseUnary();
      if (!IsAssignable(*expression->left)) {
        Fail("Invalid left-hand side expression in prefix operation");
      }
      return expression;
    }
    ExpressionPtr operand = ParseCallOrMember();
    const Token& next = Peek();
    if ((next.IsPunctuator("++") || next.IsPunctuator("--")) &&
        !next.newline_before) {
      if (!IsAssignable(*operand)) {
        Fail("Invalid left-hand side expression in postfix operation");
      }
      ExpressionPtr expression =
          NewExpression(Expression::Kind::UPDATE, next.line);
      expression->text = Next().text;
      expression->left = std::move(operand);
      return expression;
    }
    return operand;
  }

  ExpressionPtr ParseCallOrMember() {
    ExpressionPtr expression = ParsePrimary();
    while (true) {
      const Token& token = Peek();
      if (token.IsPunctuator(".")) {
        Next();
        size_t start = pos_;
        const Token& name = Next();
        if (name.type != Token::Type::IDENTIFIER &&
            name.type != Token::Type::KEYWORD) {
          UnexpectedAt(start);
        }
        ExpressionPtr member =
            NewExpression(Expression::Kind::MEMBER, name.line);
        member->text = name.text;
        member->left = std::move(expression);
        expression = std::move(member);
      } else if (token.IsPunctuator("[")) {
        int line = Next().line;
        ExpressionPtr index = NewExpression(Expression::Kind::INDEX, line);
        index->left = std::move(expression);
        index->right = ParseExpression();
        Expect("]");
        expression = std::move(index);
      } else if (token.IsPunctuator("(")) {
        int line = Next().line;
        ExpressionPtr call = NewExpression(Expression::Kind::CALL, line);
        call->left = std::move(expression);
        ParseList(")", &call->arguments);
        expression = std::move(call);
      } else {
        return expression;
      }
    }
  }

  // Comma separated expressions up to close, which is consumed.
  void ParseList(const char* close, std::vector<ExpressionPtr>* items) {
    while (!Accept(close)) {
      items->push_back(ParseAssignment());
      if (!Peek().IsPunctuator(close)) Expect(",");
    }
  }

  ExpressionPtr ParsePrimary() {
    size_t start = pos_;
    const Token& token = Next();
    switch (token.type) {
      case Token::Type::NUMBER: {
        ExpressionPtr expression =
            NewExpression(Expression::Kind::NUMBER, token.line);
        expression->number = token.number;
        return expression;
      }
      case Token::Type::STRING: {
        ExpressionPtr expression =
            NewExpression(Expression::Kind::STRING, token.line);
        expression->text = token.text;
        return expression;
      }
      case Token::Type::IDENTIFIER: {
        ExpressionPtr expression =
            NewExpression(Expression::Kind::IDENTIFIER, token.line);
        expression->text = token.text;
        return expression;
      }
      case Token::Type::KEYWORD:
        if (token.text == "true" || token.text == "false") {
          ExpressionPtr expression =
              NewExpression(Expression::Kind::BOOLEAN, token.line);
          expression->number = token.text == "true";
          return expression;
        }
        if (token.text == "null") {
          return NewExpression(Expression::Kind::NULL_VALUE, token.line);
        }
        if (token.text == "undefined") {
          return NewExpression(Expression::Kind::UNDEFINED, token.line);
        }
        break;
      case Token::Type::PUNCTUATOR:
        if (token.text == "(") {
          ExpressionPtr expression = ParseExpression();
          Expect(")");
          return expression;
        }
        if (token.text == "[") {
          ExpressionPtr list =
              NewExpression(Expression::Kind::LIST, token.line);
          ParseList("]", &list->arguments);
          return list;
        }
        break;
      case Token::Type::END:
        break;
    }
    UnexpectedAt(start);
  }

  std::vector<Token> tokens_;
  size_t pos_ = 0;
  int depth_ = 0;
  int loop_depth_ = 0;
  bool allow_return_;
};

}  // namespace

std::unique_ptr<Program> ParseScript(const std::string& source,
                                     bool allow_return) {
  Parser parser(TokenizeScript(source), allow_return);
  return parser.Run();
}

}  // namespace runtime
