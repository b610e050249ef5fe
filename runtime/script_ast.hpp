#ifndef RUNTIME_SCRIPT_AST_HPP
#define RUNTIME_SCRIPT_AST_HPP

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace runtime {

struct Expression {
  enum class Kind {
    NUMBER,       // number
    STRING,       // text
    BOOLEAN,      // number != 0
    NULL_VALUE,
    UNDEFINED,
    LIST,         // arguments
    IDENTIFIER,   // text
    MEMBER,       // object.text
    INDEX,        // object[property]
    CALL,         // callee(arguments)
    UNARY,        // text operand
    BINARY,       // left text right
    LOGICAL,      // left && right, left || right
    CONDITIONAL,  // condition ? left : right
    ASSIGNMENT,   // target text value, text is "=", "+=", ...
    UPDATE        // ++target, target--, ...; prefix in number
  };

  Kind kind = Kind::UNDEFINED;
  int line = 0;
  double number = 0;
  std::string text;
  std::unique_ptr<Expression> left;
  std::unique_ptr<Expression> right;
  std::unique_ptr<Expression> condition;
  std::vector<std::unique_ptr<Expression>> arguments;
};

struct Statement {
  enum class Kind {
    EXPRESSION,
    DECLARATION,  // let, const and var, in text
    IF,
    WHILE,
    FOR,
    BLOCK,
    BREAK,
    CONTINUE,
    RETURN,
    THROW,
    EMPTY
  };

  Kind kind = Kind::EMPTY;
  int line = 0;
  std::string text;
  // Names and initializers of declarations; initializers may be null.
  std::vector<std::pair<std::string, std::unique_ptr<Expression>>>
      declarations;
  // Value of expression, return and throw statements, condition of if,
  // while and for statements.
  std::unique_ptr<Expression> expression;
  std::unique_ptr<Expression> update;
  std::unique_ptr<Statement> init;
  std::unique_ptr<Statement> body;
  std::unique_ptr<Statement> alternative;
  std::vector<std::unique_ptr<Statement>> statements;
};

struct Program {
  std::vector<std::unique_ptr<Statement>> statements;
};

}  // namespace runtime

#endif
