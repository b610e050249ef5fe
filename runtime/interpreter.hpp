#ifndef RUNTIME_INTERPRETER_HPP
#define RUNTIME_INTERPRETER_HPP

#include <memory>
#include <string>

#include "runtime/builtins.hpp"
#include "runtime/dom.hpp"
#include "runtime/script_ast.hpp"
#include "runtime/stylesheet.hpp"
#include "runtime/value.hpp"

namespace runtime {

// Tree-walking interpreter for the script dialect. The global scope holds the
// host objects and everything declared at the top level of scripts; it is
// shared by the submission script and the assertions.
class Interpreter {
 public:
  Interpreter(Document* document, const StyleResolver* styles,
              ConsoleSink console);
  ~Interpreter();

  // Runs a script in the global scope. Throws ScriptError.
  void RunScript(const std::string& source);

  // Runs an assertion in a fresh scope nested in the global one. Its value is
  // the value of its return statement or, without one, of the last
  // expression statement executed. Throws ScriptError.
  Value EvaluateAssertion(const std::string& source);

  // Value of a global variable, undefined if it is not declared.
  Value GetGlobal(const std::string& name) const;

  Interpreter(const Interpreter&) = delete;
  Interpreter& operator=(const Interpreter&) = delete;

 private:
  class Scope;
  struct Reference;
  enum class Completion { NORMAL, BREAK, CONTINUE, RETURN };

  Completion Execute(const Statement& statement, Scope* scope);
  Completion ExecuteLoop(const Statement& statement, Scope* scope);
  Value Evaluate(const Expression& expression, Scope* scope);
  Value EvaluateBinary(const std::string& op, const Value& left,
                       const Value& right);
  Value EvaluateCall(const Expression& expression, Scope* scope);

  Reference Resolve(const Expression& target, Scope* scope);
  Value Read(const Reference& reference);
  void Write(const Reference& reference, const Value& value);

  Value GetProperty(const Value& object, const std::string& name);
  Value GetIndex(const Value& object, const Value& key);
  void SetProperty(const Value& object, const std::string& name,
                   const Value& value);
  void SetIndex(const Value& object, const Value& key, const Value& value);

  std::unique_ptr<Scope> globals_;
  Value last_value_;
  Value return_value_;
};

}  // namespace runtime

#endif
