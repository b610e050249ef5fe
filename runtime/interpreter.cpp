#include "runtime/interpreter.hpp"

#include <math.h>

#include <unordered_map>

#include "runtime/script_parser.hpp"

namespace runtime {

namespace {

// Largest gap allowed when assigning past the end of a list.
const constexpr double kMaxListGrowth = 1 << 20;

std::string Describe(const Expression& expression) {
  switch (expression.kind) {
    case Expression::Kind::IDENTIFIER:
      return expression.text;
    case Expression::Kind::MEMBER:
      return Describe(*expression.left) + "." + expression.text;
    case Expression::Kind::CALL:
      return Describe(*expression.left) + "(...)";
    case Expression::Kind::INDEX:
      return Describe(*expression.left) + "[...]";
    default:
      return "expression";
  }
}

// Index for an integral, non-negative number key; -1 otherwise.
double ListIndex(const Value& key) {
  if (key.type() != Value::Type::NUMBER) return -1;
  double index = key.number();
  if (index < 0 || index != floor(index)) return -1;
  return index;
}

}  // namespace

class Interpreter::Scope {
 public:
  struct Binding {
    Value value;
    bool constant = false;
  };

  Scope(Scope* parent, bool function_scope)
      : parent_(parent), function_scope_(function_scope) {}

  void Declare(const std::string& name, const Value& value, bool constant) {
    if (bindings_.count(name)) {
      throw ScriptError("SyntaxError",
                        "Identifier '" + name + "' has already been declared");
    }
    bindings_[name] = Binding{value, constant};
  }

  // var declarations may be repeated.
  void DeclareVar(const std::string& name, const Value* value) {
    Scope* scope = this;
    while (!scope->function_scope_) scope = scope->parent_;
    auto it = scope->bindings_.find(name);
    if (it == scope->bindings_.end()) {
      scope->bindings_[name] = Binding{value ? *value : Value(), false};
    } else if (it->second.constant) {
      throw ScriptError("SyntaxError",
                        "Identifier '" + name + "' has already been declared");
    } else if (value != nullptr) {
      it->second.value = *value;
    }
  }

  Binding* Find(const std::string& name) {
    for (Scope* scope = this; scope != nullptr; scope = scope->parent_) {
      auto it = scope->bindings_.find(name);
      if (it != scope->bindings_.end()) return &it->second;
    }
    return nullptr;
  }

 private:
  Scope* parent_;
  bool function_scope_;
  std::unordered_map<std::string, Binding> bindings_;
};

// Where an assignment stores its value.
struct Interpreter::Reference {
  enum class Kind { BINDING, PROPERTY, INDEX };
  Kind kind = Kind::BINDING;
  std::string name;
  Scope::Binding* binding = nullptr;
  Value object;
  Value key;
};

Interpreter::Interpreter(Document* document, const StyleResolver* styles,
                         ConsoleSink console)
    : globals_(new Scope(nullptr, /*function_scope=*/true)) {
  for (auto& global : GlobalBindings(document, styles, std::move(console))) {
    globals_->Declare(global.first, global.second, /*constant=*/false);
  }
}

Interpreter::~Interpreter() = default;

void Interpreter::RunScript(const std::string& source) {
  std::unique_ptr<Program> program = ParseScript(source, false);
  for (const auto& statement : program->statements) {
    Execute(*statement, globals_.get());
  }
}

Value Interpreter::EvaluateAssertion(const std::string& source) {
  std::unique_ptr<Program> program = ParseScript(source, true);
  Scope scope(globals_.get(), /*function_scope=*/true);
  last_value_ = Value();
  for (const auto& statement : program->statements) {
    if (Execute(*statement, &scope) == Completion::RETURN) {
      return return_value_;
    }
  }
  return last_value_;
}

Value Interpreter::GetGlobal(const std::string& name) const {
  Scope::Binding* binding = globals_->Find(name);
  return binding == nullptr ? Value() : binding->value;
}

Interpreter::Completion Interpreter::Execute(const Statement& statement,
                                             Scope* scope) {
  switch (statement.kind) {
    case Statement::Kind::EMPTY:
      return Completion::NORMAL;
    case Statement::Kind::EXPRESSION:
      last_value_ = Evaluate(*statement.expression, scope);
      return Completion::NORMAL;
    case Statement::Kind::DECLARATION:
      for (const auto& declaration : statement.declarations) {
        Value value;
        if (declaration.second) value = Evaluate(*declaration.second, scope);
        if (statement.text == "var") {
          scope->DeclareVar(declaration.first,
                            declaration.second ? &value : nullptr);
        } else {
          scope->Declare(declaration.first, value, statement.text == "const");
        }
      }
      return Completion::NORMAL;
    case Statement::Kind::IF:
      if (Evaluate(*statement.expression, scope).Truthy()) {
        return Execute(*statement.body, scope);
      }
      if (statement.alternative) return Execute(*statement.alternative, scope);
      return Completion::NORMAL;
    case Statement::Kind::WHILE:
    case Statement::Kind::FOR:
      return ExecuteLoop(statement, scope);
    case Statement::Kind::BLOCK: {
      Scope block(scope, /*function_scope=*/false);
      for (const auto& child : statement.statements) {
        Completion completion = Execute(*child, &block);
        if (completion != Completion::NORMAL) return completion;
      }
      return Completion::NORMAL;
    }
    case Statement::Kind::BREAK:
      return Completion::BREAK;
    case Statement::Kind::CONTINUE:
      return Completion::CONTINUE;
    case Statement::Kind::RETURN:
      return_value_ = statement.expression
                          ? Evaluate(*statement.expression, scope)
                          : Value();
      return Completion::RETURN;
    case Statement::Kind::THROW: {
      Value value = Evaluate(*statement.expression, scope);
      if (value.type() == Value::Type::OBJECT) {
        const auto* error = dynamic_cast<ErrorObject*>(value.object().get());
        if (error != nullptr) {
          throw ScriptError(error->name(), error->message());
        }
      }
      throw ScriptError("Error", value.ToString());
    }
  }
  return Completion::NORMAL;
}

// Loops are bounded only by the time budget of the sandbox.
Interpreter::Completion Interpreter::ExecuteLoop(const Statement& statement,
                                                 Scope* scope) {
  Scope loop(scope, /*function_scope=*/false);
  if (statement.init) Execute(*statement.init, &loop);
  while (true) {
    if (statement.expression &&
        !Evaluate(*statement.expression, &loop).Truthy()) {
      break;
    }
    Completion completion = Execute(*statement.body, &loop);
    if (completion == Completion::BREAK) break;
    if (completion == Completion::RETURN) return completion;
    if (statement.update) Evaluate(*statement.update, &loop);
  }
  return Completion::NORMAL;
}

Value Interpreter::Evaluate(const Expression& expression, Scope* scope) {
  switch (expression.kind) {
    case Expression::Kind::NUMBER:
      return Value::Number(expression.number);
    case Expression::Kind::STRING:
      return Value::String(expression.text);
    case Expression::Kind::BOOLEAN:
      return Value::Boolean(expression.number != 0);
    case Expression::Kind::NULL_VALUE:
      return Value::Null();
    case Expression::Kind::UNDEFINED:
      return Value();
    case Expression::Kind::LIST: {
      Value::ListType items;
      for (const auto& item : expression.arguments) {
        items.push_back(Evaluate(*item, scope));
      }
      return Value::List(std::move(items));
    }
    case Expression::Kind::IDENTIFIER:
    case Expression::Kind::MEMBER:
    case Expression::Kind::INDEX:
      return Read(Resolve(expression, scope));
    case Expression::Kind::CALL:
      return EvaluateCall(expression, scope);
    case Expression::Kind::UNARY: {
      if (expression.text == "typeof" &&
          expression.left->kind == Expression::Kind::IDENTIFIER &&
          scope->Find(expression.left->text) == nullptr) {
        return Value::String("undefined");
      }
      Value operand = Evaluate(*expression.left, scope);
      if (expression.text == "!") return Value::Boolean(!operand.Truthy());
      if (expression.text == "-") return Value::Number(-operand.ToNumber());
      if (expression.text == "+") return Value::Number(operand.ToNumber());
      return Value::String(operand.TypeOf());
    }
    case Expression::Kind::BINARY:
      return EvaluateBinary(expression.text, Evaluate(*expression.left, scope),
                            Evaluate(*expression.right, scope));
    case Expression::Kind::LOGICAL: {
      Value left = Evaluate(*expression.left, scope);
      if (expression.text == "&&" ? !left.Truthy() : left.Truthy()) {
        return left;
      }
      return Evaluate(*expression.right, scope);
    }
    case Expression::Kind::CONDITIONAL:
      return Evaluate(*expression.condition, scope).Truthy()
                 ? Evaluate(*expression.left, scope)
                 : Evaluate(*expression.right, scope);
    case Expression::Kind::ASSIGNMENT: {
      Reference reference = Resolve(*expression.left, scope);
      Value value;
      if (expression.text == "=") {
        value = Evaluate(*expression.right, scope);
      } else {
        Value current = Read(reference);
        value = EvaluateBinary(expression.text.substr(0, 1), current,
                               Evaluate(*expression.right, scope));
      }
      Write(reference, value);
      return value;
    }
    case Expression::Kind::UPDATE: {
      Reference reference = Resolve(*expression.left, scope);
      double old_value = Read(reference).ToNumber();
      double new_value =
          expression.text == "++" ? old_value + 1 : old_value - 1;
      Write(reference, Value::Number(new_value));
      return Value::Number(expression.number != 0 ? new_value : old_value);
    }
  }
  return Value();
}

Value Interpreter::EvaluateBinary(const std::string& op, const Value& left,
                                  const Value& right) {
  if (op == "===") return Value::Boolean(Value::StrictEquals(left, right));
  if (op == "!==") return Value::Boolean(!Value::StrictEquals(left, right));
  if (op == "==") return Value::Boolean(Value::LooseEquals(left, right));
  if (op == "!=") return Value::Boolean(!Value::LooseEquals(left, right));
  if (op == "+") {
    auto numeric = [](const Value& value) {
      return value.type() == Value::Type::NUMBER ||
             value.type() == Value::Type::BOOLEAN || value.IsNullish();
    };
    if (!numeric(left) || !numeric(right)) {
      return Value::String(left.ToString() + right.ToString());
    }
    return Value::Number(left.ToNumber() + right.ToNumber());
  }
  if (op == "<" || op == ">" || op == "<=" || op == ">=") {
    if (left.type() == Value::Type::STRING &&
        right.type() == Value::Type::STRING) {
      int cmp = left.string().compare(right.string());
      if (op == "<") return Value::Boolean(cmp < 0);
      if (op == ">") return Value::Boolean(cmp > 0);
      if (op == "<=") return Value::Boolean(cmp <= 0);
      return Value::Boolean(cmp >= 0);
    }
    double a = left.ToNumber();
    double b = right.ToNumber();
    if (op == "<") return Value::Boolean(a < b);
    if (op == ">") return Value::Boolean(a > b);
    if (op == "<=") return Value::Boolean(a <= b);
    return Value::Boolean(a >= b);
  }
  double a = left.ToNumber();
  double b = right.ToNumber();
  if (op == "-") return Value::Number(a - b);
  if (op == "*") return Value::Number(a * b);
  if (op == "/") return Value::Number(a / b);
  if (op == "%") return Value::Number(fmod(a, b));
  throw ScriptError("SyntaxError", "Unknown operator " + op);
}

Value Interpreter::EvaluateCall(const Expression& expression, Scope* scope) {
  Value callee = Evaluate(*expression.left, scope);
  if (callee.type() != Value::Type::FUNCTION) {
    throw ScriptError("TypeError",
                      Describe(*expression.left) + " is not a function");
  }
  std::vector<Value> arguments;
  for (const auto& argument : expression.arguments) {
    arguments.push_back(Evaluate(*argument, scope));
  }
  // Keeps the function alive even if the call replaces the binding.
  std::shared_ptr<Value::NativeFunction> function = callee.function();
  return function->call(arguments);
}

Interpreter::Reference Interpreter::Resolve(const Expression& target,
                                            Scope* scope) {
  Reference reference;
  switch (target.kind) {
    case Expression::Kind::IDENTIFIER:
      reference.kind = Reference::Kind::BINDING;
      reference.name = target.text;
      reference.binding = scope->Find(target.text);
      if (reference.binding == nullptr) {
        throw ScriptError("ReferenceError", target.text + " is not defined");
      }
      break;
    case Expression::Kind::MEMBER:
      reference.kind = Reference::Kind::PROPERTY;
      reference.object = Evaluate(*target.left, scope);
      reference.name = target.text;
      break;
    case Expression::Kind::INDEX:
      reference.kind = Reference::Kind::INDEX;
      reference.object = Evaluate(*target.left, scope);
      reference.key = Evaluate(*target.right, scope);
      break;
    default:
      throw ScriptError("SyntaxError", "Invalid assignment target");
  }
  return reference;
}

Value Interpreter::Read(const Reference& reference) {
  switch (reference.kind) {
    case Reference::Kind::BINDING:
      return reference.binding->value;
    case Reference::Kind::PROPERTY:
      return GetProperty(reference.object, reference.name);
    case Reference::Kind::INDEX:
      return GetIndex(reference.object, reference.key);
  }
  return Value();
}

void Interpreter::Write(const Reference& reference, const Value& value) {
  switch (reference.kind) {
    case Reference::Kind::BINDING:
      if (reference.binding->constant) {
        throw ScriptError("TypeError", "Assignment to constant variable.");
      }
      reference.binding->value = value;
      return;
    case Reference::Kind::PROPERTY:
      SetProperty(reference.object, reference.name, value);
      return;
    case Reference::Kind::INDEX:
      SetIndex(reference.object, reference.key, value);
      return;
  }
}

Value Interpreter::GetProperty(const Value& object, const std::string& name) {
  switch (object.type()) {
    case Value::Type::UNDEFINED:
    case Value::Type::NULL_VALUE:
      throw ScriptError("TypeError", "Cannot read properties of " +
                                         object.ToString() + " (reading '" +
                                         name + "')");
    case Value::Type::STRING:
      return StringProperty(object.string(), name);
    case Value::Type::NUMBER:
      return NumberProperty(object.number(), name);
    case Value::Type::LIST:
      return ListProperty(object.list(), name);
    case Value::Type::ELEMENT:
      return ElementProperty(object.node(), name);
    case Value::Type::OBJECT:
      return object.object()->Get(name);
    case Value::Type::FUNCTION:
      if (name == "name") return Value::String(object.function()->name);
      return Value();
    case Value::Type::BOOLEAN:
      return Value();
  }
  return Value();
}

Value Interpreter::GetIndex(const Value& object, const Value& key) {
  double index = ListIndex(key);
  if (object.type() == Value::Type::LIST && index >= 0) {
    if (index >= object.list()->size()) return Value();
    return (*object.list())[static_cast<size_t>(index)];
  }
  if (object.type() == Value::Type::STRING && index >= 0) {
    if (index >= object.string().size()) return Value();
    return Value::String(object.string().substr(static_cast<size_t>(index), 1));
  }
  return GetProperty(object, key.ToString());
}

void Interpreter::SetProperty(const Value& object, const std::string& name,
                              const Value& value) {
  switch (object.type()) {
    case Value::Type::UNDEFINED:
    case Value::Type::NULL_VALUE:
      throw ScriptError("TypeError", "Cannot set properties of " +
                                         object.ToString() + " (setting '" +
                                         name + "')");
    case Value::Type::ELEMENT:
      SetElementProperty(object.node(), name, value);
      return;
    case Value::Type::OBJECT:
      object.object()->Set(name, value);
      return;
    default:
      throw ScriptError("TypeError", "Cannot create property '" + name +
                                         "' on " + object.TypeOf());
  }
}

void Interpreter::SetIndex(const Value& object, const Value& key,
                           const Value& value) {
  double index = ListIndex(key);
  if (object.type() == Value::Type::LIST && index >= 0) {
    Value::ListType& list = *object.list();
    if (index >= list.size()) {
      if (index - list.size() > kMaxListGrowth) {
        throw ScriptError("RangeError", "Invalid array length");
      }
      list.resize(static_cast<size_t>(index) + 1);
    }
    list[static_cast<size_t>(index)] = value;
    return;
  }
  SetProperty(object, key.ToString(), value);
}

}  // namespace runtime
