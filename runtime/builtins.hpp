#ifndef RUNTIME_BUILTINS_HPP
#define RUNTIME_BUILTINS_HPP

#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "runtime/dom.hpp"
#include "runtime/stylesheet.hpp"
#include "runtime/value.hpp"

namespace runtime {

// Receives console output: level is the console method (log, info, warn,
// error or debug).
using ConsoleSink =
    std::function<void(const std::string& level, const std::string& text)>;

// Value created by Error(message) and raised again by throw.
class ErrorObject : public HostObject {
 public:
  ErrorObject(std::string name, std::string message)
      : name_(std::move(name)), message_(std::move(message)) {}
  std::string ClassName() const override { return "Error"; }
  Value Get(const std::string& property) override;
  std::string Inspect() const override { return name_ + ": " + message_; }

  const std::string& name() const { return name_; }
  const std::string& message() const { return message_; }

 private:
  std::string name_;
  std::string message_;
};

// The globals of a script: console, document, Math, getComputedStyle, assert
// and the conversion functions.
std::vector<std::pair<std::string, Value>> GlobalBindings(
    Document* document, const StyleResolver* styles, ConsoleSink console);

// Properties and methods of the values that are not host objects. All of
// them return undefined for unknown properties and throw ScriptError.
Value ElementProperty(Node* node, const std::string& name);
void SetElementProperty(Node* node, const std::string& name,
                        const Value& value);
Value StringProperty(const std::string& text, const std::string& name);
Value NumberProperty(double number, const std::string& name);
Value ListProperty(const std::shared_ptr<Value::ListType>& list,
                   const std::string& name);

// backgroundColor -> background-color.
std::string CamelCaseToProperty(const std::string& name);

}  // namespace runtime

#endif
