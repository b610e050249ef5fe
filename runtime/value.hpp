#ifndef RUNTIME_VALUE_HPP
#define RUNTIME_VALUE_HPP

#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "runtime/dom.hpp"

namespace runtime {

// An error raised while running a script, reported as "<name>: <message>".
// name is one of SyntaxError, ReferenceError, TypeError, RangeError,
// AssertionError or Error for values thrown by the script itself.
class ScriptError : public std::runtime_error {
 public:
  ScriptError(const std::string& name, const std::string& message)
      : std::runtime_error(name + ": " + message),
        name_(name),
        message_(message) {}
  const std::string& name() const { return name_; }
  const std::string& message() const { return message_; }

 private:
  std::string name_;
  std::string message_;
};

class HostObject;

class Value {
 public:
  enum class Type {
    UNDEFINED,
    NULL_VALUE,
    BOOLEAN,
    NUMBER,
    STRING,
    ELEMENT,
    LIST,
    OBJECT,
    FUNCTION
  };
  using ListType = std::vector<Value>;
  using Native = std::function<Value(const std::vector<Value>& args)>;
  struct NativeFunction {
    std::string name;
    Native call;
  };

  Value() = default;
  static Value Null();
  static Value Boolean(bool value);
  static Value Number(double value);
  static Value String(std::string value);
  // node may also be a text or comment node. nullptr gives null.
  static Value Element(Node* node);
  static Value List(ListType values);
  static Value Object(std::shared_ptr<HostObject> object);
  static Value Function(std::string name, Native call);

  Type type() const { return type_; }
  bool IsUndefined() const { return type_ == Type::UNDEFINED; }
  bool IsNullish() const {
    return type_ == Type::UNDEFINED || type_ == Type::NULL_VALUE;
  }

  bool boolean() const { return boolean_; }
  double number() const { return number_; }
  const std::string& string() const { return string_; }
  Node* node() const { return node_; }
  const std::shared_ptr<ListType>& list() const { return list_; }
  const std::shared_ptr<HostObject>& object() const { return object_; }
  const std::shared_ptr<NativeFunction>& function() const { return function_; }

  bool Truthy() const;
  double ToNumber() const;
  // Conversion performed by String(value) and string concatenation.
  std::string ToString() const;
  // Human-readable representation used by the console and in test reports.
  std::string Inspect() const;
  std::string TypeOf() const;

  static bool StrictEquals(const Value& a, const Value& b);
  static bool LooseEquals(const Value& a, const Value& b);

 private:
  std::string ToStringAtDepth(int depth) const;
  std::string InspectAtDepth(int depth) const;

  Type type_ = Type::UNDEFINED;
  bool boolean_ = false;
  double number_ = 0;
  std::string string_;
  Node* node_ = nullptr;
  std::shared_ptr<ListType> list_;
  std::shared_ptr<HostObject> object_;
  std::shared_ptr<NativeFunction> function_;
};

// Objects provided by the runtime, such as document or console.
class HostObject {
 public:
  virtual ~HostObject() = default;
  virtual std::string ClassName() const = 0;
  // Returns undefined for unknown properties.
  virtual Value Get(const std::string& property) = 0;
  // Throws TypeError unless overridden.
  virtual void Set(const std::string& property, const Value& value);
  virtual std::string Inspect() const { return "[object " + ClassName() + "]"; }
};

// Formats a number the way JavaScript's Number.prototype.toString does.
std::string FormatNumber(double value);

// Parses a numeric string as Number(string) does: NaN if not numeric.
double ParseNumber(const std::string& text);

}  // namespace runtime

#endif
