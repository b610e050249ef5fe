#include "runtime/value.hpp"

#include <math.h>
#include <stdio.h>
#include <stdlib.h>

#include <algorithm>

#include "absl/strings/ascii.h"
#include "absl/strings/strip.h"

namespace runtime {

namespace {

// Nested lists deeper than this are abbreviated.
const constexpr int kMaxPrintDepth = 8;

std::string Quote(const std::string& text) {
  std::string out = "\"";
  for (char c : text) {
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\t':
        out += "\\t";
        break;
      case '\r':
        out += "\\r";
        break;
      default:
        out += c;
    }
  }
  return out + "\"";
}

std::string InspectNode(const Node* node) {
  switch (node->type()) {
    case Node::Type::ELEMENT: {
      std::string out = "<" + node->tag();
      const std::string* id = node->GetAttribute("id");
      if (id != nullptr && !id->empty()) out += "#" + *id;
      for (const std::string& name : node->Classes()) out += "." + name;
      return out + ">";
    }
    case Node::Type::TEXT:
      return "#text " + Quote(node->data());
    case Node::Type::COMMENT:
      return "<!--" + node->data() + "-->";
    case Node::Type::DOCUMENT:
      return "#document";
  }
  return "";
}

}  // namespace

void HostObject::Set(const std::string& property, const Value& value) {
  throw ScriptError("TypeError", "Cannot set property '" + property +
                                     "' of " + ClassName());
}

Value Value::Null() {
  Value value;
  value.type_ = Type::NULL_VALUE;
  return value;
}

Value Value::Boolean(bool boolean) {
  Value value;
  value.type_ = Type::BOOLEAN;
  value.boolean_ = boolean;
  return value;
}

Value Value::Number(double number) {
  Value value;
  value.type_ = Type::NUMBER;
  value.number_ = number;
  return value;
}

Value Value::String(std::string string) {
  Value value;
  value.type_ = Type::STRING;
  value.string_ = std::move(string);
  return value;
}

Value Value::Element(Node* node) {
  if (node == nullptr) return Null();
  Value value;
  value.type_ = Type::ELEMENT;
  value.node_ = node;
  return value;
}

Value Value::List(ListType values) {
  Value value;
  value.type_ = Type::LIST;
  value.list_ = std::make_shared<ListType>(std::move(values));
  return value;
}

Value Value::Object(std::shared_ptr<HostObject> object) {
  Value value;
  value.type_ = Type::OBJECT;
  value.object_ = std::move(object);
  return value;
}

Value Value::Function(std::string name, Native call) {
  Value value;
  value.type_ = Type::FUNCTION;
  value.function_ = std::make_shared<NativeFunction>(
      NativeFunction{std::move(name), std::move(call)});
  return value;
}

bool Value::Truthy() const {
  switch (type_) {
    case Type::UNDEFINED:
    case Type::NULL_VALUE:
      return false;
    case Type::BOOLEAN:
      return boolean_;
    case Type::NUMBER:
      return number_ != 0 && !isnan(number_);
    case Type::STRING:
      return !string_.empty();
    default:
      return true;
  }
}

double ParseNumber(const std::string& text) {
  std::string trimmed(absl::StripAsciiWhitespace(text));
  if (trimmed.empty()) return 0;
  if (trimmed == "Infinity" || trimmed == "+Infinity") return INFINITY;
  if (trimmed == "-Infinity") return -INFINITY;
  if (trimmed.size() > 2 && trimmed[0] == '0' &&
      (trimmed[1] == 'x' || trimmed[1] == 'X')) {
    char* end = nullptr;
    unsigned long long value = strtoull(trimmed.c_str() + 2, &end, 16);
    if (*end != '\0') return NAN;
    return static_cast<double>(value);
  }
  // strtod accepts forms that are not numbers here.
  for (char c : trimmed) {
    if (!absl::ascii_isdigit(c) && c != '.' && c != 'e' && c != 'E' &&
        c != '+' && c != '-') {
      return NAN;
    }
  }
  char* end = nullptr;
  double value = strtod(trimmed.c_str(), &end);
  if (*end != '\0') return NAN;
  return value;
}

double Value::ToNumber() const {
  switch (type_) {
    case Type::UNDEFINED:
      return NAN;
    case Type::NULL_VALUE:
      return 0;
    case Type::BOOLEAN:
      return boolean_ ? 1 : 0;
    case Type::NUMBER:
      return number_;
    case Type::STRING:
      return ParseNumber(string_);
    case Type::LIST:
      return ParseNumber(ToString());
    default:
      return NAN;
  }
}

std::string FormatNumber(double value) {
  if (isnan(value)) return "NaN";
  if (isinf(value)) return value > 0 ? "Infinity" : "-Infinity";
  if (value == 0) return "0";
  if (value < 0) return "-" + FormatNumber(-value);
  // Shortest representation that reads back as the same number.
  char buf[64];
  int precision = 1;
  for (; precision <= 17; precision++) {
    snprintf(buf, sizeof(buf), "%.*e", precision - 1, value);
    if (strtod(buf, nullptr) == value) break;
  }
  std::string repr = buf;
  size_t e = repr.find('e');
  std::string digits = repr.substr(0, e);
  digits.erase(std::remove(digits.begin(), digits.end(), '.'), digits.end());
  while (digits.size() > 1 && digits.back() == '0') digits.pop_back();
  int exponent = atoi(repr.c_str() + e + 1);
  int k = digits.size();
  int n = exponent + 1;
  if (k <= n && n <= 21) return digits + std::string(n - k, '0');
  if (0 < n && n <= 21) return digits.substr(0, n) + "." + digits.substr(n);
  if (-6 < n && n <= 0) return "0." + std::string(-n, '0') + digits;
  std::string mantissa = digits.substr(0, 1);
  if (k > 1) mantissa += "." + digits.substr(1);
  return mantissa + "e" + (n - 1 >= 0 ? "+" : "-") +
         std::to_string(abs(n - 1));
}

std::string Value::ToString() const { return ToStringAtDepth(0); }

std::string Value::ToStringAtDepth(int depth) const {
  switch (type_) {
    case Type::UNDEFINED:
      return "undefined";
    case Type::NULL_VALUE:
      return "null";
    case Type::BOOLEAN:
      return boolean_ ? "true" : "false";
    case Type::NUMBER:
      return FormatNumber(number_);
    case Type::STRING:
      return string_;
    case Type::ELEMENT:
      if (node_->type() == Node::Type::TEXT) return "[object Text]";
      return "[object HTMLElement]";
    case Type::LIST: {
      if (depth >= kMaxPrintDepth) return "";
      std::string out;
      for (size_t i = 0; i < list_->size(); i++) {
        if (i) out += ",";
        const Value& item = (*list_)[i];
        if (!item.IsNullish()) out += item.ToStringAtDepth(depth + 1);
      }
      return out;
    }
    case Type::OBJECT:
      return object_->Inspect();
    case Type::FUNCTION:
      return "function " + function_->name + "() { [native code] }";
  }
  return "";
}

std::string Value::Inspect() const { return InspectAtDepth(0); }

std::string Value::InspectAtDepth(int depth) const {
  switch (type_) {
    case Type::STRING:
      return depth == 0 ? string_ : Quote(string_);
    case Type::ELEMENT:
      return InspectNode(node_);
    case Type::LIST: {
      if (depth >= kMaxPrintDepth) return "[...]";
      std::string out = "[";
      for (size_t i = 0; i < list_->size(); i++) {
        if (i) out += ", ";
        out += (*list_)[i].InspectAtDepth(depth + 1);
      }
      return out + "]";
    }
    case Type::FUNCTION:
      return "[Function: " + function_->name + "]";
    default:
      return ToStringAtDepth(depth);
  }
}

std::string Value::TypeOf() const {
  switch (type_) {
    case Type::UNDEFINED:
      return "undefined";
    case Type::BOOLEAN:
      return "boolean";
    case Type::NUMBER:
      return "number";
    case Type::STRING:
      return "string";
    case Type::FUNCTION:
      return "function";
    default:
      return "object";
  }
}

bool Value::StrictEquals(const Value& a, const Value& b) {
  if (a.type_ != b.type_) return false;
  switch (a.type_) {
    case Type::UNDEFINED:
    case Type::NULL_VALUE:
      return true;
    case Type::BOOLEAN:
      return a.boolean_ == b.boolean_;
    case Type::NUMBER:
      return a.number_ == b.number_;
    case Type::STRING:
      return a.string_ == b.string_;
    case Type::ELEMENT:
      return a.node_ == b.node_;
    case Type::LIST:
      return a.list_ == b.list_;
    case Type::OBJECT:
      return a.object_ == b.object_;
    case Type::FUNCTION:
      return a.function_ == b.function_;
  }
  return false;
}

bool Value::LooseEquals(const Value& a, const Value& b) {
  if (a.type_ == b.type_) return StrictEquals(a, b);
  if (a.IsNullish() || b.IsNullish()) return a.IsNullish() && b.IsNullish();
  auto primitive = [](const Value& v) {
    return v.type_ == Type::BOOLEAN || v.type_ == Type::NUMBER ||
           v.type_ == Type::STRING;
  };
  if (primitive(a) && primitive(b)) return a.ToNumber() == b.ToNumber();
  // Objects compared with primitives are converted to strings first.
  if (!primitive(a) && primitive(b)) {
    return LooseEquals(Value::String(a.ToString()), b);
  }
  if (primitive(a) && !primitive(b)) {
    return LooseEquals(a, Value::String(b.ToString()));
  }
  return false;
}

}  // namespace runtime
