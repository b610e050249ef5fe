#include "runtime/builtins.hpp"

#include <math.h>
#include <stdio.h>
#include <stdlib.h>

#include <algorithm>

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include "absl/strings/strip.h"
#include "runtime/html.hpp"
#include "runtime/selector.hpp"

namespace runtime {

namespace {

using Arguments = std::vector<Value>;

const Value& Argument(const Arguments& arguments, size_t i) {
  static const Value* undefined = new Value();
  return i < arguments.size() ? arguments[i] : *undefined;
}

std::string StringArgument(const Arguments& arguments, size_t i) {
  return Argument(arguments, i).ToString();
}

Node* NodeArgument(const Arguments& arguments, size_t i,
                   const std::string& function) {
  const Value& value = Argument(arguments, i);
  if (value.type() != Value::Type::ELEMENT) {
    throw ScriptError("TypeError", "Failed to execute '" + function +
                                       "': parameter " + std::to_string(i + 1) +
                                       " is not of type 'Node'");
  }
  return value.node();
}

Value ElementList(const std::vector<Node*>& nodes) {
  Value::ListType items;
  for (Node* node : nodes) items.push_back(Value::Element(node));
  return Value::List(std::move(items));
}

SelectorList ParseSelector(const std::string& text) {
  try {
    return SelectorList::Parse(text);
  } catch (const SelectorError& e) {
    throw ScriptError("SyntaxError", e.what());
  }
}

// Resolves a relative index argument as slice does.
size_t RelativeIndex(const Value& argument, size_t length, size_t fallback) {
  if (argument.IsUndefined()) return fallback;
  double index = argument.ToNumber();
  if (isnan(index)) return 0;
  index = trunc(index);
  if (index < 0) index = std::max(0.0, length + index);
  return static_cast<size_t>(std::min<double>(index, length));
}

std::vector<Node*> ElementsByTagName(const Node* root, const std::string& tag) {
  std::string lower = absl::AsciiStrToLower(tag);
  std::vector<Node*> found;
  root->ForEachDescendantElement([&found, &lower](Node* element) {
    if (lower == "*" || element->tag() == lower) found.push_back(element);
  });
  return found;
}

std::vector<Node*> ElementsByClassName(const Node* root,
                                       const std::string& names) {
  std::vector<std::string> wanted = absl::StrSplit(
      names, absl::ByAnyChar(" \t\n\r\f"), absl::SkipEmpty());
  std::vector<Node*> found;
  if (wanted.empty()) return found;
  root->ForEachDescendantElement([&found, &wanted](Node* element) {
    for (const std::string& name : wanted) {
      if (!element->HasClass(name)) return;
    }
    found.push_back(element);
  });
  return found;
}

void CheckToken(const std::string& token) {
  if (token.empty()) {
    throw ScriptError("SyntaxError", "The token provided must not be empty.");
  }
  if (std::any_of(token.begin(), token.end(),
                  [](char c) { return absl::ascii_isspace(c); })) {
    throw ScriptError("SyntaxError", "The token provided ('" + token +
                                         "') contains HTML space characters");
  }
}

class ClassList : public HostObject {
 public:
  explicit ClassList(Node* node) : node_(node) {}
  std::string ClassName() const override { return "DOMTokenList"; }

  Value Get(const std::string& property) override {
    Node* node = node_;
    if (property == "length") {
      return Value::Number(node->Classes().size());
    }
    if (property == "value") {
      const std::string* value = node->GetAttribute("class");
      return Value::String(value ? *value : "");
    }
    if (property == "contains") {
      return Value::Function("contains", [node](const Arguments& arguments) {
        return Value::Boolean(node->HasClass(StringArgument(arguments, 0)));
      });
    }
    if (property == "add") {
      return Value::Function("add", [node](const Arguments& arguments) {
        std::vector<std::string> classes = node->Classes();
        for (const Value& argument : arguments) {
          std::string token = argument.ToString();
          CheckToken(token);
          if (std::find(classes.begin(), classes.end(), token) ==
              classes.end()) {
            classes.push_back(token);
          }
        }
        node->SetAttribute("class", absl::StrJoin(classes, " "));
        return Value();
      });
    }
    if (property == "remove") {
      return Value::Function("remove", [node](const Arguments& arguments) {
        std::vector<std::string> classes = node->Classes();
        for (const Value& argument : arguments) {
          std::string token = argument.ToString();
          CheckToken(token);
          classes.erase(std::remove(classes.begin(), classes.end(), token),
                        classes.end());
        }
        if (node->GetAttribute("class") != nullptr) {
          node->SetAttribute("class", absl::StrJoin(classes, " "));
        }
        return Value();
      });
    }
    if (property == "toggle") {
      return Value::Function("toggle", [node](const Arguments& arguments) {
        std::string token = StringArgument(arguments, 0);
        CheckToken(token);
        std::vector<std::string> classes = node->Classes();
        auto it = std::find(classes.begin(), classes.end(), token);
        bool present = it != classes.end();
        const Value& force = Argument(arguments, 1);
        bool wanted = force.IsUndefined() ? !present : force.Truthy();
        if (wanted && !present) classes.push_back(token);
        if (!wanted && present) {
          classes.erase(std::remove(classes.begin(), classes.end(), token),
                        classes.end());
        }
        node->SetAttribute("class", absl::StrJoin(classes, " "));
        return Value::Boolean(wanted);
      });
    }
    return Value();
  }

  std::string Inspect() const override {
    return "DOMTokenList(" + absl::StrJoin(node_->Classes(), " ") + ")";
  }

 private:
  Node* node_;
};

// The style attribute of an element, as el.style.
class InlineStyle : public HostObject {
 public:
  explicit InlineStyle(Node* node) : node_(node) {}
  std::string ClassName() const override { return "CSSStyleDeclaration"; }

  Value Get(const std::string& property) override {
    Node* node = node_;
    if (property == "cssText") {
      return Value::String(SerializeDeclarations(Declarations(node)));
    }
    if (property == "getPropertyValue") {
      return Value::Function(
          "getPropertyValue", [node](const Arguments& arguments) {
            return Value::String(Lookup(
                node, absl::AsciiStrToLower(StringArgument(arguments, 0))));
          });
    }
    if (property == "setProperty") {
      return Value::Function("setProperty", [node](const Arguments& arguments) {
        Update(node, absl::AsciiStrToLower(StringArgument(arguments, 0)),
               Argument(arguments, 1).IsNullish()
                   ? ""
                   : StringArgument(arguments, 1));
        return Value();
      });
    }
    if (property == "removeProperty") {
      return Value::Function(
          "removeProperty", [node](const Arguments& arguments) {
            std::string name =
                absl::AsciiStrToLower(StringArgument(arguments, 0));
            std::string old_value = Lookup(node, name);
            Update(node, name, "");
            return Value::String(old_value);
          });
    }
    return Value::String(Lookup(node, CamelCaseToProperty(property)));
  }

  void Set(const std::string& property, const Value& value) override {
    std::string text = value.IsNullish() ? "" : value.ToString();
    if (property == "cssText") {
      node_->SetAttribute("style", text);
      return;
    }
    Update(node_, CamelCaseToProperty(property), text);
  }

 private:
  static std::vector<Declaration> Declarations(const Node* node) {
    const std::string* style = node->GetAttribute("style");
    if (style == nullptr) return {};
    return ParseDeclarations(*style);
  }

  static std::string Lookup(const Node* node, const std::string& property) {
    std::string value;
    for (const Declaration& declaration : Declarations(node)) {
      if (declaration.property == property) value = declaration.value;
    }
    return value;
  }

  // An empty value removes the property.
  static void Update(Node* node, const std::string& property,
                     const std::string& value) {
    std::vector<Declaration> declarations = Declarations(node);
    auto it = std::remove_if(declarations.begin(), declarations.end(),
                             [&property](const Declaration& declaration) {
                               return declaration.property == property;
                             });
    declarations.erase(it, declarations.end());
    std::vector<Declaration> parsed =
        ParseDeclarations(property + ": " + value);
    if (!value.empty() && !parsed.empty()) {
      parsed.back().important = false;
      declarations.push_back(parsed.back());
    }
    node->SetAttribute("style", SerializeDeclarations(declarations));
  }

  Node* node_;
};

// Result of getComputedStyle: evaluated on each access, so it is live.
class ComputedStyleObject : public HostObject {
 public:
  ComputedStyleObject(Node* node, const StyleResolver* styles)
      : node_(node), styles_(styles) {}
  std::string ClassName() const override { return "CSSStyleDeclaration"; }

  Value Get(const std::string& property) override {
    Node* node = node_;
    const StyleResolver* styles = styles_;
    if (property == "getPropertyValue") {
      return Value::Function(
          "getPropertyValue", [node, styles](const Arguments& arguments) {
            return Value::String(styles->ComputedValue(
                node, absl::AsciiStrToLower(StringArgument(arguments, 0))));
          });
    }
    return Value::String(
        styles->ComputedValue(node, CamelCaseToProperty(property)));
  }

 private:
  Node* node_;
  const StyleResolver* styles_;
};

class Console : public HostObject {
 public:
  explicit Console(ConsoleSink sink) : sink_(std::move(sink)) {}
  std::string ClassName() const override { return "Console"; }

  Value Get(const std::string& property) override {
    if (property != "log" && property != "info" && property != "warn" &&
        property != "error" && property != "debug") {
      return Value();
    }
    ConsoleSink sink = sink_;
    return Value::Function(property, [sink,
                                      property](const Arguments& arguments) {
      std::vector<std::string> parts;
      for (const Value& argument : arguments) {
        parts.push_back(argument.Inspect());
      }
      sink(property, absl::StrJoin(parts, " "));
      return Value();
    });
  }

 private:
  ConsoleSink sink_;
};

class MathObject : public HostObject {
 public:
  std::string ClassName() const override { return "Math"; }

  Value Get(const std::string& property) override {
    if (property == "PI") return Value::Number(M_PI);
    if (property == "E") return Value::Number(M_E);
    struct UnaryFunction {
      const char* name;
      double (*call)(double);
    };
    static const UnaryFunction kUnary[] = {
        {"floor", floor}, {"ceil", ceil}, {"abs", fabs},  {"sqrt", sqrt},
        {"trunc", trunc}, {"round", Round}, {"sign", Sign}};
    for (const UnaryFunction& function : kUnary) {
      if (property != function.name) continue;
      double (*f)(double) = function.call;
      return Value::Function(property, [f](const Arguments& arguments) {
        return Value::Number(f(Argument(arguments, 0).ToNumber()));
      });
    }
    if (property == "pow") {
      return Value::Function("pow", [](const Arguments& arguments) {
        return Value::Number(pow(Argument(arguments, 0).ToNumber(),
                                 Argument(arguments, 1).ToNumber()));
      });
    }
    if (property == "min" || property == "max") {
      bool is_max = property == "max";
      return Value::Function(property, [is_max](const Arguments& arguments) {
        double result = is_max ? -INFINITY : INFINITY;
        for (const Value& argument : arguments) {
          double value = argument.ToNumber();
          if (isnan(value)) return Value::Number(NAN);
          result = is_max ? std::max(result, value) : std::min(result, value);
        }
        return Value::Number(result);
      });
    }
    return Value();
  }

 private:
  static double Round(double value) { return floor(value + 0.5); }
  static double Sign(double value) {
    if (isnan(value) || value == 0) return value;
    return value > 0 ? 1 : -1;
  }
};

class DocumentObject : public HostObject {
 public:
  explicit DocumentObject(Document* document) : document_(document) {}
  std::string ClassName() const override { return "HTMLDocument"; }

  Value Get(const std::string& property) override {
    Document* document = document_;
    if (property == "body") return Value::Element(document->Body());
    if (property == "head") return Value::Element(document->Head());
    if (property == "documentElement") {
      return Value::Element(document->DocumentElement());
    }
    if (property == "title") return Value::String(document->Title());
    if (property == "getElementById") {
      return Value::Function(
          "getElementById", [document](const Arguments& arguments) {
            return Value::Element(
                document->GetElementById(StringArgument(arguments, 0)));
          });
    }
    if (property == "createElement") {
      return Value::Function(
          "createElement", [document](const Arguments& arguments) {
            std::string tag = StringArgument(arguments, 0);
            if (tag.empty() ||
                std::any_of(tag.begin(), tag.end(), [](char c) {
                  return !absl::ascii_isalnum(c) && c != '-';
                })) {
              throw ScriptError("TypeError",
                                "The tag name provided ('" + tag +
                                    "') is not a valid name.");
            }
            return Value::Element(document->CreateElement(tag));
          });
    }
    if (property == "createTextNode") {
      return Value::Function(
          "createTextNode", [document](const Arguments& arguments) {
            return Value::Element(
                document->CreateText(StringArgument(arguments, 0)));
          });
    }
    // The query methods behave as on the root element.
    if (property == "querySelector" || property == "querySelectorAll" ||
        property == "getElementsByTagName" ||
        property == "getElementsByClassName") {
      return ElementProperty(document->root(), property);
    }
    return Value();
  }

  void Set(const std::string& property, const Value& value) override {
    if (property != "title") HostObject::Set(property, value);
    Node* head = document_->Head();
    if (head == nullptr) return;
    Node* title = nullptr;
    for (Node* child : head->ElementChildren()) {
      if (child->tag() == "title") {
        title = child;
        break;
      }
    }
    if (title == nullptr) {
      title = document_->CreateElement("title");
      head->AppendChild(title);
    }
    title->SetTextContent(value.ToString());
  }

 private:
  Document* document_;
};

double ParseInt(const std::string& text, int radix) {
  std::string trimmed(absl::StripLeadingAsciiWhitespace(text));
  size_t i = 0;
  double sign = 1;
  if (i < trimmed.size() && (trimmed[i] == '+' || trimmed[i] == '-')) {
    if (trimmed[i] == '-') sign = -1;
    i++;
  }
  if ((radix == 0 || radix == 16) && trimmed.compare(i, 2, "0x") == 0) {
    radix = 16;
    i += 2;
  } else if ((radix == 0 || radix == 16) && trimmed.compare(i, 2, "0X") == 0) {
    radix = 16;
    i += 2;
  }
  if (radix == 0) radix = 10;
  if (radix < 2 || radix > 36) return NAN;
  double result = 0;
  size_t start = i;
  for (; i < trimmed.size(); i++) {
    char c = absl::ascii_tolower(trimmed[i]);
    int digit = absl::ascii_isdigit(c) ? c - '0'
                : (c >= 'a' && c <= 'z') ? c - 'a' + 10
                                         : 99;
    if (digit >= radix) break;
    result = result * radix + digit;
  }
  if (i == start) return NAN;
  return sign * result;
}

double ParseFloat(const std::string& text) {
  std::string trimmed(absl::StripLeadingAsciiWhitespace(text));
  if (absl::StartsWith(trimmed, "Infinity") ||
      absl::StartsWith(trimmed, "+Infinity")) {
    return INFINITY;
  }
  if (absl::StartsWith(trimmed, "-Infinity")) return -INFINITY;
  // Only decimal notation, strtod would also accept hex and nan.
  size_t end = 0;
  if (end < trimmed.size() && (trimmed[end] == '+' || trimmed[end] == '-')) {
    end++;
  }
  size_t digits = 0;
  while (end < trimmed.size() && absl::ascii_isdigit(trimmed[end])) {
    end++;
    digits++;
  }
  if (end < trimmed.size() && trimmed[end] == '.') {
    end++;
    while (end < trimmed.size() && absl::ascii_isdigit(trimmed[end])) {
      end++;
      digits++;
    }
  }
  if (digits == 0) return NAN;
  if (end < trimmed.size() && (trimmed[end] == 'e' || trimmed[end] == 'E')) {
    size_t exponent = end + 1;
    if (exponent < trimmed.size() &&
        (trimmed[exponent] == '+' || trimmed[exponent] == '-')) {
      exponent++;
    }
    if (exponent < trimmed.size() && absl::ascii_isdigit(trimmed[exponent])) {
      end = exponent;
      while (end < trimmed.size() && absl::ascii_isdigit(trimmed[end])) end++;
    }
  }
  return strtod(trimmed.substr(0, end).c_str(), nullptr);
}

}  // namespace

Value ErrorObject::Get(const std::string& property) {
  if (property == "name") return Value::String(name_);
  if (property == "message") return Value::String(message_);
  return Value();
}

std::string CamelCaseToProperty(const std::string& name) {
  if (name == "cssFloat") return "float";
  std::string property;
  for (char c : name) {
    if (absl::ascii_isupper(c)) {
      property += '-';
      property += absl::ascii_tolower(c);
    } else {
      property += c;
    }
  }
  return property;
}

std::vector<std::pair<std::string, Value>> GlobalBindings(
    Document* document, const StyleResolver* styles, ConsoleSink console) {
  std::vector<std::pair<std::string, Value>> globals;
  auto add = [&globals](const std::string& name, Value value) {
    globals.emplace_back(name, std::move(value));
  };
  auto add_function = [&add](const std::string& name, Value::Native call) {
    add(name, Value::Function(name, std::move(call)));
  };

  add("console", Value::Object(std::make_shared<Console>(std::move(console))));
  add("document", Value::Object(std::make_shared<DocumentObject>(document)));
  add("Math", Value::Object(std::make_shared<MathObject>()));
  add("NaN", Value::Number(NAN));
  add("Infinity", Value::Number(INFINITY));

  add_function("getComputedStyle", [styles](const Arguments& arguments) {
    Node* node = NodeArgument(arguments, 0, "getComputedStyle");
    if (!node->IsElement()) {
      throw ScriptError("TypeError",
                        "Failed to execute 'getComputedStyle': parameter 1 "
                        "is not of type 'Element'");
    }
    return Value::Object(std::make_shared<ComputedStyleObject>(node, styles));
  });
  add_function("assert", [](const Arguments& arguments) {
    if (!Argument(arguments, 0).Truthy()) {
      const Value& message = Argument(arguments, 1);
      throw ScriptError("AssertionError", message.IsUndefined()
                                              ? "Assertion failed"
                                              : message.ToString());
    }
    return Value::Boolean(true);
  });
  add_function("String", [](const Arguments& arguments) {
    if (arguments.empty()) return Value::String("");
    return Value::String(arguments[0].ToString());
  });
  add_function("Number", [](const Arguments& arguments) {
    if (arguments.empty()) return Value::Number(0);
    return Value::Number(arguments[0].ToNumber());
  });
  add_function("Boolean", [](const Arguments& arguments) {
    return Value::Boolean(Argument(arguments, 0).Truthy());
  });
  add_function("parseInt", [](const Arguments& arguments) {
    double radix = Argument(arguments, 1).ToNumber();
    return Value::Number(ParseInt(StringArgument(arguments, 0),
                                  isnan(radix) ? 0 : static_cast<int>(radix)));
  });
  add_function("parseFloat", [](const Arguments& arguments) {
    return Value::Number(ParseFloat(StringArgument(arguments, 0)));
  });
  add_function("isNaN", [](const Arguments& arguments) {
    return Value::Boolean(isnan(Argument(arguments, 0).ToNumber()));
  });
  add_function("Error", [](const Arguments& arguments) {
    const Value& message = Argument(arguments, 0);
    return Value::Object(std::make_shared<ErrorObject>(
        "Error", message.IsUndefined() ? "" : message.ToString()));
  });
  return globals;
}

Value ElementProperty(Node* node, const std::string& name) {
  // Shared by every kind of node.
  if (name == "nodeType") {
    switch (node->type()) {
      case Node::Type::ELEMENT:
        return Value::Number(1);
      case Node::Type::TEXT:
        return Value::Number(3);
      case Node::Type::COMMENT:
        return Value::Number(8);
      case Node::Type::DOCUMENT:
        return Value::Number(9);
    }
  }
  if (name == "textContent") return Value::String(node->TextContent());
  if (name == "parentElement") return Value::Element(node->ParentElement());
  if (name == "remove") {
    return Value::Function("remove", [node](const Arguments&) {
      node->Remove();
      return Value();
    });
  }
  if (!node->IsElement() && node->type() != Node::Type::DOCUMENT) {
    if (name == "data" || name == "nodeValue") {
      return Value::String(node->data());
    }
    if (name == "nodeName") {
      return Value::String(node->type() == Node::Type::TEXT ? "#text"
                                                             : "#comment");
    }
    return Value();
  }

  if (name == "querySelector") {
    return Value::Function("querySelector", [node](const Arguments& arguments) {
      return Value::Element(
          ParseSelector(StringArgument(arguments, 0)).QueryFirst(node));
    });
  }
  if (name == "querySelectorAll") {
    return Value::Function(
        "querySelectorAll", [node](const Arguments& arguments) {
          return ElementList(
              ParseSelector(StringArgument(arguments, 0)).QueryAll(node));
        });
  }
  if (name == "getElementsByTagName") {
    return Value::Function(
        "getElementsByTagName", [node](const Arguments& arguments) {
          return ElementList(
              ElementsByTagName(node, StringArgument(arguments, 0)));
        });
  }
  if (name == "getElementsByClassName") {
    return Value::Function(
        "getElementsByClassName", [node](const Arguments& arguments) {
          return ElementList(
              ElementsByClassName(node, StringArgument(arguments, 0)));
        });
  }
  if (name == "children") return ElementList(node->ElementChildren());
  if (name == "childElementCount") {
    return Value::Number(node->ElementChildren().size());
  }
  if (name == "firstElementChild") {
    return Value::Element(node->FirstElementChild());
  }
  if (name == "lastElementChild") {
    return Value::Element(node->LastElementChild());
  }
  if (name == "appendChild") {
    return Value::Function("appendChild", [node](const Arguments& arguments) {
      Node* child = NodeArgument(arguments, 0, "appendChild");
      if (child->type() == Node::Type::DOCUMENT ||
          !node->AppendChild(child)) {
        throw ScriptError("TypeError",
                          "Failed to execute 'appendChild': the new child "
                          "contains the parent");
      }
      return Value::Element(child);
    });
  }
  if (node->type() == Node::Type::DOCUMENT) return Value();

  if (name == "tagName" || name == "nodeName") {
    return Value::String(absl::AsciiStrToUpper(node->tag()));
  }
  if (name == "id" || name == "className") {
    const std::string* value =
        node->GetAttribute(name == "id" ? "id" : "class");
    return Value::String(value ? *value : "");
  }
  if (name == "innerHTML") return Value::String(SerializeChildren(node));
  if (name == "parentNode") return Value::Element(node->parent());
  if (name == "nextElementSibling" || name == "previousElementSibling") {
    Node* parent = node->parent();
    if (parent == nullptr) return Value::Null();
    std::vector<Node*> siblings = parent->ElementChildren();
    auto it = std::find(siblings.begin(), siblings.end(), node);
    if (name == "nextElementSibling") {
      return ++it == siblings.end() ? Value::Null() : Value::Element(*it);
    }
    return it == siblings.begin() ? Value::Null() : Value::Element(*--it);
  }
  if (name == "classList") {
    return Value::Object(std::make_shared<ClassList>(node));
  }
  if (name == "style") {
    return Value::Object(std::make_shared<InlineStyle>(node));
  }
  if (name == "getAttribute") {
    return Value::Function("getAttribute", [node](const Arguments& arguments) {
      const std::string* value = node->GetAttribute(
          absl::AsciiStrToLower(StringArgument(arguments, 0)));
      return value ? Value::String(*value) : Value::Null();
    });
  }
  if (name == "hasAttribute") {
    return Value::Function("hasAttribute", [node](const Arguments& arguments) {
      return Value::Boolean(
          node->GetAttribute(absl::AsciiStrToLower(
              StringArgument(arguments, 0))) != nullptr);
    });
  }
  if (name == "setAttribute") {
    return Value::Function("setAttribute", [node](const Arguments& arguments) {
      std::string attribute =
          absl::AsciiStrToLower(StringArgument(arguments, 0));
      if (attribute.empty()) {
        throw ScriptError("TypeError", "Invalid attribute name");
      }
      node->SetAttribute(attribute, StringArgument(arguments, 1));
      return Value();
    });
  }
  if (name == "removeAttribute") {
    return Value::Function(
        "removeAttribute", [node](const Arguments& arguments) {
          node->RemoveAttribute(
              absl::AsciiStrToLower(StringArgument(arguments, 0)));
          return Value();
        });
  }
  if (name == "matches") {
    return Value::Function("matches", [node](const Arguments& arguments) {
      return Value::Boolean(
          ParseSelector(StringArgument(arguments, 0)).Matches(node));
    });
  }
  return Value();
}

void SetElementProperty(Node* node, const std::string& name,
                        const Value& value) {
  std::string text = value.IsNullish() ? "" : value.ToString();
  if (name == "textContent") {
    node->SetTextContent(text);
    return;
  }
  if (node->IsElement()) {
    if (name == "id") {
      node->SetAttribute("id", text);
      return;
    }
    if (name == "className") {
      node->SetAttribute("class", text);
      return;
    }
    if (name == "innerHTML") {
      ParseHtmlFragment(text, node);
      return;
    }
  }
  throw ScriptError("TypeError", "Cannot set property '" + name +
                                     "' of " + Value::Element(node).Inspect());
}

Value StringProperty(const std::string& text, const std::string& name) {
  if (name == "length") return Value::Number(text.size());
  if (name == "toUpperCase") {
    return Value::Function("toUpperCase", [text](const Arguments&) {
      return Value::String(absl::AsciiStrToUpper(text));
    });
  }
  if (name == "toLowerCase") {
    return Value::Function("toLowerCase", [text](const Arguments&) {
      return Value::String(absl::AsciiStrToLower(text));
    });
  }
  if (name == "trim") {
    return Value::Function("trim", [text](const Arguments&) {
      return Value::String(std::string(absl::StripAsciiWhitespace(text)));
    });
  }
  if (name == "includes") {
    return Value::Function("includes", [text](const Arguments& arguments) {
      return Value::Boolean(absl::StrContains(text,
                                              StringArgument(arguments, 0)));
    });
  }
  if (name == "startsWith") {
    return Value::Function("startsWith", [text](const Arguments& arguments) {
      return Value::Boolean(absl::StartsWith(text,
                                             StringArgument(arguments, 0)));
    });
  }
  if (name == "endsWith") {
    return Value::Function("endsWith", [text](const Arguments& arguments) {
      return Value::Boolean(absl::EndsWith(text,
                                           StringArgument(arguments, 0)));
    });
  }
  if (name == "indexOf") {
    return Value::Function("indexOf", [text](const Arguments& arguments) {
      size_t pos = text.find(StringArgument(arguments, 0));
      return Value::Number(pos == std::string::npos ? -1.0 : pos);
    });
  }
  if (name == "charAt") {
    return Value::Function("charAt", [text](const Arguments& arguments) {
      double index = Argument(arguments, 0).ToNumber();
      if (isnan(index)) index = 0;
      if (index < 0 || index >= text.size()) return Value::String("");
      return Value::String(text.substr(static_cast<size_t>(index), 1));
    });
  }
  if (name == "slice") {
    return Value::Function("slice", [text](const Arguments& arguments) {
      size_t begin = RelativeIndex(Argument(arguments, 0), text.size(), 0);
      size_t end =
          RelativeIndex(Argument(arguments, 1), text.size(), text.size());
      if (end <= begin) return Value::String("");
      return Value::String(text.substr(begin, end - begin));
    });
  }
  if (name == "split") {
    return Value::Function("split", [text](const Arguments& arguments) {
      Value::ListType parts;
      const Value& separator = Argument(arguments, 0);
      if (separator.IsUndefined()) {
        parts.push_back(Value::String(text));
      } else if (separator.ToString().empty()) {
        for (char c : text) parts.push_back(Value::String(std::string(1, c)));
      } else {
        for (absl::string_view part :
             absl::StrSplit(text, separator.ToString())) {
          parts.push_back(Value::String(std::string(part)));
        }
      }
      return Value::List(std::move(parts));
    });
  }
  return Value();
}

Value NumberProperty(double number, const std::string& name) {
  if (name == "toFixed") {
    return Value::Function("toFixed", [number](const Arguments& arguments) {
      double digits = Argument(arguments, 0).ToNumber();
      if (isnan(digits)) digits = 0;
      if (digits < 0 || digits > 100) {
        throw ScriptError("RangeError",
                          "toFixed() digits argument must be between 0 and "
                          "100");
      }
      if (isnan(number) || isinf(number) || fabs(number) >= 1e21) {
        return Value::String(FormatNumber(number));
      }
      char buf[160];
      snprintf(buf, sizeof(buf), "%.*f", static_cast<int>(digits), number);
      return Value::String(buf);
    });
  }
  if (name == "toString") {
    return Value::Function("toString", [number](const Arguments&) {
      return Value::String(FormatNumber(number));
    });
  }
  return Value();
}

Value ListProperty(const std::shared_ptr<Value::ListType>& list,
                   const std::string& name) {
  if (name == "length") return Value::Number(list->size());
  if (name == "push") {
    return Value::Function("push", [list](const Arguments& arguments) {
      for (const Value& argument : arguments) list->push_back(argument);
      return Value::Number(list->size());
    });
  }
  if (name == "pop") {
    return Value::Function("pop", [list](const Arguments&) {
      if (list->empty()) return Value();
      Value last = list->back();
      list->pop_back();
      return last;
    });
  }
  if (name == "includes" || name == "indexOf") {
    bool includes = name == "includes";
    return Value::Function(name, [list, includes](const Arguments& arguments) {
      const Value& needle = Argument(arguments, 0);
      for (size_t i = 0; i < list->size(); i++) {
        const Value& item = (*list)[i];
        bool same = Value::StrictEquals(item, needle);
        // includes finds NaN, indexOf does not.
        if (!same && includes && item.type() == Value::Type::NUMBER &&
            needle.type() == Value::Type::NUMBER && isnan(item.number()) &&
            isnan(needle.number())) {
          same = true;
        }
        if (same) return includes ? Value::Boolean(true) : Value::Number(i);
      }
      return includes ? Value::Boolean(false) : Value::Number(-1);
    });
  }
  if (name == "join") {
    return Value::Function("join", [list](const Arguments& arguments) {
      const Value& separator = Argument(arguments, 0);
      std::string glue = separator.IsUndefined() ? "," : separator.ToString();
      std::vector<std::string> parts;
      for (const Value& item : *list) {
        parts.push_back(item.IsNullish() ? "" : item.ToString());
      }
      return Value::String(absl::StrJoin(parts, glue));
    });
  }
  if (name == "slice") {
    return Value::Function("slice", [list](const Arguments& arguments) {
      size_t begin = RelativeIndex(Argument(arguments, 0), list->size(), 0);
      size_t end =
          RelativeIndex(Argument(arguments, 1), list->size(), list->size());
      Value::ListType items;
      for (size_t i = begin; i < end; i++) items.push_back((*list)[i]);
      return Value::List(std::move(items));
    });
  }
  return Value();
}

}  // namespace runtime
