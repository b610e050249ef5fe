#include "runtime/interpreter.hpp"

#include <math.h>

#include <string>
#include <utility>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "runtime/html.hpp"

namespace {

using runtime::ScriptError;
using runtime::Value;
using ::testing::ElementsAre;
using ::testing::Pair;

const char kMarkup[] =
    "<html><head><title>Demo</title></head><body>\n"
    "<h1 id=\"title\" class=\"big\">Hello</h1>\n"
    "<ul id=\"list\"><li class=\"item\">a</li><li class=\"item done\">b</li>"
    "</ul>\n"
    "<p style=\"color: blue\">text</p>\n"
    "</body></html>";

const char kStyle[] =
    "h1 { color: red; font-size: 32px } .done { text-decoration: underline }";

class InterpreterTest : public ::testing::Test {
 protected:
  InterpreterTest()
      : styles_(&stylesheet_),
        interpreter_(&document_, &styles_,
                     [this](const std::string& level, const std::string& text) {
                       logs_.emplace_back(level, text);
                     }) {
    runtime::ParseHtml(kMarkup, &document_, nullptr);
    stylesheet_.Append(kStyle);
  }

  Value Eval(const std::string& source) {
    return interpreter_.EvaluateAssertion(source);
  }

  std::string Str(const std::string& source) {
    return Eval(source).ToString();
  }

  double Num(const std::string& source) {
    Value value = Eval(source);
    EXPECT_EQ(value.type(), Value::Type::NUMBER) << source;
    return value.number();
  }

  // Returns "<name>: <message>" of the error raised by source.
  std::string Error(const std::string& source) {
    try {
      Eval(source);
    } catch (const ScriptError& e) {
      return e.what();
    }
    return "no error";
  }

  runtime::Document document_;
  runtime::Stylesheet stylesheet_;
  runtime::StyleResolver styles_;
  std::vector<std::pair<std::string, std::string>> logs_;
  runtime::Interpreter interpreter_;
};

TEST_F(InterpreterTest, Operators) {
  EXPECT_EQ(Num("1 + 2 * 3"), 7);
  EXPECT_EQ(Num("(1 + 2) * 3"), 9);
  EXPECT_EQ(Num("7 % 3"), 1);
  EXPECT_EQ(Num("10 / 4"), 2.5);
  EXPECT_EQ(Num("1 + true"), 2);
  EXPECT_EQ(Num("-'3'"), -3);
  EXPECT_EQ(Str("'a' + 1"), "a1");
  EXPECT_EQ(Str("1 + 2 + 'x'"), "3x");
  EXPECT_EQ(Str("[1, 2] + ''"), "1,2");
  EXPECT_TRUE(Eval("'b' > 'a'").Truthy());
  EXPECT_TRUE(Eval("'10' < 9 == false").Truthy());
  EXPECT_TRUE(Eval("null == undefined").Truthy());
  EXPECT_FALSE(Eval("null === undefined").Truthy());
  EXPECT_TRUE(Eval("'1' != 2").Truthy());
  EXPECT_EQ(Str("0 || 'x'"), "x");
  EXPECT_EQ(Num("1 && 0"), 0);
  EXPECT_EQ(Str("1 > 2 ? 'a' : 'b'"), "b");
  EXPECT_EQ(Str("typeof undeclared"), "undefined");
  EXPECT_EQ(Str("typeof 'x'"), "string");
  EXPECT_EQ(Str("typeof document"), "object");
  EXPECT_EQ(Str("typeof Math.floor"), "function");
  EXPECT_TRUE(Eval("!''").Truthy());
  EXPECT_TRUE(isnan(Num("1 - 'x'")));
}

TEST_F(InterpreterTest, UpdateAndCompoundAssignment) {
  EXPECT_EQ(Num("let n = 5; n++"), 5);
  EXPECT_EQ(Num("let n = 5; ++n"), 6);
  EXPECT_EQ(Num("let n = 5; n--; n"), 4);
  EXPECT_EQ(Num("let n = 5; n *= 2; n -= 1; n"), 9);
  EXPECT_EQ(Str("let s = 'a'; s += 'b'; s"), "ab");
  EXPECT_EQ(Num("let l = [1]; l[0] += 4; l[0]"), 5);
}

TEST_F(InterpreterTest, GlobalsPersistAcrossScripts) {
  interpreter_.RunScript(
      "let count = 0\n"
      "for (let i = 0; i < 5; i++) { count += i }\n"
      "var v = 1\n"
      "var v = 2\n");
  EXPECT_EQ(interpreter_.GetGlobal("count").number(), 10);
  EXPECT_EQ(interpreter_.GetGlobal("v").number(), 2);
  EXPECT_TRUE(interpreter_.GetGlobal("i").IsUndefined());
  EXPECT_EQ(Num("count * 2"), 20);
  try {
    interpreter_.RunScript("let count = 1");
    FAIL() << "redeclaration accepted";
  } catch (const ScriptError& e) {
    EXPECT_EQ(e.name(), "SyntaxError");
  }
}

TEST_F(InterpreterTest, AssertionScopeIsFresh) {
  interpreter_.RunScript("let shared = 1");
  EXPECT_EQ(Num("let local = 2; shared + local"), 3);
  EXPECT_EQ(Str("typeof local"), "undefined");
  EXPECT_EQ(Num("let local = 5; local"), 5);
}

TEST_F(InterpreterTest, BlockScopes) {
  interpreter_.RunScript("let a = 1\n{ let a = 2\n a = 3 }\nif (a) { let b = 1 }");
  EXPECT_EQ(interpreter_.GetGlobal("a").number(), 1);
  EXPECT_TRUE(interpreter_.GetGlobal("b").IsUndefined());
}

TEST_F(InterpreterTest, Loops) {
  interpreter_.RunScript(
      "let s = ''\n"
      "let i = 0\n"
      "while (true) {\n"
      "  i++\n"
      "  if (i > 5) break\n"
      "  if (i % 2) continue\n"
      "  s += i\n"
      "}\n");
  EXPECT_EQ(interpreter_.GetGlobal("s").ToString(), "24");
  EXPECT_EQ(Num("let t = 0; for (;;) { t++; if (t == 3) break } t"), 3);
}

TEST_F(InterpreterTest, AssertionValue) {
  EXPECT_EQ(Str("if (1) { return 'early' } 'late'"), "early");
  EXPECT_EQ(Num("for (let i = 0; i < 10; i++) { if (i == 3) return i }"), 3);
  EXPECT_EQ(Str("1; 2; 'last'"), "last");
  EXPECT_TRUE(Eval("let x = 1").IsUndefined());
  EXPECT_TRUE(Eval("").IsUndefined());
  EXPECT_TRUE(Eval("return").IsUndefined());
}

TEST_F(InterpreterTest, Errors) {
  EXPECT_EQ(Error("throw Error('boom')"), "Error: boom");
  EXPECT_EQ(Error("throw 'plain'"), "Error: plain");
  EXPECT_EQ(Error("throw 42"), "Error: 42");
  EXPECT_EQ(Error("assert(1 == 2, 'math broke')"), "AssertionError: math broke");
  EXPECT_EQ(Error("assert(false)"), "AssertionError: Assertion failed");
  EXPECT_TRUE(Eval("assert(true)").Truthy());
  EXPECT_EQ(Error("document.foo()"),
            "TypeError: document.foo is not a function");
  EXPECT_EQ(Error("null.x"),
            "TypeError: Cannot read properties of null (reading 'x')");
  EXPECT_EQ(Error("missing + 1"), "ReferenceError: missing is not defined");
  EXPECT_EQ(Error("missing = 1"), "ReferenceError: missing is not defined");
  EXPECT_EQ(Error("const k = 1; k = 2"),
            "TypeError: Assignment to constant variable.");
  EXPECT_EQ(Error("let l = []; l[5000000] = 1"),
            "RangeError: Invalid array length");
  EXPECT_EQ(Error("(5).x = 1"), "TypeError: Cannot create property 'x' on number");
  EXPECT_EQ(Error("Math.PI = 3"), "TypeError: Cannot set property 'PI' of Math");
  EXPECT_EQ(Str("Error('m').message"), "m");
  EXPECT_EQ(Str("Error('m')"), "Error: m");
  EXPECT_EQ(Error("let a = 1; let a = 2"),
            "SyntaxError: Identifier 'a' has already been declared");
}

TEST_F(InterpreterTest, Strings) {
  EXPECT_EQ(Str("'  Hi  '.trim().toUpperCase()"), "HI");
  EXPECT_EQ(Str("'MiXeD'.toLowerCase()"), "mixed");
  EXPECT_EQ(Num("'a,b,,c'.split(',').length"), 4);
  EXPECT_EQ(Num("'abc'.split('').length"), 3);
  EXPECT_EQ(Str("'a b'.split()[0]"), "a b");
  EXPECT_EQ(Str("'hello'.slice(-3)"), "llo");
  EXPECT_EQ(Str("'hello'.slice(1, -1)"), "ell");
  EXPECT_EQ(Str("'hello'.slice(4, 2)"), "");
  EXPECT_EQ(Num("'hello'.indexOf('l')"), 2);
  EXPECT_EQ(Num("'hello'.indexOf('z')"), -1);
  EXPECT_EQ(Str("'hello'[1]"), "e");
  EXPECT_TRUE(Eval("'hello'[10]").IsUndefined());
  EXPECT_EQ(Str("'hello'.charAt(9)"), "");
  EXPECT_EQ(Num("'hello'.length"), 5);
  EXPECT_TRUE(Eval("'Hello'.startsWith('He') && 'Hello'.endsWith('lo') && "
                   "'Hello'.includes('ell')")
                  .Truthy());
}

TEST_F(InterpreterTest, Numbers) {
  EXPECT_EQ(Str("(3.14159).toFixed(2)"), "3.14");
  EXPECT_EQ(Str("(2).toFixed()"), "2");
  EXPECT_EQ(Str("(10).toString()"), "10");
  EXPECT_EQ(Str("String(1.50)"), "1.5");
  EXPECT_EQ(Num("Number('42') + 1"), 43);
  EXPECT_EQ(Num("Number()"), 0);
  EXPECT_EQ(Num("parseInt('42px')"), 42);
  EXPECT_EQ(Num("parseInt('  -7')"), -7);
  EXPECT_EQ(Num("parseInt('ff', 16)"), 255);
  EXPECT_EQ(Num("parseInt('0x1A')"), 26);
  EXPECT_EQ(Num("parseFloat('3.5em')"), 3.5);
  EXPECT_EQ(Num("parseFloat('-.5')"), -0.5);
  EXPECT_TRUE(Eval("isNaN(parseInt('x'))").Truthy());
  EXPECT_TRUE(Eval("isNaN(parseFloat('.'))").Truthy());
  EXPECT_FALSE(Eval("isNaN('12')").Truthy());
}

TEST_F(InterpreterTest, Math) {
  EXPECT_EQ(Num("Math.max(1, 5, 3)"), 5);
  EXPECT_EQ(Num("Math.min(4, '2')"), 2);
  EXPECT_EQ(Num("Math.min()"), INFINITY);
  EXPECT_EQ(Num("Math.floor(-1.5)"), -2);
  EXPECT_EQ(Num("Math.ceil(1.2)"), 2);
  EXPECT_EQ(Num("Math.round(2.5)"), 3);
  EXPECT_EQ(Num("Math.round(-2.5)"), -2);
  EXPECT_EQ(Num("Math.abs(-3)"), 3);
  EXPECT_EQ(Num("Math.pow(2, 10)"), 1024);
  EXPECT_EQ(Num("Math.sqrt(16)"), 4);
  EXPECT_EQ(Num("Math.trunc(-4.7)"), -4);
  EXPECT_EQ(Num("Math.sign(-3)"), -1);
  EXPECT_TRUE(isnan(Num("Math.max(1, 'x')")));
  EXPECT_GT(Num("Math.PI"), 3.14);
}

TEST_F(InterpreterTest, Lists) {
  EXPECT_EQ(Str("let l = [3, 1]; l.push(2); l.join('-')"), "3-1-2");
  EXPECT_EQ(Str("[1, null, 'a'].join()"), "1,,a");
  EXPECT_EQ(Num("[1, 2, 3].indexOf(2)"), 1);
  EXPECT_FALSE(Eval("[1, 2, 3].includes(4)").Truthy());
  EXPECT_TRUE(Eval("[1, '2'].includes('2')").Truthy());
  EXPECT_EQ(Num("[1, 2, 3].slice(1).length"), 2);
  EXPECT_EQ(Num("[1, 2, 3].slice(-1)[0]"), 3);
  EXPECT_EQ(Num("let l = []; l[2] = 'x'; l.length"), 3);
  EXPECT_TRUE(Eval("[1, 2][5]").IsUndefined());
  EXPECT_EQ(Num("let l = [1, 2]; l.pop()"), 2);
  EXPECT_EQ(Str("[1, [2, 'x']]"), "1,2,x");
  EXPECT_EQ(Eval("[1, [2, 'x']]").Inspect(), "[1, [2, \"x\"]]");
  // Lists are shared by reference.
  EXPECT_EQ(Num("let a = [1]; let b = a; b.push(2); a.length"), 2);
}

TEST_F(InterpreterTest, ConsoleOutputIsForwarded) {
  interpreter_.RunScript(
      "console.log('a', 1, [1, 'b'], null)\n"
      "console.warn('careful')\n"
      "console.error(document.body)\n"
      "console.info()\n");
  EXPECT_THAT(logs_, ElementsAre(Pair("log", "a 1 [1, \"b\"] null"),
                                 Pair("warn", "careful"),
                                 Pair("error", "<body>"), Pair("info", "")));
}

TEST_F(InterpreterTest, DocumentQueries) {
  EXPECT_EQ(Str("document.querySelector('#title').textContent"), "Hello");
  EXPECT_EQ(Str("document.getElementById('title').tagName"), "H1");
  EXPECT_TRUE(Eval("document.getElementById('nope') === null").Truthy());
  EXPECT_EQ(Num("document.querySelectorAll('.item').length"), 2);
  EXPECT_EQ(Str("document.getElementsByTagName('LI')[1].className"),
            "item done");
  EXPECT_EQ(Num("document.getElementsByClassName('done item').length"), 1);
  EXPECT_EQ(Num("document.getElementsByTagName('*').length"), 9);
  EXPECT_EQ(Str("document.title"), "Demo");
  EXPECT_EQ(Num("document.body.children.length"), 3);
  EXPECT_EQ(Num("document.body.childElementCount"), 3);
  EXPECT_EQ(Str("document.documentElement.tagName"), "HTML");
  EXPECT_EQ(Str("document.head.firstElementChild.textContent"), "Demo");
  EXPECT_EQ(Str("document.querySelector('li').parentElement.id"), "list");
  EXPECT_EQ(Str("document.querySelector('li').nextElementSibling.className"),
            "item done");
  EXPECT_TRUE(Eval("document.querySelector('li').previousElementSibling "
                   "=== null")
                  .Truthy());
  EXPECT_EQ(Str("document.getElementById('list').lastElementChild.textContent"),
            "b");
  EXPECT_EQ(Num("document.getElementById('list').querySelectorAll('li')"
                ".length"),
            2);
  EXPECT_TRUE(Eval("document.querySelector('li').matches('ul > .item')")
                  .Truthy());
  EXPECT_EQ(Num("document.body.nodeType"), 1);
  EXPECT_EQ(Error("document.querySelector('a + b')"),
            "SyntaxError: 'a + b' is not a valid selector");
}

TEST_F(InterpreterTest, DomMutation) {
  interpreter_.RunScript(
      "const h = document.getElementById('title')\n"
      "h.textContent = 'Bye'\n"
      "h.classList.add('x', 'y')\n"
      "h.classList.remove('big', 'y')\n"
      "h.setAttribute('data-n', 5)\n");
  EXPECT_EQ(Str("h.textContent"), "Bye");
  EXPECT_EQ(Str("h.className"), "x");
  EXPECT_EQ(Num("h.classList.length"), 1);
  EXPECT_EQ(Str("h.getAttribute('data-n')"), "5");
  EXPECT_TRUE(Eval("h.hasAttribute('DATA-N')").Truthy());
  EXPECT_TRUE(Eval("h.getAttribute('missing') === null").Truthy());
  EXPECT_FALSE(Eval("h.classList.toggle('x')").Truthy());
  EXPECT_TRUE(Eval("h.classList.toggle('z')").Truthy());
  EXPECT_TRUE(Eval("h.classList.toggle('z', true)").Truthy());
  EXPECT_EQ(Str("h.className"), "z");
  EXPECT_EQ(Error("h.classList.add('a b')"),
            "SyntaxError: The token provided ('a b') contains HTML space "
            "characters");

  interpreter_.RunScript("h.removeAttribute('data-n')\nh.id = 'renamed'");
  EXPECT_FALSE(Eval("h.hasAttribute('data-n')").Truthy());
  EXPECT_TRUE(Eval("document.getElementById('renamed') === h").Truthy());
  EXPECT_EQ(Error("h.tagName = 'p'"),
            "TypeError: Cannot set property 'tagName' of <h1#renamed.z>");
}

TEST_F(InterpreterTest, InnerHtml) {
  interpreter_.RunScript(
      "document.getElementById('list').innerHTML = "
      "'<li>z</li><li>y &amp; w</li>'");
  EXPECT_EQ(Num("document.querySelectorAll('#list li').length"), 2);
  EXPECT_EQ(Str("document.getElementById('list').innerHTML"),
            "<li>z</li><li>y &amp; w</li>");
  EXPECT_EQ(Str("document.getElementById('list').textContent"), "zy & w");
}

TEST_F(InterpreterTest, CreateAndAppend) {
  interpreter_.RunScript(
      "const d = document.createElement('DIV')\n"
      "d.id = 'new'\n"
      "d.appendChild(document.createTextNode('hi'))\n"
      "document.body.appendChild(d)\n");
  EXPECT_EQ(Str("document.getElementById('new').textContent"), "hi");
  EXPECT_EQ(Str("document.body.lastElementChild.id"), "new");
  EXPECT_EQ(Str("d.tagName"), "DIV");
  EXPECT_EQ(Error("document.createElement('<p>')"),
            "TypeError: The tag name provided ('<p>') is not a valid name.");
  EXPECT_EQ(Error("const b = document.body; b.firstElementChild.appendChild(b)"),
            "TypeError: Failed to execute 'appendChild': the new child "
            "contains the parent");
  EXPECT_EQ(Error("document.body.appendChild('text')"),
            "TypeError: Failed to execute 'appendChild': parameter 1 is not "
            "of type 'Node'");

  interpreter_.RunScript("document.querySelector('p').remove()");
  EXPECT_TRUE(Eval("document.querySelector('p') === null").Truthy());
}

TEST_F(InterpreterTest, InlineStyle) {
  interpreter_.RunScript(
      "const t = document.getElementById('title')\n"
      "t.style.backgroundColor = 'red'\n"
      "t.style.marginTop = '4px'\n");
  EXPECT_EQ(Str("t.getAttribute('style')"),
            "background-color: red; margin-top: 4px;");
  EXPECT_EQ(Str("t.style.backgroundColor"), "red");
  EXPECT_EQ(Str("t.style.getPropertyValue('margin-top')"), "4px");
  EXPECT_EQ(Str("t.style.color"), "");
  interpreter_.RunScript("t.style.marginTop = ''");
  EXPECT_EQ(Str("t.style.cssText"), "background-color: red;");
  interpreter_.RunScript("t.style.setProperty('color', 'green')");
  EXPECT_EQ(Str("getComputedStyle(t).color"), "green");
  EXPECT_EQ(Str("t.style.removeProperty('color')"), "green");
  EXPECT_EQ(Str("getComputedStyle(t).color"), "red");
}

TEST_F(InterpreterTest, ComputedStyle) {
  EXPECT_EQ(Str("getComputedStyle(document.querySelector('h1')).color"),
            "red");
  EXPECT_EQ(Str("getComputedStyle(document.querySelector('h1')).fontSize"),
            "32px");
  EXPECT_EQ(Str("getComputedStyle(document.querySelector('h1'))"
                ".getPropertyValue('font-size')"),
            "32px");
  EXPECT_EQ(Str("getComputedStyle(document.querySelector('p')).color"),
            "blue");
  EXPECT_EQ(Str("getComputedStyle(document.querySelector('li')).display"),
            "list-item");
  EXPECT_EQ(Str("getComputedStyle(document.querySelector('.done'))"
                ".textDecoration"),
            "underline");
  // Computed styles follow later changes to the document.
  EXPECT_EQ(Str("const s = getComputedStyle(document.querySelector('li'));"
                "document.querySelector('li').classList.add('done');"
                "s.textDecoration"),
            "underline");
  EXPECT_EQ(Error("getComputedStyle(null)"),
            "TypeError: Failed to execute 'getComputedStyle': parameter 1 is "
            "not of type 'Node'");
}

TEST_F(InterpreterTest, DocumentTitle) {
  interpreter_.RunScript("document.title = 'New'");
  EXPECT_EQ(Str("document.title"), "New");
  EXPECT_EQ(Error("document.body = 1"),
            "TypeError: Cannot set property 'body' of HTMLDocument");
}

}  // namespace
