#ifndef RUNTIME_SCRIPT_PARSER_HPP
#define RUNTIME_SCRIPT_PARSER_HPP

#include <memory>
#include <string>

#include "runtime/script_ast.hpp"

namespace runtime {

// Statements and expressions nested deeper than this raise a RangeError.
static const constexpr int kMaxNestingDepth = 200;

// Parses a script. return statements are accepted only if allow_return is
// set, as they are in assertions. Throws ScriptError (SyntaxError or
// RangeError).
std::unique_ptr<Program> ParseScript(const std::string& source,
                                     bool allow_return);

}  // namespace runtime

#endif
