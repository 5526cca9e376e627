#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace opr {
namespace render {
namespace tmpl {

// 1-based position of a tag in template text
struct SourcePosition {
    size_t line = 1;
    size_t column = 1;

    std::string to_string() const { return std::to_string(line) + ":" + std::to_string(column); }
};

/**
 * @brief A reference into the binding data
 *
 * Examples and how they parse:
 *   name.first   -> segments {name, first}
 *   ../title     -> parent_depth 1, segments {title}
 *   this / .     -> no segments
 *   [weird key]  -> segments {"weird key"}
 *   @index       -> data_variable "index"
 *   @root.a      -> data_variable "root", segments {a}
 */
struct PathExpression {
    size_t parent_depth = 0;
    std::string data_variable;  // empty unless the path starts with '@'
    std::vector<std::string> segments;
    std::string original;  // as written, for error messages
};

// A helper argument or the value of a plain mustache
struct Expression {
    enum class Kind { PATH, LITERAL };

    Kind kind = Kind::LITERAL;
    PathExpression path;
    nlohmann::json literal;  // string, number, boolean or null
};

enum class NodeKind {
    TEXT,    // literal template text
    OUTPUT,  // {{value}}, {{{value}}}, {{helper arg}}
    BLOCK    // {{#helper arg}}...{{else}}...{{/helper}} or {{^value}}...{{/value}}
};

// Helpers known to the compiler
constexpr const char *kHelperIf = "if";
constexpr const char *kHelperUnless = "unless";
constexpr const char *kHelperEach = "each";
constexpr const char *kHelperWith = "with";
constexpr const char *kHelperGet = "get";
// Block name used for inverted sections ({{^value}})
constexpr const char *kInvertedSection = "^";

struct Node {
    NodeKind kind = NodeKind::TEXT;
    SourcePosition position;

    // TEXT
    std::string text;

    // OUTPUT and BLOCK: helper is empty for a plain value lookup
    std::string helper;
    std::vector<Expression> arguments;
    bool escape = true;

    // BLOCK
    std::vector<Node> body;
    std::vector<Node> inverse;
};

// Compiled template: a node list ready for evaluation
struct Template {
    std::vector<Node> nodes;
};

/**
 * @brief Compiles Handlebars-style template text
 *
 * Supported: text, {{value}} (HTML-escaped), {{{value}}} and {{& value}}
 * (raw), comments, ~ whitespace control, block helpers if/unless/each/with
 * with {{else}} or {{^}}, inverted sections, and the inline helper get.
 *
 * Returns false with error set to "<line>:<column>: <reason>" on malformed
 * input: unclosed tags or blocks, mismatched closing tags, unknown helpers,
 * wrong helper arity, invalid path characters.
 */
bool compile_template(const std::string &text, Template &out, std::string &error);

}  // namespace tmpl
}  // namespace render
}  // namespace opr
