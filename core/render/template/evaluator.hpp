#pragma once

#include <functional>
#include <nlohmann/json.hpp>
#include <string>

#include "content/errors.hpp"
#include "render/template/template.hpp"

namespace opr {
namespace render {
namespace tmpl {

/**
 * @brief Callback behind {{get route}}
 *
 * Receives the evaluated argument. Returns false with failure set when the
 * argument is unusable or the nested route could not be rendered.
 */
using GetHandler = std::function<bool(const nlohmann::json &argument, const SourcePosition &position,
                                      std::string &out, content::Failure &failure)>;

/**
 * @brief Renders a compiled template against a JSON root
 *
 * Strict: printing or iterating a path that does not exist is a
 * TemplateError, as is printing an object or array. #if, #unless and
 * inverted sections treat a missing path as false.
 *
 * Falsy values: false, null, "", 0 and []. Everything else is truthy.
 *
 * On failure returns false with failure set; TemplateError messages start
 * with "<line>:<column>: ". Failures reported by the get handler are passed
 * through unchanged.
 */
bool evaluate_template(const Template &compiled, const nlohmann::json &root, const GetHandler &get,
                       std::string &out, content::Failure &failure);

// HTML-escapes & < > " ' ` =
std::string escape_html(const std::string &text);

// Handlebars truthiness
bool is_truthy(const nlohmann::json &value);

}  // namespace tmpl
}  // namespace render
}  // namespace opr
