#pragma once

#include <optional>
#include <string>
#include <utility>

namespace opr {
namespace content {

/**
 * @brief Failure kinds produced while resolving and rendering a route
 *
 * Resolution phase:
 * - INVALID_ROUTE, NOT_FOUND, AMBIGUOUS, FORBIDDEN, UNSUPPORTED_MEDIA_TYPE
 *
 * Render phase:
 * - TEMPLATE_ERROR, RECURSION_ERROR, EXECUTABLE_ERROR
 *
 * Terminal:
 * - ERROR_HANDLER_FAILED (the error-handler route itself failed)
 */
enum class ErrorKind {
    INVALID_ROUTE,
    NOT_FOUND,
    AMBIGUOUS,
    FORBIDDEN,
    UNSUPPORTED_MEDIA_TYPE,
    TEMPLATE_ERROR,
    RECURSION_ERROR,
    EXECUTABLE_ERROR,
    ERROR_HANDLER_FAILED
};

/**
 * @brief Name used for a kind in the render context ("error.kind") and in logs
 */
inline std::string error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::INVALID_ROUTE:
            return "InvalidRoute";
        case ErrorKind::NOT_FOUND:
            return "NotFound";
        case ErrorKind::AMBIGUOUS:
            return "Ambiguous";
        case ErrorKind::FORBIDDEN:
            return "Forbidden";
        case ErrorKind::UNSUPPORTED_MEDIA_TYPE:
            return "UnsupportedMediaType";
        case ErrorKind::TEMPLATE_ERROR:
            return "TemplateError";
        case ErrorKind::RECURSION_ERROR:
            return "RecursionError";
        case ErrorKind::EXECUTABLE_ERROR:
            return "ExecutableError";
        case ErrorKind::ERROR_HANDLER_FAILED:
            return "ErrorHandlerFailed";
        default:
            return "ErrorHandlerFailed";
    }
}

/**
 * @brief HTTP status a failure of this kind is reported with
 *
 * - INVALID_ROUTE -> 400
 * - FORBIDDEN -> 403
 * - NOT_FOUND -> 404
 * - UNSUPPORTED_MEDIA_TYPE -> 406
 * - everything else -> 500
 */
inline int error_kind_to_http(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::INVALID_ROUTE:
            return 400;
        case ErrorKind::FORBIDDEN:
            return 403;
        case ErrorKind::NOT_FOUND:
            return 404;
        case ErrorKind::UNSUPPORTED_MEDIA_TYPE:
            return 406;
        default:
            return 500;
    }
}

// A typed failure with enough detail to build the error zone of a render context
struct Failure {
    ErrorKind kind = ErrorKind::ERROR_HANDLER_FAILED;
    std::string message;
    std::optional<int> exit_code;  // EXECUTABLE_ERROR only
    std::string stderr_text;       // EXECUTABLE_ERROR only
    // ERROR_HANDLER_FAILED only: kind of the failure the handler was rendering for
    std::optional<ErrorKind> original_kind;

    Failure() = default;
    Failure(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}

    std::string describe() const { return error_kind_to_string(kind) + ": " + message; }
};

}  // namespace content
}  // namespace opr
