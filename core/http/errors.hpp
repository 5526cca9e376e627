#pragma once

#include <string>

#include "content/errors.hpp"
#include "render/renderer.hpp"

namespace opr {
namespace http {

constexpr int kStatusOk = 200;
constexpr int kStatusBadRequest = 400;
constexpr int kStatusInternal = 500;

/**
 * @brief HTTP status for a dispatched request
 *
 * - SUCCESS -> 200
 * - ERROR_HANDLED -> status of the original failure (body from the error handler)
 * - FAILED -> status of the failure; when the error handler itself failed,
 *   status of the failure it was handling
 */
inline int status_for_result(const render::RenderResult &result) {
    if (result.outcome == render::Outcome::SUCCESS) {
        return kStatusOk;
    }
    const content::Failure &failure = result.failure;
    if (failure.kind == content::ErrorKind::ERROR_HANDLER_FAILED && failure.original_kind) {
        return content::error_kind_to_http(*failure.original_kind);
    }
    return content::error_kind_to_http(failure.kind);
}

}  // namespace http
}  // namespace opr
