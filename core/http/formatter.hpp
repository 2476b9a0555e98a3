#pragma once

#include "handlers/outcome.hpp"
#include "message.hpp"

namespace itemvault {
namespace http {

/**
 * @brief Convert an Outcome into an HTTP-shaped response
 *
 * Pure and total:
 * - CREATED -> 201 + item, OK -> 200 + item or array, NO_CONTENT -> 204, empty body
 * - ValidationError -> 400, details = [{field, reason}, ...]
 * - NotFoundError -> 404, details = {id}
 * - RouteError -> 404, or 405 with an Allow header
 * - ConflictError / InternalError -> 500, details = {errorId} only
 */
Response format_response(const handlers::Outcome &outcome);

}  // namespace http
}  // namespace itemvault
