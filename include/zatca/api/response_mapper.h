/**
 * @file response_mapper.h
 * @brief Normalize transport results into the uniform message shape
 */

#pragma once

#include <string>
#include <vector>

#include "zatca/api/api_types.h"
#include "zatca/api/http_transport.h"

namespace zatca::api {

/// @brief FETCH_ERROR entry for a transport failure (timeout, refused, DNS)
ApiMessage transportFailureMessage(const TransportResult& result);

/**
 * @brief Error entries for a non-2xx response
 *
 * Uses validationResults.errorMessages (or a top-level errors array) when
 * present, otherwise a synthetic HTTP_<status> entry.
 */
std::vector<ApiMessage> httpErrorMessages(const HttpResponse& response);

/// @brief API/INVALID_RESPONSE entry for an unusable 2xx body
ApiMessage invalidResponseMessage(const std::string& detail);

/// @brief VALIDATION/CREDENTIAL_EXPIRED entry
ApiMessage credentialExpiredMessage();

} // namespace zatca::api
