/**
 * @file time_utils.h
 * @brief Time and date utilities
 *
 * Conversion between OpenSSL ASN1_TIME, ISO 8601 strings and std::chrono.
 */

#pragma once

#include <string>
#include <chrono>
#include <optional>
#include <openssl/asn1.h>

namespace zatca::common {

/**
 * @brief Convert ASN1_TIME to system_clock time_point
 * @param asn1Time OpenSSL ASN1_TIME structure (non-owning)
 * @return time_point, or std::nullopt on error
 */
std::optional<std::chrono::system_clock::time_point> asn1TimeToTimePoint(const ASN1_TIME* asn1Time);

/**
 * @brief Format time_point as ISO 8601 UTC string
 * @return e.g. "2026-02-02T12:34:56Z"
 */
std::string formatIso8601(const std::chrono::system_clock::time_point& tp);

/**
 * @brief Parse ISO 8601 string to time_point
 *
 * Accepts "YYYY-MM-DDTHH:MM:SS" with optional fractional seconds and an
 * optional "Z" suffix; the value is interpreted as UTC.
 *
 * @return time_point, or std::nullopt on malformed input
 */
std::optional<std::chrono::system_clock::time_point> parseIso8601(const std::string& iso8601);

/**
 * @brief Whole days from start to end (negative when end precedes start)
 */
int daysBetween(const std::chrono::system_clock::time_point& start,
                const std::chrono::system_clock::time_point& end);

} // namespace zatca::common
