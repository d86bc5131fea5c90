/**
 * @file exceptions.h
 * @brief Standard Exception Hierarchy
 *
 * Exceptions are reserved for programmer and input errors (bad key material,
 * missing CSR fields, oversized TLV values, broken configuration).
 * Regulator and transport failures are reported through result structs.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace zatca::common {

/**
 * @brief Base exception for all e-invoicing engine exceptions
 */
class ZatcaException : public std::runtime_error {
public:
    explicit ZatcaException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief TLV value does not fit the 1-byte length field, or TLV buffer is malformed
 */
class TlvException : public ZatcaException {
public:
    explicit TlvException(const std::string& message)
        : ZatcaException("TLV error: " + message) {}
};

/**
 * @brief Key material or OpenSSL operation failed
 */
class CryptoException : public ZatcaException {
public:
    explicit CryptoException(const std::string& message)
        : ZatcaException("Crypto error: " + message) {}
};

/**
 * @brief CSR configuration is incomplete
 */
class CsrException : public ZatcaException {
public:
    explicit CsrException(const std::string& message)
        : ZatcaException("CSR error: " + message) {}
};

/**
 * @brief Configuration error
 */
class ConfigException : public ZatcaException {
public:
    explicit ConfigException(const std::string& message)
        : ZatcaException("Configuration error: " + message) {}
};

/**
 * @brief Parsing error (regulator JSON, certificates, base64)
 */
class ParsingException : public ZatcaException {
public:
    explicit ParsingException(const std::string& message)
        : ZatcaException("Parsing error: " + message) {}
};

/**
 * @brief Database operation failed
 */
class DatabaseException : public ZatcaException {
public:
    explicit DatabaseException(const std::string& message)
        : ZatcaException("Database error: " + message) {}
};

/**
 * @brief Invoice chain state could not be advanced
 */
class ChainException : public ZatcaException {
public:
    explicit ChainException(const std::string& message)
        : ZatcaException("Chain error: " + message) {}
};

} // namespace zatca::common
