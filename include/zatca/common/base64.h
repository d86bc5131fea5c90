#pragma once

/**
 * @file base64.h
 * @brief Base64 encoding/decoding using OpenSSL BIO filters
 */

#include <cstdint>
#include <string>
#include <vector>
#include <openssl/evp.h>
#include <openssl/bio.h>
#include <openssl/buffer.h>

#include "zatca/common/exceptions.h"

namespace zatca::common {

class Base64 {
public:
    /**
     * Encode binary data to a single-line Base64 string.
     */
    static std::string encode(const uint8_t* data, size_t length) {
        if (length == 0) {
            return "";
        }

        BIO* b64 = BIO_new(BIO_f_base64());
        BIO* mem = BIO_new(BIO_s_mem());
        b64 = BIO_push(b64, mem);

        BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
        BIO_write(b64, data, static_cast<int>(length));
        (void)BIO_flush(b64);

        BUF_MEM* bufferPtr = nullptr;
        BIO_get_mem_ptr(b64, &bufferPtr);

        std::string result(bufferPtr->data, bufferPtr->length);
        BIO_free_all(b64);

        return result;
    }

    static std::string encode(const std::vector<uint8_t>& data) {
        return encode(data.data(), data.size());
    }

    static std::string encode(const std::string& data) {
        return encode(reinterpret_cast<const uint8_t*>(data.data()), data.size());
    }

    /**
     * Decode Base64 to bytes.
     * @throws ParsingException if the input is not valid Base64
     */
    static std::vector<uint8_t> decode(const std::string& encoded) {
        if (encoded.empty()) {
            return {};
        }
        if (!isValid(encoded)) {
            throw ParsingException("invalid Base64 input");
        }

        std::string compact;
        compact.reserve(encoded.size());
        for (char c : encoded) {
            if (c != '\n' && c != '\r') compact.push_back(c);
        }

        std::vector<uint8_t> result(compact.length() * 3 / 4 + 3);

        BIO* b64 = BIO_new(BIO_f_base64());
        BIO* mem = BIO_new_mem_buf(compact.data(), static_cast<int>(compact.length()));
        mem = BIO_push(b64, mem);

        BIO_set_flags(mem, BIO_FLAGS_BASE64_NO_NL);
        int actualLength = BIO_read(mem, result.data(), static_cast<int>(result.size()));
        BIO_free_all(mem);

        if (actualLength < 0) {
            throw ParsingException("Base64 decoding failed");
        }

        result.resize(static_cast<size_t>(actualLength));
        return result;
    }

    static std::string decodeToString(const std::string& encoded) {
        auto bytes = decode(encoded);
        return std::string(bytes.begin(), bytes.end());
    }

    /**
     * Check alphabet and padding (line breaks tolerated).
     */
    static bool isValid(const std::string& str) {
        size_t significant = 0;
        size_t padding = 0;

        for (char c : str) {
            if (c == '\n' || c == '\r') continue;

            bool alpha = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                         (c >= '0' && c <= '9') || c == '+' || c == '/';
            if (c == '=') {
                padding++;
            } else if (!alpha || padding > 0) {
                return false;
            }
            significant++;
        }

        return padding <= 2 && significant % 4 == 0;
    }
};

} // namespace zatca::common
