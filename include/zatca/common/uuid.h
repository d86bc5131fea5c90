#pragma once

#include <cstdint>
#include <string>
#include <random>
#include <sstream>
#include <iomanip>

namespace zatca::common {

/**
 * UUID generation utility (invoice UUIDs when the caller supplies none).
 */
class Uuid {
public:
    /**
     * Generate a UUID v4 (random).
     */
    static std::string generate() {
        thread_local std::mt19937_64 gen(std::random_device{}());
        std::uniform_int_distribution<uint64_t> dis;

        uint64_t ab = dis(gen);
        uint64_t cd = dis(gen);

        // Version 4, RFC 4122 variant
        ab = (ab & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
        cd = (cd & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

        std::ostringstream ss;
        ss << std::hex << std::setfill('0');

        // Format: xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx
        ss << std::setw(8) << ((ab >> 32) & 0xFFFFFFFF) << "-";
        ss << std::setw(4) << ((ab >> 16) & 0xFFFF) << "-";
        ss << std::setw(4) << (ab & 0xFFFF) << "-";
        ss << std::setw(4) << ((cd >> 48) & 0xFFFF) << "-";
        ss << std::setw(12) << (cd & 0xFFFFFFFFFFFFULL);

        return ss.str();
    }

    /**
     * Validate canonical 8-4-4-4-12 hex format.
     */
    static bool isValid(const std::string& uuid) {
        if (uuid.length() != 36) {
            return false;
        }

        for (size_t i = 0; i < uuid.length(); ++i) {
            char c = uuid[i];
            if (i == 8 || i == 13 || i == 18 || i == 23) {
                if (c != '-') return false;
            } else if (!((c >= '0' && c <= '9') ||
                         (c >= 'a' && c <= 'f') ||
                         (c >= 'A' && c <= 'F'))) {
                return false;
            }
        }

        return true;
    }
};

} // namespace zatca::common
