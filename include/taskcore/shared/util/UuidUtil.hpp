#pragma once

#include <array>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>

namespace taskcore::shared::util {

/**
 * UUID v4 generation for aggregate, event and delivery identifiers.
 */
class UuidUtil {
public:
    static std::string generate() {
        std::array<uint8_t, 16> bytes{};
        {
            std::lock_guard<std::mutex> lock(generatorMutex());
            auto& gen = generator();
            std::uniform_int_distribution<uint64_t> dis;
            uint64_t hi = dis(gen);
            uint64_t lo = dis(gen);
            for (int i = 0; i < 8; ++i) {
                bytes[i] = static_cast<uint8_t>(hi >> (56 - 8 * i));
                bytes[8 + i] = static_cast<uint8_t>(lo >> (56 - 8 * i));
            }
        }

        bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);  // version 4
        bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);  // RFC 4122 variant

        static const char* hex = "0123456789abcdef";
        std::string out;
        out.reserve(36);
        for (size_t i = 0; i < bytes.size(); ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) {
                out.push_back('-');
            }
            out.push_back(hex[bytes[i] >> 4]);
            out.push_back(hex[bytes[i] & 0x0F]);
        }
        return out;
    }

    /**
     * Check the 8-4-4-4-12 hexadecimal layout.
     */
    static bool isValid(const std::string& uuid) {
        if (uuid.size() != 36) {
            return false;
        }
        for (size_t i = 0; i < uuid.size(); ++i) {
            const char c = uuid[i];
            if (i == 8 || i == 13 || i == 18 || i == 23) {
                if (c != '-') return false;
                continue;
            }
            const bool isHex = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
            if (!isHex) return false;
        }
        return true;
    }

private:
    static std::mt19937_64& generator() {
        static std::mt19937_64 gen{std::random_device{}()};
        return gen;
    }

    static std::mutex& generatorMutex() {
        static std::mutex mutex;
        return mutex;
    }
};

} // namespace taskcore::shared::util
