#pragma once

#include "ports/output/ITokenGenerator.hpp"
#include <openssl/rand.h>
#include <stdexcept>
#include <string>

namespace bridge::adapters::secondary {

/**
 * @brief Криптостойкий генератор токенов и ID сессий
 *
 * 32 байта из RAND_bytes → 64 hex-символа (256 бит энтропии).
 */
class OpenSslTokenGenerator : public ports::output::ITokenGenerator {
public:
    static constexpr size_t TOKEN_BYTES = 32;

    std::string generate() override {
        unsigned char buf[TOKEN_BYTES];
        if (RAND_bytes(buf, static_cast<int>(sizeof(buf))) != 1) {
            throw std::runtime_error("RAND_bytes failed");
        }

        static const char* hex = "0123456789abcdef";
        std::string out;
        out.reserve(TOKEN_BYTES * 2);
        for (unsigned char b : buf) {
            out.push_back(hex[b >> 4]);
            out.push_back(hex[b & 0x0F]);
        }
        return out;
    }
};

} // namespace bridge::adapters::secondary
