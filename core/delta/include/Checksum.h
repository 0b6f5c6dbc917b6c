#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace BlockSync {

    /**
     * @brief Weak and strong block checksums shared by both peers
     *
     * Both sides of a connection must use the same pair: Adler-32 as the
     * weak checksum and SHA-256 (hex) as the strong hash.
     */
    class Checksum {
    public:
        static constexpr uint32_t MOD_ADLER = 65521;

        /**
         * @brief Calculate Adler-32 checksum.
         * @param data Pointer to data buffer.
         * @param len Length of data.
         * @return 32-bit Adler checksum, (b << 16) | a.
         */
        static uint32_t adler32(const uint8_t* data, size_t len);

        /**
         * @brief Calculate SHA-256 digest.
         * @param data Pointer to data buffer.
         * @param len Length of data.
         * @return Lowercase hex string of the digest.
         * @throws std::runtime_error if OpenSSL fails
         */
        static std::string sha256Hex(const uint8_t* data, size_t len);
    };

    /**
     * @brief Rolling Adler-32 state for sliding window computation
     */
    struct RollingAdler32 {
        uint32_t a = 1;
        uint32_t b = 0;

        /**
         * @brief Initialize with a block of data
         */
        void init(const uint8_t* data, size_t len) {
            a = 1;
            b = 0;
            for (size_t i = 0; i < len; ++i) {
                a = (a + data[i]) % Checksum::MOD_ADLER;
                b = (b + a) % Checksum::MOD_ADLER;
            }
        }

        /**
         * @brief Slide the window one byte: drop oldByte, append newByte
         * @param windowSize Window length, unchanged by the roll
         */
        void roll(uint8_t oldByte, uint8_t newByte, size_t windowSize) {
            a = (a + Checksum::MOD_ADLER - oldByte + newByte) % Checksum::MOD_ADLER;
            uint32_t drop = static_cast<uint32_t>((windowSize % Checksum::MOD_ADLER) * oldByte % Checksum::MOD_ADLER);
            b = (b + Checksum::MOD_ADLER - drop + a + Checksum::MOD_ADLER - 1) % Checksum::MOD_ADLER;
        }

        /**
         * @brief Shrink the window by dropping its first byte
         * @param windowSize Window length before the byte is removed
         *
         * Used at the end of input, where no byte enters the window.
         */
        void rollOut(uint8_t oldByte, size_t windowSize) {
            a = (a + Checksum::MOD_ADLER - oldByte) % Checksum::MOD_ADLER;
            uint32_t drop = static_cast<uint32_t>((windowSize % Checksum::MOD_ADLER) * oldByte % Checksum::MOD_ADLER);
            b = (b + 2 * Checksum::MOD_ADLER - drop - 1) % Checksum::MOD_ADLER;
        }

        uint32_t get() const {
            return (b << 16) | a;
        }
    };

}
