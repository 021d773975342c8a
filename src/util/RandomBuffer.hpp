#ifndef STORAGE_FILLER_UTIL_RANDOM_BUFFER_HPP
#define STORAGE_FILLER_UTIL_RANDOM_BUFFER_HPP

#include <cstdint>
#include <random>
#include <string_view>
#include <vector>

namespace util {

/**
 * @class AlphanumericBufferGenerator
 * @brief Fills write buffers with characters drawn uniformly from [A-Za-z0-9]
 */
class AlphanumericBufferGenerator {
public:
    static constexpr std::string_view ALPHABET =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";

    /**
     * @brief Overwrites every byte of the buffer with a random alphanumeric character
     * @param buffer The buffer to fill
     */
    static void fill(std::vector<char>& buffer) {
        // One engine per thread
        thread_local std::mt19937_64 generator{std::random_device{}()};

        // 62 symbols fit in 6 bits; draw 10 symbols from each 64-bit value and
        // reject the values 62 and 63 to keep the distribution uniform
        size_t i = 0;
        const size_t size = buffer.size();
        while (i < size) {
            uint64_t bits = generator();
            for (int slot = 0; slot < 10 && i < size; ++slot) {
                const auto index = static_cast<size_t>(bits & 0x3F);
                bits >>= 6;
                if (index < ALPHABET.size()) {
                    buffer[i++] = ALPHABET[index];
                }
            }
        }
    }
};

} // namespace util

#endif // STORAGE_FILLER_UTIL_RANDOM_BUFFER_HPP
