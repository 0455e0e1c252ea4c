/**
 * @file bytes_utils.hpp
 * @brief Numeric and byte helpers shared by the encoders and decoders.
 *
 * @par Little-endian integers
 * A 32-bit integer is always serialized as exactly 4 bytes, least
 * significant byte first, regardless of host byte order.
 */

#ifndef COLPACK_BYTES_UTILS_HPP
#define COLPACK_BYTES_UTILS_HPP

#include "config.hpp"

namespace colpack {

/**
 * @brief Number of bits needed to represent every value in [0, max_value].
 *
 * @param max_value Largest value that will be encoded
 * @return ceil(log2(max_value + 1)), 0 when max_value is 0
 */
[[nodiscard]] constexpr unsigned width_from_max_value(std::uint32_t max_value) noexcept {
    if (max_value == 0) {
        return 0;
    }
    return 32U - static_cast<unsigned>(__builtin_clz(max_value));
}

/**
 * @brief Bytes needed to hold a bit count, rounding up.
 *
 * @param bit_length Number of bits
 * @return ceil(bit_length / 8)
 */
[[nodiscard]] constexpr std::size_t padded_byte_count_from_bits(std::size_t bit_length) noexcept {
    return (bit_length + 7U) / 8U;
}

/**
 * @brief Write a 32-bit integer as 4 little-endian bytes.
 *
 * @param dst Destination, at least 4 bytes
 * @param value Value to write
 */
inline void write_int_little_endian(std::uint8_t* dst, std::uint32_t value) noexcept {
    dst[0] = static_cast<std::uint8_t>(value & 0xFFU);
    dst[1] = static_cast<std::uint8_t>((value >> 8) & 0xFFU);
    dst[2] = static_cast<std::uint8_t>((value >> 16) & 0xFFU);
    dst[3] = static_cast<std::uint8_t>((value >> 24) & 0xFFU);
}

/**
 * @brief Read a 32-bit integer from 4 little-endian bytes.
 *
 * @param src Source, at least 4 bytes
 * @return Decoded value
 */
[[nodiscard]] inline std::uint32_t read_int_little_endian(const std::uint8_t* src) noexcept {
    return static_cast<std::uint32_t>(src[0]) | (static_cast<std::uint32_t>(src[1]) << 8) |
           (static_cast<std::uint32_t>(src[2]) << 16) | (static_cast<std::uint32_t>(src[3]) << 24);
}

} // namespace colpack

#endif // COLPACK_BYTES_UTILS_HPP
