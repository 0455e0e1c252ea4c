/**
 * @file bit_packed_reader.hpp
 * @brief Sequential decoder for fixed-width bit-packed integer sections.
 *
 * A section of a page holds value_count integers of bit_width bits each,
 * packed in batches of 8 by a BytePacker, and occupies exactly
 * ceil(value_count * bit_width / 8) bytes. Several sections can follow
 * each other in one page; next_offset() tells where the following one
 * starts.
 *
 * @par Decoding
 * - One batch of 8 values is materialized at a time.
 * - The batch position starts one past the end, so the first read decodes.
 * - A final batch that runs past the end of the page is unpacked from a
 *   zero-padded scratch copy; all other batches are unpacked in place.
 * - A width of 0 decodes zeros without touching the page.
 *
 * @warning The page is borrowed. It must stay alive and unchanged for the
 *          whole decode pass.
 *
 * @authors colpack contributors
 */

#ifndef COLPACK_BIT_PACKED_READER_HPP
#define COLPACK_BIT_PACKED_READER_HPP

#include "bit_packer.hpp"
#include "config.hpp"
#include "error.hpp"

#include <array>
#include <memory>

namespace colpack {

/**
 * @brief Forward-only reader of one bit-packed section at a time.
 */
class BitPackedIntegerReader {
public:
    /**
     * @brief Construct a reader for values in [0, max_value].
     *
     * @param max_value Largest value of the column; fixes the bit width
     * @param factory Source of the BytePacker for that width
     * @throws InvalidArgumentException if max_value is negative or does
     *         not fit in 32 bits (reader left !valid() when exceptions are
     *         disabled)
     */
    BitPackedIntegerReader(std::int64_t max_value, const BytePackerFactory& factory);

    /**
     * @brief Bind the reader to a section of a page.
     *
     * @param value_count Number of values in the section
     * @param page Page bytes (may be null when the section needs none)
     * @param page_size Size of the page in bytes
     * @param offset Offset of the section within the page
     * @return Error::InvalidArg if the reader is invalid, offset is past
     *         the page, or a non-empty section has no page
     */
    Error init_from_page(std::size_t value_count, const std::uint8_t* page,
                         std::size_t page_size, std::size_t offset) noexcept;

    /**
     * @brief Decode the next value.
     *
     * Not bounded by the section's value count; the caller reads exactly
     * value_count values.
     */
    std::uint32_t read_integer() noexcept;

    /**
     * @brief Decode the next value if the section has one left.
     *
     * @param[out] value Decoded value
     * @return Error::Underflow once value_count values have been read
     */
    Error read_integer(std::uint32_t& value) noexcept;

    /**
     * @brief Discard the next value.
     */
    void skip() noexcept;

    /**
     * @brief Offset of the byte following this section.
     */
    [[nodiscard]] std::size_t next_offset() const noexcept { return end_offset_; }

    [[nodiscard]] unsigned bit_width() const noexcept { return bit_width_; }
    [[nodiscard]] std::size_t value_count() const noexcept { return value_count_; }
    [[nodiscard]] std::size_t values_read() const noexcept { return state_.values_read; }
    [[nodiscard]] bool valid() const noexcept { return valid_; }

private:
    struct DecodeState {
        std::size_t cursor = 0;                           ///< Page offset of the next batch
        std::size_t position = VALUES_AT_A_TIME - 1;      ///< Index of the last value returned
        std::size_t values_read = 0;
        std::array<std::uint32_t, VALUES_AT_A_TIME> batch{};
    };

    void decode_next_batch() noexcept;

    unsigned bit_width_;
    bool valid_;
    std::unique_ptr<BytePacker> packer_;

    const std::uint8_t* page_;
    std::size_t page_size_;
    std::size_t value_count_;
    std::size_t end_offset_;
    DecodeState state_;
};

} // namespace colpack

#endif // COLPACK_BIT_PACKED_READER_HPP
