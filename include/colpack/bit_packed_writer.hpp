/**
 * @file bit_packed_writer.hpp
 * @brief Encoder producing fixed-width bit-packed integer sections.
 *
 * Values are buffered 8 at a time; every full batch is packed into a
 * GrowableBuffer. get_bytes() packs the trailing partial batch with zero
 * padding and returns the section as a ByteSource:
 *
 *     concat(from(buffer), from(tail, ceil(pending * bit_width / 8)))
 *
 * so the section is exactly ceil(value_count * bit_width / 8) bytes, the
 * layout BitPackedIntegerReader expects.
 *
 * @authors colpack contributors
 */

#ifndef COLPACK_BIT_PACKED_WRITER_HPP
#define COLPACK_BIT_PACKED_WRITER_HPP

#include "bit_packer.hpp"
#include "byte_source.hpp"
#include "config.hpp"
#include "error.hpp"
#include "growable_buffer.hpp"

#include <array>
#include <memory>

namespace colpack {

/**
 * @brief Bit-packing encoder for values in [0, max_value].
 */
class BitPackedIntegerWriter {
public:
    /**
     * @brief Construct a writer.
     *
     * @param max_value Largest value that will be written; fixes the bit width
     * @param factory Source of the BytePacker for that width
     * @param initial_slab_size First slab capacity of the output buffer
     * @throws InvalidArgumentException if max_value is negative or does
     *         not fit in 32 bits (writer left !valid() when exceptions are
     *         disabled)
     */
    BitPackedIntegerWriter(std::int64_t max_value, const BytePackerFactory& factory,
                           std::size_t initial_slab_size = DEFAULT_SLAB_SIZE);

    /**
     * @brief Append a value.
     *
     * @return Error::InvalidArg if value exceeds max_value or the writer is invalid
     */
    Error write_integer(std::uint32_t value);

    /**
     * @brief The encoded section written so far.
     *
     * The source views this writer's storage and is valid until the next
     * write_integer() or reset().
     */
    [[nodiscard]] ByteSource get_bytes();

    /**
     * @brief Size of the section get_bytes() would return.
     */
    [[nodiscard]] std::size_t buffered_size() const noexcept;

    /**
     * @brief Forget all values written.
     */
    void reset() noexcept;

    [[nodiscard]] unsigned bit_width() const noexcept { return bit_width_; }
    [[nodiscard]] std::size_t value_count() const noexcept { return value_count_; }
    [[nodiscard]] bool valid() const noexcept { return valid_; }

private:
    std::uint32_t max_value_;
    unsigned bit_width_;
    bool valid_;
    std::unique_ptr<BytePacker> packer_;

    GrowableBuffer encoded_;
    std::array<std::uint32_t, VALUES_AT_A_TIME> pending_{};
    std::size_t pending_count_;
    std::array<std::uint8_t, MAX_BIT_WIDTH> tail_{};
    std::size_t value_count_;
};

} // namespace colpack

#endif // COLPACK_BIT_PACKED_WRITER_HPP
