/**
 * @file bit_packer.hpp
 * @brief Packing and unpacking of 8-value batches at a fixed bit width.
 *
 * Eight values of W bits occupy exactly W bytes, so a packer always
 * consumes or produces whole bytes. The bit order is owned by the packer;
 * decoders only see the BytePacker interface.
 *
 * @par Little-endian order (RLE/bit-packing hybrid)
 * Value i occupies stream bits [i*W, (i+1)*W). Stream bit k is bit
 * (k % 8) of byte k / 8, counting from the least significant bit.
 *
 * @par Big-endian order (legacy BIT_PACKED)
 * Values are written most significant bit first and bytes are filled
 * from bit 7 down to bit 0.
 *
 * Example, W = 3, values 0..7:
 * - little-endian: 0x88 0xC6 0xFA
 * - big-endian:    0x05 0x39 0x77
 *
 * @authors colpack contributors
 */

#ifndef COLPACK_BIT_PACKER_HPP
#define COLPACK_BIT_PACKER_HPP

#include "config.hpp"

#include <memory>

namespace colpack {

/**
 * @brief Bit order of a packer implementation.
 */
enum class Packer { LittleEndian, BigEndian };

/**
 * @brief Packs and unpacks batches of VALUES_AT_A_TIME integers.
 */
class BytePacker {
public:
    explicit BytePacker(unsigned bit_width) noexcept : bit_width_(bit_width) {}
    virtual ~BytePacker() = default;

    [[nodiscard]] unsigned bit_width() const noexcept { return bit_width_; }

    /**
     * @brief Pack 8 values into bit_width() bytes.
     *
     * Bits of a value above bit_width() are ignored.
     *
     * @param in 8 values
     * @param out Destination, bit_width() bytes
     */
    virtual void pack8_values(const std::uint32_t* in, std::uint8_t* out) const noexcept = 0;

    /**
     * @brief Unpack 8 values from bit_width() bytes.
     *
     * @param in Source, bit_width() bytes
     * @param out 8 values
     */
    virtual void unpack8_values(const std::uint8_t* in, std::uint32_t* out) const noexcept = 0;

protected:
    [[nodiscard]] std::uint64_t value_mask() const noexcept {
        return (std::uint64_t{1} << bit_width_) - 1U;
    }

    unsigned bit_width_;
};

/**
 * @brief Creates packers for a given bit width.
 */
class BytePackerFactory {
public:
    virtual ~BytePackerFactory() = default;

    /**
     * @brief Create a packer.
     *
     * @param bit_width Width in [0, MAX_BIT_WIDTH]
     * @return New packer, or nullptr if the width is not supported
     */
    [[nodiscard]] virtual std::unique_ptr<BytePacker> new_byte_packer(unsigned bit_width) const = 0;
};

/**
 * @brief Process-wide factory for a bit order.
 */
const BytePackerFactory& packer_factory(Packer packer) noexcept;

} // namespace colpack

#endif // COLPACK_BIT_PACKER_HPP
