/**
 * @file bit_packer.cpp
 * @brief Little-endian and big-endian BytePacker implementations.
 *
 * Both packers stream bits through a 64-bit accumulator. With W <= 32 the
 * accumulator never holds more than W + 7 pending bits.
 */

#include <colpack/bit_packer.hpp>

namespace colpack {

namespace {

class LittleEndianBytePacker final : public BytePacker {
public:
    using BytePacker::BytePacker;

    void pack8_values(const std::uint32_t* in, std::uint8_t* out) const noexcept override {
        const std::uint64_t mask = value_mask();
        std::uint64_t acc = 0;
        unsigned acc_len = 0;

        for (std::size_t i = 0; i < VALUES_AT_A_TIME; ++i) {
            // New bits go above the pending ones
            acc |= (static_cast<std::uint64_t>(in[i]) & mask) << acc_len;
            acc_len += bit_width_;

            while (acc_len >= 8) {
                *out++ = static_cast<std::uint8_t>(acc & 0xFFU);
                acc >>= 8;
                acc_len -= 8;
            }
        }
    }

    void unpack8_values(const std::uint8_t* in, std::uint32_t* out) const noexcept override {
        const std::uint64_t mask = value_mask();
        std::uint64_t acc = 0;
        unsigned acc_len = 0;

        for (std::size_t i = 0; i < VALUES_AT_A_TIME; ++i) {
            while (acc_len < bit_width_) {
                acc |= static_cast<std::uint64_t>(*in++) << acc_len;
                acc_len += 8;
            }

            out[i] = static_cast<std::uint32_t>(acc & mask);
            acc >>= bit_width_;
            acc_len -= bit_width_;
        }
    }
};

class BigEndianBytePacker final : public BytePacker {
public:
    using BytePacker::BytePacker;

    void pack8_values(const std::uint32_t* in, std::uint8_t* out) const noexcept override {
        const std::uint64_t mask = value_mask();
        std::uint64_t acc = 0;
        unsigned acc_len = 0;

        for (std::size_t i = 0; i < VALUES_AT_A_TIME; ++i) {
            acc = (acc << bit_width_) | (static_cast<std::uint64_t>(in[i]) & mask);
            acc_len += bit_width_;

            // Flush complete bytes, top bits first
            while (acc_len >= 8) {
                acc_len -= 8;
                *out++ = static_cast<std::uint8_t>(acc >> acc_len);
                acc &= (std::uint64_t{1} << acc_len) - 1U;
            }
        }
    }

    void unpack8_values(const std::uint8_t* in, std::uint32_t* out) const noexcept override {
        const std::uint64_t mask = value_mask();
        std::uint64_t acc = 0;
        unsigned acc_len = 0;

        for (std::size_t i = 0; i < VALUES_AT_A_TIME; ++i) {
            while (acc_len < bit_width_) {
                acc = (acc << 8) | *in++;
                acc_len += 8;
            }

            acc_len -= bit_width_;
            out[i] = static_cast<std::uint32_t>((acc >> acc_len) & mask);
            acc &= (std::uint64_t{1} << acc_len) - 1U;
        }
    }
};

template <typename PackerT>
class BytePackerFactoryImpl final : public BytePackerFactory {
public:
    std::unique_ptr<BytePacker> new_byte_packer(unsigned bit_width) const override {
        if (bit_width > MAX_BIT_WIDTH) {
            return nullptr;
        }
        return std::make_unique<PackerT>(bit_width);
    }
};

} // namespace

const BytePackerFactory& packer_factory(Packer packer) noexcept {
    static BytePackerFactoryImpl<LittleEndianBytePacker> little_endian;
    static BytePackerFactoryImpl<BigEndianBytePacker> big_endian;

    switch (packer) {
    case Packer::BigEndian:
        return big_endian;
    case Packer::LittleEndian:
    default:
        return little_endian;
    }
}

} // namespace colpack
