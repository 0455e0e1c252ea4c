/**
 * @file bit_packed_writer.cpp
 * @brief BitPackedIntegerWriter implementation.
 */

#include <colpack/bit_packed_writer.hpp>
#include <colpack/bytes_utils.hpp>
#include <colpack/log.hpp>

#include <limits>

#if !COLPACK_NO_EXCEPTIONS
#include <string>
#endif

namespace colpack {

BitPackedIntegerWriter::BitPackedIntegerWriter(std::int64_t max_value,
                                               const BytePackerFactory& factory,
                                               std::size_t initial_slab_size)
    : max_value_(0)
    , bit_width_(0)
    , valid_(false)
    , encoded_(initial_slab_size)
    , pending_count_(0)
    , value_count_(0) {
    if (max_value < 0 || max_value > std::numeric_limits<std::uint32_t>::max()) {
#if !COLPACK_NO_EXCEPTIONS
        throw InvalidArgumentException("max value out of range: " + std::to_string(max_value));
#else
        return;
#endif
    }

    max_value_ = static_cast<std::uint32_t>(max_value);
    bit_width_ = width_from_max_value(max_value_);
    if (bit_width_ > 0) {
        packer_ = factory.new_byte_packer(bit_width_);
        if (!packer_) {
#if !COLPACK_NO_EXCEPTIONS
            throw InvalidArgumentException("no packer for bit width " +
                                           std::to_string(bit_width_));
#else
            return;
#endif
        }
    }
    valid_ = true;
}

Error BitPackedIntegerWriter::write_integer(std::uint32_t value) {
    if (!valid_ || value > max_value_) {
        return Error::InvalidArg;
    }

    pending_[pending_count_++] = value;
    ++value_count_;

    if (pending_count_ == VALUES_AT_A_TIME) {
        pending_count_ = 0;
        if (packer_) {
            std::array<std::uint8_t, MAX_BIT_WIDTH> packed;
            packer_->pack8_values(pending_.data(), packed.data());
            return encoded_.write(packed.data(), bit_width_);
        }
    }
    return Error::Ok;
}

ByteSource BitPackedIntegerWriter::get_bytes() {
    std::size_t tail_bytes = padded_byte_count_from_bits(pending_count_ * bit_width_);
    if (tail_bytes > 0) {
        for (std::size_t i = pending_count_; i < VALUES_AT_A_TIME; ++i) {
            pending_[i] = 0;
        }
        packer_->pack8_values(pending_.data(), tail_.data());
    }

    detail::log_debug("writing %zu bytes for %zu values of size %u bits", buffered_size(),
                      value_count_, bit_width_);
    return ByteSource::concat(
        {ByteSource::from(encoded_), ByteSource::from(tail_.data(), tail_bytes)});
}

std::size_t BitPackedIntegerWriter::buffered_size() const noexcept {
    return encoded_.size() + padded_byte_count_from_bits(pending_count_ * bit_width_);
}

void BitPackedIntegerWriter::reset() noexcept {
    encoded_.reset();
    pending_count_ = 0;
    value_count_ = 0;
}

} // namespace colpack
