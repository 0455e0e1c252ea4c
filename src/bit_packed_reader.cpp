/**
 * @file bit_packed_reader.cpp
 * @brief BitPackedIntegerReader implementation.
 */

#include <colpack/bit_packed_reader.hpp>
#include <colpack/bytes_utils.hpp>
#include <colpack/log.hpp>

#include <cstring>
#include <limits>

#if !COLPACK_NO_EXCEPTIONS
#include <string>
#endif

namespace colpack {

BitPackedIntegerReader::BitPackedIntegerReader(std::int64_t max_value,
                                               const BytePackerFactory& factory)
    : bit_width_(0)
    , valid_(false)
    , page_(nullptr)
    , page_size_(0)
    , value_count_(0)
    , end_offset_(0) {
    if (max_value < 0 || max_value > std::numeric_limits<std::uint32_t>::max()) {
#if !COLPACK_NO_EXCEPTIONS
        throw InvalidArgumentException("max value out of range: " + std::to_string(max_value));
#else
        return;
#endif
    }

    bit_width_ = width_from_max_value(static_cast<std::uint32_t>(max_value));
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

Error BitPackedIntegerReader::init_from_page(std::size_t value_count, const std::uint8_t* page,
                                             std::size_t page_size, std::size_t offset) noexcept {
    if (!valid_ || offset > page_size) {
        return Error::InvalidArg;
    }

    std::size_t length = padded_byte_count_from_bits(value_count * bit_width_);
    if (length > 0 && page == nullptr) {
        return Error::InvalidArg;
    }

    detail::log_debug("reading %zu bytes for %zu values of size %u bits", length, value_count,
                      bit_width_);

    page_ = page;
    page_size_ = page_size;
    value_count_ = value_count;
    end_offset_ = offset + length;
    state_ = DecodeState{};
    state_.cursor = offset;
    return Error::Ok;
}

void BitPackedIntegerReader::decode_next_batch() noexcept {
    if (bit_width_ == 0 || !packer_) {
        state_.batch.fill(0);
        state_.position = 0;
        return;
    }

    const std::size_t width = bit_width_;
    if (state_.cursor + width > page_size_) {
        // Trailing batch only partially backed by the page
        std::array<std::uint8_t, MAX_BIT_WIDTH> scratch{};
        std::size_t available = (state_.cursor < page_size_) ? page_size_ - state_.cursor : 0;
        if (available > 0) {
            std::memcpy(scratch.data(), page_ + state_.cursor, available);
        }
        detail::log_debug("padding last batch: %zu of %zu bytes present", available, width);
        packer_->unpack8_values(scratch.data(), state_.batch.data());
    } else {
        packer_->unpack8_values(page_ + state_.cursor, state_.batch.data());
    }

    state_.cursor += width;
    state_.position = 0;
}

std::uint32_t BitPackedIntegerReader::read_integer() noexcept {
#if COLPACK_CHECKED_READS
    if (state_.values_read >= value_count_) {
        detail::log_warn("read past end of section: value %zu of %zu (next offset %zu)",
                         state_.values_read, value_count_, end_offset_);
    }
#endif

    ++state_.position;
    if (state_.position == VALUES_AT_A_TIME) {
        decode_next_batch();
    }
    ++state_.values_read;
    return state_.batch[state_.position];
}

Error BitPackedIntegerReader::read_integer(std::uint32_t& value) noexcept {
    if (!valid_) {
        return Error::InvalidArg;
    }
    if (state_.values_read >= value_count_) {
        return Error::Underflow;
    }
    value = read_integer();
    return Error::Ok;
}

void BitPackedIntegerReader::skip() noexcept {
    (void)read_integer();
}

} // namespace colpack
