/**
 * @file growable_buffer.cpp
 * @brief GrowableBuffer slab management.
 */

#include <colpack/growable_buffer.hpp>
#include <colpack/log.hpp>

#include <algorithm>
#include <cstring>

namespace colpack {

GrowableBuffer::GrowableBuffer(std::size_t initial_slab_size, std::size_t max_slab_size) noexcept
    : size_(0)
    , initial_slab_size_(1)
    , max_slab_size_(max_slab_size == 0 ? 1 : max_slab_size) {
    initial_slab_size_ = std::clamp<std::size_t>(initial_slab_size, 1, max_slab_size_);
}

std::size_t GrowableBuffer::capacity() const noexcept {
    std::size_t total = 0;
    for (const auto& slab : slabs_) {
        total += slab.capacity;
    }
    return total;
}

void GrowableBuffer::add_slab() {
    std::size_t capacity = initial_slab_size_;
    if (!slabs_.empty()) {
        std::size_t previous = slabs_.back().capacity;
        capacity = (previous > max_slab_size_ / 2) ? max_slab_size_ : previous * 2;
    }

    detail::log_debug("allocating slab %zu of %zu bytes", slabs_.size(), capacity);
    slabs_.push_back(Slab{std::make_unique<std::uint8_t[]>(capacity), capacity, 0});
}

Error GrowableBuffer::write(const std::uint8_t* data, std::size_t size) {
    if (size == 0) {
        return Error::Ok;
    }
    if (data == nullptr) {
        return Error::InvalidArg;
    }

    std::size_t remaining = size;
    while (remaining > 0) {
        if (slabs_.empty() || slabs_.back().used == slabs_.back().capacity) {
            add_slab();
        }

        Slab& slab = slabs_.back();
        std::size_t chunk = std::min(remaining, slab.capacity - slab.used);
        std::memcpy(slab.data.get() + slab.used, data, chunk);
        slab.used += chunk;
        data += chunk;
        remaining -= chunk;
    }

    size_ += size;
    return Error::Ok;
}

Error GrowableBuffer::write_byte(std::uint8_t value) {
    return write(&value, 1);
}

Error GrowableBuffer::write_to(ByteSink& sink) const {
    for (const auto& slab : slabs_) {
        auto result = sink.write(slab.data.get(), slab.used);
        if (result != Error::Ok) {
            return result;
        }
    }
    return Error::Ok;
}

Error GrowableBuffer::copy_to(std::uint8_t* dst, std::size_t count) const noexcept {
    if (count > size_) {
        return Error::InvalidArg;
    }
    if (count > 0 && dst == nullptr) {
        return Error::InvalidArg;
    }

    std::size_t remaining = count;
    for (const auto& slab : slabs_) {
        if (remaining == 0) {
            break;
        }
        std::size_t chunk = std::min(remaining, slab.used);
        std::memcpy(dst, slab.data.get(), chunk);
        dst += chunk;
        remaining -= chunk;
    }
    return Error::Ok;
}

void GrowableBuffer::reset() noexcept {
    slabs_.clear();
    size_ = 0;
}

} // namespace colpack
