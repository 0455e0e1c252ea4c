/**
 * @file byte_source.cpp
 * @brief ByteSource and StreamByteSource implementation.
 */

#include <colpack/byte_source.hpp>
#include <colpack/bytes_utils.hpp>
#include <colpack/growable_buffer.hpp>
#include <colpack/log.hpp>

#include <algorithm>
#include <array>
#include <cstring>
#include <istream>
#include <type_traits>
#include <utility>

namespace colpack {

namespace {

/// Destination region [start, start + length) must lie inside the buffer.
bool region_fits(const std::uint8_t* buffer, std::size_t buffer_size, std::size_t start,
                 std::size_t length) noexcept {
    return buffer != nullptr && start <= buffer_size && length <= buffer_size - start;
}

/// Read exactly count bytes; Error::Underflow on a short read.
Error read_fully(std::istream& in, std::uint8_t* dst, std::size_t count) {
    if (count == 0) {
        return Error::Ok;
    }

    in.read(reinterpret_cast<char*>(dst), static_cast<std::streamsize>(count));
    if (static_cast<std::size_t>(in.gcount()) != count) {
        detail::log_debug("short read: %zu of %zu bytes", static_cast<std::size_t>(in.gcount()),
                          count);
        return Error::Underflow;
    }
    return Error::Ok;
}

} // namespace

// ============================================================================
// ByteSource construction
// ============================================================================

ByteSource ByteSource::empty() noexcept {
    return ByteSource();
}

ByteSource ByteSource::from(const std::uint8_t* data, std::size_t length) noexcept {
    return ByteSource(Variant(Raw{data, length}));
}

ByteSource ByteSource::from(const GrowableBuffer& buffer) noexcept {
    return ByteSource(Variant(BufferView{&buffer}));
}

ByteSource ByteSource::from_vector(const std::vector<std::uint8_t>& bytes) noexcept {
    return ByteSource(Variant(VectorView{&bytes}));
}

ByteSource ByteSource::from_int(std::uint32_t value) noexcept {
    return ByteSource(Variant(Int{value}));
}

ByteSource ByteSource::owned(std::vector<std::uint8_t> bytes) {
    auto shared = std::make_shared<const std::vector<std::uint8_t>>(std::move(bytes));
    return ByteSource(Variant(Owned{std::move(shared)}));
}

ByteSource ByteSource::concat(std::vector<ByteSource> sources) {
    std::size_t total = 0;
    for (const auto& source : sources) {
        total += source.size();
    }
    auto children = std::make_shared<const std::vector<ByteSource>>(std::move(sources));
    return ByteSource(Variant(Concat{std::move(children), total}));
}

ByteSource ByteSource::concat(std::initializer_list<ByteSource> sources) {
    return concat(std::vector<ByteSource>(sources));
}

Error ByteSource::copy(const ByteSource& source, ByteSource& out) {
    std::vector<std::uint8_t> bytes;
    auto result = source.to_byte_array(bytes);
    if (result != Error::Ok) {
        return result;
    }
    out = owned(std::move(bytes));
    return Error::Ok;
}

// ============================================================================
// ByteSource operations
// ============================================================================

std::size_t ByteSource::size() const noexcept {
    return std::visit(
        [](const auto& part) -> std::size_t {
            using T = std::decay_t<decltype(part)>;
            if constexpr (std::is_same_v<T, Empty>)
                return 0;
            else if constexpr (std::is_same_v<T, Raw>)
                return part.length;
            else if constexpr (std::is_same_v<T, Int>)
                return INT_BYTES;
            else if constexpr (std::is_same_v<T, BufferView>)
                return part.buffer->size();
            else if constexpr (std::is_same_v<T, VectorView>)
                return part.bytes->size();
            else if constexpr (std::is_same_v<T, Owned>)
                return part.bytes->size();
            else
                return part.size;
        },
        variant_);
}

Error ByteSource::write_all_to(ByteSink& sink) const {
    return std::visit(
        [&sink](const auto& part) -> Error {
            using T = std::decay_t<decltype(part)>;
            if constexpr (std::is_same_v<T, Empty>) {
                return Error::Ok;
            } else if constexpr (std::is_same_v<T, Raw>) {
                return sink.write(part.data, part.length);
            } else if constexpr (std::is_same_v<T, Int>) {
                std::array<std::uint8_t, INT_BYTES> bytes;
                write_int_little_endian(bytes.data(), part.value);
                return sink.write(bytes.data(), bytes.size());
            } else if constexpr (std::is_same_v<T, BufferView>) {
                return part.buffer->write_to(sink);
            } else if constexpr (std::is_same_v<T, VectorView>) {
                return sink.write(part.bytes->data(), part.bytes->size());
            } else if constexpr (std::is_same_v<T, Owned>) {
                return sink.write(part.bytes->data(), part.bytes->size());
            } else {
                for (const auto& child : *part.children) {
                    detail::log_debug("write %zu bytes to out", child.size());
                    auto result = child.write_all_to(sink);
                    if (result != Error::Ok) {
                        return result;
                    }
                }
                return Error::Ok;
            }
        },
        variant_);
}

Error ByteSource::write_to(std::uint8_t* buffer, std::size_t buffer_size, std::size_t start,
                           std::size_t length) const {
    if (kind() == Kind::Empty) {
        return Error::Unsupported;
    }
    if (length == 0 || length > size()) {
        return Error::InvalidArg;
    }
    if (!region_fits(buffer, buffer_size, start, length)) {
        return Error::Overflow;
    }

    std::uint8_t* dst = buffer + start;
    return std::visit(
        [&](const auto& part) -> Error {
            using T = std::decay_t<decltype(part)>;
            if constexpr (std::is_same_v<T, Empty>) {
                return Error::Unsupported;
            } else if constexpr (std::is_same_v<T, Raw>) {
                if (part.data == nullptr) {
                    return Error::InvalidArg;
                }
                std::memcpy(dst, part.data, length);
                return Error::Ok;
            } else if constexpr (std::is_same_v<T, Int>) {
                std::array<std::uint8_t, INT_BYTES> bytes;
                write_int_little_endian(bytes.data(), part.value);
                std::memcpy(dst, bytes.data(), length);
                return Error::Ok;
            } else if constexpr (std::is_same_v<T, BufferView>) {
                return part.buffer->copy_to(dst, length);
            } else if constexpr (std::is_same_v<T, VectorView>) {
                std::memcpy(dst, part.bytes->data(), length);
                return Error::Ok;
            } else if constexpr (std::is_same_v<T, Owned>) {
                std::memcpy(dst, part.bytes->data(), length);
                return Error::Ok;
            } else {
                std::size_t written = 0;
                for (const auto& child : *part.children) {
                    std::size_t chunk = std::min(length - written, child.size());
                    if (chunk == 0) {
                        continue;
                    }
                    auto result = child.write_to(buffer, buffer_size, start + written, chunk);
                    if (result != Error::Ok) {
                        return result;
                    }
                    written += chunk;
                    if (written == length) {
                        break;
                    }
                }
                // A viewed buffer shrank below the size summed at creation.
                return written == length ? Error::Ok : Error::Underflow;
            }
        },
        variant_);
}

Error ByteSource::write_to(std::uint8_t* buffer, std::size_t buffer_size, std::size_t start,
                           std::size_t length, ByteSource& written) const {
    auto result = write_to(buffer, buffer_size, start, length);
    if (result != Error::Ok) {
        return result;
    }
    written = from(buffer + start, length);
    return Error::Ok;
}

Error ByteSource::to_byte_array(std::vector<std::uint8_t>& out) const {
    std::size_t expected = size();
    std::vector<std::uint8_t> bytes;
    bytes.reserve(expected);

    VectorByteSink sink(bytes);
    auto result = write_all_to(sink);
    if (result != Error::Ok) {
        return result;
    }

    detail::log_debug("converted %zu to byte array of %zu bytes", expected, bytes.size());
    out = std::move(bytes);
    return Error::Ok;
}

// ============================================================================
// StreamByteSource
// ============================================================================

StreamByteSource::StreamByteSource(StreamByteSource&& other) noexcept
    : in_(other.in_), byte_count_(other.byte_count_) {
    other.in_ = nullptr;
    other.byte_count_ = 0;
}

StreamByteSource& StreamByteSource::operator=(StreamByteSource&& other) noexcept {
    if (this != &other) {
        in_ = other.in_;
        byte_count_ = other.byte_count_;
        other.in_ = nullptr;
        other.byte_count_ = 0;
    }
    return *this;
}

Error StreamByteSource::write_all_to(ByteSink& sink) && {
    std::vector<std::uint8_t> bytes;
    auto result = std::move(*this).to_byte_array(bytes);
    if (result != Error::Ok) {
        return result;
    }
    return sink.write(bytes.data(), bytes.size());
}

Error StreamByteSource::write_to(std::uint8_t* buffer, std::size_t buffer_size, std::size_t start,
                                 std::size_t length, StreamByteSource& rest) && {
    if (consumed()) {
        return Error::Unsupported;
    }
    if (length == 0 || length > byte_count_) {
        return Error::InvalidArg;
    }
    if (!region_fits(buffer, buffer_size, start, length)) {
        return Error::Overflow;
    }

    std::istream& in = *in_;
    std::size_t remaining = byte_count_ - length;
    in_ = nullptr;
    byte_count_ = 0;

    auto result = read_fully(in, buffer + start, length);
    if (result != Error::Ok) {
        return result;
    }
    rest = StreamByteSource(in, remaining);
    return Error::Ok;
}

Error StreamByteSource::to_byte_array(std::vector<std::uint8_t>& out) && {
    if (consumed()) {
        return Error::Unsupported;
    }

    std::istream& in = *in_;
    std::size_t count = byte_count_;
    in_ = nullptr;
    byte_count_ = 0;

    detail::log_debug("read all %zu bytes", count);
    std::vector<std::uint8_t> bytes(count);
    auto result = read_fully(in, bytes.data(), count);
    if (result != Error::Ok) {
        return result;
    }
    out = std::move(bytes);
    return Error::Ok;
}

Error StreamByteSource::materialize(ByteSource& out) && {
    std::vector<std::uint8_t> bytes;
    auto result = std::move(*this).to_byte_array(bytes);
    if (result != Error::Ok) {
        return result;
    }
    out = ByteSource::owned(std::move(bytes));
    return Error::Ok;
}

} // namespace colpack
