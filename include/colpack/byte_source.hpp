/**
 * @file byte_source.hpp
 * @brief Composable, lazily materialized byte sources.
 *
 * A ByteSource describes a byte sequence without producing it. Encoders
 * return trees of sources (raw ranges, little-endian integers, views over
 * buffers that may still grow, concatenations) and the bytes are only
 * copied when the tree is written to a sink or into a page buffer.
 *
 * @par Variants
 * | Kind   | Content                                 | size()            |
 * |--------|-----------------------------------------|-------------------|
 * | Empty  | nothing                                 | 0                 |
 * | Raw    | borrowed [data, data + length)          | length            |
 * | Int    | 4 little-endian bytes of a value        | 4                 |
 * | Buffer | borrowed GrowableBuffer                 | current size      |
 * | Vector | borrowed std::vector<std::uint8_t>      | current size      |
 * | Owned  | shared immutable bytes                  | length            |
 * | Concat | children, in order                      | sum at creation   |
 *
 * All of these can be written any number of times. A source reading from
 * a std::istream is a separate, move-only type (StreamByteSource) whose
 * consuming operations can only be called on an rvalue, once.
 *
 * @par Lifetimes
 * Raw, Buffer and Vector sources borrow their storage. The storage must
 * outlive every source (and every concatenation) referring to it.
 *
 * @authors colpack contributors
 */

#ifndef COLPACK_BYTE_SOURCE_HPP
#define COLPACK_BYTE_SOURCE_HPP

#include "byte_sink.hpp"
#include "config.hpp"
#include "error.hpp"

#include <initializer_list>
#include <iosfwd>
#include <memory>
#include <utility>
#include <variant>
#include <vector>

namespace colpack {

class GrowableBuffer;

/**
 * @brief Immutable, re-writable description of a byte sequence.
 */
class ByteSource {
public:
    /// Variant tag, in declaration order of the underlying variant.
    enum class Kind { Empty, Raw, Int, Buffer, Vector, Owned, Concat };

    /**
     * @brief Construct an empty source.
     */
    ByteSource() noexcept = default;

    /// @name Construction helpers
    /// @{

    [[nodiscard]] static ByteSource empty() noexcept;

    /**
     * @brief View a borrowed byte range. Nothing is copied.
     */
    [[nodiscard]] static ByteSource from(const std::uint8_t* data, std::size_t length) noexcept;

    /**
     * @brief View a GrowableBuffer. Size and content are read when the
     *        source is queried or written, not now.
     */
    [[nodiscard]] static ByteSource from(const GrowableBuffer& buffer) noexcept;

    /**
     * @brief View a byte vector. Size and content are read when the
     *        source is queried or written, not now.
     */
    [[nodiscard]] static ByteSource from_vector(const std::vector<std::uint8_t>& bytes) noexcept;

    /**
     * @brief 4 little-endian bytes of value, produced at write time.
     */
    [[nodiscard]] static ByteSource from_int(std::uint32_t value) noexcept;

    /**
     * @brief Take ownership of bytes; copies of the source share them.
     */
    [[nodiscard]] static ByteSource owned(std::vector<std::uint8_t> bytes);

    /**
     * @brief Logical concatenation. Children are not copied; the total
     *        size is computed now.
     */
    [[nodiscard]] static ByteSource concat(std::vector<ByteSource> sources);
    [[nodiscard]] static ByteSource concat(std::initializer_list<ByteSource> sources);

    /**
     * @brief Materialize a source into an owned one.
     *
     * @param source Source to copy
     * @param[out] out Owned copy of its current content
     * @return Error::Ok on success
     */
    static Error copy(const ByteSource& source, ByteSource& out);

    /// @}

    [[nodiscard]] Kind kind() const noexcept {
        return static_cast<Kind>(variant_.index());
    }

    /**
     * @brief Number of bytes this source produces.
     */
    [[nodiscard]] std::size_t size() const noexcept;

    /**
     * @brief Write every byte, in order, to a sink.
     *
     * @param sink Destination
     * @return First sink error, or Error::Ok
     */
    Error write_all_to(ByteSink& sink) const;

    /**
     * @brief Write the first length bytes into buffer[start, start + length).
     *
     * Concatenations write their children in order and stop as soon as
     * length bytes are written, possibly inside a child. The result is a
     * Raw view over the destination region, not a resumable remainder.
     *
     * @param buffer Destination buffer
     * @param buffer_size Capacity of buffer
     * @param start Offset of the first byte written
     * @param length Bytes to write, in (0, size()]
     * @param[out] written Raw source over buffer[start, start + length)
     * @return Error::InvalidArg for a bad length, Error::Overflow if the
     *         region does not fit, Error::Unsupported for the empty source
     */
    Error write_to(std::uint8_t* buffer, std::size_t buffer_size, std::size_t start,
                   std::size_t length, ByteSource& written) const;

    Error write_to(std::uint8_t* buffer, std::size_t buffer_size, std::size_t start,
                   std::size_t length) const;

    /**
     * @brief Materialize into a freshly allocated vector.
     *
     * @param[out] out Replaced by the content of this source
     * @return Error::Ok on success
     */
    Error to_byte_array(std::vector<std::uint8_t>& out) const;

private:
    struct Empty {};

    struct Raw {
        const std::uint8_t* data;
        std::size_t length;
    };

    struct Int {
        std::uint32_t value;
    };

    struct BufferView {
        const GrowableBuffer* buffer;
    };

    struct VectorView {
        const std::vector<std::uint8_t>* bytes;
    };

    struct Owned {
        std::shared_ptr<const std::vector<std::uint8_t>> bytes;
    };

    struct Concat {
        std::shared_ptr<const std::vector<ByteSource>> children;
        std::size_t size;
    };

    using Variant = std::variant<Empty, Raw, Int, BufferView, VectorView, Owned, Concat>;

    explicit ByteSource(Variant variant) noexcept : variant_(std::move(variant)) {}

    Variant variant_;
};

/**
 * @brief Single-use source reading a declared byte count from a stream.
 *
 * Reading advances the stream, so each consuming operation is only
 * callable on an rvalue and leaves the object consumed. A consumed (or
 * default-constructed, or moved-from) source fails every further
 * operation with Error::Unsupported.
 *
 * @code
 * StreamByteSource page(in, header.compressed_size);
 * std::vector<std::uint8_t> bytes;
 * auto result = std::move(page).to_byte_array(bytes);
 * @endcode
 */
class StreamByteSource {
public:
    StreamByteSource() noexcept : in_(nullptr), byte_count_(0) {}

    StreamByteSource(std::istream& in, std::size_t byte_count) noexcept
        : in_(&in), byte_count_(byte_count) {}

    StreamByteSource(const StreamByteSource&) = delete;
    StreamByteSource& operator=(const StreamByteSource&) = delete;

    StreamByteSource(StreamByteSource&& other) noexcept;
    StreamByteSource& operator=(StreamByteSource&& other) noexcept;

    /**
     * @brief Declared number of bytes still to be read.
     */
    [[nodiscard]] std::size_t size() const noexcept { return byte_count_; }

    [[nodiscard]] bool consumed() const noexcept { return in_ == nullptr; }

    /**
     * @brief Read all declared bytes in one bulk read and write them to a sink.
     *
     * @return Error::Underflow on a short read
     */
    Error write_all_to(ByteSink& sink) &&;

    /**
     * @brief Read length bytes into buffer[start, start + length).
     *
     * @param[out] rest The remaining size() - length bytes of the stream
     * @return Error::InvalidArg for a bad length, Error::Overflow if the
     *         region does not fit, Error::Underflow on a short read
     */
    Error write_to(std::uint8_t* buffer, std::size_t buffer_size, std::size_t start,
                   std::size_t length, StreamByteSource& rest) &&;

    Error to_byte_array(std::vector<std::uint8_t>& out) &&;

    /**
     * @brief Read the stream into an owned ByteSource, e.g. to concatenate it.
     */
    Error materialize(ByteSource& out) &&;

private:
    std::istream* in_;
    std::size_t byte_count_;
};

} // namespace colpack

#endif // COLPACK_BYTE_SOURCE_HPP
