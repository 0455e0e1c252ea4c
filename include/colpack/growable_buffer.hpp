/**
 * @file growable_buffer.hpp
 * @brief Append-only byte buffer that grows by whole slabs.
 *
 * Bytes are stored in a list of slabs. When the current slab is full a
 * new one is allocated with twice the previous capacity, capped at the
 * configured maximum. Bytes already written never move, so a ByteSource
 * can view the buffer while an encoder keeps appending to it.
 *
 * @par Growth
 * - First slab: initial_slab_size bytes
 * - Each further slab: min(2 * previous, max_slab_size) bytes
 *
 * @authors colpack contributors
 */

#ifndef COLPACK_GROWABLE_BUFFER_HPP
#define COLPACK_GROWABLE_BUFFER_HPP

#include "byte_sink.hpp"
#include "config.hpp"
#include "error.hpp"

#include <memory>
#include <vector>

namespace colpack {

/**
 * @brief Slab-based append-only byte buffer.
 *
 * Not copyable or movable: byte sources keep a pointer to it.
 */
class GrowableBuffer final : public ByteSink {
public:
    /**
     * @brief Construct an empty buffer. No slab is allocated until the first write.
     *
     * @param initial_slab_size Capacity of the first slab (clamped to [1, max_slab_size])
     * @param max_slab_size Largest capacity a single slab may have
     */
    explicit GrowableBuffer(std::size_t initial_slab_size = DEFAULT_SLAB_SIZE,
                            std::size_t max_slab_size = MAX_SLAB_SIZE) noexcept;

    GrowableBuffer(const GrowableBuffer&) = delete;
    GrowableBuffer& operator=(const GrowableBuffer&) = delete;

    /**
     * @brief Append bytes, allocating slabs as needed.
     */
    Error write(const std::uint8_t* data, std::size_t size) override;

    /**
     * @brief Append a single byte.
     */
    Error write_byte(std::uint8_t value);

    /**
     * @brief Number of bytes written so far.
     */
    [[nodiscard]] std::size_t size() const noexcept { return size_; }

    /**
     * @brief Total bytes allocated across all slabs.
     */
    [[nodiscard]] std::size_t capacity() const noexcept;

    [[nodiscard]] std::size_t slab_count() const noexcept { return slabs_.size(); }

    /**
     * @brief Write the whole content, slab by slab, to a sink.
     *
     * @param sink Destination
     * @return First error reported by the sink, or Error::Ok
     */
    Error write_to(ByteSink& sink) const;

    /**
     * @brief Copy the first count bytes into a flat destination.
     *
     * @param dst Destination, at least count bytes
     * @param count Bytes to copy
     * @return Error::InvalidArg if count exceeds size()
     */
    Error copy_to(std::uint8_t* dst, std::size_t count) const noexcept;

    /**
     * @brief Drop all content and slabs, keeping the growth settings.
     */
    void reset() noexcept;

private:
    struct Slab {
        std::unique_ptr<std::uint8_t[]> data;
        std::size_t capacity;
        std::size_t used;
    };

    void add_slab();

    std::vector<Slab> slabs_;
    std::size_t size_;
    std::size_t initial_slab_size_;
    std::size_t max_slab_size_;
};

} // namespace colpack

#endif // COLPACK_GROWABLE_BUFFER_HPP
