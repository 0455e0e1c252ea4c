/**
 * @file byte_sink.hpp
 * @brief Sequential byte destinations.
 *
 * A ByteSink accepts appended chunks of arbitrary size. Byte sources
 * flatten themselves into a sink in order; the sink decides where the
 * bytes end up (memory, a file, a GrowableBuffer).
 */

#ifndef COLPACK_BYTE_SINK_HPP
#define COLPACK_BYTE_SINK_HPP

#include "config.hpp"
#include "error.hpp"

#include <iosfwd>
#include <vector>

namespace colpack {

/**
 * @brief Append-only output destination.
 */
class ByteSink {
public:
    virtual ~ByteSink() = default;

    /**
     * @brief Append bytes to the sink.
     *
     * @param data Bytes to append (may be null when size is 0)
     * @param size Number of bytes
     * @return Error::Ok on success, Error::Io if the destination failed
     */
    virtual Error write(const std::uint8_t* data, std::size_t size) = 0;
};

/**
 * @brief Sink appending to a caller-owned byte vector.
 */
class VectorByteSink final : public ByteSink {
public:
    explicit VectorByteSink(std::vector<std::uint8_t>& out) noexcept : out_(out) {}

    Error write(const std::uint8_t* data, std::size_t size) override;

private:
    std::vector<std::uint8_t>& out_;
};

/**
 * @brief Sink writing to a caller-owned output stream.
 */
class OstreamByteSink final : public ByteSink {
public:
    explicit OstreamByteSink(std::ostream& out) noexcept : out_(out) {}

    Error write(const std::uint8_t* data, std::size_t size) override;

private:
    std::ostream& out_;
};

} // namespace colpack

#endif // COLPACK_BYTE_SINK_HPP
