/**
 * @file byte_sink.cpp
 * @brief ByteSink implementations.
 */

#include <colpack/byte_sink.hpp>

#include <ostream>

namespace colpack {

Error VectorByteSink::write(const std::uint8_t* data, std::size_t size) {
    if (size == 0) {
        return Error::Ok;
    }
    if (data == nullptr) {
        return Error::InvalidArg;
    }
    out_.insert(out_.end(), data, data + size);
    return Error::Ok;
}

Error OstreamByteSink::write(const std::uint8_t* data, std::size_t size) {
    if (size == 0) {
        return Error::Ok;
    }
    if (data == nullptr) {
        return Error::InvalidArg;
    }
    out_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
    return out_.good() ? Error::Ok : Error::Io;
}

} // namespace colpack
