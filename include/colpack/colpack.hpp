/**
 * @file colpack.hpp
 * @brief colpack umbrella header.
 *
 * Bit-packed integer sections and composable byte sources for columnar
 * page encoding:
 *
 * @code
 * BitPackedIntegerWriter writer(max_value, packer_factory(Packer::LittleEndian));
 * for (auto v : values) writer.write_integer(v);
 *
 * std::vector<std::uint8_t> page;
 * ByteSource::concat({ByteSource::from_int(header), writer.get_bytes()}).to_byte_array(page);
 *
 * BitPackedIntegerReader reader(max_value, packer_factory(Packer::LittleEndian));
 * reader.init_from_page(values.size(), page.data(), page.size(), INT_BYTES);
 * @endcode
 */

#ifndef COLPACK_HPP
#define COLPACK_HPP

#include "bit_packed_reader.hpp"
#include "bit_packed_writer.hpp"
#include "bit_packer.hpp"
#include "byte_sink.hpp"
#include "byte_source.hpp"
#include "bytes_utils.hpp"
#include "config.hpp"
#include "error.hpp"
#include "growable_buffer.hpp"

namespace colpack {

/**
 * @brief Get library version.
 * @return Version string
 */
inline const char* version() noexcept {
    return "1.0.0";
}

} // namespace colpack

#endif // COLPACK_HPP
