/**
 * @file config.hpp
 * @brief colpack compile-time configuration.
 *
 * Every macro below can be overridden on the compiler command line
 * (or through the CMake options of the same name).
 */

#ifndef COLPACK_CONFIG_HPP
#define COLPACK_CONFIG_HPP

#include <cstddef>
#include <cstdint>

/**
 * @defgroup features Feature Configuration
 * @{
 */

/// Define COLPACK_NO_EXCEPTIONS=1 to build without the exception hierarchy.
#ifndef COLPACK_NO_EXCEPTIONS
#define COLPACK_NO_EXCEPTIONS 0
#endif

/// Define COLPACK_DEBUG=1 to trace encoder/decoder activity on stderr.
#ifndef COLPACK_DEBUG
#define COLPACK_DEBUG 0
#endif

/// Define COLPACK_CHECKED_READS=1 to warn when a reader runs past its section.
#ifndef COLPACK_CHECKED_READS
#define COLPACK_CHECKED_READS 0
#endif

/// First slab capacity of a GrowableBuffer, in bytes.
#ifndef COLPACK_DEFAULT_SLAB_SIZE
#define COLPACK_DEFAULT_SLAB_SIZE 1024U
#endif

/// Upper bound for the capacity of a single GrowableBuffer slab, in bytes.
#ifndef COLPACK_MAX_SLAB_SIZE
#define COLPACK_MAX_SLAB_SIZE (1024U * 1024U)
#endif

/** @} */

namespace colpack {

/**
 * @defgroup version Version Information
 * @{
 */
inline constexpr int VERSION_MAJOR = 1;
inline constexpr int VERSION_MINOR = 0;
inline constexpr int VERSION_PATCH = 0;
/** @} */

/**
 * @defgroup config Configuration Constants
 * @{
 */

/// Values decoded per unpack call; 8 values of W bits fill exactly W bytes.
inline constexpr std::size_t VALUES_AT_A_TIME = 8U;

/// Widest supported packed value, in bits.
inline constexpr unsigned MAX_BIT_WIDTH = 32U;

/// Serialized size of a little-endian 32-bit integer.
inline constexpr std::size_t INT_BYTES = 4U;

inline constexpr std::size_t DEFAULT_SLAB_SIZE = COLPACK_DEFAULT_SLAB_SIZE;
inline constexpr std::size_t MAX_SLAB_SIZE = COLPACK_MAX_SLAB_SIZE;

/** @} */

} // namespace colpack

#endif // COLPACK_CONFIG_HPP
