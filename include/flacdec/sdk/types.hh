/**
 * @file types.hh
 * @brief Platform-independent type definitions
 * @ingroup sdk_types
 */

#ifndef FLACDEC_SDK_TYPES_H
#define FLACDEC_SDK_TYPES_H

#include <cstdint>
#include <cstddef>

namespace flacdec {

/**
 * @defgroup sdk_types Type Definitions
 * @ingroup sdk
 * @brief Core type definitions for audio decoding
 *
 * Semantic aliases for audio-related values, so that a sample rate and a
 * channel count can not be confused in a signature.
 *
 * @{
 */

/**
 * @typedef sample_rate_t
 * @brief Type for audio sample rates
 *
 * Samples per second (Hz). FLAC can express rates up to 655350 Hz in a
 * frame header and up to 1048575 Hz in STREAMINFO.
 */
using sample_rate_t = uint32_t;

/**
 * @typedef channels_t
 * @brief Type for audio channel count
 *
 * FLAC streams carry 1 to 8 channels.
 */
using channels_t = uint8_t;

/**
 * @typedef sample_t
 * @brief Decoded PCM sample
 *
 * Signed integer at the stream's nominal bit depth (4 to 32 bits),
 * right-justified.
 */
using sample_t = int32_t;

/** @} */ // end of sdk_types group

} // namespace flacdec

#endif // FLACDEC_SDK_TYPES_H
