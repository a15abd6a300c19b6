/**
 * @file channel_decorrelator.hh
 * @brief Inter-channel decorrelation for stereo frames
 * @ingroup decoding
 */

#ifndef FLACDEC_CHANNEL_DECORRELATOR_HH
#define FLACDEC_CHANNEL_DECORRELATOR_HH

#include <flacdec/export_flacdec.h>
#include <cstdint>
#include <vector>

namespace flacdec {

    /**
     * @enum channel_assignment
     * @brief How the channels of a frame were coded
     */
    enum class channel_assignment : uint8_t {
        independent, ///< 1 to 8 channels coded separately
        left_side,   ///< Channel 0 left, channel 1 left - right
        right_side,  ///< Channel 0 left - right, channel 1 right
        mid_side     ///< Channel 0 (left + right) >> 1, channel 1 left - right
    };

    /**
     * @brief Decode depth of @p channel
     *
     * The side channel needs one bit more than the frame depth.
     */
    FLACDEC_EXPORT unsigned subframe_bits_per_sample(channel_assignment assignment,
                                                     unsigned channel,
                                                     unsigned bits_per_sample);

    /**
     * @brief Turn decoded subframes into left/right in place
     *
     * Independent frames are left untouched. Stereo assignments require
     * exactly two channels of equal length.
     *
     * @throws malformed_stream if a stereo assignment is applied to anything
     *         other than two equally sized channels
     */
    FLACDEC_EXPORT void decorrelate(channel_assignment assignment,
                                    std::vector<std::vector<int64_t>>& channels);

} // namespace flacdec

#endif // FLACDEC_CHANNEL_DECORRELATOR_HH
