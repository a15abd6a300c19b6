/**
 * @file frame.hh
 * @brief Frame header and decoded frame types
 * @ingroup decoding
 */

#ifndef FLACDEC_FRAME_HH
#define FLACDEC_FRAME_HH

#include <flacdec/export_flacdec.h>
#include <flacdec/channel_decorrelator.hh>
#include <flacdec/sdk/types.hh>
#include <cstdint>
#include <vector>

namespace flacdec {

    enum class blocking_strategy : uint8_t {
        fixed,   ///< number is the frame index
        variable ///< number is the index of the first sample
    };

    /**
     * @struct frame_header
     * @brief Parsed and CRC-8 checked frame header
     */
    struct frame_header {
        blocking_strategy blocking = blocking_strategy::fixed;
        uint32_t block_size = 0;
        sample_rate_t sample_rate = 0; ///< 0 if inherited and no STREAMINFO is known
        channel_assignment assignment = channel_assignment::independent;
        unsigned channels = 0;
        unsigned bits_per_sample = 0;
        uint64_t number = 0;
        uint8_t crc8 = 0;
    };

    /**
     * @struct decoded_frame
     * @brief One frame of reconstructed samples
     *
     * channels holds one sequence of block_size samples per channel, already
     * decorrelated and at the nominal bit depth. verified is false when the
     * CRC-16 footer did not match and the decoder was configured to deliver
     * such frames anyway.
     */
    struct FLACDEC_EXPORT decoded_frame {
        frame_header header;
        std::vector<std::vector<sample_t>> channels;
        uint16_t crc16 = 0;
        bool verified = false;

        /// Samples interleaved channel by channel, frame by frame
        [[nodiscard]] std::vector<sample_t> interleaved() const;
    };

} // namespace flacdec

#endif // FLACDEC_FRAME_HH
