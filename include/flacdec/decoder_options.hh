/**
 * @file decoder_options.hh
 * @brief Decoder configuration
 * @ingroup decoding
 */

#ifndef FLACDEC_DECODER_OPTIONS_HH
#define FLACDEC_DECODER_OPTIONS_HH

#include <cstddef>
#include <cstdint>

namespace flacdec {

    /// Format limits
    inline constexpr unsigned max_fixed_order = 4;
    inline constexpr unsigned max_lpc_order = 32;
    inline constexpr unsigned max_bits_per_sample = 32;
    inline constexpr uint32_t max_block_size = 65536;
    inline constexpr unsigned max_channels = 8;

    /**
     * @enum crc_policy
     * @brief What to do when a frame's CRC-16 does not match
     */
    enum class crc_policy {
        deliver_unverified, ///< Return the samples with decoded_frame::verified == false
        strict              ///< Throw integrity_error
    };

    /**
     * @struct decoder_options
     * @brief Tunables shared by frame_decoder and stream_decoder
     *
     * Limits may only be lowered below the format maxima. A stream that
     * exceeds a lowered limit is reported as unsupported_stream, never as
     * malformed.
     */
    struct decoder_options {
        crc_policy on_crc_mismatch = crc_policy::deliver_unverified;

        unsigned max_lpc_order = flacdec::max_lpc_order;
        unsigned max_bits_per_sample = flacdec::max_bits_per_sample;
        uint32_t max_block_size = flacdec::max_block_size;

        // Reject frame headers that disagree with STREAMINFO (channel count,
        // explicit bit depth, block size above the advertised maximum)
        bool check_stream_info = true;

        // Bytes pulled from the byte source per refill
        std::size_t read_chunk_size = 64 * 1024;
    };

} // namespace flacdec

#endif // FLACDEC_DECODER_OPTIONS_HH
