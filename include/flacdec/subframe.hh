/**
 * @file subframe.hh
 * @brief Per-channel subframe parsing and reconstruction
 * @ingroup decoding
 */

#ifndef FLACDEC_SUBFRAME_HH
#define FLACDEC_SUBFRAME_HH

#include <flacdec/export_flacdec.h>
#include <flacdec/decoder_options.hh>
#include <flacdec/residual.hh>
#include <cstddef>
#include <cstdint>
#include <variant>
#include <vector>

namespace flacdec {

    class bit_cursor;

    /// Every sample of the block has the same value
    struct constant_subframe {
        int64_t value = 0;
    };

    /// Samples stored uncompressed
    struct verbatim_subframe {
        std::vector<int64_t> samples;
    };

    /// Fixed polynomial predictor, order 0 to 4
    struct fixed_subframe {
        unsigned order = 0;
        std::vector<int64_t> warmup;
        residual residual_block;
    };

    /// Linear predictor with quantized coefficients, order 1 to 32
    struct lpc_subframe {
        unsigned order = 0;
        unsigned precision = 0;             ///< Coefficient width in bits
        int shift = 0;                      ///< Quantization shift, never negative
        std::vector<int32_t> coefficients;  ///< Newest sample first
        std::vector<int64_t> warmup;
        residual residual_block;
    };

    /**
     * @struct subframe
     * @brief One parsed channel of a frame
     *
     * All values are at the decode depth, i.e. before the wasted bits are
     * shifted back in.
     */
    struct subframe {
        std::variant<constant_subframe, verbatim_subframe, fixed_subframe, lpc_subframe> data;
        unsigned wasted_bits = 0;
    };

    /**
     * @brief Parse one subframe
     *
     * @param cursor Positioned at the subframe padding bit
     * @param block_size Samples in the frame
     * @param bits_per_sample Depth of this channel, one more than the
     *        frame depth for a side channel
     * @param options Decoder limits
     *
     * @throws malformed_stream on a non-zero padding bit, a reserved type,
     *         wasted bits >= depth, a predictor order above the block size,
     *         the reserved LPC precision or a negative LPC shift
     * @throws unsupported_stream if the LPC order or depth exceed @p options
     * @throws out_of_data if the cursor runs dry
     */
    FLACDEC_EXPORT subframe parse_subframe(bit_cursor& cursor, std::size_t block_size,
                                           unsigned bits_per_sample,
                                           const decoder_options& options);

    /**
     * @brief Expand a parsed subframe to block_size samples
     *
     * Runs the predictor and shifts the wasted bits back in.
     *
     * @throws malformed_stream if the subframe is inconsistent with @p block_size
     */
    FLACDEC_EXPORT std::vector<int64_t> reconstruct_subframe(const subframe& sub,
                                                             std::size_t block_size);

    /// parse_subframe() followed by reconstruct_subframe()
    FLACDEC_EXPORT std::vector<int64_t> decode_subframe(bit_cursor& cursor, std::size_t block_size,
                                                        unsigned bits_per_sample,
                                                        const decoder_options& options);

} // namespace flacdec

#endif // FLACDEC_SUBFRAME_HH
