/**
 * @file residual.hh
 * @brief Partitioned Rice residual decoding
 * @ingroup decoding
 */

#ifndef FLACDEC_RESIDUAL_HH
#define FLACDEC_RESIDUAL_HH

#include <flacdec/export_flacdec.h>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace flacdec {

    class bit_cursor;

    /**
     * @enum residual_coding
     * @brief Residual coding method, the 2-bit field in front of the residual
     */
    enum class residual_coding : uint8_t {
        rice = 0,  ///< 4-bit Rice parameters, escape value 15
        rice2 = 1  ///< 5-bit Rice parameters, escape value 31
    };

    /**
     * @struct residual_partition
     * @brief Coding parameters of one partition
     */
    struct residual_partition {
        unsigned rice_parameter = 0;
        bool escaped = false;
        unsigned raw_bits = 0;     ///< Width of every residual when escaped
        std::size_t count = 0;     ///< Residuals in this partition
    };

    /**
     * @struct residual
     * @brief A decoded residual block
     *
     * values holds block_size - predictor_order prediction errors. The
     * first partition is shorter than the others by the predictor order,
     * since warm-up samples occupy no residual slots.
     */
    struct residual {
        residual_coding method = residual_coding::rice;
        unsigned partition_order = 0;
        std::vector<residual_partition> partitions;
        std::vector<int64_t> values;
    };

    /**
     * @brief Decode the residual of one subframe
     *
     * @param cursor Positioned at the 2-bit coding method
     * @param block_size Samples in the subframe
     * @param predictor_order Warm-up samples in front of the residual
     * @return The decoded residual
     *
     * @throws malformed_stream on a reserved coding method, a block size not
     *         divisible by the partition count, a partition shorter than the
     *         predictor order, or a malformed Rice code
     * @throws out_of_data if the cursor runs dry
     */
    FLACDEC_EXPORT residual decode_residual(bit_cursor& cursor, std::size_t block_size,
                                            unsigned predictor_order);

} // namespace flacdec

#endif // FLACDEC_RESIDUAL_HH
