/**
 * @file predictor.hh
 * @brief Fixed and LPC signal restoration
 * @ingroup decoding
 */

#ifndef FLACDEC_PREDICTOR_HH
#define FLACDEC_PREDICTOR_HH

#include <flacdec/export_flacdec.h>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace flacdec {

    /**
     * @brief Coefficients of the fixed polynomial predictor of @p order
     *
     * Order 0 predicts zero, order 1 repeats the previous sample, orders 2 to
     * 4 are the binomial differences {2, -1}, {3, -3, 1}, {4, -6, 4, -1}.
     * Coefficient j multiplies the sample j + 1 positions back, so a fixed
     * predictor is an LPC predictor with these coefficients and a zero shift.
     *
     * @throws malformed_stream if @p order is above 4
     */
    FLACDEC_EXPORT std::vector<int32_t> fixed_coefficients(unsigned order);

    /**
     * @brief Restore a signal in place
     *
     * On entry samples[0, order) hold the warm-up samples and
     * samples[order, block_size) hold the residual. On return every residual
     * slot holds residual + ((sum of coefficients[j] * samples[i - 1 - j]) >> shift).
     *
     * The sum is accumulated in 64 bits and the shift is an arithmetic
     * (flooring) shift, as the reference decoder does.
     *
     * @throws malformed_stream on a negative shift, or when a restored sample
     *         leaves the 33-bit range a side channel can occupy
     */
    FLACDEC_EXPORT void restore_signal(const int32_t* coefficients, unsigned order, int shift,
                                       int64_t* samples, std::size_t block_size);

    /**
     * @brief Reconstruct one channel from warm-up and residual
     *
     * @param order Predictor order, equal to coefficients.size()
     * @param coefficients Quantized coefficients, newest sample first
     * @param shift Quantization shift (0 for fixed predictors)
     * @param warmup The first @p order samples
     * @param residuals Prediction errors for the remaining samples
     * @param block_size Samples in the block
     * @return block_size reconstructed samples
     *
     * @throws malformed_stream if warmup.size() != order,
     *         coefficients.size() != order, or
     *         warmup.size() + residuals.size() != block_size
     */
    FLACDEC_EXPORT std::vector<int64_t> reconstruct(unsigned order,
                                                    const std::vector<int32_t>& coefficients,
                                                    int shift,
                                                    const std::vector<int64_t>& warmup,
                                                    const std::vector<int64_t>& residuals,
                                                    std::size_t block_size);

} // namespace flacdec

#endif // FLACDEC_PREDICTOR_HH
