#include <flacdec/predictor.hh>
#include <flacdec/decoder_options.hh>
#include <flacdec/error.hh>

#include <algorithm>

namespace flacdec {

    namespace {
        // side channels of 32-bit streams need 33 bits
        constexpr int64_t sample_limit = int64_t{1} << 32;

        const std::vector<int32_t> fixed_polynomials[] = {
            {},
            {1},
            {2, -1},
            {3, -3, 1},
            {4, -6, 4, -1}
        };
    }

    std::vector<int32_t> fixed_coefficients(unsigned order) {
        if (order > max_fixed_order) {
            throw malformed_stream("Fixed predictor order " + std::to_string(order) + " above 4");
        }
        return fixed_polynomials[order];
    }

    void restore_signal(const int32_t* coefficients, unsigned order, int shift,
                        int64_t* samples, std::size_t block_size) {
        if (shift < 0) {
            throw malformed_stream("Negative LPC shift " + std::to_string(shift));
        }
        if (shift > 63) {
            throw malformed_stream("LPC shift " + std::to_string(shift) + " out of range");
        }

        for (std::size_t i = order; i < block_size; i++) {
            int64_t sum = 0;
            for (unsigned j = 0; j < order; j++) {
                sum += static_cast<int64_t>(coefficients[j]) * samples[i - 1 - j];
            }

            const int64_t restored = samples[i] + (sum >> shift);
            if (restored >= sample_limit || restored < -sample_limit) {
                throw malformed_stream("Restored sample " + std::to_string(i) + " out of range");
            }
            samples[i] = restored;
        }
    }

    std::vector<int64_t> reconstruct(unsigned order,
                                     const std::vector<int32_t>& coefficients,
                                     int shift,
                                     const std::vector<int64_t>& warmup,
                                     const std::vector<int64_t>& residuals,
                                     std::size_t block_size) {
        if (coefficients.size() != order) {
            throw malformed_stream("Predictor order " + std::to_string(order) + " with " +
                                   std::to_string(coefficients.size()) + " coefficients");
        }
        if (warmup.size() != order) {
            throw malformed_stream("Predictor order " + std::to_string(order) + " with " +
                                   std::to_string(warmup.size()) + " warm-up samples");
        }
        if (warmup.size() + residuals.size() != block_size) {
            throw malformed_stream("Warm-up and residual cover " +
                                   std::to_string(warmup.size() + residuals.size()) +
                                   " samples, block has " + std::to_string(block_size));
        }

        std::vector<int64_t> samples(block_size);
        std::copy(warmup.begin(), warmup.end(), samples.begin());
        std::copy(residuals.begin(), residuals.end(), samples.begin() + order);

        restore_signal(coefficients.data(), order, shift, samples.data(), block_size);
        return samples;
    }

} // namespace flacdec
