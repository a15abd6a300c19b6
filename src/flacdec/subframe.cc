#include <flacdec/subframe.hh>
#include <flacdec/bit_cursor.hh>
#include <flacdec/predictor.hh>
#include <flacdec/error.hh>

namespace flacdec {

    namespace {
        constexpr unsigned type_constant = 0;
        constexpr unsigned type_verbatim = 1;
        constexpr unsigned type_fixed_first = 8;
        constexpr unsigned type_fixed_last = 12;
        constexpr unsigned type_lpc_first = 32;

        constexpr unsigned reserved_lpc_precision = 15;

        std::vector<int64_t> read_warmup(bit_cursor& cursor, unsigned order, unsigned bits) {
            std::vector<int64_t> warmup;
            warmup.reserve(order);
            for (unsigned i = 0; i < order; i++) {
                warmup.push_back(cursor.read_signed(bits));
            }
            return warmup;
        }

        void check_order(unsigned order, std::size_t block_size, std::size_t position) {
            if (order > block_size) {
                throw malformed_stream("Predictor order " + std::to_string(order) +
                                       " exceeds block size " + std::to_string(block_size),
                                       position);
            }
        }

        struct reconstruct_visitor {
            std::size_t block_size;

            std::vector<int64_t> operator()(const constant_subframe& s) const {
                return std::vector<int64_t>(block_size, s.value);
            }

            std::vector<int64_t> operator()(const verbatim_subframe& s) const {
                if (s.samples.size() != block_size) {
                    throw malformed_stream("Verbatim subframe holds " + std::to_string(s.samples.size()) +
                                           " samples, block has " + std::to_string(block_size));
                }
                return s.samples;
            }

            std::vector<int64_t> operator()(const fixed_subframe& s) const {
                return reconstruct(s.order, fixed_coefficients(s.order), 0,
                                   s.warmup, s.residual_block.values, block_size);
            }

            std::vector<int64_t> operator()(const lpc_subframe& s) const {
                return reconstruct(s.order, s.coefficients, s.shift,
                                   s.warmup, s.residual_block.values, block_size);
            }
        };
    }

    subframe parse_subframe(bit_cursor& cursor, std::size_t block_size,
                            unsigned bits_per_sample, const decoder_options& options) {
        // side channels carry one extra bit
        if (bits_per_sample > options.max_bits_per_sample + 1) {
            throw unsupported_stream("Subframe depth of " + std::to_string(bits_per_sample) +
                                     " bits above configured maximum");
        }

        const std::size_t header_position = cursor.bit_position();
        if (cursor.read_bits(1) != 0) {
            throw malformed_stream("Subframe padding bit set", header_position);
        }

        const auto type = static_cast<unsigned>(cursor.read_bits(6));

        subframe result;
        if (cursor.read_bits(1) != 0) {
            result.wasted_bits = cursor.read_unary() + 1;
        }
        if (result.wasted_bits >= bits_per_sample) {
            throw malformed_stream("Subframe has " + std::to_string(result.wasted_bits) +
                                   " wasted bits at depth " + std::to_string(bits_per_sample),
                                   header_position);
        }

        const unsigned bits = bits_per_sample - result.wasted_bits;

        if (type == type_constant) {
            result.data = constant_subframe{cursor.read_signed(bits)};
        } else if (type == type_verbatim) {
            verbatim_subframe verbatim;
            verbatim.samples.reserve(block_size);
            for (std::size_t i = 0; i < block_size; i++) {
                verbatim.samples.push_back(cursor.read_signed(bits));
            }
            result.data = std::move(verbatim);
        } else if (type >= type_fixed_first && type <= type_fixed_last) {
            fixed_subframe fixed;
            fixed.order = type - type_fixed_first;
            check_order(fixed.order, block_size, header_position);
            fixed.warmup = read_warmup(cursor, fixed.order, bits);
            fixed.residual_block = decode_residual(cursor, block_size, fixed.order);
            result.data = std::move(fixed);
        } else if (type >= type_lpc_first) {
            lpc_subframe lpc;
            lpc.order = (type & 31u) + 1;
            if (lpc.order > options.max_lpc_order) {
                throw unsupported_stream("LPC order " + std::to_string(lpc.order) +
                                         " above configured maximum of " +
                                         std::to_string(options.max_lpc_order));
            }
            check_order(lpc.order, block_size, header_position);
            lpc.warmup = read_warmup(cursor, lpc.order, bits);

            const std::size_t precision_position = cursor.bit_position();
            const auto precision = static_cast<unsigned>(cursor.read_bits(4));
            if (precision == reserved_lpc_precision) {
                throw malformed_stream("Reserved LPC coefficient precision", precision_position);
            }
            lpc.precision = precision + 1;

            const std::size_t shift_position = cursor.bit_position();
            lpc.shift = static_cast<int>(cursor.read_signed(5));
            if (lpc.shift < 0) {
                throw malformed_stream("Negative LPC shift " + std::to_string(lpc.shift),
                                       shift_position);
            }

            // coefficient 0 applies to the newest sample
            lpc.coefficients.reserve(lpc.order);
            for (unsigned j = 0; j < lpc.order; j++) {
                lpc.coefficients.push_back(static_cast<int32_t>(cursor.read_signed(lpc.precision)));
            }

            lpc.residual_block = decode_residual(cursor, block_size, lpc.order);
            result.data = std::move(lpc);
        } else {
            throw malformed_stream("Reserved subframe type " + std::to_string(type), header_position);
        }

        return result;
    }

    std::vector<int64_t> reconstruct_subframe(const subframe& sub, std::size_t block_size) {
        std::vector<int64_t> samples = std::visit(reconstruct_visitor{block_size}, sub.data);

        if (sub.wasted_bits > 0) {
            for (auto& s : samples) {
                s = static_cast<int64_t>(static_cast<uint64_t>(s) << sub.wasted_bits);
            }
        }
        return samples;
    }

    std::vector<int64_t> decode_subframe(bit_cursor& cursor, std::size_t block_size,
                                         unsigned bits_per_sample, const decoder_options& options) {
        return reconstruct_subframe(parse_subframe(cursor, block_size, bits_per_sample, options),
                                    block_size);
    }

} // namespace flacdec
