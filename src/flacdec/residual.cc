#include <flacdec/residual.hh>
#include <flacdec/bit_cursor.hh>
#include <flacdec/error.hh>

namespace flacdec {

    residual decode_residual(bit_cursor& cursor, std::size_t block_size, unsigned predictor_order) {
        residual result;

        const std::size_t method_position = cursor.bit_position();
        const auto method = static_cast<unsigned>(cursor.read_bits(2));
        if (method > 1) {
            throw malformed_stream("Reserved residual coding method " + std::to_string(method),
                                   method_position);
        }
        result.method = static_cast<residual_coding>(method);

        const unsigned parameter_bits = (result.method == residual_coding::rice) ? 4 : 5;
        const unsigned escape_parameter = (1u << parameter_bits) - 1;

        const std::size_t order_position = cursor.bit_position();
        result.partition_order = static_cast<unsigned>(cursor.read_bits(4));

        const std::size_t partitions = std::size_t{1} << result.partition_order;
        if (block_size % partitions != 0) {
            throw malformed_stream("Block size " + std::to_string(block_size) +
                                   " not divisible into " + std::to_string(partitions) + " partitions",
                                   order_position);
        }

        const std::size_t partition_size = block_size >> result.partition_order;
        if (partition_size < predictor_order) {
            throw malformed_stream("Residual partition of " + std::to_string(partition_size) +
                                   " samples is shorter than predictor order " +
                                   std::to_string(predictor_order), order_position);
        }

        result.partitions.reserve(partitions);
        result.values.reserve(block_size - predictor_order);

        for (std::size_t p = 0; p < partitions; p++) {
            residual_partition partition;
            partition.count = (p == 0) ? partition_size - predictor_order : partition_size;
            partition.rice_parameter = static_cast<unsigned>(cursor.read_bits(parameter_bits));

            if (partition.rice_parameter == escape_parameter) {
                partition.escaped = true;
                partition.raw_bits = static_cast<unsigned>(cursor.read_bits(5));
                for (std::size_t i = 0; i < partition.count; i++) {
                    result.values.push_back(cursor.read_signed(partition.raw_bits));
                }
            } else {
                for (std::size_t i = 0; i < partition.count; i++) {
                    result.values.push_back(cursor.read_rice_signed(partition.rice_parameter));
                }
            }

            result.partitions.push_back(partition);
        }

        return result;
    }

} // namespace flacdec
