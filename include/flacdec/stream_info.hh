#pragma once

#include <flacdec/sdk/types.hh>
#include <array>
#include <cstdint>

namespace flacdec {
    /**
     * @struct stream_info
     * @brief Contents of the STREAMINFO metadata block
     *
     * Zero in min/max_frame_size and total_samples means "unknown".
     */
    struct stream_info {
        uint32_t min_block_size = 0;
        uint32_t max_block_size = 0;
        uint32_t min_frame_size = 0;
        uint32_t max_frame_size = 0;
        sample_rate_t sample_rate = 0;
        channels_t channels = 0;
        unsigned bits_per_sample = 0;
        uint64_t total_samples = 0;
        std::array<uint8_t, 16> md5{}; ///< MD5 of the unencoded audio, not verified
    };
}
