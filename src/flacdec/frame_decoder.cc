// This is copyrighted software. More information is at the end of this file.
#include <flacdec/frame_decoder.hh>
#include <flacdec/bit_cursor.hh>
#include <flacdec/subframe.hh>
#include <flacdec/error.hh>

#include <failsafe/failsafe.hh>

#include <stdexcept>

namespace flacdec {

namespace {
    constexpr uint64_t frame_sync_code = 0x3FFE;
    constexpr uint64_t max_frame_number = (uint64_t{1} << 31) - 1;

    constexpr sample_rate_t sample_rate_table[] = {
        0, 88200, 176400, 192000, 8000, 16000, 22050, 24000,
        32000, 44100, 48000, 96000
    };

    constexpr unsigned bits_per_sample_table[] = {
        0, 8, 12, 0, 16, 20, 24, 32
    };

    // UTF-8 style variable length number, 1 to 7 bytes
    uint64_t read_coded_number(bit_cursor& cursor) {
        const std::size_t position = cursor.bit_position();
        const auto first = static_cast<uint8_t>(cursor.read_bits(8));

        if ((first & 0x80) == 0) {
            return first;
        }

        unsigned length = 0;
        for (uint8_t mask = 0x80; mask != 0 && (first & mask) != 0; mask >>= 1) {
            length++;
        }
        if (length < 2 || length > 7) {
            throw malformed_stream("Invalid coded frame number", position);
        }

        uint64_t value = first & (0x7Fu >> length);
        for (unsigned i = 1; i < length; i++) {
            const auto next = static_cast<uint8_t>(cursor.read_bits(8));
            if ((next & 0xC0) != 0x80) {
                throw malformed_stream("Invalid coded frame number continuation byte", position);
            }
            value = (value << 6) | (next & 0x3F);
        }
        return value;
    }

    uint32_t block_size_from_code(unsigned code) {
        if (code == 1) {
            return 192;
        }
        if (code >= 2 && code <= 5) {
            return 576u << (code - 2);
        }
        if (code >= 8) {
            return 256u << (code - 8);
        }
        // 6 and 7 are read from the header tail, 0 is reserved
        return 0;
    }

    void check_sample_range(int64_t value, unsigned bits_per_sample) {
        const int64_t high = (int64_t{1} << (bits_per_sample - 1)) - 1;
        const int64_t low = -(int64_t{1} << (bits_per_sample - 1));
        if (value > high || value < low) {
            throw malformed_stream("Decoded sample " + std::to_string(value) + " exceeds " +
                                   std::to_string(bits_per_sample) + " bits");
        }
    }
}

frame_decoder::frame_decoder(const decoder_options& options)
    : m_options(options) {}

frame_decoder::frame_decoder(const stream_info& info, const decoder_options& options)
    : m_info(info),
      m_options(options) {}

frame_header frame_decoder::parse_header(bit_cursor& cursor) const {
    if (!cursor.is_byte_aligned()) {
        throw std::invalid_argument("Frame header must start on a byte boundary");
    }

    const std::size_t frame_start = cursor.byte_position();
    try {
        return read_header(cursor);
    } catch (const flacdec_error&) {
        cursor.seek(frame_start);
        throw;
    }
}

frame_header frame_decoder::read_header(bit_cursor& cursor) const {
    cursor.reset_crc();
    const std::size_t start = cursor.bit_position();

    if (cursor.read_bits(14) != frame_sync_code) {
        throw lost_sync("Frame sync code not found", start);
    }
    if (cursor.read_bits(1) != 0) {
        throw malformed_stream("Reserved bit after frame sync set", start + 14);
    }

    frame_header header;
    header.blocking = cursor.read_bits(1) ? blocking_strategy::variable : blocking_strategy::fixed;

    const auto block_size_code = static_cast<unsigned>(cursor.read_bits(4));
    const auto sample_rate_code = static_cast<unsigned>(cursor.read_bits(4));
    const auto channel_code = static_cast<unsigned>(cursor.read_bits(4));
    const auto bits_code = static_cast<unsigned>(cursor.read_bits(3));
    cursor.read_bits(1); // reserved, ignored

    if (block_size_code == 0) {
        throw malformed_stream("Reserved block size code", start + 16);
    }
    if (sample_rate_code == 15) {
        throw malformed_stream("Invalid sample rate code", start + 20);
    }

    if (channel_code < 8) {
        header.assignment = channel_assignment::independent;
        header.channels = channel_code + 1;
    } else if (channel_code == 8) {
        header.assignment = channel_assignment::left_side;
        header.channels = 2;
    } else if (channel_code == 9) {
        header.assignment = channel_assignment::right_side;
        header.channels = 2;
    } else if (channel_code == 10) {
        header.assignment = channel_assignment::mid_side;
        header.channels = 2;
    } else {
        throw malformed_stream("Reserved channel assignment " + std::to_string(channel_code), start + 24);
    }

    if (bits_code == 3) {
        throw malformed_stream("Reserved bit depth code", start + 28);
    }

    const std::size_t number_position = cursor.bit_position();
    header.number = read_coded_number(cursor);
    if (header.blocking == blocking_strategy::fixed && header.number > max_frame_number) {
        throw malformed_stream("Frame number " + std::to_string(header.number) + " out of range",
                               number_position);
    }

    if (block_size_code == 6) {
        header.block_size = static_cast<uint32_t>(cursor.read_bits(8)) + 1;
    } else if (block_size_code == 7) {
        header.block_size = static_cast<uint32_t>(cursor.read_bits(16)) + 1;
    } else {
        header.block_size = block_size_from_code(block_size_code);
    }

    if (sample_rate_code == 0) {
        header.sample_rate = m_info ? m_info->sample_rate : 0;
    } else if (sample_rate_code < 12) {
        header.sample_rate = sample_rate_table[sample_rate_code];
    } else if (sample_rate_code == 12) {
        header.sample_rate = static_cast<sample_rate_t>(cursor.read_bits(8)) * 1000;
    } else if (sample_rate_code == 13) {
        header.sample_rate = static_cast<sample_rate_t>(cursor.read_bits(16));
    } else {
        header.sample_rate = static_cast<sample_rate_t>(cursor.read_bits(16)) * 10;
    }

    const std::size_t crc_position = cursor.bit_position();
    const uint8_t computed = cursor.crc8();
    header.crc8 = static_cast<uint8_t>(cursor.read_bits(8));
    if (header.crc8 != computed) {
        throw malformed_stream("Frame header CRC-8 mismatch", crc_position);
    }

    if (bits_code == 0) {
        if (!m_info) {
            throw malformed_stream("Frame inherits bit depth but no STREAMINFO is known", start + 28);
        }
        header.bits_per_sample = m_info->bits_per_sample;
    } else {
        header.bits_per_sample = bits_per_sample_table[bits_code];
    }

    if (header.bits_per_sample > m_options.max_bits_per_sample) {
        throw unsupported_stream("Bit depth of " + std::to_string(header.bits_per_sample) +
                                 " above configured maximum");
    }
    if (header.block_size > m_options.max_block_size) {
        throw unsupported_stream("Block size of " + std::to_string(header.block_size) +
                                 " above configured maximum");
    }

    if (m_info && m_options.check_stream_info) {
        if (header.channels != m_info->channels) {
            throw malformed_stream("Frame has " + std::to_string(header.channels) +
                                   " channels, stream has " + std::to_string(m_info->channels), start);
        }
        if (bits_code != 0 && header.bits_per_sample != m_info->bits_per_sample) {
            throw malformed_stream("Frame bit depth " + std::to_string(header.bits_per_sample) +
                                   " differs from stream bit depth " +
                                   std::to_string(m_info->bits_per_sample), start);
        }
        if (m_info->max_block_size != 0 && header.block_size > m_info->max_block_size) {
            throw malformed_stream("Frame block size " + std::to_string(header.block_size) +
                                   " above stream maximum " + std::to_string(m_info->max_block_size),
                                   start);
        }
    }

    return header;
}

decoded_frame frame_decoder::decode(bit_cursor& cursor) const {
    if (!cursor.is_byte_aligned()) {
        throw std::invalid_argument("Frame must start on a byte boundary");
    }

    const std::size_t frame_start = cursor.byte_position();
    try {
        decoded_frame frame;
        frame.header = read_header(cursor);
        const auto& header = frame.header;

        std::vector<std::vector<int64_t>> channels;
        channels.reserve(header.channels);
        for (unsigned ch = 0; ch < header.channels; ch++) {
            const unsigned bits = subframe_bits_per_sample(header.assignment, ch, header.bits_per_sample);
            channels.push_back(decode_subframe(cursor, header.block_size, bits, m_options));
        }

        cursor.byte_align();
        const uint16_t computed = cursor.crc16();
        frame.crc16 = static_cast<uint16_t>(cursor.read_bits(16));
        frame.verified = (frame.crc16 == computed);

        if (!frame.verified) {
            if (m_options.on_crc_mismatch == crc_policy::strict) {
                throw integrity_error(frame.crc16, computed);
            }
            LOG_WARN("flac", "CRC-16 mismatch in frame", header.number, "- delivering unverified samples");
        }

        decorrelate(header.assignment, channels);

        frame.channels.resize(channels.size());
        for (std::size_t ch = 0; ch < channels.size(); ch++) {
            auto& out = frame.channels[ch];
            out.reserve(channels[ch].size());
            for (const int64_t value : channels[ch]) {
                check_sample_range(value, header.bits_per_sample);
                out.push_back(static_cast<sample_t>(value));
            }
        }

        return frame;
    } catch (const flacdec_error&) {
        cursor.seek(frame_start);
        throw;
    }
}

} // namespace flacdec

/*
 * Copyright (C) 2025
 *
 * This file is part of flacdec.
 *
 * flacdec is free software: you can redistribute it and/or modify it under the
 * terms of the GNU Lesser General Public License as published by the Free
 * Software Foundation, either version 3 of the License, or (at your option) any
 * later version.
 *
 * flacdec is distributed in the hope that it will be useful, but WITHOUT ANY
 * WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR
 * A PARTICULAR PURPOSE.  See the GNU Lesser General Public License for more
 * details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with flacdec.  If not, see <http://www.gnu.org/licenses/>.
 */
