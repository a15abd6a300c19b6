//
// In-memory FLAC bitstream construction for tests
//

#pragma once

#include <flacdec/crc.hh>

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace flacdec_test {

    // MSB-first bit writer
    class bit_writer {
        public:
            void write_bits(uint64_t value, unsigned bits) {
                for (unsigned i = bits; i > 0; --i) {
                    write_bit(static_cast<unsigned>((value >> (i - 1)) & 1));
                }
            }

            void write_signed(int64_t value, unsigned bits) {
                const uint64_t mask = bits >= 64 ? ~uint64_t{0} : ((uint64_t{1} << bits) - 1);
                write_bits(static_cast<uint64_t>(value) & mask, bits);
            }

            // zeros followed by a terminating one
            void write_unary(uint32_t zeros) {
                for (uint32_t i = 0; i < zeros; i++) {
                    write_bit(0);
                }
                write_bit(1);
            }

            void write_rice(int64_t value, unsigned parameter) {
                const uint64_t folded = value >= 0 ? static_cast<uint64_t>(value) << 1
                                                   : (static_cast<uint64_t>(-value) << 1) - 1;
                write_unary(static_cast<uint32_t>(folded >> parameter));
                write_bits(folded & ((uint64_t{1} << parameter) - 1), parameter);
            }

            void align() {
                while (m_bit_count % 8 != 0) {
                    write_bit(0);
                }
            }

            void append(const bit_writer& other) {
                for (std::size_t i = 0; i < other.m_bit_count; i++) {
                    write_bit((other.m_bytes[i >> 3] >> (7 - (i & 7))) & 1);
                }
            }

            void write_bytes(const std::vector<uint8_t>& bytes) {
                for (auto b : bytes) {
                    write_bits(b, 8);
                }
            }

            [[nodiscard]] const std::vector<uint8_t>& bytes() const { return m_bytes; }
            [[nodiscard]] std::size_t bit_count() const { return m_bit_count; }

        private:
            void write_bit(unsigned bit) {
                if (m_bit_count % 8 == 0) {
                    m_bytes.push_back(0);
                }
                if (bit) {
                    m_bytes.back() |= static_cast<uint8_t>(0x80 >> (m_bit_count % 8));
                }
                m_bit_count++;
            }

            std::vector<uint8_t> m_bytes;
            std::size_t m_bit_count = 0;
    };

    // Subframe writers. bits is the depth the subframe is coded at.
    inline void write_subframe_header(bit_writer& w, unsigned type, unsigned wasted = 0) {
        w.write_bits(0, 1);
        w.write_bits(type, 6);
        if (wasted > 0) {
            w.write_bits(1, 1);
            w.write_unary(wasted - 1);
        } else {
            w.write_bits(0, 1);
        }
    }

    inline void write_constant(bit_writer& w, int64_t value, unsigned bits, unsigned wasted = 0) {
        write_subframe_header(w, 0, wasted);
        w.write_signed(value, bits - wasted);
    }

    inline void write_verbatim(bit_writer& w, const std::vector<int64_t>& samples, unsigned bits,
                               unsigned wasted = 0) {
        write_subframe_header(w, 1, wasted);
        for (auto s : samples) {
            w.write_signed(s, bits - wasted);
        }
    }

    // Single partition Rice residual, method 0
    inline void write_residual(bit_writer& w, const std::vector<int64_t>& residuals, unsigned parameter) {
        w.write_bits(0, 2);
        w.write_bits(0, 4);
        w.write_bits(parameter, 4);
        for (auto r : residuals) {
            w.write_rice(r, parameter);
        }
    }

    inline void write_fixed(bit_writer& w, unsigned order, const std::vector<int64_t>& warmup,
                            const std::vector<int64_t>& residuals, unsigned bits,
                            unsigned parameter = 4, unsigned wasted = 0) {
        write_subframe_header(w, 8 + order, wasted);
        for (auto s : warmup) {
            w.write_signed(s, bits - wasted);
        }
        write_residual(w, residuals, parameter);
    }

    // coefficients newest sample first, as stored
    inline void write_lpc(bit_writer& w, const std::vector<int32_t>& coefficients, unsigned precision,
                          int shift, const std::vector<int64_t>& warmup,
                          const std::vector<int64_t>& residuals, unsigned bits,
                          unsigned parameter = 4) {
        write_subframe_header(w, 32 + static_cast<unsigned>(coefficients.size()) - 1);
        for (auto s : warmup) {
            w.write_signed(s, bits);
        }
        w.write_bits(precision - 1, 4);
        w.write_signed(shift, 5);
        for (auto c : coefficients) {
            w.write_signed(c, precision);
        }
        write_residual(w, residuals, parameter);
    }

    inline void write_coded_number(bit_writer& w, uint64_t value) {
        if (value < 0x80) {
            w.write_bits(value, 8);
            return;
        }
        unsigned length = 2;
        while (length < 7 && value >= (uint64_t{1} << (5 * length + 1))) {
            length++;
        }
        const unsigned shift = 6 * (length - 1);
        const uint64_t lead = (0xFF00u >> length) & 0xFF;
        w.write_bits(lead | (value >> shift), 8);
        for (unsigned i = length - 1; i > 0; --i) {
            w.write_bits(0x80 | ((value >> (6 * (i - 1))) & 0x3F), 8);
        }
    }

    /**
     * Builds one frame: header with CRC-8, the subframe bits written to
     * body(), zero padding and the CRC-16 footer.
     */
    struct frame_builder {
        uint32_t block_size = 4;
        unsigned block_size_code = 0;   // 0 picks 6 or 7 from block_size
        unsigned channel_code = 0;      // 0-7 independent, 8 L/S, 9 R/S, 10 M/S
        unsigned bits_code = 4;         // 16 bits
        unsigned sample_rate_code = 9;  // 44.1 kHz
        uint32_t sample_rate_field = 0; // written for codes 12 to 14
        uint64_t number = 0;
        bool variable = false;

        bit_writer body;

        [[nodiscard]] std::vector<uint8_t> header_bytes() const {
            bit_writer w;
            w.write_bits(0x3FFE, 14);
            w.write_bits(0, 1);
            w.write_bits(variable ? 1 : 0, 1);
            unsigned size_code = block_size_code;
            if (size_code == 0) {
                size_code = block_size <= 256 ? 6 : 7;
            }
            w.write_bits(size_code, 4);
            w.write_bits(sample_rate_code, 4);
            w.write_bits(channel_code, 4);
            w.write_bits(bits_code, 3);
            w.write_bits(0, 1);
            write_coded_number(w, number);
            if (size_code == 6) {
                w.write_bits(block_size - 1, 8);
            } else if (size_code == 7) {
                w.write_bits(block_size - 1, 16);
            }
            if (sample_rate_code == 12) {
                w.write_bits(sample_rate_field, 8);
            } else if (sample_rate_code == 13 || sample_rate_code == 14) {
                w.write_bits(sample_rate_field, 16);
            }

            std::vector<uint8_t> bytes = w.bytes();
            bytes.push_back(flacdec::crc8(bytes.data(), bytes.size()));
            return bytes;
        }

        [[nodiscard]] std::vector<uint8_t> build() const {
            bit_writer w;
            w.write_bytes(header_bytes());
            w.append(body);
            w.align();

            std::vector<uint8_t> bytes = w.bytes();
            const uint16_t crc = flacdec::crc16(bytes.data(), bytes.size());
            bytes.push_back(static_cast<uint8_t>(crc >> 8));
            bytes.push_back(static_cast<uint8_t>(crc & 0xFF));
            return bytes;
        }
    };

    struct stream_info_fields {
        uint32_t min_block_size = 4;
        uint32_t max_block_size = 4;
        uint32_t min_frame_size = 0;
        uint32_t max_frame_size = 0;
        uint32_t sample_rate = 44100;
        unsigned channels = 2;
        unsigned bits_per_sample = 16;
        uint64_t total_samples = 0;
    };

    inline std::vector<uint8_t> stream_info_payload(const stream_info_fields& f) {
        bit_writer w;
        w.write_bits(f.min_block_size, 16);
        w.write_bits(f.max_block_size, 16);
        w.write_bits(f.min_frame_size, 24);
        w.write_bits(f.max_frame_size, 24);
        w.write_bits(f.sample_rate, 20);
        w.write_bits(f.channels - 1, 3);
        w.write_bits(f.bits_per_sample - 1, 5);
        w.write_bits(f.total_samples, 36);
        for (unsigned i = 0; i < 16; i++) {
            w.write_bits(i, 8);
        }
        return w.bytes();
    }

    // "fLaC", STREAMINFO, optional extra blocks (type, payload), then frames
    struct stream_builder {
        stream_info_fields info;
        std::vector<std::pair<uint8_t, std::vector<uint8_t>>> extra_blocks;
        std::vector<std::vector<uint8_t>> frames;

        [[nodiscard]] std::vector<uint8_t> build() const {
            std::vector<uint8_t> out = {'f', 'L', 'a', 'C'};

            auto add_block = [&out](uint8_t type, bool last, const std::vector<uint8_t>& payload) {
                out.push_back(static_cast<uint8_t>((last ? 0x80 : 0x00) | type));
                out.push_back(static_cast<uint8_t>(payload.size() >> 16));
                out.push_back(static_cast<uint8_t>(payload.size() >> 8));
                out.push_back(static_cast<uint8_t>(payload.size()));
                out.insert(out.end(), payload.begin(), payload.end());
            };

            add_block(0, extra_blocks.empty(), stream_info_payload(info));
            for (std::size_t i = 0; i < extra_blocks.size(); i++) {
                add_block(extra_blocks[i].first, i + 1 == extra_blocks.size(), extra_blocks[i].second);
            }
            for (const auto& f : frames) {
                out.insert(out.end(), f.begin(), f.end());
            }
            return out;
        }
    };

} // namespace flacdec_test
