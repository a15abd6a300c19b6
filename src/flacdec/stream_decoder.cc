// This is copyrighted software. More information is at the end of this file.
#include <flacdec/stream_decoder.hh>
#include <flacdec/bit_cursor.hh>
#include <flacdec/frame_decoder.hh>
#include <flacdec/frame_scanner.hh>
#include <flacdec/error.hh>
#include <flacdec/sdk/io_stream.hh>

#include <failsafe/failsafe.hh>

#include <algorithm>

namespace flacdec {
    namespace {
        // sync through CRC-8 with the longest coded number and both extensions
        constexpr std::size_t max_frame_header_size = 16;

        // Every bit from bit_position to the end of the buffer is zero
        bool only_zero_bits_after(const uint8_t* data, std::size_t size, std::size_t bit_position) {
            std::size_t byte = bit_position >> 3;
            if (byte >= size) {
                return true;
            }
            if ((data[byte] & (0xFFu >> (bit_position & 7))) != 0) {
                return false;
            }
            for (byte++; byte < size; byte++) {
                if (data[byte] != 0) {
                    return false;
                }
            }
            return true;
        }

        // Bytes a verbatim frame of the given block size occupies
        std::size_t verbatim_frame_bound(const stream_info& info, std::size_t block) {
            const std::size_t subframe = 5 + (block * (info.bits_per_sample + 1) + 7) / 8;
            return max_frame_header_size + info.channels * subframe + 2;
        }
    }

    struct stream_decoder::impl {
        explicit impl(const decoder_options& opts)
            : options(opts) {}

        decoder_options options;
        io_stream* stream = nullptr;
        bool is_open = false;

        stream_metadata metadata;
        std::optional<frame_decoder> frames;

        // buffered frame data; window[0] is at stream offset window_origin
        std::vector<uint8_t> window;
        std::size_t position = 0;
        int64_t window_origin = 0;
        std::size_t target = 0;
        std::size_t initial_target = 0;
        std::size_t max_window = 0;
        bool source_exhausted = false;

        bool after_failure = false;
        std::optional<uint64_t> expected_number;

        uint64_t samples = 0;
        uint64_t frame_count = 0;

        [[nodiscard]] std::size_t available() const {
            return window.size() - position;
        }

        // drops consumed bytes once they make up half of the buffer
        void compact() {
            if (position == 0 || position < window.size() / 2) {
                return;
            }
            window.erase(window.begin(), window.begin() + static_cast<std::ptrdiff_t>(position));
            window_origin += static_cast<int64_t>(position);
            position = 0;
        }

        // Makes at least target bytes available unless the source runs dry
        void fill() {
            compact();
            const std::size_t chunk = std::max<std::size_t>(options.read_chunk_size, 1);
            while (available() < target && !source_exhausted) {
                const std::size_t old_size = window.size();
                window.resize(old_size + chunk);
                const std::size_t got = stream->read(window.data() + old_size, chunk);
                window.resize(old_size + got);
                if (got == 0) {
                    source_exhausted = true;
                }
            }
        }

        void rewind_to_first_frame() {
            if (stream->seek(metadata.first_frame_offset, seek_origin::set) < 0) {
                throw io_error("Failed to seek to first frame");
            }
            clear_state();
        }

        void clear_state() {
            window.clear();
            position = 0;
            window_origin = metadata.first_frame_offset;
            target = initial_target;
            source_exhausted = false;
            after_failure = false;
            expected_number.reset();
            samples = 0;
            frame_count = 0;
        }

        void check_open() const {
            if (!is_open) {
                THROW_RUNTIME("Decoder is not open");
            }
        }
    };

    stream_decoder::stream_decoder(const decoder_options& options)
        : m_pimpl(std::make_unique<impl>(options)) {
    }

    stream_decoder::~stream_decoder() = default;

    void stream_decoder::open(io_stream* stream) {
        if (!stream) {
            THROW_RUNTIME("Null stream passed to stream_decoder::open");
        }

        m_pimpl->is_open = false;
        m_pimpl->stream = stream;
        m_pimpl->metadata = read_metadata(stream);

        const stream_info& info = m_pimpl->metadata.info;
        m_pimpl->frames.emplace(info, m_pimpl->options);

        const std::size_t largest_block = info.max_block_size ? info.max_block_size : max_block_size;
        m_pimpl->initial_target = std::max({static_cast<std::size_t>(info.max_frame_size),
                                            verbatim_frame_bound(info, largest_block),
                                            m_pimpl->options.read_chunk_size});
        m_pimpl->max_window = std::max(m_pimpl->initial_target,
                                       verbatim_frame_bound(info, m_pimpl->options.max_block_size));
        m_pimpl->clear_state();
        m_pimpl->is_open = true;

        LOG_INFO("flac", "Opened stream:", info.sample_rate, "Hz,", static_cast<unsigned>(info.channels),
                 "channels,", info.bits_per_sample, "bits,", info.total_samples, "samples,",
                 m_pimpl->metadata.blocks.size(), "metadata blocks");
    }

    bool stream_decoder::is_open() const {
        return m_pimpl->is_open;
    }

    const stream_info& stream_decoder::info() const {
        m_pimpl->check_open();
        return m_pimpl->metadata.info;
    }

    const std::vector<metadata_block>& stream_decoder::metadata_blocks() const {
        m_pimpl->check_open();
        return m_pimpl->metadata.blocks;
    }

    std::optional<decoded_frame> stream_decoder::next_frame() {
        m_pimpl->check_open();
        auto& d = *m_pimpl;

        const uint64_t total = d.metadata.info.total_samples;
        if (total != 0 && d.samples >= total) {
            return std::nullopt;
        }

        while (true) {
            d.fill();
            if (d.available() == 0) {
                return std::nullopt;
            }

            bit_cursor cursor(d.window.data() + d.position, d.available());
            try {
                decoded_frame frame = d.frames->decode(cursor);

                d.position += cursor.byte_position();
                d.after_failure = false;

                const frame_header& header = frame.header;
                if (d.expected_number && header.number != *d.expected_number) {
                    LOG_WARN("flac", "Frame number discontinuity: expected", *d.expected_number,
                             "got", header.number);
                }
                d.expected_number = next_frame_number(header);
                d.samples += header.block_size;
                d.frame_count++;
                return frame;
            } catch (const out_of_data&) {
                if (d.source_exhausted) {
                    d.after_failure = true;
                    throw;
                }
                // frame straddles the window edge
                d.target = std::max(d.target * 2, d.available() + 1);
            } catch (const lost_sync&) {
                d.after_failure = true;
                throw;
            } catch (const malformed_stream& e) {
                // a Rice quotient cut off by the window edge reads as an unterminated code
                const bool cut_off = e.bit_position() != malformed_stream::unknown_position &&
                                     only_zero_bits_after(d.window.data() + d.position, d.available(),
                                                          e.bit_position());
                if (!cut_off || d.source_exhausted || d.available() >= d.max_window) {
                    d.after_failure = true;
                    throw;
                }
                d.target = std::max(d.target * 2, d.available() + 1);
            } catch (const flacdec_error&) {
                d.after_failure = true;
                throw;
            }
        }
    }

    std::size_t stream_decoder::decode_all(std::vector<decoded_frame>& out) {
        std::size_t count = 0;
        try {
            while (auto frame = next_frame()) {
                out.push_back(std::move(*frame));
                count++;
            }
        } catch (const flacdec_error& e) {
            LOG_ERROR("flac", "Decoding stopped after", count, "frames:", e.what());
            throw;
        }
        return count;
    }

    bool stream_decoder::resync() {
        m_pimpl->check_open();
        auto& d = *m_pimpl;

        const frame_scanner scanner(*d.frames);
        const int64_t failed_at = d.window_origin + static_cast<int64_t>(d.position);
        std::size_t start = d.after_failure ? 1 : 0;

        d.target = d.initial_target;
        while (true) {
            d.fill();
            const std::size_t avail = d.available();

            if (auto location = scanner.find_next(d.window.data() + d.position, avail, start)) {
                d.position += location->offset;
                const int64_t skipped = d.window_origin + static_cast<int64_t>(d.position) - failed_at;
                LOG_WARN("flac", "Resynchronized at frame", location->header.number, "after skipping",
                         skipped, "bytes");
                d.after_failure = false;
                d.expected_number.reset();
                return true;
            }

            if (d.source_exhausted) {
                d.position = d.window.size();
                d.after_failure = false;
                LOG_WARN("flac", "No frame header found after byte offset", failed_at);
                return false;
            }

            // keep a possible truncated header at the tail
            if (avail > max_frame_header_size) {
                d.position += avail - max_frame_header_size;
                start = 0;
            } else {
                d.target = std::max(d.target * 2, avail + 1);
            }
        }
    }

    void stream_decoder::reset() {
        m_pimpl->check_open();
        m_pimpl->rewind_to_first_frame();
    }

    uint64_t stream_decoder::samples_decoded() const {
        return m_pimpl->samples;
    }

    uint64_t stream_decoder::frames_decoded() const {
        return m_pimpl->frame_count;
    }

    std::chrono::microseconds stream_decoder::duration() const {
        m_pimpl->check_open();
        const stream_info& info = m_pimpl->metadata.info;
        if (info.total_samples == 0 || info.sample_rate == 0) {
            return std::chrono::microseconds(0);
        }
        return std::chrono::microseconds(info.total_samples * 1000000 / info.sample_rate);
    }

    stream_decoder::iterator::iterator(stream_decoder* decoder)
        : m_decoder(decoder) {
        ++(*this);
    }

    stream_decoder::iterator& stream_decoder::iterator::operator++() {
        m_current = m_decoder->next_frame();
        if (!m_current) {
            m_decoder = nullptr;
        }
        return *this;
    }

    bool stream_decoder::iterator::operator==(const iterator& other) const {
        return m_decoder == other.m_decoder;
    }
}

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
