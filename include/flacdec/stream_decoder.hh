// This is copyrighted software. More information is at the end of this file.
#pragma once

#include <flacdec/export_flacdec.h>
#include <flacdec/decoder_options.hh>
#include <flacdec/frame.hh>
#include <flacdec/metadata_reader.hh>
#include <flacdec/stream_info.hh>

#include <chrono>
#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <vector>

namespace flacdec {

class io_stream;

/**
 * @class stream_decoder
 * @brief Pull-based decoder over a FLAC byte source
 * @ingroup decoding
 *
 * Reads the stream marker and metadata on open(), then hands out one
 * decoded frame per next_frame() call. The decoder does not own the byte
 * source; it must outlive the decoder or the next open().
 *
 * Errors are never recovered silently. A failed next_frame() leaves the
 * read position at the start of the failing frame; call resync() to skip
 * to the next valid frame header, or stop.
 *
 * ## Usage
 *
 * @code
 * auto io = io_from_file("song.flac");
 * stream_decoder decoder;
 * decoder.open(io.get());
 *
 * for (const decoded_frame& frame : decoder) {
 *     write_pcm(frame.interleaved());
 * }
 * @endcode
 *
 * @see frame_decoder, decoder_options
 */
class FLACDEC_EXPORT stream_decoder {
public:
    class FLACDEC_EXPORT iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = decoded_frame;
        using difference_type = std::ptrdiff_t;
        using pointer = const decoded_frame*;
        using reference = const decoded_frame&;

        iterator() = default;
        explicit iterator(stream_decoder* decoder);

        reference operator*() const { return *m_current; }
        pointer operator->() const { return &*m_current; }
        iterator& operator++();

        bool operator==(const iterator& other) const;
        bool operator!=(const iterator& other) const { return !(*this == other); }

    private:
        stream_decoder* m_decoder = nullptr;
        std::optional<decoded_frame> m_current;
    };

    explicit stream_decoder(const decoder_options& options = {});
    ~stream_decoder();

    stream_decoder(const stream_decoder&) = delete;
    stream_decoder& operator=(const stream_decoder&) = delete;

    /**
     * @brief Read metadata and prepare to decode frames
     * @param stream Byte source positioned on the fLaC marker
     * @throws std::runtime_error if @p stream is null
     * @throws malformed_stream if the metadata is invalid
     */
    void open(io_stream* stream);

    [[nodiscard]] bool is_open() const;

    /// STREAMINFO of the open stream
    [[nodiscard]] const stream_info& info() const;

    /// Every metadata block, STREAMINFO first
    [[nodiscard]] const std::vector<metadata_block>& metadata_blocks() const;

    /**
     * @brief Decode the next frame
     *
     * @return std::nullopt at the end of the stream, or once total_samples
     *         samples have been delivered when STREAMINFO knows the total
     * @throws flacdec_error subclasses as frame_decoder::decode() does
     */
    std::optional<decoded_frame> next_frame();

    /**
     * @brief Decode every remaining frame into @p out
     *
     * Frames decoded before an error stay in @p out; the error is rethrown.
     *
     * @return Number of frames appended
     */
    std::size_t decode_all(std::vector<decoded_frame>& out);

    /**
     * @brief Skip to the next valid frame header
     *
     * After a failed next_frame() the search starts one byte past the
     * failing frame.
     *
     * @return false if no further frame header exists
     */
    bool resync();

    /**
     * @brief Restart decoding from the first frame
     * @throws io_error if the byte source cannot seek
     */
    void reset();

    [[nodiscard]] uint64_t samples_decoded() const;
    [[nodiscard]] uint64_t frames_decoded() const;

    /// Stream length from STREAMINFO, zero if unknown
    [[nodiscard]] std::chrono::microseconds duration() const;

    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

private:
    struct impl;
    const std::unique_ptr<impl> m_pimpl;
};

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
