// This is copyrighted software. More information is at the end of this file.
#pragma once

#include <flacdec/export_flacdec.h>
#include <flacdec/decoder_options.hh>
#include <flacdec/frame.hh>
#include <flacdec/stream_info.hh>

#include <optional>

namespace flacdec {

class bit_cursor;

/**
 * @class frame_decoder
 * @brief Decodes one complete frame from a bit cursor
 * @ingroup decoding
 *
 * The decoder is stateless between frames, so independent instances can
 * decode disjoint frames of the same stream concurrently (see
 * frame_scanner for locating them).
 *
 * On success the cursor is left on the first byte after the frame footer.
 * On any flacdec_error the cursor is moved back to the first byte of the
 * frame before the exception propagates.
 *
 * @code
 * frame_decoder decoder(info);
 * bit_cursor cursor(data, size);
 * while (cursor.bits_remaining() > 0) {
 *     decoded_frame frame = decoder.decode(cursor);
 *     consume(frame.interleaved());
 * }
 * @endcode
 */
class FLACDEC_EXPORT frame_decoder {
public:
    /// Decoder for frames whose headers carry all parameters explicitly
    explicit frame_decoder(const decoder_options& options = {});

    /// Decoder validating frames against a stream's STREAMINFO
    explicit frame_decoder(const stream_info& info, const decoder_options& options = {});

    /**
     * @brief Parse and CRC-8 check a frame header
     *
     * Restarts the cursor's checksums at the header's first byte.
     *
     * @throws std::invalid_argument if the cursor is not byte aligned
     * @throws lost_sync if no sync code is at the cursor
     * @throws malformed_stream on reserved codes, an invalid coded number,
     *         a CRC-8 mismatch or a header disagreeing with STREAMINFO
     * @throws unsupported_stream if the header exceeds the configured limits
     * @throws out_of_data if the header is cut short
     */
    [[nodiscard]] frame_header parse_header(bit_cursor& cursor) const;

    /**
     * @brief Decode a whole frame
     *
     * @throws integrity_error on a CRC-16 mismatch under crc_policy::strict
     * @throws malformed_stream, unsupported_stream, out_of_data as for
     *         parse_header() and the subframe decoder
     */
    [[nodiscard]] decoded_frame decode(bit_cursor& cursor) const;

    [[nodiscard]] const decoder_options& options() const { return m_options; }
    [[nodiscard]] const std::optional<stream_info>& info() const { return m_info; }

private:
    frame_header read_header(bit_cursor& cursor) const;

    std::optional<stream_info> m_info;
    decoder_options m_options;
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
