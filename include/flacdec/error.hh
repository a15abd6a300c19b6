// This is copyrighted software. More information is at the end of this file.
#pragma once

#include <flacdec/export_flacdec.h>

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace flacdec {

/**
 * @brief Base exception class for all flacdec errors
 *
 * All flacdec-specific exceptions derive from this class, making it easy
 * to catch all decoder errors with a single catch block.
 */
class FLACDEC_EXPORT flacdec_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief The input ended in the middle of a field
 *
 * Thrown by the bit cursor when a read asks for more bits than remain.
 * Always fatal for the current frame. The stream decoder uses it to
 * decide that more input has to be pulled from the byte source.
 */
class FLACDEC_EXPORT out_of_data : public flacdec_error {
public:
    out_of_data(const std::string& msg, std::size_t bit_position)
        : flacdec_error(msg + " at bit " + std::to_string(bit_position))
        , m_bit_position(bit_position) {}

    [[nodiscard]] std::size_t bit_position() const { return m_bit_position; }

private:
    std::size_t m_bit_position;
};

/**
 * @brief Structural violation of the bitstream
 *
 * Thrown when decoding meets something the format forbids, such as:
 * - Bad sync code or reserved header codes
 * - Header CRC-8 mismatch
 * - Reserved subframe types or residual coding methods
 * - Residual partitions shorter than the predictor order
 * - Negative LPC shift
 *
 * The decoder never guesses a recovery. The cursor is left at the start of
 * the offending frame so the caller can resynchronize.
 */
class FLACDEC_EXPORT malformed_stream : public flacdec_error {
public:
    static constexpr std::size_t unknown_position = static_cast<std::size_t>(-1);

    /// For checks made away from the bitstream, e.g. by the predictor functions
    explicit malformed_stream(const std::string& msg)
        : flacdec_error(msg)
        , m_bit_position(unknown_position) {}

    malformed_stream(const std::string& msg, std::size_t bit_position)
        : flacdec_error(msg + " at bit " + std::to_string(bit_position))
        , m_bit_position(bit_position) {}

    [[nodiscard]] std::size_t bit_position() const { return m_bit_position; }

private:
    std::size_t m_bit_position;
};

/**
 * @brief No frame sync code at the expected position
 *
 * A malformed_stream raised before any frame field could be read. Callers
 * scanning for the next frame treat it as "keep looking".
 */
class FLACDEC_EXPORT lost_sync : public malformed_stream {
public:
    using malformed_stream::malformed_stream;
};

/**
 * @brief Frame CRC-16 mismatch
 *
 * Only thrown when the decoder is configured with crc_policy::strict.
 * By default a mismatch is reported through decoded_frame::verified and
 * the samples are still delivered.
 */
class FLACDEC_EXPORT integrity_error : public flacdec_error {
public:
    integrity_error(uint16_t expected, uint16_t computed);

    [[nodiscard]] uint16_t expected() const { return m_expected; }
    [[nodiscard]] uint16_t computed() const { return m_computed; }

private:
    uint16_t m_expected;
    uint16_t m_computed;
};

/**
 * @brief Valid but unsupported encoding
 *
 * Thrown when a stream uses a feature beyond the configured limits, such as
 * an LPC order, bit depth or block size above decoder_options maxima.
 * Never used for malformed input.
 */
class FLACDEC_EXPORT unsupported_stream : public flacdec_error {
public:
    using flacdec_error::flacdec_error;
};

/**
 * @brief I/O stream related errors
 *
 * Thrown when the byte source fails, such as:
 * - Seek failures
 * - Stream closed unexpectedly
 */
class FLACDEC_EXPORT io_error : public flacdec_error {
public:
    using flacdec_error::flacdec_error;
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
