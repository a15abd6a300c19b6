/**
 * @file bit_cursor.hh
 * @brief MSB-first bit reader with running frame checksums
 * @ingroup decoding
 */

#ifndef FLACDEC_BIT_CURSOR_HH
#define FLACDEC_BIT_CURSOR_HH

#include <flacdec/export_flacdec.h>
#include <cstddef>
#include <cstdint>

namespace flacdec {

    /**
     * @class bit_cursor
     * @brief Reads arbitrary-width fields from a byte buffer
     * @ingroup decoding
     *
     * Fields are extracted most-significant-bit first at any bit offset.
     * Alongside the position the cursor keeps a CRC-8 and a CRC-16 over every
     * byte fully consumed since the last reset_crc(), which is what the frame
     * header and frame footer checksums are computed over.
     *
     * The cursor does not own the buffer. It never moves backwards except
     * through seek().
     *
     * @code
     * bit_cursor cursor(data, size);
     * cursor.reset_crc();
     * auto sync = cursor.read_bits(14);
     * auto sample = cursor.read_signed(17);
     * auto quotient = cursor.read_unary();
     * @endcode
     */
    class FLACDEC_EXPORT bit_cursor {
        public:
            bit_cursor(const uint8_t* data, std::size_t size_bytes);

            /**
             * @brief Read an unsigned field
             * @param bits Field width, 0 to 64
             * @throws out_of_data if fewer than @p bits remain
             */
            uint64_t read_bits(unsigned bits);

            /**
             * @brief Read a two's complement field, sign-extended from bit bits-1
             * @param bits Field width, 0 to 64
             * @throws out_of_data if fewer than @p bits remain
             */
            int64_t read_signed(unsigned bits);

            /**
             * @brief Count zero bits up to and including the terminating one bit
             *
             * This is the unary code used for Rice quotients and the wasted
             * bits count.
             *
             * @return Number of zero bits before the terminator
             * @throws malformed_stream if the buffer ends before a one bit
             */
            uint32_t read_unary();

            /**
             * @brief Read one Rice-coded signed value
             *
             * Unary quotient, @p parameter bit remainder, then the zig-zag
             * fold back to a signed value.
             *
             * @throws malformed_stream if the coded value does not fit 32 bits
             */
            int64_t read_rice_signed(unsigned parameter);

            /**
             * @brief Skip to the next byte boundary
             */
            void byte_align();

            [[nodiscard]] bool is_byte_aligned() const {
                return (m_bit_position & 7) == 0;
            }

            /**
             * @brief Move to an absolute byte offset
             *
             * Also restarts CRC accumulation at that offset.
             */
            void seek(std::size_t byte_offset);

            [[nodiscard]] std::size_t bit_position() const { return m_bit_position; }
            /// Index of the byte holding the next unread bit
            [[nodiscard]] std::size_t byte_position() const { return m_bit_position >> 3; }
            [[nodiscard]] std::size_t bits_remaining() const { return m_size * 8 - m_bit_position; }
            [[nodiscard]] std::size_t size() const { return m_size; }
            [[nodiscard]] const uint8_t* data() const { return m_data; }

            /// CRC-8 over the bytes fully consumed since the last reset_crc()
            [[nodiscard]] uint8_t crc8() const;
            /// CRC-16 over the bytes fully consumed since the last reset_crc()
            [[nodiscard]] uint16_t crc16() const;
            void reset_crc();

        private:
            void update_crc() const;

            const uint8_t* m_data;
            std::size_t m_size;
            std::size_t m_bit_position = 0;

            // checksums are brought up to date lazily, on query
            mutable std::size_t m_crc_position = 0;
            mutable uint8_t m_crc8 = 0;
            mutable uint16_t m_crc16 = 0;
    };

} // namespace flacdec

#endif // FLACDEC_BIT_CURSOR_HH
