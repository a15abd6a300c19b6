#include <flacdec/bit_cursor.hh>
#include <flacdec/crc.hh>
#include <flacdec/error.hh>

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace flacdec {

    bit_cursor::bit_cursor(const uint8_t* data, std::size_t size_bytes)
        : m_data(data),
          m_size(data ? size_bytes : 0) {
    }

    uint64_t bit_cursor::read_bits(unsigned bits) {
        if (bits > 64) {
            throw std::invalid_argument("bit_cursor: field wider than 64 bits");
        }
        if (bits == 0) {
            return 0;
        }
        if (bits > bits_remaining()) {
            throw out_of_data("Need " + std::to_string(bits) + " bits, have " +
                              std::to_string(bits_remaining()), m_bit_position);
        }

        uint64_t value = 0;
        while (bits > 0) {
            const unsigned bit_offset = static_cast<unsigned>(m_bit_position & 7);
            const unsigned available = 8 - bit_offset;
            const unsigned take = std::min(available, bits);
            const unsigned byte = m_data[m_bit_position >> 3];
            const unsigned chunk = (byte >> (available - take)) & ((1u << take) - 1);

            value = (value << take) | chunk;
            m_bit_position += take;
            bits -= take;
        }
        return value;
    }

    int64_t bit_cursor::read_signed(unsigned bits) {
        if (bits == 0) {
            return 0;
        }
        uint64_t value = read_bits(bits);
        if (bits < 64 && ((value >> (bits - 1)) & 1)) {
            value |= ~uint64_t{0} << bits;
        }
        return static_cast<int64_t>(value);
    }

    uint32_t bit_cursor::read_unary() {
        const std::size_t start = m_bit_position;
        const std::size_t end = m_size * 8;
        uint64_t count = 0;

        while (m_bit_position < end) {
            const unsigned bit_offset = static_cast<unsigned>(m_bit_position & 7);
            unsigned byte = (m_data[m_bit_position >> 3] << bit_offset) & 0xFF;

            if (byte == 0) {
                count += 8 - bit_offset;
                m_bit_position += 8 - bit_offset;
                continue;
            }

            unsigned zeros = 0;
            while ((byte & 0x80) == 0) {
                byte <<= 1;
                zeros++;
            }
            count += zeros;
            m_bit_position += zeros + 1;

            if (count > std::numeric_limits<uint32_t>::max()) {
                throw malformed_stream("Unary code too long", start);
            }
            return static_cast<uint32_t>(count);
        }

        m_bit_position = start;
        throw malformed_stream("Unterminated unary code", start);
    }

    int64_t bit_cursor::read_rice_signed(unsigned parameter) {
        const std::size_t start = m_bit_position;
        const uint64_t quotient = read_unary();

        // the folded value has to fit 32 bits
        if (parameter >= 32 || (quotient >> (32 - parameter)) != 0) {
            throw malformed_stream("Rice-coded residual out of range", start);
        }

        const uint64_t folded = (quotient << parameter) | read_bits(parameter);
        return static_cast<int64_t>(folded >> 1) ^ -static_cast<int64_t>(folded & 1);
    }

    void bit_cursor::byte_align() {
        m_bit_position = (m_bit_position + 7) & ~static_cast<std::size_t>(7);
    }

    void bit_cursor::seek(std::size_t byte_offset) {
        m_bit_position = std::min(byte_offset, m_size) * 8;
        reset_crc();
    }

    uint8_t bit_cursor::crc8() const {
        update_crc();
        return m_crc8;
    }

    uint16_t bit_cursor::crc16() const {
        update_crc();
        return m_crc16;
    }

    void bit_cursor::reset_crc() {
        m_crc_position = m_bit_position >> 3;
        m_crc8 = 0;
        m_crc16 = 0;
    }

    void bit_cursor::update_crc() const {
        const std::size_t consumed = m_bit_position >> 3;
        if (consumed > m_crc_position) {
            const std::size_t count = consumed - m_crc_position;
            m_crc8 = crc8_update(m_crc8, m_data + m_crc_position, count);
            m_crc16 = crc16_update(m_crc16, m_data + m_crc_position, count);
            m_crc_position = consumed;
        }
    }

} // namespace flacdec
