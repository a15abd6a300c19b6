/**
 * @file crc.hh
 * @brief CRC-8 and CRC-16 as used by FLAC frames
 */

#ifndef FLACDEC_CRC_HH
#define FLACDEC_CRC_HH

#include <flacdec/export_flacdec.h>
#include <cstddef>
#include <cstdint>

namespace flacdec {

    /**
     * @brief Frame header checksum
     *
     * Polynomial x^8 + x^2 + x + 1 (0x07), initial value 0, MSB first.
     * Covers every header byte from the sync code up to the CRC byte.
     */
    FLACDEC_EXPORT uint8_t crc8_update(uint8_t crc, const uint8_t* data, std::size_t size);

    /**
     * @brief Frame checksum
     *
     * Polynomial x^16 + x^15 + x^2 + 1 (0x8005), initial value 0, MSB first.
     * Covers the whole frame, header included, up to the footer.
     */
    FLACDEC_EXPORT uint16_t crc16_update(uint16_t crc, const uint8_t* data, std::size_t size);

    inline uint8_t crc8(const uint8_t* data, std::size_t size) {
        return crc8_update(0, data, size);
    }

    inline uint16_t crc16(const uint8_t* data, std::size_t size) {
        return crc16_update(0, data, size);
    }

} // namespace flacdec

#endif // FLACDEC_CRC_HH
