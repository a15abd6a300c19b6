#include <flacdec/crc.hh>
#include <array>

namespace flacdec {

    namespace {
        constexpr std::array<uint8_t, 256> make_crc8_table() {
            std::array<uint8_t, 256> table{};
            for (unsigned i = 0; i < 256; i++) {
                unsigned crc = i;
                for (int bit = 0; bit < 8; bit++) {
                    crc = (crc & 0x80) ? ((crc << 1) ^ 0x07) : (crc << 1);
                }
                table[i] = static_cast<uint8_t>(crc & 0xFF);
            }
            return table;
        }

        constexpr std::array<uint16_t, 256> make_crc16_table() {
            std::array<uint16_t, 256> table{};
            for (unsigned i = 0; i < 256; i++) {
                unsigned crc = i << 8;
                for (int bit = 0; bit < 8; bit++) {
                    crc = (crc & 0x8000) ? ((crc << 1) ^ 0x8005) : (crc << 1);
                }
                table[i] = static_cast<uint16_t>(crc & 0xFFFF);
            }
            return table;
        }

        constexpr auto crc8_table = make_crc8_table();
        constexpr auto crc16_table = make_crc16_table();
    }

    uint8_t crc8_update(uint8_t crc, const uint8_t* data, std::size_t size) {
        for (std::size_t i = 0; i < size; i++) {
            crc = crc8_table[crc ^ data[i]];
        }
        return crc;
    }

    uint16_t crc16_update(uint16_t crc, const uint8_t* data, std::size_t size) {
        for (std::size_t i = 0; i < size; i++) {
            crc = static_cast<uint16_t>((crc << 8) ^ crc16_table[(crc >> 8) ^ data[i]]);
        }
        return crc;
    }

} // namespace flacdec
