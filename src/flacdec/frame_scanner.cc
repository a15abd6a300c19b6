#include <flacdec/frame_scanner.hh>
#include <flacdec/bit_cursor.hh>
#include <flacdec/error.hh>

namespace flacdec {

    uint64_t next_frame_number(const frame_header& header) {
        if (header.blocking == blocking_strategy::fixed) {
            return header.number + 1;
        }
        return header.number + header.block_size;
    }

    frame_scanner::frame_scanner(const frame_decoder& decoder)
        : m_decoder(decoder) {}

    std::optional<frame_location> frame_scanner::find_next(const uint8_t* data, std::size_t size,
                                                           std::size_t from) const {
        if (size < 2) {
            return std::nullopt;
        }

        bit_cursor cursor(data, size);
        for (std::size_t offset = from; offset + 1 < size; offset++) {
            // 14 sync bits, reserved zero bit, any blocking bit
            if (data[offset] != 0xFF || (data[offset + 1] & 0xFE) != 0xF8) {
                continue;
            }

            cursor.seek(offset);
            try {
                frame_location location;
                location.header = m_decoder.parse_header(cursor);
                location.offset = offset;
                return location;
            } catch (const malformed_stream&) {
                // chance sync pattern, keep looking
            } catch (const unsupported_stream&) {
            } catch (const out_of_data&) {
            }
        }
        return std::nullopt;
    }

    std::vector<frame_location> frame_scanner::locate_all(const uint8_t* data, std::size_t size,
                                                          std::size_t from) const {
        std::vector<frame_location> frames;

        std::optional<frame_location> candidate = find_next(data, size, from);
        while (candidate) {
            std::optional<frame_location> following = find_next(data, size, candidate->offset + 1);

            bool keep = frames.empty();
            if (!keep) {
                keep = candidate->header.number == next_frame_number(frames.back().header);
            }
            if (!keep && following) {
                keep = following->header.number == next_frame_number(candidate->header);
            }

            if (keep) {
                frames.push_back(*candidate);
            }
            candidate = std::move(following);
        }
        return frames;
    }

} // namespace flacdec
