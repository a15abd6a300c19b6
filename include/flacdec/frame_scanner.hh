/**
 * @file frame_scanner.hh
 * @brief Locating frame boundaries in raw frame data
 * @ingroup decoding
 */

#ifndef FLACDEC_FRAME_SCANNER_HH
#define FLACDEC_FRAME_SCANNER_HH

#include <flacdec/export_flacdec.h>
#include <flacdec/frame_decoder.hh>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace flacdec {

    /**
     * @struct frame_location
     * @brief Byte offset of a frame and its parsed header
     */
    struct frame_location {
        std::size_t offset = 0;
        frame_header header;
    };

    /**
     * @class frame_scanner
     * @brief Finds frame headers by sync code and CRC-8
     * @ingroup decoding
     *
     * A candidate is any byte pair 0xFF 0xF8 or 0xFF 0xF9 whose header parses
     * and passes its CRC-8. Candidates the decoder rejects as malformed,
     * unsupported or truncated are skipped.
     *
     * locate_all() is the pre-pass for decoding frames on several
     * frame_decoder instances at once. The returned offsets are frame
     * starts; frame i ends where frame i + 1 begins.
     */
    class FLACDEC_EXPORT frame_scanner {
        public:
            explicit frame_scanner(const frame_decoder& decoder);

            /**
             * @brief First valid header at or after byte @p from
             * @return std::nullopt if none is found before the end of the data
             */
            [[nodiscard]] std::optional<frame_location> find_next(const uint8_t* data, std::size_t size,
                                                                  std::size_t from) const;

            /**
             * @brief Every frame header from byte @p from on
             *
             * After the first frame, a candidate is kept when its frame (or
             * sample) number continues the previous kept frame, or when the
             * next candidate continues it. This drops sync patterns that
             * occur by chance inside frame data.
             */
            [[nodiscard]] std::vector<frame_location> locate_all(const uint8_t* data, std::size_t size,
                                                                 std::size_t from = 0) const;

        private:
            frame_decoder m_decoder;
    };

    /// Frame or sample number the frame after @p header must carry
    FLACDEC_EXPORT uint64_t next_frame_number(const frame_header& header);

} // namespace flacdec

#endif // FLACDEC_FRAME_SCANNER_HH
