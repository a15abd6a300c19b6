/**
 * @file metadata_reader.hh
 * @brief Stream marker, metadata block headers and STREAMINFO
 * @ingroup decoding
 */

#ifndef FLACDEC_METADATA_READER_HH
#define FLACDEC_METADATA_READER_HH

#include <flacdec/export_flacdec.h>
#include <flacdec/stream_info.hh>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace flacdec {

    class io_stream;

    enum class metadata_type : uint8_t {
        stream_info = 0,
        padding = 1,
        application = 2,
        seek_table = 3,
        vorbis_comment = 4,
        cue_sheet = 5,
        picture = 6
    };

    /// Bytes in a STREAMINFO block
    inline constexpr std::size_t stream_info_size = 34;

    /**
     * @struct metadata_block
     * @brief Location of one metadata block
     *
     * Only STREAMINFO is interpreted. Other blocks are recorded so callers
     * can read them from the byte source themselves.
     */
    struct metadata_block {
        uint8_t type = 0;        ///< Raw 7-bit block type, see metadata_type
        bool is_last = false;
        int64_t offset = 0;      ///< Byte offset of the block payload
        uint32_t length = 0;     ///< Payload length in bytes
    };

    /**
     * @struct stream_metadata
     * @brief Everything in front of the first frame
     */
    struct stream_metadata {
        stream_info info;
        std::vector<metadata_block> blocks;
        int64_t first_frame_offset = 0;
    };

    /**
     * @brief Decode a STREAMINFO payload
     * @throws malformed_stream if @p size is too small or a field is invalid
     */
    FLACDEC_EXPORT stream_info parse_stream_info(const uint8_t* data, std::size_t size);

    /**
     * @brief Read the stream marker and all metadata block headers
     *
     * Leaves @p stream positioned on the first frame.
     *
     * @throws malformed_stream if the marker is missing, STREAMINFO is not
     *         the first block, a block type is invalid or the metadata is cut short
     * @throws io_error if the stream cannot seek
     */
    FLACDEC_EXPORT stream_metadata read_metadata(io_stream* stream);

    /// Human readable block type
    FLACDEC_EXPORT const char* metadata_type_name(uint8_t type);

} // namespace flacdec

#endif // FLACDEC_METADATA_READER_HH
