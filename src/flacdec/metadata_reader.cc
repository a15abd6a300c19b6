#include <flacdec/metadata_reader.hh>
#include <flacdec/bit_cursor.hh>
#include <flacdec/error.hh>
#include <flacdec/sdk/io_stream.hh>

#include <failsafe/failsafe.hh>

#include <cstring>

namespace flacdec {

    namespace {
        constexpr uint8_t stream_marker[4] = {'f', 'L', 'a', 'C'};
        constexpr uint8_t invalid_block_type = 127;
    }

    stream_info parse_stream_info(const uint8_t* data, std::size_t size) {
        if (size < stream_info_size) {
            throw malformed_stream("STREAMINFO block of " + std::to_string(size) + " bytes is too short");
        }

        bit_cursor cursor(data, size);
        stream_info info;
        info.min_block_size = static_cast<uint32_t>(cursor.read_bits(16));
        info.max_block_size = static_cast<uint32_t>(cursor.read_bits(16));
        info.min_frame_size = static_cast<uint32_t>(cursor.read_bits(24));
        info.max_frame_size = static_cast<uint32_t>(cursor.read_bits(24));
        info.sample_rate = static_cast<sample_rate_t>(cursor.read_bits(20));
        info.channels = static_cast<channels_t>(cursor.read_bits(3) + 1);
        info.bits_per_sample = static_cast<unsigned>(cursor.read_bits(5) + 1);
        info.total_samples = cursor.read_bits(36);
        for (auto& b : info.md5) {
            b = static_cast<uint8_t>(cursor.read_bits(8));
        }

        if (info.sample_rate == 0) {
            throw malformed_stream("STREAMINFO sample rate is zero");
        }
        if (info.bits_per_sample < 4) {
            throw malformed_stream("STREAMINFO bit depth " + std::to_string(info.bits_per_sample) +
                                   " below 4");
        }
        if (info.max_block_size < info.min_block_size) {
            throw malformed_stream("STREAMINFO maximum block size below minimum");
        }
        if (info.max_frame_size != 0 && info.max_frame_size < info.min_frame_size) {
            throw malformed_stream("STREAMINFO maximum frame size below minimum");
        }
        return info;
    }

    stream_metadata read_metadata(io_stream* stream) {
        uint8_t marker[4];
        if (stream->read(marker, sizeof(marker)) != sizeof(marker) ||
            std::memcmp(marker, stream_marker, sizeof(marker)) != 0) {
            throw malformed_stream("Not a FLAC stream (fLaC marker missing)");
        }

        const int64_t stream_size = stream->get_size();

        stream_metadata result;
        bool have_stream_info = false;
        bool is_last = false;

        while (!is_last) {
            uint8_t block_header = 0;
            uint32_t length = 0;
            if (!read_u8(stream, &block_header) || !read_u24be(stream, &length)) {
                throw malformed_stream("Metadata block header cut short");
            }

            metadata_block block;
            block.is_last = (block_header & 0x80) != 0;
            block.type = block_header & 0x7F;
            block.length = length;
            block.offset = stream->tell();
            is_last = block.is_last;

            if (block.type == invalid_block_type) {
                throw malformed_stream("Invalid metadata block type 127");
            }
            if (result.blocks.empty() && block.type != static_cast<uint8_t>(metadata_type::stream_info)) {
                throw malformed_stream("First metadata block is not STREAMINFO");
            }
            if (stream_size >= 0 && block.offset + static_cast<int64_t>(length) > stream_size) {
                throw malformed_stream(std::string(metadata_type_name(block.type)) +
                                       " block extends past end of stream");
            }

            if (block.type == static_cast<uint8_t>(metadata_type::stream_info)) {
                if (have_stream_info) {
                    throw malformed_stream("Duplicate STREAMINFO block");
                }
                if (length < stream_info_size) {
                    throw malformed_stream("STREAMINFO block of " + std::to_string(length) +
                                           " bytes is too short");
                }
                uint8_t payload[stream_info_size];
                if (stream->read(payload, sizeof(payload)) != sizeof(payload)) {
                    throw malformed_stream("STREAMINFO block cut short");
                }
                result.info = parse_stream_info(payload, sizeof(payload));
                have_stream_info = true;

                if (length > stream_info_size &&
                    stream->seek(length - stream_info_size, seek_origin::cur) < 0) {
                    throw io_error("Failed to skip STREAMINFO padding");
                }
            } else {
                LOG_DEBUG("flac", "Skipping", metadata_type_name(block.type), "block of", length, "bytes");
                if (stream->seek(length, seek_origin::cur) < 0) {
                    throw io_error("Failed to skip metadata block");
                }
            }

            result.blocks.push_back(block);
        }

        result.first_frame_offset = stream->tell();
        return result;
    }

    const char* metadata_type_name(uint8_t type) {
        switch (type) {
            case 0: return "STREAMINFO";
            case 1: return "PADDING";
            case 2: return "APPLICATION";
            case 3: return "SEEKTABLE";
            case 4: return "VORBIS_COMMENT";
            case 5: return "CUESHEET";
            case 6: return "PICTURE";
            default: break;
        }
        return "RESERVED";
    }

} // namespace flacdec
