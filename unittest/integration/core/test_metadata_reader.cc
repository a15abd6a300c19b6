#include <doctest/doctest.h>
#include <flacdec/metadata_reader.hh>
#include <flacdec/error.hh>
#include <flacdec/sdk/io_stream.hh>

#include "flac_stream_writer.hh"

#include <cstdint>
#include <string>
#include <vector>

using namespace flacdec;
using flacdec_test::stream_builder;

namespace {
    stream_metadata read_from(const std::vector<uint8_t>& bytes) {
        auto io = io_from_memory(bytes.data(), bytes.size());
        return read_metadata(io.get());
    }
}

TEST_SUITE("Integration::MetadataReader") {
    TEST_CASE("STREAMINFO fields") {
        stream_builder sb;
        sb.info.min_block_size = 4096;
        sb.info.max_block_size = 4096;
        sb.info.min_frame_size = 14;
        sb.info.max_frame_size = 8192;
        sb.info.sample_rate = 96000;
        sb.info.channels = 6;
        sb.info.bits_per_sample = 24;
        sb.info.total_samples = 0x9ABCDEF01ull;

        const auto bytes = sb.build();
        const auto meta = read_from(bytes);

        CHECK(meta.info.min_block_size == 4096);
        CHECK(meta.info.max_block_size == 4096);
        CHECK(meta.info.min_frame_size == 14);
        CHECK(meta.info.max_frame_size == 8192);
        CHECK(meta.info.sample_rate == 96000);
        CHECK(meta.info.channels == 6);
        CHECK(meta.info.bits_per_sample == 24);
        CHECK(meta.info.total_samples == 0x9ABCDEF01ull);
        for (std::size_t i = 0; i < meta.info.md5.size(); i++) {
            CHECK(meta.info.md5[i] == i);
        }

        REQUIRE(meta.blocks.size() == 1);
        CHECK(meta.blocks[0].type == 0);
        CHECK(meta.blocks[0].is_last);
        CHECK(meta.blocks[0].offset == 8);
        CHECK(meta.blocks[0].length == stream_info_size);
        CHECK(meta.first_frame_offset == static_cast<int64_t>(bytes.size()));
    }

    TEST_CASE("Other blocks are recorded and skipped") {
        stream_builder sb;
        sb.extra_blocks.push_back({4, std::vector<uint8_t>(20, 'v')});
        sb.extra_blocks.push_back({1, std::vector<uint8_t>(100, 0)});
        sb.extra_blocks.push_back({9, std::vector<uint8_t>(3, 0xAA)});
        sb.frames.push_back({0xFF, 0xF8});

        const auto bytes = sb.build();
        auto io = io_from_memory(bytes.data(), bytes.size());
        const auto meta = read_metadata(io.get());

        REQUIRE(meta.blocks.size() == 4);
        CHECK(meta.blocks[1].type == static_cast<uint8_t>(metadata_type::vorbis_comment));
        CHECK(meta.blocks[1].offset == 4 + 4 + 34 + 4);
        CHECK(meta.blocks[1].length == 20);
        CHECK(meta.blocks[2].type == static_cast<uint8_t>(metadata_type::padding));
        CHECK(meta.blocks[2].offset == meta.blocks[1].offset + 20 + 4);
        CHECK(meta.blocks[3].type == 9);
        CHECK(meta.blocks[3].is_last);
        CHECK_FALSE(meta.blocks[2].is_last);

        CHECK(meta.first_frame_offset == static_cast<int64_t>(bytes.size()) - 2);
        CHECK(io->tell() == meta.first_frame_offset);
    }

    TEST_CASE("Block type names") {
        CHECK(std::string(metadata_type_name(0)) == "STREAMINFO");
        CHECK(std::string(metadata_type_name(3)) == "SEEKTABLE");
        CHECK(std::string(metadata_type_name(6)) == "PICTURE");
        CHECK(std::string(metadata_type_name(42)) == "RESERVED");
    }

    TEST_CASE("Rejected metadata") {
        SUBCASE("Missing marker") {
            auto bytes = stream_builder().build();
            bytes[0] = 'F';
            CHECK_THROWS_AS(read_from(bytes), malformed_stream);
        }

        SUBCASE("Empty input") {
            CHECK_THROWS_AS(read_from({}), malformed_stream);
        }

        SUBCASE("First block is not STREAMINFO") {
            auto bytes = stream_builder().build();
            bytes[4] = 0x81;
            CHECK_THROWS_AS(read_from(bytes), malformed_stream);
        }

        SUBCASE("Invalid block type") {
            stream_builder sb;
            sb.extra_blocks.push_back({127, {}});
            CHECK_THROWS_AS(read_from(sb.build()), malformed_stream);
        }

        SUBCASE("Duplicate STREAMINFO") {
            stream_builder sb;
            sb.extra_blocks.push_back({0, flacdec_test::stream_info_payload(sb.info)});
            CHECK_THROWS_AS(read_from(sb.build()), malformed_stream);
        }

        SUBCASE("Short STREAMINFO") {
            std::vector<uint8_t> bytes = {'f', 'L', 'a', 'C', 0x80, 0x00, 0x00, 0x10};
            bytes.resize(bytes.size() + 16, 0);
            CHECK_THROWS_AS(read_from(bytes), malformed_stream);
        }

        SUBCASE("Block runs past the end") {
            stream_builder sb;
            sb.extra_blocks.push_back({1, std::vector<uint8_t>(50, 0)});
            auto bytes = sb.build();
            bytes.resize(bytes.size() - 10);
            CHECK_THROWS_AS(read_from(bytes), malformed_stream);
        }

        SUBCASE("Header cut short") {
            auto bytes = stream_builder().build();
            bytes.resize(6);
            CHECK_THROWS_AS(read_from(bytes), malformed_stream);
        }

        SUBCASE("Bit depth below 4") {
            stream_builder sb;
            sb.info.bits_per_sample = 3;
            CHECK_THROWS_AS(read_from(sb.build()), malformed_stream);
        }

        SUBCASE("Zero sample rate") {
            stream_builder sb;
            sb.info.sample_rate = 0;
            CHECK_THROWS_AS(read_from(sb.build()), malformed_stream);
        }

        SUBCASE("Maximum block size below minimum") {
            stream_builder sb;
            sb.info.min_block_size = 4096;
            sb.info.max_block_size = 1024;
            CHECK_THROWS_AS(read_from(sb.build()), malformed_stream);
        }

        SUBCASE("Maximum frame size below minimum") {
            stream_builder sb;
            sb.info.min_frame_size = 200;
            sb.info.max_frame_size = 100;
            CHECK_THROWS_AS(read_from(sb.build()), malformed_stream);
        }
    }

    TEST_CASE("Unknown frame sizes are accepted") {
        stream_builder sb;
        sb.info.min_frame_size = 0;
        sb.info.max_frame_size = 0;
        const auto meta = read_from(sb.build());
        CHECK(meta.info.max_frame_size == 0);
    }

    TEST_CASE("parse_stream_info on a raw payload") {
        flacdec_test::stream_info_fields fields;
        fields.channels = 1;
        fields.bits_per_sample = 8;
        const auto payload = flacdec_test::stream_info_payload(fields);
        REQUIRE(payload.size() == stream_info_size);

        const auto info = parse_stream_info(payload.data(), payload.size());
        CHECK(info.channels == 1);
        CHECK(info.bits_per_sample == 8);
        CHECK(info.sample_rate == 44100);

        CHECK_THROWS_AS(parse_stream_info(payload.data(), 33), malformed_stream);
    }
}
