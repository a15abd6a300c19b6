/**
 * @file test_stream_decoder.cc
 * @brief Whole-stream decoding through stream_decoder
 *
 * Test Coverage:
 * - Metadata and STREAMINFO exposure
 * - Frame iteration, decode_all and the total sample limit
 * - Reset and resynchronization after damaged frames
 * - Checksum policy at stream level
 * - Frames larger than the read window
 * - Long streams of small frames through a small window
 * - File-backed sources
 */

#include <doctest/doctest.h>
#include <flacdec/stream_decoder.hh>
#include <flacdec/error.hh>
#include <flacdec/sdk/io_stream.hh>

#include "flac_stream_writer.hh"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <vector>

using namespace flacdec;
using flacdec_test::frame_builder;
using flacdec_test::stream_builder;

namespace {
    constexpr uint32_t block = 16;

    // stereo frame with channel 0 holding number*10 and channel 1 its negation
    std::vector<uint8_t> constant_stereo_frame(uint64_t number, uint32_t block_size = block) {
        frame_builder fb;
        fb.block_size = block_size;
        fb.channel_code = 1;
        fb.number = number;
        const auto value = static_cast<int64_t>(number) * 10;
        flacdec_test::write_constant(fb.body, value, 16);
        flacdec_test::write_constant(fb.body, -value, 16);
        return fb.build();
    }

    struct test_stream {
        std::vector<uint8_t> bytes;
        std::vector<std::size_t> frame_offsets;
    };

    test_stream make_stream(unsigned frame_count, uint64_t total_samples = 0) {
        stream_builder sb;
        sb.info.min_block_size = block;
        sb.info.max_block_size = block;
        sb.info.total_samples = total_samples;
        sb.extra_blocks.push_back({1, std::vector<uint8_t>(12, 0)});

        test_stream result;
        result.bytes = sb.build();
        for (unsigned i = 0; i < frame_count; i++) {
            result.frame_offsets.push_back(result.bytes.size());
            const auto frame = constant_stereo_frame(i);
            result.bytes.insert(result.bytes.end(), frame.begin(), frame.end());
        }
        return result;
    }

    // layout of constant_stereo_frame: 7 header bytes, then per channel one
    // subframe header byte and two value bytes
    constexpr std::size_t header_crc8_byte = 6;
    constexpr std::size_t first_value_low_byte = 9;
}

TEST_SUITE("Integration::StreamDecoder") {
    TEST_CASE("Metadata") {
        const auto stream = make_stream(1, 88200);
        auto io = io_from_memory(stream.bytes.data(), stream.bytes.size());

        stream_decoder decoder;
        CHECK_FALSE(decoder.is_open());
        decoder.open(io.get());
        REQUIRE(decoder.is_open());

        CHECK(decoder.info().sample_rate == 44100);
        CHECK(decoder.info().channels == 2);
        CHECK(decoder.info().bits_per_sample == 16);
        CHECK(decoder.info().total_samples == 88200);
        CHECK(decoder.duration() == std::chrono::microseconds(2000000));

        REQUIRE(decoder.metadata_blocks().size() == 2);
        CHECK(decoder.metadata_blocks()[0].type == static_cast<uint8_t>(metadata_type::stream_info));
        CHECK(decoder.metadata_blocks()[1].type == static_cast<uint8_t>(metadata_type::padding));
        CHECK(decoder.samples_decoded() == 0);
        CHECK(decoder.frames_decoded() == 0);
    }

    TEST_CASE("Unknown length") {
        const auto stream = make_stream(1);
        auto io = io_from_memory(stream.bytes.data(), stream.bytes.size());
        stream_decoder decoder;
        decoder.open(io.get());
        CHECK(decoder.duration() == std::chrono::microseconds(0));
    }

    TEST_CASE("Mid/side stream end to end") {
        frame_builder fb;
        fb.channel_code = 10;
        flacdec_test::write_fixed(fb.body, 1, {100}, {0, 0, 0}, 16, 0);
        flacdec_test::write_fixed(fb.body, 1, {10}, {0, 0, 0}, 17, 0);

        stream_builder sb;
        sb.info.total_samples = 4;
        sb.frames.push_back(fb.build());
        const auto bytes = sb.build();

        auto io = io_from_memory(bytes.data(), bytes.size());
        stream_decoder decoder;
        decoder.open(io.get());

        const auto frame = decoder.next_frame();
        REQUIRE(frame.has_value());
        CHECK(frame->verified);
        CHECK(frame->header.assignment == channel_assignment::mid_side);
        CHECK(frame->channels[0] == std::vector<int32_t>(4, 105));
        CHECK(frame->channels[1] == std::vector<int32_t>(4, 95));

        CHECK_FALSE(decoder.next_frame().has_value());
        CHECK(decoder.samples_decoded() == 4);
        CHECK(decoder.frames_decoded() == 1);
    }

    TEST_CASE("Iterating over frames") {
        const auto stream = make_stream(5);
        auto io = io_from_memory(stream.bytes.data(), stream.bytes.size());
        stream_decoder decoder;
        decoder.open(io.get());

        uint64_t expected = 0;
        for (const decoded_frame& frame : decoder) {
            CHECK(frame.verified);
            CHECK(frame.header.number == expected);
            CHECK(frame.channels[0] == std::vector<int32_t>(block, static_cast<int32_t>(expected * 10)));
            CHECK(frame.channels[1] == std::vector<int32_t>(block, -static_cast<int32_t>(expected * 10)));
            expected++;
        }
        CHECK(expected == 5);
        CHECK(decoder.frames_decoded() == 5);
        CHECK(decoder.samples_decoded() == 5 * block);
        CHECK_FALSE(decoder.next_frame().has_value());
    }

    TEST_CASE("Decode all") {
        const auto stream = make_stream(4);
        auto io = io_from_memory(stream.bytes.data(), stream.bytes.size());
        stream_decoder decoder;
        decoder.open(io.get());

        std::vector<decoded_frame> frames;
        CHECK(decoder.decode_all(frames) == 4);
        REQUIRE(frames.size() == 4);
        CHECK(frames[3].header.number == 3);
        CHECK(decoder.decode_all(frames) == 0);
    }

    TEST_CASE("Stops at the advertised sample count") {
        const auto stream = make_stream(5, 3 * block);
        auto io = io_from_memory(stream.bytes.data(), stream.bytes.size());
        stream_decoder decoder;
        decoder.open(io.get());

        std::vector<decoded_frame> frames;
        CHECK(decoder.decode_all(frames) == 3);
        CHECK(decoder.samples_decoded() == 3 * block);
    }

    TEST_CASE("Decoding is deterministic") {
        const auto stream = make_stream(3);

        auto decode = [&stream]() {
            auto io = io_from_memory(stream.bytes.data(), stream.bytes.size());
            stream_decoder decoder;
            decoder.open(io.get());
            std::vector<int32_t> pcm;
            while (auto frame = decoder.next_frame()) {
                const auto samples = frame->interleaved();
                pcm.insert(pcm.end(), samples.begin(), samples.end());
            }
            return pcm;
        };

        const auto first = decode();
        CHECK(first.size() == 3 * block * 2);
        CHECK(first == decode());
    }

    TEST_CASE("Reset restarts at the first frame") {
        const auto stream = make_stream(3);
        auto io = io_from_memory(stream.bytes.data(), stream.bytes.size());
        stream_decoder decoder;
        decoder.open(io.get());

        REQUIRE(decoder.next_frame().has_value());
        REQUIRE(decoder.next_frame().has_value());
        CHECK(decoder.frames_decoded() == 2);

        decoder.reset();
        CHECK(decoder.frames_decoded() == 0);
        CHECK(decoder.samples_decoded() == 0);

        const auto frame = decoder.next_frame();
        REQUIRE(frame.has_value());
        CHECK(frame->header.number == 0);
    }

    TEST_CASE("Frame number gaps are tolerated") {
        stream_builder sb;
        sb.info.min_block_size = block;
        sb.info.max_block_size = block;
        sb.frames.push_back(constant_stereo_frame(0));
        sb.frames.push_back(constant_stereo_frame(1));
        sb.frames.push_back(constant_stereo_frame(7));
        const auto bytes = sb.build();

        auto io = io_from_memory(bytes.data(), bytes.size());
        stream_decoder decoder;
        decoder.open(io.get());

        std::vector<decoded_frame> frames;
        REQUIRE(decoder.decode_all(frames) == 3);
        CHECK(frames[2].header.number == 7);
    }

    TEST_CASE("Damaged frame header") {
        auto stream = make_stream(4);
        stream.bytes[stream.frame_offsets[1] + header_crc8_byte] ^= 0x55;
        auto io = io_from_memory(stream.bytes.data(), stream.bytes.size());

        stream_decoder decoder;
        decoder.open(io.get());

        REQUIRE(decoder.next_frame().has_value());

        SUBCASE("Error repeats until resync") {
            CHECK_THROWS_AS(decoder.next_frame(), malformed_stream);
            CHECK_THROWS_AS(decoder.next_frame(), malformed_stream);
        }

        SUBCASE("Resync skips to the next frame") {
            CHECK_THROWS_AS(decoder.next_frame(), malformed_stream);
            REQUIRE(decoder.resync());

            const auto frame = decoder.next_frame();
            REQUIRE(frame.has_value());
            CHECK(frame->header.number == 2);
            CHECK(frame->verified);
            REQUIRE(decoder.next_frame().has_value());
            CHECK_FALSE(decoder.next_frame().has_value());
            CHECK(decoder.frames_decoded() == 3);
        }

        SUBCASE("decode_all keeps the frames before the error") {
            std::vector<decoded_frame> frames;
            CHECK_THROWS_AS(decoder.decode_all(frames), malformed_stream);
            REQUIRE(frames.empty());

            decoder.reset();
            frames.clear();
            CHECK_THROWS_AS(decoder.decode_all(frames), malformed_stream);
            REQUIRE(frames.size() == 1);
            CHECK(frames[0].header.number == 0);
        }
    }

    TEST_CASE("Damaged header stops at the frame") {
        auto stream = make_stream(200);
        stream.bytes[stream.frame_offsets[1] + header_crc8_byte] ^= 0x55;

        decoder_options options;
        options.read_chunk_size = 16;
        auto io = io_from_memory(stream.bytes.data(), stream.bytes.size());
        stream_decoder decoder(options);
        decoder.open(io.get());

        REQUIRE(decoder.next_frame().has_value());
        CHECK_THROWS_AS(decoder.next_frame(), malformed_stream);
        // the read window did not grow past a few frames
        CHECK(io->tell() < static_cast<int64_t>(stream.frame_offsets[20]));

        REQUIRE(decoder.resync());
        const auto frame = decoder.next_frame();
        REQUIRE(frame.has_value());
        CHECK(frame->header.number == 2);
    }

    TEST_CASE("Many small frames through a small read window") {
        const auto stream = make_stream(200);

        decoder_options options;
        options.read_chunk_size = 5;
        auto io = io_from_memory(stream.bytes.data(), stream.bytes.size());
        stream_decoder decoder(options);
        decoder.open(io.get());

        uint64_t expected = 0;
        while (const auto frame = decoder.next_frame()) {
            CHECK(frame->verified);
            CHECK(frame->header.number == expected);
            CHECK(frame->channels[0][block - 1] == static_cast<int32_t>(expected * 10));
            expected++;
        }
        CHECK(expected == 200);
        CHECK(decoder.frames_decoded() == 200);
        CHECK(decoder.samples_decoded() == 200 * block);
        CHECK(io->tell() == static_cast<int64_t>(stream.bytes.size()));
    }

    TEST_CASE("Damaged frame body") {
        auto stream = make_stream(3);
        stream.bytes[stream.frame_offsets[1] + first_value_low_byte] ^= 0x01;

        SUBCASE("Delivered unverified") {
            auto io = io_from_memory(stream.bytes.data(), stream.bytes.size());
            stream_decoder decoder;
            decoder.open(io.get());

            std::vector<decoded_frame> frames;
            REQUIRE(decoder.decode_all(frames) == 3);
            CHECK(frames[0].verified);
            CHECK_FALSE(frames[1].verified);
            CHECK(frames[1].channels[0][0] == 11);
            CHECK(frames[2].verified);
        }

        SUBCASE("Strict") {
            decoder_options options;
            options.on_crc_mismatch = crc_policy::strict;
            auto io = io_from_memory(stream.bytes.data(), stream.bytes.size());
            stream_decoder decoder(options);
            decoder.open(io.get());

            REQUIRE(decoder.next_frame().has_value());
            CHECK_THROWS_AS(decoder.next_frame(), integrity_error);
            REQUIRE(decoder.resync());
            const auto frame = decoder.next_frame();
            REQUIRE(frame.has_value());
            CHECK(frame->header.number == 2);
        }
    }

    TEST_CASE("Truncated last frame") {
        auto stream = make_stream(3);
        stream.bytes.resize(stream.bytes.size() - 3);
        auto io = io_from_memory(stream.bytes.data(), stream.bytes.size());

        stream_decoder decoder;
        decoder.open(io.get());
        REQUIRE(decoder.next_frame().has_value());
        REQUIRE(decoder.next_frame().has_value());
        CHECK_THROWS_AS(decoder.next_frame(), out_of_data);
        CHECK_FALSE(decoder.resync());
        CHECK_FALSE(decoder.next_frame().has_value());
    }

    TEST_CASE("Resync on garbage before the first frame") {
        stream_builder sb;
        sb.info.min_block_size = block;
        sb.info.max_block_size = block;
        sb.frames.push_back({0x00, 0xFF, 0x12, 0xFF, 0xF8, 0x00, 0x42});
        sb.frames.push_back(constant_stereo_frame(0));
        const auto bytes = sb.build();

        auto io = io_from_memory(bytes.data(), bytes.size());
        stream_decoder decoder;
        decoder.open(io.get());

        CHECK_THROWS_AS(decoder.next_frame(), lost_sync);
        REQUIRE(decoder.resync());
        const auto frame = decoder.next_frame();
        REQUIRE(frame.has_value());
        CHECK(frame->header.number == 0);
    }

    TEST_CASE("Frames larger than the read window") {
        // STREAMINFO claims tiny blocks, so the first read window is too small
        decoder_options options;
        options.read_chunk_size = 3;
        options.check_stream_info = false;

        std::vector<int64_t> ramp(256);
        for (std::size_t i = 0; i < ramp.size(); i++) {
            ramp[i] = static_cast<int64_t>(i) * 100 - 12800;
        }

        stream_builder sb;
        for (uint64_t n = 0; n < 2; n++) {
            frame_builder fb;
            fb.block_size = 256;
            fb.channel_code = 1;
            fb.number = n;
            flacdec_test::write_verbatim(fb.body, ramp, 16);
            flacdec_test::write_verbatim(fb.body, ramp, 16);
            sb.frames.push_back(fb.build());
        }
        const auto bytes = sb.build();

        auto io = io_from_memory(bytes.data(), bytes.size());
        stream_decoder decoder(options);
        decoder.open(io.get());

        std::vector<decoded_frame> frames;
        CHECK(decoder.decode_all(frames) == 2);
        REQUIRE(frames.size() == 2);
        CHECK(frames[1].verified);
        CHECK(frames[1].channels[1] == std::vector<int32_t>(ramp.begin(), ramp.end()));
    }

    TEST_CASE("Rice codes cut by the read window") {
        decoder_options options;
        options.read_chunk_size = 3;
        options.check_stream_info = false;

        // parameter 0 turns each residual into an 80-bit unary run
        const std::vector<int64_t> residuals(256, 40);

        stream_builder sb;
        for (uint64_t n = 0; n < 2; n++) {
            frame_builder fb;
            fb.block_size = 256;
            fb.channel_code = 1;
            fb.number = n;
            flacdec_test::write_fixed(fb.body, 0, {}, residuals, 16, 0);
            flacdec_test::write_fixed(fb.body, 0, {}, residuals, 16, 0);
            sb.frames.push_back(fb.build());
        }
        const auto bytes = sb.build();

        auto io = io_from_memory(bytes.data(), bytes.size());
        stream_decoder decoder(options);
        decoder.open(io.get());

        std::vector<decoded_frame> frames;
        CHECK(decoder.decode_all(frames) == 2);
        REQUIRE(frames.size() == 2);
        CHECK(frames[0].verified);
        CHECK(frames[1].channels[0] == std::vector<int32_t>(256, 40));
    }

    TEST_CASE("File source") {
        const auto stream = make_stream(3);
        const auto path = std::filesystem::temp_directory_path() / "flacdec_stream_decoder_test.flac";
        {
            std::ofstream out(path, std::ios::binary);
            out.write(reinterpret_cast<const char*>(stream.bytes.data()),
                      static_cast<std::streamsize>(stream.bytes.size()));
        }

        {
            auto io = io_from_file(path.string().c_str());
            REQUIRE(io);
            stream_decoder decoder;
            decoder.open(io.get());

            std::vector<decoded_frame> frames;
            REQUIRE(decoder.decode_all(frames) == 3);
            CHECK(frames[2].channels[0][0] == 20);

            decoder.reset();
            CHECK(decoder.next_frame().has_value());
        }

        std::filesystem::remove(path);
    }
}
