#include <flacdec/channel_decorrelator.hh>
#include <flacdec/error.hh>

namespace flacdec {

    unsigned subframe_bits_per_sample(channel_assignment assignment, unsigned channel,
                                      unsigned bits_per_sample) {
        switch (assignment) {
            case channel_assignment::left_side:
            case channel_assignment::mid_side:
                return channel == 1 ? bits_per_sample + 1 : bits_per_sample;
            case channel_assignment::right_side:
                return channel == 0 ? bits_per_sample + 1 : bits_per_sample;
            case channel_assignment::independent:
                break;
        }
        return bits_per_sample;
    }

    void decorrelate(channel_assignment assignment, std::vector<std::vector<int64_t>>& channels) {
        if (assignment == channel_assignment::independent) {
            return;
        }

        if (channels.size() != 2 || channels[0].size() != channels[1].size()) {
            throw malformed_stream("Stereo decorrelation needs two channels of equal length");
        }

        auto& first = channels[0];
        auto& second = channels[1];
        const auto count = first.size();

        switch (assignment) {
            case channel_assignment::left_side:
                // first = left, second = side
                for (std::size_t i = 0; i < count; i++) {
                    second[i] = first[i] - second[i];
                }
                break;

            case channel_assignment::right_side:
                // first = side, second = right
                for (std::size_t i = 0; i < count; i++) {
                    first[i] = first[i] + second[i];
                }
                break;

            case channel_assignment::mid_side:
                for (std::size_t i = 0; i < count; i++) {
                    const int64_t side = second[i];
                    const int64_t mid = static_cast<int64_t>(static_cast<uint64_t>(first[i]) << 1) | (side & 1);
                    first[i] = (mid + side) >> 1;
                    second[i] = (mid - side) >> 1;
                }
                break;

            case channel_assignment::independent:
                break;
        }
    }

} // namespace flacdec
