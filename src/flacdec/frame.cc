#include <flacdec/frame.hh>

namespace flacdec {

    std::vector<sample_t> decoded_frame::interleaved() const {
        std::vector<sample_t> out;
        if (channels.empty()) {
            return out;
        }

        const auto frames = channels[0].size();
        out.resize(frames * channels.size());

        std::size_t idx = 0;
        for (std::size_t i = 0; i < frames; i++) {
            for (const auto& ch : channels) {
                out[idx++] = ch[i];
            }
        }
        return out;
    }

} // namespace flacdec
