// wc/wav_source.hpp
#pragma once

#include "wc/source.hpp"
#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

namespace wc {

// RIFF/WAVE replay: PCM16, PCM32 or float32. Multi-channel files are
// reduced to their first channel.
class WavSource : public ISource {
public:
    WavSource(const std::string& path, int block_size);

    bool ok() const { return ok_; }
    int  sample_rate() const { return sample_rate_; }
    int  channels()    const { return channels_; }
    uint64_t total_frames() const { return total_frames_; }

    // ISource
    bool get_block(AudioBlock& out) override;
    void release() override;

private:
    bool parse_header();
    float sample_at(const uint8_t* p) const;

    std::ifstream in_;
    std::string   path_;
    int      block_size_   = 0;
    bool     ok_           = false;

    uint16_t format_       = 0;     // 1 = PCM, 3 = IEEE float
    int      channels_     = 0;
    int      sample_rate_  = 0;
    int      bytes_per_sample_ = 0;
    uint64_t total_frames_ = 0;
    uint64_t frames_read_  = 0;

    std::vector<uint8_t> raw_;
};

} // namespace wc
