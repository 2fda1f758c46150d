// wc/wav_source.cpp
#include "wc/wav_source.hpp"
#include <cstdio>
#include <cstring>

namespace wc {

// WAVE_FORMAT_EXTENSIBLE, the largest fmt layout, is 40 bytes
static constexpr uint32_t kMaxFmtChunk = 40;

static void log_err(const char* msg) { std::fprintf(stderr, "[WAV] %s\n", msg); }

static uint16_t rd16(const uint8_t* p) { return static_cast<uint16_t>(p[0] | (p[1] << 8)); }
static uint32_t rd32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

WavSource::WavSource(const std::string& path, int block_size)
    : in_(path, std::ios::binary), path_(path), block_size_(block_size) {
    if (!in_)              { log_err(("cannot open " + path).c_str()); return; }
    if (block_size_ <= 0)  { log_err("block size must be > 0");         return; }
    if (!parse_header())   { release();                                 return; }
    raw_.resize(static_cast<size_t>(block_size_) * channels_ * bytes_per_sample_);
    ok_ = true;
}

bool WavSource::parse_header() {
    uint8_t hdr[12];
    if (!in_.read(reinterpret_cast<char*>(hdr), sizeof(hdr)) ||
        std::memcmp(hdr, "RIFF", 4) != 0 || std::memcmp(hdr + 8, "WAVE", 4) != 0) {
        log_err("not a RIFF/WAVE file");
        return false;
    }

    bool have_fmt = false;
    uint8_t ch[8];
    while (in_.read(reinterpret_cast<char*>(ch), sizeof(ch))) {
        const uint32_t len = rd32(ch + 4);

        if (std::memcmp(ch, "fmt ", 4) == 0) {
            if (len < 16) { log_err("fmt chunk too short"); return false; }
            if (len > kMaxFmtChunk) { log_err("fmt chunk too long"); return false; }
            std::vector<uint8_t> fmt(len);
            if (!in_.read(reinterpret_cast<char*>(fmt.data()), len)) { log_err("truncated fmt chunk"); return false; }
            format_      = rd16(&fmt[0]);
            channels_    = rd16(&fmt[2]);
            sample_rate_ = static_cast<int>(rd32(&fmt[4]));
            const int bits = rd16(&fmt[14]);
            if (format_ == 0xFFFE && len >= 26) format_ = rd16(&fmt[24]);  // WAVE_FORMAT_EXTENSIBLE
            bytes_per_sample_ = bits / 8;
            have_fmt = true;
            if (len & 1u) in_.ignore(1);
        } else if (std::memcmp(ch, "data", 4) == 0) {
            if (!have_fmt) { log_err("data chunk before fmt chunk"); return false; }
            const bool pcm16 = format_ == 1 && bytes_per_sample_ == 2;
            const bool pcm32 = format_ == 1 && bytes_per_sample_ == 4;
            const bool f32   = format_ == 3 && bytes_per_sample_ == 4;
            if (!(pcm16 || pcm32 || f32)) { log_err("unsupported sample format (PCM16/PCM32/float32 only)"); return false; }
            if (channels_ <= 0 || sample_rate_ <= 0) { log_err("bad channel count or sample rate"); return false; }
            total_frames_ = len / (static_cast<uint32_t>(channels_) * bytes_per_sample_);
            std::printf("[WAV] %s: %d Hz, %d ch, %d-bit %s, %.2f s\n",
                        path_.c_str(), sample_rate_, channels_, bytes_per_sample_ * 8,
                        f32 ? "float" : "pcm",
                        static_cast<double>(total_frames_) / sample_rate_);
            return true;
        } else {
            in_.ignore(static_cast<std::streamsize>(len + (len & 1u)));
        }
    }
    log_err("no data chunk");
    return false;
}

float WavSource::sample_at(const uint8_t* p) const {
    if (format_ == 3) {
        const uint32_t bits = rd32(p);
        float f;
        std::memcpy(&f, &bits, sizeof(f));
        return f;
    }
    if (bytes_per_sample_ == 2)
        return static_cast<int16_t>(rd16(p)) * (1.0f / 32768.0f);
    return static_cast<float>(static_cast<int32_t>(rd32(p)) * (1.0 / 2147483648.0));
}

bool WavSource::get_block(AudioBlock& out) {
    if (!ok_ || frames_read_ >= total_frames_) return false;

    const uint64_t left = total_frames_ - frames_read_;
    const size_t take = static_cast<size_t>(
        left < static_cast<uint64_t>(block_size_) ? left : static_cast<uint64_t>(block_size_));
    const size_t frame_bytes = static_cast<size_t>(channels_) * bytes_per_sample_;

    in_.read(reinterpret_cast<char*>(raw_.data()), static_cast<std::streamsize>(take * frame_bytes));
    const size_t got = static_cast<size_t>(in_.gcount()) / frame_bytes;
    if (got == 0) { log_err("unexpected end of data"); return false; }

    out.samples.resize(static_cast<size_t>(block_size_));
    out.timestamp = static_cast<double>(frames_read_) / sample_rate_;
    out.channels  = 1;
    out.status    = (got < take) ? CaptureStatus::Underflow : CaptureStatus::Ok;

    size_t i = 0;
    for (; i < got; ++i) out.samples[i] = sample_at(&raw_[i * frame_bytes]);   // channel 0
    for (; i < static_cast<size_t>(block_size_); ++i) out.samples[i] = 0.0f;

    frames_read_ += got;
    if (got < take) frames_read_ = total_frames_;   // truncated file
    return true;
}

void WavSource::release() {
    if (in_.is_open()) in_.close();
    ok_ = false;
}

} // namespace wc
