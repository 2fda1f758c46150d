// wc/iio_source.hpp
#pragma once

#include "wc/source.hpp"
#include <string>
#include <cstdint>
#include <mutex>

extern "C" {
#include <iio.h>
}

namespace wc {

struct IioConfig {
    std::string uri;                      // "local:" | "ip:192.168.1.10" | "" (default)
    std::string device      = "";         // ADC device name; "" = first buffer-capable device
    std::string channel     = "voltage0"; // input channel carrying the microphone
    int         sample_rate = 16000;      // Hz, written when the device exposes it
    int         block_size  = 1024;       // samples per block
    int         timeout_ms  = 1000;
};

// Mono capture from an IIO ADC (signed 16-bit samples)
class IioSource : public ISource {
public:
    explicit IioSource(const IioConfig& cfg);
    ~IioSource() override;

    IioSource(const IioSource&) = delete;
    IioSource& operator=(const IioSource&) = delete;

    bool ok() const { return rxbuf_ != nullptr; }

    // ISource
    bool get_block(AudioBlock& out) override;
    void release() override;

private:
    IioConfig    cfg_{};
    iio_context* ctx_   = nullptr;
    iio_device*  dev_   = nullptr;
    iio_channel* ch_    = nullptr;
    iio_buffer*  rxbuf_ = nullptr;

    uint64_t samples_read_ = 0;
    std::mutex m_;

    bool init_context();
    bool apply_static_config();
    bool alloc_buffer();

    static bool write_dev_ll (iio_device* dev, const char* attr, long long val);
    static bool write_chan_ll(iio_channel* ch, const char* attr, long long val);
};

} // namespace wc
