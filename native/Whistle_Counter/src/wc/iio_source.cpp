// wc/iio_source.cpp
#include "wc/iio_source.hpp"
#include <cstdio>
#include <string>

namespace wc {

static void log_err(const char* msg) { std::fprintf(stderr, "[IIO] %s\n", msg); }

bool IioSource::write_dev_ll(iio_device* dev, const char* attr, long long val) {
    if (!dev) return false;
    return iio_device_attr_write_longlong(dev, attr, val) >= 0;
}
bool IioSource::write_chan_ll(iio_channel* ch, const char* attr, long long val) {
    if (!ch) return false;
    return iio_channel_attr_write_longlong(ch, attr, val) >= 0;
}

IioSource::IioSource(const IioConfig& cfg) : cfg_(cfg) {
    if (!init_context())        { log_err("context could not be created."); release(); return; }
    if (!apply_static_config()) { log_err("settings could not be applied."); release(); return; }
    if (!alloc_buffer())        { log_err("capture buffer allocation failed."); release(); return; }
}

IioSource::~IioSource() { release(); }

bool IioSource::init_context() {
    ctx_ = cfg_.uri.empty() ? iio_create_default_context()
                            : iio_create_context_from_uri(cfg_.uri.c_str());
    if (!ctx_) { log_err("iio context null"); return false; }

    iio_context_set_timeout(ctx_, static_cast<unsigned int>(cfg_.timeout_ms < 0 ? 0 : cfg_.timeout_ms));

    const unsigned int ndev = iio_context_get_devices_count(ctx_);
    std::fprintf(stderr, "[IIO] context devices (%u):\n", ndev);
    for (unsigned int i=0; i<ndev; ++i) {
        auto* d = iio_context_get_device(ctx_, i);
        const char* name = iio_device_get_name(d);
        std::fprintf(stderr, "  - %s\n", name ? name : "(null)");
    }

    if (!cfg_.device.empty()) {
        dev_ = iio_context_find_device(ctx_, cfg_.device.c_str());
        if (!dev_) {
            for (unsigned int i=0; i<ndev; ++i) {
                auto* d = iio_context_get_device(ctx_, i);
                const char* nm = iio_device_get_name(d);
                if (nm && std::string(nm).find(cfg_.device) != std::string::npos) { dev_ = d; break; }
            }
        }
    } else {
        // first device with a buffered input channel of that name
        for (unsigned int i=0; i<ndev && !dev_; ++i) {
            auto* d = iio_context_get_device(ctx_, i);
            auto* c = iio_device_find_channel(d, cfg_.channel.c_str(), false);
            if (c && iio_channel_is_scan_element(c)) dev_ = d;
        }
    }
    if (!dev_) { log_err("ADC device not found."); return false; }

    ch_ = iio_device_find_channel(dev_, cfg_.channel.c_str(), false);
    if (!ch_ || !iio_channel_is_scan_element(ch_)) {
        std::fprintf(stderr, "[IIO] no buffered input channel '%s'.\n", cfg_.channel.c_str());
        ch_ = nullptr;
        return false;
    }

    const iio_data_format* fmt = iio_channel_get_data_format(ch_);
    if (!fmt || fmt->length != 16) {
        log_err("only 16-bit sample storage is supported.");
        ch_ = nullptr;
        return false;
    }

    iio_channel_enable(ch_);
    return true;
}

bool IioSource::apply_static_config() {
    // Rate lives on the channel or on the device depending on the driver
    const long long hz = cfg_.sample_rate;
    if (write_chan_ll(ch_, "sampling_frequency", hz)) return true;
    if (write_dev_ll(dev_, "sampling_frequency", hz)) return true;

    long long cur = 0;
    if (iio_device_attr_read_longlong(dev_, "sampling_frequency", &cur) >= 0 && cur != hz) {
        std::fprintf(stderr, "[IIO] device runs at %lld Hz, requested %lld Hz.\n", cur, hz);
        return false;
    }
    std::fprintf(stderr, "[IIO] sampling_frequency not writable; assuming %lld Hz.\n", hz);
    return true;
}

bool IioSource::alloc_buffer() {
    rxbuf_ = iio_device_create_buffer(dev_, static_cast<size_t>(cfg_.block_size), false);
    if (!rxbuf_) { log_err("iio_device_create_buffer() failed."); return false; }
    return true;
}

bool IioSource::get_block(AudioBlock& out) {
    std::lock_guard<std::mutex> lk(m_);
    if (!rxbuf_) return false;

    const ssize_t nbytes = iio_buffer_refill(rxbuf_);
    if (nbytes <= 0) {
        std::fprintf(stderr, "[IIO] refill failed (%zd).\n", nbytes);
        return false;
    }

    const ptrdiff_t step = iio_buffer_step(rxbuf_);
    auto* p   = static_cast<const char*>(iio_buffer_first(rxbuf_, ch_));
    auto* end = static_cast<const char*>(iio_buffer_end(rxbuf_));

    const size_t want = static_cast<size_t>(cfg_.block_size);
    out.samples.resize(want);
    out.timestamp = static_cast<double>(samples_read_) / cfg_.sample_rate;
    out.channels  = 1;

    // full scale from the significant bits, unsigned codes centred on mid-scale
    const iio_data_format* fmt = iio_channel_get_data_format(ch_);
    const int bits = (fmt->bits > 0 && fmt->bits <= 16) ? static_cast<int>(fmt->bits) : 16;
    const int half = 1 << (bits - 1);
    const float scale = 1.0f / static_cast<float>(half);

    size_t i = 0;
    for (; i < want && p < end; ++i, p += step) {
        uint16_t raw = 0;
        iio_channel_convert(ch_, &raw, p);
        const int v = fmt->is_signed ? static_cast<int16_t>(raw) : static_cast<int>(raw) - half;
        out.samples[i] = v * scale;
    }
    out.status = (i < want) ? CaptureStatus::Underflow : CaptureStatus::Ok;
    for (; i < want; ++i) out.samples[i] = 0.0f;

    samples_read_ += want;
    return true;
}

void IioSource::release() {
    std::lock_guard<std::mutex> lk(m_);

    if (rxbuf_) {
        iio_buffer_cancel(rxbuf_);
        iio_buffer_destroy(rxbuf_);
        rxbuf_ = nullptr;
    }
    if (ch_) {
        iio_channel_disable(ch_);
        ch_ = nullptr;
    }
    dev_ = nullptr;

    if (ctx_) {
        iio_context_destroy(ctx_);
        ctx_ = nullptr;
    }
}

} // namespace wc
