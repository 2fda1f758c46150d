#pragma once
#include <vector>

namespace wc {

enum class CaptureStatus {
    Ok,
    Overflow,   // samples dropped before this block
    Underflow   // block padded, device delivered less than requested
};

const char* to_string(CaptureStatus st);

struct AudioBlock {
    std::vector<float> samples;
    double timestamp  = 0.0;   // s, non-decreasing
    int    channels   = 1;
    CaptureStatus status = CaptureStatus::Ok;
};

// Block provider interface (IIO/file/synthetic all derive from this)
class ISource {
public:
    virtual ~ISource() = default;
    // true: block produced; false: source ended/error
    virtual bool get_block(AudioBlock& out) = 0;
    virtual void release() {}
};

} // namespace wc
