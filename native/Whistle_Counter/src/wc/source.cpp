#include "wc/source.hpp"

namespace wc {

const char* to_string(CaptureStatus st) {
    switch (st) {
        case CaptureStatus::Ok:        return "ok";
        case CaptureStatus::Overflow:  return "input overflow";
        case CaptureStatus::Underflow: return "input underflow";
    }
    return "?";
}

} // namespace wc
