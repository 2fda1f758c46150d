#pragma once
#include "wc/event_sink.hpp"
#include <cstdint>
#include <string>

namespace wc {

enum class WceKind : uint8_t { START=1, EVENT=2, STOP=3 };

#pragma pack(push,1)
struct WcePacketV1 {
    uint32_t magic = 0x31454357; // 'WCE1'
    uint64_t seq;
    uint8_t  kind;
    uint8_t  accepted;
    uint8_t  _pad[2]{};
    uint32_t count;
    int64_t  start_us;
    int64_t  end_us;
    int64_t  duration_us;
};
#pragma pack(pop)

// Best-effort datagram per notification, never blocks the caller
class UdpEventSink : public IEventSink {
public:
    UdpEventSink(const std::string& ip, uint16_t port);
    ~UdpEventSink() override;

    UdpEventSink(const UdpEventSink&) = delete;
    UdpEventSink& operator=(const UdpEventSink&) = delete;

    bool ok() const { return _ok; }
    uint64_t dropped() const { return _dropped; }

    void on_whistle_start(double t) override;
    void on_event(const WhistleEvent& ev) override;
    void on_shutdown() override;

private:
    void send(WcePacketV1& p);

    bool _ok=false;
    uint64_t _seq=0;
    uint64_t _dropped=0;
    uint32_t _total=0;
#ifdef _WIN32
    using socket_t = uintptr_t;
#else
    using socket_t = int;
#endif
    socket_t _fd=(socket_t)-1;
};

} // namespace wc
