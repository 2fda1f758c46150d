#include "wc/udp_event_sink.hpp"
#include <cmath>
#include <cstdio>

#ifdef _WIN32
  #include <winsock2.h>
  #include <ws2tcpip.h>
  #pragma comment(lib, "Ws2_32.lib")
  using native_socket = SOCKET;
  static const native_socket kNoSocket = INVALID_SOCKET;
#else
  #include <unistd.h>
  #include <fcntl.h>
  #include <arpa/inet.h>
  #include <sys/socket.h>
  using native_socket = int;
  static const native_socket kNoSocket = -1;
#endif

namespace {

// Non-blocking datagram socket, kNoSocket on failure
native_socket open_udp() {
#ifdef _WIN32
    static bool wsa_up = false;
    if (!wsa_up) { WSADATA w; if (WSAStartup(MAKEWORD(2,2), &w) != 0) return kNoSocket; wsa_up = true; }
    native_socket s = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (s == kNoSocket) return kNoSocket;
    u_long nb = 1;
    ioctlsocket(s, FIONBIO, &nb);
#else
    native_socket s = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (s < 0) return kNoSocket;
    const int fl = fcntl(s, F_GETFL, 0);
    fcntl(s, F_SETFL, fl | O_NONBLOCK);
#endif
    return s;
}

void close_socket(native_socket s) {
    if (s == kNoSocket) return;
#ifdef _WIN32
    ::closesocket(s);
#else
    ::close(s);
#endif
}

int64_t to_us(double s) { return static_cast<int64_t>(std::llround(s * 1e6)); }

} // namespace

namespace wc {

UdpEventSink::UdpEventSink(const std::string& ip, uint16_t port) {
    const native_socket s = open_udp();
    if (s == kNoSocket) {
        std::fprintf(stderr, "[UDP] socket creation failed\n");
        return;
    }

    sockaddr_in to{};
    to.sin_family = AF_INET;
    to.sin_port   = htons(port);
    const bool addr_ok = ::inet_pton(AF_INET, ip.c_str(), &to.sin_addr) == 1;
    if (!addr_ok || ::connect(s, reinterpret_cast<const sockaddr*>(&to), sizeof(to)) != 0) {
        std::fprintf(stderr, "[UDP] cannot target %s:%u\n", ip.c_str(), static_cast<unsigned>(port));
        close_socket(s);
        return;
    }
    _fd = static_cast<socket_t>(s);
    _ok = true;
}

UdpEventSink::~UdpEventSink() {
    if (_ok) close_socket(static_cast<native_socket>(_fd));
}

void UdpEventSink::on_whistle_start(double t) {
    WcePacketV1 p{};
    p.kind     = static_cast<uint8_t>(WceKind::START);
    p.start_us = to_us(t);
    send(p);
}

void UdpEventSink::on_event(const WhistleEvent& ev) {
    if (ev.accepted) ++_total;
    WcePacketV1 p{};
    p.kind        = static_cast<uint8_t>(WceKind::EVENT);
    p.accepted    = ev.accepted ? 1 : 0;
    p.count       = static_cast<uint32_t>(ev.count);
    p.start_us    = to_us(ev.start_time);
    p.end_us      = to_us(ev.end_time);
    p.duration_us = to_us(ev.duration);
    send(p);
}

void UdpEventSink::on_shutdown() {
    // STOP carries the final accepted total
    WcePacketV1 p{};
    p.kind  = static_cast<uint8_t>(WceKind::STOP);
    p.count = _total;
    send(p);
}

void UdpEventSink::send(WcePacketV1& p) {
    if (!_ok) return;
    p.seq = ++_seq;
    const auto n = ::send(static_cast<native_socket>(_fd),
                          reinterpret_cast<const char*>(&p), sizeof(p), 0);
    if (n != static_cast<decltype(n)>(sizeof(p))) ++_dropped; // full buffer / no listener
}

} // namespace wc
