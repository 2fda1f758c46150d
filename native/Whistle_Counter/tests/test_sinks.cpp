#include <catch2/catch.hpp>
#include "wc/console_sink.hpp"
#include "wc/udp_event_sink.hpp"

#include <cstdint>
#include <cstdio>
#include <cstring>
#include <string>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace {

std::string slurp(std::FILE* f) {
    std::fflush(f);
    std::rewind(f);
    std::string s;
    char buf[256];
    size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) s.append(buf, n);
    return s;
}

wc::WhistleEvent event(double start, double end, bool accepted, int count) {
    wc::WhistleEvent ev;
    ev.start_time = start;
    ev.end_time   = end;
    ev.duration   = end - start;
    ev.accepted   = accepted;
    ev.count      = count;
    return ev;
}

// Unpacked copy of a datagram; packed fields cannot bind to references
struct Packet {
    uint32_t magic = 0;
    uint64_t seq = 0;
    uint8_t  kind = 0;
    uint8_t  accepted = 0;
    uint32_t count = 0;
    int64_t  start_us = 0;
    int64_t  end_us = 0;
    int64_t  duration_us = 0;
};

// Loopback receiver on an ephemeral port
struct Receiver {
    Receiver() {
        fd = ::socket(AF_INET, SOCK_DGRAM, 0);
        sockaddr_in sa{};
        sa.sin_family = AF_INET;
        sa.sin_port   = 0;
        sa.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        ::bind(fd, reinterpret_cast<sockaddr*>(&sa), sizeof(sa));
        socklen_t len = sizeof(sa);
        ::getsockname(fd, reinterpret_cast<sockaddr*>(&sa), &len);
        port = ntohs(sa.sin_port);
        timeval tv{1, 0};
        ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    }
    ~Receiver() { if (fd >= 0) ::close(fd); }

    bool recv(Packet& out) {
        wc::WcePacketV1 p{};
        const ssize_t n = ::recv(fd, &p, sizeof(p), 0);
        if (n != static_cast<ssize_t>(sizeof(p))) return false;
        out.magic       = p.magic;
        out.seq         = p.seq;
        out.kind        = p.kind;
        out.accepted    = p.accepted;
        out.count       = p.count;
        out.start_us    = p.start_us;
        out.end_us      = p.end_us;
        out.duration_us = p.duration_us;
        return true;
    }

    int fd = -1;
    uint16_t port = 0;
};

} // namespace

TEST_CASE("console sink prints starts, events and the final total", "[sink]") {
    std::FILE* out = std::tmpfile();
    std::FILE* err = std::tmpfile();
    REQUIRE(out);
    REQUIRE(err);

    {
        wc::ConsoleSink sink(out, err);
        sink.on_whistle_start(3.2);
        sink.on_event(event(3.2, 6.5, true, 1));
        sink.on_event(event(10.0, 10.6, false, 0));
        sink.on_capture_anomaly(wc::CaptureStatus::Overflow, 12.0);
        sink.on_shutdown();

        REQUIRE(sink.accepted_total() == 1);
        REQUIRE(sink.rejected_total() == 1);
    }

    const std::string o = slurp(out);
    CHECK(o.find("[  3.20s] Whistle start") != std::string::npos);
    CHECK(o.find("[  6.50s] Whistle #1  duration 3.30s") != std::string::npos);
    CHECK(o.find("Ignored whistle (0.60s out of range)") != std::string::npos);
    CHECK(o.find("Stopped. Total whistles counted: 1") != std::string::npos);
    CHECK(o.find("WARN") == std::string::npos);

    const std::string e = slurp(err);
    CHECK(e.find("[WARN] [ 12.00s]") != std::string::npos);

    std::fclose(out);
    std::fclose(err);
}

TEST_CASE("udp sink emits one datagram per notification", "[sink][udp]") {
    Receiver rx;
    REQUIRE(rx.fd >= 0);
    REQUIRE(rx.port != 0);

    wc::UdpEventSink sink("127.0.0.1", rx.port);
    REQUIRE(sink.ok());

    sink.on_whistle_start(3.2);
    sink.on_event(event(3.2, 6.5, true, 1));
    sink.on_event(event(10.0, 10.5, false, 0));
    sink.on_shutdown();

    Packet p;
    REQUIRE(rx.recv(p));
    CHECK(p.magic == 0x31454357u);
    CHECK(p.seq == 1);
    CHECK(p.kind == static_cast<uint8_t>(wc::WceKind::START));
    CHECK(p.start_us == 3200000);

    REQUIRE(rx.recv(p));
    CHECK(p.seq == 2);
    CHECK(p.kind == static_cast<uint8_t>(wc::WceKind::EVENT));
    CHECK(p.accepted == 1);
    CHECK(p.count == 1);
    CHECK(p.end_us == 6500000);
    CHECK(p.duration_us == 3300000);

    REQUIRE(rx.recv(p));
    CHECK(p.accepted == 0);
    CHECK(p.count == 0);
    CHECK(p.duration_us == 500000);

    REQUIRE(rx.recv(p));
    CHECK(p.seq == 4);
    CHECK(p.kind == static_cast<uint8_t>(wc::WceKind::STOP));
    CHECK(p.count == 1);

    CHECK(sink.dropped() == 0);
}

TEST_CASE("udp sink with a bad address stays inert", "[sink][udp]") {
    wc::UdpEventSink sink("not-an-ip", 9000);
    REQUIRE_FALSE(sink.ok());
    REQUIRE_NOTHROW(sink.on_event(event(0.0, 3.0, true, 1)));
    REQUIRE_NOTHROW(sink.on_shutdown());
    REQUIRE(sink.dropped() == 0);
}

TEST_CASE("packet layout is packed", "[sink][udp]") {
    REQUIRE(sizeof(wc::WcePacketV1) == 4 + 8 + 1 + 1 + 2 + 4 + 8 + 8 + 8);
}
