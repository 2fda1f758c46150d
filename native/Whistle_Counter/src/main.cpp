// main.cpp: whistle_counter (IIO ADC / WAV / simulated input, console + UDP output)
#include "wc/config.hpp"
#include "wc/whistle_counter.hpp"
#include "wc/console_sink.hpp"
#include "wc/udp_event_sink.hpp"
#include "wc/wav_source.hpp"
#include "wc/synthetic_source.hpp"
#include "cli_features.hpp"

#include <string>
#include <cstdlib>
#include <cstdio>
#include <iostream>
#include <memory>
#include <atomic>
#include <csignal>
#include <stdexcept>
#include <utility>

// ------------------------------------------------------------
// Simple CLI
enum class Input { Iio, Wav, Simulate };

struct CliInput {
    Input       kind     = Input::Iio;
    wc::cli::IioInput iio;
    std::string wav_path;
    std::string udp;                       // "ip:port", empty = off
    bool        help     = false;
};

static void print_help() {
    std::puts(
"Usage: whistle_counter [options]\n"
"\n"
" Detection:\n"
"       --fs <int>            sample rate Hz (default 16000)\n"
"       --chunk <int>         samples per block (default 1024)\n"
"       --min <dbl>           minimum whistle length s (default 1.0)\n"
"       --max <dbl>           maximum whistle length s (default 15.0)\n"
"       --rise <dbl>          energy x noise floor to START a whistle (default 6)\n"
"       --fall <dbl>          energy x noise floor to END a whistle (default 3)\n"
"       --hold <dbl>          quiet seconds required to close (default 0.4)\n"
"       --alpha <dbl>         noise floor smoothing 0..1 (default 0.02)\n"
"       --warmup <dbl>        baseline learning period s (default 1.0)\n"
"       --fixed-floor <dbl>   start the floor at this value instead of the first block\n"
"       --freeze-floor        do not adapt the floor while a whistle is open\n"
"\n"
" Input (default: IIO ADC):\n"
"       --uri <str>           iio uri (local: | ip:192.168.1.10)\n"
"       --device <str>        iio ADC device name\n"
"       --channel <str>       iio input channel (default voltage0)\n"
"       --wav <path>          replay a WAV file instead\n"
"       --simulate            built-in synthetic signal\n"
"\n"
" Output:\n"
"       --udp <ip:port>       also send events as UDP datagrams\n"
"   -v, --verbose             per-block energy log and timing warnings\n"
"\n"
" Calibration:\n"
"       --calibrate <secs>    measure quiet/loud levels, print a --rise suggestion, exit\n"
"\n"
" Stop with Ctrl+C.\n"
    );
}

static bool parse_cli(int argc, char** argv, CliInput& in, wc::Params& p) {
    auto& d = p.detector;
    for (int i=1; i<argc; ++i) {
        std::string a = argv[i];
        auto need = [&](const char* what){
            if (i+1 >= argc) { std::fprintf(stderr,"missing value for %s\n", what); return false; }
            return true;
        };
        if (a=="-h" || a=="--help")          { in.help = true; return true; }
        else if (a=="--fs")                  { if(!need(a.c_str())) return false; d.sample_rate    = std::atoi(argv[++i]); }
        else if (a=="--chunk")               { if(!need(a.c_str())) return false; d.block_size     = std::atoi(argv[++i]); }
        else if (a=="--min")                 { if(!need(a.c_str())) return false; d.min_duration   = std::strtod(argv[++i], nullptr); }
        else if (a=="--max")                 { if(!need(a.c_str())) return false; d.max_duration   = std::strtod(argv[++i], nullptr); }
        else if (a=="--rise")                { if(!need(a.c_str())) return false; d.rise           = std::strtod(argv[++i], nullptr); }
        else if (a=="--fall")                { if(!need(a.c_str())) return false; d.fall           = std::strtod(argv[++i], nullptr); }
        else if (a=="--hold")                { if(!need(a.c_str())) return false; d.hold_seconds   = std::strtod(argv[++i], nullptr); }
        else if (a=="--alpha")               { if(!need(a.c_str())) return false; d.alpha          = std::strtod(argv[++i], nullptr); }
        else if (a=="--warmup")              { if(!need(a.c_str())) return false; d.warmup_seconds = std::strtod(argv[++i], nullptr); }
        else if (a=="--fixed-floor")         { if(!need(a.c_str())) return false; d.initial_floor  = std::strtod(argv[++i], nullptr);
                                               d.seed_from_first_block = false; }
        else if (a=="--freeze-floor")        { d.freeze_floor_in_whistle = true; }
        else if (a=="--uri")                 { if(!need(a.c_str())) return false; in.iio.uri     = argv[++i]; }
        else if (a=="--device")              { if(!need(a.c_str())) return false; in.iio.device  = argv[++i]; }
        else if (a=="--channel")             { if(!need(a.c_str())) return false; in.iio.channel = argv[++i]; }
        else if (a=="--wav")                 { if(!need(a.c_str())) return false; in.wav_path = argv[++i]; in.kind = Input::Wav; }
        else if (a=="--simulate")            { in.kind = Input::Simulate; }
        else if (a=="--udp")                 { if(!need(a.c_str())) return false; in.udp      = argv[++i]; }
        else if (a=="-v" || a=="--verbose")  { p.verbose = true; }
        else if (a=="--calibrate")           { if(!need(a.c_str())) return false; p.calib_seconds = std::strtod(argv[++i], nullptr); }
        else { std::fprintf(stderr, "unknown option: %s\n", a.c_str()); print_help(); return false; }
    }
    return true;
}

static bool split_host_port(const std::string& s, std::string& host, uint16_t& port) {
    const auto c = s.rfind(':');
    if (c == std::string::npos || c == 0 || c+1 >= s.size()) return false;
    const long v = std::strtol(s.c_str() + c + 1, nullptr, 10);
    if (v <= 0 || v > 65535) return false;
    host = s.substr(0, c);
    port = static_cast<uint16_t>(v);
    return true;
}

// Three whistles: accepted, too short, accepted
static wc::SyntheticConfig demo_signal(const wc::DetectorConfig& d) {
    wc::SyntheticConfig s;
    s.sample_rate   = d.sample_rate;
    s.block_size    = d.block_size;
    s.total_seconds = 22.0;
    s.noise_std     = 0.001;
    s.bursts = { {3.0, 3.0, 0.05, 3100.0},
                 {10.0, 0.4, 0.05, 3100.0},
                 {14.0, 5.0, 0.05, 3100.0} };
    return s;
}

// Ctrl+C -> stop_flag
static std::atomic<bool> g_stop{false};
static void on_sigint(int){ g_stop.store(true, std::memory_order_release); }

// ------------------------------------------------------------
int main(int argc, char** argv) {
    std::signal(SIGINT,  on_sigint);
#ifdef SIGTERM
    std::signal(SIGTERM, on_sigint);
#endif

    wc::Params p;
    CliInput in;
    if (!parse_cli(argc, argv, in, p)) {
        return 1;
    }
    if (in.help) { print_help(); return 0; }

    // Source
    std::unique_ptr<wc::ISource> src;
    switch (in.kind) {
    case Input::Wav: {
        auto wav = std::make_unique<wc::WavSource>(in.wav_path, p.detector.block_size);
        if (!wav->ok()) { std::cerr << "[ERR] WAV input unusable: " << in.wav_path << "\n"; return 1; }
        if (wav->sample_rate() != p.detector.sample_rate) {
            std::cout << "[INFO] Using file sample rate " << wav->sample_rate() << " Hz\n";
            p.detector.sample_rate = wav->sample_rate();
        }
        src = std::move(wav);
        break;
    }
    case Input::Simulate:
        src = std::make_unique<wc::SyntheticSource>(demo_signal(p.detector));
        break;
    case Input::Iio:
        break;
    }

    if (auto err = wc::validate(p.detector)) {
        std::cerr << "[ERR] " << *err << "\n";
        return 1;
    }

    if (in.kind == Input::Iio) {
        src = wc::cli::open_iio_source(in.iio, p.detector);
        if (!src) return 1;
    }

    const auto& d = p.detector;
    std::cout << "[INFO] Fs=" << d.sample_rate
              << " | Block=" << d.block_size
              << " | Len=[" << d.min_duration << ", " << d.max_duration << "]s"
              << " | Rise=" << d.rise << " | Fall=" << d.fall
              << " | Hold=" << d.hold_seconds << "s"
              << " | Alpha=" << d.alpha
              << " | Warmup=" << d.warmup_seconds << "s"
              << (d.seed_from_first_block ? "" : " | FixedFloor")
              << (d.freeze_floor_in_whistle ? " | FreezeFloor" : "")
              << "\n";

    // Calibration only
    if (p.calib_seconds > 0.0)
        return wc::cli::run_calibration(*src, p, g_stop);

    wc::ConsoleSink console;
    std::unique_ptr<wc::UdpEventSink> udp;
    if (!in.udp.empty()) {
        std::string host; uint16_t port = 0;
        if (!split_host_port(in.udp, host, port)) {
            std::cerr << "[ERR] --udp expects ip:port, got '" << in.udp << "'\n";
            return 1;
        }
        udp = std::make_unique<wc::UdpEventSink>(host, port);
        if (!udp->ok())
            std::cerr << "[WARN] UDP output disabled.\n";
        else
            std::cout << "[INFO] UDP events -> " << host << ":" << port << "\n";
    }

    try {
        wc::WhistleCounter counter(*src, p);
        counter.add_sink(console);
        if (udp && udp->ok()) counter.add_sink(*udp);

        std::cout << "Listening...  press Ctrl+C to exit.\n";
        const auto sum = counter.run(g_stop);

        if (p.verbose) {
            std::cout << "[INFO] blocks=" << sum.blocks
                      << " | accepted=" << sum.accepted
                      << " | rejected=" << sum.rejected
                      << " | anomalies=" << sum.anomalies
                      << " | overruns=" << sum.overruns << "\n";
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << "[ERR] " << e.what() << "\n";
        return 1;
    }
    return 0;
}
