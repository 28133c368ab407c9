#include "acquisition/engine.hpp"
#include "aqwave/codes.hpp"
#include "aqwave/device.hpp"
#include "aqwave/errors.hpp"
#include "aqwave/types.hpp"
#include "hardware/serial_port.hpp"
#include "logging/csv_writer.hpp"
#include "logging/spsc_ring.hpp"
#include "streaming/server.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <csignal>
#include <memory>

// Async-signal-safe shutdown flag (not std::atomic<bool>, volatile sig_atomic_t is correct here)
static volatile sig_atomic_t g_running = 1;

static void signal_handler(int /*sig*/) {
    g_running = 0;
}

// --- Argument parsing ---

struct Args {
    char device[128] = "/dev/ttyUSB0";
    int samples = 60 * 30;          // 30 s at 60 Hz
    double timeout_sec = aqwave::DEFAULT_TIMEOUT_SEC;
    const char* csv_path = nullptr;       // live samples
    const char* download_path = nullptr;  // stored recording
    bool check_recording = false;
    bool stream = true;
    char host[64] = "0.0.0.0";
    int port = 8889;
};

static void print_usage(const char* prog) {
    std::printf("Usage: %s [--device PATH] [--samples N] [--timeout SEC]\n"
                "          [--csv FILE] [--download FILE] [--check-recording]\n"
                "          [--no-stream] [--host ADDR] [--port PORT]\n\n"
                "Default: /dev/ttyUSB0, 1800 samples (30 s @ 60 Hz), 2 s timeout\n"
                "         TCP relay on 0.0.0.0:8889, no CSV\n\n"
                "  --device PATH      serial device (USB-serial cable or rfcomm)\n"
                "  --samples N        live samples to acquire, 0 skips streaming\n"
                "  --csv FILE         write live samples to FILE\n"
                "  --download FILE    download the stored recording to FILE first\n"
                "  --check-recording  check whether the device is recording\n"
                "                     (takes up to one timeout)\n"
                "  --no-stream        disable the TCP relay\n", prog);
}

static Args parse_args(int argc, char* argv[]) {
    Args args;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--device") == 0 && i + 1 < argc) {
            std::strncpy(args.device, argv[++i], sizeof(args.device) - 1);
        } else if (std::strcmp(argv[i], "--samples") == 0 && i + 1 < argc) {
            args.samples = static_cast<int>(std::strtol(argv[++i], nullptr, 10));
        } else if (std::strcmp(argv[i], "--timeout") == 0 && i + 1 < argc) {
            args.timeout_sec = std::strtod(argv[++i], nullptr);
        } else if (std::strcmp(argv[i], "--csv") == 0 && i + 1 < argc) {
            args.csv_path = argv[++i];
        } else if (std::strcmp(argv[i], "--download") == 0 && i + 1 < argc) {
            args.download_path = argv[++i];
        } else if (std::strcmp(argv[i], "--check-recording") == 0) {
            args.check_recording = true;
        } else if (std::strcmp(argv[i], "--no-stream") == 0) {
            args.stream = false;
        } else if (std::strcmp(argv[i], "--host") == 0 && i + 1 < argc) {
            std::strncpy(args.host, argv[++i], sizeof(args.host) - 1);
        } else if (std::strcmp(argv[i], "--port") == 0 && i + 1 < argc) {
            args.port = static_cast<int>(std::strtol(argv[++i], nullptr, 10));
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            print_usage(argv[0]);
            std::exit(0);
        } else {
            std::fprintf(stderr, "Error: unknown or incomplete argument '%s'\n", argv[i]);
            print_usage(argv[0]);
            std::exit(1);
        }
    }

    if (args.samples < 0) args.samples = 0;
    if (args.timeout_sec <= 0) args.timeout_sec = aqwave::DEFAULT_TIMEOUT_SEC;

    return args;
}

// --- Phases ---

static aqwave::DeviceInfo query_metadata(aqwave::AQWaveDevice& dev, bool check_recording) {
    aqwave::DeviceInfo info = dev.get_info();
    std::printf("  Device:       %s\n", info.device.c_str());
    std::printf("  Product:      %s\n", info.product.c_str());
    std::printf("  Manufacturer: %s\n", info.manufacturer.c_str());
    std::printf("  User ID:      %s / %s\n", info.user_id_1.c_str(), info.user_id_2.c_str());

    uint32_t counter = dev.get_recording_counter();
    std::printf("  Recording counter: %u s\n", counter);

    aqwave::RecordingSettings rt = dev.get_recording_time();
    std::printf("  Recording started: %02d:%02d\n", rt.hour, rt.minute);

    if (check_recording) {
        bool rec = dev.is_recording();
        std::printf("  Recording in progress: %s\n", rec ? "yes" : "no");
    }
    return info;
}

static bool download_recording(aqwave::AQWaveDevice& dev, const char* path) {
    std::printf("\nDownloading stored recording (device is blocked meanwhile)...\n");
    aqwave::RecordedData data = dev.recorded_data();
    std::printf("  %zu samples received\n", data.heart_rate.size());

    if (!aqwave::write_recording_csv(path, data)) {
        std::fprintf(stderr, "Failed to write %s\n", path);
        return false;
    }
    std::printf("  Written to %s [OK]\n", path);
    return true;
}

// --- Main ---

int main(int argc, char* argv[]) {
    Args args = parse_args(argc, argv);

    std::printf("\n============================================================\n"
                "AQWAVE RX101 RECORDER\n"
                "============================================================\n"
                "Device: %s @ %d baud, timeout %.1fs\n"
                "Samples: %d%s%s\n\n",
                args.device, aqwave::SERIAL_BAUD, args.timeout_sec,
                args.samples,
                args.csv_path ? ", CSV: " : "",
                args.csv_path ? args.csv_path : "");

    // SIGPIPE: disconnected TCP client must not kill the process
    signal(SIGPIPE, SIG_IGN);

    struct sigaction sa{};
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    aqwave::SerialPort port(args.device, aqwave::SERIAL_BAUD, args.timeout_sec);
    if (!port.is_open()) {
        std::fprintf(stderr, "Failed to open %s\n", args.device);
        return 1;
    }

    aqwave::AQWaveDevice dev(port);

    try {
        std::printf("Querying device...\n");
        aqwave::DeviceInfo info = query_metadata(dev, args.check_recording);

        if (args.download_path && g_running) {
            if (!download_recording(dev, args.download_path)) return 1;
        }

        if (args.samples == 0 || !g_running) {
            std::printf("\nDone.\n");
            return 0;
        }

        std::printf("\n============================================================\n"
                    "LIVE ACQUISITION (Ctrl+C to stop)\n"
                    "============================================================\n");

        auto ring = std::make_unique<aqwave::SPSCRing<aqwave::DataSample>>();
        std::unique_ptr<aqwave::CSVWriter> csv;
        if (args.csv_path) {
            csv = std::make_unique<aqwave::CSVWriter>(args.csv_path, *ring);
            if (!csv->is_open()) {
                std::fprintf(stderr, "Failed to open %s\n", args.csv_path);
                return 1;
            }
            csv->start();
        }

        std::unique_ptr<aqwave::StreamingServer> server;
        if (args.stream) {
            server = std::make_unique<aqwave::StreamingServer>(info);
            if (!server->start(args.host, args.port)) {
                std::fprintf(stderr, "  [STREAM] Relay disabled\n");
                server.reset();
            }
        }

        aqwave::AcquisitionEngine engine(dev);
        if (csv) engine.set_csv_ring(ring.get());
        if (server) engine.set_streaming_server(server.get());

        aqwave::AcquisitionEngine::Stats stats = engine.run(args.samples, g_running);

        if (server) server->stop();
        if (csv) csv->stop();

        std::printf("\n  Acquired %lu samples in %.1fs%s\n",
                    static_cast<unsigned long>(stats.total_samples), stats.runtime_sec,
                    stats.cancelled ? " (cancelled)" : "");
        if (stats.stop_warning) {
            std::printf("  Stop acknowledgment anomaly: %s\n",
                        stats.stop_warning->message().c_str());
        }
    } catch (const aqwave::ProtocolError& e) {
        std::fprintf(stderr, "\n[FAIL] %s\n", e.what());
        return 1;
    }

    std::printf("\nDone.\n");
    return 0;
}
