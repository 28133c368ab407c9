#pragma once

#include "aqwave/errors.hpp"
#include "aqwave/types.hpp"
#include "logging/spsc_ring.hpp"

#include <csignal>
#include <cstdint>
#include <functional>
#include <optional>
#include <utility>

namespace aqwave {

class AQWaveDevice;
class StreamingServer;

// Recorder loop: pulls n samples from the device stream and fans them out
// to the CSV ring and the TCP relay. Clearing `running` (signal handler)
// ends the stream early; the device is still stopped before run() returns.
class AcquisitionEngine {
public:
    using SampleHook = std::function<void(const DataSample&, uint64_t index)>;

    explicit AcquisitionEngine(AQWaveDevice& device);

    // Optional sinks, set before run()
    void set_csv_ring(SPSCRing<DataSample>* ring) { csv_ring_ = ring; }
    void set_streaming_server(StreamingServer* s) { streaming_ = s; }
    void set_sample_hook(SampleHook hook) { hook_ = std::move(hook); }

    struct Stats {
        uint64_t total_samples;
        uint64_t drop_count;
        int      keepalives;
        double   min_dt_ms;
        double   max_dt_ms;
        double   runtime_sec;
        bool     cancelled;
        std::optional<SoftAcknowledgmentMismatch> stop_warning;
    };

    // Stream n samples. Protocol errors propagate after the stop sequence.
    Stats run(int n, const volatile sig_atomic_t& running);

    Stats get_stats() const;

private:
    AQWaveDevice& device_;
    SPSCRing<DataSample>* csv_ring_ = nullptr;
    StreamingServer* streaming_ = nullptr;
    SampleHook hook_;

    uint64_t total_samples_;
    uint64_t drop_count_;
    int      keepalives_;
    double   min_dt_ms_;
    double   max_dt_ms_;
    double   start_time_;
    double   last_sample_time_;
    bool     cancelled_;
    std::optional<SoftAcknowledgmentMismatch> stop_warning_;

    static constexpr double STATS_INTERVAL_SEC = 10.0;
    double last_stats_time_;

    void reset();
    void print_stats();
    static double clock_now();
};

} // namespace aqwave
