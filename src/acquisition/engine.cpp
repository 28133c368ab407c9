#include "acquisition/engine.hpp"
#include "acquisition/data_stream.hpp"
#include "aqwave/device.hpp"
#include "streaming/server.hpp"

#include <cstdio>
#include <time.h>

namespace aqwave {

double AcquisitionEngine::clock_now() {
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return ts.tv_sec + ts.tv_nsec * 1e-9;
}

AcquisitionEngine::AcquisitionEngine(AQWaveDevice& device)
    : device_(device)
{
    reset();
}

void AcquisitionEngine::reset() {
    total_samples_ = 0;
    drop_count_ = 0;
    keepalives_ = 0;
    min_dt_ms_ = 1e9;
    max_dt_ms_ = 0;
    start_time_ = clock_now();
    last_sample_time_ = 0;
    cancelled_ = false;
    stop_warning_.reset();
    last_stats_time_ = start_time_;
}

void AcquisitionEngine::print_stats() {
    double elapsed = clock_now() - start_time_;
    double rate = (total_samples_ > 0 && elapsed > 0) ? total_samples_ / elapsed : 0;

    std::printf("  [%6.0fs] samples=%lu rate=%.1fHz dt=%.1f/%.1fms keepalives=%d drops=%lu\n",
                elapsed,
                static_cast<unsigned long>(total_samples_),
                rate,
                total_samples_ > 1 ? min_dt_ms_ : 0.0, max_dt_ms_,
                keepalives_,
                static_cast<unsigned long>(drop_count_));

    if (streaming_) {
        auto ss = streaming_->get_stats();
        std::printf("           stream: sent=%lu batches=%lu drops=%lu queued=%zu %s\n",
                    static_cast<unsigned long>(ss.samples_sent),
                    static_cast<unsigned long>(ss.batches_sent),
                    static_cast<unsigned long>(ss.drops),
                    ss.ring_queued,
                    ss.connected ? "[connected]" : "[no client]");
    }
}

AcquisitionEngine::Stats AcquisitionEngine::run(int n, const volatile sig_atomic_t& running) {
    reset();

    DataStream stream = device_.data(n, [this](const SoftAcknowledgmentMismatch& w) {
        stop_warning_ = w;
        std::fprintf(stderr, "  [ENGINE] WARNING: %s\n", w.message().c_str());
    });

    std::printf("  [ENGINE] Streaming %d samples (keepalive every %d)\n", n, KEEPALIVE_INTERVAL);

    DataSample sample;
    while (running) {
        if (!stream.next(sample)) break;

        double now = clock_now();
        if (last_sample_time_ > 0) {
            double dt_ms = (now - last_sample_time_) * 1000.0;
            if (dt_ms < min_dt_ms_) min_dt_ms_ = dt_ms;
            if (dt_ms > max_dt_ms_) max_dt_ms_ = dt_ms;
        }
        last_sample_time_ = now;

        if (csv_ring_ && !csv_ring_->try_push(sample)) {
            drop_count_++;
        }
        if (streaming_) {
            streaming_->push_sample(sample);
        }
        if (hook_) {
            hook_(sample, total_samples_);
        }

        total_samples_++;
        keepalives_ = stream.keepalives_sent();

        if (now - last_stats_time_ >= STATS_INTERVAL_SEC) {
            print_stats();
            last_stats_time_ = now;
        }
    }

    if (!running && stream.emitted() < n) {
        cancelled_ = true;
        std::printf("  [ENGINE] Cancelled after %lu of %d samples, stopping device\n",
                    static_cast<unsigned long>(total_samples_), n);
    }

    // Explicit so a failing stop reaches the caller instead of the log
    stream.finish();
    keepalives_ = stream.keepalives_sent();

    print_stats();
    return get_stats();
}

AcquisitionEngine::Stats AcquisitionEngine::get_stats() const {
    Stats s{};
    s.total_samples = total_samples_;
    s.drop_count = drop_count_;
    s.keepalives = keepalives_;
    s.min_dt_ms = min_dt_ms_;
    s.max_dt_ms = max_dt_ms_;
    s.runtime_sec = clock_now() - start_time_;
    s.cancelled = cancelled_;
    s.stop_warning = stop_warning_;
    return s;
}

} // namespace aqwave
