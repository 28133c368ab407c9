#pragma once

#include "aqwave/errors.hpp"
#include "aqwave/types.hpp"

#include <cstddef>
#include <functional>
#include <iterator>
#include <optional>

namespace aqwave {

class CommandSession;

// Continuous DATA acquisition: START, n x 9-byte DATA packets with a
// KEEP_ALIVE after every 60th sample, then STOP + 2-byte acknowledgment.
//
// Lazy and single-pass: START goes out on the first next(). The stop
// sequence runs exactly once on every way out of the stream:
//   - next() called after the n-th sample,
//   - finish(),
//   - destruction while still running (consumer stopped early),
//   - an error inside next() (stop runs first, then the error is rethrown).
// Leaving the device streaming would make every later query read stale
// DATA packets as its response.
//
// Holds the session exclusively for its lifetime.
class DataStream {
public:
    enum class State {
        IDLE,       // nothing sent yet
        STARTED,    // START sent, no sample yet
        EMITTING,   // at least one sample delivered
        STOPPING,   // stop sequence in progress (or failed)
        DONE,
    };

    using WarningHandler = std::function<void(const SoftAcknowledgmentMismatch&)>;

    // on_warning receives the stop-ack mismatch. Null: print to stderr.
    DataStream(CommandSession& session, int n, WarningHandler on_warning = nullptr);
    ~DataStream();

    DataStream(const DataStream&) = delete;
    DataStream& operator=(const DataStream&) = delete;

    // Fetch the next sample. Returns false once the stream is over
    // (the stop sequence has run by then).
    bool next(DataSample& out);

    // End the stream now. Runs the stop sequence if the stream was started
    // and not stopped yet; stop failures propagate. Returns the stop-ack
    // warning, if any. Idempotent.
    std::optional<SoftAcknowledgmentMismatch> finish();

    // Input iterator for range-for. Leaving the loop early and then
    // destroying the stream cancels it.
    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type        = DataSample;
        using difference_type   = std::ptrdiff_t;
        using pointer           = const DataSample*;
        using reference         = const DataSample&;

        Iterator() : stream_(nullptr), sample_{} {}
        explicit Iterator(DataStream* stream) : stream_(stream), sample_{} { advance(); }

        reference operator*() const { return sample_; }
        pointer operator->() const { return &sample_; }

        Iterator& operator++() {
            advance();
            return *this;
        }

        bool operator==(const Iterator& other) const { return stream_ == other.stream_; }
        bool operator!=(const Iterator& other) const { return stream_ != other.stream_; }

    private:
        void advance() {
            if (stream_ && !stream_->next(sample_)) {
                stream_ = nullptr;
            }
        }

        DataStream* stream_;
        DataSample sample_;
    };

    Iterator begin() { return Iterator(this); }
    Iterator end() { return Iterator(); }

    State state() const { return state_; }
    int target() const { return n_; }
    int emitted() const { return emitted_; }
    int keepalives_sent() const { return keepalives_; }
    const std::optional<SoftAcknowledgmentMismatch>& warning() const { return warning_; }

private:
    void run_stop();
    void stop_after_error();

    CommandSession& session_;
    int n_;
    int emitted_;
    int keepalives_;
    State state_;
    WarningHandler on_warning_;
    std::optional<SoftAcknowledgmentMismatch> warning_;
};

} // namespace aqwave
