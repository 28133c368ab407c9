#include "acquisition/data_stream.hpp"
#include "aqwave/codes.hpp"
#include "aqwave/command_session.hpp"

#include <cstdio>
#include <exception>
#include <time.h>
#include <utility>

namespace aqwave {

static double clock_realtime() {
    struct timespec ts;
    clock_gettime(CLOCK_REALTIME, &ts);
    return ts.tv_sec + ts.tv_nsec * 1e-9;
}

DataStream::DataStream(CommandSession& session, int n, WarningHandler on_warning)
    : session_(session)
    , n_(n)
    , emitted_(0)
    , keepalives_(0)
    , state_(State::IDLE)
    , on_warning_(std::move(on_warning))
{
}

DataStream::~DataStream() {
    if (state_ == State::IDLE || state_ == State::DONE || state_ == State::STOPPING) {
        return;
    }
    try {
        finish();
    } catch (const std::exception& e) {
        std::fprintf(stderr, "  [ACQ] Stop sequence failed during cleanup: %s\n", e.what());
    }
}

bool DataStream::next(DataSample& out) {
    if (state_ == State::DONE || state_ == State::STOPPING) return false;

    if (emitted_ >= n_ && state_ != State::IDLE) {
        finish();
        return false;
    }

    try {
        if (state_ == State::IDLE) {
            state_ = State::STARTED;
            session_.send_command(Cmd::START);
            // No response to START, the first DATA packet follows directly
            if (n_ <= 0) {
                finish();
                return false;
            }
        }

        DecodedPacket pkt = session_.read_packet(DATA_PACKET_LEN, PacketType::DATA);

        // values[5] and values[6] carry nothing useful (always 255 so far)
        out.timestamp  = clock_realtime();
        out.pulse      = pkt.values[0];
        out.ppg        = pkt.values[1];
        out.ppg_alt    = pkt.values[2];
        out.heart_rate = pkt.values[3];
        out.spo2       = pkt.values[4];

        ++emitted_;
        state_ = State::EMITTING;

        // The device answers nothing to KEEP_ALIVE
        if (emitted_ % KEEPALIVE_INTERVAL == 0) {
            session_.send_command(Cmd::KEEP_ALIVE);
            ++keepalives_;
        }
    } catch (...) {
        stop_after_error();
        throw;
    }

    return true;
}

std::optional<SoftAcknowledgmentMismatch> DataStream::finish() {
    if (state_ == State::DONE || state_ == State::STOPPING) return warning_;

    if (state_ == State::IDLE) {
        // Never started: the device is not streaming, nothing to stop
        state_ = State::DONE;
        return warning_;
    }

    state_ = State::STOPPING;
    try {
        run_stop();
    } catch (...) {
        state_ = State::DONE;
        throw;
    }
    state_ = State::DONE;
    return warning_;
}

void DataStream::run_stop() {
    session_.send_command(Cmd::STOP);

    // The acknowledgment shape is unreliable: a wrong type is only a warning
    DecodedPacket ack = session_.read_packet(STOP_ACK_LEN);
    if (ack.type_is(PacketType::OK)) return;

    warning_ = SoftAcknowledgmentMismatch{static_cast<uint8_t>(PacketType::OK), ack.type};
    if (on_warning_) {
        on_warning_(*warning_);
    } else {
        std::fprintf(stderr, "  [ACQ] WARNING: %s\n", warning_->message().c_str());
    }
}

void DataStream::stop_after_error() {
    // The original error wins; a failing stop is only logged
    try {
        finish();
    } catch (const std::exception& e) {
        std::fprintf(stderr, "  [ACQ] Stop sequence failed after error: %s\n", e.what());
    }
}

} // namespace aqwave
