#include <pipeline/switch_router.hpp>

#include <iostream>

namespace cs {
    const char* to_string(SwitchResult r) {
        switch (r) {
            case SwitchResult::Ack: return "ack";
            case SwitchResult::Busy: return "busy";
            case SwitchResult::Rejected: return "rejected";
            case SwitchResult::Timeout: return "timeout";
        }
        return "unknown";
    }

    const char* to_string(ChangeReason r) {
        switch (r) {
            case ChangeReason::Startup: return "startup";
            case ChangeReason::Command: return "command";
            case ChangeReason::Failover: return "failover";
            case ChangeReason::Recovery: return "recovery";
        }
        return "unknown";
    }

    ErrorCode SwitchReply::code() const {
        switch (result) {
            case SwitchResult::Ack: return ErrorCode::None;
            case SwitchResult::Busy: return ErrorCode::SwitchRejectedBusy;
            case SwitchResult::Timeout: return ErrorCode::SwitchTimeout;
            case SwitchResult::Rejected: return error != ErrorCode::None ? error : ErrorCode::PipelineError;
        }
        return ErrorCode::None;
    }

    SwitchRouter::SwitchRouter(IOutputSink& out, Options opt)
        : out_(out), opt_(opt) {}

    SwitchRouter::~SwitchRouter() {
        shutdown();
    }

    bool SwitchRouter::start(Error& err) {
        std::lock_guard lk(mtx_);
        if (started_ && !closed_) return true;
        if (writer_.joinable()) {
            err = Error(ErrorCode::PipelineError, "previous writer still running");
            return false;
        }
        if (!out_.is_open()) {
            err = Error(ErrorCode::PipelineError, "output sink is not open");
            return false;
        }
        format_ = out_.format();
        slots_ = {};
        active_.reset();
        pending_.reset();
        switching_ = false;
        commit_slot_ = nullptr;
        closed_ = false;
        started_ = true;
        out_q_.reset();
        writer_ = std::thread([this] { writer_loop_(); });
        return true;
    }

    void SwitchRouter::shutdown() {
        {
            std::lock_guard lk(mtx_);
            closed_ = true;
            switching_ = false;
            pending_.reset();
            active_.reset();
        }
        cv_.notify_all();
        out_q_.stop();

        if (writer_.joinable()) {
            if (writer_.get_id() == std::this_thread::get_id()) {
                writer_.detach();
            } else {
                writer_.join();
            }
        }
    }

    bool SwitchRouter::closed() const {
        std::lock_guard lk(mtx_);
        return closed_;
    }

    void SwitchRouter::on_active_changed(ChangeListener l) {
        std::lock_guard lk(listen_mtx_);
        change_listener_ = std::move(l);
    }

    void SwitchRouter::on_fatal(FatalListener l) {
        std::lock_guard lk(listen_mtx_);
        fatal_listener_ = std::move(l);
    }

    void SwitchRouter::emit_(const ActiveChange& c) {
        std::lock_guard ek(emit_mtx_);
        if (c.seq <= delivered_seq_) {
            std::cout << "[Router](emit_) change #" << c.seq << " overtaken by #" << delivered_seq_ << "\n";
            return;
        }
        delivered_seq_ = c.seq;

        std::cout << "[Router](emit_) active "
                  << (c.previous ? to_string(*c.previous) : "none") << " -> "
                  << (c.active ? to_string(*c.active) : "none")
                  << " (" << to_string(c.reason) << ")\n";
        ChangeListener l;
        {
            std::lock_guard lk(listen_mtx_);
            l = change_listener_;
        }
        if (l) l(c);
    }

    void SwitchRouter::attach_source(SourceSlot slot, const FrameFormat& delivered) {
        std::lock_guard lk(mtx_);
        auto& s = slots_[index_of(slot)];
        s.attached = true;
        s.format = delivered;
    }

    bool SwitchRouter::conforms_(SourceSlot slot) const {
        const auto& s = slots_[index_of(slot)];
        return s.attached && s.format == format_;
    }

    // caller holds mtx_ and has checked !conforms_(slot)
    SwitchReply SwitchRouter::reject_(SourceSlot slot) const {
        const auto& s = slots_[index_of(slot)];
        if (!s.attached) {
            return {SwitchResult::Rejected, std::string("source ") + to_string(slot) + " is not running",
                    ErrorCode::PipelineError};
        }
        return {SwitchResult::Rejected,
                "format " + s.format.describe() + " does not match output " + format_.describe(),
                ErrorCode::FormatNegotiationFailed};
    }

    bool SwitchRouter::attached(SourceSlot slot) const {
        std::lock_guard lk(mtx_);
        return slots_[index_of(slot)].attached;
    }

    RouterState SwitchRouter::state() const {
        std::lock_guard lk(mtx_);
        if (switching_) return RouterState::Switching;
        if (active_) return RouterState::Routed;
        return RouterState::Idle;
    }

    std::optional<SourceSlot> SwitchRouter::active() const {
        std::lock_guard lk(mtx_);
        return active_;
    }

    std::optional<SourceSlot> SwitchRouter::pending() const {
        std::lock_guard lk(mtx_);
        return pending_;
    }

    SwitchReply SwitchRouter::select(SourceSlot slot, ChangeReason reason) {
        ActiveChange change;
        {
            std::lock_guard lk(mtx_);
            if (closed_ || !started_) return {SwitchResult::Rejected, "router is not running"};
            if (switching_) return {SwitchResult::Busy, "switch in progress"};
            if (active_ == slot) return {SwitchResult::Ack, "already active"};
            if (active_) {
                return {SwitchResult::Rejected, std::string("already routed to ") + to_string(*active_)};
            }
            if (!conforms_(slot)) return reject_(slot);
            active_ = slot;
            change = ActiveChange{std::nullopt, slot, reason, ++change_seq_};
        }
        emit_(change);
        return {SwitchResult::Ack, ""};
    }

    SwitchReply SwitchRouter::switch_to(SourceSlot target) {
        std::unique_lock lk(mtx_);
        if (closed_ || !started_) return {SwitchResult::Rejected, "router is not running"};
        if (switching_) {
            return {SwitchResult::Busy, std::string("switch to ") + to_string(*pending_) + " in progress"};
        }
        if (!active_) {
            lk.unlock();
            return select(target, ChangeReason::Command);
        }
        if (*active_ == target) return {SwitchResult::Ack, "already active"};
        if (!conforms_(target)) return reject_(target);

        const SourceSlot from = *active_;
        switching_ = true;
        pending_ = target;

        // the commit itself happens in on_frame when the first conforming frame of target arrives
        std::optional<ActiveChange> committed;
        commit_slot_ = &committed;
        const bool woke = cv_.wait_for(lk, opt_.switch_timeout, [&] {
            return closed_ || committed || !switching_ || commit_slot_ != &committed;
        });
        if (commit_slot_ == &committed) commit_slot_ = nullptr;

        if (committed) {
            const bool held = active_ == target;
            lk.unlock();
            std::cout << "[Router](switch_to) committed " << to_string(target) << "\n";
            emit_(*committed);
            if (held) return {SwitchResult::Ack, ""};
            return {SwitchResult::Rejected, std::string("source ") + to_string(target) + " lost right after the switch",
                    ErrorCode::DeviceDisconnected};
        }
        if (closed_) {
            return {SwitchResult::Rejected, "router shut down during switch"};
        }
        if (woke) {
            // target was lost while pending, active is untouched
            return {SwitchResult::Rejected, std::string("source ") + to_string(target) + " lost during switch",
                    ErrorCode::DeviceDisconnected};
        }

        switching_ = false;
        pending_.reset();
        std::optional<ActiveChange> change;
        if (!slots_[index_of(from)].attached) {
            // the previous source failed while we waited, nothing to roll back to
            active_.reset();
            change = ActiveChange{from, std::nullopt, ChangeReason::Failover, ++change_seq_};
        }
        lk.unlock();

        std::cerr << "[Router](switch_to) no frame from " << to_string(target) << " within "
                  << opt_.switch_timeout.count() << " ms, staying on " << to_string(from) << "\n";
        if (change) emit_(*change);
        return {SwitchResult::Timeout,
                std::string("no frame from ") + to_string(target) + " within " +
                std::to_string(opt_.switch_timeout.count()) + " ms"};
    }

    SwitchReply SwitchRouter::fail_over(SourceSlot lost) {
        ActiveChange change;
        SwitchReply reply;
        {
            std::lock_guard lk(mtx_);
            slots_[index_of(lost)].attached = false;

            if (pending_ == lost) {
                switching_ = false;
                pending_.reset();
                cv_.notify_all();
            }
            if (closed_) return {SwitchResult::Rejected, "router is not running"};
            if (active_ != lost) return {SwitchResult::Ack, "lost source was not active"};

            const SourceSlot standby = other(lost);
            if (switching_) {
                // the pending swap to the standby completes or times out into Idle
                return {SwitchResult::Ack, std::string("switch to ") + to_string(standby) + " in progress"};
            }
            if (conforms_(standby)) {
                active_ = standby;
                change = ActiveChange{lost, standby, ChangeReason::Failover, ++change_seq_};
            } else {
                active_.reset();
                change = ActiveChange{lost, std::nullopt, ChangeReason::Failover, ++change_seq_};
                reply = {SwitchResult::Rejected, std::string("standby ") + to_string(standby) + " is not running",
                         ErrorCode::PipelineError};
            }
        }
        emit_(change);
        return reply;
    }

    void SwitchRouter::on_frame(const FramePtr& frame) {
        if (!frame) return;
        const SourceSlot slot = frame->source;

        std::lock_guard lk(mtx_);
        if (closed_) return;
        if (!slots_[index_of(slot)].attached || frame->format != format_) return;

        if (switching_ && pending_ == slot) {
            const ActiveChange c{active_, slot, ChangeReason::Command, ++change_seq_};
            active_ = slot;
            pending_.reset();
            switching_ = false;
            if (commit_slot_) *commit_slot_ = c;
            out_q_.push_drop_oldest(frame);
            cv_.notify_all();
            return;
        }

        if (active_ == slot) {
            out_q_.push_drop_oldest(frame);
        }
    }

    void SwitchRouter::writer_loop_() {
        const auto interval = format_.frame_interval();
        FramePtr last;

        while (true) {
            FramePtr f;
            bool repeat = false;
            if (!out_q_.pop_for(f, interval)) {
                if (out_q_.stopped()) break;
                if (!opt_.hold_last_frame || !last) continue;
                {
                    std::lock_guard lk(mtx_);
                    if (closed_ || active_ != last->source) continue;
                }
                f = last;
                repeat = true;
            }

            Error err;
            if (!out_.write(*f, err)) {
                if (err.code != ErrorCode::OutputWriteFailed) err.code = ErrorCode::OutputWriteFailed;
                std::cerr << "[Router](writer_loop_) " << err.describe() << "\n";
                {
                    std::lock_guard lk(mtx_);
                    closed_ = true;
                    switching_ = false;
                    pending_.reset();
                    active_.reset();
                }
                cv_.notify_all();
                out_q_.stop();

                FatalListener l;
                {
                    std::lock_guard lk(listen_mtx_);
                    l = fatal_listener_;
                }
                if (l) l(err);
                break;
            }

            last = std::move(f);
            written_.fetch_add(1, std::memory_order_relaxed);
            if (repeat) repeated_.fetch_add(1, std::memory_order_relaxed);
        }
    }
}
