#pragma once

#include <common/errors.hpp>
#include <output/output_sink.hpp>
#include <pipeline/bounded_queue.hpp>
#include <pipeline/types.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace cs {
    enum class SwitchResult { Ack, Busy, Rejected, Timeout };
    const char* to_string(SwitchResult r);

    struct SwitchReply {
        SwitchResult result = SwitchResult::Ack;
        std::string reason;
        ErrorCode error = ErrorCode::None; // cause of a rejection

        bool ok() const { return result == SwitchResult::Ack; }
        // Busy -> SwitchRejectedBusy, Timeout -> SwitchTimeout, Rejected -> error or PipelineError
        ErrorCode code() const;
    };

    enum class ChangeReason { Startup, Command, Failover, Recovery };
    const char* to_string(ChangeReason r);

    struct ActiveChange {
        std::optional<SourceSlot> previous;
        std::optional<SourceSlot> active;
        ChangeReason reason = ChangeReason::Command;
        uint64_t seq = 0; // commit order
    };

    // Holds the single active source and forwards its frames to the output.
    //
    // Frame delivery (on_frame) and the swap commit share one mutex, so a swap
    // is linearizable with respect to delivery: every frame before the commit
    // comes from the old source, every frame after it from the new one. A
    // writer thread drains a single-slot queue into the output sink and
    // repeats the last frame when the active source misses a frame interval.
    //
    // Changes are numbered when they happen under the mutex and delivered to
    // the listener one at a time; a change overtaken by a later one is not
    // delivered.
    class SwitchRouter {
    public:
        struct Options {
            std::chrono::milliseconds switch_timeout{1000};
            bool hold_last_frame = true;
        };

        using ChangeListener = std::function<void(const ActiveChange&)>;
        using FatalListener = std::function<void(const Error&)>;

        SwitchRouter(IOutputSink& out, Options opt);
        ~SwitchRouter();

        SwitchRouter(const SwitchRouter&) = delete;
        SwitchRouter& operator=(const SwitchRouter&) = delete;

        // output must already be open, its format becomes the routing format.
        // Can be called again after shutdown(), starting from Idle.
        bool start(Error& err);
        // no frame is accepted or written once this returns
        void shutdown();

        // A source is attachable once Running; delivered is the format its frames carry.
        void attach_source(SourceSlot slot, const FrameFormat& delivered);

        // Idle -> Routed(slot)
        SwitchReply select(SourceSlot slot, ChangeReason reason);
        // Routed(X) -> Switching -> Routed(Y), or back to Routed(X) on failure.
        // Blocks at most the switch timeout.
        SwitchReply switch_to(SourceSlot slot);
        // Detaches lost. When it was active, route the standby if attached, else go Idle.
        SwitchReply fail_over(SourceSlot lost);

        // capture listener entry point, called from source workers
        void on_frame(const FramePtr& frame);

        void on_active_changed(ChangeListener l);
        void on_fatal(FatalListener l);

        RouterState state() const;
        std::optional<SourceSlot> active() const;
        std::optional<SourceSlot> pending() const;
        bool attached(SourceSlot slot) const;
        const FrameFormat& output_format() const { return format_; }
        bool closed() const;

        uint64_t frames_written() const { return written_.load(std::memory_order_relaxed); }
        uint64_t frames_repeated() const { return repeated_.load(std::memory_order_relaxed); }

    private:
        struct Slot {
            bool attached = false;
            FrameFormat format;
        };

        bool conforms_(SourceSlot slot) const;
        SwitchReply reject_(SourceSlot slot) const;
        void emit_(const ActiveChange& c);
        void writer_loop_();

        IOutputSink& out_;
        Options opt_;
        FrameFormat format_;

        mutable std::mutex mtx_;
        std::condition_variable cv_;
        std::array<Slot, 2> slots_{};
        std::optional<SourceSlot> active_;
        std::optional<SourceSlot> pending_;
        bool switching_ = false;
        bool started_ = false;
        bool closed_ = false;
        uint64_t change_seq_ = 0;
        // set by the switch_to call waiting for a commit, filled by on_frame
        std::optional<ActiveChange>* commit_slot_ = nullptr;

        BoundedQueue<FramePtr> out_q_{1};
        std::thread writer_;

        std::mutex listen_mtx_;
        ChangeListener change_listener_;
        FatalListener fatal_listener_;

        std::mutex emit_mtx_;
        uint64_t delivered_seq_ = 0;

        std::atomic<uint64_t> written_{0};
        std::atomic<uint64_t> repeated_{0};
    };
}
