#include "fakes.hpp"

#include <ingest/capture_source.hpp>
#include <pipeline/switch_router.hpp>

#include <atomic>
#include <chrono>
#include <future>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using cs::test::FakeCamera;
using cs::test::FakeFrameSource;
using cs::test::FakeOutputSink;
using cs::test::FakeOutputState;
using cs::test::WriteRecord;
using cs::test::wait_until;

namespace {
    int g_failures = 0;

    void check(bool condition, const std::string& message) {
        if (!condition) {
            ++g_failures;
            std::cerr << "[FAIL] " << message << "\n";
        }
    }

    cs::CaptureConfig capture_cfg(int stall_ms = 0) {
        cs::CaptureConfig c;
        c.read_timeout_ms = 20;
        c.stall_timeout_ms = stall_ms;
        c.start_timeout_ms = 100;
        return c;
    }

    cs::SwitchRouter::Options router_opts(int timeout_ms = 500, bool hold = true) {
        cs::SwitchRouter::Options o;
        o.switch_timeout = std::chrono::milliseconds(timeout_ms);
        o.hold_last_frame = hold;
        return o;
    }

    // Output sink, router and two fake cameras wired the way the supervisor does it.
    struct Rig {
        cs::FrameFormat fmt = cs::test::test_format(50);
        std::shared_ptr<FakeOutputState> out = std::make_shared<FakeOutputState>();
        FakeOutputSink sink{out};
        std::shared_ptr<FakeCamera> cam_a = std::make_shared<FakeCamera>();
        std::shared_ptr<FakeCamera> cam_b = std::make_shared<FakeCamera>();
        std::unique_ptr<cs::SwitchRouter> router;
        std::unique_ptr<cs::CaptureSource> src_a;
        std::unique_ptr<cs::CaptureSource> src_b;
        std::vector<cs::ActiveChange> changes;
        std::mutex changes_mtx;

        explicit Rig(cs::SwitchRouter::Options opt = router_opts()) {
            cs::Error err;
            sink.open("/dev/video10", fmt, err);
            router = std::make_unique<cs::SwitchRouter>(sink, opt);
            router->on_active_changed([this](const cs::ActiveChange& c) {
                std::lock_guard lk(changes_mtx);
                changes.push_back(c);
            });
            router->start(err);
        }

        ~Rig() {
            router->shutdown();
            if (src_a) src_a->close();
            if (src_b) src_b->close();
        }

        bool bring_up(cs::SourceSlot slot) {
            auto& cam = slot == cs::SourceSlot::A ? cam_a : cam_b;
            const std::string dev = slot == cs::SourceSlot::A ? "/dev/video0" : "/dev/video2";
            auto src = std::make_unique<cs::CaptureSource>(
                slot, std::make_unique<FakeFrameSource>(dev, cam), capture_cfg());
            src->subscribe([this](const cs::FramePtr& f) { router->on_frame(f); });

            cs::FrameFormat delivered;
            cs::Error err;
            if (!src->open(fmt, delivered, err) || !src->start(err)) return false;
            router->attach_source(slot, delivered);
            (slot == cs::SourceSlot::A ? src_a : src_b) = std::move(src);
            return true;
        }

        size_t change_count() {
            std::lock_guard lk(changes_mtx);
            return changes.size();
        }
    };

    // once a write from `to` shows up after index `from_index`, no write from the other slot may follow
    bool clean_handover(const std::vector<WriteRecord>& w, size_t from_index, cs::SourceSlot to) {
        bool seen = false;
        for (size_t i = from_index; i < w.size(); ++i) {
            if (w[i].source == to) seen = true;
            else if (seen) return false;
        }
        return seen;
    }

    std::chrono::milliseconds max_gap(const std::vector<WriteRecord>& w, size_t from_index) {
        std::chrono::steady_clock::duration gap{0};
        for (size_t i = from_index + 1; i < w.size(); ++i) {
            gap = std::max(gap, w[i].at - w[i - 1].at);
        }
        return std::chrono::duration_cast<std::chrono::milliseconds>(gap);
    }

    void test_select_routes_only_the_active_source() {
        Rig rig;
        check(rig.bring_up(cs::SourceSlot::A), "source A should start");
        check(rig.bring_up(cs::SourceSlot::B), "source B should start");
        check(rig.router->state() == cs::RouterState::Idle, "router should start Idle");

        const auto r = rig.router->select(cs::SourceSlot::A, cs::ChangeReason::Startup);
        check(r.ok(), "select(A) should be acknowledged");
        check(rig.router->state() == cs::RouterState::Routed, "router should be Routed after select");

        check(wait_until([&] { return rig.out->count() >= 10; }, 2s), "output should receive frames");
        for (const auto& w : rig.out->snapshot()) {
            check(w.source == cs::SourceSlot::A, "only A may feed the output while A is routed");
        }

        const auto again = rig.router->select(cs::SourceSlot::B, cs::ChangeReason::Command);
        check(again.result == cs::SwitchResult::Rejected, "select while routed should be rejected");
        check(rig.router->active() == cs::SourceSlot::A, "rejected select must not change the active source");

        rig.router->shutdown();
        check(rig.router->frames_written() == rig.out->count(), "every counted write should reach the sink");
    }

    void test_switch_hands_over_cleanly() {
        Rig rig;
        rig.bring_up(cs::SourceSlot::A);
        rig.bring_up(cs::SourceSlot::B);
        rig.router->select(cs::SourceSlot::A, cs::ChangeReason::Startup);
        wait_until([&] { return rig.out->count() >= 5; }, 2s);

        const size_t before = rig.out->count();
        const auto r = rig.router->switch_to(cs::SourceSlot::B);
        check(r.ok(), "switch_to(B) should be acknowledged: " + r.reason);
        check(rig.router->active() == cs::SourceSlot::B, "B should be active after the switch");
        check(rig.router->state() == cs::RouterState::Routed, "router should settle in Routed");

        wait_until([&] { return rig.out->count() >= before + 10; }, 2s);
        const auto writes = rig.out->snapshot();
        check(clean_handover(writes, before, cs::SourceSlot::B), "no frame of A may follow the first frame of B");

        std::lock_guard lk(rig.changes_mtx);
        check(!rig.changes.empty() && rig.changes.back().reason == cs::ChangeReason::Command,
              "a committed switch should report reason command");
        check(!rig.changes.empty() && rig.changes.back().previous == cs::SourceSlot::A,
              "the change event should carry the previous source");
    }

    void test_round_trip_keeps_format_and_continuity() {
        Rig rig;
        rig.bring_up(cs::SourceSlot::A);
        rig.bring_up(cs::SourceSlot::B);
        rig.router->select(cs::SourceSlot::A, cs::ChangeReason::Startup);
        wait_until([&] { return rig.out->count() >= 5; }, 2s);
        const size_t start = rig.out->count();

        check(rig.router->switch_to(cs::SourceSlot::B).ok(), "switch_to(B) should succeed");
        std::this_thread::sleep_for(60ms);
        check(rig.router->switch_to(cs::SourceSlot::A).ok(), "switch_to(A) should succeed");
        const size_t back_on_a = rig.out->count();
        wait_until([&] { return rig.out->count() >= back_on_a + 5; }, 2s);

        const auto writes = rig.out->snapshot();
        for (const auto& w : writes) {
            check(w.format == rig.fmt, "every written frame must carry the session format");
        }
        check(clean_handover(writes, back_on_a, cs::SourceSlot::A), "output should end on A");
        const auto gap = max_gap(writes, start);
        check(gap <= rig.fmt.frame_interval() + 40ms,
              "gap across the round trip too large: " + std::to_string(gap.count()) + " ms");
    }

    void test_repeated_switches_keep_output_format() {
        Rig rig;
        rig.bring_up(cs::SourceSlot::A);
        rig.bring_up(cs::SourceSlot::B);
        rig.router->select(cs::SourceSlot::A, cs::ChangeReason::Startup);
        wait_until([&] { return rig.out->count() >= 3; }, 2s);

        const size_t start = rig.out->count();
        cs::SourceSlot next = cs::SourceSlot::B;
        int acked = 0;
        for (int i = 0; i < 8; ++i) {
            if (rig.router->switch_to(next).ok()) ++acked;
            next = cs::other(next);
            std::this_thread::sleep_for(30ms);
        }
        check(acked == 8, "all alternating switches should be acknowledged, got " + std::to_string(acked));

        const auto writes = rig.out->snapshot();
        for (size_t i = start; i < writes.size(); ++i) {
            check(writes[i].format == rig.fmt, "output format must not change across switches");
        }
        const auto gap = max_gap(writes, start);
        check(gap <= rig.fmt.frame_interval() + 40ms,
              "output gap during switching too large: " + std::to_string(gap.count()) + " ms");
    }

    void test_switch_while_switching_is_busy() {
        Rig rig(router_opts(800));
        rig.bring_up(cs::SourceSlot::A);
        rig.bring_up(cs::SourceSlot::B);
        rig.router->select(cs::SourceSlot::A, cs::ChangeReason::Startup);
        rig.cam_b->stalled = true;

        auto pending = std::async(std::launch::async, [&] { return rig.router->switch_to(cs::SourceSlot::B); });
        check(wait_until([&] { return rig.router->state() == cs::RouterState::Switching; }, 500ms),
              "router should enter Switching while waiting for B");

        const auto busy_a = rig.router->switch_to(cs::SourceSlot::A);
        const auto busy_b = rig.router->switch_to(cs::SourceSlot::B);
        check(busy_a.result == cs::SwitchResult::Busy, "switch_to(A) during a swap should be Busy");
        check(busy_b.result == cs::SwitchResult::Busy, "switch_to(B) during a swap should be Busy");
        check(rig.router->active() == cs::SourceSlot::A, "Busy must leave the active source untouched");
        check(rig.router->pending() == cs::SourceSlot::B, "Busy must leave the pending source untouched");

        rig.cam_b->stalled = false;
        const auto r = pending.get();
        check(r.ok(), "the first switch should still commit once B delivers");
        check(rig.router->active() == cs::SourceSlot::B, "B should be active after the delayed commit");
    }

    void test_switch_timeout_rolls_back() {
        Rig rig(router_opts(150));
        rig.bring_up(cs::SourceSlot::A);
        rig.bring_up(cs::SourceSlot::B);
        rig.router->select(cs::SourceSlot::A, cs::ChangeReason::Startup);
        wait_until([&] { return rig.out->count() >= 3; }, 2s);
        rig.cam_b->stalled = true;

        const size_t changes = rig.change_count();
        const auto t0 = std::chrono::steady_clock::now();
        const auto r = rig.router->switch_to(cs::SourceSlot::B);
        const auto waited = std::chrono::steady_clock::now() - t0;

        check(r.result == cs::SwitchResult::Timeout, "a silent target should time out");
        check(waited < 1s, "switch_to should block only for the switch timeout");
        check(rig.router->active() == cs::SourceSlot::A, "timeout should roll back to A");
        check(rig.router->state() == cs::RouterState::Routed, "router should be Routed again after rollback");
        check(!rig.router->pending().has_value(), "rollback should clear the pending source");
        check(rig.change_count() == changes, "a rolled back switch must not emit a change");

        const size_t before = rig.out->count();
        check(wait_until([&] { return rig.out->count() >= before + 5; }, 2s), "A should keep feeding the output");
        const auto writes = rig.out->snapshot();
        for (size_t i = before; i < writes.size(); ++i) {
            check(writes[i].source == cs::SourceSlot::A, "no frame of B may reach the output after rollback");
        }
    }

    void test_mismatched_format_is_rejected() {
        Rig rig;
        {
            std::lock_guard lk(rig.cam_b->mtx);
            auto odd = rig.fmt;
            odd.width = 32;
            odd.height = 24;
            rig.cam_b->delivered = odd;
        }
        rig.bring_up(cs::SourceSlot::A);
        rig.bring_up(cs::SourceSlot::B);
        rig.router->select(cs::SourceSlot::A, cs::ChangeReason::Startup);

        const auto r = rig.router->switch_to(cs::SourceSlot::B);
        check(r.result == cs::SwitchResult::Rejected, "a source with a different format should be rejected");
        check(r.reason.find("does not match") != std::string::npos, "rejection should name the format mismatch");
        check(r.code() == cs::ErrorCode::FormatNegotiationFailed, "a format mismatch is a negotiation error");
        check(rig.router->active() == cs::SourceSlot::A, "rejection must keep A active");
        check(rig.router->state() == cs::RouterState::Routed, "rejection must not enter Switching");
    }

    void test_switch_to_unattached_source_is_rejected() {
        Rig rig;
        rig.bring_up(cs::SourceSlot::A);
        rig.router->select(cs::SourceSlot::A, cs::ChangeReason::Startup);
        const auto r = rig.router->switch_to(cs::SourceSlot::B);
        check(r.result == cs::SwitchResult::Rejected, "switching to a source that is not running should be rejected");
        check(r.code() == cs::ErrorCode::PipelineError, "a missing source is not a configuration error");
        check(rig.router->switch_to(cs::SourceSlot::A).ok(), "switching to the active source is a no-op ack");
    }

    void test_gap_filler_repeats_last_frame() {
        Rig rig;
        rig.bring_up(cs::SourceSlot::A);
        rig.router->select(cs::SourceSlot::A, cs::ChangeReason::Startup);
        wait_until([&] { return rig.out->count() >= 3; }, 2s);

        rig.cam_a->stalled = true;
        const size_t before = rig.out->count();
        std::this_thread::sleep_for(200ms);

        check(rig.router->frames_repeated() > 0, "a stalled active source should be covered by repeats");
        const auto writes = rig.out->snapshot();
        check(writes.size() > before + 3, "output should keep receiving frames while the source stalls");
        const auto gap = max_gap(writes, before);
        check(gap <= rig.fmt.frame_interval() + 40ms,
              "repeat gap too large: " + std::to_string(gap.count()) + " ms");
    }

    void test_idle_router_writes_nothing() {
        Rig rig;
        rig.bring_up(cs::SourceSlot::A);
        rig.router->select(cs::SourceSlot::A, cs::ChangeReason::Startup);
        wait_until([&] { return rig.out->count() >= 3; }, 2s);

        const auto r = rig.router->fail_over(cs::SourceSlot::A);
        check(r.result == cs::SwitchResult::Rejected, "failover without a running standby should be rejected");
        check(rig.router->state() == cs::RouterState::Idle, "router should go Idle when nothing can be routed");
        check(!rig.router->active().has_value(), "no source should be active");

        std::this_thread::sleep_for(60ms);
        const size_t settled = rig.out->count();
        std::this_thread::sleep_for(150ms);
        check(rig.out->count() == settled, "an idle router must not write to the output");

        std::lock_guard lk(rig.changes_mtx);
        check(!rig.changes.empty() && !rig.changes.back().active.has_value() &&
              rig.changes.back().reason == cs::ChangeReason::Failover,
              "going idle should be reported as a failover change");
    }

    void test_fail_over_routes_standby() {
        Rig rig;
        rig.bring_up(cs::SourceSlot::A);
        rig.bring_up(cs::SourceSlot::B);
        rig.router->select(cs::SourceSlot::A, cs::ChangeReason::Startup);
        wait_until([&] { return rig.out->count() >= 3; }, 2s);

        const size_t before = rig.out->count();
        const auto r = rig.router->fail_over(cs::SourceSlot::A);
        check(r.ok(), "failover to a running standby should succeed");
        check(rig.router->active() == cs::SourceSlot::B, "standby should become active");
        check(!rig.router->attached(cs::SourceSlot::A), "the lost source should be detached");

        wait_until([&] { return rig.out->count() >= before + 10; }, 2s);
        check(clean_handover(rig.out->snapshot(), before, cs::SourceSlot::B), "failover should hand over cleanly");
    }

    void test_lost_pending_source_aborts_switch() {
        Rig rig(router_opts(1000));
        rig.bring_up(cs::SourceSlot::A);
        rig.bring_up(cs::SourceSlot::B);
        rig.router->select(cs::SourceSlot::A, cs::ChangeReason::Startup);
        rig.cam_b->stalled = true;

        auto pending = std::async(std::launch::async, [&] { return rig.router->switch_to(cs::SourceSlot::B); });
        wait_until([&] { return rig.router->state() == cs::RouterState::Switching; }, 500ms);
        rig.router->fail_over(cs::SourceSlot::B);

        const auto r = pending.get();
        check(r.result == cs::SwitchResult::Rejected, "losing the target mid-switch should reject the switch");
        check(rig.router->active() == cs::SourceSlot::A, "A should stay active");
    }

    void test_changes_are_reported_in_commit_order() {
        Rig rig(router_opts(300));
        rig.bring_up(cs::SourceSlot::A);
        rig.bring_up(cs::SourceSlot::B);
        rig.router->select(cs::SourceSlot::A, cs::ChangeReason::Startup);

        // a user switching back and forth while B keeps dropping out and coming back
        std::atomic<bool> done{false};
        std::thread flapper([&] {
            while (!done) {
                rig.router->fail_over(cs::SourceSlot::B);
                std::this_thread::sleep_for(7ms);
                rig.router->attach_source(cs::SourceSlot::B, rig.fmt);
                std::this_thread::sleep_for(11ms);
            }
        });
        cs::SourceSlot next = cs::SourceSlot::B;
        for (int i = 0; i < 40; ++i) {
            rig.router->switch_to(next);
            next = cs::other(next);
        }
        done = true;
        flapper.join();
        rig.router->attach_source(cs::SourceSlot::B, rig.fmt);

        std::lock_guard lk(rig.changes_mtx);
        bool ordered = true;
        for (size_t i = 1; i < rig.changes.size(); ++i) {
            if (rig.changes[i].seq <= rig.changes[i - 1].seq) ordered = false;
        }
        check(ordered, "changes should be reported in the order they were made");
        check(!rig.changes.empty() && rig.changes.back().active == rig.router->active(),
              "the last reported change should match the routed source");
    }

    void test_router_restarts_after_shutdown() {
        Rig rig;
        rig.bring_up(cs::SourceSlot::A);
        rig.bring_up(cs::SourceSlot::B);
        rig.router->select(cs::SourceSlot::A, cs::ChangeReason::Startup);
        wait_until([&] { return rig.out->count() >= 3; }, 2s);
        rig.router->shutdown();

        cs::Error err;
        check(rig.router->start(err), "start after shutdown should succeed: " + err.describe());
        check(!rig.router->closed(), "a restarted router is open");
        check(rig.router->state() == cs::RouterState::Idle, "a restarted router starts Idle");
        check(!rig.router->attached(cs::SourceSlot::A), "sources must be attached again after a restart");
        check(!rig.router->select(cs::SourceSlot::A, cs::ChangeReason::Startup).ok(),
              "an unattached source cannot be selected");

        rig.router->attach_source(cs::SourceSlot::A, rig.fmt);
        rig.router->attach_source(cs::SourceSlot::B, rig.fmt);
        check(rig.router->select(cs::SourceSlot::B, cs::ChangeReason::Startup).ok(), "select after restart");
        const size_t before = rig.out->count();
        check(wait_until([&] { return rig.out->count() >= before + 5; }, 2s), "frames flow after the restart");
        check(clean_handover(rig.out->snapshot(), before, cs::SourceSlot::B), "only B is written after the restart");
    }

    void test_output_failure_is_fatal() {
        Rig rig;
        std::atomic<int> fatal{0};
        rig.router->on_fatal([&](const cs::Error& e) {
            if (e.code == cs::ErrorCode::OutputWriteFailed) ++fatal;
        });
        rig.bring_up(cs::SourceSlot::A);
        rig.bring_up(cs::SourceSlot::B);
        rig.router->select(cs::SourceSlot::A, cs::ChangeReason::Startup);
        wait_until([&] { return rig.out->count() >= 3; }, 2s);

        rig.out->fail_writes = true;
        check(wait_until([&] { return fatal.load() == 1; }, 1s), "a write failure should be reported once");
        check(rig.router->closed(), "router should close after a write failure");

        rig.out->fail_writes = false;
        const size_t after = rig.out->count();
        std::this_thread::sleep_for(100ms);
        check(rig.out->count() == after, "no frame may be written after the fatal failure");
        check(rig.router->switch_to(cs::SourceSlot::B).result == cs::SwitchResult::Rejected,
              "a closed router rejects switches");
    }

    void test_shutdown_stops_accepting_frames() {
        Rig rig;
        rig.bring_up(cs::SourceSlot::A);
        rig.router->select(cs::SourceSlot::A, cs::ChangeReason::Startup);
        wait_until([&] { return rig.out->count() >= 3; }, 2s);

        rig.router->shutdown();
        rig.router->shutdown();
        const size_t after = rig.out->count();
        std::this_thread::sleep_for(100ms);
        check(rig.out->count() == after, "no frame may be written after shutdown");
        check(!rig.router->active().has_value(), "shutdown clears the active source");
    }

    void test_capture_source_reports_stall() {
        auto cam = std::make_shared<FakeCamera>();
        cs::CaptureSource src(cs::SourceSlot::B, std::make_unique<FakeFrameSource>("/dev/video2", cam), capture_cfg(100));

        std::atomic<int> errors{0};
        cs::ErrorCode code = cs::ErrorCode::None;
        std::mutex mtx;
        src.on_error([&](cs::SourceSlot slot, const cs::Error& e) {
            std::lock_guard lk(mtx);
            if (slot == cs::SourceSlot::B) code = e.code;
            ++errors;
        });
        std::atomic<int> frames{0};
        src.subscribe([&](const cs::FramePtr& f) {
            if (f && f->source == cs::SourceSlot::B) ++frames;
        });

        cs::FrameFormat delivered;
        cs::Error err;
        check(src.open(cs::test::test_format(50), delivered, err), "open should succeed");
        check(src.state() == cs::Health::Negotiating, "open leaves the source Negotiating");
        check(src.start(err), "start should succeed");
        check(src.start(err), "start should be idempotent");
        check(src.state() == cs::Health::Running, "source should be Running");
        check(!src.subscribe([](const cs::FramePtr&) {}), "subscribing after start is refused");

        check(wait_until([&] { return frames.load() >= 3; }, 1s), "frames should be delivered");
        cam->stalled = true;
        check(wait_until([&] { return errors.load() == 1; }, 1s), "a stall should be reported");
        check(src.state() == cs::Health::Error, "a stalled source should move to Error");
        {
            std::lock_guard lk(mtx);
            check(code == cs::ErrorCode::DeviceDisconnected, "a stall counts as a disconnect");
        }

        src.close();
        check(src.state() == cs::Health::Closed, "close should leave the source Closed");
        const int seen = frames.load();
        std::this_thread::sleep_for(50ms);
        check(frames.load() == seen, "no frame may be delivered after close");
    }

    void test_capture_source_open_failure() {
        auto cam = std::make_shared<FakeCamera>();
        cam->unplugged = true;
        cs::CaptureSource src(cs::SourceSlot::A, std::make_unique<FakeFrameSource>("/dev/video0", cam), capture_cfg());

        cs::FrameFormat delivered;
        cs::Error err;
        check(!src.open(cs::test::test_format(), delivered, err), "open on a missing device should fail");
        check(err.code == cs::ErrorCode::DeviceNotFound, "missing device should report DeviceNotFound");
        check(src.state() == cs::Health::Error, "failed open should leave the source in Error");
        check(src.last_error().code == cs::ErrorCode::DeviceNotFound, "last_error should keep the cause");
    }
}

int main() {
    test_select_routes_only_the_active_source();
    test_switch_hands_over_cleanly();
    test_round_trip_keeps_format_and_continuity();
    test_repeated_switches_keep_output_format();
    test_switch_while_switching_is_busy();
    test_switch_timeout_rolls_back();
    test_mismatched_format_is_rejected();
    test_switch_to_unattached_source_is_rejected();
    test_gap_filler_repeats_last_frame();
    test_idle_router_writes_nothing();
    test_fail_over_routes_standby();
    test_lost_pending_source_aborts_switch();
    test_changes_are_reported_in_commit_order();
    test_router_restarts_after_shutdown();
    test_output_failure_is_fatal();
    test_shutdown_stops_accepting_frames();
    test_capture_source_reports_stall();
    test_capture_source_open_failure();

    if (g_failures != 0) {
        std::cerr << "[FAIL] total failures: " << g_failures << "\n";
        return 1;
    }

    std::cout << "[OK] all router tests passed\n";
    return 0;
}
