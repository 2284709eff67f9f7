#include <ingest/capture_source.hpp>

#include <ingest/format_negotiation.hpp>

#include <chrono>
#include <iostream>

namespace cs {
    CaptureSource::CaptureSource(SourceSlot slot, std::unique_ptr<IFrameSource> src, CaptureConfig cfg)
        : slot_(slot), src_(std::move(src)), cfg_(cfg) {}

    CaptureSource::~CaptureSource() {
        close();
    }

    const std::string& CaptureSource::device() const {
        static const std::string none;
        return src_ ? src_->id() : none;
    }

    Health CaptureSource::state() const {
        std::lock_guard lk(mtx_);
        return state_;
    }

    Error CaptureSource::last_error() const {
        std::lock_guard lk(mtx_);
        return last_error_;
    }

    void CaptureSource::set_state_(Health h) {
        std::lock_guard lk(mtx_);
        state_ = h;
    }

    bool CaptureSource::subscribe(FrameListener l) {
        if (running_) {
            std::cerr << "[Capture](subscribe) source " << to_string(slot_) << " already running.\n";
            return false;
        }
        listeners_.push_back(std::move(l));
        return true;
    }

    void CaptureSource::on_error(ErrorListener l) {
        error_listener_ = std::move(l);
    }

    bool CaptureSource::open(const FrameFormat& session, FrameFormat& negotiated, Error& err) {
        if (!src_) {
            err = Error(ErrorCode::PipelineError, "no frame source");
            return false;
        }
        {
            std::lock_guard lk(mtx_);
            if (state_ != Health::Unopened) {
                err = Error(ErrorCode::PipelineError, "source already opened");
                return false;
            }
            state_ = Health::Negotiating;
        }

        auto failed = [this](const Error& e) {
            std::lock_guard lk(mtx_);
            state_ = Health::Error;
            last_error_ = e;
            return false;
        };

        std::vector<FrameFormat> modes;
        if (!src_->query_modes(modes, err)) {
            std::cerr << "[Capture](open) " << to_string(slot_) << " mode query on " << device()
                      << " failed: " << err.describe() << "\n";
            return failed(err);
        }

        const NegotiationResult choice = choose_capture_mode(modes, session, cfg_.allow_mjpg);
        if (choice.fallback) {
            std::cerr << "[Capture](open) " << device() << ": no usable advertised mode, trying "
                      << choice.mode.describe() << "\n";
        } else if (choice.downscaled) {
            std::cerr << "[Capture](open) " << device() << ": no mode within "
                      << session.describe() << ", downscaling " << choice.mode.describe() << "\n";
        }

        FrameFormat delivered;
        if (!src_->configure(choice.mode, session, delivered, err)) {
            if (err.code == ErrorCode::PipelineError) {
                err = Error(ErrorCode::FormatNegotiationFailed, err.message);
            }
            return failed(err);
        }
        if (!delivered.valid()) {
            err = Error(ErrorCode::FormatNegotiationFailed, "pipeline delivers no usable format");
            return failed(err);
        }

        negotiated = delivered;
        std::cout << "[Capture](open) " << to_string(slot_) << " " << device() << " mode "
                  << choice.mode.describe() << " -> " << delivered.describe() << "\n";
        return true;
    }

    bool CaptureSource::start(Error& err) {
        {
            std::lock_guard lk(mtx_);
            if (state_ == Health::Running) return true;
            if (state_ != Health::Negotiating) {
                err = Error(ErrorCode::PipelineError,
                            std::string("cannot start from state ") + to_string(state_));
                return false;
            }
        }

        if (!src_->start(err)) {
            std::cerr << "[Capture](start) " << to_string(slot_) << " " << device()
                      << " failed: " << err.describe() << "\n";
            src_->stop();
            std::lock_guard lk(mtx_);
            state_ = Health::Error;
            last_error_ = err;
            return false;
        }

        if (worker_.joinable()) worker_.join();
        set_state_(Health::Running);
        running_ = true;
        worker_ = std::thread([this] { capture_loop_(); });
        return true;
    }

    void CaptureSource::stop() {
        running_ = false;
        if (worker_.joinable()) {
            if (worker_.get_id() == std::this_thread::get_id()) {
                // called from a listener, the loop exits on its own
                worker_.detach();
            } else {
                worker_.join();
            }
        }
        if (src_) src_->stop();
    }

    void CaptureSource::close() {
        stop();
        set_state_(Health::Closed);
    }

    void CaptureSource::fail_(Error err) {
        running_ = false;
        {
            std::lock_guard lk(mtx_);
            if (state_ != Health::Running) return;
            state_ = Health::Error;
            last_error_ = err;
        }
        std::cerr << "[Capture](capture_loop_) " << to_string(slot_) << " " << device()
                  << " failed: " << err.describe() << "\n";
        if (error_listener_) error_listener_(slot_, err);
    }

    void CaptureSource::capture_loop_() {
        using clock = std::chrono::steady_clock;
        auto last_frame = clock::now();
        const auto stall = std::chrono::milliseconds(cfg_.stall_timeout_ms);

        while (running_.load(std::memory_order_relaxed)) {
            Frame f;
            Error err;
            ReadStatus st;
            try {
                st = src_->read(f, cfg_.read_timeout_ms, err);
            } catch (const std::exception& e) {
                err = Error(ErrorCode::DeviceDisconnected, e.what());
                st = ReadStatus::Disconnected;
            }

            if (!running_.load(std::memory_order_relaxed)) break;

            if (st == ReadStatus::Timeout) {
                if (cfg_.stall_timeout_ms > 0 && clock::now() - last_frame > stall) {
                    fail_(Error(ErrorCode::DeviceDisconnected,
                                "no frames for " + std::to_string(cfg_.stall_timeout_ms) + " ms"));
                    return;
                }
                continue;
            }
            if (st == ReadStatus::Disconnected) {
                if (!err) err = Error(ErrorCode::DeviceDisconnected, device() + " stopped delivering");
                fail_(std::move(err));
                return;
            }

            last_frame = clock::now();
            f.source = slot_;
            f.frame_id = frame_id_++;
            f.arrival = last_frame;
            auto frame = std::make_shared<const Frame>(std::move(f));

            for (auto& l : listeners_) {
                try {
                    l(frame);
                } catch (const std::exception& e) {
                    std::cerr << "[Capture](capture_loop_) listener threw: " << e.what() << "\n";
                }
            }
        }
    }
}
