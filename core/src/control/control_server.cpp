#include <control/control_server.hpp>

#include <common/frame_convert.hpp>
#include <control/status_json.hpp>
#include <pipeline/supervisor.hpp>

#include <httplib.h>
#include <opencv2/imgproc.hpp>

#include <iostream>

namespace cs {
    namespace {
        constexpr size_t kMaxEvents = 128;

        int http_status(SwitchResult r) {
            switch (r) {
                case SwitchResult::Ack: return 200;
                case SwitchResult::Busy: return 409;
                case SwitchResult::Rejected: return 422;
                case SwitchResult::Timeout: return 504;
            }
            return 500;
        }

        void no_cache(httplib::Response& res) {
            res.set_header("Cache-Control", "no-store, no-cache, must-revalidate, max-age=0");
            res.set_header("Pragma", "no-cache");
        }

        std::string error_json(const Error& e) {
            return "{\"error\":\"" + std::string(to_string(e.code)) + "\",\"message\":\"" +
                   json_escape(e.message) + "\"}";
        }
    }

    struct ControlServer::Impl {
        httplib::Server svr;
    };

    ControlServer::ControlServer(Supervisor& sup, ControlConfig cfg, PreviewConfig preview)
        : impl_(std::make_unique<Impl>()),
          sup_(sup),
          cfg_(std::move(cfg)),
          preview_(std::move(preview)),
          interp_(interp_from_str(preview_.interp)) {
        for (auto& s : streams_) s = std::make_shared<StreamState>();
    }

    ControlServer::~ControlServer() {
        stop();
    }

    void ControlServer::render_frame(SourceSlot slot, const FramePtr& frame, bool active) {
        auto& st = *streams_[index_of(slot)];
        {
            std::lock_guard lk(st.mtx);
            st.last = frame;
            st.active = active;
            ++st.seq;
        }
        st.cv.notify_all();
    }

    void ControlServer::render_status(const StatusEvent& ev) {
        {
            std::lock_guard lk(events_mtx_);
            events_.push_back(ev);
            while (events_.size() > kMaxEvents) events_.pop_front();
        }
        events_cv_.notify_all();
    }

    std::vector<StatusEvent> ControlServer::events_since(uint64_t since, std::chrono::milliseconds timeout) {
        std::unique_lock lk(events_mtx_);
        events_cv_.wait_for(lk, timeout, [&] {
            return !running_ || (!events_.empty() && events_.back().seq > since);
        });

        std::vector<StatusEvent> out;
        for (const auto& ev : events_) {
            if (ev.seq > since) out.push_back(ev);
        }
        return out;
    }

    std::shared_ptr<const std::vector<uint8_t>> ControlServer::jpeg_for_(StreamState& st, uint64_t seq) {
        FramePtr frame;
        bool active = false;
        {
            std::lock_guard lk(st.mtx);
            if (st.jpeg && st.jpeg_seq == seq) return st.jpeg;
            frame = st.last;
            active = st.active;
        }
        if (!frame) return nullptr;

        cv::Mat bgr = to_bgr(*frame);
        if (bgr.empty()) return nullptr;
        cv::Mat view = resize_frame(bgr, preview_.width, preview_.height, preview_.keep_aspect, interp_);
        if (active) {
            // the routed source gets a border, the view may alias the frame so draw on a copy
            if (view.data == bgr.data && frame->format.layout == PixelLayout::BGR) view = view.clone();
            cv::rectangle(view, cv::Rect(0, 0, view.cols, view.rows), cv::Scalar(0, 0, 255), 4);
        }

        std::vector<uint8_t> tmp;
        if (!encode_jpeg(view, preview_.jpeg_quality, tmp)) return nullptr;
        auto bytes = std::make_shared<const std::vector<uint8_t>>(std::move(tmp));

        std::lock_guard lk(st.mtx);
        if (seq >= st.jpeg_seq) {
            st.jpeg = bytes;
            st.jpeg_seq = seq;
        }
        return bytes;
    }

    void ControlServer::register_routes_() {
        auto& svr = impl_->svr;

        svr.Get("/status", [this](const httplib::Request&, httplib::Response& res) {
            res.set_content(to_json(sup_.status()), "application/json");
            no_cache(res);
        });

        // /events?since=N -> long poll, returns as soon as a newer event exists
        svr.Get("/events", [this](const httplib::Request& req, httplib::Response& res) {
            uint64_t since = 0;
            if (req.has_param("since")) {
                try {
                    since = std::stoull(req.get_param_value("since"));
                } catch (const std::exception&) {
                    res.status = 400;
                    return;
                }
            }
            res.set_content(to_json(events_since(since, std::chrono::seconds(10))), "application/json");
            no_cache(res);
        });

        svr.Post(R"(/switch/([aAbB]))", [this](const httplib::Request& req, httplib::Response& res) {
            SourceSlot slot;
            if (req.matches.size() < 2 || !parse_slot(req.matches[1], slot)) { res.status = 400; return; }
            const SwitchReply r = sup_.switch_to(slot);
            res.status = http_status(r.result);
            res.set_content(to_json(r), "application/json");
        });

        svr.Post(R"(/retry/([aAbB]))", [this](const httplib::Request& req, httplib::Response& res) {
            SourceSlot slot;
            if (req.matches.size() < 2 || !parse_slot(req.matches[1], slot)) { res.status = 400; return; }
            Error err;
            if (!sup_.retry(slot, err)) {
                res.status = 409;
                res.set_content(error_json(err), "application/json");
                return;
            }
            res.set_content("{\"result\":\"scheduled\"}", "application/json");
        });

        svr.Get("/devices", [this](const httplib::Request&, httplib::Response& res) {
            res.set_content(to_json(sup_.list_devices()), "application/json");
            no_cache(res);
        });

        svr.Post("/defaults/save", [this](const httplib::Request&, httplib::Response& res) {
            Error err;
            if (!sup_.save_defaults(err)) {
                res.status = 422;
                res.set_content(error_json(err), "application/json");
                return;
            }
            res.set_content("{\"result\":\"saved\"}", "application/json");
        });

        svr.Post("/defaults/clear", [this](const httplib::Request&, httplib::Response& res) {
            Error err;
            if (!sup_.clear_defaults(err)) {
                res.status = 500;
                res.set_content(error_json(err), "application/json");
                return;
            }
            res.set_content("{\"result\":\"cleared\"}", "application/json");
        });

        // form or query fields camera_a, camera_b, virtual_output; applies to the next start
        svr.Post("/selection", [this](const httplib::Request& req, httplib::Response& res) {
            Settings wanted;
            if (req.has_param("camera_a")) wanted.camera_a = req.get_param_value("camera_a");
            if (req.has_param("camera_b")) wanted.camera_b = req.get_param_value("camera_b");
            if (req.has_param("virtual_output")) wanted.virtual_output = req.get_param_value("virtual_output");
            Error err;
            if (!sup_.set_selection(wanted, err)) {
                res.status = err.code == ErrorCode::PipelineError ? 409 : 422;
                res.set_content(error_json(err), "application/json");
                return;
            }
            res.set_content(to_json(sup_.status()), "application/json");
        });

        svr.Post("/session/start", [this](const httplib::Request&, httplib::Response& res) {
            Error err;
            if (!sup_.start(err)) {
                switch (err.code) {
                    case ErrorCode::PipelineError: res.status = 409; break;
                    case ErrorCode::InvalidConfiguration: res.status = 422; break;
                    default: res.status = 500; break;
                }
                res.set_content(error_json(err), "application/json");
                return;
            }
            res.set_content(to_json(sup_.status()), "application/json");
        });

        svr.Post("/session/stop", [this](const httplib::Request&, httplib::Response& res) {
            sup_.stop();
            res.set_content(to_json(sup_.status()), "application/json");
        });

        svr.Post(R"(/preview/(on|off))", [this](const httplib::Request& req, httplib::Response& res) {
            sup_.set_preview_enabled(req.matches[1] == "on");
            res.set_content(to_json(sup_.status()), "application/json");
        });

        // /snapshot/<a|b> -> latest preview jpeg once
        svr.Get(R"(/snapshot/([aAbB]))", [this](const httplib::Request& req, httplib::Response& res) {
            SourceSlot slot;
            if (req.matches.size() < 2 || !parse_slot(req.matches[1], slot)) { res.status = 400; return; }
            auto st = streams_[index_of(slot)];

            uint64_t seq = 0;
            {
                std::lock_guard lk(st->mtx);
                seq = st->seq;
            }
            auto jpeg = jpeg_for_(*st, seq);
            if (!jpeg || jpeg->empty()) { res.status = 204; return; }
            res.set_content(reinterpret_cast<const char*>(jpeg->data()), jpeg->size(), "image/jpeg");
            res.set_header("Cache-Control", "no-cache");
        });

        // /preview/<a|b> -> MJPEG
        svr.Get(R"(/preview/([aAbB]))", [this](const httplib::Request& req, httplib::Response& res) {
            SourceSlot slot;
            if (req.matches.size() < 2 || !parse_slot(req.matches[1], slot)) { res.status = 400; return; }
            auto st = streams_[index_of(slot)];

            res.set_header("Cache-Control", "no-cache");
            res.set_header("Pragma", "no-cache");
            res.set_header("Connection", "close");

            const std::string boundary = "frame";
            res.set_chunked_content_provider(
                "multipart/x-mixed-replace; boundary=" + boundary,
                [this, st, boundary](size_t /*offset*/, httplib::DataSink& sink) {
                    uint64_t last_sent = 0;

                    while (running_) {
                        uint64_t seq_local = 0;
                        {
                            std::unique_lock lk(st->mtx);
                            // wakes periodically so a stopped server releases the connection
                            st->cv.wait_for(lk, std::chrono::milliseconds(500),
                                            [&] { return st->seq != last_sent || !running_; });
                            if (!running_) break;
                            if (st->seq == last_sent) continue;
                            seq_local = st->seq;
                        }

                        last_sent = seq_local;
                        auto jpeg = jpeg_for_(*st, seq_local);
                        if (!jpeg || jpeg->empty()) continue;

                        std::string header =
                            "--" + boundary + "\r\n"
                            "Content-Type: image/jpeg\r\n"
                            "Content-Length: " + std::to_string(jpeg->size()) + "\r\n\r\n";

                        if (!sink.write(header.data(), header.size())) return false;
                        if (!sink.write(reinterpret_cast<const char*>(jpeg->data()), jpeg->size())) return false;
                        if (!sink.write("\r\n", 2)) return false;
                    }

                    sink.done();
                    return true;
                }
            );
        });

        svr.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
            const SessionState s = sup_.session();
            if (s == SessionState::Fatal || s == SessionState::Stopped) res.status = 503;
            res.set_content(to_string(s), "text/plain");
        });
    }

    bool ControlServer::start() {
        if (running_) return true;

        register_routes_();
        if (!impl_->svr.bind_to_port(cfg_.host.c_str(), cfg_.port)) {
            std::cerr << "[Control](start) unable to bind " << cfg_.host << ":" << cfg_.port << "\n";
            return false;
        }

        running_ = true;
        sup_.attach_renderer(this);

        server_thread_ = std::thread([this] {
            std::cout << "[Control] Status: http://" << cfg_.host << ":" << cfg_.port << "/status\n";
            std::cout << "[Control] Preview: http://" << cfg_.host << ":" << cfg_.port << "/preview/<a|b>\n";
            impl_->svr.listen_after_bind();
        });
        return true;
    }

    void ControlServer::stop() {
        if (!running_) return;
        running_ = false;
        sup_.detach_renderer(this);

        for (auto& st : streams_) st->cv.notify_all();
        events_cv_.notify_all();

        impl_->svr.stop();
        if (server_thread_.joinable()) server_thread_.join();
    }
}
