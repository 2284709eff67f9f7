#include <pipeline/supervisor.hpp>

#include <algorithm>
#include <iostream>

namespace cs {
    namespace {
        SwitchRouter::Options router_options(const SwitchingConfig& s) {
            SwitchRouter::Options o;
            o.switch_timeout = std::chrono::milliseconds(s.timeout_ms);
            o.hold_last_frame = s.hold_last_frame;
            return o;
        }

        SourceStatus to_status(const DeviceId& device, Health h, int attempts, bool persistent, const Error& e) {
            SourceStatus st;
            st.health = h;
            st.device = device;
            st.reconnect_attempts = attempts;
            st.persistent_failure = persistent;
            st.last_error = e ? e.describe() : std::string();
            return st;
        }
    }

    Supervisor::Supervisor(Options opt,
                           SourceFactory factory,
                           std::unique_ptr<IOutputSink> output,
                           ISettingsStore& settings,
                           const DeviceEnumerator& enumerator)
        : opt_(std::move(opt)),
          factory_(std::move(factory)),
          settings_(settings),
          enumerator_(enumerator),
          output_(std::move(output)),
          preview_(opt_.preview_enabled),
          router_(std::make_unique<SwitchRouter>(*output_, router_options(opt_.switching))) {
        router_->on_active_changed([this](const ActiveChange& c) { on_active_changed_(c); });
        router_->on_fatal([this](const Error& e) {
            Event ev;
            ev.kind = Event::Kind::OutputFailed;
            ev.err = e;
            events_.push_drop_oldest(std::move(ev));
        });
    }

    Supervisor::~Supervisor() {
        stop();
    }

    std::chrono::milliseconds Supervisor::backoff_(int attempts) const {
        int64_t d = std::max(1, opt_.recovery.initial_backoff_ms);
        for (int i = 0; i < attempts && d < opt_.recovery.max_backoff_ms; ++i) d *= 2;
        return std::chrono::milliseconds(std::min<int64_t>(d, opt_.recovery.max_backoff_ms));
    }

    // caller holds mtx_
    void Supervisor::schedule_reconnect_(SlotState& st) {
        if (st.attempts >= opt_.recovery.max_retries) {
            st.persistent = true;
            st.reconnect_due = false;
            std::cerr << "[Supervisor](schedule_reconnect_) " << st.device << " gave up after "
                      << st.attempts << " attempts\n";
            return;
        }
        const auto delay = backoff_(st.attempts);
        st.reconnect_due = true;
        st.next_attempt = std::chrono::steady_clock::now() + delay;
        std::cout << "[Supervisor](schedule_reconnect_) " << st.device << " in " << delay.count() << " ms\n";
    }

    bool Supervisor::start(Error& err) {
        std::lock_guard life(lifecycle_mtx_);
        {
            std::lock_guard lk(mtx_);
            if (session_ != SessionState::Stopped) {
                err = Error(ErrorCode::PipelineError, std::string("session is ") + to_string(session_));
                return false;
            }
        }
        set_session_(SessionState::Starting, "starting");

        // config, then persisted choices, then a runtime selection, then the enumerator
        Settings sel;
        sel.camera_a = opt_.devices.camera_a;
        sel.camera_b = opt_.devices.camera_b;
        sel.virtual_output = opt_.devices.virtual_output;
        SourceSlot preferred = SourceSlot::A;
        if (parse_slot(opt_.devices.default_active, preferred)) sel.last_active = preferred;
        sel.preview_enabled = opt_.preview_enabled;

        const Settings saved = settings_.load();
        if (saved.last_active) sel.last_active = saved.last_active;
        if (opt_.autoload) {
            if (!saved.camera_a.empty()) sel.camera_a = saved.camera_a;
            if (!saved.camera_b.empty()) sel.camera_b = saved.camera_b;
            if (!saved.virtual_output.empty()) sel.virtual_output = saved.virtual_output;
            if (saved.preview_enabled) sel.preview_enabled = saved.preview_enabled;
        }
        {
            std::lock_guard lk(mtx_);
            if (override_) {
                sel.camera_a = override_->camera_a;
                sel.camera_b = override_->camera_b;
                sel.virtual_output = override_->virtual_output;
            }
        }
        sel = resolve_selection_(sel);

        if (!validate_selection(sel, err)) {
            std::cerr << "[Supervisor](start) " << err.describe() << "\n";
            set_session_(SessionState::Stopped, err.message);
            return false;
        }
        preview_.set_enabled(sel.preview_enabled.value_or(true));

        DeviceId out_id;
        if (!enumerator_.resolve(sel.virtual_output, DeviceRole::Output, out_id, err) ||
            !output_->open(out_id, opt_.format, err) ||
            !router_->start(err)) {
            std::cerr << "[Supervisor](start) output " << sel.virtual_output << ": " << err.describe() << "\n";
            output_->close();
            {
                std::lock_guard lk(mtx_);
                output_health_ = OutputHealth::Failed;
                output_device_ = sel.virtual_output;
            }
            emit_(EventKind::OutputHealthChanged, err.describe());
            set_session_(SessionState::Stopped, "output unavailable");
            return false;
        }

        {
            std::lock_guard lk(mtx_);
            selection_ = sel;
            output_health_ = OutputHealth::Open;
            output_device_ = out_id;
            slots_[index_of(SourceSlot::A)].device = sel.camera_a;
            slots_[index_of(SourceSlot::B)].device = sel.camera_b;
            for (auto& st : slots_) {
                st.health = Health::Unopened;
                st.attempts = 0;
                st.persistent = false;
                st.reconnect_due = false;
                st.last_error = Error();
            }
        }
        events_.reset();
        emit_(EventKind::OutputHealthChanged, "opened " + out_id);

        const bool a_up = bring_up_(SourceSlot::A);
        const bool b_up = bring_up_(SourceSlot::B);

        preferred = sel.last_active.value_or(SourceSlot::A);
        const bool preferred_up = preferred == SourceSlot::A ? a_up : b_up;
        const bool other_up = preferred == SourceSlot::A ? b_up : a_up;

        SwitchReply r{SwitchResult::Rejected, "no source running"};
        if (preferred_up) r = router_->select(preferred, ChangeReason::Startup);
        if (!r.ok() && other_up) r = router_->select(other(preferred), ChangeReason::Startup);

        if (r.ok()) {
            set_session_(SessionState::Running, "routing");
        } else {
            std::cerr << "[Supervisor](start) nothing routed: " << r.reason << "\n";
            set_session_(SessionState::AllSourcesDown, r.reason);
        }

        running_ = true;
        thread_ = std::thread([this] { supervise_loop_(); });
        return true;
    }

    Settings Supervisor::resolve_selection_(const Settings& wanted) const {
        Settings sel = wanted;
        std::vector<std::string> dropped;
        auto drop_unresolvable = [&](std::string& path, DeviceRole role) {
            DeviceId id;
            Error e;
            if (path.empty() || enumerator_.resolve(path, role, id, e)) return;
            std::cerr << "[Supervisor](resolve_selection_) " << e.describe() << "\n";
            dropped.push_back(path);
            path.clear();
        };
        drop_unresolvable(sel.camera_a, DeviceRole::Capture);
        drop_unresolvable(sel.camera_b, DeviceRole::Capture);
        drop_unresolvable(sel.virtual_output, DeviceRole::Output);

        if (sel.camera_a.empty() || sel.camera_b.empty() || sel.virtual_output.empty()) {
            auto devices = enumerator_.list_devices();
            devices.erase(std::remove_if(devices.begin(), devices.end(),
                                         [&](const DeviceInfo& d) {
                                             return std::find(dropped.begin(), dropped.end(), d.path) != dropped.end();
                                         }),
                          devices.end());
            sel = fill_device_defaults(sel, devices);
        }

        // without a replacement the configured node is kept and reconnected later
        auto settle = [](std::string& path, const std::string& was, const char* what) {
            if (path.empty()) {
                path = was;
            } else if (path != was && !was.empty()) {
                std::cout << "[Supervisor](resolve_selection_) " << what << " " << was << " unavailable, using "
                          << path << "\n";
            }
        };
        settle(sel.camera_a, wanted.camera_a, "camera A");
        settle(sel.camera_b, wanted.camera_b, "camera B");
        settle(sel.virtual_output, wanted.virtual_output, "virtual output");
        return sel;
    }

    bool Supervisor::bring_up_(SourceSlot slot) {
        DeviceId configured;
        uint64_t gen = 0;
        {
            std::lock_guard lk(mtx_);
            auto& st = slots_[index_of(slot)];
            configured = st.device;
            gen = ++st.generation;
            st.health = Health::Negotiating;
        }

        Error err;
        std::unique_ptr<CaptureSource> cap;
        FrameFormat delivered;
        DeviceId dev;

        bool ok = enumerator_.resolve(configured, DeviceRole::Capture, dev, err);
        if (ok) {
            try {
                cap = std::make_unique<CaptureSource>(slot, factory_(slot, dev), opt_.capture);
            } catch (const std::exception& e) {
                err = Error(ErrorCode::PipelineError, e.what());
                ok = false;
            }
        }
        if (ok) {
            cap->subscribe([this](const FramePtr& f) {
                router_->on_frame(f);
                preview_.on_frame(f);
            });
            cap->on_error([this, gen](SourceSlot s, const Error& e) {
                Event ev;
                ev.kind = Event::Kind::SourceFailed;
                ev.slot = s;
                ev.generation = gen;
                ev.err = e;
                events_.push_drop_oldest(std::move(ev));
            });
            ok = cap->open(opt_.format, delivered, err) && cap->start(err);
        }
        if (ok && delivered != router_->output_format()) {
            err = Error(ErrorCode::FormatNegotiationFailed,
                        "delivers " + delivered.describe() + ", output needs " + router_->output_format().describe());
            ok = false;
        }

        if (!ok) {
            if (cap) cap->close();
            std::cerr << "[Supervisor](bring_up_) " << to_string(slot) << " " << configured << ": "
                      << err.describe() << "\n";
            {
                std::lock_guard lk(mtx_);
                auto& st = slots_[index_of(slot)];
                st.health = Health::Error;
                st.last_error = err;
                schedule_reconnect_(st);
            }
            emit_(EventKind::SourceHealthChanged, std::string(to_string(slot)) + " " + err.describe());
            return false;
        }

        router_->attach_source(slot, delivered);
        {
            std::lock_guard lk(mtx_);
            auto& st = slots_[index_of(slot)];
            st.source = std::move(cap);
            st.health = Health::Running;
            st.attempts = 0;
            st.persistent = false;
            st.reconnect_due = false;
            st.last_error = Error();
        }
        std::cout << "[Supervisor](bring_up_) " << to_string(slot) << " running on " << dev << "\n";
        emit_(EventKind::SourceHealthChanged, std::string(to_string(slot)) + " running");
        return true;
    }

    std::unique_ptr<CaptureSource> Supervisor::take_source_(SourceSlot slot) {
        std::lock_guard lk(mtx_);
        return std::move(slots_[index_of(slot)].source);
    }

    void Supervisor::stop() {
        std::lock_guard life(lifecycle_mtx_);
        running_ = false;
        events_.stop();
        if (thread_.joinable()) thread_.join();

        bool was_open = false;
        bool fatal = false;
        {
            std::lock_guard lk(mtx_);
            if (session_ == SessionState::Stopped && output_health_ != OutputHealth::Open) return;
            was_open = output_health_ == OutputHealth::Open;
            fatal = fatal_;
        }

        router_->shutdown();
        output_->close();
        for (auto slot : {SourceSlot::A, SourceSlot::B}) {
            auto src = take_source_(slot);
            if (src) src->close();
        }
        preview_.set_active(std::nullopt);

        {
            std::lock_guard lk(mtx_);
            if (was_open) output_health_ = OutputHealth::Closed;
            for (auto& st : slots_) {
                st.health = Health::Closed;
                st.reconnect_due = false;
            }
        }
        if (was_open) emit_(EventKind::OutputHealthChanged, "closed");
        if (!fatal) set_session_(SessionState::Stopped, "stopped");
        std::cout << "[Supervisor](stop) session closed\n";
    }

    void Supervisor::supervise_loop_() {
        while (running_) {
            Event ev;
            if (events_.pop_for(ev, std::chrono::milliseconds(50))) {
                try {
                    switch (ev.kind) {
                        case Event::Kind::SourceFailed:
                            handle_source_failed_(ev.slot, ev.generation, ev.err);
                            break;
                        case Event::Kind::RetryRequested:
                            handle_retry_(ev.slot);
                            break;
                        case Event::Kind::OutputFailed:
                            handle_output_failed_(ev.err);
                            return;
                    }
                } catch (const std::exception& e) {
                    std::cerr << "[Supervisor](supervise_loop_) " << e.what() << "\n";
                }
            } else if (events_.stopped()) {
                break;
            }
            run_reconnects_();
        }
    }

    void Supervisor::handle_source_failed_(SourceSlot slot, uint64_t generation, const Error& err) {
        {
            std::lock_guard lk(mtx_);
            const auto& st = slots_[index_of(slot)];
            if (fatal_ || st.generation != generation || !st.source) return;
        }

        std::cerr << "[Supervisor](handle_source_failed_) " << to_string(slot) << ": " << err.describe() << "\n";
        const SwitchReply r = router_->fail_over(slot);
        if (!r.ok()) std::cerr << "[Supervisor](handle_source_failed_) failover: " << r.reason << "\n";
        preview_.clear(slot);

        auto src = take_source_(slot);
        if (src) src->close();

        {
            std::lock_guard lk(mtx_);
            auto& st = slots_[index_of(slot)];
            st.health = Health::Error;
            st.last_error = err;
            schedule_reconnect_(st);
        }
        emit_(EventKind::SourceHealthChanged, std::string(to_string(slot)) + " " + err.describe());
    }

    void Supervisor::handle_retry_(SourceSlot slot) {
        std::lock_guard lk(mtx_);
        auto& st = slots_[index_of(slot)];
        if (st.source || fatal_) return;
        st.attempts = 0;
        st.persistent = false;
        st.reconnect_due = true;
        st.next_attempt = std::chrono::steady_clock::now();
    }

    void Supervisor::run_reconnects_() {
        const auto now = std::chrono::steady_clock::now();
        for (auto slot : {SourceSlot::A, SourceSlot::B}) {
            {
                std::lock_guard lk(mtx_);
                auto& st = slots_[index_of(slot)];
                if (fatal_ || st.source || !st.reconnect_due || now < st.next_attempt) continue;
                st.reconnect_due = false;
                ++st.attempts;
                std::cout << "[Supervisor](run_reconnects_) " << to_string(slot) << " attempt "
                          << st.attempts << "/" << opt_.recovery.max_retries << "\n";
            }

            if (!bring_up_(slot)) continue;

            if (!router_->active()) {
                const SwitchReply r = router_->select(slot, ChangeReason::Recovery);
                if (!r.ok()) std::cerr << "[Supervisor](run_reconnects_) select: " << r.reason << "\n";
            }
        }
    }

    void Supervisor::handle_output_failed_(const Error& err) {
        std::cerr << "[Supervisor](handle_output_failed_) fatal: " << err.describe() << "\n";
        {
            std::lock_guard lk(mtx_);
            fatal_ = true;
        }
        running_ = false;

        router_->shutdown();
        for (auto slot : {SourceSlot::A, SourceSlot::B}) {
            auto src = take_source_(slot);
            if (src) src->close();
        }
        output_->close();
        preview_.set_active(std::nullopt);

        {
            std::lock_guard lk(mtx_);
            output_health_ = OutputHealth::Failed;
            for (auto& st : slots_) {
                st.health = Health::Closed;
                st.reconnect_due = false;
            }
        }
        emit_(EventKind::OutputHealthChanged, err.describe());
        set_session_(SessionState::Fatal, err.describe());
    }

    void Supervisor::on_active_changed_(const ActiveChange& c) {
        preview_.set_active(c.active);

        bool persist = false;
        Settings saved;
        if (c.reason == ChangeReason::Command && c.active) {
            std::lock_guard lk(mtx_);
            selection_.last_active = c.active;
            persist = true;
        }
        if (persist) {
            // only the choice is rewritten, device entries stay as the user saved them
            saved = settings_.load();
            saved.last_active = c.active;
            if (!settings_.store(saved)) {
                std::cerr << "[Supervisor](on_active_changed_) unable to persist last_active\n";
            }
        }

        std::string detail = std::string(c.previous ? to_string(*c.previous) : "none") + " -> " +
                             (c.active ? to_string(*c.active) : "none") + " (" + to_string(c.reason) + ")";
        emit_(EventKind::ActiveSourceChanged, detail);

        SessionState s;
        {
            std::lock_guard lk(mtx_);
            s = session_;
        }
        if (s == SessionState::Running || s == SessionState::AllSourcesDown) {
            if (c.active) set_session_(SessionState::Running, "routing " + std::string(to_string(*c.active)));
            else set_session_(SessionState::AllSourcesDown, "no source running");
        }
    }

    void Supervisor::set_session_(SessionState s, const std::string& detail) {
        {
            std::lock_guard lk(mtx_);
            if (session_ == s) return;
            if (session_ == SessionState::Fatal) return;
            session_ = s;
        }
        std::cout << "[Supervisor](set_session_) " << to_string(s) << ": " << detail << "\n";
        emit_(EventKind::SessionStateChanged, detail);
    }

    void Supervisor::emit_(EventKind kind, const std::string& detail) {
        StatusEvent ev;
        ev.seq = ++event_seq_;
        ev.kind = kind;
        ev.detail = detail;
        ev.status = status();

        std::vector<EventListener> ls;
        std::vector<IRenderer*> rs;
        {
            std::lock_guard lk(listen_mtx_);
            for (const auto& kv : listeners_) ls.push_back(kv.second);
            rs = renderers_;
        }
        for (auto* r : rs) r->render_status(ev);
        for (auto& l : ls) l(ev);
    }

    Status Supervisor::status() const {
        Status s;
        s.router = router_->state();
        s.active = router_->active();
        s.preview_enabled = preview_.enabled();
        s.format = opt_.format;

        std::lock_guard lk(mtx_);
        s.session = session_;
        s.output = output_health_;
        s.output_device = output_device_;
        const auto& a = slots_[index_of(SourceSlot::A)];
        const auto& b = slots_[index_of(SourceSlot::B)];
        s.source_a = to_status(a.device, a.health, a.attempts, a.persistent, a.last_error);
        s.source_b = to_status(b.device, b.health, b.attempts, b.persistent, b.last_error);
        return s;
    }

    SessionState Supervisor::session() const {
        std::lock_guard lk(mtx_);
        return session_;
    }

    SwitchReply Supervisor::switch_to(SourceSlot slot) {
        {
            std::lock_guard lk(mtx_);
            if (fatal_ || session_ == SessionState::Stopped) {
                return {SwitchResult::Rejected, std::string("session is ") + to_string(session_)};
            }
        }
        const SwitchReply r = router_->switch_to(slot);
        std::cout << "[Supervisor](switch_to) " << to_string(slot) << ": " << to_string(r.result)
                  << (r.reason.empty() ? "" : " (" + r.reason + ")") << "\n";
        return r;
    }

    bool Supervisor::retry(SourceSlot slot, Error& err) {
        {
            std::lock_guard lk(mtx_);
            if (fatal_ || !running_) {
                err = Error(ErrorCode::PipelineError, std::string("session is ") + to_string(session_));
                return false;
            }
            if (slots_[index_of(slot)].source) return true;
        }
        Event ev;
        ev.kind = Event::Kind::RetryRequested;
        ev.slot = slot;
        if (!events_.push_drop_oldest(std::move(ev))) {
            err = Error(ErrorCode::PipelineError, "supervisor is stopped");
            return false;
        }
        return true;
    }

    int Supervisor::subscribe(EventListener l) {
        std::lock_guard lk(listen_mtx_);
        const int id = next_listener_id_++;
        listeners_.emplace(id, std::move(l));
        return id;
    }

    void Supervisor::unsubscribe(int id) {
        std::lock_guard lk(listen_mtx_);
        listeners_.erase(id);
    }

    void Supervisor::attach_renderer(IRenderer* r) {
        if (!r) return;
        {
            std::lock_guard lk(listen_mtx_);
            if (std::find(renderers_.begin(), renderers_.end(), r) == renderers_.end()) renderers_.push_back(r);
        }
        preview_.attach(r);
    }

    void Supervisor::detach_renderer(IRenderer* r) {
        preview_.detach(r);
        std::lock_guard lk(listen_mtx_);
        renderers_.erase(std::remove(renderers_.begin(), renderers_.end(), r), renderers_.end());
    }

    void Supervisor::set_preview_enabled(bool on) {
        preview_.set_enabled(on);
        {
            std::lock_guard lk(mtx_);
            selection_.preview_enabled = on;
        }
        emit_(EventKind::SessionStateChanged, std::string("preview ") + (on ? "on" : "off"));
    }

    std::vector<DeviceInfo> Supervisor::list_devices() const {
        return enumerator_.list_devices();
    }

    Settings Supervisor::selection() const {
        std::lock_guard lk(mtx_);
        return selection_;
    }

    bool Supervisor::set_selection(const Settings& wanted, Error& err) {
        std::lock_guard life(lifecycle_mtx_);
        Settings sel = selection();
        {
            std::lock_guard lk(mtx_);
            if (session_ != SessionState::Stopped) {
                err = Error(ErrorCode::PipelineError,
                            std::string("session is ") + to_string(session_) + ", stop it first");
                return false;
            }
        }
        if (!wanted.camera_a.empty()) sel.camera_a = wanted.camera_a;
        if (!wanted.camera_b.empty()) sel.camera_b = wanted.camera_b;
        if (!wanted.virtual_output.empty()) sel.virtual_output = wanted.virtual_output;
        if (!validate_selection(sel, err)) return false;

        DeviceId id;
        if (!enumerator_.resolve(sel.camera_a, DeviceRole::Capture, id, err) ||
            !enumerator_.resolve(sel.camera_b, DeviceRole::Capture, id, err) ||
            !enumerator_.resolve(sel.virtual_output, DeviceRole::Output, id, err)) {
            std::cerr << "[Supervisor](set_selection) " << err.describe() << "\n";
            return false;
        }

        {
            std::lock_guard lk(mtx_);
            selection_ = sel;
            override_ = sel;
            slots_[index_of(SourceSlot::A)].device = sel.camera_a;
            slots_[index_of(SourceSlot::B)].device = sel.camera_b;
        }
        std::cout << "[Supervisor](set_selection) " << sel.camera_a << ", " << sel.camera_b << " -> "
                  << sel.virtual_output << "\n";
        emit_(EventKind::SessionStateChanged, "selection " + sel.camera_a + ", " + sel.camera_b + " -> " +
                                                  sel.virtual_output);
        return true;
    }

    bool Supervisor::save_defaults(Error& err) {
        const Settings s = selection();
        if (!validate_selection(s, err)) return false;
        if (!settings_.store(s)) {
            err = Error(ErrorCode::InvalidConfiguration, "unable to write settings");
            return false;
        }
        std::cout << "[Supervisor](save_defaults) saved " << s.camera_a << ", " << s.camera_b
                  << " -> " << s.virtual_output << "\n";
        return true;
    }

    bool Supervisor::clear_defaults(Error& err) {
        if (!settings_.clear()) {
            err = Error(ErrorCode::InvalidConfiguration, "unable to remove settings");
            return false;
        }
        std::cout << "[Supervisor](clear_defaults) defaults cleared\n";
        return true;
    }
}
