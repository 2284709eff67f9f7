#include <control/status_json.hpp>

#include <cstdio>
#include <sstream>

namespace cs {
    std::string json_escape(const std::string& s) {
        std::string out;
        out.reserve(s.size() + 2);
        for (char c : s) {
            switch (c) {
                case '"': out += "\\\""; break;
                case '\\': out += "\\\\"; break;
                case '\n': out += "\\n"; break;
                case '\r': out += "\\r"; break;
                case '\t': out += "\\t"; break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20) {
                        char buf[8];
                        std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                        out += buf;
                    } else {
                        out += c;
                    }
            }
        }
        return out;
    }

    static void write_source(std::ostringstream& oss, const SourceStatus& s) {
        oss << "{\"health\":\"" << to_string(s.health) << "\""
            << ",\"device\":\"" << json_escape(s.device) << "\""
            << ",\"reconnect_attempts\":" << s.reconnect_attempts
            << ",\"persistent_failure\":" << (s.persistent_failure ? "true" : "false")
            << ",\"last_error\":\"" << json_escape(s.last_error) << "\"}";
    }

    static void write_status(std::ostringstream& oss, const Status& s) {
        oss << "{\"session\":\"" << to_string(s.session) << "\""
            << ",\"router\":\"" << to_string(s.router) << "\""
            << ",\"active\":";
        if (s.active) oss << "\"" << to_string(*s.active) << "\"";
        else oss << "null";
        oss << ",\"source_a\":";
        write_source(oss, s.source_a);
        oss << ",\"source_b\":";
        write_source(oss, s.source_b);
        oss << ",\"output\":{\"health\":\"" << to_string(s.output) << "\""
            << ",\"device\":\"" << json_escape(s.output_device) << "\""
            << ",\"format\":\"" << json_escape(s.format.describe()) << "\"}"
            << ",\"preview\":" << (s.preview_enabled ? "true" : "false") << "}";
    }

    static void write_event(std::ostringstream& oss, const StatusEvent& ev) {
        oss << "{\"seq\":" << ev.seq
            << ",\"kind\":\"" << to_string(ev.kind) << "\""
            << ",\"detail\":\"" << json_escape(ev.detail) << "\""
            << ",\"status\":";
        write_status(oss, ev.status);
        oss << "}";
    }

    std::string to_json(const Status& s) {
        std::ostringstream oss;
        write_status(oss, s);
        return oss.str();
    }

    std::string to_json(const StatusEvent& ev) {
        std::ostringstream oss;
        write_event(oss, ev);
        return oss.str();
    }

    std::string to_json(const std::vector<StatusEvent>& events) {
        std::ostringstream oss;
        oss << "[";
        for (size_t i = 0; i < events.size(); ++i) {
            write_event(oss, events[i]);
            if (i + 1 < events.size()) oss << ",";
        }
        oss << "]";
        return oss.str();
    }

    std::string to_json(const std::vector<DeviceInfo>& devices) {
        std::ostringstream oss;
        oss << "[";
        for (size_t i = 0; i < devices.size(); ++i) {
            const auto& d = devices[i];
            oss << "{\"path\":\"" << json_escape(d.path) << "\""
                << ",\"name\":\"" << json_escape(d.name) << "\""
                << ",\"driver\":\"" << json_escape(d.driver) << "\""
                << ",\"kind\":\"" << to_string(d.kind) << "\"}";
            if (i + 1 < devices.size()) oss << ",";
        }
        oss << "]";
        return oss.str();
    }

    std::string to_json(const SwitchReply& r) {
        std::ostringstream oss;
        oss << "{\"result\":\"" << to_string(r.result) << "\"";
        if (!r.ok()) oss << ",\"error\":\"" << to_string(r.code()) << "\"";
        oss << ",\"reason\":\"" << json_escape(r.reason) << "\"}";
        return oss.str();
    }
}
