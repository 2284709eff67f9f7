#pragma once

#include <ingest/device_enumerator.hpp>
#include <pipeline/switch_router.hpp>
#include <pipeline/types.hpp>

#include <string>
#include <vector>

namespace cs {
    std::string json_escape(const std::string& s);

    std::string to_json(const Status& s);
    std::string to_json(const StatusEvent& ev);
    std::string to_json(const std::vector<StatusEvent>& events);
    std::string to_json(const std::vector<DeviceInfo>& devices);
    std::string to_json(const SwitchReply& r);
}
