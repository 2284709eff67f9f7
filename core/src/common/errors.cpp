#include <common/errors.hpp>

namespace cs {
    const char* to_string(ErrorCode c) {
        switch (c) {
            case ErrorCode::None: return "None";
            case ErrorCode::DeviceNotFound: return "DeviceNotFound";
            case ErrorCode::PermissionDenied: return "PermissionDenied";
            case ErrorCode::FormatNegotiationFailed: return "FormatNegotiationFailed";
            case ErrorCode::DeviceDisconnected: return "DeviceDisconnected";
            case ErrorCode::SwitchTimeout: return "SwitchTimeout";
            case ErrorCode::SwitchRejectedBusy: return "SwitchRejectedBusy";
            case ErrorCode::OutputWriteFailed: return "OutputWriteFailed";
            case ErrorCode::InvalidConfiguration: return "InvalidConfiguration";
            case ErrorCode::PipelineError: return "PipelineError";
        }
        return "Unknown";
    }

    std::string Error::describe() const {
        if (message.empty()) return to_string(code);
        return std::string(to_string(code)) + ": " + message;
    }
}
