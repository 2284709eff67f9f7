#pragma once

#include <string>

namespace cs {
    enum class ErrorCode {
        None,
        DeviceNotFound,
        PermissionDenied,
        FormatNegotiationFailed,
        DeviceDisconnected, // post-open I/O failure, EOS or stall
        SwitchTimeout,
        SwitchRejectedBusy,
        OutputWriteFailed,  // fatal for the session
        InvalidConfiguration,
        PipelineError
    };

    const char* to_string(ErrorCode c);

    struct Error {
        ErrorCode code = ErrorCode::None;
        std::string message;

        Error() = default;
        Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

        explicit operator bool() const { return code != ErrorCode::None; }
        std::string describe() const;
    };
}
