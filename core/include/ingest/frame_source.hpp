#pragma once

#include <common/errors.hpp>
#include <pipeline/types.hpp>

#include <string>
#include <vector>

namespace cs {
    enum class ReadStatus { Frame, Timeout, Disconnected };

    // One physical device's acquisition backend. Not thread-safe: a single
    // CaptureSource drives it from its worker.
    struct IFrameSource {
        virtual ~IFrameSource() = default;

        // modes the device advertises; an empty list is not an error
        virtual bool query_modes(std::vector<FrameFormat>& modes, Error& err) = 0;

        // build the pipeline for device_mode, converting into session.
        // delivered receives the format read() will produce.
        virtual bool configure(const FrameFormat& device_mode,
                               const FrameFormat& session,
                               FrameFormat& delivered,
                               Error& err) = 0;

        virtual bool start(Error& err) = 0;
        virtual void stop() = 0;
        virtual ReadStatus read(Frame& out, int timeout_ms, Error& err) = 0;
        virtual const std::string& id() const = 0;
    };
}
