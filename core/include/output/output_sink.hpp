#pragma once

#include <common/errors.hpp>
#include <pipeline/types.hpp>

#include <string>

namespace cs {
    // Writes routed frames to the virtual device. The format is fixed by
    // open() and never renegotiated; a failed write ends the session.
    struct IOutputSink {
        virtual ~IOutputSink() = default;

        virtual bool open(const DeviceId& device, const FrameFormat& format, Error& err) = 0;
        virtual bool write(const Frame& frame, Error& err) = 0;
        virtual void close() = 0;

        virtual bool is_open() const = 0;
        virtual FrameFormat format() const = 0;
        virtual const DeviceId& device() const = 0;
    };
}
