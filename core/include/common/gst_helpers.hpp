#pragma once

#include <common/errors.hpp>

#include <gst/gst.h>

namespace cs {
    void ensure_gst_init();

    // Resource NOT_FOUND -> DeviceNotFound, OPEN_* / NOT_AUTHORIZED ->
    // PermissionDenied, negotiation failures -> FormatNegotiationFailed,
    // everything else -> fallback.
    Error error_from_gerror(const GError* e, const gchar* debug, ErrorCode fallback);

    // Pops the first ERROR or EOS message waiting on the pipeline bus.
    bool pop_bus_error(GstElement* pipeline, GstClockTime timeout, ErrorCode fallback, Error& err);
}
