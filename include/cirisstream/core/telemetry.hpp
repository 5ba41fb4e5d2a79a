#pragma once

// -----------------------------------------------------------------------------
// Telemetry level configuration
// -----------------------------------------------------------------------------
//
// L1: cheap cumulative counters on lifecycle and per-frame paths.
// Compiled out entirely unless CIRISSTREAM_ENABLE_TELEMETRY_L1 is defined.

#if defined(CIRISSTREAM_ENABLE_TELEMETRY_L1)
    #define CS_TL1(expr) expr
#else
    #define CS_TL1(expr) ((void)0)
#endif
