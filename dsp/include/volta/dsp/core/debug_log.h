// ==============================================================================
// Layer 0: Core Utility - Debug Logging
// ==============================================================================
// Compile-time switchable diagnostics for setup paths (prepare summaries,
// rejected configurations). Compiles to nothing unless VOLTA_DSP_DEBUG is 1.
//
// Never call VOLTA_DSP_LOG from process()/processBlock(): formatting and
// stderr I/O are not real-time safe.
// ==============================================================================

#pragma once

#ifndef VOLTA_DSP_DEBUG
#define VOLTA_DSP_DEBUG 0
#endif

#if VOLTA_DSP_DEBUG
#include <cstdarg>
#include <cstdio>
#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#endif

namespace Volta {
namespace DSP {
namespace detail {

inline void debugLog(const char* fmt, ...) {
    char buf[512];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);
#ifdef _WIN32
    OutputDebugStringA(buf);
#else
    fprintf(stderr, "%s", buf);
#endif
}

} // namespace detail
} // namespace DSP
} // namespace Volta

#define VOLTA_DSP_LOG(...) ::Volta::DSP::detail::debugLog(__VA_ARGS__)
#else
#define VOLTA_DSP_LOG(...) ((void)0)
#endif
