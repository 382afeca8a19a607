#pragma once

//==============================================================================
/**
    Development feature flags and utilities.
    All flags are compile-time only with zero runtime cost.
*/

// Read SESSIONSCOPE_DEV_MODE compile definition
#ifndef SESSIONSCOPE_DEV_MODE
#define SESSIONSCOPE_DEV_MODE 0
#endif

//==============================================================================
// Feature Flags
//==============================================================================

#if SESSIONSCOPE_DEV_MODE
    // Dev mode defaults
    #ifndef SESSIONSCOPE_HEAVY_LOGGING
    #define SESSIONSCOPE_HEAVY_LOGGING 1
    #endif

    // Log every peak/RMS cache rebuild (very chatty while scrolling)
    #ifndef SESSIONSCOPE_TRACE_CACHES
    #define SESSIONSCOPE_TRACE_CACHES 0
    #endif
#else
    // Release mode defaults
    #ifndef SESSIONSCOPE_HEAVY_LOGGING
    #define SESSIONSCOPE_HEAVY_LOGGING 0
    #endif

    #ifndef SESSIONSCOPE_TRACE_CACHES
    #define SESSIONSCOPE_TRACE_CACHES 0
    #endif
#endif

//==============================================================================
// Dev Logging Macros
//==============================================================================

#if SESSIONSCOPE_HEAVY_LOGGING
    #include <juce_core/juce_core.h>
    #define SESSIONSCOPE_LOG(x) juce::Logger::writeToLog (x)
#else
    #define SESSIONSCOPE_LOG(x) ((void)0)  // Compiles out completely
#endif

#if SESSIONSCOPE_TRACE_CACHES
    #include <juce_core/juce_core.h>
    #define SESSIONSCOPE_TRACE(x) juce::Logger::writeToLog (x)
#else
    #define SESSIONSCOPE_TRACE(x) ((void)0)
#endif
