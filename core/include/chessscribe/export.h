#pragma once

/// \file export.h
/// \brief Symbol visibility for the chessscribe_core library.
///
/// The build defines CHESSSCRIBE_SHARED when the library is a shared object,
/// and CHESSSCRIBE_BUILDING while compiling the library's own sources.
/// A static build (the default) needs neither.

#if !defined(CHESSSCRIBE_SHARED)
    #define CHESSSCRIBE_API
#elif defined(_WIN32)
    #if defined(CHESSSCRIBE_BUILDING)
        #define CHESSSCRIBE_API __declspec(dllexport)
    #else
        #define CHESSSCRIBE_API __declspec(dllimport)
    #endif
#else
    #define CHESSSCRIBE_API __attribute__((visibility("default")))
#endif
