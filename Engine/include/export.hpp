#pragma once

#if defined(_WIN32)
    #if defined(RUSSELL_EXPORT)
        #define RUSSELL_API __declspec(dllexport)
    #else
        #define RUSSELL_API __declspec(dllimport)
    #endif
#else
    #define RUSSELL_API __attribute__((visibility("default")))
#endif
