/**
 * @file export.hpp
 * @brief Symbol visibility for the meisai_engine shared library
 */

#pragma once

#if defined(_WIN32)
    #if defined(MEISAI_EXPORT)
        #define MEISAI_API __declspec(dllexport)
    #else
        #define MEISAI_API __declspec(dllimport)
    #endif
#else
    #define MEISAI_API __attribute__((visibility("default")))
#endif
