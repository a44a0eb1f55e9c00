#pragma once

#if defined(_WIN32) || defined(__CYGWIN__)
    #ifdef VIEWMAPPER_EXPORTS
        #define VIEWMAPPER_API __declspec(dllexport)
    #else
        #define VIEWMAPPER_API __declspec(dllimport)
    #endif
#else
    #if __GNUC__ >= 4
        #define VIEWMAPPER_API __attribute__((visibility("default")))
    #else
        #define VIEWMAPPER_API
    #endif
#endif
