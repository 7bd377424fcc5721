#ifndef SBUS_CONFIG_H
#define SBUS_CONFIG_H

#define SBUS_VERSION_MAJOR 1
#define SBUS_VERSION_MINOR 0
#define SBUS_VERSION_PATCH 0
#define SBUS_VERSION_STRING "1.0.0"

#if defined(_WIN32) && defined(SBUS_SHARED)
    #ifdef SBUS_BUILDING_LIBRARY
        #define SBUS_API __declspec(dllexport)
    #else
        #define SBUS_API __declspec(dllimport)
    #endif
#elif defined(__GNUC__) && __GNUC__ >= 4
    #define SBUS_API __attribute__((visibility("default")))
#else
    #define SBUS_API
#endif

#endif // SBUS_CONFIG_H
