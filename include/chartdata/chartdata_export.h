#pragma once

// Symbol visibility for the chartdata library. Static builds (the default) need no decoration;
// shared builds define CHARTDATA_SHARED, and chartdata_EXPORTS while compiling the library itself.

#if !defined(CHARTDATA_SHARED)
#define CHARTDATA_EXPORT
#elif defined _WIN32 || defined __CYGWIN__
#ifdef chartdata_EXPORTS
#define CHARTDATA_EXPORT __declspec(dllexport)
#else
#define CHARTDATA_EXPORT __declspec(dllimport)
#endif
#elif __GNUC__ >= 4
#define CHARTDATA_EXPORT __attribute__ ((visibility ("default")))
#else
#define CHARTDATA_EXPORT
#endif
