#pragma once

// Cross-platform API export/import macros
#ifdef _WIN32
#ifdef MUFFLE_EXPORTS
#define MUFFLE_API __declspec(dllexport)
#else
#define MUFFLE_API __declspec(dllimport)
#endif
#else
    // Linux/GCC
#ifdef MUFFLE_EXPORTS
#define MUFFLE_API __attribute__((visibility("default")))
#else
#define MUFFLE_API
#endif
#endif
