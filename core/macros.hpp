#pragma once

#define KDC_UNUSED(x) (void) (x)
#define KDC_LIKELY(x) __builtin_expect(!!(x), 1)
#define KDC_UNLIKELY(x) __builtin_expect(!!(x), 0)

// Windows 平台导出/导入宏
#ifdef _WIN32
    #ifdef KDC_DLL_EXPORT
        #define KDC_API __declspec(dllexport)
    #else
        #define KDC_API __declspec(dllimport)
    #endif
#else
    #define KDC_API
#endif
