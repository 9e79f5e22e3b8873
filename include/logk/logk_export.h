#pragma once
#if defined(_WIN32) || defined(_WIN64)
  #if defined(LOGK_EXPORTS)
    #define LOGK_API __declspec(dllexport)
  #else
    #define LOGK_API __declspec(dllimport)
  #endif
#else
  #define LOGK_API __attribute__((visibility("default")))
#endif
