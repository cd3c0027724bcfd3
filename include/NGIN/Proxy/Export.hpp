#pragma once

#if defined(_WIN32) || defined(_WIN64)
  #if defined(NGIN_PROXY_STATIC)
    #define NGIN_PROXY_API
  #else
    #if defined(NGIN_PROXY_EXPORTS)
      #define NGIN_PROXY_API __declspec(dllexport)
    #else
      #define NGIN_PROXY_API __declspec(dllimport)
    #endif
  #endif
#else
  #define NGIN_PROXY_API
#endif
