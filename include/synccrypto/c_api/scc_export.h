#pragma once

#if defined(_WIN32) || defined(__CYGWIN__)
  #if defined(SYNCCRYPTO_EXPORTS)
    #define SCC_API __declspec(dllexport)
  #elif defined(SYNCCRYPTO_SHARED)
    #define SCC_API __declspec(dllimport)
  #else
    #define SCC_API
  #endif
#elif defined(__GNUC__) && __GNUC__ >= 4
  #define SCC_API __attribute__((visibility("default")))
#else
  #define SCC_API
#endif
