#pragma once

#if defined(_WIN32) && defined(ATTITUDE_CORE_SHARED)
  #if defined(ATTITUDE_CORE_BUILDING)
    #define ATTITUDE_CORE_API __declspec(dllexport)
  #else
    #define ATTITUDE_CORE_API __declspec(dllimport)
  #endif
#else
  #define ATTITUDE_CORE_API
#endif
