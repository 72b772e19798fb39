#pragma once

// Symbol visibility for the tsexec shared library. CMake defines tsexec_EXPORTS while building it.
#if defined _WIN32 || defined __CYGWIN__
#  ifdef tsexec_EXPORTS
#    ifdef __GNUC__
#      define TSEXEC_EXPORT __attribute__((dllexport))
#    else
#      define TSEXEC_EXPORT __declspec(dllexport)
#    endif
#  else
#    ifdef __GNUC__
#      define TSEXEC_EXPORT __attribute__((dllimport))
#    else
#      define TSEXEC_EXPORT __declspec(dllimport)
#    endif
#  endif
#elif defined __GNUC__ && __GNUC__ >= 4
#  define TSEXEC_EXPORT __attribute__((visibility("default")))
#else
#  define TSEXEC_EXPORT
#endif
