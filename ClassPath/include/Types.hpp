#ifndef hpp_Types_hpp
#define hpp_Types_hpp


// We need our configuration
#include "../ClassPathConfig.hpp"

// Configure the typical macros
#if __linux == 1
    #define _LINUX 1
#endif
#if __APPLE__ == 1
    #define _MAC 1
#endif

// Don't test against Linux and Mac each time we need a Posix system
#if (_LINUX == 1) || (_MAC == 1)
#define _POSIX 1
#else
#error This code only builds on Posix systems (it spawns processes and relies on pipes and fsync)
#endif


#ifdef DontWantTypes
#define DontWantUINT8
#define DontWantUINT16
#define DontWantUINT32
#define DontWantUINT64
#define DontWantINT8
#define DontWantINT16
#define DontWantINT32
#define DontWantINT64
#endif

#include <dirent.h>
#include <errno.h>
#include <fcntl.h>
#include <pthread.h>
#include <signal.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <poll.h>
#include <unistd.h>

#include <limits.h>
#include <stdlib.h>
#include <memory.h>
#include <new>
#include <stdarg.h>
#include <stdio.h>
#include <string.h>
#include <stdint.h>

#ifndef DontWantUINT8
    typedef uint8_t uint8;
#endif
#ifndef DontWantUINT32
    typedef uint32_t uint32;
#endif
#ifndef DontWantUINT16
    typedef uint16_t uint16;
#endif
#ifndef DontWantUINT64
    typedef uint64_t uint64;
#endif
#ifndef DontWantINT8
    typedef int8_t int8;
#endif
#ifndef DontWantINT32
    typedef int32_t int32;
#endif
#ifndef DontWantINT16
    typedef int16_t int16;
#endif
#ifndef DontWantINT64
    typedef int64_t int64;
#endif

// Use with (unsigned long long) casts, uint64 is not always a long long
#define PF_LLD  "%lld"
#define PF_LLU  "%llu"

#ifndef min
    template <typename T>
        inline T min(T a, T b) { return a < b ? a : b; }
    template <typename T>
        inline T max(T a, T b) { return a > b ? a : b; }
    template <typename T>
        inline T clamp(T a, T low, T high) { return a < low ? low : (a > high ? high : a); }

    #define minDefined
#endif

#if defined(__GNUC__)
    #define ForcedInline(X) X __attribute__ ((always_inline))
    #define Unused(X) X __attribute__ ((unused))
#else
    #define ForcedInline(X) X
    #define Unused(X) X
#endif

/** Delete a pointer and zero it */
template <typename T> inline void delete0(T*& t) { delete t; t = 0; }
/** Delete a pointer to an array and zero it */
template <typename T> inline void deleteA0(T*& t) { delete[] t; t = 0; }
/** Delete a pointer to an array, zero it, and zero the elements count too */
template <typename T, typename U> inline void deleteA0(T*& t, U & size) { delete[] t; t = 0; size = 0; }

namespace Private
{
    // If the compiler stop here, you're actually trying to figure out the size of an pointer and not a compile-time array.
    template< typename T, size_t N >
    char (&ArraySize_REQUIRES_ARRAY_ARGUMENT(T (&)[N]))[N];
}

#define ArrSz(X) sizeof(Private::ArraySize_REQUIRES_ARRAY_ARGUMENT(X))
#ifndef ArraySize
   #define ArraySize ArrSz
#endif

typedef pthread_t           HTHREAD;
typedef pthread_mutex_t     HMUTEX;
typedef pthread_mutex_t     OEVENT;

#endif
