#ifndef h_CPP_Lock_CPP_h
#define h_CPP_Lock_CPP_h

// Include object naming
#include "../Types.hpp"
// We need time declaration too
#include <time.h>

#ifndef __cplusplus
    #error "This file shouldn't be included in C code"
#endif


namespace Threading
{
    /** The timeout to wait for */
    enum TimeOut
    {
        InstantCheck = 0,
        Infinite = 0xFFFFFFFF,
    };


    /** This class implements inter-thread event objects

        Events can be in 2 states (Set or Unset)
        State transitions are atomic

        Any thread can wait on an event.
        Only one thread can change the event's state to Set at a given time
    */
    class Event
    {
    private:
        /** This event name (used in debug mode) */
        const char*     name;
        /** The event object */
        OEVENT          event;
        /** Should the event automatically reset ? */
        bool            manualReset;
        /** The event state */
        volatile bool   state;
        /** A synchronized condition to avoid polling on the mutexed state */
        pthread_cond_t  condition;

        /** Those methods are too big to be included here, please refer to lock.cpp for details */
        bool _Wait(const uint32 length) volatile;
        bool _Reset() volatile;
        bool _Set() volatile;

    public:
        /** The event type */
        enum Type
        {
            ManualReset = 1, //!< The event needs to be reset by calling Reset() when Set()
            AutoReset   = 0, //!< The event automatically reset when a Wait succeed after a Set()
        };

        /** The initial state */
        enum InitialState
        {
            InitiallyFree = 0, //!< The event was created initially free
            InitiallySet = 1,  //!< The event was created initially set
        };


        /** Build an event.
            For atomic / single thread unlock on Waiting, you must use AutoReset.
            @param name         The event name (only useful for debugging)
            @param type         When ManualReset, the transition from Set to Unset requires calling Reset, else it's done automatically in a successful Wait
            @param initialState The event Set state when created */
        Event(const char * name = NULL, const Type type = ManualReset, const InitialState initialState = InitiallyFree)
            : name(name), manualReset(type == ManualReset), state(initialState == InitiallySet)
        {
            pthread_mutex_init(&event, NULL);
            pthread_cond_init(&condition, NULL);
        }

        ~Event()
        {
            // Lock the mutex
            while (pthread_mutex_lock(&event) != 0) { sched_yield(); }
            while (pthread_cond_destroy(&condition) == EBUSY) { pthread_cond_broadcast(&condition); pthread_mutex_unlock(&event); sched_yield(); while(pthread_mutex_lock(&event) != 0) sched_yield();  }
            pthread_mutex_unlock(&event);
            while (pthread_mutex_destroy(&event) == EBUSY) { sched_yield(); }
        }
        /** Wait a given amount of time for this event to be set
            @param length   Time to wait for in ms (can be InstantCheck i.e. doesn't wait, or Infinite)
            @return if length = Infinite, only returns when event's state was set
                    else, return true on event set while waiting, false otherwise
        */
        inline bool Wait(const uint32 length = Infinite) volatile       { return _Wait(length); }
        /** Set this event (goes to Set state) */
        inline bool Set() volatile                                      { return _Set(); }
        /** Reset this event (only if autoreset is false) */
        inline bool Reset() volatile                                    { return _Reset(); }
        /** Get the event name */
        inline const char * getName() const volatile                    { return name; }
    };

    /** Common inter-thread locking class
        This will wrap platform specific mutexes.
        @sa ScopedLock
    */
    class FastLock
    {
    private:
        /** The object name (for debugging purpose) */
        const char *  name;
        HMUTEX mutex;
        /** Those methods are too big to be included here, please refer to lock.cpp for details */
        bool _Lock(const uint32 length) volatile;
        void _Unlock() volatile;

    public:
        /** Build a lock.
            @param name         The lock name (only useful for debugging)
            @param initialOwner When true, this is atomically equivalent to "Lock lock; lock.Acquire();" */
        FastLock(const char * name = NULL, const bool initialOwner = false)
            : name(name)
        {
            pthread_mutex_init(&mutex, NULL); if (initialOwner) Acquire();
        }

        ~FastLock() { Acquire(); Release(); while (pthread_mutex_destroy(&mutex) == EBUSY) sched_yield();  }

        /** Try to acquire the lock
            @return true on successful acquisition (no timeout by default), false on error
            @warning only return false if the locking primitive is deleted, or on recursive locking.
            @warning If it ever return false, your application logic is broken.
        */
        inline bool Acquire() volatile   { return _Lock(Infinite); }
        /** Try to acquire the lock
            @return true on successful acquisition, false on timeout */
        inline bool TryAcquire(const uint32 length) volatile { return _Lock(length); }
        /** Release the (acquired) lock or do nothing if unlocked */
        inline bool Release() volatile   { _Unlock(); return true; }
        /** Get the lock name */
        const char * getName() const volatile { return name; }
    };

    /** Say we are using fast locks as locking primitive (it's not shared between processes) */
    typedef FastLock Lock;
    /** The classical scoped lock class */
    class ScopedLock
    {
    private:
        volatile Lock & lock;

        /** Non mutable class */
        ScopedLock & operator = (const ScopedLock & other);
        /** Non mutable class */
        ScopedLock(const ScopedLock & other);
    public:
        /** Takes a reference on a lock to acquire it and release on scope's end */
        ScopedLock(volatile Lock & lock) : lock(lock) { lock.Acquire(); }
        ~ScopedLock() { lock.Release(); }
    };
    /** The classical scoped unlock class */
    class ScopedUnlock
    {
    private:
        volatile Lock & lock;

        /** Non mutable class */
        ScopedUnlock & operator = (const ScopedUnlock & other);
        /** Non mutable class */
        ScopedUnlock(const ScopedUnlock & other);
    public:
        /** Takes a reference on a lock to release it and acquire on scope's end */
        ScopedUnlock(volatile Lock & lock) : lock(lock) { lock.Release(); }
        ~ScopedUnlock() { lock.Acquire(); }
    };
}

#endif
