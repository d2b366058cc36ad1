// We need our declaration
#include "../../include/Threading/Lock.hpp"

namespace Threading
{
    // Compute the absolute deadline for the given timeout in ms
    static void computeDeadline(struct timespec & deadline, const uint32 length)
    {
        clock_gettime(CLOCK_REALTIME, &deadline);
        deadline.tv_sec += length / 1000;
        deadline.tv_nsec += (long)(length % 1000) * 1000000L;
        if (deadline.tv_nsec >= 1000000000L) { deadline.tv_sec++; deadline.tv_nsec -= 1000000000L; }
    }

    bool Event::_Wait(const uint32 length) volatile
    {
        pthread_mutex_t * mutex = const_cast<pthread_mutex_t *>(&event);
        pthread_cond_t * cond = const_cast<pthread_cond_t *>(&condition);
        if (pthread_mutex_lock(mutex) != 0) return false;

        struct timespec deadline;
        if (length != (uint32)Infinite && length != (uint32)InstantCheck) computeDeadline(deadline, length);

        while (!state)
        {
            if (length == (uint32)InstantCheck) break;
            int ret = length == (uint32)Infinite ? pthread_cond_wait(cond, mutex) : pthread_cond_timedwait(cond, mutex, &deadline);
            if (ret == ETIMEDOUT) break;
            if (ret != 0) { pthread_mutex_unlock(mutex); return false; }
        }
        bool wasSet = state;
        if (wasSet && !manualReset) state = false;
        pthread_mutex_unlock(mutex);
        return wasSet;
    }

    bool Event::_Reset() volatile
    {
        pthread_mutex_t * mutex = const_cast<pthread_mutex_t *>(&event);
        if (pthread_mutex_lock(mutex) != 0) return false;
        state = false;
        pthread_mutex_unlock(mutex);
        return true;
    }

    bool Event::_Set() volatile
    {
        pthread_mutex_t * mutex = const_cast<pthread_mutex_t *>(&event);
        pthread_cond_t * cond = const_cast<pthread_cond_t *>(&condition);
        if (pthread_mutex_lock(mutex) != 0) return false;
        state = true;
        // Wake everyone for manual reset events, the first waiter takes it for auto reset events
        if (manualReset) pthread_cond_broadcast(cond);
        else pthread_cond_signal(cond);
        pthread_mutex_unlock(mutex);
        return true;
    }

    bool FastLock::_Lock(const uint32 length) volatile
    {
        pthread_mutex_t * m = const_cast<pthread_mutex_t *>(&mutex);
        if (length == (uint32)Infinite) return pthread_mutex_lock(m) == 0;
        if (length == (uint32)InstantCheck) return pthread_mutex_trylock(m) == 0;
#if defined(_LINUX)
        struct timespec deadline;
        computeDeadline(deadline, length);
        return pthread_mutex_timedlock(m, &deadline) == 0;
#else
        // No timed lock on this platform, so poll
        for (uint32 waited = 0; waited < length; waited++)
        {
            if (pthread_mutex_trylock(m) == 0) return true;
            usleep(1000);
        }
        return false;
#endif
    }

    void FastLock::_Unlock() volatile
    {
        pthread_mutex_unlock(const_cast<pthread_mutex_t *>(&mutex));
    }
}
