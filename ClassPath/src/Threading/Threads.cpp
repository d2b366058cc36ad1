// We need our declaration
#include "../../include/Threading/Threads.hpp"

#if defined(_LINUX)
#include <sys/prctl.h>
#endif

namespace Threading
{

Thread::~Thread()
{
    // You MUST destroy the thread in your own destructor, as when the
    // execution hits here, your members are already destructed, but your
    // thread might still be running using them!!!
    destroyThread();
}

Thread::Thread(const char * name) :
    threadName(name), leaving(0), run(false), _lock(name), isCreated(false)
{
    memset(&thread, 0, sizeof(thread));
}

bool Thread::createThread(const int stackSize)
{
    {
        ScopedLock scope(_lock);
        if (isCreated)
        {
            // Need to release the RunCondition object lock
            ScopedUnlock unscope(_lock);
            if (!destroyThread()) return false;
        }
        run.start();
    }

    pthread_attr_t attr;
    pthread_attr_init(&attr);
    if (stackSize)
        pthread_attr_setstacksize(&attr, stackSize);

    if (pthread_create(&thread, &attr, Thread::RunThread, (void*)this) != 0)
    {
        pthread_attr_destroy(&attr);
        ScopedLock scope(_lock);
        run.stop();   memset((void*)&thread, 0, sizeof(thread)); return false;
    }
    pthread_attr_destroy(&attr);
    isCreated = true;
    return true;
}

void * Thread::RunThread(void * pVoid)
{
    if (pVoid != NULL)
    {
        Thread * pThread = (Thread*)pVoid;
#if defined(_LINUX)
        if (pThread->threadName) prctl(PR_SET_NAME, pThread->threadName, 0, 0, 0);
#endif
        // Only the main thread deals with the termination signals
        sigset_t mask;
        sigemptyset(&mask);
        sigaddset(&mask, SIGINT);
        sigaddset(&mask, SIGTERM);
        pthread_sigmask(SIG_BLOCK, &mask, NULL);

        void * dw = (void*)(long int)pThread->runThread();

        // Stop the run condition anyway
        ScopedLock scope(pThread->_lock);
        pThread->run.stop();
        return dw;
    }
    return 0;
}

// Check if the thread is running
bool Thread::isRunning() const
{
    ScopedLock scope(_lock);
    return run.isRunning();
}

bool Thread::destroyThread()
{
    {
        ScopedLock scope(_lock);
        // Ask the thread to stop
        run.stop();
        if (!isCreated) return true;
    }

    // Check if we are not suiciding
    if (isOurThread()) return false;

    if (leaving) leaving->threadLeaving(this);
    void * ret;
    pthread_join(thread, &ret);
    memset((void*)&thread, 0, sizeof(thread));
    isCreated = false;
    return true;
}

void Thread::Sleep(const uint32 lMilliseconds, const bool hard)
{
    if (lMilliseconds == 0) sched_yield();
    else
    {
        struct timespec req = { (time_t)(lMilliseconds / 1000), (long)((lMilliseconds % 1000) * 1000000) };
        while (nanosleep(&req, &req) < 0 && hard);
    }
}

bool Thread::isOurThread() const
{
    return isCreated && pthread_equal(pthread_self(), thread) != 0;
}

}
