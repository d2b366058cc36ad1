#ifndef h_CPP_Thread_CPP_h
#define h_CPP_Thread_CPP_h

// Need types
#include "../Types.hpp"
// Need Locks
#include "Lock.hpp"

#ifndef __cplusplus
    #error "This file shouldn't be included in C code"
#endif

/** Classes that provides multithreading functionality.
    You'll find the abstract class Threading::Thread to implement a safe thread.
    If you need to run a method of an object asynchronously, you'll have to use Threading::JobThread.

    The locking primitives are:
    - Threading::Lock (based on pthread's mutex),
    - Threading::Event (useful to signal a condition atomically) */
namespace Threading
{
    class RunCondition
    {
        /** The thread run condition */
        bool        run;
        /** Disallow copying */
        RunCondition(const RunCondition &);
        /** Disallow copying */
        RunCondition & operator = (const RunCondition &);

    public:
        /** Thread should run */
        inline void start()             { run = true; }
        /** Is the thread running ? */
        inline bool isRunning() const   { return run; }
        /** Thread should stop */
        inline void stop()              { run = false; }
        /** Construction */
        RunCondition(const bool run) : run(run)   {}
    };

    /** This class implements the thread model.
        To run a thread in your software, simply derive from this class
        and overload the runThread pure virtual method.

        It is not safe to call destroyThread from the thread's runThread
        method. Doing so could result in deadlocking.

        The proper way to stop the thread from runThread is to return from
        the method (this also ensure correct stack and object destruction).

        It is safe to call isRunning from any thread, including inside
        runThread method.
    */
    class Thread
    {
        // Type definition and enumeration
    public:
        /** Thread leaving callback */
        struct Leaving
        {
            /** This is called when the thread is leaving (at the very last moment). */
            virtual void threadLeaving(Thread * leavingThread) = 0;
            virtual ~Leaving() {}
        };

        // Members
    protected:
        /** The thread name if provided at construction time */
        const char *            threadName;
        /** The thread handle */
        HTHREAD                 thread;
        /** The thread leaving callback, if provided */
        Leaving *               leaving;

        // Give no access to child classes
    private:
        /** The run condition */
        RunCondition            run;
        /** This thread lock */
        mutable  Lock           _lock;
        /** Is the thread created ? */
        bool                    isCreated;

        // Interface
    public:
        /** Create the thread */
        bool createThread(const int stackSize = 0);
        /** Destroy the thread (ask it to stop, and wait until it has finished) */
        bool destroyThread();
        /** The needed override */
        virtual uint32 runThread() = 0;
        /** Is the thread running ? (this is thread safe, as it locks the object) */
        virtual bool isRunning() const;

        /** The run thread hook */
        static void* RunThread(void* pVoid);

        /** The platform independent Sleep method.
            @param milliseconds  The amount of time to sleep, 0 for yielding the current thread
            @param hard          On POSIX system, this actually ensure the given time has been spent. Set to false to accept being interrupted by a signal. */
        static void Sleep(const uint32 milliseconds = 0, const bool hard = true);
        /** Check if the current running thread is ours */
        bool isOurThread() const;
        /** Set the thread leaving callback, that will be called upon thread termination by the thread calling destroyThread (it can not be the leaving thread)
            @param cb A pointer to a non-owned callback that'll be called when the thread is leaving. Set to 0 to remove the callback. */
        inline void setLeavingCallback(Leaving * cb) { leaving = cb; }

        // Constructor & Destructors
    public:
        /** Construct a thread.
            @param name     A pointer on a static area containing the name.
            @warning The thread doesn't own the memory given, and it must survive until the thread is destructed. */
        Thread(const char * name = NULL);
        // Destructor
        virtual ~Thread();
    };

    /** A Job thread.
        This is used to run a method of an object asynchronously.
        Unless you run the method synchronously, you should keep this object alive until the method completed

        @param Obj  The class to use for instance

        Example code:
        @code
            struct MyObj { void longProcess(); };
            MyObj a;
            JobThread<MyObj> job(a, &MyObj::longProcess);
            job.runJob(); // Run asynchronously
            [...]
            job.waitForJob(); // Join
        @endcode */
    template <class Obj>
    class JobThread : public Thread
    {
        // Members
    private:
        /** The pointer to a one shot method */
        typedef void (Obj::*OneShot)();

        /** The object's instance */
        Obj   & instance;
        /** The pointer to method wrapper */
        const OneShot oneShot;
        /** The job finished event */
        mutable Event done;

        // Implementation
        virtual uint32 runThread()
        {
            (instance.*oneShot)();
            done.Set();
            return 0;
        }

        // Interface
    public:
        /** Run the job synchronously or not
            @return false if the thread could not be created */
        bool runJob(const bool synchronously = false)
        {
            done.Reset();
            if (synchronously) { (instance.*oneShot)(); done.Set(); return true; }
            if (!createThread()) { done.Set(); return false; }
            return true;
        }

        /** Check if the job has finished */
        bool isFinished() const { return done.Wait(InstantCheck); }
        /** Wait until the job has finished, and join the thread */
        void waitForJob() { done.Wait(); destroyThread(); }

        /** Construction with one shot method with this signature: void Obj::method() */
        JobThread(Obj & instance, OneShot shot, const char * name = NULL) : Thread(name), instance(instance), oneShot(shot), done(name, Event::ManualReset, Event::InitiallySet) {}
        /** Destruction */
        ~JobThread() { done.Wait(); destroyThread(); }
    };
}

#endif
