// We need our declaration
#include "Bridge.hpp"
// We need logging
#include "ClassPath/include/Logger/Logger.hpp"

#include <vector>
#include <time.h>

namespace Parcel
{
    namespace
    {
        /** Get a monotonic time in milliseconds */
        uint64 getTimeMs()
        {
            struct timespec ts;
            clock_gettime(CLOCK_MONOTONIC, &ts);
            return (uint64)ts.tv_sec * 1000 + (uint64)(ts.tv_nsec / 1000000);
        }

        /** Make our end of a pipe non blocking, so a stalled engine can't block us */
        bool setNonBlocking(const int fd)
        {
            int flags = fcntl(fd, F_GETFL);
            return flags >= 0 && fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
        }
    }

    uint64 ProcessEndpoint::PipeSource::read(uint8 * buffer, const uint64 size)
    {
        if (fd < 0) { error = Error(IOError, "engine", "The engine output is closed"); return (uint64)-1; }
        while (true)
        {
            ssize_t ret = ::read(fd, buffer, (size_t)min(size, (uint64)SSIZE_MAX));
            if (ret >= 0) return (uint64)ret;
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK)
            {
                if (owner.waitFor(fd, POLLIN)) continue;
                error = Error(BrokenPipeError, "engine", "The engine was killed before closing its output");
                return (uint64)-1;
            }
            error = Error::fromErrno(errno, "engine", "Can't read the engine output");
            return (uint64)-1;
        }
    }

    uint64 ProcessEndpoint::PipeSink::write(const uint8 * buffer, const uint64 size)
    {
        if (fd < 0) { error = Error(IOError, "engine", "The engine input is closed"); return (uint64)-1; }
        uint64 done = 0;
        while (done < size)
        {
            ssize_t ret = ::write(fd, buffer + done, (size_t)min(size - done, (uint64)SSIZE_MAX));
            if (ret < 0)
            {
                if (errno == EINTR) continue;
                if (errno == EAGAIN || errno == EWOULDBLOCK)
                {
                    if (owner.waitFor(fd, POLLOUT)) continue;
                    error = Error(BrokenPipeError, "engine", "The engine was killed before reading its input");
                    return (uint64)-1;
                }
                error = Error::fromErrno(errno, "engine", "Can't write to the engine input");
                return (uint64)-1;
            }
            done += (uint64)ret;
        }
        return done;
    }
    Error ProcessEndpoint::PipeSink::finish()
    {
        // Closing the pipe is what tells the engine the stream is complete
        if (fd >= 0 && ::close(fd.Release()) < 0 && errno != EINTR)
            error = Error::fromErrno(errno, "engine", "Can't close the engine input");
        return error;
    }


    ProcessEndpoint::ProcessEndpoint(const Strings::StringArray & arguments)
        : arguments(arguments), name(arguments[0].substr(arguments[0].rfind('/') + 1)),
          pid(0), output(*this), input(*this), errorTee(0), tailLock("tail"), terminating(false), terminateTime(0), killed(false), reaped(false),
          exitCode(0), signalled(false)
    {}

    ProcessEndpoint::~ProcessEndpoint()
    {
        if (pid)
        {
            terminate();
            Error ignored = wait();
            if (ignored) Logger::log(Logger::Process, "%s", ignored.describe().c_str());
        }
        delete0(errorTee);
    }

    Error ProcessEndpoint::start(const Mode mode)
    {
        if (!arguments.getSize() || !arguments[0].size()) return Error(ValidationError, "engine", "No engine command to run");
        if (pid) return Error(ValidationError, name, "The engine is already running");

        int dataPipe[2], errPipe[2];
        if (pipe2(dataPipe, O_CLOEXEC) < 0) return Error::fromErrno(errno, name, "Can't create the data pipe");
        if (pipe2(errPipe, O_CLOEXEC) < 0)
        {
            int err = errno;
            close(dataPipe[0]); close(dataPipe[1]);
            return Error::fromErrno(err, name, "Can't create the error pipe");
        }
        // The child's ends are closed in the parent when leaving this scope
        Platform::FileIndexWrapper childData(mode == Produce ? dataPipe[1] : dataPipe[0]), childError(errPipe[1]);
        if (mode == Produce) output.fd.Mutate(dataPipe[0]);
        else input.fd.Mutate(dataPipe[1]);
        errorPipe.Mutate(errPipe[0]);
        if (!setNonBlocking(mode == Produce ? dataPipe[0] : dataPipe[1]) || !setNonBlocking(errPipe[0]))
            return Error::fromErrno(errno, name, "Can't configure the engine pipes");

        // No allocation is allowed after forking, so build the argument vector now
        std::vector<char *> argv;
        for (size_t i = 0; i < arguments.getSize(); i++) argv.push_back(const_cast<char*>(arguments[i].c_str()));
        argv.push_back(0);

        Logger::log(Logger::Process, "Starting engine: %s", arguments.Join(" ").c_str());
        pid_t child = fork();
        if (child < 0) return Error::fromErrno(errno, name, "Can't start the engine");
        if (child == 0)
        {
            // We are the child here
            if (dup2(childData, mode == Produce ? STDOUT_FILENO : STDIN_FILENO) < 0 || dup2(childError, STDERR_FILENO) < 0) _exit(126);

            // Restore the default signal dispositions, ignored signals are inherited through exec
            struct sigaction action;
            memset(&action, 0, sizeof(action));
            action.sa_handler = SIG_DFL;
            sigemptyset(&action.sa_mask);
            sigaction(SIGPIPE, &action, 0);
            sigaction(SIGINT, &action, 0);
            sigaction(SIGTERM, &action, 0);
            sigset_t mask;
            sigemptyset(&mask);
            sigprocmask(SIG_SETMASK, &mask, 0);

            execvp(argv[0], &argv[0]);

            static const char message[] = "Can't execute the engine: ";
            ssize_t Unused(ret) = ::write(STDERR_FILENO, message, sizeof(message) - 1);
            ret = ::write(STDERR_FILENO, argv[0], strlen(argv[0]));
            ret = ::write(STDERR_FILENO, "\n", 1);
            _exit(127);
        }

        pid = child;
        terminating = false; terminateTime = 0; killed = false; reaped = false;
        StreamBridge::setActiveChild(child);
        Logger::log(Logger::Process, "Engine %s started with pid %d", name.c_str(), (int)child);

        errorTee = new Threading::JobThread<ProcessEndpoint>(*this, &ProcessEndpoint::teeErrors, "errortee");
        if (!errorTee->runJob())
        {
            terminate();
            Error ignored = wait();
            return Error(IOError, name, "Can't start the thread reading the engine error output");
        }
        return Error();
    }

    void ProcessEndpoint::appendToTail(const String & line)
    {
        Threading::ScopedLock scope(tailLock);
        errorTail += line;
        errorTail += "\n";
        if (errorTail.size() > DiagnosticSize)
        {
            size_t cut = errorTail.find('\n', errorTail.size() - DiagnosticSize);
            errorTail.erase(0, cut == String::npos ? errorTail.size() - DiagnosticSize : cut + 1);
        }
    }

    String ProcessEndpoint::getDiagnostic() const
    {
        Threading::ScopedLock scope(const_cast<Threading::Lock&>(tailLock));
        return Strings::Trimmed(errorTail);
    }

    void ProcessEndpoint::teeErrors()
    {
        char buffer[4096];
        String line;
        while (true)
        {
            ssize_t ret = ::read(errorPipe, buffer, sizeof(buffer));
            if (ret < 0 && errno == EINTR) continue;
            // Processes started by the engine might keep the pipe opened, so stop once the engine is gone
            if (ret < 0 && (errno == EAGAIN || errno == EWOULDBLOCK) && waitFor(errorPipe, POLLIN)) continue;
            if (ret <= 0) break;
            for (ssize_t i = 0; i < ret; i++)
            {
                // The engine's progress output uses carriage returns
                if (buffer[i] != '\n' && buffer[i] != '\r') { line += buffer[i]; continue; }
                if (!line.size()) continue;
                Logger::log(Logger::Process, "%s: %s", name.c_str(), line.c_str());
                appendToTail(line);
                line.clear();
            }
        }
        if (line.size())
        {
            Logger::log(Logger::Process, "%s: %s", name.c_str(), line.c_str());
            appendToTail(line);
        }
    }

    bool ProcessEndpoint::supervise()
    {
        pid_t child = pid;
        if (!child || reaped) return false;
        if (!terminating && StreamBridge::getReceivedSignal()) terminate();
        if (terminating && !killed && getTimeMs() - terminateTime > KillDelay)
        {
            Logger::log(Logger::Process | Logger::Warning, "Engine %s did not exit, killing it", name.c_str());
            ::kill(child, SIGKILL);
            killed = true;
        }
        return !killed;
    }

    bool ProcessEndpoint::waitFor(const int fd, const short events)
    {
        struct pollfd desc;
        desc.fd = fd; desc.events = events; desc.revents = 0;
        while (true)
        {
            int ret = ::poll(&desc, 1, PollDelay);
            // Errors are reported by the following read or write
            if (ret > 0 || (ret < 0 && errno != EINTR)) return true;
            if (!supervise()) return false;
        }
    }

    void ProcessEndpoint::terminate()
    {
        pid_t child = pid;
        if (!child || terminating) return;
        terminateTime = getTimeMs();
        terminating = true;
        Logger::log(Logger::Process, "Terminating engine %s (pid %d)", name.c_str(), (int)child);
        ::kill(child, SIGTERM);
    }

    Error ProcessEndpoint::wait()
    {
        if (!pid) return Error(ValidationError, name, "The engine is not running");

        int status = 0;
        while (true)
        {
            pid_t ret = waitpid(pid, &status, WNOHANG);
            if (ret == pid) break;
            if (ret < 0 && errno != EINTR)
            {
                int err = errno;
                pid = 0; StreamBridge::setActiveChild(0);
                return Error::fromErrno(err, name, "Can't wait for the engine");
            }
            supervise();
            Threading::Thread::Sleep(10);
        }
        reaped = true;
        pid = 0;
        StreamBridge::setActiveChild(0);
        // Nothing more to exchange with the engine
        input.fd.Mutate(-1);
        output.fd.Mutate(-1);
        if (errorTee) { errorTee->waitForJob(); delete0(errorTee); }
        errorPipe.Mutate(-1);

        if (WIFEXITED(status))
        {
            exitCode = WEXITSTATUS(status); signalled = false;
            Logger::log(Logger::Process, "Engine %s exited with code %d", name.c_str(), exitCode);
            if (!exitCode) return Error();
            return Error(ChildProcessError, name, Strings::Print("The engine exited with code %d", exitCode), exitCode, getDiagnostic());
        }
        exitCode = WIFSIGNALED(status) ? WTERMSIG(status) : -1; signalled = true;
        Logger::log(Logger::Process, "Engine %s was killed by signal %d", name.c_str(), exitCode);
        Error error(ChildProcessError, name, Strings::Print("The engine was killed by signal %d (%s)", exitCode, strsignal(exitCode)), exitCode, getDiagnostic());
        error.signalled = true;
        return error;
    }



    volatile sig_atomic_t StreamBridge::receivedSignal = 0;
    volatile pid_t StreamBridge::activeChild = 0;

    StreamBridge::StreamBridge(const uint32 capacity)
        : fifo(capacity), source(0), engine(0), cancelled(false), transferred(0), observer(0), lock("bridge")
    {}

    void StreamBridge::signalHandler(int signal)
    {
        // Only async-signal-safe calls here
        if (!receivedSignal) receivedSignal = signal;
        pid_t child = activeChild;
        if (child > 0) ::kill(child, SIGTERM);
    }

    void StreamBridge::installSignalHandlers()
    {
        Platform::ignoreBrokenPipe();
        struct sigaction action;
        memset(&action, 0, sizeof(action));
        action.sa_handler = &StreamBridge::signalHandler;
        sigemptyset(&action.sa_mask);
        sigaction(SIGINT, &action, 0);
        sigaction(SIGTERM, &action, 0);
    }

    void StreamBridge::setEngine(Engine * newEngine)
    {
        Threading::ScopedLock scope(lock);
        engine = newEngine;
    }

    void StreamBridge::cancel()
    {
        Threading::ScopedLock scope(lock);
        cancelled = true;
        fifo.Cancel();
        if (engine) engine->terminate();
    }

    void StreamBridge::pumpSource()
    {
        uint8 buffer[65536];
        while (true)
        {
            uint64 ret = source->read(buffer, sizeof(buffer));
            if (ret == (uint64)-1)
            {
                pumpError = source->getError();
                if (!pumpError) pumpError = Error(IOError, "bridge", "Reading the source failed");
                break;
            }
            if (!ret) break;
            // Cancelled by the other side
            if (!fifo.Push(buffer, (uint32)ret)) return;
        }
        fifo.Close();
    }

    Error StreamBridge::transfer(ByteSource & from, ByteSink & to, Engine * stopOnSinkError)
    {
        if (!fifo.isValid()) return Error(IOError, "bridge", "Not enough memory for the transfer buffer");
        source = &from;
        pumpError = Error();

        Threading::JobThread<StreamBridge> pump(*this, &StreamBridge::pumpSource, "pump");
        if (!pump.runJob()) return Error(IOError, "bridge", "Can't start the pump thread");

        uint8 buffer[65536];
        Error sinkError;
        while (!isCancelled())
        {
            uint32 size = fifo.Pop(buffer, sizeof(buffer));
            if (!size)
            {
                if (fifo.isCancelled()) Logger::log(Logger::Process, "Transfer cancelled after " PF_LLU " bytes", (unsigned long long)transferred);
                break;
            }
            if (to.write(buffer, size) != (uint64)size)
            {
                sinkError = to.getError();
                if (!sinkError) sinkError = Error(IOError, "bridge", "Writing to the sink failed");
                fifo.Cancel();
                // The pump might be blocked reading the engine, let it go
                if (stopOnSinkError) stopOnSinkError->terminate();
                break;
            }
            transferred += size;
            if (observer) observer->bytesTransferred(transferred);
        }
        if (isCancelled()) fifo.Cancel();
        pump.waitForJob();

        if (sinkError) return sinkError;
        // A cancelled engine is killed, so its pipe error is a consequence of the cancellation
        if (isCancelled()) return Error(CancelledError, "bridge", receivedSignal ? Strings::Print("Received signal %d", (int)receivedSignal) : String("Cancelled"));
        return pumpError;
    }

    Error StreamBridge::run(Engine & engine, ByteSink & chunkSink)
    {
        if (isCancelled()) return Error(CancelledError, "bridge", "Cancelled before starting");
        Error error = engine.start(Engine::Produce);
        if (error) return error;
        setEngine(&engine);
        // The cancel might have happened while starting
        if (isCancelled()) engine.terminate();

        error = transfer(engine.getOutput(), chunkSink, &engine);
        if (error)
        {
            // The chunk side error (or the cancellation) is what matters, not the engine's exit status
            engine.terminate();
            Error ignored = engine.wait();
            if (ignored) Logger::log(Logger::Process, "Ignored: %s", ignored.describe().c_str());
            setEngine(0);
            return error;
        }

        Error childError = engine.wait();
        setEngine(0);
        if (isCancelled()) return Error(CancelledError, "bridge", "Cancelled");
        if (childError) return childError;
        // The engine succeeded, commit the stream
        return chunkSink.finish();
    }

    Error StreamBridge::run(Engine & engine, ByteSource & chunkSource)
    {
        if (isCancelled()) return Error(CancelledError, "bridge", "Cancelled before starting");
        Error error = engine.start(Engine::Consume);
        if (error) return error;
        setEngine(&engine);
        if (isCancelled()) engine.terminate();

        error = transfer(chunkSource, engine.getInput());
        if (error && error.kind != BrokenPipeError)
        {
            // The chunk side failed (or we were cancelled): the engine must not see a clean end of stream
            engine.terminate();
            Error ignored = engine.wait();
            if (ignored) Logger::log(Logger::Process, "Ignored: %s", ignored.describe().c_str());
            setEngine(0);
            return error;
        }

        // Either everything was sent, or the engine stopped reading. In both case, its exit status tells more
        Error closeError = engine.getInput().finish();
        Error childError = engine.wait();
        setEngine(0);
        if (isCancelled()) return Error(CancelledError, "bridge", "Cancelled");
        if (childError) return childError;
        if (error) return error;
        return closeError;
    }
}
