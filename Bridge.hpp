#ifndef hpp_Parcel_Bridge_hpp
#define hpp_Parcel_Bridge_hpp

// We need errors
#include "Errors.hpp"
// We need the FIFO joining the threads
#include "ClassPath/include/Container/FIFO.hpp"
// We need threads
#include "ClassPath/include/Threading/Threads.hpp"
// We need file index wrapper
#include "ClassPath/include/Platform/Platform.hpp"

namespace Parcel
{
    /** Something bytes can be read from */
    struct ByteSource
    {
        /** Read at most size bytes.
            @return the number of bytes read, 0 at end of stream, (uint64)-1 on error (see getError) */
        virtual uint64 read(uint8 * buffer, const uint64 size) = 0;
        /** Get the error that happened */
        virtual Error getError() const = 0;
        virtual ~ByteSource() {}
    };

    /** Something bytes can be written to */
    struct ByteSink
    {
        /** Write the given bytes.
            @return size on success, (uint64)-1 on error (see getError) */
        virtual uint64 write(const uint8 * buffer, const uint64 size) = 0;
        /** Tell the sink that no more bytes will come, and let it commit what it received */
        virtual Error finish() = 0;
        /** Get the error that happened */
        virtual Error getError() const = 0;
        virtual ~ByteSink() {}
    };

    /** The imaging engine supervision interface.
        The engine either produces a byte stream (backup) or consumes one (restore) */
    struct Engine
    {
        /** The direction of the bytes */
        enum Mode
        {
            Produce     = 0,    //!< The engine writes, we read its output
            Consume     = 1,    //!< The engine reads, we write its input
        };

        /** Start the engine */
        virtual Error start(const Mode mode) = 0;
        /** Get the engine output (only valid in Produce mode, once started) */
        virtual ByteSource & getOutput() = 0;
        /** Get the engine input (only valid in Consume mode, once started) */
        virtual ByteSink & getInput() = 0;
        /** Ask the engine to stop (SIGTERM, then SIGKILL if it does not exit). This is thread safe. */
        virtual void terminate() = 0;
        /** Wait for the engine to exit.
            @return a ChildProcessError if it did not exit with a zero code */
        virtual Error wait() = 0;
        virtual ~Engine() {}
    };

    /** Get notified of the transfer progress */
    struct TransferObserver
    {
        /** Called from the transferring thread with the total amount transferred so far */
        virtual void bytesTransferred(const uint64 total) = 0;
        virtual ~TransferObserver() {}
    };

    /** The engine as a child process.
        The command is executed without a shell, with its standard output (Produce) or standard input (Consume) connected to a pipe.
        Its standard error is always captured, each line is logged (with Logger::Process flag), and the last lines
        are kept to diagnose a failure. */
    class ProcessEndpoint : public Engine
    {
        // Type definition and enumeration
    public:
        /** The maximum size of the error output that's kept for diagnostic */
        enum { DiagnosticSize = 4096 };
        /** The delay in ms, between SIGTERM and SIGKILL */
        enum { KillDelay = 3000 };
        /** The delay in ms between two checks of the engine, while waiting on its pipes */
        enum { PollDelay = 100 };

    private:
        /** The pipe we read from */
        struct PipeSource : public ByteSource
        {
            ProcessEndpoint &           owner;
            Platform::FileIndexWrapper  fd;
            Error                       error;
            virtual uint64 read(uint8 * buffer, const uint64 size);
            virtual Error getError() const { return error; }
            PipeSource(ProcessEndpoint & owner) : owner(owner) {}
        };
        /** The pipe we write to */
        struct PipeSink : public ByteSink
        {
            ProcessEndpoint &           owner;
            Platform::FileIndexWrapper  fd;
            Error                       error;
            virtual uint64 write(const uint8 * buffer, const uint64 size);
            virtual Error finish();
            virtual Error getError() const { return error; }
            PipeSink(ProcessEndpoint & owner) : owner(owner) {}
        };

        // Members
    private:
        /** The command line */
        Strings::StringArray    arguments;
        /** The engine name (used in logs) */
        String                  name;
        /** The child process */
        volatile pid_t          pid;
        /** The output pipe */
        PipeSource              output;
        /** The input pipe */
        PipeSink                input;
        /** The error pipe */
        Platform::FileIndexWrapper errorPipe;
        /** The error output reading thread */
        Threading::JobThread<ProcessEndpoint> * errorTee;
        /** The error output tail */
        String                  errorTail;
        /** The lock protecting the tail */
        Threading::Lock         tailLock;
        /** Set when terminate was called */
        volatile bool           terminating;
        /** When terminate was called (monotonic time in ms) */
        volatile uint64         terminateTime;
        /** Set once SIGKILL was sent */
        volatile bool           killed;
        /** Set once the process was waited for */
        volatile bool           reaped;
        /** The exit code (or signal) once waited */
        int                     exitCode;
        /** Set if the process was killed by a signal */
        bool                    signalled;

        // Helpers
    private:
        /** The error output reading loop */
        void teeErrors();
        /** Append a line to the tail */
        void appendToTail(const String & line);
        /** Check the engine while waiting on its pipes: terminate it on signal, and kill it if it ignores the termination.
            @return false once nothing more is expected from the engine's pipes (killed or already waited for) */
        bool supervise();
        /** Wait until the given pipe is ready for the given poll events, supervising the engine meanwhile.
            @return false if the engine was killed or waited for before the pipe got ready */
        bool waitFor(const int fd, const short events);

        // Engine interface
    public:
        virtual Error start(const Mode mode);
        virtual ByteSource & getOutput() { return output; }
        virtual ByteSink & getInput() { return input; }
        virtual void terminate();
        virtual Error wait();

        // Interface
    public:
        /** Get the exit code (only valid after wait) */
        inline int getExitCode() const { return exitCode; }
        /** Check if the process was killed by a signal, the signal number is the exit code (only valid after wait) */
        inline bool wasSignalled() const { return signalled; }
        /** Check if the process had to be killed after ignoring the termination request */
        inline bool wasKilled() const { return killed; }
        /** Get the last lines of the error output */
        String getDiagnostic() const;
        /** Get the child process identifier (0 if not running) */
        inline pid_t getPID() const { return pid; }

        // Construction and destruction
    public:
        /** Build the endpoint for the given command line (the first argument is the program, searched in PATH) */
        ProcessEndpoint(const Strings::StringArray & arguments);
        ~ProcessEndpoint();

    private:
        ProcessEndpoint(const ProcessEndpoint &);
        ProcessEndpoint & operator = (const ProcessEndpoint &);
    };

    /** Connects the imaging engine to the chunk side.

        Two threads cooperate: a pump thread reads the source and pushes the bytes in a bounded FIFO,
        while the calling thread pops the FIFO and writes to the sink.
        When the chunk side fails, the FIFO is cancelled and the engine is terminated, and the chunk side
        error is reported (the engine's exit status is then irrelevant).

        A bridge is used for a single transfer. */
    class StreamBridge
    {
        // Members
    private:
        /** The FIFO joining the pump and the drain */
        Stack::BoundedFIFO      fifo;
        /** The source the pump is reading */
        ByteSource *            source;
        /** The error the pump got */
        Error                   pumpError;
        /** The running engine */
        Engine * volatile       engine;
        /** Set when cancel was called */
        volatile bool           cancelled;
        /** The amount of bytes transferred */
        uint64                  transferred;
        /** The observer */
        TransferObserver *      observer;
        /** Protect the engine pointer against cancel */
        Threading::Lock         lock;

        /** The received signal, if any */
        static volatile sig_atomic_t receivedSignal;
        /** The child process to kill when a signal is received */
        static volatile pid_t   activeChild;

        // Helpers
    private:
        /** The pump thread loop */
        void pumpSource();
        /** Set the running engine */
        void setEngine(Engine * newEngine);
        /** The signal handler */
        static void signalHandler(int signal);

        // Interface
    public:
        /** Move all bytes from the source to the sink.
            @param from             The source to read
            @param to               The sink to write (finish is not called)
            @param stopOnSinkError  If not 0, this engine is terminated as soon as the sink fails, so the source unblocks
            @return the sink error first, then a CancelledError, then the source error */
        Error transfer(ByteSource & from, ByteSink & to, Engine * stopOnSinkError = 0);
        /** Run the engine in Produce mode, and store its output in the given sink (finish is called on success) */
        Error run(Engine & engine, ByteSink & chunkSink);
        /** Run the engine in Consume mode, feeding it with the given source */
        Error run(Engine & engine, ByteSource & chunkSource);
        /** Cancel the transfer (thread safe) */
        void cancel();
        /** Check if the transfer was cancelled (either by cancel or by a signal) */
        bool isCancelled() const { return cancelled || receivedSignal != 0; }
        /** Get the amount of bytes transferred */
        inline uint64 getTransferred() const { return transferred; }
        /** Set the transfer observer */
        inline void setObserver(TransferObserver * obs) { observer = obs; }

        /** Install the SIGINT and SIGTERM handlers that terminate the running engine, and ignore SIGPIPE */
        static void installSignalHandlers();
        /** Get the signal that was received, 0 if none */
        static int getReceivedSignal() { return (int)receivedSignal; }
        /** Register the child process that must be killed on signal (0 for none) */
        static void setActiveChild(const pid_t pid) { activeChild = pid; }

        // Construction and destruction
    public:
        /** Build a bridge with the given FIFO capacity */
        StreamBridge(const uint32 capacity = BridgeBufferSize);
    };
}

#endif
