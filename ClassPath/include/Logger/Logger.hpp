#ifndef hpp_Logger_hpp_
#define hpp_Logger_hpp_

#include <stdio.h>
#include <time.h>

// We need locks to allow multithreading logging to file
#include "../Threading/Lock.hpp"
// We need strings too
#include "../Strings/Strings.hpp"


/** If you intend to log something to a console, or a file, or both, this is where to look for */
namespace Logger
{
    /** The allowed flags to filter upon.
        When using Logger::log, you need to "tag" your message with some flags which are checked against the current application's mask.
        If they fit the mask, the log message will go through.  */
    enum Flags
    {
        Error       =   0x00000001,   //!< A typical error
        Warning     =   0x00000002,   //!< A typical warning
        File        =   0x00000004,   //!< The log is related to file operations
        Directory   =   0x00000010,   //!< The log is related to directory operations
        Content     =   0x00000040,   //!< The log is related to content operations
        Dump        =   0x00000100,   //!< Probably the most verbose log
        Creation    =   0x00000200,   //!< Log related to creating objects
        Tests       =   0x00002000,   //!< Special Tests class for some logs
        Config      =   0x00008000,   //!< Config related logs
        Process     =   0x00040000,   //!< Log related to child process (including their error output)
        Progress    =   0x00080000,   //!< Progress records (cursor position, chunk boundaries, final state)

        // Compound

        AllFlags    =   0xFFFFFFFF,
    };

    /** Get the level name for the given flags, as found in the log files (like "ERROR" or "INFO") */
    const char * getLevelName(const unsigned int flags);


    /** The logger output sink interface */
    struct OutputSink
    {
        /** The allowed mask to log */
        const unsigned int logMask;
        /** Get an UTF-8 message, without end-of-line, to sink to output */
        virtual void gotMessage(const char * message, const unsigned int flags) = 0;
        /** Required virtual destructor */
        virtual ~OutputSink() {};

        /** Define the log mask while creating */
        OutputSink(const unsigned int logMask) : logMask(logMask) {}
    };

    /** The output sink to the console */
    struct ConsoleSink : public OutputSink
    {
        // Members
    private:
        Threading::Lock lock;
    public:
        virtual void gotMessage(const char * message, const unsigned int flags)
        {
            if (logMask & flags)
            {
                Threading::ScopedLock scope(lock);
                fprintf(stdout, "%s\n", (const char*)message);
                fflush(stdout);
            }
        }
        ConsoleSink(const unsigned int logMask) : OutputSink(logMask) {}
    };

    /** The Tee sink */
    struct TeeSink : public OutputSink
    {
        OutputSink * sinks[2];
        bool         ownSinks;

        virtual void gotMessage(const char * message, const unsigned int flags)
        {
            if (sinks[0]) sinks[0]->gotMessage(message, flags);
            if (sinks[1]) sinks[1]->gotMessage(message, flags);
        }
        TeeSink(OutputSink * first, OutputSink * second) : OutputSink(0), ownSinks(true) { sinks[0] = first; sinks[1] = second; }
        TeeSink(OutputSink & first, OutputSink & second) : OutputSink(0), ownSinks(false) { sinks[0] = &first; sinks[1] = &second; }
        ~TeeSink() { if (ownSinks) { delete0(sinks[0]); delete0(sinks[1]); } }
    };

    /** The output sink to the error console */
    struct ErrorConsoleSink : public OutputSink
    {
        // Members
    private:
        Threading::Lock lock;
    public:
        virtual void gotMessage(const char * message, const unsigned int flags)
        {
            if (logMask & flags)
            {
                Threading::ScopedLock scope(lock);
                fprintf(stderr, "%s\n", (const char*)message);
            }
        }
        ErrorConsoleSink(unsigned int logMask) : OutputSink(logMask) {}
    };

    /** The output sink to a file.
        Each message is written on its own line, prefixed by the local time and the level name
        (like "2024-01-31 12:00:00 INFO     message"), and the file is flushed after each line.
        If writing to the file fails, the failure is reported once on the error console and
        the sink stops writing to the file. */
    struct FileOutputSink : public OutputSink
    {
        // Members
    private:
        FILE *          file;
        Threading::Lock lock;
        /** The file name */
        Strings::FastString fileName;
        /** Set when a write failed, and the sink is disabled */
        bool            failed;
        /** The error that happened while opening the file, if any */
        int             openError;

        // OutputSink interface
    public:
        virtual void gotMessage(const char * message, const unsigned int flags);
        /** Check if the file could be opened */
        bool isOpen() const { return file != 0; }
        /** Check if the sink was disabled after a write failure */
        bool hasFailed() const { return failed; }
        /** Get the error number that happened when opening the file (0 if none) */
        int getOpenError() const { return openError; }
        /** Get the file name */
        const Strings::FastString & getFileName() const { return fileName; }

        FileOutputSink(unsigned int logMask, const Strings::FastString & fileName, const bool appendToFile = true);
        ~FileOutputSink() { Threading::ScopedLock scope(lock); if (file) fclose(file); file = 0; }
    };

    /** Set the sink to use.
        The sink is not owned, and must outlive any log call, set to 0 to get back the default console sink */
    extern void setDefaultSink(OutputSink * newSink);
    /** Get a reference on the currently selected default sink */
    extern OutputSink & getDefaultSink();

    /** This is the main function for logging any information to the selected sink
        You'll use it like any other printf like function.
        @param flags    Any combination of the Logger::Flags value (the sink will check its own mask against these flags to allow logging or not)
        @param format   The printf like format */
    void log(const unsigned int flags, const char * format, ...)
#if defined(__GNUC__)
        __attribute__ ((format (printf, 2, 3)))
#endif
        ;
}

#endif
