#include "../../include/Logger/Logger.hpp"

#define ENDOFLINE   "\n"

namespace Logger
{
    // The main log function
    void log(const unsigned int flags, const char * format, ...)
    {
        size_t startSize = 512;

        for (;;)
        {
            va_list argp;
            va_start(argp, format);
            char * buffer = (char*)malloc(startSize);
            if(!buffer) { va_end(argp); return; }

            const int err = (int)vsnprintf(buffer, startSize, format, argp);
            va_end(argp);

            // Not enough space
            if (err < 0 || (size_t)err >= startSize)
            {
                free(buffer);
                // Safety check to exit when vsnprintf fails to print anything
                if (err < 0 || startSize > 131072) return;
                startSize = (size_t)err + 1;
                continue;
            }
            getDefaultSink().gotMessage(buffer, flags);
            free(buffer);
            return;
        }
    }

    const char * getLevelName(const unsigned int flags)
    {
        if (flags & Error)      return "ERROR";
        if (flags & Warning)    return "WARNING";
        if (flags & (Dump | Tests)) return "DEBUG";
        return "INFO";
    }

    // Get a console sink that's build on the main stack (BSS section)
    static OutputSink * getStaticSink()
    {
        static ErrorConsoleSink sink(Logger::Error | Logger::Warning);
        return &sink;
    }
    // Get a reference on the default sink pointer
    static OutputSink *& getDefaultSinkPointer()
    {
        static OutputSink * defaultSink = getStaticSink();
        return defaultSink;
    }
    // Get the default sink
    OutputSink & getDefaultSink()
    {
        return *getDefaultSinkPointer();
    }
    // Change the default sink
    void setDefaultSink(OutputSink * newSink)
    {
        getDefaultSinkPointer() = newSink ? newSink : getStaticSink();
    }

    FileOutputSink::FileOutputSink(unsigned int logMask, const Strings::FastString & fileName, const bool appendToFile)
        : OutputSink(logMask), file(fopen(fileName.c_str(), appendToFile ? "ab" : "wb")), fileName(fileName), failed(false), openError(file ? 0 : errno)
    {
        if (file)
        {
            // Prevent any child process from inheriting the file on forking
            int flags = fcntl(fileno(file), F_GETFD);
            flags |= FD_CLOEXEC;
            fcntl(fileno(file), F_SETFD, flags);
        }
    }

    void FileOutputSink::gotMessage(const char * message, const unsigned int flags)
    {
        if ((logMask & flags) == 0) return;
        Threading::ScopedLock scope(lock);
        if (!file || failed) return;

        char timeBuffer[32];
        time_t now = time(NULL);
        struct tm local;
        localtime_r(&now, &local);
        strftime(timeBuffer, sizeof(timeBuffer), "%Y-%m-%d %H:%M:%S", &local);

        if (fprintf(file, "%s %-8s %s" ENDOFLINE, timeBuffer, getLevelName(flags), message) < 0 || fflush(file) != 0)
        {
            // Only report once, logging is disabled afterward
            failed = true;
            fprintf(stderr, "Logger can not write to file '%s': %s, logging to this file is now disabled\n", fileName.c_str(), strerror(errno));
        }
    }
#undef ENDOFLINE

}
