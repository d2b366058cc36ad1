#ifndef hpp_CPP_Platform_CPP_hpp
#define hpp_CPP_Platform_CPP_hpp
// Types like size-t or NULL
#include "../Types.hpp"

/** The platform specific declarations */
namespace Platform
{
#define PathSeparator  "/"

    /** File separator char */
    enum
    {
        Separator = '/'
    };

    /** Ask for an input line from the user's terminal, that'll be stored in the UTF-8 buffer.
        This requires a console (the controlling terminal is used if any, else the standard input).
        This is typically required for asking a confirmation before a destructive operation.
        New line are not retained in the output, if present.

        @param prompt   The prompt that's displayed on user console
        @param buffer   A pointer to a buffer that's at least (size) byte large
                        that'll be filled by the function
        @param size     On input, the buffer size, on output, it's set to the used buffer size
        @param hidden   If set, the typed chars are not echoed
        @return false if it can't get any char from the terminal */
    bool queryUserInput(const char * prompt, char * buffer, size_t & size, const bool hidden = false);

    /** Check if the current process runs with super user privileges */
    inline bool isSuperUser() { return geteuid() == 0; }

    /** Writing to a pipe whose reader died raises SIGPIPE and kills the process by default.
        Call this once so such writes fail with EPIPE instead. */
    void ignoreBrokenPipe();

    /** Useful RAII class for Posix file index */
    class FileIndexWrapper
    {
        int fd;

    public:
        inline operator int() const { return fd; }
        inline void Mutate(int newfd) { if (fd >= 0) close(fd); fd = newfd; }
        /** Give up the ownership on the file index */
        inline int Release() { int ret = fd; fd = -1; return ret; }

        FileIndexWrapper(int fd = -1) : fd(fd) {}
        ~FileIndexWrapper() { if (fd >= 0) close(fd); fd = -1; }
    private:
        FileIndexWrapper(const FileIndexWrapper &);
        FileIndexWrapper & operator = (const FileIndexWrapper &);
    };
}

#endif
