#ifndef hpp_Parcel_Errors_hpp
#define hpp_Parcel_Errors_hpp

// We need strings
#include "ClassPath/include/Strings/Strings.hpp"

namespace Parcel
{
    /** The kind of String class we are using */
    typedef Strings::FastString String;

    /** The error taxonomy.
        Each component reports one of these, and the error is propagated unchanged up to the session */
    enum ErrorKind
    {
        NoError                 = 0,    //!< Success
        ValidationError         = 1,    //!< Bad arguments or paths, raised before any I/O
        IOError                 = 2,    //!< Local read or write failure
        SpaceExceededError      = 3,    //!< The destination is full
        ManifestCorruptError    = 4,    //!< The manifest or the chunks are structurally inconsistent
        ChildProcessError       = 5,    //!< The imaging engine exited with a non zero code or was killed
        BrokenPipeError         = 6,    //!< One side of the bridge terminated before the other
        CancelledError          = 7,    //!< A termination signal was received
    };

    /** Get the name of the given error kind (like "IOError") */
    const char * getErrorKindName(const ErrorKind kind);

    /** An error, as returned by all operations.
        A default constructed error means success, so you'll use it like this:
        @code
            Error error = writer.open(...);
            if (error) return error;
        @endcode */
    struct Error
    {
        /** The error kind */
        ErrorKind   kind;
        /** The component that raised the error (like "ChunkWriter") */
        String      component;
        /** The human readable message */
        String      message;
        /** The child process exit code (or the signal number that killed it, see signalled) */
        int         exitCode;
        /** Set if the child process was killed by a signal */
        bool        signalled;
        /** The tail of the child process error output */
        String      diagnostic;

        /** Check if this is an error */
        operator bool() const { return kind != NoError; }
        /** Get a one line description, like "ChunkWriter: SpaceExceededError: No space left on device" */
        String describe() const;

        /** Build an error from an errno value.
            ENOSPC and EDQUOT gives a SpaceExceededError, EPIPE a BrokenPipeError, anything else is an IOError */
        static Error fromErrno(const int err, const String & component, const String & message);

        /** Success */
        Error() : kind(NoError), exitCode(0), signalled(false) {}
        /** Build an error */
        Error(const ErrorKind kind, const String & component, const String & message, const int exitCode = 0, const String & diagnostic = "")
            : kind(kind), component(component), message(message), exitCode(exitCode), signalled(false), diagnostic(diagnostic) {}
    };
}

#endif
