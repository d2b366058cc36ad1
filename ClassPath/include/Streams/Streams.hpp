#ifndef hpp_CPP_Streams_CPP_hpp
#define hpp_CPP_Streams_CPP_hpp

// We need types
#include "../Types.hpp"
// We need strings
#include "../Strings/Strings.hpp"

// Forward declare the file stream, so we don't drag the file interface here
namespace File { class Stream; }

/** Manipulating data from different medium is often easier when seen as a generic stream.
    You'll use an input stream (InputFileStream), or the equivalent
    output stream (any of OutputFileStream, OutputStringStream, NullOutputStream).

    Similarly, you have compression specialized streams (see CompressStream.hpp).

    All the read and write methods return the number of bytes processed, or (uint64)-1 on error.
    In that case, getLastError() tells what happened (errno like value).

    For a more complete list of input streams:
     Class                        | Description
     -----------------------------|------------------------------------------------------------
     InputFileStream              | An input stream whose source is a file
     DecompressInputStream        | An input stream that's decompressing data on the fly

    For a more complete list of output streams:
     Class                        | Description
     -----------------------------|------------------------------------------------------------
     OutputFileStream             | An output stream that writes to a file
     OutputStringStream           | An output stream that's filling a string
     NullOutputStream             | An output stream that just keeps track of the amount written, but does not write anything
     CompressOutputStream         | An output stream that's compressing data on the fly
*/
namespace Stream
{
    /** All the fullSize() method in each stream can return this value if the stream is not opened correctly, or broken */
    enum { BadStreamSize = (uint64)-1 };

    /** The Stream interface that must be supported in child classes */
    class BaseStream
    {
        // Constructors
    protected:
        /** The default constructor is only available to child classes */
        BaseStream() {}

    public:
        /** The only destructor */
        virtual ~BaseStream() {}

        // Interface
    public:
        /** This method returns the stream length in byte, if known
            For stream where the length is not known, this method will return (uint64)-1. */
        virtual uint64 fullSize() const = 0;
        /** This method returns true if the end of stream is reached */
        virtual bool endReached() const = 0;
        /** This method returns the position of the next byte that could be read from this stream */
        virtual uint64 currentPosition() const = 0;
        /** Try to seek to the given absolute position (return false if not supported) */
        virtual bool setPosition(const uint64 newPos) = 0;
        /** Get the last error (errno like value) that happened on this stream, 0 if none */
        virtual int getLastError() const { return 0; }
    };

    /** The base input stream interface */
    class InputStream : public BaseStream
    {
    protected:
        /** The default constructor is only available to child classes */
        InputStream() {}

        // The interface
    public:
        /** Try to read the given amount of data to the specified buffer
            @return the number of byte truly read, 0 at end of stream, or (uint64)-1 on error (this method doesn't throw) */
        virtual uint64 read(void * const buffer, const uint64 size) const throw() = 0;
        /** Move the stream position forward of the given amount
            This should give the same results as setPosition(currentPosition() + value),
            but implementation can be faster for non-seek-able stream. */
        virtual bool goForward(const uint64 skipAmount) = 0;
    };

    /** The base output stream interface */
    class OutputStream : public BaseStream
    {
    protected:
        /** The default constructor is only available to child classes */
        OutputStream() {}

        // The interface
    public:
        /** Try to write the given amount of data to the specified buffer
            @return the number of byte truly written, or (uint64)-1 on error (this method doesn't throw) */
        virtual uint64 write(const void * const buffer, const uint64 size) throw() = 0;
        /** Flush any pending data to the underlying medium.
            @return false on error */
        virtual bool flush() { return true; }

        /** A useful helper for writing strings to this stream.
            @param val  The string to write to the stream.
            @return true when val was completely written into the stream */
        bool write(const Strings::FastString & val) throw() { return write(val.data(), (const uint64)val.size()) == (uint64)val.size(); }
    };

    /** A File-based input stream */
    class InputFileStream : public InputStream
    {
    protected:
        /** The string implementation we are using */
        typedef Strings::FastString String;

        // Members
    private:
        /** The filename */
        String                  fileName;
        /** The file handle */
        File::Stream     *      stream;
        /** The file size */
        uint64                  fileSize;
        /** The last error */
        mutable int             lastError;

        // The interface
    public:
        virtual uint64 fullSize() const;
        virtual bool endReached() const;
        virtual uint64 currentPosition() const;
        virtual bool setPosition(const uint64 newPos);
        virtual bool goForward(const uint64 skipAmount);
        virtual uint64 read(void * const buffer, const uint64 size) const throw();
        virtual int getLastError() const { return lastError; }

        /** Check if the file could be opened */
        bool isOpen() const { return stream != 0; }

        // Construction
    public:
        /** The only allowed constructor */
        InputFileStream(const String & name);
        /** The only allowed destructor */
        ~InputFileStream();

    private:
        /** Deny copying */
        InputFileStream(const InputFileStream & other);
        InputFileStream & operator = (const InputFileStream & other);
    };


    /** A File-based output stream */
    class OutputFileStream : public OutputStream
    {
    protected:
        /** The string implementation we are using */
        typedef Strings::FastString String;

        // Members
    private:
        /** The filename */
        String              fileName;
        /** The file stream */
        File::Stream     *  stream;
        /** The file size */
        uint64              fileSize;
        /** The last error */
        int                 lastError;

        // The interface
    public:
        virtual uint64 fullSize() const;
        virtual bool endReached() const;
        virtual uint64 currentPosition() const;
        virtual bool setPosition(const uint64 newPos);
        virtual uint64 write(const void * const buffer, const uint64 size) throw();
        using OutputStream::write;
        virtual bool flush();
        virtual int getLastError() const { return lastError; }

        /** Check if the file could be opened */
        bool isOpen() const { return stream != 0; }
        /** Flush the data and wait for the storage to have written it */
        bool sync();

        // Construction
    public:
        /** The only allowed constructor
            @param name             The file name to write to (it's created or truncated) */
        OutputFileStream(const String & name);
        /** The only allowed destructor */
        ~OutputFileStream();

    private:
        /** Deny copying */
        OutputFileStream(const OutputFileStream &);
        OutputFileStream & operator = (const OutputFileStream &);
    };

    /** A string-based output stream */
    class OutputStringStream : public OutputStream
    {
    protected:
        /** The string implementation we are using */
        typedef Strings::FastString String;

        // Members
    private:
        /** The reference on the content */
        String  &       content;

        // The interface
    public:
        virtual uint64 fullSize() const { return content.size(); }
        virtual bool endReached() const { return false; }
        virtual uint64 currentPosition() const { return content.size(); }
        /** Only truncating is supported */
        virtual bool setPosition(const uint64 newPos) { if (newPos > content.size()) return false; content.resize((size_t)newPos); return true; }
        virtual uint64 write(const void * const buffer, const uint64 size) throw();
        using OutputStream::write;

        // Construction
    public:
        /** The only allowed constructor */
        OutputStringStream(String & content) : content(content) {}

    private:
        /** Deny copying */
        OutputStringStream(const OutputStringStream &);
        OutputStringStream & operator = (const OutputStringStream &);
    };

    /** A stream that doesn't output anything.
        This is useful for testing, or checking a whole stream can be read.
        It does track the amount of written data however. */
    class NullOutputStream : public OutputStream
    {
        uint64 size;
    public:
        virtual uint64 fullSize() const { return size; }
        virtual bool endReached() const { return false; }
        virtual uint64 currentPosition() const { return size; }
        virtual bool setPosition(const uint64 newPos) { size = newPos; return true; }
        virtual uint64 write(const void * const, const uint64 size) throw() { this->size += size; return size; }

        NullOutputStream() : size(0) {}
    };

    /** The copy callback that is called while the copy is running. */
    struct CopyCallback
    {
        /** Overload this method to get informed about the progress of the stream copy
            @param  size    The currently copied size
            @param  total   The total stream size (if known beforehand else it's (uint64)-1)
            @return If you return false from this method, the copying is aborted, and left in the current state */
        virtual bool copiedData(const uint64 size, const uint64 total) = 0;
        virtual ~CopyCallback() {}
    };

    /** The copy stream function.
        The input stream is read until its end (or the forced size), and written to the output stream.
        @param is               The input stream to copy from
        @param os               The output stream to copy to
        @param forceInputSize   If provided, this limits the copy to this size.
        @return false if reading or writing failed (check the streams' getLastError) */
    bool copyStream(const InputStream & is, OutputStream & os, const uint64 forceInputSize = 0);
    /** The copy stream function with callback.
        @param is               The input stream to copy from
        @param os               The output stream to copy to
        @param callback         The callback object with a copiedData method that'll be called while copy is in progress
        @param forceInputSize   If provided, this limits the copy to this size. */
    bool copyStream(const InputStream & is, OutputStream & os, CopyCallback & callback, const uint64 forceInputSize = 0);
}

#endif
