#ifndef hpp_BaseCompressor_hpp
#define hpp_BaseCompressor_hpp

// We need basic types
#include "../Types.hpp"

#if (WantCompression == 1)

/** Lossless compression and decompression of unknown data primitives.
    All (de)compressor implements the BaseCompressor interface.
    The compressors work incrementally: you feed them with input as it comes, and they produce
    output as soon as they can, so a whole stream never needs to be in memory.
    A (de)compressor is not thread safe, don't share it across threads.

    You might be interested in using Stream based (de)compression to transparent on-the-fly (de)compression. */
namespace Compression
{
    /** The base compression interface.
        All (de)compressors implements this interface.
        @sa GZip */
    class BaseCompressor
    {
        // Type definition and enumeration
    public:
        /** The possible result of a processing step */
        enum Result
        {
            Success         = 0,    //!< No error, call again with more input or output space
            EndOfStream     = 1,    //!< Not an error, the end of the compressed stream was reached
            StreamError     = -2,   //!< An error appeared on the stream (bad state)
            DataError       = -3,   //!< The data show errors (likely checksum failed, or not compressed data)
            MemoryError     = -4,   //!< A memory error happened
            BufferError     = -5,   //!< No progress possible
        };

        // Members
    private:
        /** The compressor name */
        const char * name;

        // Interface
    public:
        /** Get the compressor name */
        inline const char * getName() const { return name; }
        /** Prepare the object for a new stream.
            @param isCompressing    Set to true for compressing, false for decompressing
            @return false if the engine could not be initialized */
        virtual bool Reset(const bool isCompressing) = 0;
        /** Process (compress or decompress, depending on the last Reset call) some data.
            @param in       The input buffer
            @param inSize   On input, the input buffer size, on output, the number of bytes consumed
            @param out      The output buffer
            @param outSize  On input, the output buffer size, on output, the number of bytes produced
            @param lastCall When compressing, set this to true when no more input will be given (the footer is produced then).
                            Call again until EndOfStream is returned.
            @return Success if more data is expected, EndOfStream when the stream is complete, or an error */
        virtual Result process(const uint8 * in, size_t & inSize, uint8 * out, size_t & outSize, const bool lastCall) = 0;
        /** Get the last processing error */
        virtual Result getLastError() const = 0;

        // Construction and destruction
    public:
        /** Common constructor */
        BaseCompressor(const char * name = "") : name(name) {}
        virtual ~BaseCompressor() {}
    };
}

#define HasCompression 1
#endif

#endif
