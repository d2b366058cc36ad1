#ifndef hpp_CPP_ZLib_CPP_hpp
#define hpp_CPP_ZLib_CPP_hpp

// We need base class declaration
#include "BaseCompress.hpp"

#if (WantCompression == 1)

// External object that's forward declared
extern "C" { struct z_stream_s; }

namespace Compression
{
    /** Implements GZip compression.
        GZip is the public domain compression/decompression engine written by Gailly and Adler.
        It's made to compress stream, the output is compatible with the gzip and pigz tools.

        You can set the compression factor with setCompressionFactor() method.
        You can fetch the last processing error with getLastError() method.

        Unlike the gzip file tool, there is no size limit on the stream.
        When decompressing, multiple concatenated members are accepted (like gunzip does).

        @warning If you intend to use the same compressor for different streams, you must call
                 "Reset()" between each stream in order to prepare the engine

        The specification for this file format is in RFC1952. */
    class GZip : public BaseCompressor
    {
        // Members
    private:
        /** The opaque holder */
        z_stream_s *    opaque;
        /** Set when the engine is compressing */
        bool            compressing;
        /** The last operation error */
        Result          lastError;
        /** The compression level (from 0 to 9, or -1 for default) */
        int             compressionLevel;

        // Helpers
    private:
        /** Release the engine */
        void release();

        // Interface
    public:
        virtual bool Reset(const bool isCompressing);
        virtual Result process(const uint8 * in, size_t & inSize, uint8 * out, size_t & outSize, const bool lastCall);
        virtual Result getLastError() const { return lastError; }
        /** Set the compression factor (from 0.0 (fastest) to 1.0f (best)), this resets the engine for compressing */
        void setCompressionFactor(const float factor = 1.0f);
        /** Check if the engine is compressing */
        inline bool isCompressing() const { return compressing; }

        // Construction and destruction
    public:
        /** Gzip construction (the engine is ready for compressing) */
        GZip();
        ~GZip();

    private:
        GZip(const GZip &);
        GZip & operator = (const GZip &);
    };
}
#endif

#endif
