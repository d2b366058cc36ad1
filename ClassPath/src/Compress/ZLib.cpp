// We need our declaration
#include "../../include/Compress/ZLib.hpp"

#if (WantCompression == 1)
#include <zlib.h>

// The window bits, adding 16 selects the gzip header and trailer instead of the zlib's one
#define GZipWindowBits  (MAX_WBITS + 16)

namespace Compression
{
    static BaseCompressor::Result fromZLibError(const int ret)
    {
        switch(ret)
        {
        case Z_OK:          return BaseCompressor::Success;
        case Z_STREAM_END:  return BaseCompressor::EndOfStream;
        // No progress possible is not fatal, the caller will provide more input or output space
        case Z_BUF_ERROR:   return BaseCompressor::Success;
        case Z_NEED_DICT:
        case Z_DATA_ERROR:  return BaseCompressor::DataError;
        case Z_MEM_ERROR:   return BaseCompressor::MemoryError;
        default:            return BaseCompressor::StreamError;
        }
    }

    GZip::GZip() : BaseCompressor("gzip"), opaque(0), compressing(true), lastError(Success), compressionLevel(Z_DEFAULT_COMPRESSION)
    {
        Reset(true);
    }
    GZip::~GZip() { release(); }

    void GZip::release()
    {
        if (!opaque) return;
        if (compressing) deflateEnd(opaque);
        else inflateEnd(opaque);
        delete opaque; opaque = 0;
    }

    void GZip::setCompressionFactor(const float factor)
    {
        compressionLevel = clamp((int)(factor * 9 + .5f), 0, 9);
        Reset(true);
    }

    bool GZip::Reset(const bool isCompressing)
    {
        release();
        compressing = isCompressing;
        opaque = new z_stream;
        memset(opaque, 0, sizeof(*opaque));
        int ret = compressing ? deflateInit2(opaque, compressionLevel, Z_DEFLATED, GZipWindowBits, 8, Z_DEFAULT_STRATEGY)
                              : inflateInit2(opaque, GZipWindowBits);
        if (ret != Z_OK)
        {
            delete opaque; opaque = 0;
            lastError = fromZLibError(ret);
            return false;
        }
        lastError = Success;
        return true;
    }

    BaseCompressor::Result GZip::process(const uint8 * in, size_t & inSize, uint8 * out, size_t & outSize, const bool lastCall)
    {
        if (!opaque) { inSize = outSize = 0; return lastError = StreamError; }

        opaque->next_in = (Bytef*)in;
        opaque->avail_in = (uInt)min(inSize, (size_t)UINT_MAX);
        opaque->next_out = (Bytef*)out;
        opaque->avail_out = (uInt)min(outSize, (size_t)UINT_MAX);
        const uInt givenIn = opaque->avail_in, givenOut = opaque->avail_out;

        int ret = compressing ? deflate(opaque, lastCall ? Z_FINISH : Z_NO_FLUSH) : inflate(opaque, Z_NO_FLUSH);

        inSize = (size_t)(givenIn - opaque->avail_in);
        outSize = (size_t)(givenOut - opaque->avail_out);
        opaque->next_in = 0; opaque->next_out = 0;
        return lastError = fromZLibError(ret);
    }
}

#endif
