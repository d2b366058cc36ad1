#ifndef hpp_CompressStream_hpp
#define hpp_CompressStream_hpp

// We need stream declarations
#include "Streams.hpp"

#if (WantCompression == 1)

// We need base compressor declaration too
#include "../Compress/BaseCompress.hpp"
// We need ZLib implementation too for default usage
#include "../Compress/ZLib.hpp"
// We need scoped pointers too
#include "../Utils/ScopePtr.hpp"


namespace Stream
{
    /** An input stream that's decompressing on-the-fly while being read.
        This is a pseudo stream, in the sense that a real stream is used
        underneath to refill the compressed buffer when necessary.
        It's not possible to seek this stream.
        A truncated or corrupted compressed stream is reported as an error (EBADMSG) */
    class DecompressInputStream : public InputStream
    {
        // Members
    private:
        /** The input stream to read from */
        const InputStream & stream;
        /** The compressor to use */
        Utils::ScopePtr<Compression::BaseCompressor> compressor;
        /** The compressed data buffer */
        mutable uint8   inBuffer[65536];
        /** The position of the first unused byte in the compressed buffer */
        mutable size_t  inPos;
        /** The number of valid bytes in the compressed buffer */
        mutable size_t  inSize;
        /** Set when the underlying stream is exhausted */
        mutable bool    inputDone;
        /** Set when the compressed stream ended */
        mutable bool    streamEnded;
        /** The current accumulator of output bytes */
        mutable uint64  position;
        /** The last error */
        mutable int     lastError;

        // Helpers
    private:
        /** Refill the compressed buffer, return false on error */
        bool refill() const
        {
            if (inPos < inSize || inputDone) return true;
            uint64 ret = stream.read(inBuffer, sizeof(inBuffer));
            if (ret == (uint64)-1) { lastError = stream.getLastError() ? stream.getLastError() : EIO; return false; }
            inPos = 0; inSize = (size_t)ret;
            if (!ret) inputDone = true;
            return true;
        }

        // Interface
    public:
        /** Get the compressor used */
        inline const Compression::BaseCompressor * getCompressor() const { return compressor; }
        /** Try to read the given amount of data to the specified buffer
            @return the number of byte truly read, 0 at end of stream, (uint64)-1 on error */
        uint64 read(void * const outBuffer, const uint64 size) const throw()
        {
            if (lastError) return (uint64)-1;
            uint64 done = 0;
            while (done < size)
            {
                if (!refill()) return (uint64)-1;
                if (streamEnded)
                {   // Another gzip member might follow, like gunzip, accept it
                    if (inPos == inSize) break;
                    if (!compressor->Reset(false)) { lastError = ENOMEM; return (uint64)-1; }
                    streamEnded = false;
                }
                if (inputDone && inPos == inSize)
                {   // The compressed stream is truncated
                    lastError = EBADMSG; return (uint64)-1;
                }

                size_t consumed = inSize - inPos, produced = (size_t)min(size - done, (uint64)INT_MAX);
                Compression::BaseCompressor::Result res = compressor->process(&inBuffer[inPos], consumed, (uint8*)outBuffer + done, produced, false);
                if (res < 0) { lastError = EBADMSG; return (uint64)-1; }
                inPos += consumed; done += produced;
                if (res == Compression::BaseCompressor::EndOfStream) streamEnded = true;
                // Stop early if we've got something and more input would be required
                if (done && inPos == inSize && !streamEnded) break;
            }
            position += done;
            return done;
        }
        /** Skipping is done by decompressing */
        bool goForward(const uint64 size)
        {
            uint8 buffer[4096]; uint64 left = size;
            while (left)
            {
                uint64 ret = read(buffer, min(left, (uint64)sizeof(buffer)));
                if (ret == (uint64)-1 || !ret) return false;
                left -= ret;
            }
            return true;
        }
        /** The decompressed size is not known */
        inline uint64 fullSize() const { return (uint64)-1; }
        /** This method returns true if the end of stream is reached */
        inline bool endReached() const { return streamEnded && inputDone && inPos == inSize; }
        /** This method returns the amount of decompressed bytes read so far */
        inline uint64 currentPosition() const { return position; }
        /** Try to seek to the given absolute position (return false if not supported) */
        inline bool setPosition(const uint64) { return false; }
        /** Get the last error */
        virtual int getLastError() const { return lastError; }

        // Construction and destruction
    public:
        /** Construct a DecompressInputStream object from the given stream with the given compressor (it's owned).
            @param stream       The actual stream to read compressed data from (must outlive this object)
            @param compressor   A pointer on a new allocated compressor that's own by this stream. If 0, a GZip is built and used. */
        DecompressInputStream(const InputStream & stream, Compression::BaseCompressor * compressor = 0)
            : stream(stream), compressor(compressor), inPos(0), inSize(0), inputDone(false), streamEnded(false), position(0), lastError(0)
        {
            if (!compressor) this->compressor = new Compression::GZip;
            if (!this->compressor->Reset(false)) lastError = ENOMEM;
        }
    };

    /** An output stream that's compressing on-the-fly while being written into.
        This is a pseudo stream, in the sense that a real stream is used
        underneath to flush the compressed data when necessary.
        It's not possible to seek this stream.
        The compressed stream is only complete once finish() was called */
    class CompressOutputStream : public OutputStream
    {
        // Members
    private:
        /** The stream to write to */
        OutputStream &  stream;
        /** The amount written */
        uint64  amount;
        /** The compressor to use */
        Utils::ScopePtr<Compression::BaseCompressor> compressor;
        /** The output buffer */
        uint8   outBuffer[65536];
        /** Set when the stream is finished */
        bool    finished;
        /** The last error */
        int     lastError;

        // Helpers
    private:
        /** Feed the compressor and write what it produced */
        bool pushData(const uint8 * buffer, size_t size, const bool lastCall)
        {
            while (true)
            {
                size_t consumed = size, produced = sizeof(outBuffer);
                Compression::BaseCompressor::Result res = compressor->process(buffer, consumed, outBuffer, produced, lastCall);
                if (res < 0) { lastError = EINVAL; return false; }
                if (produced && stream.write(outBuffer, produced) != (uint64)produced)
                {
                    lastError = stream.getLastError() ? stream.getLastError() : EIO;
                    return false;
                }
                buffer += consumed; size -= consumed;
                if (lastCall ? res == Compression::BaseCompressor::EndOfStream : (!size && produced < sizeof(outBuffer))) return true;
            }
        }

        // Interface
    public:
        /** Get the compressor used */
        inline const Compression::BaseCompressor * getCompressor() const { return compressor; }
        /** This method returns the number of uncompressed bytes written */
        virtual uint64 fullSize() const  { return amount; }
        virtual bool endReached() const  { return finished; }
        virtual uint64 currentPosition() const { return amount; }
        virtual bool setPosition(const uint64) { return false; }
        /** Try to write the given amount of data to the specified buffer
            @return the number of byte truly written (this method doesn't throw) */
        virtual uint64 write(const void * const buffer, const uint64 size) throw()
        {
            if (finished || lastError) return (uint64)-1;
            if (!pushData((const uint8*)buffer, (size_t)size, false)) return (uint64)-1;
            amount += size;
            return size;
        }
        virtual int getLastError() const { return lastError; }

        /** Terminate the compressed stream (writing the footer), and flush the underlying stream.
            @return false on error */
        bool finish()
        {
            if (finished) return !lastError;
            finished = true;
            if (lastError || !pushData(0, 0, true)) return false;
            if (!stream.flush()) { lastError = stream.getLastError() ? stream.getLastError() : EIO; return false; }
            return true;
        }

        // Construction and destruction
    public:
        /** Construct a CompressOutputStream object to the given stream with the given compressor (it's owned).
            @param stream       The actual stream to write compressed data to (must outlive this object)
            @param compressor   A pointer on a new allocated compressor that's own by this stream. If 0, a GZip is built and used. */
        CompressOutputStream(OutputStream & stream, Compression::BaseCompressor * compressor = 0)
            : stream(stream), amount(0), compressor(compressor), finished(false), lastError(0)
        {
            if (!compressor) this->compressor = new Compression::GZip;
            if (!this->compressor->Reset(true)) lastError = ENOMEM;
        }
    };
}

#endif

#endif
