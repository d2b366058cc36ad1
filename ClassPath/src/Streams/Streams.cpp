// We need our declarations
#include "../../include/Streams/Streams.hpp"
// We need file declaration
#include "../../include/File/File.hpp"

namespace Stream
{
    InputFileStream::InputFileStream(const String & name) : fileName(name), stream(0), fileSize((uint64)BadStreamSize), lastError(0)
    {
        if (fileName.size())
        {
            File::Info info(fileName);
            stream = new File::Stream(fileName, "rb");
            if (!stream->isOpen()) { lastError = stream->getLastError(); delete0(stream); }
            else fileSize = info.size;
        }
    }

    InputFileStream::~InputFileStream()
    {
        fileSize = 0; delete0(stream);
    }

    uint64 InputFileStream::fullSize() const { return fileSize; }
    bool InputFileStream::endReached() const { return stream ? stream->endOfStream() : true; }
    uint64 InputFileStream::currentPosition() const { return stream ? stream->getPosition() : 0; }
    bool InputFileStream::setPosition(const uint64 newPos)
    {
        return stream ? stream->setPosition(newPos) : false;
    }
    bool InputFileStream::goForward(const uint64 skipAmount)
    {
        return stream ? stream->setPosition(stream->getPosition() + skipAmount) : false;
    }
    uint64 InputFileStream::read(void * const buffer, const uint64 size) const throw()
    {
        if (!stream) return (uint64)-1;
        if (!buffer || !size) return 0;

        int ret = stream->read((char*)buffer, (int)min((uint64)INT_MAX, size));
        if (ret < 0) { lastError = stream->getLastError(); return (uint64)-1; }
        return (uint64)ret;
    }


    OutputFileStream::OutputFileStream(const String & name) : fileName(name), stream(0), fileSize(0), lastError(0)
    {
        stream = new File::Stream(fileName, "wb");
        if (!stream->isOpen()) { lastError = stream->getLastError(); delete0(stream); }
    }
    OutputFileStream::~OutputFileStream()
    {
        if (stream && !stream->close()) lastError = stream->getLastError();
        delete0(stream);
    }

    uint64 OutputFileStream::fullSize() const { return fileSize; }
    bool OutputFileStream::endReached() const { return false; }
    uint64 OutputFileStream::currentPosition() const { return stream ? stream->getPosition() : 0; }
    bool OutputFileStream::setPosition(const uint64 newPos) { return stream ? stream->setPosition(newPos) : false; }
    uint64 OutputFileStream::write(const void * const buffer, const uint64 size) throw()
    {
        if (!stream) return (uint64)-1;
        uint64 done = 0;
        while (done < size)
        {
            int ret = stream->write((const char*)buffer + done, (int)min((uint64)INT_MAX, size - done));
            if (ret < 0) { lastError = stream->getLastError(); return (uint64)-1; }
            done += (uint64)ret;
        }
        fileSize = max(fileSize, stream->getPosition());
        return done;
    }
    bool OutputFileStream::flush()
    {
        if (!stream) return false;
        if (!stream->flush()) { lastError = stream->getLastError(); return false; }
        return true;
    }
    bool OutputFileStream::sync()
    {
        if (!stream) return false;
        if (!stream->sync()) { lastError = stream->getLastError(); return false; }
        return true;
    }


    uint64 OutputStringStream::write(const void * const buffer, const uint64 size) throw()
    {
        if (!buffer) return (uint64)-1;
        content.append((const char*)buffer, (size_t)size);
        return size;
    }


    // The copy stream function
    bool copyStream(const InputStream & is, OutputStream & os, const uint64 forcedSize)
    {
        uint64 total = forcedSize ? forcedSize : is.fullSize();

        uint8 buffer[4096];
        while (total)
        {
            // This works because if fullSize() returns -1 (size not known), it's seen as the biggest number possible
            uint64 data = is.read(buffer, min(total, (uint64)sizeof(buffer)));
            if (data == (uint64)-1) return false;
            if (!data) break;
            if (os.write(buffer, data) != data) return false;
            total -= data;
        }
        return os.flush();
    }
    // The copy stream function
    bool copyStream(const InputStream & is, OutputStream & os, CopyCallback & callback, const uint64 forceOutputSize)
    {
        uint64 total = forceOutputSize ? forceOutputSize : is.fullSize(), current = 0;

        uint8 buffer[4096];
        while (current < total)
        {
            uint64 data = is.read(buffer, min(total - current, (uint64)sizeof(buffer)));
            if (data == (uint64)-1) return false;
            if (!data) break;
            if (os.write(buffer, data) != data) return false;
            current += data;
            if (!callback.copiedData(current, total)) return false;
        }
        return os.flush();
    }
}
