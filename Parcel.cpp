// We need our declaration
#include "Parcel.hpp"

// We need flock
#include <sys/file.h>


namespace Parcel
{
    namespace
    {
        /** The characters that separate the fields of a manifest record */
        const char * const Whitespaces = " \t\r\n\v\f";

        /** Get the device name used in the stream name ("/dev/mapper/vg-root" gives "mapper-vg-root").
            Image files are named by their base name. Whitespaces are replaced too, since the manifest fields are separated by them */
        String getDeviceName(const String & device)
        {
            String name = Strings::startsWith(device, "/dev/") ? device.substr(5) : Strings::fromLast(device, "/");
            if (name.empty()) name = device;
            for (size_t pos = name.find_first_of(Whitespaces); pos != String::npos; pos = name.find_first_of(Whitespaces, pos + 1))
                name[pos] = '-';
            return Strings::replaceAll(name, "/", "-");
        }

        /** A stream name is used as a manifest field and as a file name prefix */
        bool isValidStreamName(const String & name)
        {
            return name.size() && name.find('/') == String::npos && name.find_first_of(Whitespaces) == String::npos;
        }

        /** Join a directory and a file name */
        String joinPath(const String & directory, const String & name)
        {
            if (directory.empty()) return name;
            return Strings::endsWith(directory, PathSeparator) ? directory + name : directory + PathSeparator + name;
        }

        /** Check a SHA-256 hexadecimal digest */
        bool isHexDigest(const String & text)
        {
            return text.size() == 2 * Crypto::OSSL_SHA256::DigestSize && Strings::invFindAnyChar(text, "0123456789abcdef") == -1;
        }

        Error corrupted(const String & message) { return Error(ManifestCorruptError, "ChunkReader", message); }
    }

    const char * getErrorKindName(const ErrorKind kind)
    {
        switch (kind)
        {
        case NoError:               return "NoError";
        case ValidationError:       return "ValidationError";
        case IOError:               return "IOError";
        case SpaceExceededError:    return "SpaceExceededError";
        case ManifestCorruptError:  return "ManifestCorruptError";
        case ChildProcessError:     return "ChildProcessError";
        case BrokenPipeError:       return "BrokenPipeError";
        case CancelledError:        return "CancelledError";
        }
        return "UnknownError";
    }

    String Error::describe() const
    {
        if (!kind) return "success";
        return Strings::Print("%s: %s: %s", component.c_str(), getErrorKindName(kind), message.c_str());
    }

    Error Error::fromErrno(const int err, const String & component, const String & message)
    {
        ErrorKind kind = IOError;
        if (err == ENOSPC || err == EDQUOT) kind = SpaceExceededError;
        else if (err == EPIPE) kind = BrokenPipeError;
        return Error(kind, component, message + ": " + strerror(err));
    }

    // Manifest
    ///////////////////////////////////////////////////////////////////////////

    String Manifest::getStreamName(const String & device, const String & fsType, const CompressionMode compression)
    {
        return getDeviceName(device) + "." + fsType + "-ptcl-img" + (compression == CompressGZip ? ".gz" : "");
    }

    String Manifest::getHeader() const
    {
        return Strings::Print(MANIFEST_MAGIC " %d\nstream %s\ncompression %s\nchunksize " PF_LLU "\n", MANIFEST_VERSION,
                              streamName.c_str(), compression == CompressGZip ? "gzip" : "none", (unsigned long long)maxChunkSize);
    }

    String Manifest::getChunkRecord(const ChunkDescriptor & chunk)
    {
        return Strings::Print("chunk %u %s " PF_LLU " " PF_LLU " %s\n", chunk.index, chunk.fileName.c_str(),
                              (unsigned long long)chunk.offset, (unsigned long long)chunk.length, chunk.checksum.c_str());
    }

    String Manifest::getEndRecord(const uint64 totalLength, const uint32 count)
    {
        return Strings::Print("end " PF_LLU " %u\n", (unsigned long long)totalLength, count);
    }

    Error Manifest::parse(const String & content)
    {
        *this = Manifest();
        Strings::StringArray lines;
        lines.appendSplit(content, "\r\n");
        if (!lines.getSize()) return corrupted("The manifest is empty");

        Strings::StringArray header;
        header.appendSplit(lines[0]);
        if (header.getSize() != 2 || header[0] != MANIFEST_MAGIC) return corrupted("This is not a manifest");
        if (header[1] != Strings::Print("%d", MANIFEST_VERSION)) return corrupted(Strings::Print("Unsupported manifest version %s", header[1].c_str()));

        bool hasCompression = false;
        for (size_t i = 1; i < lines.getSize(); i++)
        {
            Strings::StringArray fields;
            fields.appendSplit(lines[i]);
            if (!fields.getSize()) continue;
            if (finalized) return corrupted(Strings::Print("Unexpected record after the end record, line %u", (unsigned)i + 1));

            const String & type = fields[0];
            if (type == "stream" && fields.getSize() == 2 && streamName.empty())
            {
                streamName = fields[1];
                if (streamName.find('/') != String::npos) return corrupted("Invalid stream name");
            }
            else if (type == "compression" && fields.getSize() == 2 && !hasCompression)
            {
                if (fields[1] == "gzip") compression = CompressGZip;
                else if (fields[1] == "none") compression = CompressNone;
                else return corrupted(Strings::Print("Unknown compression %s", fields[1].c_str()));
                hasCompression = true;
            }
            else if (type == "chunksize" && fields.getSize() == 2 && !maxChunkSize)
            {
                if (!Strings::parseUnsigned(fields[1], maxChunkSize) || !maxChunkSize) return corrupted("Invalid chunk size");
            }
            else if (type == "chunk" && fields.getSize() == 6)
            {
                uint64 index = 0;
                ChunkDescriptor chunk;
                if (!Strings::parseUnsigned(fields[1], index) || index > 0xFFFFFFFFULL
                    || !Strings::parseUnsigned(fields[3], chunk.offset) || !Strings::parseUnsigned(fields[4], chunk.length))
                    return corrupted(Strings::Print("Invalid chunk record, line %u", (unsigned)i + 1));
                chunk.index = (uint32)index;
                chunk.fileName = fields[2];
                chunk.checksum = fields[5];
                if (chunk.fileName.find('/') != String::npos || !isHexDigest(chunk.checksum))
                    return corrupted(Strings::Print("Invalid chunk record, line %u", (unsigned)i + 1));
                chunks.push_back(chunk);
            }
            else if (type == "end" && fields.getSize() == 3)
            {
                uint64 count = 0;
                if (!Strings::parseUnsigned(fields[1], totalLength) || !Strings::parseUnsigned(fields[2], count) || count > 0xFFFFFFFFULL)
                    return corrupted("Invalid end record");
                declaredCount = (uint32)count;
                finalized = true;
            }
            else return corrupted(Strings::Print("Invalid record, line %u", (unsigned)i + 1));
        }
        if (streamName.empty() || !hasCompression || !maxChunkSize) return corrupted("The manifest header is incomplete");
        return Error();
    }

    Error Manifest::validate(const String & directory) const
    {
        if (!finalized) return corrupted("The manifest is not finalized (the backup did not complete)");
        if (chunks.empty()) return corrupted("The manifest does not reference any chunk");
        if (declaredCount != chunks.size()) return corrupted(Strings::Print("The manifest declares %u chunks, but lists %u", declaredCount, (unsigned)chunks.size()));

        uint64 expectedOffset = 0;
        for (size_t i = 0; i < chunks.size(); i++)
        {
            const ChunkDescriptor & chunk = chunks[i];
            if (chunk.index != i) return corrupted(Strings::Print("Chunk %u is out of sequence (expected %u)", chunk.index, (unsigned)i));
            if (chunk.offset != expectedOffset)
                return corrupted(Strings::Print("Chunk %u starts at " PF_LLU ", expected " PF_LLU, chunk.index, (unsigned long long)chunk.offset, (unsigned long long)expectedOffset));
            if (chunk.length > maxChunkSize) return corrupted(Strings::Print("Chunk %u is larger than the chunk size", chunk.index));
            if (chunk.fileName != getChunkName(streamName, chunk.index)) return corrupted(Strings::Print("Chunk %u has an unexpected name %s", chunk.index, chunk.fileName.c_str()));
            expectedOffset += chunk.length;
        }
        if (expectedOffset != totalLength)
            return corrupted(Strings::Print("The chunks total " PF_LLU " bytes, but the manifest declares " PF_LLU, (unsigned long long)expectedOffset, (unsigned long long)totalLength));

        // Then check the files
        for (size_t i = 0; i < chunks.size(); i++)
        {
            File::Info info(joinPath(directory, chunks[i].fileName));
            if (!info.doesExist()) return corrupted(Strings::Print("Chunk %s is missing", chunks[i].fileName.c_str()));
            if (!info.isFile()) return corrupted(Strings::Print("Chunk %s is not a file", chunks[i].fileName.c_str()));
            if (info.size != chunks[i].length)
                return corrupted(Strings::Print("Chunk %s is " PF_LLU " bytes long, expected " PF_LLU, chunks[i].fileName.c_str(), (unsigned long long)info.size, (unsigned long long)chunks[i].length));
        }
        return Error();
    }

    // ProgressLogger
    ///////////////////////////////////////////////////////////////////////////

    ProgressLogger::ProgressLogger(const String & path, const unsigned int logMask)
        : Logger::FileOutputSink(logMask, path, true), nextCursor(CursorInterval) {}

    Error ProgressLogger::checkOpened() const
    {
        if (isOpen()) return Error();
        return Error(ValidationError, "ProgressLogger", Strings::Print("Can't open log file %s: %s", getFileName().c_str(), strerror(getOpenError())));
    }

    void ProgressLogger::recordCursor(const uint64 offset)
    {
        gotMessage(Strings::Print("cursor " PF_LLU, (unsigned long long)offset).c_str(), Logger::Progress);
    }

    void ProgressLogger::recordChunkBoundary(const uint32 index, const uint64 length)
    {
        gotMessage(Strings::Print("chunk %u closed length " PF_LLU, index, (unsigned long long)length).c_str(), Logger::Progress);
    }

    void ProgressLogger::recordTerminal(const String & status, const String & detail)
    {
        gotMessage(Strings::Print("terminal %s %s", status.c_str(), detail.c_str()).c_str(), Logger::Progress);
    }

    void ProgressLogger::bytesTransferred(const uint64 total)
    {
        if (total < nextCursor) return;
        recordCursor(total);
        nextCursor = (total / CursorInterval + 1) * CursorInterval;
    }

    // ChunkWriter
    ///////////////////////////////////////////////////////////////////////////

    ChunkWriter::ChunkWriter() : chunkLength(0), totalLength(0), opened(false), closed(false), progress(0) {}
    ChunkWriter::~ChunkWriter() {}

    String ChunkWriter::getManifestPath() const { return joinPath(directory, Manifest::getManifestName(manifest.streamName)); }

    File::BaseStream * ChunkWriter::openChunk(const String & path)
    {
        return File::Info(path).getStream(File::Info::Exclusive);
    }

    Error ChunkWriter::appendRecord(const String & record)
    {
        if (manifestFile->write(record.c_str(), (int)record.size()) != (int)record.size() || !manifestFile->sync())
        {
            int err = manifestFile->getLastError();
            return setError(Error::fromErrno(err ? err : EIO, "ChunkWriter", Strings::Print("Can't write manifest %s", getManifestPath().c_str())));
        }
        return Error();
    }

    Error ChunkWriter::open(const String & directory, const String & streamName, const uint64 maxChunkBytes, const CompressionMode compression)
    {
        if (opened) return setError(Error(ValidationError, "ChunkWriter", "The writer is already opened"));
        if (!maxChunkBytes) return setError(Error(ValidationError, "ChunkWriter", "The chunk size can't be zero"));
        if (!isValidStreamName(streamName)) return setError(Error(ValidationError, "ChunkWriter", Strings::Print("Invalid stream name '%s'", streamName.c_str())));

        this->directory = directory;
        manifest = Manifest();
        manifest.streamName = streamName;
        manifest.compression = compression;
        manifest.maxChunkSize = maxChunkBytes;

        const String manifestPath = getManifestPath();
        manifestFile = File::Info(manifestPath).getStream(File::Info::Exclusive);
        if (!manifestFile)
        {
            if (errno == EEXIST) return setError(Error(ValidationError, "ChunkWriter", Strings::Print("A backup already exists in %s (%s)", directory.c_str(), manifestPath.c_str())));
            return setError(Error::fromErrno(errno, "ChunkWriter", Strings::Print("Can't create manifest %s", manifestPath.c_str())));
        }
        Error err = appendRecord(manifest.getHeader());
        if (err) return err;
        if (!File::General::syncDirectory(directory))
            return setError(Error::fromErrno(errno, "ChunkWriter", Strings::Print("Can't sync directory %s", directory.c_str())));

        opened = true;
        Logger::log(Logger::File, "Created manifest %s, chunk size is " PF_LLU " bytes", manifestPath.c_str(), (unsigned long long)maxChunkBytes);
        return startChunk();
    }

    Error ChunkWriter::startChunk()
    {
        const uint32 index = (uint32)manifest.chunks.size();
        const String path = joinPath(directory, Manifest::getChunkName(manifest.streamName, index));
        chunk = openChunk(path);
        if (!chunk)
        {
            if (errno == EEXIST) return setError(Error(IOError, "ChunkWriter", Strings::Print("The chunk %s already exists, it's not overwritten", path.c_str())));
            return setError(Error::fromErrno(errno, "ChunkWriter", Strings::Print("Can't create chunk %s", path.c_str())));
        }
        chunkLength = 0;
        hasher.Start();
        Logger::log(Logger::File, "Started chunk %s", path.c_str());
        return Error();
    }

    Error ChunkWriter::closeChunk()
    {
        const uint32 index = (uint32)manifest.chunks.size();
        const String name = Manifest::getChunkName(manifest.streamName, index);
        if (!chunk->sync())
        {
            int err = chunk->getLastError();
            return setError(Error::fromErrno(err ? err : EIO, "ChunkWriter", Strings::Print("Can't flush chunk %s", name.c_str())));
        }
        chunk = 0;

        uint8 digest[Crypto::OSSL_SHA256::DigestSize];
        hasher.Finalize(digest);
        ChunkDescriptor desc(index, name, totalLength - chunkLength, chunkLength, Strings::toHex(digest, sizeof(digest)));

        // The chunk must be durable before the manifest references it
        if (!File::General::syncDirectory(directory))
            return setError(Error::fromErrno(errno, "ChunkWriter", Strings::Print("Can't sync directory %s", directory.c_str())));
        Error err = appendRecord(Manifest::getChunkRecord(desc));
        if (err) return err;
        manifest.chunks.push_back(desc);

        if (progress) progress->recordChunkBoundary(index, chunkLength);
        Logger::log(Logger::File, "Closed chunk %s (" PF_LLU " bytes)", name.c_str(), (unsigned long long)chunkLength);
        chunkLength = 0;
        return Error();
    }

    uint64 ChunkWriter::write(const void * const buffer, const uint64 size) throw()
    {
        if (error) return (uint64)-1;
        if (!opened || closed) { setError(Error(IOError, "ChunkWriter", "The writer is not opened")); return (uint64)-1; }

        const uint8 * data = (const uint8 *)buffer;
        uint64 left = size;
        while (left)
        {
            if (!chunk && startChunk()) return (uint64)-1;

            const uint64 part = min(min(left, manifest.maxChunkSize - chunkLength), (uint64)(1 << 30));
            if (chunk->write((const char*)data, (int)part) != (int)part)
            {
                int err = chunk->getLastError();
                setError(Error::fromErrno(err ? err : EIO, "ChunkWriter", Strings::Print("Can't write to chunk %s", Manifest::getChunkName(manifest.streamName, (uint32)manifest.chunks.size()).c_str())));
                return (uint64)-1;
            }
            hasher.Hash(data, (uint32)part);
            chunkLength += part; totalLength += part;
            data += part; left -= part;

            if (chunkLength == manifest.maxChunkSize && closeChunk()) return (uint64)-1;
        }
        return size;
    }

    Error ChunkWriter::close()
    {
        if (closed) return error;
        if (!opened) return setError(Error(IOError, "ChunkWriter", "The writer is not opened"));
        closed = true;
        if (error) return error;

        // The last chunk is still opened unless the stream length is a multiple of the chunk size
        if (chunk && closeChunk()) return error;

        const uint32 count = (uint32)manifest.chunks.size();
        Error err = appendRecord(Manifest::getEndRecord(totalLength, count));
        if (err) return err;
        if (!File::General::syncDirectory(directory))
            return setError(Error::fromErrno(errno, "ChunkWriter", Strings::Print("Can't sync directory %s", directory.c_str())));

        manifest.finalized = true;
        manifest.totalLength = totalLength;
        manifest.declaredCount = count;
        manifestFile = 0;
        Logger::log(Logger::File, "Finalized manifest %s: %u chunks, " PF_LLU " bytes", getManifestPath().c_str(), count, (unsigned long long)totalLength);
        return Error();
    }

    // ChunkReader
    ///////////////////////////////////////////////////////////////////////////

    ChunkReader::ChunkReader() : chunkIndex(0), chunkRead(0), position(0), opened(false) {}

    Error ChunkReader::resolveManifest(const String & reference, String & manifestPath)
    {
        File::Info info(reference);
        if (!info.doesExist()) return Error(ValidationError, "ChunkReader", Strings::Print("%s does not exist", reference.c_str()));

        if (info.isDir())
        {
            File::DirectoryIterator iter = File::General::listFilesIn(reference);
            String name, found;
            unsigned count = 0;
            while (iter.getNextFileName(name))
            {
                if (!Strings::endsWith(name, MANIFEST_EXTENSION)) continue;
                found = name;
                count++;
            }
            if (!count) return Error(ValidationError, "ChunkReader", Strings::Print("No manifest found in %s", reference.c_str()));
            if (count > 1) return Error(ValidationError, "ChunkReader", Strings::Print("%u manifests found in %s, please select one", count, reference.c_str()));
            manifestPath = joinPath(reference, found);
            return Error();
        }
        if (Strings::endsWith(reference, MANIFEST_EXTENSION))
        {
            manifestPath = reference;
            return Error();
        }

        // Maybe a chunk, find its manifest by its name
        const size_t pos = reference.rfind('.');
        const String suffix = pos == String::npos ? String() : reference.substr(pos + 1);
        if (suffix.size() < 6 || Strings::invFindAnyChar(suffix, "0123456789") != -1)
            return Error(ValidationError, "ChunkReader", Strings::Print("%s is neither a manifest, a chunk nor a directory", reference.c_str()));

        manifestPath = reference.substr(0, pos) + MANIFEST_EXTENSION;
        if (!File::Info(manifestPath).isFile())
            return Error(ValidationError, "ChunkReader", Strings::Print("No manifest %s found for chunk %s", manifestPath.c_str(), reference.c_str()));
        return Error();
    }

    Error ChunkReader::open(const String & reference)
    {
        close();
        error = Error();
        Error err = resolveManifest(reference, manifestPath);
        if (err) return error = err;

        const size_t slash = manifestPath.rfind('/');
        const String manifestName = slash == String::npos ? manifestPath : manifestPath.substr(slash + 1);
        directory = slash == String::npos ? String(".") : (slash ? manifestPath.substr(0, slash) : String(PathSeparator));

        String content;
        Stream::InputFileStream file(manifestPath);
        Stream::OutputStringStream out(content);
        if (!file.isOpen() || !Stream::copyStream(file, out))
            return error = Error::fromErrno(file.getLastError() ? file.getLastError() : EIO, "ChunkReader", Strings::Print("Can't read manifest %s", manifestPath.c_str()));

        err = manifest.parse(content);
        if (!err && manifestName != Manifest::getManifestName(manifest.streamName))
            err = corrupted(Strings::Print("The manifest %s describes stream %s", manifestName.c_str(), manifest.streamName.c_str()));
        if (!err) err = manifest.validate(directory);
        if (err) return error = err;

        chunkIndex = 0; chunkRead = 0; position = 0;
        opened = true;
        Logger::log(Logger::File, "Opened manifest %s: %u chunks, " PF_LLU " bytes", manifestPath.c_str(), (unsigned)manifest.chunks.size(), (unsigned long long)manifest.totalLength);
        return Error();
    }

    void ChunkReader::close()
    {
        chunk = 0;
        opened = false;
    }

    bool ChunkReader::checkChunkEnd() const
    {
        const ChunkDescriptor & desc = manifest.chunks[chunkIndex];
        char extra;
        int ret = chunk->read(&extra, 1);
        if (ret < 0) { fail(Error::fromErrno(chunk->getLastError() ? chunk->getLastError() : EIO, "ChunkReader", Strings::Print("Can't read chunk %s", desc.fileName.c_str()))); return false; }
        if (ret > 0) { fail(corrupted(Strings::Print("Chunk %s is longer than declared", desc.fileName.c_str()))); return false; }

        uint8 digest[Crypto::OSSL_SHA256::DigestSize];
        hasher.Finalize(digest);
        if (Strings::toHex(digest, sizeof(digest)) != desc.checksum) { fail(corrupted(Strings::Print("Chunk %s checksum mismatch", desc.fileName.c_str()))); return false; }

        chunk = 0;
        chunkIndex++;
        chunkRead = 0;
        return true;
    }

    uint64 ChunkReader::read(void * const buffer, const uint64 size) const throw()
    {
        if (error) return (uint64)-1;
        if (!opened) return fail(Error(IOError, "ChunkReader", "The reader is not opened"));

        uint8 * out = (uint8 *)buffer;
        uint64 done = 0;
        while (done < size && chunkIndex < manifest.chunks.size())
        {
            const ChunkDescriptor & desc = manifest.chunks[chunkIndex];
            if (!chunk)
            {
                const String path = joinPath(directory, desc.fileName);
                chunk = File::Info(path).getStream(File::Info::ReadOnly);
                if (!chunk)
                {
                    if (errno == ENOENT) return fail(corrupted(Strings::Print("Chunk %s is missing", desc.fileName.c_str())));
                    return fail(Error::fromErrno(errno, "ChunkReader", Strings::Print("Can't open chunk %s", path.c_str())));
                }
                chunkRead = 0;
                hasher.Start();
            }
            if (chunkRead < desc.length)
            {
                const uint64 part = min(min(size - done, desc.length - chunkRead), (uint64)(1 << 30));
                int ret = chunk->read((char*)out + done, (int)part);
                if (ret < 0) return fail(Error::fromErrno(chunk->getLastError() ? chunk->getLastError() : EIO, "ChunkReader", Strings::Print("Can't read chunk %s", desc.fileName.c_str())));
                if (ret == 0) return fail(corrupted(Strings::Print("Chunk %s is shorter than declared", desc.fileName.c_str())));
                hasher.Hash(out + done, (uint32)ret);
                chunkRead += (uint64)ret; done += (uint64)ret; position += (uint64)ret;
            }
            if (chunkRead == desc.length && !checkChunkEnd()) return (uint64)-1;
        }
        return done;
    }

    bool ChunkReader::goForward(const uint64 skipAmount)
    {
        uint8 buffer[4096];
        uint64 left = skipAmount;
        while (left)
        {
            uint64 ret = read(buffer, min(left, (uint64)sizeof(buffer)));
            if (ret == (uint64)-1 || !ret) return false;
            left -= ret;
        }
        return true;
    }

    // ChunkSink and ChunkSource
    ///////////////////////////////////////////////////////////////////////////

    ChunkSink::ChunkSink(ChunkWriter & writer, const CompressionMode compression)
        : writer(writer), compressor(compression == CompressGZip ? new Stream::CompressOutputStream(writer) : 0) {}

    uint64 ChunkSink::write(const uint8 * buffer, const uint64 size)
    {
        if (error) return (uint64)-1;
        uint64 ret = compressor ? compressor->write(buffer, size) : writer.write(buffer, size);
        if (ret == size) return size;

        if (writer.getError()) error = writer.getError();
        else error = Error::fromErrno(compressor && compressor->getLastError() ? compressor->getLastError() : EIO, "Compressor", "Can't compress the stream");
        return (uint64)-1;
    }

    Error ChunkSink::finish()
    {
        if (error) return error;
        if (compressor && !compressor->finish())
        {
            if (writer.getError()) return error = writer.getError();
            return error = Error::fromErrno(compressor->getLastError() ? compressor->getLastError() : EIO, "Compressor", "Can't finish the compressed stream");
        }
        return error = writer.close();
    }

    ChunkSource::ChunkSource(ChunkReader & reader)
        : reader(reader), decompressor(reader.getManifest().compression == CompressGZip ? new Stream::DecompressInputStream(reader) : 0) {}

    uint64 ChunkSource::read(uint8 * buffer, const uint64 size)
    {
        if (error) return (uint64)-1;
        uint64 ret = decompressor ? decompressor->read(buffer, size) : reader.read(buffer, size);
        if (ret != (uint64)-1) return ret;

        if (reader.getError()) error = reader.getError();
        else if (decompressor && decompressor->getLastError() == EBADMSG) error = Error(ManifestCorruptError, "Decompressor", "The compressed stream is truncated or corrupted");
        else error = Error::fromErrno(decompressor && decompressor->getLastError() ? decompressor->getLastError() : EIO, "Decompressor", "Can't decompress the stream");
        return (uint64)-1;
    }

    // DirectoryLock
    ///////////////////////////////////////////////////////////////////////////

    Error DirectoryLock::acquire(const String & directory)
    {
        release();
        path = joinPath(directory, LOCK_FILE_NAME);
        fd.Mutate(::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644));
        if (fd < 0) return Error(ValidationError, "DirectoryLock", Strings::Print("Can't create lock file %s: %s", path.c_str(), strerror(errno)));
        if (flock(fd, LOCK_EX | LOCK_NB) != 0)
        {
            const int err = errno;
            fd.Mutate(-1);
            if (err == EWOULDBLOCK) return Error(ValidationError, "DirectoryLock", Strings::Print("Another backup is running in %s", directory.c_str()));
            return Error(ValidationError, "DirectoryLock", Strings::Print("Can't lock %s: %s", path.c_str(), strerror(err)));
        }
        return Error();
    }

    void DirectoryLock::release()
    {
        // The lock file is left in place, removing it would race with another locker
        if (fd >= 0) flock(fd, LOCK_UN);
        fd.Mutate(-1);
    }

    // Session
    ///////////////////////////////////////////////////////////////////////////

    namespace
    {
        /** Stop the verification copy when the session is cancelled */
        struct VerifyCallback : public Stream::CopyCallback
        {
            const Session & session;
            ProgressLogger * progress;
            bool copiedData(const uint64 size, const uint64)
            {
                if (progress) progress->bytesTransferred(size);
                return !session.isCancelled();
            }
            VerifyCallback(const Session & session, ProgressLogger * progress) : session(session), progress(progress) {}
        };
    }

    Session::Session(const Options & options)
        : options(options), state(Validating), previousSink(0), bridge(0), cancelled(false), cursor(0) {}

    Session::~Session()
    {
        // Unplug the log file before it's destructed
        if (teeSink) Logger::setDefaultSink(previousSink);
    }

    const char * Session::getStateName(const State state)
    {
        switch (state)
        {
        case Validating: return "Validating";
        case Running:    return "Running";
        case Succeeded:  return "Succeeded";
        case Failed:     return "Failed";
        }
        return "Unknown";
    }

    int Session::getExitCode(const Error & error, const bool duringValidation)
    {
        if (!error) return 0;
        if (error.kind == CancelledError)
        {
            const int signal = StreamBridge::getReceivedSignal();
            return 128 + (signal ? signal : SIGTERM);
        }
        if (duringValidation || error.kind == ValidationError) return 2;
        return 1;
    }

    Error Session::checkCancelled() const
    {
        const int signal = StreamBridge::getReceivedSignal();
        if (signal) return Error(CancelledError, "Session", Strings::Print("Interrupted by signal %d (%s)", signal, strsignal(signal)));
        if (cancelled) return Error(CancelledError, "Session", "Cancelled");
        return Error();
    }

    void Session::cancel()
    {
        Threading::ScopedLock scope(bridgeLock);
        cancelled = true;
        if (bridge) bridge->cancel();
    }

    void Session::setBridge(StreamBridge * newBridge)
    {
        Threading::ScopedLock scope(bridgeLock);
        bridge = newBridge;
        if (bridge && cancelled) bridge->cancel();
    }

    Error Session::openLog(const String & path)
    {
        progress = new ProgressLogger(path);
        Error err = progress->checkOpened();
        if (err) { progress = 0; return err; }

        previousSink = &Logger::getDefaultSink();
        teeSink = new Logger::TeeSink(*previousSink, *progress);
        Logger::setDefaultSink(teeSink);
        return Error();
    }

    Error Session::validateDevice(const String & device, const bool forWriting) const
    {
        if (device.empty()) return Error(ValidationError, "Session", "Empty device path");
        if (!options.imageFile && !Strings::startsWith(device, "/dev/"))
            return Error(ValidationError, "Session", Strings::Print("%s is not a device path (use --image-file for image files)", device.c_str()));

        File::Info info(device);
        if (!info.doesExist())
        {
            // An image file can be created by a restore
            if (forWriting && options.imageFile && File::Info(info.getParentFolder()).checkPermission(File::Info::Writing)) return Error();
            return Error(ValidationError, "Session", Strings::Print("%s does not exist", device.c_str()));
        }
        if (info.isDir()) return Error(ValidationError, "Session", Strings::Print("%s is a directory", device.c_str()));
        if (!info.checkPermission(forWriting ? File::Info::Writing : File::Info::Reading))
            return Error(ValidationError, "Session", Strings::Print("Can't %s %s", forWriting ? "write to" : "read from", device.c_str()));
        return Error();
    }

    Error Session::confirm(const String & device) const
    {
        if (options.assumeYes) return Error();
        Error err = checkCancelled();
        if (err) return err;
        char buffer[64];
        size_t size = sizeof(buffer);
        const String prompt = Strings::Print("This will ERASE the contents of %s. Type 'yes' to continue: ", device.c_str());
        if (!Platform::queryUserInput(prompt.c_str(), buffer, size))
        {
            // An interruption while prompting makes the input fail
            if ((err = checkCancelled())) return err;
            return Error(ValidationError, "Session", "Can't ask for confirmation (use --yes to skip it)");
        }
        if (Strings::Trimmed(String(buffer, size)) != "yes")
            return Error(ValidationError, "Session", "Restore aborted by user");
        return Error();
    }

    Error Session::validate()
    {
        if (options.backupPath.empty()) return Error(ValidationError, "Session", "Missing backup path");
        if (options.direction != Verify)
        {
            if (options.fsType.empty() || options.fsType.find('/') != String::npos || options.fsType.find_first_of(Whitespaces) != String::npos)
                return Error(ValidationError, "Session", Strings::Print("Invalid file system type '%s'", options.fsType.c_str()));
            if (!options.imageFile && !Platform::isSuperUser())
                return Error(ValidationError, "Session", "Accessing devices requires super user privileges (use --image-file for image files)");
        }

        Error err;
        switch (options.direction)
        {
        case Backup:
        {
            if (!options.devices.getSize()) return Error(ValidationError, "Session", "No device to backup");
            if (!options.maxChunkSize) return Error(ValidationError, "Session", "The chunk size can't be zero");

            File::Info dir(options.backupPath);
            if (dir.doesExist() && !dir.isDir()) return Error(ValidationError, "Session", Strings::Print("%s is not a directory", options.backupPath.c_str()));
            if (!dir.doesExist() && !dir.makeDir(true))
                return Error(ValidationError, "Session", Strings::Print("Can't create backup directory %s: %s", options.backupPath.c_str(), strerror(errno)));
            if (!dir.checkPermission(File::Info::Writing))
                return Error(ValidationError, "Session", Strings::Print("Can't write to backup directory %s", options.backupPath.c_str()));

            Strings::StringArray streams;
            for (size_t i = 0; i < options.devices.getSize(); i++)
            {
                if ((err = validateDevice(options.devices[i], false))) return err;
                const String stream = Manifest::getStreamName(options.devices[i], options.fsType, options.compression);
                if (streams.Contains(stream)) return Error(ValidationError, "Session", Strings::Print("%s is listed twice", options.devices[i].c_str()));
                if (File::Info(joinPath(options.backupPath, Manifest::getManifestName(stream))).doesExist())
                    return Error(ValidationError, "Session", Strings::Print("A backup of %s already exists in %s", options.devices[i].c_str(), options.backupPath.c_str()));
                streams.Append(stream);
            }
            if ((err = lock.acquire(options.backupPath))) return err;
            if ((err = openLog(joinPath(options.backupPath, BACKUP_LOG_NAME)))) return err;
            break;
        }
        case Restore:
            if (options.devices.getSize() != 1) return Error(ValidationError, "Session", "Restore requires exactly one destination device");
            if ((err = validateDevice(options.devices[0], true))) return err;
            if (options.logFile.size() && (err = openLog(options.logFile))) return err;
            if ((err = reader.open(options.backupPath))) return err;
            if ((err = confirm(options.devices[0]))) return err;
            break;
        case Verify:
            if (options.logFile.size() && (err = openLog(options.logFile))) return err;
            if ((err = reader.open(options.backupPath))) return err;
            break;
        }
        return checkCancelled();
    }

    Strings::StringArray Session::getEngineArguments(const String & device) const
    {
        Strings::StringArray args;
        if (options.engineCommand.size())
        {
            Strings::StringArray tokens;
            tokens.appendSplit(options.engineCommand, " \t");
            for (size_t i = 0; i < tokens.getSize(); i++) args.Append(Strings::replaceAll(tokens[i], "%s", device));
            return args;
        }

        args.Append("partclone." + options.fsType);
        if (options.direction == Backup)
        {
            args.Append("--logfile");
            args.Append(joinPath(options.backupPath, "partclone-" + getDeviceName(device) + ".log"));
            args.Append("--buffer_size");
            args.Append("10485670");
            args.Append("--clone");
            args.Append("--source");
            args.Append(device);
            args.Append("--output");
            args.Append("-");
        } else
        {
            args.Append("--restore");
            args.Append("--source");
            args.Append("-");
            args.Append("--output");
            args.Append(device);
        }
        return args;
    }

    ChunkWriter * Session::createWriter() { return new ChunkWriter; }

    Error Session::backupDevice(const String & device)
    {
        Error err = checkCancelled();
        if (err) return err;

        const String streamName = Manifest::getStreamName(device, options.fsType, options.compression);
        Utils::ScopePtr<ChunkWriter> writer(createWriter());
        writer->setProgressLogger(progress);
        if ((err = writer->open(options.backupPath, streamName, options.maxChunkSize, options.compression))) return err;
        Logger::log(Logger::Content, "Backing up %s to %s", device.c_str(), writer->getManifestPath().c_str());

        ChunkSink sink(*writer, options.compression);
        ProcessEndpoint engine(getEngineArguments(device));
        StreamBridge bridge;
        bridge.setObserver(progress);
        setBridge(&bridge);
        err = bridge.run(engine, sink);
        setBridge(0);

        cursor += bridge.getTransferred();
        if (progress) progress->recordCursor(cursor);
        if (err) return err;
        Logger::log(Logger::Content, "Backup of %s done: " PF_LLU " bytes read, %u chunks, " PF_LLU " bytes stored", device.c_str(),
                    (unsigned long long)bridge.getTransferred(), (unsigned)writer->getManifest().chunks.size(), (unsigned long long)writer->getManifest().totalLength);
        return Error();
    }

    Error Session::runRestore()
    {
        const String & device = options.devices[0];
        Logger::log(Logger::Content, "Restoring %s to %s", reader.getManifestPath().c_str(), device.c_str());

        ChunkSource source(reader);
        ProcessEndpoint engine(getEngineArguments(device));
        StreamBridge bridge;
        bridge.setObserver(progress);
        setBridge(&bridge);
        Error err = bridge.run(engine, source);
        setBridge(0);
        reader.close();

        cursor = bridge.getTransferred();
        if (progress) progress->recordCursor(cursor);
        if (err) return err;
        Logger::log(Logger::Content, "Restore of %s done: " PF_LLU " bytes written", device.c_str(), (unsigned long long)cursor);
        return Error();
    }

    Error Session::runVerify()
    {
        Stream::NullOutputStream null;
        VerifyCallback callback(*this, progress);
        bool ok = true;
        uint64 decompressed = 0;
        if (reader.getManifest().compression == CompressGZip)
        {
            // Checking the compressed stream too, since it's what will be fed to the engine
            Stream::DecompressInputStream input(reader);
            ok = Stream::copyStream(input, null, callback);
            decompressed = input.currentPosition();
            if (!ok && !reader.getError() && !checkCancelled())
                return input.getLastError() == EBADMSG ? Error(ManifestCorruptError, "Decompressor", "The compressed stream is truncated or corrupted")
                                                       : Error::fromErrno(input.getLastError() ? input.getLastError() : EIO, "Decompressor", "Can't decompress the stream");
        }
        else ok = Stream::copyStream(reader, null, callback);

        cursor = reader.currentPosition();
        if (!ok)
        {
            if (reader.getError()) return reader.getError();
            Error err = checkCancelled();
            return err ? err : Error(IOError, "Session", "Verification failed");
        }
        // The copy stops at the declared size, so check the last chunk is completed (this verifies an empty chunk too)
        uint8 extra;
        if (reader.read(&extra, 1) != 0) return reader.getError() ? reader.getError() : Error(ManifestCorruptError, "ChunkReader", "The chunks are longer than declared");
        if (!reader.endReached()) return Error(ManifestCorruptError, "ChunkReader", "The chunks were not completely read");
        reader.close();

        if (decompressed) Logger::log(Logger::Content, "Verified %s: %u chunks, " PF_LLU " bytes (" PF_LLU " bytes uncompressed)", reader.getManifestPath().c_str(),
                                      (unsigned)reader.getManifest().chunks.size(), (unsigned long long)cursor, (unsigned long long)decompressed);
        else Logger::log(Logger::Content, "Verified %s: %u chunks, " PF_LLU " bytes", reader.getManifestPath().c_str(), (unsigned)reader.getManifest().chunks.size(), (unsigned long long)cursor);
        return Error();
    }

    int Session::terminate(const Error & err)
    {
        const bool duringValidation = state == Validating;
        error = err;
        state = err ? Failed : Succeeded;

        const String detail = err ? err.describe() : Strings::Print(PF_LLU " bytes", (unsigned long long)cursor);
        if (err)
        {
            Logger::log(Logger::Error, "%s", detail.c_str());
            if (err.diagnostic.size()) Logger::log(Logger::Error, "Last engine output:\n%s", err.diagnostic.c_str());
        }
        if (progress) progress->recordTerminal(getStateName(state), detail);
        lock.release();
        return getExitCode(err, duringValidation);
    }

    int Session::run()
    {
        state = Validating;
        Error err = validate();
        if (err) return terminate(err);

        state = Running;
        switch (options.direction)
        {
        case Backup:
            for (size_t i = 0; i < options.devices.getSize() && !err; i++) err = backupDevice(options.devices[i]);
            break;
        case Restore: err = runRestore(); break;
        case Verify:  err = runVerify(); break;
        }
        return terminate(err);
    }
}
