#ifndef hpp_Parcel_hpp
#define hpp_Parcel_hpp

// We need the ClassPath's streams
#include "ClassPath/include/Streams/Streams.hpp"
// We need compressed streams too
#include "ClassPath/include/Streams/CompressStream.hpp"
// We need files too
#include "ClassPath/include/File/File.hpp"
// We need strings
#include "ClassPath/include/Strings/Strings.hpp"
// We need the logger to write the progress file
#include "ClassPath/include/Logger/Logger.hpp"
// We need crypto code too for the chunks checksum
#include "ClassPath/include/Crypto/OpenSSLWrap.hpp"
// We need scoped pointers
#include "ClassPath/include/Utils/ScopePtr.hpp"
// We need the bridge to the imaging engine
#include "Bridge.hpp"

#include <vector>

  #define MANIFEST_MAGIC        "parcel-manifest"
  #define MANIFEST_VERSION      1
  #define MANIFEST_EXTENSION    ".manifest"
  #define BACKUP_LOG_NAME       "parcel-backup.log"
  #define LOCK_FILE_NAME        ".parcel.lock"


namespace Parcel
{
    /** The compression applied to the stream before it's cut in chunks */
    enum CompressionMode
    {
        CompressNone    = 0,    //!< Raw engine output
        CompressGZip    = 1,    //!< The engine output is gzip'd (RFC1952)
    };

    /** A chunk description, as found in the manifest */
    struct ChunkDescriptor
    {
        /** The chunk index (zero based) */
        uint32      index;
        /** The chunk file name (without path) */
        String      fileName;
        /** The offset of the chunk in the stream */
        uint64      offset;
        /** The chunk length in bytes */
        uint64      length;
        /** The SHA-256 of the chunk content, in lowercase hexadecimal */
        String      checksum;

        ChunkDescriptor(const uint32 index = 0, const String & fileName = "", const uint64 offset = 0, const uint64 length = 0, const String & checksum = "")
            : index(index), fileName(fileName), offset(offset), length(length), checksum(checksum) {}
    };

    /** The manifest describes how the stream was cut in chunks.

        It's a text file, one record per line, that's only appended to while the backup runs:
        @verbatim
            parcel-manifest 1
            stream sda1.ext4-ptcl-img.gz
            compression gzip
            chunksize 4294967296
            chunk 0 sda1.ext4-ptcl-img.gz.000000 0 4294967296 <sha256 in hex>
            chunk 1 sda1.ext4-ptcl-img.gz.000001 4294967296 1234 <sha256 in hex>
            end 4294968530 2
        @endverbatim
        The "end" record is only written when the stream is complete, so a manifest without it is unfinished. */
    struct Manifest
    {
        // Type definition and enumeration
    public:
        typedef std::vector<ChunkDescriptor> ChunkArray;

        // Members
    public:
        /** The stream name (all the chunk names are built from it) */
        String          streamName;
        /** The compression used */
        CompressionMode compression;
        /** The maximum chunk size */
        uint64          maxChunkSize;
        /** The chunks */
        ChunkArray      chunks;
        /** Set when the end record was found */
        bool            finalized;
        /** The total stream length as declared in the end record */
        uint64          totalLength;
        /** The number of chunks as declared in the end record */
        uint32          declaredCount;

        // Interface
    public:
        /** Get the manifest file name for the given stream name */
        static String getManifestName(const String & streamName) { return streamName + MANIFEST_EXTENSION; }
        /** Get the chunk file name for the given stream name and index */
        static String getChunkName(const String & streamName, const uint32 index) { return Strings::Print("%s.%06u", streamName.c_str(), index); }
        /** Get the stream name for the given device or image path.
            "/dev/sda1" with "ext4" gives "sda1.ext4-ptcl-img", and "/dev/mapper/vg-root" gives "mapper-vg-root.ext4-ptcl-img" */
        static String getStreamName(const String & device, const String & fsType, const CompressionMode compression);

        /** Get the header records */
        String getHeader() const;
        /** Get the record for the given chunk */
        static String getChunkRecord(const ChunkDescriptor & chunk);
        /** Get the finalization record */
        static String getEndRecord(const uint64 totalLength, const uint32 count);

        /** Parse the manifest content (this only checks the syntax, see validate)
            @return a ManifestCorruptError on a syntax error */
        Error parse(const String & content);
        /** Check the manifest structure (finalized, contiguous chunks, totals) and the chunk files in the given directory.
            @return a ManifestCorruptError on the first inconsistency */
        Error validate(const String & directory) const;

        Manifest() : compression(CompressNone), maxChunkSize(0), finalized(false), totalLength(0), declaredCount(0) {}
    };

    /** The progress logger.
        This writes the progress records (cursor position, chunk boundaries, final outcome) to the log file,
        and since it's also a log sink, any log message ends up in the same file.
        Each record is flushed, so the file can be watched while the transfer runs.
        If writing fails, this is reported once on the error console, and the file logging is disabled. */
    class ProgressLogger : public Logger::FileOutputSink, public TransferObserver
    {
        // Type definition and enumeration
    public:
        /** The amount of bytes between two cursor records */
        enum { CursorInterval = 64 * 1024 * 1024 };

        // Members
    private:
        /** The next cursor to record */
        uint64      nextCursor;

        // Interface
    public:
        /** Check if the log file could be opened
            @return a ValidationError if it could not be opened */
        Error checkOpened() const;
        /** Record the current position in the stream */
        void recordCursor(const uint64 offset);
        /** Record a chunk that was closed */
        void recordChunkBoundary(const uint32 index, const uint64 length);
        /** Record the final outcome of the session */
        void recordTerminal(const String & status, const String & detail);
        /** Record the cursor at regular interval */
        virtual void bytesTransferred(const uint64 total);

        /** Open the log file (in append mode)
            @param path     The log file path
            @param logMask  The messages to keep in the file */
        ProgressLogger(const String & path, const unsigned int logMask = Logger::Error | Logger::Warning | Logger::File | Logger::Config | Logger::Content | Logger::Process | Logger::Progress);
    };

    /** The chunk writer.
        This is an output stream that cuts what's written into fixed size chunk files,
        and maintains the manifest describing them.
        The chunk boundaries only depend on the amount of bytes written.
        A chunk is durably closed (flushed and synced) before it's appended to the manifest.
        The next chunk is only created when some data is written, except the first one which is created on opening.
        If something fails, the chunks already closed are left valid, the chunk being written is left as is,
        and the manifest is never finalized. */
    class ChunkWriter : public Stream::OutputStream
    {
        // Members
    private:
        /** The destination directory */
        String              directory;
        /** The manifest being written */
        Manifest            manifest;
        /** The manifest file */
        Utils::ScopePtr<File::BaseStream> manifestFile;
        /** The current chunk file (0 if none opened yet) */
        Utils::ScopePtr<File::BaseStream> chunk;
        /** The current chunk length */
        uint64              chunkLength;
        /** The total amount written */
        uint64              totalLength;
        /** The current chunk hasher */
        Crypto::OSSL_SHA256 hasher;
        /** The first error that happened */
        Error               error;
        /** Set once opened */
        bool                opened;
        /** Set once closed */
        bool                closed;
        /** The progress logger, if any */
        ProgressLogger *    progress;

        // Helpers
    private:
        /** Create the next chunk */
        Error startChunk();
        /** Close the current chunk, and append it to the manifest */
        Error closeChunk();
        /** Append a record to the manifest, and sync it */
        Error appendRecord(const String & record);
        /** Remember the first error */
        Error setError(const Error & err) { if (!error) error = err; return error; }

    protected:
        /** Create the chunk file.
            @return 0 on error (with errno set) */
        virtual File::BaseStream * openChunk(const String & path);

        // Interface
    public:
        /** Create the manifest, and the first chunk.
            @param directory        The destination directory (must exist)
            @param streamName       The stream name (the chunks and manifest names are built from it)
            @param maxChunkBytes    The maximum size of a chunk
            @param compression      The compression used for the stream (only recorded in the manifest)
            @return a ValidationError if the manifest already exists, an IOError or SpaceExceededError on failure */
        Error open(const String & directory, const String & streamName, const uint64 maxChunkBytes, const CompressionMode compression);
        /** Write the given data to the chunks.
            @return size on success, or (uint64)-1 on error (see getError) */
        virtual uint64 write(const void * const buffer, const uint64 size) throw();
        /** Close the last chunk, and finalize the manifest.
            @return the first error that happened (the manifest is not finalized then) */
        Error close();

        /** Get the first error that happened */
        inline const Error & getError() const { return error; }
        /** Get the manifest, as written so far */
        inline const Manifest & getManifest() const { return manifest; }
        /** Get the manifest path */
        String getManifestPath() const;
        /** Set the progress logger */
        inline void setProgressLogger(ProgressLogger * logger) { progress = logger; }

        // Stream interface
    public:
        virtual uint64 fullSize() const { return totalLength; }
        virtual bool endReached() const { return closed; }
        virtual uint64 currentPosition() const { return totalLength; }
        virtual bool setPosition(const uint64) { return false; }
        virtual int getLastError() const { return error ? (error.kind == SpaceExceededError ? ENOSPC : EIO) : 0; }

        // Construction and destruction
    public:
        ChunkWriter();
        virtual ~ChunkWriter();
    };

    /** The chunk reader.
        This is an input stream that reads the chunks described in a manifest, as if it was a single stream.
        The manifest and the chunk files are checked on opening, before any byte is produced.
        While reading, each chunk length and checksum is checked again when it's completely read. */
    class ChunkReader : public Stream::InputStream
    {
        // Members
    private:
        /** The directory containing the chunks */
        String              directory;
        /** The manifest path */
        String              manifestPath;
        /** The manifest */
        Manifest            manifest;
        /** The current chunk file (0 if none opened yet) */
        mutable Utils::ScopePtr<File::BaseStream> chunk;
        /** The current chunk index */
        mutable uint32      chunkIndex;
        /** The amount read in the current chunk */
        mutable uint64      chunkRead;
        /** The position in the stream */
        mutable uint64      position;
        /** The current chunk hasher */
        mutable Crypto::OSSL_SHA256 hasher;
        /** The first error that happened */
        mutable Error       error;
        /** Set once opened */
        bool                opened;

        // Helpers
    private:
        /** Check the current chunk once it's completely read */
        bool checkChunkEnd() const;
        /** Remember the first error */
        uint64 fail(const Error & err) const { if (!error) error = err; return (uint64)-1; }

        // Interface
    public:
        /** Find the manifest for a reference.
            The reference can be a manifest file, a chunk file (its manifest is then found by its name), or a directory containing a single manifest.
            @return a ValidationError if it can't be resolved */
        static Error resolveManifest(const String & reference, String & manifestPath);
        /** Open the stream.
            @param reference    Any reference accepted by resolveManifest
            @return a ManifestCorruptError if the manifest or the chunks are not consistent */
        Error open(const String & reference);
        /** Read the stream
            @return the amount read (less than size only at the end of the stream), or (uint64)-1 on error (see getError) */
        virtual uint64 read(void * const buffer, const uint64 size) const throw();
        /** Close the stream */
        void close();

        /** Get the first error that happened */
        inline const Error & getError() const { return error; }
        /** Get the manifest */
        inline const Manifest & getManifest() const { return manifest; }
        /** Get the manifest path */
        inline const String & getManifestPath() const { return manifestPath; }

        // Stream interface
    public:
        virtual uint64 fullSize() const { return manifest.totalLength; }
        virtual bool endReached() const { return opened && chunkIndex >= manifest.chunks.size(); }
        virtual uint64 currentPosition() const { return position; }
        virtual bool setPosition(const uint64) { return false; }
        virtual bool goForward(const uint64 skipAmount);
        virtual int getLastError() const { return error ? (error.kind == ManifestCorruptError ? EBADMSG : EIO) : 0; }

        // Construction and destruction
    public:
        ChunkReader();
    };

    /** The chunk side of a backup: compress (if required) and write to the chunks */
    class ChunkSink : public ByteSink
    {
        // Members
    private:
        /** The writer */
        ChunkWriter &       writer;
        /** The compressor, if any */
        Utils::ScopePtr<Stream::CompressOutputStream> compressor;
        /** The error */
        Error               error;

        // ByteSink interface
    public:
        virtual uint64 write(const uint8 * buffer, const uint64 size);
        virtual Error finish();
        virtual Error getError() const { return error; }

        /** Build the sink on the given (opened) writer */
        ChunkSink(ChunkWriter & writer, const CompressionMode compression);
    };

    /** The chunk side of a restore: read the chunks, and decompress them (if required) */
    class ChunkSource : public ByteSource
    {
        // Members
    private:
        /** The reader */
        ChunkReader &       reader;
        /** The decompressor, if any */
        Utils::ScopePtr<Stream::DecompressInputStream> decompressor;
        /** The error */
        Error               error;

        // ByteSource interface
    public:
        virtual uint64 read(uint8 * buffer, const uint64 size);
        virtual Error getError() const { return error; }

        /** Build the source on the given (opened) reader, the compression is found from its manifest */
        ChunkSource(ChunkReader & reader);
    };

    /** Prevent concurrent backups in the same directory.
        The lock is advisory (flock on a lock file in the directory), and released when the object is destructed */
    class DirectoryLock
    {
        // Members
    private:
        /** The lock file index */
        Platform::FileIndexWrapper  fd;
        /** The lock file path */
        String                      path;

        // Interface
    public:
        /** Lock the given directory
            @return a ValidationError if it's already locked, or can't be locked */
        Error acquire(const String & directory);
        /** Release the lock */
        void release();
        /** Check if we own the lock */
        inline bool isLocked() const { return fd >= 0; }

        DirectoryLock() {}
        ~DirectoryLock() { release(); }
    };

    /** A backup, restore or verify session.

        The session validates everything it can before doing any I/O, then runs the transfer:
        @verbatim
            Validating ---> Running ---> Succeeded
                |              |
                +------------> +-------> Failed
        @endverbatim
        The exit code is 0 on success, 2 when validation failed, 128 + signal number when cancelled by a signal,
        and 1 otherwise. Files are never deleted on failure. */
    class Session
    {
        // Type definition and enumeration
    public:
        /** The direction of the session */
        enum Direction
        {
            Backup      = 0,
            Restore     = 1,
            Verify      = 2,
        };
        /** The session state */
        enum State
        {
            Validating  = 0,
            Running     = 1,
            Succeeded   = 2,
            Failed      = 3,
        };

        /** The session options, as parsed from the command line */
        struct Options
        {
            /** The direction */
            Direction           direction;
            /** The backup directory (backup), or the backup reference (restore and verify) */
            String              backupPath;
            /** The devices to backup, or the device to restore to */
            Strings::StringArray devices;
            /** The maximum chunk size */
            uint64              maxChunkSize;
            /** The compression to use for backup */
            CompressionMode     compression;
            /** The file system type (used to select the engine) */
            String              fsType;
            /** The engine command line template, %s is replaced by the device (empty for the default engine) */
            String              engineCommand;
            /** Set if the devices are plain image files (no /dev/ and super user check) */
            bool                imageFile;
            /** Set to skip the restore confirmation */
            bool                assumeYes;
            /** The log file path for restore (can be empty) */
            String              logFile;

            Options() : direction(Backup), maxChunkSize((uint64)4096 * 1024 * 1024), compression(CompressGZip), fsType("ext4"), imageFile(false), assumeYes(false) {}
        };

        // Members
    private:
        /** The options */
        Options             options;
        /** The current state */
        volatile State      state;
        /** The error that failed the session */
        Error               error;
        /** The progress logger */
        Utils::ScopePtr<ProgressLogger> progress;
        /** The sink that was used before the progress logger was joined to it */
        Logger::OutputSink * previousSink;
        /** The sink joining the console and the progress logger */
        Utils::ScopePtr<Logger::TeeSink> teeSink;
        /** The directory lock */
        DirectoryLock       lock;
        /** The reader (restore and verify) */
        ChunkReader         reader;
        /** The current bridge, if any */
        StreamBridge *      bridge;
        /** Protect the bridge pointer */
        Threading::Lock     bridgeLock;
        /** Set when cancel was called */
        volatile bool       cancelled;
        /** The amount of bytes transferred so far */
        uint64              cursor;

        // Helpers
    private:
        /** Validate the options and the environment */
        Error validate();
        /** Validate a device path */
        Error validateDevice(const String & device, const bool forWriting) const;
        /** Open the progress log */
        Error openLog(const String & path);
        /** Ask the user for confirmation */
        Error confirm(const String & device) const;
        /** Run a backup of a single device */
        Error backupDevice(const String & device);
        /** Run the restore */
        Error runRestore();
        /** Run the verification */
        Error runVerify();
        /** Build the engine command line for the given device */
        Strings::StringArray getEngineArguments(const String & device) const;
        /** Move to the final state */
        int terminate(const Error & err);
        /** Set the running bridge */
        void setBridge(StreamBridge * newBridge);
        /** Check if cancel was asked or a signal received */
        Error checkCancelled() const;

    protected:
        /** Create the writer storing a device's stream. The returned writer is owned by the caller */
        virtual ChunkWriter * createWriter();

        // Interface
    public:
        /** Run the session
            @return the process exit code */
        int run();
        /** Cancel the session (thread safe) */
        void cancel();
        /** Get the state */
        inline State getState() const { return state; }
        /** Get the error */
        inline const Error & getError() const { return error; }
        /** Get the amount of bytes transferred */
        inline uint64 getCursor() const { return cursor; }
        /** Check if the session was cancelled (by cancel or a signal) */
        bool isCancelled() const { return cancelled || StreamBridge::getReceivedSignal() != 0; }
        /** Get the exit code for the given error, in the given state */
        static int getExitCode(const Error & error, const bool duringValidation);
        /** Get the state name */
        static const char * getStateName(const State state);

        /** Build a session.
            When a log file is used, it's joined with the current default sink while the session exists */
        Session(const Options & options);
        virtual ~Session();
    };
}

#endif
