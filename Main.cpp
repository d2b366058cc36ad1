// We need our declaration
#include "Parcel.hpp"

// mkdtemp
#include <stdlib.h>

// This value is returned when the action is not found in the options
const int BailOut = 26748;
// This value is returned when the arguments are invalid
const int BadArgument = 2;

// The parsed options
Strings::StringMap optionsMap;

int showHelpMessage(const Parcel::String & error = "")
{
    if (error.size()) fprintf(stderr, "error: %s\n\n", error.c_str());

    printf("Parcel is a tool used to backup a block device to a set of fixed size chunk files,\n"
           "and to restore such backup to a block device. The device imaging is done by partclone.\n\n"
           "Usage:\n"
           "  Actions:\n"
           "\t--backup dir dev [dev...]\tBackup the given devices to the given directory (created if required)\n"
           "\t--restore backup dev\t\tRestore the backup to the given device. The backup is either a manifest, a chunk file or\n"
           "\t                    \t\ta directory containing a single manifest\n"
           "\t--verify backup\t\t\tCheck the backup's manifest, chunk lengths and checksums without restoring it\n"
           "\t--test [name]\t\t\tRun the test with the given name -developer only- use -v for more verbose mode, 'help' to get a list of available tests\n"
           "\t--help\t\t\t\tThis help\n"
           "  Optional parameters:\n"
           "\t--size [size]\t\t\tThe maximum chunk size (possible suffix: K,M,G), default is 4096M - backup only\n"
           "\t--compression [mode]\t\tEither 'gzip' (default) or 'none' - backup only\n"
           "\t--fstype [type]\t\t\tThe file system type, used to select the partclone engine (default is ext4)\n"
           "\t--engine \"cmd %%s\"\t\tUse this command instead of partclone, %%s is replaced by the device path.\n"
           "\t                    \t\tThe command must write the image to its standard output (backup) or read it from its standard input (restore)\n"
           "\t--image-file\t\t\tThe devices are plain image files (no /dev/ prefix and super user privileges required)\n"
           "\t--yes\t\t\t\tDon't ask for confirmation before restoring\n"
           "\t--log-file path\t\t\tThe log file to use for restore and verify (backup always logs to dir/" BACKUP_LOG_NAME ")\n"
           "\t--verbose\t\t\tEnable verbosity\n\n"
           "Exit code is 0 on success, 2 for invalid arguments, 128 + signal number when interrupted, and 1 for any other failure\n");
    return error.size() ? BadArgument : EXIT_SUCCESS;
}

bool getOptionParameters(const Strings::StringArray & options, const Strings::FastString & option, Strings::StringArray & params)
{
    params.Clear();
    size_t optionPos = options.indexOf("--" + option);
    if (optionPos != options.getSize())
    {
        // Find the next option in the argument list
        size_t nextArg = options.lookUp("--", optionPos + 1);
        params = options.Extract(optionPos + 1, nextArg);
        return true;
    }
    return false;
}

int checkOption(const Strings::StringArray & options, const Strings::FastString & option, bool numeric = false)
{
    Strings::StringArray param;
    if (getOptionParameters(options, option, param))
    {
        if (param.getSize() != 1) return showHelpMessage("Invalid number of argument for --" + option);
        Strings::FastString optionValue = Strings::Trimmed(param[0]);
        if (numeric && (optionValue.empty() || Strings::invFindAnyChar(optionValue, "0123456789KMG") != -1))
            return showHelpMessage("Expecting numerical value (accepted also K, M or G suffix) for: " + option);
        optionsMap.storeValue(option, optionValue, true);
        return 1;
    }
    return -1;
}

/** Parse a size like "4096M", return 0 if invalid */
uint64 parseNumericSuffixed(const Strings::FastString & option)
{
    if (option.empty()) return 0;
    uint64 factor = 1;
    const char suffix = option[option.size() - 1];
    if (suffix == 'K') factor = 1024;
    if (suffix == 'M') factor = 1024 * 1024;
    if (suffix == 'G') factor = 1024 * 1024 * 1024;

    uint64 parsed = 0;
    if (!Strings::parseUnsigned(factor == 1 ? option : option.substr(0, option.size() - 1), parsed)) return 0;
    if (parsed > (uint64)-1 / factor) return 0;
    return parsed * factor;
}

int handleAction(const Strings::StringArray & options, const Strings::FastString & action)
{
    Strings::StringArray params;
    if (!getOptionParameters(options, action, params)) return BailOut;

    Parcel::Session::Options opts;
    if (action == "backup")
    {
        if (params.getSize() < 2) return showHelpMessage("Bad argument for backup, expecting the backup directory and at least one device");
        opts.direction = Parcel::Session::Backup;
        opts.devices = params.Extract(1, params.getSize());
    }
    else if (action == "restore")
    {
        if (params.getSize() != 2) return showHelpMessage("Bad argument for restore, expecting the backup and the destination device");
        opts.direction = Parcel::Session::Restore;
        opts.devices = params.Extract(1, 2);
    }
    else
    {
        if (params.getSize() != 1) return showHelpMessage("Bad argument for verify, expecting the backup");
        opts.direction = Parcel::Session::Verify;
    }
    opts.backupPath = params[0];

    if (optionsMap["size"])
    {
        opts.maxChunkSize = parseNumericSuffixed(*optionsMap["size"]);
        if (!opts.maxChunkSize) return showHelpMessage("Bad argument for size, expecting a non zero size like 4096M");
    }
    if (optionsMap["compression"])
    {
        if (*optionsMap["compression"] == "gzip") opts.compression = Parcel::CompressGZip;
        else if (*optionsMap["compression"] == "none") opts.compression = Parcel::CompressNone;
        else return showHelpMessage("Bad argument for compression (none of: gzip, none)");
    }
    if (optionsMap["fstype"]) opts.fsType = *optionsMap["fstype"];
    if (optionsMap["engine"]) opts.engineCommand = *optionsMap["engine"];
    if (optionsMap["log-file"]) opts.logFile = *optionsMap["log-file"];
    opts.imageFile = options.Contains("--image-file");
    opts.assumeYes = options.Contains("--yes");

    Parcel::Session session(opts);
    return session.run();
}


// Test helpers
///////////////////////////////////////////////////////////////////////////

namespace
{
    typedef Parcel::String String;

    /** Create a fresh directory for a test */
    String makeTestDir(const char * name)
    {
        String pattern = Strings::Print("/tmp/parcel-%s-XXXXXX", name);
        if (!mkdtemp(&pattern[0])) return "";
        return pattern;
    }
    /** Remove a test directory (and the files in it) */
    void removeTestDir(const String & path)
    {
        if (path.empty()) return;
        File::DirectoryIterator iter = File::General::listFilesIn(path);
        String name;
        Strings::StringArray names;
        while (iter.getNextFileName(name)) names.Append(name);
        for (size_t i = 0; i < names.getSize(); i++)
        {
            File::Info info(path + PathSeparator + names[i]);
            if (info.isDir()) removeTestDir(info.getFullPath());
            else info.remove();
        }
        File::Info(path).remove();
    }
    /** Get some deterministic data that does not compress well */
    String makeData(const size_t size, uint32 seed)
    {
        String data(size, '\0');
        for (size_t i = 0; i < size; i++)
        {
            seed = seed * 1103515245 + 12345;
            data[i] = (char)(seed >> 16);
        }
        return data;
    }
    bool writeFile(const String & path, const String & content)
    {
        Stream::OutputFileStream file(path);
        return file.isOpen() && file.write(content) && file.flush();
    }
    bool readFile(const String & path, String & content)
    {
        content.clear();
        Stream::InputFileStream file(path);
        Stream::OutputStringStream out(content);
        return file.isOpen() && Stream::copyStream(file, out);
    }
    /** Write the data in pieces of the given size */
    bool writeInPieces(Parcel::ChunkWriter & writer, const String & data, const size_t piece)
    {
        for (size_t pos = 0; pos < data.size(); pos += piece)
        {
            const size_t size = min(piece, data.size() - pos);
            if (writer.write(data.data() + pos, size) != (uint64)size) return false;
        }
        return true;
    }
    /** Read the whole stream */
    bool readAll(const Stream::InputStream & reader, String & content)
    {
        content.clear();
        Stream::OutputStringStream out(content);
        char buffer[37];
        while (true)
        {
            uint64 ret = reader.read(buffer, sizeof(buffer));
            if (ret == (uint64)-1) return false;
            if (!ret) return true;
            if (out.write(buffer, ret) != ret) return false;
        }
    }
    String sha256Of(const String & data)
    {
        Crypto::OSSL_SHA256 hasher;
        uint8 digest[Crypto::OSSL_SHA256::DigestSize];
        hasher.Hash((const uint8*)data.data(), (uint32)data.size());
        hasher.Finalize(digest);
        return Strings::toHex(digest, sizeof(digest));
    }
    Strings::StringArray makeCommand(const char * a, const char * b = 0, const char * c = 0, const char * d = 0)
    {
        Strings::StringArray args;
        const char * all[] = { a, b, c, d };
        for (size_t i = 0; i < ArrSz(all) && all[i]; i++) args.Append(all[i]);
        return args;
    }

    /** A stream that fails with ENOSPC once the given amount is written */
    class FullDiskStream : public File::BaseStream
    {
        File::Stream    file;
        uint64          budget;
        int             lastError;

    public:
        virtual int read(char * buffer, int length) { return file.read(buffer, length); }
        virtual int write(const char * buffer, int length)
        {
            if ((uint64)length > budget)
            {
                if (budget) file.write(buffer, (int)budget);
                budget = 0; lastError = ENOSPC;
                return -1;
            }
            budget -= (uint64)length;
            return file.write(buffer, length);
        }
        virtual bool flush() { return file.flush(); }
        virtual bool sync() { return file.sync(); }
        virtual uint64 getSize() const { return file.getSize(); }
        virtual uint64 getPosition() const { return file.getPosition(); }
        virtual bool setPosition(const uint64 offset) { return file.setPosition(offset); }
        virtual bool endOfStream() const { return file.endOfStream(); }
        virtual int getLastError() const { return lastError ? lastError : file.getLastError(); }

        FullDiskStream(const String & path, const uint64 budget) : file(path, "wb"), budget(budget), lastError(0) {}
    };

    /** A writer whose destination gets full while writing the given chunk */
    class FullDiskWriter : public Parcel::ChunkWriter
    {
        uint32 failingChunk;
        uint64 budget;
        uint32 created;

    protected:
        File::BaseStream * openChunk(const String & path)
        {
            if (created++ == failingChunk) return new FullDiskStream(path, budget);
            return ChunkWriter::openChunk(path);
        }
    public:
        FullDiskWriter(const uint32 failingChunk, const uint64 budget) : failingChunk(failingChunk), budget(budget), created(0) {}
    };

    /** A backup session whose destination gets full while writing the given chunk */
    class FullDiskSession : public Parcel::Session
    {
        uint32 failingChunk;
        uint64 budget;

    protected:
        Parcel::ChunkWriter * createWriter() { return new FullDiskWriter(failingChunk, budget); }
    public:
        FullDiskSession(const Parcel::Session::Options & opts, const uint32 failingChunk, const uint64 budget)
            : Parcel::Session(opts), failingChunk(failingChunk), budget(budget) {}
    };

    /** Cancel a bridge from another thread, after a delay */
    struct DelayedCancel
    {
        Parcel::StreamBridge &  bridge;
        uint32                  delay;
        void run() { Threading::Thread::Sleep(delay); bridge.cancel(); }
        DelayedCancel(Parcel::StreamBridge & bridge, const uint32 delay) : bridge(bridge), delay(delay) {}
    };

    /** Run a session in a thread */
    struct SessionRunner
    {
        Parcel::Session &   session;
        int                 result;
        void run() { result = session.run(); }
        SessionRunner(Parcel::Session & session) : session(session), result(-1) {}
    };

    /** Get the options for a session on image files */
    Parcel::Session::Options imageOptions(const Parcel::Session::Direction direction, const String & backupPath, const String & device, const String & engine)
    {
        Parcel::Session::Options opts;
        opts.direction = direction;
        opts.backupPath = backupPath;
        if (device.size()) opts.devices.Append(device);
        opts.engineCommand = engine;
        opts.imageFile = true;
        opts.assumeYes = true;
        return opts;
    }
}

#define ERR(Msg, ...) { fprintf(stderr, Msg "\n", ##__VA_ARGS__); return -1; }
#define CHECK(Err, Msg) { Parcel::Error _e = (Err); if (_e) ERR(Msg ": %s", _e.describe().c_str()); }

int testChunks()
{
    String dir = makeTestDir("chunks");
    if (dir.empty()) ERR("Can't create the test directory");
    const String data = makeData(250, 1);

    Parcel::ChunkWriter writer;
    CHECK(writer.open(dir, "test", 100, Parcel::CompressNone), "Opening the writer failed");
    if (!writeInPieces(writer, data, 7)) ERR("Writing failed: %s", writer.getError().describe().c_str());
    CHECK(writer.close(), "Closing the writer failed");

    const Parcel::Manifest & manifest = writer.getManifest();
    if (manifest.chunks.size() != 3) ERR("Expected 3 chunks, got %u", (unsigned)manifest.chunks.size());
    const uint64 expected[] = { 100, 100, 50 };
    for (size_t i = 0; i < 3; i++)
    {
        const Parcel::ChunkDescriptor & chunk = manifest.chunks[i];
        if (chunk.length != expected[i]) ERR("Bad chunk %u length: " PF_LLU, (unsigned)i, (unsigned long long)chunk.length);
        if (i && manifest.chunks[i-1].offset + manifest.chunks[i-1].length != chunk.offset) ERR("Chunks %u is not contiguous", (unsigned)i);
        if (chunk.fileName != Strings::Print("test.%06u", (unsigned)i)) ERR("Bad chunk name %s", chunk.fileName.c_str());
        if (chunk.checksum != sha256Of(data.substr((size_t)chunk.offset, (size_t)chunk.length))) ERR("Bad chunk %u checksum", (unsigned)i);
    }

    // The manifest on disk must match
    String content;
    if (!readFile(dir + "/test.manifest", content)) ERR("Can't read the manifest");
    if (!Strings::startsWith(content, "parcel-manifest 1\nstream test\ncompression none\nchunksize 100\n")) ERR("Bad manifest header: %s", content.c_str());
    if (!Strings::endsWith(content, "end 250 3\n")) ERR("Bad manifest end: %s", content.c_str());

    Parcel::ChunkReader reader;
    CHECK(reader.open(dir + "/test.manifest"), "Opening the reader failed");
    String result;
    if (!readAll(reader, result)) ERR("Reading failed: %s", reader.getError().describe().c_str());
    if (result != data) ERR("Round trip failed (%u bytes read)", (unsigned)result.size());
    if (!reader.endReached()) ERR("The reader should be at end");
    reader.close();

    removeTestDir(dir);
    fprintf(stderr, "Success\n");
    return EXIT_SUCCESS;
}

int testEmpty()
{
    String dir = makeTestDir("empty");
    if (dir.empty()) ERR("Can't create the test directory");

    Parcel::ChunkWriter writer;
    CHECK(writer.open(dir, "empty", 100, Parcel::CompressNone), "Opening the writer failed");
    CHECK(writer.close(), "Closing the writer failed");
    if (writer.getManifest().chunks.size() != 1 || writer.getManifest().chunks[0].length != 0) ERR("Expected a single empty chunk");
    if (!File::Info(dir + "/empty.000000").isFile()) ERR("The empty chunk file is missing");

    Parcel::ChunkReader reader;
    CHECK(reader.open(dir), "Opening the reader from the directory failed");
    String result;
    if (!readAll(reader, result)) ERR("Reading failed: %s", reader.getError().describe().c_str());
    if (result.size()) ERR("Expected an empty stream");

    // Empty compressed stream must round trip too
    Parcel::ChunkWriter gzWriter;
    CHECK(gzWriter.open(dir, "empty.gz", 100, Parcel::CompressGZip), "Opening the compressed writer failed");
    {
        Parcel::ChunkSink sink(gzWriter, Parcel::CompressGZip);
        CHECK(sink.finish(), "Finishing the compressed stream failed");
    }
    Parcel::ChunkReader gzReader;
    CHECK(gzReader.open(dir + "/empty.gz.manifest"), "Opening the compressed reader failed");
    Parcel::ChunkSource source(gzReader);
    uint8 buffer[16];
    if (source.read(buffer, sizeof(buffer)) != 0) ERR("Expected an empty decompressed stream: %s", source.getError().describe().c_str());

    removeTestDir(dir);
    fprintf(stderr, "Success\n");
    return EXIT_SUCCESS;
}

int testMultiple()
{
    String dir = makeTestDir("multiple");
    if (dir.empty()) ERR("Can't create the test directory");
    const String data = makeData(300, 2);

    Parcel::ChunkWriter writer;
    CHECK(writer.open(dir, "exact", 100, Parcel::CompressNone), "Opening the writer failed");
    if (!writeInPieces(writer, data, 100)) ERR("Writing failed: %s", writer.getError().describe().c_str());
    CHECK(writer.close(), "Closing the writer failed");
    if (writer.getManifest().chunks.size() != 3) ERR("Expected 3 chunks (no empty trailing chunk), got %u", (unsigned)writer.getManifest().chunks.size());
    if (File::Info(dir + "/exact.000003").doesExist()) ERR("An empty trailing chunk was created");

    // Reference by a chunk file
    Parcel::ChunkReader reader;
    CHECK(reader.open(dir + "/exact.000001"), "Opening the reader from a chunk failed");
    String result;
    if (!readAll(reader, result) || result != data) ERR("Round trip failed: %s", reader.getError().describe().c_str());

    // Two manifests in the same directory can't be resolved
    Parcel::ChunkWriter other;
    CHECK(other.open(dir, "other", 100, Parcel::CompressNone), "Opening the second writer failed");
    CHECK(other.close(), "Closing the second writer failed");
    Parcel::ChunkReader ambiguous;
    Parcel::Error err = ambiguous.open(dir);
    if (err.kind != Parcel::ValidationError) ERR("Expected a validation error with 2 manifests, got %s", err.describe().c_str());

    // And the manifest can't be overwritten
    Parcel::ChunkWriter again;
    err = again.open(dir, "exact", 100, Parcel::CompressNone);
    if (err.kind != Parcel::ValidationError) ERR("Expected a validation error for an existing manifest, got %s", err.describe().c_str());

    // Nor a chunk left without its manifest
    if (!writeFile(dir + "/leftover.000000", "old")) ERR("Can't write the leftover chunk");
    Parcel::ChunkWriter leftover;
    err = leftover.open(dir, "leftover", 100, Parcel::CompressNone);
    if (err.kind != Parcel::IOError) ERR("Expected an error for an existing chunk, got %s", err.describe().c_str());
    String old;
    if (!readFile(dir + "/leftover.000000", old) || old != "old") ERR("The existing chunk was overwritten");

    removeTestDir(dir);
    fprintf(stderr, "Success\n");
    return EXIT_SUCCESS;
}

int testCorrupt()
{
    String dir = makeTestDir("corrupt");
    if (dir.empty()) ERR("Can't create the test directory");
    const String data = makeData(250, 3);

    Parcel::ChunkWriter writer;
    CHECK(writer.open(dir, "bad", 100, Parcel::CompressNone), "Opening the writer failed");
    if (!writeInPieces(writer, data, 64)) ERR("Writing failed");
    CHECK(writer.close(), "Closing the writer failed");

    // Length mismatch is found on opening
    String chunk;
    if (!readFile(dir + "/bad.000001", chunk)) ERR("Can't read chunk");
    if (!writeFile(dir + "/bad.000001", chunk + "x")) ERR("Can't write chunk");
    Parcel::ChunkReader reader;
    Parcel::Error err = reader.open(dir + "/bad.manifest");
    if (err.kind != Parcel::ManifestCorruptError) ERR("Expected a corrupt manifest for a longer chunk, got %s", err.describe().c_str());

    // Same length, different content is found when reading
    chunk[10] = (char)(chunk[10] ^ 0x55);
    if (!writeFile(dir + "/bad.000001", chunk)) ERR("Can't write chunk");
    CHECK(reader.open(dir + "/bad.manifest"), "Opening with a modified chunk failed");
    String result;
    if (readAll(reader, result)) ERR("Reading a modified chunk should fail");
    if (reader.getError().kind != Parcel::ManifestCorruptError) ERR("Expected a checksum error, got %s", reader.getError().describe().c_str());
    if (result.size() >= 200) ERR("Data from after the bad chunk was produced");

    // Syntax and structure errors
    struct { const char * content; const char * what; } manifests[] = {
        { "parcel-manifest 2\nstream bad\ncompression none\nchunksize 100\nend 0 0\n", "unknown version" },
        { "parcel-manifest 1\nstream bad\ncompression none\nchunksize 100\n", "no end record" },
        { "parcel-manifest 1\nstream bad\ncompression none\nchunksize 100\nchunk 1 bad.000001 0 100 %s\nend 100 1\n", "index out of sequence" },
        { "parcel-manifest 1\nstream bad\ncompression none\nchunksize 100\nchunk 0 bad.000000 0 100 %s\nchunk 1 bad.000001 90 100 %s\nend 190 2\n", "overlap" },
        { "parcel-manifest 1\nstream bad\ncompression none\nchunksize 50\nchunk 0 bad.000000 0 100 %s\nend 100 1\n", "chunk larger than the size" },
        { "parcel-manifest 1\nstream bad\ncompression none\nchunksize 100\nchunk 0 bad.000000 0 100 %s\nend 120 1\n", "bad total" },
        { "parcel-manifest 1\nstream bad\ncompression lzma\nchunksize 100\nend 0 0\n", "unknown compression" },
    };
    const String digest = sha256Of(data.substr(0, 100));
    for (size_t i = 0; i < ArrSz(manifests); i++)
    {
        if (!writeFile(dir + "/bad.manifest", Strings::Print(manifests[i].content, digest.c_str(), digest.c_str()))) ERR("Can't write manifest");
        err = reader.open(dir + "/bad.manifest");
        if (err.kind != Parcel::ManifestCorruptError) ERR("Expected a corrupt manifest for %s, got %s", manifests[i].what, err.describe().c_str());
    }

    removeTestDir(dir);
    fprintf(stderr, "Success\n");
    return EXIT_SUCCESS;
}

int testMissing()
{
    String dir = makeTestDir("missing");
    if (dir.empty()) ERR("Can't create the test directory");
    const String image = dir + "/disk.img", restored = dir + "/restored.img", backup = dir + "/backup";
    if (!writeFile(image, makeData(250, 4))) ERR("Can't write the image");

    Parcel::Session::Options opts = imageOptions(Parcel::Session::Backup, backup, image, "cat %s");
    opts.maxChunkSize = 100;
    opts.compression = Parcel::CompressNone;
    {
        Parcel::Session session(opts);
        int ret = session.run();
        if (ret) ERR("Backup failed with %d: %s", ret, session.getError().describe().c_str());
    }
    const String stream = Parcel::Manifest::getStreamName(image, "ext4", Parcel::CompressNone);
    if (!File::Info(backup + "/" + Parcel::Manifest::getChunkName(stream, 1)).remove()) ERR("Can't remove the chunk");

    // The restore must fail before writing anything
    Parcel::Session session(imageOptions(Parcel::Session::Restore, backup, restored, "dd of=%s"));
    int ret = session.run();
    if (ret != 2) ERR("Expected exit code 2, got %d", ret);
    if (session.getError().kind != Parcel::ManifestCorruptError) ERR("Expected a corrupt manifest, got %s", session.getError().describe().c_str());
    if (File::Info(restored).doesExist()) ERR("The destination was written");

    removeTestDir(dir);
    fprintf(stderr, "Success\n");
    return EXIT_SUCCESS;
}

int testSpace()
{
    String dir = makeTestDir("space");
    if (dir.empty()) ERR("Can't create the test directory");
    const String data = makeData(250, 5);

    // The destination is full while writing the third chunk
    FullDiskWriter writer(2, 10);
    CHECK(writer.open(dir, "full", 100, Parcel::CompressNone), "Opening the writer failed");
    if (writeInPieces(writer, data, 30)) ERR("Writing should have failed");
    if (writer.getError().kind != Parcel::SpaceExceededError) ERR("Expected a space error, got %s", writer.getError().describe().c_str());
    if (!writer.close()) ERR("Closing should report the error");
    if (writer.getManifest().finalized) ERR("The manifest must not be finalized");

    // The manifest on disk lists the 2 closed chunks, and they are valid
    String content;
    if (!readFile(dir + "/full.manifest", content)) ERR("Can't read the manifest");
    Parcel::Manifest manifest;
    CHECK(manifest.parse(content), "Parsing the unfinished manifest failed");
    if (manifest.finalized || manifest.chunks.size() != 2) ERR("Expected 2 chunks in an unfinished manifest");
    for (size_t i = 0; i < 2; i++)
    {
        String chunk;
        if (!readFile(dir + "/" + manifest.chunks[i].fileName, chunk)) ERR("Can't read chunk %u", (unsigned)i);
        if (chunk != data.substr(i * 100, 100) || sha256Of(chunk) != manifest.chunks[i].checksum) ERR("Chunk %u is not valid", (unsigned)i);
    }

    // And it's not accepted for restore
    Parcel::ChunkReader reader;
    if (reader.open(dir).kind != Parcel::ManifestCorruptError) ERR("An unfinished manifest must be rejected");

    // The same through a complete backup session
    const String image = dir + "/disk.img", backup = dir + "/backup";
    if (!writeFile(image, data)) ERR("Can't write the image");
    Parcel::Session::Options opts = imageOptions(Parcel::Session::Backup, backup, image, "cat %s");
    opts.maxChunkSize = 100;
    opts.compression = Parcel::CompressNone;
    {
        FullDiskSession session(opts, 2, 10);
        int ret = session.run();
        if (ret != 1 || session.getState() != Parcel::Session::Failed) ERR("Expected the backup to fail with 1, got %d", ret);
        if (session.getError().kind != Parcel::SpaceExceededError || session.getError().component != "ChunkWriter") ERR("Expected the chunk writer's space error, got %s", session.getError().describe().c_str());
    }
    String log;
    if (!readFile(backup + "/" BACKUP_LOG_NAME, log) || log.find("terminal Failed ChunkWriter: SpaceExceededError") == String::npos) ERR("Missing terminal record in the log: %s", log.c_str());
    const String stream = Parcel::Manifest::getStreamName(image, "ext4", Parcel::CompressNone);
    if (!readFile(backup + "/" + Parcel::Manifest::getManifestName(stream), content)) ERR("Can't read the session's manifest");
    CHECK(manifest.parse(content), "Parsing the session's manifest failed");
    if (manifest.finalized || manifest.chunks.size() != 2) ERR("Expected 2 chunks in the session's unfinished manifest");

    removeTestDir(dir);
    fprintf(stderr, "Success\n");
    return EXIT_SUCCESS;
}

int testBridge()
{
    String dir = makeTestDir("bridge");
    if (dir.empty()) ERR("Can't create the test directory");
    const String data = makeData(1024 * 1024 + 123, 6);
    const String image = dir + "/source.img", restored = dir + "/restored.img";
    if (!writeFile(image, data)) ERR("Can't write the image");

    // Backup with compression
    {
        Parcel::ChunkWriter writer;
        CHECK(writer.open(dir, "source.gz", 65536, Parcel::CompressGZip), "Opening the writer failed");
        Parcel::ChunkSink sink(writer, Parcel::CompressGZip);
        Parcel::ProcessEndpoint engine(makeCommand("cat", image.c_str()));
        Parcel::StreamBridge bridge;
        CHECK(bridge.run(engine, sink), "Backup through the bridge failed");
        if (bridge.getTransferred() != data.size()) ERR("Transferred " PF_LLU " bytes", (unsigned long long)bridge.getTransferred());
        if (!writer.getManifest().finalized || writer.getManifest().chunks.size() < 2) ERR("Expected a finalized manifest with many chunks");
    }
    // And restore
    {
        Parcel::ChunkReader reader;
        CHECK(reader.open(dir + "/source.gz.000000"), "Opening the reader failed");
        Parcel::ChunkSource source(reader);
        Parcel::ProcessEndpoint engine(makeCommand("dd", ("of=" + restored).c_str()));
        Parcel::StreamBridge bridge;
        CHECK(bridge.run(engine, source), "Restore through the bridge failed");
    }
    String result;
    if (!readFile(restored, result) || result != data) ERR("Round trip through the engine failed");

    removeTestDir(dir);
    fprintf(stderr, "Success\n");
    return EXIT_SUCCESS;
}

int testBridgeFailure()
{
    String dir = makeTestDir("bridgefail");
    if (dir.empty()) ERR("Can't create the test directory");

    // The chunk side fails while the engine produces an endless stream: the engine must be stopped and the chunk error reported
    {
        FullDiskWriter writer(2, 1000);
        CHECK(writer.open(dir, "zero", 65536, Parcel::CompressNone), "Opening the writer failed");
        Parcel::ChunkSink sink(writer, Parcel::CompressNone);
        Parcel::ProcessEndpoint engine(makeCommand("cat", "/dev/zero"));
        Parcel::StreamBridge bridge;
        Parcel::Error err = bridge.run(engine, sink);
        if (err.kind != Parcel::SpaceExceededError || err.component != "ChunkWriter") ERR("Expected the chunk writer's error, got %s", err.describe().c_str());
        if (engine.getPID()) ERR("The engine is still running");
        if (writer.getManifest().finalized) ERR("The manifest must not be finalized");
    }

    // The engine stops reading before the end of the stream
    {
        const String data = makeData(1024 * 1024, 7);
        Parcel::ChunkWriter writer;
        CHECK(writer.open(dir, "short", 1024 * 1024, Parcel::CompressNone), "Opening the writer failed");
        if (!writeInPieces(writer, data, 4096)) ERR("Writing failed");
        CHECK(writer.close(), "Closing failed");

        Parcel::ChunkReader reader;
        CHECK(reader.open(dir + "/short.manifest"), "Opening the reader failed");
        Parcel::ChunkSource source(reader);
        Parcel::ProcessEndpoint engine(makeCommand("dd", "of=/dev/null", "bs=10", "count=1"));
        Parcel::StreamBridge bridge;
        Parcel::Error err = bridge.run(engine, source);
        if (err.kind != Parcel::BrokenPipeError) ERR("Expected a broken pipe, got %s", err.describe().c_str());
    }

    // An engine that can't be executed
    {
        Parcel::ChunkWriter writer;
        CHECK(writer.open(dir, "noexec", 100, Parcel::CompressNone), "Opening the writer failed");
        Parcel::ChunkSink sink(writer, Parcel::CompressNone);
        Parcel::ProcessEndpoint engine(makeCommand("/nonexistent/partclone.ext4"));
        Parcel::StreamBridge bridge;
        Parcel::Error err = bridge.run(engine, sink);
        if (err.kind != Parcel::ChildProcessError || err.exitCode != 127) ERR("Expected the engine to fail with 127, got %s", err.describe().c_str());
    }

    removeTestDir(dir);
    fprintf(stderr, "Success\n");
    return EXIT_SUCCESS;
}

int testChild()
{
    String dir = makeTestDir("child");
    if (dir.empty()) ERR("Can't create the test directory");

    {
        Parcel::ChunkWriter writer;
        CHECK(writer.open(dir, "fail", 100, Parcel::CompressNone), "Opening the writer failed");
        Parcel::ChunkSink sink(writer, Parcel::CompressNone);
        Parcel::ProcessEndpoint engine(makeCommand("sh", "-c", "echo partial; echo 'device is busy' >&2; exit 3"));
        Parcel::StreamBridge bridge;
        Parcel::Error err = bridge.run(engine, sink);
        if (err.kind != Parcel::ChildProcessError || err.exitCode != 3 || err.signalled) ERR("Expected the engine to fail with 3, got %s", err.describe().c_str());
        if (engine.getExitCode() != 3 || engine.wasSignalled()) ERR("Bad engine exit status");
        if (err.diagnostic.find("device is busy") == String::npos) ERR("The engine error output was not captured: %s", err.diagnostic.c_str());
        if (writer.getManifest().finalized) ERR("The manifest must not be finalized");
    }
    {
        Parcel::ChunkWriter writer;
        CHECK(writer.open(dir, "killed", 100, Parcel::CompressNone), "Opening the writer failed");
        Parcel::ChunkSink sink(writer, Parcel::CompressNone);
        Parcel::ProcessEndpoint engine(makeCommand("sh", "-c", "kill -9 $$"));
        Parcel::StreamBridge bridge;
        Parcel::Error err = bridge.run(engine, sink);
        if (err.kind != Parcel::ChildProcessError || !err.signalled || err.exitCode != SIGKILL) ERR("Expected the engine to be killed, got %s", err.describe().c_str());
        if (!engine.wasSignalled() || engine.wasKilled()) ERR("The engine killed itself, we did not");
    }

    removeTestDir(dir);
    fprintf(stderr, "Success\n");
    return EXIT_SUCCESS;
}

int testLogger()
{
    String dir = makeTestDir("logger");
    if (dir.empty()) ERR("Can't create the test directory");
    const String path = dir + "/progress.log";
    const uint64 interval = Parcel::ProgressLogger::CursorInterval;
    {
        Parcel::ProgressLogger logger(path);
        CHECK(logger.checkOpened(), "Opening the log failed");
        logger.recordCursor(1234);
        logger.recordChunkBoundary(1, 100);
        logger.bytesTransferred(interval - 1);
        logger.bytesTransferred(interval + 5);
        logger.bytesTransferred(interval + 10);

        // Log messages go to the file too
        Logger::OutputSink & previous = Logger::getDefaultSink();
        Logger::setDefaultSink(&logger);
        Logger::log(Logger::Process, "engine: hello");
        Logger::log(Logger::Dump, "not in the file");
        Logger::setDefaultSink(&previous);

        logger.recordTerminal("Succeeded", "done");
    }
    String content;
    if (!readFile(path, content)) ERR("Can't read the log");
    const char * expected[] = { "cursor 1234\n", "chunk 1 closed length 100\n", "INFO     engine: hello\n", "terminal Succeeded done\n" };
    for (size_t i = 0; i < ArrSz(expected); i++)
        if (content.find(expected[i]) == String::npos) ERR("Missing '%s' in log: %s", expected[i], content.c_str());
    if (content.find(Strings::Print("cursor " PF_LLU "\n", (unsigned long long)(interval + 5))) == String::npos) ERR("Missing the periodic cursor record");
    if (content.find(Strings::Print("cursor " PF_LLU "\n", (unsigned long long)(interval + 10))) != String::npos) ERR("Too many cursor records");
    if (content.find(Strings::Print("cursor " PF_LLU "\n", (unsigned long long)(interval - 1))) != String::npos) ERR("Early cursor record");
    if (content.find("not in the file") != String::npos) ERR("Masked message was logged");
    // The line format is "YYYY-MM-DD HH:MM:SS LEVEL    message"
    if (content.size() < 20 || content[4] != '-' || content[7] != '-' || content[10] != ' ' || content[13] != ':' || content[19] != ' ') ERR("Bad line format: %s", content.c_str());

    // A write failure disables the log file, without failing the session
    {
        Parcel::ProgressLogger full("/dev/full");
        CHECK(full.checkOpened(), "Opening /dev/full failed");
        if (full.hasFailed()) ERR("The log should not be failed before writing");
        full.recordCursor(1);
        if (!full.hasFailed()) ERR("Writing to a full device should disable the log");
        full.recordTerminal("Succeeded", "done");
    }

    Parcel::ProgressLogger bad(dir + "/missing/progress.log");
    if (bad.checkOpened().kind != Parcel::ValidationError) ERR("Opening a log in a missing directory should fail");

    removeTestDir(dir);
    fprintf(stderr, "Success\n");
    return EXIT_SUCCESS;
}

int testLock()
{
    String dir = makeTestDir("lock");
    if (dir.empty()) ERR("Can't create the test directory");
    const String image = dir + "/disk.img";
    if (!writeFile(image, makeData(10, 8))) ERR("Can't write the image");

    Parcel::DirectoryLock first, second;
    CHECK(first.acquire(dir), "Locking failed");
    if (second.acquire(dir).kind != Parcel::ValidationError) ERR("Locking twice should fail");
    if (!first.isLocked() || second.isLocked()) ERR("Bad lock state");

    // A backup in a locked directory is refused
    Parcel::Session session(imageOptions(Parcel::Session::Backup, dir, image, "cat %s"));
    int ret = session.run();
    if (ret != 2 || session.getState() != Parcel::Session::Failed) ERR("Expected the backup to fail validation, got %d", ret);
    if (File::Info(dir + "/" + Parcel::Manifest::getManifestName(Parcel::Manifest::getStreamName(image, "ext4", Parcel::CompressGZip))).doesExist()) ERR("A manifest was created");

    first.release();
    if (first.isLocked()) ERR("The lock was not released");
    CHECK(second.acquire(dir), "Locking after release failed");
    second.release();

    removeTestDir(dir);
    fprintf(stderr, "Success\n");
    return EXIT_SUCCESS;
}

int testRoundtrip()
{
    String dir = makeTestDir("roundtrip");
    if (dir.empty()) ERR("Can't create the test directory");
    const String backup = dir + "/backup", first = dir + "/first.img", second = dir + "/second.img", restored = dir + "/restored.img";
    const String firstData = makeData(300000, 9), secondData = makeData(65536 * 2, 10);
    if (!writeFile(first, firstData) || !writeFile(second, secondData)) ERR("Can't write the images");

    // Two devices in one backup, the directory is created
    Parcel::Session::Options opts = imageOptions(Parcel::Session::Backup, backup, first, "cat %s");
    opts.devices.Append(second);
    opts.maxChunkSize = 65536;
    {
        Parcel::Session session(opts);
        int ret = session.run();
        if (ret || session.getState() != Parcel::Session::Succeeded) ERR("Backup failed with %d: %s", ret, session.getError().describe().c_str());
        if (session.getCursor() != firstData.size() + secondData.size()) ERR("Bad cursor " PF_LLU, (unsigned long long)session.getCursor());
    }
    String log;
    if (!readFile(backup + "/" BACKUP_LOG_NAME, log)) ERR("Can't read the backup log");
    if (log.find("terminal Succeeded") == String::npos || log.find("chunk 0 closed length") == String::npos) ERR("Missing records in the backup log: %s", log.c_str());

    // Running it again must not overwrite anything
    {
        Parcel::Session session(opts);
        int ret = session.run();
        if (ret != 2) ERR("Expected a validation failure for an existing backup, got %d", ret);
    }

    // Check and restore the first device
    const String stream = Parcel::Manifest::getStreamName(first, "ext4", Parcel::CompressGZip);
    if (stream != "first.img.ext4-ptcl-img.gz") ERR("Bad stream name %s", stream.c_str());
    {
        Parcel::Session session(imageOptions(Parcel::Session::Verify, backup + "/" + Parcel::Manifest::getManifestName(stream), "", ""));
        int ret = session.run();
        if (ret) ERR("Verify failed with %d: %s", ret, session.getError().describe().c_str());
    }
    {
        Parcel::Session::Options restore = imageOptions(Parcel::Session::Restore, backup + "/" + Parcel::Manifest::getChunkName(stream, 0), restored, "dd of=%s");
        restore.logFile = dir + "/restore.log";
        Parcel::Session session(restore);
        int ret = session.run();
        if (ret || session.getState() != Parcel::Session::Succeeded) ERR("Restore failed with %d: %s", ret, session.getError().describe().c_str());
    }
    String result;
    if (!readFile(restored, result) || result != firstData) ERR("The restored image differs");
    if (!readFile(dir + "/restore.log", log) || log.find("terminal Succeeded") == String::npos) ERR("Missing terminal record in the restore log");

    // The backup directory holds 2 manifests, so it's not a valid reference
    {
        Parcel::Session session(imageOptions(Parcel::Session::Restore, backup, restored, "dd of=%s"));
        if (session.run() != 2) ERR("Restoring from an ambiguous directory should fail validation");
    }

    // Whitespaces in the device name can't end up in the manifest fields
    const String spaced = dir + "/my disk.img", spacedBackup = dir + "/spaced";
    const String spacedData = makeData(250, 14);
    if (!writeFile(spaced, spacedData)) ERR("Can't write the image");
    opts = imageOptions(Parcel::Session::Backup, spacedBackup, spaced, "cat %s");
    opts.maxChunkSize = 100;
    opts.compression = Parcel::CompressNone;
    {
        Parcel::Session session(opts);
        int ret = session.run();
        if (ret) ERR("Backup of an image with a space failed with %d: %s", ret, session.getError().describe().c_str());
    }
    const String spacedStream = Parcel::Manifest::getStreamName(spaced, "ext4", Parcel::CompressNone);
    if (spacedStream != "my-disk.img.ext4-ptcl-img") ERR("Bad stream name %s", spacedStream.c_str());
    {
        Parcel::ChunkReader reader;
        CHECK(reader.open(spacedBackup), "Opening the backup of an image with a space failed");
        if (!readAll(reader, result) || result != spacedData) ERR("Round trip of an image with a space failed");
    }

    removeTestDir(dir);
    fprintf(stderr, "Success\n");
    return EXIT_SUCCESS;
}

int testCancel()
{
    String dir = makeTestDir("cancel");
    if (dir.empty()) ERR("Can't create the test directory");
    const String image = dir + "/disk.img";
    if (!writeFile(image, makeData(10, 11))) ERR("Can't write the image");

    // The engine never ends
    Parcel::Session session(imageOptions(Parcel::Session::Backup, dir, image, "sleep 60"));
    SessionRunner runner(session);
    Threading::JobThread<SessionRunner> job(runner, &SessionRunner::run, "session");
    time_t start = time(NULL);
    if (!job.runJob()) ERR("Can't start the session thread");
    while (session.getState() == Parcel::Session::Validating) Threading::Thread::Sleep(10);
    Threading::Thread::Sleep(200);
    session.cancel();
    job.waitForJob();

    if (runner.result != 128 + SIGTERM) ERR("Expected exit code %d, got %d", 128 + SIGTERM, runner.result);
    if (session.getState() != Parcel::Session::Failed || session.getError().kind != Parcel::CancelledError) ERR("Expected a cancelled session, got %s", session.getError().describe().c_str());
    if (time(NULL) - start > 10) ERR("Cancelling took too long");

    // The manifest is left unfinished
    String content;
    Parcel::Manifest manifest;
    if (!readFile(dir + "/" + Parcel::Manifest::getManifestName(Parcel::Manifest::getStreamName(image, "ext4", Parcel::CompressGZip)), content)) ERR("Can't read the manifest");
    CHECK(manifest.parse(content), "Can't parse the manifest");
    if (manifest.finalized) ERR("The manifest must not be finalized");
    String log;
    if (!readFile(dir + "/" BACKUP_LOG_NAME, log) || log.find("terminal Failed") == String::npos || log.find("CancelledError") == String::npos) ERR("Missing terminal record in the log: %s", log.c_str());

    // An interrupted confirmation is a cancellation, not an invalid argument
    {
        Parcel::ChunkWriter writer;
        CHECK(writer.open(dir, "confirm", 100, Parcel::CompressNone), "Opening the writer failed");
        CHECK(writer.close(), "Closing the writer failed");
        Parcel::Session::Options opts = imageOptions(Parcel::Session::Restore, dir + "/confirm.manifest", image, "dd of=%s");
        opts.assumeYes = false;
        Parcel::Session restore(opts);
        restore.cancel();
        int ret = restore.run();
        if (ret != 128 + SIGTERM || restore.getError().kind != Parcel::CancelledError) ERR("Expected a cancelled restore, got %d: %s", ret, restore.getError().describe().c_str());
    }

    removeTestDir(dir);
    fprintf(stderr, "Success\n");
    return EXIT_SUCCESS;
}

int testStalled()
{
    String dir = makeTestDir("stalled");
    if (dir.empty()) ERR("Can't create the test directory");

    // The engine neither writes nor exits on SIGTERM
    {
        Parcel::ChunkWriter writer;
        CHECK(writer.open(dir, "silent", 100, Parcel::CompressNone), "Opening the writer failed");
        Parcel::ChunkSink sink(writer, Parcel::CompressNone);
        Parcel::ProcessEndpoint engine(makeCommand("sh", "-c", "trap '' TERM; sleep 15"));
        Parcel::StreamBridge bridge;
        DelayedCancel canceller(bridge, 300);
        Threading::JobThread<DelayedCancel> job(canceller, &DelayedCancel::run, "cancel");
        time_t start = time(NULL);
        if (!job.runJob()) ERR("Can't start the cancelling thread");
        Parcel::Error err = bridge.run(engine, sink);
        job.waitForJob();
        if (err.kind != Parcel::CancelledError) ERR("Expected a cancelled backup, got %s", err.describe().c_str());
        if (!engine.wasKilled() || engine.getPID()) ERR("The engine should have been killed");
        if (time(NULL) - start >= 10) ERR("Cancelling a silent engine took too long");
        if (writer.getManifest().finalized) ERR("The manifest must not be finalized");
    }

    // The engine never reads its input, and ignores SIGTERM
    {
        const String data = makeData(1024 * 1024, 13);
        Parcel::ChunkWriter writer;
        CHECK(writer.open(dir, "unread", 1024 * 1024, Parcel::CompressNone), "Opening the writer failed");
        if (!writeInPieces(writer, data, 4096)) ERR("Writing failed");
        CHECK(writer.close(), "Closing failed");

        Parcel::ChunkReader reader;
        CHECK(reader.open(dir + "/unread.manifest"), "Opening the reader failed");
        Parcel::ChunkSource source(reader);
        Parcel::ProcessEndpoint engine(makeCommand("sh", "-c", "trap '' TERM; sleep 15 >/dev/null"));
        Parcel::StreamBridge bridge;
        DelayedCancel canceller(bridge, 300);
        Threading::JobThread<DelayedCancel> job(canceller, &DelayedCancel::run, "cancel");
        time_t start = time(NULL);
        if (!job.runJob()) ERR("Can't start the cancelling thread");
        Parcel::Error err = bridge.run(engine, source);
        job.waitForJob();
        if (err.kind != Parcel::CancelledError) ERR("Expected a cancelled restore, got %s", err.describe().c_str());
        if (!engine.wasKilled()) ERR("The engine should have been killed");
        if (time(NULL) - start >= 10) ERR("Cancelling an engine not reading took too long");
        if (bridge.getTransferred() >= data.size()) ERR("The engine should not have received everything");
    }

    removeTestDir(dir);
    fprintf(stderr, "Success\n");
    return EXIT_SUCCESS;
}

int testOptions()
{
    if (parseNumericSuffixed("4096M") != (uint64)4096 * 1024 * 1024) ERR("Bad parsing of 4096M");
    if (parseNumericSuffixed("100") != 100 || parseNumericSuffixed("2K") != 2048 || parseNumericSuffixed("1G") != 1024 * 1024 * 1024) ERR("Bad size parsing");
    if (parseNumericSuffixed("1K2") != 0 || parseNumericSuffixed("M") != 0 || parseNumericSuffixed("") != 0) ERR("Invalid sizes should give 0");

    if (Parcel::Manifest::getStreamName("/dev/sda1", "ext4", Parcel::CompressGZip) != "sda1.ext4-ptcl-img.gz") ERR("Bad stream name for sda1");
    if (Parcel::Manifest::getStreamName("/dev/mapper/vg-root", "xfs", Parcel::CompressNone) != "mapper-vg-root.xfs-ptcl-img") ERR("Bad stream name for a mapper device");
    if (Parcel::Manifest::getChunkName("sda1.ext4-ptcl-img", 42) != "sda1.ext4-ptcl-img.000042") ERR("Bad chunk name");
    if (Parcel::Manifest::getStreamName("/dev/disk/by-partlabel/EFI system\tpartition", "vfat", Parcel::CompressNone) != "disk-by-partlabel-EFI-system-partition.vfat-ptcl-img")
        ERR("Whitespaces must be replaced in stream names");
    {
        Parcel::ChunkWriter writer;
        if (writer.open("/tmp", "bad name", 100, Parcel::CompressNone).kind != Parcel::ValidationError) ERR("A stream name with a space must be refused");
    }

    Parcel::Error err = Parcel::Error::fromErrno(ENOSPC, "test", "write");
    if (err.kind != Parcel::SpaceExceededError) ERR("ENOSPC should be a space error");
    if (Parcel::Error::fromErrno(EPIPE, "test", "write").kind != Parcel::BrokenPipeError || Parcel::Error::fromErrno(EIO, "test", "write").kind != Parcel::IOError) ERR("Bad errno mapping");
    if (err.describe().find("test: SpaceExceededError: write") != 0) ERR("Bad description: %s", err.describe().c_str());

    if (Parcel::Session::getExitCode(Parcel::Error(), false) != 0) ERR("Success must exit with 0");
    if (Parcel::Session::getExitCode(Parcel::Error(Parcel::ManifestCorruptError, "test", ""), true) != 2) ERR("Validation failures must exit with 2");
    if (Parcel::Session::getExitCode(Parcel::Error(Parcel::IOError, "test", ""), false) != 1) ERR("Running failures must exit with 1");

    // Devices must be under /dev/ unless using image files
    Parcel::Session::Options opts;
    opts.direction = Parcel::Session::Backup;
    opts.backupPath = "/tmp";
    opts.devices.Append("/tmp/disk.img");
    Parcel::Session session(opts);
    if (session.run() != 2 || session.getError().kind != Parcel::ValidationError) ERR("A non device path must fail validation");
    opts.imageFile = true;
    opts.fsType = "ext 4";
    Parcel::Session spaced(opts);
    if (spaced.run() != 2 || spaced.getError().kind != Parcel::ValidationError) ERR("A file system type with a space must fail validation");

    // Command line parsing
    const char * argv[] = { "parcel", "--backup", "/tmp/dir", "/dev/sda1", "/dev/sda2", "--size", "10M" };
    Strings::StringArray options((char**)argv, ArrSz(argv)), params;
    if (!getOptionParameters(options, "backup", params) || params.getSize() != 3 || params[2] != "/dev/sda2") ERR("Bad backup parameters");
    if (checkOption(options, "size", true) != 1 || !optionsMap["size"] || *optionsMap["size"] != "10M") ERR("Bad size option");
    if (checkOption(options, "fstype") != -1) ERR("Missing option should not be found");

    fprintf(stderr, "Success\n");
    return EXIT_SUCCESS;
}

int testVerify()
{
    String dir = makeTestDir("verify");
    if (dir.empty()) ERR("Can't create the test directory");
    const String data = makeData(5000, 12);

    Parcel::ChunkWriter writer;
    CHECK(writer.open(dir, "check.gz", 1000, Parcel::CompressGZip), "Opening the writer failed");
    {
        Parcel::ChunkSink sink(writer, Parcel::CompressGZip);
        if (sink.write((const uint8*)data.data(), data.size()) != data.size()) ERR("Writing failed: %s", sink.getError().describe().c_str());
        CHECK(sink.finish(), "Finishing failed");
    }
    const String manifest = dir + "/check.gz.manifest";
    {
        Parcel::Session session(imageOptions(Parcel::Session::Verify, manifest, "", ""));
        int ret = session.run();
        if (ret) ERR("Verify failed with %d: %s", ret, session.getError().describe().c_str());
        if (session.getCursor() != writer.getManifest().totalLength) ERR("Not all the chunks were verified");
    }

    // Flip a byte in the last chunk
    const String last = dir + "/" + writer.getManifest().chunks.back().fileName;
    String chunk;
    if (!readFile(last, chunk) || chunk.empty()) ERR("Can't read the last chunk");
    chunk[chunk.size() / 2] = (char)(chunk[chunk.size() / 2] ^ 0xFF);
    if (!writeFile(last, chunk)) ERR("Can't write the last chunk");
    {
        Parcel::Session session(imageOptions(Parcel::Session::Verify, manifest, "", ""));
        int ret = session.run();
        if (ret != 1 || session.getError().kind != Parcel::ManifestCorruptError) ERR("Expected a corrupt chunk, got %d: %s", ret, session.getError().describe().c_str());
    }

    removeTestDir(dir);
    fprintf(stderr, "Success\n");
    return EXIT_SUCCESS;
}
#undef CHECK
#undef ERR

int checkTests(const Strings::StringArray & options)
{
    // Check for test mode
    size_t optionPos = 0;

    if ((optionPos = options.indexOf("--test")) != options.getSize())
    {
        Strings::FastString testName = "help";
        if (optionPos + 1 != options.getSize()) testName = Strings::Trimmed(options[optionPos+1]);

        static const struct { const char * name; int (*test)(); const char * help; } tests[] = {
            { "chunks",     testChunks,         "Write 250 bytes in 100 bytes chunks, check the manifest and read it back" },
            { "empty",      testEmpty,          "An empty stream gives a single empty chunk" },
            { "multiple",   testMultiple,       "A stream multiple of the chunk size gives no trailing chunk, and reference resolution" },
            { "corrupt",    testCorrupt,        "Modified chunks and invalid manifests are rejected" },
            { "missing",    testMissing,        "A missing chunk fails the restore before any byte is written" },
            { "space",      testSpace,          "A full destination fails the backup, and keeps the closed chunks valid" },
            { "bridge",     testBridge,         "Backup and restore a compressed image through an engine process" },
            { "bridgefail", testBridgeFailure,  "Chunk side failures terminate the engine, and broken pipes are reported" },
            { "child",      testChild,          "The engine exit code, signal and error output are reported" },
            { "logger",     testLogger,         "Progress records and log messages end up in the log file" },
            { "lock",       testLock,           "Concurrent backups in the same directory are refused" },
            { "roundtrip",  testRoundtrip,      "Complete backup, verify and restore sessions of image files" },
            { "cancel",     testCancel,         "Cancelling a running backup terminates the engine" },
            { "stalled",    testStalled,        "An engine ignoring the termination request is killed" },
            { "options",    testOptions,        "Option parsing, naming rules and exit codes" },
            { "verify",     testVerify,         "Verification of a good and a corrupted backup" },
        };

        // Run tests now
        if (testName == "help")
        {
            printf("Test mode help:\n");
            for (size_t i = 0; i < ArrSz(tests); i++) printf("\t%s\t%s%s\n", tests[i].name, strlen(tests[i].name) < 8 ? "\t" : "", tests[i].help);
            return EXIT_SUCCESS;
        }
        for (size_t i = 0; i < ArrSz(tests); i++)
            if (testName == tests[i].name) return tests[i].test();

        showHelpMessage("Unknown test " + testName);
        return -1;
    }
    return BailOut;
}

int main(int argc, char ** argv)
{
    // Build the options array
    Strings::StringArray options(argv, (size_t)argc);
    if (options.getSize() < 2)
        return showHelpMessage();

    // The engine must be terminated on interruption
    Parcel::StreamBridge::installSignalHandlers();

    Logger::ConsoleSink debugSink(~0);
    // "-v" is not a "--" option, so it would end up in the action's parameters
    size_t verbosePos = options.indexOf("-v");
    bool verbose = verbosePos != options.getSize() || options.indexOf("--verbose") != options.getSize();
    if (verbosePos != options.getSize()) options.Remove(verbosePos);
    if (verbose) Logger::setDefaultSink(&debugSink);

    // Test mode first
    int tested = checkTests(options);
    if (tested != BailOut) return tested == EXIT_SUCCESS ? EXIT_SUCCESS : EXIT_FAILURE;

    Strings::StringArray params;
    if (getOptionParameters(options, "help", params))
        return showHelpMessage();

    int ret = 0;
    if ((ret = checkOption(options, "size", true)) == BadArgument) return ret;
    if ((ret = checkOption(options, "compression")) == BadArgument) return ret;
    if ((ret = checkOption(options, "fstype")) == BadArgument) return ret;
    if ((ret = checkOption(options, "engine")) == BadArgument) return ret;
    if ((ret = checkOption(options, "log-file")) == BadArgument) return ret;

    // Then actions
    if ((ret = handleAction(options, "backup")) != BailOut) return ret;
    if ((ret = handleAction(options, "restore")) != BailOut) return ret;
    if ((ret = handleAction(options, "verify")) != BailOut) return ret;

    return showHelpMessage("Either backup, restore or verify mode required");
}
