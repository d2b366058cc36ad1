#ifndef hpp_CPP_File_CPP_hpp
#define hpp_CPP_File_CPP_hpp

// We need basic type declaration
#include "../Types.hpp"
// We need platform specific structure
#include "../Platform/Platform.hpp"
// We need strings
#include "../Strings/Strings.hpp"

/** All utility for manipulating files */
namespace File
{
    /** The string class we are using */
    typedef Strings::FastString String;

    /** The stream interface.

        Once you've retrieved file informations (Info), you can get a stream to
        manipulate file content.

        The interface is limited to basic stream operations
    */
    struct BaseStream
    {
        /** Read the stream of the given amount of bytes.
            @param buffer   The buffer to read into
            @param length   The data length to read
            @return 0 on end of file, -1 on error, or the actual length read else */
        virtual int read(char * buffer, int length) = 0;
        /** Write the given amount of bytes to the stream.
            @param buffer   The buffer to write
            @param length   The data length to write
            @return -1 on error, or the actual length written else */
        virtual int write(const char * buffer, int length) = 0;

        /** Flush the stream buffers to the operating system.
            @return false on error (check getLastError) */
        virtual bool flush() = 0;
        /** Flush the stream and wait until the operating system has written the data to the storage.
            @return false on error (check getLastError) */
        virtual bool sync() = 0;

        /** Get the stream size (if known by advance) */
        virtual uint64 getSize() const = 0;
        /** Get the current pointer position in the stream. */
        virtual uint64 getPosition() const = 0;
        /** Set the current pointer position in the stream */
        virtual bool setPosition(const uint64 offset) = 0;
        /** Check if the stream is finished. */
        virtual bool endOfStream() const = 0;
        /** Get the last error number (errno like) that happened on this stream, or 0 if none */
        virtual int getLastError() const = 0;

        /** Required destructor */
        virtual ~BaseStream() {}
    };


    /** The file info contains meta information about files */
    struct Info
    {
        // Type definition and enumeration
    public:
        /** The permission to check */
        enum PermissionType
        {
            Reading     =   0,
            Writing     =   1,
            Execution   =   2,
        };

        /** The different file type */
        enum Type
        {
            Regular     = 0x001,
            Link        = 0x100,
            Directory   = 0x002,
            FIFO        = 0x004,
            Device      = 0x010,
            Socket      = 0x020,
        };

        /** The way to open a stream on this file */
        enum OpenMode
        {
            ReadOnly    =   0,  //!< Read only, the file must exist
            Exclusive   =   1,  //!< Write only, the file must not exist and is created
        };

        // Members
    public:
        /** The file name (without the path) */
        String      name;
        /** The file path (without the name) */
        String      path;
        /** The file size in bytes */
        uint64      size;
        /** The file type */
        Type        type;
        /** Set if the file exists (was stat'd correctly) */
        bool        exists;

        // Interface
    public:
        /** Get the full path (path and name) */
        inline String getFullPath() const { return path.empty() ? name : (name.empty() ? path : path + PathSeparator + name); }
        /** Get the parent folder of this file */
        inline String getParentFolder() const { return path.empty() ? String(".") : path; }
        /** Check the given permission for the current user
            @param type     One of the permission type to check */
        bool checkPermission(const PermissionType type) const;
        /** Get a stream on this file.
            @param mode     The opening mode
            @return A new allocated stream you must delete, or 0 on error (errno is kept) */
        BaseStream * getStream(const OpenMode mode = ReadOnly) const;
        /** Remove the file (or empty directory) */
        bool remove();
        /** Make a directory, with this file name.
            @param recursive  If set, the parent directories are created if required */
        bool makeDir(const bool recursive = true);
        /** Check if the file exists */
        inline bool doesExist() const { return exists; }
        /** Check if it's a directory */
        inline bool isDir() const { return exists && (type & Directory) > 0; }
        /** Check if it's a device */
        inline bool isDevice() const { return exists && (type & Device) > 0; }
        /** Check if it's a regular file */
        inline bool isFile() const { return exists && (type & Regular) > 0; }
        /** Refresh the file information */
        bool restatFile();

        // Construction and destruction
    public:
        /** Build the file information for the given path */
        Info(const String & fullPath = "");
    };

    /** A directory iterator */
    struct DirectoryIterator
    {
        // Members
    private:
        mutable DIR *               finder;
        /** The search path */
        String          path;

        // Interface
    public:
        /** Get the next file name iteratively (the special "." and ".." entries are skipped)
            @param name     The file name (without path)
            @return false when iteration should stop */
        bool getNextFileName(String & name) const;

        /** Only allow General to build us */
        friend struct General;

        // Construction and destruction
    private:
        /** Build an iterator */
        DirectoryIterator(const String & path);

    public:
        DirectoryIterator(const DirectoryIterator & dir);
        ~DirectoryIterator();
    };

    /** The general class allows to list directories and query the file systems.
        It doesn't actually look into file content, only manipulate pointers to files */
    struct General
    {
        /** Get an iterator on the given folder */
        static DirectoryIterator listFilesIn(const String & path);
        /** Get the drive usage for the given path.
            @param path         The path to a file or folder on the drive
            @param totalBytes   On output, contains the total drive space
            @param freeBytes    On output, contains the total free space on the drive
            @return true on successful drive space query */
        static bool getDriveUsage(const String & path, uint64 & totalBytes, uint64 & freeBytes);
        /** Flush a directory entries to the storage (so created files survive a power loss)
            @return false on error (errno is kept) */
        static bool syncDirectory(const String & path);
    };


    /** The blocking, classic file stream. */
    class Stream : public BaseStream
    {
        // Member
    private:
        /** The stream pointer */
        FILE    *       file;
        /** The last error */
        int             lastError;

        // Interface
    public:
        virtual int read(char * buffer, int length);
        virtual int write(const char * buffer, int length);
        virtual bool flush();
        virtual bool sync();
        virtual uint64 getSize() const;
        virtual uint64 getPosition() const;
        virtual bool setPosition(const uint64 offset);
        virtual bool endOfStream() const;
        virtual int getLastError() const { return lastError; }

        /** Check if the file could be opened */
        bool isOpen() const { return file != NULL; }
        /** Close the stream (flushing it)
            @return false on error */
        bool close();

        /** Default constructor.
            @param fullPath     The path to the file
            @param mode         The fopen like mode (the close-on-exec flag is always added) */
        Stream(const String & fullPath = "", const String & mode = "r+b");
        ~Stream();

    private:
        /** Prevent copying */
        Stream(const Stream &);
        Stream & operator = (const Stream &);
    };
}

#endif
