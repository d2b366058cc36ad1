// We need our declaration
#include "../../include/File/File.hpp"

#include <sys/statvfs.h>

namespace File
{
    bool Info::checkPermission(const PermissionType type) const
    {
        static const int modes[] = { R_OK, W_OK, X_OK };
        return access(getFullPath().c_str(), modes[type]) == 0;
    }

    bool Info::makeDir(const bool recursive)
    {
        String fullPath = getFullPath();
        if (!recursive)
        {
            if (mkdir(fullPath.c_str(), 0755) != 0) return false;
            return restatFile();
        }
        // Need to split the directory to make them recursively
        while (fullPath.size() > 1 && fullPath[fullPath.size() - 1] == Platform::Separator) fullPath.erase(fullPath.size() - 1);
        size_t pos = 0;
        while ((pos = fullPath.find(Platform::Separator, pos + 1)) != String::npos)
        {
            String parent = fullPath.substr(0, pos);
            if (!Info(parent).isDir() && mkdir(parent.c_str(), 0755) != 0 && errno != EEXIST) return false;
        }
        if (!Info(fullPath).isDir() && mkdir(fullPath.c_str(), 0755) != 0 && errno != EEXIST) return false;
        return restatFile() && isDir();
    }

    bool Info::remove()
    {
        int ret = isDir() ? rmdir(getFullPath().c_str()) : unlink(getFullPath().c_str());
        if (ret != 0) return false;
        size = 0; type = Regular; exists = false;
        return true;
    }

    bool Info::restatFile()
    {
        struct stat status;
        memset(&status, 0, sizeof(status));
        exists = false;
        if (stat(getFullPath().c_str(), &status) != 0) return false;
        size = (uint64)status.st_size;
        type = Regular;
        if (S_ISDIR(status.st_mode)) type = Directory;
        if (S_ISCHR(status.st_mode)) type = Device;
        if (S_ISBLK(status.st_mode)) type = Device;
        if (S_ISFIFO(status.st_mode)) type = FIFO;
        if (S_ISSOCK(status.st_mode)) type = Socket;
        exists = true;
        return true;
    }

    // Get a stream from this file.
    BaseStream * Info::getStream(const OpenMode mode) const
    {
        static const char * modes[] = { "rb", "wbx" };
        Stream * stream = new Stream(getFullPath(), modes[mode]);
        if (!stream->isOpen())
        {
            int error = stream->getLastError();
            delete stream;
            errno = error;
            return 0;
        }
        return stream;
    }

    Info::Info(const String & fullPath) : size(0), type(Regular), exists(false)
    {
        size_t pos = fullPath.rfind(Platform::Separator);
        if (pos == String::npos) name = fullPath;
        else if (pos == 0) { path = PathSeparator; name = fullPath.substr(1); }
        else { path = fullPath.substr(0, pos); name = fullPath.substr(pos + 1); }
        if (path == PathSeparator) { path.clear(); name = PathSeparator + name; }
        if (fullPath.size()) restatFile();
    }

    bool DirectoryIterator::getNextFileName(String & name) const
    {
        if (finder == 0)
        {
            finder = opendir(path.c_str());
            if (finder == 0) return false;
        }

        for (;;)
        {
            struct dirent * ent = readdir(finder);
            if (ent == NULL) { closedir(finder); finder = 0; return false; }
            if (strcmp(ent->d_name, ".") == 0 || strcmp(ent->d_name, "..") == 0) continue;
            name = ent->d_name;
            return true;
        }
    }

    DirectoryIterator::DirectoryIterator(const DirectoryIterator & dir) : finder(dir.finder), path(dir.path) { const_cast<DirectoryIterator &>(dir).finder = 0; }
    DirectoryIterator::DirectoryIterator(const String & path) : finder(0), path(path) {}
    DirectoryIterator::~DirectoryIterator() { if (finder) closedir(finder); finder = 0; }

    DirectoryIterator General::listFilesIn(const String & path) { return DirectoryIterator(path); }

    bool General::getDriveUsage(const String & path, uint64 & totalBytes, uint64 & freeBytes)
    {
        struct statvfs stats;
        if (statvfs(path.c_str(), &stats) != 0) return false;
        totalBytes = (uint64)stats.f_blocks * (uint64)stats.f_frsize;
        freeBytes = (uint64)stats.f_bavail * (uint64)stats.f_frsize;
        return true;
    }

    bool General::syncDirectory(const String & path)
    {
        Platform::FileIndexWrapper fd(open(path.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
        if (fd < 0) return false;
        // Some file systems don't support syncing a directory, that's not an error
        return fsync(fd) == 0 || errno == EINVAL || errno == EROFS;
    }

    // Read the stream of the given amount of bytes.
    int Stream::read(char * buffer, int length)
    {
        if (file == NULL) { lastError = EBADF; return -1; }
        int ret = (int)fread(buffer, 1, length, file);
        if (ret < length && ferror(file)) { lastError = errno; clearerr(file); return ret ? ret : -1; }
        return ret;
    }

    // Write the given amount of bytes to the stream.
    int Stream::write(const char * buffer, int length)
    {
        if (file == NULL) { lastError = EBADF; return -1; }
        int ret = (int)fwrite(buffer, 1, length, file);
        if (ret < length) { lastError = errno ? errno : EIO; clearerr(file); return -1; }
        return ret;
    }
    // Flush the stream.
    bool Stream::flush()
    {
        if (file == NULL) { lastError = EBADF; return false; }
        if (fflush(file) != 0) { lastError = errno; clearerr(file); return false; }
        return true;
    }
    // Sync the stream to storage
    bool Stream::sync()
    {
        if (!flush()) return false;
        // Devices and pipes might not support syncing
        if (fsync(fileno(file)) != 0 && errno != EINVAL && errno != EROFS) { lastError = errno; return false; }
        return true;
    }

    // Get the stream size (if known by advance)
    uint64 Stream::getSize() const
    {
        if (file == NULL) return 0;
        struct stat status;
        if (fstat(fileno(file), &status) != 0) return 0;
        // Don't forget the buffered data
        return max((uint64)status.st_size, getPosition());
    }
    // Get the current pointer position in the stream.
    uint64 Stream::getPosition() const
    {
        if (file == NULL) return 0;
        off_t pos = ftello(file);
        return pos < 0 ? 0 : (uint64)pos;
    }
    // Set the current pointer position in the stream
    bool Stream::setPosition(const uint64 offset)
    {
        if (file == NULL) return false;
        if (fseeko(file, (off_t)offset, SEEK_SET) != 0) { lastError = errno; return false; }
        return true;
    }

    // Check if the stream is finished.
    bool Stream::endOfStream() const
    {
        return file == NULL || feof(file) != 0;
    }

    bool Stream::close()
    {
        if (file == NULL) return true;
        int ret = fclose(file);
        file = NULL;
        if (ret != 0) { lastError = errno; return false; }
        return true;
    }

    Stream::Stream(const String & fullPath, const String & mode)
        : file(NULL), lastError(0)
    {
        if (fullPath.size())
        {
            // Prevent any child process from inheriting the file on forking
            file = fopen(fullPath.c_str(), (mode + "e").c_str());
            if (!file) lastError = errno;
        }
    }

    Stream::~Stream()
    {
        if (file && fclose(file) < 0) perror("fclose");
        file = NULL;
    }
}
