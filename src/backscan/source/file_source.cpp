#include <backscan/reader/error.h>
#include <backscan/source/file_source.h>

#include <sys/types.h>

#include <cerrno>
#include <cstring>
#include <utility>

#include "backscan/common/logging.h"

#ifdef __linux__
#include <fcntl.h>
#endif

namespace backscan {

static FILE *open_file(const std::string &path) {
    FILE *file = fopen(path.c_str(), "rb");
    if (!file) {
        throw ReaderError(ReaderError::FILE_IO_ERROR,
                          "Failed to open file: " + path + " (" +
                              std::strerror(errno) + ")");
    }

    // Unbuffered: every read_at seeks to a new chunk
    setvbuf(file, nullptr, _IONBF, 0);

#ifdef __linux__
    // Chunks are read back to front
    int fd = fileno(file);
    posix_fadvise(fd, 0, 0, POSIX_FADV_RANDOM);
#endif

    return file;
}

static std::size_t query_file_size(FILE *file, const std::string &path) {
    if (fseeko(file, 0, SEEK_END) != 0) {
        throw ReaderError(ReaderError::FILE_IO_ERROR,
                          "Failed to seek to end of file: " + path);
    }
    off_t end = ftello(file);
    if (end < 0) {
        throw ReaderError(ReaderError::FILE_IO_ERROR,
                          "Failed to determine size of file: " + path);
    }
    return static_cast<std::size_t>(end);
}

FileSource::FileSource(const std::string &path)
    : path_(path), file_handle_(open_file(path)), size_(0) {
    try {
        size_ = query_file_size(file_handle_, path_);
    } catch (const ReaderError &) {
        fclose(file_handle_);
        file_handle_ = nullptr;
        throw;
    }
    BACKSCAN_LOG_DEBUG("Opened file source {} ({} bytes)", path_, size_);
}

FileSource::~FileSource() { close(); }

FileSource::FileSource(FileSource &&other) noexcept
    : path_(std::move(other.path_)),
      file_handle_(other.file_handle_),
      size_(other.size_) {
    other.file_handle_ = nullptr;
    other.size_ = 0;
}

FileSource &FileSource::operator=(FileSource &&other) noexcept {
    if (this != &other) {
        close();
        path_ = std::move(other.path_);
        file_handle_ = other.file_handle_;
        size_ = other.size_;
        other.file_handle_ = nullptr;
        other.size_ = 0;
    }
    return *this;
}

ReadResult FileSource::read_at(std::size_t offset, char *buffer,
                               std::size_t size) {
    if (!file_handle_) {
        throw ReaderError(ReaderError::INVALID_ARGUMENT,
                          "Read from closed file source: " + path_);
    }

    clearerr(file_handle_);
    if (fseeko(file_handle_, static_cast<off_t>(offset), SEEK_SET) != 0) {
        throw ReaderError(ReaderError::READ_ERROR,
                          "Failed to seek to offset " +
                              std::to_string(offset) + " in " + path_);
    }

    std::size_t n = fread(buffer, 1, size, file_handle_);
    if (n < size && ferror(file_handle_)) {
        int err = errno;
        BACKSCAN_LOG_ERROR("Read of {} bytes at offset {} in {} failed: {}",
                           size, offset, path_, std::strerror(err));
        throw ReaderError(ReaderError::READ_ERROR,
                          "Failed to read " + std::to_string(size) +
                              " bytes at offset " + std::to_string(offset) +
                              " in " + path_ + " (" + std::strerror(err) +
                              ")");
    }

    bool end_of_source = feof(file_handle_) != 0 || offset + n >= size_;
    return ReadResult{n, end_of_source};
}

void FileSource::close() {
    if (file_handle_) {
        fclose(file_handle_);
        file_handle_ = nullptr;
        BACKSCAN_LOG_DEBUG("Closed file source {}", path_);
    }
}

}  // namespace backscan
