#ifndef BACKSCAN_SOURCE_FILE_SOURCE_H
#define BACKSCAN_SOURCE_FILE_SOURCE_H

#include <backscan/source/source.h>

#include <cstddef>
#include <cstdio>
#include <string>

namespace backscan {

/**
 * Read-only file source. Owns its FILE handle and closes it on destruction.
 */
class FileSource : public RandomAccessSource {
   public:
    explicit FileSource(const std::string &path);
    ~FileSource() override;

    FileSource(const FileSource &) = delete;
    FileSource &operator=(const FileSource &) = delete;
    FileSource(FileSource &&other) noexcept;
    FileSource &operator=(FileSource &&other) noexcept;

    ReadResult read_at(std::size_t offset, char *buffer,
                       std::size_t size) override;

    std::size_t size() const override { return size_; }

    bool supports_close() const override { return true; }

    /**
     * Release the file handle. Safe to call more than once.
     */
    void close() override;

    bool is_open() const { return file_handle_ != nullptr; }
    const std::string &path() const { return path_; }

   private:
    std::string path_;
    FILE *file_handle_;
    std::size_t size_;
};

}  // namespace backscan

#endif  // BACKSCAN_SOURCE_FILE_SOURCE_H
