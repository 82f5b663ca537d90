#include <backscan/reader/error.h>
#include <backscan/source/memory_source.h>

#include <cstring>
#include <utility>

namespace backscan {

MemorySource::MemorySource(std::string data) : data_(std::move(data)) {}

MemorySource::MemorySource(std::string_view data) : data_(data) {}

MemorySource::MemorySource(const char *data)
    : data_(data ? std::string(data) : std::string()) {}

MemorySource::MemorySource(const char *data, std::size_t size)
    : data_(size > 0 ? std::string(data, size) : std::string()) {}

ReadResult MemorySource::read_at(std::size_t offset, char *buffer,
                                 std::size_t size) {
    if (offset > data_.size()) {
        throw ReaderError(ReaderError::INVALID_ARGUMENT,
                          "Offset " + std::to_string(offset) +
                              " is past the end of a " +
                              std::to_string(data_.size()) + " byte source");
    }
    std::size_t available = data_.size() - offset;
    std::size_t n = size < available ? size : available;
    if (n > 0) {
        std::memcpy(buffer, data_.data() + offset, n);
    }
    return ReadResult{n, offset + n == data_.size()};
}

}  // namespace backscan
