#ifndef BACKSCAN_SOURCE_MEMORY_SOURCE_H
#define BACKSCAN_SOURCE_MEMORY_SOURCE_H

#include <backscan/source/source.h>

#include <cstddef>
#include <string>
#include <string_view>

namespace backscan {

/**
 * Source over an owned copy of in-memory bytes. Signals end of source on any
 * read that touches the last byte.
 */
class MemorySource : public RandomAccessSource {
   public:
    explicit MemorySource(std::string data);
    explicit MemorySource(std::string_view data);
    explicit MemorySource(const char *data);
    MemorySource(const char *data, std::size_t size);

    ReadResult read_at(std::size_t offset, char *buffer,
                       std::size_t size) override;

    std::size_t size() const override { return data_.size(); }
    const std::string &data() const { return data_; }

   private:
    std::string data_;
};

}  // namespace backscan

#endif  // BACKSCAN_SOURCE_MEMORY_SOURCE_H
