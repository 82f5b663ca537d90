#ifndef BACKSCAN_READER_BACKWARD_READER_IMPL_H
#define BACKSCAN_READER_BACKWARD_READER_IMPL_H

#include <backscan/reader/backward_reader.h>
#include <backscan/reader/line_processor.h>
#include <backscan/source/source.h>

#include <cstddef>
#include <cstdint>
#include <exception>
#include <string_view>
#include <vector>

namespace backscan {

struct BackwardLineReaderImplementor {
    RandomAccessSource *source;
    std::size_t cursor;
    std::size_t chunk_size;
    std::size_t max_buffer_size;
    LineStatus status;
    bool is_closed;

    BackwardLineReaderImplementor(RandomAccessSource &source,
                                  std::size_t start_offset,
                                  const BackwardLineReader::Config &config);

    LineView next_line_bytes();
    LineStatus for_each_line(LineProcessor &processor);
    void close();

    inline std::size_t buffered_bytes() const { return length_; }

   private:
    LineStatus fetch_chunk();
    LineStatus feed_lines(LineProcessor &processor);

    // Live bytes are buffer_[0, length_) and start at `cursor` in the source
    std::vector<char> buffer_;
    std::size_t length_;
    // Swapped with buffer_ on every prepend
    std::vector<char> scratch_;
    std::exception_ptr error_;
};

}  // namespace backscan

#endif  // BACKSCAN_READER_BACKWARD_READER_IMPL_H
