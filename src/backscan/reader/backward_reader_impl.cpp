#include <backscan/common/constants.h>
#include <backscan/reader/error.h>

#include <algorithm>
#include <cstring>
#include <string>

#include "backscan/common/logging.h"
#include "backscan/reader/backward_reader_impl.h"

static std::size_t sanitize(std::int64_t value, std::size_t fallback,
                            const char *name) {
    if (value <= 0) {
        if (value < 0) {
            BACKSCAN_LOG_DEBUG("Invalid {} {}, using default {}", name, value,
                               fallback);
        }
        return fallback;
    }
    return static_cast<std::size_t>(value);
}

static std::string_view drop_cr(std::string_view line) {
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }
    return line;
}

namespace backscan {

BackwardLineReaderImplementor::BackwardLineReaderImplementor(
    RandomAccessSource &source_, std::size_t start_offset,
    const BackwardLineReader::Config &config)
    : source(&source_),
      cursor(start_offset),
      chunk_size(sanitize(config.chunk_size,
                          constants::reader::DEFAULT_CHUNK_SIZE, "chunk size")),
      max_buffer_size(sanitize(config.max_buffer_size,
                               constants::reader::DEFAULT_MAX_BUFFER_SIZE,
                               "max buffer size")),
      status(LineStatus::OK),
      is_closed(false),
      length_(0) {
    std::size_t source_size = source->size();
    if (start_offset > source_size) {
        throw ReaderError(ReaderError::INVALID_ARGUMENT,
                          "start offset " + std::to_string(start_offset) +
                              " exceeds source size " +
                              std::to_string(source_size));
    }

    BACKSCAN_LOG_DEBUG(
        "Created backward reader: start_offset={}, chunk_size={}, "
        "max_buffer_size={}",
        start_offset, chunk_size, max_buffer_size);
}

LineStatus BackwardLineReaderImplementor::fetch_chunk() {
    if (cursor == 0) {
        return LineStatus::END_OF_SOURCE;
    }

    std::size_t fetch_size = std::min(chunk_size, cursor);
    cursor -= fetch_size;

    std::size_t total_size = fetch_size + length_;
    if (total_size > max_buffer_size) {
        BACKSCAN_LOG_WARN(
            "Unterminated line needs {} bytes at offset {}, more than the "
            "{} byte buffer limit",
            total_size, cursor, max_buffer_size);
        return LineStatus::BUFFER_SIZE_EXCEEDED;
    }

    if (scratch_.size() < total_size) {
        scratch_.resize(total_size);
    }

    BACKSCAN_LOG_TRACE("Fetching {} bytes at offset {} (buffered {})",
                       fetch_size, cursor, length_);
    ReadResult result = source->read_at(cursor, scratch_.data(), fetch_size);
    if (result.bytes < fetch_size) {
        if (result.end_of_source) {
            BACKSCAN_LOG_DEBUG(
                "Source ended after {} of {} bytes at offset {}", result.bytes,
                fetch_size, cursor);
            return LineStatus::END_OF_SOURCE;
        }
        BACKSCAN_LOG_ERROR("Short read of {} of {} bytes at offset {}",
                           result.bytes, fetch_size, cursor);
        throw ReaderError(ReaderError::READ_ERROR,
                          "short read: got " + std::to_string(result.bytes) +
                              " of " + std::to_string(fetch_size) +
                              " bytes at offset " + std::to_string(cursor));
    }

    if (length_ > 0) {
        std::memcpy(scratch_.data() + fetch_size, buffer_.data(), length_);
    }
    buffer_.swap(scratch_);
    length_ = total_size;
    return LineStatus::OK;
}

LineView BackwardLineReaderImplementor::next_line_bytes() {
    if (error_) {
        std::rethrow_exception(error_);
    }
    if (status != LineStatus::OK) {
        return LineView{std::string_view(), 0, status};
    }

    while (true) {
        std::string_view content(buffer_.data(), length_);
        std::size_t separator = content.rfind('\n');
        if (separator != std::string_view::npos) {
            length_ = separator;
            return LineView{drop_cr(content.substr(separator + 1)),
                            cursor + separator + 1, LineStatus::OK};
        }

        LineStatus fetched;
        try {
            fetched = fetch_chunk();
        } catch (...) {
            error_ = std::current_exception();
            throw;
        }

        if (fetched == LineStatus::END_OF_SOURCE) {
            status = LineStatus::END_OF_SOURCE;
            if (length_ > 0) {
                std::string_view last(buffer_.data(), length_);
                length_ = 0;
                BACKSCAN_LOG_DEBUG("Reached start of source");
                return LineView{drop_cr(last), 0, LineStatus::OK};
            }
            BACKSCAN_LOG_DEBUG("Reached start of source with empty buffer");
            return LineView{std::string_view(), 0, status};
        }
        if (fetched == LineStatus::BUFFER_SIZE_EXCEEDED) {
            status = fetched;
            return LineView{std::string_view(), 0, status};
        }
    }
}

LineStatus BackwardLineReaderImplementor::for_each_line(
    LineProcessor &processor) {
    processor.begin(cursor + length_);
    LineStatus result;
    try {
        result = feed_lines(processor);
    } catch (...) {
        // begin() and end() stay paired when a read or process() throws
        processor.end();
        throw;
    }
    processor.end();
    return result;
}

LineStatus BackwardLineReaderImplementor::feed_lines(
    LineProcessor &processor) {
    while (true) {
        LineView line = next_line_bytes();
        if (!line.ok()) {
            return line.status;
        }
        if (!processor.process(line.data.data(), line.data.size(),
                               line.position)) {
            BACKSCAN_LOG_DEBUG("Line processor stopped at position {}",
                               line.position);
            return LineStatus::OK;
        }
    }
}

void BackwardLineReaderImplementor::close() {
    if (is_closed) {
        return;
    }
    is_closed = true;
    if (source->supports_close()) {
        source->close();
    }
}

}  // namespace backscan
