#include <backscan/reader/backward_reader.h>
#include <backscan/reader/error.h>

#include <exception>

#include "backscan/common/logging.h"
#include "backscan/reader/backward_reader_impl.h"

static void check_reader_state(const void *impl) {
    if (!impl) {
        throw backscan::ReaderError(backscan::ReaderError::INITIALIZATION_ERROR,
                                    "Reader is not valid");
    }
}

namespace backscan {

const char *to_string(LineStatus status) {
    switch (status) {
        case LineStatus::OK:
            return "OK";
        case LineStatus::END_OF_SOURCE:
            return "END_OF_SOURCE";
        case LineStatus::BUFFER_SIZE_EXCEEDED:
            return "BUFFER_SIZE_EXCEEDED";
    }
    return "UNKNOWN";
}

BackwardLineReader::BackwardLineReader(RandomAccessSource &source,
                                       std::size_t start_offset)
    : BackwardLineReader(source, start_offset, Config{}) {}

BackwardLineReader::BackwardLineReader(RandomAccessSource &source,
                                       std::size_t start_offset,
                                       const Config &config)
    : p_impl_(new BackwardLineReaderImplementor(source, start_offset, config)) {
}

BackwardLineReader::~BackwardLineReader() = default;

BackwardLineReader::BackwardLineReader(BackwardLineReader &&other) noexcept
    : p_impl_(other.p_impl_.release()) {}

BackwardLineReader &BackwardLineReader::operator=(
    BackwardLineReader &&other) noexcept {
    if (this != &other) {
        p_impl_.reset(other.p_impl_.release());
    }
    return *this;
}

LineView BackwardLineReader::next_line_bytes() {
    check_reader_state(p_impl_.get());
    return p_impl_->next_line_bytes();
}

Line BackwardLineReader::next_line() {
    check_reader_state(p_impl_.get());
    LineView view = p_impl_->next_line_bytes();
    return Line{std::string(view.data), view.position, view.status};
}

LineStatus BackwardLineReader::for_each_line(LineProcessor &processor) {
    check_reader_state(p_impl_.get());
    return p_impl_->for_each_line(processor);
}

void BackwardLineReader::close() {
    check_reader_state(p_impl_.get());
    p_impl_->close();
}

std::size_t BackwardLineReader::cursor() const {
    check_reader_state(p_impl_.get());
    return p_impl_->cursor;
}

std::size_t BackwardLineReader::buffered_bytes() const {
    check_reader_state(p_impl_.get());
    return p_impl_->buffered_bytes();
}

LineStatus BackwardLineReader::status() const {
    check_reader_state(p_impl_.get());
    return p_impl_->status;
}

std::size_t BackwardLineReader::chunk_size() const {
    check_reader_state(p_impl_.get());
    return p_impl_->chunk_size;
}

std::size_t BackwardLineReader::max_buffer_size() const {
    check_reader_state(p_impl_.get());
    return p_impl_->max_buffer_size;
}

bool BackwardLineReader::is_valid() const { return p_impl_ != nullptr; }

}  // namespace backscan

// ==============================================================================
// C API Implementation (wraps C++ implementation)
// ==============================================================================

extern "C" {

backscan_reader_handle_t backscan_reader_create(backscan_source_handle_t source,
                                                size_t start_offset) {
    return backscan_reader_create_with_config(source, start_offset, 0, 0);
}

backscan_reader_handle_t backscan_reader_create_with_config(
    backscan_source_handle_t source, size_t start_offset, int64_t chunk_size,
    int64_t max_buffer_size) {
    if (!source) {
        BACKSCAN_LOG_ERROR("Invalid parameters for reader creation");
        return nullptr;
    }

    try {
        backscan::BackwardLineReader::Config config;
        config.chunk_size = chunk_size;
        config.max_buffer_size = max_buffer_size;
        auto *reader = new backscan::BackwardLineReader(
            *static_cast<backscan::RandomAccessSource *>(source), start_offset,
            config);
        return static_cast<backscan_reader_handle_t>(reader);
    } catch (const std::exception &e) {
        BACKSCAN_LOG_ERROR("Failed to create reader: {}", e.what());
        return nullptr;
    }
}

int backscan_reader_next_line(backscan_reader_handle_t reader,
                              const char **line, size_t *length,
                              size_t *position) {
    if (!reader || !line || !length || !position) {
        return -1;
    }

    try {
        auto *cpp_reader = static_cast<backscan::BackwardLineReader *>(reader);
        backscan::LineView view = cpp_reader->next_line_bytes();
        *line = view.data.data();
        *length = view.data.size();
        *position = view.position;
        return static_cast<int>(view.status);
    } catch (const std::exception &e) {
        BACKSCAN_LOG_ERROR("Failed to read line: {}", e.what());
        return -1;
    }
}

int backscan_reader_for_each_line(backscan_reader_handle_t reader,
                                  backscan_line_processor_callback_t callback,
                                  void *user_data) {
    if (!reader || !callback) {
        return -1;
    }

    try {
        auto *cpp_reader = static_cast<backscan::BackwardLineReader *>(reader);
        backscan::CallbackLineProcessor processor(callback, user_data);
        return static_cast<int>(cpp_reader->for_each_line(processor));
    } catch (const std::exception &e) {
        BACKSCAN_LOG_ERROR("Failed to process lines: {}", e.what());
        return -1;
    }
}

int backscan_reader_close(backscan_reader_handle_t reader) {
    if (!reader) {
        return -1;
    }

    try {
        static_cast<backscan::BackwardLineReader *>(reader)->close();
        return 0;
    } catch (const std::exception &e) {
        BACKSCAN_LOG_ERROR("Failed to close reader: {}", e.what());
        return -1;
    }
}

void backscan_reader_destroy(backscan_reader_handle_t reader) {
    if (reader) {
        delete static_cast<backscan::BackwardLineReader *>(reader);
    }
}

}  // extern "C"
