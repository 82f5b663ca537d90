#ifndef BACKSCAN_READER_BACKWARD_READER_H
#define BACKSCAN_READER_BACKWARD_READER_H

#include <backscan/reader/line_processor.h>
#include <backscan/source/source.h>

#ifdef __cplusplus
extern "C" {
#endif

#include <stddef.h>
#include <stdint.h>

enum {
    BACKSCAN_LINE_OK = 0,
    BACKSCAN_LINE_END_OF_SOURCE = 1,
    BACKSCAN_LINE_BUFFER_SIZE_EXCEEDED = 2
};

/**
 * Opaque handle for a backward line reader
 */
typedef void *backscan_reader_handle_t;

/**
 * Create a reader over `source` that yields the lines before `start_offset`.
 * The source must outlive the reader.
 * @return Reader handle, or NULL on failure
 */
backscan_reader_handle_t backscan_reader_create(backscan_source_handle_t source,
                                                size_t start_offset);

/**
 * Same as backscan_reader_create with explicit tunables. Values <= 0 select
 * the defaults.
 */
backscan_reader_handle_t backscan_reader_create_with_config(
    backscan_source_handle_t source, size_t start_offset, int64_t chunk_size,
    int64_t max_buffer_size);

/**
 * Fetch the next line, newest first. `*line` points into reader storage and
 * stays valid until the next call on this reader.
 * @return BACKSCAN_LINE_OK, BACKSCAN_LINE_END_OF_SOURCE,
 *         BACKSCAN_LINE_BUFFER_SIZE_EXCEEDED, or -1 on error
 */
int backscan_reader_next_line(backscan_reader_handle_t reader,
                              const char **line, size_t *length,
                              size_t *position);

/**
 * Feed the remaining lines to `callback` until it returns 0 or the reader
 * reaches a terminal state.
 * @return Same codes as backscan_reader_next_line (BACKSCAN_LINE_OK when the
 *         callback stopped the iteration)
 */
int backscan_reader_for_each_line(backscan_reader_handle_t reader,
                                  backscan_line_processor_callback_t callback,
                                  void *user_data);

/**
 * Close the underlying source if it supports closing
 * @return 0 on success, -1 on error
 */
int backscan_reader_close(backscan_reader_handle_t reader);

void backscan_reader_destroy(backscan_reader_handle_t reader);

#ifdef __cplusplus
}  // extern "C"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace backscan {

enum class LineStatus {
    OK = BACKSCAN_LINE_OK,
    END_OF_SOURCE = BACKSCAN_LINE_END_OF_SOURCE,
    BUFFER_SIZE_EXCEEDED = BACKSCAN_LINE_BUFFER_SIZE_EXCEEDED
};

const char *to_string(LineStatus status);

/**
 * A line that aliases reader storage. `data` is invalidated by the next
 * fetch on the same reader.
 */
struct LineView {
    std::string_view data;
    std::size_t position;
    LineStatus status;

    bool ok() const { return status == LineStatus::OK; }
};

/**
 * A line with its own copy of the bytes
 */
struct Line {
    std::string data;
    std::size_t position;
    LineStatus status;

    bool ok() const { return status == LineStatus::OK; }
};

struct BackwardLineReaderImplementor;

/**
 * Yields the lines preceding a start offset of a random-access source, most
 * recent first, reading the source backward one chunk at a time.
 *
 * A line is the run of bytes after a '\n' up to the previous line (or the
 * start offset), with one trailing '\r' removed. Its position is the offset
 * of its first byte; the earliest line is always reported at position 0.
 * Once END_OF_SOURCE or BUFFER_SIZE_EXCEEDED is returned, every later call
 * returns the same status. Exceptions thrown by the source propagate and are
 * rethrown on every later call.
 *
 * Not thread-safe.
 */
class BackwardLineReader {
   public:
    struct Config {
        /** Bytes pulled per source read, <= 0 selects the default */
        std::int64_t chunk_size = 0;
        /** Cap on buffered bytes (and so on line length), <= 0 selects the
         * default */
        std::int64_t max_buffer_size = 0;
    };

    BackwardLineReader(RandomAccessSource &source, std::size_t start_offset);
    BackwardLineReader(RandomAccessSource &source, std::size_t start_offset,
                       const Config &config);
    ~BackwardLineReader();

    BackwardLineReader(const BackwardLineReader &) = delete;
    BackwardLineReader &operator=(const BackwardLineReader &) = delete;
    BackwardLineReader(BackwardLineReader &&other) noexcept;
    BackwardLineReader &operator=(BackwardLineReader &&other) noexcept;

    /**
     * Fetch the next line without copying
     */
    LineView next_line_bytes();

    /**
     * Fetch the next line as an owned string
     */
    Line next_line();

    /**
     * Feed the remaining lines to `processor`, newest first
     * @return the terminal status, or OK when the processor stopped early
     */
    LineStatus for_each_line(LineProcessor &processor);

    /**
     * Close the source if it supports closing, otherwise do nothing
     */
    void close();

    std::size_t cursor() const;
    std::size_t buffered_bytes() const;
    LineStatus status() const;
    std::size_t chunk_size() const;
    std::size_t max_buffer_size() const;

    bool is_valid() const;

   private:
    std::unique_ptr<BackwardLineReaderImplementor> p_impl_;
};

}  // namespace backscan
#endif

#endif  // BACKSCAN_READER_BACKWARD_READER_H
