#ifndef BACKSCAN_READER_LINE_PROCESSOR_H
#define BACKSCAN_READER_LINE_PROCESSOR_H

#ifdef __cplusplus
extern "C" {
#endif

#include <stddef.h>

/**
 * Line callback for the C API.
 * @param data Line bytes, valid only for the duration of the call
 * @param length Number of bytes in the line
 * @param position Absolute offset of the line's first byte
 * @param user_data Pointer passed through from the caller
 * @return non-zero to continue, 0 to stop
 */
typedef int (*backscan_line_processor_callback_t)(const char *data,
                                                  size_t length,
                                                  size_t position,
                                                  void *user_data);

#ifdef __cplusplus
}  // extern "C"

#include <cstddef>
#include <string>
#include <vector>

namespace backscan {

/**
 * Receives lines newest-first from BackwardLineReader::for_each_line.
 * `data` points into reader storage and is valid only inside process().
 * end() is called once for every begin(), including when the iteration
 * ends with an exception.
 */
class LineProcessor {
   public:
    virtual ~LineProcessor() = default;

    /**
     * Process one line
     * @return true to continue, false to stop the iteration
     */
    virtual bool process(const char *data, std::size_t length,
                         std::size_t position) = 0;

    virtual void begin(std::size_t start_offset) { (void)start_offset; }
    virtual void end() {}
};

/**
 * Collects lines (and their positions) into vectors, optionally stopping
 * after `limit` lines. A limit of 0 means no limit.
 */
class StringLineProcessor : public LineProcessor {
   public:
    explicit StringLineProcessor(std::size_t limit = 0) : limit_(limit) {}

    bool process(const char *data, std::size_t length,
                 std::size_t position) override {
        lines_.emplace_back(data, length);
        positions_.push_back(position);
        return limit_ == 0 || lines_.size() < limit_;
    }

    void begin(std::size_t start_offset) override {
        (void)start_offset;
        lines_.clear();
        positions_.clear();
    }

    const std::vector<std::string> &lines() const { return lines_; }
    const std::vector<std::size_t> &positions() const { return positions_; }

   private:
    std::size_t limit_;
    std::vector<std::string> lines_;
    std::vector<std::size_t> positions_;
};

class CallbackLineProcessor : public LineProcessor {
   public:
    CallbackLineProcessor(backscan_line_processor_callback_t callback,
                          void *user_data)
        : callback_(callback), user_data_(user_data) {}

    bool process(const char *data, std::size_t length,
                 std::size_t position) override {
        return callback_(data, length, position, user_data_) != 0;
    }

   private:
    backscan_line_processor_callback_t callback_;
    void *user_data_;
};

}  // namespace backscan
#endif

#endif  // BACKSCAN_READER_LINE_PROCESSOR_H
