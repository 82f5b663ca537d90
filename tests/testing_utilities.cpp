#include "testing_utilities.h"

#include <backscan/reader/error.h>
#include <backscan/utils/logger.h>

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <random>

namespace fs = std::filesystem;

namespace backscan_test {

std::vector<ExpectedLine> expected_backward_lines(const std::string &input) {
    std::vector<ExpectedLine> forward;
    std::size_t start = 0;
    while (true) {
        std::size_t separator = input.find('\n', start);
        std::string raw = input.substr(
            start, separator == std::string::npos ? std::string::npos
                                                  : separator - start);
        // The earliest piece only counts when it holds at least one byte
        if (start > 0 || !raw.empty()) {
            if (!raw.empty() && raw.back() == '\r') {
                raw.pop_back();
            }
            forward.push_back(ExpectedLine{raw, start});
        }
        if (separator == std::string::npos) {
            break;
        }
        start = separator + 1;
    }

    std::reverse(forward.begin(), forward.end());
    return forward;
}

std::vector<ExpectedLine> drain(backscan::BackwardLineReader &reader,
                                backscan::LineStatus &terminal) {
    std::vector<ExpectedLine> lines;
    while (true) {
        backscan::Line line = reader.next_line();
        if (!line.ok()) {
            terminal = line.status;
            return lines;
        }
        lines.push_back(ExpectedLine{line.data, line.position});
    }
}

std::string make_log_text(std::size_t lines, bool crlf,
                          bool trailing_newline) {
    std::string text;
    for (std::size_t i = 0; i < lines; ++i) {
        if (i > 0) {
            text += crlf ? "\r\n" : "\n";
        }
        text += "{\"id\": " + std::to_string(i) +
                ", \"level\": \"info\", \"message\": \"request " +
                std::string(i % 17, 'x') + "\"}";
    }
    if (trailing_newline && lines > 0) {
        text += crlf ? "\r\n" : "\n";
    }
    return text;
}

ScriptedSource::ScriptedSource(std::string data, EofMode eof_mode)
    : data_(std::move(data)),
      eof_mode_(eof_mode),
      closable_(false),
      fail_on_read_(0),
      short_read_on_(0),
      short_read_missing_(0),
      short_read_eof_(false),
      close_calls_(0) {}

backscan::ReadResult ScriptedSource::read_at(std::size_t offset,
                                             char *buffer, std::size_t size) {
    reads_.emplace_back(offset, size);
    std::size_t call = reads_.size();

    if (call == fail_on_read_) {
        throw backscan::ReaderError(backscan::ReaderError::READ_ERROR,
                                    "injected failure on read " +
                                        std::to_string(call));
    }

    std::size_t available = offset < data_.size() ? data_.size() - offset : 0;
    std::size_t n = std::min(size, available);
    bool eof = false;
    if (call == short_read_on_) {
        n = short_read_missing_ < n ? n - short_read_missing_ : 0;
        eof = short_read_eof_;
    } else if (n < size) {
        eof = true;
    } else if (eof_mode_ == EofMode::AT_END) {
        eof = offset + n == data_.size();
    } else if (eof_mode_ == EofMode::ALWAYS) {
        eof = true;
    }

    if (n > 0) {
        std::memcpy(buffer, data_.data() + offset, n);
    }
    return backscan::ReadResult{n, eof};
}

TestEnvironment::TestEnvironment() {
    backscan::utils::logger::set_log_level("warn");
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(100000, 999999);

    fs::path test_path =
        fs::temp_directory_path() / ("backscan_test_" + std::to_string(dis(gen)));

    std::error_code ec;
    if (fs::create_directories(test_path, ec)) {
        test_dir = test_path.string();
    }
}

TestEnvironment::~TestEnvironment() {
    if (!test_dir.empty()) {
        std::error_code ec;
        fs::remove_all(test_dir, ec);
    }
}

const std::string &TestEnvironment::get_dir() const { return test_dir; }

bool TestEnvironment::is_valid() const { return !test_dir.empty(); }

std::string TestEnvironment::create_file(const std::string &name,
                                         const std::string &content) {
    if (test_dir.empty()) {
        return "";
    }
    std::string path = (fs::path(test_dir) / name).string();
    std::ofstream out(path, std::ios::binary);
    if (!out.is_open()) {
        return "";
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.close();
    return out ? path : "";
}

}  // namespace backscan_test
