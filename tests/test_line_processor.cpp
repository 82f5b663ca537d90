#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <backscan/reader/backward_reader.h>
#include <backscan/reader/error.h>
#include <backscan/reader/line_processor.h>
#include <backscan/source/memory_source.h>
#include <doctest/doctest.h>

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "testing_utilities.h"

using namespace backscan;
using namespace backscan_test;

namespace {

class RecordingProcessor : public LineProcessor {
   public:
    explicit RecordingProcessor(std::string stop_at = "")
        : stop_at_(std::move(stop_at)) {}

    bool process(const char *data, std::size_t length,
                 std::size_t position) override {
        events.push_back("line:" + std::string(data, length) + "@" +
                         std::to_string(position));
        return std::string(data, length) != stop_at_;
    }

    void begin(std::size_t start_offset) override {
        events.push_back("begin:" + std::to_string(start_offset));
    }

    void end() override { events.push_back("end"); }

    std::vector<std::string> events;

   private:
    std::string stop_at_;
};

}  // namespace

TEST_CASE("LineProcessor - Visits every line newest first") {
    const std::string input = "Start\nLine1\nLine2\nLine3\nEnd";
    MemorySource source(input);
    BackwardLineReader reader(source, input.size());

    RecordingProcessor processor;
    LineStatus status = reader.for_each_line(processor);

    CHECK(status == LineStatus::END_OF_SOURCE);
    CHECK(processor.events ==
          std::vector<std::string>{"begin:27", "line:End@23", "line:Line3@17",
                                   "line:Line2@11", "line:Line1@5",
                                   "line:Start@0", "end"});
}

TEST_CASE("LineProcessor - Early stop") {
    const std::string input = "Start\nLine1\nLine2\nLine3\nEnd";
    MemorySource source(input);
    BackwardLineReader reader(source, input.size());

    RecordingProcessor processor("Line2");
    CHECK(reader.for_each_line(processor) == LineStatus::OK);
    CHECK(processor.events.size() == 5);
    CHECK(processor.events.back() == "end");

    // The reader resumes after the line that stopped the iteration
    Line next = reader.next_line();
    CHECK(next.data == "Line1");
    CHECK(next.position == 5);

    RecordingProcessor rest;
    CHECK(reader.for_each_line(rest) == LineStatus::END_OF_SOURCE);
    CHECK(rest.events ==
          std::vector<std::string>{"begin:5", "line:Start@0", "end"});
}

TEST_CASE("LineProcessor - Buffer limit ends the iteration") {
    const std::string input = std::string(64, 'z') + "\nok";
    MemorySource source(input);
    BackwardLineReader::Config config;
    config.chunk_size = 8;
    config.max_buffer_size = 32;
    BackwardLineReader reader(source, input.size(), config);

    StringLineProcessor processor;
    CHECK(reader.for_each_line(processor) ==
          LineStatus::BUFFER_SIZE_EXCEEDED);
    CHECK(processor.lines() == std::vector<std::string>{"ok"});
}

TEST_CASE("LineProcessor - StringLineProcessor limit") {
    const std::string input = make_log_text(50, true, false);
    std::vector<ExpectedLine> expected = expected_backward_lines(input);

    MemorySource source(input);
    BackwardLineReader::Config config;
    config.chunk_size = 17;
    BackwardLineReader reader(source, input.size(), config);

    StringLineProcessor processor(10);
    CHECK(reader.for_each_line(processor) == LineStatus::OK);
    REQUIRE(processor.lines().size() == 10);
    for (std::size_t i = 0; i < 10; ++i) {
        CHECK(processor.lines()[i] == expected[i].line);
        CHECK(processor.positions()[i] == expected[i].position);
    }

    StringLineProcessor all;
    CHECK(reader.for_each_line(all) == LineStatus::END_OF_SOURCE);
    CHECK(all.lines().size() == expected.size() - 10);
}

TEST_CASE("LineProcessor - Read failures propagate") {
    const std::string input = make_log_text(10, false, false);
    ScriptedSource source(input);
    source.fail_on_read(2);
    BackwardLineReader::Config config;
    config.chunk_size = 4;
    BackwardLineReader reader(source, input.size(), config);

    RecordingProcessor processor;
    CHECK_THROWS_AS(reader.for_each_line(processor), ReaderError);
    REQUIRE(processor.events.size() == 2);
    CHECK(processor.events.front() == "begin:" + std::to_string(input.size()));
    CHECK(processor.events.back() == "end");
    CHECK_THROWS_AS(reader.for_each_line(processor), ReaderError);
    CHECK(processor.events.back() == "end");
}

TEST_CASE("LineProcessor - end() runs when process() throws") {
    class ThrowingProcessor : public RecordingProcessor {
       public:
        bool process(const char *data, std::size_t length,
                     std::size_t position) override {
            RecordingProcessor::process(data, length, position);
            throw std::runtime_error("rejected line");
        }
    };

    MemorySource source("first\nsecond\nthird");
    BackwardLineReader reader(source, source.size());
    ThrowingProcessor processor;

    CHECK_THROWS_WITH_AS(reader.for_each_line(processor), "rejected line",
                         std::runtime_error);
    REQUIRE(processor.events.size() == 3);
    CHECK(processor.events[0] == "begin:18");
    CHECK(processor.events[1] == "line:third@13");
    CHECK(processor.events[2] == "end");

    // The reader itself is not latched by a processor failure
    auto line = reader.next_line();
    CHECK(line.status == LineStatus::OK);
    CHECK(line.data == "second");
}
