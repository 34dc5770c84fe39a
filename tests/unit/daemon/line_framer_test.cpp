// Newline framing of the local socket protocol

#include <catch2/catch_test_macros.hpp>

#include <mcpcmd/daemon/ipc/line_framer.h>

using namespace mcpcmd::daemon;

TEST_CASE("split_lines returns complete lines and keeps the partial tail",
          "[daemon][framing]") {
    auto out = split_lines("", "{\"a\":1}\n{\"b\":2}\n{\"c\"");
    REQUIRE(out.lines.size() == 2);
    CHECK(out.lines[0] == "{\"a\":1}");
    CHECK(out.lines[1] == "{\"b\":2}");
    CHECK(out.remainder == "{\"c\"");
}

TEST_CASE("split_lines completes the buffered prefix", "[daemon][framing]") {
    auto out = split_lines("{\"id\":", "\"x\"}\n");
    REQUIRE(out.lines.size() == 1);
    CHECK(out.lines[0] == "{\"id\":\"x\"}");
    CHECK(out.remainder.empty());
}

TEST_CASE("split_lines without a newline only grows the remainder", "[daemon][framing]") {
    auto out = split_lines("abc", "def");
    CHECK(out.lines.empty());
    CHECK(out.remainder == "abcdef");
}

TEST_CASE("split_lines keeps empty lines for the caller to skip", "[daemon][framing]") {
    auto out = split_lines("", "\n\nx\n");
    REQUIRE(out.lines.size() == 3);
    CHECK(out.lines[0].empty());
    CHECK(out.lines[1].empty());
    CHECK(out.lines[2] == "x");
}

TEST_CASE("LineFramer yields the same lines however the bytes are chunked",
          "[daemon][framing]") {
    const std::string stream = "{\"id\":\"1\",\"method\":\"listTools\"}\n"
                               "{\"id\":\"2\",\"method\":\"callTool\"}\n";

    for (std::size_t chunk : {std::size_t{1}, std::size_t{3}, std::size_t{7}, stream.size()}) {
        LineFramer framer;
        std::vector<std::string> lines;
        for (std::size_t pos = 0; pos < stream.size(); pos += chunk) {
            auto fed = framer.feed(std::string_view(stream).substr(pos, chunk));
            REQUIRE(fed);
            for (auto& line : fed.value())
                lines.push_back(line);
        }
        INFO("chunk size " << chunk);
        REQUIRE(lines.size() == 2);
        CHECK(lines[0] == "{\"id\":\"1\",\"method\":\"listTools\"}");
        CHECK(lines[1] == "{\"id\":\"2\",\"method\":\"callTool\"}");
        CHECK_FALSE(framer.has_pending());
    }
}

TEST_CASE("LineFramer rejects a partial line beyond the limit", "[daemon][framing]") {
    LineFramer framer(8);
    auto ok = framer.feed("1234");
    REQUIRE(ok);
    CHECK(framer.pending() == "1234");

    auto tooLong = framer.feed("56789");
    REQUIRE_FALSE(tooLong);
    CHECK(tooLong.error().code == mcpcmd::ErrorCode::MalformedMessage);
    CHECK_FALSE(framer.has_pending());
}

TEST_CASE("is_blank_line", "[daemon][framing]") {
    CHECK(is_blank_line(""));
    CHECK(is_blank_line("  \t\r"));
    CHECK_FALSE(is_blank_line(" {} "));
}
