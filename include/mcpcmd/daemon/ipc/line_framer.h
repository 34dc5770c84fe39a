#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include <mcpcmd/core/types.h>

namespace mcpcmd::daemon {

/**
 * Newline-delimited framing for the local socket protocol.
 *
 * `split_lines` is the pure step: given the partial line retained from earlier reads and the
 * bytes of a new read, it returns every complete line (without its '\n') and the new
 * remainder. `LineFramer` keeps that remainder between reads for one connection.
 */
struct SplitResult {
    std::vector<std::string> lines;
    std::string remainder;
};

SplitResult split_lines(std::string_view buffered, std::string_view incoming);

class LineFramer {
public:
    static constexpr std::size_t kDefaultMaxLineBytes = 16 * 1024 * 1024;

    explicit LineFramer(std::size_t maxLineBytes = kDefaultMaxLineBytes)
        : maxLineBytes_(maxLineBytes) {}

    // Append bytes and return the lines they complete. Fails with MalformedMessage when the
    // pending partial line grows beyond the configured limit; the framer is then unusable
    // until reset().
    Result<std::vector<std::string>> feed(std::string_view bytes);

    const std::string& pending() const noexcept { return buffer_; }
    bool has_pending() const noexcept { return !buffer_.empty(); }
    void reset() noexcept { buffer_.clear(); }

private:
    std::size_t maxLineBytes_;
    std::string buffer_;
};

// True when the line holds nothing but whitespace.
bool is_blank_line(std::string_view line) noexcept;

} // namespace mcpcmd::daemon
