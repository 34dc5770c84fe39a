#include <mcpcmd/daemon/ipc/line_framer.h>

#include <algorithm>
#include <cctype>

namespace mcpcmd::daemon {

SplitResult split_lines(std::string_view buffered, std::string_view incoming) {
    SplitResult out;

    auto newline = incoming.find('\n');
    if (newline == std::string_view::npos) {
        out.remainder.reserve(buffered.size() + incoming.size());
        out.remainder.append(buffered);
        out.remainder.append(incoming);
        return out;
    }

    // First line completes whatever was buffered
    std::string first;
    first.reserve(buffered.size() + newline);
    first.append(buffered);
    first.append(incoming.substr(0, newline));
    out.lines.push_back(std::move(first));

    std::size_t start = newline + 1;
    while ((newline = incoming.find('\n', start)) != std::string_view::npos) {
        out.lines.emplace_back(incoming.substr(start, newline - start));
        start = newline + 1;
    }
    out.remainder.assign(incoming.substr(start));
    return out;
}

Result<std::vector<std::string>> LineFramer::feed(std::string_view bytes) {
    auto split = split_lines(buffer_, bytes);
    buffer_ = std::move(split.remainder);
    if (buffer_.size() > maxLineBytes_) {
        buffer_.clear();
        return Error{ErrorCode::MalformedMessage,
                     "Request line exceeds " + std::to_string(maxLineBytes_) + " bytes"};
    }
    return std::move(split.lines);
}

bool is_blank_line(std::string_view line) noexcept {
    return std::all_of(line.begin(), line.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

} // namespace mcpcmd::daemon
