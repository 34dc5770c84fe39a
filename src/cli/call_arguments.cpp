#include <mcpcmd/cli/call_arguments.h>

#include <charconv>
#include <cmath>
#include <cstdint>
#include <optional>

namespace mcpcmd::cli {

namespace {

bool is_option(std::string_view word) {
    return word.size() > 1 && word.front() == '-' && word != "--";
}

void assign(json& target, const std::string& key, json value) {
    auto it = target.find(key);
    if (it == target.end()) {
        target[key] = std::move(value);
        return;
    }
    if (!it->is_array()) {
        json collected = json::array();
        collected.push_back(std::move(*it));
        *it = std::move(collected);
    }
    it->push_back(std::move(value));
}

} // namespace

json coerce_scalar(std::string_view text) {
    if (text == "true")
        return true;
    if (text == "false")
        return false;
    if (text == "null")
        return nullptr;
    if (text.empty())
        return std::string();

    const char* begin = text.data();
    const char* end = text.data() + text.size();
    std::int64_t integer = 0;
    auto [iptr, iec] = std::from_chars(begin, end, integer);
    if (iec == std::errc{} && iptr == end) {
        return integer;
    }
    double real = 0.0;
    auto [dptr, dec] = std::from_chars(begin, end, real);
    if (dec == std::errc{} && dptr == end && std::isfinite(real)) {
        return real;
    }
    return std::string(text);
}

Result<json> build_call_arguments(const std::vector<std::string>& words) {
    json named = json::object();
    std::string positional;
    bool onlyPositional = false;

    for (std::size_t i = 0; i < words.size(); ++i) {
        const std::string& word = words[i];
        if (onlyPositional || !is_option(word)) {
            if (!positional.empty())
                positional += ' ';
            positional += word;
            continue;
        }
        if (word == "--") {
            onlyPositional = true;
            continue;
        }

        const bool isLong = word.starts_with("--");
        std::string body = word.substr(isLong ? 2 : 1);
        std::optional<std::string> inlineValue;
        if (auto eq = body.find('='); eq != std::string::npos) {
            inlineValue = body.substr(eq + 1);
            body.resize(eq);
        }
        if (body.empty()) {
            return Error{ErrorCode::InvalidArgument, "Invalid argument: " + word};
        }

        // -abc sets a and b, c takes the value
        std::string key = body;
        if (!isLong && body.size() > 1) {
            for (std::size_t k = 0; k + 1 < body.size(); ++k) {
                assign(named, std::string(1, body[k]), true);
            }
            key = body.substr(body.size() - 1);
        }

        if (inlineValue) {
            assign(named, key, coerce_scalar(*inlineValue));
            continue;
        }
        if (isLong && key.starts_with("no-") && key.size() > 3) {
            assign(named, key.substr(3), false);
            continue;
        }
        if (i + 1 < words.size() && !is_option(words[i + 1]) && words[i + 1] != "--") {
            assign(named, key, coerce_scalar(words[++i]));
            continue;
        }
        assign(named, key, true);
    }

    if (!positional.empty()) {
        json parsed = json::parse(positional, nullptr, false);
        if (parsed.is_discarded()) {
            return Error{ErrorCode::InvalidArgument,
                         "Positional arguments are not valid JSON: " + positional};
        }
        if (!parsed.is_object()) {
            return Error{ErrorCode::InvalidArgument,
                         "Positional arguments must form a JSON object, got " +
                             std::string(parsed.type_name())};
        }
        for (auto it = parsed.begin(); it != parsed.end(); ++it) {
            named[it.key()] = it.value();
        }
    }
    return named;
}

} // namespace mcpcmd::cli
