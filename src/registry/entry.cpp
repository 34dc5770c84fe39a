#include <mcpcmd/registry/entry.h>

#include <cctype>
#include <chrono>
#include <ctime>
#include <format>

namespace mcpcmd::registry {

namespace {

bool is_scheme_char(unsigned char c) {
    return std::isalnum(c) != 0 || c == '+' || c == '-' || c == '.';
}

std::string percent_encode_spaces(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == ' ')
            out += "%20";
        else
            out.push_back(c);
    }
    return out;
}

Result<std::vector<std::string>> string_array(const json& doc, const char* key) {
    std::vector<std::string> out;
    auto it = doc.find(key);
    if (it == doc.end() || it->is_null())
        return out;
    if (!it->is_array())
        return Error{ErrorCode::CorruptedData, std::string(key) + " must be an array"};
    for (const auto& item : *it) {
        if (!item.is_string())
            return Error{ErrorCode::CorruptedData, std::string(key) + " must hold strings"};
        out.push_back(item.get<std::string>());
    }
    return out;
}

} // namespace

bool looks_like_url(std::string_view text) {
    if (text.empty() || std::isalpha(static_cast<unsigned char>(text.front())) == 0)
        return false;
    auto colon = text.find("://");
    if (colon == std::string_view::npos || colon == 0)
        return false;
    for (std::size_t i = 0; i < colon; ++i) {
        if (!is_scheme_char(static_cast<unsigned char>(text[i])))
            return false;
    }
    auto rest = text.substr(colon + 3);
    auto authorityEnd = rest.find_first_of("/?#");
    auto authority = rest.substr(0, authorityEnd);
    if (authority.empty())
        return false;
    for (unsigned char c : authority) {
        if (std::isspace(c) != 0)
            return false;
    }
    return true;
}

Result<LaunchSpec> make_launch_spec(const std::vector<std::string>& targetWords,
                                    std::filesystem::path cwd,
                                    std::map<std::string, std::string> env) {
    if (targetWords.empty() || targetWords.front().empty()) {
        return Error{ErrorCode::InvalidArgument, "A URL or command is required"};
    }

    std::string joined;
    for (const auto& word : targetWords) {
        if (!joined.empty())
            joined.push_back(' ');
        joined += word;
    }

    LaunchSpec spec;
    spec.cwd = std::move(cwd);
    spec.env = std::move(env);
    if (looks_like_url(joined)) {
        spec.target = RemoteEndpoint{percent_encode_spaces(joined)};
    } else {
        LocalSpawn local;
        local.command = targetWords.front();
        local.args.assign(targetWords.begin() + 1, targetWords.end());
        spec.target = std::move(local);
    }
    return spec;
}

Result<std::map<std::string, std::string>> parse_env_assignments(
    const std::vector<std::string>& assignments) {
    std::map<std::string, std::string> env;
    for (const auto& assignment : assignments) {
        auto eq = assignment.find('=');
        std::string key = assignment.substr(0, eq);
        if (key.empty()) {
            return Error{ErrorCode::InvalidArgument,
                         "Environment assignment must look like KEY=VALUE: '" + assignment + "'"};
        }
        env[key] = eq == std::string::npos ? std::string{} : assignment.substr(eq + 1);
    }
    return env;
}

json launch_spec_to_json(const LaunchSpec& spec) {
    json doc = json::object();
    if (const auto* local = spec.local()) {
        doc["command"] = local->command;
        doc["args"] = local->args;
    } else if (const auto* remote = spec.remote()) {
        doc["url"] = remote->url;
    }
    json env = json::object();
    for (const auto& [key, value] : spec.env)
        env[key] = value;
    doc["env"] = std::move(env);
    doc["cwd"] = spec.cwd.string();
    return doc;
}

Result<LaunchSpec> launch_spec_from_json(const json& doc) {
    if (!doc.is_object())
        return Error{ErrorCode::CorruptedData, "Launch spec must be an object"};

    LaunchSpec spec;
    auto url = doc.find("url");
    auto command = doc.find("command");
    if (url != doc.end() && url->is_string() && !url->get<std::string>().empty()) {
        spec.target = RemoteEndpoint{url->get<std::string>()};
    } else if (command != doc.end() && command->is_string() &&
               !command->get<std::string>().empty()) {
        auto args = string_array(doc, "args");
        if (!args)
            return args.error();
        spec.target = LocalSpawn{command->get<std::string>(), std::move(args).value()};
    } else {
        return Error{ErrorCode::CorruptedData, "Launch spec needs either a url or a command"};
    }

    if (auto cwd = doc.find("cwd"); cwd != doc.end() && cwd->is_string())
        spec.cwd = cwd->get<std::string>();

    if (auto env = doc.find("env"); env != doc.end() && !env->is_null()) {
        if (!env->is_object())
            return Error{ErrorCode::CorruptedData, "env must be an object"};
        for (const auto& [key, value] : env->items()) {
            if (!value.is_string())
                return Error{ErrorCode::CorruptedData, "env values must be strings"};
            spec.env[key] = value.get<std::string>();
        }
    }
    return spec;
}

json entry_to_json(const Entry& entry) {
    json doc = launch_spec_to_json(entry.launchSpec);
    doc["pid"] = entry.pid;
    doc["socketPath"] = entry.socketAddress.string();
    doc["started"] = entry.startedAt;
    return doc;
}

Result<Entry> entry_from_json(const std::string& name, const json& doc) {
    auto spec = launch_spec_from_json(doc);
    if (!spec)
        return Error{spec.error().code, "Entry '" + name + "': " + spec.error().message};

    auto pid = doc.find("pid");
    if (pid == doc.end() || !pid->is_number_integer() || pid->get<std::int64_t>() <= 0)
        return Error{ErrorCode::CorruptedData, "Entry '" + name + "' has no valid pid"};

    Entry entry;
    entry.name = name;
    entry.launchSpec = std::move(spec).value();
    entry.pid = pid->get<std::int64_t>();
    if (auto sock = doc.find("socketPath"); sock != doc.end() && sock->is_string())
        entry.socketAddress = sock->get<std::string>();
    if (auto started = doc.find("started"); started != doc.end() && started->is_string())
        entry.startedAt = started->get<std::string>();
    return entry;
}

std::string format_timestamp(TimePoint tp) {
    auto ms = std::chrono::floor<std::chrono::milliseconds>(tp);
    return std::format("{:%Y-%m-%dT%H:%M:%S}Z", ms);
}

} // namespace mcpcmd::registry
