// json_pointer.cpp - RFC 6901 rendering of Path

#include <json_diff/json_pointer.h>

namespace json_diff {

namespace {

void append_escaped(std::string& out, const std::string& key)
{
    for (char c : key) {
        switch (c) {
            case '~': out += "~0"; break;
            case '/': out += "~1"; break;
            default:  out += c;
        }
    }
}

} // anonymous namespace

std::string path_to_json_pointer(const Path& path)
{
    std::string result;
    for (const auto& elem : path) {
        result += '/';
        if (auto* key = std::get_if<std::string>(&elem)) {
            append_escaped(result, *key);
        } else {
            result += std::to_string(std::get<std::size_t>(elem));
        }
    }
    return result;
}

} // namespace json_diff
