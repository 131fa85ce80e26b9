#pragma once

#include <string>
#include <string_view>

namespace tzupdater {

// Normalize tar path to a clean relative form:
// - strip leading "./"
// - strip leading "/" (avoid absolute)
// - collapse duplicate slashes
// - drop a trailing "/"
inline std::string NormalizeTarPath(std::string s) {
    while (s.rfind("./", 0) == 0) s.erase(0, 2);
    while (!s.empty() && s.front() == '/') s.erase(0, 1);

    std::string out;
    out.reserve(s.size());
    bool prev_slash = false;
    for (char c : s) {
        const bool slash = (c == '/');
        if (slash && prev_slash) continue;
        out.push_back(c);
        prev_slash = slash;
    }
    if (out.size() > 1 && out.back() == '/') out.pop_back();
    return out;
}

// Splits `text` on '\n', dropping '\r' and empty lines.
template <typename Fn>
void ForEachLine(std::string_view text, Fn&& fn) {
    while (!text.empty()) {
        const auto pos = text.find('\n');
        std::string_view line = text.substr(0, pos);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        if (!line.empty()) fn(line);
        if (pos == std::string_view::npos) break;
        text.remove_prefix(pos + 1);
    }
}

} // namespace tzupdater
