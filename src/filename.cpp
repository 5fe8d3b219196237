#include "imgmgr/filename.hpp"
#include "imgmgr/cache_store.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>

namespace imgmgr {

static inline bool is_space(unsigned char ch) {
    return std::isspace(ch) != 0;
}

std::string file_extension(std::string_view filename)
{
    const std::size_t dot = filename.rfind('.');
    std::string ext(dot == std::string_view::npos ? filename : filename.substr(dot + 1));
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return ext;
}

std::string file_stem(std::string_view filename)
{
    const std::size_t dot = filename.rfind('.');
    return std::string(dot == std::string_view::npos ? filename : filename.substr(0, dot));
}

std::string substitute_extension(std::string_view filename, std::string_view format)
{
    const std::size_t dot = filename.rfind('.');
    if (dot == std::string_view::npos || dot == 0) {
        return std::string(filename) + "." + std::string(format);
    }
    return std::string(filename.substr(0, dot + 1)) + std::string(format);
}

std::string slug(std::string_view filename)
{
    // '_' 連續出現 → 一個 '-'；'@' → "-at-"
    std::string s;
    s.reserve(filename.size() + 8);
    for (std::size_t i = 0; i < filename.size(); ++i) {
        const char ch = filename[i];
        if (ch == '_') {
            if (i == 0 || filename[i - 1] != '_') s.push_back('-');
        } else if (ch == '@') {
            s += "-at-";
        } else {
            s.push_back(ch);
        }
    }

    // 轉小寫，只留下 '-'、'.'、文字、數字、空白
    std::string kept;
    kept.reserve(s.size());
    for (unsigned char ch : s) {
        if (ch >= 0x80) {
            kept.push_back(static_cast<char>(ch));
        } else if (ch == '-' || ch == '.' || std::isalnum(ch) || is_space(ch)) {
            kept.push_back(static_cast<char>(std::tolower(ch)));
        }
    }

    // '-' 與空白連續出現 → 一個 '-'
    std::string out;
    out.reserve(kept.size());
    bool in_sep = false;
    for (unsigned char ch : kept) {
        if (ch == '-' || is_space(ch)) {
            if (!in_sep) out.push_back('-');
            in_sep = true;
        } else {
            out.push_back(static_cast<char>(ch));
            in_sep = false;
        }
    }

    const std::size_t first = out.find_first_not_of('-');
    if (first == std::string::npos) return {};
    const std::size_t last = out.find_last_not_of('-');
    return out.substr(first, last - first + 1);
}

// 8 位秒數 + 5 位微秒，共 13 位 hex
static std::string time_based_id()
{
    using namespace std::chrono;
    const auto us = duration_cast<microseconds>(system_clock::now().time_since_epoch()).count();
    const unsigned long long secs  = static_cast<unsigned long long>(us / 1000000);
    const unsigned long long micro = static_cast<unsigned long long>(us % 1000000);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%08llx%05llx", secs & 0xFFFFFFFFull, micro);
    return buf;
}

std::string unique_filename(std::string_view filename,
                            const std::filesystem::path& destination,
                            const CacheStore& store)
{
    std::string name = slug(filename);

    while (store.exists(destination / name)) {
        const std::size_t dot = name.find('.');
        if (dot == std::string::npos) {
            name += "-" + time_based_id();
        } else {
            name = name.substr(0, dot) + "-" + time_based_id() + "." + file_extension(name);
        }
    }
    return name;
}

} // namespace imgmgr
