#include "ignore_utils.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace {

void trim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

namespace ignore {

bool matches_token(const std::string& path, const std::vector<std::string>& tokens) {
    const std::string haystack = lower(path);
    for (auto token : tokens) {
        trim(token);
        if (token.empty())
            continue;
        if (haystack.find(lower(token)) != std::string::npos)
            return true;
    }
    return false;
}

std::vector<std::string> split_list(const std::string& text) {
    std::vector<std::string> out;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        trim(item);
        if (!item.empty())
            out.push_back(item);
    }
    return out;
}

} // namespace ignore
