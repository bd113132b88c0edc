#include "scanner.hpp"

#include <sstream>

#include "environment.hpp"
#include "ignore_utils.hpp"

std::string guest_find_script(const std::string& root) {
    const std::string quoted = env::shell_escape(root);
    return "if [ -d " + quoted + " ]; then find " + quoted +
           " -type d -name .git -prune 2>/dev/null; fi";
}

std::vector<std::string> parse_guest_find_output(const std::string& output,
                                                 const std::vector<std::string>& ignore) {
    static const std::string kSuffix = "/.git";
    std::vector<std::string> repos;
    std::istringstream in(output);
    std::string line;
    while (std::getline(in, line)) {
        while (!line.empty() && (line.back() == '\r' || line.back() == ' ' || line.back() == '\t'))
            line.pop_back();
        auto first = line.find_first_not_of(" \t");
        if (first == std::string::npos)
            continue;
        line.erase(0, first);
        if (ignore::matches_token(line, ignore))
            continue;
        if (line.size() > kSuffix.size() &&
            line.compare(line.size() - kSuffix.size(), kSuffix.size(), kSuffix) == 0)
            line.erase(line.size() - kSuffix.size());
        repos.push_back(line);
    }
    return repos;
}
