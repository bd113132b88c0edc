#include "scanner.hpp"

#include <filesystem>
#include <system_error>
#include <vector>

#include "git_utils.hpp"
#include "ignore_utils.hpp"

namespace fs = std::filesystem;

namespace {

void walk(const fs::path& current, std::size_t depth, std::size_t max_depth,
          const std::vector<std::string>& ignore, std::vector<fs::path>& result) {
    if (depth > max_depth || ignore::matches_token(current.string(), ignore))
        return;
    if (git::is_git_repo(current)) {
        result.push_back(current);
        return;
    }
    std::error_code ec;
    fs::directory_iterator it(current, fs::directory_options::skip_permission_denied, ec);
    if (ec)
        return;
    std::vector<fs::path> children;
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec)
            break;
        auto st = it->symlink_status(ec);
        if (ec) {
            ec.clear();
            continue;
        }
        if (fs::is_symlink(st) || !fs::is_directory(st))
            continue;
        if (it->path().filename() == ".git")
            continue;
        children.push_back(it->path());
    }
    for (const auto& child : children)
        walk(child, depth + 1, max_depth, ignore, result);
}

} // namespace

std::vector<fs::path> find_native_repositories(const fs::path& root,
                                               const std::vector<std::string>& ignore,
                                               std::size_t max_depth) {
    std::vector<fs::path> result;
    if (root.empty())
        return result;
    std::error_code ec;
    if (!fs::is_directory(root, ec))
        return result;
    walk(root.lexically_normal(), 0, max_depth, ignore, result);
    return result;
}
