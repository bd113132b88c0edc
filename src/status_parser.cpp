#include "status_parser.hpp"
#include <cctype>
#include <charconv>
#include <limits>
#include <sstream>
#include <system_error>

namespace git {

namespace {

const std::string kUnbornPrefix = "No commits yet on ";
const std::string kLegacyUnbornPrefix = "Initial commit on ";
const std::string kRenameArrow = " -> ";

std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return s.substr(b, e - b);
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

// Reads the integer after `key ` in the bracketed tracking detail.
int detail_count(const std::string& detail, const std::string& key) {
    auto pos = detail.find(key + " ");
    if (pos == std::string::npos)
        return 0;
    pos += key.size() + 1;
    const char* first = detail.data() + pos;
    const char* last = detail.data() + detail.size();
    int value = 0;
    const auto result = std::from_chars(first, last, value);
    if (result.ec == std::errc::result_out_of_range)
        return std::numeric_limits<int>::max();
    if (result.ec != std::errc() || value < 0)
        return 0;
    return value;
}

std::string post_rename_path(const std::string& raw) {
    auto arrow = raw.find(kRenameArrow);
    if (arrow == std::string::npos)
        return raw;
    return raw.substr(arrow + kRenameArrow.size());
}

} // namespace

BranchHeader parse_branch_header(const std::string& header) {
    BranchHeader h;
    const std::string summary = trim(header);
    if (starts_with(summary, "HEAD (")) {
        h.kind = HeaderKind::Detached;
        h.branch = "detached";
        return h;
    }
    for (const auto* prefix : {&kUnbornPrefix, &kLegacyUnbornPrefix}) {
        if (starts_with(summary, *prefix)) {
            std::string name = summary.substr(prefix->size());
            auto dots = name.find("...");
            if (dots != std::string::npos)
                name = name.substr(0, dots);
            h.kind = HeaderKind::Unborn;
            h.branch = trim(name);
            return h;
        }
    }
    auto dots = summary.find("...");
    std::string local = trim(dots == std::string::npos ? summary : summary.substr(0, dots));
    h.branch = local.empty() ? "unknown" : local;
    if (dots == std::string::npos) {
        h.kind = HeaderKind::NoUpstream;
        return h;
    }
    h.kind = HeaderKind::Tracking;
    std::string remote = summary.substr(dots + 3);
    auto open = remote.find('[');
    auto close = open == std::string::npos ? std::string::npos : remote.find(']', open);
    h.upstream = trim(open == std::string::npos ? remote : remote.substr(0, open));
    if (open != std::string::npos && close != std::string::npos) {
        const std::string detail = remote.substr(open + 1, close - open - 1);
        h.ahead = detail_count(detail, "ahead");
        h.behind = detail_count(detail, "behind");
    }
    return h;
}

std::optional<ChangedFile> parse_file_entry(const std::string& line) {
    ChangedFile f;
    if (starts_with(line, "?? ")) {
        f.path = post_rename_path(line.substr(3));
        f.index_status = '?';
        f.worktree_status = '?';
        f.untracked = true;
        f.unstaged = true;
        return f;
    }
    if (line.size() < 4)
        return std::nullopt;
    f.index_status = line[0];
    f.worktree_status = line[1];
    f.path = post_rename_path(line.substr(3));
    f.staged = f.index_status != ' ' && f.index_status != '?';
    f.unstaged = f.worktree_status != ' ';
    f.conflicted = f.index_status == 'U' || f.worktree_status == 'U' ||
                   (f.index_status == 'A' && f.worktree_status == 'A') ||
                   (f.index_status == 'D' && f.worktree_status == 'D');
    return f;
}

bool needs_attention(const AttentionInputs& in) {
    return in.dirty || in.ahead > 0 || in.behind > 0 || in.conflicted > 0 ||
           in.merge_in_progress || in.rebase_in_progress || in.fetch_failed;
}

StatusSummary parse_status(const std::string& raw) {
    StatusSummary s;
    BranchHeader header;
    bool header_seen = false;
    std::istringstream in(raw);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (line.empty())
            continue;
        if (starts_with(line, "## ")) {
            if (!header_seen) {
                header = parse_branch_header(line.substr(3));
                header_seen = true;
            }
            continue;
        }
        auto entry = parse_file_entry(line);
        if (!entry)
            continue;
        if (entry->untracked)
            ++s.untracked_count;
        if (entry->staged)
            ++s.staged_count;
        if (entry->unstaged && !entry->untracked)
            ++s.modified_count;
        if (entry->conflicted)
            ++s.conflicted_count;
        s.changed_files.push_back(std::move(*entry));
    }

    s.branch = header.branch;
    s.detached = header.detached();
    s.has_upstream = header.has_upstream();
    s.ahead = header.ahead;
    s.behind = header.behind;
    s.has_staged = s.staged_count > 0;
    s.has_untracked = s.untracked_count > 0;
    s.dirty = s.staged_count > 0 || s.modified_count > 0 || s.untracked_count > 0;
    AttentionInputs inputs;
    inputs.dirty = s.dirty;
    inputs.ahead = s.ahead;
    inputs.behind = s.behind;
    inputs.conflicted = s.conflicted_count;
    s.needs_attention = needs_attention(inputs);
    return s;
}

} // namespace git
