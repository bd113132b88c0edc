#include "repo.hpp"
#include <algorithm>
#include <cstdio>
#include <random>

namespace fs = std::filesystem;

std::string new_id(const std::string& prefix) {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<unsigned> byte(0, 255);
    std::string id = prefix + "_";
    char buf[3];
    for (int i = 0; i < 6; ++i) {
        std::snprintf(buf, sizeof(buf), "%02x", byte(rng));
        id += buf;
    }
    return id;
}

static std::string strip_trailing_slashes(std::string p) {
    while (p.size() > 1 && (p.back() == '/' || p.back() == '\\'))
        p.pop_back();
    return p;
}

std::string normalize_repo_path(const RepoEnvironment& env, const std::string& path) {
    if (env.is_guest())
        return strip_trailing_slashes(path);
    std::error_code ec;
    fs::path abs = fs::absolute(fs::path(path), ec);
    if (ec)
        abs = fs::path(path);
    return strip_trailing_slashes(abs.lexically_normal().string());
}

std::string repository_key(const RepoEnvironment& env, const std::string& path) {
    const std::string norm = normalize_repo_path(env, path);
    if (env.is_guest())
        return "guest:" + env.guest + ":" + norm;
    return "native:" + norm;
}

std::string default_display_name(const std::string& path) {
    std::string p = strip_trailing_slashes(path);
    auto pos = p.find_last_of("/\\");
    std::string name = pos == std::string::npos ? p : p.substr(pos + 1);
    return name.empty() ? p : name;
}

void push_history(RepoRecord& record, Transcript t) {
    record.history.push_back(std::move(t));
    while (record.history.size() > HISTORY_LIMIT)
        record.history.pop_front();
}

void sort_for_display(std::vector<RepoRecord>& repos) {
    auto attention = [](const RepoRecord& r) { return r.status && r.status->needs_attention; };
    std::stable_sort(repos.begin(), repos.end(), [&](const RepoRecord& a, const RepoRecord& b) {
        bool aa = attention(a);
        bool bb = attention(b);
        if (aa != bb)
            return aa;
        return a.name < b.name;
    });
}

int effective_refresh_interval(const Settings& settings) {
    return std::max(MIN_REFRESH_INTERVAL_SECONDS, settings.refresh_interval_seconds);
}
