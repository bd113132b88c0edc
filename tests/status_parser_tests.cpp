#include "test_common.hpp"
#include "status_parser.hpp"
#include <limits>

TEST_CASE("parse_status reads branch, tracking and file counts") {
    const std::string raw = "## main...origin/main [ahead 2, behind 1]\n"
                            " M src/a.ts\n"
                            "A  src/b.ts\n"
                            "?? src/c.ts";
    StatusSummary s = git::parse_status(raw);
    REQUIRE(s.branch == "main");
    REQUIRE(s.has_upstream);
    REQUIRE_FALSE(s.detached);
    REQUIRE(s.ahead == 2);
    REQUIRE(s.behind == 1);
    REQUIRE(s.modified_count == 1);
    REQUIRE(s.staged_count == 1);
    REQUIRE(s.untracked_count == 1);
    REQUIRE(s.conflicted_count == 0);
    REQUIRE(s.has_staged);
    REQUIRE(s.has_untracked);
    REQUIRE(s.dirty);
    REQUIRE(s.needs_attention);
    REQUIRE(s.changed_files.size() == 3);
    REQUIRE(s.changed_files[0].path == "src/a.ts");
    REQUIRE(s.changed_files[0].unstaged);
    REQUIRE_FALSE(s.changed_files[0].staged);
    REQUIRE(s.changed_files[1].staged);
    REQUIRE(s.changed_files[2].untracked);
}

TEST_CASE("parse_status treats ellipsis without detail as in sync") {
    StatusSummary s = git::parse_status("## main...origin/main\n");
    REQUIRE(s.branch == "main");
    REQUIRE(s.has_upstream);
    REQUIRE(s.ahead == 0);
    REQUIRE(s.behind == 0);
    REQUIRE_FALSE(s.dirty);
    REQUIRE_FALSE(s.needs_attention);
    REQUIRE(s.changed_files.empty());
}

TEST_CASE("parse_status is deterministic") {
    const std::string raw = "## dev...up/dev [behind 3]\nUU both.txt\n?? new.txt\n";
    StatusSummary a = git::parse_status(raw);
    StatusSummary b = git::parse_status(raw);
    REQUIRE(a.changed_files == b.changed_files);
    REQUIRE(a.behind == b.behind);
    REQUIRE(a.needs_attention == b.needs_attention);
    REQUIRE(a.conflicted_count == 1);
}

TEST_CASE("parse_status skips short lines without affecting neighbours") {
    StatusSummary s = git::parse_status("## main\n M one.txt\nXY\n?\n M two.txt\n");
    REQUIRE(s.changed_files.size() == 2);
    REQUIRE(s.changed_files[0].path == "one.txt");
    REQUIRE(s.changed_files[1].path == "two.txt");
    REQUIRE(s.modified_count == 2);
}

TEST_CASE("parse_status handles local branches and detached heads") {
    SECTION("no upstream") {
        StatusSummary s = git::parse_status("## feature\n");
        REQUIRE(s.branch == "feature");
        REQUIRE_FALSE(s.has_upstream);
        REQUIRE_FALSE(s.detached);
    }
    SECTION("detached") {
        StatusSummary s = git::parse_status("## HEAD (no branch)\n");
        REQUIRE(s.detached);
        REQUIRE(s.branch == "detached");
        REQUIRE_FALSE(s.has_upstream);
    }
    SECTION("missing header") {
        StatusSummary s = git::parse_status(" M a\n");
        REQUIRE(s.detached);
        REQUIRE(s.branch == "detached");
    }
    SECTION("only the first header counts") {
        StatusSummary s = git::parse_status("## one...o/one [ahead 1]\n## two\n");
        REQUIRE(s.branch == "one");
        REQUIRE(s.ahead == 1);
    }
}

TEST_CASE("parse_branch_header recognises unborn branches") {
    auto h = git::parse_branch_header("No commits yet on main");
    REQUIRE(h.kind == git::HeaderKind::Unborn);
    REQUIRE(h.branch == "main");
    REQUIRE_FALSE(h.detached());

    auto legacy = git::parse_branch_header("Initial commit on trunk...origin/trunk");
    REQUIRE(legacy.kind == git::HeaderKind::Unborn);
    REQUIRE(legacy.branch == "trunk");
    REQUIRE_FALSE(legacy.has_upstream());
}

TEST_CASE("parse_branch_header reads gone upstreams and partial detail") {
    auto gone = git::parse_branch_header("main...origin/main [gone]");
    REQUIRE(gone.has_upstream());
    REQUIRE(gone.upstream == "origin/main");
    REQUIRE(gone.ahead == 0);
    REQUIRE(gone.behind == 0);

    auto behind = git::parse_branch_header("main...origin/main [behind 12]");
    REQUIRE(behind.ahead == 0);
    REQUIRE(behind.behind == 12);

    auto blank = git::parse_branch_header("...origin/main");
    REQUIRE(blank.branch == "unknown");
}

TEST_CASE("parse_file_entry classifies index and worktree columns") {
    SECTION("rename keeps the new path") {
        auto f = git::parse_file_entry("R  old.txt -> new.txt");
        REQUIRE(f);
        REQUIRE(f->path == "new.txt");
        REQUIRE(f->staged);
        REQUIRE_FALSE(f->unstaged);
    }
    SECTION("staged and modified") {
        auto f = git::parse_file_entry("MM both.txt");
        REQUIRE(f);
        REQUIRE(f->staged);
        REQUIRE(f->unstaged);
        REQUIRE_FALSE(f->conflicted);
    }
    SECTION("conflict markers") {
        for (const char* line : {"UU a", "AA a", "DD a", "UD a", "DU a", "AU a", "UA a"}) {
            auto f = git::parse_file_entry(line);
            REQUIRE(f);
            INFO(line);
            REQUIRE(f->conflicted);
        }
    }
    SECTION("untracked") {
        auto f = git::parse_file_entry("?? dir/file");
        REQUIRE(f);
        REQUIRE(f->untracked);
        REQUIRE(f->unstaged);
        REQUIRE_FALSE(f->staged);
    }
    SECTION("too short") { REQUIRE_FALSE(git::parse_file_entry(" M ")); }
}

TEST_CASE("needs_attention is the OR of every condition") {
    for (int mask = 0; mask < (1 << 7); ++mask) {
        git::AttentionInputs in;
        in.dirty = mask & 1;
        in.ahead = (mask & 2) ? 1 : 0;
        in.behind = (mask & 4) ? 3 : 0;
        in.conflicted = (mask & 8) ? 2 : 0;
        in.merge_in_progress = mask & 16;
        in.rebase_in_progress = mask & 32;
        in.fetch_failed = mask & 64;
        INFO("mask " << mask);
        REQUIRE(git::needs_attention(in) == (mask != 0));
    }
}

TEST_CASE("parse_branch_header clamps oversized tracking counts") {
    auto h = git::parse_branch_header(
        "main...origin/main [ahead 99999999999999999999999, behind 3]");
    REQUIRE(h.ahead == std::numeric_limits<int>::max());
    REQUIRE(h.behind == 3);
    StatusSummary s = git::parse_status("## main...origin/main [behind 123456789012345678901234567]");
    REQUIRE(s.behind == std::numeric_limits<int>::max());
    REQUIRE(s.needs_attention);
}
