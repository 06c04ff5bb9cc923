#include <braid/braid.hpp>
#include <iostream>
#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using namespace braid;

namespace fs = std::filesystem;

static fs::path make_temp_dir() {
    std::string tmpl = (fs::temp_directory_path() / "braid_test_XXXXXX").string();
    char* dir = mkdtemp(tmpl.data());
    assert(dir != nullptr);
    return fs::path(dir);
}

static void write_text(const fs::path& path, const std::string& text) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path);
    out << text;
}

static Timestamp ts(const std::string& s) {
    auto t = parse_timestamp(s);
    assert(t.has_value());
    return *t;
}

static Issue issue(const std::string& id, Priority p = Priority::P2,
                   std::vector<std::string> deps = {}) {
    Issue i = make_issue(id, "title " + id, p, ts("2025-01-01T00:00:00Z"));
    i.deps = std::move(deps);
    return i;
}

static IssueMap store_of(std::vector<Issue> list) {
    IssueMap map;
    for (auto& i : list) map.emplace(i.id, std::move(i));
    return map;
}

// parse then validate, as load_config does
static Result<Config> load_config_text(const std::string& text) {
    auto config = parse_config(text, "config.toml");
    if (!config) return config.error();
    auto valid = validate_config(*config);
    if (!valid) return valid.error();
    return config;
}

void test_error_codes() {
    std::cout << "Testing Error codes..." << std::endl;

    assert(Error::not_git_repo().exit_code() == 10);
    assert(Error::control_root_invalid("x").exit_code() == 11);
    assert(Error::issue_not_found("x").exit_code() == 12);
    assert(Error::ambiguous_id("x", {"a", "b"}).exit_code() == 13);
    assert(Error::claim_conflict("x").exit_code() == 14);
    assert(Error::invalid_graph("x").exit_code() == 15);
    assert(Error::parse("f", "m").exit_code() == 16);
    assert(Error::not_initialized().exit_code() == 17);
    assert(Error::io("x").exit_code() == 1);
    assert(Error::usage("x").exit_code() == 2);

    assert(std::string(Error::claim_conflict("x").code()) == "claim_conflict");
    assert(Error::parse("f.md", "bad").message == "parse error in f.md: bad");

    Error amb = Error::ambiguous_id("ab", {"brd-ab12", "brd-ab34"});
    assert(amb.message == "ambiguous issue id 'ab': matches [\"brd-ab12\", \"brd-ab34\"]");
    assert(amb.candidates.size() == 2);

    std::cout << "  PASS" << std::endl;
}

void test_toml() {
    std::cout << "Testing TOML codec..." << std::endl;

    auto t = toml::parse("# comment\nname = \"a \\\"b\\\"\"  # trailing\nn = 42\nflag = true\nlit = 'x\\y'\n", "t");
    assert(t.ok());
    assert(std::get<std::string>(*t->find("name")) == "a \"b\"");
    assert(std::get<int64_t>(*t->find("n")) == 42);
    assert(std::get<bool>(*t->find("flag")) == true);
    assert(std::get<std::string>(*t->find("lit")) == "x\\y");

    auto again = toml::parse(toml::serialize(*t), "t2");
    assert(again.ok());
    assert(std::get<std::string>(*again->find("name")) == "a \"b\"");

    auto bad = toml::parse("[table]\n", "cfg");
    assert(!bad.ok());
    assert(bad.error().kind == ErrorKind::ParseError);

    auto wrong = toml::get_int(*t, "name", "t");
    assert(!wrong.ok());

    std::cout << "  PASS" << std::endl;
}

void test_config() {
    std::cout << "Testing Config..." << std::endl;

    assert(derive_prefix("my-cool_repo") == "myco");
    assert(derive_prefix("ab") == "abxx");
    assert(derive_prefix("---") == "xxxx");
    assert(derive_prefix("Braid") == "brai");

    Config c = config_with_derived_prefix("braid");
    auto parsed = parse_config(serialize_config(c), "config.toml");
    assert(parsed.ok());
    assert(parsed->id_prefix == "brai");
    assert(parsed->id_len == 4);
    assert(parsed->auto_pull && parsed->auto_push);

    // v4 shape: sync_branch, no auto flags
    bool migrated = false;
    auto old = parse_config("schema_version = 4\nid_prefix = \"brd\"\nid_len = 4\nsync_branch = \"issues\"\n",
                            "config.toml", &migrated);
    assert(old.ok());
    assert(migrated);
    assert(old->schema_version == version::CURRENT_SCHEMA);
    assert(old->issues_branch == std::optional<std::string>("issues"));
    assert(old->auto_pull && old->auto_push);

    Config future = c;
    future.schema_version = 999;
    auto v = validate_config(future);
    assert(!v.ok());
    assert(v.error().exit_code() == 16);
    assert(v.error().message.find("v999") != std::string::npos);

    // int64 values are never narrowed into range
    auto wrapped = load_config_text("schema_version = 4294967305\nid_prefix = \"brd\"\nid_len = 4\n");
    assert(!wrapped.ok());
    assert(wrapped.error().exit_code() == 16);
    assert(wrapped.error().message.find("v4294967305") != std::string::npos);
    assert(!load_config_text("schema_version = -1\nid_prefix = \"brd\"\nid_len = 4\n").ok());
    auto long_id = load_config_text("schema_version = 9\nid_prefix = \"brd\"\nid_len = 4294967300\n");
    assert(!long_id.ok());
    assert(long_id.error().message.find("id_len must be between 4 and 10") != std::string::npos);

    Config short_len = c;
    short_len.id_len = 3;
    assert(validate_config(short_len).error().message.find("id_len must be between 4 and 10, got 3") !=
           std::string::npos);

    Config both = c;
    both.issues_branch = "issues";
    both.issues_repo = "../other";
    assert(!validate_config(both).ok());

    fs::path dir = make_temp_dir();
    auto missing = load_config(dir / "config.toml");
    assert(!missing.ok());
    assert(missing.error().kind == ErrorKind::NotInitialized);

    fs::remove_all(dir);
    std::cout << "  PASS" << std::endl;
}

void test_timestamps() {
    std::cout << "Testing Timestamps..." << std::endl;

    Timestamp t = ts("2025-03-04T05:06:07Z");
    assert(format_timestamp(t) == "2025-03-04T05:06:07Z");
    assert(ts("2025-03-04T07:06:07+02:00") == t);
    assert(!parse_timestamp("2025-13-01T00:00:00Z").has_value());

    Timestamp ref = ts("2025-03-04T05:06:07Z");
    assert(format_timestamp(*parse_scheduled("tomorrow", ref)) == "2025-03-05T00:00:00Z");
    assert(format_timestamp(*parse_scheduled("+2d", ref)) == "2025-03-06T05:06:07Z");
    assert(format_timestamp(*parse_scheduled("+1w", ref)) == "2025-03-11T05:06:07Z");
    assert(format_timestamp(*parse_scheduled("+1mo", ref)) == "2025-04-03T05:06:07Z");
    assert(format_timestamp(*parse_scheduled("2025-12-25", ref)) == "2025-12-25T00:00:00Z");
    assert(!parse_scheduled("+abc", ref).ok());
    assert(!parse_scheduled("someday", ref).ok());

    assert(format_relative(ref + std::chrono::hours(5), ref) == "in 5h");
    assert(format_relative(ref + std::chrono::days(2), ref) == "in 2d");
    assert(format_relative(ref - std::chrono::days(1), ref) == "now");

    std::cout << "  PASS" << std::endl;
}

void test_frontmatter_split() {
    std::cout << "Testing frontmatter split..." << std::endl;

    auto ok = split_frontmatter("\n---\nid: x\n---\n\nbody text\n", "f");
    assert(ok.ok());
    assert(ok->yaml == "id: x");
    assert(ok->body == "body text\n");

    auto no_open = split_frontmatter("id: x\n", "f.md");
    assert(!no_open.ok());
    assert(no_open.error().message == "parse error in f.md: missing frontmatter delimiter");

    auto no_close = split_frontmatter("---\nid: x\n", "f.md");
    assert(!no_close.ok());
    assert(no_close.error().message.find("missing closing frontmatter delimiter") != std::string::npos);

    std::cout << "  PASS" << std::endl;
}

void test_issue_roundtrip() {
    std::cout << "Testing issue serialize/parse..." << std::endl;

    Issue i = issue("brd-ab12", Priority::P1, {"brd-cd34"});
    i.title = "yes";  // YAML 1.1 bool word must stay a string
    i.issue_type = IssueType::Design;
    i.status = Status::Doing;
    i.owner = "agent-1";
    i.tags = {"backend", "urgent"};
    i.acceptance = {"tests pass", "docs: updated"};
    i.started_at = ts("2025-01-02T00:00:00Z");
    i.scheduled_for = ts("2025-02-01T00:00:00Z");
    i.body = "# Notes\n\nSome text.\n";

    std::string md = to_markdown(i);
    assert(md.rfind("---\nschema_version: 9\nid: brd-ab12\n", 0) == 0);
    assert(md.find("issue_type: design") != std::string::npos);
    assert(md.find("completed_at") == std::string::npos);

    auto back = parse_issue(md, "brd-ab12", "brd-ab12.md");
    assert(back.ok());
    assert(*back == i);

    // Normalization is idempotent
    assert(to_markdown(*back) == md);

    // Empty collections are omitted
    Issue bare = issue("brd-0000");
    std::string bare_md = to_markdown(bare);
    assert(bare_md.find("deps") == std::string::npos);
    assert(bare_md.find("tags") == std::string::npos);
    assert(bare_md.find("owner") == std::string::npos);
    auto bare_back = parse_issue(bare_md, "brd-0000", "f");
    assert(bare_back.ok() && *bare_back == bare);

    std::cout << "  PASS" << std::endl;
}

void test_issue_parse_errors() {
    std::cout << "Testing issue parse errors..." << std::endl;

    const std::string base =
        "---\nschema_version: 9\nid: brd-aaaa\ntitle: t\npriority: P2\nstatus: open\n"
        "created_at: 2025-01-01T00:00:00Z\n---\n";

    auto mismatch = parse_issue(base, "brd-bbbb", "brd-bbbb.md");
    assert(!mismatch.ok());
    assert(mismatch.error().message ==
           "parse error in brd-bbbb.md: id 'brd-aaaa' does not match filename 'brd-bbbb'");

    auto missing_title = parse_issue(
        "---\nschema_version: 9\nid: brd-aaaa\npriority: P2\nstatus: open\ncreated_at: 2025-01-01T00:00:00Z\n---\n",
        "brd-aaaa", "f.md");
    assert(!missing_title.ok());
    assert(missing_title.error().kind == ErrorKind::ParseError);

    int declared = -1;
    auto future = parse_issue(
        "---\nschema_version: 10\nid: brd-aaaa\ntitle: t\npriority: P2\nstatus: open\ncreated_at: 2025-01-01T00:00:00Z\n---\n",
        "brd-aaaa", "f.md", &declared);
    assert(!future.ok());
    assert(declared == 10);
    assert(future.error().message.find("v10") != std::string::npos);

    auto legacy_type = parse_issue(
        "---\nschema_version: 9\nid: brd-aaaa\ntitle: t\npriority: P2\nstatus: open\ntype: meta\n"
        "created_at: 2025-01-01T00:00:00Z\n---\n",
        "brd-aaaa", "f.md");
    assert(legacy_type.ok());
    assert(legacy_type->is_meta());

    auto bad_version = parse_issue(
        "---\nschema_version: nine\nid: brd-aaaa\n---\n", "brd-aaaa", "f.md");
    assert(!bad_version.ok());
    assert(bad_version.error().message.find("expected integer") != std::string::npos);

    std::cout << "  PASS" << std::endl;
}

void test_migrations() {
    std::cout << "Testing migrations..." << std::endl;

    // Pre-versioning file with every legacy shape
    const std::string v0 =
        "---\nid: brd-mig0\ntitle: old\npriority: P1\nstatus: done\nlabels: [a, b]\n"
        "deps: []\ncreated_at: 2024-01-01T00:00:00Z\nupdated_at: 2024-02-01T00:00:00Z\n---\nbody\n";
    int declared = -1;
    auto i = parse_issue(v0, "brd-mig0", "f.md", &declared);
    assert(i.ok());
    assert(declared == 0);
    assert(i->schema_version == 9);
    assert((i->tags == std::vector<std::string>{"a", "b"}));
    assert(i->started_at == ts("2024-02-01T00:00:00Z"));
    assert(i->completed_at == ts("2024-02-01T00:00:00Z"));
    assert(!i->owner.has_value());

    // Writing back: current schema, no legacy keys
    std::string md = to_markdown(*i);
    assert(md.find("schema_version: 9") != std::string::npos);
    assert(md.find("brd:") == std::string::npos);
    assert(md.find("updated_at") == std::string::npos);
    assert(md.find("labels") == std::string::npos);

    // `brd: 1` with todo status
    const std::string v1 =
        "---\nbrd: 1\nid: brd-mig1\ntitle: t\npriority: P2\nstatus: todo\n"
        "created_at: 2024-01-01T00:00:00Z\n---\n";
    auto j = parse_issue(v1, "brd-mig1", "f.md");
    assert(j.ok());
    assert(j->status == Status::Open);
    std::string jmd = to_markdown(*j);
    assert(jmd.find("status: open") != std::string::npos);
    assert(jmd.find("brd:") == std::string::npos);

    // Idempotent once current
    YAML::Node tree = YAML::Load("schema_version: 6\nstatus: todo\nid: x\n");
    auto once = migrations::migrate_frontmatter(tree);
    assert(once.ok() && once->migrated);
    auto twice = migrations::migrate_frontmatter(once->frontmatter);
    assert(twice.ok() && !twice->migrated);
    assert(YAML::Dump(once->frontmatter) == YAML::Dump(twice->frontmatter));

    // Input tree is not modified
    assert(tree["status"].as<std::string>() == "todo");

    auto summary = migrations::migration_summary(6, 9);
    assert(summary.size() == 3);
    assert(summary[0] == "v6→v7: rename status 'todo' to 'open'");

    std::cout << "  PASS" << std::endl;
}

void test_store_load() {
    std::cout << "Testing store load..." << std::endl;

    fs::path dir = make_temp_dir();
    auto a = save_issue(issue("brd-aaaa"), issue_path(dir, "brd-aaaa"));
    assert(a.ok());
    write_text(dir / "brd-bad0.md", "not an issue");
    write_text(dir / "notes.txt", "ignored");

    auto report = load_all(dir, true);
    assert(report.ok());
    assert(report->issues.size() == 1);
    assert(report->failures.size() == 1);
    assert(report->failures[0].path.filename().string() == "brd-bad0.md");

    // No temp files survive a write
    for (const auto& entry : fs::directory_iterator(dir)) {
        assert(entry.path().filename().string().find(".tmp.") == std::string::npos);
    }

    // A newer schema anywhere fails the whole load
    write_text(dir / "brd-new0.md",
               "---\nschema_version: 42\nid: brd-new0\ntitle: t\npriority: P2\nstatus: open\n"
               "created_at: 2025-01-01T00:00:00Z\n---\n");
    auto closed = load_all(dir, true);
    assert(!closed.ok());
    assert(closed.error().exit_code() == 16);
    fs::remove(dir / "brd-new0.md");

    // Versions too large for an int are still newer, not malformed
    for (const char* huge : {"2000000", "4294967305", "99999999999999999999999"}) {
        write_text(dir / "brd-new1.md",
                   std::string("---\nschema_version: ") + huge +
                   "\nid: brd-new1\ntitle: t\npriority: P2\nstatus: open\n"
                   "created_at: 2025-01-01T00:00:00Z\n---\n");
        auto huge_load = load_all(dir, true);
        assert(!huge_load.ok());
        assert(huge_load.error().exit_code() == 16);
        assert(huge_load.error().message.find("only supports up to v9") != std::string::npos);
    }
    fs::remove(dir / "brd-new1.md");

    auto empty = load_all(dir / "missing", true);
    assert(empty.ok() && empty->issues.empty());

    fs::remove_all(dir);
    std::cout << "  PASS" << std::endl;
}

void test_resolve_and_generate() {
    std::cout << "Testing ID resolution/generation..." << std::endl;

    IssueMap s = store_of({issue("brd-ab12"), issue("brd-ab34"), issue("brd-cd56")});

    assert(*resolve_issue_id("brd-ab12", s) == "brd-ab12");
    assert(*resolve_issue_id("cd5", s) == "brd-cd56");
    assert(*resolve_issue_id("BRD-CD56", s) == "brd-cd56");

    auto amb = resolve_issue_id("ab", s);
    assert(!amb.ok());
    assert(amb.error().kind == ErrorKind::AmbiguousId);
    assert((amb.error().candidates == std::vector<std::string>{"brd-ab12", "brd-ab34"}));

    auto none = resolve_issue_id("zz", s);
    assert(!none.ok() && none.error().exit_code() == 12);

    fs::path dir = make_temp_dir();
    Config c;
    c.id_prefix = "tst";
    c.id_len = 6;
    auto id = generate_issue_id(c, dir);
    assert(id.ok());
    assert(id->size() == 10);
    assert(id->rfind("tst-", 0) == 0);
    for (char ch : id->substr(4)) {
        assert((ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'z'));
    }

    fs::remove_all(dir);
    std::cout << "  PASS" << std::endl;
}

void test_graph_derived() {
    std::cout << "Testing derived state..." << std::endl;

    IssueMap s = store_of({issue("a"), issue("b", Priority::P2, {"a"}), issue("c", Priority::P2, {"ghost"})});

    Derived da = compute_derived(s.at("a"), s);
    assert(da.is_ready && !da.is_blocked);

    Derived db = compute_derived(s.at("b"), s);
    assert(!db.is_ready && db.is_blocked);
    assert((db.open_deps == std::vector<std::string>{"a"}));

    Derived dc = compute_derived(s.at("c"), s);
    assert(dc.is_blocked);
    assert((dc.missing_deps == std::vector<std::string>{"ghost"}));

    // skip does not resolve a dependency
    s.at("a").status = Status::Skip;
    assert(compute_derived(s.at("b"), s).is_blocked);
    s.at("a").status = Status::Done;
    assert(compute_derived(s.at("b"), s).is_ready);

    // Non-open issues are neither ready nor blocked
    s.at("c").status = Status::Doing;
    Derived doing = compute_derived(s.at("c"), s);
    assert(!doing.is_ready && !doing.is_blocked);

    std::cout << "  PASS" << std::endl;
}

void test_graph_cycles() {
    std::cout << "Testing cycle detection..." << std::endl;

    IssueMap s = store_of({issue("a", Priority::P2, {"b"}), issue("b")});

    auto path = would_create_cycle("b", "a", s);
    assert(path.has_value());
    assert(format_cycle(*path) == "b -> a -> b");
    assert(!would_create_cycle("a", "b", s).has_value());

    auto rejected = add_dep_checked(s, "b", "a");
    assert(!rejected.ok());
    assert(rejected.error().kind == ErrorKind::InvalidGraph);
    assert(rejected.error().message == "cannot add dependency: would create cycle: b -> a -> b");
    assert(s.at("b").deps.empty());

    auto self = add_dep_checked(s, "a", "a");
    assert(!self.ok() && self.error().message == "cannot add self-dependency: a");

    auto again = add_dep_checked(s, "a", "b");
    assert(again.ok() && *again == false);
    assert(s.at("a").deps.size() == 1);

    assert(find_cycles(s).empty());
    s.at("b").deps.push_back("a");
    auto cycles = find_cycles(s);
    assert(!cycles.empty());
    assert(cycles[0].front() == cycles[0].back());

    std::cout << "  PASS" << std::endl;
}

void test_ready_and_next() {
    std::cout << "Testing ready ordering and next..." << std::endl;

    Issue meta = issue("m", Priority::P0);
    meta.issue_type = IssueType::Meta;
    Issue late = issue("z", Priority::P1);
    late.created_at = ts("2025-06-01T00:00:00Z");
    IssueMap s = store_of({issue("p3", Priority::P3), issue("y", Priority::P1), late, meta});

    auto ready = ready_issues(s);
    assert(ready.size() == 4);
    assert(ready[0]->id == "m");
    assert(ready[1]->id == "y");
    assert(ready[2]->id == "z");
    assert(ready[3]->id == "p3");

    const Issue* next = next_issue(s);
    assert(next && next->id == "y");

    IssueMap only_meta = store_of({meta});
    assert(next_issue(only_meta) == nullptr);

    std::cout << "  PASS" << std::endl;
}

void test_apply_field() {
    std::cout << "Testing set field..." << std::endl;

    Timestamp at = ts("2025-05-05T00:00:00Z");
    Issue i = issue("brd-set0");

    assert(*apply_field(i, "p", "p0", "me", at) == "P0");
    assert(i.priority == Priority::P0);

    assert(*apply_field(i, "status", "doing", "me", at) == "doing");
    assert(i.owner == std::optional<std::string>("me"));
    assert(i.started_at == at);

    assert(!apply_field(i, "owner", "-", "me", at).ok());

    assert(*apply_field(i, "s", "done", "me", at) == "done");
    assert(!i.owner && i.completed_at == at);

    assert(*apply_field(i, "status", "open", "me", at) == "open");
    assert(!i.completed_at);

    assert(*apply_field(i, "tag", "x", "", at) == "+x");
    assert(apply_field(i, "tag", "+x", "", at).ok());
    assert(i.tags.size() == 1);
    assert(apply_field(i, "tag", "-x", "", at).ok());
    assert(i.tags.empty());

    assert(*apply_field(i, "type", "meta", "", at) == "meta");
    assert(apply_field(i, "t", "-", "", at).ok());
    assert(!i.issue_type);

    assert(*apply_field(i, "scheduled", "2025-06-01", "", at) == "2025-06-01T00:00:00Z");
    assert(apply_field(i, "scheduled_for", "-", "", at).ok());
    assert(!i.scheduled_for);

    assert(!apply_field(i, "title", "  ", "", at).ok());
    assert(!apply_field(i, "priority", "P9", "", at).ok());

    auto unknown = apply_field(i, "color", "red", "", at);
    assert(!unknown.ok());
    assert(unknown.error().message.rfind("unknown field 'color'. supported fields:", 0) == 0);

    std::cout << "  PASS" << std::endl;
}

void test_filter() {
    std::cout << "Testing ls filters..." << std::endl;

    Issue done = issue("d");
    done.status = Status::Done;
    done.completed_at = ts("2025-01-02T00:00:00Z");
    Issue tagged = issue("t", Priority::P1, {"d"});
    tagged.tags = {"api", "db"};
    IssueMap s = store_of({done, tagged, issue("o", Priority::P3, {"t"})});

    ListFilter def;
    assert(filter_issues(s, def).size() == 2);

    ListFilter all;
    all.all = true;
    assert(filter_issues(s, all).size() == 3);

    ListFilter by_status;
    by_status.status = Status::Done;
    assert(filter_issues(s, by_status).size() == 1);

    ListFilter ready;
    ready.ready = true;
    auto r = filter_issues(s, ready);
    assert(r.size() == 1 && r[0]->id == "t");

    ListFilter blocked;
    blocked.blocked = true;
    auto b = filter_issues(s, blocked);
    assert(b.size() == 1 && b[0]->id == "o");

    ListFilter tags;
    tags.tags = {"api", "db"};
    assert(filter_issues(s, tags).size() == 1);
    tags.tags = {"api", "web"};
    assert(filter_issues(s, tags).empty());

    std::cout << "  PASS" << std::endl;
}

void test_lock() {
    std::cout << "Testing cross-process lock..." << std::endl;

    fs::path dir = make_temp_dir();
    fs::path lock_path = dir / "brd" / "lock";
    {
        auto held = LockGuard::acquire(lock_path);
        assert(held.ok() && held->held());

        // flock is per open file description, so a second open conflicts
        auto contended = LockGuard::try_acquire(lock_path);
        assert(contended.ok());
        assert(!contended->has_value());
    }
    auto released = LockGuard::try_acquire(lock_path);
    assert(released.ok() && released->has_value());
    assert(fs::exists(lock_path));

    fs::remove_all(dir);
    std::cout << "  PASS" << std::endl;
}

void test_json_output() {
    std::cout << "Testing JSON output..." << std::endl;

    IssueMap s = store_of({issue("a"), issue("b", Priority::P1, {"a", "gone"})});
    json j = issue_to_json(s.at("b"), s);
    assert(j["id"] == "b");
    assert(j["priority"] == "P1");
    assert(j["status"] == "open");
    assert(j["type"].is_null());
    assert(j["owner"].is_null());
    assert(j["created_at"] == "2025-01-01T00:00:00Z");
    assert(j["derived"]["is_blocked"] == true);
    assert(j["derived"]["open_deps"] == json::array({"a"}));
    assert(j["derived"]["missing_deps"] == json::array({"gone"}));

    json e = error_to_json(Error::ambiguous_id("x", {"p", "q"}));
    assert(e["ok"] == false);
    assert(e["code"] == "ambiguous_id");
    assert(e["exit_code"] == 13);
    assert(e["candidates"].size() == 2);

    assert(format_issue_line(s.at("b"), s) == "b  P1  open  title b (deps:2 open:1)");
    assert(format_issue_line(s.at("a"), s) == "a  P2  open  title a");

    std::ostringstream out;
    print_issue_list(out, {}, s);
    assert(out.str() == "No issues found.\n");

    std::ostringstream detail;
    print_issue_detail(detail, s.at("b"), s, ts("2025-01-01T00:00:00Z"));
    assert(detail.str().rfind("ID:       b\nTitle:    title b\n", 0) == 0);
    assert(detail.str().find("State:    BLOCKED") != std::string::npos);

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== Braid Unit Tests ===" << std::endl;
    std::cout << "schema v" << version::CURRENT_SCHEMA << std::endl;
    std::cout << std::endl;

    test_error_codes();
    test_toml();
    test_config();
    test_timestamps();
    test_frontmatter_split();
    test_issue_roundtrip();
    test_issue_parse_errors();
    test_migrations();
    test_store_load();
    test_resolve_and_generate();
    test_graph_derived();
    test_graph_cycles();
    test_ready_and_next();
    test_apply_field();
    test_filter();
    test_lock();
    test_json_output();

    std::cout << std::endl;
    std::cout << "=== All tests passed ===" << std::endl;
    return 0;
}
