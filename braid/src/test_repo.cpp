// Repository tests: real git repositories under the temp dir
//
// Usage: braid_repo_test [path/to/brd]
// With a brd binary the CLI exit-code checks run too.

#include <braid/braid.hpp>
#include <iostream>
#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <sys/wait.h>
#include <unistd.h>

using namespace braid;

namespace fs = std::filesystem;

static fs::path g_root;
static std::string g_brd;

static int sh(const std::string& cmd) {
    int rc = std::system(cmd.c_str());
    return WIFEXITED(rc) ? WEXITSTATUS(rc) : -1;
}

static void write_text(const fs::path& path, const std::string& text) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path);
    out << text;
}

static std::string read_text(const fs::path& path) {
    auto text = read_file(path);
    assert(text.ok());
    return *text;
}

static fs::path make_repo(const std::string& name) {
    fs::path dir = g_root / name;
    fs::create_directories(dir);
    const std::string cd = "cd '" + dir.string() + "' && ";
    assert(sh(cd + "git init -q && git symbolic-ref HEAD refs/heads/main") == 0);
    write_text(dir / "README.md", "# " + name + "\n");
    assert(sh(cd + "git add README.md && git commit -q -m initial") == 0);
    return fs::canonical(dir);
}

static Workspace init_repo(const fs::path& dir) {
    auto paths = discover(dir);
    assert(paths.ok());
    auto init = init_braid(*paths);
    assert(init.ok());
    auto ws = open_workspace(*paths);
    assert(ws.ok());
    return *ws;
}

static std::string add(const Workspace& ws, const std::string& title,
                       std::vector<std::string> deps = {},
                       std::optional<IssueType> type = std::nullopt) {
    AddOptions opts;
    opts.title = title;
    opts.deps = std::move(deps);
    opts.issue_type = type;
    auto r = add_issue(ws, opts);
    assert(r.ok());
    return r->issue.id;
}

static IssueMap load(const Workspace& ws) {
    auto issues = load_issues(ws.issues_dir);
    assert(issues.ok());
    return *issues;
}

static std::string last_commit_subject(const fs::path& dir) {
    auto out = git::output(dir, {"log", "-1", "--format=%s"});
    assert(out.ok());
    return *out;
}

static int brd(const fs::path& dir, const std::string& args) {
    return sh("'" + g_brd + "' -C '" + dir.string() + "' " + args + " >/dev/null 2>&1");
}

void test_init_and_add() {
    std::cout << "Testing init and add..." << std::endl;

    fs::path dir = make_repo("alpha-repo");
    auto paths = discover(dir);
    assert(paths.ok());

    auto init = init_braid(*paths);
    assert(init.ok());
    assert(init->created_config);
    assert(init->id_prefix == "alph");
    assert(fs::exists(paths->config_path()));
    assert(read_text(paths->gitignore_path()) == "agent.toml\nruntime/\n");
    assert(fs::exists(paths->agent_path()));

    // Re-running keeps the config
    auto again = init_braid(*paths);
    assert(again.ok() && !again->created_config);

    auto ws = open_workspace(*paths);
    assert(ws.ok());
    assert(ws->mode == Mode::GitNative);
    assert(ws->issues_dir == paths->local_issues_dir());

    std::string id = add(*ws, "First issue");
    assert(id.rfind("alph-", 0) == 0);
    assert(id.size() == 9);

    fs::path file = issue_path(ws->issues_dir, id);
    assert(fs::exists(file));
    std::string content = read_text(file);
    assert(content.find("schema_version: 9") != std::string::npos);
    assert(content.find("status: open") != std::string::npos);

    IssueMap issues = load(*ws);
    assert(issues.size() == 1);
    assert(issues.at(id).title == "First issue");

    AddOptions empty;
    empty.title = "   ";
    auto rejected = add_issue(*ws, empty);
    assert(!rejected.ok() && rejected.error().exit_code() == 2);

    AddOptions bad_dep;
    bad_dep.title = "needs ghost";
    bad_dep.deps = {"nope"};
    auto missing = add_issue(*ws, bad_dep);
    assert(!missing.ok() && missing.error().exit_code() == 12);

    auto not_repo = discover(g_root);
    assert(!not_repo.ok() && not_repo.error().exit_code() == 10);

    std::cout << "  PASS" << std::endl;
}

void test_not_initialized() {
    std::cout << "Testing uninitialized repo..." << std::endl;

    fs::path dir = make_repo("bare-repo");
    auto ws = open_workspace_at(dir);
    assert(!ws.ok());
    assert(ws.error().exit_code() == 17);

    std::cout << "  PASS" << std::endl;
}

void test_readiness() {
    std::cout << "Testing readiness across done..." << std::endl;

    Workspace ws = init_repo(make_repo("ready-repo"));
    std::string a = add(ws, "A");
    std::string b = add(ws, "B", {a});

    IssueMap issues = load(ws);
    auto ready = ready_issues(issues);
    assert(ready.size() == 1 && ready[0]->id == a);
    assert(compute_derived(issues.at(b), issues).is_blocked);

    DoneOptions done;
    done.id = a;
    done.no_push = true;
    auto r = complete_issue(ws, done);
    assert(r.ok());

    issues = load(ws);
    assert(issues.at(a).status == Status::Done);
    assert(issues.at(a).completed_at.has_value());
    assert(issues.at(a).started_at.has_value());
    ready = ready_issues(issues);
    assert(ready.size() == 1 && ready[0]->id == b);

    // skip does not unblock
    std::string c = add(ws, "C");
    std::string d = add(ws, "D", {c});
    assert(skip_issue(ws, c).ok());
    issues = load(ws);
    assert(issues.at(c).status == Status::Skip);
    assert(compute_derived(issues.at(d), issues).is_blocked);

    auto reopened = reopen_issue(ws, c);
    assert(reopened.ok());
    issues = load(ws);
    assert(issues.at(c).status == Status::Open);
    assert(!issues.at(c).completed_at);

    std::cout << "  PASS" << std::endl;
}

void test_cycle_rejected() {
    std::cout << "Testing dependency cycle rejection..." << std::endl;

    Workspace ws = init_repo(make_repo("cycle-repo"));
    std::string a = add(ws, "A");
    std::string b = add(ws, "B", {a});

    auto r = add_dependency(ws, a, b);
    assert(!r.ok());
    assert(r.error().exit_code() == 15);
    assert(r.error().message.find(a + " -> " + b + " -> " + a) != std::string::npos);

    auto self = add_dependency(ws, a, a);
    assert(!self.ok() && self.error().exit_code() == 15);

    // Nothing written
    IssueMap issues = load(ws);
    assert(issues.at(a).deps.empty());

    auto dup = add_dependency(ws, b, a);
    assert(dup.ok() && !dup->changed);

    auto removed = remove_dependency(ws, b, a);
    assert(removed.ok() && removed->changed);
    assert(load(ws).at(b).deps.empty());

    auto absent = remove_dependency(ws, b, a);
    assert(absent.ok() && !absent->changed);

    std::cout << "  PASS" << std::endl;
}

void test_design_propagation() {
    std::cout << "Testing design completion propagation..." << std::endl;

    Workspace ws = init_repo(make_repo("design-repo"));
    std::string base = add(ws, "Base");
    std::string design = add(ws, "Design", {base}, IssueType::Design);
    std::string impl = add(ws, "Impl");
    std::string consumer = add(ws, "Consumer", {design});

    DoneOptions no_results;
    no_results.id = design;
    no_results.no_push = true;
    auto refused = complete_issue(ws, no_results);
    assert(!refused.ok());
    assert(refused.error().message.find("--result") != std::string::npos);

    DoneOptions self = no_results;
    self.results = {design};
    assert(!complete_issue(ws, self).ok());

    DoneOptions done = no_results;
    done.results = {impl};
    auto r = complete_issue(ws, done);
    assert(r.ok());
    assert((r->updated_dependents == std::vector<std::string>{consumer}));

    IssueMap issues = load(ws);
    const auto& consumer_deps = issues.at(consumer).deps;
    assert(std::find(consumer_deps.begin(), consumer_deps.end(), design) != consumer_deps.end());
    assert(std::find(consumer_deps.begin(), consumer_deps.end(), impl) != consumer_deps.end());

    // Results inherit the design's own deps
    assert((issues.at(impl).deps == std::vector<std::string>{base}));

    // Consumer stays blocked until the result is done
    assert(compute_derived(issues.at(consumer), issues).is_blocked);

    std::string forced = add(ws, "Forced design", {}, IssueType::Design);
    DoneOptions force;
    force.id = forced;
    force.force = true;
    force.no_push = true;
    assert(complete_issue(ws, force).ok());

    // Two results that both hang off the design: no edge between them
    std::string plan = add(ws, "Plan", {}, IssueType::Design);
    std::string part1 = add(ws, "Part one", {plan});
    std::string part2 = add(ws, "Part two", {plan});
    std::string user = add(ws, "User", {plan});
    DoneOptions split;
    split.id = plan;
    split.no_push = true;
    split.results = {part1, part2};
    auto both = complete_issue(ws, split);
    assert(both.ok());
    assert((both->updated_dependents == std::vector<std::string>{user}));

    issues = load(ws);
    assert((issues.at(part1).deps == std::vector<std::string>{plan}));
    assert((issues.at(part2).deps == std::vector<std::string>{plan}));
    const auto& user_deps = issues.at(user).deps;
    assert(std::find(user_deps.begin(), user_deps.end(), part1) != user_deps.end());
    assert(std::find(user_deps.begin(), user_deps.end(), part2) != user_deps.end());
    assert(find_cycles(issues).empty());

    std::cout << "  PASS" << std::endl;
}

void test_start_and_claims() {
    std::cout << "Testing start and claim conflicts..." << std::endl;

    Workspace ws = init_repo(make_repo("claim-repo"));
    std::string low = add(ws, "Low");
    std::string meta = add(ws, "Tracker", {}, IssueType::Meta);

    setenv("BRD_AGENT_ID", "agent-one", 1);
    StartOptions next;
    next.no_sync = true;
    next.no_push = true;
    auto started = start_issue(ws, next);
    assert(started.ok());
    assert(started->id == low);  // meta trackers are never picked
    assert(started->agent == "agent-one");

    IssueMap issues = load(ws);
    assert(issues.at(low).status == Status::Doing);
    assert(issues.at(low).owner == std::optional<std::string>("agent-one"));
    assert(issues.at(meta).status == Status::Open);

    auto none = start_issue(ws, next);
    assert(!none.ok() && none.error().message == "no ready issues");

    setenv("BRD_AGENT_ID", "agent-two", 1);
    StartOptions claim = next;
    claim.id = low;
    auto conflict = start_issue(ws, claim);
    assert(!conflict.ok());
    assert(conflict.error().exit_code() == 14);
    assert(conflict.error().message.find("agent-one") != std::string::npos);

    claim.force = true;
    auto stolen = start_issue(ws, claim);
    assert(stolen.ok());
    assert(load(ws).at(low).owner == std::optional<std::string>("agent-two"));

    // Doing issues resist deletion without --force
    auto kept = remove_issue(ws, low, false);
    assert(!kept.ok());
    assert(fs::exists(issue_path(ws.issues_dir, low)));
    auto removed = remove_issue(ws, low, true);
    assert(removed.ok() && *removed == low);
    assert(!fs::exists(issue_path(ws.issues_dir, low)));

    unsetenv("BRD_AGENT_ID");
    std::cout << "  PASS" << std::endl;
}

void test_start_commits() {
    std::cout << "Testing auto-commit on start and done..." << std::endl;

    fs::path dir = make_repo("commit-repo");
    Workspace ws = init_repo(dir);
    std::string id = add(ws, "Ship it");

    setenv("BRD_AGENT_ID", "committer", 1);
    StartOptions opts;
    opts.id = id;
    auto started = start_issue(ws, opts);  // no origin: sync and push are skipped
    assert(started.ok());
    assert(last_commit_subject(dir) == "chore(braid): start " + id);

    DoneOptions done;
    done.id = id;
    assert(complete_issue(ws, done).ok());
    assert(last_commit_subject(dir) == "chore(braid): done " + id);

    auto off = set_auto_sync(ws.paths, false);
    assert(off.ok() && *off);
    auto unchanged = set_auto_sync(ws.paths, false);
    assert(unchanged.ok() && !*unchanged);

    auto quiet = open_workspace(ws.paths);
    assert(quiet.ok());
    assert(!quiet->config.auto_pull && !quiet->config.auto_push);

    std::string other = add(*quiet, "Manual");
    StartOptions manual;
    manual.id = other;
    assert(start_issue(*quiet, manual).ok());
    assert(last_commit_subject(dir) == "chore(braid): set auto-sync to disabled");

    auto pending = commit_pending(*quiet, std::nullopt);
    assert(pending.ok() && pending->committed);
    assert(pending->message == "chore(braid): add 1 issue (" + other + ")");

    auto nothing = commit_pending(*quiet, std::nullopt);
    assert(nothing.ok() && !nothing->committed);

    unsetenv("BRD_AGENT_ID");
    std::cout << "  PASS" << std::endl;
}

void test_start_pulls_first() {
    std::cout << "Testing start fetches before loading..." << std::endl;

    fs::path dir = make_repo("pull-repo");
    Workspace ws = init_repo(dir);
    add(ws, "Local");
    fs::path origin = g_root / "pull-origin.git";
    fs::path peer = g_root / "pull-peer";
    assert(sh("cd '" + dir.string() + "' && git add .braid && git commit -q -m 'add braid'") == 0);
    assert(sh("git clone -q --bare '" + dir.string() + "' '" + origin.string() + "'") == 0);
    assert(sh("cd '" + dir.string() + "' && git remote add origin '" + origin.string() +
              "' && git fetch -q origin") == 0);
    assert(sh("git clone -q '" + origin.string() + "' '" + peer.string() + "'") == 0);

    // Another clone files an issue and pushes it
    auto peer_ws = open_workspace_at(peer);
    assert(peer_ws.ok());
    std::string remote_only = add(*peer_ws, "Filed elsewhere");
    assert(sh("cd '" + peer.string() + "' && git add .braid && git commit -q -m 'add issue' && "
              "git push -q origin main") == 0);
    assert(load(ws).count(remote_only) == 0);

    setenv("BRD_AGENT_ID", "puller", 1);
    StartOptions opts;
    opts.id = remote_only;
    opts.no_push = true;
    auto started = start_issue(ws, opts);
    assert(started.ok());
    assert(started->id == remote_only);
    assert(load(ws).at(remote_only).owner == std::optional<std::string>("puller"));

    auto free_lock = LockGuard::try_acquire(ws.lock_path);
    assert(free_lock.ok() && free_lock->has_value());

    unsetenv("BRD_AGENT_ID");
    std::cout << "  PASS" << std::endl;
}

void test_set_fields() {
    std::cout << "Testing set..." << std::endl;

    Workspace ws = init_repo(make_repo("set-repo"));
    std::string id = add(ws, "Editable");

    auto p = set_field(ws, id, "priority", "p0");
    assert(p.ok() && p->value == "P0");
    auto tag = set_field(ws, id, "tag", "backend");
    assert(tag.ok() && tag->value == "+backend");
    auto title = set_field(ws, id, "title", "Renamed");
    assert(title.ok());

    IssueMap issues = load(ws);
    assert(issues.at(id).priority == Priority::P0);
    assert(issues.at(id).has_tag("backend"));
    assert(issues.at(id).title == "Renamed");

    auto unknown = set_field(ws, id, "colour", "red");
    assert(!unknown.ok() && unknown.error().exit_code() == 2);

    std::cout << "  PASS" << std::endl;
}

void test_migrate() {
    std::cout << "Testing migrate..." << std::endl;

    Workspace ws = init_repo(make_repo("migrate-repo"));
    std::string current = add(ws, "Already current");
    fs::path legacy = ws.issues_dir / "migr-old1.md";
    write_text(legacy,
               "---\nbrd: 1\nid: migr-old1\ntitle: legacy\npriority: P2\nstatus: todo\n"
               "created_at: 2024-01-01T00:00:00Z\n---\n\nLegacy body.\n");
    const std::string before = read_text(legacy);

    auto dry = migrate_store(ws, true);
    assert(dry.ok());
    assert(dry->entries.size() == 1);
    assert(dry->entries[0].id == "migr-old1");
    assert(dry->entries[0].from_version == 1);
    assert(dry->entries[0].steps.size() == 8);
    assert(read_text(legacy) == before);

    auto real = migrate_store(ws, false);
    assert(real.ok() && real->entries.size() == 1);
    std::string after = read_text(legacy);
    assert(after.find("schema_version: 9") != std::string::npos);
    assert(after.find("status: open") != std::string::npos);
    assert(after.find("brd:") == std::string::npos);
    assert(after.find("Legacy body.") != std::string::npos);

    auto rerun = migrate_store(ws, false);
    assert(rerun.ok() && rerun->entries.empty());

    // A config from before auto-sync is upgraded on the next write
    write_text(ws.paths.config_path(), "schema_version = 5\nid_prefix = \"migr\"\nid_len = 4\n");
    auto old = open_workspace(ws.paths);
    assert(old.ok() && old->config_migrated);
    auto persisted = migrate_store(*old, false);
    assert(persisted.ok() && persisted->config_migrated);
    std::string cfg = read_text(ws.paths.config_path());
    assert(cfg.find("schema_version = 9") != std::string::npos);
    assert(cfg.find("auto_pull = true") != std::string::npos);
    (void)current;

    std::cout << "  PASS" << std::endl;
}

void test_doctor() {
    std::cout << "Testing doctor..." << std::endl;

    Workspace ws = init_repo(make_repo("doctor-repo"));
    std::string a = add(ws, "A");
    std::string b = add(ws, "B", {a});

    auto clean = run_doctor(ws.paths);
    assert(clean.ok());
    assert(clean->ok());
    assert(clean->status().ok());

    // Hand-edit a cycle into place
    {
        auto issues = load(ws);
        Issue edited = issues.at(a);
        edited.deps.push_back(b);
        assert(save_issue(edited, issue_path(ws.issues_dir, a)).ok());
    }
    auto cyclic = run_doctor(ws.paths);
    assert(cyclic.ok() && !cyclic->ok());
    assert(cyclic->only_cycles());
    assert(cyclic->status().error().exit_code() == 15);

    // Unparseable files warn but never fail doctor
    {
        auto issues = load(ws);
        Issue edited = issues.at(a);
        edited.deps.clear();
        assert(save_issue(edited, issue_path(ws.issues_dir, a)).ok());
    }
    write_text(ws.issues_dir / "doct-bad0.md", "garbage");
    auto unparsed = run_doctor(ws.paths);
    assert(unparsed.ok());
    assert(unparsed->ok());
    assert(unparsed->status().ok());
    bool warned = false;
    for (const auto& w : unparsed->warnings) {
        if (w.find("doct-bad0.md") != std::string::npos) warned = true;
    }
    assert(warned);
    assert(doctor_to_json(*unparsed)["warnings"].size() == 1);
    if (!g_brd.empty()) assert(brd(ws.paths.worktree_root, "doctor") == 0);

    std::string c = add(ws, "C");
    {
        auto issues = load(ws);
        Issue edited = issues.at(c);
        edited.deps.push_back("doct-gone");
        assert(save_issue(edited, issue_path(ws.issues_dir, c)).ok());
    }
    write_text(ws.issues_dir / (c + ".md.tmp.123"), "partial");

    auto broken = run_doctor(ws.paths);
    assert(broken.ok());
    assert(!broken->only_cycles());
    assert(broken->status().error().exit_code() == 1);
    bool saw_missing = false;
    for (const auto& e : broken->errors) {
        if (e.code == "missing_dep" && e.dep == "doct-gone") saw_missing = true;
        assert(e.code != "parse_error");
    }
    assert(saw_missing);
    assert(broken->warnings.size() >= 2);

    json j = doctor_to_json(*broken);
    assert(j["ok"] == false);
    assert(!j["checks"].empty());

    std::cout << "  PASS" << std::endl;
}

void test_future_config_schema() {
    std::cout << "Testing newer config schema fails closed..." << std::endl;

    fs::path dir = make_repo("future-repo");
    Workspace ws = init_repo(dir);
    std::string id = add(ws, "Before upgrade");
    write_text(ws.paths.config_path(), "schema_version = 999\nid_prefix = \"futu\"\nid_len = 4\n");

    auto opened = open_workspace(ws.paths);
    assert(!opened.ok());
    assert(opened.error().exit_code() == 16);
    assert(opened.error().message.find("v999") != std::string::npos);

    auto doctor = run_doctor(ws.paths);
    assert(!doctor.ok() && doctor.error().exit_code() == 16);

    auto init = init_braid(ws.paths);
    assert(!init.ok() && init.error().exit_code() == 16);

    auto branch = set_issues_branch(ws.paths, "issues");
    assert(!branch.ok() && branch.error().exit_code() == 16);

    if (!g_brd.empty()) {
        const std::vector<std::string> commands = {
            "ls", "show " + id, "ready", "next", "status", "path " + id, "add new",
            "start " + id, "done " + id, "skip " + id, "reopen " + id, "set " + id + " p P1",
            "rm " + id, "dep add " + id + " " + id, "dep rm " + id + " " + id, "migrate",
            "commit", "sync", "doctor", "init", "config", "config auto-sync off"
        };
        for (const auto& cmd : commands) {
            int rc = brd(dir, cmd);
            if (rc != 16) std::cerr << "  brd " << cmd << " exited " << rc << std::endl;
            assert(rc == 16);
        }
    }

    std::cout << "  PASS" << std::endl;
}

void test_issues_branch_mode() {
    std::cout << "Testing issues-branch mode..." << std::endl;

    fs::path dir = make_repo("branch-repo");
    Workspace ws = init_repo(dir);
    std::string first = add(ws, "Moves to branch");
    assert(sh("cd '" + dir.string() + "' && git add .braid && git commit -q -m 'add braid'") == 0);

    // Needs a clean tree
    write_text(dir / "dirty.txt", "x");
    assert(sh("cd '" + dir.string() + "' && git add dirty.txt") == 0);
    auto refused = set_issues_branch(ws.paths, "braid-issues");
    assert(!refused.ok());
    assert(sh("cd '" + dir.string() + "' && git commit -q -m dirty") == 0);

    auto set = set_issues_branch(ws.paths, "braid-issues");
    assert(set.ok());
    assert(set->created_branch);
    assert(set->moved == 1);
    assert(fs::exists(set->issues_worktree / ".git"));
    assert(!fs::exists(issue_path(ws.paths.local_issues_dir(), first)));

    auto again = set_issues_branch(ws.paths, "braid-issues");
    assert(again.ok() && again->unchanged);

    auto bws = open_workspace(ws.paths);
    assert(bws.ok());
    assert(bws->mode == Mode::IssuesBranch);
    assert(bws->issues_dir == set->issues_worktree / ".braid" / "issues");
    assert(bws->sync_root == set->issues_worktree);
    assert(load(*bws).count(first) == 1);

    std::string second = add(*bws, "Lives on branch");
    assert(fs::exists(issue_path(bws->issues_dir, second)));

    auto synced = sync_issues(*bws, false);
    assert(synced.ok());
    assert(synced->committed);
    assert(!synced->pushed);

    auto cleared = clear_issues_branch(ws.paths);
    assert(cleared.ok());
    assert(cleared->moved == 2);
    assert(fs::exists(issue_path(ws.paths.local_issues_dir(), second)));

    auto native = open_workspace(ws.paths);
    assert(native.ok() && native->mode == Mode::GitNative);
    auto not_branch = sync_issues(*native, false);
    assert(!not_branch.ok());

    // The worktree survives --clear; re-enabling needs it clean
    assert(fs::exists(cleared->issues_worktree / ".git"));
    write_text(cleared->issues_worktree / "scratch.txt", "left behind");
    auto dirty_wt = set_issues_branch(ws.paths, "braid-issues");
    assert(!dirty_wt.ok());
    assert(dirty_wt.error().message.find("issues worktree has uncommitted changes") != std::string::npos);
    assert(load(*native).count(second) == 1);

    fs::remove(cleared->issues_worktree / "scratch.txt");
    auto reenabled = set_issues_branch(ws.paths, "braid-issues");
    assert(reenabled.ok());
    assert(!reenabled->created_branch);
    assert(reenabled->moved == 2);
    assert(clear_issues_branch(ws.paths).ok());

    std::cout << "  PASS" << std::endl;
}

void test_external_repo_mode() {
    std::cout << "Testing external-repo mode..." << std::endl;

    fs::path tracker_dir = make_repo("tracker");
    Workspace tracker = init_repo(tracker_dir);
    std::string shared = add(tracker, "Shared issue");

    fs::path app_dir = make_repo("app");
    Workspace app = init_repo(app_dir);

    auto missing = set_external_repo(app.paths, "../no-such-repo");
    assert(!missing.ok() && missing.error().exit_code() == 11);

    auto set = set_external_repo(app.paths, "../tracker");
    assert(set.ok());
    assert(set->resolved == tracker_dir);

    auto ws = open_workspace(app.paths);
    assert(ws.ok());
    assert(ws->mode == Mode::ExternalRepo);
    assert(ws->issues_dir == tracker.issues_dir);
    assert(ws->lock_path == tracker.lock_path);
    assert(ws->store_config.id_prefix == "trac");
    assert(load(*ws).count(shared) == 1);

    std::string from_app = add(*ws, "Filed from app");
    assert(from_app.rfind("trac-", 0) == 0);
    assert(fs::exists(issue_path(tracker.issues_dir, from_app)));

    // Chains are rejected
    fs::path chained_dir = make_repo("chained");
    Workspace chained = init_repo(chained_dir);
    assert(set_external_repo(chained.paths, "../app").error().exit_code() == 11);

    auto cleared = clear_external_repo(app.paths);
    assert(cleared.ok() && !cleared->unchanged);
    auto native = open_workspace(app.paths);
    assert(native.ok() && native->mode == Mode::GitNative);

    std::cout << "  PASS" << std::endl;
}

void test_concurrent_adds() {
    std::cout << "Testing concurrent adds..." << std::endl;

    Workspace ws = init_repo(make_repo("busy-repo"));
    constexpr int writers = 8;
    std::vector<pid_t> children;
    for (int i = 0; i < writers; ++i) {
        pid_t pid = fork();
        assert(pid >= 0);
        if (pid == 0) {
            AddOptions opts;
            opts.title = "writer " + std::to_string(i);
            auto r = add_issue(ws, opts);
            _exit(r.ok() ? 0 : 1);
        }
        children.push_back(pid);
    }
    for (pid_t pid : children) {
        int status = 0;
        assert(waitpid(pid, &status, 0) == pid);
        assert(WIFEXITED(status) && WEXITSTATUS(status) == 0);
    }

    IssueMap issues = load(ws);
    assert(issues.size() == static_cast<size_t>(writers));
    std::set<std::string> titles;
    for (const auto& [id, issue] : issues) titles.insert(issue.title);
    assert(titles.size() == static_cast<size_t>(writers));

    for (const auto& entry : fs::directory_iterator(ws.issues_dir)) {
        assert(entry.path().filename().string().find(".tmp.") == std::string::npos);
    }

    std::cout << "  PASS" << std::endl;
}

void test_cli_exit_codes() {
    if (g_brd.empty()) {
        std::cout << "Skipping CLI checks (no brd path given)" << std::endl;
        return;
    }
    std::cout << "Testing CLI exit codes..." << std::endl;

    fs::path outside = g_root / "not-a-repo";
    fs::create_directories(outside);
    assert(brd(outside, "ls") == 10);

    fs::path dir = make_repo("cli-repo");
    assert(brd(dir, "ls") == 17);
    assert(brd(dir, "init") == 0);
    assert(brd(dir, "add 'CLI one'") == 0);
    assert(brd(dir, "add 'CLI two'") == 0);
    assert(brd(dir, "add") == 2);
    assert(brd(dir, "--bogus ls") == 2);
    assert(brd(dir, "show zzzz") == 12);
    assert(brd(dir, "show cli") == 13);
    assert(brd(dir, "ls --json") == 0);
    assert(brd(dir, "doctor") == 0);
    assert(brd(dir, "set cli p P0") == 13);

    IssueMap issues = load(init_repo(dir));
    const std::string one = issues.begin()->first;
    assert(brd(dir, "set " + one + " owner -") == 0);
    assert(brd(dir, "start " + one + " --no-sync --no-push") == 0);
    assert(sh("cd '" + dir.string() + "' && BRD_AGENT_ID=other '" + g_brd + "' start " + one +
              " --no-sync --no-push >/dev/null 2>&1") == 14);
    assert(brd(dir, "--json show " + one) == 0);

    // -d and -r are the short forms of --dep and --result
    assert(brd(dir, "add 'CLI design' -t design -d " + one) == 0);
    assert(brd(dir, "add 'CLI impl'") == 0);
    auto cli_ws = open_workspace_at(dir);
    assert(cli_ws.ok());
    std::string design, impl;
    for (const auto& [id, i] : load(*cli_ws)) {
        if (i.title == "CLI design") design = id;
        if (i.title == "CLI impl") impl = id;
    }
    assert(!design.empty() && !impl.empty());
    assert((load(*cli_ws).at(design).deps == std::vector<std::string>{one}));
    assert(brd(dir, "done " + design + " -r " + impl + " --no-push") == 0);
    issues = load(*cli_ws);
    assert(issues.at(design).status == Status::Done);
    assert((issues.at(impl).deps == std::vector<std::string>{one}));

    std::cout << "  PASS" << std::endl;
}

void test_agent_init() {
    std::cout << "Testing agent worktree creation..." << std::endl;

    fs::path dir = make_repo("agent-repo");
    Workspace ws = init_repo(dir);
    assert(sh("cd '" + dir.string() + "' && git add .braid && git commit -q -m 'add braid'") == 0);
    assert(set_issues_branch(ws.paths, "braid-issues").ok());

    // A missing shared issues worktree is recreated for the new agent
    fs::path issues_wt = ws.paths.issues_worktree_dir();
    assert(sh("cd '" + dir.string() + "' && git worktree remove --force '" + issues_wt.string() +
              "'") == 0);
    assert(!fs::exists(issues_wt / ".git"));

    const char* prev_home = std::getenv("HOME");
    std::optional<std::string> saved_home;
    if (prev_home) saved_home = prev_home;
    fs::path home = g_root / "home";
    setenv("HOME", home.c_str(), 1);

    auto bad = init_agent_worktree(ws.paths, "bad name", std::nullopt);
    assert(!bad.ok() && bad.error().exit_code() == 2);

    auto made = init_agent_worktree(ws.paths, "worker-1", std::nullopt);
    assert(made.ok());
    assert(made->worktree == home / ".braid" / "worktrees" / "agent-repo" / "worker-1");
    assert(made->branch == "worker-1");
    assert(made->base == "main");
    assert(made->issues_branch == std::optional<std::string>("braid-issues"));
    assert(fs::exists(issues_wt / ".git"));

    auto agent_id = read_agent_file(made->worktree / ".braid" / "agent.toml");
    assert(agent_id.ok() && *agent_id == std::optional<std::string>("worker-1"));
    auto head = git::output(made->worktree, {"rev-parse", "--abbrev-ref", "HEAD"});
    assert(head.ok() && *head == "worker-1");

    // The agent sees the same issue store
    auto agent_paths = discover(made->worktree);
    assert(agent_paths.ok());
    auto agent_ws = open_workspace(*agent_paths);
    assert(agent_ws.ok());
    assert(agent_ws->mode == Mode::IssuesBranch);
    assert(fs::weakly_canonical(agent_ws->issues_dir) ==
           fs::weakly_canonical(open_workspace(ws.paths)->issues_dir));

    auto dup = init_agent_worktree(ws.paths, "worker-1", std::nullopt);
    assert(!dup.ok());
    assert(dup.error().message.find("already exists") != std::string::npos);
    auto nested = init_agent_worktree(*agent_paths, "worker-2", std::nullopt);
    assert(!nested.ok());
    assert(nested.error().message.find("already in an agent worktree") != std::string::npos);

    assert(sh("cd '" + dir.string() + "' && git branch release") == 0);
    auto based = init_agent_worktree(ws.paths, "worker-3", std::string("release"));
    assert(based.ok() && based->base == "release");

    // Agents fall behind once main moves on
    write_text(dir / "later.txt", "later\n");
    assert(sh("cd '" + dir.string() + "' && git add later.txt && git commit -q -m later") == 0);
    bool behind = false;
    for (const auto& wt : find_agent_worktrees_needing_rebase(dir)) {
        if (wt.branch == "worker-1") behind = true;
    }
    assert(behind);

    if (!g_brd.empty()) {
        assert(brd(dir, "agent init worker-4") == 0);
        assert(fs::exists(home / ".braid" / "worktrees" / "agent-repo" / "worker-4" / ".braid" /
                          "agent.toml"));
        assert(brd(dir, "agent bogus") == 2);
    }

    if (saved_home) {
        setenv("HOME", saved_home->c_str(), 1);
    } else {
        unsetenv("HOME");
    }

    std::cout << "  PASS" << std::endl;
}

int main(int argc, char** argv) {
    std::cout << "=== Braid Repository Tests ===" << std::endl;
    if (argc > 1) g_brd = fs::absolute(argv[1]).string();

    std::string tmpl = (fs::temp_directory_path() / "braid_repo_XXXXXX").string();
    char* root = mkdtemp(tmpl.data());
    assert(root != nullptr);
    g_root = fs::canonical(root);
    std::cout << "workspace: " << g_root.string() << std::endl;
    std::cout << std::endl;

    setenv("GIT_AUTHOR_NAME", "braid-test", 1);
    setenv("GIT_AUTHOR_EMAIL", "braid-test@example.com", 1);
    setenv("GIT_COMMITTER_NAME", "braid-test", 1);
    setenv("GIT_COMMITTER_EMAIL", "braid-test@example.com", 1);
    setenv("GIT_CONFIG_NOSYSTEM", "1", 1);
    unsetenv("BRD_AGENT_ID");

    test_init_and_add();
    test_not_initialized();
    test_readiness();
    test_cycle_rejected();
    test_design_propagation();
    test_start_and_claims();
    test_start_commits();
    test_start_pulls_first();
    test_set_fields();
    test_migrate();
    test_doctor();
    test_future_config_schema();
    test_issues_branch_mode();
    test_external_repo_mode();
    test_agent_init();
    test_concurrent_adds();
    test_cli_exit_codes();

    fs::remove_all(g_root);

    std::cout << std::endl;
    std::cout << "=== All tests passed ===" << std::endl;
    return 0;
}
