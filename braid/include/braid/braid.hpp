#pragma once
// Braid: repo-local issue tracking for agents sharing a git repository
//
// - Issue: markdown + YAML front-matter, migrated on read
// - Store: one file per issue, atomic writes under a cross-process lock
// - Graph: readiness, cycles, dependency propagation
// - Layout: git-native, issues-branch and external-repo stores
// - Sync: pull before claim, commit and push after transitions
// - Ops: every mutation; Query and Doctor: read-only views

#include "version.hpp"
#include "error.hpp"
#include "log.hpp"
#include "issue.hpp"
#include "store.hpp"
#include "graph.hpp"
#include "layout.hpp"
#include "sync.hpp"
#include "ops.hpp"
#include "query.hpp"
#include "doctor.hpp"
#include "output.hpp"
