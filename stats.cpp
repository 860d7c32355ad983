//
// SchedSim: Out-of-Order Scheduling Core Model
// Statistics tree
//
// Copyright 2006 Matt T. Yourst <yourst@yourst.com>
//
// This program is free software; it is licensed under the
// GNU General Public License, Version 2.
//

#include <globals.h>
#include <stats.h>

using namespace SchedSim;

void update_stats(SchedSimStats& stats, const OutOfOrderCore& core) {
  stats.ooocore = core.stats;
  stats.ooocore.scheduler = core.sched.stats;

  stats.summary.cycles = core.stats.cycles;
  stats.summary.insns = core.total_insns_committed;
  stats.summary.ipc = (stats.summary.cycles) ? ((double)stats.summary.insns / (double)stats.summary.cycles) : 0;
}

static ostream& indent(ostream& os, int depth) {
  foreach (i, depth) os << "  ";
  return os;
}

static ostream& print_node(ostream& os, int depth, const char* name) {
  return indent(os, depth) << name, ":", endl;
}

static ostream& print_value(ostream& os, int depth, const char* name, W64 value) {
  return indent(os, depth) << padstring(name, -20), " ", value, endl;
}

static ostream& print_value(ostream& os, int depth, const char* name, W64 value, W64 total) {
  return indent(os, depth) << padstring(name, -20), " ", intstring(value, 12), " (", floatstring(((total) ? percent(value, total) : 0.0), 6, 2), "%)", endl;
}

// Each bucket printed with its share of the total
static ostream& print_histogram(ostream& os, int depth, const char* name, const W64* buckets, int n) {
  W64 total = 0;
  foreach (i, n) total += buckets[i];

  print_node(os, depth, name);
  foreach (i, n) {
    if (!buckets[i]) continue;
    stringbuf sb;
    sb << i;
    print_value(os, depth+1, sb, buckets[i], total);
  }
  return os;
}

static ostream& print_labeled(ostream& os, int depth, const char* name, const W64* values, const char** labels, int n) {
  W64 total = 0;
  foreach (i, n) total += values[i];

  print_node(os, depth, name);
  foreach (i, n) print_value(os, depth+1, labels[i], values[i], total);
  return os;
}

static ostream& print_scheduler(ostream& os, int depth, const SchedulerStats& s) {
  print_node(os, depth, "scheduler");

  print_node(os, depth+1, "dispatch");
  print_value(os, depth+2, "ok", s.dispatch.ok);
  print_value(os, depth+2, "window_full", s.dispatch.window_full);

  const struct SchedulerStats::dispatch::source& src = s.dispatch.source;
  W64 sources = src.zero + src.immediate + src.committed + src.forwarded + src.waiting;
  print_node(os, depth+2, "source");
  print_value(os, depth+3, "zero", src.zero, sources);
  print_value(os, depth+3, "immediate", src.immediate, sources);
  print_value(os, depth+3, "committed", src.committed, sources);
  print_value(os, depth+3, "forwarded", src.forwarded, sources);
  print_value(os, depth+3, "waiting", src.waiting, sources);

  print_node(os, depth+1, "issue");
  print_value(os, depth+2, "ok", s.issue.ok);
  print_value(os, depth+2, "none", s.issue.none);

  print_node(os, depth+1, "complete");
  print_value(os, depth+2, "ok", s.complete.ok);
  print_value(os, depth+2, "wakeups", s.complete.wakeups);
  print_value(os, depth+2, "woken_ready", s.complete.woken_ready);

  print_node(os, depth+1, "commit");
  print_value(os, depth+2, "ok", s.commit.ok);
  print_value(os, depth+2, "none", s.commit.none);

  print_node(os, depth+1, "flush");
  print_value(os, depth+2, "count", s.flush.count);
  print_value(os, depth+2, "annulled", s.flush.annulled);

  return os;
}

ostream& operator <<(ostream& os, const SchedSimStats& stats) {
  print_node(os, 0, "summary");
  print_value(os, 1, "cycles", stats.summary.cycles);
  print_value(os, 1, "insns", stats.summary.insns);
  indent(os, 1) << padstring("ipc", -20), " ", floatstring(stats.summary.ipc, 0, 3), endl;

  const OutOfOrderCoreStats& c = stats.ooocore;

  print_node(os, 0, "ooocore");
  print_value(os, 1, "cycles", c.cycles);

  print_node(os, 1, "dispatch");
  print_histogram(os, 2, "width", c.dispatch.width, lengthof(c.dispatch.width));
  print_value(os, 2, "stalled_cycles", c.dispatch.stalled_cycles);

  print_node(os, 1, "issue");
  print_labeled(os, 2, "opclass", c.issue.opclass, opclass_names, OPCLASS_COUNT);
  print_histogram(os, 2, "width", c.issue.width, lengthof(c.issue.width));

  print_node(os, 1, "commit");
  print_histogram(os, 2, "width", c.commit.width, lengthof(c.commit.width));
  print_value(os, 2, "insns", c.commit.insns);

  print_node(os, 1, "fu");
  print_histogram(os, 2, "busy_cycles", c.fu.busy_cycles, lengthof(c.fu.busy_cycles));
  print_histogram(os, 2, "executed", c.fu.executed, lengthof(c.fu.executed));
  print_value(os, 2, "annulled", c.fu.annulled);

  print_value(os, 1, "pipeline_flushes", c.pipeline_flushes);

  print_scheduler(os, 1, c.scheduler);

  return os;
}
