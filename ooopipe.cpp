//
// SchedSim: Out-of-Order Scheduling Core Model
// Pipeline Stages
//
// Copyright 2003-2006 Matt T. Yourst <yourst@yourst.com>
//
// This program is free software; it is licensed under the
// GNU General Public License, Version 2.
//

#include <globals.h>
#include <schedsim.h>
#include <ooocore.h>

#ifndef SCHEDSIM_ENABLE_LOGGING
#undef logable
#define logable(level) (0)
#endif

using namespace SchedSim;

namespace SchedSim {
  // Cycles without a commit before the core is declared deadlocked
  static const int DEADLOCK_CYCLES = 4096;

  //
  // Run one cycle. Stages are evaluated in reverse pipeline order,
  // so each stage sees the state the stage after it left behind
  // at the end of the previous cycle. Returns true once the core
  // has nothing left to do or hit its instruction stop point.
  //
  bool OutOfOrderCore::runcycle() {
    commit();
    complete();
    issue();
    dispatch();

    if (logable(8)) print(logfile);

#ifdef SCHEDSIM_ENABLE_CHECKS
    sched.validate();
#endif

    stats.cycles++;
    sim_cycle++;

    if unlikely ((!sched.empty()) && ((sim_cycle - last_commit_at_cycle) > DEADLOCK_CYCLES)) {
      logfile << "Core deadlock at cycle ", sim_cycle, ": no commits since cycle ", last_commit_at_cycle, endl;
      print(logfile);
      logfile.flush();
      check_invariant((sim_cycle - last_commit_at_cycle) <= DEADLOCK_CYCLES);
    }

    return (finished() || (total_insns_committed >= stop_at_insns));
  }

  //
  // Dispatch in program order until the width is used up or the
  // window fills. An instruction refused by the scheduler stays at
  // the head of the frontend and is retried next cycle.
  //
  int OutOfOrderCore::dispatch() {
    int dispatchcount = 0;

    while ((dispatchcount < dispatch_width) && (fetchindex < program.size())) {
      int tag;
      if unlikely (!sched.dispatch(program[fetchindex], tag)) {
        stats.dispatch.stalled_cycles++;
        break;
      }
      fetchindex++;
      dispatchcount++;
    }

    stats.dispatch.width[dispatchcount]++;
    return dispatchcount;
  }

  //
  // Retire up to commit_width instructions from the head of the window
  //
  int OutOfOrderCore::commit() {
    int commitcount = 0;

    while (commitcount < commit_width) {
      CommitRecord cr;
      if (!sched.commit(cr)) break;

      commitcount++;
      total_insns_committed++;
      commits_since_flush++;
      last_commit_at_cycle = sim_cycle;

      if (logable(4)) {
        logfile << intstring(sim_cycle, 10), " retire    uuid ", intstring(cr.uuid, 6), " ";
        if (cr.rd < ARCHREG_COUNT)
          logfile << arch_reg_names[cr.rd], " = 0x", hexstring(cr.value, 64);
        else logfile << "(no result)";
        logfile << endl;
      }

      if unlikely (total_insns_committed >= stop_at_insns) break;

      if unlikely (commits_since_flush >= flush_interval) {
        flush_pipeline();
        break;
      }
    }

    stats.commit.width[commitcount]++;
    stats.commit.insns += commitcount;
    return commitcount;
  }

  //
  // Annul every uncommitted instruction and restart the frontend
  // at the oldest one. Functional units working on annulled slots
  // drop their results without completing.
  //
  void OutOfOrderCore::flush_pipeline() {
    commits_since_flush = 0;
    stats.pipeline_flushes++;

    if (logable(3)) logfile << intstring(sim_cycle, 10), " flush     pipeline with ", sched.count, " instructions in flight", endl;

    if (sched.empty()) return;

    W64 restart_uuid = sched[sched.head].uop.uuid;

    foreach (i, fu_count) {
      FunctionalUnit& fu = fus[i];
      if (!fu.busy()) continue;
      if (logable(6)) logfile << intstring(sim_cycle, 10), " cancel    ", fu, endl;
      fu.reset();
      stats.fu.annulled++;
    }

    sched.flush(sched.head);

    fetchindex = restart_uuid;
  }

  W64 OutOfOrderCore::run() {
    W64 start_cycle = sim_cycle;
    last_commit_at_cycle = sim_cycle;

    if (logable(1)) logfile << "Starting out-of-order core at cycle ", sim_cycle, " with ", program.size(), " instructions", endl;

    for (;;) {
      if unlikely (finished()) break;
      if unlikely (total_insns_committed >= stop_at_insns) break;
      if unlikely ((sim_cycle - start_cycle) >= stop_at_cycle) break;
      if (runcycle()) break;
    }

    if (logable(1)) {
      logfile << "Stopped out-of-order core at cycle ", sim_cycle, " after ", (sim_cycle - start_cycle), " cycles, ",
        total_insns_committed, " instructions committed", endl;
      logfile.flush();
    }

    return total_insns_committed;
  }
};
