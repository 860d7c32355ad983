//
// SchedSim: Out-of-Order Scheduling Core Model
// Issue, execution and wakeup
//
// Copyright 2003-2006 Matt T. Yourst <yourst@yourst.com>
//
// This program is free software; it is licensed under the
// GNU General Public License, Version 2.
//

#include <globals.h>
#include <schedsim.h>
#include <ooocore.h>
#include <uopimpl.h>

#ifndef SCHEDSIM_ENABLE_LOGGING
#undef logable
#define logable(level) (0)
#endif

using namespace SchedSim;

namespace SchedSim {
  //
  // Oldest-first select: walk the occupied run from head, so the
  // first match is always the oldest eligible slot. Calls within
  // one cycle see each other's issued flags.
  //
  template <int size>
  bool OutOfOrderScheduler<size>::issue(W32 fumask, int& tag) {
    int idx = head;

    foreach (i, count) {
      Slot& slot = slots[idx];

      if (slot.valid && slot.ready && (!slot.issued) && (opinfo[slot.uop.opcode].fu & fumask)) {
        slot.issued = 1;
        tag = idx;
        stats.issue.ok++;
        if (logable(5)) logfile << intstring(sim_cycle, 10), " issue     ", slot, endl;
        return true;
      }

      idx = add_index_modulo(idx, +1, size);
    }

    stats.issue.none++;
    return false;
  }

  //
  // Store the result, then broadcast the tag down its column of
  // the wakeup matrix. Every set bit is one unit of pending in
  // the waiting slot and is cleared exactly once here.
  //
  template <int size>
  void OutOfOrderScheduler<size>::complete(int tag, W64 result) {
    check_invariant(inrange(tag, 0, size-1));

    Slot& slot = slots[tag];
    check_invariant(slot.valid);
    check_invariant(slot.issued);
    check_invariant(!slot.completed);

    slot.result = result;
    slot.completed = 1;
    stats.complete.ok++;

    if (logable(5)) logfile << intstring(sim_cycle, 10), " complete  ", slot, endl;

    foreach (i, size) {
      foreach (operand, MAX_OPERANDS) {
        if likely (!wakeup.test(i, operand, tag)) continue;

        wakeup.reset(i, operand, tag);

        Slot& waiter = slots[i];
        if unlikely (!waiter.valid) continue;

        check_invariant(waiter.pending > 0);
        check_invariant(waiter.producers[operand] == tag);

        waiter.operands[operand] = result;
        waiter.producers[operand] = -1;
        waiter.pending--;
        stats.complete.wakeups++;

        if (!waiter.pending) {
          waiter.ready = 1;
          stats.complete.woken_ready++;
        }

        if (logable(6)) logfile << intstring(sim_cycle, 10), " wakeup    ", waiter, endl;
      }
    }
  }

#define declare_scheduler_exec_templates(size) \
  template bool OutOfOrderScheduler<size>::issue(W32 fumask, int& tag); \
  template void OutOfOrderScheduler<size>::complete(int tag, W64 result)

  declare_scheduler_exec_templates(4);
  declare_scheduler_exec_templates(8);
  declare_scheduler_exec_templates(16);
  declare_scheduler_exec_templates(32);
  declare_scheduler_exec_templates(64);

  //
  // Issue stage: every idle functional unit asks the scheduler
  // for the oldest ready instruction it is able to execute.
  // The result is computed now and delivered after the latency.
  //
  int OutOfOrderCore::issue() {
    int issuecount = 0;

    foreach (i, fu_count) {
      FunctionalUnit& fu = fus[i];
      if (fu.busy()) continue;

      int tag;
      if (!sched.issue(fu.fumask, tag)) continue;

      const Slot& slot = sched[tag];
      const TransOp& uop = slot.uop;

      fu.tag = tag;
      fu.uuid = uop.uuid;
      fu.result = execute_uop(uop.opcode, slot.operands[RA], slot.operands[RB]);
      fu.cycles_left = fu.latency;

      stats.issue.opclass[opclassof(uop.opcode)]++;
      stats.fu.executed[i]++;
      issuecount++;

      if (logable(6)) logfile << intstring(sim_cycle, 10), " execute   ", fu, " ", uop, endl;
    }

    stats.issue.width[issuecount]++;
    return issuecount;
  }

  //
  // Complete stage: count down busy units and deliver results
  // from those reaching zero. A unit completes its instruction
  // exactly once and then becomes idle.
  //
  int OutOfOrderCore::complete() {
    int completecount = 0;

    foreach (i, fu_count) {
      FunctionalUnit& fu = fus[i];
      if (!fu.busy()) continue;

      stats.fu.busy_cycles[i]++;

      fu.cycles_left--;
      if (fu.cycles_left > 0) continue;

      sched.complete(fu.tag, fu.result);
      fu.reset();
      completecount++;
    }

    return completecount;
  }
};
