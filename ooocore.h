// -*- c++ -*-
//
// SchedSim: Out-of-Order Scheduling Core Model
// Out-of-Order Core Structures
//
// Copyright 2003-2006 Matt T. Yourst <yourst@yourst.com>
//
// This program is free software; it is licensed under the
// GNU General Public License, Version 2.
//

// With this disabled, simulation is faster
#define SCHEDSIM_ENABLE_LOGGING

#ifndef _OOOCORE_H_
#define _OOOCORE_H_

#include <globals.h>
#include <schedhwdef.h>

namespace SchedSim {
  //
  // Operand formats
  //
  static const int MAX_OPERANDS = 2;
  static const int RA = 0;
  static const int RB = 1;

  //
  // Sizing
  //
  static const int ROB_SIZE = 32;
  static const int MAX_DISPATCH_WIDTH = 8;
  static const int MAX_COMMIT_WIDTH = 8;
  static const int MAX_FUNCTIONAL_UNITS = 16;

  // RAT entry with no live producer: read the committed register file
  static const int RAT_RESOLVED = -1;

  //
  // Per-scheduler event counters. The core folds these into
  // its own statistics tree (see stats.h).
  //
  struct SchedulerStats {
    struct dispatch {
      W64 ok;
      W64 window_full;
      struct source { // node: summable
        W64 zero;
        W64 immediate;
        W64 committed;
        W64 forwarded;
        W64 waiting;
      } source;
    } dispatch;

    struct issue {
      W64 ok;
      W64 none;
    } issue;

    struct complete {
      W64 ok;
      W64 wakeups;
      W64 woken_ready;
    } complete;

    struct commit {
      W64 ok;
      W64 none;
    } commit;

    struct flush {
      W64 count;
      W64 annulled;
    } flush;
  };

  //
  // Instruction lifecycle record. The tag of a slot is its
  // position in the pool and never changes.
  //
  // States:
  //               V R I C
  // free          0 0 0 0
  // waiting       1 0 0 0
  // ready         1 1 0 0
  // issued        1 1 1 0
  // completed     1 1 1 1
  //
  struct Slot {
    TransOp uop;
    W64 operands[MAX_OPERANDS];
    // Producer tag each pending operand waits on, or -1
    W16s producers[MAX_OPERANDS];
    W64 result;
    W16s idx;
    byte pending;
    byte valid:1, ready:1, issued:1, completed:1;

    int index() const { return idx; }

    void init(int idx);
    void reset();
    ostream& print(ostream& os) const;
  };

  static inline ostream& operator <<(ostream& os, const Slot& slot) {
    return slot.print(os);
  }

  //
  // Register Alias Table: per architectural register, either
  // resolved (committed value) or the tag of its youngest
  // in-flight producer.
  //
  struct RegisterAliasTable {
    W16s map[ARCHREG_COUNT];

    void reset() {
      foreach (i, ARCHREG_COUNT) map[i] = RAT_RESOLVED;
    }

    W16s& operator [](int reg) { return map[reg]; }
    const W16s& operator [](int reg) const { return map[reg]; }

    bool resolved(int reg) const { return (map[reg] == RAT_RESOLVED); }

    ostream& print(ostream& os) const;
  };

  static inline ostream& operator <<(ostream& os, const RegisterAliasTable& rat) {
    return rat.print(os);
  }

  //
  // Architectural register file, written only at commit
  //
  struct CommittedRegisterFile {
    W64 regs[ARCHREG_COUNT];

    void reset() {
      foreach (i, ARCHREG_COUNT) regs[i] = 0;
    }

    W64 operator [](int reg) const { return regs[reg]; }

    void write(int reg, W64 value) {
      check_invariant(inrange(reg, 0, ARCHREG_COUNT-1));
      // r0 is hard-wired to zero
      if unlikely (reg == REG_zero) return;
      regs[reg] = value;
    }

    ostream& print(ostream& os) const;
  };

  static inline ostream& operator <<(ostream& os, const CommittedRegisterFile& arf) {
    return arf.print(os);
  }

  //
  // Wakeup matrix: bit [operand][waiter][producer] is set while
  // operand <operand> of slot <waiter> waits for slot <producer>.
  // Keeping one plane per operand means an instruction that reads
  // the same producer twice holds two bits, one per operand, and
  // a single completion clears both.
  //
  template <int size>
  struct WakeupMatrix {
    bitvec<size> waitsfor[MAX_OPERANDS][size];

    void reset() {
      foreach (operand, MAX_OPERANDS) {
        foreach (i, size) waitsfor[operand][i].reset();
      }
    }

    void set(int waiter, int operand, int producer) {
      waitsfor[operand][waiter].set(producer);
    }

    void reset(int waiter, int operand, int producer) {
      waitsfor[operand][waiter].reset(producer);
    }

    bool test(int waiter, int operand, int producer) const {
      return waitsfor[operand][waiter].test(producer);
    }

    // All producers slot <waiter> waits on, merged across operands
    bitvec<size> row(int waiter) const {
      bitvec<size> r;
      foreach (operand, MAX_OPERANDS) r |= waitsfor[operand][waiter];
      return r;
    }

    // Number of set bits in the row of <waiter>, counted per operand
    int edges(int waiter) const {
      int n = 0;
      foreach (operand, MAX_OPERANDS) n += waitsfor[operand][waiter].popcount();
      return n;
    }

    // All slots with at least one operand waiting on <producer>
    bitvec<size> waiters(int producer) const {
      bitvec<size> c;
      foreach (i, size) {
        foreach (operand, MAX_OPERANDS) {
          if (waitsfor[operand][i].test(producer)) c.set(i);
        }
      }
      return c;
    }

    void clear_row(int waiter) {
      foreach (operand, MAX_OPERANDS) waitsfor[operand][waiter].reset();
    }

    void clear_column(int producer) {
      foreach (operand, MAX_OPERANDS) {
        foreach (i, size) waitsfor[operand][i].reset(producer);
      }
    }

    ostream& print(ostream& os) const {
      os << "Wakeup matrix (row waits on column):", endl;
      foreach (i, size) {
        if (!edges(i)) continue;
        os << "  ", intstring(i, 3), ": ";
        foreach (operand, MAX_OPERANDS) {
          os << waitsfor[operand][i], " ";
        }
        os << endl;
      }
      return os;
    }
  };

  template <int size>
  static inline ostream& operator <<(ostream& os, const WakeupMatrix<size>& m) {
    return m.print(os);
  }

  //
  // Retired instruction as reported by commit
  //
  struct CommitRecord {
    int tag;
    int rd;
    W64 value;
    W64 uuid;
  };

  //
  // Scheduler: slot pool, renaming, wakeup and in-order retirement
  // over a circular window of <size> slots. Occupied slots always
  // form one contiguous run starting at head; dispatch allocates at
  // tail and commit frees at head.
  //
  template <int size>
  struct OutOfOrderScheduler {
    static const int SIZE = size;

    Slot slots[size];
    RegisterAliasTable rat;
    CommittedRegisterFile arf;
    WakeupMatrix<size> wakeup;
    SchedulerStats stats;

    int head;
    int tail;
    int count;

    OutOfOrderScheduler() { reset(); }

    void reset();

    int remaining() const { return (size - count); }
    bool empty() const { return (!count); }
    bool full() const { return (!remaining()); }

    Slot& operator [](int tag) { return slots[tag]; }
    const Slot& operator [](int tag) const { return slots[tag]; }

    //
    // Allocate the tail slot for <uop>, rename its sources and
    // destination. Returns false (backpressure) if the window is full.
    //
    bool dispatch(const TransOp& uop, int& tag);

    //
    // Select the oldest ready, unissued slot whose opcode can run
    // on any functional unit class in <fumask>.
    //
    bool issue(W32 fumask, int& tag);

    // Capture the result of <tag> and wake up its waiters
    void complete(int tag, W64 result);

    //
    // Retire the head slot if it has completed. Returns false
    // if the head is empty or still in flight.
    //
    bool commit(CommitRecord& cr);

    // Same, but the caller names the slot it expects to be the head
    bool commit(int tag, CommitRecord& cr);

    //
    // Annul <from_tag> and every younger slot, then restore the
    // RAT from the survivors. Returns the number of annulled slots.
    //
    int flush(int from_tag);

    void rebuild_rat();

    bool validate() const;

    ostream& print(ostream& os) const;
  };

  template <int size>
  static inline ostream& operator <<(ostream& os, const OutOfOrderScheduler<size>& sched) {
    return sched.print(os);
  }

  // Instantiate any scheduler sizes used by the core or tests:
#define declare_scheduler_templates \
  template struct OutOfOrderScheduler<4>; \
  template struct OutOfOrderScheduler<8>; \
  template struct OutOfOrderScheduler<16>; \
  template struct OutOfOrderScheduler<32>; \
  template struct OutOfOrderScheduler<64>

  //
  // Execution resource: runs one instruction at a time
  // (not pipelined) for a fixed number of cycles.
  //
  struct FunctionalUnit {
    char name[16];
    W32 fumask;
    int fuclass;
    int latency;

    // Slot being executed, or -1 if idle
    int tag;
    W64 uuid;
    int cycles_left;
    W64 result;

    void init(int fuclass, int index, int latency);
    void reset();
    bool busy() const { return (tag >= 0); }
    ostream& print(ostream& os) const;
  };

  static inline ostream& operator <<(ostream& os, const FunctionalUnit& fu) {
    return fu.print(os);
  }

  //
  // Statistics collected by the core itself (stats.h adds the summary)
  //
  struct OutOfOrderCoreStats {
    W64 cycles;

    struct dispatch {
      W64 width[MAX_DISPATCH_WIDTH+1]; // histo: 0, MAX_DISPATCH_WIDTH, 1
      W64 stalled_cycles;
    } dispatch;

    struct issue {
      W64 opclass[OPCLASS_COUNT]; // label: opclass_names
      W64 width[MAX_FUNCTIONAL_UNITS+1]; // histo: 0, MAX_FUNCTIONAL_UNITS, 1
    } issue;

    struct commit {
      W64 width[MAX_COMMIT_WIDTH+1]; // histo: 0, MAX_COMMIT_WIDTH, 1
      W64 insns;
    } commit;

    struct fu {
      W64 busy_cycles[MAX_FUNCTIONAL_UNITS];
      W64 executed[MAX_FUNCTIONAL_UNITS];
      W64 annulled;
    } fu;

    W64 pipeline_flushes;

    SchedulerStats scheduler;
  };

  //
  // Pipeline driver: feeds a fixed instruction sequence through the
  // scheduler, the functional units and retirement, one cycle at a time.
  //
  struct OutOfOrderCore {
    OutOfOrderScheduler<ROB_SIZE> sched;

    FunctionalUnit fus[MAX_FUNCTIONAL_UNITS];
    int fu_count;

    // Frontend
    dynarray<TransOp> program;
    int fetchindex;

    // Parameters (snapshot of the configuration at init)
    int dispatch_width;
    int commit_width;
    W64 flush_interval;
    W64 stop_at_cycle;
    W64 stop_at_insns;

    // Commit
    W64 total_insns_committed;
    W64 commits_since_flush;
    W64 last_commit_at_cycle;

    OutOfOrderCoreStats stats;

    OutOfOrderCore() { fu_count = 0; fetchindex = 0; }

    //
    // Size the core from the configuration and clear all state.
    // Returns false (with a warning) if the configuration is invalid.
    //
    bool init();
    void reset();

    // Returns false if an opcode has no functional unit to run on
    bool load(const TransOp* uops, int n);

    // Pipeline stages
    bool runcycle();
    int dispatch();
    int issue();
    int complete();
    int commit();

    W64 run();
    void flush_pipeline();

    bool finished() const { return ((fetchindex == program.size()) && sched.empty()); }

    W64 regof(int reg) const { return sched.arf[reg]; }

    ostream& print(ostream& os) const;
  };

  static inline ostream& operator <<(ostream& os, const OutOfOrderCore& core) {
    return core.print(os);
  }
};

#endif // _OOOCORE_H_
