//
// SchedSim: Out-of-Order Scheduling Core Model
// Scheduler structures: dispatch, retirement and recovery
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
  //
  // Slot
  //
  void Slot::init(int idx) {
    this->idx = idx;
    reset();
  }

  void Slot::reset() {
    uop = TransOp(OP_nop, REG_none, REG_none, REG_none);
    foreach (i, MAX_OPERANDS) {
      operands[i] = 0;
      producers[i] = -1;
    }
    result = 0;
    pending = 0;
    valid = 0;
    ready = 0;
    issued = 0;
    completed = 0;
  }

  ostream& Slot::print(ostream& os) const {
    stringbuf name;
    name << uop;

    os << "slot ", intstring(idx, 3), " ";
    if (!valid) return os << "(free)";

    os << ((ready) ? 'R' : '-'), ((issued) ? 'I' : '-'), ((completed) ? 'C' : '-'), " ";
    os << "uuid ", intstring(uop.uuid, 6), "  ", padstring(name, -24);
    os << " pend ", (int)pending;

    foreach (i, MAX_OPERANDS) {
      os << ((i == 0) ? "  [" : ", ");
      if (producers[i] >= 0)
        os << "wait ", producers[i];
      else os << "0x", hexstring(operands[i], 64);
    }
    os << "]";

    if (completed) os << " = 0x", hexstring(result, 64);
    return os;
  }

  //
  // Register Alias Table
  //
  ostream& RegisterAliasTable::print(ostream& os) const {
    os << "RegisterAliasTable:", endl;
    foreach (i, ARCHREG_COUNT) {
      if ((i % 8) == 0) os << " ";
      os << " ", padstring(arch_reg_names[i], -4), " ";
      if (map[i] == RAT_RESOLVED)
        os << padstring("-", -4);
      else os << intstring(map[i], -4);
      if ((i % 8) == 7) os << endl;
    }
    return os;
  }

  //
  // Committed register file
  //
  ostream& CommittedRegisterFile::print(ostream& os) const {
    os << "CommittedRegisterFile:", endl;
    foreach (i, ARCHREG_COUNT) {
      if ((i % 4) == 0) os << " ";
      os << " ", padstring(arch_reg_names[i], -4), " 0x", hexstring(regs[i], 64);
      if ((i % 4) == 3) os << endl;
    }
    return os;
  }

  //
  // Scheduler
  //
  template <int size>
  void OutOfOrderScheduler<size>::reset() {
    foreach (i, size) slots[i].init(i);
    rat.reset();
    arf.reset();
    wakeup.reset();
    setzero(stats);
    head = 0;
    tail = 0;
    count = 0;
  }

  template <int size>
  bool OutOfOrderScheduler<size>::dispatch(const TransOp& uop, int& tag) {
    check_invariant((uop.rd == REG_none) | (uop.rd < ARCHREG_COUNT));

    if unlikely (full()) {
      stats.dispatch.window_full++;
      if (logable(6)) logfile << intstring(sim_cycle, 10), " dispatch  window full (", count, " of ", size, "), hold uuid ", uop.uuid, endl;
      return false;
    }

    tag = tail;
    Slot& slot = slots[tag];
    check_invariant(!slot.valid);

    slot.reset();
    slot.uop = uop;
    slot.valid = 1;

    //
    // Resolve sources before renaming the destination, so an
    // instruction that reads and writes the same register sees
    // the previous producer.
    //
    byte sources[MAX_OPERANDS] = {uop.ra, uop.rb};

    foreach (operand, MAX_OPERANDS) {
      int reg = sources[operand];

      if ((reg == REG_zero) | (reg == REG_none)) {
        slot.operands[operand] = 0;
        stats.dispatch.source.zero++;
        continue;
      }

      if (reg == REG_imm) {
        slot.operands[operand] = (W64)uop.imm;
        stats.dispatch.source.immediate++;
        continue;
      }

      check_invariant(reg < ARCHREG_COUNT);

      int producer = rat[reg];

      if (producer == RAT_RESOLVED) {
        slot.operands[operand] = arf[reg];
        stats.dispatch.source.committed++;
        continue;
      }

      const Slot& source = slots[producer];
      check_invariant(source.valid);

      if (source.completed) {
        // Forward the result directly: no wakeup edge
        slot.operands[operand] = source.result;
        stats.dispatch.source.forwarded++;
        continue;
      }

      wakeup.set(tag, operand, producer);
      slot.producers[operand] = producer;
      slot.pending++;
      stats.dispatch.source.waiting++;
    }

    slot.ready = (slot.pending == 0);

    if (uop.writes_register()) rat[uop.rd] = tag;

    tail = add_index_modulo(tail, +1, size);
    count++;
    stats.dispatch.ok++;

    if (logable(5)) logfile << intstring(sim_cycle, 10), " dispatch  ", slot, endl;

    return true;
  }

  template <int size>
  bool OutOfOrderScheduler<size>::commit(CommitRecord& cr) {
    if unlikely (empty()) {
      stats.commit.none++;
      return false;
    }

    Slot& slot = slots[head];
    check_invariant(slot.valid);

    if (!slot.completed) {
      stats.commit.none++;
      return false;
    }

    // Nothing may still wait on a completed producer
    check_invariant(wakeup.waiters(head).iszero());

    const TransOp& uop = slot.uop;

    cr.tag = head;
    cr.rd = (uop.opcode == OP_nop) ? REG_none : uop.rd;
    cr.value = slot.result;
    cr.uuid = uop.uuid;

    if (uop.writes_register()) {
      arf.write(uop.rd, slot.result);
      if (rat[uop.rd] == head) rat[uop.rd] = RAT_RESOLVED;
    }

    if (logable(5)) logfile << intstring(sim_cycle, 10), " commit    ", slot, endl;

    slot.reset();
    head = add_index_modulo(head, +1, size);
    count--;
    stats.commit.ok++;

    return true;
  }

  template <int size>
  bool OutOfOrderScheduler<size>::commit(int tag, CommitRecord& cr) {
    check_invariant(tag == head);
    return commit(cr);
  }

  template <int size>
  int OutOfOrderScheduler<size>::flush(int from_tag) {
    check_invariant(inrange(from_tag, 0, size-1));
    check_invariant(slots[from_tag].valid);

    int n = count - modulo_span(head, from_tag, size);

    if (logable(5)) logfile << intstring(sim_cycle, 10), " flush     from slot ", from_tag, " (", n, " of ", count, " slots annulled)", endl;

    int idx = from_tag;
    foreach (i, n) {
      Slot& slot = slots[idx];
      check_invariant(slot.valid);
      if (logable(6)) logfile << intstring(sim_cycle, 10), " annul     ", slot, endl;
      wakeup.clear_row(idx);
      wakeup.clear_column(idx);
      slot.reset();
      idx = add_index_modulo(idx, +1, size);
    }

    tail = from_tag;
    count -= n;

    rebuild_rat();

    stats.flush.count++;
    stats.flush.annulled += n;

    return n;
  }

  //
  // Point every register at its youngest surviving producer
  //
  template <int size>
  void OutOfOrderScheduler<size>::rebuild_rat() {
    rat.reset();

    int idx = head;
    foreach (i, count) {
      const Slot& slot = slots[idx];
      if (slot.uop.writes_register()) rat[slot.uop.rd] = idx;
      idx = add_index_modulo(idx, +1, size);
    }
  }

  template <int size>
  bool OutOfOrderScheduler<size>::validate() const {
    check_invariant(inrange(count, 0, size));
    check_invariant(inrange(head, 0, size-1));
    check_invariant(inrange(tail, 0, size-1));
    check_invariant((count == size) ? (head == tail) : (count == modulo_span(head, tail, size)));

    bitvec<size> occupied;
    int idx = head;
    foreach (i, count) {
      occupied.set(idx);
      idx = add_index_modulo(idx, +1, size);
    }

    foreach (i, size) {
      const Slot& slot = slots[i];
      check_invariant(slot.index() == (int)i);
      check_invariant(slot.valid == occupied.test(i));

      if (!slot.valid) {
        check_invariant(wakeup.edges(i) == 0);
        check_invariant(wakeup.waiters(i).iszero());
        continue;
      }

      check_invariant(slot.ready == (slot.pending == 0));
      check_invariant(wakeup.edges(i) == slot.pending);
      check_invariant((!slot.issued) | slot.ready);
      check_invariant((!slot.completed) | slot.issued);

      foreach (operand, MAX_OPERANDS) {
        int producer = slot.producers[operand];
        if (producer < 0) continue;
        check_invariant(wakeup.test(i, operand, producer));
        check_invariant(slots[producer].valid);
        check_invariant(!slots[producer].completed);
      }
    }

    foreach (reg, ARCHREG_COUNT) {
      int tag = rat[reg];
      if (tag == RAT_RESOLVED) continue;
      check_invariant(inrange(tag, 0, size-1));
      check_invariant(slots[tag].valid);
      check_invariant(slots[tag].uop.writes_register());
      check_invariant(slots[tag].uop.rd == reg);
    }

    return true;
  }

  template <int size>
  ostream& OutOfOrderScheduler<size>::print(ostream& os) const {
    os << "Scheduler: ", count, " of ", size, " slots used, head ", head, ", tail ", tail, endl;
    int idx = head;
    foreach (i, count) {
      os << "  ", slots[idx], endl;
      idx = add_index_modulo(idx, +1, size);
    }
    os << wakeup;
    os << rat;
    os << arf;
    return os;
  }

  declare_scheduler_templates;

  //
  // Functional units
  //
  void FunctionalUnit::init(int fuclass, int index, int latency) {
    this->fuclass = fuclass;
    this->fumask = (1 << fuclass);
    this->latency = latency;
    snprintf(name, sizeof(name), "%s%d", fu_class_names[fuclass], index);
    reset();
  }

  void FunctionalUnit::reset() {
    tag = -1;
    uuid = 0;
    cycles_left = 0;
    result = 0;
  }

  ostream& FunctionalUnit::print(ostream& os) const {
    os << padstring(name, -6), " ";
    if (!busy()) return os << "idle";
    return os << "slot ", intstring(tag, 3), " uuid ", uuid, " (", cycles_left, " cycles left)";
  }

  //
  // Core
  //
  //
  // Configuration errors are reported, not asserted: the caller
  // gets false and the core is left without functional units.
  //
  static bool check_range(const char* name, W64 value, W64 lo, W64 hi) {
    if likely (inrange(value, lo, hi)) return true;
    cerr << "Warning: ", name, " is ", value, " but must be between ", lo, " and ", hi, endl;
    return false;
  }

  bool OutOfOrderCore::init() {
    fu_count = 0;

    bool ok = true;
    ok &= check_range("alus", config.alu_count, 0, MAX_FUNCTIONAL_UNITS);
    ok &= check_range("muls", config.mul_count, 0, MAX_FUNCTIONAL_UNITS);
    ok &= check_range("divs", config.div_count, 0, MAX_FUNCTIONAL_UNITS);
    ok &= check_range("dispatch-width", config.dispatch_width, 1, MAX_DISPATCH_WIDTH);
    ok &= check_range("commit-width", config.commit_width, 1, MAX_COMMIT_WIDTH);
    ok &= check_range("alu-latency", config.alu_latency, 1, infinity);
    ok &= check_range("mul-latency", config.mul_latency, 1, infinity);
    ok &= check_range("div-latency", config.div_latency, 1, infinity);
    if unlikely (!ok) return false;

    W64 unitcount = config.alu_count + config.mul_count + config.div_count;
    if unlikely (!check_range("total functional units", unitcount, 1, MAX_FUNCTIONAL_UNITS)) return false;

    foreach (i, config.alu_count) fus[fu_count++].init(FU_CLASS_ALU, i, config.alu_latency);
    foreach (i, config.mul_count) fus[fu_count++].init(FU_CLASS_MUL, i, config.mul_latency);
    foreach (i, config.div_count) fus[fu_count++].init(FU_CLASS_DIV, i, config.div_latency);

    dispatch_width = config.dispatch_width;
    commit_width = config.commit_width;
    flush_interval = config.flush_interval;
    stop_at_cycle = config.stop_at_cycle;
    stop_at_insns = config.stop_at_user_insns;

    reset();
    return true;
  }

  void OutOfOrderCore::reset() {
    sched.reset();
    foreach (i, fu_count) fus[i].reset();
    fetchindex = 0;
    total_insns_committed = 0;
    commits_since_flush = 0;
    last_commit_at_cycle = sim_cycle;
    setzero(stats);
  }

  //
  // Every opcode in the program needs at least one functional unit
  // able to execute it, or it would never issue.
  //
  bool OutOfOrderCore::load(const TransOp* uops, int n) {
    W32 fumask = 0;
    foreach (i, fu_count) fumask |= fus[i].fumask;

    foreach (i, n) {
      const TransOp& uop = uops[i];
      if unlikely (uop.opcode >= OP_MAX_OPCODE) {
        cerr << "Warning: instruction ", i, " has invalid opcode ", (int)uop.opcode, endl;
        return false;
      }
      if unlikely (!(opinfo[uop.opcode].fu & fumask)) {
        cerr << "Warning: instruction ", i, " (", uop, ") needs a ", fu_class_names[fuclassof(uop.opcode)], " unit but none is configured", endl;
        return false;
      }
    }

    program.resize(n);
    foreach (i, n) {
      program[i] = uops[i];
      program[i].uuid = i;
    }
    fetchindex = 0;
    return true;
  }

  ostream& OutOfOrderCore::print(ostream& os) const {
    os << "OutOfOrderCore state at cycle ", sim_cycle, ": fetch ", fetchindex, " of ", program.size(), ", committed ", total_insns_committed, endl;
    os << sched;
    os << "Functional units:", endl;
    foreach (i, fu_count) os << "  ", fus[i], endl;
    return os;
  }
};
