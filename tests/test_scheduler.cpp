//
// SchedSim: Out-of-Order Scheduling Core Model
// Tests for dispatch, issue, completion and retirement
//

#include <gtest/gtest.h>

#include <globals.h>
#include <ooocore.h>
#include <uopimpl.h>

#include <stdlib.h>

using namespace SchedSim;

typedef OutOfOrderScheduler<8> Scheduler;
typedef OutOfOrderScheduler<4> SmallScheduler;

namespace {
  template <int size>
  int dispatch_ok(OutOfOrderScheduler<size>& s, const TransOp& uop) {
    int tag = -1;
    EXPECT_TRUE(s.dispatch(uop, tag));
    return tag;
  }

  template <int size>
  int issue_ok(OutOfOrderScheduler<size>& s, W32 fumask = FU_ANY) {
    int tag = -1;
    EXPECT_TRUE(s.issue(fumask, tag));
    return tag;
  }

  // Issue the oldest ready instruction, execute it and complete it
  template <int size>
  int execute_next(OutOfOrderScheduler<size>& s) {
    int tag = issue_ok(s);
    if (tag < 0) return tag;
    const Slot& slot = s[tag];
    s.complete(tag, execute_uop(slot.uop.opcode, slot.operands[RA], slot.operands[RB]));
    return tag;
  }

  TransOp movi(int rd, W64s imm) {
    return TransOp(OP_mov, rd, REG_none, REG_imm, imm);
  }
}

TEST(Scheduler, StartsEmpty) {
  Scheduler s;
  EXPECT_TRUE(s.empty());
  EXPECT_FALSE(s.full());
  EXPECT_EQ(s.remaining(), 8);
  EXPECT_EQ(s.head, 0);
  EXPECT_EQ(s.tail, 0);
  foreach (reg, ARCHREG_COUNT) {
    EXPECT_TRUE(s.rat.resolved(reg));
    EXPECT_EQ(s.arf[reg], 0ULL);
  }
  EXPECT_TRUE(s.validate());
}

TEST(Scheduler, DependentWaitsForProducerAndWakesWithItsResult) {
  Scheduler s;
  s.arf.write(1, 3);
  s.arf.write(2, 4);
  s.arf.write(4, 5);

  int add = dispatch_ok(s, TransOp(OP_add, 3, 1, 2));
  int mul = dispatch_ok(s, TransOp(OP_mul, 5, 3, 4));

  EXPECT_TRUE(s[add].ready);
  EXPECT_EQ(s[add].operands[RA], 3ULL);
  EXPECT_EQ(s[add].operands[RB], 4ULL);

  EXPECT_EQ(s[mul].pending, 1);
  EXPECT_FALSE(s[mul].ready);
  EXPECT_EQ(s.wakeup.row(mul).popcount(), 1);
  EXPECT_TRUE(s.wakeup.test(mul, RA, add));
  EXPECT_EQ(s[mul].producers[RA], add);
  EXPECT_EQ(s[mul].operands[RB], 5ULL);
  EXPECT_TRUE(s.validate());

  EXPECT_EQ(issue_ok(s, FU_ALU), add);
  s.complete(add, 7);

  EXPECT_EQ(s[mul].pending, 0);
  EXPECT_TRUE(s[mul].ready);
  EXPECT_EQ(s[mul].operands[RA], 7ULL);
  EXPECT_TRUE(s.wakeup.row(mul).iszero());
  EXPECT_TRUE(s.validate());
}

TEST(Scheduler, FullWindowRefusesUntilHeadRetires) {
  SmallScheduler s;
  foreach (i, 4) {
    int tag = dispatch_ok(s, movi(1 + i, i));
    EXPECT_EQ(tag, (int)i);
  }
  EXPECT_TRUE(s.full());

  int tag = -1;
  EXPECT_FALSE(s.dispatch(movi(5, 5), tag));
  EXPECT_EQ(s.stats.dispatch.window_full, 1ULL);
  EXPECT_EQ(s.count, 4);
  EXPECT_TRUE(s.validate());

  EXPECT_EQ(execute_next(s), 0);
  CommitRecord cr;
  ASSERT_TRUE(s.commit(cr));
  EXPECT_EQ(cr.tag, 0);

  // The same instruction is accepted unmodified into the freed slot
  EXPECT_TRUE(s.dispatch(movi(5, 5), tag));
  EXPECT_EQ(tag, 0);
  EXPECT_EQ(s.count, 4);
  EXPECT_EQ(s.head, 1);
  EXPECT_TRUE(s.validate());
}

TEST(Scheduler, OccupancyMatchesHeadTailDistance) {
  SmallScheduler s;
  int dispatched = 0;

  foreach (step, 40) {
    if (!s.full()) {
      dispatch_ok(s, movi(1 + (dispatched % 15), dispatched));
      dispatched++;
    }

    if ((step % 3) == 2) {
      execute_next(s);
      CommitRecord cr;
      EXPECT_TRUE(s.commit(cr));
    }

    EXPECT_LE(s.count, 4);
    if (s.full()) {
      EXPECT_EQ(s.head, s.tail);
    } else {
      EXPECT_EQ(s.count, modulo_span(s.head, s.tail, 4));
    }
    EXPECT_TRUE(s.validate());
  }
}

TEST(Scheduler, ReaderBindsToYoungestWriter) {
  Scheduler s;
  int w1 = dispatch_ok(s, movi(1, 10));
  int w2 = dispatch_ok(s, movi(1, 20));
  int r = dispatch_ok(s, TransOp(OP_add, 2, 1, REG_zero));

  EXPECT_EQ(s.rat[1], w2);
  EXPECT_EQ(s.rat[2], r);
  EXPECT_TRUE(s.wakeup.test(r, RA, w2));
  EXPECT_FALSE(s.wakeup.test(r, RA, w1));
  EXPECT_EQ(s[r].producers[RA], w2);

  EXPECT_EQ(issue_ok(s), w1);
  EXPECT_EQ(issue_ok(s), w2);

  // Completing the overwritten writer does not wake the reader
  s.complete(w1, 10);
  EXPECT_EQ(s[r].pending, 1);
  EXPECT_FALSE(s[r].ready);

  s.complete(w2, 20);
  EXPECT_TRUE(s[r].ready);
  EXPECT_EQ(s[r].operands[RA], 20ULL);

  CommitRecord cr;
  ASSERT_TRUE(s.commit(cr));
  EXPECT_EQ(s.arf[1], 10ULL);
  EXPECT_EQ(s.rat[1], w2);

  ASSERT_TRUE(s.commit(cr));
  EXPECT_EQ(s.arf[1], 20ULL);
  EXPECT_TRUE(s.rat.resolved(1));
  EXPECT_TRUE(s.validate());
}

TEST(Scheduler, SourceReadsAndWritesSameRegister) {
  Scheduler s;
  int w = dispatch_ok(s, movi(1, 4));
  int u = dispatch_ok(s, TransOp(OP_add, 1, 1, REG_imm, 1));

  EXPECT_EQ(s[u].producers[RA], w);
  EXPECT_EQ(s.rat[1], u);

  execute_next(s);
  execute_next(s);
  EXPECT_EQ(s[u].result, 5ULL);
}

TEST(Scheduler, CompletedProducerIsForwarded) {
  Scheduler s;
  int p = dispatch_ok(s, TransOp(OP_add, 1, REG_zero, REG_imm, 5));
  EXPECT_EQ(execute_next(s), p);
  EXPECT_TRUE(s[p].completed);

  int c = dispatch_ok(s, TransOp(OP_add, 2, 1, 1));
  EXPECT_EQ(s[c].pending, 0);
  EXPECT_TRUE(s[c].ready);
  EXPECT_EQ(s[c].operands[RA], 5ULL);
  EXPECT_EQ(s[c].operands[RB], 5ULL);
  EXPECT_EQ(s.wakeup.edges(c), 0);
  EXPECT_EQ(s.stats.dispatch.source.forwarded, 2ULL);
  EXPECT_EQ(s.stats.dispatch.source.waiting, 0ULL);

  // After retirement the value comes from the committed file
  CommitRecord cr;
  ASSERT_TRUE(s.commit(cr));
  int d = dispatch_ok(s, TransOp(OP_sub, 3, 1, REG_imm, 1));
  EXPECT_TRUE(s[d].ready);
  EXPECT_EQ(s[d].operands[RA], 5ULL);
  EXPECT_EQ(s.stats.dispatch.source.committed, 1ULL);
}

TEST(Scheduler, ReadyOnlyAfterEveryRecordedProducerCompletes) {
  Scheduler s;
  int p1 = dispatch_ok(s, movi(1, 1));
  int p2 = dispatch_ok(s, movi(2, 2));
  int p3 = dispatch_ok(s, movi(3, 3));
  int w = dispatch_ok(s, TransOp(OP_add, 4, 1, 2));

  EXPECT_EQ(s[w].pending, 2);
  EXPECT_EQ(issue_ok(s), p1);
  EXPECT_EQ(issue_ok(s), p2);
  EXPECT_EQ(issue_ok(s), p3);

  int tag;
  EXPECT_FALSE(s.issue(FU_ANY, tag));

  s.complete(p3, 3);
  EXPECT_EQ(s[w].pending, 2);
  EXPECT_FALSE(s[w].ready);

  s.complete(p1, 1);
  EXPECT_EQ(s[w].pending, 1);
  EXPECT_FALSE(s[w].ready);
  EXPECT_EQ(s[w].operands[RA], 1ULL);

  s.complete(p2, 2);
  EXPECT_EQ(s[w].pending, 0);
  EXPECT_TRUE(s[w].ready);
  EXPECT_EQ(s.stats.complete.wakeups, 2ULL);
  EXPECT_EQ(s.stats.complete.woken_ready, 1ULL);
  EXPECT_TRUE(s.validate());

  EXPECT_EQ(execute_next(s), w);
  EXPECT_EQ(s[w].result, 3ULL);
}

TEST(Scheduler, SameProducerOnBothOperandsCountsTwice) {
  Scheduler s;
  int p = dispatch_ok(s, movi(1, 9));
  int w = dispatch_ok(s, TransOp(OP_mul, 2, 1, 1));

  EXPECT_EQ(s[w].pending, 2);
  EXPECT_EQ(s.wakeup.edges(w), 2);
  EXPECT_EQ(s.wakeup.row(w).popcount(), 1);
  EXPECT_EQ(s.stats.dispatch.source.waiting, 2ULL);
  EXPECT_TRUE(s.validate());

  EXPECT_EQ(execute_next(s), p);

  EXPECT_EQ(s[w].pending, 0);
  EXPECT_TRUE(s[w].ready);
  EXPECT_EQ(s[w].operands[RA], 9ULL);
  EXPECT_EQ(s[w].operands[RB], 9ULL);
  EXPECT_EQ(s.wakeup.edges(w), 0);
  EXPECT_EQ(s.stats.complete.wakeups, 2ULL);
  EXPECT_TRUE(s.validate());
}

TEST(Scheduler, CommitsInProgramOrder) {
  Scheduler s;
  int a = dispatch_ok(s, TransOp(OP_mul, 1, REG_imm, REG_imm, 3));
  int b = dispatch_ok(s, TransOp(OP_add, 2, REG_zero, REG_imm, 4));

  EXPECT_EQ(issue_ok(s, FU_ALU), b);
  s.complete(b, 4);

  CommitRecord cr;
  EXPECT_FALSE(s.commit(cr));
  EXPECT_EQ(s.stats.commit.none, 1ULL);
  EXPECT_EQ(s.arf[2], 0ULL);

  EXPECT_EQ(issue_ok(s, FU_MUL), a);
  s.complete(a, 9);

  ASSERT_TRUE(s.commit(cr));
  EXPECT_EQ(cr.tag, a);
  EXPECT_EQ(cr.rd, 1);
  EXPECT_EQ(cr.value, 9ULL);
  EXPECT_EQ(cr.uuid, 0ULL);

  ASSERT_TRUE(s.commit(b, cr));
  EXPECT_EQ(cr.tag, b);
  EXPECT_EQ(cr.rd, 2);
  EXPECT_EQ(cr.value, 4ULL);

  EXPECT_FALSE(s.commit(cr));
  EXPECT_TRUE(s.empty());
  EXPECT_EQ(s.arf[1], 9ULL);
  EXPECT_EQ(s.arf[2], 4ULL);
}

TEST(Scheduler, RegisterZeroIsNeverRenamedOrWritten) {
  Scheduler s;
  int w = dispatch_ok(s, TransOp(OP_add, REG_zero, REG_zero, REG_imm, 5));
  EXPECT_TRUE(s.rat.resolved(REG_zero));

  int r = dispatch_ok(s, TransOp(OP_add, 1, REG_zero, REG_zero));
  EXPECT_TRUE(s[r].ready);
  EXPECT_EQ(s[r].operands[RA], 0ULL);
  EXPECT_EQ(s.wakeup.edges(r), 0);
  EXPECT_EQ(s.stats.dispatch.source.zero, 3ULL);

  EXPECT_EQ(execute_next(s), w);
  EXPECT_EQ(s[w].result, 5ULL);

  CommitRecord cr;
  ASSERT_TRUE(s.commit(cr));
  EXPECT_EQ(cr.rd, REG_zero);
  EXPECT_EQ(cr.value, 5ULL);
  EXPECT_EQ(s.arf[REG_zero], 0ULL);
}

TEST(Scheduler, ImmediateOperandsBindAtDispatch) {
  Scheduler s;
  int t = dispatch_ok(s, TransOp(OP_sub, 1, REG_imm, REG_imm, -2));
  EXPECT_TRUE(s[t].ready);
  EXPECT_EQ(s[t].operands[RA], (W64)-2LL);
  EXPECT_EQ(s[t].operands[RB], (W64)-2LL);
  EXPECT_EQ(s.stats.dispatch.source.immediate, 2ULL);
}

TEST(Scheduler, NopRetiresWithoutResult) {
  Scheduler s;
  int n = dispatch_ok(s, TransOp(OP_nop, 3, REG_none, REG_none));
  EXPECT_TRUE(s.rat.resolved(3));
  EXPECT_EQ(execute_next(s), n);

  CommitRecord cr;
  ASSERT_TRUE(s.commit(cr));
  EXPECT_EQ(cr.rd, REG_none);
  EXPECT_EQ(s.arf[3], 0ULL);
}

TEST(Scheduler, IssuesOldestReadyMatchingUnitClass) {
  Scheduler s;
  int m = dispatch_ok(s, TransOp(OP_mul, 1, REG_imm, REG_imm, 2));
  int a1 = dispatch_ok(s, TransOp(OP_add, 2, REG_imm, REG_imm, 2));
  int a2 = dispatch_ok(s, TransOp(OP_add, 3, REG_imm, REG_imm, 2));

  EXPECT_EQ(issue_ok(s, FU_ALU), a1);
  EXPECT_EQ(issue_ok(s, FU_ALU), a2);

  int tag = -1;
  EXPECT_FALSE(s.issue(FU_ALU, tag));
  EXPECT_FALSE(s.issue(FU_DIV, tag));
  EXPECT_EQ(s.stats.issue.none, 2ULL);

  EXPECT_EQ(issue_ok(s, FU_MUL), m);
  EXPECT_FALSE(s.issue(FU_ANY, tag));

  EXPECT_TRUE(s[m].issued);
  EXPECT_TRUE(s[a1].issued);
  EXPECT_TRUE(s[a2].issued);
}

TEST(Scheduler, OlderSlotWinsOnceWoken) {
  Scheduler s;
  int m = dispatch_ok(s, TransOp(OP_mul, 1, REG_imm, REG_imm, 3));
  int x = dispatch_ok(s, TransOp(OP_add, 2, 1, REG_zero));
  int y = dispatch_ok(s, TransOp(OP_add, 3, REG_imm, REG_zero, 1));

  EXPECT_EQ(issue_ok(s, FU_MUL), m);
  s.complete(m, 9);

  // y has been ready longer, but x is older
  EXPECT_EQ(issue_ok(s, FU_ALU), x);
  EXPECT_EQ(issue_ok(s, FU_ALU), y);
}

TEST(Scheduler, ChainWrapsAroundWindow) {
  SmallScheduler s;
  int dispatched = 0;
  int committed = 0;

  while (committed < 10) {
    while ((dispatched < 10) && (!s.full())) {
      int tag = -1;
      ASSERT_TRUE(s.dispatch(TransOp(OP_add, 1, 1, REG_imm, 1), tag));
      EXPECT_EQ(tag, dispatched % 4);
      dispatched++;
    }

    execute_next(s);

    CommitRecord cr;
    ASSERT_TRUE(s.commit(cr));
    committed++;
    EXPECT_EQ(cr.value, (W64)committed);
    EXPECT_TRUE(s.validate());
  }

  EXPECT_TRUE(s.empty());
  EXPECT_EQ(s.arf[1], 10ULL);
  EXPECT_EQ(s.head, 10 % 4);
  EXPECT_EQ(s.tail, 10 % 4);
  EXPECT_TRUE(s.rat.resolved(1));
}

TEST(Scheduler, PrintsWindowState) {
  Scheduler s;
  dispatch_ok(s, movi(1, 1));
  dispatch_ok(s, TransOp(OP_add, 2, 1, 1));

  char path[64];
  strcpy(path, "/tmp/schedsim-sched-XXXXXX");
  int fd = mkstemp(path);
  ASSERT_GE(fd, 0);
  ::close(fd);

  {
    ostream os;
    ASSERT_TRUE(os.open(path));
    os << s;
  }

  char buf[4096];
  FILE* fp = fopen(path, "r");
  ASSERT_TRUE(fp != null);
  size_t n = fread(buf, 1, sizeof(buf)-1, fp);
  buf[n] = 0;
  fclose(fp);
  unlink(path);

  EXPECT_TRUE(strstr(buf, "Scheduler: 2 of 8 slots used") != null);
  EXPECT_TRUE(strstr(buf, "add  r2 = r1,r1") != null);
  EXPECT_TRUE(strstr(buf, "RegisterAliasTable:") != null);
}

//
// Precondition violations are fatal
//
TEST(SchedulerDeathTest, CompleteBeforeIssue) {
  Scheduler s;
  int t = dispatch_ok(s, movi(1, 1));
  EXPECT_DEATH(s.complete(t, 1), "Assert .* failed");
}

TEST(SchedulerDeathTest, CompleteTwice) {
  Scheduler s;
  dispatch_ok(s, movi(1, 1));
  int t = execute_next(s);
  EXPECT_DEATH(s.complete(t, 1), "Assert .* failed");
}

TEST(SchedulerDeathTest, CompleteFreeSlot) {
  Scheduler s;
  EXPECT_DEATH(s.complete(3, 1), "Assert .* failed");
}

TEST(SchedulerDeathTest, CommitNonHead) {
  Scheduler s;
  dispatch_ok(s, movi(1, 1));
  int t = dispatch_ok(s, movi(2, 2));
  execute_next(s);
  execute_next(s);
  CommitRecord cr;
  EXPECT_DEATH(s.commit(t, cr), "Assert .* failed");
}

TEST(SchedulerDeathTest, DestinationNotARegister) {
  Scheduler s;
  int tag = -1;
  EXPECT_DEATH(s.dispatch(TransOp(OP_add, REG_imm, 1, 2), tag), "Assert .* failed");
  EXPECT_DEATH(s.dispatch(TransOp(OP_add, ARCHREG_COUNT + 4, 1, 2), tag), "Assert .* failed");
}
