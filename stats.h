// -*- c++ -*-
//
// SchedSim: Out-of-Order Scheduling Core Model
// Statistics tree
//
// Copyright 2006 Matt T. Yourst <yourst@yourst.com>
//
// This program is free software; it is licensed under the
// GNU General Public License, Version 2.
//

#ifndef _STATS_H_
#define _STATS_H_

#include <globals.h>
#include <superstl.h>
#include <schedsim.h>
#include <ooocore.h>

struct SchedSimStats { // rootnode:
  struct summary {
    W64 cycles;
    W64 insns;
    double ipc;
  } summary;

  SchedSim::OutOfOrderCoreStats ooocore;
};

//
// Snapshot the core counters into <stats>
//
void update_stats(SchedSimStats& stats, const SchedSim::OutOfOrderCore& core);

ostream& operator <<(ostream& os, const SchedSimStats& stats);

#endif // _STATS_H_
