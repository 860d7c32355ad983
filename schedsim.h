// -*- c++ -*-
//
// SchedSim: Out-of-Order Scheduling Core Model
// Simulator Structures
//
// Copyright 2000-2005 Matt T. Yourst <yourst@yourst.com>
//
// This program is free software; it is licensed under the
// GNU General Public License, Version 2.
//

#ifndef _SCHEDSIM_H_
#define _SCHEDSIM_H_

#include <globals.h>
#include <config.h>

//
// Configuration Options:
//
struct SchedSimConfig {
  // Logging
  bool quiet;
  stringbuf log_filename;
  W64 loglevel;
  bool log_on_console;

  // Execution resources
  W64 alu_count;
  W64 mul_count;
  W64 div_count;
  W64 alu_latency;
  W64 mul_latency;
  W64 div_latency;

  // Pipeline widths
  W64 dispatch_width;
  W64 commit_width;

  // Stopping point
  W64 stop_at_cycle;
  W64 stop_at_user_insns;

  // Recovery
  W64 flush_interval;

  void reset();
};

template <>
void ConfigurationParser<SchedSimConfig>::setup();

ostream& operator <<(ostream& os, const SchedSimConfig& config);

extern SchedSimConfig config;
extern ConfigurationParser<SchedSimConfig> configparser;

extern ostream logfile;
extern bool logenable;
extern W64 sim_cycle;

void print_banner(ostream& os, int argc, char* argv[]);
void print_usage(int argc, char* argv[]);
int init_config(int argc, char* argv[]);
void reopen_logfile();

#define logable(level) (unlikely (logenable && (config.loglevel >= (W64)(level))))

#endif // _SCHEDSIM_H_
