//
// SchedSim: Out-of-Order Scheduling Core Model
// Shared Functions and Structures
//
// Copyright 2000-2006 Matt T. Yourst <yourst@yourst.com>
//
// This program is free software; it is licensed under the
// GNU General Public License, Version 2.
//

#include <globals.h>
#include <schedsim.h>
#include <schedhwdef.h>

//
// Global variables
//
SchedSimConfig config;
ConfigurationParser<SchedSimConfig> configparser;

ostream logfile;
bool logenable = 0;
W64 sim_cycle = 0;

void SchedSimConfig::reset() {
  quiet = 0;
  log_filename = "schedsim.log";
  loglevel = 0;
  log_on_console = 0;

  alu_count = 2;
  mul_count = 1;
  div_count = 1;
  alu_latency = opinfo[OP_add].latency;
  mul_latency = opinfo[OP_mul].latency;
  div_latency = opinfo[OP_div].latency;

  dispatch_width = 1;
  commit_width = 1;

  stop_at_cycle = infinity;
  stop_at_user_insns = infinity;

  flush_interval = infinity;
}

template <>
void ConfigurationParser<SchedSimConfig>::setup() {
  section("General Logging Control");
  add(quiet,                        "quiet",                "Do not print the banner and active parameters");
  add(log_filename,                 "logfile",              "Log filename (use /dev/fd/1 for stdout, /dev/fd/2 for stderr)");
  add(loglevel,                     "loglevel",             "Log level (0 to 99)");
  add(log_on_console,               "consolelog",           "Replicate log file messages to console");

  section("Execution Resources");
  add(alu_count,                    "alus",                 "Number of integer ALUs");
  add(mul_count,                    "muls",                 "Number of multipliers");
  add(div_count,                    "divs",                 "Number of dividers");
  add(alu_latency,                  "alu-latency",          "ALU latency in cycles");
  add(mul_latency,                  "mul-latency",          "Multiplier latency in cycles");
  add(div_latency,                  "div-latency",          "Divider latency in cycles");

  section("Pipeline");
  add(dispatch_width,               "dispatch-width",       "Dispatch attempts per cycle");
  add(commit_width,                 "commit-width",         "Commits per cycle");

  section("Trace Stop Point");
  add(stop_at_cycle,                "stopcycle",            "Stop after <stopcycle> cycles");
  add(stop_at_user_insns,           "stopinsns",            "Stop after committing <stopinsns> instructions");
  add(flush_interval,               "flushevery",           "Flush the pipeline every N committed instructions");
}

ostream& operator <<(ostream& os, const SchedSimConfig& config) {
  return configparser.print(os, config);
}

void print_banner(ostream& os, int argc, char* argv[]) {
  os << "//  ", endl;
  os << "//  SchedSim: Out-of-Order Scheduling Core Model", endl;
  os << "//  ", endl;
  os << "//  Arguments: ";
  foreach (i, argc) {
    os << argv[i];
    if (i != (argc-1)) os << ' ';
  }
  os << endl;
  os << "//  ", endl, endl;
}

void print_usage(int argc, char* argv[]) {
  cerr << "Syntax: schedsim [-option value] ...", endl, endl;
  configparser.printusage(cerr, config);
}

void reopen_logfile() {
  if (logfile) logfile.close();
  logfile.open(config.log_filename);
  logfile.setchain((config.log_on_console) ? &cout : null);
}

//
// Parse the options and open the log. Returns the parser result
// (index of the first trailing argument, or -1 on any invalid option).
//
int init_config(int argc, char* argv[]) {
  config.reset();
  if (!configparser.optioncount) configparser.setup();

  int rc = configparser.parse(config, argc, argv);
  if unlikely (rc < 0) print_usage(argc, argv);

  if (config.log_filename.set()) reopen_logfile();
  logenable = (config.loglevel > 0);

  if ((!config.quiet) && logfile) {
    print_banner(logfile, argc, argv);
    logfile << config;
    logfile.flush();
  }

  return rc;
}

extern "C" void assert_fail(const char* __assertion, const char* __file, unsigned int __line, const char* __function) {
  stringbuf sb;
  sb << "Assert ", __assertion, " failed in ", __file, ":", __line, " (", __function, ") at cycle ", sim_cycle, endl;

  cerr << sb;
  cerr.flush();
  if (logfile) {
    logfile << sb;
    logfile.flush();
  }
  cout.flush();
  abort();
}
