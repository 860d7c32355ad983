//
// SchedSim: Out-of-Order Scheduling Core Model
// Tests for the configuration parser and simulator options
//

#include <gtest/gtest.h>

#include <globals.h>
#include <config.h>
#include <schedsim.h>
#include <schedhwdef.h>

#include <stdlib.h>

namespace {
  struct ParserTestConfig {
    W64 count;
    W64 limit;
    double ratio;
    bool verbose;
    stringbuf name;

    void reset() {
      count = 1;
      limit = infinity;
      ratio = 0.5;
      verbose = 0;
      name = "default";
    }
  };
}

template <>
void ConfigurationParser<ParserTestConfig>::setup() {
  section("Test Options");
  add(count,     "count",     "Item count");
  add(limit,     "limit",     "Upper limit");
  add(ratio,     "ratio",     "Ratio");
  add(verbose,   "verbose",   "Verbose output");
  add(name,      "name",      "Name");
}

namespace {
  struct ConfigParserTest: public ::testing::Test {
    ConfigurationParser<ParserTestConfig> parser;
    ParserTestConfig cfg;

    void SetUp() {
      parser.setup();
      cfg.reset();
    }

    int parse(int argc, const char** argv) {
      return parser.parse(cfg, argc, (char**)argv);
    }
  };

  static stringbuf slurp(const char* filename) {
    stringbuf sb;
    FILE* fp = fopen(filename, "r");
    if (!fp) return sb;
    char buf[256];
    for (;;) {
      size_t n = fread(buf, 1, sizeof(buf), fp);
      if (!n) break;
      sb.append(buf, n);
    }
    fclose(fp);
    return sb;
  }
}

TEST_F(ConfigParserTest, FindsRegisteredOptions) {
  EXPECT_EQ(parser.optioncount, 6);
  ASSERT_TRUE(parser.find("count") != null);
  EXPECT_EQ(parser.find("count")->type, OPTION_TYPE_W64);
  EXPECT_EQ(parser.find("name")->type, OPTION_TYPE_STRING);
  EXPECT_TRUE(parser.find("Test Options") == null);
  EXPECT_TRUE(parser.find("missing") == null);
}

TEST_F(ConfigParserTest, ParsesNumericFormats) {
  const char* argv[] = {"-count", "0x10", "-limit", "5k"};
  EXPECT_EQ(parse(4, argv), 4);
  EXPECT_EQ(cfg.count, 16);
  EXPECT_EQ(cfg.limit, 5000);

  const char* argv2[] = {"-count", "3m", "-limit", "2g"};
  EXPECT_EQ(parse(4, argv2), 4);
  EXPECT_EQ(cfg.count, 3000000);
  EXPECT_EQ(cfg.limit, 2000000000);

  const char* argv3[] = {"-limit", "inf", "-count", "12"};
  EXPECT_EQ(parse(4, argv3), 4);
  EXPECT_EQ(cfg.limit, infinity);
  EXPECT_EQ(cfg.count, 12);
}

TEST_F(ConfigParserTest, BoolTogglesAndStringsCopy) {
  const char* argv[] = {"-verbose", "-name", "alpha", "-ratio", "0.25"};
  EXPECT_EQ(parse(5, argv), 5);
  EXPECT_TRUE(cfg.verbose);
  EXPECT_STREQ((char*)cfg.name, "alpha");
  EXPECT_DOUBLE_EQ(cfg.ratio, 0.25);

  const char* argv2[] = {"-verbose"};
  EXPECT_EQ(parse(1, argv2), 1);
  EXPECT_FALSE(cfg.verbose);
}

TEST_F(ConfigParserTest, StopsAtFirstTrailingArgument) {
  const char* argv[] = {"-count", "7", "program", "-limit", "9"};
  EXPECT_EQ(parse(5, argv), 2);
  EXPECT_EQ(cfg.count, 7);
  EXPECT_EQ(cfg.limit, infinity);
}

TEST_F(ConfigParserTest, RejectsUnknownOptionsAndBadValues) {
  const char* argv[] = {"-bogus", "-count", "9"};
  EXPECT_EQ(parse(3, argv), -1);
  // Later valid options are still applied
  EXPECT_EQ(cfg.count, 9);

  cfg.reset();
  const char* argv2[] = {"-count", "12abc"};
  EXPECT_EQ(parse(2, argv2), -1);
  EXPECT_EQ(cfg.count, 1);

  const char* argv3[] = {"-ratio", "x"};
  EXPECT_EQ(parse(2, argv3), -1);
  EXPECT_DOUBLE_EQ(cfg.ratio, 0.5);

  const char* argv4[] = {"-count"};
  EXPECT_EQ(parse(1, argv4), -1);
  EXPECT_EQ(cfg.count, 1);
}

TEST_F(ConfigParserTest, PrintsActiveParametersAndUsage) {
  char path[64];
  strcpy(path, "/tmp/schedsim-config-XXXXXX");
  int fd = mkstemp(path);
  ASSERT_GE(fd, 0);
  ::close(fd);

  cfg.count = 3000000;
  {
    ostream os;
    ASSERT_TRUE(os.open(path));
    parser.print(os, cfg);
    parser.printusage(os, cfg);
    os.close();
  }

  stringbuf contents = slurp(path);
  unlink(path);

  EXPECT_TRUE(strstr(contents, "Active parameters:") != null);
  EXPECT_TRUE(strstr(contents, "3 M") != null);
  EXPECT_TRUE(strstr(contents, "infinity") != null);
  EXPECT_TRUE(strstr(contents, "Options are:") != null);
  EXPECT_TRUE(strstr(contents, "Test Options:") != null);
  EXPECT_TRUE(strstr(contents, "Item count") != null);
}

namespace {
  struct SimulatorConfigTest: public ::testing::Test {
    void TearDown() {
      logfile.close();
      config.reset();
      logenable = 0;
    }
  };
}

TEST_F(SimulatorConfigTest, DefaultsMatchCoreModel) {
  config.reset();
  EXPECT_EQ(config.alu_count, 2);
  EXPECT_EQ(config.mul_count, 1);
  EXPECT_EQ(config.div_count, 1);
  EXPECT_EQ(config.alu_latency, 1);
  EXPECT_EQ(config.mul_latency, 2);
  EXPECT_EQ(config.div_latency, 1);
  EXPECT_EQ(config.alu_latency, opinfo[OP_add].latency);
  EXPECT_EQ(config.mul_latency, opinfo[OP_mul].latency);
  EXPECT_EQ(config.div_latency, opinfo[OP_div].latency);
  EXPECT_EQ(config.dispatch_width, 1);
  EXPECT_EQ(config.commit_width, 1);
  EXPECT_EQ(config.stop_at_cycle, infinity);
  EXPECT_EQ(config.stop_at_user_insns, infinity);
  EXPECT_EQ(config.flush_interval, infinity);
  EXPECT_EQ(config.loglevel, 0);
}

TEST_F(SimulatorConfigTest, InitConfigAppliesOptions) {
  const char* argv[] = {"-quiet", "-logfile", "/dev/null", "-alus", "4", "-mul-latency", "3", "-flushevery", "100", "-commit-width", "2"};
  EXPECT_EQ(init_config(lengthof(argv), (char**)argv), (int)lengthof(argv));
  EXPECT_TRUE(config.quiet);
  EXPECT_EQ(config.alu_count, 4);
  EXPECT_EQ(config.mul_latency, 3);
  EXPECT_EQ(config.flush_interval, 100);
  EXPECT_EQ(config.commit_width, 2);
  EXPECT_STREQ((char*)config.log_filename, "/dev/null");
  EXPECT_TRUE(logfile.ok());
  EXPECT_FALSE(logenable);
}

TEST_F(SimulatorConfigTest, LogLevelEnablesLogging) {
  const char* argv[] = {"-quiet", "-logfile", "/dev/null", "-loglevel", "5"};
  EXPECT_EQ(init_config(lengthof(argv), (char**)argv), (int)lengthof(argv));
  EXPECT_TRUE(logenable);
  EXPECT_TRUE(logable(5));
  EXPECT_FALSE(logable(6));
}

TEST_F(SimulatorConfigTest, InitConfigResetsPreviousValues) {
  const char* argv[] = {"-quiet", "-logfile", "/dev/null", "-divs", "3"};
  EXPECT_EQ(init_config(lengthof(argv), (char**)argv), (int)lengthof(argv));
  EXPECT_EQ(config.div_count, 3);

  const char* argv2[] = {"-quiet", "-logfile", "/dev/null"};
  EXPECT_EQ(init_config(lengthof(argv2), (char**)argv2), (int)lengthof(argv2));
  EXPECT_EQ(config.div_count, 1);
}

TEST_F(SimulatorConfigTest, InitConfigReportsInvalidOptions) {
  const char* argv[] = {"-quiet", "-logfile", "/dev/null", "-alus", "many", "-commit-width", "3"};
  EXPECT_EQ(init_config(lengthof(argv), (char**)argv), -1);
  EXPECT_EQ(config.alu_count, 2);
  EXPECT_EQ(config.commit_width, 3);
}
