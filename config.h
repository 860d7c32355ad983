// -*- c++ -*-
//
// Copyright 2000-2005 Matt T. Yourst <yourst@yourst.com>
//
// This program is free software; it is licensed under the
// GNU General Public License, Version 2.
//
#ifndef _CONFIG_H_
#define _CONFIG_H_

#include <globals.h>

enum {
  OPTION_TYPE_NONE    = 0,
  OPTION_TYPE_W64     = 1,
  OPTION_TYPE_FLOAT   = 2,
  OPTION_TYPE_STRING  = 3,
  OPTION_TYPE_BOOL    = 5,
  OPTION_TYPE_SECTION = -1
};

struct ConfigurationOption {
  const char* name;
  const char* description;
  int type;
  // Byte offset of the variable within the configuration structure
  int offset;
};

static const W64 infinity = limits<W64s>::max;

//
// Untyped option table shared by all configuration structures.
// Variables are addressed by their offset from the base of the
// configuration structure, so one table serves any instance.
//
struct ConfigurationParserBase {
  static const int MAX_OPTIONS = 64;

  ConfigurationOption options[MAX_OPTIONS];
  int optioncount;

  ConfigurationParserBase() { optioncount = 0; }

  void addoption(const char* name, const char* description, int type, int offset);

  int parse(void* base, int argc, char* argv[]) const;
  ostream& printusage(ostream& os, const void* base) const;
  ostream& print(ostream& os, const void* base) const;

  const ConfigurationOption* find(const char* name) const;
};

template <typename T>
struct ConfigurationParser: public T, public ConfigurationParserBase {
  void setup();

  void section(const char* name) {
    addoption(name, name, OPTION_TYPE_SECTION, 0);
  }

  void add(W64& v, const char* name, const char* description) {
    addoption(name, description, OPTION_TYPE_W64, offsetof_field(&v));
  }

  void add(double& v, const char* name, const char* description) {
    addoption(name, description, OPTION_TYPE_FLOAT, offsetof_field(&v));
  }

  void add(bool& v, const char* name, const char* description) {
    addoption(name, description, OPTION_TYPE_BOOL, offsetof_field(&v));
  }

  void add(stringbuf& v, const char* name, const char* description) {
    addoption(name, description, OPTION_TYPE_STRING, offsetof_field(&v));
  }

  //
  // Parse options into <config>. Returns the index of the first
  // trailing (non-option) argument, argc if there are none, or
  // -1 if any option or value was rejected.
  //
  int parse(T& config, int argc, char* argv[]) const {
    return ConfigurationParserBase::parse(&config, argc, argv);
  }

  ostream& printusage(ostream& os, const T& config) const {
    return ConfigurationParserBase::printusage(os, &config);
  }

  ostream& print(ostream& os, const T& config) const {
    return ConfigurationParserBase::print(os, &config);
  }

protected:
  int offsetof_field(const void* field) const {
    return (const byte*)field - (const byte*)static_cast<const T*>(this);
  }
};

#endif // _CONFIG_H_
