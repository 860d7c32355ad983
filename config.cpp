//
// SchedSim: Out-of-Order Scheduling Core Model
// Configuration Management
//
// Copyright 2000-2005 Matt T. Yourst <yourst@yourst.com>
//
// This program is free software; it is licensed under the
// GNU General Public License, Version 2.
//

#include <globals.h>
#include <config.h>

void ConfigurationParserBase::addoption(const char* name, const char* description, int type, int offset) {
  check_invariant(optioncount < MAX_OPTIONS);
  ConfigurationOption& opt = options[optioncount++];
  opt.name = name;
  opt.description = description;
  opt.type = type;
  opt.offset = offset;
}

const ConfigurationOption* ConfigurationParserBase::find(const char* name) const {
  foreach (i, optioncount) {
    if (options[i].type == OPTION_TYPE_SECTION) continue;
    if (strequal(name, options[i].name)) return &options[i];
  }
  return null;
}

static bool parse_w64(const char* p, W64& v) {
  int len = strlen(p);
  if unlikely (!len) return false;

  if (strncmp(p, "inf", 3) == 0) {
    v = infinity;
    return true;
  }

  W64 multiplier = 1;
  char digits[64];
  if unlikely (len >= (int)sizeof(digits)) return false;
  strcpy(digits, p);

  if (len > 1) {
    char& c = digits[len-1];
    switch (c) {
    case 'k': case 'K':
      multiplier = 1000LL; c = 0; break;
    case 'm': case 'M':
      multiplier = 1000000LL; c = 0; break;
    case 'g': case 'G':
      multiplier = 1000000000LL; c = 0; break;
    case 't': case 'T':
      multiplier = 1000000000000LL; c = 0; break;
    }
  }

  char* endp = digits;
  errno = 0;
  W64 r = strtoull(digits, &endp, 0);
  if unlikely ((endp == digits) | (endp[0] != 0) | (errno != 0)) return false;

  v = r * multiplier;
  return true;
}

int ConfigurationParserBase::parse(void* base, int argc, char* argv[]) const {
  int i = 0;
  bool failed = false;

  while (i < argc) {
    if (!((argv[i][0] == '-') && (strlen(argv[i]) > 1))) return (failed) ? -1 : i;

    const char* name = &argv[i][1];
    i++;

    const ConfigurationOption* opt = find(name);
    if unlikely (!opt) {
      cerr << "Warning: invalid option '", argv[i-1], "'", endl;
      failed = true;
      continue;
    }

    void* variable = (byte*)base + opt->offset;

    if unlikely ((opt->type != OPTION_TYPE_NONE) && (opt->type != OPTION_TYPE_BOOL) && (i >= argc)) {
      cerr << "Warning: missing value for option '", argv[i-1], "'", endl;
      failed = true;
      break;
    }

    switch (opt->type) {
    case OPTION_TYPE_NONE:
      break;
    case OPTION_TYPE_W64: {
      W64 v;
      if unlikely (!parse_w64(argv[i], v)) {
        cerr << "Warning: invalid value '", argv[i], "' for option ", argv[i-1], "; ignoring", endl;
        failed = true;
      } else {
        *((W64*)variable) = v;
      }
      i++;
      break;
    }
    case OPTION_TYPE_FLOAT: {
      char* endp = argv[i];
      double v = strtod(argv[i], &endp);
      if unlikely ((endp == argv[i]) | (endp[0] != 0)) {
        cerr << "Warning: invalid value '", argv[i], "' for option ", argv[i-1], "; ignoring", endl;
        failed = true;
      } else {
        *((double*)variable) = v;
      }
      i++;
      break;
    }
    case OPTION_TYPE_STRING:
      *((stringbuf*)variable) = argv[i++];
      break;
    case OPTION_TYPE_BOOL:
      *((bool*)variable) = (!(*((bool*)variable)));
      break;
    default:
      check_invariant(false);
    }
  }

  return (failed) ? -1 : argc;
}

ostream& ConfigurationParserBase::printusage(ostream& os, const void* base) const {
  os << "Options are:", endl;
  foreach (i, optioncount) {
    const ConfigurationOption& opt = options[i];
    if (opt.type == OPTION_TYPE_SECTION) {
      os << opt.description, ":", endl;
      continue;
    }
    const void* variable = (const byte*)base + opt.offset;
    os << "  -", padstring(opt.name, -16), " ", opt.description, " [";
    switch (opt.type) {
    case OPTION_TYPE_NONE:
      break;
    case OPTION_TYPE_W64: {
      W64 v = *((const W64*)variable);
      if (v == infinity) os << "inf"; else os << v;
      break;
    }
    case OPTION_TYPE_FLOAT:
      os << *((const double*)variable);
      break;
    case OPTION_TYPE_STRING: {
      const stringbuf& sb = *((const stringbuf*)variable);
      os << ((sb.set()) ? (const char*)sb : "(null)");
      break;
    }
    case OPTION_TYPE_BOOL:
      os << ((*((const bool*)variable)) ? "enabled" : "disabled");
      break;
    default:
      check_invariant(false);
    }
    os << "]", endl;
  }
  os << endl;

  return os;
}

ostream& ConfigurationParserBase::print(ostream& os, const void* base) const {
  os << "Active parameters:", endl;

  foreach (i, optioncount) {
    const ConfigurationOption& opt = options[i];
    if (opt.type == OPTION_TYPE_SECTION) continue;
    const void* variable = (const byte*)base + opt.offset;
    os << "  -", padstring(opt.name, -16), " ";
    switch (opt.type) {
    case OPTION_TYPE_NONE:
      break;
    case OPTION_TYPE_W64: {
      W64 v = *((const W64*)variable);
      if (v == 0) {
        os << 0;
      } else if (v == infinity) {
        os << "infinity";
      } else if ((v % 1000000000LL) == 0) {
        os << (v / 1000000000LL), " G";
      } else if ((v % 1000000LL) == 0) {
        os << (v / 1000000LL), " M";
      } else {
        os << v;
      }
      break;
    }
    case OPTION_TYPE_FLOAT:
      os << *((const double*)variable);
      break;
    case OPTION_TYPE_STRING: {
      const stringbuf& sb = *((const stringbuf*)variable);
      os << ((sb.set()) ? (const char*)sb : "(null)");
      break;
    }
    case OPTION_TYPE_BOOL:
      os << ((*((const bool*)variable)) ? "enabled" : "disabled");
      break;
    default:
      check_invariant(false);
    }
    os << endl;
  }

  return os;
}
