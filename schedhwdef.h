// -*- c++ -*-
//
// SchedSim: Out-of-Order Scheduling Core Model
// Hardware Definitions
//
// Copyright 1999-2006 Matt T. Yourst <yourst@yourst.com>
//
// This program is free software; it is licensed under the
// GNU General Public License, Version 2.
//

#ifndef _SCHEDHWDEF_H
#define _SCHEDHWDEF_H

#include <globals.h>

//
// Architectural registers
//
#define ARCHREG_COUNT 16

// Hard-wired to zero; reads return 0 and writes are discarded
#define REG_zero      0
// Source operand binds the immediate field
#define REG_imm       16
// No register (destination not written or source unused)
#define REG_none      17

#define TRANSREG_COUNT 18

extern const char* arch_reg_names[TRANSREG_COUNT];

//
// Opclasses
//
#define OPCLASS_LOGIC                   (1 << 0)
#define OPCLASS_ADDSUB                  (1 << 1)
#define OPCLASS_SHIFT                   (1 << 2)
#define OPCLASS_MULTIPLY                (1 << 3)
#define OPCLASS_DIVIDE                  (1 << 4)

#define OPCLASS_COUNT                   5

extern const char* opclass_names[OPCLASS_COUNT];

//
// Functional unit classes (the capability filter passed to issue)
//
enum {
  FU_CLASS_ALU,
  FU_CLASS_MUL,
  FU_CLASS_DIV,
  FU_CLASS_COUNT,
};

#define FU_ALU      (1 << FU_CLASS_ALU)
#define FU_MUL      (1 << FU_CLASS_MUL)
#define FU_DIV      (1 << FU_CLASS_DIV)
#define FU_ANY      (FU_ALU|FU_MUL|FU_DIV)

extern const char* fu_class_names[FU_CLASS_COUNT];

//
// Opcodes
//
enum {
  OP_nop,
  OP_add,
  OP_sub,
  OP_and,
  OP_or,
  OP_xor,
  OP_shl,
  OP_shr,
  OP_mul,
  OP_div,
  OP_mov,
  OP_MAX_OPCODE,
};

struct OpcodeInfo {
  const char* name;
  W32 opclass;
  W16 latency;
  W16 fu;
};

extern const OpcodeInfo opinfo[OP_MAX_OPCODE];

inline bool isclass(int opcode, W32 opclass) { return ((opinfo[opcode].opclass & opclass) != 0); }
inline int opclassof(int opcode) { return lsbindex64(opinfo[opcode].opclass); }
inline int fuclassof(int opcode) { return lsbindex64(opinfo[opcode].fu); }
inline const char* nameof(int opcode) { return (opcode < OP_MAX_OPCODE) ? opinfo[opcode].name : "INVALID"; }

//
// Decoded instruction as delivered by the frontend
//
struct TransOp {
  byte opcode;
  byte rd;
  byte ra;
  byte rb;
  W64s imm;
  // Program order sequence number
  W64 uuid;

  TransOp() { }

  TransOp(int opcode, int rd, int ra, int rb, W64s imm = 0) {
    this->opcode = opcode;
    this->rd = rd;
    this->ra = ra;
    this->rb = rb;
    this->imm = imm;
    this->uuid = 0;
  }

  // True if the destination names a real architectural register
  bool writes_register() const { return ((opcode != OP_nop) && (rd != REG_zero) && (rd < ARCHREG_COUNT)); }
};

stringbuf& operator <<(stringbuf& sb, const TransOp& op);

static inline ostream& operator <<(ostream& os, const TransOp& op) {
  stringbuf sb;
  sb << op;
  return os << sb;
}

#endif // _SCHEDHWDEF_H
