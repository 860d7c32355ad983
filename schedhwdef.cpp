//
// SchedSim: Out-of-Order Scheduling Core Model
// Hardware Definitions
//
// Copyright 1999-2006 Matt T. Yourst <yourst@yourst.com>
//
// This program is free software; it is licensed under the
// GNU General Public License, Version 2.
//

#include <globals.h>
#include <schedhwdef.h>

const char* arch_reg_names[TRANSREG_COUNT] = {
  "r0",   "r1",   "r2",   "r3",   "r4",   "r5",   "r6",   "r7",
  "r8",   "r9",   "r10",  "r11",  "r12",  "r13",  "r14",  "r15",
  "imm",  "none",
};

const char* opclass_names[OPCLASS_COUNT] = {
  "logic", "addsub", "shift", "mul", "div",
};

const char* fu_class_names[FU_CLASS_COUNT] = {
  "alu", "mul", "div",
};

//
// Opcodes and properties
//
#define A 1 // ALU latency, assuming fast bypass
#define M 2 // multiplier
#define D 1 // divider

#define ALU FU_ALU
#define MUL FU_MUL
#define DIV FU_DIV

const OpcodeInfo opinfo[OP_MAX_OPCODE] = {
  // name, opclass, latency, fu
  {"nop",            OPCLASS_LOGIC,         A, ALU},
  {"add",            OPCLASS_ADDSUB,        A, ALU}, // ra + rb
  {"sub",            OPCLASS_ADDSUB,        A, ALU}, // ra - rb
  {"and",            OPCLASS_LOGIC,         A, ALU},
  {"or",             OPCLASS_LOGIC,         A, ALU},
  {"xor",            OPCLASS_LOGIC,         A, ALU},
  {"shl",            OPCLASS_SHIFT,         A, ALU}, // ra << rb[5:0]
  {"shr",            OPCLASS_SHIFT,         A, ALU}, // ra >> rb[5:0], unsigned
  {"mul",            OPCLASS_MULTIPLY,      M, MUL}, // low 64 bits of ra * rb
  {"div",            OPCLASS_DIVIDE,        D, DIV}, // ra / rb, unsigned; all ones if rb == 0
  {"mov",            OPCLASS_LOGIC,         A, ALU}, // rd = rb
};

#undef A
#undef M
#undef D
#undef ALU
#undef MUL
#undef DIV

stringbuf& operator <<(stringbuf& sb, const TransOp& op) {
  sb << padstring(nameof(op.opcode), -4), " ";

  if (op.opcode == OP_nop) return sb;

  sb << arch_reg_names[op.rd], " = ";

  if (op.opcode == OP_mov) {
    if (op.rb == REG_imm) sb << op.imm; else sb << arch_reg_names[op.rb];
    return sb;
  }

  if (op.ra == REG_imm) sb << op.imm; else sb << arch_reg_names[op.ra];
  sb << ",";
  if (op.rb == REG_imm) sb << op.imm; else sb << arch_reg_names[op.rb];

  return sb;
}
