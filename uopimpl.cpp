//
// SchedSim: Out-of-Order Scheduling Core Model
// Functional unit datapaths
//
// Copyright 2000-2005 Matt T. Yourst <yourst@yourst.com>
//
// This program is free software; it is licensed under the
// GNU General Public License, Version 2.
//

#include <globals.h>
#include <uopimpl.h>

#define make_exp_aluop(name, expr) \
struct name { \
  W64 operator ()(W64 ra, W64 rb) { \
    W64 rd; expr; return rd; \
  } \
}

template <class func>
W64 aluop(W64 ra, W64 rb) {
  func f;
  return f(ra, rb);
}

#define make_exp_aluop_impl(name, expr) \
  make_exp_aluop(exp_op_ ## name, (expr)); \
  static const uopimpl_func_t implmap_ ## name = &aluop<exp_op_ ## name>

make_exp_aluop_impl(nop, (rd = 0));
make_exp_aluop_impl(add, (rd = ra + rb));
make_exp_aluop_impl(sub, (rd = ra - rb));
make_exp_aluop_impl(and, (rd = ra & rb));
make_exp_aluop_impl(or,  (rd = ra | rb));
make_exp_aluop_impl(xor, (rd = ra ^ rb));
make_exp_aluop_impl(shl, (rd = ra << (rb & 63)));
make_exp_aluop_impl(shr, (rd = ra >> (rb & 63)));
make_exp_aluop_impl(mul, (rd = ra * rb));
// Divide by zero saturates instead of trapping
make_exp_aluop_impl(div, (rd = (rb) ? (ra / rb) : 0xffffffffffffffffULL));
make_exp_aluop_impl(mov, (rd = rb));

static const uopimpl_func_t implmap[OP_MAX_OPCODE] = {
  implmap_nop,
  implmap_add,
  implmap_sub,
  implmap_and,
  implmap_or,
  implmap_xor,
  implmap_shl,
  implmap_shr,
  implmap_mul,
  implmap_div,
  implmap_mov,
};

uopimpl_func_t get_uop_implementation(int opcode) {
  check_invariant(inrange(opcode, 0, OP_MAX_OPCODE-1));
  return implmap[opcode];
}

W64 execute_uop(int opcode, W64 ra, W64 rb) {
  return get_uop_implementation(opcode)(ra, rb);
}
