// -*- c++ -*-
//
// SchedSim: Out-of-Order Scheduling Core Model
// Functional unit datapaths
//
// Copyright 2000-2005 Matt T. Yourst <yourst@yourst.com>
//
// This program is free software; it is licensed under the
// GNU General Public License, Version 2.
//

#ifndef _UOPIMPL_H_
#define _UOPIMPL_H_

#include <globals.h>
#include <schedhwdef.h>

typedef W64 (*uopimpl_func_t)(W64 ra, W64 rb);

uopimpl_func_t get_uop_implementation(int opcode);

// Compute the result of <opcode> applied to operands ra and rb
W64 execute_uop(int opcode, W64 ra, W64 rb);

#endif // _UOPIMPL_H_
