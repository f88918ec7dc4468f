#pragma once
#include <stdint.h>

#ifdef __cplusplus
extern "C"
{
#endif

  /** @file
   *  @brief tvm opcode set for C.
   *
   *  Single-byte opcodes. PUSH_BYTE carries one immediate byte, PUSH_WORD
   *  a full 256-bit word.
   */

  typedef enum tvm_op_t
  {
#define OP(name, val, _) TVM_OP_##name = val,
#include "tvm/opcodes.def"
#undef OP
  } tvm_op_t;

#ifdef __cplusplus
}  // extern "C"
#endif
