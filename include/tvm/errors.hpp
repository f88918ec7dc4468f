#pragma once

#include "tvm/vm_api.h"

// Error codes are generated from errors.def, the same way opcodes come from
// opcodes.def.

namespace tvm
{

#define ERR(name, val, msg) name = val,

enum class Err : int
{
#include "tvm/errors.def"
};

#undef ERR

inline const char *err_str(Err e)
{
  switch (e)
  {
#define ERR(name, val, msg) \
  case Err::name:           \
    return msg;
#include "tvm/errors.def"
#undef ERR
    default:
      return "unknown error";
  }
}

inline const char *err_str(int code)
{
  return err_str(static_cast<Err>(code));
}

}  // namespace tvm

#define TVM_ERR(name) static_cast<tvm_err>(::tvm::Err::name)
