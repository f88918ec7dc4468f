/**
 * @file panic.hpp
 * @brief tvm panic handler C++ wrapper
 *
 * SPDX-License-Identifier: MIT OR Apache-2.0
 */

#pragma once

#include "tvm/panic.h"

namespace tvm
{

using PanicInfo = TvmPanicInfo;
using PanicHandler = TvmPanicHandler;

inline void set_panic_handler(Vm *vm, PanicHandler handler, void *user_data = nullptr)
{
  vm_set_panic_handler(vm, handler, user_data);
}

}  // namespace tvm
