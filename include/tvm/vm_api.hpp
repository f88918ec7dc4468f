/**
 * @file vm_api.hpp
 * @brief tvm VM C++ API wrapper
 *
 * SPDX-License-Identifier: MIT OR Apache-2.0
 */

#pragma once

#include "tvm/bytecode.hpp"
#include "tvm/panic.hpp"
#include "tvm/vm_api.h"

namespace tvm
{

/**
 * @brief Owning handle for one VM instance.
 *
 * Creates the VM from a VmConfig and destroys it when it goes out of scope.
 */
class Machine
{
public:
  explicit Machine(const VmConfig &cfg) : vm_(vm_create(&cfg)) {}
  ~Machine()
  {
    vm_destroy(vm_);
  }

  Machine(const Machine &) = delete;
  Machine &operator=(const Machine &) = delete;

  /** @return true if vm_create succeeded. */
  bool ok() const
  {
    return vm_ != nullptr;
  }

  Vm *get() const
  {
    return vm_;
  }

  void set_panic_handler(PanicHandler handler, void *user_data = nullptr)
  {
    vm_set_panic_handler(vm_, handler, user_data);
  }

  /**
   * @brief Run a program on a fresh stack.
   * @return 0 on success, negative error code on failure.
   */
  tvm_err run(const Program &program)
  {
    vm_reset(vm_);
    return vm_exec(vm_, program.data(), static_cast<int>(program.size()));
  }

  tvm_err pop(tvm_word *out)
  {
    return vm_ds_pop(vm_, out);
  }

  int depth() const
  {
    return vm_ds_depth_public(vm_);
  }

private:
  Vm *vm_;
};

}  // namespace tvm
