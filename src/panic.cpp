#include "tvm/panic.h"

#include <inttypes.h>
#include <stdio.h>

#include "tvm/errors.hpp"
#include "tvm/internal/vm.h"  // For Vm struct definition
#include "tvm/opcodes.hpp"
#include "tvm/panic.hpp"
#include "tvm/vm_api.h"

extern "C"
{
  void vm_set_panic_handler(struct Vm *vm, TvmPanicHandler handler, void *user_data)
  {
    if (!vm)
      return;

    vm->panic_handler = handler;
    vm->panic_user_data = user_data;
  }

  tvm_err vm_panic(struct Vm *vm, tvm_err error_code)
  {
    using namespace tvm;

    if (!vm)
      return error_code;

    // Collect panic information
    TvmPanicInfo info = {};
    info.error_code = error_code;
    info.pc = vm->pc;
    info.op = vm->op;
    info.ds_depth = vm->ds.top;
    info.has_stack_data = (info.ds_depth > 0);

    for (uint32_t i = 0; i < 4 && i < info.ds_depth; ++i)
    {
      info.stack[i] = vm->ds.data[info.ds_depth - 1 - i];
    }

    if (vm->verbose >= 1)
    {
      printf("\n");
      printf("========== TVM PANIC ==========\n");
      printf("Error: %s (code=%d)\n", err_str(error_code), error_code);
      printf("PC: %" PRIu32 " (%s)\n", info.pc, op_name(static_cast<Op>(info.op)));
      printf("Data Stack: [%" PRIu32 "]\n", info.ds_depth);

      for (uint32_t i = 0; i < 4 && i < info.ds_depth; ++i)
      {
        char hex[TVM_WORD_HEX_LEN];
        tvm_word_to_hex(&info.stack[i], hex);
        printf("  [%" PRIu32 "] %s\n", i, hex);
      }
      if (info.ds_depth > 4)
      {
        printf("  ... (%" PRIu32 " more entries)\n", info.ds_depth - 4);
      }

      printf("===============================\n");
      printf("\n");
    }

    // Call custom panic handler if registered
    if (vm->panic_handler)
    {
      vm->panic_handler(vm->panic_user_data, &info);
    }

    return error_code;
  }

}  // extern "C"
