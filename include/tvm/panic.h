#pragma once
#include <stdint.h>

#include "tvm/vm_api.h"

#ifdef __cplusplus
extern "C"
{
#endif

  /**
   * @brief VM panic diagnostic information
   *
   * Structure holding diagnostic information when the VM faults.
   * Collected by vm_panic() and passed to the registered handler.
   */
  typedef struct TvmPanicInfo
  {
    int32_t error_code;  /**< Error code (Err enumeration value) */
    uint32_t pc;         /**< Index of the faulting instruction */
    uint8_t op;          /**< Opcode of the faulting instruction */
    uint32_t ds_depth;   /**< Data stack depth at the fault */
    int has_stack_data;  /**< Whether stack[] holds valid entries */
    tvm_word stack[4];   /**< Top 4 stack words, stack[0] = TOS */
  } TvmPanicInfo;

  // Forward declaration
  struct Vm;

  /**
   * @brief Panic handler callback type
   *
   * @param user_data  User data pointer passed to vm_set_panic_handler
   * @param info       Panic diagnostic information
   */
  typedef void (*TvmPanicHandler)(void *user_data, const TvmPanicInfo *info);

  /**
   * @brief Set custom panic handler
   *
   * Registers a callback invoked by vm_panic(). Lets embedders collect
   * faults without parsing the printed banner.
   *
   * @param vm         VM instance
   * @param handler    Panic handler callback (NULL to disable)
   * @param user_data  User data passed to handler
   */
  void vm_set_panic_handler(struct Vm *vm, TvmPanicHandler handler, void *user_data);

  /**
   * @brief Report a fault.
   *
   * Prints a diagnostic banner when the VM is verbose and calls the custom
   * handler if one is registered.
   *
   * @param vm          VM instance
   * @param error_code  Fault being reported
   * @return error_code, so callers can write `return vm_panic(vm, e);`
   */
  tvm_err vm_panic(struct Vm *vm, tvm_err error_code);

#ifdef __cplusplus
}
#endif
