#pragma once
#include <stdint.h>

#include "tvm/panic.h"
#include "tvm/vm_api.h"

#ifdef __cplusplus
extern "C"
{
#endif

  /**
   * @brief Internal VM structure (not part of the public API).
   *        Visible only for unit tests or tightly coupled components.
   */
  typedef struct Vm
  {
    WordStack ds; /**< Data stack */

    /* Storage view (borrowed, see VmConfig) */
    tvm_word *storage;
    tvm_u32 storage_len;

    /* Execution state */
    tvm_u32 pc;   /**< Index of the next instruction */
    tvm_u8 op;    /**< Opcode currently executing */
    int halted;   /**< Set when RETURN was executed */
    int last_err; /**< Last error code (0 = OK) */
    int verbose;  /**< See VmConfig::verbose */

    /* Panic handler */
    TvmPanicHandler panic_handler;
    void *panic_user_data;
  } Vm;

#ifdef __cplusplus
} /* extern "C" */
#endif
