#pragma once
#include <stddef.h>
#include <stdint.h>

#include "tvm/word.h"

#ifdef __cplusplus
extern "C"
{
#endif

  /* ------------------------------------------------------------------------- */
  /* Basic typedefs                                                            */
  /* ------------------------------------------------------------------------- */

  /** 8-bit unsigned integer used for opcodes and byte immediates. */
  typedef uint8_t tvm_u8;
  /** 32-bit unsigned integer used for counters and slot numbers. */
  typedef uint32_t tvm_u32;
  /** Error code type. 0 = OK, negative = error. */
  typedef int tvm_err;

  /* ------------------------------------------------------------------------- */
  /* Instructions                                                              */
  /* ------------------------------------------------------------------------- */

  /**
   * @brief One decoded instruction: opcode tag plus payload.
   *
   * imm is meaningful for PUSH_BYTE (low byte only) and PUSH_WORD; it is
   * zero for every other opcode.
   */
  typedef struct tvm_instr
  {
    tvm_u8 op;    /**< tvm_op_t value */
    tvm_word imm; /**< Immediate payload */
  } tvm_instr;

  /* ------------------------------------------------------------------------- */
  /* Word stack                                                                */
  /* ------------------------------------------------------------------------- */

#define TVM_STACK_CAPACITY 1024

  /**
   * @brief Fixed-capacity LIFO of words.
   *
   * Invariant: 0 <= top <= TVM_STACK_CAPACITY. data[top-1] is the top entry.
   */
  typedef struct WordStack
  {
    tvm_word data[TVM_STACK_CAPACITY];
    tvm_u32 top;
  } WordStack;

  /** @brief Empty the stack. */
  void ws_init(WordStack *ws);

  /**
   * @brief Push a word.
   * @return 0 on success, StackOverflow when the stack is full.
   */
  tvm_err ws_push(WordStack *ws, tvm_word value);

  /**
   * @brief Push a byte, zero-extended to a word.
   * @return 0 on success, StackOverflow when the stack is full.
   */
  tvm_err ws_push_byte(WordStack *ws, tvm_u8 value);

  /**
   * @brief Pop the top word.
   * @param out  Destination for the popped word (can be NULL).
   * @return 0 on success, StackUnderflow when the stack is empty.
   */
  tvm_err ws_pop(WordStack *ws, tvm_word *out);

  /**
   * @brief Exchange the two topmost entries.
   * @return 0 on success, StackUnderflow with fewer than two entries.
   */
  tvm_err ws_swap_top2(WordStack *ws);

  /** @brief Number of entries currently on the stack. */
  tvm_u32 ws_depth(const WordStack *ws);

  /* ------------------------------------------------------------------------- */
  /* VM configuration                                                          */
  /* ------------------------------------------------------------------------- */

  /**
   * @brief Configuration structure used when creating a VM instance.
   *
   * The storage view is borrowed: the VM reads and writes the caller's slots
   * in place and never resizes them.
   */
  typedef struct VmConfig
  {
    tvm_word *storage;   /**< Storage slots (can be NULL when storage_len is 0) */
    tvm_u32 storage_len; /**< Number of slots */
    int verbose;         /**< 0 = silent, 1 = panic banners, 2 = + instruction trace */
  } VmConfig;

  /* Forward declaration for the opaque VM structure. */
  struct Vm;

  /* ------------------------------------------------------------------------- */
  /* Lifecycle and execution                                                   */
  /* ------------------------------------------------------------------------- */

  /**
   * @brief Create a new VM instance.
   * @param cfg  Pointer to a valid VmConfig.
   * @return Pointer to the new VM, or NULL on allocation failure.
   */
  struct Vm *vm_create(const VmConfig *cfg);

  /**
   * @brief Destroy a VM instance.
   * @param vm  VM instance to destroy (NULL-safe).
   */
  void vm_destroy(struct Vm *vm);

  /**
   * @brief Reset the stack, program counter and halt flag.
   *        Storage binding and panic handler are kept.
   * @param vm  VM instance.
   */
  void vm_reset(struct Vm *vm);

  /**
   * @brief Point the VM at a different storage view.
   * @param vm     VM instance.
   * @param slots  Storage slots (can be NULL when len is 0).
   * @param len    Number of slots.
   * @return 0 on success, InvalidArg on bad arguments.
   */
  tvm_err vm_bind_storage(struct Vm *vm, tvm_word *slots, tvm_u32 len);

  /**
   * @brief Run a program from pc 0 until RETURN or the end of the program.
   *
   * The stack is not cleared first; call vm_reset() for a fresh run.
   * On a fault execution stops, vm_panic() is invoked and the fault code
   * is returned. Storage writes performed before the fault stay in the
   * bound view; callers that need atomicity run against a copy.
   *
   * @param vm       VM instance.
   * @param program  Instruction array.
   * @param len      Number of instructions.
   * @return 0 on success, negative error code on failure.
   */
  tvm_err vm_exec(struct Vm *vm, const tvm_instr *program, int len);

  /** @brief Program counter after the last vm_exec (index of the next instruction). */
  tvm_u32 vm_pc(const struct Vm *vm);

  /** @brief Non-zero if the last vm_exec stopped on RETURN. */
  int vm_halted(const struct Vm *vm);

  /** @brief Error code of the last vm_exec (0 = OK). */
  tvm_err vm_last_error(const struct Vm *vm);

  /* ------------------------------------------------------------------------- */
  /* Stack inspection and manipulation (for embedders and tests)              */
  /* ------------------------------------------------------------------------- */

  /**
   * @brief Get the current data stack depth.
   * @param vm  VM instance.
   * @return Number of words currently on the data stack.
   */
  int vm_ds_depth_public(struct Vm *vm);

  /**
   * @brief Push a word onto the data stack.
   * @return 0 on success, StackOverflow when full.
   */
  tvm_err vm_ds_push(struct Vm *vm, tvm_word value);

  /**
   * @brief Pop a word from the data stack.
   * @param vm         VM instance.
   * @param out_value  Output pointer for popped value (can be NULL).
   * @return 0 on success, StackUnderflow when empty.
   */
  tvm_err vm_ds_pop(struct Vm *vm, tvm_word *out_value);

  /** @brief Clear the data stack. */
  void vm_ds_clear(struct Vm *vm);

#ifdef __cplusplus
}  // extern "C"
#endif
