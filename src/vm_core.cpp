#include <cinttypes>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

#include "tvm/errors.hpp"
#include "tvm/internal/vm.h"
#include "tvm/opcodes.hpp"
#include "tvm/panic.h"
#include "tvm/vm_api.h"

/* ============================== Word stack =============================== */

extern "C" void ws_init(WordStack* ws)
{
  if (!ws)
    return;
  ws->top = 0;
}

extern "C" tvm_err ws_push(WordStack* ws, tvm_word value)
{
  if (!ws)
    return TVM_ERR(InvalidArg);
  if (ws->top >= TVM_STACK_CAPACITY)
    return TVM_ERR(StackOverflow);
  ws->data[ws->top++] = value;
  return TVM_ERR(OK);
}

extern "C" tvm_err ws_push_byte(WordStack* ws, tvm_u8 value)
{
  return ws_push(ws, tvm_word_from_u64(value));
}

extern "C" tvm_err ws_pop(WordStack* ws, tvm_word* out)
{
  if (!ws)
    return TVM_ERR(InvalidArg);
  if (ws->top == 0)
    return TVM_ERR(StackUnderflow);
  ws->top--;
  if (out)
    *out = ws->data[ws->top];
  return TVM_ERR(OK);
}

extern "C" tvm_err ws_swap_top2(WordStack* ws)
{
  if (!ws)
    return TVM_ERR(InvalidArg);
  // Checked before computing top - 2 so the unsigned index cannot wrap
  if (ws->top < 2)
    return TVM_ERR(StackUnderflow);
  tvm_word tmp = ws->data[ws->top - 1];
  ws->data[ws->top - 1] = ws->data[ws->top - 2];
  ws->data[ws->top - 2] = tmp;
  return TVM_ERR(OK);
}

extern "C" tvm_u32 ws_depth(const WordStack* ws)
{
  return ws ? ws->top : 0;
}

/* =============================== Lifecycle =============================== */

extern "C" Vm* vm_create(const VmConfig* cfg)
{
  if (!cfg)
    return nullptr;
  if (!cfg->storage && cfg->storage_len > 0)
    return nullptr;

  Vm* vm = static_cast<Vm*>(calloc(1, sizeof(Vm)));
  if (!vm)
    return nullptr;

  vm->storage = cfg->storage;
  vm->storage_len = cfg->storage_len;
  vm->verbose = cfg->verbose;
  vm->panic_handler = nullptr;
  vm->panic_user_data = nullptr;
  vm_reset(vm);
  return vm;
}

extern "C" void vm_destroy(Vm* vm)
{
  free(vm);
}

extern "C" void vm_reset(Vm* vm)
{
  if (!vm)
    return;

  ws_init(&vm->ds);
  vm->pc = 0;
  vm->op = 0;
  vm->halted = 0;
  vm->last_err = 0;
}

extern "C" tvm_err vm_bind_storage(Vm* vm, tvm_word* slots, tvm_u32 len)
{
  if (!vm || (!slots && len > 0))
    return TVM_ERR(InvalidArg);
  vm->storage = slots;
  vm->storage_len = len;
  return TVM_ERR(OK);
}

/* ================================ Tracing ================================ */

static void trace_instr(const Vm* vm, const tvm_instr* in)
{
  const tvm::Op op = static_cast<tvm::Op>(in->op);
  const char* name = tvm::op_name(op);

  if (op == tvm::Op::PUSH_BYTE)
  {
    printf("[tvm] %04" PRIu32 " %-9s 0x%02x  depth=%" PRIu32 "\n", vm->pc, name,
           (unsigned)(in->imm.limb[0] & 0xFF), vm->ds.top);
  }
  else if (op == tvm::Op::PUSH_WORD)
  {
    char hex[TVM_WORD_HEX_LEN];
    tvm_word_to_hex(&in->imm, hex);
    printf("[tvm] %04" PRIu32 " %-9s %s  depth=%" PRIu32 "\n", vm->pc, name, hex,
           vm->ds.top);
  }
  else
  {
    printf("[tvm] %04" PRIu32 " %-9s depth=%" PRIu32 "\n", vm->pc, name, vm->ds.top);
  }
}

/* ============================ Storage access ============================= */

static inline tvm_err slot_index(const Vm* vm, const tvm_word* key, tvm_u32* out)
{
  uint64_t k;
  if (tvm_word_to_u64(key, &k) != 0 || k >= vm->storage_len)
    return TVM_ERR(InvalidStorageSlot);
  *out = static_cast<tvm_u32>(k);
  return TVM_ERR(OK);
}

/* ========================== Instruction dispatch ========================= */

static tvm_err step(Vm* vm, const tvm_instr* in)
{
  switch (static_cast<tvm::Op>(in->op))
  {
    /* -------- Literals -------- */
    case tvm::Op::PUSH_WORD:
      return ws_push(&vm->ds, in->imm);

    case tvm::Op::PUSH_BYTE:
      return ws_push_byte(&vm->ds, static_cast<tvm_u8>(in->imm.limb[0] & 0xFF));

    /* -------- Stack manipulation -------- */
    case tvm::Op::POP:
      return ws_pop(&vm->ds, nullptr);

    case tvm::Op::DUP1:
    {
      tvm_word v;
      if (tvm_err e = ws_pop(&vm->ds, &v))
        return e;
      if (tvm_err e = ws_push(&vm->ds, v))
        return e;
      return ws_push(&vm->ds, v);
    }

    case tvm::Op::SWAP1:
      return ws_swap_top2(&vm->ds);

    /* -------- Storage -------- */
    case tvm::Op::LOAD:
    {
      tvm_word key;
      tvm_u32 idx;
      if (tvm_err e = ws_pop(&vm->ds, &key))
        return e;
      if (tvm_err e = slot_index(vm, &key, &idx))
        return e;
      return ws_push(&vm->ds, vm->storage[idx]);
    }

    case tvm::Op::STORE:
    {
      tvm_word key, value;
      tvm_u32 idx;
      if (tvm_err e = ws_pop(&vm->ds, &key))
        return e;
      if (tvm_err e = ws_pop(&vm->ds, &value))
        return e;
      if (tvm_err e = slot_index(vm, &key, &idx))
        return e;
      vm->storage[idx] = value;
      return TVM_ERR(OK);
    }

    /* -------- Logic -------- */
    case tvm::Op::ISZERO:
    {
      tvm_word v;
      if (tvm_err e = ws_pop(&vm->ds, &v))
        return e;
      return ws_push_byte(&vm->ds, tvm_word_is_zero(&v) ? 1 : 0);
    }

    /* -------- Return -------- */
    case tvm::Op::RETURN:
      vm->halted = 1;
      return TVM_ERR(OK);
  }

  // Tag outside opcodes.def
  return TVM_ERR(UnknownOp);
}

/* ========================== Main execution loop ========================== */

extern "C" tvm_err vm_exec(Vm* vm, const tvm_instr* program, int len)
{
  if (!vm || len < 0 || (!program && len > 0))
    return TVM_ERR(InvalidArg);

  vm->pc = 0;
  vm->halted = 0;
  vm->last_err = 0;

  // Straight-line code: at most len steps.
  while (vm->pc < static_cast<tvm_u32>(len) && !vm->halted)
  {
    const tvm_instr* in = &program[vm->pc];
    vm->op = in->op;

    if (vm->verbose >= 2)
      trace_instr(vm, in);

    if (tvm_err e = step(vm, in))
    {
      vm->last_err = e;
      return vm_panic(vm, e);
    }
    vm->pc++;
  }

  return TVM_ERR(OK);
}

extern "C" tvm_u32 vm_pc(const Vm* vm)
{
  return vm ? vm->pc : 0;
}

extern "C" int vm_halted(const Vm* vm)
{
  return vm ? vm->halted : 0;
}

extern "C" tvm_err vm_last_error(const Vm* vm)
{
  return vm ? vm->last_err : TVM_ERR(InvalidArg);
}

/* ===================== Stack inspection API ============================== */

extern "C" int vm_ds_depth_public(Vm* vm)
{
  if (!vm)
    return 0;
  return static_cast<int>(vm->ds.top);
}

extern "C" tvm_err vm_ds_push(Vm* vm, tvm_word value)
{
  if (!vm)
    return TVM_ERR(InvalidArg);
  return ws_push(&vm->ds, value);
}

extern "C" tvm_err vm_ds_pop(Vm* vm, tvm_word* out_value)
{
  if (!vm)
    return TVM_ERR(InvalidArg);
  return ws_pop(&vm->ds, out_value);
}

extern "C" void vm_ds_clear(Vm* vm)
{
  if (!vm)
    return;
  ws_init(&vm->ds);
}
