#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <cstdint>
#include <string>

#include "doctest.h"
#include "tvm/bytecode.hpp"
#include "tvm/errors.hpp"
#include "tvm/internal/vm.h"
#include "tvm/opcodes.hpp"
#include "tvm/vm_api.h"
#include "tvm/vm_api.hpp"

using tvm::Op;
using tvm::Program;

/* ------------------------------------------------------------------------- */
/* Helpers                                                                   */
/* ------------------------------------------------------------------------- */
static tvm_err run(Vm *vm, const Program &p)
{
  vm_reset(vm);
  return vm_exec(vm, p.data(), (int)p.size());
}

static tvm_word word_of(uint64_t v)
{
  return tvm_word_from_u64(v);
}

static tvm_word big_word()
{
  tvm_word w = tvm_word_zero();
  w.limb[0] = 0x1111111111111111ull;
  w.limb[3] = 0x8000000000000000ull;
  return w;
}

/* ------------------------------------------------------------------------- */
/* Word                                                                      */
/* ------------------------------------------------------------------------- */
TEST_CASE("word: zero test, equality and narrowing")
{
  tvm_word zero = tvm_word_zero();
  CHECK(tvm_word_is_zero(&zero));
  tvm_word one = word_of(1);
  CHECK_FALSE(tvm_word_is_zero(&one));
  CHECK(one == word_of(1));
  CHECK(one != word_of(2));

  uint64_t v = 0;
  CHECK(tvm_word_to_u64(&one, &v) == 0);
  CHECK(v == 1);

  tvm_word big = big_word();
  CHECK(tvm_word_to_u64(&big, &v) == -1);
}

TEST_CASE("word: big-endian bytes and hex rendering")
{
  tvm_word w = word_of(0x0102);
  uint8_t be[TVM_WORD_BYTES];
  tvm_word_to_be_bytes(&w, be);
  CHECK(be[30] == 0x01);
  CHECK(be[31] == 0x02);
  CHECK(be[0] == 0x00);

  tvm_word back;
  tvm_word_from_be_bytes(&back, be);
  CHECK(back == w);

  tvm_word big = big_word();
  tvm_word_to_be_bytes(&big, be);
  CHECK(be[0] == 0x80);
  CHECK(be[31] == 0x11);

  char hex[TVM_WORD_HEX_LEN];
  tvm_word_to_hex(&w, hex);
  CHECK(std::string(hex) ==
        "0x0000000000000000000000000000000000000000000000000000000000000102");
}

/* ------------------------------------------------------------------------- */
/* Word stack                                                                */
/* ------------------------------------------------------------------------- */
TEST_CASE("stack: push then pop returns the same word")
{
  WordStack ws;
  ws_init(&ws);

  const tvm_word samples[] = {word_of(0), word_of(1), word_of(0xFFFFFFFFFFFFFFFFull), big_word()};
  for (const tvm_word &w : samples)
  {
    REQUIRE(ws_push(&ws, w) == TVM_ERR(OK));
    tvm_word out = word_of(42);
    REQUIRE(ws_pop(&ws, &out) == TVM_ERR(OK));
    CHECK(out == w);
    CHECK(ws_depth(&ws) == 0);
  }
}

TEST_CASE("stack: push_byte zero-extends")
{
  WordStack ws;
  ws_init(&ws);

  REQUIRE(ws_push_byte(&ws, 0xAB) == TVM_ERR(OK));
  tvm_word out;
  REQUIRE(ws_pop(&ws, &out) == TVM_ERR(OK));
  CHECK(out == word_of(0xAB));
}

TEST_CASE("stack: 1024 pushes succeed, the 1025th overflows")
{
  WordStack ws;
  ws_init(&ws);

  for (int i = 0; i < TVM_STACK_CAPACITY; ++i)
  {
    REQUIRE(ws_push(&ws, word_of((uint64_t)i)) == TVM_ERR(OK));
  }
  CHECK(ws_depth(&ws) == TVM_STACK_CAPACITY);

  CHECK(ws_push(&ws, word_of(7)) == TVM_ERR(StackOverflow));
  CHECK(ws_push_byte(&ws, 7) == TVM_ERR(StackOverflow));
  CHECK(ws_depth(&ws) == TVM_STACK_CAPACITY);

  // The rejected value was not written over the top entry
  tvm_word top;
  REQUIRE(ws_pop(&ws, &top) == TVM_ERR(OK));
  CHECK(top == word_of(TVM_STACK_CAPACITY - 1));
}

TEST_CASE("stack: pop on empty underflows")
{
  WordStack ws;
  ws_init(&ws);

  tvm_word out = word_of(99);
  CHECK(ws_pop(&ws, &out) == TVM_ERR(StackUnderflow));
  CHECK(out == word_of(99));
  CHECK(ws_depth(&ws) == 0);
}

TEST_CASE("stack: swap_top2 exchanges entries and checks depth")
{
  WordStack ws;
  ws_init(&ws);

  CHECK(ws_swap_top2(&ws) == TVM_ERR(StackUnderflow));
  ws_push(&ws, word_of(1));
  CHECK(ws_swap_top2(&ws) == TVM_ERR(StackUnderflow));
  CHECK(ws_depth(&ws) == 1);

  ws_push(&ws, word_of(2));
  REQUIRE(ws_swap_top2(&ws) == TVM_ERR(OK));

  tvm_word a, b;
  ws_pop(&ws, &a);
  ws_pop(&ws, &b);
  CHECK(a == word_of(1));
  CHECK(b == word_of(2));
}

/* ------------------------------------------------------------------------- */
/* Engine: stack instructions                                                */
/* ------------------------------------------------------------------------- */
TEST_CASE("exec: PUSH_WORD/PUSH_BYTE/DUP1/SWAP1/POP")
{
  Vm vm{};
  vm_reset(&vm);

  Program p = {tvm::push_word(big_word()), tvm::push_byte(5), tvm::instr(Op::SWAP1),
               tvm::instr(Op::DUP1),       tvm::instr(Op::POP), tvm::instr(Op::DUP1)};
  REQUIRE(run(&vm, p) == TVM_ERR(OK));
  CHECK(vm_ds_depth_public(&vm) == 3);

  tvm_word w;
  vm_ds_pop(&vm, &w);
  CHECK(w == big_word());
  vm_ds_pop(&vm, &w);
  CHECK(w == big_word());
  vm_ds_pop(&vm, &w);
  CHECK(w == word_of(5));
}

TEST_CASE("exec: ISZERO maps 0 to 1 and nonzero to 0")
{
  Vm vm{};
  vm_reset(&vm);
  tvm_word w;

  REQUIRE(run(&vm, {tvm::push_byte(0), tvm::instr(Op::ISZERO)}) == TVM_ERR(OK));
  vm_ds_pop(&vm, &w);
  CHECK(w == word_of(1));

  const tvm_word nonzero[] = {word_of(1), word_of(2), word_of(255), big_word()};
  for (const tvm_word &v : nonzero)
  {
    REQUIRE(run(&vm, {tvm::push_word(v), tvm::instr(Op::ISZERO)}) == TVM_ERR(OK));
    vm_ds_pop(&vm, &w);
    CHECK(w == word_of(0));
  }
}

TEST_CASE("exec: DUP1 on empty stack underflows")
{
  Vm vm{};
  vm_reset(&vm);

  CHECK(run(&vm, {tvm::instr(Op::DUP1)}) == TVM_ERR(StackUnderflow));
  CHECK(vm_last_error(&vm) == TVM_ERR(StackUnderflow));
  CHECK(vm_pc(&vm) == 0);
}

TEST_CASE("exec: SWAP1 with one entry underflows")
{
  Vm vm{};
  vm_reset(&vm);

  CHECK(run(&vm, {tvm::push_byte(1), tvm::instr(Op::SWAP1)}) == TVM_ERR(StackUnderflow));
  CHECK(vm_pc(&vm) == 1);
}

TEST_CASE("exec: POP and ISZERO on empty stack underflow")
{
  Vm vm{};
  vm_reset(&vm);

  CHECK(run(&vm, {tvm::instr(Op::POP)}) == TVM_ERR(StackUnderflow));
  CHECK(run(&vm, {tvm::instr(Op::ISZERO)}) == TVM_ERR(StackUnderflow));
}

TEST_CASE("exec: DUP1 on a full stack overflows")
{
  Vm vm{};
  vm_reset(&vm);
  for (int i = 0; i < TVM_STACK_CAPACITY; ++i)
    REQUIRE(vm_ds_push(&vm, word_of(1)) == TVM_ERR(OK));

  tvm_instr dup = tvm::instr(Op::DUP1);
  CHECK(vm_exec(&vm, &dup, 1) == TVM_ERR(StackOverflow));
}

TEST_CASE("exec: unknown opcode tag faults")
{
  Vm vm{};
  vm_reset(&vm);

  tvm_instr bad = tvm::instr(Op::POP);
  bad.op = 0x00;
  CHECK(vm_exec(&vm, &bad, 1) == TVM_ERR(UnknownOp));
}

TEST_CASE("exec: invalid arguments")
{
  Vm vm{};
  vm_reset(&vm);

  CHECK(vm_exec(nullptr, nullptr, 0) == TVM_ERR(InvalidArg));
  CHECK(vm_exec(&vm, nullptr, 3) == TVM_ERR(InvalidArg));
  CHECK(vm_exec(&vm, nullptr, 0) == TVM_ERR(OK));
}

/* ------------------------------------------------------------------------- */
/* Engine: termination                                                       */
/* ------------------------------------------------------------------------- */
TEST_CASE("exec: RETURN halts and leaves the stack as the return buffer")
{
  Vm vm{};
  vm_reset(&vm);

  Program p = {tvm::push_byte(1), tvm::instr(Op::RETURN), tvm::push_byte(2),
               tvm::instr(Op::POP)};
  REQUIRE(run(&vm, p) == TVM_ERR(OK));
  CHECK(vm_halted(&vm));
  CHECK(vm_pc(&vm) == 2);
  CHECK(vm_ds_depth_public(&vm) == 1);

  tvm_word w;
  vm_ds_pop(&vm, &w);
  CHECK(w == word_of(1));
}

TEST_CASE("exec: running off the end terminates normally")
{
  Vm vm{};
  vm_reset(&vm);

  REQUIRE(run(&vm, {tvm::push_byte(3), tvm::push_byte(4)}) == TVM_ERR(OK));
  CHECK_FALSE(vm_halted(&vm));
  CHECK(vm_pc(&vm) == 2);
  CHECK(vm_ds_depth_public(&vm) == 2);

  REQUIRE(run(&vm, {}) == TVM_ERR(OK));
  CHECK(vm_pc(&vm) == 0);
}

/* ------------------------------------------------------------------------- */
/* Engine: storage                                                           */
/* ------------------------------------------------------------------------- */
TEST_CASE("exec: STORE then LOAD returns the stored value")
{
  tvm_word slots[4] = {};
  VmConfig cfg{slots, 4, 0};
  Vm *vm = vm_create(&cfg);
  REQUIRE(vm);

  const tvm_word values[] = {word_of(0), word_of(1), word_of(0xDEAD), big_word()};
  for (uint8_t k = 0; k < 4; ++k)
  {
    Program p = {tvm::push_word(values[k]), tvm::push_byte(k), tvm::instr(Op::STORE),
                 tvm::push_byte(k), tvm::instr(Op::LOAD)};
    REQUIRE(run(vm, p) == TVM_ERR(OK));
    CHECK(vm_ds_depth_public(vm) == 1);

    tvm_word w;
    vm_ds_pop(vm, &w);
    CHECK(w == values[k]);
    CHECK(slots[k] == values[k]);
  }

  vm_destroy(vm);
}

TEST_CASE("exec: LOAD/STORE out of range fault with InvalidStorageSlot")
{
  tvm_word slots[2] = {};
  VmConfig cfg{slots, 2, 0};
  Vm *vm = vm_create(&cfg);
  REQUIRE(vm);

  CHECK(run(vm, {tvm::push_byte(2), tvm::instr(Op::LOAD)}) == TVM_ERR(InvalidStorageSlot));
  CHECK(run(vm, {tvm::push_byte(1), tvm::push_byte(2), tvm::instr(Op::STORE)}) ==
        TVM_ERR(InvalidStorageSlot));
  CHECK(run(vm, {tvm::push_word(big_word()), tvm::instr(Op::LOAD)}) ==
        TVM_ERR(InvalidStorageSlot));
  CHECK(slots[0] == word_of(0));
  CHECK(slots[1] == word_of(0));

  vm_destroy(vm);
}

TEST_CASE("exec: LOAD with no storage bound faults")
{
  Vm vm{};
  vm_reset(&vm);

  CHECK(run(&vm, {tvm::push_byte(0), tvm::instr(Op::LOAD)}) == TVM_ERR(InvalidStorageSlot));
}

TEST_CASE("exec: STORE needs both key and value")
{
  tvm_word slots[1] = {};
  VmConfig cfg{slots, 1, 0};
  Vm *vm = vm_create(&cfg);
  REQUIRE(vm);

  CHECK(run(vm, {tvm::push_byte(0), tvm::instr(Op::STORE)}) == TVM_ERR(StackUnderflow));

  vm_destroy(vm);
}

TEST_CASE("vm_bind_storage switches the view")
{
  tvm_word a[1] = {};
  tvm_word b[1] = {};
  VmConfig cfg{a, 1, 0};
  Vm *vm = vm_create(&cfg);
  REQUIRE(vm);

  CHECK(vm_bind_storage(vm, nullptr, 1) == TVM_ERR(InvalidArg));
  REQUIRE(vm_bind_storage(vm, b, 1) == TVM_ERR(OK));
  REQUIRE(run(vm, {tvm::push_byte(9), tvm::push_byte(0), tvm::instr(Op::STORE)}) ==
          TVM_ERR(OK));
  CHECK(a[0] == word_of(0));
  CHECK(b[0] == word_of(9));

  vm_destroy(vm);
}

TEST_CASE("vm_create rejects a missing storage buffer")
{
  VmConfig cfg{nullptr, 3, 0};
  CHECK(vm_create(&cfg) == nullptr);
  CHECK(vm_create(nullptr) == nullptr);
}

TEST_CASE("stack inspection: push, pop, depth and clear")
{
  Vm vm{};
  vm_reset(&vm);

  REQUIRE(vm_ds_push(&vm, word_of(5)) == TVM_ERR(OK));
  REQUIRE(vm_ds_push(&vm, word_of(6)) == TVM_ERR(OK));
  CHECK(vm_ds_depth_public(&vm) == 2);

  vm_ds_clear(&vm);
  CHECK(vm_ds_depth_public(&vm) == 0);
  CHECK(vm_ds_pop(&vm, nullptr) == TVM_ERR(StackUnderflow));

  vm_ds_clear(nullptr);
  CHECK(vm_ds_depth_public(nullptr) == 0);
}

TEST_CASE("Machine: run leaves results on the stack")
{
  tvm_word slots[1] = {};
  VmConfig cfg{slots, 1, 0};
  tvm::Machine m(cfg);
  REQUIRE(m.ok());

  REQUIRE(m.run({tvm::push_byte(3), tvm::instr(Op::DUP1)}) == TVM_ERR(OK));
  CHECK(m.depth() == 2);

  tvm_word w;
  REQUIRE(m.pop(&w) == TVM_ERR(OK));
  CHECK(w == word_of(3));
  CHECK(m.depth() == 1);

  // run starts from an empty stack
  REQUIRE(m.run({tvm::instr(Op::RETURN)}) == TVM_ERR(OK));
  CHECK(m.depth() == 0);
}
