#pragma once

#include <map>
#include <string>
#include <vector>

#include "tvm/ast.hpp"
#include "tvm/bytecode.hpp"
#include "tvm/panic.hpp"
#include "tvm/vm_api.h"

namespace tvm
{

using ast::Mutability;
using ast::TypeName;
using ast::Visibility;

/** A lowered function. Immutable once the compiler has produced it. */
struct Function
{
  std::string name;
  std::string signature;  // canonical, e.g. "get()"
  Program program;
  Visibility visibility = Visibility::Internal;
  Mutability mutability = Mutability::NonPayable;
  std::vector<TypeName> returns;  // declaration order
};

/**
 * Unit of contract state. Copied by value: a call produces a new Contract
 * rather than updating the caller's.
 */
struct Contract
{
  std::string name;
  std::map<std::string, Function> functions;  // selector -> function
  std::map<std::string, tvm_u32> slots;       // state variable -> slot
  std::vector<tvm_word> storage;              // one word per slot
};

/** One decoded return value. Only bool returns carry a value. */
struct ReturnValue
{
  TypeName type = TypeName::Bool;
  bool has_value = false;
  bool value = false;
  tvm_word raw = tvm_word_zero();
};

struct CallOptions
{
  int verbose = 0;  // see VmConfig::verbose
  PanicHandler panic_handler = nullptr;
  void *panic_user_data = nullptr;
};

struct CallResult
{
  Contract contract;                // state after the call
  std::vector<ReturnValue> returns;  // declaration order
  bool found = false;               // false if the selector is not registered
};

/** false for View and Pure: their storage output is discarded. */
bool is_state_mutating(Mutability m);

/** @return Function registered under selector, or nullptr. */
const Function *find_function(const Contract &contract, const std::string &selector);

/**
 * @brief Dispatch a call by selector.
 *
 * Runs the function against a copy of the contract storage. The copy is
 * committed to out->contract only for state-mutating functions and only
 * when execution and return decoding both succeed. An unknown selector is
 * not an error: out->contract equals the input and out->found is false.
 *
 * @param contract  Current contract state (never modified).
 * @param selector  8 hex character selector.
 * @param out       Receives the new state and decoded return values.
 * @param options   Optional call options (can be NULL).
 * @return 0 on success, negative error code if execution faulted. On a
 *         fault out->contract is the unchanged input and out->returns is empty.
 */
tvm_err call(const Contract &contract, const std::string &selector, CallResult *out,
             const CallOptions *options = nullptr);

/** call() with the selector derived from a canonical signature via Keccak-256. */
tvm_err call_signature(const Contract &contract, const std::string &signature,
                       CallResult *out, const CallOptions *options = nullptr);

}  // namespace tvm
