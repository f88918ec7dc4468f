#pragma once

#include <string>
#include <vector>

#include "tvm/ast.hpp"
#include "tvm/bytecode.hpp"
#include "tvm/contract.hpp"
#include "tvm/keccak.h"
#include "tvm/vm_api.h"

namespace tvm
{

struct CompileOptions
{
  tvm_hash_fn hash = nullptr;  // nullptr = tvm_keccak256
  int verbose = 0;             // 1 = log skipped parts and errors
};

/** Where and why lowering stopped. */
struct CompileError
{
  tvm_err code = 0;
  std::string contract;
  std::string function;  // empty for faults outside a function
  std::string detail;    // offending identifier or construct
};

/** "Contract.function: message (detail)" */
std::string to_string(const CompileError &err);

/**
 * @brief Lower every contract of a source unit.
 *
 * Contracts are produced in source order. Within a contract, state
 * variables get consecutive slots from 0 in declaration order and
 * functions with a body are lowered and registered under their selector.
 * Constructors, declaration-only functions and pragmas are skipped.
 *
 * A fault drops only the contract it occurs in. The remaining contracts
 * are still written to *out, and *err (if given) describes the first
 * fault.
 *
 * @param unit     Parsed source.
 * @param out      Receives the contracts.
 * @param err      Optional fault description (can be NULL).
 * @param options  Optional options (can be NULL).
 * @return 0 if every contract lowered, else the code of the first fault.
 */
tvm_err compile(const ast::SourceUnit &unit, std::vector<Contract> *out,
                CompileError *err = nullptr, const CompileOptions *options = nullptr);

/**
 * @brief Lower one function body against a contract's slot map.
 *
 * Appends RETURN unless the last statement is a return statement.
 *
 * @param body      Statements in order.
 * @param contract  Provides the slot map.
 * @param out       Receives the program.
 * @param detail    Optional; receives the offending identifier/construct.
 * @return 0 on success, negative error code on failure.
 */
tvm_err lower_body(const std::vector<ast::Stmt> &body, const Contract &contract,
                   Program *out, std::string *detail = nullptr);

}  // namespace tvm
