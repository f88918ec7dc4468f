#pragma once

#include <cstddef>
#include <string>

#include "tvm/ast.hpp"
#include "tvm/keccak.h"
#include "tvm/vm_api.h"

namespace tvm
{

/** Selector length in hex characters (4 digest bytes). */
static constexpr std::size_t kSelectorHexLen = 8;

/**
 * @brief Build the canonical signature `name(type,...)` of a function.
 *
 * At most one parameter is supported and it must be `bool`.
 *
 * @param fn   Function definition.
 * @param out  Receives the signature.
 * @return 0 on success, UnsupportedConstruct for more than one parameter,
 *         UnsupportedType for a non-bool parameter.
 */
tvm_err canonical_signature(const ast::FunctionDef &fn, std::string *out);

/**
 * @brief First 4 bytes of hash(signature) as 8 lowercase hex characters.
 * @param signature  Canonical signature, e.g. "get()".
 * @param hash       Hash primitive; nullptr selects tvm_keccak256.
 */
std::string selector_of(const std::string &signature, tvm_hash_fn hash = nullptr);

}  // namespace tvm
