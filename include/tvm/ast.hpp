#pragma once

#include <cstdint>
#include <string>
#include <vector>

/**
 * @file ast.hpp
 * @brief Parsed contract source tree consumed by the lowering compiler.
 *
 * The tree is produced by an external parser. Nodes are plain tagged
 * structs: `kind` selects which of the other fields are meaningful.
 */

namespace tvm::ast
{

enum class Visibility : uint8_t
{
  Public,
  Private,
  Internal,
  External,
};

enum class Mutability : uint8_t
{
  Pure,
  View,
  NonPayable,
  Payable,
  Constant,
};

/** Elementary type names. Only Bool is accepted in function signatures. */
enum class TypeName : uint8_t
{
  Bool,
  Address,
  String,
  Uint256,
  Int256,
  Bytes32,
};

/** Canonical spelling used in signatures, e.g. "bool", "uint256". */
const char *type_name_str(TypeName t);

enum class ExprKind : uint8_t
{
  BoolLiteral,
  Variable,
  Assign,
  Not,
  Type,
};

/**
 * Expression node.
 *  - BoolLiteral: bool_value
 *  - Variable:    name
 *  - Assign:      children[0] = target, children[1] = value
 *  - Not:         children[0] = operand
 *  - Type:        type
 */
struct Expr
{
  ExprKind kind = ExprKind::BoolLiteral;
  bool bool_value = false;
  std::string name;
  TypeName type = TypeName::Bool;
  std::vector<Expr> children;
};

enum class StmtKind : uint8_t
{
  Expression,
  Return,
};

struct Stmt
{
  StmtKind kind = StmtKind::Expression;
  bool has_expr = false;  // Return only; Expression statements always carry one
  Expr expr;
};

struct Param
{
  TypeName type = TypeName::Bool;
  std::string name;  // may be empty
};

enum class AttrKind : uint8_t
{
  Visibility,
  Mutability,
};

struct FunctionAttribute
{
  AttrKind kind = AttrKind::Visibility;
  Visibility visibility = Visibility::Internal;
  Mutability mutability = Mutability::NonPayable;
};

struct FunctionDef
{
  std::string name;
  std::vector<Param> params;
  std::vector<FunctionAttribute> attributes;
  std::vector<Param> returns;
  bool has_body = false;  // false for declaration-only functions
  std::vector<Stmt> body;
};

struct VariableDef
{
  TypeName type = TypeName::Bool;
  std::string name;
};

struct ConstructorDef
{
  std::vector<Param> params;
  std::vector<FunctionAttribute> attributes;
  std::vector<Stmt> body;
};

enum class PartKind : uint8_t
{
  Function,
  Variable,
  Constructor,
};

struct ContractPart
{
  PartKind kind = PartKind::Variable;
  FunctionDef function;
  VariableDef variable;
  ConstructorDef constructor;
};

struct ContractDef
{
  std::string name;
  std::vector<ContractPart> parts;
};

enum class UnitPartKind : uint8_t
{
  Contract,
  Pragma,
};

struct SourceUnitPart
{
  UnitPartKind kind = UnitPartKind::Contract;
  ContractDef contract;
  std::string pragma;  // Pragma only; ignored by the compiler
};

struct SourceUnit
{
  std::vector<SourceUnitPart> parts;
};

// -----------------------------------------------------------------------------
// Node builders
// -----------------------------------------------------------------------------
Expr bool_lit(bool value);
Expr var(const std::string &name);
Expr assign(Expr target, Expr value);
Expr logical_not(Expr operand);
Expr type_ref(TypeName type);

Stmt expr_stmt(Expr e);
Stmt return_stmt(Expr e);
Stmt return_void();

FunctionAttribute visibility_attr(Visibility v);
FunctionAttribute mutability_attr(Mutability m);

ContractPart state_var(TypeName type, const std::string &name);
ContractPart function_part(FunctionDef fn);
ContractPart constructor_part(ConstructorDef ctor);

SourceUnitPart contract_unit(ContractDef contract);

}  // namespace tvm::ast
