#include "tvm/ast.hpp"

#include <utility>

namespace tvm::ast
{

const char *type_name_str(TypeName t)
{
  switch (t)
  {
    case TypeName::Bool:
      return "bool";
    case TypeName::Address:
      return "address";
    case TypeName::String:
      return "string";
    case TypeName::Uint256:
      return "uint256";
    case TypeName::Int256:
      return "int256";
    case TypeName::Bytes32:
      return "bytes32";
  }
  return "?";
}

Expr bool_lit(bool value)
{
  Expr e;
  e.kind = ExprKind::BoolLiteral;
  e.bool_value = value;
  return e;
}

Expr var(const std::string &name)
{
  Expr e;
  e.kind = ExprKind::Variable;
  e.name = name;
  return e;
}

Expr assign(Expr target, Expr value)
{
  Expr e;
  e.kind = ExprKind::Assign;
  e.children.push_back(std::move(target));
  e.children.push_back(std::move(value));
  return e;
}

Expr logical_not(Expr operand)
{
  Expr e;
  e.kind = ExprKind::Not;
  e.children.push_back(std::move(operand));
  return e;
}

Expr type_ref(TypeName type)
{
  Expr e;
  e.kind = ExprKind::Type;
  e.type = type;
  return e;
}

Stmt expr_stmt(Expr e)
{
  Stmt s;
  s.kind = StmtKind::Expression;
  s.has_expr = true;
  s.expr = std::move(e);
  return s;
}

Stmt return_stmt(Expr e)
{
  Stmt s;
  s.kind = StmtKind::Return;
  s.has_expr = true;
  s.expr = std::move(e);
  return s;
}

Stmt return_void()
{
  Stmt s;
  s.kind = StmtKind::Return;
  s.has_expr = false;
  return s;
}

FunctionAttribute visibility_attr(Visibility v)
{
  FunctionAttribute a;
  a.kind = AttrKind::Visibility;
  a.visibility = v;
  return a;
}

FunctionAttribute mutability_attr(Mutability m)
{
  FunctionAttribute a;
  a.kind = AttrKind::Mutability;
  a.mutability = m;
  return a;
}

ContractPart state_var(TypeName type, const std::string &name)
{
  ContractPart p;
  p.kind = PartKind::Variable;
  p.variable.type = type;
  p.variable.name = name;
  return p;
}

ContractPart function_part(FunctionDef fn)
{
  ContractPart p;
  p.kind = PartKind::Function;
  p.function = std::move(fn);
  return p;
}

ContractPart constructor_part(ConstructorDef ctor)
{
  ContractPart p;
  p.kind = PartKind::Constructor;
  p.constructor = std::move(ctor);
  return p;
}

SourceUnitPart contract_unit(ContractDef contract)
{
  SourceUnitPart p;
  p.kind = UnitPartKind::Contract;
  p.contract = std::move(contract);
  return p;
}

}  // namespace tvm::ast
