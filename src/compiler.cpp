#include "tvm/compiler.hpp"

#include <cstdio>
#include <utility>

#include "tvm/errors.hpp"
#include "tvm/selector.hpp"

namespace tvm
{

/* ============================ Slot handling ============================== */

static tvm_err resolve_slot(const Contract &contract, const std::string &name, tvm_u32 *slot,
                            std::string *detail)
{
  auto it = contract.slots.find(name);
  if (it == contract.slots.end())
  {
    if (detail)
      *detail = name;
    return TVM_ERR(UnknownIdentifier);
  }
  *slot = it->second;
  return TVM_ERR(OK);
}

// PUSH_BYTE reaches slots 0..255; anything higher needs a full word.
static void emit_slot(tvm_u32 slot, Program *out)
{
  if (slot <= 0xFF)
    out->push_back(push_byte(static_cast<uint8_t>(slot)));
  else
    out->push_back(push_word(tvm_word_from_u64(slot)));
}

/* ========================= Expression lowering =========================== */

static tvm_err lower_expr(const ast::Expr &e, const Contract &contract, Program *out,
                          std::string *detail);

// Operand positions must leave exactly one word on the stack.
static tvm_err lower_value(const ast::Expr &e, const Contract &contract, Program *out,
                           std::string *detail)
{
  if (e.kind == ast::ExprKind::Assign)
  {
    if (detail)
      *detail = "assignment used as a value";
    return TVM_ERR(UnsupportedConstruct);
  }
  if (e.kind == ast::ExprKind::Type)
  {
    if (detail)
      *detail = std::string("type '") + ast::type_name_str(e.type) + "' used as a value";
    return TVM_ERR(UnsupportedConstruct);
  }
  return lower_expr(e, contract, out, detail);
}

static tvm_err lower_expr(const ast::Expr &e, const Contract &contract, Program *out,
                          std::string *detail)
{
  switch (e.kind)
  {
    case ast::ExprKind::BoolLiteral:
      out->push_back(push_byte(e.bool_value ? 1 : 0));
      return TVM_ERR(OK);

    case ast::ExprKind::Variable:
    {
      tvm_u32 slot;
      if (tvm_err err = resolve_slot(contract, e.name, &slot, detail))
        return err;
      emit_slot(slot, out);
      out->push_back(instr(Op::LOAD));
      return TVM_ERR(OK);
    }

    case ast::ExprKind::Assign:
    {
      if (e.children.size() != 2)
      {
        if (detail)
          *detail = "malformed assignment";
        return TVM_ERR(UnsupportedConstruct);
      }
      const ast::Expr &target = e.children[0];
      if (target.kind != ast::ExprKind::Variable)
      {
        if (detail)
          *detail = "left-hand side is not a state variable";
        return TVM_ERR(UnsupportedAssignmentTarget);
      }

      if (tvm_err err = lower_value(e.children[1], contract, out, detail))
        return err;
      tvm_u32 slot;
      if (tvm_err err = resolve_slot(contract, target.name, &slot, detail))
        return err;
      emit_slot(slot, out);
      out->push_back(instr(Op::STORE));
      return TVM_ERR(OK);
    }

    case ast::ExprKind::Not:
    {
      if (e.children.size() != 1)
      {
        if (detail)
          *detail = "malformed negation";
        return TVM_ERR(UnsupportedConstruct);
      }
      if (tvm_err err = lower_value(e.children[0], contract, out, detail))
        return err;
      out->push_back(instr(Op::ISZERO));
      return TVM_ERR(OK);
    }

    case ast::ExprKind::Type:
      // Only the bool placeholder lowers to nothing
      if (e.type != ast::TypeName::Bool)
      {
        if (detail)
          *detail = std::string("type '") + ast::type_name_str(e.type) + "'";
        return TVM_ERR(UnsupportedConstruct);
      }
      return TVM_ERR(OK);
  }

  if (detail)
    *detail = "unknown expression kind";
  return TVM_ERR(UnsupportedConstruct);
}

/* ========================== Statement lowering =========================== */

static tvm_err lower_stmt(const ast::Stmt &s, const Contract &contract, Program *out,
                          std::string *detail)
{
  switch (s.kind)
  {
    case ast::StmtKind::Expression:
      return lower_expr(s.expr, contract, out, detail);

    case ast::StmtKind::Return:
      if (s.has_expr)
      {
        if (tvm_err err = lower_value(s.expr, contract, out, detail))
          return err;
      }
      out->push_back(instr(Op::RETURN));
      return TVM_ERR(OK);
  }

  if (detail)
    *detail = "unknown statement kind";
  return TVM_ERR(UnsupportedConstruct);
}

tvm_err lower_body(const std::vector<ast::Stmt> &body, const Contract &contract, Program *out,
                   std::string *detail)
{
  if (!out)
    return TVM_ERR(InvalidArg);

  Program program;
  for (const ast::Stmt &s : body)
  {
    if (tvm_err err = lower_stmt(s, contract, &program, detail))
      return err;
  }
  if (body.empty() || body.back().kind != ast::StmtKind::Return)
    program.push_back(instr(Op::RETURN));

  *out = std::move(program);
  return TVM_ERR(OK);
}

/* ========================== Function attributes ========================== */

// Last attribute of each category wins.
static void resolve_attrs(const std::vector<ast::FunctionAttribute> &attrs, Visibility *vis,
                          Mutability *mut)
{
  *vis = Visibility::Internal;
  *mut = Mutability::NonPayable;
  for (const ast::FunctionAttribute &a : attrs)
  {
    if (a.kind == ast::AttrKind::Visibility)
      *vis = a.visibility;
    else
      *mut = a.mutability;
  }
}

/* =========================== Contract lowering =========================== */

static tvm_err fail(CompileError *err, tvm_err code, const std::string &function,
                    const std::string &detail)
{
  err->code = code;
  err->function = function;
  err->detail = detail;
  return code;
}

static tvm_err lower_function(const ast::FunctionDef &def, const CompileOptions &opt,
                              Contract *contract, CompileError *err)
{
  Function fn;
  fn.name = def.name;

  if (tvm_err e = canonical_signature(def, &fn.signature))
    return fail(err, e, def.name, "parameter list");

  for (const ast::Param &p : def.returns)
  {
    if (p.type != ast::TypeName::Bool)
      return fail(err, TVM_ERR(UnsupportedType), def.name, ast::type_name_str(p.type));
    fn.returns.push_back(p.type);
  }

  std::string detail;
  if (tvm_err e = lower_body(def.body, *contract, &fn.program, &detail))
    return fail(err, e, def.name, detail);

  resolve_attrs(def.attributes, &fn.visibility, &fn.mutability);

  const std::string selector = selector_of(fn.signature, opt.hash);
  auto it = contract->functions.find(selector);
  if (it != contract->functions.end())
  {
    // TODO: reject selector collisions once overloading rules are settled
    if (opt.verbose)
      printf("[tvm] %s: selector %s of %s replaces %s\n", contract->name.c_str(),
             selector.c_str(), fn.signature.c_str(), it->second.signature.c_str());
    it->second = std::move(fn);
    return TVM_ERR(OK);
  }

  contract->functions.emplace(selector, std::move(fn));
  return TVM_ERR(OK);
}

static tvm_err lower_contract(const ast::ContractDef &def, const CompileOptions &opt,
                              Contract *contract, CompileError *err)
{
  contract->name = def.name;
  err->contract = def.name;

  for (const ast::ContractPart &part : def.parts)
  {
    switch (part.kind)
    {
      case ast::PartKind::Variable:
      {
        const std::string &name = part.variable.name;
        if (contract->slots.count(name))
          return fail(err, TVM_ERR(DuplicateIdentifier), "", name);

        const tvm_u32 slot = static_cast<tvm_u32>(contract->storage.size());
        contract->storage.push_back(tvm_word_zero());
        contract->slots.emplace(name, slot);
        break;
      }

      case ast::PartKind::Function:
        if (!part.function.has_body)
        {
          if (opt.verbose)
            printf("[tvm] %s: skipping declaration-only function %s\n", def.name.c_str(),
                   part.function.name.c_str());
          break;
        }
        if (tvm_err e = lower_function(part.function, opt, contract, err))
          return e;
        break;

      case ast::PartKind::Constructor:
        // Deployment is handled outside the compiler
        if (opt.verbose)
          printf("[tvm] %s: skipping constructor\n", def.name.c_str());
        break;
    }
  }
  return TVM_ERR(OK);
}

std::string to_string(const CompileError &err)
{
  std::string s = err.contract;
  if (!err.function.empty())
  {
    s += '.';
    s += err.function;
  }
  s += ": ";
  s += err_str(err.code);
  if (!err.detail.empty())
  {
    s += " (";
    s += err.detail;
    s += ')';
  }
  return s;
}

tvm_err compile(const ast::SourceUnit &unit, std::vector<Contract> *out, CompileError *err,
                const CompileOptions *options)
{
  if (!out)
    return TVM_ERR(InvalidArg);

  const CompileOptions defaults;
  const CompileOptions &opt = options ? *options : defaults;

  std::vector<Contract> contracts;
  tvm_err first = TVM_ERR(OK);
  for (const ast::SourceUnitPart &part : unit.parts)
  {
    if (part.kind != ast::UnitPartKind::Contract)
      continue;

    Contract contract;
    CompileError local;
    if (tvm_err e = lower_contract(part.contract, opt, &contract, &local))
    {
      // Only the faulting contract is dropped
      if (opt.verbose)
        printf("[tvm] lowering failed: %s\n", to_string(local).c_str());
      if (first == TVM_ERR(OK))
      {
        first = e;
        if (err)
          *err = local;
      }
      continue;
    }
    contracts.push_back(std::move(contract));
  }

  *out = std::move(contracts);
  return first;
}

}  // namespace tvm
