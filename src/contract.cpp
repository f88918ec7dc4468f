#include "tvm/contract.hpp"

#include <cstdio>
#include <utility>

#include "tvm/errors.hpp"
#include "tvm/selector.hpp"
#include "tvm/vm_api.hpp"

namespace tvm
{

bool is_state_mutating(Mutability m)
{
  return m != Mutability::View && m != Mutability::Pure;
}

const Function *find_function(const Contract &contract, const std::string &selector)
{
  auto it = contract.functions.find(selector);
  return it == contract.functions.end() ? nullptr : &it->second;
}

static ReturnValue decode_return(TypeName type, const tvm_word &w)
{
  ReturnValue rv;
  rv.type = type;
  rv.raw = w;
  if (type == TypeName::Bool)
  {
    rv.has_value = true;
    rv.value = (w == tvm_word_from_u64(1));
  }
  return rv;
}

tvm_err call(const Contract &contract, const std::string &selector, CallResult *out,
             const CallOptions *options)
{
  if (!out)
    return TVM_ERR(InvalidArg);

  const CallOptions defaults;
  const CallOptions &opt = options ? *options : defaults;

  out->contract = contract;
  out->returns.clear();
  out->found = false;

  const Function *fn = find_function(contract, selector);
  if (!fn)
  {
    if (opt.verbose)
      printf("[tvm] %s: no function for selector %s\n", contract.name.c_str(),
             selector.c_str());
    return TVM_ERR(OK);
  }
  out->found = true;

  // Run against a copy; the caller's storage is only replaced on success.
  std::vector<tvm_word> scratch = contract.storage;
  VmConfig cfg{scratch.data(), static_cast<tvm_u32>(scratch.size()), opt.verbose};
  Machine machine(cfg);
  if (!machine.ok())
    return TVM_ERR(InvalidArg);
  if (opt.panic_handler)
    machine.set_panic_handler(opt.panic_handler, opt.panic_user_data);

  if (opt.verbose)
    printf("[tvm] %s: call %s (%s)\n", contract.name.c_str(), fn->signature.c_str(),
           selector.c_str());

  if (tvm_err e = machine.run(fn->program))
    return e;

  std::vector<ReturnValue> returns;
  returns.reserve(fn->returns.size());
  for (TypeName type : fn->returns)
  {
    tvm_word w;
    if (tvm_err e = machine.pop(&w))
      return vm_panic(machine.get(), e);
    returns.push_back(decode_return(type, w));
  }

  if (is_state_mutating(fn->mutability))
    out->contract.storage = std::move(scratch);
  out->returns = std::move(returns);
  return TVM_ERR(OK);
}

tvm_err call_signature(const Contract &contract, const std::string &signature,
                       CallResult *out, const CallOptions *options)
{
  return call(contract, selector_of(signature), out, options);
}

}  // namespace tvm
