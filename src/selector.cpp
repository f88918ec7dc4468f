#include "tvm/selector.hpp"

#include <cstdint>

#include "tvm/errors.hpp"

namespace tvm
{

tvm_err canonical_signature(const ast::FunctionDef &fn, std::string *out)
{
  if (!out)
    return TVM_ERR(InvalidArg);

  if (fn.params.size() > 1)
    return TVM_ERR(UnsupportedConstruct);

  std::string sig = fn.name;
  sig += '(';
  if (!fn.params.empty())
  {
    if (fn.params[0].type != ast::TypeName::Bool)
      return TVM_ERR(UnsupportedType);
    sig += ast::type_name_str(fn.params[0].type);
  }
  sig += ')';

  *out = sig;
  return TVM_ERR(OK);
}

std::string selector_of(const std::string &signature, tvm_hash_fn hash)
{
  static const char kDigits[] = "0123456789abcdef";

  if (!hash)
    hash = tvm_keccak256;

  uint8_t digest[TVM_KECCAK256_DIGEST_SIZE];
  hash(reinterpret_cast<const uint8_t *>(signature.data()), signature.size(), digest);

  std::string out;
  out.reserve(kSelectorHexLen);
  for (std::size_t i = 0; i < kSelectorHexLen / 2; ++i)
  {
    out += kDigits[digest[i] >> 4];
    out += kDigits[digest[i] & 0x0F];
  }
  return out;
}

}  // namespace tvm
