#include "tvm/bytecode.hpp"

#include <cstdio>

#include "tvm/errors.hpp"

namespace tvm
{

tvm_err encode(const Program &program, std::vector<uint8_t> *out)
{
  if (!out)
    return TVM_ERR(InvalidArg);

  for (const tvm_instr &in : program)
  {
    const PrimitiveEntry *e = find_primitive(in.op);
    if (!e)
      return TVM_ERR(UnknownOp);

    out->push_back(in.op);
    switch (e->kind)
    {
      case PrimKind::NoImm:
        break;
      case PrimKind::Imm8:
        out->push_back(static_cast<uint8_t>(in.imm.limb[0] & 0xFF));
        break;
      case PrimKind::Imm256:
      {
        uint8_t be[TVM_WORD_BYTES];
        tvm_word_to_be_bytes(&in.imm, be);
        out->insert(out->end(), be, be + TVM_WORD_BYTES);
        break;
      }
    }
  }
  return TVM_ERR(OK);
}

tvm_err decode(const uint8_t *bytes, std::size_t len, Program *out)
{
  if (!out || (!bytes && len > 0))
    return TVM_ERR(InvalidArg);

  std::size_t i = 0;
  while (i < len)
  {
    const PrimitiveEntry *e = find_primitive(bytes[i]);
    if (!e)
      return TVM_ERR(UnknownOp);

    tvm_instr in = instr(static_cast<Op>(bytes[i]));
    i++;

    switch (e->kind)
    {
      case PrimKind::NoImm:
        break;
      case PrimKind::Imm8:
        if (i + 1 > len)
          return TVM_ERR(TruncatedImmediate);
        in.imm = tvm_word_from_u64(bytes[i]);
        i += 1;
        break;
      case PrimKind::Imm256:
        if (i + TVM_WORD_BYTES > len)
          return TVM_ERR(TruncatedImmediate);
        tvm_word_from_be_bytes(&in.imm, bytes + i);
        i += TVM_WORD_BYTES;
        break;
    }
    out->push_back(in);
  }
  return TVM_ERR(OK);
}

std::string to_string(const tvm_instr &in)
{
  const Op op = static_cast<Op>(in.op);
  std::string s = op_name(op);

  if (op == Op::PUSH_BYTE)
  {
    char buf[8];
    snprintf(buf, sizeof(buf), " 0x%02x", static_cast<unsigned>(in.imm.limb[0] & 0xFF));
    s += buf;
  }
  else if (op == Op::PUSH_WORD)
  {
    char hex[TVM_WORD_HEX_LEN];
    tvm_word_to_hex(&in.imm, hex);
    s += ' ';
    s += hex;
  }
  return s;
}

std::string disassemble(const Program &program)
{
  std::string out;
  for (const tvm_instr &in : program)
  {
    out += to_string(in);
    out += '\n';
  }
  return out;
}

}  // namespace tvm
