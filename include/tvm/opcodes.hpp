#pragma once
#include <cstddef>
#include <cstdint>

namespace tvm
{

/** Opcode set (single byte). See opcodes.def for the numeric values. */
enum class Op : std::uint8_t
{
#define OP(name, val, _) name = val,
#include "tvm/opcodes.def"
#undef OP
};

// -----------------------------------------------------------------------------
// Immediate kind classification for table-driven encode/decode
// -----------------------------------------------------------------------------
enum class PrimKind : uint8_t
{
  NoImm,   // e.g., POP, LOAD, RETURN
  Imm8,    // PUSH_BYTE imm8
  Imm256,  // PUSH_WORD imm256 (big-endian on the wire)
};

struct PrimitiveEntry
{
  const char *name;
  uint8_t opcode;
  PrimKind kind;
};

#define PRIM_KIND_NO_IMM PrimKind::NoImm
#define PRIM_KIND_IMM8 PrimKind::Imm8
#define PRIM_KIND_IMM256 PrimKind::Imm256

static constexpr PrimitiveEntry kPrimitiveTable[] = {
#define OP(name, val, kind) {#name, val, PRIM_KIND_##kind},
#include "tvm/opcodes.def"
#undef OP
};

static constexpr std::size_t kPrimitiveCount = sizeof(kPrimitiveTable) / sizeof(kPrimitiveTable[0]);

/**
 * @brief Look up the table entry for an opcode byte.
 * @return Entry pointer, or nullptr if the byte is not an opcode.
 */
inline const PrimitiveEntry *find_primitive(uint8_t opcode)
{
  for (std::size_t i = 0; i < kPrimitiveCount; ++i)
  {
    if (kPrimitiveTable[i].opcode == opcode)
      return &kPrimitiveTable[i];
  }
  return nullptr;
}

/** Mnemonic for an opcode, "???" for bytes outside the table. */
inline const char *op_name(Op op)
{
  const PrimitiveEntry *e = find_primitive(static_cast<uint8_t>(op));
  return e ? e->name : "???";
}

}  // namespace tvm
