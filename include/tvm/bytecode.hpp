#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "tvm/opcodes.hpp"
#include "tvm/vm_api.h"

/** Instructions compare equal when opcode and payload match. */
inline bool operator==(const tvm_instr &a, const tvm_instr &b)
{
  return a.op == b.op && a.imm == b.imm;
}

inline bool operator!=(const tvm_instr &a, const tvm_instr &b)
{
  return !(a == b);
}

namespace tvm
{

/** Straight-line program: one entry per instruction, executed in order. */
using Program = std::vector<tvm_instr>;

// -----------------------------------------------------------------------------
// Instruction builders
// -----------------------------------------------------------------------------
inline tvm_instr instr(Op op)
{
  tvm_instr in{};
  in.op = static_cast<tvm_u8>(op);
  in.imm = tvm_word_zero();
  return in;
}

inline tvm_instr push_byte(uint8_t v)
{
  tvm_instr in = instr(Op::PUSH_BYTE);
  in.imm = tvm_word_from_u64(v);
  return in;
}

inline tvm_instr push_word(const tvm_word &w)
{
  tvm_instr in = instr(Op::PUSH_WORD);
  in.imm = w;
  return in;
}

// -----------------------------------------------------------------------------
// Wire format
// -----------------------------------------------------------------------------

/**
 * @brief Serialize a program to bytes.
 *
 * Each instruction is its opcode byte followed by its immediate:
 * one byte for PUSH_BYTE, 32 big-endian bytes for PUSH_WORD.
 *
 * @param program  Program to encode.
 * @param out      Destination; bytes are appended.
 * @return 0 on success, UnknownOp if an instruction tag is not an opcode.
 */
tvm_err encode(const Program &program, std::vector<uint8_t> *out);

/**
 * @brief Parse bytes produced by encode().
 * @param bytes  Encoded program.
 * @param len    Number of bytes.
 * @param out    Destination; instructions are appended.
 * @return 0 on success, UnknownOp or TruncatedImmediate on malformed input.
 */
tvm_err decode(const uint8_t *bytes, std::size_t len, Program *out);

// -----------------------------------------------------------------------------
// Disassembly
// -----------------------------------------------------------------------------

/** "PUSH_BYTE 0x00", "PUSH_WORD 0x...", or the bare mnemonic. */
std::string to_string(const tvm_instr &in);

/** One instruction per line, each terminated by '\n'. */
std::string disassemble(const Program &program);

}  // namespace tvm
