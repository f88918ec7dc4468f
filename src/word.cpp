#include "tvm/word.h"

extern "C" void tvm_word_from_be_bytes(tvm_word *out, const uint8_t *bytes)
{
  // bytes[0] is the most significant byte of limb[3]
  for (int l = 0; l < TVM_WORD_LIMBS; ++l)
  {
    const uint8_t *p = bytes + (TVM_WORD_LIMBS - 1 - l) * 8;
    uint64_t v = 0;
    for (int i = 0; i < 8; ++i)
      v = (v << 8) | p[i];
    out->limb[l] = v;
  }
}

extern "C" void tvm_word_to_be_bytes(const tvm_word *w, uint8_t *out)
{
  for (int l = 0; l < TVM_WORD_LIMBS; ++l)
  {
    uint8_t *p = out + (TVM_WORD_LIMBS - 1 - l) * 8;
    uint64_t v = w->limb[l];
    for (int i = 7; i >= 0; --i)
    {
      p[i] = (uint8_t)(v & 0xFF);
      v >>= 8;
    }
  }
}

extern "C" void tvm_word_to_hex(const tvm_word *w, char *out)
{
  static const char kDigits[] = "0123456789abcdef";
  uint8_t be[TVM_WORD_BYTES];
  tvm_word_to_be_bytes(w, be);

  out[0] = '0';
  out[1] = 'x';
  for (int i = 0; i < TVM_WORD_BYTES; ++i)
  {
    out[2 + 2 * i] = kDigits[be[i] >> 4];
    out[3 + 2 * i] = kDigits[be[i] & 0x0F];
  }
  out[TVM_WORD_HEX_LEN - 1] = '\0';
}
