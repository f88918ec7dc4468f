#pragma once
#include <stddef.h>
#include <stdint.h>

/**
 * @file word.h
 * @brief 256-bit machine word
 *
 * The only value type the VM manipulates. Stored as four 64-bit limbs,
 * least significant limb first. Storage slots, stack entries and PUSH_WORD
 * immediates are all tvm_word.
 *
 * SPDX-License-Identifier: MIT OR Apache-2.0
 */

#ifdef __cplusplus
extern "C"
{
#endif

#define TVM_WORD_LIMBS 4
#define TVM_WORD_BYTES 32
/** "0x" + 64 hex digits + NUL */
#define TVM_WORD_HEX_LEN 67

  typedef struct tvm_word
  {
    uint64_t limb[TVM_WORD_LIMBS]; /**< limb[0] is least significant */
  } tvm_word;

  static inline tvm_word tvm_word_from_u64(uint64_t v)
  {
    tvm_word w = {{v, 0, 0, 0}};
    return w;
  }

  static inline tvm_word tvm_word_zero(void)
  {
    return tvm_word_from_u64(0);
  }

  static inline int tvm_word_is_zero(const tvm_word *w)
  {
    return (w->limb[0] | w->limb[1] | w->limb[2] | w->limb[3]) == 0;
  }

  static inline int tvm_word_eq(const tvm_word *a, const tvm_word *b)
  {
    return a->limb[0] == b->limb[0] && a->limb[1] == b->limb[1] &&
           a->limb[2] == b->limb[2] && a->limb[3] == b->limb[3];
  }

  /* Narrow to 64 bits. Returns 0 and writes *out if the value fits, -1 otherwise. */
  static inline int tvm_word_to_u64(const tvm_word *w, uint64_t *out)
  {
    if (w->limb[1] | w->limb[2] | w->limb[3])
      return -1;
    *out = w->limb[0];
    return 0;
  }

  /**
   * @brief Decode 32 big-endian bytes into a word.
   * @param out    Destination word.
   * @param bytes  Exactly TVM_WORD_BYTES bytes, most significant first.
   */
  void tvm_word_from_be_bytes(tvm_word *out, const uint8_t *bytes);

  /**
   * @brief Encode a word as 32 big-endian bytes.
   * @param w    Source word.
   * @param out  Destination buffer of TVM_WORD_BYTES bytes.
   */
  void tvm_word_to_be_bytes(const tvm_word *w, uint8_t *out);

  /**
   * @brief Render a word as "0x" followed by 64 lowercase hex digits.
   * @param w    Source word.
   * @param out  Destination buffer of at least TVM_WORD_HEX_LEN chars.
   */
  void tvm_word_to_hex(const tvm_word *w, char *out);

#ifdef __cplusplus
}  // extern "C"

inline bool operator==(const tvm_word &a, const tvm_word &b)
{
  return tvm_word_eq(&a, &b) != 0;
}

inline bool operator!=(const tvm_word &a, const tvm_word &b)
{
  return !(a == b);
}
#endif
