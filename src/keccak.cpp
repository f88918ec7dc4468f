#include "tvm/keccak.h"

#include <nettle/sha3.h>

#include <cstring>

// nettle only ships the FIPS-202 SHA3 padding; the Keccak-f[1600]
// permutation itself is public, so the sponge is driven here with the
// original Keccak domain byte.

static const size_t kRate = SHA3_256_BLOCK_SIZE;  // 136 bytes
static const uint8_t kKeccakPad = 0x01;

static inline uint64_t ld_le64(const uint8_t *p)
{
  uint64_t v = 0;
  for (int i = 7; i >= 0; --i)
    v = (v << 8) | p[i];
  return v;
}

static inline void st_le64(uint8_t *p, uint64_t v)
{
  for (int i = 0; i < 8; ++i)
  {
    p[i] = (uint8_t)(v & 0xFF);
    v >>= 8;
  }
}

static void absorb_block(struct sha3_state *st, const uint8_t *block)
{
  for (size_t i = 0; i < kRate / 8; ++i)
    st->a[i] ^= ld_le64(block + 8 * i);
  sha3_permute(st);
}

extern "C" void tvm_keccak256(const uint8_t *data, size_t len, uint8_t *out)
{
  struct sha3_state st;
  memset(&st, 0, sizeof(st));

  while (len >= kRate)
  {
    absorb_block(&st, data);
    data += kRate;
    len -= kRate;
  }

  // Final block: message tail, domain byte, closing bit at the end of the rate
  uint8_t last[kRate];
  memset(last, 0, sizeof(last));
  if (len > 0)
    memcpy(last, data, len);
  last[len] ^= kKeccakPad;
  last[kRate - 1] ^= 0x80;
  absorb_block(&st, last);

  for (size_t i = 0; i < TVM_KECCAK256_DIGEST_SIZE / 8; ++i)
    st_le64(out + 8 * i, st.a[i]);
}
