#pragma once
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C"
{
#endif

#define TVM_KECCAK256_DIGEST_SIZE 32

  /**
   * @brief Hash primitive used for selector derivation.
   *
   * Writes a TVM_KECCAK256_DIGEST_SIZE byte digest of data[0..len) to out.
   */
  typedef void (*tvm_hash_fn)(const uint8_t *data, size_t len, uint8_t *out);

  /**
   * @brief Keccak-256 as used by Ethereum (original Keccak padding, not
   *        FIPS-202 SHA3-256).
   * @param data  Input bytes (can be NULL when len is 0).
   * @param len   Number of input bytes.
   * @param out   32-byte digest buffer.
   */
  void tvm_keccak256(const uint8_t *data, size_t len, uint8_t *out);

#ifdef __cplusplus
}
#endif
