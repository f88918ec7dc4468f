#pragma once

/**
 * @file errors.h
 * @brief tvm error codes for C
 *
 * C-compatible error code definitions generated from errors.def
 */

#ifdef __cplusplus
extern "C"
{
#endif

  /* Generate error code constants from errors.def */
#define ERR(name, val, msg) static const int TVM_ERR_##name = val;
#include "tvm/errors.def"
#undef ERR

#ifdef __cplusplus
}
#endif
