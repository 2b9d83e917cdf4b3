#pragma once

#include "RMSuppressWarning.h"

RM_SUPPRESS_WARNING_PUSH
#if defined(__clang__) && __clang_major__ >= 21
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
#endif

#include <parallel_hashmap/phmap_config.h>
#ifdef __aarch64__
// force on Clang for ABI compatibility with GCC:
// https://github.com/greg7mdp/parallel-hashmap/issues/289
#undef PHMAP_HAVE_INTRINSIC_INT128
#define PHMAP_HAVE_INTRINSIC_INT128 1
#endif
#include <parallel_hashmap/phmap.h>

RM_SUPPRESS_WARNING_POP
