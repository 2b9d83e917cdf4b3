#pragma once

#ifndef RM_USE_STD_EXPECTED
// `tl::expected` is used by default, `std::expected` needs a C++23 standard library
#define RM_USE_STD_EXPECTED 0
#endif

#if RM_USE_STD_EXPECTED

#include <expected>

#else // !RM_USE_STD_EXPECTED

#ifndef RM_NODISCARD_TL_EXPECTED
// declare tl::expected as nodiscard
#define RM_NODISCARD_TL_EXPECTED 1
#endif

#if RM_NODISCARD_TL_EXPECTED
#include "RMSuppressWarning.h"
RM_SUPPRESS_WARNING_PUSH
RM_SUPPRESS_WARNING( "-Wattributes", 5240 )
namespace tl { template <class T, class E> class [[nodiscard]] expected; }
RM_SUPPRESS_WARNING_POP
#endif

#include <tl/expected.hpp>

#endif
