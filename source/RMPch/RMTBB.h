#pragma once

// includes the used parts of oneTBB and suppresses warnings there

#define TBB_SUPPRESS_DEPRECATED_MESSAGES 1
#if __GNUC__ <= 14
#define __TBB_USE_CONSTRAINTS 0
#endif
#pragma warning(push)
#pragma warning(disable: 4459) //declaration of 'compare' hides global declaration
#pragma warning(disable: 4464) //relative include path contains '..'
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#pragma warning(pop)
