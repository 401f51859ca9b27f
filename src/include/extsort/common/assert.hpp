//===----------------------------------------------------------------------===//
//                         ExtSort
//
// extsort/common/assert.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "extsort/common/constants.hpp"

namespace extsort {
EXTSORT_API void ExtSortAssertInternal(bool condition, const char *condition_name, const char *file, int linenr);
} // namespace extsort

#if (defined(EXTSORT_USE_STANDARD_ASSERT) || !defined(DEBUG)) && !defined(EXTSORT_FORCE_ASSERT)

#include <assert.h>
#define D_ASSERT assert

#else

#define D_ASSERT(condition) extsort::ExtSortAssertInternal(bool(condition), #condition, __FILE__, __LINE__)

#endif
