//===----------------------------------------------------------------------===//
//                         ExtSort
//
// extsort.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "extsort/common/error_data.hpp"
#include "extsort/common/exception.hpp"
#include "extsort/common/file_system.hpp"
#include "extsort/logging/log_manager.hpp"
#include "extsort/logging/log_storage.hpp"
#include "extsort/logging/logger.hpp"
#include "extsort/sort/external_sort_config.hpp"
#include "extsort/sort/external_sorter.hpp"
#include "extsort/sort/push_external_sorter.hpp"
#include "extsort/sort/sort_codec.hpp"
#include "extsort/sort/sort_comparator.hpp"
#include "extsort/sort/sorted_iterator.hpp"
