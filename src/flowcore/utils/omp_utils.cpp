// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <flowcore/config.hpp>
#include <flowcore/utils/omp_utils.hpp>

#ifndef FLOWCORE_ENABLE_OPENMP

extern "C" {

int omp_get_max_threads() { return 1; }
}

#endif

namespace flowcore::utils {

int resolve_num_threads(int requested) {
  if (requested > 0) {
    return requested;
  }
  int available = omp_get_max_threads();
  return available > 0 ? available : 1;
}

}  // namespace flowcore::utils
