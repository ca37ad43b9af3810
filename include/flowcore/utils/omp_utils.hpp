// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <flowcore/config.hpp>

#ifdef FLOWCORE_ENABLE_OPENMP
#include <omp.h>
#else

extern "C" {

/**
 * @brief Fallback replacement for `omp_get_max_threads` for when flowcore is
 * built without OpenMP bindings.
 *
 * See https://www.openmp.org/spec-html/5.0/openmpsu112.html for details
 *
 * @returns 1
 */
int omp_get_max_threads();
}

#endif  // FLOWCORE_ENABLE_OPENMP

namespace flowcore::utils {

/**
 * @brief Resolve a requested thread count to the count a parallel region
 * should use
 *
 * @param requested Requested number of threads; 0 selects the OpenMP runtime
 * default (`omp_get_max_threads()`)
 * @return Number of threads, at least 1
 */
int resolve_num_threads(int requested);

}  // namespace flowcore::utils
