// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <flowcore/algorithms/contraction.hpp>
#include <flowcore/algorithms/kernels.hpp>
#include <flowcore/data/operand.hpp>
#include <flowcore/data/reference_state.hpp>
#include <flowcore/data/settings.hpp>
#include <flowcore/data/tensor.hpp>
#include <flowcore/utils/logger.hpp>
#include <flowcore/utils/omp_utils.hpp>
