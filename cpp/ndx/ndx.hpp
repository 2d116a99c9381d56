#pragma once

/**
 * @defgroup ndx
 * @{
 * @brief ndx module.
 *
 * N-dimensional arrays with a fixed set of numeric dtypes, elementwise operations, reductions, linear algebra
 * and random sampling.
 *
 * @}
 */

#include "arithmetic.hpp"
#include "array.hpp"
#include "broadcast.hpp"
#include "combine.hpp"
#include "comparison.hpp"
#include "config.hpp"
#include "dtype.hpp"
#include "exceptions.hpp"
#include "format.hpp"
#include "generators.hpp"
#include "json_adapt.hpp"
#include "linalg/linalg.hpp"
#include "math.hpp"
#include "random/generator.hpp"
#include "statistics.hpp"
#include "transform.hpp"
