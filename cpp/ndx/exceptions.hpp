#pragma once

/**
 * @file exceptions.hpp
 * @brief Definitions of the exceptions for `ndx` module.
 */

#include <base/exception.hpp>
#include <base/format.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace ndx {

class exception : public base::exception
{
public:
    exception(std::string&& what, params_t&& params)
        : base::exception(std::move(what), std::move(params))
    {
    }

    explicit exception(std::string&& what)
        : base::exception(std::move(what))
    {
    }
};

/**
 * @brief Element count or arity mismatch: reshape, construction, concatenation, index arity.
 */
class shape_error : public exception
{
public:
    explicit shape_error(std::string&& what)
        : exception(std::move(what))
    {
    }

    shape_error(std::string&& what, params_t&& params)
        : exception(std::move(what), std::move(params))
    {
    }
};

class index_error : public exception
{
public:
    index_error(int64_t index, int64_t axis, int64_t size)
        : exception(size == 0 ? fmt::format("Cannot index axis {} of extent 0 with index {}", axis, index)
                              : fmt::format("Index {} is out of bounds for axis {} with size {}", index, axis, size),
                    {{"index", std::to_string(index)}, {"axis", std::to_string(axis)}, {"size", std::to_string(size)}})
    {
    }

    explicit index_error(std::string&& what)
        : exception(std::move(what))
    {
    }
};

class broadcast_error : public exception
{
public:
    broadcast_error(const std::string& first, const std::string& second)
        : exception(fmt::format("Shapes {} and {} cannot be broadcast together", first, second),
                    {{"first", first}, {"second", second}})
    {
    }

    broadcast_error(std::string&& what, params_t&& params)
        : exception(std::move(what), std::move(params))
    {
    }
};

/**
 * @brief The operation requires inputs of a different rank or matching inner dimensions.
 */
class dimension_error : public exception
{
public:
    explicit dimension_error(std::string&& what)
        : exception(std::move(what))
    {
    }

    dimension_error(std::string&& what, params_t&& params)
        : exception(std::move(what), std::move(params))
    {
    }
};

class unsupported_rank_error : public exception
{
public:
    unsupported_rank_error(std::string_view operation, int64_t first, int64_t second)
        : exception(fmt::format("Unsupported ranks for {}: {}D and {}D", operation, first, second),
                    {{"operation", std::string(operation)},
                     {"first", std::to_string(first)},
                     {"second", std::to_string(second)}})
    {
    }
};

class singular_matrix_error : public exception
{
public:
    singular_matrix_error(int64_t row, double pivot)
        : exception(fmt::format("Matrix is singular: pivot {} at row {} is too small", pivot, row),
                    {{"row", std::to_string(row)}, {"pivot", fmt::format("{}", pivot)}})
    {
    }
};

class unsupported_dtype_error : public exception
{
public:
    unsupported_dtype_error(std::string_view dtype, std::string_view operation)
        : exception(fmt::format("Dtype {} is not supported by {}", dtype, operation),
                    {{"dtype", std::string(dtype)}, {"operation", std::string(operation)}})
    {
    }

    explicit unsupported_dtype_error(std::string_view name)
        : exception(fmt::format("Unknown dtype: {}", name), {{"dtype", std::string(name)}})
    {
    }
};

/**
 * @brief A scalar argument is outside of the domain of the operation.
 */
class invalid_argument : public exception
{
public:
    explicit invalid_argument(std::string&& what)
        : exception(std::move(what))
    {
    }
};

} // namespace ndx
