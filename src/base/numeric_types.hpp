/**
 * @file        numeric_types.hpp
 * @brief       Arbitrary-precision number types shared by the conversion engine.
 * @version     1.0
 * @date        2025-06-02
 * @copyright   Copyright (c) 2025
 */

#ifndef SAFEMATH_NUMERIC_TYPES_HPP
#define SAFEMATH_NUMERIC_TYPES_HPP

#include <cstdint>
#include <boost/multiprecision/cpp_int.hpp>
#include <boost/multiprecision/cpp_bin_float.hpp>
#include <boost/multiprecision/rational_adaptor.hpp>

namespace safemath
{
    /// Unbounded signed integer holding scaled amounts
    using BigInt = boost::multiprecision::cpp_int;

    /// Exact quotient of two BigInt values
    using BigRational = boost::multiprecision::cpp_rational;

    /// Arbitrary-precision float used as the transit format between BigInt and double
    using BigFloat = boost::multiprecision::number<
        boost::multiprecision::cpp_bin_float<256, boost::multiprecision::digit_base_2>,
        boost::multiprecision::et_off>;

    /// Decimal places of native token units (10^18 units per display unit)
    static constexpr uint64_t NATIVE_EXPONENT = 18;

    /// Decimal places used by stablecoin amounts
    static constexpr uint64_t STABLECOIN_EXPONENT = 14;
} // namespace safemath

#endif // SAFEMATH_NUMERIC_TYPES_HPP
