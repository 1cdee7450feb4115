/**
 * @file        double_boundary.hpp
 * @brief       Narrowing of scaled integers into machine doubles with loss detection.
 * @version     1.0
 * @date        2025-06-02
 * @copyright   Copyright (c) 2025
 */

#ifndef SAFEMATH_DOUBLE_BOUNDARY_HPP
#define SAFEMATH_DOUBLE_BOUNDARY_HPP

#include "base/numeric_types.hpp"
#include "conversion/conversion_error.hpp"
#include "numeric/NullableBigInt.hpp"

namespace safemath
{
    /**
     * @brief       Position of a rounded double relative to the exact value.
     */
    enum class Accuracy
    {
        Below = -1, ///< the double is smaller than the exact value
        Exact = 0,
        Above = 1, ///< the double is larger than the exact value
    };

    struct NarrowResult
    {
        double   value;
        Accuracy accuracy;
    };

    /**
     * @brief       Round to the nearest double (ties to even) and classify the rounding.
     * @param[in]   value Exact intermediate.
     * @return      Rounded double and its accuracy.
     */
    NarrowResult Narrow( const BigFloat &value );

    /**
     * @brief       Strategy used when narrowing to double.
     */
    enum class ConversionMode
    {
        Balanced,  ///< always through BigFloat
        Optimized, ///< machine division when the operands fit 64 bits
        Safe,      ///< rejects values above 2^53 whole units first
    };

    class DoubleBoundary
    {
    public:
        /// Smallest non-zero result accepted from the optimized machine division
        static constexpr double OPTIMIZED_FLOOR = 1e-17;

        /// Largest exponent whose factor fits a signed 64-bit integer
        static constexpr uint64_t OPTIMIZED_MAX_EXPONENT = 18;

        /// 2^53, the largest count of whole units the safe mode accepts
        static constexpr uint64_t SAFE_WHOLE_UNIT_LIMIT = 9007199254740992ULL;

        /**
         * @brief       Balanced conversion of value / 10^exponent to double.
         *
         * A double that rounded above the exact value is PRECISION_LOSS; rounding
         * below is accepted.
         *
         * @param[in]   value    Scaled integer.
         * @param[in]   exponent Number of decimal places.
         * @return      Display amount, NEGATIVE_INPUT or PRECISION_LOSS.
         */
        static outcome::result<double> ToDouble( const BigInt &value, uint64_t exponent );

        /**
         * @brief       Null-aware variant; the null state is NULL_INPUT.
         */
        static outcome::result<double> ToDouble( const NullableBigInt &value, uint64_t exponent );

        /**
         * @brief       Machine division for operands that fit 64 bits, Balanced otherwise.
         *
         * A non-zero machine result below OPTIMIZED_FLOOR is PRECISION_LOSS.
         */
        static outcome::result<double> ToDoubleOptimized( const BigInt &value, uint64_t exponent );

        static outcome::result<double> ToDoubleOptimized( const NullableBigInt &value, uint64_t exponent );

        /**
         * @brief       Balanced conversion that first rejects values above 2^53 * 10^exponent.
         */
        static outcome::result<double> ToDoubleSafe( const BigInt &value, uint64_t exponent );

        static outcome::result<double> ToDoubleSafe( const NullableBigInt &value, uint64_t exponent );

        /**
         * @brief       Dispatch to the conversion named by @p mode.
         */
        static outcome::result<double> ToDouble( const BigInt &value, uint64_t exponent, ConversionMode mode );

        static outcome::result<double> ToDouble( const NullableBigInt &value,
                                                 uint64_t              exponent,
                                                 ConversionMode        mode );

        /**
         * @brief       Strict conversion of a display amount into a scaled integer.
         * @param[in]   value    Display amount.
         * @param[in]   exponent Number of decimal places.
         * @return      trunc(value * 10^exponent), PRECISION_LOSS for NaN or infinity,
         *              NEGATIVE_INPUT for negative input.
         */
        static outcome::result<BigInt> FromDouble( double value, uint64_t exponent );
    };
} // namespace safemath

#endif // SAFEMATH_DOUBLE_BOUNDARY_HPP
