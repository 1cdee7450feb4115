/**
 * @file        decimal_bridge.hpp
 * @brief       Precision-preserving conversions between scaled integers and BigFloat.
 * @version     1.0
 * @date        2025-06-02
 * @copyright   Copyright (c) 2025
 */

#ifndef SAFEMATH_DECIMAL_BRIDGE_HPP
#define SAFEMATH_DECIMAL_BRIDGE_HPP

#include <string>
#include <string_view>
#include "base/numeric_types.hpp"
#include "conversion/conversion_error.hpp"
#include "numeric/NullableBigInt.hpp"

namespace safemath
{
    /**
     * @class       DecimalBridge
     * @brief       Moves scaled integers in and out of the BigFloat intermediate.
     *
     * None of these operations fail. Inbound conversions clamp what they cannot
     * represent to zero; failures are reported one level up by DoubleBoundary.
     */
    class DecimalBridge
    {
    public:
        /// Formatting never produces more fractional digits than this
        static constexpr uint32_t MAX_FORMAT_DIGITS = 100;

        /// Default relative deviation above which FromFloat logs a warning (0.1 %)
        static constexpr double DEFAULT_PRECISION_WARNING_RATIO = 0.001;

        /**
         * @brief       Divide a scaled integer by 10^exponent.
         * @param[in]   value    Scaled integer; the sign is preserved.
         * @param[in]   exponent Number of decimal places.
         * @return      value / 10^exponent.
         */
        static BigFloat ToBigFloat( const BigInt &value, uint64_t exponent );

        /**
         * @brief       Null-aware variant; the null state maps to zero.
         */
        static BigFloat ToBigFloat( const NullableBigInt &value, uint64_t exponent );

        /**
         * @brief       A display amount shifted by 10^exponent and split at the decimal point.
         */
        struct ScaledAmount
        {
            BigInt   units;   ///< truncated product
            BigFloat dropped; ///< discarded fraction of one unit, in [0, 1)
        };

        /**
         * @brief       Multiply a double by 10^exponent in decimal.
         *
         * The double is taken at its shortest round-trip decimal text, so the
         * shift is exact. Negative, NaN and infinite inputs give zero.
         *
         * @param[in]   value    Display amount.
         * @param[in]   exponent Number of decimal places.
         * @return      Truncated product and the fraction it dropped.
         */
        static ScaledAmount Scale( double value, uint64_t exponent );

        /**
         * @brief       Convert a display amount to a scaled integer, truncating the fraction.
         *
         * Negative, NaN and infinite inputs give zero. A truncation that moves the
         * value by more than the warning ratio is logged, and the result is still
         * returned.
         *
         * @param[in]   value    Display amount.
         * @param[in]   exponent Number of decimal places.
         * @return      trunc(value * 10^exponent).
         */
        static BigInt FromFloat( double value, uint64_t exponent );

        /**
         * @brief       Like FromFloat, multiplying in machine arithmetic when exponent <= 14
         *              and the product fits a signed 64-bit integer.
         */
        static BigInt FromFloatFast( double value, uint64_t exponent );

        /**
         * @brief       FromFloatFast result divided by 100, for percentages.
         */
        static BigInt FromFloatPercent( double value, uint64_t exponent );

        /**
         * @brief       Whole display units held by a scaled integer.
         * @param[in]   value    Scaled integer.
         * @param[in]   exponent Number of decimal places.
         * @return      value / 10^exponent, or zero for negative or null input.
         */
        static BigInt ToWholeUnits( const BigInt &value, uint64_t exponent );

        static BigInt ToWholeUnits( const NullableBigInt &value, uint64_t exponent );

        /**
         * @brief       Strict base-10 parse of a scaled integer.
         * @param[in]   text Digits with optional sign.
         * @return      Parsed value or ConversionError::INVALID_TEXT, also for empty text.
         */
        static outcome::result<BigInt> ParseInteger( std::string_view text );

        /**
         * @brief       Render value / 10^exponent with at most @p digits fractional digits.
         *
         * The value is rounded half to even at the last requested digit. Trailing
         * zeros are removed, keeping one zero after the point. Zero digits render
         * without a point. Negative values render as "0".
         *
         * @param[in]   value    Scaled integer.
         * @param[in]   exponent Number of decimal places.
         * @param[in]   digits   Requested fractional digits, clamped to MAX_FORMAT_DIGITS.
         * @return      Decimal text.
         */
        static std::string FormatDecimal( const BigInt &value, uint64_t exponent, uint32_t digits );

        /**
         * @brief       Null-aware variant; the null state renders as "0".
         */
        static std::string FormatDecimal( const NullableBigInt &value, uint64_t exponent, uint32_t digits );

        static void SetPrecisionWarningRatio( double ratio );

        static double PrecisionWarningRatio();
    };
} // namespace safemath

#endif // SAFEMATH_DECIMAL_BRIDGE_HPP
