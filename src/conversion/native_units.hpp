/**
 * @file        native_units.hpp
 * @brief       Conversions with the exponent fixed to the native and stablecoin scales.
 * @version     1.0
 * @date        2025-06-02
 * @copyright   Copyright (c) 2025
 */

#ifndef SAFEMATH_NATIVE_UNITS_HPP
#define SAFEMATH_NATIVE_UNITS_HPP

#include <string>
#include "conversion/double_boundary.hpp"

namespace safemath
{
    /**
     * @class       NativeUnits
     * @brief       Native token amounts, 10^18 base units per display unit.
     */
    class NativeUnits
    {
    public:
        static constexpr uint64_t EXPONENT = NATIVE_EXPONENT;

        static outcome::result<double> ToDisplay( const BigInt &units );
        static outcome::result<double> ToDisplay( const NullableBigInt &units );

        static outcome::result<double> ToDisplayOptimized( const BigInt &units );
        static outcome::result<double> ToDisplayOptimized( const NullableBigInt &units );

        static outcome::result<double> ToDisplaySafe( const BigInt &units );
        static outcome::result<double> ToDisplaySafe( const NullableBigInt &units );

        /**
         * @brief       Strict conversion of a display amount to base units.
         *
         * A fraction of half a base unit or more dropped by the truncation is
         * PRECISION_LOSS.
         *
         * @param[in]   amount Display amount.
         * @return      Base units, or the errors of DoubleBoundary::FromDouble.
         */
        static outcome::result<BigInt> FromDisplay( double amount );

        static std::string Format( const BigInt &units, uint32_t digits );
        static std::string Format( const NullableBigInt &units, uint32_t digits );

        static BigInt ToWholeUnits( const BigInt &units );
        static BigInt ToWholeUnits( const NullableBigInt &units );
    };

    /**
     * @class       StablecoinUnits
     * @brief       Stablecoin amounts, 10^14 base units per display unit.
     */
    class StablecoinUnits
    {
    public:
        static constexpr uint64_t EXPONENT = STABLECOIN_EXPONENT;

        /// Clamping conversion; negative, NaN and infinite amounts give zero
        static BigInt FromFloat( double amount );

        static BigInt FromFloatPercent( double percent );

        static BigInt ToWholeUnits( const BigInt &units );

        static outcome::result<double> ToDisplay( const BigInt &units );
    };
} // namespace safemath

#endif // SAFEMATH_NATIVE_UNITS_HPP
