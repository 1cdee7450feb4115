/**
 * @file        native_units.cpp
 * @brief       Conversions with the exponent fixed to the native and stablecoin scales.
 * @version     1.0
 * @date        2025-06-02
 * @copyright   Copyright (c) 2025
 */

#include "conversion/native_units.hpp"
#include "conversion/decimal_bridge.hpp"

namespace safemath
{
    outcome::result<double> NativeUnits::ToDisplay( const BigInt &units )
    {
        return DoubleBoundary::ToDouble( units, EXPONENT );
    }

    outcome::result<double> NativeUnits::ToDisplay( const NullableBigInt &units )
    {
        return DoubleBoundary::ToDouble( units, EXPONENT );
    }

    outcome::result<double> NativeUnits::ToDisplayOptimized( const BigInt &units )
    {
        return DoubleBoundary::ToDoubleOptimized( units, EXPONENT );
    }

    outcome::result<double> NativeUnits::ToDisplayOptimized( const NullableBigInt &units )
    {
        return DoubleBoundary::ToDoubleOptimized( units, EXPONENT );
    }

    outcome::result<double> NativeUnits::ToDisplaySafe( const BigInt &units )
    {
        return DoubleBoundary::ToDoubleSafe( units, EXPONENT );
    }

    outcome::result<double> NativeUnits::ToDisplaySafe( const NullableBigInt &units )
    {
        return DoubleBoundary::ToDoubleSafe( units, EXPONENT );
    }

    outcome::result<BigInt> NativeUnits::FromDisplay( double amount )
    {
        OUTCOME_TRY( auto &&units, DoubleBoundary::FromDouble( amount, EXPONENT ) );

        if ( DecimalBridge::Scale( amount, EXPONENT ).dropped >= BigFloat( 0.5 ) )
        {
            return outcome::failure( ConversionError::PRECISION_LOSS );
        }
        return units;
    }

    std::string NativeUnits::Format( const BigInt &units, uint32_t digits )
    {
        return DecimalBridge::FormatDecimal( units, EXPONENT, digits );
    }

    std::string NativeUnits::Format( const NullableBigInt &units, uint32_t digits )
    {
        return DecimalBridge::FormatDecimal( units, EXPONENT, digits );
    }

    BigInt NativeUnits::ToWholeUnits( const BigInt &units )
    {
        return DecimalBridge::ToWholeUnits( units, EXPONENT );
    }

    BigInt NativeUnits::ToWholeUnits( const NullableBigInt &units )
    {
        return DecimalBridge::ToWholeUnits( units, EXPONENT );
    }

    BigInt StablecoinUnits::FromFloat( double amount )
    {
        return DecimalBridge::FromFloatFast( amount, EXPONENT );
    }

    BigInt StablecoinUnits::FromFloatPercent( double percent )
    {
        return DecimalBridge::FromFloatPercent( percent, EXPONENT );
    }

    BigInt StablecoinUnits::ToWholeUnits( const BigInt &units )
    {
        return DecimalBridge::ToWholeUnits( units, EXPONENT );
    }

    outcome::result<double> StablecoinUnits::ToDisplay( const BigInt &units )
    {
        return DoubleBoundary::ToDouble( units, EXPONENT );
    }
} // namespace safemath
