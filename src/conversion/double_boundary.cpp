/**
 * @file        double_boundary.cpp
 * @brief       Narrowing of scaled integers into machine doubles with loss detection.
 * @version     1.0
 * @date        2025-06-02
 * @copyright   Copyright (c) 2025
 */

#include "conversion/double_boundary.hpp"
#include <cmath>
#include <limits>
#include "conversion/decimal_bridge.hpp"
#include "conversion/scale_cache.hpp"

namespace safemath
{
    NarrowResult Narrow( const BigFloat &value )
    {
        double rounded = value.convert_to<double>();
        int    order   = BigFloat( rounded ).compare( value );
        if ( order > 0 )
        {
            return { rounded, Accuracy::Above };
        }
        if ( order < 0 )
        {
            return { rounded, Accuracy::Below };
        }
        return { rounded, Accuracy::Exact };
    }

    outcome::result<double> DoubleBoundary::ToDouble( const BigInt &value, uint64_t exponent )
    {
        if ( value.sign() < 0 )
        {
            return outcome::failure( ConversionError::NEGATIVE_INPUT );
        }
        auto narrowed = Narrow( DecimalBridge::ToBigFloat( value, exponent ) );
        if ( narrowed.accuracy == Accuracy::Above )
        {
            return outcome::failure( ConversionError::PRECISION_LOSS );
        }
        return narrowed.value;
    }

    outcome::result<double> DoubleBoundary::ToDouble( const NullableBigInt &value, uint64_t exponent )
    {
        if ( value.IsNull() )
        {
            return outcome::failure( ConversionError::NULL_INPUT );
        }
        return ToDouble( *value.Get(), exponent );
    }

    outcome::result<double> DoubleBoundary::ToDoubleOptimized( const BigInt &value, uint64_t exponent )
    {
        if ( value.sign() < 0 )
        {
            return outcome::failure( ConversionError::NEGATIVE_INPUT );
        }
        if ( exponent <= OPTIMIZED_MAX_EXPONENT && value <= std::numeric_limits<int64_t>::max() )
        {
            auto   factor = ScaleCache::GetInstance().Get( exponent ).integer.convert_to<int64_t>();
            double result = static_cast<double>( value.convert_to<int64_t>() ) / static_cast<double>( factor );
            if ( result != 0.0 && result < OPTIMIZED_FLOOR )
            {
                return outcome::failure( ConversionError::PRECISION_LOSS );
            }
            return result;
        }
        return ToDouble( value, exponent );
    }

    outcome::result<double> DoubleBoundary::ToDoubleOptimized( const NullableBigInt &value, uint64_t exponent )
    {
        if ( value.IsNull() )
        {
            return outcome::failure( ConversionError::NULL_INPUT );
        }
        return ToDoubleOptimized( *value.Get(), exponent );
    }

    outcome::result<double> DoubleBoundary::ToDoubleSafe( const BigInt &value, uint64_t exponent )
    {
        if ( value.sign() < 0 )
        {
            return outcome::failure( ConversionError::NEGATIVE_INPUT );
        }
        const auto &factor = ScaleCache::GetInstance().Get( exponent );
        if ( value > factor.integer * SAFE_WHOLE_UNIT_LIMIT )
        {
            return outcome::failure( ConversionError::PRECISION_LOSS );
        }
        return ToDouble( value, exponent );
    }

    outcome::result<double> DoubleBoundary::ToDoubleSafe( const NullableBigInt &value, uint64_t exponent )
    {
        if ( value.IsNull() )
        {
            return outcome::failure( ConversionError::NULL_INPUT );
        }
        return ToDoubleSafe( *value.Get(), exponent );
    }

    outcome::result<double> DoubleBoundary::ToDouble( const BigInt &value, uint64_t exponent, ConversionMode mode )
    {
        switch ( mode )
        {
            case ConversionMode::Optimized:
                return ToDoubleOptimized( value, exponent );
            case ConversionMode::Safe:
                return ToDoubleSafe( value, exponent );
            case ConversionMode::Balanced:
            default:
                return ToDouble( value, exponent );
        }
    }

    outcome::result<double> DoubleBoundary::ToDouble( const NullableBigInt &value,
                                                      uint64_t              exponent,
                                                      ConversionMode        mode )
    {
        if ( value.IsNull() )
        {
            return outcome::failure( ConversionError::NULL_INPUT );
        }
        return ToDouble( *value.Get(), exponent, mode );
    }

    outcome::result<BigInt> DoubleBoundary::FromDouble( double value, uint64_t exponent )
    {
        if ( !std::isfinite( value ) )
        {
            return outcome::failure( ConversionError::PRECISION_LOSS );
        }
        if ( value < 0.0 )
        {
            return outcome::failure( ConversionError::NEGATIVE_INPUT );
        }
        return DecimalBridge::FromFloat( value, exponent );
    }
} // namespace safemath
