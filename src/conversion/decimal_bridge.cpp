/**
 * @file        decimal_bridge.cpp
 * @brief       Precision-preserving conversions between scaled integers and BigFloat.
 * @version     1.0
 * @date        2025-06-02
 * @copyright   Copyright (c) 2025
 */

#include "conversion/decimal_bridge.hpp"
#include <algorithm>
#include <atomic>
#include <cmath>
#include <limits>
#include "base/logger.hpp"
#include "conversion/scale_cache.hpp"
#include "numeric/integer_text.hpp"

namespace safemath
{
    namespace
    {
        constexpr uint64_t FAST_PATH_MAX_EXPONENT = STABLECOIN_EXPONENT;

        /// 2^63, the first product that no longer fits a signed 64-bit integer
        constexpr double INT64_LIMIT = 9223372036854775808.0;

        constexpr double POWERS_OF_TEN[] = { 1e0, 1e1, 1e2,  1e3,  1e4,  1e5,  1e6,  1e7,
                                             1e8, 1e9, 1e10, 1e11, 1e12, 1e13, 1e14 };

        std::atomic<double> &WarningRatio()
        {
            static std::atomic<double> ratio( DecimalBridge::DEFAULT_PRECISION_WARNING_RATIO );
            return ratio;
        }

        base::Logger &BridgeLogger()
        {
            static base::Logger logger = base::createLogger( "SafeMath" );
            return logger;
        }

        /// Clamping policy shared by the inbound conversions
        bool IsConvertible( double value )
        {
            return std::isfinite( value ) && value > 0.0;
        }

        const BigInt &Pow10( uint64_t exponent )
        {
            return ScaleCache::GetInstance().Get( exponent ).integer;
        }

        /// Round an exact quotient to the nearest BigFloat, ties to even
        BigFloat RoundToBigFloat( const BigRational &exact )
        {
            BigInt numerator   = boost::multiprecision::numerator( exact );
            BigInt denominator = boost::multiprecision::denominator( exact );
            if ( numerator.is_zero() )
            {
                return BigFloat( 0 );
            }
            bool negative = numerator.sign() < 0;
            if ( negative )
            {
                numerator = -numerator;
            }

            // Quotient carries at least two bits beyond the mantissa so the sticky bit decides ties
            int64_t shift = static_cast<int64_t>( std::numeric_limits<BigFloat>::digits ) + 2 -
                            ( static_cast<int64_t>( boost::multiprecision::msb( numerator ) ) -
                              static_cast<int64_t>( boost::multiprecision::msb( denominator ) ) );
            BigInt quotient;
            BigInt remainder;
            if ( shift >= 0 )
            {
                BigInt widened = numerator << static_cast<unsigned>( shift );
                boost::multiprecision::divide_qr( widened, denominator, quotient, remainder );
            }
            else
            {
                BigInt widened = denominator << static_cast<unsigned>( -shift );
                boost::multiprecision::divide_qr( numerator, widened, quotient, remainder );
            }
            if ( !remainder.is_zero() )
            {
                boost::multiprecision::bit_set( quotient, 0 );
            }

            BigFloat result = boost::multiprecision::ldexp( BigFloat( quotient ), static_cast<int>( -shift ) );
            return negative ? BigFloat( -result ) : result;
        }
    } // namespace

    BigFloat DecimalBridge::ToBigFloat( const BigInt &value, uint64_t exponent )
    {
        const auto &factor = ScaleCache::GetInstance().Get( exponent );
        return RoundToBigFloat( BigRational( value ) / factor.decimal );
    }

    BigFloat DecimalBridge::ToBigFloat( const NullableBigInt &value, uint64_t exponent )
    {
        if ( value.IsNull() )
        {
            return BigFloat( 0 );
        }
        return ToBigFloat( *value.Get(), exponent );
    }

    DecimalBridge::ScaledAmount DecimalBridge::Scale( double value, uint64_t exponent )
    {
        ScaledAmount amount{ BigInt( 0 ), BigFloat( 0 ) };
        if ( !IsConvertible( value ) )
        {
            return amount;
        }

        auto decimal = numeric::ShortestDecimal( value );
        if ( !decimal )
        {
            BridgeLogger()->error( "No decimal form for {}: {}", value, decimal.error().message() );
            return amount;
        }

        int64_t shift = decimal.value().exponent + static_cast<int64_t>( exponent );
        if ( shift >= 0 )
        {
            amount.units = decimal.value().digits * Pow10( static_cast<uint64_t>( shift ) );
            return amount;
        }

        const auto &divisor = ScaleCache::GetInstance().Get( static_cast<uint64_t>( -shift ) );
        BigInt      remainder;
        boost::multiprecision::divide_qr( decimal.value().digits, divisor.integer, amount.units, remainder );
        amount.dropped = RoundToBigFloat( BigRational( remainder ) / divisor.decimal );
        return amount;
    }

    BigInt DecimalBridge::FromFloat( double value, uint64_t exponent )
    {
        BigInt result = Scale( value, exponent ).units;
        if ( !IsConvertible( value ) )
        {
            return result;
        }

        BigFloat original( value );
        BigFloat deviation = boost::multiprecision::abs( ToBigFloat( result, exponent ) - original );
        if ( deviation > original * BigFloat( PrecisionWarningRatio() ) )
        {
            BridgeLogger()->warn( "Precision anomaly converting {} at 10^{}: got {}",
                                  value,
                                  exponent,
                                  result.str() );
        }
        return result;
    }

    BigInt DecimalBridge::FromFloatFast( double value, uint64_t exponent )
    {
        if ( !IsConvertible( value ) )
        {
            return BigInt( 0 );
        }
        if ( exponent <= FAST_PATH_MAX_EXPONENT )
        {
            double product = value * POWERS_OF_TEN[exponent];
            if ( product < INT64_LIMIT )
            {
                return BigInt( static_cast<int64_t>( product ) );
            }
        }
        return FromFloat( value, exponent );
    }

    BigInt DecimalBridge::FromFloatPercent( double value, uint64_t exponent )
    {
        return FromFloatFast( value, exponent ) / 100;
    }

    BigInt DecimalBridge::ToWholeUnits( const BigInt &value, uint64_t exponent )
    {
        if ( value.sign() < 0 )
        {
            return BigInt( 0 );
        }
        return value / ScaleCache::GetInstance().Get( exponent ).integer;
    }

    BigInt DecimalBridge::ToWholeUnits( const NullableBigInt &value, uint64_t exponent )
    {
        if ( value.IsNull() )
        {
            return BigInt( 0 );
        }
        return ToWholeUnits( *value.Get(), exponent );
    }

    outcome::result<BigInt> DecimalBridge::ParseInteger( std::string_view text )
    {
        if ( text.empty() )
        {
            return outcome::failure( ConversionError::INVALID_TEXT );
        }
        return numeric::ParseBigInt( text, 10 );
    }

    std::string DecimalBridge::FormatDecimal( const BigInt &value, uint64_t exponent, uint32_t digits )
    {
        if ( value.sign() < 0 )
        {
            return "0";
        }
        digits = std::min( digits, MAX_FORMAT_DIGITS );

        // value scaled to `digits` fractional places, rounded half to even
        BigInt scaled;
        if ( digits >= exponent )
        {
            scaled = value * Pow10( digits - exponent );
        }
        else
        {
            BigInt divisor = Pow10( exponent - digits );
            BigInt remainder;
            boost::multiprecision::divide_qr( value, divisor, scaled, remainder );
            BigInt twice = remainder * 2;
            int    half  = twice.compare( divisor );
            if ( half > 0 || ( half == 0 && boost::multiprecision::bit_test( scaled, 0 ) ) )
            {
                ++scaled;
            }
        }

        if ( digits == 0 )
        {
            return scaled.str();
        }

        BigInt whole;
        BigInt fraction;
        boost::multiprecision::divide_qr( scaled, Pow10( digits ), whole, fraction );

        std::string fraction_str = fraction.str();
        if ( fraction_str.size() < digits )
        {
            fraction_str.insert( 0, digits - fraction_str.size(), '0' );
        }
        fraction_str.erase( fraction_str.find_last_not_of( '0' ) + 1 );
        if ( fraction_str.empty() )
        {
            fraction_str = "0";
        }
        return whole.str() + "." + fraction_str;
    }

    std::string DecimalBridge::FormatDecimal( const NullableBigInt &value, uint64_t exponent, uint32_t digits )
    {
        if ( value.IsNull() )
        {
            return "0";
        }
        return FormatDecimal( *value.Get(), exponent, digits );
    }

    void DecimalBridge::SetPrecisionWarningRatio( double ratio )
    {
        WarningRatio().store( ratio );
    }

    double DecimalBridge::PrecisionWarningRatio()
    {
        return WarningRatio().load();
    }
} // namespace safemath
