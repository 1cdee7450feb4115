/**
 * @file        integer_text.cpp
 * @brief       Strict text parsing of arbitrary-precision integers.
 * @version     1.0
 * @date        2025-06-02
 * @copyright   Copyright (c) 2025
 */

#include "numeric/integer_text.hpp"
#include <array>
#include <charconv>
#include <cmath>
#include <string>

namespace
{
    int digitValue( char c )
    {
        if ( c >= '0' && c <= '9' )
        {
            return c - '0';
        }
        if ( c >= 'a' && c <= 'f' )
        {
            return c - 'a' + 10;
        }
        if ( c >= 'A' && c <= 'F' )
        {
            return c - 'A' + 10;
        }
        return -1;
    }

    /// Digits folded into a machine word before touching the big integer
    constexpr size_t chunkDigits( unsigned base )
    {
        return base == 16 ? 15 : 18;
    }
} // namespace

namespace safemath::numeric
{
    outcome::result<BigInt> ParseBigInt( std::string_view text, unsigned base )
    {
        if ( base != 10 && base != 16 )
        {
            return outcome::failure( ConversionError::INVALID_TEXT );
        }

        bool negative = false;
        if ( !text.empty() && ( text.front() == '-' || text.front() == '+' ) )
        {
            negative = text.front() == '-';
            text.remove_prefix( 1 );
        }
        if ( text.empty() )
        {
            return outcome::failure( ConversionError::INVALID_TEXT );
        }

        BigInt   result     = 0;
        uint64_t chunk      = 0;
        uint64_t chunk_base = 1;
        size_t   in_chunk   = 0;

        for ( char c : text )
        {
            int digit = digitValue( c );
            if ( digit < 0 || static_cast<unsigned>( digit ) >= base )
            {
                return outcome::failure( ConversionError::INVALID_TEXT );
            }
            chunk      = chunk * base + static_cast<uint64_t>( digit );
            chunk_base = chunk_base * base;
            if ( ++in_chunk == chunkDigits( base ) )
            {
                result     = result * chunk_base + chunk;
                chunk      = 0;
                chunk_base = 1;
                in_chunk   = 0;
            }
        }
        if ( in_chunk > 0 )
        {
            result = result * chunk_base + chunk;
        }

        if ( negative )
        {
            result = -result;
        }
        return outcome::success( std::move( result ) );
    }

    outcome::result<BigInt> ParseBigIntAuto( std::string_view text )
    {
        auto decimal = ParseBigInt( text, 10 );
        if ( decimal )
        {
            return decimal;
        }
        if ( text.size() > 2 && text.substr( 0, 2 ) == "0x" )
        {
            return ParseBigInt( text.substr( 2 ), 16 );
        }
        return outcome::failure( ConversionError::INVALID_TEXT );
    }

    outcome::result<DecimalText> ShortestDecimal( double value )
    {
        if ( !std::isfinite( value ) )
        {
            return outcome::failure( ConversionError::PRECISION_LOSS );
        }

        // "-d.ddddde-ddd" at most
        std::array<char, 32> buffer{};
        auto [end, ec] = std::to_chars( buffer.data(), buffer.data() + buffer.size(), value,
                                        std::chars_format::scientific );
        if ( ec != std::errc() )
        {
            return outcome::failure( ConversionError::INVALID_TEXT );
        }

        std::string_view text( buffer.data(), static_cast<size_t>( end - buffer.data() ) );
        size_t           e_pos = text.find( 'e' );
        if ( e_pos == std::string_view::npos )
        {
            return outcome::failure( ConversionError::INVALID_TEXT );
        }

        std::string_view mantissa = text.substr( 0, e_pos );
        std::string_view power    = text.substr( e_pos + 1 );
        if ( !power.empty() && power.front() == '+' )
        {
            power.remove_prefix( 1 );
        }

        int64_t exponent = 0;
        auto [ptr, ec_exp] = std::from_chars( power.data(), power.data() + power.size(), exponent );
        if ( ec_exp != std::errc() || ptr != power.data() + power.size() )
        {
            return outcome::failure( ConversionError::INVALID_TEXT );
        }

        std::string digits;
        size_t      dot_pos = mantissa.find( '.' );
        if ( dot_pos == std::string_view::npos )
        {
            digits = std::string( mantissa );
        }
        else
        {
            digits = std::string( mantissa.substr( 0, dot_pos ) ) + std::string( mantissa.substr( dot_pos + 1 ) );
            exponent -= static_cast<int64_t>( mantissa.size() - dot_pos - 1 );
        }

        OUTCOME_TRY( auto &&parsed, ParseBigInt( digits, 10 ) );
        return outcome::success( DecimalText{ std::move( parsed ), exponent } );
    }
} // namespace safemath::numeric
