/**
 * @file        nullable_bigint_json.cpp
 * @brief       JSON exchange format of NullableBigInt.
 * @version     1.0
 * @date        2025-06-03
 * @copyright   Copyright (c) 2025
 */

#include "numeric/nullable_bigint_json.hpp"
#include <array>
#include <charconv>
#include <cmath>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include "numeric/integer_text.hpp"

namespace
{
    /// Largest magnitude below which every integer is exactly representable as a double
    constexpr double EXACT_INTEGER_LIMIT = 9007199254740992.0;

    outcome::result<safemath::NullableBigInt> decodeDouble( double value )
    {
        using safemath::ConversionError;
        if ( std::isnan( value ) || std::isinf( value ) )
        {
            return outcome::failure( ConversionError::PRECISION_LOSS );
        }
        if ( value == std::trunc( value ) && std::fabs( value ) <= EXACT_INTEGER_LIMIT )
        {
            return outcome::success( safemath::NullableBigInt::FromInt64( static_cast<int64_t>( value ) ) );
        }

        // 309 integer digits, sign, point and the shortest fraction fit comfortably
        std::array<char, 512> buffer{};
        auto [end, ec] = std::to_chars( buffer.data(), buffer.data() + buffer.size(), value,
                                        std::chars_format::fixed );
        if ( ec != std::errc() )
        {
            return outcome::failure( ConversionError::INVALID_TEXT );
        }
        return safemath::NullableBigInt::FromString( std::string_view( buffer.data(), end - buffer.data() ), 10 );
    }

    std::string_view trimQuotes( std::string_view text )
    {
        while ( !text.empty() && text.front() == '"' )
        {
            text.remove_prefix( 1 );
        }
        while ( !text.empty() && text.back() == '"' )
        {
            text.remove_suffix( 1 );
        }
        return text;
    }
} // namespace

namespace safemath::json
{
    outcome::result<NullableBigInt> Decode( const rapidjson::Value &value )
    {
        if ( value.IsNull() )
        {
            return outcome::success( NullableBigInt() );
        }
        if ( value.IsInt64() )
        {
            return outcome::success( NullableBigInt::FromInt64( value.GetInt64() ) );
        }
        if ( value.IsUint64() )
        {
            return outcome::success( NullableBigInt::FromUint64( value.GetUint64() ) );
        }
        if ( value.IsNumber() )
        {
            return decodeDouble( value.GetDouble() );
        }
        if ( value.IsString() )
        {
            return NullableBigInt::FromString(
                trimQuotes( std::string_view( value.GetString(), value.GetStringLength() ) ) );
        }
        return outcome::failure( ConversionError::INVALID_TEXT );
    }

    outcome::result<NullableBigInt> DecodeText( std::string_view text )
    {
        rapidjson::Document document;
        document.Parse<rapidjson::kParseNanAndInfFlag | rapidjson::kParseFullPrecisionFlag>( text.data(),
                                                                                               text.size() );
        if ( document.HasParseError() )
        {
            return outcome::failure( ConversionError::INVALID_TEXT );
        }
        return Decode( document );
    }

    std::string EncodeText( const NullableBigInt &value )
    {
        rapidjson::StringBuffer                    buffer;
        rapidjson::Writer<rapidjson::StringBuffer> writer( buffer );
        Encode( value, writer );
        return std::string( buffer.GetString(), buffer.GetSize() );
    }
} // namespace safemath::json
