/**
 * @file        nullable_bigint_json.hpp
 * @brief       JSON exchange format of NullableBigInt.
 * @version     1.0
 * @date        2025-06-03
 * @copyright   Copyright (c) 2025
 */

#ifndef SAFEMATH_NULLABLE_BIGINT_JSON_HPP
#define SAFEMATH_NULLABLE_BIGINT_JSON_HPP

#include <string>
#include <string_view>
#include <rapidjson/document.h>
#include "numeric/NullableBigInt.hpp"

namespace safemath::json
{
    /**
     * @brief       Decode a JSON number, string or null.
     *
     * Integers take the exact path. Doubles are rejected when NaN or infinite,
     * converted directly when integral and within +/-2^53, and otherwise printed
     * in fixed notation and parsed as base-10 text (fractions therefore fail).
     * Strings are parsed as base 10, then as "0x" base 16; the empty string and
     * JSON null both give the null state.
     *
     * @param[in]   value JSON value.
     * @return      Decoded value, ConversionError::PRECISION_LOSS or ConversionError::INVALID_TEXT.
     */
    outcome::result<NullableBigInt> Decode( const rapidjson::Value &value );

    /**
     * @brief       Parse a JSON document holding a single value and decode it.
     * @param[in]   text JSON text. NaN and Infinity literals are read so they can be rejected.
     * @return      Decoded value or error.
     */
    outcome::result<NullableBigInt> DecodeText( std::string_view text );

    /**
     * @brief       Write the value as a base-10 JSON string, or JSON null.
     * @param[in]   value  Value to write.
     * @param[out]  writer Any rapidjson writer.
     */
    template <typename Writer>
    void Encode( const NullableBigInt &value, Writer &writer )
    {
        if ( value.IsNull() )
        {
            writer.Null();
            return;
        }
        auto text = value.ToString();
        writer.String( text.data(), static_cast<rapidjson::SizeType>( text.size() ) );
    }

    /**
     * @brief       Serialize the value to JSON text.
     * @param[in]   value Value to write.
     * @return      Quoted base-10 digits or "null".
     */
    std::string EncodeText( const NullableBigInt &value );
} // namespace safemath::json

#endif // SAFEMATH_NULLABLE_BIGINT_JSON_HPP
