/**
 * @file        integer_text.hpp
 * @brief       Strict text parsing of arbitrary-precision integers.
 * @version     1.0
 * @date        2025-06-02
 * @copyright   Copyright (c) 2025
 */

#ifndef SAFEMATH_INTEGER_TEXT_HPP
#define SAFEMATH_INTEGER_TEXT_HPP

#include <cstdint>
#include <string_view>
#include "base/numeric_types.hpp"
#include "conversion/conversion_error.hpp"

namespace safemath::numeric
{
    /**
     * @brief       Parse an integer written in base 10 or base 16.
     *
     * An optional leading '+' or '-' is accepted. No prefix, whitespace,
     * separator or exponent is accepted; "0123" is decimal 123.
     *
     * @param[in]   text Digits to parse.
     * @param[in]   base 10 or 16.
     * @return      Parsed value or ConversionError::INVALID_TEXT.
     */
    outcome::result<BigInt> ParseBigInt( std::string_view text, unsigned base );

    /**
     * @brief       Parse base 10 first, then a "0x"-prefixed base-16 form.
     * @param[in]   text Digits to parse.
     * @return      Parsed value or ConversionError::INVALID_TEXT.
     */
    outcome::result<BigInt> ParseBigIntAuto( std::string_view text );

    /**
     * @brief       Decimal form of a double: value == digits * 10^exponent.
     */
    struct DecimalText
    {
        BigInt  digits;
        int64_t exponent;
    };

    /**
     * @brief       Shortest decimal digits that read back as @p value.
     * @param[in]   value Finite double.
     * @return      Digits and power of ten, or ConversionError::PRECISION_LOSS for NaN and infinities.
     */
    outcome::result<DecimalText> ShortestDecimal( double value );
} // namespace safemath::numeric

#endif // SAFEMATH_INTEGER_TEXT_HPP
