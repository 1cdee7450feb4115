/**
 * @file        NullableBigInt.hpp
 * @brief       Arbitrary-precision integer with a null state distinct from zero.
 * @version     1.0
 * @date        2025-06-02
 * @copyright   Copyright (c) 2025
 */

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include "numeric/BigIntPool.hpp"
#include "conversion/conversion_error.hpp"

namespace safemath
{
    /**
     * @class NullableBigInt
     * @brief Scaled amount that may be absent.
     *
     * The value lives in storage drawn from BigIntPool::Shared(). Setting the value
     * to null hands that storage back to the pool. Arithmetic never faults: a null
     * operand behaves as the identity of the operation or yields zero, and division
     * by zero yields zero.
     */
    class NullableBigInt
    {
    public:
        /**
         * @brief Construct the null state.
         */
        NullableBigInt() noexcept = default;

        NullableBigInt( std::nullptr_t ) noexcept {}

        /**
         * @brief Construct holding a copy of @p value.
         * @param[in] value Integer to hold.
         */
        explicit NullableBigInt( const BigInt &value );

        NullableBigInt( const NullableBigInt &other );
        NullableBigInt( NullableBigInt &&other ) noexcept = default;

        NullableBigInt &operator=( const NullableBigInt &other );
        NullableBigInt &operator=( NullableBigInt &&other ) noexcept = default;

        /**
         * @brief Drop the value and return its storage to the pool.
         */
        NullableBigInt &operator=( std::nullptr_t ) noexcept;

        static NullableBigInt FromInt64( int64_t value );

        static NullableBigInt FromUint64( uint64_t value );

        /**
         * @brief Parse external text.
         *
         * The empty string is the null state. Otherwise base 10 (with optional sign)
         * is tried first, then a "0x"-prefixed base-16 form.
         *
         * @param[in] text Text to parse.
         * @return Parsed value or ConversionError::INVALID_TEXT.
         */
        static outcome::result<NullableBigInt> FromString( std::string_view text );

        /**
         * @brief Parse text in a fixed base.
         * @param[in] text Digits with optional sign.
         * @param[in] base 10 or 16.
         * @return Parsed value or ConversionError::INVALID_TEXT.
         */
        static outcome::result<NullableBigInt> FromString( std::string_view text, unsigned base );

        /**
         * @brief Replace the held value, leaving the null state if necessary.
         * @param[in] value New value.
         * @return Reference to this object.
         */
        NullableBigInt &Set( const BigInt &value );

        /**
         * @brief Return the storage to the pool. The object becomes null.
         */
        void Release() noexcept;

        bool IsNull() const noexcept;

        /**
         * @brief Sign of the value; the null state reports 0.
         * @return -1, 0 or 1.
         */
        int Sign() const noexcept;

        /**
         * @brief Held value, or nullptr in the null state.
         */
        const BigInt *Get() const noexcept;

        /**
         * @brief Three-way comparison where null equals null and sorts below every value.
         * @param[in] other Value to compare with.
         * @return Negative, zero or positive.
         */
        int Compare( const NullableBigInt &other ) const;

        NullableBigInt Add( const NullableBigInt &other ) const;

        NullableBigInt Sub( const NullableBigInt &other ) const;

        NullableBigInt Mul( const NullableBigInt &other ) const;

        /**
         * @brief Euclidean quotient; zero when either side is null or the divisor is zero.
         * @param[in] other Divisor.
         * @return Quotient.
         */
        NullableBigInt Div( const NullableBigInt &other ) const;

        /**
         * @brief Narrow to int64_t. The null state yields 0.
         * @return Value or ConversionError::OUT_OF_RANGE.
         */
        outcome::result<int64_t> ToInt64() const;

        /**
         * @brief Narrow to uint64_t. The null state yields 0.
         * @return Value or ConversionError::OUT_OF_RANGE.
         */
        outcome::result<uint64_t> ToUint64() const;

        /**
         * @brief Canonical base-10 text; the null state is the empty string.
         */
        std::string ToString() const;

        bool operator==( const NullableBigInt &other ) const { return Compare( other ) == 0; }
        bool operator!=( const NullableBigInt &other ) const { return Compare( other ) != 0; }
        bool operator<( const NullableBigInt &other ) const { return Compare( other ) < 0; }
        bool operator>( const NullableBigInt &other ) const { return Compare( other ) > 0; }
        bool operator<=( const NullableBigInt &other ) const { return Compare( other ) <= 0; }
        bool operator>=( const NullableBigInt &other ) const { return Compare( other ) >= 0; }

    private:
        BigIntPool::Handle value_;
    };
} // namespace safemath
