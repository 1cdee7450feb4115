/**
 * @file        NullableBigInt.cpp
 * @brief       Arbitrary-precision integer with a null state distinct from zero.
 * @version     1.0
 * @date        2025-06-02
 * @copyright   Copyright (c) 2025
 */

#include "numeric/NullableBigInt.hpp"
#include <limits>
#include "numeric/integer_text.hpp"

namespace safemath
{
    NullableBigInt::NullableBigInt( const BigInt &value ) : value_( BigIntPool::Shared().Acquire() )
    {
        *value_ = value;
    }

    NullableBigInt::NullableBigInt( const NullableBigInt &other )
    {
        if ( other.value_ )
        {
            value_  = BigIntPool::Shared().Acquire();
            *value_ = *other.value_;
        }
    }

    NullableBigInt &NullableBigInt::operator=( const NullableBigInt &other )
    {
        if ( this == &other )
        {
            return *this;
        }
        if ( other.value_ )
        {
            Set( *other.value_ );
        }
        else
        {
            Release();
        }
        return *this;
    }

    NullableBigInt &NullableBigInt::operator=( std::nullptr_t ) noexcept
    {
        Release();
        return *this;
    }

    NullableBigInt NullableBigInt::FromInt64( int64_t value )
    {
        return NullableBigInt( BigInt( value ) );
    }

    NullableBigInt NullableBigInt::FromUint64( uint64_t value )
    {
        return NullableBigInt( BigInt( value ) );
    }

    outcome::result<NullableBigInt> NullableBigInt::FromString( std::string_view text )
    {
        if ( text.empty() )
        {
            return outcome::success( NullableBigInt() );
        }
        OUTCOME_TRY( auto &&parsed, numeric::ParseBigIntAuto( text ) );
        return outcome::success( NullableBigInt( parsed ) );
    }

    outcome::result<NullableBigInt> NullableBigInt::FromString( std::string_view text, unsigned base )
    {
        OUTCOME_TRY( auto &&parsed, numeric::ParseBigInt( text, base ) );
        return outcome::success( NullableBigInt( parsed ) );
    }

    NullableBigInt &NullableBigInt::Set( const BigInt &value )
    {
        if ( !value_ )
        {
            value_ = BigIntPool::Shared().Acquire();
        }
        *value_ = value;
        return *this;
    }

    void NullableBigInt::Release() noexcept
    {
        value_.reset();
    }

    bool NullableBigInt::IsNull() const noexcept
    {
        return !value_;
    }

    int NullableBigInt::Sign() const noexcept
    {
        if ( !value_ )
        {
            return 0;
        }
        return value_->sign();
    }

    const BigInt *NullableBigInt::Get() const noexcept
    {
        return value_.get();
    }

    int NullableBigInt::Compare( const NullableBigInt &other ) const
    {
        if ( !value_ )
        {
            return other.value_ ? -1 : 0;
        }
        if ( !other.value_ )
        {
            return 1;
        }
        return value_->compare( *other.value_ );
    }

    NullableBigInt NullableBigInt::Add( const NullableBigInt &other ) const
    {
        if ( !value_ && !other.value_ )
        {
            return NullableBigInt( BigInt( 0 ) );
        }
        if ( !value_ )
        {
            return other;
        }
        if ( !other.value_ )
        {
            return *this;
        }
        return NullableBigInt( BigInt( *value_ + *other.value_ ) );
    }

    NullableBigInt NullableBigInt::Sub( const NullableBigInt &other ) const
    {
        if ( !value_ && !other.value_ )
        {
            return NullableBigInt( BigInt( 0 ) );
        }
        if ( !value_ )
        {
            return NullableBigInt( BigInt( -*other.value_ ) );
        }
        if ( !other.value_ )
        {
            return *this;
        }
        return NullableBigInt( BigInt( *value_ - *other.value_ ) );
    }

    NullableBigInt NullableBigInt::Mul( const NullableBigInt &other ) const
    {
        if ( !value_ || !other.value_ )
        {
            return NullableBigInt( BigInt( 0 ) );
        }
        return NullableBigInt( BigInt( *value_ * *other.value_ ) );
    }

    NullableBigInt NullableBigInt::Div( const NullableBigInt &other ) const
    {
        if ( !value_ || !other.value_ || other.value_->is_zero() )
        {
            return NullableBigInt( BigInt( 0 ) );
        }
        BigInt quotient  = *value_ / *other.value_;
        BigInt remainder = *value_ % *other.value_;
        // cpp_int truncates toward zero; shift so the remainder is never negative
        if ( remainder.sign() < 0 )
        {
            if ( other.value_->sign() > 0 )
            {
                --quotient;
            }
            else
            {
                ++quotient;
            }
        }
        return NullableBigInt( quotient );
    }

    outcome::result<int64_t> NullableBigInt::ToInt64() const
    {
        if ( !value_ )
        {
            return outcome::success( int64_t{ 0 } );
        }
        if ( *value_ > std::numeric_limits<int64_t>::max() || *value_ < std::numeric_limits<int64_t>::min() )
        {
            return outcome::failure( ConversionError::OUT_OF_RANGE );
        }
        return outcome::success( value_->convert_to<int64_t>() );
    }

    outcome::result<uint64_t> NullableBigInt::ToUint64() const
    {
        if ( !value_ )
        {
            return outcome::success( uint64_t{ 0 } );
        }
        if ( value_->sign() < 0 || *value_ > std::numeric_limits<uint64_t>::max() )
        {
            return outcome::failure( ConversionError::OUT_OF_RANGE );
        }
        return outcome::success( value_->convert_to<uint64_t>() );
    }

    std::string NullableBigInt::ToString() const
    {
        if ( !value_ )
        {
            return {};
        }
        return value_->str();
    }
} // namespace safemath
