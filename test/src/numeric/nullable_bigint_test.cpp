#include <gtest/gtest.h>
#include <cstdint>
#include <limits>
#include <string>
#include <utility>
#include "numeric/NullableBigInt.hpp"

using safemath::BigInt;
using safemath::ConversionError;
using safemath::NullableBigInt;

namespace
{
    NullableBigInt Value( int64_t value )
    {
        return NullableBigInt::FromInt64( value );
    }
}

/**
 * @test The null state is distinct from zero.
 */
TEST( NullableBigIntTest, NullIsNotZero )
{
    NullableBigInt null_value;
    NullableBigInt zero = Value( 0 );

    EXPECT_TRUE( null_value.IsNull() );
    EXPECT_EQ( null_value.Get(), nullptr );
    EXPECT_FALSE( zero.IsNull() );
    ASSERT_NE( zero.Get(), nullptr );
    EXPECT_EQ( *zero.Get(), BigInt( 0 ) );

    EXPECT_NE( null_value, zero );
    EXPECT_LT( null_value, zero );
    EXPECT_EQ( null_value.Sign(), 0 );
    EXPECT_EQ( null_value.ToString(), "" );
    EXPECT_EQ( zero.ToString(), "0" );
}

TEST( NullableBigIntTest, Construction )
{
    NullableBigInt from_big( BigInt( "123456789012345678901234567890" ) );
    EXPECT_EQ( from_big.ToString(), "123456789012345678901234567890" );

    EXPECT_EQ( NullableBigInt::FromInt64( -42 ).ToString(), "-42" );
    EXPECT_EQ( NullableBigInt::FromUint64( std::numeric_limits<uint64_t>::max() ).ToString(),
               "18446744073709551615" );

    NullableBigInt from_null( nullptr );
    EXPECT_TRUE( from_null.IsNull() );
}

TEST( NullableBigIntTest, FromStringForms )
{
    auto empty = NullableBigInt::FromString( "" );
    ASSERT_TRUE( empty.has_value() );
    EXPECT_TRUE( empty.value().IsNull() );

    auto decimal = NullableBigInt::FromString( "-123" );
    ASSERT_TRUE( decimal.has_value() );
    EXPECT_EQ( decimal.value(), Value( -123 ) );

    auto hex = NullableBigInt::FromString( "0xff" );
    ASSERT_TRUE( hex.has_value() );
    EXPECT_EQ( hex.value(), Value( 255 ) );

    auto fixed_base = NullableBigInt::FromString( "ff", 16 );
    ASSERT_TRUE( fixed_base.has_value() );
    EXPECT_EQ( fixed_base.value(), Value( 255 ) );

    for ( const char *text : { "abc", "1.5", " 1", "0x" } )
    {
        auto result = NullableBigInt::FromString( text );
        ASSERT_FALSE( result.has_value() ) << text;
        EXPECT_EQ( result.error(), make_error_code( ConversionError::INVALID_TEXT ) );
    }

    auto empty_fixed = NullableBigInt::FromString( "", 10 );
    ASSERT_FALSE( empty_fixed.has_value() );
}

TEST( NullableBigIntTest, CopiesAreIndependent )
{
    NullableBigInt original = Value( 10 );
    NullableBigInt copy( original );
    copy.Set( BigInt( 20 ) );

    EXPECT_EQ( original, Value( 10 ) );
    EXPECT_EQ( copy, Value( 20 ) );

    NullableBigInt assigned;
    assigned = original;
    original = nullptr;
    EXPECT_TRUE( original.IsNull() );
    EXPECT_EQ( assigned, Value( 10 ) );

    NullableBigInt moved( std::move( assigned ) );
    EXPECT_EQ( moved, Value( 10 ) );
}

TEST( NullableBigIntTest, SetAndRelease )
{
    NullableBigInt value;
    value.Set( BigInt( 7 ) );
    EXPECT_FALSE( value.IsNull() );
    EXPECT_EQ( value.Sign(), 1 );

    value.Release();
    EXPECT_TRUE( value.IsNull() );

    value.Set( BigInt( -7 ) );
    EXPECT_EQ( value.Sign(), -1 );
}

TEST( NullableBigIntTest, CompareOrdersNullFirst )
{
    NullableBigInt null_value;

    EXPECT_EQ( null_value.Compare( NullableBigInt() ), 0 );
    EXPECT_LT( null_value.Compare( Value( -100 ) ), 0 );
    EXPECT_GT( Value( -100 ).Compare( null_value ), 0 );
    EXPECT_LT( Value( 1 ).Compare( Value( 2 ) ), 0 );
    EXPECT_TRUE( Value( 3 ) >= Value( 3 ) );
    EXPECT_TRUE( Value( 3 ) <= Value( 4 ) );
    EXPECT_TRUE( Value( 5 ) > null_value );
}

TEST( NullableBigIntTest, AddTreatsNullAsIdentity )
{
    NullableBigInt null_value;

    EXPECT_EQ( Value( 2 ).Add( Value( 3 ) ), Value( 5 ) );
    EXPECT_EQ( Value( 2 ).Add( null_value ), Value( 2 ) );
    EXPECT_EQ( null_value.Add( Value( 3 ) ), Value( 3 ) );
    EXPECT_EQ( null_value.Add( null_value ), Value( 0 ) );
}

TEST( NullableBigIntTest, SubNegatesRightOperand )
{
    NullableBigInt null_value;

    EXPECT_EQ( Value( 2 ).Sub( Value( 3 ) ), Value( -1 ) );
    EXPECT_EQ( Value( 2 ).Sub( null_value ), Value( 2 ) );
    EXPECT_EQ( null_value.Sub( Value( 3 ) ), Value( -3 ) );
    EXPECT_EQ( null_value.Sub( null_value ), Value( 0 ) );
}

TEST( NullableBigIntTest, MulWithNullIsZero )
{
    NullableBigInt null_value;

    EXPECT_EQ( Value( 4 ).Mul( Value( -3 ) ), Value( -12 ) );
    EXPECT_EQ( Value( 4 ).Mul( null_value ), Value( 0 ) );
    EXPECT_EQ( null_value.Mul( Value( 4 ) ), Value( 0 ) );
}

/**
 * @test Division is Euclidean and never faults.
 */
TEST( NullableBigIntTest, DivIsEuclidean )
{
    NullableBigInt null_value;

    EXPECT_EQ( Value( 7 ).Div( Value( 2 ) ), Value( 3 ) );
    EXPECT_EQ( Value( -7 ).Div( Value( 2 ) ), Value( -4 ) );
    EXPECT_EQ( Value( 7 ).Div( Value( -2 ) ), Value( -3 ) );
    EXPECT_EQ( Value( -7 ).Div( Value( -2 ) ), Value( 4 ) );
    EXPECT_EQ( Value( -8 ).Div( Value( 2 ) ), Value( -4 ) );

    EXPECT_EQ( Value( 7 ).Div( Value( 0 ) ), Value( 0 ) );
    EXPECT_EQ( Value( 7 ).Div( null_value ), Value( 0 ) );
    EXPECT_EQ( null_value.Div( Value( 7 ) ), Value( 0 ) );
}

TEST( NullableBigIntTest, MachineIntegerExtraction )
{
    auto null_int = NullableBigInt().ToInt64();
    ASSERT_TRUE( null_int.has_value() );
    EXPECT_EQ( null_int.value(), 0 );

    auto in_range = Value( -5 ).ToInt64();
    ASSERT_TRUE( in_range.has_value() );
    EXPECT_EQ( in_range.value(), -5 );

    NullableBigInt too_big( BigInt( "9223372036854775808" ) );
    auto           overflow = too_big.ToInt64();
    ASSERT_FALSE( overflow.has_value() );
    EXPECT_EQ( overflow.error(), make_error_code( ConversionError::OUT_OF_RANGE ) );

    auto unsigned_value = too_big.ToUint64();
    ASSERT_TRUE( unsigned_value.has_value() );
    EXPECT_EQ( unsigned_value.value(), 9223372036854775808ULL );

    auto negative = Value( -1 ).ToUint64();
    ASSERT_FALSE( negative.has_value() );
    EXPECT_EQ( negative.error(), make_error_code( ConversionError::OUT_OF_RANGE ) );

    auto null_uint = NullableBigInt().ToUint64();
    ASSERT_TRUE( null_uint.has_value() );
    EXPECT_EQ( null_uint.value(), 0U );
}
