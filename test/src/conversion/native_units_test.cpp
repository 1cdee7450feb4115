#include <gtest/gtest.h>
#include <limits>
#include <string>
#include <variant>
#include "conversion/native_units.hpp"

using safemath::BigInt;
using safemath::ConversionError;
using safemath::NativeUnits;
using safemath::NullableBigInt;
using safemath::StablecoinUnits;

// ======================== NativeUnits::ToDisplay ========================

TEST( NativeUnitsTest, ToDisplayModes )
{
    BigInt one_coin( 1000000000000000000ULL );

    auto balanced = NativeUnits::ToDisplay( one_coin );
    ASSERT_TRUE( balanced.has_value() );
    EXPECT_EQ( balanced.value(), 1.0 );

    auto optimized = NativeUnits::ToDisplayOptimized( one_coin );
    ASSERT_TRUE( optimized.has_value() );
    EXPECT_EQ( optimized.value(), 1.0 );

    auto safe = NativeUnits::ToDisplaySafe( one_coin );
    ASSERT_TRUE( safe.has_value() );
    EXPECT_EQ( safe.value(), 1.0 );
}

TEST( NativeUnitsTest, SmallestUnitIsRejected )
{
    auto balanced = NativeUnits::ToDisplay( BigInt( 1 ) );
    ASSERT_FALSE( balanced.has_value() );
    EXPECT_EQ( balanced.error(), make_error_code( ConversionError::PRECISION_LOSS ) );

    auto optimized = NativeUnits::ToDisplayOptimized( BigInt( 1 ) );
    ASSERT_FALSE( optimized.has_value() );
    EXPECT_EQ( optimized.error(), make_error_code( ConversionError::PRECISION_LOSS ) );

    auto at_floor = NativeUnits::ToDisplayOptimized( BigInt( 10 ) );
    ASSERT_TRUE( at_floor.has_value() );
    EXPECT_DOUBLE_EQ( at_floor.value(), 1e-17 );
}

TEST( NativeUnitsTest, SafeBoundRejectsHugeBalances )
{
    BigInt huge = ( BigInt( 9007199254740992ULL ) + 1 ) * BigInt( 1000000000000000000ULL );

    auto balanced = NativeUnits::ToDisplay( huge );
    ASSERT_TRUE( balanced.has_value() );
    EXPECT_EQ( balanced.value(), 9007199254740992.0 );

    auto safe = NativeUnits::ToDisplaySafe( huge );
    ASSERT_FALSE( safe.has_value() );
    EXPECT_EQ( safe.error(), make_error_code( ConversionError::PRECISION_LOSS ) );
}

TEST( NativeUnitsTest, NullAndNegativeInput )
{
    NullableBigInt null_value;
    EXPECT_EQ( NativeUnits::ToDisplay( null_value ).error(), make_error_code( ConversionError::NULL_INPUT ) );
    EXPECT_EQ( NativeUnits::ToDisplayOptimized( null_value ).error(),
               make_error_code( ConversionError::NULL_INPUT ) );
    EXPECT_EQ( NativeUnits::ToDisplaySafe( null_value ).error(), make_error_code( ConversionError::NULL_INPUT ) );

    auto negative = NullableBigInt::FromInt64( -5 );
    EXPECT_EQ( NativeUnits::ToDisplay( negative ).error(), make_error_code( ConversionError::NEGATIVE_INPUT ) );
    EXPECT_EQ( NativeUnits::ToDisplaySafe( BigInt( -5 ) ).error(),
               make_error_code( ConversionError::NEGATIVE_INPUT ) );
}

// ======================== NativeUnits::FromDisplay ========================

struct FromDisplayParam_s
{
    double                                     input;    ///< Display amount.
    std::variant<std::string, ConversionError> expected; ///< Base units or error.
};

class FromDisplayTest : public ::testing::TestWithParam<FromDisplayParam_s>
{
};

/**
 * @test Truncation may drop less than half a base unit, never more.
 */
TEST_P( FromDisplayTest, StrictConversion )
{
    const auto &tc     = GetParam();
    auto        result = NativeUnits::FromDisplay( tc.input );

    if ( std::holds_alternative<std::string>( tc.expected ) )
    {
        ASSERT_TRUE( result.has_value() ) << result.error().message();
        EXPECT_EQ( result.value(), BigInt( std::get<std::string>( tc.expected ) ) );
    }
    else
    {
        ASSERT_FALSE( result.has_value() );
        EXPECT_EQ( result.error(), make_error_code( std::get<ConversionError>( tc.expected ) ) );
    }
}

INSTANTIATE_TEST_SUITE_P(
    FromDisplayTests,
    FromDisplayTest,
    ::testing::Values( FromDisplayParam_s{ 1.0, std::string( "1000000000000000000" ) },
                       FromDisplayParam_s{ 0.5, std::string( "500000000000000000" ) },
                       FromDisplayParam_s{ 1.1, std::string( "1100000000000000000" ) },
                       FromDisplayParam_s{ 1.23456e-13, std::string( "123456" ) },
                       FromDisplayParam_s{ 123456789.0, std::string( "123456789000000000000000000" ) },
                       FromDisplayParam_s{ 1e-18, std::string( "1" ) },
                       FromDisplayParam_s{ 1e-19, std::string( "0" ) },
                       FromDisplayParam_s{ 0.0, std::string( "0" ) },
                       // Half a base unit or more would be dropped
                       FromDisplayParam_s{ 2.5e-18, ConversionError::PRECISION_LOSS },
                       FromDisplayParam_s{ 7e-19, ConversionError::PRECISION_LOSS },
                       FromDisplayParam_s{ -1.0, ConversionError::NEGATIVE_INPUT },
                       FromDisplayParam_s{ std::numeric_limits<double>::quiet_NaN(), ConversionError::PRECISION_LOSS },
                       FromDisplayParam_s{ std::numeric_limits<double>::infinity(),
                                           ConversionError::PRECISION_LOSS } ) );

// ======================== NativeUnits formatting ========================

TEST( NativeUnitsTest, FormatAndWholeUnits )
{
    EXPECT_EQ( NativeUnits::Format( BigInt( 1234567890000000000ULL ), 8 ), "1.23456789" );
    EXPECT_EQ( NativeUnits::Format( NullableBigInt(), 8 ), "0" );
    EXPECT_EQ( NativeUnits::Format( NullableBigInt::FromUint64( 2500000000000000000ULL ), 2 ), "2.5" );

    EXPECT_EQ( NativeUnits::ToWholeUnits( BigInt( 2500000000000000000ULL ) ), BigInt( 2 ) );
    EXPECT_EQ( NativeUnits::ToWholeUnits( NullableBigInt() ), BigInt( 0 ) );
}

// ======================== StablecoinUnits ========================

TEST( StablecoinUnitsTest, FixedExponentConversions )
{
    EXPECT_EQ( StablecoinUnits::FromFloat( 1.5 ), BigInt( 150000000000000ULL ) );
    EXPECT_EQ( StablecoinUnits::FromFloat( -1.0 ), BigInt( 0 ) );
    EXPECT_EQ( StablecoinUnits::FromFloatPercent( 50.0 ), BigInt( 50000000000000ULL ) );
    EXPECT_EQ( StablecoinUnits::ToWholeUnits( BigInt( 250000000000000ULL ) ), BigInt( 2 ) );

    auto display = StablecoinUnits::ToDisplay( BigInt( 25000000000000ULL ) );
    ASSERT_TRUE( display.has_value() );
    EXPECT_EQ( display.value(), 0.25 );

    auto too_fine = StablecoinUnits::ToDisplay( BigInt( 5 ) );
    ASSERT_FALSE( too_fine.has_value() );
    EXPECT_EQ( too_fine.error(), make_error_code( ConversionError::PRECISION_LOSS ) );
}
