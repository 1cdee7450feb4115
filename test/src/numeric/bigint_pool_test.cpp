#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include <vector>
#include "numeric/BigIntPool.hpp"
#include "numeric/NullableBigInt.hpp"

using safemath::BigInt;
using safemath::BigIntPool;
using safemath::NullableBigInt;

/**
 * @test Storage handed back to the pool is reset before it is reused.
 */
TEST( BigIntPoolTest, ReacquiredStorageIsZero )
{
    BigIntPool pool( 4 );

    auto        first   = pool.Acquire();
    const auto *address = first.get();
    *first              = BigInt( "123456789012345678901234567890" );
    first.reset();
    EXPECT_EQ( pool.Idle(), 1U );

    auto second = pool.Acquire();
    EXPECT_EQ( second.get(), address );
    EXPECT_EQ( *second, BigInt( 0 ) );
    EXPECT_EQ( pool.Idle(), 0U );
}

TEST( BigIntPoolTest, CapacityBoundsIdleStorage )
{
    BigIntPool                      pool( 2 );
    std::vector<BigIntPool::Handle> handles;
    for ( int i = 0; i < 5; ++i )
    {
        handles.push_back( pool.Acquire() );
    }
    handles.clear();
    EXPECT_EQ( pool.Idle(), 2U );
    EXPECT_EQ( pool.Capacity(), 2U );
}

TEST( BigIntPoolTest, ShrinkingCapacityDropsIdleStorage )
{
    BigIntPool pool;
    EXPECT_EQ( pool.Capacity(), BigIntPool::DEFAULT_CAPACITY );

    {
        auto a = pool.Acquire();
        auto b = pool.Acquire();
        auto c = pool.Acquire();
    }
    EXPECT_EQ( pool.Idle(), 3U );

    pool.SetCapacity( 1 );
    EXPECT_EQ( pool.Idle(), 1U );
    EXPECT_EQ( pool.Capacity(), 1U );

    pool.SetCapacity( 0 );
    EXPECT_EQ( pool.Idle(), 0U );
    {
        auto d = pool.Acquire();
    }
    EXPECT_EQ( pool.Idle(), 0U );
}

TEST( BigIntPoolTest, DefaultHandleDeletesStorage )
{
    BigIntPool::Handle handle( new BigInt( 5 ) );
    EXPECT_EQ( *handle, BigInt( 5 ) );
    handle.reset();
    EXPECT_FALSE( handle );
}

/**
 * @test Nullable values draw from the shared pool and return to it when set to null.
 */
TEST( BigIntPoolTest, NullableValuesUseSharedPool )
{
    auto &shared = BigIntPool::Shared();
    shared.SetCapacity( BigIntPool::DEFAULT_CAPACITY );

    NullableBigInt value( BigInt( 99 ) );
    size_t         idle_before = shared.Idle();

    value = nullptr;
    EXPECT_EQ( shared.Idle(), idle_before + 1 );

    value.Set( BigInt( 1 ) );
    EXPECT_EQ( shared.Idle(), idle_before );
    EXPECT_EQ( *value.Get(), BigInt( 1 ) );
}

/**
 * @test Threads acquiring and releasing together never share storage, and the idle list stays bounded.
 */
TEST( BigIntPoolTest, ConcurrentChurnKeepsStorageExclusive )
{
    BigIntPool               pool( 16 );
    constexpr int            kThreads    = 8;
    constexpr int            kIterations = 2000;
    std::atomic<int>         mismatches{ 0 };
    std::vector<std::thread> threads;

    for ( int t = 0; t < kThreads; ++t )
    {
        threads.emplace_back(
            [&pool, &mismatches, t]
            {
                for ( int i = 0; i < kIterations; ++i )
                {
                    auto handle = pool.Acquire();
                    if ( *handle != 0 )
                    {
                        ++mismatches;
                    }
                    BigInt mine = BigInt( t ) * 1000000 + i;
                    *handle     = mine;
                    std::this_thread::yield();
                    if ( *handle != mine )
                    {
                        ++mismatches;
                    }
                }
            } );
    }
    for ( auto &thread : threads )
    {
        thread.join();
    }

    EXPECT_EQ( mismatches.load(), 0 );
    EXPECT_LE( pool.Idle(), 16U );
    EXPECT_GE( pool.Idle(), 1U );
}

/**
 * @test Nullable values on separate threads draw from the shared pool without interfering.
 */
TEST( BigIntPoolTest, SharedPoolServesConcurrentNullables )
{
    constexpr int            kThreads = 4;
    std::atomic<int>         mismatches{ 0 };
    std::vector<std::thread> threads;

    for ( int t = 0; t < kThreads; ++t )
    {
        threads.emplace_back(
            [&mismatches, t]
            {
                for ( int i = 0; i < 1000; ++i )
                {
                    NullableBigInt value( BigInt( t * 10000 + i ) );
                    NullableBigInt sum = value.Add( NullableBigInt::FromInt64( 1 ) );
                    if ( *sum.Get() != BigInt( t * 10000 + i + 1 ) )
                    {
                        ++mismatches;
                    }
                    value = nullptr;
                }
            } );
    }
    for ( auto &thread : threads )
    {
        thread.join();
    }
    EXPECT_EQ( mismatches.load(), 0 );
}

/**
 * @test A static value that first takes storage after the shared pool exists can still release it at exit.
 */
TEST( BigIntPoolTest, StaticHolderReleasesAfterSharedPool )
{
    static NullableBigInt holder;
    EXPECT_TRUE( holder.IsNull() );

    (void)BigIntPool::Shared();
    holder.Set( BigInt( 42 ) );
    EXPECT_EQ( *holder.Get(), BigInt( 42 ) );
}
