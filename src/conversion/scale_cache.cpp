/**
 * @file        scale_cache.cpp
 * @brief       Process-wide memo of power-of-ten scale factors.
 * @version     1.0
 * @date        2025-06-02
 * @copyright   Copyright (c) 2025
 */

#include "conversion/scale_cache.hpp"
#include <mutex>

namespace safemath
{
    ScaleCache::ScaleCache()
    {
        factors_.emplace( STABLECOIN_EXPONENT, Compute( STABLECOIN_EXPONENT ) );
        factors_.emplace( NATIVE_EXPONENT, Compute( NATIVE_EXPONENT ) );
    }

    ScaleCache &ScaleCache::GetInstance()
    {
        static ScaleCache instance;
        return instance;
    }

    std::unique_ptr<const ScaleCache::Factor> ScaleCache::Compute( uint64_t exponent )
    {
        BigInt integer = boost::multiprecision::pow( BigInt( 10 ), static_cast<unsigned>( exponent ) );
        BigRational decimal( integer );
        return std::make_unique<const Factor>( Factor{ std::move( integer ), std::move( decimal ) } );
    }

    const ScaleCache::Factor &ScaleCache::Get( uint64_t exponent )
    {
        {
            std::shared_lock<std::shared_mutex> lock( mutex_ );
            auto                                it = factors_.find( exponent );
            if ( it != factors_.end() )
            {
                return *it->second;
            }
        }

        // Computed outside the lock; a concurrent writer for the same exponent wins and this copy is dropped.
        auto computed = Compute( exponent );

        std::unique_lock<std::shared_mutex> lock( mutex_ );
        auto [it, inserted] = factors_.try_emplace( exponent, std::move( computed ) );
        if ( inserted )
        {
            logger_->debug( "Cached scale factor 10^{}", exponent );
        }
        return *it->second;
    }

    void ScaleCache::Warm( const std::vector<uint64_t> &exponents )
    {
        for ( auto exponent : exponents )
        {
            (void)Get( exponent );
        }
    }

    bool ScaleCache::Contains( uint64_t exponent ) const
    {
        std::shared_lock<std::shared_mutex> lock( mutex_ );
        return factors_.find( exponent ) != factors_.end();
    }

    size_t ScaleCache::Size() const
    {
        std::shared_lock<std::shared_mutex> lock( mutex_ );
        return factors_.size();
    }
} // namespace safemath
