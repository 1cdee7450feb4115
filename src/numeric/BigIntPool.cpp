/**
 * @file        BigIntPool.cpp
 * @brief       Free list of BigInt storage reused by deserialization.
 * @version     1.0
 * @date        2025-06-02
 * @copyright   Copyright (c) 2025
 */

#include "numeric/BigIntPool.hpp"
#include <new>
#include "base/logger.hpp"

namespace safemath
{
    void BigIntPool::Releaser::operator()( BigInt *value ) const noexcept
    {
        if ( pool_ != nullptr )
        {
            pool_->Release( value );
        }
        else
        {
            delete value;
        }
    }

    BigIntPool::BigIntPool( size_t capacity ) : capacity_( capacity ) {}

    BigIntPool &BigIntPool::Shared()
    {
        // Never destroyed, so static holders released during exit still find it
        static auto *instance = new BigIntPool;
        return *instance;
    }

    BigIntPool::Handle BigIntPool::Acquire()
    {
        std::unique_ptr<BigInt> storage;
        {
            std::lock_guard<std::mutex> lock( mutex_ );
            if ( !free_.empty() )
            {
                storage = std::move( free_.back() );
                free_.pop_back();
            }
        }

        if ( storage )
        {
            *storage = 0;
        }
        else
        {
            storage = std::make_unique<BigInt>( 0 );
        }
        return Handle( storage.release(), Releaser( this ) );
    }

    void BigIntPool::SetCapacity( size_t capacity )
    {
        size_t idle = 0;
        {
            std::lock_guard<std::mutex> lock( mutex_ );
            capacity_ = capacity;
            if ( free_.size() > capacity_ )
            {
                free_.resize( capacity_ );
            }
            idle = free_.size();
        }
        base::createLogger( "SafeMath" )->debug( "Pool capacity set to {} ({} idle)", capacity, idle );
    }

    size_t BigIntPool::Capacity() const
    {
        std::lock_guard<std::mutex> lock( mutex_ );
        return capacity_;
    }

    size_t BigIntPool::Idle() const
    {
        std::lock_guard<std::mutex> lock( mutex_ );
        return free_.size();
    }

    void BigIntPool::Release( BigInt *value ) noexcept
    {
        std::unique_ptr<BigInt> storage( value );
        std::lock_guard<std::mutex> lock( mutex_ );
        if ( free_.size() < capacity_ )
        {
            try
            {
                free_.push_back( std::move( storage ) );
            }
            catch ( const std::bad_alloc & )
            {
                // storage still owns the value and frees it
            }
        }
    }
} // namespace safemath
