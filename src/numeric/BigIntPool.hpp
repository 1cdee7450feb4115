/**
 * @file        BigIntPool.hpp
 * @brief       Free list of BigInt storage reused by deserialization.
 * @version     1.0
 * @date        2025-06-02
 * @copyright   Copyright (c) 2025
 */

#pragma once

#include <memory>
#include <mutex>
#include <vector>
#include "base/numeric_types.hpp"

namespace safemath
{
    /**
     * @class BigIntPool
     * @brief Hands out BigInt storage and takes it back when the holder lets go.
     *
     * Storage is owned by exactly one Handle at a time. Destroying or resetting the
     * Handle gives the storage back to the pool that issued it, so the pool must
     * outlive every Handle it issued.
     */
    class BigIntPool
    {
    public:
        /// Idle storage kept when no capacity is configured
        static constexpr size_t DEFAULT_CAPACITY = 1024;

        /**
         * @brief Deleter returning storage to its pool.
         */
        class Releaser
        {
        public:
            Releaser() noexcept = default;

            explicit Releaser( BigIntPool *pool ) noexcept : pool_( pool ) {}

            void operator()( BigInt *value ) const noexcept;

        private:
            BigIntPool *pool_ = nullptr;
        };

        using Handle = std::unique_ptr<BigInt, Releaser>;

        explicit BigIntPool( size_t capacity = DEFAULT_CAPACITY );

        BigIntPool( const BigIntPool & )            = delete;
        BigIntPool &operator=( const BigIntPool & ) = delete;

        /**
         * @brief Pool shared by every NullableBigInt in the process.
         *
         * The shared pool is intentionally leaked so that it outlives static
         * NullableBigInt objects destroyed at exit.
         * @return Reference to the shared pool.
         */
        static BigIntPool &Shared();

        /**
         * @brief Take storage from the free list, or allocate when it is empty.
         * @return Handle owning storage whose value is zero.
         */
        Handle Acquire();

        /**
         * @brief Bound the number of idle entries. Surplus entries are freed at once.
         * @param[in] capacity Maximum idle entries.
         */
        void SetCapacity( size_t capacity );

        size_t Capacity() const;

        /**
         * @brief Number of entries currently waiting on the free list.
         */
        size_t Idle() const;

    private:
        void Release( BigInt *value ) noexcept;

        mutable std::mutex                   mutex_;
        std::vector<std::unique_ptr<BigInt>> free_;
        size_t                               capacity_;
    };
} // namespace safemath
