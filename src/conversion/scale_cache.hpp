/**
 * @file        scale_cache.hpp
 * @brief       Process-wide memo of power-of-ten scale factors.
 * @version     1.0
 * @date        2025-06-02
 * @copyright   Copyright (c) 2025
 */

#ifndef SAFEMATH_SCALE_CACHE_HPP
#define SAFEMATH_SCALE_CACHE_HPP

#include <memory>
#include <shared_mutex>
#include <unordered_map>
#include <vector>
#include "base/logger.hpp"
#include "base/numeric_types.hpp"

namespace safemath
{
    /**
     * @class       ScaleCache
     * @brief       Maps a scale exponent to 10^exponent in integer and float form.
     *
     * Entries are computed once and never mutated or evicted, so a reference
     * returned by Get() stays valid for the lifetime of the cache.
     */
    class ScaleCache
    {
    public:
        /**
         * @brief       Both forms of one scale factor. They are numerically equal for every exponent.
         */
        struct Factor
        {
            BigInt      integer;
            BigRational decimal;
        };

        /**
         * @brief       Create a cache pre-populated with the stablecoin and native exponents.
         */
        ScaleCache();

        /**
         * @brief       Process-wide cache used by every conversion.
         * @return      Reference to the shared cache.
         */
        static ScaleCache &GetInstance();

        /**
         * @brief       Fetch the factor for an exponent, computing and storing it on a miss.
         * @param[in]   exponent Number of decimal places.
         * @return      Factor equal to 10^exponent.
         */
        const Factor &Get( uint64_t exponent );

        /**
         * @brief       Pre-populate several exponents.
         * @param[in]   exponents Exponents to compute ahead of use.
         */
        void Warm( const std::vector<uint64_t> &exponents );

        bool Contains( uint64_t exponent ) const;

        size_t Size() const;

    private:
        static std::unique_ptr<const Factor> Compute( uint64_t exponent );

        mutable std::shared_mutex                                      mutex_;
        std::unordered_map<uint64_t, std::unique_ptr<const Factor>>    factors_;
        base::Logger                                                   logger_ = base::createLogger( "SafeMath" );
    };
} // namespace safemath

#endif // SAFEMATH_SCALE_CACHE_HPP
