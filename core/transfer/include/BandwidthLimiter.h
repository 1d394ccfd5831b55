#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <utility>

namespace DriveSync {

class CancellationToken;

/**
 * @brief Token Bucket algorithm for bandwidth throttling
 *
 * Tokens (bytes) are added at a constant rate up to the bucket capacity.
 * The bucket starts full, so over any window T >= capacity/rate the bytes
 * acquired never exceed rate * T + capacity.
 */
class BandwidthLimiter {
public:
    static constexpr double BYTES_PER_MEGABYTE = 1024.0 * 1024.0;

    /**
     * @brief Construct a bandwidth limiter
     * @param maxBytesPerSecond Maximum transfer rate (0 = unlimited)
     * @param burstCapacity Maximum burst size in bytes (default: one second of rate)
     */
    explicit BandwidthLimiter(uint64_t maxBytesPerSecond = 0, uint64_t burstCapacity = 0);

    /**
     * @brief Limiter for a rate given in MB/s; 0 or negative means unlimited
     */
    static std::unique_ptr<BandwidthLimiter> fromMegabytesPerSecond(double megabytesPerSecond);

    /**
     * @brief Block until @p bytes may be transferred
     *
     * Requests larger than the capacity are split into capacity-sized
     * pieces. The token is polled between sleeps.
     * @throws OperationCancelled if @p cancel fires while waiting
     */
    void acquire(size_t bytes, const CancellationToken* cancel = nullptr);

    /**
     * @brief Take what is available without blocking
     * @return Number of bytes allowed (may be less than requested)
     */
    size_t tryAcquire(size_t bytes);

    /**
     * @brief Update the rate limit; capacity follows the new rate
     */
    void setRateLimit(uint64_t maxBytesPerSecond);

    uint64_t getRateLimit() const { return maxBytesPerSecond_.load(); }
    uint64_t getCapacity() const;
    bool isEnabled() const { return maxBytesPerSecond_.load() > 0; }

    double getCurrentTokens() const;

    /**
     * @brief Reset token bucket to full capacity
     */
    void reset();

    /**
     * @brief Get statistics
     * @return Pair of (total_bytes_acquired, total_wait_time_ms)
     */
    std::pair<uint64_t, uint64_t> getStats() const;

private:
    void refillTokens();
    void acquirePiece(uint64_t bytes, const CancellationToken* cancel);

    std::atomic<uint64_t> maxBytesPerSecond_;
    uint64_t burstCapacity_;
    double tokens_;

    std::chrono::steady_clock::time_point lastRefill_;
    mutable std::mutex mutex_;

    std::atomic<uint64_t> totalBytesTransferred_{0};
    std::atomic<uint64_t> totalWaitTimeMs_{0};
};

} // namespace DriveSync
