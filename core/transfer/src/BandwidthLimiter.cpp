#include "BandwidthLimiter.h"
#include "CancellationToken.h"
#include "Logger.h"

#include <algorithm>
#include <thread>

namespace DriveSync {

namespace {
constexpr long long kMaxSleepMicros = 100000;
}

BandwidthLimiter::BandwidthLimiter(uint64_t maxBytesPerSecond, uint64_t burstCapacity)
    : maxBytesPerSecond_(maxBytesPerSecond)
    , burstCapacity_(burstCapacity > 0 ? burstCapacity : maxBytesPerSecond)
    , tokens_(static_cast<double>(burstCapacity_))
    , lastRefill_(std::chrono::steady_clock::now())
{
    if (maxBytesPerSecond == 0) {
        // Unlimited
        burstCapacity_ = 0;
        tokens_ = 0;
    }
}

std::unique_ptr<BandwidthLimiter> BandwidthLimiter::fromMegabytesPerSecond(double megabytesPerSecond) {
    if (megabytesPerSecond <= 0.0) {
        return std::make_unique<BandwidthLimiter>(0);
    }
    auto bytesPerSecond = static_cast<uint64_t>(megabytesPerSecond * BYTES_PER_MEGABYTE);
    Logger::instance().log(LogLevel::DEBUG, "Bandwidth limit " + std::to_string(megabytesPerSecond) +
                           " MB/s (" + std::to_string(bytesPerSecond) + " B/s)", "BandwidthLimiter");
    return std::make_unique<BandwidthLimiter>(std::max<uint64_t>(bytesPerSecond, 1));
}

void BandwidthLimiter::refillTokens() {
    auto now = std::chrono::steady_clock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(now - lastRefill_).count();

    if (elapsed > 0) {
        double tokensToAdd = (static_cast<double>(maxBytesPerSecond_.load()) * elapsed) / 1000000.0;
        tokens_ = std::min(tokens_ + tokensToAdd, static_cast<double>(burstCapacity_));
        lastRefill_ = now;
    }
}

void BandwidthLimiter::acquire(size_t bytes, const CancellationToken* cancel) {
    if (!isEnabled()) {
        totalBytesTransferred_ += bytes;
        return;
    }

    auto startWait = std::chrono::steady_clock::now();

    uint64_t remaining = bytes;
    while (remaining > 0) {
        uint64_t piece = std::min<uint64_t>(remaining, std::max<uint64_t>(getCapacity(), 1));
        acquirePiece(piece, cancel);
        remaining -= piece;
    }

    auto waitTime = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startWait).count();
    totalWaitTimeMs_ += static_cast<uint64_t>(waitTime);
}

void BandwidthLimiter::acquirePiece(uint64_t bytes, const CancellationToken* cancel) {
    std::unique_lock<std::mutex> lock(mutex_);

    const double needed = static_cast<double>(bytes);
    while (true) {
        if (maxBytesPerSecond_.load() == 0) {
            // Limit lifted while waiting
            totalBytesTransferred_ += bytes;
            return;
        }
        refillTokens();
        if (tokens_ >= needed) {
            break;
        }

        if (CancellationToken::cancelled(cancel)) {
            throw OperationCancelled();
        }

        double tokensNeeded = needed - tokens_;
        auto waitMicros = static_cast<long long>((tokensNeeded / maxBytesPerSecond_.load()) * 1000000) + 1;

        lock.unlock();
        std::this_thread::sleep_for(std::chrono::microseconds(std::min(waitMicros, kMaxSleepMicros)));
        lock.lock();
    }

    tokens_ -= needed;
    totalBytesTransferred_ += bytes;
}

size_t BandwidthLimiter::tryAcquire(size_t bytes) {
    if (!isEnabled()) {
        totalBytesTransferred_ += bytes;
        return bytes;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    refillTokens();

    size_t allowed = std::min(bytes, static_cast<size_t>(tokens_));
    if (allowed > 0) {
        tokens_ -= static_cast<double>(allowed);
        totalBytesTransferred_ += allowed;
    }

    return allowed;
}

void BandwidthLimiter::setRateLimit(uint64_t maxBytesPerSecond) {
    std::lock_guard<std::mutex> lock(mutex_);

    maxBytesPerSecond_ = maxBytesPerSecond;

    if (maxBytesPerSecond == 0) {
        burstCapacity_ = 0;
        tokens_ = 0;
    } else {
        burstCapacity_ = maxBytesPerSecond;
        tokens_ = std::min(tokens_, static_cast<double>(burstCapacity_));
    }

    lastRefill_ = std::chrono::steady_clock::now();
}

uint64_t BandwidthLimiter::getCapacity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return burstCapacity_;
}

double BandwidthLimiter::getCurrentTokens() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tokens_;
}

void BandwidthLimiter::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    tokens_ = static_cast<double>(burstCapacity_);
    lastRefill_ = std::chrono::steady_clock::now();
}

std::pair<uint64_t, uint64_t> BandwidthLimiter::getStats() const {
    return {totalBytesTransferred_.load(), totalWaitTimeMs_.load()};
}

} // namespace DriveSync
