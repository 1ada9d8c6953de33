/**
 * @file bandwidthlimiter.h
 * @brief Computes pauses that keep a transfer under a byte rate.
 */

#ifndef BANDWIDTHLIMITER_H
#define BANDWIDTHLIMITER_H

#include <QtGlobal>

/**
 * @brief Average-rate limiter for one transfer.
 *
 * The limiter compares the bytes moved since the transfer started against
 * the time they are allowed to take and returns how long the caller has to
 * wait to get back under the limit.
 */
class BandwidthLimiter
{
public:
    /**
     * @param bytesPerSecond Limit; 0 or less disables limiting.
     */
    explicit BandwidthLimiter(qint64 bytesPerSecond = 0)
        : bytesPerSecond_(bytesPerSecond)
    {
    }

    [[nodiscard]] bool isEnabled() const { return bytesPerSecond_ > 0; }
    [[nodiscard]] qint64 limit() const { return bytesPerSecond_; }

    /**
     * @brief Milliseconds to wait before moving more data.
     * @param elapsedMs Time since the transfer started.
     * @param bytes Bytes moved since the transfer started.
     */
    [[nodiscard]] qint64 delayMs(qint64 elapsedMs, qint64 bytes) const
    {
        if (!isEnabled() || bytes <= 0) {
            return 0;
        }
        const qint64 allowedMs = bytes * 1000 / bytesPerSecond_;
        return allowedMs > elapsedMs ? allowedMs - elapsedMs : 0;
    }

private:
    qint64 bytesPerSecond_;
};

#endif // BANDWIDTHLIMITER_H
