/**
 * @file ratemeter.h
 * @brief Rolling transfer rate and ETA estimation.
 *
 * Keeps (time, bytes) samples over a fixed time window and derives the
 * average rate over that window, so short stalls and bursts are smoothed.
 */

#ifndef RATEMETER_H
#define RATEMETER_H

#include <QtGlobal>

#include <cmath>
#include <deque>

/**
 * @brief Calculates transfer speed over a rolling time window.
 *
 * The caller supplies timestamps, which keeps the meter deterministic in
 * tests.
 *
 * @par Example usage:
 * @code
 * RateMeter meter(5000);  // 5 second window
 * meter.addSample(0, 0);
 * meter.addSample(1000, 65536);
 * double bps = meter.bytesPerSecond();       // 65536
 * qint64 eta = meter.etaSeconds(131072);     // 2
 * @endcode
 */
class RateMeter
{
public:
    /**
     * @brief Constructs a meter.
     * @param windowMs Samples older than this relative to the newest are dropped.
     */
    explicit RateMeter(qint64 windowMs = 5000)
        : windowMs_(windowMs)
    {
    }

    /**
     * @brief Records the cumulative byte count at a point in time.
     * @param timeMs Monotonic time in milliseconds.
     * @param totalBytes Bytes transferred so far.
     */
    void addSample(qint64 timeMs, qint64 totalBytes)
    {
        if (!samples_.empty() && timeMs < samples_.back().timeMs) {
            return;
        }
        samples_.push_back(Sample{timeMs, totalBytes});

        // Keep one sample at or beyond the window edge as the baseline
        while (samples_.size() > 2 && timeMs - samples_[1].timeMs >= windowMs_) {
            samples_.pop_front();
        }
    }

    /**
     * @brief Returns the average rate across the window.
     * @return Bytes per second, or 0.0 with fewer than two samples.
     */
    [[nodiscard]] double bytesPerSecond() const
    {
        if (samples_.size() < 2) {
            return 0.0;
        }
        const Sample &first = samples_.front();
        const Sample &last = samples_.back();
        const qint64 elapsedMs = last.timeMs - first.timeMs;
        if (elapsedMs <= 0) {
            return 0.0;
        }
        return static_cast<double>(last.bytes - first.bytes) * 1000.0 / static_cast<double>(elapsedMs);
    }

    /**
     * @brief Estimates the seconds needed for the remaining bytes.
     * @return Seconds rounded up, or -1 if the rate is unknown.
     */
    [[nodiscard]] qint64 etaSeconds(qint64 remainingBytes) const
    {
        const double rate = bytesPerSecond();
        if (rate <= 0.0 || remainingBytes < 0) {
            return -1;
        }
        return static_cast<qint64>(std::ceil(static_cast<double>(remainingBytes) / rate));
    }

    /**
     * @brief Returns the number of samples currently kept.
     */
    [[nodiscard]] size_t count() const
    {
        return samples_.size();
    }

    /**
     * @brief Clears all samples.
     */
    void clear()
    {
        samples_.clear();
    }

private:
    struct Sample {
        qint64 timeMs;
        qint64 bytes;
    };

    qint64 windowMs_;
    std::deque<Sample> samples_;
};

#endif // RATEMETER_H
