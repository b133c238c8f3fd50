/**
 * @file clock.hpp
 * @brief Time source and sleeper abstraction for RollingVault.
 *
 * Every bounded wait in the system (credential polling, probe backoff, daemon
 * scheduling) goes through a Clock so that tests can substitute a fake one and
 * never block on real time.
 */

#ifndef CLOCK_HPP
#define CLOCK_HPP

#include <chrono>
#include <string>

/**
 * @brief Interface for reading the wall clock and sleeping.
 */
class Clock {
public:
    virtual ~Clock() = default;

    /**
     * @brief Returns the current wall-clock time.
     */
    virtual std::chrono::system_clock::time_point now() const = 0;

    /**
     * @brief Blocks the calling thread for the given duration.
     */
    virtual void sleepFor(std::chrono::milliseconds duration) = 0;
};

/**
 * @brief Clock backed by std::chrono::system_clock and std::this_thread::sleep_for.
 */
class SystemClock : public Clock {
public:
    std::chrono::system_clock::time_point now() const override;
    void sleepFor(std::chrono::milliseconds duration) override;
};

/**
 * @brief Formats a time point as ISO-8601 UTC with second precision ("2024-01-31T02:00:00Z").
 */
std::string formatIsoUtc(std::chrono::system_clock::time_point time);

#endif // CLOCK_HPP
