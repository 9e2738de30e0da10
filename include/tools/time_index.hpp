/**
 * @file time_index.hpp
 * @brief Regular, gapless, left-bound datetime index.
 *
 * A TimeIndex is the sequence of period-start timestamps of consecutive
 * delivery periods of one frequency. Every period starts where the previous
 * one ends. Daily-or-longer periods start at the index' start-of-day offset
 * (e.g. 06:00 for gas markets), and that offset is kept by every index
 * derived from this one (slices, intersections, resampled indices).
 *
 * Timezone: the tz string is a label only; two indices are compatible when
 * their labels match. Period durations are wall-clock durations.
 *
 * Thread safety: Instances are immutable; the stamp table is shared between
 * copies.
 */

#ifndef POWERFOLIO_TOOLS_TIME_INDEX_HPP
#define POWERFOLIO_TOOLS_TIME_INDEX_HPP

#include "tools/calendar.hpp"
#include "tools/frequency.hpp"

#include <Eigen/Dense>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace powerfolio
{
    namespace tools
    {

        /**
         * @class TimeIndex
         * @brief Left-bound timestamps of consecutive delivery periods.
         *
         * Usage:
         * @code
         *   auto start = parse_timestamp("2023-01-01");
         *   TimeIndex quarters(start, 4, Frequency::QUARTER);
         *   Eigen::VectorXd hours = quarters.duration_hours(); // 2160, 2184, 2208, 2208
         * @endcode
         */
        class TimeIndex
        {
        public:
            /**
             * @brief Empty daily index starting at the epoch.
             */
            TimeIndex();

            /**
             * @brief Construct from first timestamp and number of periods.
             * @param start Start of the first period.
             * @param size Number of periods.
             * @param freq Period length.
             * @param start_of_day Offset of the delivery day from midnight.
             * @param tz Timezone label ("" for timezone-agnostic).
             * @throws IndexError if start is not a period boundary of freq, or if
             *         start_of_day is not a multiple of 15 minutes within a day.
             */
            TimeIndex(Timestamp start, size_t size, Frequency freq,
                      Minutes start_of_day = Minutes(0), std::string tz = "");

            /**
             * @brief Construct covering [start, end).
             * @throws IndexError if end is not a period boundary or precedes start.
             */
            static TimeIndex from_range(Timestamp start, Timestamp end, Frequency freq,
                                        Minutes start_of_day = Minutes(0), std::string tz = "");

            /** @brief Number of periods. */
            size_t size() const { return stamps_->size() - 1; }

            /** @brief True if the index has no periods. */
            bool empty() const { return size() == 0; }

            /** @brief Start of period i (unchecked). */
            Timestamp operator[](size_t i) const { return (*stamps_)[i]; }

            /**
             * @brief Start of period i.
             * @throws IndexError if i is out of range.
             */
            Timestamp stamp(size_t i) const;

            /**
             * @brief End (exclusive) of period i.
             * @throws IndexError if i is out of range.
             */
            Timestamp right(size_t i) const;

            /** @brief Start of the first period. */
            Timestamp start() const { return stamps_->front(); }

            /** @brief End (exclusive) of the last period. */
            Timestamp end() const { return stamps_->back(); }

            Frequency freq() const { return freq_; }
            Minutes start_of_day() const { return start_of_day_; }
            const std::string &tz() const { return tz_; }

            /**
             * @brief Duration of every period in hours.
             */
            Eigen::VectorXd duration_hours() const;

            /**
             * @brief Sub-index of count periods starting at position first.
             * @throws IndexError if the range exceeds the index.
             */
            TimeIndex slice(size_t first, size_t count) const;

            /**
             * @brief Periods lying entirely within [from, to).
             */
            TimeIndex loc(Timestamp from, Timestamp to) const;

            /**
             * @brief Position of the period starting at ts, if any.
             */
            std::optional<size_t> position(Timestamp ts) const;

            /**
             * @brief Same frequency, start-of-day and timezone.
             */
            bool is_compatible(const TimeIndex &other) const;

            /**
             * @brief Common periods of two compatible indices (may be empty).
             * @throws IndexError if the indices are not compatible.
             */
            TimeIndex intersect(const TimeIndex &other) const;

            /**
             * @brief Short human-readable description, used in error messages.
             */
            std::string describe() const;

            bool operator==(const TimeIndex &other) const;
            bool operator!=(const TimeIndex &other) const { return !(*this == other); }

        private:
            Frequency freq_;
            Minutes start_of_day_;
            std::string tz_;
            std::shared_ptr<const std::vector<Timestamp>> stamps_; ///< size()+1 boundaries
        };

    } // namespace tools
} // namespace powerfolio

#endif // POWERFOLIO_TOOLS_TIME_INDEX_HPP
