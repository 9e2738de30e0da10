/**
 * @file time_index.cpp
 * @brief Implementation of TimeIndex.
 */

#include "tools/time_index.hpp"
#include "errors.hpp"

#include <algorithm>

namespace powerfolio
{
    namespace tools
    {

        namespace
        {
            std::shared_ptr<const std::vector<Timestamp>> make_stamps(Timestamp start, size_t size, Frequency freq)
            {
                auto stamps = std::make_shared<std::vector<Timestamp>>();
                stamps->reserve(size + 1);
                Timestamp ts = start;
                stamps->push_back(ts);
                for (size_t i = 0; i < size; ++i)
                {
                    ts = next_stamp(ts, freq);
                    stamps->push_back(ts);
                }
                return stamps;
            }
        }

        // ============================================================================
        // Constructors
        // ============================================================================

        TimeIndex::TimeIndex()
            : freq_(Frequency::DAY), start_of_day_(0), tz_(), stamps_(make_stamps(Timestamp(Minutes(0)), 0, Frequency::DAY))
        {
        }

        TimeIndex::TimeIndex(Timestamp start, size_t size, Frequency freq,
                             Minutes start_of_day, std::string tz)
            : freq_(freq), start_of_day_(start_of_day), tz_(std::move(tz))
        {
            if (start_of_day_.count() < 0 || start_of_day_.count() >= 24 * 60 || start_of_day_.count() % 15 != 0)
            {
                throw IndexError("Start-of-day must be a multiple of 15 minutes within one day, got " +
                                 std::to_string(start_of_day_.count()) + " minutes");
            }
            if (!is_boundary(start, freq_, start_of_day_))
            {
                throw IndexError("Timestamp " + format_timestamp(start) + " is not the start of a period with frequency " +
                                 to_string(freq_));
            }
            stamps_ = make_stamps(start, size, freq_);
        }

        TimeIndex TimeIndex::from_range(Timestamp start, Timestamp end, Frequency freq,
                                        Minutes start_of_day, std::string tz)
        {
            if (end < start)
            {
                throw IndexError("End of range precedes its start");
            }
            if (!is_boundary(end, freq, start_of_day))
            {
                throw IndexError("Timestamp " + format_timestamp(end) + " is not a period boundary with frequency " +
                                 to_string(freq));
            }
            size_t count = 0;
            for (Timestamp ts = start; ts < end; ts = next_stamp(ts, freq))
            {
                ++count;
            }
            return TimeIndex(start, count, freq, start_of_day, std::move(tz));
        }

        // ============================================================================
        // Access
        // ============================================================================

        Timestamp TimeIndex::stamp(size_t i) const
        {
            if (i >= size())
            {
                throw IndexError("Position " + std::to_string(i) + " out of range for index of size " +
                                 std::to_string(size()));
            }
            return (*stamps_)[i];
        }

        Timestamp TimeIndex::right(size_t i) const
        {
            if (i >= size())
            {
                throw IndexError("Position " + std::to_string(i) + " out of range for index of size " +
                                 std::to_string(size()));
            }
            return (*stamps_)[i + 1];
        }

        Eigen::VectorXd TimeIndex::duration_hours() const
        {
            const auto n = static_cast<Eigen::Index>(size());
            if (freq_ == Frequency::QUARTERHOUR)
            {
                return Eigen::VectorXd::Constant(n, 0.25);
            }
            if (freq_ == Frequency::HOUR)
            {
                return Eigen::VectorXd::Ones(n);
            }
            Eigen::VectorXd hours(n);
            for (Eigen::Index i = 0; i < n; ++i)
            {
                hours(i) = static_cast<double>(((*stamps_)[i + 1] - (*stamps_)[i]).count()) / 60.0;
            }
            return hours;
        }

        // ============================================================================
        // Sub-indices
        // ============================================================================

        TimeIndex TimeIndex::slice(size_t first, size_t count) const
        {
            if (first > size() || count > size() - first)
            {
                throw IndexError("Slice [" + std::to_string(first) + ", " + std::to_string(first + count) +
                                 ") exceeds index of size " + std::to_string(size()));
            }
            TimeIndex result = *this;
            auto stamps = std::make_shared<std::vector<Timestamp>>(
                stamps_->begin() + static_cast<std::ptrdiff_t>(first),
                stamps_->begin() + static_cast<std::ptrdiff_t>(first + count + 1));
            result.stamps_ = stamps;
            return result;
        }

        TimeIndex TimeIndex::loc(Timestamp from, Timestamp to) const
        {
            // First period starting at or after `from`; last period ending at or before `to`.
            auto lo = std::lower_bound(stamps_->begin(), stamps_->end() - 1, from);
            auto hi = std::upper_bound(stamps_->begin(), stamps_->end(), to);
            size_t first = static_cast<size_t>(lo - stamps_->begin());
            size_t last_boundary = hi == stamps_->begin() ? 0 : static_cast<size_t>(hi - stamps_->begin()) - 1;
            if (last_boundary <= first)
            {
                return slice(std::min(first, size()), 0);
            }
            return slice(first, last_boundary - first);
        }

        std::optional<size_t> TimeIndex::position(Timestamp ts) const
        {
            auto it = std::lower_bound(stamps_->begin(), stamps_->end() - 1, ts);
            if (it == stamps_->end() - 1 || *it != ts)
            {
                return std::nullopt;
            }
            return static_cast<size_t>(it - stamps_->begin());
        }

        bool TimeIndex::is_compatible(const TimeIndex &other) const
        {
            return freq_ == other.freq_ && start_of_day_ == other.start_of_day_ && tz_ == other.tz_;
        }

        TimeIndex TimeIndex::intersect(const TimeIndex &other) const
        {
            if (!is_compatible(other))
            {
                throw IndexError("Indices are not compatible: " + describe() + " vs " + other.describe());
            }
            Timestamp from = std::max(start(), other.start());
            Timestamp to = std::min(end(), other.end());
            if (to <= from)
            {
                return TimeIndex(from, 0, freq_, start_of_day_, tz_);
            }
            return loc(from, to);
        }

        std::string TimeIndex::describe() const
        {
            std::string text = "[" + format_timestamp(start()) + ", " + format_timestamp(end()) + ") freq=" +
                               to_string(freq_) + " periods=" + std::to_string(size());
            if (start_of_day_.count() != 0)
            {
                text += " start_of_day=" + std::to_string(start_of_day_.count()) + "min";
            }
            if (!tz_.empty())
            {
                text += " tz=" + tz_;
            }
            return text;
        }

        bool TimeIndex::operator==(const TimeIndex &other) const
        {
            return is_compatible(other) && size() == other.size() && start() == other.start();
        }

    } // namespace tools
} // namespace powerfolio
