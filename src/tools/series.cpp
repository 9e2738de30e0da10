/**
 * @file series.cpp
 * @brief Implementation of Series.
 */

#include "tools/series.hpp"
#include "errors.hpp"

#include <cmath>

namespace powerfolio
{
    namespace tools
    {

        Series::Series(TimeIndex index, Eigen::VectorXd values, std::optional<std::string> unit)
            : index_(std::move(index)), values_(std::move(values)), unit_(std::move(unit))
        {
            if (static_cast<size_t>(values_.size()) != index_.size())
            {
                throw IndexError("Series has " + std::to_string(values_.size()) + " values but index has " +
                                 std::to_string(index_.size()) + " periods");
            }
        }

        Series Series::constant(const TimeIndex &index, double value, std::optional<std::string> unit)
        {
            return Series(index, Eigen::VectorXd::Constant(static_cast<Eigen::Index>(index.size()), value),
                          std::move(unit));
        }

        double Series::at(Timestamp ts) const
        {
            auto pos = index_.position(ts);
            if (!pos)
            {
                throw KeyError("No period starts at " + format_timestamp(ts));
            }
            return values_(static_cast<Eigen::Index>(*pos));
        }

        Series Series::reindex(const TimeIndex &sub) const
        {
            if (sub == index_)
            {
                return *this;
            }
            if (!sub.is_compatible(index_))
            {
                throw IndexError("Cannot reindex " + index_.describe() + " onto " + sub.describe());
            }
            if (sub.empty())
            {
                return Series(sub, Eigen::VectorXd(0), unit_);
            }
            auto first = index_.position(sub.start());
            if (!first || *first + sub.size() > index_.size())
            {
                throw IndexError("Index " + sub.describe() + " is not part of " + index_.describe());
            }
            return Series(sub, values_.segment(static_cast<Eigen::Index>(*first), static_cast<Eigen::Index>(sub.size())),
                          unit_);
        }

        Series Series::loc(Timestamp from, Timestamp to) const
        {
            return reindex(index_.loc(from, to));
        }

        Series Series::with_unit(std::optional<std::string> unit) const
        {
            return Series(index_, values_, std::move(unit));
        }

        bool Series::approx_equal(const Series &other, double rtol, double atol) const
        {
            return index_ == other.index_ && all_close(values_, other.values_, rtol, atol);
        }

        bool all_close(const Eigen::VectorXd &a, const Eigen::VectorXd &b, double rtol, double atol)
        {
            if (a.size() != b.size())
            {
                return false;
            }
            for (Eigen::Index i = 0; i < a.size(); ++i)
            {
                const bool na = std::isnan(a(i));
                const bool nb = std::isnan(b(i));
                if (na || nb)
                {
                    if (na != nb)
                        return false;
                    continue;
                }
                if (std::abs(a(i) - b(i)) > atol + rtol * std::abs(b(i)))
                {
                    return false;
                }
            }
            return true;
        }

    } // namespace tools
} // namespace powerfolio
