/**
 * @file resample.cpp
 * @brief Implementation of the resampling engine.
 *
 * Both directions are reduced to one mapping: every coarse period covers a
 * contiguous run of fine periods. Downsampling aggregates each run,
 * upsampling spreads each coarse value over its run.
 */

#include "tools/resample.hpp"
#include "errors.hpp"

#include <cmath>
#include <limits>
#include <vector>

namespace powerfolio
{
    namespace tools
    {
        namespace resample
        {

            namespace
            {
                /**
                 * @brief Number of fine periods in each coarse period.
                 *
                 * fine must cover exactly the same time span as coarse.
                 */
                std::vector<Eigen::Index> run_lengths(const TimeIndex &fine, const TimeIndex &coarse)
                {
                    std::vector<Eigen::Index> lengths(coarse.size(), 0);
                    size_t j = 0;
                    for (size_t i = 0; i < fine.size(); ++i)
                    {
                        while (fine[i] >= coarse.right(j))
                        {
                            ++j;
                        }
                        ++lengths[j];
                    }
                    return lengths;
                }

                /**
                 * @brief Part of s that lies within complete periods of target.
                 */
                Series trimmed(const Series &s, const TimeIndex &target)
                {
                    return s.reindex(s.index().loc(target.start(), target.end()));
                }

                Series downsample_summable(const Series &s, Frequency freq)
                {
                    TimeIndex target = index(s.index(), freq);
                    Series fine = trimmed(s, target);
                    auto lengths = run_lengths(fine.index(), target);

                    Eigen::VectorXd out(static_cast<Eigen::Index>(target.size()));
                    Eigen::Index pos = 0;
                    for (size_t j = 0; j < lengths.size(); ++j)
                    {
                        out(static_cast<Eigen::Index>(j)) = fine.values().segment(pos, lengths[j]).sum();
                        pos += lengths[j];
                    }
                    return Series(target, out, s.unit());
                }

                Series downsample_weighted(const Series &values, const Eigen::VectorXd &weights, Frequency freq)
                {
                    TimeIndex target = index(values.index(), freq);
                    TimeIndex fine_index = values.index().loc(target.start(), target.end());
                    auto first = values.index().position(fine_index.start());
                    const Eigen::Index offset = static_cast<Eigen::Index>(first.value_or(0));
                    auto lengths = run_lengths(fine_index, target);

                    Eigen::VectorXd out(static_cast<Eigen::Index>(target.size()));
                    Eigen::Index pos = offset;
                    for (size_t j = 0; j < lengths.size(); ++j)
                    {
                        const Eigen::Index n = lengths[j];
                        auto v = values.values().segment(pos, n);
                        auto w = weights.segment(pos, n);
                        const double wsum = w.sum();
                        if (wsum != 0.0)
                        {
                            // Values without weight do not count, even if undefined.
                            double total = 0.0;
                            for (Eigen::Index k = 0; k < n; ++k)
                            {
                                if (w(k) != 0.0)
                                    total += v(k) * w(k);
                            }
                            out(static_cast<Eigen::Index>(j)) = total / wsum;
                        }
                        else if ((v.array() == v(0)).all())
                        {
                            out(static_cast<Eigen::Index>(j)) = v(0);
                        }
                        else
                        {
                            out(static_cast<Eigen::Index>(j)) = std::numeric_limits<double>::quiet_NaN();
                        }
                        pos += n;
                    }
                    return Series(target, out, values.unit());
                }

                Series upsample(const Series &s, Frequency freq, bool distribute)
                {
                    TimeIndex target = index(s.index(), freq);
                    auto lengths = run_lengths(target, s.index());
                    Eigen::VectorXd out(static_cast<Eigen::Index>(target.size()));

                    Eigen::Index pos = 0;
                    for (size_t j = 0; j < lengths.size(); ++j)
                    {
                        out.segment(pos, lengths[j]).setConstant(s.values()(static_cast<Eigen::Index>(j)));
                        pos += lengths[j];
                    }

                    if (distribute)
                    {
                        // Constant rate within each source period: share by duration.
                        Eigen::VectorXd source_hours = s.index().duration_hours();
                        Eigen::VectorXd target_hours = target.duration_hours();
                        pos = 0;
                        for (size_t j = 0; j < lengths.size(); ++j)
                        {
                            out.segment(pos, lengths[j]).array() *=
                                target_hours.segment(pos, lengths[j]).array() / source_hours(static_cast<Eigen::Index>(j));
                            pos += lengths[j];
                        }
                    }
                    return Series(target, out, s.unit());
                }
            }

            TimeIndex index(const TimeIndex &source, Frequency freq)
            {
                const int direction = up_or_down(source.freq(), freq);
                if (direction == 0)
                {
                    return source;
                }
                if (direction > 0)
                {
                    return TimeIndex::from_range(source.start(), source.end(), freq, source.start_of_day(), source.tz());
                }

                Timestamp first = ceil_stamp(source.start(), freq, source.start_of_day());
                Timestamp last = floor_stamp(source.end(), freq, source.start_of_day());
                if (last <= first)
                {
                    throw IndexError("No complete period with frequency " + to_string(freq) + " in " + source.describe());
                }
                return TimeIndex::from_range(first, last, freq, source.start_of_day(), source.tz());
            }

            Series summable(const Series &s, Frequency freq)
            {
                const int direction = up_or_down(s.index().freq(), freq);
                if (direction == 0)
                {
                    return s;
                }
                if (direction > 0)
                {
                    return upsample(s, freq, true);
                }
                return downsample_summable(s, freq);
            }

            Series averagable(const Series &s, Frequency freq)
            {
                const int direction = up_or_down(s.index().freq(), freq);
                if (direction == 0)
                {
                    return s;
                }
                if (direction > 0)
                {
                    return upsample(s, freq, false);
                }
                return downsample_weighted(s, s.index().duration_hours(), freq);
            }

            Series general(Semantic semantic, const Series &s, Frequency freq)
            {
                return semantic == Semantic::SUMMABLE ? summable(s, freq) : averagable(s, freq);
            }

            Series weighted(const Series &values, const Series &weights, Frequency freq)
            {
                if (values.index() != weights.index())
                {
                    throw IndexError("Values and weights must share one index: " + values.index().describe() +
                                     " vs " + weights.index().describe());
                }
                const int direction = up_or_down(values.index().freq(), freq);
                if (direction == 0)
                {
                    return values;
                }
                if (direction > 0)
                {
                    return upsample(values, freq, false);
                }
                return downsample_weighted(values, weights.values(), freq);
            }

        } // namespace resample
    } // namespace tools
} // namespace powerfolio
