/**
 * @file hedge.cpp
 * @brief Implementation of the base-product hedge.
 */

#include "tools/hedge.hpp"
#include "tools/resample.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace powerfolio
{
    namespace tools
    {

        HedgeMethod parse_hedge_method(const std::string &text)
        {
            std::string s = text;
            std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            if (s == "vol" || s == "volume")
                return HedgeMethod::VOLUME;
            if (s == "val" || s == "value")
                return HedgeMethod::VALUE;
            throw std::invalid_argument("Hedge method must be 'vol' or 'val', got: " + text);
        }

        std::pair<Series, Series> hedge(const Series &w, const Series &p, HedgeMethod how, Frequency freq)
        {
            if (!w.index().is_compatible(p.index()))
            {
                throw IndexError("Power and price must have compatible indices: " + w.index().describe() + " vs " +
                                 p.index().describe());
            }
            if (up_or_down(w.index().freq(), Frequency::DAY) > 0)
            {
                throw IndexError("Can only hedge a timeseries with daily (or shorter) values, got frequency " +
                                 to_string(w.index().freq()));
            }
            if (is_subdaily(freq) || up_or_down(w.index().freq(), freq) > 0)
            {
                throw IndexError("Hedge product frequency must be daily or longer, and not shorter than the data; got " +
                                 to_string(freq));
            }

            TimeIndex common = w.index().intersect(p.index());
            if (common.empty())
            {
                throw IndexError("Power and price do not overlap in time");
            }
            TimeIndex products = resample::index(common, freq);
            TimeIndex fine = common.loc(products.start(), products.end());

            const Eigen::VectorXd wv = w.reindex(fine).values();
            const Eigen::VectorXd pv = p.reindex(fine).values();
            const Eigen::VectorXd hours = fine.duration_hours();

            Eigen::VectorXd w_out(wv.size());
            Eigen::VectorXd p_out(pv.size());

            Eigen::Index pos = 0;
            for (size_t j = 0; j < products.size(); ++j)
            {
                Eigen::Index n = 0;
                while (pos + n < wv.size() && fine[static_cast<size_t>(pos + n)] < products.right(j))
                {
                    ++n;
                }
                auto d = hours.segment(pos, n);
                auto wseg = wv.segment(pos, n);
                auto pseg = pv.segment(pos, n);

                const double p_hedge = pseg.dot(d) / d.sum();
                Eigen::VectorXd weights = (how == HedgeMethod::VOLUME) ? Eigen::VectorXd(d)
                                                                        : Eigen::VectorXd(pseg.cwiseProduct(d));
                const double w_hedge = wseg.dot(weights) / weights.sum();

                w_out.segment(pos, n).setConstant(w_hedge);
                p_out.segment(pos, n).setConstant(p_hedge);
                pos += n;
            }

            return {Series(fine, w_out, w.unit()), Series(fine, p_out, p.unit())};
        }

    } // namespace tools
} // namespace powerfolio
