/**
 * @file concat.cpp
 * @brief Implementation of concat
 */

#include "core/concat.hpp"
#include "errors.hpp"

#include <algorithm>
#include <set>

namespace powerfolio
{
    namespace core
    {

        namespace
        {
            Eigen::VectorXd stack(const std::vector<PfLine> &lines, char tag)
            {
                Eigen::Index total = 0;
                for (const auto &line : lines)
                {
                    total += static_cast<Eigen::Index>(line.index().size());
                }

                Eigen::VectorXd out(total);
                Eigen::Index pos = 0;
                for (const auto &line : lines)
                {
                    const Eigen::VectorXd v = line.column(tag).values();
                    out.segment(pos, v.size()) = v;
                    pos += v.size();
                }
                return out;
            }

            std::set<std::string> names_of(const PfLine &line)
            {
                auto names = line.child_names();
                return std::set<std::string>(names.begin(), names.end());
            }
        }

        PfLine concat(const std::vector<PfLine> &lines)
        {
            if (lines.empty())
            {
                throw InsufficientDataError("Nothing to concatenate");
            }

            std::vector<PfLine> sorted = lines;
            std::stable_sort(sorted.begin(), sorted.end(), [](const PfLine &a, const PfLine &b)
                             { return a.index().start() < b.index().start(); });

            const PfLine &first = sorted.front();
            for (size_t i = 1; i < sorted.size(); ++i)
            {
                const PfLine &prev = sorted[i - 1];
                const PfLine &line = sorted[i];
                if (line.kind() != first.kind())
                {
                    throw ShapeError("Cannot concatenate a " + to_string(first.kind()) + " line and a " +
                                     to_string(line.kind()) + " line");
                }
                if (line.structure() != first.structure())
                {
                    throw ShapeError("Cannot concatenate flat and nested lines");
                }
                if (!line.index().is_compatible(first.index()))
                {
                    throw IndexError("Cannot concatenate incompatible indices: " + first.index().describe() + " and " +
                                     line.index().describe());
                }
                if (line.index().start() != prev.index().end())
                {
                    throw IndexError("Indices must be gapless and without overlap: " + prev.index().describe() +
                                     " is followed by " + line.index().describe());
                }
                if (first.is_nested() && names_of(line) != names_of(first))
                {
                    throw ShapeError("Nested lines must have the same children to be concatenated");
                }
            }

            if (sorted.size() == 1)
            {
                return first;
            }

            size_t total = 0;
            for (const auto &line : sorted)
            {
                total += line.index().size();
            }
            const tools::TimeIndex &idx0 = first.index();
            tools::TimeIndex index(idx0.start(), total, idx0.freq(), idx0.start_of_day(), idx0.tz());

            if (first.is_nested())
            {
                Children parts;
                for (const auto &name : first.child_names())
                {
                    std::vector<PfLine> pieces;
                    for (const auto &line : sorted)
                    {
                        pieces.push_back(line.child(name));
                    }
                    parts.emplace_back(name, concat(pieces));
                }
                return PfLine::nested(std::move(parts));
            }

            switch (first.kind())
            {
            case Kind::VOLUME:
                return PfLine::flat_volume(index, stack(sorted, 'q'));
            case Kind::PRICE:
                return PfLine::flat_price(index, stack(sorted, 'p'));
            case Kind::REVENUE:
                return PfLine::flat_revenue(index, stack(sorted, 'r'));
            case Kind::COMPLETE:
                break;
            }
            return PfLine::flat_complete(index, stack(sorted, 'q'), stack(sorted, 'p'), stack(sorted, 'r'));
        }

        PfState concat(const std::vector<PfState> &states)
        {
            if (states.empty())
            {
                throw InsufficientDataError("Nothing to concatenate");
            }

            std::vector<PfLine> offtake, unsourced_price, sourced;
            for (const auto &state : states)
            {
                offtake.push_back(state.offtake());
                unsourced_price.push_back(state.unsourced_price());
                sourced.push_back(state.sourced());
            }
            return PfState(concat(offtake), concat(unsourced_price), concat(sourced), states.front().context());
        }

    } // namespace core
} // namespace powerfolio
