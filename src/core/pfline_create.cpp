/**
 * @file pfline_create.cpp
 * @brief Kind inference and consistency checks for new portfolio lines
 */

#include "core/pfline_create.hpp"
#include "errors.hpp"

#include <cmath>
#include <limits>

namespace powerfolio
{
    namespace core
    {

        namespace
        {
            const double NaN = std::numeric_limits<double>::quiet_NaN();

            char tag_of_key(const std::string &key)
            {
                if (key.size() == 1 && (key[0] == 'w' || key[0] == 'q' || key[0] == 'p' || key[0] == 'r'))
                {
                    return key[0];
                }
                throw AmbiguousDimensionError("Unknown dimension key '" + key + "'; expected one of w, q, p, r");
            }

            char tag_of_dimension(units::Dimension dimension)
            {
                switch (dimension)
                {
                case units::Dimension::POWER:
                    return 'w';
                case units::Dimension::ENERGY:
                    return 'q';
                case units::Dimension::PRICE:
                    return 'p';
                case units::Dimension::REVENUE:
                    return 'r';
                case units::Dimension::DIMENSIONLESS:
                    break;
                }
                throw AmbiguousDimensionError("A dimensionless value does not describe a portfolio line");
            }

            // Conversion factor of a value stored under tag; untagged values are canonical.
            double factor_for(const std::optional<std::string> &unit, char tag, const Context &ctx)
            {
                if (!unit)
                {
                    return 1.0;
                }

                const units::Dimension expected = column_dimension(tag);
                const units::Dimension actual = ctx.registry().dimension_of(*unit);
                if (actual == units::Dimension::DIMENSIONLESS)
                {
                    throw AmbiguousDimensionError(std::string("Value for '") + tag + "' is dimensionless ('" + *unit +
                                                  "'); expected " + units::to_string(expected));
                }
                if (actual != expected)
                {
                    throw AmbiguousDimensionError(std::string("Value for '") + tag + "' has unit '" + *unit + "' (" +
                                                  units::to_string(actual) + "); expected " +
                                                  units::to_string(expected));
                }
                return ctx.registry().factor_of(*unit);
            }

            tools::TimeIndex common_index(const ColumnData &data, const std::optional<tools::TimeIndex> &index)
            {
                if (index)
                {
                    return *index;
                }

                const tools::TimeIndex *found = nullptr;
                for (const auto &kv : data)
                {
                    const auto *series = std::get_if<tools::Series>(&kv.second);
                    if (!series)
                    {
                        continue;
                    }
                    if (!found)
                    {
                        found = &series->index();
                    }
                    else if (series->index() != *found)
                    {
                        throw IndexError("All series must share one index; '" + kv.first + "' has " +
                                         series->index().describe() + ", expected " + found->describe());
                    }
                }

                if (!found)
                {
                    throw IndexError("An index is needed when only scalar values are given");
                }
                return *found;
            }

            Eigen::VectorXd canonical(const Value &value, char tag, const tools::TimeIndex &index, const Context &ctx)
            {
                const auto n = static_cast<Eigen::Index>(index.size());

                if (const auto *number = std::get_if<double>(&value))
                {
                    return Eigen::VectorXd::Constant(n, *number);
                }
                if (const auto *quantity = std::get_if<units::Quantity>(&value))
                {
                    return Eigen::VectorXd::Constant(n, quantity->magnitude * factor_for(quantity->unit, tag, ctx));
                }

                const auto &series = std::get<tools::Series>(value);
                const double factor = factor_for(series.unit(), tag, ctx);
                return series.reindex(index).values() * factor;
            }
        }

        PfLine create_flat(const ColumnData &data, const Context &ctx, const std::optional<tools::TimeIndex> &index)
        {
            if (data.empty())
            {
                throw InsufficientDataError("No values given; need at least one of w, q, p, r");
            }
            for (const auto &kv : data)
            {
                tag_of_key(kv.first);
            }

            const tools::TimeIndex idx = common_index(data, index);

            std::optional<Eigen::VectorXd> w, q, p, r;
            for (const auto &kv : data)
            {
                const char tag = tag_of_key(kv.first);
                Eigen::VectorXd values = canonical(kv.second, tag, idx, ctx);
                switch (tag)
                {
                case 'w':
                    w = std::move(values);
                    break;
                case 'q':
                    q = std::move(values);
                    break;
                case 'p':
                    p = std::move(values);
                    break;
                default:
                    r = std::move(values);
                    break;
                }
            }

            // Volume from power and/or energy.
            if (w)
            {
                Eigen::VectorXd q_from_w = w->cwiseProduct(idx.duration_hours());
                if (q && !ctx.close(*q, q_from_w))
                {
                    throw ConsistencyError("Power and energy values do not match (q != w * duration)");
                }
                if (!q)
                {
                    q = std::move(q_from_w);
                }
            }

            if (q && !p && !r)
            {
                return PfLine::flat_volume(idx, *q);
            }
            if (p && !q && !r)
            {
                return PfLine::flat_price(idx, *p);
            }
            if (r && !q && !p)
            {
                return PfLine::flat_revenue(idx, *r);
            }

            // Complete: derive the missing dimension or check the supplied ones.
            const Eigen::Index n = static_cast<Eigen::Index>(idx.size());
            if (q && p && r)
            {
                if (!ctx.close(*r, p->cwiseProduct(*q)))
                {
                    throw ConsistencyError("Volume, price and revenue values do not match (r != p * q)");
                }
            }
            else if (q && p)
            {
                r = p->cwiseProduct(*q);
            }
            else if (q && r)
            {
                p = Eigen::VectorXd(n);
                for (Eigen::Index i = 0; i < n; ++i)
                {
                    if ((*q)(i) != 0.0)
                        (*p)(i) = (*r)(i) / (*q)(i);
                    else if ((*r)(i) == 0.0)
                        (*p)(i) = NaN;
                    else
                        throw ConsistencyError("Revenue without volume in period " +
                                               tools::format_timestamp(idx[static_cast<size_t>(i)]));
                }
            }
            else
            {
                q = Eigen::VectorXd(n);
                for (Eigen::Index i = 0; i < n; ++i)
                {
                    if ((*p)(i) != 0.0)
                        (*q)(i) = (*r)(i) / (*p)(i);
                    else if ((*r)(i) == 0.0)
                        throw InsufficientDataError("Volume cannot be derived where price and revenue are zero (" +
                                                    tools::format_timestamp(idx[static_cast<size_t>(i)]) + ")");
                    else
                        throw ConsistencyError("Revenue at zero price in period " +
                                               tools::format_timestamp(idx[static_cast<size_t>(i)]));
                }
            }

            return PfLine::flat_complete(idx, *q, *p, *r);
        }

        PfLine create_nested(const ChildData &children, const Context &ctx, const std::optional<tools::TimeIndex> &index)
        {
            if (children.empty())
            {
                throw InvariantError("A nested portfolio line needs at least one child");
            }

            Children lines;
            for (const auto &kv : children)
            {
                if (const auto *line = std::get_if<PfLine>(&kv.second))
                {
                    lines.emplace_back(kv.first, index ? line->reindex(*index) : *line);
                }
                else
                {
                    lines.emplace_back(kv.first, create_flat(std::get<ColumnData>(kv.second), ctx, index));
                }
            }
            return PfLine::nested(std::move(lines));
        }

        PfLine create_from_series(const tools::Series &series, const Context &ctx)
        {
            if (!series.unit())
            {
                throw AmbiguousDimensionError("Cannot infer the dimension of a series without unit");
            }
            const char tag = tag_of_dimension(ctx.registry().dimension_of(*series.unit()));
            return create_flat(ColumnData{{std::string(1, tag), series}}, ctx);
        }

        PfLine create_from_quantity(const units::Quantity &quantity, const tools::TimeIndex &index, const Context &ctx)
        {
            if (!quantity.unit)
            {
                throw AmbiguousDimensionError("Cannot infer the dimension of a value without unit");
            }
            const char tag = tag_of_dimension(ctx.registry().dimension_of(*quantity.unit));
            return create_flat(ColumnData{{std::string(1, tag), quantity}}, ctx, index);
        }

    } // namespace core
} // namespace powerfolio
