/**
 * @file pfline.cpp
 * @brief Implementation of PfLine
 */

#include "core/pfline.hpp"
#include "errors.hpp"
#include "tools/resample.hpp"

#include <cmath>
#include <limits>
#include <set>
#include <variant>

namespace powerfolio
{
    namespace core
    {

        struct PfLine::FlatData
        {
            Kind kind;
            Eigen::VectorXd q; ///< empty unless VOLUME or COMPLETE
            Eigen::VectorXd p; ///< empty unless PRICE or COMPLETE
            Eigen::VectorXd r; ///< empty unless REVENUE or COMPLETE
        };

        struct PfLine::NestedData
        {
            Children children;
            FlatData aggregate;
        };

        struct PfLine::Impl
        {
            tools::TimeIndex index;
            std::variant<FlatData, NestedData> data;
        };

        namespace
        {
            const double NaN = std::numeric_limits<double>::quiet_NaN();

            Eigen::VectorXd cut(const tools::TimeIndex &index, const Eigen::VectorXd &values, const tools::TimeIndex &sub)
            {
                if (values.size() == 0)
                {
                    return values;
                }
                return tools::Series(index, values).reindex(sub).values();
            }

            // Energies and revenues are summable, powers and prices averagable.
            tools::Series resampled(const tools::TimeIndex &index, const Eigen::VectorXd &values, char tag,
                                    tools::Frequency freq)
            {
                namespace rs = tools::resample;
                const rs::Semantic semantic =
                    (tag == 'q' || tag == 'r') ? rs::Semantic::SUMMABLE : rs::Semantic::AVERAGABLE;
                return rs::general(semantic, tools::Series(index, values), freq);
            }

            bool same_value(double a, double b)
            {
                return (std::isnan(a) && std::isnan(b)) || a == b;
            }
        }

        Eigen::VectorXd combined_price(const Eigen::VectorXd &q, const Eigen::VectorXd &r,
                                       const std::vector<Eigen::VectorXd> &part_prices)
        {
            Eigen::VectorXd p(q.size());
            for (Eigen::Index i = 0; i < q.size(); ++i)
            {
                if (q(i) != 0.0)
                {
                    p(i) = r(i) / q(i);
                    continue;
                }

                // No volume: keep the price only if all parts agree on it.
                p(i) = part_prices.empty() ? NaN : part_prices.front()(i);
                for (const auto &part : part_prices)
                {
                    if (!same_value(part(i), p(i)))
                    {
                        p(i) = NaN;
                        break;
                    }
                }
            }
            return p;
        }

        // ============================================================================
        // Construction
        // ============================================================================

        PfLine::PfLine(std::shared_ptr<const Impl> impl)
            : impl_(std::move(impl))
        {
        }

        PfLine PfLine::make_flat(const tools::TimeIndex &index, FlatData data)
        {
            const auto n = static_cast<Eigen::Index>(index.size());
            for (char tag : {'q', 'p', 'r'})
            {
                if (!has_column(data.kind, tag))
                {
                    continue;
                }
                const Eigen::VectorXd &v = tag == 'q' ? data.q : (tag == 'p' ? data.p : data.r);
                if (v.size() != n)
                {
                    throw IndexError(std::string("Values for '") + tag + "' have " + std::to_string(v.size()) +
                                     " elements but index has " + std::to_string(n) + " periods");
                }
            }

            auto impl = std::make_shared<Impl>(Impl{index, std::move(data)});
            return PfLine(std::move(impl));
        }

        PfLine PfLine::flat_volume(const tools::TimeIndex &index, const Eigen::VectorXd &q)
        {
            return make_flat(index, FlatData{Kind::VOLUME, q, Eigen::VectorXd(), Eigen::VectorXd()});
        }

        PfLine PfLine::flat_price(const tools::TimeIndex &index, const Eigen::VectorXd &p)
        {
            return make_flat(index, FlatData{Kind::PRICE, Eigen::VectorXd(), p, Eigen::VectorXd()});
        }

        PfLine PfLine::flat_revenue(const tools::TimeIndex &index, const Eigen::VectorXd &r)
        {
            return make_flat(index, FlatData{Kind::REVENUE, Eigen::VectorXd(), Eigen::VectorXd(), r});
        }

        PfLine PfLine::flat_complete(const tools::TimeIndex &index, const Eigen::VectorXd &q,
                                     const Eigen::VectorXd &p, const Eigen::VectorXd &r)
        {
            return make_flat(index, FlatData{Kind::COMPLETE, q, p, r});
        }

        void PfLine::check_child_name(const std::string &name)
        {
            if (name.empty())
            {
                throw InvariantError("Child name must not be empty");
            }
            if (name == "w" || name == "q" || name == "p" || name == "r")
            {
                throw InvariantError("Child name '" + name + "' is reserved for a dimension");
            }
        }

        PfLine::FlatData PfLine::aggregate(const Children &children)
        {
            const Kind kind = children.front().second.kind();
            const auto n = static_cast<Eigen::Index>(children.front().second.index().size());

            FlatData agg{kind, Eigen::VectorXd(), Eigen::VectorXd(), Eigen::VectorXd()};
            for (char tag : summable_columns(kind))
            {
                Eigen::VectorXd &target = tag == 'q' ? agg.q : (tag == 'p' ? agg.p : agg.r);
                target = Eigen::VectorXd::Zero(n);
            }

            std::vector<Eigen::VectorXd> prices;
            for (const auto &kv : children)
            {
                const FlatData &v = kv.second.values();
                if (agg.q.size())
                    agg.q += v.q;
                if (agg.r.size())
                    agg.r += v.r;
                if (kind == Kind::PRICE)
                    agg.p += v.p;
                else if (kind == Kind::COMPLETE)
                    prices.push_back(v.p);
            }

            if (kind == Kind::COMPLETE)
            {
                agg.p = combined_price(agg.q, agg.r, prices);
            }
            return agg;
        }

        PfLine PfLine::nested(Children children)
        {
            if (children.empty())
            {
                throw InvariantError("A nested portfolio line needs at least one child");
            }

            const PfLine &first = children.front().second;
            std::set<std::string> seen;
            for (const auto &kv : children)
            {
                check_child_name(kv.first);
                if (!seen.insert(kv.first).second)
                {
                    throw InvariantError("Duplicate child name '" + kv.first + "'");
                }
                if (kv.second.kind() != first.kind())
                {
                    throw ShapeError("All children must have the same kind; '" + kv.first + "' is " +
                                     to_string(kv.second.kind()) + ", expected " + to_string(first.kind()));
                }
                if (kv.second.index() != first.index())
                {
                    throw ShapeError("All children must have the same index; '" + kv.first + "' has " +
                                     kv.second.index().describe() + ", expected " + first.index().describe());
                }
            }

            tools::TimeIndex index = first.index();
            FlatData agg = aggregate(children);
            auto impl = std::make_shared<Impl>(Impl{std::move(index), NestedData{std::move(children), std::move(agg)}});
            return PfLine(std::move(impl));
        }

        // ============================================================================
        // Properties
        // ============================================================================

        const PfLine::FlatData &PfLine::values() const
        {
            if (const auto *flat = std::get_if<FlatData>(&impl_->data))
            {
                return *flat;
            }
            return std::get<NestedData>(impl_->data).aggregate;
        }

        Kind PfLine::kind() const
        {
            return values().kind;
        }

        Structure PfLine::structure() const
        {
            return std::holds_alternative<FlatData>(impl_->data) ? Structure::FLAT : Structure::NESTED;
        }

        const tools::TimeIndex &PfLine::index() const
        {
            return impl_->index;
        }

        tools::Series PfLine::column(char tag) const
        {
            const units::Dimension dimension = column_dimension(tag);
            if (!has_column(kind(), tag))
            {
                throw ShapeError("A " + to_string(kind()) + " line has no '" + std::string(1, tag) + "' values");
            }

            const std::string &unit = units::UnitRegistry::canonical_unit(dimension);
            const FlatData &v = values();
            switch (tag)
            {
            case 'w':
                return tools::Series(index(), v.q.cwiseQuotient(index().duration_hours()), unit);
            case 'q':
                return tools::Series(index(), v.q, unit);
            case 'p':
                return tools::Series(index(), v.p, unit);
            default:
                return tools::Series(index(), v.r, unit);
            }
        }

        tools::Series PfLine::w() const { return column('w'); }
        tools::Series PfLine::q() const { return column('q'); }
        tools::Series PfLine::p() const { return column('p'); }
        tools::Series PfLine::r() const { return column('r'); }

        PfLine PfLine::volume() const
        {
            switch (kind())
            {
            case Kind::VOLUME:
                return *this;
            case Kind::COMPLETE:
                break;
            default:
                throw ShapeError("A " + to_string(kind()) + " line has no volume");
            }

            if (is_flat())
            {
                return flat_volume(index(), values().q);
            }
            Children parts;
            for (const auto &kv : children())
            {
                parts.emplace_back(kv.first, kv.second.volume());
            }
            return nested(std::move(parts));
        }

        PfLine PfLine::price() const
        {
            switch (kind())
            {
            case Kind::PRICE:
                return *this;
            case Kind::COMPLETE:
                return flat_price(index(), values().p);
            default:
                throw ShapeError("A " + to_string(kind()) + " line has no price");
            }
        }

        PfLine PfLine::revenue() const
        {
            switch (kind())
            {
            case Kind::REVENUE:
                return *this;
            case Kind::COMPLETE:
                break;
            default:
                throw ShapeError("A " + to_string(kind()) + " line has no revenue");
            }

            if (is_flat())
            {
                return flat_revenue(index(), values().r);
            }
            Children parts;
            for (const auto &kv : children())
            {
                parts.emplace_back(kv.first, kv.second.revenue());
            }
            return nested(std::move(parts));
        }

        // ============================================================================
        // Children
        // ============================================================================

        const Children &PfLine::children() const
        {
            static const Children none;
            if (const auto *nested_data = std::get_if<NestedData>(&impl_->data))
            {
                return nested_data->children;
            }
            return none;
        }

        bool PfLine::has_child(const std::string &name) const
        {
            for (const auto &kv : children())
            {
                if (kv.first == name)
                    return true;
            }
            return false;
        }

        const PfLine &PfLine::child(const std::string &name) const
        {
            for (const auto &kv : children())
            {
                if (kv.first == name)
                    return kv.second;
            }
            throw KeyError("No child named '" + name + "'");
        }

        std::vector<std::string> PfLine::child_names() const
        {
            std::vector<std::string> names;
            for (const auto &kv : children())
            {
                names.push_back(kv.first);
            }
            return names;
        }

        PfLine PfLine::set_child(const std::string &name, const PfLine &child) const
        {
            if (is_flat())
            {
                throw ShapeError("Cannot set a child on a flat line");
            }
            check_child_name(name);
            if (child.kind() != kind())
            {
                throw ShapeError("Child '" + name + "' is a " + to_string(child.kind()) + " line, expected " +
                                 to_string(kind()));
            }
            if (child.index() != index())
            {
                throw ShapeError("Child '" + name + "' has index " + child.index().describe() + ", expected " +
                                 index().describe());
            }

            Children updated = children();
            bool replaced = false;
            for (auto &kv : updated)
            {
                if (kv.first == name)
                {
                    kv.second = child;
                    replaced = true;
                }
            }
            if (!replaced)
            {
                updated.emplace_back(name, child);
            }
            return nested(std::move(updated));
        }

        PfLine PfLine::drop_child(const std::string &name) const
        {
            if (!has_child(name))
            {
                throw KeyError("No child named '" + name + "'");
            }
            if (num_children() == 1)
            {
                throw InvariantError("Cannot drop '" + name + "', the only child");
            }

            Children remaining;
            for (const auto &kv : children())
            {
                if (kv.first != name)
                    remaining.push_back(kv);
            }
            return nested(std::move(remaining));
        }

        PfLine PfLine::flatten() const
        {
            if (is_flat())
            {
                return *this;
            }
            return make_flat(index(), values());
        }

        // ============================================================================
        // Time
        // ============================================================================

        PfLine PfLine::asfreq(tools::Frequency freq) const
        {
            if (freq == index().freq())
            {
                return *this;
            }

            if (is_nested())
            {
                Children resampled;
                for (const auto &kv : children())
                {
                    resampled.emplace_back(kv.first, kv.second.asfreq(freq));
                }
                return nested(std::move(resampled));
            }

            namespace rs = tools::resample;
            const FlatData &v = values();
            switch (kind())
            {
            case Kind::VOLUME:
            {
                tools::Series q = resampled(index(), v.q, 'q', freq);
                return flat_volume(q.index(), q.values());
            }
            case Kind::PRICE:
            {
                tools::Series p = resampled(index(), v.p, 'p', freq);
                return flat_price(p.index(), p.values());
            }
            case Kind::REVENUE:
            {
                tools::Series r = resampled(index(), v.r, 'r', freq);
                return flat_revenue(r.index(), r.values());
            }
            case Kind::COMPLETE:
                break;
            }

            // Price follows from the resampled energy and revenue; the weighted price only fills periods
            // without volume.
            tools::Series q = resampled(index(), v.q, 'q', freq);
            tools::Series r = resampled(index(), v.r, 'r', freq);
            tools::Series p_weighted = rs::weighted(tools::Series(index(), v.p), tools::Series(index(), v.q), freq);
            return flat_complete(q.index(), q.values(), combined_price(q.values(), r.values(), {p_weighted.values()}),
                                 r.values());
        }

        PfLine PfLine::reindex(const tools::TimeIndex &sub) const
        {
            if (sub == index())
            {
                return *this;
            }

            if (is_nested())
            {
                Children parts;
                for (const auto &kv : children())
                {
                    parts.emplace_back(kv.first, kv.second.reindex(sub));
                }
                return nested(std::move(parts));
            }

            const FlatData &v = values();
            return make_flat(sub, FlatData{v.kind, cut(index(), v.q, sub), cut(index(), v.p, sub), cut(index(), v.r, sub)});
        }

        PfLine PfLine::loc(tools::Timestamp from, tools::Timestamp to) const
        {
            tools::TimeIndex sub = index().loc(from, to);
            if (sub.empty())
            {
                throw IndexError("No period of " + index().describe() + " lies within [" +
                                 tools::format_timestamp(from) + ", " + tools::format_timestamp(to) + ")");
            }
            return reindex(sub);
        }

        PfLine PfLine::hedge_with(const PfLine &prices, tools::HedgeMethod how, tools::Frequency freq) const
        {
            if (!has_column(kind(), 'q'))
            {
                throw ShapeError("Can only hedge a line with volume, got a " + to_string(kind()) + " line");
            }
            if (!has_column(prices.kind(), 'p'))
            {
                throw ShapeError("Hedge prices must come from a line with price, got a " + to_string(prices.kind()) +
                                 " line");
            }

            auto hedged = tools::hedge(w(), prices.p(), how, freq);
            const tools::TimeIndex &idx = hedged.first.index();
            Eigen::VectorXd q = hedged.first.values().cwiseProduct(idx.duration_hours());
            Eigen::VectorXd r = hedged.second.values().cwiseProduct(q);
            return flat_complete(idx, q, hedged.second.values(), r);
        }

        // ============================================================================
        // Comparison
        // ============================================================================

        bool PfLine::equals(const PfLine &other, double rtol, double atol) const
        {
            if (kind() != other.kind() || structure() != other.structure() || index() != other.index())
            {
                return false;
            }

            if (is_nested())
            {
                const Children &mine = children();
                const Children &theirs = other.children();
                if (mine.size() != theirs.size())
                {
                    return false;
                }
                for (size_t i = 0; i < mine.size(); ++i)
                {
                    if (mine[i].first != theirs[i].first || !mine[i].second.equals(theirs[i].second, rtol, atol))
                    {
                        return false;
                    }
                }
                return true;
            }

            const FlatData &a = values();
            const FlatData &b = other.values();
            return tools::all_close(a.q, b.q, rtol, atol) && tools::all_close(a.p, b.p, rtol, atol) &&
                   tools::all_close(a.r, b.r, rtol, atol);
        }

        bool PfLine::is_zero(double atol) const
        {
            const FlatData &v = values();
            for (char tag : summable_columns(kind()))
            {
                const Eigen::VectorXd &x = tag == 'q' ? v.q : (tag == 'p' ? v.p : v.r);
                if (x.size() > 0 && !(x.array().abs() <= atol).all())
                {
                    return false;
                }
            }
            return true;
        }

        std::string PfLine::describe() const
        {
            std::string text = to_string(structure()) + " " + to_string(kind()) + " line";
            if (is_nested())
            {
                text += " with " + std::to_string(num_children()) + " children";
            }
            return text + " on " + index().describe();
        }

    } // namespace core
} // namespace powerfolio
