/**
 * @file arithmetic.cpp
 * @brief Operator dispatch over {kind, structure} of both operands
 */

#include "core/arithmetic.hpp"
#include "core/pfline_create.hpp"
#include "errors.hpp"

#include <optional>

namespace powerfolio
{
    namespace core
    {

        namespace
        {
            /**
             * Dimensionless multiplier: a constant, optionally times a series.
             */
            struct Factor
            {
                double constant = 1.0;
                std::optional<tools::Series> series;
            };

            bool is_line(const Operand &x)
            {
                return std::holds_alternative<PfLine>(x);
            }

            const PfLine &line_of(const Operand &x)
            {
                return std::get<PfLine>(x);
            }

            // Factor for untagged numbers/series and explicitly dimensionless values.
            std::optional<Factor> factor_of(const Operand &x, const Context &ctx)
            {
                if (const auto *number = std::get_if<double>(&x))
                {
                    return Factor{*number, std::nullopt};
                }
                if (const auto *quantity = std::get_if<units::Quantity>(&x))
                {
                    if (!quantity->unit)
                    {
                        return Factor{quantity->magnitude, std::nullopt};
                    }
                    if (ctx.registry().dimension_of(*quantity->unit) == units::Dimension::DIMENSIONLESS)
                    {
                        return Factor{ctx.registry().to_canonical(quantity->magnitude, *quantity->unit), std::nullopt};
                    }
                    return std::nullopt;
                }
                if (const auto *series = std::get_if<tools::Series>(&x))
                {
                    if (!series->unit())
                    {
                        return Factor{1.0, *series};
                    }
                    if (ctx.registry().dimension_of(*series->unit()) == units::Dimension::DIMENSIONLESS)
                    {
                        return Factor{ctx.registry().factor_of(*series->unit()), series->with_unit("1")};
                    }
                    return std::nullopt;
                }
                return std::nullopt;
            }

            bool is_bare(const Operand &x)
            {
                if (std::holds_alternative<double>(x))
                    return true;
                if (const auto *quantity = std::get_if<units::Quantity>(&x))
                    return !quantity->unit;
                if (const auto *series = std::get_if<tools::Series>(&x))
                    return !series->unit();
                return false;
            }

            /**
             * Turn a non-line operand into a line next to `other`.
             *
             * Bare numbers become lines of other's kind when bare_kind_ok is set;
             * unit-tagged values become lines of the kind belonging to their
             * dimension.
             */
            PfLine coerce(const Operand &x, const PfLine &other, bool bare_kind_ok, const Context &ctx)
            {
                if (is_line(x))
                {
                    return line_of(x);
                }

                if (is_bare(x))
                {
                    if (!bare_kind_ok)
                    {
                        throw AmbiguousDimensionError("A value without unit cannot be combined with a " +
                                                      to_string(other.kind()) + " line; give it a unit");
                    }
                    const char tag = other.kind() == Kind::PRICE ? 'p' : 'r';
                    if (const auto *series = std::get_if<tools::Series>(&x))
                    {
                        return create_flat(ColumnData{{std::string(1, tag), *series}}, ctx);
                    }
                    const double value = std::holds_alternative<double>(x) ? std::get<double>(x)
                                                                           : std::get<units::Quantity>(x).magnitude;
                    return create_flat(ColumnData{{std::string(1, tag), value}}, ctx, other.index());
                }

                if (const auto *quantity = std::get_if<units::Quantity>(&x))
                {
                    return create_from_quantity(*quantity, other.index(), ctx);
                }
                return create_from_series(std::get<tools::Series>(x), ctx);
            }

            // Cut both lines to their common periods.
            void align(PfLine &a, PfLine &b, const Context &ctx)
            {
                if (a.index() == b.index())
                {
                    return;
                }
                if (!a.index().is_compatible(b.index()))
                {
                    throw IndexError("Operands have incompatible indices: " + a.index().describe() + " and " +
                                     b.index().describe());
                }
                tools::TimeIndex common = a.index().intersect(b.index());
                if (common.empty())
                {
                    throw IndexError("Operands do not overlap in time: " + a.index().describe() + " and " +
                                     b.index().describe());
                }
                ctx.warn(DiagnosticCode::PARTIAL_OVERLAP,
                         "Operands only partially overlap; result is limited to " + common.describe());
                a = a.reindex(common);
                b = b.reindex(common);
            }

            void align(PfLine &a, tools::Series &s, const Context &ctx)
            {
                if (a.index() == s.index())
                {
                    return;
                }
                if (!a.index().is_compatible(s.index()))
                {
                    throw IndexError("Operands have incompatible indices: " + a.index().describe() + " and " +
                                     s.index().describe());
                }
                tools::TimeIndex common = a.index().intersect(s.index());
                if (common.empty())
                {
                    throw IndexError("Operands do not overlap in time: " + a.index().describe() + " and " +
                                     s.index().describe());
                }
                ctx.warn(DiagnosticCode::PARTIAL_OVERLAP,
                         "Operands only partially overlap; result is limited to " + common.describe());
                a = a.reindex(common);
                s = s.reindex(common);
            }

            PfLine flattened_for(const PfLine &nested_line, const PfLine &flat_line, const Context &ctx)
            {
                if (ctx.strict())
                {
                    throw ShapeError("Cannot combine a nested and a flat line (strict mode): " +
                                     nested_line.describe() + " and " + flat_line.describe());
                }
                ctx.warn(DiagnosticCode::FLATTENED_OPERAND,
                         "Nested operand flattened to combine it with a flat line; children are lost (" +
                             nested_line.describe() + ")");
                return nested_line.flatten();
            }

            // Element-wise scaling; index of factor equals index of a.
            PfLine scale_values(const PfLine &a, const Eigen::VectorXd &factor)
            {
                if (a.is_nested())
                {
                    Children parts;
                    for (const auto &kv : a.children())
                    {
                        parts.emplace_back(kv.first, scale_values(kv.second, factor));
                    }
                    return PfLine::nested(std::move(parts));
                }

                switch (a.kind())
                {
                case Kind::VOLUME:
                    return PfLine::flat_volume(a.index(), a.q().values().cwiseProduct(factor));
                case Kind::PRICE:
                    return PfLine::flat_price(a.index(), a.p().values().cwiseProduct(factor));
                case Kind::REVENUE:
                    return PfLine::flat_revenue(a.index(), a.r().values().cwiseProduct(factor));
                case Kind::COMPLETE:
                    break;
                }
                return PfLine::flat_complete(a.index(), a.q().values().cwiseProduct(factor), a.p().values(),
                                             a.r().values().cwiseProduct(factor));
            }

            PfLine add_flat(const PfLine &a, const PfLine &b)
            {
                switch (a.kind())
                {
                case Kind::VOLUME:
                    return PfLine::flat_volume(a.index(), a.q().values() + b.q().values());
                case Kind::PRICE:
                    return PfLine::flat_price(a.index(), a.p().values() + b.p().values());
                case Kind::REVENUE:
                    return PfLine::flat_revenue(a.index(), a.r().values() + b.r().values());
                case Kind::COMPLETE:
                    break;
                }

                Eigen::VectorXd q = a.q().values() + b.q().values();
                Eigen::VectorXd r = a.r().values() + b.r().values();
                Eigen::VectorXd p = combined_price(q, r, {a.p().values(), b.p().values()});
                return PfLine::flat_complete(a.index(), q, p, r);
            }

            PfLine add_lines(PfLine a, PfLine b, const Context &ctx)
            {
                if (a.kind() != b.kind())
                {
                    throw ShapeError("Cannot add a " + to_string(a.kind()) + " line and a " + to_string(b.kind()) +
                                     " line");
                }
                align(a, b, ctx);

                if (a.is_flat() && b.is_flat())
                {
                    return add_flat(a, b);
                }
                if (a.is_nested() && b.is_nested())
                {
                    Children parts;
                    for (const auto &kv : a.children())
                    {
                        if (b.has_child(kv.first))
                            parts.emplace_back(kv.first, add_lines(kv.second, b.child(kv.first), ctx));
                        else
                            parts.emplace_back(kv.first, kv.second);
                    }
                    for (const auto &kv : b.children())
                    {
                        if (!a.has_child(kv.first))
                            parts.emplace_back(kv.first, kv.second);
                    }
                    return PfLine::nested(std::move(parts));
                }
                if (a.is_nested())
                {
                    return add_flat(flattened_for(a, b, ctx), b);
                }
                return add_flat(a, flattened_for(b, a, ctx));
            }

            // Kind of a product or quotient of two lines, looked up in the registry's derivation table
            // on the summable dimension of each kind. Empty if the pair has no portfolio line as result.
            std::optional<Kind> derived_kind(Kind a, units::Operation op, Kind b)
            {
                if (a == Kind::COMPLETE || b == Kind::COMPLETE)
                {
                    return std::nullopt;
                }
                const units::Dimension da = column_dimension(summable_columns(a).front());
                const units::Dimension db = column_dimension(summable_columns(b).front());
                std::optional<units::Dimension> result = units::UnitRegistry::derive(da, op, db);
                if (!result || *result == units::Dimension::DIMENSIONLESS)
                {
                    return std::nullopt;
                }
                return kind_of_dimension(*result);
            }

            PfLine flat_of_kind(Kind kind, const tools::TimeIndex &index, const Eigen::VectorXd &values)
            {
                switch (kind)
                {
                case Kind::VOLUME:
                    return PfLine::flat_volume(index, values);
                case Kind::PRICE:
                    return PfLine::flat_price(index, values);
                case Kind::REVENUE:
                    return PfLine::flat_revenue(index, values);
                case Kind::COMPLETE:
                    break;
                }
                throw ShapeError("A single column does not make a complete line");
            }

            Eigen::VectorXd summable_values(const PfLine &line)
            {
                return line.column(summable_columns(line.kind()).front()).values();
            }

            // Kind-changing product; at most one operand nested.
            PfLine multiply_lines(PfLine a, PfLine b, const Context &ctx)
            {
                const std::optional<Kind> kind = derived_kind(a.kind(), units::Operation::MULTIPLY, b.kind());
                if (!kind)
                {
                    throw ShapeError("Cannot multiply a " + to_string(a.kind()) + " line and a " +
                                     to_string(b.kind()) + " line");
                }
                if (a.is_nested() && b.is_nested())
                {
                    throw ShapeError("Cannot multiply two nested lines");
                }
                align(a, b, ctx);

                if (a.is_nested() || b.is_nested())
                {
                    const PfLine &tree = a.is_nested() ? a : b;
                    const PfLine &leaf = a.is_nested() ? b : a;
                    Children parts;
                    for (const auto &kv : tree.children())
                    {
                        parts.emplace_back(kv.first, multiply_lines(kv.second, leaf, ctx));
                    }
                    return PfLine::nested(std::move(parts));
                }

                return flat_of_kind(*kind, a.index(), summable_values(a).cwiseProduct(summable_values(b)));
            }

            // Kind-changing quotient (REVENUE / PRICE, REVENUE / VOLUME); at most one operand nested.
            PfLine divide_changing(PfLine a, PfLine b, const Context &ctx)
            {
                const std::optional<Kind> kind = derived_kind(a.kind(), units::Operation::DIVIDE, b.kind());
                if (!kind)
                {
                    throw ShapeError("Cannot divide a " + to_string(a.kind()) + " line by a " + to_string(b.kind()) +
                                     " line");
                }
                if (a.is_nested() && b.is_nested())
                {
                    throw ShapeError("Cannot divide two nested lines");
                }
                align(a, b, ctx);

                if (a.is_nested())
                {
                    Children parts;
                    for (const auto &kv : a.children())
                    {
                        parts.emplace_back(kv.first, divide_changing(kv.second, b, ctx));
                    }
                    return PfLine::nested(std::move(parts));
                }
                if (b.is_nested())
                {
                    Children parts;
                    for (const auto &kv : b.children())
                    {
                        parts.emplace_back(kv.first, divide_changing(a, kv.second, ctx));
                    }
                    return PfLine::nested(std::move(parts));
                }

                return flat_of_kind(*kind, a.index(), summable_values(a).cwiseQuotient(summable_values(b)));
            }

            // Ratio of two flat lines of the same (non-complete) kind.
            tools::Series ratio(PfLine a, PfLine b, const Context &ctx)
            {
                if (a.kind() == Kind::COMPLETE)
                {
                    throw ShapeError("Cannot divide two complete lines");
                }
                if (a.is_nested() || b.is_nested())
                {
                    throw ShapeError("Ratio of two " + to_string(a.kind()) + " lines needs flat operands");
                }
                align(a, b, ctx);

                const char tag = summable_columns(a.kind()).front();
                return tools::Series(a.index(), a.column(tag).values().cwiseQuotient(b.column(tag).values()), "1");
            }

            Operand negated(const Operand &x)
            {
                if (const auto *number = std::get_if<double>(&x))
                {
                    return -*number;
                }
                if (const auto *quantity = std::get_if<units::Quantity>(&x))
                {
                    return units::Quantity{-quantity->magnitude, quantity->unit};
                }
                if (const auto *series = std::get_if<tools::Series>(&x))
                {
                    return tools::Series(series->index(), -series->values(), series->unit());
                }
                return -line_of(x);
            }

            const Arithmetic &standard()
            {
                static const Arithmetic arithmetic(Context::standard());
                return arithmetic;
            }
        }

        Arithmetic::Arithmetic(Context ctx)
            : ctx_(std::move(ctx))
        {
        }

        // ============================================================================
        // Scaling
        // ============================================================================

        PfLine Arithmetic::scale(const PfLine &a, double factor) const
        {
            return scale_values(a, Eigen::VectorXd::Constant(static_cast<Eigen::Index>(a.index().size()), factor));
        }

        PfLine Arithmetic::scale(const PfLine &a, const tools::Series &factor) const
        {
            PfLine line = a;
            tools::Series f = factor;
            align(line, f, ctx_);
            return scale_values(line, f.values());
        }

        PfLine Arithmetic::negate(const PfLine &a) const
        {
            return scale(a, -1.0);
        }

        // ============================================================================
        // Addition
        // ============================================================================

        PfLine Arithmetic::add(const Operand &a, const Operand &b) const
        {
            if (is_line(a) && is_line(b))
            {
                return add_lines(line_of(a), line_of(b), ctx_);
            }
            if (is_line(a))
            {
                const PfLine &la = line_of(a);
                const bool bare_ok = la.kind() == Kind::PRICE || la.kind() == Kind::REVENUE;
                return add_lines(la, coerce(b, la, bare_ok, ctx_), ctx_);
            }
            if (is_line(b))
            {
                const PfLine &lb = line_of(b);
                const bool bare_ok = lb.kind() == Kind::PRICE || lb.kind() == Kind::REVENUE;
                return add_lines(coerce(a, lb, bare_ok, ctx_), lb, ctx_);
            }
            throw ShapeError("Addition needs at least one portfolio line");
        }

        PfLine Arithmetic::subtract(const Operand &a, const Operand &b) const
        {
            if (!is_line(a) && !is_line(b))
            {
                throw ShapeError("Subtraction needs at least one portfolio line");
            }
            if (is_line(b))
            {
                return add(a, negate(line_of(b)));
            }
            return add(a, negated(b));
        }

        // ============================================================================
        // Multiplication and division
        // ============================================================================

        PfLine Arithmetic::multiply(const Operand &a, const Operand &b) const
        {
            if (!is_line(a) && !is_line(b))
            {
                throw ShapeError("Multiplication needs at least one portfolio line");
            }

            if (is_line(a))
            {
                if (auto f = factor_of(b, ctx_))
                {
                    PfLine scaled = scale(line_of(a), f->constant);
                    return f->series ? scale(scaled, *f->series) : scaled;
                }
            }
            if (is_line(b))
            {
                if (auto f = factor_of(a, ctx_))
                {
                    PfLine scaled = scale(line_of(b), f->constant);
                    return f->series ? scale(scaled, *f->series) : scaled;
                }
            }

            if (is_line(a))
            {
                const PfLine &la = line_of(a);
                return multiply_lines(la, coerce(b, la, false, ctx_), ctx_);
            }
            const PfLine &lb = line_of(b);
            return multiply_lines(coerce(a, lb, false, ctx_), lb, ctx_);
        }

        Quotient Arithmetic::divide(const Operand &a, const Operand &b) const
        {
            if (!is_line(a) && !is_line(b))
            {
                throw ShapeError("Division needs at least one portfolio line");
            }

            if (!is_line(a))
            {
                if (factor_of(a, ctx_))
                {
                    throw ShapeError("Cannot divide a number by a portfolio line");
                }
                const PfLine &lb = line_of(b);
                PfLine la = coerce(a, lb, false, ctx_);
                if (la.kind() == lb.kind())
                {
                    return ratio(la, lb, ctx_);
                }
                return divide_changing(la, lb, ctx_);
            }

            const PfLine &la = line_of(a);
            if (auto f = factor_of(b, ctx_))
            {
                PfLine scaled = scale(la, 1.0 / f->constant);
                if (!f->series)
                {
                    return scaled;
                }
                const tools::Series &s = *f->series;
                return scale(scaled, tools::Series(s.index(), s.values().cwiseInverse(), s.unit()));
            }

            PfLine lb = coerce(b, la, false, ctx_);
            if (la.kind() == lb.kind())
            {
                return ratio(la, lb, ctx_);
            }
            return divide_changing(la, lb, ctx_);
        }

        // ============================================================================
        // Union
        // ============================================================================

        PfLine Arithmetic::unite(const Operand &a, const Operand &b) const
        {
            if (!is_line(a) && !is_line(b))
            {
                throw ShapeError("Union needs at least one portfolio line");
            }

            PfLine la = is_line(a) ? line_of(a) : coerce(a, line_of(b), false, ctx_);
            PfLine lb = is_line(b) ? line_of(b) : coerce(b, la, false, ctx_);

            if (la.is_nested() || lb.is_nested())
            {
                throw ShapeError("Union needs flat operands");
            }
            if (la.kind() == Kind::COMPLETE || lb.kind() == Kind::COMPLETE)
            {
                throw ShapeError("Union is not defined for complete lines");
            }
            if (la.kind() == lb.kind())
            {
                throw ShapeError("Union needs lines of distinct kinds, got two " + to_string(la.kind()) + " lines");
            }
            align(la, lb, ctx_);

            ColumnData columns;
            for (const PfLine *line : {&la, &lb})
            {
                const char tag = summable_columns(line->kind()).front();
                columns.emplace(std::string(1, tag), line->column(tag).with_unit(std::nullopt));
            }
            return create_flat(columns, ctx_);
        }

        // ============================================================================
        // Operators (standard context)
        // ============================================================================

        PfLine operator-(const PfLine &a) { return standard().negate(a); }

        PfLine operator+(const PfLine &a, const PfLine &b) { return standard().add(a, b); }
        PfLine operator+(const PfLine &a, double b) { return standard().add(a, b); }
        PfLine operator+(double a, const PfLine &b) { return standard().add(a, b); }
        PfLine operator+(const PfLine &a, const units::Quantity &b) { return standard().add(a, b); }
        PfLine operator+(const units::Quantity &a, const PfLine &b) { return standard().add(a, b); }
        PfLine operator+(const PfLine &a, const tools::Series &b) { return standard().add(a, b); }
        PfLine operator+(const tools::Series &a, const PfLine &b) { return standard().add(a, b); }

        PfLine operator-(const PfLine &a, const PfLine &b) { return standard().subtract(a, b); }
        PfLine operator-(const PfLine &a, double b) { return standard().subtract(a, b); }
        PfLine operator-(double a, const PfLine &b) { return standard().subtract(a, b); }
        PfLine operator-(const PfLine &a, const units::Quantity &b) { return standard().subtract(a, b); }
        PfLine operator-(const units::Quantity &a, const PfLine &b) { return standard().subtract(a, b); }
        PfLine operator-(const PfLine &a, const tools::Series &b) { return standard().subtract(a, b); }
        PfLine operator-(const tools::Series &a, const PfLine &b) { return standard().subtract(a, b); }

        PfLine operator*(const PfLine &a, const PfLine &b) { return standard().multiply(a, b); }
        PfLine operator*(const PfLine &a, double b) { return standard().multiply(a, b); }
        PfLine operator*(double a, const PfLine &b) { return standard().multiply(a, b); }
        PfLine operator*(const PfLine &a, const units::Quantity &b) { return standard().multiply(a, b); }
        PfLine operator*(const units::Quantity &a, const PfLine &b) { return standard().multiply(a, b); }
        PfLine operator*(const PfLine &a, const tools::Series &b) { return standard().multiply(a, b); }
        PfLine operator*(const tools::Series &a, const PfLine &b) { return standard().multiply(a, b); }

        Quotient operator/(const PfLine &a, const PfLine &b) { return standard().divide(a, b); }

        PfLine operator/(const PfLine &a, double b)
        {
            return std::get<PfLine>(standard().divide(a, b));
        }

        PfLine operator/(const PfLine &a, const units::Quantity &b)
        {
            Quotient result = standard().divide(a, b);
            if (const auto *line = std::get_if<PfLine>(&result))
            {
                return *line;
            }
            throw ShapeError("Division of " + a.describe() + " by a quantity of the same dimension is a ratio, not a line");
        }

        PfLine operator/(const PfLine &a, const tools::Series &b)
        {
            Quotient result = standard().divide(a, b);
            if (const auto *line = std::get_if<PfLine>(&result))
            {
                return *line;
            }
            throw ShapeError("Division of " + a.describe() + " by a series of the same dimension is a ratio, not a line");
        }

        PfLine operator|(const PfLine &a, const PfLine &b) { return standard().unite(a, b); }
        PfLine operator|(const PfLine &a, const units::Quantity &b) { return standard().unite(a, b); }
        PfLine operator|(const units::Quantity &a, const PfLine &b) { return standard().unite(a, b); }
        PfLine operator|(const PfLine &a, const tools::Series &b) { return standard().unite(a, b); }
        PfLine operator|(const tools::Series &a, const PfLine &b) { return standard().unite(a, b); }

    } // namespace core
} // namespace powerfolio
