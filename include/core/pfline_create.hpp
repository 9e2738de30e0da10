/**
 * @file pfline_create.hpp
 * @brief Construct portfolio lines from loosely typed input.
 *
 * The kind of the new line is inferred from which dimensions are supplied:
 *
 * | supplied                 | kind     |
 * |--------------------------|----------|
 * | w and/or q               | VOLUME   |
 * | p                        | PRICE    |
 * | r                        | REVENUE  |
 * | two of {w or q, p, r}    | COMPLETE |
 *
 * Values may be plain numbers, unit-tagged quantities or series. Untagged
 * values are taken in the canonical unit of their dimension; tagged values
 * are converted with the context's unit registry.
 */

#ifndef POWERFOLIO_CORE_PFLINE_CREATE_HPP
#define POWERFOLIO_CORE_PFLINE_CREATE_HPP

#include "core/context.hpp"
#include "core/pfline.hpp"
#include "tools/series.hpp"
#include "units/unit_registry.hpp"

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace powerfolio
{
    namespace core
    {

        /** @brief Scalar or series, optionally unit-tagged. */
        using Value = std::variant<double, units::Quantity, tools::Series>;

        /** @brief Values keyed by dimension tag ("w", "q", "p", "r"). */
        using ColumnData = std::map<std::string, Value>;

        /** @brief Input of one child: an existing line or its values. */
        using ChildInput = std::variant<PfLine, ColumnData>;

        /** @brief Ordered (name, child) input of a nested line. */
        using ChildData = std::vector<std::pair<std::string, ChildInput>>;

        /**
         * @brief Flat line from values keyed by dimension tag.
         *
         * @param data Values; keys must be one of w, q, p, r.
         * @param ctx Unit registry and tolerances of the consistency checks.
         * @param index Index of the line. Required if data contains only
         *              scalars; series are cut to it otherwise.
         * @throws InsufficientDataError if data is empty.
         * @throws AmbiguousDimensionError for unknown keys, or values whose unit
         *         does not match their key.
         * @throws ConsistencyError if over-determined values disagree.
         * @throws IndexError if the series do not share one index, or no index
         *         can be determined.
         */
        PfLine create_flat(const ColumnData &data, const Context &ctx = Context::standard(),
                           const std::optional<tools::TimeIndex> &index = std::nullopt);

        /**
         * @brief Nested line from named children.
         *
         * @param children Existing lines, or values passed on to create_flat().
         * @throws InvariantError if children is empty.
         * @throws ShapeError if the children differ in kind.
         * @throws IndexError if the children differ in index.
         */
        PfLine create_nested(const ChildData &children, const Context &ctx = Context::standard(),
                             const std::optional<tools::TimeIndex> &index = std::nullopt);

        /**
         * @brief Flat line from a single unit-tagged series.
         *
         * Power or energy gives a VOLUME line, price a PRICE line, and revenue
         * a REVENUE line.
         * @throws AmbiguousDimensionError if the series is untagged or dimensionless.
         */
        PfLine create_from_series(const tools::Series &series, const Context &ctx = Context::standard());

        /**
         * @brief Flat line with one unit-tagged value in every period.
         * @throws AmbiguousDimensionError if the quantity is untagged or dimensionless.
         */
        PfLine create_from_quantity(const units::Quantity &quantity, const tools::TimeIndex &index,
                                    const Context &ctx = Context::standard());

    } // namespace core
} // namespace powerfolio

#endif // POWERFOLIO_CORE_PFLINE_CREATE_HPP
