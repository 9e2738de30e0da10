/**
 * @file arithmetic.hpp
 * @brief Arithmetic on portfolio lines.
 *
 * The result of an operation depends on the kinds and structures of both
 * operands:
 *
 * | operation               | operands                          | result           |
 * |-------------------------|-----------------------------------|------------------|
 * | a + b, a - b            | same kind                         | same kind        |
 * | a * f, a / f            | any kind, dimensionless factor f  | same kind        |
 * | VOLUME * PRICE          | at most one nested                | REVENUE          |
 * | REVENUE / PRICE         | at most one nested                | VOLUME           |
 * | REVENUE / VOLUME        | at most one nested                | PRICE            |
 * | a / b                   | same kind, flat, not COMPLETE     | dimensionless    |
 * | a \| b                  | distinct kinds, flat, not COMPLETE| COMPLETE         |
 *
 * Every other combination raises ShapeError. Adding a flat and a nested
 * line flattens the nested one and reports FLATTENED_OPERAND (ShapeError
 * in strict mode). Operands on different (compatible) indices are cut to
 * their common periods.
 */

#ifndef POWERFOLIO_CORE_ARITHMETIC_HPP
#define POWERFOLIO_CORE_ARITHMETIC_HPP

#include "core/context.hpp"
#include "core/pfline.hpp"
#include "tools/series.hpp"
#include "units/unit_registry.hpp"

#include <variant>

namespace powerfolio
{
    namespace core
    {

        /** @brief Anything that can take part in portfolio-line arithmetic. */
        using Operand = std::variant<PfLine, double, units::Quantity, tools::Series>;

        /** @brief Result of a division: a line, or a dimensionless ratio. */
        using Quotient = std::variant<PfLine, tools::Series>;

        /**
         * @class Arithmetic
         * @brief Operator dispatch bound to a calculation context.
         *
         * Usage:
         * @code
         *   Arithmetic calc(Context::standard().with_strict(true));
         *   PfLine revenue = calc.multiply(volume, price);
         *   PfLine doubled = calc.multiply(volume, 2.0);
         * @endcode
         */
        class Arithmetic
        {
        public:
            explicit Arithmetic(Context ctx);

            const Context &context() const { return ctx_; }

            /**
             * @brief a + b
             * @throws ShapeError if the kinds differ (or strict mode forbids flattening).
             * @throws AmbiguousDimensionError if a value's dimension cannot be resolved.
             * @throws IndexError if the indices are incompatible or do not overlap.
             */
            PfLine add(const Operand &a, const Operand &b) const;

            /** @brief a - b, i.e. a + (-b). */
            PfLine subtract(const Operand &a, const Operand &b) const;

            /**
             * @brief a * b: scaling, or VOLUME * PRICE.
             * @throws ShapeError for undefined kind combinations.
             */
            PfLine multiply(const Operand &a, const Operand &b) const;

            /**
             * @brief a / b: scaling, ratio of two lines, or kind-changing division.
             * @throws ShapeError for undefined combinations.
             */
            Quotient divide(const Operand &a, const Operand &b) const;

            /**
             * @brief a | b: union of two flat lines of distinct kinds into a COMPLETE line.
             * @throws ShapeError for nested or complete operands and equal kinds.
             */
            PfLine unite(const Operand &a, const Operand &b) const;

            /** @brief -a */
            PfLine negate(const PfLine &a) const;

            /**
             * @brief Scale a line by a dimensionless factor per period.
             */
            PfLine scale(const PfLine &a, const tools::Series &factor) const;

            /** @brief Scale a line by a constant factor. */
            PfLine scale(const PfLine &a, double factor) const;

        private:
            Context ctx_;
        };

        PfLine operator-(const PfLine &a);

        PfLine operator+(const PfLine &a, const PfLine &b);
        PfLine operator+(const PfLine &a, double b);
        PfLine operator+(double a, const PfLine &b);
        PfLine operator+(const PfLine &a, const units::Quantity &b);
        PfLine operator+(const units::Quantity &a, const PfLine &b);
        PfLine operator+(const PfLine &a, const tools::Series &b);
        PfLine operator+(const tools::Series &a, const PfLine &b);

        PfLine operator-(const PfLine &a, const PfLine &b);
        PfLine operator-(const PfLine &a, double b);
        PfLine operator-(double a, const PfLine &b);
        PfLine operator-(const PfLine &a, const units::Quantity &b);
        PfLine operator-(const units::Quantity &a, const PfLine &b);
        PfLine operator-(const PfLine &a, const tools::Series &b);
        PfLine operator-(const tools::Series &a, const PfLine &b);

        PfLine operator*(const PfLine &a, const PfLine &b);
        PfLine operator*(const PfLine &a, double b);
        PfLine operator*(double a, const PfLine &b);
        PfLine operator*(const PfLine &a, const units::Quantity &b);
        PfLine operator*(const units::Quantity &a, const PfLine &b);
        PfLine operator*(const PfLine &a, const tools::Series &b);
        PfLine operator*(const tools::Series &a, const PfLine &b);

        /** @brief Ratio (dimensionless Series) or kind-changing division (PfLine). */
        Quotient operator/(const PfLine &a, const PfLine &b);
        PfLine operator/(const PfLine &a, double b);
        PfLine operator/(const PfLine &a, const units::Quantity &b);
        PfLine operator/(const PfLine &a, const tools::Series &b);

        PfLine operator|(const PfLine &a, const PfLine &b);
        PfLine operator|(const PfLine &a, const units::Quantity &b);
        PfLine operator|(const units::Quantity &a, const PfLine &b);
        PfLine operator|(const PfLine &a, const tools::Series &b);
        PfLine operator|(const tools::Series &a, const PfLine &b);

    } // namespace core
} // namespace powerfolio

#endif // POWERFOLIO_CORE_ARITHMETIC_HPP
