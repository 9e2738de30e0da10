/**
 * @file context.hpp
 * @brief Calculation context: unit registry, tolerances and diagnostics.
 */

#ifndef POWERFOLIO_CORE_CONTEXT_HPP
#define POWERFOLIO_CORE_CONTEXT_HPP

#include "diagnostics.hpp"
#include "engine_config.hpp"
#include "units/unit_registry.hpp"

#include <Eigen/Dense>
#include <memory>
#include <string>

namespace powerfolio
{
    namespace core
    {

        /**
         * @class Context
         * @brief Everything a calculation needs besides its operands.
         *
         * A Context is an immutable value. Copies share the registry and the
         * diagnostic sink.
         *
         * Usage:
         * @code
         *   auto sink = std::make_shared<CollectingDiagnosticSink>();
         *   Context ctx = Context::standard().with_sink(sink);
         *   Arithmetic(ctx).add(flat_line, nested_line); // sink receives FLATTENED_OPERAND
         * @endcode
         */
        class Context
        {
        public:
            /**
             * @brief Construct a context.
             * @param registry Unit registry (must not be null).
             * @param sink Diagnostic sink (must not be null).
             * @param rtol Relative tolerance of consistency checks.
             * @param atol Absolute tolerance of consistency checks.
             * @param strict Turn flatten-on-mismatch into a ShapeError.
             * @throws std::invalid_argument on null pointers or negative tolerances.
             */
            Context(std::shared_ptr<const units::UnitRegistry> registry,
                    std::shared_ptr<DiagnosticSink> sink,
                    double rtol = 1e-7, double atol = 1e-9, bool strict = false);

            /**
             * @brief Standard units, default tolerances, warnings to std::cerr.
             */
            static const Context &standard();

            /**
             * @brief Build a context from configuration.
             * @throws std::invalid_argument for invalid configuration values.
             */
            static Context from_config(const EngineConfig &config);

            const units::UnitRegistry &registry() const { return *registry_; }
            DiagnosticSink &sink() const { return *sink_; }
            double rtol() const { return rtol_; }
            double atol() const { return atol_; }
            bool strict() const { return strict_; }

            Context with_sink(std::shared_ptr<DiagnosticSink> sink) const;
            Context with_strict(bool strict) const;
            Context with_tolerance(double rtol, double atol) const;

            /**
             * @brief Report a diagnostic on the sink.
             */
            void warn(DiagnosticCode code, const std::string &message) const;

            /**
             * @brief Element-wise closeness with this context's tolerances.
             */
            bool close(const Eigen::VectorXd &a, const Eigen::VectorXd &b) const;

        private:
            std::shared_ptr<const units::UnitRegistry> registry_;
            std::shared_ptr<DiagnosticSink> sink_;
            double rtol_;
            double atol_;
            bool strict_;
        };

    } // namespace core
} // namespace powerfolio

#endif // POWERFOLIO_CORE_CONTEXT_HPP
