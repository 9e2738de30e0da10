/**
 * @file context.cpp
 * @brief Implementation of Context
 */

#include "core/context.hpp"
#include "tools/series.hpp"

#include <stdexcept>

namespace powerfolio
{
    namespace core
    {

        Context::Context(std::shared_ptr<const units::UnitRegistry> registry,
                         std::shared_ptr<DiagnosticSink> sink,
                         double rtol, double atol, bool strict)
            : registry_(std::move(registry)),
              sink_(std::move(sink)),
              rtol_(rtol),
              atol_(atol),
              strict_(strict)
        {
            if (!registry_)
            {
                throw std::invalid_argument("Context needs a unit registry");
            }
            if (!sink_)
            {
                throw std::invalid_argument("Context needs a diagnostic sink");
            }
            if (rtol_ < 0.0 || atol_ < 0.0)
            {
                throw std::invalid_argument("Tolerances must be non-negative");
            }
        }

        const Context &Context::standard()
        {
            static const Context context(
                std::make_shared<const units::UnitRegistry>(units::UnitRegistry::standard()),
                std::make_shared<StreamDiagnosticSink>());
            return context;
        }

        Context Context::from_config(const EngineConfig &config)
        {
            auto registry = units::UnitRegistry::standard();
            for (const auto &unit : config.units)
            {
                registry.add_unit(unit);
            }

            std::shared_ptr<DiagnosticSink> sink;
            if (config.warnings == "stderr")
            {
                sink = std::make_shared<StreamDiagnosticSink>();
            }
            else if (config.warnings == "collect")
            {
                sink = std::make_shared<CollectingDiagnosticSink>();
            }
            else if (config.warnings == "none")
            {
                sink = std::make_shared<NullDiagnosticSink>();
            }
            else
            {
                throw std::invalid_argument("Unknown warnings target: " + config.warnings);
            }

            return Context(std::make_shared<const units::UnitRegistry>(std::move(registry)),
                           std::move(sink), config.rtol, config.atol, config.strict);
        }

        Context Context::with_sink(std::shared_ptr<DiagnosticSink> sink) const
        {
            return Context(registry_, std::move(sink), rtol_, atol_, strict_);
        }

        Context Context::with_strict(bool strict) const
        {
            return Context(registry_, sink_, rtol_, atol_, strict);
        }

        Context Context::with_tolerance(double rtol, double atol) const
        {
            return Context(registry_, sink_, rtol, atol, strict_);
        }

        void Context::warn(DiagnosticCode code, const std::string &message) const
        {
            sink_->report(Diagnostic{code, message});
        }

        bool Context::close(const Eigen::VectorXd &a, const Eigen::VectorXd &b) const
        {
            return tools::all_close(a, b, rtol_, atol_);
        }

    } // namespace core
} // namespace powerfolio
