/**
 * @file diagnostics.cpp
 * @brief Implementation of the diagnostic sinks.
 */

#include "diagnostics.hpp"

#include <algorithm>
#include <iostream>

namespace powerfolio
{

    std::string to_string(DiagnosticCode code)
    {
        switch (code)
        {
        case DiagnosticCode::FLATTENED_OPERAND:
            return "flattened_operand";
        case DiagnosticCode::DISCARDED_DIMENSION:
            return "discarded_dimension";
        case DiagnosticCode::PARTIAL_OVERLAP:
            return "partial_overlap";
        }
        return "unknown";
    }

    // ============================================================================
    // StreamDiagnosticSink
    // ============================================================================

    StreamDiagnosticSink::StreamDiagnosticSink() : os_(&std::cerr) {}

    StreamDiagnosticSink::StreamDiagnosticSink(std::ostream &os) : os_(&os) {}

    void StreamDiagnosticSink::report(const Diagnostic &diagnostic)
    {
        // One insertion per message so concurrent reports do not interleave mid-line.
        *os_ << ("Warning: " + diagnostic.message + " [" + to_string(diagnostic.code) + "]\n");
    }

    // ============================================================================
    // CollectingDiagnosticSink
    // ============================================================================

    void CollectingDiagnosticSink::report(const Diagnostic &diagnostic)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        diagnostics_.push_back(diagnostic);
    }

    std::vector<Diagnostic> CollectingDiagnosticSink::diagnostics() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return diagnostics_;
    }

    size_t CollectingDiagnosticSink::count(DiagnosticCode code) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<size_t>(std::count_if(diagnostics_.begin(), diagnostics_.end(),
                                                 [code](const Diagnostic &d)
                                                 { return d.code == code; }));
    }

    size_t CollectingDiagnosticSink::size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return diagnostics_.size();
    }

    void CollectingDiagnosticSink::clear()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        diagnostics_.clear();
    }

} // namespace powerfolio
