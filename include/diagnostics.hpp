/**
 * @file diagnostics.hpp
 * @brief Non-fatal diagnostic channel.
 *
 * A few operations complete successfully but lose information on the way
 * (e.g. adding a flat and a nested portfolio line flattens the nested
 * operand). These are reported through a DiagnosticSink, which is injected
 * via the calculation Context rather than written to a global stream.
 *
 * Thread safety: StreamDiagnosticSink writes each message with a single
 * stream insertion; CollectingDiagnosticSink locks its buffer.
 */

#ifndef POWERFOLIO_DIAGNOSTICS_HPP
#define POWERFOLIO_DIAGNOSTICS_HPP

#include <iosfwd>
#include <mutex>
#include <string>
#include <vector>

namespace powerfolio
{

    /**
     * @enum DiagnosticCode
     * @brief What kind of information loss occurred.
     */
    enum class DiagnosticCode
    {
        FLATTENED_OPERAND,   /**< Nested operand flattened to match a flat one */
        DISCARDED_DIMENSION, /**< Input carried a dimension that is dropped */
        PARTIAL_OVERLAP      /**< Operands only partially overlap in time */
    };

    /**
     * @brief Convert DiagnosticCode to string.
     */
    std::string to_string(DiagnosticCode code);

    /**
     * @struct Diagnostic
     * @brief A single reported condition.
     */
    struct Diagnostic
    {
        DiagnosticCode code;
        std::string message;
    };

    /**
     * @class DiagnosticSink
     * @brief Receiver of diagnostics.
     */
    class DiagnosticSink
    {
    public:
        virtual ~DiagnosticSink() = default;

        /**
         * @brief Report a diagnostic.
         * @param diagnostic The condition that occurred.
         */
        virtual void report(const Diagnostic &diagnostic) = 0;
    };

    /**
     * @class StreamDiagnosticSink
     * @brief Writes "Warning: ..." lines to an output stream (std::cerr by default).
     */
    class StreamDiagnosticSink : public DiagnosticSink
    {
    public:
        StreamDiagnosticSink();
        explicit StreamDiagnosticSink(std::ostream &os);

        void report(const Diagnostic &diagnostic) override;

    private:
        std::ostream *os_;
    };

    /**
     * @class CollectingDiagnosticSink
     * @brief Keeps every diagnostic for later inspection.
     */
    class CollectingDiagnosticSink : public DiagnosticSink
    {
    public:
        void report(const Diagnostic &diagnostic) override;

        /** @brief Copy of all diagnostics received so far. */
        std::vector<Diagnostic> diagnostics() const;

        /** @brief Number of diagnostics with the given code. */
        size_t count(DiagnosticCode code) const;

        /** @brief Total number of diagnostics received. */
        size_t size() const;

        void clear();

    private:
        mutable std::mutex mutex_;
        std::vector<Diagnostic> diagnostics_;
    };

    /**
     * @class NullDiagnosticSink
     * @brief Discards all diagnostics.
     */
    class NullDiagnosticSink : public DiagnosticSink
    {
    public:
        void report(const Diagnostic &) override {}
    };

} // namespace powerfolio

#endif // POWERFOLIO_DIAGNOSTICS_HPP
