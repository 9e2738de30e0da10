/**
 * @file errors.hpp
 * @brief Error taxonomy of the powerfolio library.
 *
 * Every error is a caller-input error: the call is rejected synchronously
 * and nothing is retried. All types derive from powerfolio::Error, which is
 * a std::invalid_argument, so callers that only care about "bad input" can
 * catch that.
 */

#ifndef POWERFOLIO_ERRORS_HPP
#define POWERFOLIO_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace powerfolio
{

    /**
     * @class Error
     * @brief Base class of all powerfolio errors.
     */
    class Error : public std::invalid_argument
    {
    public:
        explicit Error(const std::string &message);
    };

    /**
     * @brief Construction input under-determines the requested kind.
     */
    class InsufficientDataError : public Error
    {
    public:
        explicit InsufficientDataError(const std::string &message);
    };

    /**
     * @brief Over-determined input is internally inconsistent beyond tolerance.
     */
    class ConsistencyError : public Error
    {
    public:
        explicit ConsistencyError(const std::string &message);
    };

    /**
     * @brief An operand's dimension or unit cannot be resolved for the operator.
     */
    class AmbiguousDimensionError : public Error
    {
    public:
        explicit AmbiguousDimensionError(const std::string &message);
    };

    /**
     * @brief Operation invoked on a {kind, structure} combination outside its domain.
     */
    class ShapeError : public Error
    {
    public:
        explicit ShapeError(const std::string &message);
    };

    /**
     * @brief Operation would break a structural invariant (e.g. empty nesting).
     */
    class InvariantError : public Error
    {
    public:
        explicit InvariantError(const std::string &message);
    };

    /**
     * @brief Inputs do not share a single regular, gapless, left-bound index.
     */
    class IndexError : public Error
    {
    public:
        explicit IndexError(const std::string &message);
    };

    /**
     * @brief Child name not present in a nested portfolio line.
     */
    class KeyError : public Error
    {
    public:
        explicit KeyError(const std::string &message);
    };

} // namespace powerfolio

#endif // POWERFOLIO_ERRORS_HPP
