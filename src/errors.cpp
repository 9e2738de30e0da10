/**
 * @file errors.cpp
 * @brief Constructors of the powerfolio error types.
 */

#include "errors.hpp"

namespace powerfolio
{

    Error::Error(const std::string &message) : std::invalid_argument(message) {}

    InsufficientDataError::InsufficientDataError(const std::string &message) : Error(message) {}

    ConsistencyError::ConsistencyError(const std::string &message) : Error(message) {}

    AmbiguousDimensionError::AmbiguousDimensionError(const std::string &message) : Error(message) {}

    ShapeError::ShapeError(const std::string &message) : Error(message) {}

    InvariantError::InvariantError(const std::string &message) : Error(message) {}

    IndexError::IndexError(const std::string &message) : Error(message) {}

    KeyError::KeyError(const std::string &message) : Error(message) {}

} // namespace powerfolio
