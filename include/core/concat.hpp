/**
 * @file concat.hpp
 * @brief Join portfolio lines and states along their index.
 */

#ifndef POWERFOLIO_CORE_CONCAT_HPP
#define POWERFOLIO_CORE_CONCAT_HPP

#include "core/pfline.hpp"
#include "core/pfstate.hpp"

#include <vector>

namespace powerfolio
{
    namespace core
    {

        /**
         * @brief Concatenate portfolio lines.
         *
         * The lines must have the same kind and structure, compatible indices
         * (frequency, start-of-day, timezone), and together cover a gapless
         * period without overlap. The order of the input does not matter.
         * Nested lines must have the same child names and are joined child by
         * child.
         *
         * @throws InsufficientDataError if lines is empty.
         * @throws ShapeError if kinds, structures or child names differ.
         * @throws IndexError if the indices are incompatible, overlap or leave a gap.
         */
        PfLine concat(const std::vector<PfLine> &lines);

        /**
         * @brief Concatenate portfolio states, line by line.
         * @throws Same as concat(const std::vector<PfLine>&).
         */
        PfState concat(const std::vector<PfState> &states);

    } // namespace core
} // namespace powerfolio

#endif // POWERFOLIO_CORE_CONCAT_HPP
