/**
 * @file AscReader.hpp
 * @brief Reads the ASC point format back into rows for re-triangulation
 */

#pragma once

#include "planet_generator.hpp"
#include "Logger.hpp"
#include <istream>
#include <string>

namespace planet {

/**
 * @brief Parser for "id x y z" point lines grouped into rows by blank lines
 *
 * Lines with three numbers ("x y z") are accepted too and get sequential
 * ids. Lines starting with '#' are ignored.
 */
class AscReader {
public:
    AscReader();

    /**
     * @throws std::runtime_error when the file cannot be opened or a line is malformed
     */
    Patch read_file(const std::string& filename) const;

    /**
     * @throws std::runtime_error on malformed lines or ids out of sequence
     */
    Patch read(std::istream& in) const;

private:
    Logger logger_;
};

} // namespace planet
