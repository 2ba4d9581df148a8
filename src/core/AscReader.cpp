/**
 * @file AscReader.cpp
 * @brief Implementation of the ASC point reader
 */

#include "AscReader.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace planet {

AscReader::AscReader() : logger_("AscReader") {
}

Patch AscReader::read_file(const std::string& filename) const {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open ASC file: " + filename);
    }
    Patch patch = read(file);
    logger_.info("Read " + std::to_string(patch.point_count()) + " points in " +
                 std::to_string(patch.rows.size()) + " rows from " + filename);
    return patch;
}

Patch AscReader::read(std::istream& in) const {
    Patch patch("asc", 0);
    PointId next_id = 0;
    Row row;
    std::string line;
    size_t line_number = 0;

    auto finish_row = [&]() {
        if (!row.empty()) {
            patch.rows.push_back(std::move(row));
            row.clear();
        }
    };

    while (std::getline(in, line)) {
        ++line_number;
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            finish_row();
            continue;
        }
        if (line[line.find_first_not_of(" \t\r")] == '#') {
            continue;
        }

        std::istringstream fields(line);
        std::vector<double> values;
        double value = 0.0;
        while (fields >> value) {
            values.push_back(value);
        }
        if (!fields.eof() || (values.size() != 3 && values.size() != 4)) {
            throw std::runtime_error("Malformed point at line " + std::to_string(line_number) + ": " + line);
        }

        SurfacePoint point;
        size_t offset = 0;
        if (values.size() == 4) {
            if (values[0] != static_cast<double>(next_id)) {
                throw std::runtime_error("Point id out of sequence at line " + std::to_string(line_number) +
                                         ", expected " + std::to_string(next_id));
            }
            offset = 1;
        }
        point.id = next_id++;
        point.x = values[offset];
        point.y = values[offset + 1];
        point.z = values[offset + 2];
        row.push_back(point);
    }
    finish_row();

    patch.next_id = next_id;
    logger_.debug("Parsed " + std::to_string(line_number) + " lines");
    return patch;
}

} // namespace planet
