/**
 * @file RowTriangulator.hpp
 * @brief Triangulates the band between two adjacent rows ("walking the dog")
 */

#pragma once

#include "planet_generator.hpp"
#include "Logger.hpp"
#include <vector>

namespace planet {

/**
 * @brief Greedy two-row triangulation
 *
 * Walks the current row point by point (the human) while a cursor into
 * the previous row (the dog) advances as long as doing so brings it
 * strictly closer to the human. Distances are measured between points
 * projected to the unit sphere, so relief never changes the topology.
 *
 * Faces come out counter-clockwise seen from outside when the previous
 * row lies north of the current one and both run in increasing azimuth.
 */
class RowTriangulator {
public:
    RowTriangulator();

    /**
     * @brief Faces spanning the band between previous and current
     * @param close_figure Treat both rows as closed rings and close the seam
     */
    std::vector<Face> triangulate(const Row& previous, const Row& current, bool close_figure) const;

    /**
     * @brief Append the band faces to an existing list
     */
    void triangulate(const Row& previous, const Row& current, bool close_figure,
                     std::vector<Face>& faces) const;

    /**
     * @brief Faces for every consecutive row pair of a patch
     */
    std::vector<Face> triangulate_patch(const Patch& patch, bool close_figure) const;

private:
    Logger logger_;
};

} // namespace planet
