/**
 * @file HemisphereSplitter.hpp
 * @brief Cuts a triangle soup by a horizontal plane into two halves
 */

#pragma once

#include "../export/StlFile.hpp"
#include "Logger.hpp"
#include <optional>
#include <string>
#include <vector>

namespace planet {

/**
 * @brief Options for one split
 */
struct SplitConfig {
    enum class Mode {
        PLANE,  ///< Geometric cut at zcut
        COUNT   ///< First `count` triangles north, the rest south
    };
    Mode mode = Mode::PLANE;
    std::optional<double> zcut;   ///< nullopt means the mean z of all vertices
    bool discard_border = false;  ///< Route straddling triangles to `discarded` instead of re-tiling
    size_t count = 0;
};

/**
 * @brief The two halves plus any discarded border triangles
 */
struct SplitResult {
    std::vector<StlTriangle> north;
    std::vector<StlTriangle> south;
    std::vector<StlTriangle> discarded;
    double zcut = 0.0;
    size_t straddling = 0;  ///< Input triangles that crossed the plane
};

class HemisphereSplitter {
public:
    explicit HemisphereSplitter(const SplitConfig& config);

    SplitResult split(const std::vector<StlTriangle>& triangles) const;

    /**
     * @brief Mean z over every vertex of every triangle
     */
    static double mean_z(const std::vector<StlTriangle>& triangles);

    /**
     * @brief Re-tile a triangle crossing z = zcut
     *
     * Walks the vertices cyclically and inserts the interpolated point at
     * every edge crossing the plane. Vertices lying on the plane belong to
     * both sides. Each side's polygon (3 or 4 vertices) is fanned from its
     * first vertex, keeping the original winding.
     */
    static void cut_triangle(const StlTriangle& triangle, double zcut,
                             std::vector<StlTriangle>& north, std::vector<StlTriangle>& south);

private:
    SplitConfig config_;
    Logger logger_;
};

} // namespace planet
