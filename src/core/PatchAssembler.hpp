/**
 * @file PatchAssembler.hpp
 * @brief Composes independently sampled patches into one consistent mesh
 */

#pragma once

#include "planet_generator.hpp"
#include "RowTriangulator.hpp"
#include "SphereMesh.hpp"
#include "Logger.hpp"
#include <optional>
#include <vector>

namespace planet {

/**
 * @brief Which points of a patch form its outer boundary
 */
enum class BoundaryMode {
    LARGEST,            ///< Points at the largest distance from the z axis
    SMALLEST,           ///< Points at the smallest distance from the z axis
    ABOVE_SAMPLE_MEAN   ///< Points farther from the z axis than a sample row on average
};

/**
 * @brief Extract a patch's boundary as a row sorted by azimuth
 *
 * Used where a patch's own row order does not follow latitude, as with
 * logos whose rows are image scan lines.
 *
 * @param sample_row Row whose mean squared planar radius is the threshold
 *        for ABOVE_SAMPLE_MEAN (defaults to row 1, or row 0 for single-row patches)
 * @param tolerance Relative tolerance for LARGEST and SMALLEST
 */
Row extract_boundary(const Patch& patch, BoundaryMode mode,
                     std::optional<size_t> sample_row = std::nullopt,
                     double tolerance = 1e-6);

/**
 * @brief Shift every id of a patch so it starts at first_id
 */
void renumber(Patch& patch, PointId first_id);

/**
 * @brief True for a row made of a single point on the z axis
 */
bool is_pole_row(const Row& row);

/**
 * @brief Swap the last two ids of every face, flipping all normals
 */
void invert_faces(std::vector<Face>& faces);

/**
 * @brief Owns the running point id and the accumulated faces of one run
 *
 * Patches must be added in pipeline order; each one has to start at
 * next_id(). Patches are triangulated internally when added; seams
 * between patches are only triangulated through stitch().
 */
class PatchAssembler {
public:
    PatchAssembler();

    /**
     * @brief Id the next patch has to start at
     */
    PointId next_id() const { return next_id_; }

    /**
     * @brief Take ownership of a patch and triangulate its bands
     * @param close_figure Close every band of this patch into a ring
     * @throws std::logic_error when the patch ids do not continue the sequence
     * @return The stored patch
     */
    const Patch& add_patch(Patch patch, bool close_figure);

    /**
     * @brief Triangulate the seam between two patches
     *
     * Both rows keep their existing ids; no points are created.
     *
     * @param upper Boundary row nearer the north pole
     * @param lower Boundary row nearer the south pole
     */
    void stitch(const Row& upper, const Row& lower, bool close_figure);

    const std::vector<Patch>& patches() const { return patches_; }
    const std::vector<Face>& faces() const { return faces_; }

    /**
     * @brief Build the final mesh
     * @param invert Flip all normals
     * @param with_faces False keeps only the points (text point-cloud output)
     * @throws std::out_of_range when a face references an id no patch produced
     */
    SphereMesh build_mesh(bool invert = false, bool with_faces = true) const;

private:
    PointId next_id_;
    std::vector<Patch> patches_;
    std::vector<Face> faces_;
    RowTriangulator triangulator_;
    Logger logger_;
};

} // namespace planet
