/**
 * @file RasterLoader.hpp
 * @brief Decodes map and logo images into height grids through GDAL
 */

#pragma once

#include "planet_generator.hpp"
#include "Logger.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace planet {

/**
 * @brief Parse a channel name: "val", "avg", "r", "g", "b", "hue", "sat", "color"
 */
std::optional<PlanetConfig::Channel> parse_channel(const std::string& name);

std::string channel_name(PlanetConfig::Channel channel);

/**
 * @brief Reads any raster format GDAL understands (PNG, JPEG, GeoTIFF, ...)
 *
 * Single-band rasters are read as floating point so 16-bit elevation
 * models keep their precision; multi-band rasters are read as 8-bit RGB(A)
 * and reduced to one channel.
 */
class RasterLoader {
public:
    struct RasterSize {
        size_t width = 0;
        size_t height = 0;
    };

    RasterLoader();

    /**
     * @brief Read only the raster dimensions
     * @throws std::runtime_error when GDAL cannot open the file
     */
    RasterSize read_size(const std::string& filename) const;

    struct Options {
        PlanetConfig::Channel channel = PlanetConfig::Channel::VALUE;
        bool invert = false;                  ///< Mirror values within their range (dark becomes high)
        bool keep_colors = false;             ///< Also keep RGBA per pixel
        bool fill_gaps = false;               ///< Paint over near-black no-data pixels, see fill_dark()
        std::optional<size_t> resample_height; ///< Read the image stretched vertically to this many rows
    };

    /**
     * @brief Load an image as a height grid
     * @throws std::runtime_error when GDAL cannot open or read the file
     */
    HeightGrid load(const std::string& filename, const Options& options) const;

    /**
     * @brief Replace near-black pixels with the last bright pixel seen in scan order
     *
     * Pixels whose value (max of r, g, b) is below `too_dark` take the
     * color of the most recent pixel brighter than `darkest_fill`, white at
     * the start. Dark areas in scanned maps usually mean missing data.
     *
     * @return Number of pixels replaced
     */
    static size_t fill_dark(std::vector<std::uint8_t>& red, std::vector<std::uint8_t>& green,
                            std::vector<std::uint8_t>& blue,
                            std::uint8_t too_dark = 30, std::uint8_t darkest_fill = 50);

    /**
     * @brief Reduce one RGB pixel to a channel value in [0, 255]
     *
     * COLOR is not a per-pixel channel and is answered with VALUE; see
     * palette_heights().
     */
    static double channel_value(PlanetConfig::Channel channel, double r, double g, double b);

    /**
     * @brief Heights for a color-coded relief map
     *
     * Each distinct color is ranked by descending hue, then ascending
     * value, and its rank becomes its height. This follows the usual
     * legend where blue/violet is low and red is high, and darker shades
     * of one hue are lower.
     */
    static std::vector<double> palette_heights(const std::vector<std::uint8_t>& red,
                                               const std::vector<std::uint8_t>& green,
                                               const std::vector<std::uint8_t>& blue);

private:
    Logger logger_;
};

} // namespace planet
