/**
 * @file RasterLoader.cpp
 * @brief GDAL-backed image decoding and channel extraction
 */

#include "RasterLoader.hpp"
#include <gdal_priv.h>
#include <cpl_error.h>
#include <algorithm>
#include <array>
#include <cmath>
#include <map>
#include <utility>
#include <memory>
#include <stdexcept>
#include <vector>

namespace planet {

namespace {

// RAII wrapper for GDAL dataset
struct GDALDatasetDeleter {
    void operator()(GDALDataset* dataset) {
        if (dataset) {
            GDALClose(dataset);
        }
    }
};

using GDALDatasetPtr = std::unique_ptr<GDALDataset, GDALDatasetDeleter>;

GDALDatasetPtr open_dataset(const std::string& filename) {
    GDALDatasetPtr dataset(static_cast<GDALDataset*>(GDALOpen(filename.c_str(), GA_ReadOnly)));
    if (!dataset) {
        throw std::runtime_error("Cannot open image " + filename + ": " + CPLGetLastErrorMsg());
    }
    return dataset;
}

} // namespace

std::optional<PlanetConfig::Channel> parse_channel(const std::string& name) {
    using Channel = PlanetConfig::Channel;
    if (name == "val" || name == "value") return Channel::VALUE;
    if (name == "avg" || name == "average") return Channel::AVERAGE;
    if (name == "r" || name == "red") return Channel::RED;
    if (name == "g" || name == "green") return Channel::GREEN;
    if (name == "b" || name == "blue") return Channel::BLUE;
    if (name == "hue") return Channel::HUE;
    if (name == "sat" || name == "saturation") return Channel::SATURATION;
    if (name == "color") return Channel::COLOR;
    return std::nullopt;
}

std::string channel_name(PlanetConfig::Channel channel) {
    using Channel = PlanetConfig::Channel;
    switch (channel) {
        case Channel::VALUE:      return "val";
        case Channel::AVERAGE:    return "avg";
        case Channel::RED:        return "r";
        case Channel::GREEN:      return "g";
        case Channel::BLUE:       return "b";
        case Channel::HUE:        return "hue";
        case Channel::SATURATION: return "sat";
        case Channel::COLOR:      return "color";
    }
    return "val";
}

double RasterLoader::channel_value(PlanetConfig::Channel channel, double r, double g, double b) {
    using Channel = PlanetConfig::Channel;
    const double vmax = std::max({r, g, b});
    const double vmin = std::min({r, g, b});
    switch (channel) {
        case Channel::VALUE:
        case Channel::COLOR:   return vmax;
        case Channel::AVERAGE: return (r + g + b) / 3.0;
        case Channel::RED:     return r;
        case Channel::GREEN:   return g;
        case Channel::BLUE:    return b;
        case Channel::SATURATION:
            return vmax > 0 ? 255.0 * (vmax - vmin) / vmax : 0.0;
        case Channel::HUE: {
            const double delta = vmax - vmin;
            if (delta <= 0) {
                return 0.0;
            }
            double hue = 0.0;  // in sixths of a turn
            if (vmax == r) {
                hue = std::fmod((g - b) / delta, 6.0);
            } else if (vmax == g) {
                hue = (b - r) / delta + 2.0;
            } else {
                hue = (r - g) / delta + 4.0;
            }
            if (hue < 0) {
                hue += 6.0;
            }
            return 255.0 * hue / 6.0;
        }
    }
    return vmax;
}

RasterLoader::RasterLoader() : logger_("RasterLoader") {
    GDALAllRegister();
}

RasterLoader::RasterSize RasterLoader::read_size(const std::string& filename) const {
    GDALDatasetPtr dataset = open_dataset(filename);
    RasterSize size;
    size.width = static_cast<size_t>(std::max(0, dataset->GetRasterXSize()));
    size.height = static_cast<size_t>(std::max(0, dataset->GetRasterYSize()));
    return size;
}

std::vector<double> RasterLoader::palette_heights(const std::vector<std::uint8_t>& red,
                                                  const std::vector<std::uint8_t>& green,
                                                  const std::vector<std::uint8_t>& blue) {
    using Key = std::pair<double, double>;  // (-hue, value)
    auto key_of = [&](size_t i) {
        return Key(-channel_value(PlanetConfig::Channel::HUE, red[i], green[i], blue[i]),
                   channel_value(PlanetConfig::Channel::VALUE, red[i], green[i], blue[i]));
    };

    std::map<Key, size_t> ranks;
    for (size_t i = 0; i < red.size(); ++i) {
        ranks.emplace(key_of(i), 0);
    }
    size_t rank = 0;
    for (auto& [key, value] : ranks) {
        value = rank++;
    }

    std::vector<double> heights(red.size());
    for (size_t i = 0; i < red.size(); ++i) {
        heights[i] = static_cast<double>(ranks.at(key_of(i)));
    }
    return heights;
}

size_t RasterLoader::fill_dark(std::vector<std::uint8_t>& red, std::vector<std::uint8_t>& green,
                               std::vector<std::uint8_t>& blue,
                               std::uint8_t too_dark, std::uint8_t darkest_fill) {
    std::array<std::uint8_t, 3> last_fill = {255, 255, 255};
    size_t filled = 0;
    for (size_t i = 0; i < red.size(); ++i) {
        const std::uint8_t value = std::max({red[i], green[i], blue[i]});
        if (value < too_dark) {
            red[i] = last_fill[0];
            green[i] = last_fill[1];
            blue[i] = last_fill[2];
            ++filled;
        } else if (value > darkest_fill) {
            last_fill = {red[i], green[i], blue[i]};
        }
    }
    return filled;
}

HeightGrid RasterLoader::load(const std::string& filename, const Options& options) const {
    const PlanetConfig::Channel channel = options.channel;
    const bool keep_colors = options.keep_colors;
    const auto& resample_height = options.resample_height;
    GDALDatasetPtr dataset = open_dataset(filename);

    const int width = dataset->GetRasterXSize();
    const int source_height = dataset->GetRasterYSize();
    const int bands = dataset->GetRasterCount();
    if (width <= 0 || source_height <= 0 || bands <= 0) {
        throw std::runtime_error("Image " + filename + " has no raster data");
    }
    const int height = resample_height && *resample_height > 0 ?
        static_cast<int>(*resample_height) : source_height;

    logger_.info("Loading " + filename + ": " + std::to_string(width) + "x" + std::to_string(source_height) +
                 ", " + std::to_string(bands) + " band(s), channel " + channel_name(channel));
    if (height != source_height) {
        logger_.detailed("Resampling to " + std::to_string(width) + "x" + std::to_string(height));
    }

    const size_t pixel_count = static_cast<size_t>(width) * static_cast<size_t>(height);
    HeightGrid grid(static_cast<size_t>(width), static_cast<size_t>(height));

    auto read_band = [&](int index, GDALDataType type, void* buffer) {
        GDALRasterBand* band = dataset->GetRasterBand(index);
        if (!band) {
            throw std::runtime_error("Failed to get raster band " + std::to_string(index));
        }
        CPLErr err = band->RasterIO(GF_Read, 0, 0, width, source_height, buffer, width, height, type, 0, 0);
        if (err != CE_None) {
            throw std::runtime_error("Failed to read band " + std::to_string(index) + " of " +
                                     filename + ": " + CPLGetLastErrorMsg());
        }
    };

    // 1 band: gray, 2: gray + alpha, 3: RGB, 4: RGBA
    const bool has_color = bands >= 3;
    const bool has_alpha = bands == 2 || bands >= 4;

    std::vector<std::uint8_t> red(pixel_count), green, blue, alpha;
    if (has_color) {
        green.resize(pixel_count);
        blue.resize(pixel_count);
        read_band(1, GDT_Byte, red.data());
        read_band(2, GDT_Byte, green.data());
        read_band(3, GDT_Byte, blue.data());
        if (options.fill_gaps) {
            logger_.detailed("Filled " + std::to_string(fill_dark(red, green, blue)) + " dark pixels");
        }
        if (channel == PlanetConfig::Channel::COLOR) {
            grid.values = palette_heights(red, green, blue);
        } else {
            for (size_t i = 0; i < pixel_count; ++i) {
                grid.values[i] = channel_value(channel, red[i], green[i], blue[i]);
            }
        }
    } else {
        std::vector<float> gray(pixel_count);
        read_band(1, GDT_Float32, gray.data());
        std::copy(gray.begin(), gray.end(), grid.values.begin());
        if (channel == PlanetConfig::Channel::HUE || channel == PlanetConfig::Channel::SATURATION) {
            logger_.warning("Grayscale image has no " + channel_name(channel) + ", heights will be flat");
            std::fill(grid.values.begin(), grid.values.end(), 0.0);
        }
        if (keep_colors) {
            read_band(1, GDT_Byte, red.data());
        }
    }
    if (has_alpha && keep_colors) {
        alpha.resize(pixel_count);
        read_band(bands == 2 ? 2 : 4, GDT_Byte, alpha.data());
    }

    if (options.invert) {
        auto [lo, hi] = std::minmax_element(grid.values.begin(), grid.values.end());
        const double sum = *lo + *hi;
        for (auto& v : grid.values) {
            v = sum - v;
        }
    }

    if (keep_colors) {
        std::vector<RGBA> colors(pixel_count);
        for (size_t i = 0; i < pixel_count; ++i) {
            const std::uint8_t r = red[i];
            const std::uint8_t g = has_color ? green[i] : r;
            const std::uint8_t b = has_color ? blue[i] : r;
            const std::uint8_t a = has_alpha ? alpha[i] : 255;
            colors[i] = {r, g, b, a};
        }
        grid.colors = std::move(colors);
    }

    return grid;
}

} // namespace planet
