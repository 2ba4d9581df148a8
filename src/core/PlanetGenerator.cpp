/**
 * @file PlanetGenerator.cpp
 * @brief Pipeline driver: image, patches, stitching, validation, export
 */

#include "planet_generator.hpp"
#include "AscReader.hpp"
#include "InputValidator.hpp"
#include "Logger.hpp"
#include "PatchAssembler.hpp"
#include "PointSampler.hpp"
#include "PolarPatchGenerator.hpp"
#include "Projection.hpp"
#include "RasterLoader.hpp"
#include "SphereMesh.hpp"
#include "../export/MeshExporter.hpp"
#include <chrono>
#include <cmath>
#include <filesystem>
#include <sstream>

namespace planet {

namespace {

bool is_asc_input(const std::string& filename) {
    return std::filesystem::path(filename).extension() == ".asc";
}

template <typename Clock>
std::chrono::milliseconds elapsed_ms(typename Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

} // namespace

// ============================================================================
// PlanetGenerator::Impl - Private implementation
// ============================================================================

class PlanetGenerator::Impl {
public:
    explicit Impl(const PlanetConfig& config)
        : config_(config), logger_("PlanetGenerator") {
        logger_.setLogLevel(static_cast<LogLevel>(config_.log_level));
    }

    bool generate_model() {
        using Clock = std::chrono::high_resolution_clock;
        auto start_time = Clock::now();
        metrics_ = {};

        InputValidator validator;
        auto validation = validator.validate(config_);
        if (validation.has_errors()) {
            logger_.error(validation.format_error_message());
            return false;
        }

        bool success = load_image();
        success = success && generate_mesh();
        success = success && validate_mesh();
        success = success && export_models();

        metrics_.total_time = elapsed_ms<Clock>(start_time);
        logger_.info("Total processing time: " + std::to_string(metrics_.total_time.count()) + "ms");
        return success;
    }

    bool load_image() {
        using Clock = std::chrono::high_resolution_clock;
        auto start_time = Clock::now();

        if (heights_) {
            logger_.detailed("Using preloaded height grid");
            return true;
        }

        try {
            if (is_asc_input(config_.input_file)) {
                asc_patch_ = AscReader().read_file(config_.input_file);
                metrics_.image_loading_time = elapsed_ms<Clock>(start_time);
                return true;
            }

            RasterLoader loader;
            auto size = loader.read_size(config_.input_file);
            RasterLoader::Options options;
            options.channel = config_.channel;
            options.invert = config_.invert_heights;
            options.keep_colors = config_.color_vertices;
            options.fill_gaps = config_.fill_gaps;
            options.resample_height = corrected_height(size.width, size.height);
            heights_ = loader.load(config_.input_file, options);
        } catch (const std::exception& e) {
            logger_.error(e.what());
            return false;
        }

        metrics_.image_loading_time = elapsed_ms<Clock>(start_time);
        return true;
    }

    bool generate_mesh() {
        using Clock = std::chrono::high_resolution_clock;
        auto start_time = Clock::now();

        try {
            PatchAssembler assembler;
            if (asc_patch_) {
                logger_.info("Re-triangulating " + std::to_string(asc_patch_->rows.size()) + " rows");
                assembler.add_patch(std::move(*asc_patch_), config_.close_figure);
                asc_patch_.reset();
            } else if (heights_) {
                assemble_planet(assembler);
            } else {
                logger_.error("No image loaded");
                return false;
            }
            metrics_.sampling_time = elapsed_ms<Clock>(start_time);

            mesh_ = assembler.build_mesh(config_.invert);
        } catch (const std::exception& e) {
            logger_.error(std::string("Mesh generation failed: ") + e.what());
            return false;
        }

        metrics_.triangulation_time = elapsed_ms<Clock>(start_time) - metrics_.sampling_time;
        metrics_.points_generated = mesh_.num_points();
        metrics_.faces_generated = mesh_.num_faces();
        logger_.info("Mesh: " + std::to_string(mesh_.num_points()) + " points, " +
                     std::to_string(mesh_.num_faces()) + " faces");
        return true;
    }

    bool validate_mesh() {
        validation_result_ = mesh_.validate_topology();

        if (!validation_result_.ids_consistent) {
            logger_.error("Point ids do not match their positions in the mesh");
            return false;
        }

        if (!validation_result_.is_watertight || validation_result_.num_degenerate_faces > 0 ||
            validation_result_.inward_faces > 0) {
            logger_.detailed("Mesh validation notes:");
            logger_.detailed("  Boundary edges: " + std::to_string(validation_result_.boundary_edge_count));
            logger_.detailed("  Non-manifold edges: " + std::to_string(validation_result_.non_manifold_edge_count));
            logger_.detailed("  Degenerate faces: " + std::to_string(validation_result_.num_degenerate_faces));
            logger_.detailed("  Inward faces: " + std::to_string(validation_result_.inward_faces));
        }
        return true;
    }

    bool export_models() {
        using Clock = std::chrono::high_resolution_clock;
        auto start_time = Clock::now();

        MultiFormatExporter::GlobalOptions options;
        options.output_directory = config_.output_directory;
        options.base_filename = config_.output_name.value_or(
            std::filesystem::path(config_.input_file).stem().string());
        if (options.base_filename.empty()) {
            options.base_filename = "planet";
        }
        options.overwrite = config_.overwrite;
        options.binary_ply = config_.binary_ply;
        // Faces are already inverted in the mesh when requested

        MultiFormatExporter exporter(options);
        bool success = false;
        try {
            success = exporter.export_all_formats(mesh_, config_.output_formats);
        } catch (const std::exception& e) {
            logger_.error(std::string("Export failed: ") + e.what());
            return false;
        }

        metrics_.export_time = elapsed_ms<Clock>(start_time);
        for (const auto& file : exporter.written_files()) {
            logger_.info("Output: " + file);
        }
        return success;
    }

    void set_heights(HeightGrid heights) {
        heights_ = std::move(heights);
        asc_patch_.reset();
    }

    const SphereMesh& get_mesh() const { return mesh_; }
    const PerformanceMetrics& get_metrics() const { return metrics_; }
    const MeshValidationResult& get_validation_result() const { return validation_result_; }
    const PlanetConfig& get_config() const { return config_; }

private:
    PlanetConfig config_;
    Logger logger_;
    std::optional<HeightGrid> heights_;
    std::optional<Patch> asc_patch_;
    SphereMesh mesh_;
    PerformanceMetrics metrics_;
    MeshValidationResult validation_result_;

    /**
     * @brief Height to stretch the image to when its aspect ratio does not fit the projection
     */
    std::optional<size_t> corrected_height(size_t width, size_t height) const {
        if (width == 0 || height == 0) {
            return std::nullopt;
        }
        Projection projection(config_.projection, width, height);
        auto expected = projection.expected_height();
        if (!expected || *expected == height || *expected == 0) {
            return std::nullopt;
        }

        std::ostringstream oss;
        oss << "Image is " << width << "x" << height << " but a "
            << projection_name(config_.projection) << " map of that width should be "
            << *expected << " pixels tall";
        if (!config_.ratio_check) {
            logger_.warning(oss.str() + ", using it as is");
            return std::nullopt;
        }
        logger_.warning(oss.str() + ", resampling to " + std::to_string(width) + "x" +
                        std::to_string(*expected));
        return expected;
    }

    HeightGrid load_logo(const std::string& filename) const {
        RasterLoader::Options options;
        options.keep_colors = config_.color_vertices;
        return RasterLoader().load(filename, options);
    }

    void assemble_planet(PatchAssembler& assembler) {
        CapPolicy caps = CapPolicy::parse(config_.caps);
        if (caps.mode == CapPolicy::Mode::AUTO &&
            (config_.projection == ProjectionKind::MOLLWEIDE ||
             config_.projection == ProjectionKind::SINUSOIDAL ||
             config_.projection == ProjectionKind::HALF_SPHERE)) {
            logger_.info("Projection " + projection_name(config_.projection) +
                         " reaches the poles, using caps none");
            caps.mode = CapPolicy::Mode::NONE;
        }

        const double polar_radius =
            config_.caps_height.value_or(config_.protrusion * (1.0 + config_.scale / 2.0));

        SamplingConfig sampling;
        sampling.projection = config_.projection;
        sampling.target_points = config_.target_points;
        sampling.scale = config_.scale;
        sampling.caps = caps;
        sampling.meridians = config_.meridians;
        sampling.equator_width = config_.equator_width;
        sampling.protrusion = config_.protrusion;
        sampling.meridians_height = config_.meridians_height;
        sampling.equator_height = config_.equator_height;
        sampling.caps_height = polar_radius;

        PointSampler sampler(sampling);
        Patch map = sampler.sample(*heights_, 0);
        if (map.empty()) {
            throw std::runtime_error("The map produced no points");
        }

        // A half-sphere is a dome of scan lines, never closed into rings
        if (config_.projection == ProjectionKind::HALF_SPHERE) {
            assembler.add_patch(std::move(map), false);
            return;
        }

        Projection projection(config_.projection, heights_->width, heights_->height);
        const double phi_cap = sampler.cap_angle(projection);
        const bool with_caps = caps.mode != CapPolicy::Mode::NONE;
        // Decided per pole: a map row on the pole already closes that end
        const bool north_open = !is_pole_row(map.rows.front());
        const bool south_open = !is_pole_row(map.rows.back());

        CapGenerator cap_generator;

        // North: logo or cap
        std::optional<Row> north_boundary;
        if (config_.logo_north) {
            const Patch& logo = assembler.add_patch(
                LogoGenerator(config_.logo_north_scale).logo(load_logo(*config_.logo_north), phi_cap,
                                                             polar_radius, assembler.next_id()),
                false);
            if (!logo.empty()) {
                north_boundary = extract_boundary(logo, BoundaryMode::ABOVE_SAMPLE_MEAN);
            }
        } else if (with_caps && north_open) {
            const Patch& cap = assembler.add_patch(
                cap_generator.cap(polar_radius, phi_cap, assembler.next_id()), config_.close_figure);
            north_boundary = cap.rows.back();
        } else if (with_caps) {
            logger_.detailed("Map reaches the north pole, no cap needed");
        }

        // Map body
        renumber(map, assembler.next_id());
        const Patch& body = assembler.add_patch(std::move(map), config_.close_figure);
        const Row map_first = body.rows.front();
        const Row map_last = body.rows.back();
        if (north_boundary) {
            assembler.stitch(*north_boundary, map_first, config_.close_figure);
        }

        // South: logo or cap
        if (config_.logo_south) {
            const Patch& logo = assembler.add_patch(
                LogoGenerator(config_.logo_south_scale).logo(load_logo(*config_.logo_south), -phi_cap,
                                                             polar_radius, assembler.next_id()),
                false);
            if (!logo.empty()) {
                Row south_boundary = extract_boundary(logo, BoundaryMode::ABOVE_SAMPLE_MEAN);
                assembler.stitch(map_last, south_boundary, config_.close_figure);
            }
        } else if (with_caps && south_open) {
            const Patch& cap = assembler.add_patch(
                cap_generator.cap(polar_radius, -phi_cap, assembler.next_id()), config_.close_figure);
            assembler.stitch(map_last, cap.rows.back(), config_.close_figure);
        } else if (with_caps) {
            logger_.detailed("Map reaches the south pole, no cap needed");
        }
    }
};

// ============================================================================
// PlanetGenerator - forwarding to Impl
// ============================================================================

PlanetGenerator::PlanetGenerator(const PlanetConfig& config)
    : impl_(std::make_unique<Impl>(config)) {
}

PlanetGenerator::~PlanetGenerator() = default;

bool PlanetGenerator::generate_model() { return impl_->generate_model(); }
bool PlanetGenerator::load_image() { return impl_->load_image(); }
bool PlanetGenerator::generate_mesh() { return impl_->generate_mesh(); }
bool PlanetGenerator::validate_mesh() { return impl_->validate_mesh(); }
bool PlanetGenerator::export_models() { return impl_->export_models(); }

void PlanetGenerator::set_heights(HeightGrid heights) { impl_->set_heights(std::move(heights)); }

const SphereMesh& PlanetGenerator::get_mesh() const { return impl_->get_mesh(); }
const PerformanceMetrics& PlanetGenerator::get_metrics() const { return impl_->get_metrics(); }
const MeshValidationResult& PlanetGenerator::get_validation_result() const {
    return impl_->get_validation_result();
}
const PlanetConfig& PlanetGenerator::get_config() const { return impl_->get_config(); }

} // namespace planet
