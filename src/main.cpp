// File: main.cpp

#include <chrono>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "api/range_callback.hpp"
#include "api/range_publisher.hpp"
#include "common/formatting/fmt_eigen.hpp"
#include "common/formatting/fmt_ranging.hpp"
#include "common/logging/logger.hpp"
#include "config/configuration.hpp"
#include "knowledge/object_size_catalog.hpp"
#include "ranging/ranging_engine.hpp"

/*
 * Replays a scene file through the ranging engine:
 *
 *   rangefinder_replay scene.yaml [configuration.yaml]
 *
 *   camera: {fx: 1400, fy: 1400, cx: 960, cy: 540, width: 1920, height: 1080}
 *   calibration: {distance: 40.0, depth: 0.05}        # optional
 *   frames:
 *     - detections:
 *         - {label: person, confidence: 0.9, box: [930, 465, 60, 150]}
 *       depth: {width: 192, height: 108, value: 0.06} # optional, constant raster
 *     - reset: true                                   # forget the current target
 */

namespace {

    types::CameraIntrinsics parseCamera(const YAML::Node &node, cv::Size &frame_size) {
        frame_size = cv::Size(node["width"].as<int>(1920), node["height"].as<int>(1080));

        Eigen::Matrix3d K = Eigen::Matrix3d::Identity();
        K(0, 0) = node["fx"].as<double>(1400.0);
        K(1, 1) = node["fy"].as<double>(K(0, 0));
        K(0, 2) = node["cx"].as<double>(frame_size.width / 2.0);
        K(1, 2) = node["cy"].as<double>(frame_size.height / 2.0);
        return types::CameraIntrinsics::fromCameraMatrix(K, frame_size);
    }

    std::vector<types::Detection> parseDetections(const YAML::Node &node, const types::Timestamp timestamp) {
        std::vector<types::Detection> detections;
        if (!node || !node.IsSequence()) {
            return detections;
        }

        for (const auto &entry: node) {
            const auto box = entry["box"].as<std::vector<double>>();
            if (box.size() != 4) {
                LOG_WARN("Skipping detection with {} box values (expected x, y, width, height)", box.size());
                continue;
            }
            detections.emplace_back(entry["label"].as<std::string>(), entry["confidence"].as<double>(),
                                    cv::Rect2d(box[0], box[1], box[2], box[3]), timestamp);
        }
        return detections;
    }

    std::optional<cv::Mat> parseDepth(const YAML::Node &node) {
        if (!node) {
            return std::nullopt;
        }
        const int width = node["width"].as<int>(256);
        const int height = node["height"].as<int>(256);
        return cv::Mat(height, width, CV_32FC1, cv::Scalar(node["value"].as<float>()));
    }

    // Read straight from the file: the configuration singleton logs while it loads.
    common::logging::LoggerSettings loggerSettings(const std::string &filename) {
        common::logging::LoggerSettings settings;
        if (!std::filesystem::exists(filename)) {
            return settings;
        }
        const YAML::Node logging = YAML::LoadFile(filename)["logging"];
        if (!logging || !logging.IsMap()) {
            return settings;
        }
        settings.directory = logging["directory"].as<std::string>(settings.directory);
        settings.filename = logging["file"].as<std::string>(settings.filename);
        settings.level = logging["level"].as<std::string>(settings.level);
        settings.pattern = logging["pattern"].as<std::string>(settings.pattern);
        settings.file_sink = logging["file_sink"].as<bool>(settings.file_sink);
        return settings;
    }

} // namespace

int main(const int argc, char *argv[]) {
    if (argc < 2) {
        fmt::print(stderr, "usage: {} scene.yaml [configuration.yaml]\n", argv[0]);
        return EXIT_FAILURE;
    }

    try {
        const std::string configuration_file = argc > 2 ? argv[2] : "configuration.yaml";
        common::logging::Logger::configure(loggerSettings(configuration_file));
        config::initialize(configuration_file);
        LOG_INFO("Running with configuration '{}'", config::Configuration::getInstance().filename());
        if (config::get("logging.show_configuration", false)) {
            config::show();
        }

        const auto catalog = std::make_shared<knowledge::ObjectSizeCatalog>(
                knowledge::ObjectSizeCatalog::fromFile(config::get("knowledge.catalog", "object_sizes.yaml")));

        const auto settings = ranging::RangingEngine::Settings::fromConfiguration();
        const auto callback = std::make_shared<api::RangeCallback>();
        callback->registerCallback([lock_threshold = settings.lock_threshold](const types::RangeEstimate &estimate) {
            if (!estimate.has_signal) {
                LOG_INFO("---");
                return;
            }
            LOG_INFO("{} {} {} | {} | {:.0f}% | {}", estimate.formattedDistance(), estimate.display_unit,
                     estimate.formattedUncertainty(), estimate.method, estimate.confidence * 100.0,
                     estimate.isLocked(lock_threshold) ? "LOCKED" : "searching");
        });

        const auto publisher = std::make_shared<api::RangePublisher>(
                callback, config::get("publisher.queue_capacity", api::RangePublisher::default_capacity));
        ranging::RangingEngine engine(catalog, settings, publisher);

        const YAML::Node scene = YAML::LoadFile(argv[1]);
        cv::Size frame_size;
        const YAML::Node camera = scene["camera"] ? scene["camera"] : YAML::Node(YAML::NodeType::Map);
        const types::CameraIntrinsics intrinsics = parseCamera(camera, frame_size);
        LOG_INFO("Scene camera: {}, K = {:1}", intrinsics, intrinsics.cameraMatrix());

        if (const auto calibration = scene["calibration"]) {
            const auto status = engine.calibrate(calibration["distance"].as<double>(),
                                                 calibration["depth"].as<double>());
            LOG_INFO("Calibration {}", calibration::toString(status));
        }

        const auto start = types::Clock::now();
        std::size_t index = 0;
        for (const auto &frame_node: scene["frames"]) {
            if (frame_node["reset"].as<bool>(false)) {
                engine.reset();
                continue;
            }

            types::FrameResult frame;
            frame.timestamp = start + std::chrono::milliseconds(50 * index++);
            frame.detections = parseDetections(frame_node["detections"], frame.timestamp);
            frame.depth_map = parseDepth(frame_node["depth"]);
            frame.intrinsics = intrinsics;
            frame.frame_size = frame_size;

            static_cast<void>(engine.process(frame));
        }

        publisher->flush();
        LOG_INFO("Replayed {} frames, {} estimates in history", index, engine.history().size());
    } catch (const std::exception &e) {
        LOG_CRITICAL("Replay failed: {}", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
