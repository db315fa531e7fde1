#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

#include <boost/program_options.hpp>

#include "core/logging.hpp"
#include "core/recon_config.hpp"
#include "services/pipeline/reconstruction_pipeline.hpp"

namespace po = boost::program_options;

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

void printUsage(const po::options_description& desc) {
    std::cout << "Usage: sweep_recon <command> <input> [options]\n\n"
              << "Commands:\n"
              << "  sort      Sort the raw 4D sweep into IMG_3D_sorted\n"
              << "  estimate  Sort, estimate respiration and classify states\n"
              << "  resample  Reconstruct state volumes from a previous estimate\n"
              << "  run       All stages\n\n"
              << desc << "\n";
}

/// Apply command line flags on top of the loaded configuration
std::optional<std::string> applyOverrides(const po::variables_map& vm,
                                          sweep_recon::core::ReconConfig& config) {
    using namespace sweep_recon::services;

    if (vm.count("output")) config.outputDirectory = vm["output"].as<std::string>();
    if (vm.count("thickness")) config.thickness = vm["thickness"].as<double>();
    if (vm.count("n-states")) config.nStates = vm["n-states"].as<int>();
    if (vm.count("workers")) config.workers = vm["workers"].as<int>();
    if (vm.count("sampling-rate")) config.samplingRateHz = vm["sampling-rate"].as<double>();
    if (vm.count("rbf-epsilon")) config.rbfEpsilon = vm["rbf-epsilon"].as<double>();
    if (vm.count("smoothing-sigma")) config.smoothingSigma = vm["smoothing-sigma"].as<double>();
    if (vm.count("trend-window")) config.trendWindow = vm["trend-window"].as<int>();
    if (vm.count("spline-order")) config.splineOrder = vm["spline-order"].as<unsigned int>();
    if (vm.count("log-level")) config.logLevel = vm["log-level"].as<std::string>();
    if (vm.count("log-directory")) config.logDirectory = vm["log-directory"].as<std::string>();
    if (vm["redo"].as<bool>()) config.redo = true;
    if (vm["disable-crop"].as<bool>()) config.disableCrop = true;
    if (vm["no-isotropic"].as<bool>()) config.isotropicInPlane = false;
    if (vm["no-qc"].as<bool>()) config.writeQcImages = false;

    if (vm.count("in-plane-interpolation")) {
        auto name = vm["in-plane-interpolation"].as<std::string>();
        auto interp = IsotropicResampler::interpolationFromName(name);
        if (!interp) {
            return "unknown in-plane interpolation '" + name + "' (nearest | linear | bspline)";
        }
        config.inPlaneInterpolation = *interp;
    }

    if (vm.count("interpolation")) {
        auto name = vm["interpolation"].as<std::string>();
        auto method = methodFromString(name);
        if (!method) {
            return "unknown interpolation '" + name + "' (fast_linear | rbf)";
        }
        config.interpolation = *method;
    }
    if (vm.count("feature")) {
        auto name = vm["feature"].as<std::string>();
        auto feature = featureFromString(name);
        if (!feature) {
            return "unknown feature '" + name + "'";
        }
        config.feature = *feature;
    }
    if (vm.count("rbf-kernel")) {
        auto name = vm["rbf-kernel"].as<std::string>();
        auto kernel = kernelFromString(name);
        if (!kernel) {
            return "unknown RBF kernel '" + name + "'";
        }
        config.rbfKernel = *kernel;
    }
    return std::nullopt;
}

void configureLogging(const sweep_recon::core::ReconConfig& config) {
    sweep_recon::logging::LogConfig logConfig;
    logConfig.level = sweep_recon::logging::logLevelFromString(config.logLevel)
                          .value_or(sweep_recon::logging::LogLevel::Info);
    logConfig.enableFileLogging = !config.logDirectory.empty();
    logConfig.logDirectory = config.logDirectory;
    sweep_recon::logging::LoggerFactory::configure(logConfig);
}

int reportError(const sweep_recon::ReconError& error) {
    std::cerr << "sweep_recon: " << error.toString() << std::endl;
    sweep_recon::logging::LoggerFactory::shutdown();
    return kExitFailure;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    using sweep_recon::services::ReconstructionPipeline;

    std::string command;
    std::string input;

    po::options_description desc("Options");
    desc.add_options()
        ("help,h", "Show this help")
        ("config,c", po::value<std::string>(), "JSON configuration file")
        ("save-config", po::value<std::string>(),
            "Write the effective configuration to a JSON file")
        ("output,o", po::value<std::string>(), "Output directory (default: .)")
        ("thickness,t", po::value<double>(), "Output slice thickness in mm (default: 2.5)")
        ("n-states,n", po::value<int>(), "Number of respiration states (default: 4)")
        ("interpolation,m", po::value<std::string>(),
            "Slice-axis interpolation: fast_linear | rbf (default: fast_linear)")
        ("workers,j", po::value<int>(), "Worker tasks (default: cpu count - 1)")
        ("redo", po::bool_switch(), "Recompute the respiration signal")
        ("disable-crop", po::bool_switch(), "Keep irregular breathing slices")
        ("no-isotropic", po::bool_switch(), "Keep the in-plane spacing")
        ("in-plane-interpolation", po::value<std::string>(),
            "In-plane resampling: nearest | linear | bspline (default: linear)")
        ("spline-order", po::value<unsigned int>(), "B-spline order 2-5 (default: 3)")
        ("no-qc", po::bool_switch(), "Skip the cropped stack and body mask images")
        ("sampling-rate", po::value<double>(),
            "Frame rate in Hz (default: frame interval of the input)")
        ("feature", po::value<std::string>(),
            "Surrogate: body_area | intensity_centroid | reference_correlation")
        ("smoothing-sigma", po::value<double>(), "Surrogate smoothing in samples")
        ("trend-window", po::value<int>(),
            "Detrend window in samples (-1 = from frame rate, 0 = off)")
        ("rbf-kernel", po::value<std::string>(),
            "multiquadric | inverse_multiquadric | gaussian | linear | cubic | thin_plate")
        ("rbf-epsilon", po::value<double>(), "RBF shape parameter in mm (0 = auto)")
        ("log-level", po::value<std::string>(),
            "trace | debug | info | warning | error | critical | off")
        ("log-directory", po::value<std::string>(), "Directory for rotating log files")
    ;

    po::options_description hidden;
    hidden.add_options()
        ("command", po::value<std::string>(&command))
        ("input", po::value<std::string>(&input))
    ;

    po::options_description all;
    all.add(desc).add(hidden);

    po::positional_options_description pos;
    pos.add("command", 1);
    pos.add("input", 1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv)
            .options(all)
            .positional(pos)
            .run(), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "sweep_recon: " << e.what() << "\n\n";
        printUsage(desc);
        return kExitUsage;
    }

    if (vm.count("help") || command.empty()) {
        printUsage(desc);
        return vm.count("help") ? kExitSuccess : kExitUsage;
    }
    if (command != "sort" && command != "estimate" && command != "resample"
        && command != "run") {
        std::cerr << "sweep_recon: unknown command '" << command << "'\n\n";
        printUsage(desc);
        return kExitUsage;
    }
    if (input.empty()) {
        std::cerr << "sweep_recon: missing input volume\n\n";
        printUsage(desc);
        return kExitUsage;
    }

    sweep_recon::core::ReconConfig config;
    if (vm.count("config")) {
        auto loaded = sweep_recon::core::ReconConfig::load(vm["config"].as<std::string>());
        if (!loaded) {
            return reportError(loaded.error());
        }
        config = loaded.value();
    }
    if (auto problem = applyOverrides(vm, config)) {
        std::cerr << "sweep_recon: " << *problem << "\n";
        return kExitUsage;
    }
    if (auto valid = config.validate(); !valid) {
        return reportError(valid.error());
    }

    configureLogging(config);

    if (vm.count("save-config")) {
        auto saved = config.save(vm["save-config"].as<std::string>());
        if (!saved) {
            return reportError(saved.error());
        }
    }

    ReconstructionPipeline pipeline(config);

    if (command == "run") {
        auto summary = pipeline.run(input);
        if (!summary) {
            return reportError(summary.error());
        }
        std::cout << "Reconstructed " << summary->stateVolumes.size() << " states from "
                  << summary->retainedCount << " of " << summary->sliceCount
                  << " slices -> " << summary->stackedVolume.string() << std::endl;
        sweep_recon::logging::LoggerFactory::shutdown();
        return summary->failedPartitions == 0 ? kExitSuccess : kExitFailure;
    }

    auto sequence = pipeline.sortStage(input);
    if (!sequence) {
        return reportError(sequence.error());
    }
    if (command == "sort") {
        std::cout << "Sorted " << sequence->size() << " slices -> "
                  << ReconstructionPipeline::sortedVolumePath(config.outputDirectory).string()
                  << std::endl;
        sweep_recon::logging::LoggerFactory::shutdown();
        return kExitSuccess;
    }

    auto signal = command == "estimate"
                      ? pipeline.estimateStage(sequence.value())
                      : pipeline.loadCachedSignal(sequence.value());
    if (!signal) {
        if (command == "resample") {
            std::cerr << "sweep_recon: no respiration estimate found, run 'estimate' first\n";
        }
        return reportError(signal.error());
    }

    auto assignment = pipeline.classifyStage(sequence.value(), signal.value());
    if (!assignment) {
        return reportError(assignment.error());
    }
    if (command == "estimate") {
        std::cout << "Classified " << assignment->retainedCount() << " of "
                  << sequence->size() << " slices into " << config.nStates
                  << " states -> "
                  << ReconstructionPipeline::reportPath(config.outputDirectory).string()
                  << std::endl;
        sweep_recon::logging::LoggerFactory::shutdown();
        return kExitSuccess;
    }

    auto result = pipeline.resampleStage(sequence.value(), assignment.value());
    if (!result) {
        return reportError(result.error());
    }
    std::cout << "Reconstructed " << result->states.size() << " states -> "
              << ReconstructionPipeline::stackedVolumePath(
                     config.outputDirectory, config.interpolation).string()
              << std::endl;
    sweep_recon::logging::LoggerFactory::shutdown();
    return result->isComplete() ? kExitSuccess : kExitFailure;
}
