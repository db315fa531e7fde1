// BSD 3-Clause License
//
// Copyright (c) 2021-2025, 🍀☀🌕🌥 🌊
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this
//    list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
// FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
// DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
// SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
// CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
// OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

#include "core/recon_config.hpp"

#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "core/logging.hpp"

namespace sweep_recon::core {

using json = nlohmann::json;

namespace {

ReconError invalid(const std::string& message) {
    return ReconError{ReconError::Code::InvalidConfiguration, message};
}

}  // anonymous namespace

std::expected<void, ReconError> ReconConfig::validate() const {
    if (!(thickness > 0.0)) {
        return std::unexpected(invalid("thickness must be > 0"));
    }
    if (nStates < 1) {
        return std::unexpected(invalid("n_states must be >= 1"));
    }
    if (workers < 0) {
        return std::unexpected(invalid("workers must be >= 0"));
    }
    if (samplingRateHz < 0.0) {
        return std::unexpected(invalid("sampling_rate_hz must be >= 0"));
    }
    if (rbfEpsilon < 0.0) {
        return std::unexpected(invalid("rbf_epsilon must be >= 0"));
    }
    if (smoothingSigma < 0.0) {
        return std::unexpected(invalid("smoothing_sigma must be >= 0"));
    }
    if (trendWindow < services::respiration_constants::kAutoTrendWindow) {
        return std::unexpected(invalid("trend_window must be >= -1"));
    }
    if (minVisitsPerPosition < 1) {
        return std::unexpected(invalid("min_visits_per_position must be >= 1"));
    }
    if (!(cropMadFactor > 0.0)) {
        return std::unexpected(invalid("crop_mad_factor must be > 0"));
    }
    if (splineOrder < 2 || splineOrder > 5) {
        return std::unexpected(invalid("spline_order must be in [2, 5]"));
    }
    if (!logging::logLevelFromString(logLevel)) {
        return std::unexpected(invalid("unknown log_level '" + logLevel + "'"));
    }
    return {};
}

std::string ReconConfig::toJsonString() const {
    json root = {
        {"thickness", thickness},
        {"n_states", nStates},
        {"redo", redo},
        {"disable_crop", disableCrop},
        {"interpolation", services::methodToString(interpolation)},
        {"workers", workers},
        {"output_directory", outputDirectory.string()},
        {"sampling_rate_hz", samplingRateHz},
        {"feature", services::featureToString(feature)},
        {"rbf_kernel", services::kernelToString(rbfKernel)},
        {"rbf_epsilon", rbfEpsilon},
        {"smoothing_sigma", smoothingSigma},
        {"trend_window", trendWindow},
        {"min_visits_per_position", minVisitsPerPosition},
        {"crop_mad_factor", cropMadFactor},
        {"isotropic_in_plane", isotropicInPlane},
        {"in_plane_interpolation",
         services::IsotropicResampler::interpolationName(inPlaneInterpolation)},
        {"spline_order", splineOrder},
        {"write_qc_images", writeQcImages},
        {"log_level", logLevel},
        {"log_directory", logDirectory.string()}
    };
    return root.dump(2);
}

std::expected<ReconConfig, ReconError>
ReconConfig::fromJsonString(const std::string& text) {
    json root;
    try {
        root = json::parse(text);
    } catch (const json::parse_error& e) {
        return std::unexpected(invalid(std::string("malformed JSON: ") + e.what()));
    }
    if (!root.is_object()) {
        return std::unexpected(invalid("configuration must be a JSON object"));
    }

    ReconConfig config;
    try {
        config.thickness = root.value("thickness", config.thickness);
        config.nStates = root.value("n_states", config.nStates);
        config.redo = root.value("redo", config.redo);
        config.disableCrop = root.value("disable_crop", config.disableCrop);
        config.workers = root.value("workers", config.workers);
        config.outputDirectory =
            root.value("output_directory", config.outputDirectory.string());
        config.samplingRateHz = root.value("sampling_rate_hz", config.samplingRateHz);
        config.rbfEpsilon = root.value("rbf_epsilon", config.rbfEpsilon);
        config.smoothingSigma = root.value("smoothing_sigma", config.smoothingSigma);
        config.trendWindow = root.value("trend_window", config.trendWindow);
        config.minVisitsPerPosition =
            root.value("min_visits_per_position", config.minVisitsPerPosition);
        config.cropMadFactor = root.value("crop_mad_factor", config.cropMadFactor);
        config.isotropicInPlane = root.value("isotropic_in_plane", config.isotropicInPlane);
        config.writeQcImages = root.value("write_qc_images", config.writeQcImages);

        int splineOrder = root.value("spline_order", static_cast<int>(config.splineOrder));
        if (splineOrder < 2 || splineOrder > 5) {
            return std::unexpected(invalid("spline_order must be in [2, 5]"));
        }
        config.splineOrder = static_cast<unsigned int>(splineOrder);
        config.logLevel = root.value("log_level", config.logLevel);
        config.logDirectory = root.value("log_directory", config.logDirectory.string());

        std::string method = root.value("interpolation",
                                        services::methodToString(config.interpolation));
        auto parsedMethod = services::methodFromString(method);
        if (!parsedMethod) {
            return std::unexpected(invalid("unknown interpolation '" + method + "'"));
        }
        config.interpolation = *parsedMethod;

        std::string inPlane = root.value(
            "in_plane_interpolation",
            services::IsotropicResampler::interpolationName(config.inPlaneInterpolation));
        auto parsedInPlane = services::IsotropicResampler::interpolationFromName(inPlane);
        if (!parsedInPlane) {
            return std::unexpected(
                invalid("unknown in_plane_interpolation '" + inPlane + "'"));
        }
        config.inPlaneInterpolation = *parsedInPlane;

        std::string feature = root.value("feature", services::featureToString(config.feature));
        auto parsedFeature = services::featureFromString(feature);
        if (!parsedFeature) {
            return std::unexpected(invalid("unknown feature '" + feature + "'"));
        }
        config.feature = *parsedFeature;

        std::string kernel = root.value("rbf_kernel", services::kernelToString(config.rbfKernel));
        auto parsedKernel = services::kernelFromString(kernel);
        if (!parsedKernel) {
            return std::unexpected(invalid("unknown rbf_kernel '" + kernel + "'"));
        }
        config.rbfKernel = *parsedKernel;
    } catch (const json::type_error& e) {
        return std::unexpected(invalid(std::string("wrong value type: ") + e.what()));
    }

    if (auto valid = config.validate(); !valid) {
        return std::unexpected(valid.error());
    }
    return config;
}

std::expected<ReconConfig, ReconError>
ReconConfig::load(const std::filesystem::path& filePath) {
    if (!std::filesystem::exists(filePath)) {
        return std::unexpected(ReconError{
            ReconError::Code::IoError,
            "Configuration file not found: " + filePath.string()
        });
    }
    std::ifstream file(filePath);
    if (!file) {
        return std::unexpected(ReconError{
            ReconError::Code::IoError,
            "Cannot open configuration file: " + filePath.string()
        });
    }
    std::ostringstream content;
    content << file.rdbuf();
    return fromJsonString(content.str());
}

std::expected<void, ReconError>
ReconConfig::save(const std::filesystem::path& filePath) const {
    std::ofstream file(filePath);
    if (!file) {
        return std::unexpected(ReconError{
            ReconError::Code::IoError,
            "Cannot open file for writing: " + filePath.string()
        });
    }
    file << toJsonString() << '\n';
    if (!file) {
        return std::unexpected(ReconError{
            ReconError::Code::IoError,
            "Failed to write configuration: " + filePath.string()
        });
    }
    return {};
}

}  // namespace sweep_recon::core
