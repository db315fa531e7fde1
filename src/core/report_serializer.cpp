#include "core/report_serializer.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

namespace sweep_recon::core {

using json = nlohmann::json;

namespace {

json signalToJson(const services::RespirationSignal& signal) {
    json indices = json::array();
    json surrogate = json::array();
    for (const auto& sample : signal.samples) {
        indices.push_back(sample.acquisitionIndex);
        surrogate.push_back(sample.surrogate);
    }
    return {
        {"acquisitionIndex", indices},
        {"surrogate", surrogate},
        {"rawFeature", signal.rawFeature},
        {"gapFilled", signal.gapFilledIndices},
        {"roi", {
            {"startColumn", signal.roi.startColumn},
            {"columnCount", signal.roi.columnCount}
        }},
        {"samplingRateHz", signal.samplingRateHz},
        {"trendWindow", signal.trendWindow}
    };
}

services::RespirationSignal jsonToSignal(const json& j) {
    services::RespirationSignal signal;
    auto indices = j.value("acquisitionIndex", std::vector<int>{});
    auto surrogate = j.value("surrogate", std::vector<double>{});
    std::size_t n = std::min(indices.size(), surrogate.size());
    signal.samples.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        signal.samples.push_back({indices[i], surrogate[i]});
    }
    signal.rawFeature = j.value("rawFeature", std::vector<double>{});
    signal.gapFilledIndices = j.value("gapFilled", std::vector<int>{});
    if (auto roi = j.find("roi"); roi != j.end() && roi->is_object()) {
        signal.roi.startColumn = roi->value("startColumn", std::size_t{0});
        signal.roi.columnCount = roi->value("columnCount", std::size_t{0});
    }
    signal.samplingRateHz = j.value("samplingRateHz", 0.0);
    signal.trendWindow = j.value("trendWindow", 0);
    return signal;
}

json assignmentToJson(const services::StateAssignment& a) {
    return {
        {"nStates", a.nStates},
        {"state", a.stateOfSlice},
        {"retained", a.retainedSlices},
        {"thresholds", a.thresholds},
        {"stableRange", json::array({a.stableRange.first, a.stableRange.second})},
        {"cropApplied", a.cropApplied},
        {"occupancy", a.occupancy()}
    };
}

services::StateAssignment jsonToAssignment(const json& j) {
    services::StateAssignment a;
    a.nStates = j.value("nStates", 0);
    a.stateOfSlice = j.value("state", std::vector<int>{});
    a.retainedSlices = j.value("retained", std::vector<std::size_t>{});
    a.thresholds = j.value("thresholds", std::vector<double>{});
    auto range = j.value("stableRange", std::vector<double>{});
    if (range.size() >= 2) {
        a.stableRange = {range[0], range[1]};
    }
    a.cropApplied = j.value("cropApplied", false);
    return a;
}

}  // anonymous namespace

std::string ReportSerializer::toJsonString(const RespirationReport& report) {
    json root = {
        {"version", report.version},
        {"sliceCount", report.sliceCount},
        {"feature", services::featureToString(report.feature)},
        {"signal", signalToJson(report.signal)}
    };
    if (report.assignment) {
        root["assignment"] = assignmentToJson(*report.assignment);
    }
    return root.dump(2);
}

std::expected<RespirationReport, ReconError>
ReportSerializer::fromJsonString(const std::string& text) {
    json root;
    try {
        root = json::parse(text);
    } catch (const json::parse_error& e) {
        return std::unexpected(ReconError{
            ReconError::Code::IoError,
            std::string("Invalid respiration report: ") + e.what()
        });
    }

    if (!root.is_object() || !root.contains("version")) {
        return std::unexpected(ReconError{
            ReconError::Code::IoError, "Respiration report has no version"
        });
    }

    try {
        RespirationReport report;
        report.version = root["version"].get<std::string>();
        if (report.version != kCurrentVersion) {
            return std::unexpected(ReconError{
                ReconError::Code::IoError,
                "Unsupported respiration report version: " + report.version
            });
        }

        report.sliceCount = root.value("sliceCount", std::size_t{0});
        auto feature = services::featureFromString(
            root.value("feature", services::featureToString(report.feature)));
        if (feature) {
            report.feature = *feature;
        }
        report.signal = jsonToSignal(root.value("signal", json::object()));
        if (root.contains("assignment")) {
            report.assignment = jsonToAssignment(root["assignment"]);
        }

        if (report.signal.size() != report.sliceCount) {
            return std::unexpected(ReconError{
                ReconError::Code::IoError,
                "Respiration report holds " + std::to_string(report.signal.size())
                    + " samples for " + std::to_string(report.sliceCount) + " slices"
            });
        }
        return report;
    } catch (const json::exception& e) {
        return std::unexpected(ReconError{
            ReconError::Code::IoError,
            std::string("Invalid respiration report: ") + e.what()
        });
    }
}

std::expected<void, ReconError>
ReportSerializer::save(const RespirationReport& report,
                       const std::filesystem::path& filePath) {
    std::ofstream file(filePath);
    if (!file) {
        return std::unexpected(ReconError{
            ReconError::Code::IoError,
            "Cannot open file for writing: " + filePath.string()
        });
    }
    file << toJsonString(report) << '\n';
    if (!file) {
        return std::unexpected(ReconError{
            ReconError::Code::IoError,
            "Failed to write respiration report: " + filePath.string()
        });
    }
    return {};
}

std::expected<RespirationReport, ReconError>
ReportSerializer::load(const std::filesystem::path& filePath) {
    if (!std::filesystem::exists(filePath)) {
        return std::unexpected(ReconError{
            ReconError::Code::IoError,
            "File not found: " + filePath.string()
        });
    }
    std::ifstream file(filePath);
    if (!file) {
        return std::unexpected(ReconError{
            ReconError::Code::IoError,
            "Cannot open file: " + filePath.string()
        });
    }
    std::ostringstream content;
    content << file.rdbuf();
    return fromJsonString(content.str());
}

}  // namespace sweep_recon::core
