/**
 * @file report_serializer.hpp
 * @brief JSON report of the respiration signal and state assignment
 * @details The report doubles as the cache of the estimation stage: a run
 *          without redo reuses the stored signal when it matches the slice
 *          count of the current sequence.
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include <cstddef>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>

#include "core/recon_error.hpp"
#include "services/respiration/respiration_types.hpp"

namespace sweep_recon::core {

/**
 * @brief Contents of respiration.json
 */
struct RespirationReport {
    /// Format version
    std::string version = "1.0";

    /// Number of slices the signal was estimated from
    std::size_t sliceCount = 0;

    services::SurrogateFeature feature = services::SurrogateFeature::BodyArea;
    services::RespirationSignal signal;

    /// Present once classification has run
    std::optional<services::StateAssignment> assignment;
};

/**
 * @brief Serialization of RespirationReport
 */
class ReportSerializer {
public:
    /// Supported format versions
    static constexpr const char* kCurrentVersion = "1.0";

    [[nodiscard]] static std::string toJsonString(const RespirationReport& report);

    /**
     * @brief Parse a report
     * @return IoError for malformed JSON or an unsupported version
     */
    [[nodiscard]] static std::expected<RespirationReport, ReconError>
    fromJsonString(const std::string& text);

    [[nodiscard]] static std::expected<void, ReconError>
    save(const RespirationReport& report, const std::filesystem::path& filePath);

    [[nodiscard]] static std::expected<RespirationReport, ReconError>
    load(const std::filesystem::path& filePath);
};

}  // namespace sweep_recon::core
