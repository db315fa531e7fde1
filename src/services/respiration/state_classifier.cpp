#include "services/respiration/state_classifier.hpp"

#include <algorithm>
#include <cmath>

#include "core/logging.hpp"

namespace {

auto& getLogger() {
    static auto logger =
        sweep_recon::logging::LoggerFactory::create("StateClassifier");
    return logger;
}

double median(std::vector<double> values) {
    if (values.empty()) {
        return 0.0;
    }
    std::size_t mid = values.size() / 2;
    std::nth_element(values.begin(), values.begin() + static_cast<long>(mid), values.end());
    double upper = values[mid];
    if (values.size() % 2 == 1) {
        return upper;
    }
    double lower = *std::max_element(values.begin(), values.begin() + static_cast<long>(mid));
    return 0.5 * (lower + upper);
}

}  // anonymous namespace

namespace sweep_recon::services {

/**
 * @brief PIMPL implementation for StateClassifier
 */
class StateClassifier::Impl {
public:
    std::expected<StateAssignment, ReconError> run(
        const RespirationSignal& signal,
        const std::vector<double>* positions,
        const Parameters& params) const;
};

std::expected<StateAssignment, ReconError> StateClassifier::Impl::run(
    const RespirationSignal& signal,
    const std::vector<double>* positions,
    const Parameters& params) const
{
    if (!params.isValid()) {
        getLogger()->error("Invalid classification parameters: nStates={}", params.nStates);
        return std::unexpected(ReconError{
            ReconError::Code::InvalidConfiguration,
            "Number of respiration states must be >= 1, got "
                + std::to_string(params.nStates)
        });
    }
    if (signal.empty()) {
        return std::unexpected(ReconError{
            ReconError::Code::InvalidInput, "Respiration signal is empty"
        });
    }

    const std::size_t n = signal.size();
    StateAssignment assignment;
    assignment.nStates = params.nStates;
    assignment.stateOfSlice.assign(n, StateAssignment::kUnassigned);

    std::vector<std::size_t> candidates;
    candidates.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        if (positions && params.positionRange
            && !params.positionRange->contains((*positions)[i])) {
            continue;
        }
        candidates.push_back(i);
    }
    if (positions && params.positionRange) {
        getLogger()->info("Position crop [{:.2f}, {:.2f}] mm keeps {} of {} slices",
                          params.positionRange->minPosition,
                          params.positionRange->maxPosition,
                          candidates.size(), n);
    }

    std::vector<double> candidateValues;
    candidateValues.reserve(candidates.size());
    for (std::size_t i : candidates) {
        candidateValues.push_back(signal.samples[i].surrogate);
    }

    if (params.cropUnstable && !candidateValues.empty()) {
        auto range = StateClassifier::stableRange(candidateValues, params.cropMadFactor);
        assignment.stableRange = range;
        assignment.cropApplied = true;
        for (std::size_t i : candidates) {
            double v = signal.samples[i].surrogate;
            if (v >= range.first && v <= range.second) {
                assignment.retainedSlices.push_back(i);
            }
        }
        getLogger()->info("Stable respiration range [{:.3f}, {:.3f}] keeps {} of {} slices",
                          range.first, range.second,
                          assignment.retainedSlices.size(), candidates.size());
    } else {
        assignment.retainedSlices = candidates;
    }

    const std::size_t retained = assignment.retainedSlices.size();
    if (retained < static_cast<std::size_t>(params.nStates)) {
        getLogger()->error("{} states requested but only {} slices retained",
                           params.nStates, retained);
        return std::unexpected(ReconError{
            ReconError::Code::ClassificationImbalance,
            std::to_string(params.nStates) + " states requested but only "
                + std::to_string(retained) + " slices retained; at least one "
                "state would be empty"
        });
    }

    // Rank by surrogate; equal values keep acquisition order
    std::vector<std::size_t> ranked = assignment.retainedSlices;
    std::stable_sort(ranked.begin(), ranked.end(),
                     [&signal](std::size_t a, std::size_t b) {
                         const auto& sa = signal.samples[a];
                         const auto& sb = signal.samples[b];
                         if (sa.surrogate != sb.surrogate) {
                             return sa.surrogate < sb.surrogate;
                         }
                         return sa.acquisitionIndex < sb.acquisitionIndex;
                     });

    const auto nStates = static_cast<std::size_t>(params.nStates);
    assignment.thresholds.assign(nStates - 1, 0.0);
    for (std::size_t r = 0; r < retained; ++r) {
        auto state = static_cast<int>(r * nStates / retained);
        assignment.stateOfSlice[ranked[r]] = state;
        if (state > 0 && (r == 0 || static_cast<int>((r - 1) * nStates / retained) != state)) {
            assignment.thresholds[static_cast<std::size_t>(state - 1)] =
                signal.samples[ranked[r]].surrogate;
        }
    }

    auto counts = assignment.occupancy();
    for (std::size_t s = 0; s < counts.size(); ++s) {
        getLogger()->debug("State {}: {} slices", s, counts[s]);
    }
    getLogger()->info("Classified {} slices into {} states", retained, params.nStates);

    return assignment;
}

StateClassifier::StateClassifier()
    : impl_(std::make_unique<Impl>()) {}

StateClassifier::~StateClassifier() = default;

StateClassifier::StateClassifier(StateClassifier&&) noexcept = default;
StateClassifier& StateClassifier::operator=(StateClassifier&&) noexcept = default;

std::expected<StateAssignment, ReconError>
StateClassifier::classify(const core::SliceSequence& sequence,
                          const RespirationSignal& signal,
                          const Parameters& params) const
{
    if (sequence.size() != signal.size()) {
        getLogger()->error("Signal length {} does not match {} slices",
                           signal.size(), sequence.size());
        return std::unexpected(ReconError{
            ReconError::Code::InvalidInput,
            "Respiration signal length does not match the slice count"
        });
    }

    std::vector<double> positions;
    positions.reserve(sequence.size());
    for (const auto& slice : sequence.slices) {
        positions.push_back(slice.position);
    }
    return impl_->run(signal, &positions, params);
}

std::expected<StateAssignment, ReconError>
StateClassifier::classify(const RespirationSignal& signal,
                          const Parameters& params) const
{
    return impl_->run(signal, nullptr, params);
}

void StateClassifier::annotate(core::SliceSequence& sequence,
                               const StateAssignment& assignment)
{
    std::size_t n = std::min(sequence.size(), assignment.stateOfSlice.size());
    for (std::size_t i = 0; i < n; ++i) {
        int state = assignment.stateOfSlice[i];
        if (state == StateAssignment::kUnassigned) {
            sequence.slices[i].state.reset();
        } else {
            sequence.slices[i].state = state;
        }
    }
}

std::pair<double, double> StateClassifier::stableRange(
    const std::vector<double>& values, double madFactor)
{
    if (values.empty()) {
        return {0.0, 0.0};
    }
    double med = median(values);

    std::vector<double> deviations;
    deviations.reserve(values.size());
    for (double v : values) {
        deviations.push_back(std::abs(v - med));
    }
    double mad = median(std::move(deviations));

    if (mad <= 0.0) {
        auto [lo, hi] = std::minmax_element(values.begin(), values.end());
        return {*lo, *hi};
    }
    double halfWidth = madFactor * respiration_constants::kMadToSigma * mad;
    return {med - halfWidth, med + halfWidth};
}

}  // namespace sweep_recon::services
