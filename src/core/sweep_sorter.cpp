#include "core/sweep_sorter.hpp"

#include <algorithm>

#include "core/logging.hpp"

namespace sweep_recon::core {

namespace {

auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("SweepSorter");
    return logger;
}

}  // anonymous namespace

std::expected<SliceSequence, ReconError>
SweepSorter::sort(const Volume4DType::Pointer& volume) {
    return sort(volume, Parameters{});
}

std::expected<SliceSequence, ReconError>
SweepSorter::sort(const Volume4DType::Pointer& volume, const Parameters& params) {
    if (!volume) {
        return std::unexpected(ReconError{
            ReconError::Code::InvalidInput, "Input volume is null"
        });
    }
    if (!params.isValid()) {
        return std::unexpected(ReconError{
            ReconError::Code::InvalidConfiguration,
            "Slice spacing must be >= 0"
        });
    }

    auto size = volume->GetLargestPossibleRegion().GetSize();
    for (unsigned int d = 0; d < 4; ++d) {
        if (size[d] == 0) {
            return std::unexpected(ReconError{
                ReconError::Code::InvalidInput, "Input volume is empty"
            });
        }
    }

    const auto width = size[0];
    const auto height = size[1];
    const auto locations = static_cast<int>(size[2]);
    const auto dynamics = static_cast<int>(size[3]);
    const auto spacing = volume->GetSpacing();

    SliceSequence sequence;
    sequence.pixelSpacing = {spacing[0], spacing[1]};
    sequence.nominalSliceSpacing = params.sliceSpacing > 0.0 ? params.sliceSpacing
                                                             : spacing[2];
    sequence.dynamicsPerPosition = dynamics;
    // Dynamics of one location are acquired back to back
    sequence.frameInterval = spacing[3] > 0.0 ? spacing[3] : 0.0;
    for (unsigned int r = 0; r < 3; ++r) {
        sequence.origin[r] = volume->GetOrigin()[r];
        for (unsigned int c = 0; c < 3; ++c) {
            sequence.direction[r * 3 + c] = volume->GetDirection()[r][c];
        }
    }

    Slice::ImageType::RegionType region;
    Slice::ImageType::IndexType start;
    start.Fill(0);
    Slice::ImageType::SizeType sliceSize;
    sliceSize[0] = width;
    sliceSize[1] = height;
    region.SetIndex(start);
    region.SetSize(sliceSize);

    Slice::ImageType::SpacingType sliceSpacing;
    sliceSpacing[0] = spacing[0];
    sliceSpacing[1] = spacing[1];

    const std::size_t pixels = width * height;
    const float* buffer = volume->GetBufferPointer();
    const double dz = sequence.nominalSliceSpacing;

    sequence.slices.reserve(static_cast<std::size_t>(locations) * dynamics);
    for (int s = 0; s < locations; ++s) {
        for (int d = 0; d < dynamics; ++d) {
            auto image = Slice::ImageType::New();
            image->SetRegions(region);
            image->SetSpacing(sliceSpacing);
            image->Allocate();

            // Buffer layout is x fastest, then y, slice, dynamic
            std::size_t offset = (static_cast<std::size_t>(d) * locations + s) * pixels;
            std::copy(buffer + offset, buffer + offset + pixels, image->GetBufferPointer());

            Slice slice;
            slice.acquisitionIndex = acquisitionIndex(s, d, dynamics);
            slice.position = s * dz;
            if (params.continuousSweep) {
                slice.position += d * dz / dynamics;
            }
            slice.image = image;
            sequence.slices.push_back(std::move(slice));
        }
    }

    getLogger()->info("Sorted {} locations x {} dynamics into {} slices "
                      "({}x{} px, {:.3f} mm nominal spacing, {:.3f} s frame interval)",
                      locations, dynamics, sequence.size(), width, height, dz,
                      sequence.frameInterval);
    return sequence;
}

}  // namespace sweep_recon::core
