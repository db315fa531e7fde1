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

#include "core/volume_io.hpp"

#include <algorithm>
#include <system_error>

#include <itkImageFileReader.h>
#include <itkImageFileWriter.h>
#include <itkNiftiImageIO.h>
#include <itkNrrdImageIO.h>

#include "core/logging.hpp"

namespace sweep_recon::core {

namespace {

auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("VolumeIO");
    return logger;
}

bool isNifti(const std::filesystem::path& path) {
    auto ext = path.extension().string();
    auto stem = path.stem().extension().string();
    return ext == ".nii" || (ext == ".gz" && stem == ".nii");
}

bool isNrrd(const std::filesystem::path& path) {
    auto ext = path.extension().string();
    return ext == ".nrrd" || ext == ".nhdr";
}

/// Set the ImageIO explicitly for known extensions
template <typename ProcessType>
void selectImageIO(ProcessType* process, const std::filesystem::path& path) {
    if (isNifti(path)) {
        process->SetImageIO(itk::NiftiImageIO::New());
    } else if (isNrrd(path)) {
        process->SetImageIO(itk::NrrdImageIO::New());
    }
}

template <typename ImageType>
std::expected<typename ImageType::Pointer, ReconError>
readImage(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        getLogger()->error("Input file not found: {}", path.string());
        return std::unexpected(ReconError{
            ReconError::Code::InvalidInput,
            "File not found: " + path.string()
        });
    }

    try {
        using ReaderType = itk::ImageFileReader<ImageType>;
        auto reader = ReaderType::New();
        reader->SetFileName(path.string());
        selectImageIO(reader.GetPointer(), path);
        reader->Update();

        typename ImageType::Pointer image = reader->GetOutput();
        image->DisconnectPipeline();
        getLogger()->debug("Read {}", path.string());
        return image;
    } catch (const itk::ExceptionObject& e) {
        getLogger()->error("Failed to read {}: {}", path.string(), e.GetDescription());
        return std::unexpected(ReconError{
            ReconError::Code::IoError,
            std::string("Failed to read ") + path.string() + ": " + e.GetDescription()
        });
    }
}

template <typename ImageType>
std::expected<void, ReconError>
writeImage(const typename ImageType::Pointer& image, const std::filesystem::path& path) {
    if (!image) {
        return std::unexpected(ReconError{
            ReconError::Code::InvalidInput, "Volume is null"
        });
    }

    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return std::unexpected(ReconError{
                ReconError::Code::IoError,
                "Cannot create directory " + path.parent_path().string()
                    + ": " + ec.message()
            });
        }
    }

    try {
        using WriterType = itk::ImageFileWriter<ImageType>;
        auto writer = WriterType::New();
        writer->SetInput(image);
        writer->SetFileName(path.string());
        selectImageIO(writer.GetPointer(), path);
        writer->Update();
        getLogger()->debug("Wrote {}", path.string());
        return {};
    } catch (const itk::ExceptionObject& e) {
        getLogger()->error("Failed to write {}: {}", path.string(), e.GetDescription());
        return std::unexpected(ReconError{
            ReconError::Code::IoError,
            std::string("Failed to write ") + path.string() + ": " + e.GetDescription()
        });
    }
}

}  // anonymous namespace

std::expected<VolumeIO::Volume4DType::Pointer, ReconError>
VolumeIO::readVolume4D(const std::filesystem::path& path) {
    return readImage<Volume4DType>(path);
}

std::expected<VolumeIO::Volume3DType::Pointer, ReconError>
VolumeIO::readVolume3D(const std::filesystem::path& path) {
    return readImage<Volume3DType>(path);
}

std::expected<void, ReconError>
VolumeIO::writeVolume4D(const Volume4DType::Pointer& volume,
                        const std::filesystem::path& path) {
    return writeImage<Volume4DType>(volume, path);
}

std::expected<void, ReconError>
VolumeIO::writeVolume3D(const Volume3DType::Pointer& volume,
                        const std::filesystem::path& path) {
    return writeImage<Volume3DType>(volume, path);
}

std::expected<VolumeIO::Volume4DType::Pointer, ReconError>
VolumeIO::stackVolumes(const std::vector<Volume3DType::Pointer>& volumes) {
    if (volumes.empty() || !volumes.front()) {
        return std::unexpected(ReconError{
            ReconError::Code::InvalidInput, "No volumes to stack"
        });
    }

    const auto& first = volumes.front();
    auto size3 = first->GetLargestPossibleRegion().GetSize();
    for (const auto& volume : volumes) {
        if (!volume || volume->GetLargestPossibleRegion().GetSize() != size3) {
            return std::unexpected(ReconError{
                ReconError::Code::InvalidInput,
                "Volumes to stack must have identical sizes"
            });
        }
    }

    Volume4DType::SizeType size;
    Volume4DType::SpacingType spacing;
    Volume4DType::PointType origin;
    Volume4DType::DirectionType direction;
    direction.SetIdentity();
    for (unsigned int d = 0; d < 3; ++d) {
        size[d] = size3[d];
        spacing[d] = first->GetSpacing()[d];
        origin[d] = first->GetOrigin()[d];
        for (unsigned int c = 0; c < 3; ++c) {
            direction[d][c] = first->GetDirection()[d][c];
        }
    }
    size[3] = volumes.size();
    spacing[3] = 1.0;
    origin[3] = 0.0;

    Volume4DType::IndexType start;
    start.Fill(0);
    Volume4DType::RegionType region;
    region.SetIndex(start);
    region.SetSize(size);

    auto stacked = Volume4DType::New();
    stacked->SetRegions(region);
    stacked->SetSpacing(spacing);
    stacked->SetOrigin(origin);
    stacked->SetDirection(direction);
    stacked->Allocate();

    const std::size_t voxels = size3[0] * size3[1] * size3[2];
    float* out = stacked->GetBufferPointer();
    for (std::size_t v = 0; v < volumes.size(); ++v) {
        const float* in = volumes[v]->GetBufferPointer();
        std::copy(in, in + voxels, out + v * voxels);
    }
    return stacked;
}

std::expected<VolumeIO::Volume3DType::Pointer, ReconError>
VolumeIO::sequenceToVolume(const SliceSequence& sequence) {
    auto inPlane = sequence.imageSize();
    if (sequence.empty() || inPlane[0] == 0 || inPlane[1] == 0) {
        return std::unexpected(ReconError{
            ReconError::Code::InvalidInput, "Slice sequence is empty"
        });
    }

    Volume3DType::SizeType size;
    size[0] = inPlane[0];
    size[1] = inPlane[1];
    size[2] = sequence.size();

    Volume3DType::IndexType start;
    start.Fill(0);
    Volume3DType::RegionType region;
    region.SetIndex(start);
    region.SetSize(size);

    Volume3DType::SpacingType spacing;
    spacing[0] = sequence.pixelSpacing[0];
    spacing[1] = sequence.pixelSpacing[1];
    spacing[2] = sequence.nominalSliceSpacing
                 / static_cast<double>(std::max(1, sequence.dynamicsPerPosition));

    Volume3DType::PointType origin;
    Volume3DType::DirectionType direction;
    for (unsigned int r = 0; r < 3; ++r) {
        origin[r] = sequence.origin[r];
        for (unsigned int c = 0; c < 3; ++c) {
            direction[r][c] = sequence.direction[r * 3 + c];
        }
    }

    auto volume = Volume3DType::New();
    volume->SetRegions(region);
    volume->SetSpacing(spacing);
    volume->SetOrigin(origin);
    volume->SetDirection(direction);
    volume->Allocate();

    const std::size_t pixels = inPlane[0] * inPlane[1];
    float* out = volume->GetBufferPointer();
    for (std::size_t i = 0; i < sequence.size(); ++i) {
        const auto& image = sequence.slices[i].image;
        if (!image || image->GetLargestPossibleRegion().GetSize()[0] != inPlane[0]
            || image->GetLargestPossibleRegion().GetSize()[1] != inPlane[1]) {
            return std::unexpected(ReconError{
                ReconError::Code::InvalidInput,
                "Slice " + std::to_string(i) + " has no image of the common size"
            });
        }
        const float* in = image->GetBufferPointer();
        std::copy(in, in + pixels, out + i * pixels);
    }
    return volume;
}

}  // namespace sweep_recon::core
