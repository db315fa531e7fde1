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

/**
 * @file volume_io.hpp
 * @brief Reading and writing of geometry-tagged volumes
 * @details NIfTI (.nii, .nii.gz) and NRRD (.nrrd, .nhdr) are selected by
 *          extension; other extensions go through the ITK IO factories.
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include <expected>
#include <filesystem>
#include <vector>

#include <itkImage.h>

#include "core/recon_error.hpp"
#include "core/slice_sequence.hpp"

namespace sweep_recon::core {

/**
 * @brief Volume file access for the reconstruction pipeline
 */
class VolumeIO {
public:
    /// Raw sweep input (x, y, slice, dynamic)
    using Volume4DType = itk::Image<float, 4>;

    /// Sorted slice stack and reconstructed state volumes
    using Volume3DType = itk::Image<float, 3>;

    /**
     * @brief Read a 4D volume
     *
     * 3D files are read as 4D volumes with one dynamic.
     *
     * @return InvalidInput if the file does not exist, IoError if ITK cannot
     *         read it
     */
    [[nodiscard]] static std::expected<Volume4DType::Pointer, ReconError>
    readVolume4D(const std::filesystem::path& path);

    [[nodiscard]] static std::expected<Volume3DType::Pointer, ReconError>
    readVolume3D(const std::filesystem::path& path);

    /**
     * @brief Write a 4D volume, creating parent directories
     */
    [[nodiscard]] static std::expected<void, ReconError>
    writeVolume4D(const Volume4DType::Pointer& volume,
                  const std::filesystem::path& path);

    /**
     * @brief Write a 3D volume, creating parent directories
     */
    [[nodiscard]] static std::expected<void, ReconError>
    writeVolume3D(const Volume3DType::Pointer& volume,
                  const std::filesystem::path& path);

    /**
     * @brief Stack same-sized 3D volumes along a fourth axis
     *
     * Geometry of the first three axes is taken from the first volume, the
     * fourth axis has unit spacing.
     *
     * @return InvalidInput if the list is empty or sizes differ
     */
    [[nodiscard]] static std::expected<Volume4DType::Pointer, ReconError>
    stackVolumes(const std::vector<Volume3DType::Pointer>& volumes);

    /**
     * @brief Stack the slices of a sequence into a 3D volume in acquisition
     *        order
     *
     * The third axis spacing is the nominal slice spacing divided by the
     * dynamics per position, i.e. the distance between consecutive frames.
     */
    [[nodiscard]] static std::expected<Volume3DType::Pointer, ReconError>
    sequenceToVolume(const SliceSequence& sequence);
};

}  // namespace sweep_recon::core
