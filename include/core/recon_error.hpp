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
 * @file recon_error.hpp
 * @brief Error type shared by every reconstruction stage
 * @details All fallible operations return std::expected<T, ReconError>.
 *          Configuration and input errors are fatal for a run; recovered
 *          conditions (estimation gaps, regularized RBF systems) are logged
 *          and never surface as a ReconError.
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include <string>

namespace sweep_recon {

/**
 * @brief Error information for reconstruction operations
 */
struct ReconError {
    enum class Code {
        Success,
        InvalidInput,             ///< Missing/unreadable input or geometry mismatch
        InvalidConfiguration,     ///< Parameter out of range
        ClassificationImbalance,  ///< A respiration state would receive no slice
        ProcessingFailed,         ///< Numerical or ITK pipeline failure
        IoError,                  ///< Read/write failure
        InternalError
    };

    Code code = Code::Success;
    std::string message;

    [[nodiscard]] bool isSuccess() const noexcept {
        return code == Code::Success;
    }

    [[nodiscard]] std::string toString() const {
        switch (code) {
            case Code::Success: return "Success";
            case Code::InvalidInput: return "Invalid input: " + message;
            case Code::InvalidConfiguration:
                return "Invalid configuration: " + message;
            case Code::ClassificationImbalance:
                return "Classification imbalance: " + message;
            case Code::ProcessingFailed: return "Processing failed: " + message;
            case Code::IoError: return "I/O error: " + message;
            case Code::InternalError: return "Internal error: " + message;
        }
        return "Unknown error";
    }
};

}  // namespace sweep_recon
