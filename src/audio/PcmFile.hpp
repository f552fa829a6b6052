// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace scribe
{

/// @brief Sample encoding of a headerless PCM file.
enum class PcmFormat : std::uint8_t
{
    Float32, ///< IEEE-754 float, little-endian.
    Int16,   ///< Signed 16-bit integer, little-endian.
};

/// @brief Parses "f32" or "s16".
[[nodiscard]] auto pcmFormatFromString(std::string_view name) -> Result<PcmFormat>;

/// @brief Converts raw little-endian PCM bytes to float samples.
///
/// Int16 samples are scaled by 1/32768. No resampling or channel mixing is done.
/// @return The samples, or InvalidArgument if the byte count is not a multiple of the sample size.
[[nodiscard]] auto decodePcm(std::span<const std::byte> bytes, PcmFormat format) -> Result<std::vector<float>>;

/// @brief Reads a headerless mono PCM file into memory.
/// @return The samples, IoError if the file cannot be read, or the decodePcm() error.
[[nodiscard]] auto readPcmFile(std::string_view path, PcmFormat format) -> Result<std::vector<float>>;

/// @brief Reads a whole file into memory.
[[nodiscard]] auto readBinaryFile(std::string_view path) -> Result<std::vector<std::byte>>;

} // namespace scribe
