// SPDX-License-Identifier: Apache-2.0
#include "PcmFile.hpp"

#include <core/Log.hpp>

#include <bit>
#include <cstring>
#include <format>
#include <fstream>
#include <iterator>

namespace scribe
{

namespace
{

    auto loadFloat32(const std::byte* data) -> float
    {
        auto bits = std::uint32_t {};
        std::memcpy(&bits, data, sizeof(bits));
        if constexpr (std::endian::native == std::endian::big)
            bits = std::byteswap(bits);
        return std::bit_cast<float>(bits);
    }

    auto loadInt16(const std::byte* data) -> std::int16_t
    {
        auto bits = std::uint16_t {};
        std::memcpy(&bits, data, sizeof(bits));
        if constexpr (std::endian::native == std::endian::big)
            bits = std::byteswap(bits);
        return static_cast<std::int16_t>(bits);
    }

    auto sampleSize(PcmFormat format) -> std::size_t
    {
        switch (format)
        {
            case PcmFormat::Float32: return sizeof(float);
            case PcmFormat::Int16: return sizeof(std::int16_t);
        }
        return sizeof(float);
    }

} // namespace

auto pcmFormatFromString(std::string_view name) -> Result<PcmFormat>
{
    if (name == "f32")
        return PcmFormat::Float32;
    if (name == "s16")
        return PcmFormat::Int16;
    return makeError(ErrorCode::InvalidArgument, std::format("Unknown PCM format: {} (expected f32 or s16)", name));
}

auto decodePcm(std::span<const std::byte> bytes, PcmFormat format) -> Result<std::vector<float>>
{
    auto const size = sampleSize(format);
    if (bytes.size() % size != 0)
        return makeError(ErrorCode::InvalidArgument,
                         std::format("PCM data size {} is not a multiple of the sample size {}", bytes.size(), size));

    auto samples = std::vector<float>(bytes.size() / size);
    for (auto i = std::size_t { 0 }; i < samples.size(); ++i)
    {
        auto const* data = bytes.data() + i * size;
        if (format == PcmFormat::Float32)
            samples[i] = loadFloat32(data);
        else
            samples[i] = static_cast<float>(loadInt16(data)) / 32768.0f;
    }
    return samples;
}

auto readBinaryFile(std::string_view path) -> Result<std::vector<std::byte>>
{
    auto file = std::ifstream(std::string(path), std::ios::binary);
    if (!file.is_open())
        return makeError(ErrorCode::IoError, std::format("Cannot open file: {}", path));

    auto const chars = std::vector<char>(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    if (file.bad())
        return makeError(ErrorCode::IoError, std::format("Failed to read file: {}", path));

    auto bytes = std::vector<std::byte>(chars.size());
    if (!chars.empty())
        std::memcpy(bytes.data(), chars.data(), chars.size());
    return bytes;
}

auto readPcmFile(std::string_view path, PcmFormat format) -> Result<std::vector<float>>
{
    auto bytes = readBinaryFile(path);
    if (!bytes)
        return std::unexpected(bytes.error());

    auto samples = decodePcm(*bytes, format);
    if (samples)
        log::debug("Loaded {} samples from {}", samples->size(), path);
    return samples;
}

} // namespace scribe
