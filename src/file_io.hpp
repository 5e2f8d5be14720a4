#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <vector>

#include <kdm/types.hpp>

namespace kdm::detail {

// Whole-file helpers shared by the manifest bridge and the builder.
// Failures are reported as IoError.
bool writeFile(const std::filesystem::path &path, std::span<const uint8_t> bytes,
               Error *outError);

std::optional<std::vector<uint8_t>> readFile(const std::filesystem::path &path, Error *outError);

} // namespace kdm::detail
