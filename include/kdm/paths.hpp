#pragma once

#include <filesystem>
#include <string_view>

// Naming conventions tying the files of one archive together:
//
//   EUR_en.bin       data file
//   EUR_en_info.bin  info file
//   EUR_en_tex.json  manifest
//   EUR_en_tex/      payload files
namespace kdm::paths {

// Same directory as path; the file name loses oldSuffix (if it ends with it) and gains newSuffix
std::filesystem::path siblingPath(const std::filesystem::path &path, std::string_view oldSuffix,
                                  std::string_view newSuffix);

std::filesystem::path companionInfoPath(const std::filesystem::path &dataPath);

std::filesystem::path defaultManifestPath(const std::filesystem::path &dataPath);

std::filesystem::path payloadDirectoryFor(const std::filesystem::path &manifestPath);

std::filesystem::path defaultDataPath(const std::filesystem::path &manifestPath);

} // namespace kdm::paths
