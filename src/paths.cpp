#include <kdm/paths.hpp>

#include <string>

namespace kdm::paths {

std::filesystem::path siblingPath(const std::filesystem::path &path, std::string_view oldSuffix,
                                  std::string_view newSuffix) {
  std::string fileName = path.filename().string();

  if (!oldSuffix.empty() && fileName.ends_with(oldSuffix)) {
    fileName.resize(fileName.size() - oldSuffix.size());
  }
  fileName += newSuffix;

  return path.parent_path() / fileName;
}

std::filesystem::path companionInfoPath(const std::filesystem::path &dataPath) {
  return siblingPath(dataPath, ".bin", "_info.bin");
}

std::filesystem::path defaultManifestPath(const std::filesystem::path &dataPath) {
  return siblingPath(dataPath, ".bin", "_tex.json");
}

std::filesystem::path payloadDirectoryFor(const std::filesystem::path &manifestPath) {
  if (manifestPath.filename().string().ends_with(".json")) {
    return siblingPath(manifestPath, ".json", "");
  }
  // Never collide with the manifest file itself
  return siblingPath(manifestPath, "", ".d");
}

std::filesystem::path defaultDataPath(const std::filesystem::path &manifestPath) {
  if (manifestPath.filename().string().ends_with("_tex.json")) {
    return siblingPath(manifestPath, "_tex.json", ".bin");
  }
  return std::filesystem::path(manifestPath).replace_extension();
}

} // namespace kdm::paths
