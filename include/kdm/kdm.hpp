#pragma once

// KDM Archive Library
// A C++20 library for extracting and rebuilding the paired info/data resource archives
// (EUR_en.bin + EUR_en_info.bin and friends) that hold a game's localized textures.

#include "archive.hpp"
#include "data_block.hpp"
#include "entry_table.hpp"
#include "info_codec.hpp"
#include "manifest.hpp"
#include "paths.hpp"
#include "types.hpp"

// The library provides three levels of abstraction:
//
// 1. Codecs: InfoCodec / DataBlockCodec
//    - Pure byte-buffer translation, no file I/O
//
// 2. ManifestBridge
//    - Editable JSON manifest plus one payload file per entry
//
// 3. Orchestration: ArchiveExtractor / ArchiveBuilder / Archive
//    - Whole extract and rebuild operations on files
//
// Example usage:
//
//   // Extracting an archive
//   kdm::Error error;
//   auto manifest = kdm::ArchiveExtractor::extractFiles(
//       "EUR_en.bin", kdm::paths::defaultManifestPath("EUR_en.bin"), {}, &error);
//   if (!manifest) {
//     std::cerr << error.describe() << std::endl;
//   }
//
//   // Rebuilding it after editing EUR_en_tex.json
//   kdm::ArchiveBuilder::rebuildFiles("EUR_en_tex.json", "EUR_en.bin", "EUR_en_info.bin");

namespace kdm {}
