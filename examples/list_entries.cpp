#include <iostream>

#include <kdm/kdm.hpp>

int main(int argc, char *argv[]) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <archive.bin> [entry]\n";
    return 1;
  }

  kdm::Error error;
  auto archive = kdm::Archive::open(argv[1], &error);

  if (!archive) {
    std::cerr << "Error: " << error.describe() << "\n";
    return 1;
  }

  if (argc >= 3) {
    const auto *entry = archive->lookup(argv[2], &error);
    if (!entry) {
      std::cerr << "Error: " << error.describe() << "\n";
      return 1;
    }
    std::cout << entry->name << ": offset " << entry->offset << ", " << entry->size << " bytes\n";
    return 0;
  }

  std::cout << "Archive: " << argv[1] << "\n";
  std::cout << "Entries: " << archive->entryCount() << "\n\n";

  for (const auto &entry : archive->entries()) {
    std::cout << "  " << entry.name << " (" << entry.size << " bytes)\n";
  }

  return 0;
}
