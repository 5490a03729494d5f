// src/io/soundbank_locator.cpp

#include "io/soundbank_locator.hpp"
#include "io/io.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace {

bool has_sf2_extension(const fs::path &p) {
  std::string ext = p.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return ext == ".sf2";
}

} // namespace

namespace io {

std::size_t edit_distance(const std::string &a, const std::string &b) {
  // Two-row dynamic programming table.
  std::vector<std::size_t> prev(b.size() + 1), cur(b.size() + 1);
  for (std::size_t j = 0; j <= b.size(); ++j)
    prev[j] = j;
  for (std::size_t i = 1; i <= a.size(); ++i) {
    cur[0] = i;
    for (std::size_t j = 1; j <= b.size(); ++j) {
      const std::size_t subst = prev[j - 1] + (a[i - 1] == b[j - 1] ? 0 : 1);
      cur[j] = std::min({prev[j] + 1, cur[j - 1] + 1, subst});
    }
    std::swap(prev, cur);
  }
  return prev[b.size()];
}

std::optional<fs::path> guess_sound_bank(const fs::path &midiFile,
                                         bool looseMatching) {
  const fs::path midiDir = midiFile.parent_path();
  const fs::path parentDir = midiDir.parent_path();
  const std::string stem = midiFile.stem().string();

  const std::vector<fs::path> candidates = {
      midiDir / (stem + ".sf2"),
      midiDir / (midiDir.filename().string() + ".sf2"),
      parentDir / (parentDir.filename().string() + ".sf2"),
  };
  for (const auto &c : candidates) {
    if (io::is_file(c))
      return c;
  }

  if (!looseMatching)
    return std::nullopt;

  std::error_code ec;
  fs::directory_iterator it(midiDir.empty() ? fs::path(".") : midiDir, ec);
  if (ec)
    return std::nullopt;

  std::optional<fs::path> best;
  std::size_t bestDistance = std::numeric_limits<std::size_t>::max();
  for (const auto &entry : it) {
    if (!entry.is_regular_file(ec) || !has_sf2_extension(entry.path()))
      continue;
    const std::size_t d =
        edit_distance(entry.path().filename().string(), stem);
    if (d < bestDistance) {
      bestDistance = d;
      best = entry.path();
    }
  }
  return best;
}

std::optional<fs::path> resolve_sound_bank(const std::string &nameOrPath,
                                           const fs::path &searchDir) {
  const fs::path direct(nameOrPath);
  if (io::is_file(direct))
    return direct;

  const std::vector<fs::path> candidates = {
      searchDir / nameOrPath,
      searchDir / (nameOrPath + ".sf2"),
  };
  for (const auto &c : candidates) {
    if (io::is_file(c))
      return c;
  }
  return std::nullopt;
}

} // namespace io
