#include "gallery_merger.hpp"

#include <string>
#include <unordered_map>
#include <unordered_set>

std::vector<GalleryDescriptor> merge_galleries(const std::vector<GalleryDescriptor>& live,
                                               const std::vector<GalleryDescriptor>& downloaded) {
  std::vector<GalleryDescriptor> merged;
  merged.reserve(live.size() + downloaded.size());
  std::unordered_map<std::string, std::size_t> live_index;

  for(const auto& g : live) {
    if(live_index.count(g.name)) continue;
    live_index.emplace(g.name, merged.size());
    GalleryDescriptor entry = g;
    entry.source = GallerySource::Live;
    entry.is_downloaded = false;
    merged.push_back(std::move(entry));
  }

  std::unordered_set<std::string> appended;
  for(const auto& g : downloaded) {
    auto it = live_index.find(g.name);
    if(it != live_index.end()) {
      merged[it->second].is_downloaded = true;
      continue;
    }
    if(!appended.insert(g.name).second) continue;
    GalleryDescriptor entry = g;
    entry.source = GallerySource::Downloaded;
    entry.is_downloaded = false;
    merged.push_back(std::move(entry));
  }
  return merged;
}
