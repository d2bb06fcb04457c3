#pragma once
#include <vector>

#include "protocol.hpp"

// Combined view of a friend's galleries: every live gallery (first occurrence
// of each name, input order) followed by downloaded-only galleries in input
// order. A downloaded gallery whose name matches a live one only flips that
// entry's is_downloaded flag. Names compare byte-exact.
std::vector<GalleryDescriptor> merge_galleries(const std::vector<GalleryDescriptor>& live,
                                               const std::vector<GalleryDescriptor>& downloaded);
