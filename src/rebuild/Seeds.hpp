#pragma once

#include "rebuild/ProjectInputs.hpp"

#include <cstdint>

namespace rebuild {

// Seeds parameterizing the downstream stages.
//
// One seed per concern so stages vary independently instead of producing
// visibly correlated numbers. All seeds are recomputed per run; nothing here is
// cached or persisted.
struct SeedSet {
  std::uint64_t metadataDigest = 0;
  std::uint64_t manifestDigest = 0;

  std::uint64_t pieces = 0;
  std::uint64_t structural = 0;
  std::uint64_t hazard = 0;
  std::uint64_t environment = 0;
  std::uint64_t feasibility = 0;

  bool operator==(const SeedSet& o) const
  {
    return metadataDigest == o.metadataDigest && manifestDigest == o.manifestDigest && pieces == o.pieces &&
           structural == o.structural && hazard == o.hazard && environment == o.environment &&
           feasibility == o.feasibility;
  }
};

// Placeholder hashed in place of an empty field.
inline constexpr const char* kUnsetFieldPlaceholder = "<unset>";

// Digest of the metadata text fields in a fixed order.
std::uint64_t DigestMetadata(const ProjectMetadata& meta);

// Digest of the manifest entry names (assets first, then scans).
std::uint64_t DigestManifest(const FileManifest& manifest);

// Piece, hazard, environment and feasibility seeds depend on the
// metadata digest only: adding or removing files changes how many pieces exist
// but never the attributes of the pieces that remain. The structural seed also
// folds in the manifest digest (scan coverage changes the structural read).
SeedSet DeriveSeeds(const ProjectMetadata& meta, const FileManifest& manifest);

} // namespace rebuild
