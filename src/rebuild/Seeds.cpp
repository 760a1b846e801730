#include "rebuild/Seeds.hpp"

#include "rebuild/Hash.hpp"
#include "rebuild/Random.hpp"

namespace rebuild {

namespace {

// Fixed per-concern salts. Changing any of these changes every report.
constexpr std::uint64_t kSaltPieces = 0x50494543455331ULL;      // "PIECES1"
constexpr std::uint64_t kSaltStructural = 0x5354525543545552ULL; // "STRUCTUR"
constexpr std::uint64_t kSaltHazard = 0x48415A415244ULL;        // "HAZARD"
constexpr std::uint64_t kSaltEnvironment = 0x454E5649524F4EULL; // "ENVIRON"
constexpr std::uint64_t kSaltFeasibility = 0x4645415349424CULL; // "FEASIBL"

constexpr std::uint8_t kFieldSeparator = 0x1F;

void HashField(std::uint64_t& h, const std::string& s)
{
  HashText(h, s.empty() ? std::string_view(kUnsetFieldPlaceholder) : std::string_view(s));
  HashByte(h, kFieldSeparator);
}

} // namespace

std::uint64_t DigestMetadata(const ProjectMetadata& meta)
{
  std::uint64_t h = kFnvOffset;
  HashField(h, meta.projectName);
  HashField(h, meta.description);
  HashField(h, meta.transportPlan);
  HashField(h, meta.humanBuilt ? std::string("human_built=true") : std::string("human_built=false"));
  HashField(h, meta.siteLocation);
  HashField(h, meta.soilProfile);
  HashField(h, meta.hazardProfile);
  HashField(h, meta.demolitionNotes);
  HashField(h, meta.lidarNotes);
  return h;
}

std::uint64_t DigestManifest(const FileManifest& manifest)
{
  std::uint64_t h = kFnvOffset;
  for (const UploadedFile& f : manifest.assets) {
    HashByte(h, 'A');
    HashField(h, f.filename);
  }
  for (const UploadedFile& f : manifest.scans) {
    HashByte(h, 'S');
    HashField(h, f.filename);
  }
  return h;
}

SeedSet DeriveSeeds(const ProjectMetadata& meta, const FileManifest& manifest)
{
  SeedSet s;
  s.metadataDigest = DigestMetadata(meta);
  s.manifestDigest = DigestManifest(manifest);

  s.pieces = MixSeed(s.metadataDigest, kSaltPieces);
  s.hazard = MixSeed(s.metadataDigest, kSaltHazard);
  s.environment = MixSeed(s.metadataDigest, kSaltEnvironment);
  s.feasibility = MixSeed(s.metadataDigest, kSaltFeasibility);
  s.structural = MixSeed(s.metadataDigest ^ MixSeed(s.manifestDigest, kSaltStructural), kSaltStructural);
  return s;
}

} // namespace rebuild
