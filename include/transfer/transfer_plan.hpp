#ifndef PNEUMATIC_TRANSFER_PLAN_HPP
#define PNEUMATIC_TRANSFER_PLAN_HPP

#include <cstdint>
#include <vector>
#include "transfer/file_metadata.hpp"

namespace pneumatic {
namespace transfer {

struct PlanThresholds {
    static constexpr uint64_t DEFAULT_SMALL_FILE_THRESHOLD = 1000000;
    static constexpr uint64_t DEFAULT_LARGE_FILE_THRESHOLD = 512000000;
    static constexpr uint64_t DEFAULT_BUNDLE_TARGET_SIZE = 64000000;

    // Files below this size are bundled together
    uint64_t small_file_threshold = DEFAULT_SMALL_FILE_THRESHOLD;
    // Files at or above this size are split into chunks
    uint64_t large_file_threshold = DEFAULT_LARGE_FILE_THRESHOLD;
    // Target size of one bundle of small files
    uint64_t bundle_target_size = DEFAULT_BUNDLE_TARGET_SIZE;
};

/**
 * Partition of a file set into three size buckets, each sorted ascending by size:
 * small        size < small_file_threshold
 * single-chunk small_file_threshold <= size < large_file_threshold
 * large        size >= large_file_threshold
 */
class TransferPlan {
public:
  // Throws PlanningError if the small threshold exceeds the large one
  static TransferPlan create(std::vector<FileMetadata> files, const PlanThresholds& thresholds = PlanThresholds());


  // ---- GETTERS ----
  const std::vector<FileMetadata>& small_files() const { return small_files_; }
  const std::vector<FileMetadata>& single_chunk_files() const { return single_chunk_files_; }
  const std::vector<FileMetadata>& large_files() const { return large_files_; }
  const PlanThresholds& thresholds() const { return thresholds_; }

  std::size_t file_count() const;
  // Sum of all file sizes across the buckets
  uint64_t total_size() const;

private:
  TransferPlan(std::vector<FileMetadata> small_files,
               std::vector<FileMetadata> single_chunk_files,
               std::vector<FileMetadata> large_files,
               const PlanThresholds& thresholds);

  // ---- PARAMETERS ----
  std::vector<FileMetadata> small_files_;
  std::vector<FileMetadata> single_chunk_files_;
  std::vector<FileMetadata> large_files_;
  PlanThresholds thresholds_;
};

} // namespace transfer
} // namespace pneumatic

#endif // PNEUMATIC_TRANSFER_PLAN_HPP
