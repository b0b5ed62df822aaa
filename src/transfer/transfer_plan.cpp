#include "transfer/transfer_plan.hpp"
#include "transfer/transfer_error.hpp"
#include <algorithm>
#include <iterator>
#include <boost/log/trivial.hpp>

namespace pneumatic {
namespace transfer {

TransferPlan::TransferPlan(std::vector<FileMetadata> small_files,
                           std::vector<FileMetadata> single_chunk_files,
                           std::vector<FileMetadata> large_files,
                           const PlanThresholds& thresholds)
  : small_files_(std::move(small_files))
  , single_chunk_files_(std::move(single_chunk_files))
  , large_files_(std::move(large_files))
  , thresholds_(thresholds) {
}

TransferPlan TransferPlan::create(std::vector<FileMetadata> files, const PlanThresholds& thresholds) {
  if (thresholds.small_file_threshold > thresholds.large_file_threshold) {
    throw PlanningError("small file threshold " + std::to_string(thresholds.small_file_threshold) +
                        " exceeds large file threshold " + std::to_string(thresholds.large_file_threshold));
  }

  std::stable_sort(files.begin(), files.end(), [](const FileMetadata& lhs, const FileMetadata& rhs) {
    return lhs.size < rhs.size;
  });

  auto below = [](const FileMetadata& file, uint64_t threshold) { return file.size < threshold; };
  const auto single_begin = std::lower_bound(files.begin(), files.end(),
                                             thresholds.small_file_threshold, below);
  const auto large_begin = std::lower_bound(single_begin, files.end(),
                                            thresholds.large_file_threshold, below);

  std::vector<FileMetadata> small_files(std::make_move_iterator(files.begin()),
                                        std::make_move_iterator(single_begin));
  std::vector<FileMetadata> single_chunk_files(std::make_move_iterator(single_begin),
                                               std::make_move_iterator(large_begin));
  std::vector<FileMetadata> large_files(std::make_move_iterator(large_begin),
                                        std::make_move_iterator(files.end()));

  BOOST_LOG_TRIVIAL(info) << "Transfer plan: " << small_files.size() << " small, "
                          << single_chunk_files.size() << " single-chunk, "
                          << large_files.size() << " large";

  return TransferPlan(std::move(small_files), std::move(single_chunk_files),
                      std::move(large_files), thresholds);
}

std::size_t TransferPlan::file_count() const {
  return small_files_.size() + single_chunk_files_.size() + large_files_.size();
}

uint64_t TransferPlan::total_size() const {
  uint64_t total = 0;
  for (const auto* bucket : {&small_files_, &single_chunk_files_, &large_files_}) {
    for (const auto& file : *bucket) {
      total += file.size;
    }
  }
  return total;
}

} // namespace transfer
} // namespace pneumatic
