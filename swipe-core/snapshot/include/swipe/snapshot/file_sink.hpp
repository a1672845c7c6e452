#pragma once
#include <expected>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <swipe/batch/repositories.hpp>
#include <swipe/snapshot/snapshot.hpp>

namespace swipe::snapshot {

  // Keeps the newest clustering run of each entity type as one file per type,
  // <directory>/<type>_clusters.<ext>. A write goes to a temporary file that is
  // then renamed over the previous snapshot.
  class SnapshotFileSink : public batch::IClusterSink {
  public:
    // The directory is not created; writing into a missing one fails.
    explicit SnapshotFileSink(std::filesystem::path directory,
                              SnapshotFormat format = SnapshotFormat::Msgpack);

    [[nodiscard]] std::expected<void, std::string> save_clustering_result(
        const clustering::ClusteringResult& result) override;

    // nullopt when no snapshot of that type exists yet. Unreadable or invalid
    // files throw (std::runtime_error, parser errors, std::invalid_argument).
    [[nodiscard]] std::optional<clustering::ClusteringResult> load_latest(EntityType type) const;

    [[nodiscard]] std::filesystem::path path_for(EntityType type) const;
    [[nodiscard]] SnapshotFormat format() const noexcept { return format_; }

  private:
    std::filesystem::path directory_;
    SnapshotFormat format_;
    std::mutex write_mutex_;
  };

}  // namespace swipe::snapshot
