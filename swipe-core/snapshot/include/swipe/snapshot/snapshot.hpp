#pragma once
#include <string>
#include <string_view>
#include <swipe/clustering/types.hpp>

namespace swipe::snapshot {

  inline constexpr std::string_view kSnapshotVersion = "1.0";

  enum class SnapshotFormat { Json, Msgpack };

  [[nodiscard]] std::string_view to_string(SnapshotFormat format) noexcept;

  // File extension without the dot: "json" or "msgpack".
  [[nodiscard]] std::string_view file_extension(SnapshotFormat format) noexcept;

  // Timestamps are stored as milliseconds since the Unix epoch; finer precision is dropped.
  [[nodiscard]] std::string to_json_string(const clustering::ClusteringResult& result);
  [[nodiscard]] clustering::ClusteringResult from_json_string(const std::string& json_str);

  // Centroids are packed as one row-major float32 binary blob.
  [[nodiscard]] std::string to_msgpack_string(const clustering::ClusteringResult& result);
  [[nodiscard]] clustering::ClusteringResult from_msgpack_string(const std::string& data);

  [[nodiscard]] std::string encode(const clustering::ClusteringResult& result,
                                   SnapshotFormat format);
  [[nodiscard]] clustering::ClusteringResult decode(const std::string& data,
                                                    SnapshotFormat format);

  // Throws std::invalid_argument when the result breaks one of its invariants:
  // quality outside [0, 1], negative iterations, duplicate cluster ids, size not
  // matching member_ids, centroids of different dimensions, or an assignment
  // that disagrees with cluster membership.
  void validate(const clustering::ClusteringResult& result);

}  // namespace swipe::snapshot
