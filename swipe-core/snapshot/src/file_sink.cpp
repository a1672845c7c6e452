#include <fmt/format.h>

#include <exception>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <swipe/common/logging.hpp>
#include <swipe/common/tracy.hpp>
#include <swipe/snapshot/file_sink.hpp>
#include <system_error>
#include <utility>

namespace swipe::snapshot {

  using clustering::ClusteringResult;

  SnapshotFileSink::SnapshotFileSink(std::filesystem::path directory, SnapshotFormat format)
      : directory_(std::move(directory)), format_(format) {}

  std::filesystem::path SnapshotFileSink::path_for(EntityType type) const {
    return directory_ / fmt::format("{}_clusters.{}", to_string(type), file_extension(format_));
  }

  std::expected<void, std::string> SnapshotFileSink::save_clustering_result(
      const ClusteringResult& result) {
    SWIPE_ZONE;
    auto log = get_logger("swipe.snapshot");

    std::string data;
    try {
      data = encode(result, format_);
    } catch (const std::exception& e) {
      return std::unexpected(fmt::format("Failed to encode snapshot: {}", e.what()));
    }

    const auto target = path_for(result.metadata.entity_type);
    auto tmp = target;
    tmp += ".tmp";

    std::lock_guard lock(write_mutex_);
    {
      std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
      if (!file.is_open()) {
        return std::unexpected(
            fmt::format("Failed to open snapshot file for writing: {}", tmp.string()));
      }
      file.write(data.data(), static_cast<std::streamsize>(data.size()));
      file.flush();
      if (!file) {
        std::error_code ignored;
        std::filesystem::remove(tmp, ignored);
        return std::unexpected(fmt::format("Failed to write snapshot file: {}", tmp.string()));
      }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, target, ec);
    if (ec) {
      std::error_code ignored;
      std::filesystem::remove(tmp, ignored);
      return std::unexpected(
          fmt::format("Failed to replace snapshot {}: {}", target.string(), ec.message()));
    }

    log->debug("wrote {} bytes to {}", data.size(), target.string());
    return {};
  }

  std::optional<ClusteringResult> SnapshotFileSink::load_latest(EntityType type) const {
    SWIPE_ZONE;
    const auto path = path_for(type);
    if (!std::filesystem::exists(path)) return std::nullopt;

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
      throw std::runtime_error(fmt::format("Failed to open snapshot file: {}", path.string()));
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    auto result = decode(buffer.str(), format_);
    validate(result);
    if (result.metadata.entity_type != type) {
      throw std::invalid_argument(fmt::format("snapshot {} holds {} clusters, expected {}",
                                              path.string(), to_string(result.metadata.entity_type),
                                              to_string(type)));
    }

    get_logger("swipe.snapshot")
        ->info("loaded {} {} clusters from {}", result.clusters.size(), to_string(type),
               path.string());
    return result;
  }

}  // namespace swipe::snapshot
