#include <fmt/format.h>

#include <cmath>
#include <cstdint>
#include <cstring>
#include <map>
#include <msgpack.hpp>
#include <nlohmann/json.hpp>
#include <set>
#include <stdexcept>
#include <swipe/common/tracy.hpp>
#include <swipe/snapshot/snapshot.hpp>
#include <utility>
#include <vector>

using json = nlohmann::json;

namespace swipe::snapshot {

  using clustering::Cluster;
  using clustering::ClusteringResult;
  using clustering::Timestamp;

  namespace {

    int64_t to_epoch_ms(Timestamp t) {
      return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
    }

    Timestamp from_epoch_ms(int64_t ms) { return Timestamp(std::chrono::milliseconds(ms)); }

    using ObjectMap = std::map<std::string, msgpack::object>;

    template <typename T> T value_or(const ObjectMap& map, const char* key, T fallback) {
      auto it = map.find(key);
      return it == map.end() ? fallback : it->second.as<T>();
    }

  }  // namespace

  std::string_view to_string(SnapshotFormat format) noexcept {
    return format == SnapshotFormat::Json ? "json" : "msgpack";
  }

  std::string_view file_extension(SnapshotFormat format) noexcept { return to_string(format); }

  // ============================================================================
  // JSON Serialization
  // ============================================================================

  std::string to_json_string(const ClusteringResult& result) {
    SWIPE_ZONE;
    json j;
    j["version"] = std::string(kSnapshotVersion);
    j["metadata"] = {{"entity_type", std::string(to_string(result.metadata.entity_type))},
                     {"total_items", result.metadata.total_items},
                     {"noise_count", result.metadata.noise_count},
                     {"created_at_ms", to_epoch_ms(result.metadata.created_at)}};
    j["quality"] = result.quality;
    j["converged"] = result.converged;
    j["iterations"] = result.iterations;

    json clusters = json::array();
    for (const auto& c : result.clusters) {
      clusters.push_back({{"id", c.id},
                          {"centroid", c.centroid},
                          {"size", c.size},
                          {"density", c.density},
                          {"member_ids", c.member_ids},
                          {"created_at_ms", to_epoch_ms(c.created_at)},
                          {"updated_at_ms", to_epoch_ms(c.updated_at)}});
    }
    j["clusters"] = std::move(clusters);
    j["assignments"] = result.assignments;

    return j.dump(2);
  }

  ClusteringResult from_json_string(const std::string& json_str) {
    SWIPE_ZONE;
    json j = json::parse(json_str);

    ClusteringResult result;

    const auto& meta = j.at("metadata");
    result.metadata.entity_type
        = entity_type_from_string(meta.at("entity_type").get<std::string>());
    result.metadata.total_items = meta.at("total_items").get<size_t>();
    result.metadata.noise_count = meta.value("noise_count", size_t{0});
    result.metadata.created_at = from_epoch_ms(meta.value("created_at_ms", int64_t{0}));

    result.quality = j.at("quality").get<float>();
    result.converged = j.value("converged", true);
    result.iterations = j.value("iterations", 0);

    for (const auto& cj : j.at("clusters")) {
      Cluster c;
      cj.at("id").get_to(c.id);
      cj.at("centroid").get_to(c.centroid);
      cj.at("size").get_to(c.size);
      c.density = cj.value("density", 0.0f);
      c.member_ids = cj.value("member_ids", std::vector<std::string>{});
      c.created_at = from_epoch_ms(cj.value("created_at_ms", int64_t{0}));
      c.updated_at = from_epoch_ms(cj.value("updated_at_ms", int64_t{0}));
      result.clusters.push_back(std::move(c));
    }

    j.at("assignments").get_to(result.assignments);
    return result;
  }

  // ============================================================================
  // MessagePack Serialization
  // ============================================================================

  std::string to_msgpack_string(const ClusteringResult& result) {
    SWIPE_ZONE;
    msgpack::sbuffer buffer;
    msgpack::packer<msgpack::sbuffer> pk(&buffer);

    pk.pack_map(8);

    pk.pack("version");
    pk.pack(std::string(kSnapshotVersion));

    pk.pack("metadata");
    pk.pack_map(4);
    pk.pack("entity_type");
    pk.pack(std::string(to_string(result.metadata.entity_type)));
    pk.pack("total_items");
    pk.pack(static_cast<uint64_t>(result.metadata.total_items));
    pk.pack("noise_count");
    pk.pack(static_cast<uint64_t>(result.metadata.noise_count));
    pk.pack("created_at_ms");
    pk.pack(to_epoch_ms(result.metadata.created_at));

    pk.pack("quality");
    pk.pack(result.quality);
    pk.pack("converged");
    pk.pack(result.converged);
    pk.pack("iterations");
    pk.pack(result.iterations);

    // Cluster records without centroids; those follow as one blob.
    pk.pack("clusters");
    pk.pack_array(static_cast<uint32_t>(result.clusters.size()));
    for (const auto& c : result.clusters) {
      pk.pack_map(6);
      pk.pack("id");
      pk.pack(c.id);
      pk.pack("size");
      pk.pack(static_cast<uint64_t>(c.size));
      pk.pack("density");
      pk.pack(c.density);
      pk.pack("member_ids");
      pk.pack(c.member_ids);
      pk.pack("created_at_ms");
      pk.pack(to_epoch_ms(c.created_at));
      pk.pack("updated_at_ms");
      pk.pack(to_epoch_ms(c.updated_at));
    }

    const size_t rows = result.clusters.size();
    const size_t cols = rows == 0 ? 0 : result.clusters.front().centroid.size();
    std::vector<float> flat;
    flat.reserve(rows * cols);
    for (const auto& c : result.clusters) {
      if (c.centroid.size() != cols) {
        throw std::invalid_argument(
            fmt::format("cluster {} centroid has {} dims, expected {}", c.id, c.centroid.size(),
                        cols));
      }
      flat.insert(flat.end(), c.centroid.begin(), c.centroid.end());
    }

    pk.pack("centroids");
    pk.pack_map(3);
    pk.pack("rows");
    pk.pack(static_cast<uint64_t>(rows));
    pk.pack("cols");
    pk.pack(static_cast<uint64_t>(cols));
    pk.pack("data");
    const size_t data_size = flat.size() * sizeof(float);
    pk.pack_bin(static_cast<uint32_t>(data_size));
    pk.pack_bin_body(reinterpret_cast<const char*>(flat.data()), static_cast<uint32_t>(data_size));

    pk.pack("assignments");
    pk.pack(result.assignments);

    return std::string(buffer.data(), buffer.size());
  }

  ClusteringResult from_msgpack_string(const std::string& data) {
    SWIPE_ZONE;
    msgpack::object_handle handle = msgpack::unpack(data.data(), data.size());
    auto map = handle.get().as<ObjectMap>();

    ClusteringResult result;

    auto meta = map.at("metadata").as<ObjectMap>();
    result.metadata.entity_type = entity_type_from_string(meta.at("entity_type").as<std::string>());
    result.metadata.total_items = meta.at("total_items").as<uint64_t>();
    result.metadata.noise_count = value_or<uint64_t>(meta, "noise_count", 0);
    result.metadata.created_at = from_epoch_ms(value_or<int64_t>(meta, "created_at_ms", 0));

    result.quality = map.at("quality").as<float>();
    result.converged = value_or<bool>(map, "converged", true);
    result.iterations = value_or<int>(map, "iterations", 0);

    auto clusters_arr = map.at("clusters").as<std::vector<msgpack::object>>();
    result.clusters.reserve(clusters_arr.size());
    for (const auto& obj : clusters_arr) {
      auto cm = obj.as<ObjectMap>();
      Cluster c;
      c.id = cm.at("id").as<std::string>();
      c.size = cm.at("size").as<uint64_t>();
      c.density = value_or<float>(cm, "density", 0.0f);
      c.member_ids = value_or<std::vector<std::string>>(cm, "member_ids", {});
      c.created_at = from_epoch_ms(value_or<int64_t>(cm, "created_at_ms", 0));
      c.updated_at = from_epoch_ms(value_or<int64_t>(cm, "updated_at_ms", 0));
      result.clusters.push_back(std::move(c));
    }

    // Centroids (binary blob)
    auto centroids = map.at("centroids").as<ObjectMap>();
    auto rows = centroids.at("rows").as<uint64_t>();
    auto cols = centroids.at("cols").as<uint64_t>();
    std::string bytes = centroids.at("data").as<std::string>();

    if (rows != result.clusters.size()) {
      throw std::invalid_argument(fmt::format("centroid rows ({}) does not match cluster count ({})",
                                              rows, result.clusters.size()));
    }
    if (cols != 0 && rows > SIZE_MAX / cols) [[unlikely]] {
      throw std::invalid_argument("centroid rows * cols would overflow");
    }
    if (rows * cols > SIZE_MAX / sizeof(float)) [[unlikely]] {
      throw std::invalid_argument("centroid data size would overflow");
    }
    const uint64_t expected_size = rows * cols * sizeof(float);
    if (bytes.size() != expected_size) {
      throw std::invalid_argument(fmt::format(
          "centroid data size mismatch: expected {} bytes, got {}", expected_size, bytes.size()));
    }
    for (size_t i = 0; i < rows; ++i) {
      auto& centroid = result.clusters[i].centroid;
      centroid.resize(cols);
      std::memcpy(centroid.data(), bytes.data() + i * cols * sizeof(float), cols * sizeof(float));
    }

    result.assignments = map.at("assignments").as<clustering::Assignments>();
    return result;
  }

  std::string encode(const ClusteringResult& result, SnapshotFormat format) {
    return format == SnapshotFormat::Json ? to_json_string(result) : to_msgpack_string(result);
  }

  ClusteringResult decode(const std::string& data, SnapshotFormat format) {
    return format == SnapshotFormat::Json ? from_json_string(data) : from_msgpack_string(data);
  }

  // ============================================================================
  // Validation
  // ============================================================================

  void validate(const ClusteringResult& result) {
    if (!std::isfinite(result.quality) || result.quality < 0.0f || result.quality > 1.0f) {
      throw std::invalid_argument(
          fmt::format("quality must be in range [0.0, 1.0], got {}", result.quality));
    }
    if (result.iterations < 0) {
      throw std::invalid_argument(
          fmt::format("iterations must be non-negative, got {}", result.iterations));
    }

    std::set<std::string> ids;
    const size_t dim = result.clusters.empty() ? 0 : result.clusters.front().centroid.size();
    for (const auto& c : result.clusters) {
      if (!ids.insert(c.id).second) {
        throw std::invalid_argument(fmt::format("duplicate cluster id '{}'", c.id));
      }
      if (c.centroid.size() != dim) {
        throw std::invalid_argument(fmt::format("cluster {} centroid has {} dims, expected {}",
                                                c.id, c.centroid.size(), dim));
      }
      if (c.size != c.member_ids.size()) {
        throw std::invalid_argument(fmt::format("cluster {} size ({}) does not match {} members",
                                                c.id, c.size, c.member_ids.size()));
      }
      for (const auto& member : c.member_ids) {
        auto it = result.assignments.find(member);
        if (it == result.assignments.end() || it->second != c.id) {
          throw std::invalid_argument(
              fmt::format("member {} of cluster {} is not assigned to it", member, c.id));
        }
      }
    }

    for (const auto& [entity_id, cluster_id] : result.assignments) {
      if (!ids.contains(cluster_id)) {
        throw std::invalid_argument(fmt::format("entity {} is assigned to unknown cluster '{}'",
                                                entity_id, cluster_id));
      }
    }
  }

}  // namespace swipe::snapshot
