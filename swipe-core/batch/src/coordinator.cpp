#include <fmt/format.h>

#include <exception>
#include <stdexcept>
#include <swipe/batch/coordinator.hpp>
#include <swipe/common/logging.hpp>
#include <swipe/common/tracy.hpp>
#include <utility>

namespace swipe::batch {

  namespace {

    void check_pairing(const EntityRepositories& repos, EntityType type) {
      if (static_cast<bool>(repos.ids) != static_cast<bool>(repos.embedding_service)) {
        throw std::invalid_argument(
            fmt::format("{} repositories need both an id source and an embedding service",
                        to_string(type)));
      }
    }

    BatchConfig validated(BatchConfig config) {
      config.validate();
      return config;
    }

  }  // namespace

  BatchCoordinator::BatchCoordinator(BatchConfig config, BatchRepositories repositories)
      : config_(validated(std::move(config))),
        repositories_(std::move(repositories)),
        recalculator_(config_.batch_size, repositories_.sink),
        refresher_(config_.batch_size, config_.max_items_per_run),
        registry_(config_.clustering.distance) {
    check_pairing(repositories_.users, EntityType::User);
    check_pairing(repositories_.posts, EntityType::Post);
  }

  BatchCoordinator::~BatchCoordinator() { stop(); }

  // ============================================================================
  // Lifecycle
  // ============================================================================

  void BatchCoordinator::start() {
    auto log = get_logger("swipe.coordinator");
    std::lock_guard lock(lifecycle_mutex_);
    if (running_.load()) {
      log->warn("batch jobs already running");
      return;
    }

    timers_.push_back(std::make_unique<PeriodicTimer>(
        "embedding-refresh", config_.embedding_update_interval,
        [this] { scheduled_embedding_pass(); }));
    timers_.push_back(std::make_unique<PeriodicTimer>(
        "cluster-recalculation", config_.clustering_interval,
        [this] { scheduled_clustering_pass(); }));

    running_.store(true);
    for (auto& timer : timers_) {
      timer->start(true);
    }
    log->info("batch jobs started: embeddings every {} ms, clustering every {} ms",
              config_.embedding_update_interval.count(), config_.clustering_interval.count());
  }

  void BatchCoordinator::stop() {
    std::lock_guard lock(lifecycle_mutex_);
    if (!running_.exchange(false)) return;

    for (auto& timer : timers_) {
      timer->stop();
    }
    timers_.clear();
    get_logger("swipe.coordinator")->info("batch jobs stopped");
  }

  size_t BatchCoordinator::active_timers() const {
    std::lock_guard lock(lifecycle_mutex_);
    return timers_.size();
  }

  void BatchCoordinator::force_update() {
    get_logger("swipe.coordinator")->info("forced batch update");
    (void)run_embedding_pass();
    (void)run_clustering_pass();
  }

  // ============================================================================
  // Passes
  // ============================================================================

  EmbeddingPassReport BatchCoordinator::run_embedding_pass() {
    SWIPE_ZONE;
    EmbeddingPassReport report;
    if (repositories_.users.ids) {
      report.users = refresher_.refresh(*repositories_.users.ids,
                                        *repositories_.users.embedding_service, EntityType::User);
    }
    if (repositories_.posts.ids) {
      report.posts = refresher_.refresh(*repositories_.posts.ids,
                                        *repositories_.posts.embedding_service, EntityType::Post);
    }
    return report;
  }

  ClusteringPassReport BatchCoordinator::run_clustering_pass() {
    SWIPE_ZONE;
    ClusteringPassReport report;
    if (repositories_.posts.embeddings) {
      report.posts = recalculate(EntityType::Post, *repositories_.posts.embeddings);
    }
    if (repositories_.users.embeddings) {
      report.users = recalculate(EntityType::User, *repositories_.users.embeddings);
    }
    return report;
  }

  std::shared_ptr<const clustering::ClusteringResult> BatchCoordinator::recalculate(
      EntityType type, IEmbeddingSource& source) {
    registry_.publish(recalculator_.recalculate(type, source, config_.clustering));
    return registry_.latest(type);
  }

  void BatchCoordinator::scheduled_embedding_pass() noexcept {
    try {
      auto report = run_embedding_pass();
      auto log = get_logger("swipe.coordinator");
      if (report.users) {
        log->info("user embedding refresh: {}/{} succeeded", report.users->succeeded,
                  report.users->processed);
      }
      if (report.posts) {
        log->info("post embedding refresh: {}/{} succeeded", report.posts->succeeded,
                  report.posts->processed);
      }
    } catch (const std::exception& e) {
      get_logger("swipe.coordinator")->error("embedding refresh failed: {}", e.what());
    } catch (...) {
      get_logger("swipe.coordinator")->error("embedding refresh failed: unknown error");
    }
  }

  void BatchCoordinator::scheduled_clustering_pass() noexcept {
    try {
      (void)run_clustering_pass();
    } catch (const std::exception& e) {
      get_logger("swipe.coordinator")->error("cluster recalculation failed: {}", e.what());
    } catch (...) {
      get_logger("swipe.coordinator")->error("cluster recalculation failed: unknown error");
    }
  }

}  // namespace swipe::batch
