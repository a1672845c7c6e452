#include <exception>
#include <future>
#include <stdexcept>
#include <swipe/batch/refresher.hpp>
#include <swipe/common/logging.hpp>
#include <swipe/common/tracy.hpp>
#include <vector>

namespace swipe::batch {

  EmbeddingRefresher::EmbeddingRefresher(size_t batch_size, size_t max_items_per_run)
      : batch_size_(batch_size), max_items_per_run_(max_items_per_run) {
    if (batch_size_ == 0) {
      throw std::invalid_argument("batch_size must be positive");
    }
    if (max_items_per_run_ == 0) {
      throw std::invalid_argument("max_items_per_run must be positive");
    }
  }

  RefreshSummary EmbeddingRefresher::refresh(IIdSource& ids, IEmbeddingService& service,
                                             EntityType type) const {
    SWIPE_ZONE;
    auto log = get_logger("swipe.refresher");
    log->info("refreshing {} embeddings in batches of {}", to_string(type), batch_size_);

    RefreshSummary summary;
    size_t offset = 0;

    while (summary.processed < max_items_per_run_) {
      auto page = ids.find_all_ids(batch_size_, offset);
      if (page.empty()) break;

      std::vector<std::future<void>> pending;
      pending.reserve(page.size());
      for (const auto& id : page) {
        pending.push_back(
            std::async(std::launch::async, [&service, id] { service.refresh_embedding(id); }));
      }

      // Wait for every entity, successes and failures alike.
      size_t page_ok = 0;
      for (size_t i = 0; i < pending.size(); ++i) {
        try {
          pending[i].get();
          ++page_ok;
        } catch (const std::exception& e) {
          log->error("failed to refresh embedding for {} {}: {}", to_string(type), page[i],
                     e.what());
        } catch (...) {
          log->error("failed to refresh embedding for {} {}: unknown error", to_string(type),
                     page[i]);
        }
      }

      summary.processed += page.size();
      summary.succeeded += page_ok;
      summary.failed += page.size() - page_ok;
      offset += page.size();

      log->info("processed batch of {} {} ids, {} refreshed", page.size(), to_string(type),
                page_ok);

      if (page.size() < batch_size_) break;
    }

    log->info("{} embedding refresh done: {} processed, {} failed", to_string(type),
              summary.processed, summary.failed);
    return summary;
  }

}  // namespace swipe::batch
