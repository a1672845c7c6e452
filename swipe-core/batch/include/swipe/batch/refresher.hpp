#pragma once
#include <cstddef>
#include <swipe/batch/repositories.hpp>
#include <swipe/common/entity.hpp>

namespace swipe::batch {

  struct RefreshSummary {
    size_t processed = 0;
    size_t succeeded = 0;
    size_t failed = 0;
  };

  // Walks every known id of one entity type and asks the embedding service to
  // recompute each one. Ids of a page are refreshed concurrently.
  class EmbeddingRefresher {
  public:
    // Throws std::invalid_argument when either bound is 0.
    EmbeddingRefresher(size_t batch_size, size_t max_items_per_run);

    // Stops at the end of the ids or once max_items_per_run ids were processed
    // (checked per page). A failing entity is logged and counted; id source
    // errors propagate.
    [[nodiscard]] RefreshSummary refresh(IIdSource& ids, IEmbeddingService& service,
                                         EntityType type) const;

    [[nodiscard]] size_t batch_size() const noexcept { return batch_size_; }
    [[nodiscard]] size_t max_items_per_run() const noexcept { return max_items_per_run_; }

  private:
    size_t batch_size_;
    size_t max_items_per_run_;
  };

}  // namespace swipe::batch
