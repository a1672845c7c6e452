#pragma once
#include <cstddef>
#include <swipe/batch/repositories.hpp>
#include <swipe/common/entity.hpp>
#include <swipe/common/matrix.hpp>
#include <vector>

namespace swipe::batch {

  struct CollectedBatch {
    EmbeddingMatrix<float> vectors;
    std::vector<Entity> entities;  // parallel to vectors rows
    size_t total_items = 0;        // every record seen, skipped ones included
    size_t skipped = 0;
  };

  // Pages an embedding source until exhaustion and keeps the well-formed records.
  class EmbeddingCollector {
  public:
    // Throws std::invalid_argument when batch_size is 0.
    explicit EmbeddingCollector(size_t batch_size);

    // Source errors propagate; nothing collected so far is returned.
    [[nodiscard]] CollectedBatch collect(IEmbeddingSource& source, EntityType type) const;

    [[nodiscard]] size_t batch_size() const noexcept { return batch_size_; }

  private:
    size_t batch_size_;
  };

}  // namespace swipe::batch
