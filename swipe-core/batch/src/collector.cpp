#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <swipe/batch/collector.hpp>
#include <swipe/common/logging.hpp>
#include <swipe/common/tracy.hpp>

namespace swipe::batch {

  EmbeddingCollector::EmbeddingCollector(size_t batch_size) : batch_size_(batch_size) {
    if (batch_size_ == 0) {
      throw std::invalid_argument("batch_size must be positive");
    }
  }

  CollectedBatch EmbeddingCollector::collect(IEmbeddingSource& source, EntityType type) const {
    SWIPE_ZONE;
    auto log = get_logger("swipe.collector");

    CollectedBatch batch;
    size_t offset = 0;

    while (true) {
      auto page = source.find_all_embeddings(batch_size_, offset);
      batch.total_items += page.size();
      if (page.empty()) break;

      for (auto& record : page) {
        if (!record.vector || record.vector->empty()) {
          log->debug("skipping {} {}: no embedding", to_string(type), record.entity_id);
          ++batch.skipped;
          continue;
        }
        if (!std::ranges::all_of(*record.vector, [](float x) { return std::isfinite(x); })) {
          log->warn("skipping {} {}: non-finite embedding component", to_string(type),
                    record.entity_id);
          ++batch.skipped;
          continue;
        }
        if (!batch.vectors.empty() && record.vector->size() != batch.vectors.cols()) {
          log->warn("skipping {} {}: dimension {} differs from batch dimension {}",
                    to_string(type), record.entity_id, record.vector->size(),
                    batch.vectors.cols());
          ++batch.skipped;
          continue;
        }

        batch.vectors.append_row(*record.vector);
        batch.entities.push_back(Entity{.id = std::move(record.entity_id),
                                        .type = type,
                                        .metadata = std::move(record.metadata)});
      }

      offset += page.size();
      if (page.size() < batch_size_) break;
    }

    if (batch.skipped > 0) {
      log->warn("skipped {} malformed {} embedding records", batch.skipped, to_string(type));
    }
    log->info("collected {} {} embeddings ({} records seen)", batch.entities.size(),
              to_string(type), batch.total_items);
    return batch;
  }

}  // namespace swipe::batch
