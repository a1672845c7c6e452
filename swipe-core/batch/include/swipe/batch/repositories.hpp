#pragma once
#include <cstddef>
#include <expected>
#include <memory>
#include <string>
#include <swipe/clustering/types.hpp>
#include <swipe/common/entity.hpp>
#include <vector>

namespace swipe::batch {

  // Collaborators supplied by the host application. Implementations must
  // tolerate concurrent calls and return pages in a stable order within one pass.

  class IEmbeddingSource {
  public:
    virtual ~IEmbeddingSource() = default;

    IEmbeddingSource(const IEmbeddingSource&) = delete;
    IEmbeddingSource& operator=(const IEmbeddingSource&) = delete;
    IEmbeddingSource(IEmbeddingSource&&) = delete;
    IEmbeddingSource& operator=(IEmbeddingSource&&) = delete;

    // Fewer than `limit` records (possibly none) signals the end of the data.
    [[nodiscard]] virtual std::vector<EmbeddingRecord> find_all_embeddings(size_t limit,
                                                                           size_t offset)
        = 0;

  protected:
    IEmbeddingSource() = default;
  };

  class IIdSource {
  public:
    virtual ~IIdSource() = default;

    IIdSource(const IIdSource&) = delete;
    IIdSource& operator=(const IIdSource&) = delete;
    IIdSource(IIdSource&&) = delete;
    IIdSource& operator=(IIdSource&&) = delete;

    [[nodiscard]] virtual std::vector<std::string> find_all_ids(size_t limit, size_t offset) = 0;

  protected:
    IIdSource() = default;
  };

  // Recomputes and stores the embedding of one entity. Failure is reported by
  // throwing; the computed vector is not returned.
  class IEmbeddingService {
  public:
    virtual ~IEmbeddingService() = default;

    IEmbeddingService(const IEmbeddingService&) = delete;
    IEmbeddingService& operator=(const IEmbeddingService&) = delete;
    IEmbeddingService(IEmbeddingService&&) = delete;
    IEmbeddingService& operator=(IEmbeddingService&&) = delete;

    virtual void refresh_embedding(const std::string& entity_id) = 0;

  protected:
    IEmbeddingService() = default;
  };

  // Durable store for clustering runs. Failures come back as an error message.
  class IClusterSink {
  public:
    virtual ~IClusterSink() = default;

    IClusterSink(const IClusterSink&) = delete;
    IClusterSink& operator=(const IClusterSink&) = delete;
    IClusterSink(IClusterSink&&) = delete;
    IClusterSink& operator=(IClusterSink&&) = delete;

    [[nodiscard]] virtual std::expected<void, std::string> save_clustering_result(
        const clustering::ClusteringResult& result)
        = 0;

  protected:
    IClusterSink() = default;
  };

  // Everything the batch jobs need for one entity type. Any member may be null;
  // ids and service must be both set or both null.
  struct EntityRepositories {
    std::shared_ptr<IIdSource> ids;
    std::shared_ptr<IEmbeddingService> embedding_service;
    std::shared_ptr<IEmbeddingSource> embeddings;
  };

  struct BatchRepositories {
    EntityRepositories users;
    EntityRepositories posts;
    std::shared_ptr<IClusterSink> sink;
  };

}  // namespace swipe::batch
