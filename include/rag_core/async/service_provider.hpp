#pragma once

#include <cstddef>
#include <memory>

namespace rag_core {
class IngestionTaskRepo;
class DatasetRepo;
class StrategyResolver;
}

namespace rag_core {

class ServiceProvider {
 public:
  ServiceProvider(std::shared_ptr<IngestionTaskRepo> task_repo,
                  std::shared_ptr<DatasetRepo> dataset_repo,
                  std::shared_ptr<StrategyResolver> resolver, size_t max_concurrent_files = 4)
      : task_repo_(task_repo),
        dataset_repo_(dataset_repo),
        resolver_(resolver),
        max_concurrent_files_(max_concurrent_files == 0 ? 1 : max_concurrent_files) {}

  IngestionTaskRepo& get_task_repo() {
    return *task_repo_;
  }
  DatasetRepo& get_dataset_repo() {
    return *dataset_repo_;
  }
  StrategyResolver& get_resolver() {
    return *resolver_;
  }
  // Upper bound on files of one task processed at the same time.
  size_t max_concurrent_files() const {
    return max_concurrent_files_;
  }

 private:
  std::shared_ptr<IngestionTaskRepo> task_repo_;
  std::shared_ptr<DatasetRepo> dataset_repo_;
  std::shared_ptr<StrategyResolver> resolver_;
  size_t max_concurrent_files_;
};

}  // namespace rag_core
