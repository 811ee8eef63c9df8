#pragma once

#include <string>
#include <vector>

#include "cut_list_file.h"
#include "cut_optimizer.h"

namespace cl {

struct BatchJobResult {
    std::string jobName;
    optimizer::OptimizeResult result;
};

// Failure recorded for a job the pool refused (kind NotScheduled, field "job")
optimizer::OptimizeResult notScheduledResult(const std::string& jobName);

// Runs independent jobs concurrently on a ThreadPool. Each job gets its own
// optimize() call over its own inputs; results come back in job order.
class BatchRunner {
  public:
    explicit BatchRunner(size_t threadCount);

    size_t threadCount() const { return m_threadCount; }

    std::vector<BatchJobResult> run(const std::vector<CutJob>& jobs) const;

  private:
    size_t m_threadCount;
};

} // namespace cl
