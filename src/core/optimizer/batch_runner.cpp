#include "batch_runner.h"

#include <algorithm>
#include <future>
#include <optional>

#include "../threading/thread_pool.h"
#include "../utils/log.h"

namespace cl {

optimizer::OptimizeResult notScheduledResult(const std::string& jobName) {
    optimizer::OptimizeResult result;
    result.error.kind = optimizer::ErrorKind::NotScheduled;
    result.error.field = "job";
    result.error.message = "job '" + jobName + "' was not scheduled";
    return result;
}

BatchRunner::BatchRunner(size_t threadCount) : m_threadCount(std::max(size_t(1), threadCount)) {}

std::vector<BatchJobResult> BatchRunner::run(const std::vector<CutJob>& jobs) const {
    std::vector<BatchJobResult> results(jobs.size());
    if (jobs.empty()) {
        return results;
    }

    size_t workers = std::min(m_threadCount, jobs.size());
    log::infof("Batch", "Running %zu jobs on %zu threads", jobs.size(), workers);

    ThreadPool pool(workers);
    std::vector<std::optional<std::future<optimizer::OptimizeResult>>> pending;
    pending.reserve(jobs.size());
    for (const CutJob& job : jobs) {
        pending.push_back(pool.submit([&job] {
            optimizer::CuttingOptimizer optimizer(job.sheet.kerfWidth);
            return optimizer.optimize(job.parts, job.sheet, job.algorithm);
        }));
    }

    for (size_t i = 0; i < jobs.size(); ++i) {
        results[i].jobName = jobs[i].name;
        if (pending[i]) {
            results[i].result = pending[i]->get();
        } else {
            log::errorf("Batch", "Thread pool refused job '%s'", jobs[i].name.c_str());
            results[i].result = notScheduledResult(jobs[i].name);
        }
    }
    pool.shutdown();

    size_t failed = static_cast<size_t>(std::count_if(
        results.begin(), results.end(), [](const BatchJobResult& r) { return !r.result.success; }));
    if (failed > 0) {
        log::warningf("Batch", "%zu of %zu jobs failed", failed, jobs.size());
    }
    return results;
}

} // namespace cl
