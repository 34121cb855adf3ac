#include "gate/batch_auditor.hpp"

#include <algorithm>
#include <stdexcept>
#include <thread>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <spdlog/spdlog.h>

BatchAuditor::BatchAuditor(std::shared_ptr<const SqlValidator> validator, BatchSettings settings)
    : validator_(std::move(validator))
    , worker_count_(settings.worker_threads)
{
    if (!validator_) {
        throw std::invalid_argument("batch_auditor: validator is required");
    }
    if (worker_count_ == 0) {
        worker_count_ = std::max(1U, std::thread::hardware_concurrency());
    }
}

std::vector<SqlValidationResult>
BatchAuditor::audit(const std::vector<std::string>& statements,
                    const RequestContext& context) const {
    std::vector<SqlValidationResult> results(statements.size());
    if (statements.empty()) {
        return results;
    }

    const std::size_t threads = std::min(worker_count_, statements.size());
    boost::asio::thread_pool pool(threads);

    for (std::size_t i = 0; i < statements.size(); ++i) {
        boost::asio::post(pool, [this, &statements, &results, &context, i] {
            results[i] = validator_->validate(statements[i], context);
        });
    }
    pool.join();

    const BatchSummary summary = summarize(results);
    spdlog::info("batch_auditor: audited {} statement(s) on {} thread(s), allowed={}, blocked={}",
                 summary.total, threads, summary.allowed, summary.blocked);
    return results;
}

BatchSummary summarize(const std::vector<SqlValidationResult>& results) {
    BatchSummary summary;
    summary.total = results.size();
    for (const auto& result : results) {
        if (result.is_execution_allowed()) {
            ++summary.allowed;
        } else {
            ++summary.blocked;
        }
        if (!result.warnings.empty()) {
            ++summary.with_warnings;
        }
    }
    return summary;
}
