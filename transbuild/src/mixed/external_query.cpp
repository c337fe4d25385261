#include "mixed/external_query.hpp"

#include "log/log.hpp"

namespace transbuild::mixed {

auto request_type_name(RequestType request) -> const char* {
    switch (request) {
    case RequestType::OutputFiles:
        return "output_files";
    }
    return "unknown";
}

void ExternalQueryQueue::enqueue(ExternalQuery query) {
    std::lock_guard<std::mutex> lock(mutex_);
    TRANSBUILD_LOG_TRACE("mixed", "Queue " << request_type_name(query.request) << " "
                                           << query.label << " (" << query.key.arch << ", "
                                           << config::os_name(query.key.os) << ")");
    queries_.try_emplace(std::move(query));
}

auto ExternalQueryQueue::pending() const -> std::vector<ExternalQuery> {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ExternalQuery> result;
    for (const auto& [query, answer] : queries_) {
        if (!answer) {
            result.push_back(query);
        }
    }
    return result;
}

void ExternalQueryQueue::set_answer(const ExternalQuery& query, std::vector<std::string> values) {
    std::lock_guard<std::mutex> lock(mutex_);
    queries_[query] = std::move(values);
}

auto ExternalQueryQueue::answer(const ExternalQuery& query) const
    -> Result<std::vector<std::string>> {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = queries_.find(query);
    if (it == queries_.end()) {
        return "no " + std::string(request_type_name(query.request)) + " query was queued for " +
               query.label;
    }
    if (!it->second) {
        return "external executor did not answer " +
               std::string(request_type_name(query.request)) + " for " + query.label;
    }
    return *it->second;
}

auto ExternalQueryQueue::size() const -> size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return queries_.size();
}

auto ExternalQueryQueue::answer_all(ExternalExecutor& executor) -> size_t {
    size_t answered = 0;
    for (const auto& query : pending()) {
        auto result = executor.answer(query);
        if (is_err(result)) {
            TRANSBUILD_LOG_WARN("mixed", "Query for " << query.label
                                                      << " failed: " << unwrap_err(result));
            continue;
        }
        set_answer(query, std::move(unwrap(result)));
        ++answered;
    }
    TRANSBUILD_LOG_INFO("mixed", "Answered " << answered << " of " << size() << " queries");
    return answered;
}

} // namespace transbuild::mixed
