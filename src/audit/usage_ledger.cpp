#include "audit/usage_ledger.hpp"
#include <spdlog/spdlog.h>

namespace runbox::audit {

using json = nlohmann::json;

// ============================================================================
// ExecutionRecord Implementation
// ============================================================================

json ExecutionRecord::to_json() const {
    json j;
    j["execution_id"] = execution_id;
    j["user_id"] = user_id;
    j["tier"] = tier;
    j["language"] = language;
    j["task_id"] = task_id ? json(*task_id) : json(nullptr);
    j["sandbox_id"] = sandbox_id ? json(*sandbox_id) : json(nullptr);
    j["code"] = code.substr(0, MAX_CODE_BYTES);
    j["stdin"] = stdin_data.substr(0, MAX_STDIN_BYTES);
    j["stdout"] = stdout_data;
    j["stderr"] = stderr_data;
    j["exit_code"] = exit_code;
    j["execution_time_ms"] = execution_time_ms;
    j["memory_used_mb"] = memory_used_mb ? json(*memory_used_mb) : json(nullptr);
    j["provider_id"] = provider_id;
    j["status"] = status;
    j["credits_used"] = credits_used;
    j["created_at"] = created_at;
    return j;
}

// ============================================================================
// InMemoryUsageLedger Implementation
// ============================================================================

RecordOutcome InMemoryUsageLedger::record_execution(const ExecutionRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (index_.count(record.execution_id)) {
        return RecordOutcome::DUPLICATE;
    }

    ExecutionRecord stored = record;
    if (stored.code.size() > ExecutionRecord::MAX_CODE_BYTES) {
        stored.code.resize(ExecutionRecord::MAX_CODE_BYTES);
    }
    if (stored.stdin_data.size() > ExecutionRecord::MAX_STDIN_BYTES) {
        stored.stdin_data.resize(ExecutionRecord::MAX_STDIN_BYTES);
    }

    index_[stored.execution_id] = records_.size();
    records_.push_back(std::move(stored));
    return RecordOutcome::RECORDED;
}

bool InMemoryUsageLedger::contains(const std::string& execution_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index_.count(execution_id) > 0;
}

size_t InMemoryUsageLedger::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

std::optional<ExecutionRecord> InMemoryUsageLedger::find(const std::string& execution_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(execution_id);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return records_[it->second];
}

std::vector<ExecutionRecord> InMemoryUsageLedger::records() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
}

// ============================================================================
// JsonlUsageLedger Implementation
// ============================================================================

JsonlUsageLedger::JsonlUsageLedger(const std::string& path) : path_(path) {
    load_existing_ids();

    file_.open(path_, std::ios::out | std::ios::app);
    if (!file_.is_open()) {
        spdlog::error("Failed to open usage ledger {}", path_);
        return;
    }
    spdlog::info("Usage ledger at {} ({} existing records)", path_, ids_.size());
}

void JsonlUsageLedger::load_existing_ids() {
    std::ifstream in(path_);
    if (!in.is_open()) {
        return;
    }

    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (line.empty()) continue;
        try {
            json j = json::parse(line);
            if (j.contains("execution_id") && j["execution_id"].is_string()) {
                ids_.insert(j["execution_id"].get<std::string>());
            }
        } catch (const json::parse_error& e) {
            spdlog::warn("Skipping malformed ledger line {} in {}: {}", line_no, path_, e.what());
        }
    }
}

RecordOutcome JsonlUsageLedger::record_execution(const ExecutionRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ids_.count(record.execution_id)) {
        return RecordOutcome::DUPLICATE;
    }
    if (!file_.is_open()) {
        return RecordOutcome::FAILED;
    }

    file_ << record.to_json().dump(-1, ' ', false, json::error_handler_t::replace) << "\n";
    file_.flush();
    if (!file_) {
        spdlog::error("Usage ledger write failed for execution {}", record.execution_id);
        file_.clear();
        return RecordOutcome::FAILED;
    }

    ids_.insert(record.execution_id);
    return RecordOutcome::RECORDED;
}

bool JsonlUsageLedger::contains(const std::string& execution_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ids_.count(execution_id) > 0;
}

size_t JsonlUsageLedger::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ids_.size();
}

bool JsonlUsageLedger::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return file_.is_open();
}

} // namespace runbox::audit
