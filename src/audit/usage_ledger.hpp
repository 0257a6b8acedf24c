/**
 * Runbox Usage Ledger
 *
 * Append-only record of completed executions, one per execution id.
 * Recording the same execution id twice is a no-op, so callers may
 * retry a write without double-charging.
 */
#pragma once
#include <string>
#include <vector>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <mutex>
#include <fstream>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace runbox::audit {

struct ExecutionRecord {
    static constexpr size_t MAX_CODE_BYTES = 10000;
    static constexpr size_t MAX_STDIN_BYTES = 1000;

    std::string execution_id;
    std::string user_id;
    std::string tier;
    std::string language;
    std::optional<std::string> task_id;
    std::optional<std::string> sandbox_id;
    std::string code;                        // First MAX_CODE_BYTES
    std::string stdin_data;                  // First MAX_STDIN_BYTES
    std::string stdout_data;
    std::string stderr_data;
    int exit_code = 0;
    uint64_t execution_time_ms = 0;
    std::optional<double> memory_used_mb;
    std::string provider_id;
    std::string status = "completed";
    uint32_t credits_used = 1;
    std::string created_at;

    nlohmann::json to_json() const;
};

enum class RecordOutcome {
    RECORDED,
    DUPLICATE,
    FAILED
};

inline const char* record_outcome_to_string(RecordOutcome outcome) {
    switch (outcome) {
        case RecordOutcome::RECORDED:  return "recorded";
        case RecordOutcome::DUPLICATE: return "duplicate";
        case RecordOutcome::FAILED:    return "failed";
        default: return "failed";
    }
}

class UsageLedger {
public:
    virtual ~UsageLedger() = default;
    virtual RecordOutcome record_execution(const ExecutionRecord& record) = 0;
    virtual bool contains(const std::string& execution_id) const = 0;
    virtual size_t size() const = 0;
};

class InMemoryUsageLedger : public UsageLedger {
public:
    RecordOutcome record_execution(const ExecutionRecord& record) override;
    bool contains(const std::string& execution_id) const override;
    size_t size() const override;

    std::optional<ExecutionRecord> find(const std::string& execution_id) const;
    std::vector<ExecutionRecord> records() const;

private:
    mutable std::mutex mutex_;
    std::vector<ExecutionRecord> records_;
    std::unordered_map<std::string, size_t> index_;
};

// One JSON object per line. Ids already in the file are loaded on open
// so idempotency survives restarts.
class JsonlUsageLedger : public UsageLedger {
public:
    explicit JsonlUsageLedger(const std::string& path);

    RecordOutcome record_execution(const ExecutionRecord& record) override;
    bool contains(const std::string& execution_id) const override;
    size_t size() const override;

    bool is_open() const;
    const std::string& path() const { return path_; }

private:
    std::string path_;
    mutable std::mutex mutex_;
    std::ofstream file_;
    std::unordered_set<std::string> ids_;

    void load_existing_ids();
};

} // namespace runbox::audit
