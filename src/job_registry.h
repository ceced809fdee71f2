#pragma once

#include "job.h"
#include "constants.h"
#include <functional>
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <unordered_map>

namespace tabrun {

enum class UpdateOutcome {
    APPLIED,
    NOT_FOUND,
    CONFLICT      // Status did not match, or transition not allowed
};

// Concurrency-safe job store, the single source of truth for job status.
//
// Keys are spread over independent shards, each guarded by its own
// shared_mutex, so readers polling one job never wait on a writer
// updating another. Every operation is atomic per key: a reader gets a
// full copy of the record as of one instant, never a half-applied update.
//
// Status changes are checked against can_transition(); an update that
// would leave a terminal state or move backwards is refused.
class JobRegistry {
public:
    explicit JobRegistry(size_t shard_count = REGISTRY_SHARDS);
    ~JobRegistry();

    JobRegistry(const JobRegistry&) = delete;
    JobRegistry& operator=(const JobRegistry&) = delete;

    // Insert or replace. record.id is forced to id.
    void put(const std::string& id, JobRecord record);

    // Copy of the record, nullopt if unknown
    std::optional<JobRecord> get(const std::string& id) const;

    // Apply update. Unknown id is a no-op (returns false) so writers racing
    // a delete never fail. Also false when the status change is refused.
    bool update(const std::string& id, const JobUpdate& update);

    // Compare-and-set on status: applies only if the current status equals expected
    UpdateOutcome update_if(const std::string& id, JobStatus expected, const JobUpdate& update);

    // Applies only if precondition holds for the current record. The
    // precondition runs under the shard lock and must not touch the registry.
    UpdateOutcome update_if(const std::string& id,
                            const std::function<bool(const JobRecord&)>& precondition,
                            const JobUpdate& update);

    // False if unknown
    bool erase(const std::string& id);

    // Remove and return the record in one step, nullopt if unknown. Whoever
    // takes a record owns cleaning up after it.
    std::optional<JobRecord> take(const std::string& id);

    // take() only if precondition holds; nullopt otherwise
    std::optional<JobRecord> take_if(const std::string& id,
                                     const std::function<bool(const JobRecord&)>& precondition);

    std::vector<std::string> list_ids() const;
    size_t size() const;

private:
    struct Shard {
        mutable std::shared_mutex mutex;
        std::unordered_map<std::string, JobRecord> jobs;
    };

    Shard& shard_for(const std::string& id) const;
    static bool apply_locked(JobRecord& record, const JobUpdate& update);

    size_t shard_count_;
    std::unique_ptr<Shard[]> shards_;
};

} // namespace tabrun
