#include "job_registry.h"
#include <iostream>
#include <mutex>

namespace tabrun {

JobRegistry::JobRegistry(size_t shard_count)
    : shard_count_(shard_count == 0 ? 1 : shard_count),
      shards_(std::make_unique<Shard[]>(shard_count_)) {}

JobRegistry::~JobRegistry() = default;

JobRegistry::Shard& JobRegistry::shard_for(const std::string& id) const {
    return shards_[std::hash<std::string>{}(id) % shard_count_];
}

bool JobRegistry::apply_locked(JobRecord& record, const JobUpdate& update) {
    if (update.status && !can_transition(record.status, *update.status)) {
        std::cerr << "[Registry] Refused transition " << status_to_string(record.status)
                  << " -> " << status_to_string(*update.status)
                  << " for job " << record.id << std::endl;
        return false;
    }
    update.apply_to(record);
    return true;
}

void JobRegistry::put(const std::string& id, JobRecord record) {
    record.id = id;
    Shard& shard = shard_for(id);
    std::unique_lock lock(shard.mutex);
    shard.jobs[id] = std::move(record);
}

std::optional<JobRecord> JobRegistry::get(const std::string& id) const {
    Shard& shard = shard_for(id);
    std::shared_lock lock(shard.mutex);
    auto it = shard.jobs.find(id);
    if (it == shard.jobs.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool JobRegistry::update(const std::string& id, const JobUpdate& update) {
    Shard& shard = shard_for(id);
    std::unique_lock lock(shard.mutex);
    auto it = shard.jobs.find(id);
    if (it == shard.jobs.end()) {
        return false;
    }
    return apply_locked(it->second, update);
}

UpdateOutcome JobRegistry::update_if(const std::string& id, JobStatus expected,
                                     const JobUpdate& update) {
    return update_if(id, [expected](const JobRecord& record) { return record.status == expected; },
                     update);
}

UpdateOutcome JobRegistry::update_if(const std::string& id,
                                     const std::function<bool(const JobRecord&)>& precondition,
                                     const JobUpdate& update) {
    Shard& shard = shard_for(id);
    std::unique_lock lock(shard.mutex);
    auto it = shard.jobs.find(id);
    if (it == shard.jobs.end()) {
        return UpdateOutcome::NOT_FOUND;
    }
    if (!precondition(it->second)) {
        return UpdateOutcome::CONFLICT;
    }
    return apply_locked(it->second, update) ? UpdateOutcome::APPLIED : UpdateOutcome::CONFLICT;
}

bool JobRegistry::erase(const std::string& id) {
    Shard& shard = shard_for(id);
    std::unique_lock lock(shard.mutex);
    return shard.jobs.erase(id) > 0;
}

std::optional<JobRecord> JobRegistry::take(const std::string& id) {
    return take_if(id, [](const JobRecord&) { return true; });
}

std::optional<JobRecord> JobRegistry::take_if(
    const std::string& id, const std::function<bool(const JobRecord&)>& precondition) {
    Shard& shard = shard_for(id);
    std::unique_lock lock(shard.mutex);
    auto it = shard.jobs.find(id);
    if (it == shard.jobs.end() || !precondition(it->second)) {
        return std::nullopt;
    }
    JobRecord record = std::move(it->second);
    shard.jobs.erase(it);
    return record;
}

std::vector<std::string> JobRegistry::list_ids() const {
    std::vector<std::string> ids;
    for (size_t i = 0; i < shard_count_; ++i) {
        std::shared_lock lock(shards_[i].mutex);
        for (const auto& [id, _] : shards_[i].jobs) {
            ids.push_back(id);
        }
    }
    return ids;
}

size_t JobRegistry::size() const {
    size_t total = 0;
    for (size_t i = 0; i < shard_count_; ++i) {
        std::shared_lock lock(shards_[i].mutex);
        total += shards_[i].jobs.size();
    }
    return total;
}

} // namespace tabrun
