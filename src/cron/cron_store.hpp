#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "cron/cron_types.hpp"

namespace cronkeeper::cron {

// In-memory index over the jobs file with dirty-gated persistence.
// Not synchronized: callers serialize access (CronService holds its lock).
class CronStore {
public:
    using Clock = std::function<long long()>;
    using Mutator = std::function<void(CronJob&)>;

    explicit CronStore(std::filesystem::path store_path, Clock now_ms = {}, int persist_attempts = 3);

    // A missing, unreadable or malformed file yields an empty store.
    void Load();
    void Reload();

    const std::vector<CronJob>& GetAll() const { return store_.jobs; }
    std::optional<CronJob> GetById(const std::string& id) const;
    std::optional<CronJob> GetByName(const std::string& name) const;
    std::vector<CronJob> GetEnabled() const;

    // Replaces a job that already carries the same id.
    void Add(const CronJob& job);
    // Applies the mutation and, unless told otherwise, stamps updated_at_ms.
    std::optional<CronJob> Update(const std::string& id, const Mutator& mutate, bool stamp_updated = true);
    bool Remove(const std::string& id);
    void Clear();

    // Writes only when dirty. Returns false if every attempt failed; the
    // dirty flag then stays set so the next call retries.
    bool Persist();
    bool ForcePersist();

    bool IsDirty() const { return dirty_; }
    const std::filesystem::path& Path() const { return store_path_; }

private:
    bool WriteAtomically();
    CronJob* Find(const std::string& id);

    std::filesystem::path store_path_;
    Clock now_ms_;
    int persist_attempts_ = 3;
    CronStoreFile store_;
    bool dirty_ = false;
};

std::filesystem::path DefaultCronStorePath();

}  // namespace cronkeeper::cron
