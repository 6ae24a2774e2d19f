#include "cron/cron_store.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <system_error>
#include <utility>

#include <unistd.h>

#include "nlohmann/json.hpp"

#include "cron/cron_json.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace cronkeeper::cron {
namespace {

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

}  // namespace

std::filesystem::path DefaultCronStorePath() {
    return GetHomePath() / ".cronkeeper" / "cron" / "jobs.json";
}

CronStore::CronStore(std::filesystem::path store_path, Clock now_ms, int persist_attempts)
    : store_path_(std::move(store_path))
    , now_ms_(now_ms ? std::move(now_ms) : Clock(&utils::SystemNowMs))
    , persist_attempts_(std::max(1, persist_attempts)) {
    Load();
}

void CronStore::Load() {
    store_ = CronStoreFile{};
    dirty_ = false;
    std::error_code ec;
    if (!std::filesystem::exists(store_path_, ec)) {
        return;
    }
    try {
        std::ifstream input(store_path_);
        if (!input.is_open()) {
            utils::LogWarn("cron", "store unreadable, starting empty", {{"path", store_path_.string()}});
            return;
        }
        nlohmann::json data;
        input >> data;
        store_ = StoreFromJson(data);
    } catch (const std::exception& ex) {
        utils::LogWarn("cron", "store malformed, starting empty",
                       {{"path", store_path_.string()}, {"error", ex.what()}});
        store_ = CronStoreFile{};
    }
}

void CronStore::Reload() {
    Load();
}

std::optional<CronJob> CronStore::GetById(const std::string& id) const {
    const auto it = std::find_if(store_.jobs.begin(), store_.jobs.end(), [&](const CronJob& job) {
        return job.id == id;
    });
    if (it == store_.jobs.end()) {
        return std::nullopt;
    }
    return *it;
}

std::optional<CronJob> CronStore::GetByName(const std::string& name) const {
    const auto it = std::find_if(store_.jobs.begin(), store_.jobs.end(), [&](const CronJob& job) {
        return job.name == name;
    });
    if (it == store_.jobs.end()) {
        return std::nullopt;
    }
    return *it;
}

std::vector<CronJob> CronStore::GetEnabled() const {
    std::vector<CronJob> jobs;
    for (const auto& job : store_.jobs) {
        if (job.enabled) {
            jobs.push_back(job);
        }
    }
    return jobs;
}

void CronStore::Add(const CronJob& job) {
    if (auto* existing = Find(job.id)) {
        *existing = job;
    } else {
        store_.jobs.push_back(job);
    }
    dirty_ = true;
}

std::optional<CronJob> CronStore::Update(const std::string& id, const Mutator& mutate, bool stamp_updated) {
    auto* job = Find(id);
    if (!job) {
        return std::nullopt;
    }
    if (mutate) {
        mutate(*job);
    }
    job->id = id;
    if (stamp_updated) {
        job->updated_at_ms = now_ms_();
    }
    dirty_ = true;
    return *job;
}

bool CronStore::Remove(const std::string& id) {
    const auto before = store_.jobs.size();
    store_.jobs.erase(std::remove_if(store_.jobs.begin(), store_.jobs.end(), [&](const CronJob& job) {
        return job.id == id;
    }), store_.jobs.end());
    const bool removed = store_.jobs.size() < before;
    if (removed) {
        dirty_ = true;
    }
    return removed;
}

void CronStore::Clear() {
    store_.jobs.clear();
    dirty_ = true;
}

bool CronStore::Persist() {
    if (!dirty_) {
        return true;
    }
    return ForcePersist();
}

bool CronStore::ForcePersist() {
    for (int attempt = 1; attempt <= persist_attempts_; ++attempt) {
        if (WriteAtomically()) {
            dirty_ = false;
            return true;
        }
        utils::LogWarn("cron", "store write failed",
                       {{"path", store_path_.string()}, {"attempt", std::to_string(attempt)}});
    }
    dirty_ = true;
    utils::LogError("cron", "store write gave up, keeping changes in memory",
                    {{"path", store_path_.string()}});
    return false;
}

bool CronStore::WriteAtomically() {
    std::error_code ec;
    if (store_path_.has_parent_path()) {
        std::filesystem::create_directories(store_path_.parent_path(), ec);
        if (ec) {
            return false;
        }
    }

    auto tmp_path = store_path_;
    tmp_path += "." + std::to_string(::getpid()) + "." + std::to_string(utils::SystemNowMs()) + ".tmp";
    {
        std::ofstream output(tmp_path, std::ios::trunc);
        if (!output.is_open()) {
            return false;
        }
        try {
            output << StoreToJson(store_).dump(2);
        } catch (const nlohmann::json::exception& ex) {
            utils::LogError("cron", "store serialization failed", {{"error", ex.what()}});
            output.close();
            std::filesystem::remove(tmp_path, ec);
            return false;
        }
        output.flush();
        if (!output.good()) {
            output.close();
            std::filesystem::remove(tmp_path, ec);
            return false;
        }
    }

    std::filesystem::rename(tmp_path, store_path_, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tmp_path, ignored);
        return false;
    }

    auto backup_path = store_path_;
    backup_path += ".bak";
    std::filesystem::copy_file(store_path_, backup_path,
                               std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        utils::LogDebug("cron", "backup copy failed", {{"path", backup_path.string()}, {"error", ec.message()}});
    }
    return true;
}

CronJob* CronStore::Find(const std::string& id) {
    for (auto& job : store_.jobs) {
        if (job.id == id) {
            return &job;
        }
    }
    return nullptr;
}

}  // namespace cronkeeper::cron
