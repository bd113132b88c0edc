#ifndef STATE_STORE_HPP
#define STATE_STORE_HPP
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "repo.hpp"

/**
 * @brief Everything that survives a restart.
 */
struct PersistedState {
    Settings settings;
    std::vector<RepoRecord> repos;
};

/**
 * @brief Durable storage for the catalog and settings.
 */
class StateStore {
  public:
    virtual ~StateStore() = default;

    /**
     * @brief Read the stored state.
     *
     * Never fails: unreadable or corrupt data yields default settings and an
     * empty catalog. Active operations are always cleared.
     */
    virtual PersistedState load() = 0;

    /**
     * @brief Overwrite the stored state with @p state.
     *
     * @return `false` when the state could not be written.
     */
    virtual bool save(const PersistedState& state) = 0;
};

/**
 * @brief State store backed by a single JSON document.
 *
 * Writes go to a sibling temporary file that is renamed over the target, so a
 * crash never leaves a half-written document behind.
 */
class JsonStateStore : public StateStore {
  public:
    explicit JsonStateStore(std::filesystem::path path) : path_(std::move(path)) {}

    PersistedState load() override;
    bool save(const PersistedState& state) override;

    const std::filesystem::path& path() const { return path_; }

  private:
    std::filesystem::path path_;
    std::mutex write_mtx_;
};

// JSON mapping, also used by the command-line driver for --json output.
void to_json(nlohmann::json& j, const Transcript& t);
void from_json(const nlohmann::json& j, Transcript& t);
void to_json(nlohmann::json& j, const RepoEnvironment& e);
void from_json(const nlohmann::json& j, RepoEnvironment& e);
void to_json(nlohmann::json& j, const ChangedFile& f);
void from_json(const nlohmann::json& j, ChangedFile& f);
void to_json(nlohmann::json& j, const StatusSummary& s);
void from_json(const nlohmann::json& j, StatusSummary& s);
void to_json(nlohmann::json& j, const ActiveOperation& op);
void to_json(nlohmann::json& j, const RepoRecord& r);
void from_json(const nlohmann::json& j, RepoRecord& r);
void to_json(nlohmann::json& j, const GuestRoot& g);
void from_json(const nlohmann::json& j, GuestRoot& g);
void to_json(nlohmann::json& j, const Settings& s);
void from_json(const nlohmann::json& j, Settings& s);
void to_json(nlohmann::json& j, const Snapshot& s);
void to_json(nlohmann::json& j, const RepoActionResult& r);

#endif // STATE_STORE_HPP
