#pragma once

#include "common/backup_state.hpp"
#include <string>
#include <vector>
#include <mutex>
#include <nlohmann/json.hpp>

nlohmann::json stateToJson(const BackupJobState& state);

// Receives the complete set of tracked job states after every change
class StateRepository {
public:
    virtual ~StateRepository() = default;
    virtual bool updateState(const std::vector<BackupJobState>& states) = 0;
    virtual void setStatePath(const std::string& path) = 0;
};

// Writes the states as a JSON array to a temporary file, then renames it
// over the state file.
class JsonStateRepository : public StateRepository {
public:
    explicit JsonStateRepository(const std::string& statePath = "state.json");

    bool updateState(const std::vector<BackupJobState>& states) override;
    void setStatePath(const std::string& path) override;

    std::string getStatePath() const;
    std::string getLastError() const;

private:
    mutable std::mutex mutex_;
    std::string statePath_;
    std::string lastError_;
};
