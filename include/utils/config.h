#pragma once

#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <cstdint>

namespace coursedao {
namespace utils {

struct OrganizationSettings {
    std::string owner;
    std::vector<std::string> board;
    std::string treasuryAccount = "dao:treasury";
    std::string tokenSymbol = "EDU";
    uint64_t proposalDuration = 180;
    uint64_t defaultRatingWeight = 100;
};

struct LogSettings {
    std::string level = "info";
    std::string file;
    bool console = true;
    uint64_t maxFileSize = 10 * 1024 * 1024;
    uint32_t maxFiles = 5;
};

struct StorageSettings {
    std::string dataDir;
    std::string dbFile = "coursedao.db";
};

class Config {
public:
    static Config& instance();

    Config();
    ~Config();

    bool load(const std::string& path);
    bool save(const std::string& path);
    bool loadDefaults();
    // Drops every key and the loaded path, then reapplies the defaults.
    void reset();

    std::string getString(const std::string& key, const std::string& def = "") const;
    int getInt(const std::string& key, int def = 0) const;
    uint64_t getUint64(const std::string& key, uint64_t def = 0) const;
    bool getBool(const std::string& key, bool def = false) const;
    std::vector<std::string> getList(const std::string& key) const;

    void set(const std::string& key, const std::string& value);
    void set(const std::string& key, const char* value);
    void set(const std::string& key, int value);
    void set(const std::string& key, uint64_t value);
    void set(const std::string& key, bool value);
    void setList(const std::string& key, const std::vector<std::string>& values);

    bool has(const std::string& key) const;

    OrganizationSettings getOrganizationSettings() const;
    LogSettings getLogSettings() const;
    StorageSettings getStorageSettings() const;

    void setOrganizationSettings(const OrganizationSettings& settings);

    std::string getDataDir() const;
    std::string getConfigPath() const;
    void setDataDir(const std::string& path);

    // Called with the key after every set*, outside the config lock.
    void onChange(std::function<void(const std::string&)> callback);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
