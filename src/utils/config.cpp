#include "utils/config.h"
#include "utils/utils.h"
#include <map>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cstdlib>
#include <mutex>
#include <functional>

namespace coursedao {
namespace utils {

struct Config::Impl {
    std::map<std::string, std::string> data;
    std::string configPath;
    std::string dataDir;
    std::function<void(const std::string&)> changeCallback;
    mutable std::mutex mtx;

    void store(const std::string& key, const std::string& value) {
        std::function<void(const std::string&)> callback;
        {
            std::lock_guard<std::mutex> lock(mtx);
            data[key] = value;
            callback = changeCallback;
        }
        if (callback) callback(key);
    }

    bool lookup(const std::string& key, std::string& out) const {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = data.find(key);
        if (it == data.end()) return false;
        out = it->second;
        return true;
    }
};

static std::string trimmed(const std::string& in) {
    size_t start = in.find_first_not_of(" \t\r");
    if (start == std::string::npos) return "";
    size_t end = in.find_last_not_of(" \t\r");
    return in.substr(start, end - start + 1);
}

Config::Config() : impl_(std::make_unique<Impl>()) {
    const char* home = std::getenv("HOME");
    if (home) {
        impl_->dataDir = std::string(home) + "/.coursedao";
    } else {
        impl_->dataDir = ".coursedao";
    }
    loadDefaults();
}

Config::~Config() = default;

Config& Config::instance() {
    static Config inst;
    return inst;
}

bool Config::loadDefaults() {
    set("org.owner", "");
    set("org.board", "");
    set("org.treasury_account", "dao:treasury");
    set("org.proposal_duration", static_cast<uint64_t>(180));
    set("org.default_rating_weight", static_cast<uint64_t>(100));

    set("token.symbol", "EDU");

    set("log.level", "info");
    set("log.file", "");
    set("log.console", true);
    set("log.max_file_size", static_cast<uint64_t>(10 * 1024 * 1024));
    set("log.max_files", 5);

    set("data.db_file", "coursedao.db");
    return true;
}

void Config::reset() {
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        impl_->data.clear();
        impl_->configPath.clear();
    }
    loadDefaults();
}

bool Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return false;

    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->configPath = path;
    std::string line;

    while (std::getline(file, line)) {
        line = trimmed(line);
        if (line.empty() || line[0] == '#') continue;

        auto pos = line.find('=');
        if (pos != std::string::npos) {
            std::string key = trimmed(line.substr(0, pos));
            std::string value = trimmed(line.substr(pos + 1));
            if (!key.empty()) impl_->data[key] = value;
        }
    }
    return true;
}

bool Config::save(const std::string& path) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::string savePath = path.empty() ? impl_->configPath : path;
    if (savePath.empty()) return false;

    std::ofstream file(savePath);
    if (!file.is_open()) return false;

    file << "# coursedao configuration\n\n";

    std::string lastPrefix;
    for (const auto& [key, value] : impl_->data) {
        auto pos = key.find('.');
        std::string prefix = pos != std::string::npos ? key.substr(0, pos) : "";
        if (prefix != lastPrefix && !lastPrefix.empty()) {
            file << "\n";
        }
        lastPrefix = prefix;
        file << key << "=" << value << "\n";
    }
    return static_cast<bool>(file);
}

std::string Config::getString(const std::string& key, const std::string& def) const {
    std::string val;
    return impl_->lookup(key, val) ? val : def;
}

int Config::getInt(const std::string& key, int def) const {
    std::string val;
    if (!impl_->lookup(key, val)) return def;
    try { return std::stoi(val); }
    catch (const std::exception&) { return def; }
}

uint64_t Config::getUint64(const std::string& key, uint64_t def) const {
    std::string val;
    if (!impl_->lookup(key, val)) return def;
    if (val.empty() || val[0] == '-') return def;
    try { return std::stoull(val); }
    catch (const std::exception&) { return def; }
}

bool Config::getBool(const std::string& key, bool def) const {
    std::string val;
    if (!impl_->lookup(key, val)) return def;
    val = Formatter::toLower(val);
    return val == "true" || val == "1" || val == "yes" || val == "on";
}

std::vector<std::string> Config::getList(const std::string& key) const {
    std::vector<std::string> result;
    std::string val;
    if (!impl_->lookup(key, val)) return result;

    std::istringstream iss(val);
    std::string item;
    while (std::getline(iss, item, ',')) {
        item = trimmed(item);
        if (!item.empty()) result.push_back(item);
    }
    return result;
}

void Config::set(const std::string& key, const std::string& value) {
    impl_->store(key, value);
}

void Config::set(const std::string& key, const char* value) {
    impl_->store(key, value ? value : "");
}

void Config::set(const std::string& key, int value) {
    impl_->store(key, std::to_string(value));
}

void Config::set(const std::string& key, uint64_t value) {
    impl_->store(key, std::to_string(value));
}

void Config::set(const std::string& key, bool value) {
    impl_->store(key, value ? "true" : "false");
}

void Config::setList(const std::string& key, const std::vector<std::string>& values) {
    std::string joined;
    for (size_t i = 0; i < values.size(); i++) {
        if (i > 0) joined += ",";
        joined += values[i];
    }
    impl_->store(key, joined);
}

bool Config::has(const std::string& key) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->data.find(key) != impl_->data.end();
}

OrganizationSettings Config::getOrganizationSettings() const {
    OrganizationSettings s;
    s.owner = getString("org.owner");
    s.board = getList("org.board");
    s.treasuryAccount = getString("org.treasury_account", "dao:treasury");
    s.tokenSymbol = getString("token.symbol", "EDU");
    s.proposalDuration = getUint64("org.proposal_duration", 180);
    s.defaultRatingWeight = getUint64("org.default_rating_weight", 100);
    return s;
}

LogSettings Config::getLogSettings() const {
    LogSettings s;
    s.level = getString("log.level", "info");
    s.file = getString("log.file");
    s.console = getBool("log.console", true);
    s.maxFileSize = getUint64("log.max_file_size", 10 * 1024 * 1024);
    s.maxFiles = static_cast<uint32_t>(getInt("log.max_files", 5));
    return s;
}

StorageSettings Config::getStorageSettings() const {
    StorageSettings s;
    s.dataDir = getString("data.dir", getDataDir());
    s.dbFile = getString("data.db_file", "coursedao.db");
    return s;
}

void Config::setOrganizationSettings(const OrganizationSettings& s) {
    set("org.owner", s.owner);
    setList("org.board", s.board);
    set("org.treasury_account", s.treasuryAccount);
    set("token.symbol", s.tokenSymbol);
    set("org.proposal_duration", s.proposalDuration);
    set("org.default_rating_weight", s.defaultRatingWeight);
}

std::string Config::getDataDir() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->dataDir;
}

std::string Config::getConfigPath() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->configPath;
}

void Config::setDataDir(const std::string& path) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->dataDir = path;
}

void Config::onChange(std::function<void(const std::string&)> callback) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->changeCallback = std::move(callback);
}

}
}
