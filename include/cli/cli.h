#pragma once

#include "core/types.h"
#include "infrastructure/error_handling.h"
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace coursedao {

struct CliConfig {
    bool showHelp = false;
    bool showVersion = false;
    bool jsonOutput = false;
    bool fixedNow = false;
    uint64_t now = 0;
    std::string configPath;
    std::string dataDir;
    std::string dbPath;
    std::string caller;
    std::string logLevel;
    std::vector<std::string> commandArgs;
};

void printHelp(const char* prog, std::ostream& out);
void printVersion(std::ostream& out);
bool parseArgs(int argc, char* argv[], CliConfig& config);

// Argument parsing shared by the commands.
bool parseYesNo(const std::string& text, bool& out);
std::vector<core::Account> parseAccountList(const std::string& text);
// Comma separated basis points; a single share above 10000 can never sum
// to 10000 and is refused before reaching the catalog.
Result<std::vector<uint32_t>> parseShareList(const std::string& text);
// Values that do not fit a rating byte map to 0 so the ledger reports them
// as invalid.
uint8_t ratingArgument(uint64_t value);

// One command per instance: initialize() opens config, log and database,
// runCommand() executes inside a single database transaction.
class CourseDaoCli {
public:
    CourseDaoCli(const CliConfig& cli, std::ostream& out, std::ostream& err);
    ~CourseDaoCli();

    bool initialize();
    int runCommand(const std::vector<std::string>& args);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
