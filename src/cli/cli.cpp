#include "cli/cli.h"
#include <iostream>
#include <string>
#include <vector>
#include <memory>
#include <filesystem>
#include <stdexcept>
#include <getopt.h>

#include <nlohmann/json.hpp>

#include "core/organization.h"
#include "core/token_ledger.h"
#include "core/clock.h"
#include "database/database.h"
#include "database/state_store.h"
#include "utils/logger.h"
#include "utils/config.h"
#include "utils/utils.h"

namespace coursedao {

using json = nlohmann::json;

void printHelp(const char* prog, std::ostream& out) {
    out << "Usage: " << prog << " [options] <command> [args]\n\n";
    out << "Options:\n";
    out << "  -h, --help          Show this help message\n";
    out << "  -v, --version       Show version information\n";
    out << "  -c, --config FILE   Configuration file\n";
    out << "  -D, --datadir DIR   Data directory\n";
    out << "  -b, --db FILE       Database file (overrides datadir)\n";
    out << "  -a, --as ACCOUNT    Account issuing the command\n";
    out << "  -l, --loglevel LVL  Log level (trace/debug/info/warn/error)\n";
    out << "  -n, --now TS        Use a fixed clock at TS seconds\n";
    out << "  -j, --json          Print views and events as JSON\n\n";
    out << "Governance:\n";
    out << "  init OWNER [BOARD...]             Create the organization\n";
    out << "  role ACCOUNT                      Show an account's role\n";
    out << "  members board|teacher|student     List members of a role\n";
    out << "  propose CANDIDATE ROLE            Open an admission proposal\n";
    out << "  vote ID yes|no                    Vote on a proposal\n";
    out << "  execute ID                        Execute a closed proposal\n";
    out << "  proposals                         List proposals\n";
    out << "  set-duration SECONDS              Change the voting window (owner)\n\n";
    out << "Courses:\n";
    out << "  course-create TITLE PRICE T1,T2 S1,S2\n";
    out << "  course-remove ID\n";
    out << "  courses [--all]\n";
    out << "  apply COURSE\n";
    out << "  enroll-vote COURSE STUDENT yes|no\n";
    out << "  confirm COURSE\n";
    out << "  complete COURSE STUDENT\n";
    out << "  enrollments COURSE\n";
    out << "  rate COURSE TEACHER 1-5\n";
    out << "  stats TEACHER\n";
    out << "  bonus COURSE AMOUNT\n\n";
    out << "Treasury and ledger:\n";
    out << "  payout TO AMOUNT                  Board payout from the treasury\n";
    out << "  rescue TOKEN TO AMOUNT            Owner escape hatch\n";
    out << "  mint TO AMOUNT                    Credit the local ledger\n";
    out << "  approve AMOUNT                    Let the treasury pull AMOUNT\n";
    out << "  balance ACCOUNT\n";
    out << "  treasury\n";
}

void printVersion(std::ostream& out) {
    out << "coursedao v0.1.0\n";
    out << "State format version: " << database::StateStore::FORMAT_VERSION << "\n";
    out << "Build: " << __DATE__ << " " << __TIME__ << "\n";
}

bool parseArgs(int argc, char* argv[], CliConfig& config) {
    static struct option longOptions[] = {
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 'v'},
        {"config", required_argument, nullptr, 'c'},
        {"datadir", required_argument, nullptr, 'D'},
        {"db", required_argument, nullptr, 'b'},
        {"as", required_argument, nullptr, 'a'},
        {"loglevel", required_argument, nullptr, 'l'},
        {"now", required_argument, nullptr, 'n'},
        {"json", no_argument, nullptr, 'j'},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    int optionIndex = 0;

    while ((opt = getopt_long(argc, argv, "+hvc:D:b:a:l:n:j", longOptions, &optionIndex)) != -1) {
        switch (opt) {
            case 'h':
                config.showHelp = true;
                return true;
            case 'v':
                config.showVersion = true;
                return true;
            case 'c':
                config.configPath = optarg;
                break;
            case 'D':
                config.dataDir = optarg;
                break;
            case 'b':
                config.dbPath = optarg;
                break;
            case 'a':
                config.caller = optarg;
                break;
            case 'l':
                config.logLevel = optarg;
                break;
            case 'n':
                if (!utils::Formatter::parseUint64(optarg, config.now)) {
                    std::cerr << "Invalid --now value: " << optarg << "\n";
                    return false;
                }
                config.fixedNow = true;
                break;
            case 'j':
                config.jsonOutput = true;
                break;
            default:
                return false;
        }
    }

    for (int i = optind; i < argc; i++) {
        config.commandArgs.push_back(argv[i]);
    }
    return true;
}

bool parseYesNo(const std::string& text, bool& out) {
    std::string v = utils::Formatter::toLower(text);
    if (v == "yes" || v == "y" || v == "for") { out = true; return true; }
    if (v == "no" || v == "n" || v == "against") { out = false; return true; }
    return false;
}

std::vector<core::Account> parseAccountList(const std::string& text) {
    std::vector<core::Account> accounts;
    for (const auto& a : utils::Formatter::split(text, ',')) {
        if (!a.empty()) accounts.push_back(a);
    }
    return accounts;
}

Result<std::vector<uint32_t>> parseShareList(const std::string& text) {
    std::vector<uint32_t> shares;
    for (const auto& s : utils::Formatter::split(text, ',')) {
        if (s.empty()) continue;
        uint64_t bp;
        COURSEDAO_CHECK(utils::Formatter::parseUint64(s, bp), ErrorCode::INVALID_ARGUMENT, "not a share: " + s);
        COURSEDAO_CHECK(bp <= core::BASIS_POINTS, ErrorCode::SHARES_MUST_SUM_TO_10000, "share above 10000: " + s);
        shares.push_back(static_cast<uint32_t>(bp));
    }
    return shares;
}

uint8_t ratingArgument(uint64_t value) {
    return value > 255 ? 0 : static_cast<uint8_t>(value);
}

static json proposalToJson(const core::Proposal& p, uint64_t now) {
    return json{
        {"id", p.id},
        {"candidate", p.candidate},
        {"role", core::roleToString(p.roleToAdd)},
        {"proposer", p.proposer},
        {"votesFor", p.votesFor},
        {"votesAgainst", p.votesAgainst},
        {"start", p.start},
        {"end", p.end},
        {"executed", p.executed},
        {"granted", p.granted},
        {"state", core::proposalStateToString(p.stateAt(now))}
    };
}

static json courseToJson(const core::Course& c) {
    json teachers = json::array();
    for (const auto& t : c.teachers) {
        teachers.push_back(json{{"account", t}, {"shareBp", c.shareOf(t)}});
    }
    return json{
        {"id", c.id},
        {"title", c.title},
        {"price", c.price},
        {"teachers", teachers},
        {"creator", c.creator},
        {"exists", c.exists}
    };
}

static json enrollmentToJson(const core::EnrollmentRequest& e) {
    return json{
        {"course", e.courseId},
        {"student", e.student},
        {"stage", core::enrollmentStageToString(e.stage())},
        {"votesFor", e.votesFor},
        {"votesAgainst", e.votesAgainst},
        {"attempts", e.attempts},
        {"enrolled", e.enrolled},
        {"completed", e.completed}
    };
}

static json notificationToJson(const core::Notification& n) {
    json fields = json::object();
    for (const auto& [key, value] : n.fields) fields[key] = value;
    return json{
        {"event", core::notificationTypeToString(n.type)},
        {"sequence", n.sequence},
        {"timestamp", n.timestamp},
        {"fields", fields}
    };
}

struct CourseDaoCli::Impl {
    Impl(const CliConfig& cli, std::ostream& out, std::ostream& err) : cli_(cli), out_(out), err_(err) {}

    ~Impl() {
        ErrorHandler::instance().setHandler(nullptr);
        org_.reset();
        ledger_.reset();
        db_.close();
        utils::Logger::shutdown();
    }

    bool initialize() {
        auto& cfg = utils::Config::instance();
        if (!cli_.dataDir.empty()) cfg.setDataDir(cli_.dataDir);

        std::string configPath = cli_.configPath;
        if (configPath.empty()) {
            std::string candidate = cfg.getDataDir() + "/coursedao.conf";
            if (std::filesystem::exists(candidate)) configPath = candidate;
        }
        if (!configPath.empty() && !cfg.load(configPath)) {
            err_ << "Failed to load config " << configPath << "\n";
            return false;
        }

        utils::LogSettings logSettings = cfg.getLogSettings();
        if (!cli_.logLevel.empty()) logSettings.level = cli_.logLevel;
        utils::LogLevel level;
        if (!utils::Logger::parseLevel(logSettings.level, level)) {
            err_ << "Unknown log level: " << logSettings.level << "\n";
            return false;
        }
        storage_ = cfg.getStorageSettings();
        std::error_code ec;
        std::filesystem::create_directories(storage_.dataDir, ec);
        if (ec) {
            err_ << "Cannot create data directory " << storage_.dataDir << ": " << ec.message() << "\n";
            return false;
        }

        utils::Logger::init(logSettings.file.empty() ? storage_.dataDir + "/coursedao.log" : logSettings.file);
        utils::Logger::setLevel(level);
        utils::Logger::enableConsole(logSettings.console);
        utils::Logger::setMaxFileSize(logSettings.maxFileSize);
        utils::Logger::setMaxFiles(logSettings.maxFiles);

        std::string dbPath = cli_.dbPath.empty() ? storage_.dataDir + "/" + storage_.dbFile : cli_.dbPath;
        if (!db_.open(dbPath)) {
            err_ << "Failed to open database " << dbPath << "\n";
            return false;
        }

        settings_ = cfg.getOrganizationSettings();
        if (cli_.fixedNow) {
            clock_ = std::make_unique<core::ManualClock>(cli_.now);
        } else {
            clock_ = std::make_unique<core::SystemClock>();
        }
        ledger_ = std::make_unique<core::SqliteTokenLedger>(db_, settings_.tokenSymbol);

        reportErrors();
        LOG_DEBUG("coursedao using " + dbPath);
        return true;
    }

    // Load, operation and save share one write transaction; any failure
    // rolls back ledger moves together with the organization state.
    int runCommand(const std::vector<std::string>& args) {
        if (args.empty()) {
            printHelp("coursedao", out_);
            return 1;
        }
        database::Transaction tx(db_);
        if (!tx.active()) {
            return fail(makeError(ErrorCode::DATABASE_ERROR, "cannot lock database", db_.getPath()));
        }
        int rc = dispatch(args);
        if (rc != 0) {
            LOG_WARN("command " + args[0] + " rolled back");
            return rc;
        }
        if (!tx.commit()) {
            return fail(COURSEDAO_ERROR(ErrorCode::DATABASE_ERROR, "commit failed for " + db_.getPath()));
        }
        return 0;
    }

    int dispatch(const std::vector<std::string>& args) {
        const std::string& cmd = args[0];
        try {
            if (cmd == "init") return cmdInit(args);
            if (cmd == "mint") return cmdMint(args);
            if (cmd == "approve") return cmdApprove(args);
            if (cmd == "balance") return cmdBalance(args);

            if (!loadOrganization()) return 1;

            if (cmd == "role") return cmdRole(args);
            if (cmd == "members") return cmdMembers(args);
            if (cmd == "proposals") return cmdProposals();
            if (cmd == "courses") return cmdCourses(args);
            if (cmd == "enrollments") return cmdEnrollments(args);
            if (cmd == "stats") return cmdStats(args);
            if (cmd == "treasury") return cmdTreasury();

            if (cmd == "propose") return cmdPropose(args);
            if (cmd == "vote") return cmdVote(args);
            if (cmd == "execute") return cmdExecute(args);
            if (cmd == "set-duration") return cmdSetDuration(args);
            if (cmd == "course-create") return cmdCourseCreate(args);
            if (cmd == "course-remove") return cmdCourseRemove(args);
            if (cmd == "apply") return cmdApply(args);
            if (cmd == "enroll-vote") return cmdEnrollVote(args);
            if (cmd == "confirm") return cmdConfirm(args);
            if (cmd == "complete") return cmdComplete(args);
            if (cmd == "rate") return cmdRate(args);
            if (cmd == "bonus") return cmdBonus(args);
            if (cmd == "payout") return cmdPayout(args);
            if (cmd == "rescue") return cmdRescue(args);
        } catch (const std::exception& e) {
            LOG_ERROR(std::string("command ") + cmd + " failed: " + e.what());
            err_ << "Error: " << e.what() << "\n";
            return 1;
        }
        err_ << "Unknown command: " << cmd << "\n";
        return 1;
    }

    CliConfig cli_;
    std::ostream& out_;
    std::ostream& err_;
    utils::OrganizationSettings settings_;
    utils::StorageSettings storage_;
    database::Database db_;
    std::unique_ptr<core::Clock> clock_;
    std::unique_ptr<core::SqliteTokenLedger> ledger_;
    std::unique_ptr<core::Organization> org_;

    bool usage(const std::vector<std::string>& args, size_t minArgs, const std::string& synopsis) const {
        if (args.size() >= minArgs + 1) return true;
        err_ << "Usage: coursedao " << synopsis << "\n";
        return false;
    }

    bool requireCaller() const {
        if (!cli_.caller.empty()) return true;
        err_ << "This command needs --as ACCOUNT\n";
        return false;
    }

    bool parseAmount(const std::string& text, uint64_t& out) const {
        if (utils::Formatter::parseUint64(text, out)) return true;
        err_ << "Not a number: " << text << "\n";
        return false;
    }

    bool parseVote(const std::string& text, bool& out) const {
        if (parseYesNo(text, out)) return true;
        err_ << "Expected yes or no, got " << text << "\n";
        return false;
    }

    int fail(const Error& error) const {
        ErrorHandler::instance().handle(error);
        return 1;
    }

    void reportErrors() {
        bool asJson = cli_.jsonOutput;
        std::ostream* err = &err_;
        ErrorHandler::instance().setHandler([asJson, err](const Error& error) {
            LOG_CAT(DEBUG, "cli", std::string(categoryToString(error.category)) + " " +
                    errorName(error.code) + ": " + error.message);
            if (asJson) {
                json out = {
                    {"error", errorName(error.code)},
                    {"category", categoryToString(error.category)},
                    {"message", error.message},
                    {"context", error.context}
                };
                *err << out.dump() << "\n";
                return;
            }
            *err << "Error: " << errorName(error.code) << ": " << error.message;
            if (!error.context.empty()) *err << " [" << error.context << "]";
            *err << "\n";
        });
    }

    void watchNotifications() {
        org_->notifications().subscribeAll([this](const core::Notification& n) {
            if (cli_.jsonOutput) {
                out_ << notificationToJson(n).dump() << "\n";
            } else {
                out_ << n.toString() << "\n";
            }
        });
    }

    bool loadOrganization() {
        database::StateStore store(db_);
        if (!store.hasState()) {
            err_ << "No organization in " << db_.getPath() << "; run `coursedao init` first\n";
            return false;
        }
        auto state = store.load();
        if (state.failed()) {
            fail(state.error());
            return false;
        }

        core::OrganizationConfig orgConfig = core::OrganizationConfig::fromSettings(settings_);
        orgConfig.treasuryAccount = state.value().treasuryAccount;
        orgConfig.proposalDuration = state.value().proposals.duration;
        org_ = std::make_unique<core::Organization>(state.value().owner, std::vector<core::Account>{},
                                                    *ledger_, *clock_, orgConfig);
        auto restored = org_->restore(state.value());
        if (restored.failed()) {
            fail(restored.error());
            return false;
        }
        watchNotifications();
        return true;
    }

    int persist() {
        database::StateStore store(db_);
        auto saved = store.save(org_->snapshot());
        if (saved.failed()) return fail(saved.error());
        return 0;
    }

    template<typename T>
    int finish(const Result<T>& result) {
        if (result.failed()) return fail(result.error());
        return persist();
    }

    int cmdInit(const std::vector<std::string>& args) {
        database::StateStore store(db_);
        if (store.hasState()) {
            err_ << "An organization already exists in " << db_.getPath() << "\n";
            return 1;
        }
        std::string owner = args.size() > 1 ? args[1] : settings_.owner;
        std::vector<core::Account> board(args.size() > 2 ? args.begin() + 2 : args.end(), args.end());
        if (args.size() <= 2) board = settings_.board;
        if (owner.empty()) {
            err_ << "Usage: coursedao init OWNER [BOARD...] (or set org.owner)\n";
            return 1;
        }

        try {
            org_ = std::make_unique<core::Organization>(owner, board, *ledger_, *clock_,
                                                        core::OrganizationConfig::fromSettings(settings_));
        } catch (const std::runtime_error& e) {
            err_ << "Cannot create organization: " << e.what() << "\n";
            return 1;
        }
        int rc = persist();
        if (rc != 0) return rc;
        LOG_INFO("organization created by " + owner + " in " + db_.getPath());
        out_ << "Organization created: owner " << owner << ", " << board.size()
                  << " board member(s), treasury " << org_->treasuryAccount() << "\n";

        auto& cfg = utils::Config::instance();
        if (cfg.getConfigPath().empty()) {
            settings_.owner = owner;
            settings_.board = board;
            cfg.setOrganizationSettings(settings_);
            std::string confPath = storage_.dataDir + "/coursedao.conf";
            if (cfg.save(confPath)) {
                out_ << "Wrote " << confPath << "\n";
            } else {
                LOG_WARN("could not write " + confPath);
            }
        }
        return 0;
    }

    int cmdMint(const std::vector<std::string>& args) {
        if (!usage(args, 2, "mint TO AMOUNT")) return 1;
        uint64_t amount;
        if (!parseAmount(args[2], amount)) return 1;
        if (!ledger_->mint(args[1], amount)) {
            return fail(makeError(ErrorCode::TRANSFER_FAILED, "ledger refused mint", args[1]));
        }
        out_ << "Minted " << utils::Formatter::formatAmount(amount, ledger_->symbol())
                  << " to " << args[1] << "\n";
        return 0;
    }

    int cmdApprove(const std::vector<std::string>& args) {
        if (!usage(args, 1, "--as ACCOUNT approve AMOUNT") || !requireCaller()) return 1;
        uint64_t amount;
        if (!parseAmount(args[1], amount)) return 1;
        database::StateStore store(db_);
        std::string spender = settings_.treasuryAccount;
        if (store.hasState()) {
            auto state = store.load();
            if (state.failed()) return fail(state.error());
            spender = state.value().treasuryAccount;
        }
        if (!ledger_->approve(cli_.caller, spender, amount)) {
            return fail(makeError(ErrorCode::TRANSFER_FAILED, "ledger refused approval", cli_.caller));
        }
        out_ << cli_.caller << " allows " << spender << " to pull "
                  << utils::Formatter::formatAmount(amount, ledger_->symbol()) << "\n";
        return 0;
    }

    int cmdBalance(const std::vector<std::string>& args) {
        if (!usage(args, 1, "balance ACCOUNT")) return 1;
        uint64_t balance = ledger_->balanceOf(args[1]);
        if (cli_.jsonOutput) {
            out_ << json{{"account", args[1]}, {"token", ledger_->symbol()}, {"balance", balance}}.dump() << "\n";
        } else {
            out_ << args[1] << ": " << utils::Formatter::formatAmount(balance, ledger_->symbol()) << "\n";
        }
        return 0;
    }

    int cmdRole(const std::vector<std::string>& args) {
        if (!usage(args, 1, "role ACCOUNT")) return 1;
        core::Role role = org_->roleOf(args[1]);
        if (cli_.jsonOutput) {
            out_ << json{{"account", args[1]}, {"role", core::roleToString(role)}}.dump() << "\n";
        } else {
            out_ << args[1] << ": " << core::roleToString(role) << "\n";
        }
        return 0;
    }

    int cmdMembers(const std::vector<std::string>& args) {
        if (!usage(args, 1, "members board|teacher|student")) return 1;
        core::Role role;
        if (!core::roleFromString(args[1], role) || !core::isMemberRole(role)) {
            err_ << "Unknown role: " << args[1] << "\n";
            return 1;
        }
        auto members = org_->members(role);
        if (cli_.jsonOutput) {
            out_ << json(members).dump() << "\n";
            return 0;
        }
        for (const auto& m : members) out_ << m << "\n";
        return 0;
    }

    int cmdProposals() {
        auto proposals = org_->listProposals();
        uint64_t now = org_->now();
        if (cli_.jsonOutput) {
            json out = json::array();
            for (const auto& p : proposals) out.push_back(proposalToJson(p, now));
            out_ << out.dump(2) << "\n";
            return 0;
        }
        utils::TableFormatter table;
        table.setHeaders({"ID", "Candidate", "Role", "For", "Against", "Ends", "State"});
        for (const auto& p : proposals) {
            table.addRow({std::to_string(p.id), utils::Formatter::formatAddress(p.candidate),
                          core::roleToString(p.roleToAdd), std::to_string(p.votesFor),
                          std::to_string(p.votesAgainst), utils::Formatter::formatTimestamp(p.end),
                          core::proposalStateToString(p.stateAt(now))});
        }
        out_ << table.render();
        return 0;
    }

    int cmdCourses(const std::vector<std::string>& args) {
        bool all = args.size() > 1 && args[1] == "--all";
        auto courses = org_->listCourses(all);
        if (cli_.jsonOutput) {
            json out = json::array();
            for (const auto& c : courses) out.push_back(courseToJson(c));
            out_ << out.dump(2) << "\n";
            return 0;
        }
        utils::TableFormatter table;
        table.setHeaders({"ID", "Title", "Price", "Teachers", "Status"});
        for (const auto& c : courses) {
            std::vector<std::string> teachers;
            for (const auto& t : c.teachers) {
                teachers.push_back(utils::Formatter::formatAddress(t) + " " +
                                   utils::Formatter::formatBasisPoints(c.shareOf(t)));
            }
            table.addRow({std::to_string(c.id), utils::Formatter::truncate(c.title, 32),
                          utils::Formatter::formatAmount(c.price, org_->paymentToken()),
                          utils::Formatter::join(teachers, ", "), c.exists ? "active" : "removed"});
        }
        out_ << table.render();
        return 0;
    }

    int cmdEnrollments(const std::vector<std::string>& args) {
        if (!usage(args, 1, "enrollments COURSE")) return 1;
        uint64_t courseId;
        if (!parseAmount(args[1], courseId)) return 1;
        auto requests = org_->listEnrollments(courseId);
        if (cli_.jsonOutput) {
            json out = json::array();
            for (const auto& e : requests) out.push_back(enrollmentToJson(e));
            out_ << out.dump(2) << "\n";
            return 0;
        }
        utils::TableFormatter table;
        table.setHeaders({"Student", "Stage", "For", "Against", "Attempts"});
        for (const auto& e : requests) {
            table.addRow({utils::Formatter::formatAddress(e.student), core::enrollmentStageToString(e.stage()),
                          std::to_string(e.votesFor), std::to_string(e.votesAgainst),
                          std::to_string(e.attempts)});
        }
        out_ << table.render();
        return 0;
    }

    int cmdStats(const std::vector<std::string>& args) {
        if (!usage(args, 1, "stats TEACHER")) return 1;
        auto stats = org_->teacherStats(args[1]);
        if (cli_.jsonOutput) {
            out_ << json{{"teacher", args[1]}, {"sum", stats.sum}, {"count", stats.count},
                              {"average", stats.scaledAverage()}, {"weight", org_->teacherWeight(args[1])}}.dump() << "\n";
        } else {
            out_ << args[1] << ": " << stats.count << " rating(s), average "
                      << utils::Formatter::formatHundredths(stats.scaledAverage())
                      << ", bonus weight " << org_->teacherWeight(args[1]) << "\n";
        }
        return 0;
    }

    int cmdTreasury() {
        if (cli_.jsonOutput) {
            out_ << json{{"account", org_->treasuryAccount()}, {"token", org_->paymentToken()},
                              {"balance", org_->treasuryBalance()},
                              {"proposalDuration", org_->proposalDuration()},
                              {"owner", org_->owner()}}.dump() << "\n";
            return 0;
        }
        out_ << "Treasury " << org_->treasuryAccount() << ": "
                  << utils::Formatter::formatAmount(org_->treasuryBalance(), org_->paymentToken()) << "\n";
        out_ << "Owner: " << org_->owner() << "\n";
        out_ << "Proposal duration: " << utils::Formatter::formatDuration(org_->proposalDuration()) << "\n";
        return 0;
    }

    int cmdPropose(const std::vector<std::string>& args) {
        if (!usage(args, 2, "--as ACCOUNT propose CANDIDATE ROLE") || !requireCaller()) return 1;
        core::Role role = core::Role::NONE;
        core::roleFromString(args[2], role);
        return finish(org_->createAdmissionProposal(cli_.caller, args[1], role));
    }

    int cmdVote(const std::vector<std::string>& args) {
        if (!usage(args, 2, "--as ACCOUNT vote ID yes|no") || !requireCaller()) return 1;
        uint64_t id;
        bool support;
        if (!parseAmount(args[1], id) || !parseVote(args[2], support)) return 1;
        return finish(org_->castVote(cli_.caller, id, support));
    }

    int cmdExecute(const std::vector<std::string>& args) {
        if (!usage(args, 1, "--as ACCOUNT execute ID") || !requireCaller()) return 1;
        uint64_t id;
        if (!parseAmount(args[1], id)) return 1;
        return finish(org_->executeProposal(cli_.caller, id));
    }

    int cmdSetDuration(const std::vector<std::string>& args) {
        if (!usage(args, 1, "--as OWNER set-duration SECONDS") || !requireCaller()) return 1;
        uint64_t seconds;
        if (!parseAmount(args[1], seconds)) return 1;
        return finish(org_->setProposalDuration(cli_.caller, seconds));
    }

    int cmdCourseCreate(const std::vector<std::string>& args) {
        if (!usage(args, 4, "--as TEACHER course-create TITLE PRICE T1,T2 S1,S2") || !requireCaller()) return 1;
        uint64_t price;
        if (!parseAmount(args[2], price)) return 1;
        auto shares = parseShareList(args[4]);
        if (shares.failed()) return fail(shares.error());
        return finish(org_->createCourse(cli_.caller, args[1], price, parseAccountList(args[3]), shares.value()));
    }

    int cmdCourseRemove(const std::vector<std::string>& args) {
        if (!usage(args, 1, "--as ACCOUNT course-remove ID") || !requireCaller()) return 1;
        uint64_t id;
        if (!parseAmount(args[1], id)) return 1;
        return finish(org_->removeCourse(cli_.caller, id));
    }

    int cmdApply(const std::vector<std::string>& args) {
        if (!usage(args, 1, "--as STUDENT apply COURSE") || !requireCaller()) return 1;
        uint64_t id;
        if (!parseAmount(args[1], id)) return 1;
        return finish(org_->applyToCourse(cli_.caller, id));
    }

    int cmdEnrollVote(const std::vector<std::string>& args) {
        if (!usage(args, 3, "--as TEACHER enroll-vote COURSE STUDENT yes|no") || !requireCaller()) return 1;
        uint64_t id;
        bool support;
        if (!parseAmount(args[1], id) || !parseVote(args[3], support)) return 1;
        return finish(org_->teacherVoteOnEnrollment(cli_.caller, id, args[2], support));
    }

    int cmdConfirm(const std::vector<std::string>& args) {
        if (!usage(args, 1, "--as STUDENT confirm COURSE") || !requireCaller()) return 1;
        uint64_t id;
        if (!parseAmount(args[1], id)) return 1;
        return finish(org_->confirmEnrollment(cli_.caller, id));
    }

    int cmdComplete(const std::vector<std::string>& args) {
        if (!usage(args, 2, "--as ACCOUNT complete COURSE STUDENT") || !requireCaller()) return 1;
        uint64_t id;
        if (!parseAmount(args[1], id)) return 1;
        return finish(org_->completeCourseAndDistribute(cli_.caller, id, args[2]));
    }

    int cmdRate(const std::vector<std::string>& args) {
        if (!usage(args, 3, "--as STUDENT rate COURSE TEACHER 1-5") || !requireCaller()) return 1;
        uint64_t id;
        uint64_t value;
        if (!parseAmount(args[1], id) || !parseAmount(args[3], value)) return 1;
        return finish(org_->giveRating(cli_.caller, id, args[2], ratingArgument(value)));
    }

    int cmdBonus(const std::vector<std::string>& args) {
        if (!usage(args, 2, "--as BOARD bonus COURSE AMOUNT") || !requireCaller()) return 1;
        uint64_t id;
        uint64_t amount;
        if (!parseAmount(args[1], id) || !parseAmount(args[2], amount)) return 1;
        return finish(org_->distributeBonusByRating(cli_.caller, id, amount));
    }

    int cmdPayout(const std::vector<std::string>& args) {
        if (!usage(args, 2, "--as BOARD payout TO AMOUNT") || !requireCaller()) return 1;
        uint64_t amount;
        if (!parseAmount(args[2], amount)) return 1;
        return finish(org_->boardPayout(cli_.caller, args[1], amount));
    }

    int cmdRescue(const std::vector<std::string>& args) {
        if (!usage(args, 3, "--as OWNER rescue TOKEN TO AMOUNT") || !requireCaller()) return 1;
        uint64_t amount;
        if (!parseAmount(args[3], amount)) return 1;
        return finish(org_->rescueFunds(cli_.caller, args[1], args[2], amount));
    }
};

CourseDaoCli::CourseDaoCli(const CliConfig& cli, std::ostream& out, std::ostream& err)
    : impl_(std::make_unique<Impl>(cli, out, err)) {}

CourseDaoCli::~CourseDaoCli() = default;

bool CourseDaoCli::initialize() {
    return impl_->initialize();
}

int CourseDaoCli::runCommand(const std::vector<std::string>& args) {
    return impl_->runCommand(args);
}

}
