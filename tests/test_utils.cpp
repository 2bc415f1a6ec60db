#include "utils/utils.h"
#include "utils/config.h"
#include "utils/logger.h"
#include "utils/serialize.h"
#include "infrastructure/error_handling.h"
#include <cassert>
#include <cstdint>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <vector>

using coursedao::utils::Formatter;

static void testFormatter() {
    assert(Formatter::formatNumber(0) == "0");
    assert(Formatter::formatNumber(1234) == "1,234");
    assert(Formatter::formatNumber(1234567) == "1,234,567");
    assert(Formatter::formatAmount(2500, "EDU") == "2,500 EDU");
    assert(Formatter::formatBasisPoints(4000) == "40.00%");
    assert(Formatter::formatBasisPoints(5) == "0.05%");
    assert(Formatter::formatHundredths(450) == "4.50");
    assert(Formatter::formatDuration(45) == "45s");
    assert(Formatter::formatDuration(180) == "3m 0s");
    assert(Formatter::formatDuration(7260) == "2h 1m");
    assert(Formatter::formatDuration(90000) == "1d 1h");
    assert(Formatter::formatTimestamp(0) == "1970-01-01 00:00:00");
    assert(Formatter::formatAddress("") == "<none>");
    assert(Formatter::formatAddress("0x0123456789abcdef0123") == "0x01234567...ef0123");
    assert(Formatter::split(" a, b ,c", ',') == (std::vector<std::string>{"a", "b", "c"}));
    assert(Formatter::join({"t1", "t2"}, ",") == "t1,t2");
    assert(Formatter::truncate("abcdefgh", 6) == "abc...");

    uint64_t v = 7;
    assert(Formatter::parseUint64(" 18446744073709551615 ", v) && v == UINT64_MAX);
    v = 7;
    assert(!Formatter::parseUint64("18446744073709551616", v) && v == 7);
    assert(!Formatter::parseUint64("-1", v));
    assert(!Formatter::parseUint64("", v));
    assert(!Formatter::parseUint64("12a", v));

    assert(Formatter::toLower("YES") == "yes");
    assert(Formatter::toLower("Caf\xc9") == "caf\xc9");
}

static void testTable() {
    coursedao::utils::TableFormatter table;
    table.setHeaders({"ID", "TITLE"});
    table.addRow({"1", "Algebra"});
    std::string out = table.render();
    assert(out == "| ID | TITLE   |\n|----|---------|\n| 1  | Algebra |\n");
}

static void testByteBuffer() {
    coursedao::utils::ByteBuffer out;
    out.writeUint8(7);
    out.writeUint32(0xdeadbeef);
    out.writeUint64(1ULL << 40);
    out.writeVarInt(300);
    out.writeString("owner");
    out.writeStringList({"t1", "t2"});
    out.writeBool(true);

    coursedao::utils::ByteBuffer in(out.data());
    assert(in.readUint8() == 7);
    assert(in.readUint32() == 0xdeadbeef);
    assert(in.readUint64() == (1ULL << 40));
    assert(in.readVarInt() == 300);
    assert(in.readString() == "owner");
    assert(in.readStringList() == (std::vector<std::string>{"t1", "t2"}));
    assert(in.readBool());
    assert(in.atEnd());

    bool threw = false;
    try {
        in.readUint8();
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
}

static void testConfigRoundTrip() {
    std::string path = "/tmp/coursedao_test_utils.conf";
    std::remove(path.c_str());

    coursedao::utils::Config cfg;
    assert(cfg.getUint64("org.proposal_duration") == 180);
    assert(!cfg.load(path));

    coursedao::utils::OrganizationSettings s;
    s.owner = "founder";
    s.board = {"b1", "b2"};
    s.proposalDuration = 600;
    s.defaultRatingWeight = 50;
    cfg.setOrganizationSettings(s);
    cfg.set("org.proposal_duration", "-5");
    assert(cfg.getUint64("org.proposal_duration", 9) == 9);
    cfg.set("org.proposal_duration", static_cast<uint64_t>(600));
    assert(cfg.save(path));

    coursedao::utils::Config loaded;
    assert(loaded.load(path));
    auto back = loaded.getOrganizationSettings();
    assert(back.owner == "founder");
    assert(back.board == (std::vector<std::string>{"b1", "b2"}));
    assert(back.proposalDuration == 600);
    assert(back.defaultRatingWeight == 50);
    assert(back.treasuryAccount == "dao:treasury");
    assert(loaded.getBool("log.console"));

    std::remove(path.c_str());
}

static void testConfigResetAndChanges() {
    coursedao::utils::Config cfg;
    std::vector<std::string> changed;
    cfg.onChange([&](const std::string& key) {
        changed.push_back(key);
        assert(cfg.has(key));
    });

    cfg.set("org.owner", "founder");
    cfg.set("token.symbol", "GOV");
    assert(changed == (std::vector<std::string>{"org.owner", "token.symbol"}));

    cfg.set("custom.flag", true);
    changed.clear();
    cfg.reset();
    assert(!cfg.has("custom.flag"));
    assert(cfg.getString("token.symbol") == "EDU");
    assert(cfg.getConfigPath().empty());
    assert(!changed.empty());

    cfg.onChange(nullptr);
    changed.clear();
    cfg.set("org.owner", "other");
    assert(changed.empty());
}

static void testLogLevels() {
    using coursedao::utils::LogLevel;
    using coursedao::utils::Logger;
    LogLevel level = LogLevel::INFO;
    assert(Logger::parseLevel("DEBUG", level) && level == LogLevel::DEBUG);
    assert(Logger::parseLevel("warning", level) && level == LogLevel::WARN);
    assert(Logger::parseLevel("off", level) && level == LogLevel::OFF);
    assert(!Logger::parseLevel("loud", level) && level == LogLevel::OFF);
    assert(!Logger::parseLevel("INF\xff", level) && level == LogLevel::OFF);

    Logger::setAllowSensitiveLogging(true);
    assert(Logger::redactAddress("0x0123456789abcdef0123") == "0x0123456789abcdef0123");
    Logger::setAllowSensitiveLogging(false);
    assert(Logger::redactAddress("0x0123456789abcdef0123") != "0x0123456789abcdef0123");
}

static void testLoggerHistory() {
    using coursedao::utils::LogEntry;
    using coursedao::utils::LogLevel;
    using coursedao::utils::Logger;
    Logger::enableConsole(false);
    Logger::setLevel(LogLevel::INFO);
    Logger::clearLogs();

    std::vector<std::string> observed;
    Logger::onLog([&](const LogEntry& e) { observed.push_back(e.message); });

    LOG_DEBUG("below threshold");
    LOG_INFO("course 1 created");
    LOG_WARN("vote rejected");
    LOG_CAT(ERROR, "database", "disk full");
    LOG_ERROR("commit failed");

    assert(observed == (std::vector<std::string>{"course 1 created", "vote rejected", "disk full", "commit failed"}));
    assert(Logger::getLogCount() == 4);
    assert(Logger::getErrorCount() == 2);

    std::vector<LogEntry> recent = Logger::getRecentLogs(2);
    assert(recent.size() == 2);
    assert(recent[0].category == "database");
    assert(recent[0].level == LogLevel::ERROR);
    assert(recent[1].message == "commit failed");
    assert(Logger::getRecentLogs().size() == 4);

    for (int i = 0; i < 1100; i++) LOG_INFO("entry " + std::to_string(i));
    assert(Logger::getRecentLogs(5000).size() == 1000);
    assert(Logger::getRecentLogs(1)[0].message == "entry 1099");

    Logger::onLog(nullptr);
    Logger::clearLogs();
    assert(Logger::getLogCount() == 0);
    assert(Logger::getErrorCount() == 0);
    assert(Logger::getRecentLogs().empty());
    Logger::enableConsole(true);
}

static coursedao::Result<uint32_t> checkedShare(uint64_t bp) {
    COURSEDAO_CHECK(bp <= 10000, coursedao::ErrorCode::SHARES_MUST_SUM_TO_10000, "share " + std::to_string(bp));
    return static_cast<uint32_t>(bp);
}

static void testErrorMacros() {
    using coursedao::ErrorCode;
    auto ok = checkedShare(6000);
    assert(ok.ok() && ok.value() == 6000);
    auto bad = checkedShare(10001);
    assert(bad.failed());
    assert(bad.code() == ErrorCode::SHARES_MUST_SUM_TO_10000);
    assert(bad.error().message == "share 10001");

    coursedao::Error e = COURSEDAO_ERROR(ErrorCode::INVALID_ARGUMENT, "not a number");
    assert(e.code == ErrorCode::INVALID_ARGUMENT);
    assert(e.message == "not a number");
    assert(e.context.empty());
}

static void testErrorNames() {
    using coursedao::ErrorCode;
    using coursedao::ErrorCategory;
    assert(std::string(coursedao::errorName(ErrorCode::SHARES_MUST_SUM_TO_10000)) == "SharesMustSumTo10000");
    assert(std::string(coursedao::errorName(ErrorCode::INSUFFICIENT_TREASURY)) == "InsufficientTreasury");
    assert(coursedao::categoryOf(ErrorCode::NOT_OWNER) == ErrorCategory::AUTHORIZATION);
    assert(coursedao::categoryOf(ErrorCode::VOTING_CLOSED) == ErrorCategory::TEMPORAL);
    assert(coursedao::categoryOf(ErrorCode::OK) == ErrorCategory::NONE);

    coursedao::Error e = coursedao::makeError(ErrorCode::NO_SUCH_COURSE, "course 9", "remove");
    assert(e.category == ErrorCategory::STATE_CONFLICT);
    assert(e.context == "remove");

    bool threw = false;
    try {
        coursedao::throwIfError(ErrorCode::INVALID_DURATION);
    } catch (const std::exception&) {
        threw = true;
    }
    assert(threw);
    coursedao::throwIfError(ErrorCode::OK);
}

static void testErrorHandler() {
    using coursedao::ErrorCode;
    coursedao::ErrorHandler handler;
    std::vector<std::string> printed;
    handler.setHandler([&](const coursedao::Error& e) { printed.push_back(coursedao::errorName(e.code)); });

    handler.handle(ErrorCode::NOT_BOARD, "payout by t1");
    handler.handle(coursedao::makeError(ErrorCode::NO_SUCH_COURSE, "course 4"));
    handler.handle(ErrorCode::NOT_BOARD, "bonus by s1");

    assert(printed == (std::vector<std::string>{"NotBoard", "NoSuchCourse", "NotBoard"}));
    assert(handler.getErrorCount() == 3);
    assert(handler.getErrorCount(ErrorCode::NOT_BOARD) == 2);
    assert(handler.getLastError().message == "bonus by s1");

    auto recent = handler.getRecentErrors(2);
    assert(recent.size() == 2);
    assert(recent[0].message == "bonus by s1");
    assert(recent[1].code == ErrorCode::NO_SUCH_COURSE);

    handler.clearErrors();
    assert(handler.getErrorCount() == 0);
    assert(handler.getLastError().code == ErrorCode::OK);
}

int main() {
    testFormatter();
    testTable();
    testByteBuffer();
    testConfigRoundTrip();
    testConfigResetAndChanges();
    testLogLevels();
    testLoggerHistory();
    testErrorNames();
    testErrorMacros();
    testErrorHandler();
    return 0;
}
