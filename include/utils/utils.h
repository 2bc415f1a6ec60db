#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace coursedao {
namespace utils {

class Formatter {
public:
    static std::string formatNumber(uint64_t num);
    static std::string formatAmount(uint64_t amount, const std::string& symbol);
    // 450 -> "4.50"
    static std::string formatHundredths(uint64_t value);
    static std::string formatBasisPoints(uint64_t bp);
    static std::string formatDuration(uint64_t seconds);
    static std::string formatTimestamp(uint64_t seconds);
    static std::string formatAddress(const std::string& address);
    static std::string padRight(const std::string& str, size_t width, char padChar = ' ');
    static std::string truncate(const std::string& str, size_t maxLen, const std::string& suffix = "...");
    static std::string toLower(const std::string& str);
    static std::string trim(const std::string& str);
    static std::vector<std::string> split(const std::string& str, char delimiter);
    static std::string join(const std::vector<std::string>& parts, const std::string& delimiter);
    static bool parseUint64(const std::string& str, uint64_t& out);
};

class TableFormatter {
public:
    TableFormatter();
    void setHeaders(const std::vector<std::string>& hdrs);
    void addRow(const std::vector<std::string>& row);
    std::string render() const;
    std::string renderRow(const std::vector<std::string>& row) const;
    std::string renderSeparator() const;
    void clear();

private:
    std::vector<std::string> headers;
    std::vector<std::vector<std::string>> rows;
    std::vector<size_t> columnWidths;
    char borderChar;
    char headerSeparator;
};

}
}
