#include "utils/utils.h"
#include <sstream>
#include <iomanip>
#include <ctime>
#include <algorithm>
#include <cctype>

namespace coursedao {
namespace utils {

std::string Formatter::formatNumber(uint64_t num) {
    std::string str = std::to_string(num);
    int insertPosition = static_cast<int>(str.length()) - 3;
    while (insertPosition > 0) { str.insert(insertPosition, ","); insertPosition -= 3; }
    return str;
}

std::string Formatter::formatAmount(uint64_t amount, const std::string& symbol) {
    if (symbol.empty()) return formatNumber(amount);
    return formatNumber(amount) + " " + symbol;
}

std::string Formatter::formatHundredths(uint64_t value) {
    std::stringstream ss;
    ss << value / 100 << "." << std::setw(2) << std::setfill('0') << value % 100;
    return ss.str();
}

// 10000 basis points is 100%.
std::string Formatter::formatBasisPoints(uint64_t bp) {
    return formatHundredths(bp) + "%";
}

std::string Formatter::formatDuration(uint64_t seconds) {
    if (seconds < 60) return std::to_string(seconds) + "s";
    else if (seconds < 3600) return std::to_string(seconds / 60) + "m " + std::to_string(seconds % 60) + "s";
    else if (seconds < 86400) return std::to_string(seconds / 3600) + "h " + std::to_string((seconds % 3600) / 60) + "m";
    else return std::to_string(seconds / 86400) + "d " + std::to_string((seconds % 86400) / 3600) + "h";
}

std::string Formatter::formatTimestamp(uint64_t seconds) {
    time_t ts = static_cast<time_t>(seconds);
    std::tm tmBuf{};
    gmtime_r(&ts, &tmBuf);
    char buf[64];
    strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tmBuf);
    return std::string(buf);
}

std::string Formatter::formatAddress(const std::string& address) {
    if (address.empty()) return "<none>";
    if (address.length() <= 19) return address;
    return address.substr(0, 10) + "..." + address.substr(address.length() - 6);
}

std::string Formatter::padRight(const std::string& str, size_t width, char padChar) {
    if (str.length() >= width) return str;
    return str + std::string(width - str.length(), padChar);
}

std::string Formatter::truncate(const std::string& str, size_t maxLen, const std::string& suffix) {
    if (str.length() <= maxLen) return str;
    if (maxLen <= suffix.length()) return str.substr(0, maxLen);
    return str.substr(0, maxLen - suffix.length()) + suffix;
}

std::string Formatter::toLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string Formatter::trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

std::vector<std::string> Formatter::split(const std::string& str, char delimiter) {
    std::vector<std::string> result;
    std::stringstream ss(str);
    std::string item;
    while (std::getline(ss, item, delimiter)) result.push_back(trim(item));
    return result;
}

std::string Formatter::join(const std::vector<std::string>& parts, const std::string& delimiter) {
    std::string result;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i > 0) result += delimiter;
        result += parts[i];
    }
    return result;
}

bool Formatter::parseUint64(const std::string& str, uint64_t& out) {
    std::string s = trim(str);
    if (s.empty() || s.size() > 20) return false;
    uint64_t value = 0;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (value > (UINT64_MAX - digit) / 10) return false;
        value = value * 10 + digit;
    }
    out = value;
    return true;
}

TableFormatter::TableFormatter() : borderChar('|'), headerSeparator('-') {}

void TableFormatter::setHeaders(const std::vector<std::string>& hdrs) {
    headers = hdrs;
    columnWidths.resize(headers.size(), 0);
    for (size_t i = 0; i < headers.size(); i++) {
        columnWidths[i] = std::max(columnWidths[i], headers[i].length());
    }
}

void TableFormatter::addRow(const std::vector<std::string>& row) {
    rows.push_back(row);
    for (size_t i = 0; i < row.size() && i < columnWidths.size(); i++) {
        columnWidths[i] = std::max(columnWidths[i], row[i].length());
    }
}

std::string TableFormatter::render() const {
    std::stringstream ss;
    ss << renderRow(headers);
    ss << renderSeparator();
    for (const auto& row : rows) ss << renderRow(row);
    return ss.str();
}

std::string TableFormatter::renderRow(const std::vector<std::string>& row) const {
    std::stringstream ss;
    ss << borderChar;
    for (size_t i = 0; i < columnWidths.size(); i++) {
        std::string cell = (i < row.size()) ? row[i] : "";
        ss << " " << Formatter::padRight(cell, columnWidths[i]) << " " << borderChar;
    }
    ss << "\n";
    return ss.str();
}

std::string TableFormatter::renderSeparator() const {
    std::stringstream ss;
    ss << borderChar;
    for (size_t width : columnWidths) ss << std::string(width + 2, headerSeparator) << borderChar;
    ss << "\n";
    return ss.str();
}

void TableFormatter::clear() {
    headers.clear();
    rows.clear();
    columnWidths.clear();
}

}
}
