#include "utils/utils.h"
#include <sstream>
#include <iomanip>
#include <ctime>
#include <chrono>
#include <algorithm>
#include <random>
#include <mutex>
#include <cctype>

namespace paycore {
namespace utils {

std::string Formatter::formatTimestamp(uint64_t timestampMs) {
    time_t ts = static_cast<time_t>(timestampMs / 1000);
    std::tm tmBuf{};
    gmtime_r(&ts, &tmBuf);
    char buf[32];
    if (strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tmBuf) == 0) return std::to_string(timestampMs);
    return std::string(buf);
}

std::string Formatter::toUpper(const std::string& str) {
    std::string out = str;
    for (auto& c : out) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return out;
}

std::string Formatter::toLower(const std::string& str) {
    std::string out = str;
    for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

std::string Formatter::trim(const std::string& str) {
    const char* ws = " \t\n\r";
    size_t first = str.find_first_not_of(ws);
    if (first == std::string::npos) return "";
    return str.substr(first, str.find_last_not_of(ws) - first + 1);
}

TableFormatter::TableFormatter(char border) : border_(border) {}

void TableFormatter::widen(const std::vector<std::string>& row) {
    if (row.size() > widths_.size()) {
        widths_.resize(row.size(), 0);
        numeric_.resize(row.size(), false);
    }
    for (size_t i = 0; i < row.size(); ++i) widths_[i] = std::max(widths_[i], row[i].size());
}

void TableFormatter::setHeaders(const std::vector<std::string>& hdrs) {
    headers_ = hdrs;
    widen(headers_);
}

void TableFormatter::setNumeric(size_t column) {
    if (column >= numeric_.size()) {
        widths_.resize(column + 1, 0);
        numeric_.resize(column + 1, false);
    }
    numeric_[column] = true;
}

void TableFormatter::addRow(const std::vector<std::string>& row) {
    rows_.push_back(row);
    widen(row);
}

std::string TableFormatter::render() const {
    std::ostringstream ss;
    ss << renderRow(headers_) << renderSeparator();
    for (const auto& row : rows_) ss << renderRow(row);
    return ss.str();
}

std::string TableFormatter::renderRow(const std::vector<std::string>& row) const {
    std::ostringstream ss;
    ss << border_;
    for (size_t i = 0; i < widths_.size(); ++i) {
        const std::string cell = i < row.size() ? row[i] : "";
        ss << ' ' << (numeric_[i] ? std::right : std::left)
           << std::setw(static_cast<int>(widths_[i])) << cell << ' ' << border_;
    }
    ss << '\n';
    return ss.str();
}

std::string TableFormatter::renderSeparator() const {
    std::string line(1, border_);
    for (size_t w : widths_) line += std::string(w + 2, '-') + border_;
    return line + "\n";
}

uint64_t nowMillis() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

std::string generateId(const std::string& prefix) {
    static std::mutex rngMutex;
    static std::mt19937_64 rng{std::random_device{}()};
    uint64_t hi;
    uint32_t lo;
    {
        std::lock_guard<std::mutex> lock(rngMutex);
        hi = rng();
        lo = static_cast<uint32_t>(rng());
    }
    std::ostringstream ss;
    ss << prefix << std::hex << std::setfill('0') << std::setw(16) << hi << std::setw(8) << lo;
    return ss.str();
}

}
}
