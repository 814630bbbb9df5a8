#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace paycore {
namespace utils {

class Formatter {
public:
    // "YYYY-MM-DD HH:MM:SS" in UTC.
    static std::string formatTimestamp(uint64_t timestampMs);
    static std::string toUpper(const std::string& str);
    static std::string toLower(const std::string& str);
    static std::string trim(const std::string& str);
};

// Plain text table for the CLI. Columns marked numeric are right aligned.
class TableFormatter {
public:
    explicit TableFormatter(char border = '|');
    void setHeaders(const std::vector<std::string>& hdrs);
    void setNumeric(size_t column);
    void addRow(const std::vector<std::string>& row);
    size_t rowCount() const { return rows_.size(); }
    std::string render() const;

private:
    std::string renderRow(const std::vector<std::string>& row) const;
    std::string renderSeparator() const;
    void widen(const std::vector<std::string>& row);

    std::vector<std::string> headers_;
    std::vector<std::vector<std::string>> rows_;
    std::vector<size_t> widths_;
    std::vector<bool> numeric_;
    char border_;
};

// Milliseconds since the Unix epoch.
uint64_t nowMillis();

// prefix followed by 24 random lowercase hex characters, e.g. "txn_3f09...".
std::string generateId(const std::string& prefix);

}
}
