#pragma once

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

// ---------------------------------------------------------------------------
// CsvTable - header-indexed rows of a comma-separated file.
// No quoting support; fields may not contain commas.
// ---------------------------------------------------------------------------
class CsvTable {
public:
    static CsvTable load(const std::filesystem::path& path) {
        std::ifstream in(path);
        if (!in.is_open())
            throw std::runtime_error("Cannot open CSV file: " + path.string());
        CsvTable table;
        table.source_ = path.string();

        std::string line;
        if (!std::getline(in, line))
            throw std::runtime_error("Empty CSV file: " + path.string());
        auto header = split(line);
        for (size_t i = 0; i < header.size(); ++i) table.columns_[header[i]] = i;

        while (std::getline(in, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (line.empty() || line[0] == '#') continue;
            table.rows_.push_back(split(line));
        }
        return table;
    }

    size_t size() const { return rows_.size(); }
    bool has_column(const std::string& name) const { return columns_.count(name) > 0; }

    const std::string& text(size_t row, const std::string& column) const {
        auto it = columns_.find(column);
        if (it == columns_.end())
            throw std::runtime_error(source_ + ": missing column '" + column + "'");
        const auto& r = rows_.at(row);
        if (it->second >= r.size()) return empty_;
        return r[it->second];
    }

    double number(size_t row, const std::string& column, double fallback = 0.0) const {
        const auto& s = text(row, column);
        if (s.empty()) return fallback;
        try {
            return std::stod(s);
        } catch (const std::exception&) {
            throw std::runtime_error(source_ + ": row " + std::to_string(row + 2)
                                     + " column '" + column + "' is not numeric: " + s);
        }
    }

    int integer(size_t row, const std::string& column, int fallback = 0) const {
        return static_cast<int>(number(row, column, fallback));
    }

private:
    static std::vector<std::string> split(const std::string& line) {
        std::vector<std::string> out;
        std::stringstream ss(line);
        std::string field;
        while (std::getline(ss, field, ',')) {
            size_t b = field.find_first_not_of(" \t\r");
            size_t e = field.find_last_not_of(" \t\r");
            out.push_back(b == std::string::npos ? std::string() : field.substr(b, e - b + 1));
        }
        if (!line.empty() && line.back() == ',') out.emplace_back();
        return out;
    }

    std::string source_;
    std::unordered_map<std::string, size_t> columns_;
    std::vector<std::vector<std::string>> rows_;
    std::string empty_;
};
