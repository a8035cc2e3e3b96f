#include "market_data.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace retiresim {

namespace {

constexpr int kSp500StartYear = 1928;
constexpr int kSp500EndYear = 2024;

const std::vector<double>& sp500ReturnsPct() {
    static const std::vector<double> values = {
        // 1928-1940
        43.81, -8.30, -25.12, -43.84, -8.64, 49.98, -1.19, 46.74, 31.94, 35.34, -35.34, 29.28, -1.10,
        // 1941-1960
        -12.77, 19.17, 25.06, 19.03, 35.82, -8.43, 5.20, 5.70, 18.30, 30.81,
        23.68, 14.37, -1.21, 52.56, 31.24, 18.15, -0.73, 23.68, 52.40, 31.74,
        // 1961-1980
        26.63, -8.81, 22.61, 16.42, 12.40, -10.06, 23.80, 10.81, -8.24, -14.31,
        3.56, 14.22, 18.76, -14.31, -25.90, 37.00, 23.83, -7.18, 6.56, 18.44,
        // 1981-2000
        -4.70, 20.42, 22.34, 6.15, 31.24, 18.49, 5.81, 16.54, 31.48, -3.06,
        30.23, 7.49, 9.97, 1.33, 37.20, 22.68, 33.10, 28.34, 20.89, -9.03,
        // 2001-2020
        -11.85, -21.97, 28.36, 10.74, 4.83, 15.61, 5.48, -36.55, 25.94, 14.82,
        2.10, 15.89, 32.15, 13.52, 1.36, 11.77, 21.61, -4.23, 31.21, 18.02,
        // 2021-2024
        28.47, -18.04, 26.06, 25.02,
    };
    return values;
}

std::string trimCopy(std::string_view text) {
    std::size_t begin = 0;
    while (begin < text.size() && std::isspace(static_cast<unsigned char>(text[begin]))) {
        ++begin;
    }
    std::size_t end = text.size();
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return std::string(text.substr(begin, end - begin));
}

bool parseDouble(const std::string& text, double& value) {
    const std::string cleaned = trimCopy(text);
    if (cleaned.empty()) return false;
    std::istringstream ss(cleaned);
    ss >> value;
    return !ss.fail() && ss.eof();
}

bool parseInt(const std::string& text, int& value) {
    const std::string cleaned = trimCopy(text);
    if (cleaned.empty()) return false;
    std::istringstream ss(cleaned);
    ss >> value;
    return !ss.fail() && ss.eof();
}

double clampReturn(double value, double clampPct) {
    if (clampPct <= 0.0) {
        return value;
    }
    return std::max(-clampPct, std::min(clampPct, value));
}

}  // namespace

HistoricalSeries::HistoricalSeries(int startYear, int endYear, std::vector<double> returnsPct)
    : startYear_(startYear), endYear_(endYear), returnsPct_(std::move(returnsPct)) {
    if (returnsPct_.empty()) {
        throw std::invalid_argument("HistoricalSeries must contain at least one annual return");
    }
    if (endYear_ < startYear_) {
        throw std::invalid_argument("HistoricalSeries end year precedes start year");
    }
    const std::size_t expected = static_cast<std::size_t>(endYear_ - startYear_ + 1);
    if (returnsPct_.size() != expected) {
        throw std::invalid_argument("HistoricalSeries integrity error: expected " + std::to_string(expected) +
                                    " years (" + std::to_string(startYear_) + "-" + std::to_string(endYear_) +
                                    "), but got " + std::to_string(returnsPct_.size()) + " values");
    }
}

HistoricalSeries HistoricalSeries::sp500() {
    return HistoricalSeries(kSp500StartYear, kSp500EndYear, sp500ReturnsPct());
}

HistoricalSeries HistoricalSeries::loadFromCsv(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Unable to open historical returns CSV: " + path);
    }

    std::vector<double> values;
    int firstYear = 0;
    int previousYear = 0;
    std::string line;
    std::size_t lineNumber = 0;
    while (std::getline(file, line)) {
        ++lineNumber;
        if (trimCopy(line).empty()) continue;

        std::istringstream ss(line);
        std::string yearCell;
        std::string valueCell;
        std::getline(ss, yearCell, ',');
        std::getline(ss, valueCell, ',');

        int year = 0;
        double value = 0.0;
        if (!parseInt(yearCell, year)) {
            if (lineNumber == 1) continue;  // header
            throw std::invalid_argument("Malformed year on line " + std::to_string(lineNumber) + " of " + path);
        }
        if (!parseDouble(valueCell, value)) {
            throw std::invalid_argument("Malformed return on line " + std::to_string(lineNumber) + " of " + path);
        }
        if (values.empty()) {
            firstYear = year;
        } else if (year != previousYear + 1) {
            throw std::invalid_argument("Historical returns CSV years must be contiguous (line " +
                                        std::to_string(lineNumber) + ")");
        }
        previousYear = year;
        values.push_back(value);
    }

    if (values.empty()) {
        throw std::invalid_argument("Historical returns CSV appears empty: " + path);
    }
    return HistoricalSeries(firstYear, previousYear, std::move(values));
}

std::vector<double> HistoricalSeries::playbackValues(double clampPct) const {
    std::vector<double> out;
    out.reserve(returnsPct_.size());
    for (double value : returnsPct_) {
        out.push_back(clampReturn(value, clampPct));
    }
    return out;
}

std::vector<double> HistoricalSeries::bootstrapPool(double clampPct, bool includeDampedCopy) const {
    std::vector<double> pool = playbackValues(clampPct);
    if (includeDampedCopy) {
        const std::size_t n = pool.size();
        pool.reserve(n * 2);
        for (std::size_t i = 0; i < n; ++i) {
            pool.push_back(pool[i] / 2.0);
        }
    }
    return pool;
}

}  // namespace retiresim
