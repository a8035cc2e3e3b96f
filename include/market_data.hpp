#pragma once

#include <string>
#include <vector>

namespace retiresim {

// Annual equity total-return percentages indexed by calendar year.
class HistoricalSeries {
public:
    // Throws std::invalid_argument when values.size() does not match the
    // declared year range.
    HistoricalSeries(int startYear, int endYear, std::vector<double> returnsPct);

    // S&P 500 total returns, 1928 through 2024.
    [[nodiscard]] static HistoricalSeries sp500();

    // Reads "year,returnPct" rows (header optional). Years must be contiguous.
    [[nodiscard]] static HistoricalSeries loadFromCsv(const std::string& path);

    [[nodiscard]] int startYear() const noexcept { return startYear_; }
    [[nodiscard]] int endYear() const noexcept { return endYear_; }
    [[nodiscard]] std::size_t size() const noexcept { return returnsPct_.size(); }
    [[nodiscard]] const std::vector<double>& returnsPct() const noexcept { return returnsPct_; }

    // Chronological returns clamped to +/- clampPct (clampPct <= 0 disables).
    [[nodiscard]] std::vector<double> playbackValues(double clampPct) const;

    // Sampling pool for bootstrap draws: the clamped series, optionally followed
    // by a damped copy with every value halved.
    [[nodiscard]] std::vector<double> bootstrapPool(double clampPct, bool includeDampedCopy) const;

private:
    int startYear_;
    int endYear_;
    std::vector<double> returnsPct_;
};

}  // namespace retiresim
