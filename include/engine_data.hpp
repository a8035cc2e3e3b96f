#pragma once

#include "market_data.hpp"
#include "tax_tables.hpp"

#include <utility>

namespace retiresim {

// Read-only configuration shared by every request: jurisdiction tables plus
// the historical return series. Built once at startup.
struct EngineData {
    TaxTables tables;
    HistoricalSeries history;

    EngineData(TaxTables t, HistoricalSeries h) : tables(std::move(t)), history(std::move(h)) {
        tables.validate();
    }

    [[nodiscard]] static EngineData defaults() { return EngineData(TaxTables::us2026(), HistoricalSeries::sp500()); }
};

}  // namespace retiresim
