#pragma once

#include <istream>
#include <string>
#include <vector>
#include "common/Types.h"

namespace semilev {
namespace backtest {

struct DataOptions {
    // Symbol whose intraday return sign drives derived persistence
    std::string persistence_symbol = "SMH";
    // Persistence unit: each consecutive bar counts this many minutes
    int bar_minutes = 5;
    // Optional inclusive range, "YYYY-MM-DD"
    std::string start_date;
    std::string end_date;
};

class DataHistory {
public:
    // Load bars from a wide CSV file with a header row:
    //   timestamp,vix[,long_persist,short_persist],<SYM>_open,<SYM>_high,<SYM>_low,<SYM>_close[,<SYM>_ret]
    // Returns an empty vector (and logs) when the file cannot be opened.
    static std::vector<MarketBar> loadCSV(const std::string& file_path, const DataOptions& options = DataOptions());

    static std::vector<MarketBar> parseCSV(std::istream& in, const DataOptions& options = DataOptions());

    // Fill in <SYM> returns missing from the file as (close / first open of the day) - 1,
    // and per-day persistence streaks of the persistence symbol's return sign.
    static void deriveIntradayFeatures(std::vector<MarketBar>& bars,
                                       const std::vector<std::string>& symbols_missing_returns,
                                       bool derive_persistence,
                                       const DataOptions& options);

    // Filter bars by trading day, inclusive. Empty bounds are open.
    static std::vector<MarketBar> filterByDate(const std::vector<MarketBar>& bars,
                                               const std::string& start_date,
                                               const std::string& end_date);
};

} // namespace backtest
} // namespace semilev
