#include "backtest/DataHistory.h"
#include "common/TimeUtils.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <sstream>

using namespace semilev;
using semilev::backtest::DataHistory;
using semilev::backtest::DataOptions;

namespace {
bool near(double a, double b, double eps = 1e-9) {
    return std::fabs(a - b) < eps;
}

const char* kWideCsv =
    "timestamp,vix,SMH_open,SMH_high,SMH_low,SMH_close,SOXX_close,QQQ_ret\n"
    "2024-01-03 09:35,14.0,102,102,102,102,204,0.0\n"
    "2024-01-02 09:35,13.0,100,101,99.5,100.5,200,0.001\n"
    "2024-01-02 09:40,13.1,100.5,101,100,101,201,0.002\n"
    "2024-01-02 09:40,99.0,1,1,1,1,1,0.0\n"
    "2024-01-02 09:45,nan,101,101,99,99.8,199,0.001\n"
    "2024-01-02 09:50,abc,101,101,99,99.8,199,0.001\n"
    "not-a-time,13.0,100,101,99.5,100.5,200,0.001\n"
    "\n";
}

int main() {
    // ===== Wide CSV with derived returns and persistence =====
    {
        std::istringstream in(kWideCsv);
        const auto bars = DataHistory::parseCSV(in);
        assert(bars.size() == 4);

        for (size_t i = 1; i < bars.size(); ++i) {
            assert(bars[i - 1].timestamp < bars[i].timestamp);
        }

        const MarketBar& first = bars[0];
        assert(first.day == 20240102);
        assert(near(first.vix, 13.0));
        assert(near(first.getQuote("SMH")->low, 99.5));
        assert(near(first.getReturn("SMH"), 0.005));
        assert(near(first.getReturn("SOXX"), 0.0));
        assert(near(first.getReturn("QQQ"), 0.001));
        assert(first.getQuote("QQQ") == nullptr);
        assert(near(first.getQuote("SOXX")->high, 200.0));
        assert(first.persistence.long_bars == 5);
        assert(first.persistence.short_bars == 0);

        // First of two duplicate timestamps is kept
        const MarketBar& second = bars[1];
        assert(near(second.vix, 13.1));
        assert(near(second.getReturn("SMH"), 0.01));
        assert(near(second.getReturn("SOXX"), 0.005));
        assert(second.persistence.long_bars == 10);

        const MarketBar& third = bars[2];
        assert(std::isnan(third.vix));
        assert(near(third.getReturn("SMH"), -0.002));
        assert(third.persistence.long_bars == 0);
        assert(third.persistence.short_bars == 5);

        // New day re-bases returns and streaks
        const MarketBar& fourth = bars[3];
        assert(fourth.day == 20240103);
        assert(near(fourth.getReturn("SMH"), 0.0));
        assert(fourth.persistence.long_bars == 0);
        assert(fourth.persistence.short_bars == 0);
    }

    // ===== Explicit returns and persistence are kept =====
    {
        std::istringstream in(
            "date,vix_close,long_persistence_min,short_persistence_min,SMH_close,SMH_ret,SOXX_close,SOXX_ret\n"
            "2024-02-01 10:00,12.5,45,0,210,0.0031,220,0.0022\n");
        DataOptions options;
        options.bar_minutes = 1;
        const auto bars = DataHistory::parseCSV(in, options);
        assert(bars.size() == 1);
        assert(near(bars[0].getReturn("SMH"), 0.0031));
        assert(near(bars[0].getReturn("SOXX"), 0.0022));
        assert(bars[0].persistence.long_bars == 45);
        assert(near(bars[0].getQuote("SMH")->open, 210.0));
    }

    // ===== Out-of-range persistence counts saturate =====
    {
        std::istringstream in(
            "date,vix_close,long_persistence_min,short_persistence_min,SMH_close,SMH_ret,SOXX_close,SOXX_ret\n"
            "2024-02-01 10:00,12.5,1e12,-3,210,0.0031,220,0.0022\n");
        DataOptions options;
        options.bar_minutes = 1;
        const auto bars = DataHistory::parseCSV(in, options);
        assert(bars.size() == 1);
        assert(bars[0].persistence.long_bars == std::numeric_limits<int>::max());
        assert(bars[0].persistence.short_bars == 0);
    }

    // ===== Date filter =====
    {
        std::istringstream in(kWideCsv);
        DataOptions options;
        options.start_date = "2024-01-03";
        const auto bars = DataHistory::parseCSV(in, options);
        assert(bars.size() == 1);
        assert(bars[0].day == 20240103);

        std::istringstream in_all(kWideCsv);
        const auto all = DataHistory::parseCSV(in_all);
        assert(DataHistory::filterByDate(all, "", "20240102").size() == 3);
        assert(DataHistory::filterByDate(all, "", "").size() == 4);
    }

    // ===== Unusable inputs =====
    {
        std::istringstream no_ts("vix,SMH_close\n13,100\n");
        assert(DataHistory::parseCSV(no_ts).empty());

        assert(DataHistory::loadCSV("definitely/not/here.csv").empty());
    }

    std::cout << "[TEST] DataHistory PASSED\n";
    return 0;
}
