// include/finpipe/ingest/macro_catalog.hpp
#pragma once

#include <string>
#include <vector>
#include "finpipe/core/types.hpp"

namespace finpipe {

struct MacroSeriesInfo {
    std::string code;
    std::string description;
    MacroFrequency frequency;
};

/**
 * @brief The fixed set of macro series the pipeline ingests
 */
inline const std::vector<MacroSeriesInfo>& macro_catalog() {
    static const std::vector<MacroSeriesInfo> catalog = {
        {"DFF", "Federal Funds Effective Rate", MacroFrequency::DAILY},
        {"UNRATE", "Unemployment Rate", MacroFrequency::MONTHLY},
        {"GDP", "Gross Domestic Product", MacroFrequency::QUARTERLY},
        {"CPIAUCSL", "Consumer Price Index", MacroFrequency::MONTHLY},
        {"DGS10", "10-Year Treasury Rate", MacroFrequency::DAILY},
        {"DGS2", "2-Year Treasury Rate", MacroFrequency::DAILY},
        {"SP500", "S&P 500 Index", MacroFrequency::DAILY},
        {"VIXCLS", "VIX Volatility Index", MacroFrequency::DAILY},
        {"PSAVERT", "Personal Savings Rate", MacroFrequency::MONTHLY},
        {"INDPRO", "Industrial Production Index", MacroFrequency::MONTHLY},
    };
    return catalog;
}

inline const MacroSeriesInfo* find_macro_series(const std::string& code) {
    for (const auto& info : macro_catalog()) {
        if (info.code == code) {
            return &info;
        }
    }
    return nullptr;
}

}  // namespace finpipe
