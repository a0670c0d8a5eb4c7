// src/data/time_series_store.cpp

#include "finpipe/data/time_series_store.hpp"
#include <algorithm>
#include <cctype>

namespace finpipe {

Result<std::string> normalize_symbol(const std::string& symbol) {
    std::string normalized;
    normalized.reserve(symbol.size());
    for (char c : symbol) {
        if (c == ' ' || c == '\t') {
            continue;
        }
        normalized.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }

    if (normalized.empty() || normalized.size() > 20) {
        return make_error<std::string>(ErrorCode::INVALID_ARGUMENT,
                                       "Invalid symbol length: '" + symbol + "'",
                                       "TimeSeriesStore");
    }
    bool valid = std::all_of(normalized.begin(), normalized.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '.' || c == '_' || c == '^' || c == '=' || c == '-';
    });
    if (!valid) {
        return make_error<std::string>(ErrorCode::INVALID_ARGUMENT,
                                       "Invalid characters in symbol: '" + symbol + "'",
                                       "TimeSeriesStore");
    }
    return normalized;
}

}  // namespace finpipe
