// src/pipeline/ingestion_lock.cpp

#include "finpipe/pipeline/ingestion_lock.hpp"
#include <algorithm>

namespace finpipe {

std::shared_ptr<std::mutex> IngestionLock::mutex_for(const std::string& symbol) {
    std::lock_guard<std::mutex> lock(table_mutex_);
    auto& entry = mutexes_[symbol];
    if (!entry) {
        entry = std::make_shared<std::mutex>();
    }
    return entry;
}

IngestionLock::Guard IngestionLock::acquire(std::vector<std::string> symbols) {
    std::sort(symbols.begin(), symbols.end());
    symbols.erase(std::unique(symbols.begin(), symbols.end()), symbols.end());

    Guard guard;
    guard.locks_.reserve(symbols.size());
    for (const auto& symbol : symbols) {
        // The table keeps every mutex alive for the lifetime of the lock object
        guard.locks_.emplace_back(*mutex_for(symbol));
    }
    guard.symbols_ = std::move(symbols);
    return guard;
}

size_t IngestionLock::tracked_symbols() const {
    std::lock_guard<std::mutex> lock(table_mutex_);
    return mutexes_.size();
}

}  // namespace finpipe
