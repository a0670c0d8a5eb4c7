// include/finpipe/pipeline/ingestion_lock.hpp
#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace finpipe {

/**
 * @brief Per-symbol mutex table shared by manual fetches and scheduler ticks
 *
 * Symbols are always locked in sorted order, so two callers with overlapping sets cannot
 * deadlock. Callers with disjoint sets never wait on each other.
 */
class IngestionLock {
public:
    /**
     * @brief Holds the locks of one symbol set until destroyed
     */
    class Guard {
    public:
        Guard() = default;
        Guard(Guard&&) = default;
        Guard& operator=(Guard&&) = default;
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

        const std::vector<std::string>& symbols() const {
            return symbols_;
        }

    private:
        friend class IngestionLock;
        std::vector<std::string> symbols_;
        std::vector<std::unique_lock<std::mutex>> locks_;
    };

    /**
     * @brief Block until every symbol in the set is free, then hold them all
     */
    Guard acquire(std::vector<std::string> symbols);

    size_t tracked_symbols() const;

private:
    std::shared_ptr<std::mutex> mutex_for(const std::string& symbol);

    mutable std::mutex table_mutex_;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> mutexes_;
};

}  // namespace finpipe
