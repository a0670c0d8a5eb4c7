// src/data/symbol_catalog.cpp

#include "finpipe/data/symbol_catalog.hpp"
#include <arrow/api.h>
#include <arrow/csv/api.h>
#include <arrow/io/api.h>
#include <filesystem>
#include <map>
#include "finpipe/core/logger.hpp"

namespace finpipe {

namespace {

constexpr const char* kComponent = "SymbolCatalogLoader";

const std::vector<std::string>& catalog_columns() {
    static const std::vector<std::string> columns = {
        "symbol", "name", "sector", "industry", "exchange", "currency", "country", "asset_class"};
    return columns;
}

std::string cell(const std::shared_ptr<arrow::StringArray>& column, int64_t row) {
    if (!column || column->IsNull(row)) {
        return "";
    }
    return column->GetString(row);
}

}  // namespace

Result<std::vector<SymbolInfo>> SymbolCatalogLoader::load_csv(const std::string& path) {
    using Rows = std::vector<SymbolInfo>;

    if (!std::filesystem::exists(path)) {
        return make_error<Rows>(ErrorCode::FILE_NOT_FOUND, "Catalog file not found: " + path,
                                kComponent);
    }

    auto input = arrow::io::ReadableFile::Open(path);
    if (!input.ok()) {
        return make_error<Rows>(ErrorCode::FILE_IO_ERROR,
                                "Cannot open catalog " + path + ": " + input.status().ToString(),
                                kComponent);
    }

    auto read_options = arrow::csv::ReadOptions::Defaults();
    auto parse_options = arrow::csv::ParseOptions::Defaults();
    auto convert_options = arrow::csv::ConvertOptions::Defaults();
    // Tickers like "1810" or "NAN" must stay text
    for (const auto& column : catalog_columns()) {
        convert_options.column_types[column] = arrow::utf8();
    }
    convert_options.strings_can_be_null = false;

    auto reader = arrow::csv::TableReader::Make(arrow::io::default_io_context(), *input,
                                                read_options, parse_options, convert_options);
    if (!reader.ok()) {
        return make_error<Rows>(ErrorCode::INVALID_DATA,
                                "Cannot read catalog " + path + ": " + reader.status().ToString(),
                                kComponent);
    }
    auto table_result = (*reader)->Read();
    if (!table_result.ok()) {
        return make_error<Rows>(ErrorCode::INVALID_DATA,
                                "Malformed catalog " + path + ": " +
                                    table_result.status().ToString(),
                                kComponent);
    }

    std::shared_ptr<arrow::Table> table = *table_result;
    if (table->GetColumnByName("symbol") == nullptr) {
        return make_error<Rows>(ErrorCode::INVALID_DATA,
                                "Catalog " + path + " has no symbol column", kComponent);
    }

    Rows result;
    if (table->num_rows() == 0) {
        return result;
    }

    auto combined = table->CombineChunks(arrow::default_memory_pool());
    if (!combined.ok()) {
        return make_error<Rows>(ErrorCode::CONVERSION_ERROR,
                                "Failed to combine catalog chunks: " +
                                    combined.status().ToString(),
                                kComponent);
    }
    table = *combined;

    std::map<std::string, std::shared_ptr<arrow::StringArray>> columns;
    for (const auto& name : catalog_columns()) {
        auto column = table->GetColumnByName(name);
        if (column) {
            columns[name] = std::static_pointer_cast<arrow::StringArray>(column->chunk(0));
        }
    }

    std::map<std::string, size_t> position_of;
    size_t skipped = 0;
    for (int64_t row = 0; row < table->num_rows(); ++row) {
        auto ticker = normalize_symbol(cell(columns["symbol"], row));
        if (ticker.is_error()) {
            WARN("Skipping catalog row " << row + 2 << ": " << ticker.error()->what());
            ++skipped;
            continue;
        }

        SymbolInfo info;
        info.symbol = ticker.value();
        info.name = cell(columns["name"], row);
        info.sector = cell(columns["sector"], row);
        info.industry = cell(columns["industry"], row);
        info.exchange = cell(columns["exchange"], row);
        info.currency = cell(columns["currency"], row);
        info.country = cell(columns["country"], row);
        std::string asset_class = cell(columns["asset_class"], row);
        if (!asset_class.empty()) {
            info.asset_class = asset_class;
        }

        auto existing = position_of.find(info.symbol);
        if (existing != position_of.end()) {
            result[existing->second] = std::move(info);
        } else {
            position_of[info.symbol] = result.size();
            result.push_back(std::move(info));
        }
    }

    INFO("Loaded " << result.size() << " catalog symbols from " << path
                   << (skipped ? " (" + std::to_string(skipped) + " rows skipped)" : ""));
    return result;
}

Result<size_t> SymbolCatalogLoader::load_into(TimeSeriesStore& store, const std::string& path) {
    auto symbols = load_csv(path);
    if (symbols.is_error()) {
        return forward_error<size_t>(symbols);
    }
    return store.upsert_symbols(symbols.value());
}

}  // namespace finpipe
