// src/data/conversion_utils.cpp

#include "finpipe/data/conversion_utils.hpp"
#include <arrow/type_traits.h>
#include "finpipe/core/time_utils.hpp"

namespace finpipe {

namespace {

constexpr const char* kComponent = "DataConversionUtils";

template <typename T>
Result<T> arrow_error(const arrow::Status& status, const std::string& context) {
    return make_error<T>(ErrorCode::CONVERSION_ERROR, context + ": " + status.ToString(),
                         kComponent);
}

}  // namespace

std::shared_ptr<arrow::Schema> DataConversionUtils::price_schema() {
    return arrow::schema({
        arrow::field("time", arrow::timestamp(arrow::TimeUnit::SECOND, "UTC")),
        arrow::field("symbol", arrow::utf8()),
        arrow::field("open", arrow::float64()),
        arrow::field("high", arrow::float64()),
        arrow::field("low", arrow::float64()),
        arrow::field("close", arrow::float64()),
        arrow::field("volume", arrow::float64()),
        arrow::field("adjusted_close", arrow::float64()),
    });
}

Result<std::shared_ptr<arrow::Table>> DataConversionUtils::price_bars_to_table(
    const std::vector<PriceBar>& bars) {
    using TableResult = std::shared_ptr<arrow::Table>;

    arrow::TimestampBuilder time_builder(arrow::timestamp(arrow::TimeUnit::SECOND, "UTC"),
                                         arrow::default_memory_pool());
    arrow::StringBuilder symbol_builder;
    arrow::DoubleBuilder open_builder, high_builder, low_builder, close_builder,
        volume_builder, adjusted_builder;

    for (const auto& bar : bars) {
        arrow::Status status = time_builder.Append(core::to_unix_seconds(bar.date));
        if (status.ok())
            status = symbol_builder.Append(bar.symbol);
        if (status.ok())
            status = open_builder.Append(bar.open);
        if (status.ok())
            status = high_builder.Append(bar.high);
        if (status.ok())
            status = low_builder.Append(bar.low);
        if (status.ok())
            status = close_builder.Append(bar.close);
        if (status.ok())
            status = volume_builder.Append(bar.volume);
        if (status.ok())
            status = adjusted_builder.Append(bar.adjusted_close);
        if (!status.ok()) {
            return arrow_error<TableResult>(status, "Failed to append bar for " + bar.symbol);
        }
    }

    std::vector<std::shared_ptr<arrow::Array>> arrays(8);
    arrow::ArrayBuilder* builders[] = {&time_builder,  &symbol_builder, &open_builder,
                                       &high_builder,  &low_builder,    &close_builder,
                                       &volume_builder, &adjusted_builder};
    for (size_t i = 0; i < arrays.size(); ++i) {
        arrow::Status status = builders[i]->Finish(&arrays[i]);
        if (!status.ok()) {
            return arrow_error<TableResult>(status, "Failed to finish column " +
                                                        price_schema()->field(i)->name());
        }
    }

    return Result<TableResult>(arrow::Table::Make(price_schema(), arrays));
}

Result<std::vector<PriceBar>> DataConversionUtils::arrow_table_to_price_bars(
    const std::shared_ptr<arrow::Table>& table, const std::string& source) {
    using BarsResult = std::vector<PriceBar>;

    if (!table) {
        return make_error<BarsResult>(ErrorCode::INVALID_ARGUMENT, "Table pointer is null",
                                      kComponent);
    }

    const std::vector<std::string> required_columns = {"time", "symbol", "open", "high",
                                                       "low",  "close",  "volume"};
    for (const auto& col : required_columns) {
        if (table->GetColumnByName(col) == nullptr) {
            return make_error<BarsResult>(ErrorCode::INVALID_DATA,
                                          "Missing required column: " + col, kComponent);
        }
    }

    std::vector<PriceBar> bars;
    if (table->num_rows() == 0) {
        return Result<BarsResult>(std::move(bars));
    }

    try {
        auto combined = table->CombineChunks(arrow::default_memory_pool());
        if (!combined.ok()) {
            return arrow_error<BarsResult>(combined.status(), "Failed to combine chunks");
        }
        std::shared_ptr<arrow::Table> flat = *combined;

        auto time_array = flat->GetColumnByName("time")->chunk(0);
        auto symbol_array = flat->GetColumnByName("symbol")->chunk(0);
        auto open_array = flat->GetColumnByName("open")->chunk(0);
        auto high_array = flat->GetColumnByName("high")->chunk(0);
        auto low_array = flat->GetColumnByName("low")->chunk(0);
        auto close_array = flat->GetColumnByName("close")->chunk(0);
        auto volume_array = flat->GetColumnByName("volume")->chunk(0);
        auto adjusted_column = flat->GetColumnByName("adjusted_close");
        std::shared_ptr<arrow::Array> adjusted_array =
            adjusted_column ? adjusted_column->chunk(0) : nullptr;

        bars.reserve(flat->num_rows());
        for (int64_t i = 0; i < flat->num_rows(); ++i) {
            auto ts_result = extract_timestamp(time_array, i);
            if (ts_result.is_error()) {
                return forward_error<BarsResult>(ts_result, kComponent);
            }
            auto symbol_result = extract_string(symbol_array, i);
            if (symbol_result.is_error()) {
                return forward_error<BarsResult>(symbol_result, kComponent);
            }

            auto open_result = extract_double(open_array, i);
            auto high_result = extract_double(high_array, i);
            auto low_result = extract_double(low_array, i);
            auto close_result = extract_double(close_array, i);
            auto volume_result = extract_double(volume_array, i);
            if (open_result.is_error() || high_result.is_error() || low_result.is_error() ||
                close_result.is_error() || volume_result.is_error()) {
                return make_error<BarsResult>(
                    ErrorCode::CONVERSION_ERROR,
                    "Error extracting OHLCV values at row " + std::to_string(i), kComponent);
            }

            PriceBar bar(symbol_result.value(), core::floor_to_day(ts_result.value()),
                         open_result.value(), high_result.value(), low_result.value(),
                         close_result.value(), volume_result.value(), source);
            if (adjusted_array && !adjusted_array->IsNull(i)) {
                auto adjusted_result = extract_double(adjusted_array, i);
                if (adjusted_result.is_error()) {
                    return forward_error<BarsResult>(adjusted_result, kComponent);
                }
                bar.adjusted_close = adjusted_result.value();
            }
            bars.push_back(std::move(bar));
        }
    } catch (const std::exception& e) {
        return make_error<BarsResult>(ErrorCode::CONVERSION_ERROR,
                                      std::string("Error converting table to bars: ") + e.what(),
                                      kComponent);
    }

    return Result<BarsResult>(std::move(bars));
}

Result<Timestamp> DataConversionUtils::extract_timestamp(
    const std::shared_ptr<arrow::Array>& array, int64_t index) {
    if (!array || index < 0 || index >= array->length()) {
        return make_error<Timestamp>(ErrorCode::INVALID_ARGUMENT, "Invalid array or index",
                                     kComponent);
    }
    if (array->IsNull(index)) {
        return make_error<Timestamp>(ErrorCode::INVALID_DATA,
                                     "Null timestamp value at index " + std::to_string(index),
                                     kComponent);
    }

    // CSV sources arrive as text dates
    if (array->type_id() == arrow::Type::STRING) {
        auto text = std::static_pointer_cast<arrow::StringArray>(array)->GetString(index);
        auto parsed = core::parse_date(text);
        if (!parsed) {
            parsed = core::parse_timestamp(text);
        }
        if (!parsed) {
            return make_error<Timestamp>(ErrorCode::CONVERSION_ERROR,
                                         "Unparseable date '" + text + "'", kComponent);
        }
        return Result<Timestamp>(*parsed);
    }

    if (array->type_id() != arrow::Type::TIMESTAMP) {
        return make_error<Timestamp>(ErrorCode::CONVERSION_ERROR,
                                     "Expected timestamp column, got " + array->type()->ToString(),
                                     kComponent);
    }

    auto ts_array = std::static_pointer_cast<arrow::TimestampArray>(array);
    const auto& ts_type = static_cast<const arrow::TimestampType&>(*ts_array->type());
    int64_t value = ts_array->Value(index);
    switch (ts_type.unit()) {
        case arrow::TimeUnit::MILLI:
            value /= 1000;
            break;
        case arrow::TimeUnit::MICRO:
            value /= 1000000;
            break;
        case arrow::TimeUnit::NANO:
            value /= 1000000000;
            break;
        default:
            break;
    }
    return Result<Timestamp>(core::from_unix_seconds(value));
}

Result<double> DataConversionUtils::extract_double(const std::shared_ptr<arrow::Array>& array,
                                                   int64_t index) {
    if (!array || index < 0 || index >= array->length()) {
        return make_error<double>(ErrorCode::INVALID_ARGUMENT, "Invalid array or index",
                                  kComponent);
    }
    if (array->IsNull(index)) {
        return make_error<double>(ErrorCode::INVALID_DATA,
                                  "Null double value at index " + std::to_string(index),
                                  kComponent);
    }

    switch (array->type_id()) {
        case arrow::Type::DOUBLE:
            return Result<double>(
                std::static_pointer_cast<arrow::DoubleArray>(array)->Value(index));
        case arrow::Type::INT64:
            return Result<double>(static_cast<double>(
                std::static_pointer_cast<arrow::Int64Array>(array)->Value(index)));
        default:
            return make_error<double>(ErrorCode::CONVERSION_ERROR,
                                      "Expected numeric column, got " + array->type()->ToString(),
                                      kComponent);
    }
}

Result<std::string> DataConversionUtils::extract_string(
    const std::shared_ptr<arrow::Array>& array, int64_t index) {
    if (!array || index < 0 || index >= array->length()) {
        return make_error<std::string>(ErrorCode::INVALID_ARGUMENT, "Invalid array or index",
                                       kComponent);
    }
    if (array->type_id() != arrow::Type::STRING) {
        return make_error<std::string>(ErrorCode::CONVERSION_ERROR,
                                       "Expected string column, got " + array->type()->ToString(),
                                       kComponent);
    }
    if (array->IsNull(index)) {
        return make_error<std::string>(ErrorCode::INVALID_DATA,
                                       "Null string value at index " + std::to_string(index),
                                       kComponent);
    }
    return Result<std::string>(
        std::static_pointer_cast<arrow::StringArray>(array)->GetString(index));
}

}  // namespace finpipe
