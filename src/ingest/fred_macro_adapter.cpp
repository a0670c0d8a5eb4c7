// src/ingest/fred_macro_adapter.cpp

#include "finpipe/ingest/fred_macro_adapter.hpp"
#include <arrow/api.h>
#include <arrow/csv/api.h>
#include <arrow/io/api.h>
#include <algorithm>
#include <cctype>
#include "finpipe/core/logger.hpp"
#include "finpipe/core/time_utils.hpp"
#include "finpipe/ingest/macro_catalog.hpp"

namespace finpipe {

namespace {

constexpr const char* kComponent = "fred";

std::optional<double> parse_value(const std::string& text) {
    if (text.empty() || text == ".") {
        return std::nullopt;
    }
    try {
        size_t consumed = 0;
        double value = std::stod(text, &consumed);
        if (consumed != text.size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

}  // namespace

Result<std::string> FredMacroAdapter::normalize_key(const std::string& key) const {
    std::string code = key;
    code.erase(std::remove_if(code.begin(), code.end(),
                              [](unsigned char c) { return std::isspace(c); }),
               code.end());
    std::transform(code.begin(), code.end(), code.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (!find_macro_series(code)) {
        return make_error<std::string>(ErrorCode::INVALID_ARGUMENT,
                                       "Unknown macro indicator: " + key, config_.name);
    }
    return code;
}

std::string FredMacroAdapter::build_url(const std::string& key,
                                        const std::string& /*period*/) const {
    return config_.base_url + "/graph/fredgraph.csv?id=" + key;
}

Result<FetchedRecords> FredMacroAdapter::parse(const std::string& key,
                                               const std::string& body) const {
    auto observations = parse_csv(key, body);
    if (observations.is_error()) {
        return forward_error<FetchedRecords>(observations, config_.name);
    }
    FetchedRecords records;
    records.observations = observations.take_value();
    return records;
}

Result<std::vector<MacroObservation>> FredMacroAdapter::parse_csv(const std::string& code,
                                                                  const std::string& body) {
    using Rows = std::vector<MacroObservation>;

    auto input = std::make_shared<arrow::io::BufferReader>(arrow::Buffer::FromString(body));

    auto read_options = arrow::csv::ReadOptions::Defaults();
    // The header names differ between endpoint versions; position is what matters
    read_options.column_names = {"date", "value"};
    read_options.skip_rows = 1;
    auto parse_options = arrow::csv::ParseOptions::Defaults();
    auto convert_options = arrow::csv::ConvertOptions::Defaults();
    convert_options.column_types["date"] = arrow::utf8();
    convert_options.column_types["value"] = arrow::utf8();
    convert_options.strings_can_be_null = false;

    auto reader = arrow::csv::TableReader::Make(arrow::io::default_io_context(), input,
                                                read_options, parse_options, convert_options);
    if (!reader.ok()) {
        return make_error<Rows>(ErrorCode::SOURCE_UNAVAILABLE,
                                "malformed CSV for " + code + ": " + reader.status().ToString(),
                                kComponent);
    }
    auto table_result = (*reader)->Read();
    if (!table_result.ok()) {
        return make_error<Rows>(ErrorCode::SOURCE_UNAVAILABLE,
                                "malformed CSV for " + code + ": " +
                                    table_result.status().ToString(),
                                kComponent);
    }

    const MacroSeriesInfo* info = find_macro_series(code);
    MacroFrequency frequency = info ? info->frequency : MacroFrequency::DAILY;

    Rows observations;
    std::shared_ptr<arrow::Table> table = *table_result;
    auto dates = table->GetColumnByName("date");
    auto values = table->GetColumnByName("value");
    size_t skipped = 0;
    for (int c = 0; c < dates->num_chunks(); ++c) {
        auto date_chunk = std::static_pointer_cast<arrow::StringArray>(dates->chunk(c));
        auto value_chunk = std::static_pointer_cast<arrow::StringArray>(values->chunk(c));
        for (int64_t i = 0; i < date_chunk->length(); ++i) {
            auto date = core::parse_date(date_chunk->GetString(i));
            auto value = parse_value(value_chunk->GetString(i));
            if (!date || !value) {
                ++skipped;
                continue;
            }
            MacroObservation obs;
            obs.indicator = code;
            obs.date = *date;
            obs.value = *value;
            obs.frequency = frequency;
            obs.source = "FRED";
            observations.push_back(std::move(obs));
        }
    }

    if (observations.empty()) {
        return make_error<Rows>(NOT_FOUND, "no observations for " + code, kComponent);
    }
    TRACE("Parsed " << observations.size() << " " << code << " observations, skipped "
                    << skipped);
    return observations;
}

}  // namespace finpipe
