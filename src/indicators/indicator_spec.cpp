// src/indicators/indicator_spec.cpp

#include "finpipe/indicators/indicator_spec.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

namespace finpipe {

namespace {

struct FamilyEntry {
    IndicatorFamily family;
    const char* name;
    std::vector<int> defaults;
};

const std::vector<FamilyEntry>& family_table() {
    static const std::vector<FamilyEntry> table = {
        {IndicatorFamily::SMA, "SMA", {20}},
        {IndicatorFamily::EMA, "EMA", {12}},
        {IndicatorFamily::RSI, "RSI", {14}},
        {IndicatorFamily::MACD, "MACD", {12, 26, 9}},
        {IndicatorFamily::BBANDS, "BB", {20}},
        {IndicatorFamily::STOCH, "STOCH", {14, 3}},
        {IndicatorFamily::ADX, "ADX", {14}},
        {IndicatorFamily::ATR, "ATR", {14}},
        {IndicatorFamily::CCI, "CCI", {20}},
        {IndicatorFamily::OBV, "OBV", {}},
        {IndicatorFamily::WILLR, "WILLR", {14}},
        {IndicatorFamily::MFI, "MFI", {14}},
        {IndicatorFamily::ROC, "ROC", {12}},
    };
    return table;
}

const FamilyEntry* find_family(const std::string& name) {
    for (const auto& entry : family_table()) {
        if (name == entry.name) {
            return &entry;
        }
    }
    if (name == "BBANDS") {
        return find_family("BB");
    }
    return nullptr;
}

const FamilyEntry& entry_for(IndicatorFamily family) {
    for (const auto& entry : family_table()) {
        if (entry.family == family) {
            return entry;
        }
    }
    return family_table().front();
}

std::string to_upper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

std::string trim(const std::string& value) {
    auto begin = value.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = value.find_last_not_of(" \t");
    return value.substr(begin, end - begin + 1);
}

bool parse_positive_int(const std::string& text, int& out) {
    if (text.empty() || text.size() > 6 ||
        !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return false;
    }
    out = std::stoi(text);
    return true;
}

IndicatorSpec make_spec(IndicatorFamily family, std::vector<int> params) {
    IndicatorSpec spec;
    spec.family = family;
    spec.params = std::move(params);
    return spec;
}

}  // namespace

std::string indicator_family_to_string(IndicatorFamily family) {
    return entry_for(family).name;
}

std::string IndicatorSpec::label() const {
    std::ostringstream ss;
    ss << indicator_family_to_string(family);
    if (!params.empty()) {
        ss << "(";
        for (size_t i = 0; i < params.size(); ++i) {
            if (i > 0)
                ss << ",";
            ss << params[i];
        }
        if (family == IndicatorFamily::BBANDS && band_width != 2.0) {
            ss << "," << band_width;
        }
        ss << ")";
    }
    return ss.str();
}

std::vector<std::string> IndicatorSpec::output_names() const {
    auto p = [this](size_t i) { return std::to_string(params.at(i)); };
    switch (family) {
        case IndicatorFamily::SMA:
            return {"SMA_" + p(0)};
        case IndicatorFamily::EMA:
            return {"EMA_" + p(0)};
        case IndicatorFamily::RSI:
            return {"RSI_" + p(0)};
        case IndicatorFamily::MACD:
            return {"MACD_" + p(0) + "_" + p(1), "MACD_SIGNAL_" + p(2), "MACD_HIST"};
        case IndicatorFamily::BBANDS:
            return {"BB_UPPER_" + p(0), "BB_MIDDLE_" + p(0), "BB_LOWER_" + p(0)};
        case IndicatorFamily::STOCH:
            return {"STOCH_K_" + p(0), "STOCH_D_" + p(1)};
        case IndicatorFamily::ADX:
            return {"ADX_" + p(0), "+DI_" + p(0), "-DI_" + p(0)};
        case IndicatorFamily::ATR:
            return {"ATR_" + p(0)};
        case IndicatorFamily::CCI:
            return {"CCI_" + p(0)};
        case IndicatorFamily::OBV:
            return {"OBV"};
        case IndicatorFamily::WILLR:
            return {"WILLR_" + p(0)};
        case IndicatorFamily::MFI:
            return {"MFI_" + p(0)};
        case IndicatorFamily::ROC:
            return {"ROC_" + p(0)};
    }
    return {};
}

size_t IndicatorSpec::min_history() const {
    auto p = [this](size_t i) { return static_cast<size_t>(params.at(i)); };
    switch (family) {
        case IndicatorFamily::SMA:
        case IndicatorFamily::EMA:
        case IndicatorFamily::BBANDS:
        case IndicatorFamily::CCI:
        case IndicatorFamily::WILLR:
            return p(0);
        case IndicatorFamily::RSI:
        case IndicatorFamily::ATR:
        case IndicatorFamily::MFI:
        case IndicatorFamily::ROC:
            return p(0) + 1;
        case IndicatorFamily::MACD:
            return p(1) + p(2);
        case IndicatorFamily::STOCH:
            return p(0) + p(1);
        case IndicatorFamily::ADX:
            return 2 * p(0) + 1;
        case IndicatorFamily::OBV:
            return 2;
    }
    return 0;
}

Result<void> IndicatorSpec::validate() const {
    const auto& entry = entry_for(family);
    if (params.size() != entry.defaults.size()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                std::string(entry.name) + " expects " +
                                    std::to_string(entry.defaults.size()) + " parameter(s)",
                                "IndicatorSpec");
    }
    for (int value : params) {
        if (value < 1) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                    label() + ": periods must be at least 1", "IndicatorSpec");
        }
    }
    if (family == IndicatorFamily::MACD && params[0] >= params[1]) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                label() + ": fast period must be shorter than slow period",
                                "IndicatorSpec");
    }
    if (family == IndicatorFamily::BBANDS && !(band_width > 0.0)) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                label() + ": band width must be positive", "IndicatorSpec");
    }
    return Result<void>();
}

Result<IndicatorSpec> IndicatorSpec::parse(const std::string& text) {
    std::string input = to_upper(trim(text));
    std::string family_name = input;
    std::vector<std::string> args;

    auto open = input.find('(');
    if (open != std::string::npos) {
        if (input.back() != ')') {
            return make_error<IndicatorSpec>(ErrorCode::INVALID_ARGUMENT,
                                             "Malformed indicator: " + text, "IndicatorSpec");
        }
        family_name = trim(input.substr(0, open));
        std::stringstream inner(input.substr(open + 1, input.size() - open - 2));
        std::string token;
        while (std::getline(inner, token, ',')) {
            args.push_back(trim(token));
        }
    }

    const FamilyEntry* entry = find_family(family_name);
    if (!entry) {
        return make_error<IndicatorSpec>(ErrorCode::INVALID_ARGUMENT,
                                         "Unknown indicator: " + text, "IndicatorSpec");
    }

    IndicatorSpec spec = make_spec(entry->family, entry->defaults);
    size_t int_args = args.size();
    if (entry->family == IndicatorFamily::BBANDS && args.size() == 2) {
        try {
            spec.band_width = std::stod(args[1]);
        } catch (const std::exception&) {
            return make_error<IndicatorSpec>(ErrorCode::INVALID_ARGUMENT,
                                             "Invalid band width in " + text, "IndicatorSpec");
        }
        int_args = 1;
    }
    if (int_args > entry->defaults.size()) {
        return make_error<IndicatorSpec>(ErrorCode::INVALID_ARGUMENT,
                                         "Too many parameters: " + text, "IndicatorSpec");
    }
    for (size_t i = 0; i < int_args; ++i) {
        int value = 0;
        if (!parse_positive_int(args[i], value)) {
            return make_error<IndicatorSpec>(ErrorCode::INVALID_ARGUMENT,
                                             "Invalid parameter '" + args[i] + "' in " + text,
                                             "IndicatorSpec");
        }
        spec.params[i] = value;
    }

    auto valid = spec.validate();
    if (valid.is_error()) {
        return forward_error<IndicatorSpec>(valid);
    }
    return spec;
}

Result<IndicatorSpec> IndicatorSpec::from_series_name(const std::string& raw_name) {
    std::string name = to_upper(trim(raw_name));
    if (name == "OBV") {
        return make_spec(IndicatorFamily::OBV, {});
    }
    if (name == "MACD_HIST") {
        return make_spec(IndicatorFamily::MACD, {12, 26, 9});
    }

    std::vector<std::string> parts;
    std::stringstream ss(name);
    std::string part;
    while (std::getline(ss, part, '_')) {
        parts.push_back(part);
    }

    auto unknown = [&raw_name]() {
        return make_error<IndicatorSpec>(ErrorCode::INVALID_ARGUMENT,
                                         "Unknown indicator series: " + raw_name,
                                         "IndicatorSpec");
    };
    if (parts.size() < 2) {
        return unknown();
    }

    int last = 0;
    if (!parse_positive_int(parts.back(), last)) {
        return unknown();
    }

    Result<IndicatorSpec> resolved = unknown();
    const std::string& head = parts[0];
    if (parts.size() == 2) {
        if (head == "+DI" || head == "-DI") {
            resolved = make_spec(IndicatorFamily::ADX, {last});
        } else if (const FamilyEntry* entry = find_family(head)) {
            if (entry->defaults.size() == 1 && entry->family != IndicatorFamily::BBANDS) {
                resolved = make_spec(entry->family, {last});
            }
        }
    } else if (parts.size() == 3) {
        int middle = 0;
        if (head == "MACD" && parts[1] == "SIGNAL") {
            resolved = make_spec(IndicatorFamily::MACD, {12, 26, last});
        } else if (head == "MACD" && parse_positive_int(parts[1], middle)) {
            resolved = make_spec(IndicatorFamily::MACD, {middle, last, 9});
        } else if (head == "BB" &&
                   (parts[1] == "UPPER" || parts[1] == "MIDDLE" || parts[1] == "LOWER")) {
            resolved = make_spec(IndicatorFamily::BBANDS, {last});
        } else if (head == "STOCH" && parts[1] == "K") {
            resolved = make_spec(IndicatorFamily::STOCH, {last, 3});
        } else if (head == "STOCH" && parts[1] == "D") {
            resolved = make_spec(IndicatorFamily::STOCH, {14, last});
        }
    }

    if (resolved.is_ok()) {
        auto valid = resolved.value().validate();
        if (valid.is_error()) {
            return forward_error<IndicatorSpec>(valid);
        }
    }
    return resolved;
}

std::vector<IndicatorSpec> default_indicator_set() {
    return {
        make_spec(IndicatorFamily::RSI, {14}),         make_spec(IndicatorFamily::SMA, {20}),
        make_spec(IndicatorFamily::SMA, {50}),         make_spec(IndicatorFamily::EMA, {12}),
        make_spec(IndicatorFamily::EMA, {26}),         make_spec(IndicatorFamily::MACD, {12, 26, 9}),
        make_spec(IndicatorFamily::BBANDS, {20}),      make_spec(IndicatorFamily::ATR, {14}),
        make_spec(IndicatorFamily::STOCH, {14, 3}),    make_spec(IndicatorFamily::OBV, {}),
        make_spec(IndicatorFamily::ADX, {14}),         make_spec(IndicatorFamily::WILLR, {14}),
        make_spec(IndicatorFamily::CCI, {20}),         make_spec(IndicatorFamily::MFI, {14}),
        make_spec(IndicatorFamily::ROC, {12}),
    };
}

}  // namespace finpipe
