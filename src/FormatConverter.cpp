#include "FormatConverter.hpp"
#include "ColumnDecoders.hpp"
#include <sstream>
#include <stdexcept>

namespace pqrow {

namespace {

template <typename T>
ColumnDecoder<json> jsonColumn(ValueParser<T> parser, bool nullable) {
    ValueParser<json> toJson = [parser = std::move(parser)](std::string_view text) {
        return parser(text).map([](const T& value) { return json(value); });
    };
    if (nullable) {
        return [toJson](const Cell& cell) {
            if (!cell) return DecodeResult<json>::success(json(nullptr));
            return toJson(*cell);
        };
    }
    return notNull(std::move(toJson));
}

ValueParser<json> jsonValue() {
    return [](std::string_view text) {
        json parsed = json::parse(text.begin(), text.end(), nullptr, false);
        if (parsed.is_discarded()) {
            return DecodeResult<json>::failure("invalid json '" + std::string(text) + "'");
        }
        return DecodeResult<json>::success(std::move(parsed));
    };
}

}  // namespace

ColumnSpec ColumnSpec::parse(const std::string& spec) {
    ColumnSpec column;

    auto colon = spec.rfind(':');
    column.name = spec.substr(0, colon);
    if (colon != std::string::npos) {
        column.type = spec.substr(colon + 1);
    }

    if (!column.type.empty() && column.type.back() == '?') {
        column.nullable = true;
        column.type.pop_back();
    }

    if (column.name.empty()) {
        throw std::invalid_argument("Column spec without a name: '" + spec + "'");
    }

    static const std::vector<std::string> kTypes = {
        "text", "bool", "int2", "int4", "int8", "float4", "float8", "json"};
    bool known = false;
    for (const auto& type : kTypes) {
        if (type == column.type) {
            known = true;
            break;
        }
    }
    if (!known) {
        throw std::invalid_argument("Unknown column type '" + column.type + "' in '" + spec + "'");
    }

    return column;
}

std::vector<ColumnSpec> ColumnSpec::parseAll(const std::vector<std::string>& specs) {
    std::vector<ColumnSpec> columns;
    columns.reserve(specs.size());
    for (const auto& spec : specs) {
        ColumnSpec column = parse(spec);
        for (const auto& existing : columns) {
            if (existing.name == column.name) {
                throw std::invalid_argument("Duplicate column name '" + column.name + "'");
            }
        }
        columns.push_back(std::move(column));
    }
    return columns;
}

ColumnDecoder<json> FormatConverter::columnDecoder(const ColumnSpec& spec) {
    if (spec.type == "bool") return jsonColumn(boolValue(), spec.nullable);
    if (spec.type == "int2") return jsonColumn(int16Value(), spec.nullable);
    if (spec.type == "int4") return jsonColumn(int32Value(), spec.nullable);
    if (spec.type == "int8") return jsonColumn(int64Value(), spec.nullable);
    if (spec.type == "float4") return jsonColumn(float4Value(), spec.nullable);
    if (spec.type == "float8") return jsonColumn(float8Value(), spec.nullable);
    if (spec.type == "json") return jsonColumn(jsonValue(), spec.nullable);
    return jsonColumn(textValue(), spec.nullable);
}

RowDecoder<json> FormatConverter::makeJsonRowDecoder(const std::vector<ColumnSpec>& specs) {
    std::vector<std::pair<std::string, ColumnDecoder<json>>> columns;
    columns.reserve(specs.size());
    for (const auto& spec : specs) {
        columns.emplace_back(spec.name, columnDecoder(spec));
    }

    return makeRowDecoder<json>(columns.size(), [columns](const Row& row) {
        json obj = json::object();
        for (size_t i = 0; i < columns.size(); ++i) {
            auto value = columns[i].second(row[i]);
            if (!value.ok()) {
                return DecodeResult<json>::failure("column " + std::to_string(i) + " (" +
                                                   columns[i].first + "): " + value.error());
            }
            obj[columns[i].first] = std::move(value).value();
        }
        return DecodeResult<json>::success(std::move(obj));
    });
}

std::string FormatConverter::toJSON(const std::vector<json>& rows, const JSONOptions& options) {
    json arr = json::array();

    for (const auto& row : rows) {
        if (options.includeNull || !row.is_object()) {
            arr.push_back(row);
            continue;
        }
        json obj = json::object();
        for (auto it = row.begin(); it != row.end(); ++it) {
            if (!it.value().is_null()) {
                obj[it.key()] = it.value();
            }
        }
        arr.push_back(std::move(obj));
    }

    // Text columns from a SQL_ASCII database may carry bytes that are not UTF-8
    constexpr auto onInvalidUtf8 = json::error_handler_t::replace;
    return options.pretty ? arr.dump(options.indent, ' ', false, onInvalidUtf8)
                          : arr.dump(-1, ' ', false, onInvalidUtf8);
}

std::string FormatConverter::toCSV(const std::vector<ColumnSpec>& specs,
                                   const std::vector<json>& rows,
                                   const CSVOptions& options) {
    std::ostringstream out;

    // Header
    if (options.includeHeader) {
        for (size_t i = 0; i < specs.size(); ++i) {
            if (i > 0) out << options.delimiter;
            out << escapeCSVField(specs[i].name, options);
        }
        out << options.lineEnding;
    }

    // Rows, NULL is an empty field
    for (const auto& row : rows) {
        for (size_t i = 0; i < specs.size(); ++i) {
            if (i > 0) out << options.delimiter;

            auto it = row.find(specs[i].name);
            if (it == row.end() || it->is_null()) continue;
            out << escapeCSVField(it->is_string() ? it->get<std::string>() : it->dump(), options);
        }
        out << options.lineEnding;
    }

    return out.str();
}

std::string FormatConverter::escapeCSVField(const std::string& field,
                                            const CSVOptions& options) {
    bool needs_quoting = options.quoteAll;

    if (!needs_quoting) {
        for (char c : field) {
            if (c == options.delimiter || c == options.quote ||
                c == '\n' || c == '\r') {
                needs_quoting = true;
                break;
            }
        }
    }

    if (!needs_quoting) {
        return field;
    }

    std::string result;
    result.reserve(field.size() + 2);
    result += options.quote;

    for (char c : field) {
        if (c == options.quote) {
            result += options.quote;  // Double the quote
        }
        result += c;
    }

    result += options.quote;
    return result;
}

}  // namespace pqrow
