#pragma once

#include "RowDecoder.hpp"

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace pqrow {

using json = nlohmann::json;

// Declared shape of one result column: name:type, with a trailing '?' for nullable
struct ColumnSpec {
    std::string name;
    std::string type = "text";  // text, bool, int2, int4, int8, float4, float8, json
    bool nullable = false;

    // Throws std::invalid_argument on an unknown type or empty name
    static ColumnSpec parse(const std::string& spec);
    static std::vector<ColumnSpec> parseAll(const std::vector<std::string>& specs);
};

// Options structs declared outside the class to avoid default argument issues
struct CSVOptions {
    char delimiter = ',';
    char quote = '"';
    std::string lineEnding = "\n";
    bool includeHeader = true;
    bool quoteAll = false;
};

struct JSONOptions {
    bool pretty = true;
    int indent = 2;
    bool includeNull = true;
};

// Decodes rows into JSON objects and renders them
class FormatConverter {
public:
    // One JSON object per row, keyed by column name; width = specs.size()
    static RowDecoder<json> makeJsonRowDecoder(const std::vector<ColumnSpec>& specs);

    // JSON value decoder for a single column
    static ColumnDecoder<json> columnDecoder(const ColumnSpec& spec);

    static std::string toJSON(const std::vector<json>& rows,
                              const JSONOptions& options = JSONOptions{});

    static std::string toCSV(const std::vector<ColumnSpec>& specs,
                             const std::vector<json>& rows,
                             const CSVOptions& options = CSVOptions{});

    static std::string escapeCSVField(const std::string& field,
                                      const CSVOptions& options = CSVOptions{});
};

}  // namespace pqrow
