#include "store_locator/store_catalog.hpp"

#include <fstream>
#include <string_view>

#include <fmt/format.h>

#include "store_locator/errors.hpp"
#include "store_locator/logging.hpp"

namespace store_locator {

namespace {

enum class CsvColumn : std::size_t {
    Name = 0,
    Location,
    Address,
    City,
    State,
    Zip,
    Latitude,
    Longitude,
    County
};

const std::string& column(const std::vector<std::string>& fields, CsvColumn index) {
    return fields[static_cast<std::size_t>(index)];
}

double parse_coordinate(const std::string& text, const char* field_name, const std::string& location) {
    std::size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &consumed);
    } catch (const std::exception&) {
        throw StoreCatalogError(fmt::format("{}: {} '{}' is not a number", location, field_name, text));
    }
    if (consumed != text.size()) {
        throw StoreCatalogError(fmt::format("{}: {} '{}' is not a number", location, field_name, text));
    }
    return value;
}

StoreRecord parse_store(const std::vector<std::string>& fields, const std::string& location) {
    if (fields.size() != k_store_csv_column_count) {
        throw StoreCatalogError(fmt::format("{}: expected {} columns, got {}", location, k_store_csv_column_count, fields.size()));
    }

    StoreRecord store{};
    store.name = column(fields, CsvColumn::Name);
    store.location = column(fields, CsvColumn::Location);
    store.address = column(fields, CsvColumn::Address);
    store.city = column(fields, CsvColumn::City);
    store.state = column(fields, CsvColumn::State);
    store.zip_code = column(fields, CsvColumn::Zip);
    store.latitude = parse_coordinate(column(fields, CsvColumn::Latitude), "latitude", location);
    store.longitude = parse_coordinate(column(fields, CsvColumn::Longitude), "longitude", location);
    store.county = column(fields, CsvColumn::County);

    try {
        static_cast<void>(make_geo_point(store.latitude, store.longitude));
    } catch (const InvalidGeometryError& exc) {
        throw StoreCatalogError(fmt::format("{}: {}", location, exc.what()));
    }
    return store;
}

void strip_carriage_return(std::string& line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
}

bool has_open_quote(std::string_view record) {
    std::size_t quote_count = 0;
    for (const char character : record) {
        if (character == '"') {
            ++quote_count;
        }
    }
    return quote_count % 2 != 0;
}

}  // namespace

std::vector<std::string> split_csv_line(std::string_view line) {
    std::vector<std::string> fields;
    std::string current;
    bool in_quotes = false;

    for (std::size_t index = 0; index < line.size(); ++index) {
        const char character = line[index];
        if (in_quotes) {
            if (character != '"') {
                current.push_back(character);
            } else if (index + 1 < line.size() && line[index + 1] == '"') {
                current.push_back('"');
                ++index;
            } else {
                in_quotes = false;
            }
        } else if (character == '"') {
            in_quotes = true;
        } else if (character == ',') {
            fields.push_back(std::move(current));
            current.clear();
        } else {
            current.push_back(character);
        }
    }

    if (in_quotes) {
        throw StoreCatalogError("Unterminated quoted field");
    }
    fields.push_back(std::move(current));
    return fields;
}

std::vector<StoreRecord> load_stores(const std::filesystem::path& csv_path, bool has_header_row) {
    auto logger = get_logger();

    std::ifstream file(csv_path);
    if (!file.is_open()) {
        throw StoreCatalogError("Failed to open store catalogue " + csv_path.string());
    }

    std::vector<StoreRecord> stores;
    std::string line;
    std::size_t line_num = 0;
    std::size_t record_num = 0;
    while (std::getline(file, line)) {
        ++line_num;
        strip_carriage_return(line);
        const std::size_t record_line_num = line_num;
        std::string record = line;
        // A quoted field may span several physical lines.
        while (has_open_quote(record) && std::getline(file, line)) {
            ++line_num;
            strip_carriage_return(line);
            record.push_back('\n');
            record += line;
        }

        ++record_num;
        if (record_num == 1 && has_header_row) {
            continue;
        }
        if (record.empty()) {
            logger->debug("Skipping empty line {} of {}", record_line_num, csv_path.string());
            continue;
        }

        const std::string location = fmt::format("{}:{}", csv_path.string(), record_line_num);
        std::vector<std::string> fields;
        try {
            fields = split_csv_line(record);
        } catch (const StoreCatalogError& exc) {
            throw StoreCatalogError(fmt::format("{}: {}", location, exc.what()));
        }
        stores.push_back(parse_store(fields, location));
    }

    if (file.bad()) {
        throw StoreCatalogError("Failed while reading store catalogue " + csv_path.string());
    }

    logger->info("Loaded {} stores from {}", stores.size(), csv_path.string());
    return stores;
}

}  // namespace store_locator
