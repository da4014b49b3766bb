// === Store Catalog ===========================================================
//
// Loads the static list of store locations from CSV. Expected column order:
// name, location, address, city, state, zip, latitude, longitude, county.

#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "store_locator/store_record.hpp"

namespace store_locator {

inline constexpr std::size_t k_store_csv_column_count{9};

/**
 * @brief Read every store from @p csv_path.
 *
 * Quoted fields may contain commas, doubled quotes and line breaks. Blank
 * lines are ignored. Error locations name the line on which a row starts.
 *
 * @param csv_path Catalogue file.
 * @param has_header_row Skip the first line when true.
 * @throws StoreCatalogError when the file cannot be read or a row is malformed.
 */
[[nodiscard]] std::vector<StoreRecord> load_stores(const std::filesystem::path& csv_path, bool has_header_row = true);

/** @brief Split one CSV line into fields; throws StoreCatalogError on an unterminated quote. */
[[nodiscard]] std::vector<std::string> split_csv_line(std::string_view line);

}  // namespace store_locator
