// === Result Renderer =========================================================
//
// Presentation of store records. One rendering function per OutputFormat;
// the record types themselves carry no formatting logic.

#pragma once

#include <string>

#include "store_locator/store_record.hpp"
#include "store_locator/types.hpp"

namespace store_locator {

/** @brief "<address>, <city>, <state>, <zip>". */
[[nodiscard]] std::string render_text(const StoreRecord& store);
/** @brief Address line followed by "Distance to store: <d.dd>". */
[[nodiscard]] std::string render_text(const RankedStore& ranked);

/** @brief Single-line JSON object (", " and ": " separators) with the catalogue fields in column order. */
[[nodiscard]] std::string render_json(const StoreRecord& store);
/** @brief As render_json(StoreRecord) with a trailing "distance_to_store" field. */
[[nodiscard]] std::string render_json(const RankedStore& ranked);

/** @brief Dispatch on @p format. */
[[nodiscard]] std::string render(const StoreRecord& store, OutputFormat format);
[[nodiscard]] std::string render(const RankedStore& ranked, OutputFormat format);

/** @brief "<name> located at <address>, <city>, <state>, <zip>", used in logs. */
[[nodiscard]] std::string describe(const StoreRecord& store);

}  // namespace store_locator
