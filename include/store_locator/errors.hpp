// === Errors ==================================================================
//
// Exception hierarchy surfaced by the store locator. Every failure that the
// command-line entry point reports derives from `StoreLocatorError`, so `main`
// can distinguish domain failures from unexpected standard exceptions.

#pragma once

#include <stdexcept>
#include <string>

namespace store_locator {

/** @brief Root of all store locator failures. */
class StoreLocatorError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/** @brief A latitude/longitude pair lies outside the valid ranges. */
class InvalidGeometryError final : public StoreLocatorError {
  public:
    using StoreLocatorError::StoreLocatorError;
};

/** @brief A nearest-neighbour search was requested over zero candidates. */
class EmptyInputError final : public StoreLocatorError {
  public:
    using StoreLocatorError::StoreLocatorError;
};

/** @brief Geocoding failed (transport error, bad response, or no match). */
class GeocodingError final : public StoreLocatorError {
  public:
    using StoreLocatorError::StoreLocatorError;
};

/** @brief The store catalogue could not be read or parsed. */
class StoreCatalogError final : public StoreLocatorError {
  public:
    using StoreLocatorError::StoreLocatorError;
};

/** @brief The command line was malformed. */
class UsageError final : public StoreLocatorError {
  public:
    using StoreLocatorError::StoreLocatorError;
};

}  // namespace store_locator
