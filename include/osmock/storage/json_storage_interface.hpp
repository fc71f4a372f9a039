/**
 * @file json_storage_interface.hpp
 * @brief Abstract persistence provider for named JSON documents
 *
 * The resource store keeps each collection as one JSON document and talks
 * to durable storage only through this interface, so tests can substitute
 * an in-memory provider.
 */

#pragma once

#include <osmock/core/result.hpp>

#include <nlohmann/json.hpp>

#include <string>

namespace osmock::storage {

/**
 * @brief Persistence provider contract
 *
 * - load() never fails: a missing or unparsable record yields the default.
 * - save() replaces the whole record; readers never observe a partial write.
 *
 * Implementations need not be thread-safe; the resource store serializes
 * all calls.
 */
class json_storage_interface {
public:
    virtual ~json_storage_interface() = default;

    /**
     * @brief Load the document stored under @p name
     * @param name Collection name (e.g. "images")
     * @param default_value Returned unchanged when no valid record exists
     */
    [[nodiscard]] virtual auto load(const std::string& name,
                                    const nlohmann::json& default_value) const
        -> nlohmann::json = 0;

    /**
     * @brief Replace the document stored under @p name
     */
    [[nodiscard]] virtual auto save(const std::string& name,
                                    const nlohmann::json& value) -> VoidResult = 0;
};

} // namespace osmock::storage
