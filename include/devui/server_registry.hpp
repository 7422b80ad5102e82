/**
 * @file server_registry.hpp
 * @brief Persisted record of the Developer UI server running for a project
 *
 * The record lives at <root>/.devui/servers/tools.json:
 *
 *   {
 *     "url": "http://localhost:4000",
 *     "timestamp": "2026-10-18T09:15:02.123Z"
 *   }
 *
 * Read-then-overwrite semantics: the file is read once at the start of a
 * ui:start run and replaced wholesale after a new server is confirmed
 * healthy. A missing or unparsable file means "no server".
 */

#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include <nlohmann/json.hpp>

namespace devui {

    /**
     * @brief The URL and creation time of the last known dev server
     */
    struct ServerRegistryRecord {
        std::string url;
        std::string timestamp;

        [[nodiscard]] nlohmann::json to_json() const;

        /**
         * @brief Parses a record, rejecting anything that is not well-formed
         *
         * @return std::nullopt unless url and timestamp are strings and the
         *         timestamp looks like ISO-8601
         */
        static std::optional<ServerRegistryRecord> from_json(const nlohmann::json& j);
    };

    /**
     * @brief True if j has the shape of a ServerRegistryRecord
     */
    bool is_valid_server_record(const nlohmann::json& j);

    /**
     * @brief File-backed key-value record with read-then-overwrite semantics
     *
     * No in-memory caching: every read goes to disk.
     */
    class ServerRegistry {
    public:
        /**
         * @param record_path Path of tools.json
         */
        explicit ServerRegistry(std::filesystem::path record_path);

        /**
         * @brief Reads the record
         *
         * Never throws: a missing, unreadable or malformed file yields
         * std::nullopt.
         */
        [[nodiscard]] std::optional<ServerRegistryRecord> read() const;

        /**
         * @brief Replaces the record
         *
         * Creates the parent directory, writes to a sibling temp file and
         * renames it over the record so readers never see a torn file.
         *
         * @throws std::runtime_error / std::filesystem::filesystem_error on failure
         */
        void write(const ServerRegistryRecord& record) const;

        /**
         * @brief Deletes the record if present
         *
         * @return true if a file was removed
         */
        bool remove() const;

        [[nodiscard]] std::filesystem::path get_record_path() const { return record_path_; }

    private:
        std::filesystem::path record_path_;
    };

} // namespace devui
