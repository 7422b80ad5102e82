#include "devui/server_registry.hpp"
#include "devui/utils.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace devui {

    nlohmann::json ServerRegistryRecord::to_json() const {
        return {
            {"url", url},
            {"timestamp", timestamp}
        };
    }

    bool is_valid_server_record(const nlohmann::json& j) {
        return j.is_object() &&
               j.contains("url") && j["url"].is_string() &&
               !j["url"].get<std::string>().empty() &&
               j.contains("timestamp") && j["timestamp"].is_string() &&
               looks_like_iso8601(j["timestamp"].get<std::string>());
    }

    std::optional<ServerRegistryRecord> ServerRegistryRecord::from_json(const nlohmann::json& j) {
        if (!is_valid_server_record(j)) {
            return std::nullopt;
        }
        ServerRegistryRecord record;
        record.url = j["url"].get<std::string>();
        record.timestamp = j["timestamp"].get<std::string>();
        return record;
    }

    ServerRegistry::ServerRegistry(std::filesystem::path record_path)
        : record_path_(std::move(record_path)) {}

    std::optional<ServerRegistryRecord> ServerRegistry::read() const {
        std::ifstream file(record_path_);
        if (!file.is_open()) {
            return std::nullopt;
        }

        std::stringstream buffer;
        buffer << file.rdbuf();

        nlohmann::json j = nlohmann::json::parse(buffer.str(), nullptr, false);
        if (j.is_discarded()) {
            return std::nullopt;
        }
        return ServerRegistryRecord::from_json(j);
    }

    void ServerRegistry::write(const ServerRegistryRecord& record) const {
        if (record_path_.has_parent_path()) {
            std::filesystem::create_directories(record_path_.parent_path());
        }

        std::filesystem::path temp_path = record_path_;
        temp_path += ".tmp";

        {
            std::ofstream file(temp_path, std::ios::trunc);
            if (!file) {
                throw std::runtime_error("Failed to open " + temp_path.string() + " for writing");
            }
            file << record.to_json().dump(2);
            file.flush();
            if (!file) {
                throw std::runtime_error("Failed to write " + temp_path.string());
            }
        }

        std::error_code ec;
        std::filesystem::rename(temp_path, record_path_, ec);
        if (ec) {
            std::string reason = ec.message();
            std::filesystem::remove(temp_path, ec);
            throw std::runtime_error("Failed to replace " + record_path_.string() + ": " + reason);
        }
    }

    bool ServerRegistry::remove() const {
        std::error_code ec;
        return std::filesystem::remove(record_path_, ec);
    }

} // namespace devui
