#pragma once

#include "pesadb/storage/database.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace pesadb::storage {

class Catalog final {
public:
    struct Config final {
        // Empty keeps every database in memory only.
        std::filesystem::path data_directory{};
    };

    Catalog();
    explicit Catalog(Config config);

    // Scans the data directory for documents. Unreadable ones are skipped and reported through
    // load_warnings(); only a failure to list the directory itself is returned.
    std::error_code open();

    [[nodiscard]] const Config& config() const noexcept { return config_; }
    [[nodiscard]] bool persistent() const noexcept { return !config_.data_directory.empty(); }
    [[nodiscard]] const std::vector<std::string>& load_warnings() const noexcept { return load_warnings_; }

    Database& create_database(const std::string& name);
    // Removes the in-memory database and its document.
    void drop_database(std::string_view name);

    [[nodiscard]] Database* find_database(std::string_view name) noexcept;
    [[nodiscard]] const Database* find_database(std::string_view name) const noexcept;
    [[nodiscard]] Database& database(std::string_view name);

    // Sorted by name.
    [[nodiscard]] std::vector<std::string> database_names() const;

    // Rewrites the database's document. A no-op for in-memory catalogs.
    std::error_code flush(std::string_view name) const;
    [[nodiscard]] std::filesystem::path document_path(std::string_view name) const;

private:
    Config config_{};
    std::map<std::string, std::unique_ptr<Database>, std::less<>> databases_{};
    std::vector<std::string> load_warnings_{};
};

}  // namespace pesadb::storage
