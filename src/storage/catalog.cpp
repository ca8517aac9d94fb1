#include "pesadb/storage/catalog.hpp"

#include "pesadb/common/sql_errors.hpp"
#include "pesadb/storage/persistence.hpp"

#include <utility>

namespace pesadb::storage {

namespace {

[[nodiscard]] std::string quote_name(std::string_view text)
{
    return "'" + std::string{text} + "'";
}

}  // namespace

Catalog::Catalog()
    : Catalog{Config{}}
{}

Catalog::Catalog(Config config)
    : config_{std::move(config)}
{}

std::error_code Catalog::open()
{
    load_warnings_.clear();
    if (!persistent()) {
        return {};
    }

    std::error_code ec;
    std::filesystem::create_directories(config_.data_directory, ec);
    if (ec) {
        return ec;
    }

    std::filesystem::directory_iterator it{config_.data_directory, ec};
    if (ec) {
        return ec;
    }

    for (const std::filesystem::directory_iterator end{}; it != end; it.increment(ec)) {
        if (ec) {
            return ec;
        }

        const auto& path = it->path();
        std::error_code status_ec;
        if (!it->is_regular_file(status_ec) || path.extension().string() != kDocumentExtension) {
            continue;
        }

        std::unique_ptr<Database> database;
        if (auto load_ec = load_database(path, database); load_ec) {
            load_warnings_.push_back("Skipped " + path.filename().string() + ": " + load_ec.message());
            continue;
        }

        const auto expected = path.stem().string();
        if (database->name() != expected) {
            load_warnings_.push_back("Skipped " + path.filename().string() + ": document holds database " +
                                     quote_name(database->name()));
            continue;
        }

        databases_[expected] = std::move(database);
    }
    return {};
}

Database& Catalog::create_database(const std::string& name)
{
    if (find_database(name) != nullptr) {
        throw SqlError{SqlErrc::DatabaseAlreadyExists, "Database " + quote_name(name) + " already exists"};
    }

    auto [it, inserted] = databases_.emplace(name, std::make_unique<Database>(name));
    return *it->second;
}

void Catalog::drop_database(std::string_view name)
{
    const auto it = databases_.find(name);
    if (it == databases_.end()) {
        throw SqlError{SqlErrc::DatabaseNotFound, "Database " + quote_name(name) + " does not exist"};
    }

    if (persistent()) {
        std::error_code ec;
        std::filesystem::remove(document_path(name), ec);
        if (ec) {
            throw SqlError{SqlErrc::PersistenceFailed,
                           "Failed to remove document for database " + quote_name(name) + ": " + ec.message()};
        }
    }
    databases_.erase(it);
}

Database* Catalog::find_database(std::string_view name) noexcept
{
    const auto it = databases_.find(name);
    return it == databases_.end() ? nullptr : it->second.get();
}

const Database* Catalog::find_database(std::string_view name) const noexcept
{
    const auto it = databases_.find(name);
    return it == databases_.end() ? nullptr : it->second.get();
}

Database& Catalog::database(std::string_view name)
{
    if (auto* found = find_database(name)) {
        return *found;
    }
    throw SqlError{SqlErrc::DatabaseNotFound, "Database " + quote_name(name) + " does not exist"};
}

std::vector<std::string> Catalog::database_names() const
{
    std::vector<std::string> names;
    names.reserve(databases_.size());
    for (const auto& [name, database] : databases_) {
        names.push_back(name);
    }
    return names;
}

std::error_code Catalog::flush(std::string_view name) const
{
    if (!persistent()) {
        return {};
    }

    const auto* database = find_database(name);
    if (database == nullptr) {
        return std::make_error_code(std::errc::no_such_file_or_directory);
    }
    return save_database(*database, document_path(name));
}

std::filesystem::path Catalog::document_path(std::string_view name) const
{
    return config_.data_directory / (std::string{name} + std::string{kDocumentExtension});
}

}  // namespace pesadb::storage
