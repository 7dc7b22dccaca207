#include "fieldsync/cleanup.hpp"
#include "fieldsync/log.hpp"
#include <filesystem>
#include <system_error>

namespace fieldsync {

namespace fs = std::filesystem;

attachment_removal remove_attachment(const std::string& path) {
    attachment_removal removal;
    removal.path = path;

    std::error_code ec;
    bool removed = fs::remove(fs::path(path), ec);
    if (ec) {
        removal.result = attachment_removal::outcome::failed;
        removal.error = ec.message();
    } else if (!removed) {
        removal.result = attachment_removal::outcome::missing;
    }
    return removal;
}

size_t cleanup_report::files_removed() const {
    size_t count = 0;
    for (const auto& a : attachments) {
        if (a.result == attachment_removal::outcome::removed) ++count;
    }
    return count;
}

size_t cleanup_report::files_failed() const {
    size_t count = 0;
    for (const auto& a : attachments) {
        if (!a.ok()) ++count;
    }
    return count;
}

void record_cleanup::remove_files(const std::vector<std::string>& paths, cleanup_report& report) {
    for (const auto& path : paths) {
        if (path.empty()) continue;
        auto removal = remove_attachment(path);
        if (!removal.ok()) {
            LOG_WARN("cleanup", "Could not delete attachment %s: %s",
                     removal.path.c_str(), removal.error.c_str());
        }
        report.attachments.push_back(std::move(removal));
    }
}

cleanup_report record_cleanup::purge(const std::vector<taxpayer_record>& records) {
    cleanup_report report;
    if (records.empty()) return report;

    std::vector<column_value_t> ids;
    std::vector<std::string> files;
    for (const auto& record : records) {
        ids.push_back(record.id);
        files.insert(files.end(), record.piece_identite_urls.begin(), record.piece_identite_urls.end());
    }

    {
        transaction tx(db_);
        db_.execute("DELETE FROM contribuables WHERE id IN (" + placeholders(ids.size()) + ")", ids);
        report.rows_deleted = static_cast<size_t>(db_.changes());
        tx.commit();
    }

    remove_files(files, report);

    LOG_INFO("cleanup", "Purged %zu taxpayers, %zu files removed, %zu failed",
             report.rows_deleted, report.files_removed(), report.files_failed());
    return report;
}

cleanup_report record_cleanup::purge(const std::vector<parcel_record>& records) {
    cleanup_report report;
    if (records.empty()) return report;

    std::vector<column_value_t> ids;
    std::vector<std::string> files;
    for (const auto& record : records) {
        ids.push_back(record.id);
        files.insert(files.end(), record.photo_urls.begin(), record.photo_urls.end());
    }
    auto in_clause = "(" + placeholders(ids.size()) + ")";

    {
        transaction tx(db_);
        db_.execute("DELETE FROM batiments WHERE parcelle_id IN " + in_clause, ids);
        db_.execute("DELETE FROM personnes WHERE parcelle_id IN " + in_clause, ids);
        db_.execute("DELETE FROM parcelles WHERE id IN " + in_clause, ids);
        report.rows_deleted = static_cast<size_t>(db_.changes());
        tx.commit();
    }

    remove_files(files, report);

    LOG_INFO("cleanup", "Purged %zu parcels, %zu files removed, %zu failed",
             report.rows_deleted, report.files_removed(), report.files_failed());
    return report;
}

} // namespace fieldsync
