#pragma once

#include "db.hpp"
#include "records.hpp"
#include <string>
#include <vector>

namespace fieldsync {

// Outcome of removing one attachment file. Never escalated: the caller logs
// failures and moves on.
struct attachment_removal {
    enum class outcome { removed, missing, failed };

    std::string path;
    outcome result = outcome::removed;
    std::string error;  // set when result == failed

    bool ok() const { return result != outcome::failed; }
};

attachment_removal remove_attachment(const std::string& path);

struct cleanup_report {
    size_t rows_deleted = 0;
    std::vector<attachment_removal> attachments;

    size_t files_removed() const;
    size_t files_failed() const;
};

// ============================================================================
// record_cleanup - deletes rows together with everything they own
// ============================================================================
//
// Rows go first, inside one transaction; attachment files go afterwards so a
// rolled back delete never leaves a row pointing at a removed photo.
// Parcel dependents (buildings, then owner) are deleted explicitly before the
// parcel instead of relying on ON DELETE CASCADE.

class record_cleanup {
public:
    explicit record_cleanup(database& db) : db_(db) {}

    cleanup_report purge(const std::vector<taxpayer_record>& records);
    cleanup_report purge(const std::vector<parcel_record>& records);

private:
    database& db_;

    void remove_files(const std::vector<std::string>& paths, cleanup_report& report);
};

} // namespace fieldsync
