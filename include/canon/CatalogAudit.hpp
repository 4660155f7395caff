#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "canon/Models.hpp"
#include "canon/Normalizer.hpp"

namespace canon {

struct AuditIssue {
    std::string code;
    std::string message;
    std::string item_id;
};

struct AuditReport {
    bool pass = true;
    size_t items = 0;
    std::vector<AuditIssue> issues;
};

// Read-only data-quality check of a catalog snapshot. Cleaning up what it
// finds belongs to the catalog maintenance workflow.
AuditReport audit_catalog(const std::vector<CanonicalItem>& items, const Normalizer& normalizer);

void write_audit_report(const std::filesystem::path& path, const AuditReport& rep);

}  // namespace canon
