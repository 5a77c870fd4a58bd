/**
 * @file hash_importer.hpp
 * @brief Hash-index administration: file import and preload from storage
 */

#pragma once

#include <dedup/hash_index.hpp>
#include <ingestion/import_pipeline.hpp>
#include <storage/statement_repository.hpp>
#include <string>
#include <vector>

namespace Meisai {

struct HashImportOptions {
    bool skip_duplicates = true;
    bool update_existing = false;
    bool validate_only = false;
};

struct HashImportResult {
    ImportCounts counts;
    SessionStatus status = SessionStatus::Pending;
    std::string failure_reason;
    std::vector<ImportRowError> errors;
};

class HashImporter {
public:
    HashImporter(HashIndex& index, IStatementRepository& repository);

    /**
     * @brief Import a statement CSV file through the regular pipeline.
     * @throws MeisaiError(Validation) when the file cannot be read
     */
    HashImportResult import_csv(const std::string& path, const HashImportOptions& options = {});

    /**
     * @brief Register every stored record in the index.
     * @return number of records visited
     */
    size_t preload();

private:
    HashIndex& index_;
    IStatementRepository& repository_;
};

} // namespace Meisai
