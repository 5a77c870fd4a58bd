#include <ingestion/hash_importer.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>

namespace Meisai {

HashImporter::HashImporter(HashIndex& index, IStatementRepository& repository)
    : index_(index), repository_(repository) {}

HashImportResult HashImporter::import_csv(const std::string& path, const HashImportOptions& options) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw MeisaiError(ErrorKind::Validation, "cannot open CSV file", {{"field", "path"}, {"path", path}});
    }
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    SessionInfo info;
    info.account_id = "hash-import";
    info.file_name = std::filesystem::path(path).filename().string();
    info.file_size = content.size();
    info.created_by = "hash-admin";

    PipelineOptions pipeline;
    pipeline.skip_duplicates = options.skip_duplicates;
    pipeline.update_existing = options.update_existing;
    pipeline.validate_only = options.validate_only;

    Timer timer;
    auto session = std::make_shared<ImportSession>("hash-import", info);
    SessionIngestor ingestor(session, index_, repository_, pipeline);
    ingestor.import_content(content);

    SessionSummary summary = session->summary();
    HashImportResult result;
    result.counts = ingestor.counts();
    result.counts.total = summary.total_rows;
    result.status = summary.status;
    result.failure_reason = summary.failure_reason;
    result.errors = std::move(summary.errors);

    Logger::info("Hash import " + path + (options.validate_only ? " (validate only)" : "") + ": " +
                 std::to_string(result.counts.added) + " added, " +
                 std::to_string(result.counts.updated) + " updated, " +
                 std::to_string(result.counts.duplicate) + " duplicates, " +
                 std::to_string(result.counts.error) + " errors in " +
                 std::to_string(static_cast<int64_t>(timer.elapsed_ms())) + "ms");
    return result;
}

size_t HashImporter::preload() {
    Timer timer;
    size_t n = 0;
    repository_.for_each([&](const StatementRecord& record) {
        index_.insert(record);
        ++n;
    });
    Logger::success("Hash index preloaded with " + std::to_string(n) + " stored records in " +
                    std::to_string(static_cast<int64_t>(timer.elapsed_ms())) + "ms");
    return n;
}

} // namespace Meisai
