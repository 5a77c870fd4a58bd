/**
 * @file meisai_import.cpp
 * @brief CLI tool to import toll statement CSV files
 *
 * Usage:
 *   meisai_import import <csv> [--account ID] [--personal] [--chunk-bytes N] [--config FILE]
 *   meisai_import hash-import <csv> [--validate-only] [--update-existing] [--keep-duplicates] [--config FILE]
 *   meisai_import stats [--config FILE]
 *   meisai_import clear [--config FILE]
 *
 * The hash index is loaded from and saved to snapshot_path when configured,
 * and preloaded from the database otherwise. An empty conninfo runs against
 * an in-memory repository.
 */

#include <config/engine_config.hpp>
#include <core/errors.hpp>
#include <database/postgres_connection.hpp>
#include <ingestion/hash_importer.hpp>
#include <ingestion/import_service.hpp>
#include <storage/memory_repository.hpp>
#include <storage/postgres_repository.hpp>
#include <storage/retrying_repository.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>

using namespace Meisai;
namespace fs = std::filesystem;

namespace {

void usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " import <csv> [--account ID] [--personal] [--chunk-bytes N] [--config FILE]\n"
              << "       " << argv0 << " hash-import <csv> [--validate-only] [--update-existing] [--keep-duplicates] [--config FILE]\n"
              << "       " << argv0 << " stats [--config FILE]\n"
              << "       " << argv0 << " clear [--config FILE]\n";
}

std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw MeisaiError(ErrorKind::Validation, "cannot open " + path.string(), {{"path", path.string()}});
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

void print_summary(const SessionSummary& s, double seconds) {
    std::cout << "\nSession " << s.session_id << ": " << to_string(s.status) << "\n";
    std::cout << "  Duration:   " << std::fixed << std::setprecision(2) << seconds << "s\n";
    std::cout << "  Rows:       " << s.processed_rows << " / " << s.total_rows << "\n";
    std::cout << "  Success:    " << s.success_rows << " (updated " << s.updated_rows << ")\n";
    std::cout << "  Duplicates: " << s.duplicate_rows << "\n";
    std::cout << "  Errors:     " << s.error_rows << "\n";
    if (!s.failure_reason.empty()) std::cout << "  Failure:    " << s.failure_reason << "\n";
    for (const auto& e : s.errors)
        std::cout << "    row " << e.row_number << " [" << e.error_type << "] " << e.message << "\n";
}

void print_counts(const HashImportResult& r) {
    std::cout << "\nHash import: " << to_string(r.status) << "\n";
    std::cout << "  Added:      " << r.counts.added << "\n";
    std::cout << "  Updated:    " << r.counts.updated << "\n";
    std::cout << "  Duplicates: " << r.counts.duplicate << "\n";
    std::cout << "  Errors:     " << r.counts.error << "\n";
    std::cout << "  Total rows: " << r.counts.total << "\n";
    if (!r.failure_reason.empty()) std::cout << "  Failure:    " << r.failure_reason << "\n";
}

SessionSummary stream_file(ImportService& service, const SessionInfo& info, const std::string& content, size_t chunk_bytes) {
    auto handle = service.open_stream(info);

    std::thread reporter([handle] {
        ProgressSnapshot p;
        int last = -1;
        while (handle->next_progress(p)) {
            int pct = static_cast<int>(p.progress_percentage);
            if (pct / 10 != last / 10 || pct == 100) {
                Logger::bulk("progress " + std::to_string(pct) + "% (" + std::to_string(p.processed_rows) + " rows)");
                last = pct;
            }
        }
    });

    int64_t number = 1;
    for (size_t off = 0; off < content.size() || number == 1; off += chunk_bytes, ++number) {
        Chunk c;
        c.session_id = handle->session_id();
        c.chunk_number = number;
        c.data = content.substr(off, chunk_bytes);
        bool last = off + chunk_bytes >= content.size();
        c.is_last = last;
        if (!handle->send(std::move(c)) || last) break;
    }
    handle->finish_sending();
    reporter.join();
    service.wait_idle();
    return service.get_session(handle->session_id());
}

} // anonymous namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    std::string csv_path;
    std::string config_path;
    SessionInfo info;
    info.account_id = "cli";
    info.created_by = "meisai_import";
    size_t chunk_bytes = 0;
    HashImportOptions hash_options;

    int i = 2;
    if (command == "import" || command == "hash-import") {
        if (argc < 3) {
            usage(argv[0]);
            return 1;
        }
        csv_path = argv[2];
        i = 3;
    }
    for (; i < argc; ++i) {
        std::string arg = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                std::exit(1);
            }
            return argv[++i];
        };
        if (arg == "--config") config_path = value();
        else if (arg == "--account") info.account_id = value();
        else if (arg == "--personal") info.account_type = AccountType::Personal;
        else if (arg == "--chunk-bytes") {
            std::string v = value();
            if (v.empty() || v.find_first_not_of("0123456789") != std::string::npos) {
                std::cerr << "--chunk-bytes expects a positive integer\n";
                return 1;
            }
            chunk_bytes = std::stoul(v);
        }
        else if (arg == "--validate-only") hash_options.validate_only = true;
        else if (arg == "--update-existing") hash_options.update_existing = true;
        else if (arg == "--keep-duplicates") hash_options.skip_duplicates = false;
        else {
            std::cerr << "Unknown option: " << arg << "\n";
            usage(argv[0]);
            return 1;
        }
    }

    try {
        EngineConfig config = EngineConfig::from_env();
        if (!config_path.empty()) config.merge_json(read_file(config_path));
        Logger::set_level(config.log_level);

        std::unique_ptr<PostgresConnection> db;
        std::shared_ptr<IStatementRepository> repository;
        if (!config.conninfo.empty()) {
            db = std::make_unique<PostgresConnection>(config.conninfo);
            ensure_schema(*db);
            repository = std::make_shared<RetryingStatementRepository>(
                std::make_shared<PostgresStatementRepository>(*db));
        } else {
            repository = std::make_shared<MemoryStatementRepository>();
        }

        HashIndex index(config.index_options());
        bool from_snapshot = !config.snapshot_path.empty() && index.load_snapshot(config.snapshot_path);
        if (!from_snapshot && db) {
            HashImporter(index, *repository).preload();
        }

        auto save = [&] {
            if (!config.snapshot_path.empty()) index.save_snapshot(config.snapshot_path);
        };

        if (command == "stats") {
            auto stats = index.stats();
            std::cout << "Records:              " << stats.total_records << "\n";
            std::cout << "Pending reservations: " << stats.pending_reservations << "\n";
            std::cout << "Memory estimate:      " << stats.memory_estimate_bytes << " bytes\n";
            std::cout << "Change detection:     " << (stats.change_detection ? "on" : "off") << "\n";
            return 0;
        }

        if (command == "clear") {
            index.clear();
            save();
            return 0;
        }

        if (command == "hash-import") {
            Timer timer;
            HashImporter importer(index, *repository);
            auto result = importer.import_csv(csv_path, hash_options);
            print_counts(result);
            std::cout << "  Duration:   " << std::fixed << std::setprecision(2) << timer.elapsed_sec() << "s\n";
            if (!hash_options.validate_only) save();
            return result.status == SessionStatus::Completed ? 0 : 2;
        }

        if (command == "import") {
            fs::path path(csv_path);
            std::string content = read_file(path);
            info.file_name = path.filename().string();
            info.file_size = content.size();

            SessionSummary summary;
            Timer timer;
            {
                ImportService service(index, repository, config.service_options());
                summary = chunk_bytes ? stream_file(service, info, content, chunk_bytes)
                                      : service.import_file(info, content);
            }
            print_summary(summary, timer.elapsed_sec());
            save();
            return summary.status == SessionStatus::Completed ? 0 : 2;
        }

        usage(argv[0]);
        return 1;

    } catch (const MeisaiError& e) {
        std::cerr << "\nError [" << to_string(e.kind()) << "]: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "\nError: " << e.what() << "\n";
        return 1;
    }
}
