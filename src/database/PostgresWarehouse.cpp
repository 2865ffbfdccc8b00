// =============================================================================
// PostgresWarehouse.cpp — the job service and table service on libpqxx
// =============================================================================
// Every public method opens its own pqxx::connection; nothing is shared
// between calls except the connection string. A job body runs in a single
// pqxx::work, so a failed load / copy / query leaves its destination exactly
// as it was.
// =============================================================================

#include "PostgresWarehouse.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdio>
#include <iostream>
#include <thread>
#include <ctre.hpp>

#include "../common/Errors.hpp"
#include "../jobs/CancellationToken.hpp"
#include "../output/ParquetWriter.hpp"
#include "../parser/RowCsvCodec.hpp"
#include "../storage/StagingFileSystem.hpp"

namespace BulkBridge
{

    namespace
    {
        constexpr std::chrono::milliseconds MAX_POLL_BACKOFF{10'000};

        std::string sql_type(FieldType type)
        {
            switch (type)
            {
            case FieldType::String:
                return "TEXT";
            case FieldType::Integer:
                return "BIGINT";
            case FieldType::Float:
                return "DOUBLE PRECISION";
            case FieldType::Boolean:
                return "BOOLEAN";
            case FieldType::Timestamp:
                return "TIMESTAMPTZ";
            }
            return "TEXT";
        }

        // information_schema.columns.data_type -> column type
        FieldType field_type_from_pg(std::string_view data_type)
        {
            if (ctre::match<"bigint|integer|smallint">(data_type))
                return FieldType::Integer;
            if (ctre::match<"double precision|real|numeric.*">(data_type))
                return FieldType::Float;
            if (data_type == "boolean")
                return FieldType::Boolean;
            if (ctre::match<"timestamp.*">(data_type))
                return FieldType::Timestamp;
            return FieldType::String;
        }

        std::string qualified(pqxx::work &W, const TableReference &table)
        {
            return W.quote_name(table.dataset_id) + "." + W.quote_name(table.table_id);
        }

        std::string column_list(pqxx::work &W, const TableSchema &schema)
        {
            std::string out;
            for (const auto &field : schema.fields)
            {
                if (!out.empty())
                    out += ", ";
                out += W.quote_name(field.name);
            }
            return out;
        }

        std::string column_definitions(pqxx::work &W, const TableSchema &schema)
        {
            std::string out;
            for (const auto &field : schema.fields)
            {
                if (!out.empty())
                    out += ", ";
                out += W.quote_name(field.name) + " " + sql_type(field.type);
                if (field.mode == FieldMode::Required)
                    out += " NOT NULL";
            }
            return out;
        }

        // Timestamps leave the database as microseconds since the epoch
        std::string extract_select_list(pqxx::work &W, const TableSchema &schema)
        {
            std::string out;
            for (const auto &field : schema.fields)
            {
                if (!out.empty())
                    out += ", ";
                const std::string column = W.quote_name(field.name);
                if (field.type == FieldType::Timestamp)
                    out += "(EXTRACT(EPOCH FROM " + column + ") * 1000000)::bigint AS " + column;
                else
                    out += column;
            }
            return out;
        }

        FieldValue read_field(const pqxx::field &f, FieldType type)
        {
            switch (type)
            {
            case FieldType::String:
                return f.as<std::string>();
            case FieldType::Integer:
                return f.as<int64_t>();
            case FieldType::Float:
                return f.as<double>();
            case FieldType::Boolean:
                return f.as<bool>();
            case FieldType::Timestamp:
                return Timestamp{f.as<int64_t>()};
            }
            return f.as<std::string>();
        }

        std::string join(const std::vector<std::string> &parts, char sep)
        {
            std::string out;
            for (const auto &p : parts)
            {
                if (!out.empty())
                    out.push_back(sep);
                out += p;
            }
            return out;
        }

        std::vector<std::string> split(std::string_view text, char sep)
        {
            std::vector<std::string> parts;
            while (!text.empty())
            {
                const size_t cut = text.find(sep);
                parts.emplace_back(text.substr(0, cut));
                if (cut == std::string_view::npos)
                    break;
                text.remove_prefix(cut + 1);
            }
            return parts;
        }

        int64_t to_int64(std::string_view digits)
        {
            int64_t value = 0;
            std::from_chars(digits.data(), digits.data() + digits.size(), value);
            return value;
        }

        std::string quote_identifier(std::string_view name)
        {
            std::string out = "\"";
            for (char c : name)
            {
                if (c == '"')
                    out.push_back('"');
                out.push_back(c);
            }
            out.push_back('"');
            return out;
        }

        std::string not_found_table(const TableReference &table)
        {
            return "Not found: Table " + to_table_spec(table);
        }

        // Error reason recorded on a failed job
        std::string error_reason(const std::exception &e)
        {
            if (auto *w = dynamic_cast<const WarehouseError *>(&e); w && w->not_found())
                return "notFound";
            if (dynamic_cast<const pqxx::sql_error *>(&e))
                return "invalidQuery";
            return "invalid";
        }

        bool schema_exists(pqxx::work &W, const std::string &dataset_id)
        {
            return !W.exec("SELECT 1 FROM information_schema.schemata WHERE schema_name = $1",
                           pqxx::params{dataset_id})
                        .empty();
        }

        bool table_exists(pqxx::work &W, const TableReference &table)
        {
            return !W.exec("SELECT 1 FROM information_schema.tables WHERE table_schema = $1 AND table_name = $2",
                           pqxx::params{table.dataset_id, table.table_id})
                        .empty();
        }

        std::optional<Table> lookup_table(pqxx::work &W, const TableReference &ref)
        {
            if (!table_exists(W, ref))
                return std::nullopt;

            Table table;
            table.reference = ref;

            auto columns = W.exec(
                "SELECT column_name, data_type, is_nullable FROM information_schema.columns "
                "WHERE table_schema = $1 AND table_name = $2 ORDER BY ordinal_position",
                pqxx::params{ref.dataset_id, ref.table_id});
            for (const auto &row : columns)
            {
                TableFieldSchema field;
                field.name = row[0].as<std::string>();
                field.type = field_type_from_pg(row[1].as<std::string>());
                field.mode = row[2].as<std::string>() == "NO" ? FieldMode::Required : FieldMode::Nullable;
                table.schema.fields.push_back(std::move(field));
            }

            auto meta = W.exec(
                "SELECT coalesce(obj_description(c.oid, 'pg_class'), ''), pg_total_relation_size(c.oid) "
                "FROM pg_class c JOIN pg_namespace n ON n.oid = c.relnamespace "
                "WHERE n.nspname = $1 AND c.relname = $2",
                pqxx::params{ref.dataset_id, ref.table_id});
            if (!meta.empty())
            {
                table.description = meta[0][0].as<std::string>();
                table.num_bytes = meta[0][1].as<int64_t>();
            }

            table.num_rows = W.exec("SELECT count(*) FROM " + qualified(W, ref))[0][0].as<int64_t>();

            auto dataset = W.exec("SELECT location FROM bulkbridge_meta.datasets WHERE dataset_id = $1",
                                  pqxx::params{ref.dataset_id});
            table.location = dataset.empty() ? "local" : dataset[0][0].as<std::string>();
            return table;
        }

        JobType parse_job_type(std::string_view text)
        {
            for (JobType type : {JobType::Load, JobType::Copy, JobType::Extract, JobType::Query})
            {
                if (to_string(type) == text)
                    return type;
            }
            return JobType::Load;
        }

        std::string trim_statement(std::string_view sql)
        {
            while (!sql.empty() && (sql.back() == ';' || std::isspace(static_cast<unsigned char>(sql.back()))))
                sql.remove_suffix(1);
            return std::string(sql);
        }
    }

    PostgresWarehouse::PostgresWarehouse(std::string connection_string,
                                         const StagingFileSystem &fs,
                                         std::chrono::milliseconds poll_interval,
                                         int64_t rows_per_extract_file)
        : conn_str_(std::move(connection_string)),
          fs_(fs),
          poll_interval_(poll_interval),
          rows_per_extract_file_(std::max<int64_t>(1, rows_per_extract_file))
    {
    }

    // =========================================================================
    // CATALOG
    // =========================================================================
    //   jobs        one row per submitted job id; outcome + statistics
    //   datasets    project / location / description of each dataset schema
    //   insert_ids  unique ids already accepted by insert_all, per table
    // =========================================================================
    void PostgresWarehouse::init_catalog()
    {
        try
        {
            pqxx::connection C(conn_str_);
            pqxx::work W(C);

            W.exec("CREATE SCHEMA IF NOT EXISTS bulkbridge_meta");

            W.exec(R"(
                CREATE TABLE IF NOT EXISTS bulkbridge_meta.jobs (
                    project_id        TEXT        NOT NULL,
                    job_id            TEXT        NOT NULL,
                    job_type          TEXT        NOT NULL,
                    state             TEXT        NOT NULL CHECK (state IN ('RUNNING','DONE')),
                    error_reason      TEXT,
                    error_message     TEXT,
                    bytes_processed   BIGINT      NOT NULL DEFAULT 0,
                    output_rows       BIGINT      NOT NULL DEFAULT 0,
                    file_counts       TEXT        NOT NULL DEFAULT '',
                    referenced_tables TEXT        NOT NULL DEFAULT '',
                    created_at        TIMESTAMPTZ NOT NULL DEFAULT now(),
                    finished_at       TIMESTAMPTZ,
                    PRIMARY KEY (project_id, job_id)
                );
            )");

            W.exec(R"(
                CREATE TABLE IF NOT EXISTS bulkbridge_meta.datasets (
                    dataset_id  TEXT PRIMARY KEY,
                    project_id  TEXT NOT NULL,
                    location    TEXT NOT NULL,
                    description TEXT NOT NULL DEFAULT ''
                );
            )");

            W.exec(R"(
                CREATE TABLE IF NOT EXISTS bulkbridge_meta.insert_ids (
                    table_spec  TEXT        NOT NULL,
                    unique_id   TEXT        NOT NULL,
                    inserted_at TIMESTAMPTZ NOT NULL DEFAULT now(),
                    PRIMARY KEY (table_spec, unique_id)
                );
            )");

            W.commit();
            std::cout << "[PG] Catalog initialized (schema: bulkbridge_meta).\n";
        }
        catch (const std::exception &e)
        {
            std::cerr << "[PG ERROR] init_catalog failed: " << e.what() << "\n";
            throw;
        }
    }

    // =========================================================================
    // JOBS
    // =========================================================================

    template <typename Body>
    void PostgresWarehouse::run_job(const JobReference &ref, JobType type, Body &&body)
    {
        {
            pqxx::connection C(conn_str_);
            pqxx::work W(C);
            auto registered = W.exec(
                "INSERT INTO bulkbridge_meta.jobs (project_id, job_id, job_type, state) "
                "VALUES ($1, $2, $3, 'RUNNING') ON CONFLICT DO NOTHING",
                pqxx::params{ref.project_id, ref.job_id, std::string(to_string(type))});
            if (registered.affected_rows() == 0)
                throw WarehouseError("Already Exists: Job " + ref.project_id + ":" + ref.job_id);
            W.commit();
        }
        std::cout << "[PG] " << to_string(type) << " job " << ref.job_id << " started\n";

        JobStatistics stats;
        std::optional<JobError> error;
        try
        {
            stats = body();
        }
        catch (const std::exception &e)
        {
            // The failure is the job's outcome, reported through poll_job()
            error = JobError{error_reason(e), e.what()};
            std::cerr << "[PG WARN] " << to_string(type) << " job " << ref.job_id << " failed: " << e.what() << "\n";
        }

        std::vector<std::string> counts;
        for (int64_t n : stats.destination_uri_file_counts)
            counts.push_back(std::to_string(n));
        std::vector<std::string> referenced;
        for (const auto &t : stats.referenced_tables)
            referenced.push_back(to_table_spec(t));

        pqxx::connection C(conn_str_);
        pqxx::work W(C);
        W.exec("UPDATE bulkbridge_meta.jobs SET state = 'DONE', error_reason = $3, error_message = $4, "
               "bytes_processed = $5, output_rows = $6, file_counts = $7, referenced_tables = $8, "
               "finished_at = now() WHERE project_id = $1 AND job_id = $2",
               pqxx::params{ref.project_id, ref.job_id,
                            error ? std::optional<std::string>(error->reason) : std::nullopt,
                            error ? std::optional<std::string>(error->message) : std::nullopt,
                            stats.total_bytes_processed, stats.output_rows,
                            join(counts, ','), join(referenced, ',')});
        W.commit();
    }

    void PostgresWarehouse::submit_load(const JobReference &ref, const LoadJobConfig &config)
    {
        run_job(ref, JobType::Load, [&]
                { return execute_load(config); });
    }

    void PostgresWarehouse::submit_copy(const JobReference &ref, const CopyJobConfig &config)
    {
        run_job(ref, JobType::Copy, [&]
                { return execute_copy(config); });
    }

    void PostgresWarehouse::submit_extract(const JobReference &ref, const ExtractJobConfig &config)
    {
        run_job(ref, JobType::Extract, [&]
                { return execute_extract(config); });
    }

    void PostgresWarehouse::submit_query(const JobReference &ref, const QueryJobConfig &config)
    {
        run_job(ref, JobType::Query, [&]
                { return execute_query(ref.project_id, config); });
    }

    std::optional<Job> PostgresWarehouse::get_job(const JobReference &ref)
    {
        pqxx::connection C(conn_str_);
        pqxx::work W(C);
        auto r = W.exec(
            "SELECT job_type, state, error_reason, error_message, bytes_processed, output_rows, "
            "file_counts, referenced_tables FROM bulkbridge_meta.jobs WHERE project_id = $1 AND job_id = $2",
            pqxx::params{ref.project_id, ref.job_id});
        if (r.empty())
            return std::nullopt;

        const auto row = r[0];
        Job job;
        job.reference = ref;
        job.type = parse_job_type(row[0].as<std::string>());
        job.state = row[1].as<std::string>();
        if (!row[2].is_null())
        {
            job.error_result = JobError{row[2].as<std::string>(), row[3].is_null() ? "" : row[3].as<std::string>()};
            job.errors.push_back(*job.error_result);
        }
        job.statistics.total_bytes_processed = row[4].as<int64_t>();
        job.statistics.output_rows = row[5].as<int64_t>();
        for (const auto &n : split(row[6].as<std::string>(), ','))
            job.statistics.destination_uri_file_counts.push_back(to_int64(n));
        for (const auto &spec : split(row[7].as<std::string>(), ','))
            job.statistics.referenced_tables.push_back(parse_table_spec(spec));
        return job;
    }

    // Waits for state DONE. Lost connections are retried with exponential
    // backoff up to max_retries; everything else propagates.
    std::optional<Job> PostgresWarehouse::poll_job(const JobReference &ref,
                                                   int max_retries,
                                                   const CancellationToken *cancel)
    {
        int64_t failures = 0;
        auto backoff = poll_interval_;

        while (true)
        {
            if (cancel && cancel->is_cancelled())
                throw JobCancelledError("Interrupted while polling job " + ref.job_id);

            try
            {
                auto job = get_job(ref);
                if (!job || job->state == "DONE")
                    return job;
            }
            catch (const pqxx::broken_connection &e)
            {
                if (++failures > max_retries)
                {
                    throw WarehouseError("Polling job " + ref.job_id + " failed after " +
                                         std::to_string(max_retries) + " retries: " + e.what());
                }
                std::cerr << "[PG WARN] Lost connection while polling " << ref.job_id
                          << " (attempt " << failures << "): " << e.what() << "\n";
            }

            const bool cancelled = cancel ? cancel->wait_for(backoff) : (std::this_thread::sleep_for(backoff), false);
            if (cancelled)
                throw JobCancelledError("Interrupted while polling job " + ref.job_id);
            backoff = std::min(backoff * 2, MAX_POLL_BACKOFF);
        }
    }

    JobStatistics PostgresWarehouse::dry_run_query(const std::string &project_id, const QueryJobConfig &config)
    {
        try
        {
            pqxx::connection C(conn_str_);
            pqxx::work W(C);
            return explain(W, project_id, trim_statement(rewrite_table_references(config.query, config.use_legacy_sql)));
        }
        catch (const pqxx::sql_error &e)
        {
            throw WarehouseError(std::string("Invalid query: ") + e.what());
        }
    }

    // Estimated bytes = rows x width of the top plan node. Referenced tables
    // are the scanned relations outside the catalog schema.
    JobStatistics PostgresWarehouse::explain(pqxx::work &W, const std::string &project_id, const std::string &sql) const
    {
        const std::string plan = W.exec("EXPLAIN (VERBOSE, FORMAT JSON) " + sql)[0][0].as<std::string>();

        JobStatistics stats;
        const auto rows = ctre::search<R"re("Plan Rows": (\d+))re">(plan);
        const auto width = ctre::search<R"re("Plan Width": (\d+))re">(plan);
        if (rows && width)
            stats.total_bytes_processed = to_int64(rows.get<1>().to_view()) * to_int64(width.get<1>().to_view());

        for (auto m : ctre::search_all<R"re("Relation Name": "([^"]*)",\s*"Schema": "([^"]*)")re">(plan))
        {
            const std::string schema(m.get<2>().to_view());
            if (schema == CATALOG_SCHEMA)
                continue;
            TableReference table{project_id, schema, std::string(m.get<1>().to_view())};
            if (std::find(stats.referenced_tables.begin(), stats.referenced_tables.end(), table) == stats.referenced_tables.end())
                stats.referenced_tables.push_back(std::move(table));
        }
        return stats;
    }

    std::string PostgresWarehouse::rewrite_table_references(std::string_view query, bool use_legacy_sql)
    {
        std::string out;
        size_t pos = 0;
        auto replace = [&](std::string_view whole, std::string_view dataset, std::string_view table)
        {
            const size_t start = static_cast<size_t>(whole.data() - query.data());
            out.append(query.substr(pos, start - pos));
            out += quote_identifier(dataset) + "." + quote_identifier(table);
            pos = start + whole.size();
        };

        if (use_legacy_sql)
        {
            for (auto m : ctre::search_all<R"re(\[(?:[^\]:]+:)?([^\].]+)\.([^\]]+)\])re">(query))
                replace(m.to_view(), m.get<1>().to_view(), m.get<2>().to_view());
        }
        else
        {
            for (auto m : ctre::search_all<R"re(`(?:[^`.]+\.)?([^`.]+)\.([^`]+)`)re">(query))
                replace(m.to_view(), m.get<1>().to_view(), m.get<2>().to_view());
        }
        out.append(query.substr(pos));
        return out;
    }

    TableSchema PostgresWarehouse::prepare_destination(pqxx::work &W,
                                                       const TableReference &table,
                                                       const std::optional<TableSchema> &schema,
                                                       WriteDisposition write_disposition,
                                                       CreateDisposition create_disposition) const
    {
        auto existing = lookup_table(W, table);
        if (!existing)
        {
            if (create_disposition == CreateDisposition::CreateNever)
                throw WarehouseError(not_found_table(table), true);
            if (!schema || schema->empty())
                throw ValidationError("Table " + to_table_spec(table) + " does not exist and the job carries no schema");

            W.exec("CREATE TABLE " + qualified(W, table) + " (" + column_definitions(W, *schema) + ")");
            return *schema;
        }

        switch (write_disposition)
        {
        case WriteDisposition::WriteEmpty:
            if (existing->num_rows > 0)
                throw ValidationError("Already Exists: Table " + to_table_spec(table) + " is not empty");
            break;
        case WriteDisposition::WriteTruncate:
            W.exec("TRUNCATE TABLE " + qualified(W, table));
            break;
        case WriteDisposition::WriteAppend:
            break;
        }
        return existing->schema;
    }

    // COPY FROM STDIN in schema column order; NULL for absent values
    void PostgresWarehouse::copy_rows(pqxx::work &W,
                                      const TableReference &table,
                                      const TableSchema &schema,
                                      const std::vector<TableRow> &rows) const
    {
        if (rows.empty())
            return;

        const std::vector<std::string> names = schema.column_names();
        auto stream = pqxx::stream_to::raw_table(
            W,
            W.conn().quote_table({table.dataset_id, table.table_id}),
            W.conn().quote_columns(names));

        std::vector<std::optional<std::string>> values(names.size());
        for (const auto &row : rows)
        {
            for (size_t i = 0; i < names.size(); ++i)
            {
                const FieldValue &value = row.get(names[i]);
                values[i] = is_null(value) ? std::nullopt : std::optional<std::string>(format_value(value));
            }
            stream.write_row(values);
        }
        stream.complete();
    }

    JobStatistics PostgresWarehouse::execute_load(const LoadJobConfig &config)
    {
        if (config.source_format != "CSV")
            throw ValidationError("Unsupported source format: " + config.source_format);

        pqxx::connection C(conn_str_);
        pqxx::work W(C);

        const TableSchema schema = prepare_destination(W, config.destination, config.schema,
                                                       config.write_disposition, config.create_disposition);
        const RowCsvCodec codec(schema);

        JobStatistics stats;
        for (const auto &uri : config.source_uris)
        {
            const auto paths = uri.find('*') != std::string::npos ? fs_.match(uri) : std::vector<std::string>{uri};
            for (const auto &path : paths)
            {
                const std::string content = fs_.read_all(path);
                const auto rows = codec.decode(content);
                copy_rows(W, config.destination, schema, rows);
                stats.total_bytes_processed += static_cast<int64_t>(content.size());
                stats.output_rows += static_cast<int64_t>(rows.size());
            }
        }

        W.commit();
        std::cout << "[PG] Loaded " << stats.output_rows << " rows into " << to_table_spec(config.destination) << "\n";
        return stats;
    }

    JobStatistics PostgresWarehouse::execute_copy(const CopyJobConfig &config)
    {
        if (config.sources.empty())
            throw ValidationError("Copy job has no source tables");

        pqxx::connection C(conn_str_);
        pqxx::work W(C);

        std::vector<Table> sources;
        for (const auto &source : config.sources)
        {
            auto table = lookup_table(W, source);
            if (!table)
                throw WarehouseError(not_found_table(source), true);
            sources.push_back(std::move(*table));
        }

        const TableSchema schema = prepare_destination(W, config.destination, sources.front().schema,
                                                       config.write_disposition, config.create_disposition);
        const std::string columns = column_list(W, schema);
        const std::string target = qualified(W, config.destination);

        JobStatistics stats;
        for (const auto &source : sources)
        {
            auto r = W.exec("INSERT INTO " + target + " (" + columns + ") SELECT " + columns +
                            " FROM " + qualified(W, source.reference));
            stats.output_rows += static_cast<int64_t>(r.affected_rows());
            stats.total_bytes_processed += source.num_bytes;
        }

        W.commit();
        std::cout << "[PG] Copied " << sources.size() << " table(s) into " << to_table_spec(config.destination) << "\n";
        return stats;
    }

    // flatten_results has no effect: tables here are always flat
    JobStatistics PostgresWarehouse::execute_query(const std::string &project_id, const QueryJobConfig &config)
    {
        if (!config.destination)
            throw ValidationError("Query job needs a destination table");

        const std::string sql = trim_statement(rewrite_table_references(config.query, config.use_legacy_sql));

        pqxx::connection C(conn_str_);
        pqxx::work W(C);

        JobStatistics stats = explain(W, project_id, sql);
        const std::string target = qualified(W, *config.destination);

        auto existing = lookup_table(W, *config.destination);
        if (!existing)
        {
            if (config.create_disposition == CreateDisposition::CreateNever)
                throw WarehouseError(not_found_table(*config.destination), true);
            stats.output_rows = static_cast<int64_t>(W.exec("CREATE TABLE " + target + " AS " + sql).affected_rows());
        }
        else
        {
            if (config.write_disposition == WriteDisposition::WriteEmpty && existing->num_rows > 0)
                throw ValidationError("Already Exists: Table " + to_table_spec(*config.destination) + " is not empty");
            if (config.write_disposition == WriteDisposition::WriteTruncate)
                W.exec("TRUNCATE TABLE " + target);
            stats.output_rows = static_cast<int64_t>(W.exec("INSERT INTO " + target + " " + sql).affected_rows());
        }

        W.commit();
        std::cout << "[PG] Query wrote " << stats.output_rows << " rows into " << to_table_spec(*config.destination) << "\n";
        return stats;
    }

    // =========================================================================
    // EXTRACT
    // =========================================================================
    // "<dir>/*.parquet" becomes <dir>/000000000000.parquet, ...001.parquet, ...
    // one file per rows_per_extract_file rows. An empty table still yields one
    // (empty) file.
    // =========================================================================
    JobStatistics PostgresWarehouse::execute_extract(const ExtractJobConfig &config)
    {
        if (config.destination_format != "PARQUET")
            throw ValidationError("Unsupported destination format: " + config.destination_format);
        if (config.destination_uris.size() != 1)
            throw ValidationError("Extract job needs exactly one destination URI");

        const std::string &uri = config.destination_uris.front();
        const size_t slash = uri.rfind('/');
        if (slash == std::string::npos || uri.substr(slash + 1) != "*.parquet")
            throw ValidationError("Extract destination must end in /*.parquet: " + uri);
        const std::string dir = uri.substr(0, slash);

        pqxx::connection C(conn_str_);
        pqxx::work W(C);

        auto table = lookup_table(W, config.source);
        if (!table)
            throw WarehouseError(not_found_table(config.source), true);

        pqxx::stateless_cursor<pqxx::cursor_base::read_only, pqxx::cursor_base::owned> cursor(
            W,
            "SELECT " + extract_select_list(W, table->schema) + " FROM " + qualified(W, config.source),
            "bulkbridge_extract",
            false);
        const int64_t total = static_cast<int64_t>(cursor.size());

        JobStatistics stats;
        int64_t files = 0;
        int64_t begin = 0;
        do
        {
            const int64_t end = std::min(total, begin + rows_per_extract_file_);
            std::vector<TableRow> rows;
            if (end > begin)
            {
                auto page = cursor.retrieve(begin, end);
                rows.reserve(page.size());
                for (const auto &r : page)
                {
                    TableRow row;
                    for (size_t i = 0; i < table->schema.fields.size(); ++i)
                    {
                        const auto &field = table->schema.fields[i];
                        if (!r[static_cast<int>(i)].is_null())
                            row.set(field.name, read_field(r[static_cast<int>(i)], field.type));
                    }
                    rows.push_back(std::move(row));
                }
            }

            char name[32];
            std::snprintf(name, sizeof(name), "%012lld.parquet", static_cast<long long>(files));
            stats.total_bytes_processed += ParquetWriter::write(rows, table->schema, fs_, StagingFileSystem::join(dir, name));
            stats.output_rows += static_cast<int64_t>(rows.size());
            ++files;
            begin = end;
        } while (begin < total);

        stats.destination_uri_file_counts.push_back(files);
        W.commit();
        std::cout << "[PG] Extracted " << stats.output_rows << " rows of " << to_table_spec(config.source)
                  << " into " << files << " file(s)\n";
        return stats;
    }

    // =========================================================================
    // TABLES AND DATASETS
    // =========================================================================

    std::optional<Table> PostgresWarehouse::get_table(const TableReference &ref)
    {
        pqxx::connection C(conn_str_);
        pqxx::work W(C);
        return lookup_table(W, ref);
    }

    void PostgresWarehouse::create_table(const Table &table)
    {
        pqxx::connection C(conn_str_);
        pqxx::work W(C);

        if (!schema_exists(W, table.reference.dataset_id))
            throw WarehouseError("Not found: Dataset " + table.reference.project_id + ":" + table.reference.dataset_id, true);

        const std::string target = qualified(W, table.reference);
        W.exec("CREATE TABLE IF NOT EXISTS " + target + " (" + column_definitions(W, table.schema) + ")");
        if (!table.description.empty())
            W.exec("COMMENT ON TABLE " + target + " IS " + W.quote(table.description));
        W.commit();
    }

    void PostgresWarehouse::delete_table(const TableReference &ref)
    {
        pqxx::connection C(conn_str_);
        pqxx::work W(C);

        if (!table_exists(W, ref))
            throw WarehouseError(not_found_table(ref), true);

        W.exec("DROP TABLE " + qualified(W, ref));
        W.exec("DELETE FROM bulkbridge_meta.insert_ids WHERE table_spec = $1", pqxx::params{to_table_spec(ref)});
        W.commit();
    }

    std::optional<Dataset> PostgresWarehouse::get_dataset(const std::string &project_id, const std::string &dataset_id)
    {
        pqxx::connection C(conn_str_);
        pqxx::work W(C);

        if (!schema_exists(W, dataset_id))
            return std::nullopt;

        Dataset dataset{project_id, dataset_id, "local", ""};
        auto meta = W.exec("SELECT project_id, location, description FROM bulkbridge_meta.datasets WHERE dataset_id = $1",
                           pqxx::params{dataset_id});
        if (!meta.empty())
        {
            dataset.project_id = meta[0][0].as<std::string>();
            dataset.location = meta[0][1].as<std::string>();
            dataset.description = meta[0][2].as<std::string>();
        }
        return dataset;
    }

    void PostgresWarehouse::create_dataset(const std::string &project_id,
                                           const std::string &dataset_id,
                                           const std::string &location,
                                           const std::string &description)
    {
        pqxx::connection C(conn_str_);
        pqxx::work W(C);
        W.exec("CREATE SCHEMA IF NOT EXISTS " + W.quote_name(dataset_id));
        W.exec("INSERT INTO bulkbridge_meta.datasets (dataset_id, project_id, location, description) "
               "VALUES ($1, $2, $3, $4) ON CONFLICT (dataset_id) DO NOTHING",
               pqxx::params{dataset_id, project_id, location, description});
        W.commit();
        std::cout << "[PG] Created dataset " << project_id << ":" << dataset_id << " (" << location << ")\n";
    }

    void PostgresWarehouse::delete_dataset(const std::string &project_id, const std::string &dataset_id)
    {
        pqxx::connection C(conn_str_);
        pqxx::work W(C);

        if (!schema_exists(W, dataset_id))
            throw WarehouseError("Not found: Dataset " + project_id + ":" + dataset_id, true);

        W.exec("DROP SCHEMA " + W.quote_name(dataset_id) + " CASCADE");
        W.exec("DELETE FROM bulkbridge_meta.datasets WHERE dataset_id = $1", pqxx::params{dataset_id});
        W.commit();
    }

    bool PostgresWarehouse::is_table_empty(const TableReference &ref)
    {
        pqxx::connection C(conn_str_);
        pqxx::work W(C);

        if (!table_exists(W, ref))
            throw WarehouseError(not_found_table(ref), true);
        return W.exec("SELECT NOT EXISTS (SELECT 1 FROM " + qualified(W, ref) + ")")[0][0].as<bool>();
    }

    // One transaction: claim each unique id, then COPY the rows whose id was new
    int64_t PostgresWarehouse::insert_all(const TableReference &ref,
                                          const std::vector<TableRow> &rows,
                                          const std::vector<std::string> &unique_ids)
    {
        if (rows.size() != unique_ids.size())
            throw ValidationError("insert_all needs exactly one unique id per row");

        try
        {
            pqxx::connection C(conn_str_);
            pqxx::work W(C);

            auto table = lookup_table(W, ref);
            if (!table)
                throw WarehouseError(not_found_table(ref), true);

            const std::string spec = to_table_spec(ref);
            const RowCsvCodec codec(table->schema);

            int64_t bytes = 0;
            std::vector<TableRow> accepted;
            accepted.reserve(rows.size());
            for (size_t i = 0; i < rows.size(); ++i)
            {
                bytes += static_cast<int64_t>(codec.encode(rows[i]).size());
                auto claimed = W.exec("INSERT INTO bulkbridge_meta.insert_ids (table_spec, unique_id) "
                                      "VALUES ($1, $2) ON CONFLICT DO NOTHING",
                                      pqxx::params{spec, unique_ids[i]});
                if (claimed.affected_rows() == 1)
                    accepted.push_back(rows[i]);
            }

            copy_rows(W, ref, table->schema, accepted);
            W.commit();

            if (accepted.size() < rows.size())
            {
                std::cout << "[PG] insert_all " << spec << ": dropped " << rows.size() - accepted.size()
                          << " duplicate row(s)\n";
            }
            return bytes;
        }
        catch (const pqxx::sql_error &e)
        {
            std::cerr << "[PG ERROR] insert_all into " << to_table_spec(ref) << " failed: " << e.what() << "\n";
            throw WarehouseError(e.what());
        }
    }

    void PostgresWarehouse::patch_table_description(const TableReference &ref, const std::string &description)
    {
        pqxx::connection C(conn_str_);
        pqxx::work W(C);

        if (!table_exists(W, ref))
            throw WarehouseError(not_found_table(ref), true);
        W.exec("COMMENT ON TABLE " + qualified(W, ref) + " IS " + W.quote(description));
        W.commit();
    }

} // namespace BulkBridge
