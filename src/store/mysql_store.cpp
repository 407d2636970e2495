#include "store/mysql_store.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <boost/throw_exception.hpp>
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace codejudge::store {
using namespace std;
using namespace nlohmann;

static const char *CREATE_STATUSES_TABLE = R"(
CREATE TABLE IF NOT EXISTS statuses (
    id INT PRIMARY KEY,
    name VARCHAR(50) NOT NULL UNIQUE
))";

static const char *CREATE_SUBMISSIONS_TABLE = R"(
CREATE TABLE IF NOT EXISTS submissions (
    id BIGINT AUTO_INCREMENT PRIMARY KEY,
    source_code MEDIUMTEXT NOT NULL,
    language_id INT NOT NULL,
    stdin MEDIUMTEXT NULL,
    expected_output MEDIUMTEXT NULL,
    time_limit INT NULL,
    memory_limit INT NULL,
    status_id INT NOT NULL,
    stdout MEDIUMTEXT NULL,
    stderr MEDIUMTEXT NULL,
    compile_output MEDIUMTEXT NULL,
    exit_code INT NULL,
    `signal` INT NULL,
    wall_time DOUBLE NULL,
    cpu_time DOUBLE NULL,
    memory_peak BIGINT NULL,
    error_message TEXT NULL,
    execution_metadata JSON NULL,
    created_at DATETIME(6) NOT NULL,
    started_at DATETIME(6) NULL,
    finished_at DATETIME(6) NULL,
    INDEX idx_submissions_status (status_id)
))";

static const char *SELECT_COLUMNS =
    "id, source_code, language_id, stdin, expected_output, time_limit, memory_limit, status_id, "
    "stdout, stderr, compile_output, exit_code, `signal`, wall_time, cpu_time, memory_peak, "
    "error_message, execution_metadata, created_at, started_at, finished_at";

template <typename T>
static optional<T> column(const sql_row &row, size_t index) {
    if (!row.at(index)) return nullopt;
    return boost::lexical_cast<T>(*row.at(index));
}

static optional<chrono::system_clock::time_point> time_column(const sql_row &row, size_t index) {
    if (!row.at(index)) return nullopt;
    auto tp = parse_iso8601(*row.at(index));
    if (!tp) BOOST_THROW_EXCEPTION(database_error("MySQL: malformed timestamp " + *row.at(index)));
    return tp;
}

static submission parse_submission(const sql_row &row) {
    submission submit;
    submit.id = column<long long>(row, 0).value();
    submit.source_code = row.at(1).value_or("");
    submit.language_id = column<int>(row, 2).value();
    submit.stdin_text = row.at(3);
    submit.expected_output = row.at(4);
    submit.time_limit = column<int>(row, 5).value_or(0);
    submit.memory_limit = column<int>(row, 6).value_or(0);

    int stat_id = column<int>(row, 7).value();
    auto stat = status_from_id(stat_id);
    if (!stat) BOOST_THROW_EXCEPTION(database_error("MySQL: unknown status id " + std::to_string(stat_id)));
    submit.status = *stat;

    submit.stdout_text = row.at(8);
    submit.stderr_text = row.at(9);
    submit.compile_output = row.at(10);
    submit.exit_code = column<int>(row, 11);
    submit.signal = column<int>(row, 12);
    submit.wall_time = column<double>(row, 13);
    submit.cpu_time = column<double>(row, 14);
    submit.memory_peak_kb = column<long long>(row, 15);
    submit.error_message = row.at(16);
    if (row.at(17)) submit.execution_metadata = json::parse(*row.at(17));
    submit.created_at = time_column(row, 18).value();
    submit.started_at = time_column(row, 19);
    submit.finished_at = time_column(row, 20);
    return submit;
}

mysql_store::mysql_store(const database_config &config) : db(config) {}

void mysql_store::ensure_schema() {
    db.execute(CREATE_STATUSES_TABLE);
    db.execute(CREATE_SUBMISSIONS_TABLE);
    for (int id = status_id(status::QUEUED); id <= status_id(status::EXEC_FORMAT_ERROR); ++id) {
        db.execute("INSERT IGNORE INTO statuses (id, name) VALUES (?, ?)",
                   {(long long)id, string(get_display_message(*status_from_id(id)))});
    }
    LOG(INFO) << "MySQL: schema is ready";
}

bool mysql_store::ping() {
    return db.ping();
}

submission mysql_store::create(const submission &draft) {
    long long id = db.insert(
        "INSERT INTO submissions (source_code, language_id, stdin, expected_output, time_limit, memory_limit, status_id, created_at) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, NOW(6))",
        {draft.source_code, (long long)draft.language_id, to_sql_value(draft.stdin_text), to_sql_value(draft.expected_output),
         (long long)draft.time_limit, (long long)draft.memory_limit, (long long)status_id(status::QUEUED)});

    auto created = find(id);
    if (!created) BOOST_THROW_EXCEPTION(database_error("MySQL: submission " + std::to_string(id) + " vanished after insertion"));
    return *created;
}

optional<submission> mysql_store::find(long long id) {
    auto rows = db.query(fmt::format("SELECT {} FROM submissions WHERE id = {}", SELECT_COLUMNS, id));
    if (rows.empty()) return nullopt;
    try {
        return parse_submission(rows.front());
    } catch (boost::bad_lexical_cast &ex) {
        BOOST_THROW_EXCEPTION(database_error("MySQL: malformed row for submission " + std::to_string(id) + ": " + ex.what()));
    } catch (json::exception &ex) {
        BOOST_THROW_EXCEPTION(database_error("MySQL: malformed execution metadata for submission " + std::to_string(id) + ": " + ex.what()));
    }
}

bool mysql_store::try_claim(long long id) {
    return db.execute("UPDATE submissions SET status_id = ?, started_at = NOW(6) WHERE id = ? AND status_id = ?",
                      {(long long)status_id(status::PROCESSING), id, (long long)status_id(status::QUEUED)}) == 1;
}

bool mysql_store::complete(long long id, const submission_outcome &outcome) {
    sql_value metadata = nullptr;
    if (outcome.execution_metadata) metadata = outcome.execution_metadata->dump();

    return db.execute(
               "UPDATE submissions SET status_id = ?, stdout = ?, stderr = ?, compile_output = ?, exit_code = ?, "
               "`signal` = ?, wall_time = ?, cpu_time = ?, memory_peak = ?, error_message = ?, execution_metadata = ?, "
               "finished_at = NOW(6) WHERE id = ? AND status_id = ?",
               {(long long)status_id(outcome.status), to_sql_value(outcome.stdout_text), to_sql_value(outcome.stderr_text),
                to_sql_value(outcome.compile_output), to_sql_value(outcome.exit_code), to_sql_value(outcome.signal),
                to_sql_value(outcome.wall_time), to_sql_value(outcome.cpu_time), to_sql_value(outcome.memory_peak_kb),
                to_sql_value(outcome.error_message), metadata, id, (long long)status_id(status::PROCESSING)}) == 1;
}

bool mysql_store::force_internal_error(long long id, const string &error_message) {
    return db.execute("UPDATE submissions SET status_id = ?, error_message = ?, finished_at = NOW(6) "
                      "WHERE id = ? AND status_id IN (?, ?)",
                      {(long long)status_id(status::INTERNAL_ERROR), error_message, id,
                       (long long)status_id(status::QUEUED), (long long)status_id(status::PROCESSING)}) == 1;
}

bool mysql_store::update_if_queued(long long id, const submission_edit &edit) {
    string assignments = "id = id";
    vector<sql_value> params;
    if (edit.stdin_text) assignments += ", stdin = ?", params.push_back(*edit.stdin_text);
    if (edit.expected_output) assignments += ", expected_output = ?", params.push_back(*edit.expected_output);
    if (edit.time_limit) assignments += ", time_limit = ?", params.push_back((long long)*edit.time_limit);
    if (edit.memory_limit) assignments += ", memory_limit = ?", params.push_back((long long)*edit.memory_limit);
    params.push_back(id);
    params.push_back((long long)status_id(status::QUEUED));

    return db.execute("UPDATE submissions SET " + assignments + " WHERE id = ? AND status_id = ?", params) == 1;
}

map<status, size_t> mysql_store::count_by_status() {
    map<status, size_t> counts;
    for (auto &row : db.query("SELECT status_id, COUNT(*) FROM submissions GROUP BY status_id")) {
        auto stat = status_from_id(column<int>(row, 0).value());
        if (!stat) {
            LOG(WARNING) << "MySQL: ignoring submissions with unknown status id " << row.at(0).value_or("NULL");
            continue;
        }
        counts[*stat] = column<size_t>(row, 1).value_or(0);
    }
    return counts;
}

}  // namespace codejudge::store
