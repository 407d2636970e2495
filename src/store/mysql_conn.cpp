#include "store/mysql_conn.hpp"
#include <glog/logging.h>
#include <boost/throw_exception.hpp>
#include "common/defer.hpp"
#include "common/exceptions.hpp"

namespace codejudge::store {
using namespace std;

mysql_conn::mysql_conn(const database_config &config) : dbcfg(config) {}

mysql_conn::~mysql_conn() {
    if (con) mysql_close(con);
}

void mysql_conn::connect() {
    scoped_lock guard(mut);
    connect_nolock();
}

void mysql_conn::connect_nolock() {
    if (con) {
        mysql_close(con);
        con = nullptr;
    }

    LOG(INFO) << "MySQL: Setup connection with server " << dbcfg.host << ":" << dbcfg.port;
    con = mysql_init(nullptr);
    if (!con) BOOST_THROW_EXCEPTION(database_error("MySQL: unable to allocate connection"));

    unsigned timeout = 5;
    mysql_options(con, MYSQL_OPT_CONNECT_TIMEOUT, &timeout);
    mysql_options(con, MYSQL_SET_CHARSET_NAME, "utf8mb4");

    // CLIENT_FOUND_ROWS: UPDATE 返回匹配的行数而不是实际改变的行数，条件更新依赖这一点
    if (!mysql_real_connect(con, dbcfg.host.c_str(), dbcfg.user.c_str(), dbcfg.password.c_str(),
                            dbcfg.database.c_str(), dbcfg.port, nullptr, CLIENT_FOUND_ROWS)) {
        string message = mysql_error(con);
        mysql_close(con);
        con = nullptr;
        LOG(ERROR) << "MySQL: Unable to connect to database server " << dbcfg.host << ":" << dbcfg.port << ", " << message;
        BOOST_THROW_EXCEPTION(database_error("MySQL: unable to connect to " + dbcfg.host + ": " + message));
    }

    // 所有时间戳都按 UTC 存储
    if (mysql_query(con, "SET time_zone = '+00:00'"))
        LOG(WARNING) << "MySQL: Unable to set session time zone: " << mysql_error(con);

    LOG(INFO) << "MySQL: Connecting to database server succeeded " << dbcfg.host << ":" << dbcfg.port;
}

void mysql_conn::ensure_connected_nolock() {
    if (con && mysql_ping(con) == 0) return;
    if (con) LOG(WARNING) << "MySQL: Lost connection, trying to reconnect";
    connect_nolock();
}

bool mysql_conn::ping() {
    scoped_lock guard(mut);
    try {
        ensure_connected_nolock();
        return true;
    } catch (database_error &ex) {
        LOG(ERROR) << "MySQL connection test failed: " << ex.what();
        return false;
    }
}

mysql_conn::statement_result mysql_conn::run_statement(const string &sql, const vector<sql_value> &params) {
    scoped_lock guard(mut);
    ensure_connected_nolock();

    MYSQL_STMT *stmt = mysql_stmt_init(con);
    if (!stmt) BOOST_THROW_EXCEPTION(database_error(string("MySQL: unable to create statement: ") + mysql_error(con)));
    defer { mysql_stmt_close(stmt); };

    if (mysql_stmt_prepare(stmt, sql.c_str(), sql.size()))
        BOOST_THROW_EXCEPTION(database_error(string("MySQL: unable to prepare statement: ") + mysql_stmt_error(stmt)));

    if (mysql_stmt_param_count(stmt) != params.size())
        BOOST_THROW_EXCEPTION(database_error("MySQL: parameter count mismatch in " + sql));

    // MYSQL_BIND 只保存指针，参数的副本必须活到 mysql_stmt_execute 结束
    vector<sql_value> values = params;
    vector<MYSQL_BIND> binds(values.size());
    vector<unsigned long> lengths(values.size());
    for (size_t i = 0; i < values.size(); ++i) {
        MYSQL_BIND &bind = binds[i];
        if (auto *integer = get_if<long long>(&values[i])) {
            bind.buffer_type = MYSQL_TYPE_LONGLONG;
            bind.buffer = integer;
        } else if (auto *real = get_if<double>(&values[i])) {
            bind.buffer_type = MYSQL_TYPE_DOUBLE;
            bind.buffer = real;
        } else if (auto *text = get_if<string>(&values[i])) {
            lengths[i] = text->size();
            bind.buffer_type = MYSQL_TYPE_STRING;
            bind.buffer = text->data();
            bind.buffer_length = text->size();
            bind.length = &lengths[i];
        } else {
            bind.buffer_type = MYSQL_TYPE_NULL;
        }
    }

    if (!binds.empty() && mysql_stmt_bind_param(stmt, binds.data()))
        BOOST_THROW_EXCEPTION(database_error(string("MySQL: unable to bind parameters: ") + mysql_stmt_error(stmt)));

    if (mysql_stmt_execute(stmt))
        BOOST_THROW_EXCEPTION(database_error(string("MySQL: unable to execute statement: ") + mysql_stmt_error(stmt)));

    return {(size_t)mysql_stmt_affected_rows(stmt), (long long)mysql_stmt_insert_id(stmt)};
}

size_t mysql_conn::execute(const string &sql, const vector<sql_value> &params) {
    return run_statement(sql, params).affected_rows;
}

long long mysql_conn::insert(const string &sql, const vector<sql_value> &params) {
    return run_statement(sql, params).insert_id;
}

vector<sql_row> mysql_conn::query(const string &sql) {
    scoped_lock guard(mut);
    ensure_connected_nolock();

    if (mysql_real_query(con, sql.c_str(), sql.size()))
        BOOST_THROW_EXCEPTION(database_error(string("MySQL: query failed: ") + mysql_error(con)));

    MYSQL_RES *res = mysql_store_result(con);
    if (!res) {
        if (mysql_field_count(con) == 0) return {};
        BOOST_THROW_EXCEPTION(database_error(string("MySQL: unable to fetch result: ") + mysql_error(con)));
    }
    defer { mysql_free_result(res); };

    vector<sql_row> rows;
    unsigned fields = mysql_num_fields(res);
    while (MYSQL_ROW row = mysql_fetch_row(res)) {
        unsigned long *lengths = mysql_fetch_lengths(res);
        sql_row values(fields);
        for (unsigned i = 0; i < fields; ++i)
            if (row[i]) values[i] = string(row[i], lengths[i]);
        rows.push_back(move(values));
    }
    return rows;
}

}  // namespace codejudge::store
