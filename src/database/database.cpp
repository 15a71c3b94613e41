#include "../../inc/database.h"
#include <filesystem>
#include <iostream>

StmtGuard::StmtGuard(sqlite3_stmt *stmt) : stmt_(stmt) {}

StmtGuard::~StmtGuard() {
  if (stmt_) {
    sqlite3_finalize(stmt_);
  }
}

sqlite3_stmt *StmtGuard::get() { return stmt_; }

StmtGuard::operator sqlite3_stmt *() { return stmt_; }

bool Database::connect(const std::string &db_name) {
  if (db) {
    sqlite3_close(db);
    db = nullptr;
  }

  std::error_code ec;
  std::filesystem::remove(db_name, ec);
  if (ec) {
    std::cerr << "Could not remove old database " << db_name << ": "
              << ec.message() << "\n";
    return false;
  }

  if (sqlite3_open(db_name.c_str(), &db) != SQLITE_OK) {
    std::cerr << "SQLite3 connection error: " << sqlite3_errmsg(db) << "\n";
    sqlite3_close(db);
    db = nullptr;
    return false;
  }
  return true;
}

bool Database::exec(const std::string &sql) {
  char *err_msg = nullptr;
  if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err_msg) != SQLITE_OK) {
    std::cerr << "SQL error: " << (err_msg ? err_msg : "unknown") << "\n";
    sqlite3_free(err_msg);
    return false;
  }
  return true;
}

void Database::rollback() {
  if (!exec("ROLLBACK;")) {
    std::cerr << "Rollback failed, export may be incomplete\n";
  }
}

bool Database::create_tables() {
  if (!db) {
    std::cerr << "Database is not connected." << std::endl;
    return false;
  }
  return exec("CREATE TABLE IF NOT EXISTS site ("
              "domain TEXT NOT NULL );") &&
         exec("CREATE TABLE IF NOT EXISTS pages ("
              "path TEXT PRIMARY KEY,"
              "url TEXT NOT NULL );") &&
         exec("CREATE TABLE IF NOT EXISTS links ("
              "page_path TEXT NOT NULL REFERENCES pages(path),"
              "position INTEGER NOT NULL,"
              "url TEXT NOT NULL );") &&
         exec("CREATE TABLE IF NOT EXISTS assets ("
              "page_path TEXT NOT NULL REFERENCES pages(path),"
              "position INTEGER NOT NULL,"
              "url TEXT NOT NULL );");
}

bool Database::insert_urls(const char *table, const std::string &path,
                           const std::vector<std::string> &urls) {
  sqlite3_stmt *raw_stmt;
  std::string sql = std::string("INSERT INTO ") + table +
                    " (page_path, position, url) VALUES (?, ?, ?);";
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &raw_stmt, nullptr) !=
      SQLITE_OK) {
    std::cerr << "Failed to prepare statement: " << sqlite3_errmsg(db) << "\n";
    return false;
  }
  StmtGuard stmt(raw_stmt);

  for (size_t i = 0; i < urls.size(); ++i) {
    sqlite3_reset(stmt);
    if (sqlite3_bind_text(stmt, 1, path.c_str(), -1, SQLITE_STATIC) !=
            SQLITE_OK ||
        sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(i)) !=
            SQLITE_OK ||
        sqlite3_bind_text(stmt, 3, urls[i].c_str(), -1, SQLITE_STATIC) !=
            SQLITE_OK) {
      std::cerr << "Failed to bind " << table << " row: " << sqlite3_errmsg(db)
                << "\n";
      return false;
    }
    if (sqlite3_step(stmt) != SQLITE_DONE) {
      std::cerr << "Error executing query: " << sqlite3_errmsg(db) << "\n";
      return false;
    }
  }
  return true;
}

bool Database::insert_page(const std::string &path, const Page &page) {
  sqlite3_stmt *raw_stmt;
  std::string sql = "INSERT INTO pages (path, url) VALUES (?, ?);";
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &raw_stmt, nullptr) !=
      SQLITE_OK) {
    std::cerr << "Failed to prepare statement: " << sqlite3_errmsg(db) << "\n";
    return false;
  }
  StmtGuard stmt(raw_stmt);

  if (sqlite3_bind_text(stmt, 1, path.c_str(), -1, SQLITE_STATIC) !=
      SQLITE_OK) {
    std::cerr << "Failed to bind path: " << sqlite3_errmsg(db) << "\n";
    return false;
  }
  if (sqlite3_bind_text(stmt, 2, page.url.c_str(), -1, SQLITE_STATIC) !=
      SQLITE_OK) {
    std::cerr << "Failed to bind URL: " << sqlite3_errmsg(db) << "\n";
    return false;
  }

  if (sqlite3_step(stmt) != SQLITE_DONE) {
    std::cerr << "Error executing query: " << sqlite3_errmsg(db) << "\n";
    return false;
  }

  return insert_urls("links", path, page.links) &&
         insert_urls("assets", path, page.assets);
}

bool Database::save_site(const Site &site) {
  if (!db) {
    std::cerr << "Database is not connected." << std::endl;
    return false;
  }
  if (!exec("BEGIN TRANSACTION;")) {
    return false;
  }

  sqlite3_stmt *raw_stmt;
  if (sqlite3_prepare_v2(db, "INSERT INTO site (domain) VALUES (?);", -1,
                         &raw_stmt, nullptr) != SQLITE_OK) {
    std::cerr << "Failed to prepare statement: " << sqlite3_errmsg(db) << "\n";
    rollback();
    return false;
  }
  {
    StmtGuard stmt(raw_stmt);
    if (sqlite3_bind_text(stmt, 1, site.domain.c_str(), -1, SQLITE_STATIC) !=
            SQLITE_OK ||
        sqlite3_step(stmt) != SQLITE_DONE) {
      std::cerr << "Error saving domain: " << sqlite3_errmsg(db) << "\n";
      rollback();
      return false;
    }
  }

  for (const auto &entry : site.pages) {
    if (!insert_page(entry.first, entry.second)) {
      rollback();
      return false;
    }
  }

  return exec("COMMIT;");
}

Database::~Database() {
  if (db)
    sqlite3_close(db);
}

sqlite3 *Database::get_db() { return db; }
