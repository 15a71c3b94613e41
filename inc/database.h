#pragma once
#include "page.h"
#include <sqlite3.h>
#include <string>
#include <vector>

// SQLite export of a finished sitemap. The file is recreated on connect.
class Database {
public:
  Database() = default;
  ~Database();

  Database(const Database &) = delete;
  Database &operator=(const Database &) = delete;

  bool connect(const std::string &db_name);
  bool create_tables();
  bool save_site(const Site &site);
  bool is_connected() const { return db != nullptr; }
  sqlite3 *get_db();

private:
  bool exec(const std::string &sql);
  void rollback();
  bool insert_page(const std::string &path, const Page &page);
  bool insert_urls(const char *table, const std::string &path,
                   const std::vector<std::string> &urls);

  sqlite3 *db = nullptr;
};

class StmtGuard {
public:
  StmtGuard(sqlite3_stmt *stmt);
  ~StmtGuard();

  sqlite3_stmt *get();
  operator sqlite3_stmt *();

private:
  sqlite3_stmt *stmt_;
  StmtGuard(const StmtGuard &) = delete;
  StmtGuard &operator=(const StmtGuard &) = delete;
};
