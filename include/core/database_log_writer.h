#ifndef DATABASE_LOG_WRITER_H
#define DATABASE_LOG_WRITER_H

#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>

// Writes log entries into metadata.logs over a single dedicated connection.
// Any connection failure disables the writer for the rest of the process.
class DatabaseLogWriter {
private:
  std::unique_ptr<pqxx::connection> conn_;
  std::string connectionString_;
  bool statementPrepared_;
  bool enabled_;
  mutable std::mutex mutex_;

  void ensureTableUnlocked();
  void prepareStatementUnlocked();

public:
  explicit DatabaseLogWriter(const std::string &connectionString);
  ~DatabaseLogWriter() { close(); }

  DatabaseLogWriter(const DatabaseLogWriter &) = delete;
  DatabaseLogWriter &operator=(const DatabaseLogWriter &) = delete;

  void close();
  bool isOpen() const;
  bool isEnabled() const;

  bool writeParsed(const std::string &levelStr, const std::string &categoryStr,
                   const std::string &function, const std::string &message);
};

#endif
