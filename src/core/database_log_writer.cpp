#include "core/database_log_writer.h"
#include <algorithm>
#include <iostream>

namespace {

constexpr size_t MAX_FUNCTION_LENGTH = 255;
constexpr size_t MAX_MESSAGE_LENGTH = 10000;

// Length of the UTF-8 sequence starting at lead, 0 if lead cannot start one.
size_t utf8SequenceLength(unsigned char lead) {
  if (lead < 0x80)
    return 1;
  if ((lead & 0xE0) == 0xC0)
    return 2;
  if ((lead & 0xF0) == 0xE0)
    return 3;
  if ((lead & 0xF8) == 0xF0)
    return 4;
  return 0;
}

// PostgreSQL rejects text with invalid UTF-8; payload values quoted in log
// messages come straight from source systems.
std::string sanitizeUTF8(const std::string &input, size_t maxLength) {
  std::string result;
  result.reserve(std::min(input.size(), maxLength));

  size_t i = 0;
  while (i < input.size() && result.size() < maxLength) {
    unsigned char c = static_cast<unsigned char>(input[i]);
    size_t len = utf8SequenceLength(c);
    if (len == 1) {
      if (c >= 0x20 || c == '\n' || c == '\r' || c == '\t')
        result += static_cast<char>(c);
      ++i;
      continue;
    }
    if (len == 0 || i + len > input.size()) {
      ++i;
      continue;
    }
    bool valid = true;
    for (size_t k = 1; k < len; ++k) {
      if ((static_cast<unsigned char>(input[i + k]) & 0xC0) != 0x80) {
        valid = false;
        break;
      }
    }
    if (valid && result.size() + len <= maxLength)
      result.append(input, i, len);
    i += valid ? len : 1;
  }
  return result;
}

} // namespace

DatabaseLogWriter::DatabaseLogWriter(const std::string &connectionString)
    : connectionString_(connectionString), statementPrepared_(false),
      enabled_(true) {
  try {
    conn_ = std::make_unique<pqxx::connection>(connectionString_);
    std::lock_guard<std::mutex> lock(mutex_);
    ensureTableUnlocked();
    prepareStatementUnlocked();
  } catch (const std::exception &e) {
    enabled_ = false;
    conn_.reset();
    std::cerr << "DatabaseLogWriter: Failed to establish connection: "
              << e.what() << std::endl;
  }
}

void DatabaseLogWriter::ensureTableUnlocked() {
  pqxx::work txn(*conn_);
  txn.exec("CREATE SCHEMA IF NOT EXISTS metadata");
  txn.exec("CREATE TABLE IF NOT EXISTS metadata.logs ("
           "id BIGSERIAL PRIMARY KEY,"
           "ts TIMESTAMP NOT NULL DEFAULT NOW(),"
           "level VARCHAR(20) NOT NULL,"
           "category VARCHAR(50) NOT NULL,"
           "function VARCHAR(255),"
           "message TEXT NOT NULL)");
  txn.commit();
}

void DatabaseLogWriter::prepareStatementUnlocked() {
  if (statementPrepared_ || !conn_ || !conn_->is_open())
    return;

  try {
    conn_->prepare("timevault_log_insert",
                   "INSERT INTO metadata.logs (ts, level, category, function, "
                   "message) VALUES (NOW(), $1, $2, $3, $4)");
    statementPrepared_ = true;
  } catch (const std::exception &e) {
    enabled_ = false;
    std::cerr << "DatabaseLogWriter: Failed to prepare statement: " << e.what()
              << std::endl;
  }
}

bool DatabaseLogWriter::writeParsed(const std::string &levelStr,
                                    const std::string &categoryStr,
                                    const std::string &function,
                                    const std::string &message) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!enabled_ || !conn_ || !conn_->is_open()) {
    enabled_ = false;
    return false;
  }

  try {
    prepareStatementUnlocked();
    if (!statementPrepared_)
      return false;

    pqxx::work txn(*conn_);
    txn.exec_prepared("timevault_log_insert", levelStr, categoryStr,
                      sanitizeUTF8(function, MAX_FUNCTION_LENGTH),
                      sanitizeUTF8(message, MAX_MESSAGE_LENGTH));
    txn.commit();
    return true;
  } catch (const pqxx::broken_connection &e) {
    enabled_ = false;
    conn_.reset();
    std::cerr << "DatabaseLogWriter: Connection broken: " << e.what()
              << std::endl;
    return false;
  } catch (const std::exception &e) {
    std::cerr << "DatabaseLogWriter: Failed to write log entry: " << e.what()
              << std::endl;
    return false;
  }
}

void DatabaseLogWriter::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  conn_.reset();
  enabled_ = false;
}

bool DatabaseLogWriter::isEnabled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return enabled_;
}

bool DatabaseLogWriter::isOpen() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return conn_ && conn_->is_open() && enabled_;
}
