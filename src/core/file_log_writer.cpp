#include "core/file_log_writer.h"
#include <filesystem>
#include <iostream>
#include <system_error>

FileLogWriter::FileLogWriter(const std::string &fileName, size_t maxFileSize,
                             int maxBackupFiles)
    : fileName_(fileName), maxFileSize_(maxFileSize),
      maxBackupFiles_(maxBackupFiles), bytesWritten_(0) {
  std::filesystem::path filePath(fileName_);
  std::error_code ec;
  if (filePath.has_parent_path()) {
    std::filesystem::create_directories(filePath.parent_path(), ec);
  }
  if (std::filesystem::exists(filePath, ec)) {
    bytesWritten_ = static_cast<size_t>(std::filesystem::file_size(filePath, ec));
  }
  file_.open(fileName_, std::ios::app);
  if (!file_.is_open()) {
    std::cerr << "FileLogWriter: could not open log file '" << fileName_
              << "'" << std::endl;
  }
}

bool FileLogWriter::write(const std::string &formattedMessage) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!file_.is_open())
    return false;

  if (bytesWritten_ >= maxFileSize_) {
    rotateUnlocked();
    if (!file_.is_open())
      return false;
  }

  file_ << formattedMessage << '\n';
  bytesWritten_ += formattedMessage.size() + 1;
  return file_.good();
}

void FileLogWriter::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open())
    file_.flush();
}

void FileLogWriter::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open()) {
    file_.flush();
    file_.close();
  }
}

bool FileLogWriter::isOpen() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return file_.is_open();
}

// Shifts <file>.i to <file>.i+1, dropping the oldest backup, then reopens an
// empty <file>.
void FileLogWriter::rotateUnlocked() {
  file_.close();
  std::error_code ec;

  std::string oldest = fileName_ + "." + std::to_string(maxBackupFiles_);
  std::filesystem::remove(oldest, ec);
  for (int i = maxBackupFiles_ - 1; i > 0; --i) {
    std::string from = fileName_ + "." + std::to_string(i);
    if (std::filesystem::exists(from, ec)) {
      std::filesystem::rename(from, fileName_ + "." + std::to_string(i + 1),
                              ec);
    }
  }
  if (maxBackupFiles_ > 0) {
    std::filesystem::rename(fileName_, fileName_ + ".1", ec);
  } else {
    std::filesystem::remove(fileName_, ec);
  }

  file_.open(fileName_, std::ios::app);
  bytesWritten_ = 0;
}
