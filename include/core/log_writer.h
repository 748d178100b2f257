#ifndef LOG_WRITER_H
#define LOG_WRITER_H

#include <string>

// Sink for formatted log lines. Implementations must be safe to call from
// several worker threads at once.
class ILogWriter {
public:
  virtual ~ILogWriter() = default;

  virtual bool write(const std::string &formattedMessage) = 0;
  virtual void flush() = 0;
  virtual void close() = 0;
  virtual bool isOpen() const = 0;
};

#endif
