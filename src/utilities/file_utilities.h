#ifndef STIFFRK_FILE_UTILITIES_H_
#define STIFFRK_FILE_UTILITIES_H_

#include <stdio.h>

#include <string>
#include <vector>

namespace stiffrk
{
namespace utilities
{

// Passing null_filename as the log file name disables the file stream.
extern const char* null_filename;

// Sends each printf-style message to every active stream: stdout, stderr and
// an append-mode log file. A Logger built with null_filename (or an empty
// name) and both console flags false is silent. If the log file can not be
// opened the messages go to stderr instead.
//
// The log file is stamped with the local time when the Logger opens and
// closes it.
class Logger
{
 public:
  Logger(); // stdout only
  explicit Logger(const std::string &log_filename); // file only
  Logger(const std::string &log_filename,
         const bool use_stdout,
         const bool use_stderr);
  ~Logger();

  // Returns the vfprintf result of the last stream written, 0 if silent.
  int PrintF(const char *format, ...) const;
  int FFlush() const;

  bool IsActive() const {return !streams_.empty();}

 private:
  Logger(const Logger &);
  Logger& operator=(const Logger &);

  void OpenStreams(const std::string &log_filename,
                   bool use_stdout,
                   bool use_stderr);
  void StampLogFile(const char *event) const;

  std::vector<FILE *> streams_;
  FILE *log_file_ptr_;
};

} // namespace utilities
} // namespace stiffrk

#endif
