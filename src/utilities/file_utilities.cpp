#include <stdio.h>
#include <stdarg.h>
#include <time.h>

#include "file_utilities.h"

namespace stiffrk
{
namespace utilities
{

#ifdef _WIN32
const char* null_filename = "nul";
#else
const char* null_filename = "/dev/null";
#endif

Logger::Logger() :
  log_file_ptr_(NULL)
{
  streams_.push_back(stdout);
}

Logger::Logger(const std::string &log_filename) :
  log_file_ptr_(NULL)
{
  OpenStreams(log_filename, false, false);
}

Logger::Logger(const std::string &log_filename,
               const bool use_stdout,
               const bool use_stderr) :
  log_file_ptr_(NULL)
{
  OpenStreams(log_filename, use_stdout, use_stderr);
}

Logger::~Logger()
{
  FFlush();
  if(log_file_ptr_ != NULL) {
    StampLogFile("closed");
    fclose(log_file_ptr_);
  }
}

void Logger::OpenStreams(const std::string &log_filename,
                         bool use_stdout,
                         bool use_stderr)
{
  if(!log_filename.empty() && log_filename != null_filename) {
    log_file_ptr_ = fopen(log_filename.c_str(),"a");
    if(log_file_ptr_ == NULL) {
      fprintf(stderr,
              "# ERROR: In Logger::OpenStreams(...),\n"
              "#        can not append to log file %s.\n"
              "#        Log messages are sent to stderr.\n",
              log_filename.c_str());
      use_stderr = true;
    } else {
      StampLogFile("opened");
    }
  }

  if(use_stdout) {
    streams_.push_back(stdout);
  }
  if(use_stderr) {
    streams_.push_back(stderr);
  }
  if(log_file_ptr_ != NULL) {
    streams_.push_back(log_file_ptr_);
  }
}

void Logger::StampLogFile(const char *event) const
{
  time_t raw_time = time(NULL);
  // asctime ends with a newline
  fprintf(log_file_ptr_,
          "#------------------------------------------------------------------------------\n"
          "# stiffrk log %s at %s"
          "#------------------------------------------------------------------------------\n",
          event,
          asctime(localtime(&raw_time)));
  fflush(log_file_ptr_);
}

int Logger::FFlush() const
{
  int return_code = 0;
  for(size_t j=0; j<streams_.size(); ++j) {
    if(fflush(streams_[j]) != 0) {
      return_code = EOF;
    }
  }
  return return_code;
}

int Logger::PrintF(const char *format, ...) const
{
  int return_code = 0;
  va_list argument_list;
  va_start(argument_list, format);
  for(size_t j=0; j<streams_.size(); ++j) {
    // vfprintf consumes the list
    va_list stream_list;
    va_copy(stream_list, argument_list);
    return_code = vfprintf(streams_[j], format, stream_list);
    va_end(stream_list);
  }
  va_end(argument_list);
  return return_code;
}

} // namespace utilities
} // namespace stiffrk
