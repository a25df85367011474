#ifndef STIFFRK_OPTIONABLE_H_
#define STIFFRK_OPTIONABLE_H_

#include <map>
#include <string>

namespace stiffrk
{

typedef enum _optionable_status_t {
  OPTIONABLE_STATUS_SUCCESS = 0,
  OPTIONABLE_STATUS_OPTION_NOT_DEFINED
} optionable_status_t;

// Named int, double and string options. Getters fail for names that were
// never set; setters accept any name.
class Optionable
{
 public:
  Optionable() {};
  virtual ~Optionable() {};

  typedef std::map<std::string,int> IntOptions;
  typedef std::map<std::string,double> DoubleOptions;
  typedef std::map<std::string,std::string> StringOptions;

  optionable_status_t GetIntOption(const std::string &option_name,
                                   int *option_value) const;
  optionable_status_t GetDoubleOption(const std::string &option_name,
                                      double *option_value) const;
  optionable_status_t GetStringOption(const std::string &option_name,
                                      std::string *option_value) const;

  void GetIntOptions(IntOptions *options) const {*options = int_options_;}
  void GetDoubleOptions(DoubleOptions *options) const
  {*options = double_options_;}
  void GetStringOptions(StringOptions *options) const
  {*options = string_options_;}

  optionable_status_t SetIntOption(const std::string &option_name,
                                   const int option_value);
  optionable_status_t SetDoubleOption(const std::string &option_name,
                                      const double option_value);
  optionable_status_t SetStringOption(const std::string &option_name,
                                      const std::string &option_value);

  // Merge into the current options; existing names are overwritten.
  void SetIntOptions(const IntOptions &options);
  void SetDoubleOptions(const DoubleOptions &options);
  void SetStringOptions(const StringOptions &options);

 protected:
  IntOptions int_options_;
  DoubleOptions double_options_;
  StringOptions string_options_;
};

} // namespace stiffrk

#endif
