#include "optionable.h"

namespace stiffrk
{

optionable_status_t Optionable::GetIntOption(const std::string &option_name,
                                             int *option_value) const
{
  IntOptions::const_iterator it = int_options_.find(option_name);
  if(it == int_options_.end()) {
    return OPTIONABLE_STATUS_OPTION_NOT_DEFINED;
  }
  *option_value = it->second;
  return OPTIONABLE_STATUS_SUCCESS;
}

optionable_status_t Optionable::GetDoubleOption(const std::string &option_name,
                                                double *option_value) const
{
  DoubleOptions::const_iterator it = double_options_.find(option_name);
  if(it == double_options_.end()) {
    return OPTIONABLE_STATUS_OPTION_NOT_DEFINED;
  }
  *option_value = it->second;
  return OPTIONABLE_STATUS_SUCCESS;
}

optionable_status_t Optionable::GetStringOption(const std::string &option_name,
                                                std::string *option_value) const
{
  StringOptions::const_iterator it = string_options_.find(option_name);
  if(it == string_options_.end()) {
    return OPTIONABLE_STATUS_OPTION_NOT_DEFINED;
  }
  *option_value = it->second;
  return OPTIONABLE_STATUS_SUCCESS;
}

optionable_status_t Optionable::SetIntOption(const std::string &option_name,
                                             const int option_value)
{
  int_options_[option_name] = option_value;
  return OPTIONABLE_STATUS_SUCCESS;
}

optionable_status_t Optionable::SetDoubleOption(const std::string &option_name,
                                                const double option_value)
{
  double_options_[option_name] = option_value;
  return OPTIONABLE_STATUS_SUCCESS;
}

optionable_status_t Optionable::SetStringOption(const std::string &option_name,
                                                const std::string &option_value)
{
  string_options_[option_name] = option_value;
  return OPTIONABLE_STATUS_SUCCESS;
}

void Optionable::SetIntOptions(const IntOptions &options)
{
  for(IntOptions::const_iterator it = options.begin();
      it != options.end(); ++it) {
    int_options_[it->first] = it->second;
  }
}

void Optionable::SetDoubleOptions(const DoubleOptions &options)
{
  for(DoubleOptions::const_iterator it = options.begin();
      it != options.end(); ++it) {
    double_options_[it->first] = it->second;
  }
}

void Optionable::SetStringOptions(const StringOptions &options)
{
  for(StringOptions::const_iterator it = options.begin();
      it != options.end(); ++it) {
    string_options_[it->first] = it->second;
  }
}

} // namespace stiffrk
