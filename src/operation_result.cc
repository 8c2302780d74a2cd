#include "operation_result.hh"

#include <algorithm>
#include <string>

void ProfileBundle::OperationResult::addWritten(const std::string &path)
{
  if(std::find(files_written.begin(), files_written.end(), path) == files_written.end()) {
    files_written.push_back(path);
  }
}
