#ifndef PROFILEBUNDLE_OPERATION_RESULT_HH
#define PROFILEBUNDLE_OPERATION_RESULT_HH

#include <cstddef>
#include <list>
#include <string>

namespace ProfileBundle {
  // What a combine, bundle, clean or update run did. The values are for reporting only.
  struct OperationResult {
    // The parent or bundle file that was written; empty when nothing was done
    std::string output_file;

    std::list<std::string> files_written;
    std::list<std::string> files_deleted;

    // Qualified names of the profiles relocated into a bundle, before renaming
    std::list<std::string> profiles_moved;

    size_t leaves_kept = 0;
    size_t descendants = 0;
    size_t profiles_changed = 0;
    size_t properties_removed = 0;

    // Set when the preconditions of the operation found no work ("nothing to bundle")
    bool nothing_to_do = false;

    // Records a written file once
    void addWritten(const std::string &path);
  };
} // namespace ProfileBundle

#endif // PROFILEBUNDLE_OPERATION_RESULT_HH
