#pragma once

#include "types.hpp"

namespace FileMover {
// Moves `source` to `destination`, creating missing parent directories.
// In dry-run mode nothing on disk changes. An existing destination is only
// replaced when `force` is set; otherwise DestinationExistsError is thrown
// and the source is left where it was. Other failures surface as
// fs::filesystem_error.
MoveOutcome move_file(const fs::path& source, const fs::path& destination,
                      bool dryRun, bool force);
}  // namespace FileMover
