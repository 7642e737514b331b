#pragma once
#include <string_view>

namespace uds {

// Compare two dotted-numeric versions. Returns -1, 0 or 1.
// Missing trailing components count as 0, so "1.2" == "1.2.0".
// Input is assumed to be validated by the caller.
int compare_versions(std::string_view a, std::string_view b);

// X.Y.Z exactly, as required for uploaded artifact metadata.
bool is_strict_version(std::string_view v);

// One or more numeric components separated by '.', e.g. "2" or "1.4.0.7".
bool is_dotted_numeric(std::string_view v);

} // namespace uds
