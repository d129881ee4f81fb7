#pragma once

#include <string>

namespace apphost::util {

/*
  Four component version (major.minor.build.revision).
*/
struct Version {
  int major    = 0;
  int minor    = 0;
  int build    = 0;
  int revision = 0;

  // Formats the first `fields` components (1..4).
  std::string ToString(int fields = 4) const;
};

// Hard-coded version of this build.
const Version& CurrentVersion();

} // namespace apphost::util
