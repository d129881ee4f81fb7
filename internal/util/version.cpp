#include "version.hpp"

#include "internal/util/errors.hpp"

namespace apphost::util {

namespace {

constexpr int kVersionMajor    = 8;
constexpr int kVersionMinor    = 1;
constexpr int kVersionBuild    = 3;
constexpr int kVersionRevision = 0;

} // namespace

std::string Version::ToString(int fields) const {
  if (fields < 1 || fields > 4) {
    throw InvalidArgument("Version::ToString fields must be between 1 and 4, got " + std::to_string(fields));
  }

  const int   parts[] = {major, minor, build, revision};
  std::string out     = std::to_string(parts[0]);
  for (int i = 1; i < fields; ++i) {
    out += '.';
    out += std::to_string(parts[i]);
  }
  return out;
}

const Version& CurrentVersion() {
  static const Version kCurrent{kVersionMajor, kVersionMinor, kVersionBuild, kVersionRevision};
  return kCurrent;
}

} // namespace apphost::util
