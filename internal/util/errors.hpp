#pragma once

#include <stdexcept>
#include <string>

namespace apphost::util {

/*
  Central error types.

  Programmer errors (bad arguments, phase violations, absent collaborators)
  surface as these; soft configuration problems never do.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A collaborator or value was read before anything assigned it.
class NotSet : public std::runtime_error {
 public:
  explicit NotSet(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace apphost::util
