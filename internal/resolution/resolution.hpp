#pragma once

namespace apphost::resolution {

/*
  Process-wide resolution phase.

  Resolvers are configured while resolution is open and read once it is
  frozen. The boot manager freezes resolution when boot completes;
  disposing the application context resets it.
*/
class Resolution {
 public:
  static bool IsFrozen();

  // Throws util::InvalidState if already frozen.
  static void Freeze();

  static void Reset();

  static void EnsureIsFrozen();
  static void EnsureIsNotFrozen();
};

} // namespace apphost::resolution
