#pragma once

// =============================================================================
// Limited CoreXY | limited_corexy / limit_errors.hpp (ROS 2 Jazzy)
// =============================================================================
// Purpose
// -------
// Exception types raised by the limited_corexy library.
//
//   LimitError      common base (catch this at the node boundary)
//   ConfigError     invalid construction-time configuration
//   RangeError      runtime value outside its allowed range
//   CommandError    malformed or unknown operator command
//   MoveError       move rejected by the endstop range check
//
// The library never clamps an invalid value silently. Nodes catch these at
// callback level, log them and report them back to the operator.
// =============================================================================

#include <stdexcept>
#include <string>

namespace limited_corexy
{

class LimitError : public std::runtime_error
{
public:
  explicit LimitError(const std::string & what)
  : std::runtime_error(what)
  {}
};

class ConfigError : public LimitError
{
public:
  explicit ConfigError(const std::string & what)
  : LimitError(what)
  {}
};

class RangeError : public LimitError
{
public:
  explicit RangeError(const std::string & what)
  : LimitError(what)
  {}
};

class CommandError : public LimitError
{
public:
  explicit CommandError(const std::string & what)
  : LimitError(what)
  {}
};

class MoveError : public LimitError
{
public:
  explicit MoveError(const std::string & what)
  : LimitError(what)
  {}
};

}  // namespace limited_corexy
