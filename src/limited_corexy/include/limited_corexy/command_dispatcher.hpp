#pragma once

// =============================================================================
// Limited CoreXY | limited_corexy / command_dispatcher.hpp (ROS 2 Jazzy)
// =============================================================================
// Purpose
// -------
// Operator command plumbing, independent of ROS:
//
//   CommandLine          one parsed "NAME KEY=VALUE ..." line with typed,
//                        range-checked parameter getters
//   CommandDispatcher    name -> handler registry; dispatch() runs a line
//
// Handlers are registered explicitly by whoever owns them (see
// KinematicsLimitCommand::register_with()); nothing registers itself.
//
// Errors
// ------
// - empty / malformed line, unknown command, unparsable value -> CommandError
// - value outside the bounds requested by the handler         -> RangeError
// =============================================================================

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace limited_corexy
{

// Bounds for numeric parameters (unset bound = not checked)
struct ValueBounds
{
  std::optional<double> minval {};
  std::optional<double> maxval {};
  std::optional<double> above {};
  std::optional<double> below {};
};

class CommandLine
{
public:
  // Command name and keys are upper-cased, values are kept verbatim.
  static CommandLine parse(const std::string & line);

  const std::string & name() const
  {
    return name_;
  }

  bool has(const std::string & key) const;

  std::optional<double> get_optional_float(
    const std::string & key,
    const ValueBounds & bounds = ValueBounds{}) const;

  double get_float(
    const std::string & key,
    double default_value,
    const ValueBounds & bounds = ValueBounds{}) const;

  std::optional<long> get_optional_int(
    const std::string & key,
    const ValueBounds & bounds = ValueBounds{}) const;

  long get_int(
    const std::string & key,
    long default_value,
    const ValueBounds & bounds = ValueBounds{}) const;

private:
  void check_bounds_(const std::string & key, double value, const ValueBounds & bounds) const;

  std::string name_;
  std::map<std::string, std::string> params_;
};

using CommandHandler = std::function<std::string(const CommandLine &)>;

class CommandDispatcher
{
public:
  struct CommandInfo
  {
    std::string name;
    std::string help;
  };

  // Throws CommandError if the name is empty or already registered.
  void register_command(
    const std::string & name,
    CommandHandler handler,
    const std::string & help = "");

  bool has_command(const std::string & name) const;

  // Parses the line and runs the matching handler; returns its response.
  std::string dispatch(const std::string & line) const;

  std::vector<CommandInfo> commands() const;

private:
  struct Entry
  {
    CommandHandler handler;
    std::string help;
  };

  std::map<std::string, Entry> commands_;
};

}  // namespace limited_corexy
