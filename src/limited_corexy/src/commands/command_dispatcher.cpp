// =============================================================================
// Limited CoreXY | limited_corexy / src/commands/command_dispatcher.cpp (ROS 2 Jazzy)
// =============================================================================

#include "limited_corexy/command_dispatcher.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "limited_corexy/limit_errors.hpp"

namespace limited_corexy
{

namespace
{

std::string upper_(std::string s)
{
  std::transform(
    s.begin(), s.end(), s.begin(),
    [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return s;
}

double parse_double_(const std::string & name, const std::string & key, const std::string & text)
{
  double value = 0.0;
  std::size_t used = 0;
  try {
    value = std::stod(text, &used);
  } catch (const std::invalid_argument &) {
    used = 0;
  } catch (const std::out_of_range &) {
    used = 0;
  }

  if (used == 0 || used != text.size() || !std::isfinite(value)) {
    std::ostringstream ss;
    ss << "Error on '" << name << "': unable to parse " << key << "='" << text << "'";
    throw CommandError(ss.str());
  }
  return value;
}

long parse_long_(const std::string & name, const std::string & key, const std::string & text)
{
  long value = 0;
  std::size_t used = 0;
  try {
    value = std::stol(text, &used);
  } catch (const std::invalid_argument &) {
    used = 0;
  } catch (const std::out_of_range &) {
    used = 0;
  }

  if (used == 0 || used != text.size()) {
    std::ostringstream ss;
    ss << "Error on '" << name << "': unable to parse " << key << "='" << text << "'";
    throw CommandError(ss.str());
  }
  return value;
}

}  // namespace

// -----------------------------------------------------------------------------
// CommandLine
// -----------------------------------------------------------------------------
CommandLine CommandLine::parse(const std::string & line)
{
  CommandLine out;

  std::istringstream in(line);
  std::string token;
  if (!(in >> token)) {
    throw CommandError("Empty command");
  }
  out.name_ = upper_(token);

  while (in >> token) {
    const auto eq = token.find('=');
    if (eq == std::string::npos || eq == 0) {
      std::ostringstream ss;
      ss << "Malformed command parameter '" << token << "' in '" << line << "'";
      throw CommandError(ss.str());
    }
    out.params_[upper_(token.substr(0, eq))] = token.substr(eq + 1);
  }
  return out;
}

bool CommandLine::has(const std::string & key) const
{
  return params_.count(upper_(key)) > 0;
}

std::optional<double> CommandLine::get_optional_float(
  const std::string & key,
  const ValueBounds & bounds) const
{
  const std::string k = upper_(key);
  const auto it = params_.find(k);
  if (it == params_.end()) {
    return std::nullopt;
  }
  const double v = parse_double_(name_, k, it->second);
  check_bounds_(k, v, bounds);
  return v;
}

double CommandLine::get_float(
  const std::string & key,
  double default_value,
  const ValueBounds & bounds) const
{
  return get_optional_float(key, bounds).value_or(default_value);
}

std::optional<long> CommandLine::get_optional_int(
  const std::string & key,
  const ValueBounds & bounds) const
{
  const std::string k = upper_(key);
  const auto it = params_.find(k);
  if (it == params_.end()) {
    return std::nullopt;
  }
  const long v = parse_long_(name_, k, it->second);
  check_bounds_(k, static_cast<double>(v), bounds);
  return v;
}

long CommandLine::get_int(
  const std::string & key,
  long default_value,
  const ValueBounds & bounds) const
{
  return get_optional_int(key, bounds).value_or(default_value);
}

void CommandLine::check_bounds_(
  const std::string & key,
  double value,
  const ValueBounds & bounds) const
{
  std::ostringstream ss;
  ss << "Error on '" << name_ << "': " << key;

  if (bounds.minval && value < *bounds.minval) {
    ss << " must have minimum of " << *bounds.minval;
    throw RangeError(ss.str());
  }
  if (bounds.maxval && value > *bounds.maxval) {
    ss << " must have maximum of " << *bounds.maxval;
    throw RangeError(ss.str());
  }
  if (bounds.above && value <= *bounds.above) {
    ss << " must be above " << *bounds.above;
    throw RangeError(ss.str());
  }
  if (bounds.below && value >= *bounds.below) {
    ss << " must be below " << *bounds.below;
    throw RangeError(ss.str());
  }
}

// -----------------------------------------------------------------------------
// CommandDispatcher
// -----------------------------------------------------------------------------
void CommandDispatcher::register_command(
  const std::string & name,
  CommandHandler handler,
  const std::string & help)
{
  const std::string key = upper_(name);
  if (key.empty() || !handler) {
    throw CommandError("Cannot register an unnamed or empty command handler");
  }
  if (commands_.count(key) > 0) {
    throw CommandError("Command '" + key + "' already registered");
  }
  commands_.emplace(key, Entry{std::move(handler), help});
}

bool CommandDispatcher::has_command(const std::string & name) const
{
  return commands_.count(upper_(name)) > 0;
}

std::string CommandDispatcher::dispatch(const std::string & line) const
{
  const CommandLine cmd = CommandLine::parse(line);
  const auto it = commands_.find(cmd.name());
  if (it == commands_.end()) {
    throw CommandError("Unknown command: \"" + cmd.name() + "\"");
  }
  return it->second.handler(cmd);
}

std::vector<CommandDispatcher::CommandInfo> CommandDispatcher::commands() const
{
  std::vector<CommandInfo> out;
  out.reserve(commands_.size());
  for (const auto & kv : commands_) {
    out.push_back(CommandInfo{kv.first, kv.second.help});
  }
  return out;
}

}  // namespace limited_corexy
