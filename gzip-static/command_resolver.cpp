#include "command_resolver.hpp"
#include <crails/utils/split.hpp>
#include <algorithm>
#include <cstdlib>
#include <iostream>

extern bool verbose_mode;

std::string ResolvedCommand::to_string() const
{
  std::string result;

  for (const std::string& argument : arguments)
  {
    if (result.length() > 0)
      result += ' ';
    result += argument;
  }
  return result;
}

SearchPath search_path_from(const std::string& path_variable)
{
  SearchPath result;

  for (const std::string& directory : Crails::split(path_variable, ':'))
  {
    if (directory.length() > 0)
      result.push_back(directory);
  }
  return result;
}

SearchPath default_search_path()
{
  const char* path_variable = std::getenv("PATH");

  return search_path_from(path_variable ? path_variable : "");
}

std::vector<std::string> tokenize_command(const std::string& command_line)
{
  std::string normalized = command_line;
  std::vector<std::string> tokens;

  std::replace(normalized.begin(), normalized.end(), '\t', ' ');
  for (const std::string& token : Crails::split(normalized, ' '))
  {
    if (token.length() > 0)
      tokens.push_back(token);
  }
  return tokens;
}

bool is_direct_path(const std::string& program)
{
  return program.find('/') != std::string::npos || program[0] == '.';
}

static bool is_executable_file(const std::filesystem::path& path)
{
  const auto any_exec = std::filesystem::perms::owner_exec
                      | std::filesystem::perms::group_exec
                      | std::filesystem::perms::others_exec;
  std::error_code error_code;
  auto status = std::filesystem::status(path, error_code);

  if (error_code || !std::filesystem::is_regular_file(status))
    return false;
  return (status.permissions() & any_exec) != std::filesystem::perms::none;
}

bool find_program(const std::string& program, const SearchPath& search_path, std::filesystem::path& location)
{
  if (program.length() == 0)
    return false;
  if (is_direct_path(program))
  {
    if (!is_executable_file(program))
      return false;
    location = program;
    return true;
  }
  for (const std::filesystem::path& directory : search_path)
  {
    std::filesystem::path candidate = directory / program;

    if (is_executable_file(candidate))
    {
      location = candidate;
      return true;
    }
  }
  return false;
}

bool resolve_command(const std::vector<std::string>& candidates, const SearchPath& search_path, ResolvedCommand& command)
{
  for (const std::string& candidate : candidates)
  {
    std::vector<std::string> tokens = tokenize_command(candidate);
    std::filesystem::path location;

    if (tokens.size() > 0 && find_program(tokens.front(), search_path, location))
    {
      command.program = location;
      command.arguments = tokens;
      if (verbose_mode)
        std::cout << "[gzip-static] using compressor `" << command.to_string() << "` (" << location.string() << ')' << std::endl;
      return true;
    }
  }
  return false;
}
