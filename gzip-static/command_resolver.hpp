#pragma once
#include <filesystem>
#include <string>
#include <vector>

typedef std::vector<std::filesystem::path> SearchPath;

struct ResolvedCommand
{
  std::filesystem::path    program;
  std::vector<std::string> arguments;

  std::string to_string() const;
};

SearchPath               search_path_from(const std::string& path_variable);
SearchPath               default_search_path();
std::vector<std::string> tokenize_command(const std::string& command_line);
bool                     is_direct_path(const std::string& program);
bool                     find_program(const std::string& program, const SearchPath& search_path, std::filesystem::path& location);
bool                     resolve_command(const std::vector<std::string>& candidates, const SearchPath& search_path, ResolvedCommand& command);
