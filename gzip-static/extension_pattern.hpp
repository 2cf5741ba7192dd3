#pragma once
#include <regex>
#include <string>
#include <vector>

class ExtensionPattern
{
public:
  ExtensionPattern(const std::string& source) : matcher(make_expression(source), std::regex::icase)
  {
  }

  // Matches `*.<pattern>` against a file name, ignoring case.
  bool matches(const std::string& filename) const
  {
    return std::regex_match(filename, matcher);
  }

  static std::string make_expression(const std::string& glob)
  {
    static const std::string special_characters = "\\^$.|+()[]{}";
    std::string expression("^[\\s\\S]*\\.");

    expression.reserve(expression.length() + glob.length() * 7 + 1);
    for (char c : glob)
    {
      if (c == '*')
        expression += "[\\s\\S]*";
      else if (c == '?')
        expression += "[\\s\\S]";
      else
      {
        if (special_characters.find(c) != std::string::npos)
          expression += '\\';
        expression += c;
      }
    }
    expression += '$';
    return expression;
  }

private:
  std::regex matcher;
};

typedef std::vector<ExtensionPattern> ExtensionPatterns;

inline ExtensionPatterns make_extension_patterns(const std::vector<std::string>& sources)
{
  ExtensionPatterns patterns;

  patterns.reserve(sources.size());
  for (const std::string& source : sources)
    patterns.emplace_back(source);
  return patterns;
}

inline bool matches_any(const ExtensionPatterns& patterns, const std::string& filename)
{
  for (const ExtensionPattern& pattern : patterns)
  {
    if (pattern.matches(filename))
      return true;
  }
  return false;
}
