#pragma once

#include <string>
#include <vector>

#include "settings_manager.hpp"

struct ParseOutcome {
  bool ok = true;
  std::string error;
};

class CommandLineParser {
public:
  CommandLineParser(std::string process_name = "efsyncd",
                    nlohmann::json settings_spec = SETTINGS_SPECIFICATION,
                    nlohmann::json argv_spec = nlohmann::json::array({
                      {{"index",0},{"key","source_root"}},
                      {{"index",1},{"key","endpoint"}}
                    }));

  // Stops at the first bad token; settings keep whatever was applied before it.
  ParseOutcome parse(int argc, const char* const argv[], SettingsManager& settings) const;
  void usage() const;

private:
  struct ArgvSpec {
    std::size_t index = 0;
    std::string key;
  };

  std::vector<ArgvSpec> build_positional_specs(const nlohmann::json& spec) const;
  static bool is_option_token(const std::string& candidate);
  static bool is_bool_literal(const std::string& value);

  std::string process_name_;
  nlohmann::json settings_spec_;
  nlohmann::json argv_spec_;
  std::vector<ArgvSpec> positional_specs_;
};
