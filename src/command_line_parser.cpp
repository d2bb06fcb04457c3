#include "command_line_parser.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

CommandLineParser::CommandLineParser(std::string process_name,
                                     nlohmann::json settings_spec,
                                     nlohmann::json argv_spec)
  : process_name_(std::move(process_name)),
    settings_spec_(std::move(settings_spec)) {
  positional_specs_ = build_positional_specs(argv_spec);
}

std::vector<CommandLineParser::ArgvSpec> CommandLineParser::build_positional_specs(const nlohmann::json& spec) const {
  std::vector<ArgvSpec> result;
  for(const auto& entry : spec) {
    ArgvSpec out;
    out.index = entry.at("index").get<std::size_t>();
    out.key = entry.at("key").get<std::string>();
    result.push_back(std::move(out));
  }
  std::sort(result.begin(), result.end(),
            [](const ArgvSpec& a, const ArgvSpec& b){ return a.index < b.index; });

  SettingsManager lookup(settings_spec_);
  for(const auto& argv_entry : result) {
    if(!lookup.resolve_key(argv_entry.key)) {
      throw std::runtime_error("ARGV specification references unknown setting '" + argv_entry.key + "'");
    }
  }
  return result;
}

bool CommandLineParser::is_option_token(const std::string& candidate) {
  if(candidate.rfind("--", 0) == 0) return true;
  return candidate.size() >= 2 && candidate[0] == '-' &&
         std::isalpha(static_cast<unsigned char>(candidate[1]));
}

void CommandLineParser::parse(int argc, const char* const argv[], SettingsManager& settings) const {
  std::vector<std::string> args;
  if(argc > 1 && argv) {
    args.assign(argv + 1, argv + argc);
  }
  parse(args, settings);
}

void CommandLineParser::parse(const std::vector<std::string>& args, SettingsManager& settings) const {
  std::size_t positional_index = 0;

  for(std::size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];

    // Returns false when a short alias is not recognised so it can be taken
    // as a positional (e.g. a negative number).
    auto handle_option = [&](const std::string& key_token, bool long_form) {
      std::string name = key_token;
      std::string inline_value;
      bool has_inline = false;
      if(const auto eq = name.find('='); eq != std::string::npos) {
        inline_value = name.substr(eq + 1);
        name.erase(eq);
        has_inline = true;
      }
      auto resolved = settings.resolve_key(name);
      if(!resolved) {
        if(long_form) throw CommandLineError("Unknown option --" + name);
        return false;
      }
      std::string value;
      if(has_inline) {
        value = inline_value;
      } else if(settings.is_bool_setting(*resolved)) {
        if(i + 1 < args.size() && !is_option_token(args[i + 1]) &&
           SettingsManager::is_bool_literal(args[i + 1])) {
          value = args[++i];
        } else {
          value = "true";
        }
      } else {
        if(i + 1 >= args.size()) {
          throw CommandLineError("Missing value for option '" + name + "'");
        }
        value = args[++i];
      }
      std::string error;
      if(!settings.set_from_string(*resolved, value, error)) {
        throw CommandLineError("Invalid value for option '" + name + "': " + error);
      }
      return true;
    };

    if(token.rfind("--", 0) == 0) {
      handle_option(token.substr(2), true);
      continue;
    }
    if(token.size() > 1 && token[0] == '-' && handle_option(token.substr(1), false)) {
      continue;
    }

    if(positional_index >= positional_specs_.size()) {
      throw CommandLineError("Unexpected positional argument '" + token + "'");
    }
    const auto& spec = positional_specs_[positional_index++];
    std::string error;
    if(!settings.set_from_string(spec.key, token, error)) {
      throw CommandLineError("Invalid value for " + spec.key + " '" + token + "': " + error);
    }
  }
}

std::string CommandLineParser::usage() const {
  std::ostringstream out;
  out << process_name_ << " - friend-to-friend content sync node\n";
  out << "Usage:\n  " << process_name_;
  for(const auto& pos : positional_specs_) {
    out << " [" << pos.key << "]";
  }
  out << " [--option value ...]\n\nOptions:\n";

  for(const auto& entry : settings_spec_) {
    const auto key = entry.at("key").get<std::string>();
    const auto type = entry.at("type").get<std::string>();
    const std::string argument_hint = (type == "bool") ? "[true|false]" : "<" + type + ">";

    std::string aliases;
    if(entry.contains("aliases")) {
      for(const auto& alias : entry.at("aliases")) {
        aliases += aliases.empty() ? " (alias: " : ", ";
        aliases += "-" + alias.get<std::string>();
      }
      if(!aliases.empty()) aliases += ")";
    }

    const auto& default_value = entry.at("default");
    std::string default_str;
    if(default_value.is_boolean()) {
      default_str = default_value.get<bool>() ? "true" : "false";
    } else if(default_value.is_string()) {
      default_str = default_value.get<std::string>();
      if(default_str.empty()) default_str = "\"\"";
    } else {
      default_str = default_value.dump();
    }

    out << fmt::format("  --{:<26} {:<12} {}{} (default: {})\n",
                       key, argument_hint, entry.value("description", ""),
                       aliases, default_str);
  }
  return out.str();
}
