#include "tools/a2s_decode/decode_config.h"

#include <fstream>
#include <limits>
#include <stdexcept>
#include <type_traits>

#include <CLI/CLI.hpp>

#include "common/logging/logger.h"
#include "common/version.h"

namespace a2s::tools {

namespace {
// Helper to safely parse integer with validation
template <typename T>
bool safe_parse_int(const std::string& value, T& out, const std::string& field_name,
                    std::error_code& ec) {
  try {
    if constexpr (std::is_unsigned_v<T>) {
      if (!value.empty() && value[0] == '-') {
        LOG_ERROR("Configuration error: {} value '{}' cannot be negative", field_name, value);
        ec = std::make_error_code(std::errc::result_out_of_range);
        return false;
      }
      unsigned long long parsed = std::stoull(value);
      if (parsed > std::numeric_limits<T>::max()) {
        LOG_ERROR("Configuration error: {} value '{}' is out of range", field_name, value);
        ec = std::make_error_code(std::errc::result_out_of_range);
        return false;
      }
      out = static_cast<T>(parsed);
    } else {
      long long parsed = std::stoll(value);
      if (parsed < std::numeric_limits<T>::min() || parsed > std::numeric_limits<T>::max()) {
        LOG_ERROR("Configuration error: {} value '{}' is out of range", field_name, value);
        ec = std::make_error_code(std::errc::result_out_of_range);
        return false;
      }
      out = static_cast<T>(parsed);
    }
    return true;
  } catch (const std::invalid_argument&) {
    LOG_ERROR("Configuration error: {} value '{}' is not a valid number", field_name, value);
    ec = std::make_error_code(std::errc::invalid_argument);
    return false;
  } catch (const std::out_of_range&) {
    LOG_ERROR("Configuration error: {} value '{}' is out of range", field_name, value);
    ec = std::make_error_code(std::errc::result_out_of_range);
    return false;
  }
}

bool parse_bool(const std::string& value) {
  return value == "true" || value == "1" || value == "yes";
}

void trim(std::string& text) {
  while (!text.empty() && (text.back() == ' ' || text.back() == '\t' || text.back() == '\r')) {
    text.pop_back();
  }
  while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
    text.erase(0, 1);
  }
}

// Simple INI parser for configuration files.
bool parse_ini_value(const std::string& line, std::string& key, std::string& value) {
  if (line.empty() || line[0] == '#' || line[0] == ';' || line[0] == '[') {
    return false;
  }

  auto pos = line.find('=');
  if (pos == std::string::npos) {
    return false;
  }

  key = line.substr(0, pos);
  value = line.substr(pos + 1);
  trim(key);
  trim(value);
  return !key.empty();
}

std::string get_current_section(std::string line) {
  trim(line);
  if (line.size() >= 2 && line.front() == '[' && line.back() == ']') {
    return line.substr(1, line.size() - 2);
  }
  return "";
}

bool apply_split_format(const std::string& value, DecodeConfig& config, std::error_code& ec) {
  const auto format = packet::split_format_from_string(value);
  if (!format) {
    LOG_ERROR("Configuration error: unknown split_format '{}'", value);
    ec = std::make_error_code(std::errc::invalid_argument);
    return false;
  }
  config.split_format = *format;
  return true;
}
}  // namespace

bool parse_args(int argc, char* argv[], DecodeConfig& config, std::error_code& ec) {
  CLI::App app{"Decode captured A2S server query datagrams to JSON"};
  app.set_version_flag("--version", kFullVersionString);

  std::string split_format;
  bool hex_input = false;
  bool raw_text = false;
  bool allow_truncated_rules = false;
  bool verbose = false;
  std::string log_file;

  app.add_option("-c,--config", config.config_file, "Configuration file path");
  auto* format_opt = app.add_option("-f,--split-format", split_format,
                                    "Split header layout: source, source-nosize or goldsource")
                         ->check(CLI::IsMember({"source", "source-nosize", "goldsource"}));
  auto* hex_opt = app.add_flag("--hex", hex_input, "Input files contain hex text");
  auto* raw_opt = app.add_flag("--raw-text", raw_text, "Keep strings that are not valid UTF-8");
  auto* rules_opt = app.add_flag("--allow-truncated-rules", allow_truncated_rules,
                                 "Accept rule lists cut off mid-pair");
  auto* verbose_opt = app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
  auto* log_opt = app.add_option("--log-file", log_file, "Log file path");
  app.add_option("inputs", config.inputs, "Datagram files, one datagram per file")
      ->required()
      ->check(CLI::ExistingFile);

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    if (app.exit(e) == 0) {
      config.exit_requested = true;
      return false;
    }
    ec = std::make_error_code(std::errc::invalid_argument);
    return false;
  }

  if (!config.config_file.empty()) {
    if (!load_config_file(config.config_file, config, ec)) {
      return false;
    }
  }

  if (format_opt->count() > 0 && !apply_split_format(split_format, config, ec)) {
    return false;
  }
  if (hex_opt->count() > 0) config.hex_input = hex_input;
  if (raw_opt->count() > 0) config.raw_text = raw_text;
  if (rules_opt->count() > 0) config.allow_truncated_rules = allow_truncated_rules;
  if (verbose_opt->count() > 0) config.verbose = verbose;
  if (log_opt->count() > 0) config.log_file = log_file;

  return true;
}

bool load_config_file(const std::string& path, DecodeConfig& config, std::error_code& ec) {
  std::ifstream file(path);
  if (!file) {
    ec = std::error_code(errno, std::generic_category());
    LOG_ERROR("Failed to open config file: {}", path);
    return false;
  }

  std::string line;
  std::string section;

  while (std::getline(file, line)) {
    std::string new_section = get_current_section(line);
    if (!new_section.empty()) {
      section = new_section;
      continue;
    }

    std::string key;
    std::string value;
    if (!parse_ini_value(line, key, value)) {
      continue;
    }

    if (section == "decoder" || section.empty()) {
      if (key == "split_format") {
        if (!apply_split_format(value, config, ec)) {
          return false;
        }
      } else if (key == "hex_input") {
        config.hex_input = parse_bool(value);
      } else if (key == "raw_text") {
        config.raw_text = parse_bool(value);
      } else if (key == "allow_truncated_rules") {
        config.allow_truncated_rules = parse_bool(value);
      } else if (key == "max_fragments") {
        std::size_t max_fragments = 0;
        if (!safe_parse_int(value, max_fragments, "max_fragments", ec)) {
          return false;
        }
        config.reassembly.max_fragments = max_fragments;
      } else if (key == "max_decompressed_size") {
        std::size_t max_size = 0;
        if (!safe_parse_int(value, max_size, "max_decompressed_size", ec)) {
          return false;
        }
        config.reassembly.max_decompressed_size = max_size;
      } else {
        LOG_WARN("Ignoring unknown key '{}' in [decoder]", key);
      }
    } else if (section == "logging") {
      if (key == "verbose") {
        config.verbose = parse_bool(value);
      } else if (key == "level") {
        config.log_level = logging::parse_log_level(value, config.log_level);
      } else if (key == "log_file") {
        config.log_file = value;
      }
    }
  }

  LOG_DEBUG("Loaded configuration from {}", path);
  return true;
}

bool validate_config(const DecodeConfig& config, std::string& error) {
  if (config.inputs.empty()) {
    error = "At least one input file is required";
    return false;
  }

  if (config.reassembly.max_fragments == 0 || config.reassembly.max_fragments > 255) {
    error = "max_fragments must be between 1 and 255";
    return false;
  }

  if (config.reassembly.max_decompressed_size == 0) {
    error = "max_decompressed_size must be positive";
    return false;
  }

  return true;
}

payload::DecodeOptions decode_options(const DecodeConfig& config) {
  payload::DecodeOptions options;
  options.text_policy = config.raw_text ? payload::TextPolicy::kRaw : payload::TextPolicy::kStrictUtf8;
  options.allow_truncated_rules = config.allow_truncated_rules;
  return options;
}

}  // namespace a2s::tools
