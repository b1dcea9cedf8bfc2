#pragma once

#include <string>
#include <system_error>
#include <vector>

#include "common/logging/logger.h"
#include "protocol/packet/packet_header.h"
#include "protocol/payload/decode_options.h"
#include "protocol/reassembly/split_reassembly.h"

namespace a2s::tools {

struct DecodeConfig {
  std::string config_file;
  std::vector<std::string> inputs;

  packet::SplitFormat split_format{packet::SplitFormat::kSource};
  bool hex_input{false};
  bool raw_text{false};
  bool allow_truncated_rules{false};
  reassembly::ReassemblyConfig reassembly;

  // Level used unless verbose is set, which forces debug.
  logging::LogLevel log_level{logging::LogLevel::warn};
  bool verbose{false};
  std::string log_file;

  // Set when --help or --version was handled; not an error.
  bool exit_requested{false};
};

// Parses the command line, then the INI file named by --config. Options
// given explicitly on the command line take precedence over the file.
bool parse_args(int argc, char* argv[], DecodeConfig& config, std::error_code& ec);

// Applies [decoder] and [logging] keys from an INI file.
bool load_config_file(const std::string& path, DecodeConfig& config, std::error_code& ec);

bool validate_config(const DecodeConfig& config, std::string& error);

payload::DecodeOptions decode_options(const DecodeConfig& config);

}  // namespace a2s::tools
