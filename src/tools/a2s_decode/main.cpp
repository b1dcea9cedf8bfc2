#include <cctype>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/logging/logger.h"
#include "protocol/errors.h"
#include "protocol/packet/packet_header.h"
#include "protocol/payload/payload_header.h"
#include "protocol/payload/payload_parser.h"
#include "protocol/reassembly/split_reassembly.h"
#include "protocol/request/request_codec.h"
#include "tools/a2s_decode/decode_config.h"
#include "tools/a2s_decode/json_output.h"

using namespace a2s;

namespace {

bool read_file(const std::string& path, std::vector<std::uint8_t>& out, std::error_code& ec) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    ec = std::error_code(errno, std::generic_category());
    return false;
  }
  out.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
  return true;
}

int hex_digit(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

// Accepts "FF FF FF FF 49 ..." as well as "ffffffff49...".
bool decode_hex(const std::vector<std::uint8_t>& text, std::vector<std::uint8_t>& out,
                std::error_code& ec) {
  out.clear();
  int high = -1;
  for (const auto byte : text) {
    const auto c = static_cast<char>(byte);
    if (std::isspace(static_cast<unsigned char>(c)) != 0) {
      continue;
    }
    const int value = hex_digit(c);
    if (value < 0) {
      ec = std::make_error_code(std::errc::invalid_argument);
      return false;
    }
    if (high < 0) {
      high = value;
    } else {
      out.push_back(static_cast<std::uint8_t>((high << 4) | value));
      high = -1;
    }
  }
  if (high >= 0) {
    ec = std::make_error_code(std::errc::invalid_argument);
    return false;
  }
  return true;
}

class Decoder {
 public:
  explicit Decoder(const tools::DecodeConfig& config)
      : format_(config.split_format),
        options_(tools::decode_options(config)),
        reassembler_(config.reassembly) {}

  // Returns false if the datagram could not be decoded.
  bool process(const std::string& input, std::span<const std::uint8_t> datagram) {
    std::error_code ec;
    const auto packet = packet::classify(datagram, format_, ec);
    if (!packet) {
      return report_error(input, ec);
    }
    if (packet->kind == packet::PacketKind::kSingle) {
      return decode(input, packet->payload);
    }

    const auto& split = packet->split;
    auto result = reassembler_.accept(split, packet->payload);
    switch (result.status) {
      case reassembly::ReassemblyStatus::kIncomplete:
        LOG_DEBUG("{}: fragment {}/{} of request {} buffered", input, split.fragment_index + 1,
                  split.total_fragments, split.request_id);
        return true;
      case reassembly::ReassemblyStatus::kFailed:
        return report_error(input, result.error);
      case reassembly::ReassemblyStatus::kComplete:
        break;
    }
    return decode(input, result.payload);
  }

  [[nodiscard]] const reassembly::SplitReassembler& reassembler() const { return reassembler_; }

 private:
  bool decode(const std::string& input, std::span<const std::uint8_t> payload) {
    std::error_code ec;
    const auto response = payload::parse_payload(payload, options_, ec);
    if (response) {
      note_split_format(*response);
      auto line = payload::response_to_json(*response);
      line["input"] = input;
      std::cout << tools::dump_line(line) << '\n';
      return true;
    }

    // Captures may include the client's side of the exchange.
    if (ec == Error::kUnknownPayloadType) {
      std::error_code request_ec;
      const auto request = request::parse_request(payload, request_ec);
      if (request) {
        nlohmann::json line = *request;
        line["input"] = input;
        std::cout << tools::dump_line(line) << '\n';
        return true;
      }
      const auto type_byte = payload::peek_type_byte(payload);
      if (type_byte) {
        LOG_WARN("{}: unknown payload type 0x{:02X}", input, *type_byte);
      }
    }
    return report_error(input, ec);
  }

  // Source servers of a few AppIDs drop the split size field; follow what
  // the info response announces for the rest of the capture.
  void note_split_format(const payload::Response& response) {
    const auto* info = std::get_if<payload::SourceInfo>(&response);
    if (info == nullptr || format_ == packet::SplitFormat::kGoldSource) {
      return;
    }
    const auto format = packet::split_format_for(info->app_id, info->protocol);
    if (format != format_) {
      LOG_INFO("Switching to {} split layout for app {}", packet::split_format_name(format),
               info->app_id);
      format_ = format;
    }
  }

  static bool report_error(const std::string& input, const std::error_code& ec) {
    LOG_ERROR("{}: {}", input, ec.message());
    std::cout << tools::dump_line(tools::error_to_json(input, ec)) << '\n';
    return false;
  }

  packet::SplitFormat format_;
  payload::DecodeOptions options_;
  reassembly::SplitReassembler reassembler_;
};

}  // namespace

int main(int argc, char* argv[]) {
  tools::DecodeConfig config;
  std::error_code ec;
  if (!tools::parse_args(argc, argv, config, ec)) {
    return config.exit_requested ? 0 : 1;
  }

  std::string error;
  if (!tools::validate_config(config, error)) {
    std::cerr << "Configuration error: " << error << '\n';
    return 1;
  }

  logging::configure_logging(config.verbose ? logging::LogLevel::debug : config.log_level,
                             true, config.log_file);
  LOG_DEBUG("Decoding {} input(s) with {} split layout", config.inputs.size(),
            packet::split_format_name(config.split_format));

  Decoder decoder(config);
  bool all_ok = true;
  for (const auto& input : config.inputs) {
    std::vector<std::uint8_t> contents;
    if (!read_file(input, contents, ec)) {
      LOG_ERROR("Failed to read {}: {}", input, ec.message());
      all_ok = false;
      continue;
    }
    std::vector<std::uint8_t> datagram;
    if (config.hex_input) {
      if (!decode_hex(contents, datagram, ec)) {
        LOG_ERROR("{}: not valid hex text", input);
        all_ok = false;
        continue;
      }
    } else {
      datagram = std::move(contents);
    }
    all_ok = decoder.process(input, datagram) && all_ok;
  }

  const auto& reassembler = decoder.reassembler();
  if (reassembler.pending_count() > 0) {
    LOG_ERROR("{} split response(s) incomplete at end of input", reassembler.pending_count());
    all_ok = false;
  }
  LOG_DEBUG("Reassembly: {}", nlohmann::json(reassembler.stats()).dump());

  return all_ok ? 0 : 1;
}
