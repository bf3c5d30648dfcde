#pragma once

#include "common/json.hpp"
#include "src/pairlink/session_table.h"
#include "src/pairlink/signaling_channel.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace pairlink {

constexpr uint16_t kDefaultSignalPort = 9003;
constexpr uint16_t kDefaultStunPort = 9004;

struct ServerConfig {
  std::string bind_address = "0.0.0.0";
  uint16_t signal_port = kDefaultSignalPort;
  uint16_t stun_port = kDefaultStunPort;
  bool stun_enabled = true;
  // 0 selects std::thread::hardware_concurrency().
  unsigned worker_threads = 0;

  std::size_t max_pending_messages = 0;
  std::size_t max_decode_errors = 3;
  std::size_t table_stripes = 16;

  std::chrono::seconds waiting_timeout{60};
  std::chrono::seconds idle_timeout{120};
  std::chrono::seconds closing_grace{5};
  std::chrono::seconds sweep_interval{5};

  SessionTableOptions table_options() const;
  ChannelOptions channel_options() const;
  unsigned effective_worker_threads() const;
};

// Overlays the keys present in `j` onto `out`. Unknown keys are ignored.
bool apply_config_json(const common::json& j, ServerConfig* out, std::string* error_out = nullptr);
bool load_config_file(const std::string& path, ServerConfig* out, std::string* error_out = nullptr);
bool validate_config(const ServerConfig& config, std::string* error_out = nullptr);

enum class ArgsResult { Run, Help, Error };

// Applies --config first, then the remaining flags on top of it.
ArgsResult parse_args(const std::vector<std::string>& args, ServerConfig* out, std::string* error_out = nullptr);

std::string usage(const std::string& program);

} // namespace pairlink
