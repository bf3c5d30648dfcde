#include "src/pairlink/server_config.h"

#include "common/util.hpp"

#include <utility>
#include <boost/asio.hpp>

#include <fstream>
#include <limits>
#include <optional>
#include <stdexcept>
#include <thread>

namespace pairlink {

namespace {

bool fail(std::string* error_out, std::string message) {
  if (error_out) *error_out = std::move(message);
  return false;
}

bool read_uint(const common::json& j, const char* key, uint64_t max, uint64_t* out, std::string* error_out) {
  const auto it = j.find(key);
  if (it == j.end()) return true;
  if (!it->is_number_integer()) return fail(error_out, std::string(key) + " must be an unsigned integer");
  if (!it->is_number_unsigned() && it->get<int64_t>() < 0) {
    return fail(error_out, std::string(key) + " must not be negative");
  }
  const uint64_t v = it->get<uint64_t>();
  if (v > max) return fail(error_out, std::string(key) + " is out of range (max " + std::to_string(max) + ")");
  *out = v;
  return true;
}

template <class T>
bool read_field(const common::json& j, const char* key, T* field, std::string* error_out) {
  uint64_t v = static_cast<uint64_t>(*field);
  if (!read_uint(j, key, std::numeric_limits<T>::max(), &v, error_out)) return false;
  *field = static_cast<T>(v);
  return true;
}

bool read_seconds(const common::json& j, const char* key, std::chrono::seconds* field, std::string* error_out) {
  uint64_t v = static_cast<uint64_t>(field->count());
  if (!read_uint(j, key, 7 * 24 * 3600, &v, error_out)) return false;
  *field = std::chrono::seconds(static_cast<long long>(v));
  return true;
}

} // namespace

SessionTableOptions ServerConfig::table_options() const {
  SessionTableOptions o;
  o.stripes = table_stripes;
  o.max_pending_messages = max_pending_messages;
  o.waiting_timeout = waiting_timeout;
  o.idle_timeout = idle_timeout;
  o.closing_grace = closing_grace;
  return o;
}

ChannelOptions ServerConfig::channel_options() const {
  ChannelOptions o;
  o.max_decode_errors = max_decode_errors;
  o.close_timeout = closing_grace;
  return o;
}

unsigned ServerConfig::effective_worker_threads() const {
  if (worker_threads > 0) return worker_threads;
  const unsigned hw = std::thread::hardware_concurrency();
  return hw > 0 ? hw : 1;
}

bool apply_config_json(const common::json& j, ServerConfig* out, std::string* error_out) {
  if (!out) return false;
  if (!j.is_object()) return fail(error_out, "config is not a JSON object");

  ServerConfig c = *out;
  if (const auto it = j.find("bind_address"); it != j.end()) {
    if (!it->is_string()) return fail(error_out, "bind_address must be a string");
    c.bind_address = it->get<std::string>();
  }
  if (const auto it = j.find("stun_enabled"); it != j.end()) {
    if (!it->is_boolean()) return fail(error_out, "stun_enabled must be a boolean");
    c.stun_enabled = it->get<bool>();
  }
  if (!read_field(j, "signal_port", &c.signal_port, error_out)) return false;
  if (!read_field(j, "stun_port", &c.stun_port, error_out)) return false;
  if (!read_field(j, "worker_threads", &c.worker_threads, error_out)) return false;
  if (!read_field(j, "max_pending_messages", &c.max_pending_messages, error_out)) return false;
  if (!read_field(j, "max_decode_errors", &c.max_decode_errors, error_out)) return false;
  if (!read_field(j, "table_stripes", &c.table_stripes, error_out)) return false;
  if (!read_seconds(j, "waiting_timeout_s", &c.waiting_timeout, error_out)) return false;
  if (!read_seconds(j, "idle_timeout_s", &c.idle_timeout, error_out)) return false;
  if (!read_seconds(j, "closing_grace_s", &c.closing_grace, error_out)) return false;
  if (!read_seconds(j, "sweep_interval_s", &c.sweep_interval, error_out)) return false;

  *out = std::move(c);
  return true;
}

bool load_config_file(const std::string& path, ServerConfig* out, std::string* error_out) {
  std::ifstream in(path);
  if (!in) return fail(error_out, "cannot open config file: " + path);

  common::json j;
  try {
    j = common::json::parse(in, nullptr, true, true);
  } catch (const std::exception& e) {
    return fail(error_out, "failed to parse config file " + path + ": " + e.what());
  }
  std::string err;
  if (!apply_config_json(j, out, &err)) return fail(error_out, path + ": " + err);
  return true;
}

bool validate_config(const ServerConfig& config, std::string* error_out) {
  boost::system::error_code ec;
  (void)boost::asio::ip::make_address(config.bind_address, ec);
  if (ec) return fail(error_out, "invalid bind_address: " + config.bind_address);
  if (config.table_stripes == 0) return fail(error_out, "table_stripes must be at least 1");
  if (config.max_pending_messages > 1024) return fail(error_out, "max_pending_messages must be at most 1024");
  if (config.sweep_interval.count() == 0) return fail(error_out, "sweep_interval_s must be at least 1");
  if (config.waiting_timeout.count() == 0) return fail(error_out, "waiting_timeout_s must be at least 1");
  if (config.idle_timeout.count() == 0) return fail(error_out, "idle_timeout_s must be at least 1");
  if (config.worker_threads > 256) return fail(error_out, "worker_threads must be at most 256");
  if (config.stun_enabled && config.signal_port != 0 && config.signal_port == config.stun_port) {
    return fail(error_out, "signal_port and stun_port must differ");
  }
  return true;
}

ArgsResult parse_args(const std::vector<std::string>& args, ServerConfig* out, std::string* error_out) {
  ServerConfig c = *out;

  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "--help" || args[i] == "-h") return ArgsResult::Help;
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        fail(error_out, "--config needs a value");
        return ArgsResult::Error;
      }
      if (!load_config_file(args[i + 1], &c, error_out)) return ArgsResult::Error;
    }
  }

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string& a = args[i];
    auto need_val = [&](const char* flag) -> std::optional<std::string> {
      if (a != flag) return std::nullopt;
      if (i + 1 >= args.size()) return std::nullopt;
      return args[++i];
    };
    auto port_val = [&](const std::string& flag, const std::string& v, uint16_t* port) {
      const auto p = common::parse_port(v);
      if (!p) return fail(error_out, "invalid " + flag + ": " + v);
      *port = *p;
      return true;
    };

    if (need_val("--config")) continue;
    if (auto v = need_val("--bind")) {
      c.bind_address = *v;
      continue;
    }
    if (auto v = need_val("--signal-port")) {
      if (!port_val("--signal-port", *v, &c.signal_port)) return ArgsResult::Error;
      continue;
    }
    if (auto v = need_val("--stun-port")) {
      if (!port_val("--stun-port", *v, &c.stun_port)) return ArgsResult::Error;
      continue;
    }
    if (auto v = need_val("--threads")) {
      try {
        const unsigned long n = std::stoul(*v);
        if (n > 256) throw std::out_of_range("threads");
        c.worker_threads = static_cast<unsigned>(n);
      } catch (const std::exception&) {
        fail(error_out, "invalid --threads: " + *v);
        return ArgsResult::Error;
      }
      continue;
    }
    if (a == "--no-stun") {
      c.stun_enabled = false;
      continue;
    }
    fail(error_out, "unknown or incomplete argument: " + a);
    return ArgsResult::Error;
  }

  if (!validate_config(c, error_out)) return ArgsResult::Error;
  *out = std::move(c);
  return ArgsResult::Run;
}

std::string usage(const std::string& program) {
  return "Usage: " + program +
         " [--config <file.json>] [--bind <ip>] [--signal-port N] [--stun-port N] [--threads N] [--no-stun]\n"
         "Example: " + program + " --bind 0.0.0.0 --signal-port 9003 --stun-port 9004\n";
}

} // namespace pairlink
