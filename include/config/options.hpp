#pragma once

#include "config/config_file.hpp"
#include "core/error.hpp"
#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace config {

struct ServerOptions {
  std::string addr = ":8080";
  std::string file = "sample.txt";
  std::chrono::milliseconds delay{1000};
  std::chrono::milliseconds gather_timeout{10000};
  std::chrono::milliseconds open_timeout{30000};
  std::string bind_address = "0.0.0.0";
  bool verbose = false;
  bool help = false;
};

struct ClientOptions {
  std::string server = "http://localhost:8080/offer";
  std::string output;
  std::chrono::milliseconds gather_timeout{10000};
  std::chrono::milliseconds open_timeout{30000};
  std::string bind_address = "0.0.0.0";
  bool verbose = false;
  bool help = false;
};

// Returns the variable's value, or nullopt when unset.
using EnvLookup = std::function<std::optional<std::string>(const char *)>;

inline std::optional<std::string> SystemEnv(const char *name) {
  const char *v = std::getenv(name);
  if (v == nullptr) {
    return std::nullopt;
  }
  return std::string(v);
}

namespace detail {

inline std::unexpected<core::Error> ConfigError(std::string message) {
  return core::MakeError(core::ErrorKind::config, std::move(message));
}

inline core::Result<std::chrono::milliseconds>
ParseMillis(std::string_view name, std::string_view value) {
  std::int64_t ms = 0;
  auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), ms);
  if (ec != std::errc() || ptr != value.data() + value.size() || ms < 0) {
    return ConfigError("invalid value \"" + std::string(value) + "\" for " +
                       std::string(name) +
                       " (expected non-negative milliseconds)");
  }
  return std::chrono::milliseconds(ms);
}

// Splits argv into (flag, value) pairs. Accepts "--flag value" and
// "--flag=value"; boolean flags take no value.
class ArgReader {
public:
  explicit ArgReader(const std::vector<std::string> &args) : args_(args) {}

  struct Flag {
    std::string name;
    std::optional<std::string> inline_value;
  };

  std::optional<Flag> NextFlag() {
    if (pos_ >= args_.size()) {
      return std::nullopt;
    }
    const std::string &a = args_[pos_++];
    Flag f;
    auto eq = a.find('=');
    if (a.rfind("--", 0) == 0 && eq != std::string::npos) {
      f.name = a.substr(0, eq);
      f.inline_value = a.substr(eq + 1);
    } else {
      f.name = a;
    }
    return f;
  }

  core::Result<std::string> Value(const Flag &f) {
    if (f.inline_value) {
      return *f.inline_value;
    }
    if (pos_ >= args_.size()) {
      return ConfigError("flag " + f.name + " needs a value");
    }
    return args_[pos_++];
  }

private:
  const std::vector<std::string> &args_;
  std::size_t pos_ = 0;
};

// --config must be known before the file is loaded, so it is looked up
// ahead of regular parsing.
inline std::string FindConfigPath(const std::vector<std::string> &args) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "--config" && i + 1 < args.size()) {
      return args[i + 1];
    }
    if (args[i].rfind("--config=", 0) == 0) {
      return args[i].substr(9);
    }
  }
  return {};
}

} // namespace detail

// Shared flags of both subcommands; returns true if `flag` was consumed.
template <typename Options>
core::Result<bool> ApplyCommonFlag(Options &opt, detail::ArgReader &reader,
                                   const detail::ArgReader::Flag &flag) {
  if (flag.name == "--help" || flag.name == "-h") {
    opt.help = true;
    return true;
  }
  if (flag.name == "--verbose" || flag.name == "-v") {
    opt.verbose = true;
    return true;
  }
  if (flag.name == "--config" || flag.name == "--gather-timeout" ||
      flag.name == "--open-timeout" || flag.name == "--bind") {
    auto v = reader.Value(flag);
    if (!v) {
      return std::unexpected(v.error());
    }
    if (flag.name == "--bind") {
      opt.bind_address = *v;
    } else if (flag.name != "--config") {
      auto ms = detail::ParseMillis(flag.name, *v);
      if (!ms) {
        return std::unexpected(ms.error());
      }
      (flag.name == "--gather-timeout" ? opt.gather_timeout
                                       : opt.open_timeout) = *ms;
    }
    return true;
  }
  return false;
}

// defaults < config file < LINECAST_SERVER_* < flags
inline core::Result<ServerOptions>
ParseServerOptions(const std::vector<std::string> &args,
                   const EnvLookup &env = SystemEnv) {
  ServerOptions opt;
  auto cfg = LoadConfig(detail::FindConfigPath(args));
  if (!cfg) {
    return std::unexpected(cfg.error());
  }
  opt.addr = cfg->server.addr;
  opt.file = cfg->server.file;
  opt.delay = std::chrono::milliseconds(cfg->server.delay_ms);

  if (auto v = env("LINECAST_SERVER_ADDR")) {
    opt.addr = *v;
  }
  if (auto v = env("LINECAST_SERVER_FILE")) {
    opt.file = *v;
  }
  if (auto v = env("LINECAST_SERVER_DELAY")) {
    auto ms = detail::ParseMillis("LINECAST_SERVER_DELAY", *v);
    if (!ms) {
      return std::unexpected(ms.error());
    }
    opt.delay = *ms;
  }

  detail::ArgReader reader(args);
  while (auto flag = reader.NextFlag()) {
    auto common = ApplyCommonFlag(opt, reader, *flag);
    if (!common) {
      return std::unexpected(common.error());
    }
    if (*common) {
      continue;
    }
    if (flag->name == "--addr" || flag->name == "--file" ||
        flag->name == "--delay") {
      auto v = reader.Value(*flag);
      if (!v) {
        return std::unexpected(v.error());
      }
      if (flag->name == "--addr") {
        opt.addr = *v;
      } else if (flag->name == "--file") {
        opt.file = *v;
      } else {
        auto ms = detail::ParseMillis("--delay", *v);
        if (!ms) {
          return std::unexpected(ms.error());
        }
        opt.delay = *ms;
      }
      continue;
    }
    return detail::ConfigError("unknown flag " + flag->name);
  }
  return opt;
}

// defaults < config file < LINECAST_CLIENT_* < flags
inline core::Result<ClientOptions>
ParseClientOptions(const std::vector<std::string> &args,
                   const EnvLookup &env = SystemEnv) {
  ClientOptions opt;
  auto cfg = LoadConfig(detail::FindConfigPath(args));
  if (!cfg) {
    return std::unexpected(cfg.error());
  }
  opt.server = cfg->client.server;
  opt.output = cfg->client.output;

  if (auto v = env("LINECAST_CLIENT_SERVER")) {
    opt.server = *v;
  }
  if (auto v = env("LINECAST_CLIENT_OUTPUT")) {
    opt.output = *v;
  }

  detail::ArgReader reader(args);
  while (auto flag = reader.NextFlag()) {
    auto common = ApplyCommonFlag(opt, reader, *flag);
    if (!common) {
      return std::unexpected(common.error());
    }
    if (*common) {
      continue;
    }
    if (flag->name == "--server" || flag->name == "--output") {
      auto v = reader.Value(*flag);
      if (!v) {
        return std::unexpected(v.error());
      }
      (flag->name == "--server" ? opt.server : opt.output) = *v;
      continue;
    }
    return detail::ConfigError("unknown flag " + flag->name);
  }
  return opt;
}

inline const char *ServerUsage() {
  return "usage: linecast server [--addr [host]:port] [--file path]\n"
         "                       [--delay ms] [--gather-timeout ms]\n"
         "                       [--open-timeout ms] [--bind address]\n"
         "                       [--config path] [--verbose]\n";
}

inline const char *ClientUsage() {
  return "usage: linecast client [--server http://host:port/offer]\n"
         "                       [--output path] [--gather-timeout ms]\n"
         "                       [--open-timeout ms] [--bind address]\n"
         "                       [--config path] [--verbose]\n";
}

} // namespace config
