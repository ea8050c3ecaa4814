#pragma once

#include "core/error.hpp"
#include <boost/property_tree/exceptions.hpp>
#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

// namespace config: persisted settings shared by both subcommands.
// File layout (JSON shown; INI uses [server]/[client] sections):
//   {"server":{"addr":":8080","file":"sample.txt","delay":1000},
//    "client":{"server":"http://localhost:8080/offer","output":""}}
namespace config {

namespace pt = boost::property_tree;

struct ServerSection {
  std::string addr = ":8080";
  std::string file = "sample.txt";
  std::int64_t delay_ms = 1000;
};

struct ClientSection {
  std::string server = "http://localhost:8080/offer";
  std::string output;
};

struct Config {
  ServerSection server;
  ClientSection client;
  // Path the values were read from; empty when only defaults apply.
  std::string source;
};

namespace detail {

inline bool IsIni(const std::filesystem::path &path) {
  return path.extension() == ".ini";
}

inline core::Status ReadTree(const std::filesystem::path &path,
                             pt::ptree &tree) {
  std::ifstream in(path);
  if (!in.is_open()) {
    return core::MakeError(core::ErrorKind::config,
                           "error reading config file " + path.string() +
                               ": cannot open");
  }
  try {
    if (IsIni(path)) {
      pt::read_ini(in, tree);
    } else {
      pt::read_json(in, tree);
    }
  } catch (const pt::file_parser_error &e) {
    return core::MakeError(core::ErrorKind::config,
                           "error reading config file " + path.string() +
                               ": " + e.message() + " at line " +
                               std::to_string(e.line()));
  }
  return {};
}

} // namespace detail

// Empty `path` looks for ./config.json then ./config.ini. A missing file
// yields defaults; a file that exists but cannot be parsed is an error.
inline core::Result<Config> LoadConfig(const std::string &path) {
  Config cfg;
  std::filesystem::path chosen;
  std::error_code fs_ec;
  if (path.empty()) {
    for (const char *candidate : {"config.json", "config.ini"}) {
      if (std::filesystem::exists(candidate, fs_ec)) {
        chosen = candidate;
        break;
      }
    }
  } else if (std::filesystem::exists(path, fs_ec)) {
    chosen = path;
  }
  if (chosen.empty()) {
    return cfg;
  }

  pt::ptree tree;
  if (auto st = detail::ReadTree(chosen, tree); !st) {
    return std::unexpected(st.error());
  }
  try {
    cfg.server.addr = tree.get("server.addr", cfg.server.addr);
    cfg.server.file = tree.get("server.file", cfg.server.file);
    if (tree.get_child_optional("server.delay")) {
      cfg.server.delay_ms = tree.get<std::int64_t>("server.delay");
    }
    cfg.client.server = tree.get("client.server", cfg.client.server);
    cfg.client.output = tree.get("client.output", cfg.client.output);
  } catch (const pt::ptree_bad_data &e) {
    return core::MakeError(core::ErrorKind::config,
                           "unable to decode config " + chosen.string() +
                               ": " + e.what());
  }
  if (cfg.server.delay_ms < 0) {
    return core::MakeError(core::ErrorKind::config,
                           "server.delay must not be negative");
  }
  cfg.source = chosen.string();
  return cfg;
}

// Writes every key; the extension selects INI or JSON. Parent directories
// are created.
inline core::Status SaveConfig(const Config &cfg, const std::string &path) {
  const std::filesystem::path target(path);
  std::error_code fs_ec;
  if (target.has_parent_path()) {
    std::filesystem::create_directories(target.parent_path(), fs_ec);
    if (fs_ec) {
      return core::MakeError(core::ErrorKind::config,
                             "error creating config directory: " +
                                 fs_ec.message());
    }
  }
  pt::ptree tree;
  tree.put("server.addr", cfg.server.addr);
  tree.put("server.file", cfg.server.file);
  tree.put("server.delay", cfg.server.delay_ms);
  tree.put("client.server", cfg.client.server);
  tree.put("client.output", cfg.client.output);

  std::ofstream out(target, std::ios::trunc);
  if (!out.is_open()) {
    return core::MakeError(core::ErrorKind::config,
                           "error writing config file " + path);
  }
  try {
    if (detail::IsIni(target)) {
      pt::write_ini(out, tree);
    } else {
      pt::write_json(out, tree);
    }
  } catch (const pt::file_parser_error &e) {
    return core::MakeError(core::ErrorKind::config,
                           "error writing config file " + path + ": " +
                               e.message());
  }
  out.flush();
  if (!out) {
    return core::MakeError(core::ErrorKind::config,
                           "error writing config file " + path);
  }
  return {};
}

} // namespace config
