#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace agent_notifier::core {
namespace {

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string lowercase(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (const char c : value) {
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

bool parse_bool(const std::string& value) {
  const std::string lower = lowercase(value);
  return lower == "true" || lower == "yes" || lower == "on" || lower == "1";
}

std::string unquote(const std::string& value) {
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

long long parse_ranged(const std::string& key, const std::string& value, long long min, long long max) {
  std::size_t consumed = 0;
  const auto parsed = std::stoll(value, &consumed);
  if (consumed != value.size()) {
    throw std::runtime_error(key + " must be an integer");
  }
  if (parsed < min || parsed > max) {
    throw std::runtime_error(key + " must be in range " + std::to_string(min) + ".." + std::to_string(max));
  }
  return parsed;
}

void apply_key_value(RelayConfig& config, const std::string& key, const std::string& value) {
  if (key == "app_name") {
    config.app_name = unquote(value);
    if (config.app_name.empty()) {
      throw std::runtime_error("app_name must not be empty");
    }
    return;
  }

  if (key == "settings_path") {
    config.settings_path = unquote(value);
    if (config.settings_path.empty()) {
      throw std::runtime_error("settings_path must not be empty");
    }
    return;
  }

  if (key == "server.worker_threads") {
    config.worker_threads = static_cast<std::size_t>(parse_ranged(key, value, 1, 64));
    return;
  }

  if (key == "mcp.keepalive_interval_s") {
    config.keepalive_interval = std::chrono::seconds(parse_ranged(key, value, 1, 3600));
    return;
  }

  if (key == "notifier.backend") {
    const auto backend = lowercase(unquote(value));
    if (backend == "auto") {
      config.notifier = NotifierBackend::kAuto;
    } else if (backend == "libnotify") {
      config.notifier = NotifierBackend::kLibnotify;
    } else if (backend == "log") {
      config.notifier = NotifierBackend::kLog;
    } else {
      throw std::runtime_error("notifier.backend must be one of auto, libnotify, log");
    }
    return;
  }

  if (key == "sound.enabled") {
    config.sound.enabled = parse_bool(value);
    return;
  }

  if (key == "sound.file") {
    config.sound.file = unquote(value);
    return;
  }

  if (key == "sound.worker_threads") {
    config.sound.worker_threads = static_cast<std::size_t>(parse_ranged(key, value, 1, 16));
  }
}

}  // namespace

RelayConfig load_relay_config(const std::string& path) {
  RelayConfig config{};

  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }

  std::vector<std::string> sections;
  std::string line;
  while (std::getline(input, line)) {
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.erase(comment_pos);
    }

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string value = trim(stripped.substr(colon_pos + 1));

    if (sections.size() > depth) {
      sections.resize(depth);
    }

    if (value.empty()) {
      if (sections.size() == depth) {
        sections.push_back(key);
      } else {
        sections[depth] = key;
      }
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key << section << '.';
      }
    }
    full_key << key;

    apply_key_value(config, full_key.str(), value);
  }

  return config;
}

}  // namespace agent_notifier::core
