#include "config/config.hpp"
#include <boost/log/trivial.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <fstream>
#include <sstream>

namespace pneumatic {
namespace config {

namespace pt = boost::property_tree;

namespace {

template <typename T>
std::optional<T> read_optional(const pt::ptree& tree, const std::string& key) {
  const auto node = tree.get_child_optional(key);
  if (!node) {
    return std::nullopt;
  }
  const auto value = node->get_value_optional<T>();
  if (!value) {
    throw ConfigError("invalid value for '" + key + "': " + node->data());
  }
  return *value;
}

ServerConfig from_tree(const pt::ptree& tree) {
  ServerConfig config;

  if (const auto roots = tree.get_child_optional("roots")) {
    for (const auto& item : *roots) {
      if (!item.first.empty() || item.second.data().empty()) {
        throw ConfigError("'roots' must be an array of paths");
      }
      config.roots.push_back(item.second.data());
    }
  }

  config.small_file_threshold_bytes = read_optional<uint64_t>(tree, "small_file_threshold_bytes");
  config.large_file_threshold_bytes = read_optional<uint64_t>(tree, "large_file_threshold_bytes");
  config.bundle_target_size = read_optional<uint64_t>(tree, "bundle_target_size");

  if (const auto workers = read_optional<std::size_t>(tree, "discovery_workers")) {
    if (*workers == 0) {
      throw ConfigError("'discovery_workers' must be positive");
    }
    config.discovery_workers = *workers;
  }
  if (const auto address = read_optional<std::string>(tree, "address")) {
    config.address = *address;
  }
  if (const auto port = read_optional<uint16_t>(tree, "port")) {
    config.port = *port;
  }
  if (const auto close = read_optional<bool>(tree, "close_on_unsupported_protocol")) {
    config.close_on_unsupported_protocol = *close;
  }

  return config;
}

ServerConfig parse_stream(std::istream& input, const std::string& source) {
  pt::ptree tree;
  try {
    pt::read_json(input, tree);
  }
  catch (const pt::json_parser_error& e) {
    throw ConfigError(source + ": " + e.what());
  }

  ServerConfig config = from_tree(tree);
  BOOST_LOG_TRIVIAL(info) << "Config: Loaded " << source << " (" << config.roots.size() << " roots, "
                          << config.discovery_workers << " discovery workers)";
  return config;
}

} // namespace

//==============================================
// GETTERS WITH DEFAULTS
//==============================================

uint64_t ServerConfig::get_small_file_threshold() const {
  return small_file_threshold_bytes.value_or(transfer::PlanThresholds::DEFAULT_SMALL_FILE_THRESHOLD);
}

uint64_t ServerConfig::get_large_file_threshold() const {
  return large_file_threshold_bytes.value_or(transfer::PlanThresholds::DEFAULT_LARGE_FILE_THRESHOLD);
}

uint64_t ServerConfig::get_bundle_target_size() const {
  return bundle_target_size.value_or(transfer::PlanThresholds::DEFAULT_BUNDLE_TARGET_SIZE);
}

transfer::PlanThresholds ServerConfig::plan_thresholds() const {
  transfer::PlanThresholds thresholds;
  thresholds.small_file_threshold = get_small_file_threshold();
  thresholds.large_file_threshold = get_large_file_threshold();
  thresholds.bundle_target_size = get_bundle_target_size();
  return thresholds;
}

network::UnsupportedProtocolPolicy ServerConfig::unsupported_protocol_policy() const {
  return close_on_unsupported_protocol ? network::UnsupportedProtocolPolicy::CLOSE
                                       : network::UnsupportedProtocolPolicy::KEEP_OPEN;
}

//==============================================
// LOADING
//==============================================

ServerConfig load_config(const std::string& path) {
  BOOST_LOG_TRIVIAL(debug) << "Config: Reading " << path;

  std::ifstream file(path);
  if (!file) {
    throw ConfigError("cannot open " + path);
  }
  return parse_stream(file, path);
}

ServerConfig parse_config(const std::string& json) {
  std::istringstream input(json);
  return parse_stream(input, "<inline>");
}

} // namespace config
} // namespace pneumatic
