#ifndef CONFIG_FILTER_HPP
#define CONFIG_FILTER_HPP

#include <map>
#include <string>

#include <json/json.h>

#include "configuration.hpp"

/// @brief Apply an include/exclude policy to a `/config` tree
///
/// A leaf is selected when its dotted path, or the path of one of its
/// ancestors, is in the policy's key set. Arrays count as leaves. Under
/// INCLUDE only the selected leaves remain, together with the objects leading
/// to them; under EXCLUDE the selected leaves are removed. Objects emptied by
/// filtering are dropped. Keys that do not exist in the tree are ignored.
/// An empty key set yields `{}` for INCLUDE and the unchanged tree for EXCLUDE.
Json::Value applyFilter(const Json::Value& tree, const ConfigFilterPolicy& policy);

/// Dotted path to leaf value, in path order. Empty objects are reported as
/// leaves so that they survive a per-key write.
std::map<std::string, Json::Value> flattenConfig(const Json::Value& tree);

/// Build the nested object `{"a": {"b": value}}` for path "a.b"
Json::Value expandPath(const std::string& path, const Json::Value& value);

/// Throws FilterConfigError for empty keys or malformed dotted paths
void validatePolicy(const ConfigFilterPolicy& policy);

#endif // CONFIG_FILTER_HPP
