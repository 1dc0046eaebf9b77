#include "config_filter.hpp"
#include "sync_errors.hpp"

#include <cctype>

namespace {

bool hasSelectedDescendant(const std::set<std::string>& keys, const std::string& path) {
    const std::string prefix = path + ".";
    auto it = keys.lower_bound(prefix);
    return it != keys.end() && it->compare(0, prefix.size(), prefix) == 0;
}

Json::Value filterObject(const Json::Value& object, const std::string& path, const ConfigFilterPolicy& policy) {
    const bool include = policy.mode == FilterMode::INCLUDE;
    Json::Value result(Json::objectValue);

    for (const auto& name : object.getMemberNames()) {
        const std::string childPath = path.empty() ? name : path + "." + name;
        const Json::Value& child = object[name];

        if (policy.keys.count(childPath) != 0) {
            // the whole subtree is selected
            if (include) {
                result[name] = child;
            }
            continue;
        }

        if (child.isObject() && hasSelectedDescendant(policy.keys, childPath)) {
            Json::Value filtered = filterObject(child, childPath, policy);
            if (!filtered.empty() || (!include && child.empty())) {
                result[name] = std::move(filtered);
            }
            continue;
        }

        if (!include) {
            result[name] = child;
        }
    }
    return result;
}

void flattenInto(const Json::Value& value, const std::string& path, std::map<std::string, Json::Value>& leaves) {
    if (!value.isObject() || value.empty()) {
        leaves.emplace(path, value);
        return;
    }
    for (const auto& name : value.getMemberNames()) {
        flattenInto(value[name], path.empty() ? name : path + "." + name, leaves);
    }
}

} // namespace

Json::Value applyFilter(const Json::Value& tree, const ConfigFilterPolicy& policy) {
    if (policy.keys.empty()) {
        return policy.mode == FilterMode::INCLUDE ? Json::Value(Json::objectValue) : tree;
    }
    if (!tree.isObject()) {
        return Json::Value(Json::objectValue);
    }
    return filterObject(tree, "", policy);
}

std::map<std::string, Json::Value> flattenConfig(const Json::Value& tree) {
    std::map<std::string, Json::Value> leaves;
    if (!tree.isObject()) {
        return leaves;
    }
    for (const auto& name : tree.getMemberNames()) {
        flattenInto(tree[name], name, leaves);
    }
    return leaves;
}

Json::Value expandPath(const std::string& path, const Json::Value& value) {
    Json::Value root(Json::objectValue);
    Json::Value* node = &root;

    std::string::size_type start = 0;
    for (auto dot = path.find('.'); dot != std::string::npos; dot = path.find('.', start)) {
        node = &(*node)[path.substr(start, dot - start)];
        start = dot + 1;
    }
    (*node)[path.substr(start)] = value;
    return root;
}

void validatePolicy(const ConfigFilterPolicy& policy) {
    for (const auto& key : policy.keys) {
        if (key.empty()) {
            throw FilterConfigError("filter_keys contains an empty key");
        }
        if (key.front() == '.' || key.back() == '.' || key.find("..") != std::string::npos) {
            throw FilterConfigError("filter key '" + key + "' is not a valid dotted path");
        }
        for (unsigned char c : key) {
            if (std::isspace(c)) {
                throw FilterConfigError("filter key '" + key + "' contains whitespace");
            }
        }
    }
}
