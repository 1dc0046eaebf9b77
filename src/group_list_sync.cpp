#include "group_list_sync.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <sstream>
#include <utility>

namespace {

std::vector<int> normalizedGroups(std::vector<int> groups) {
    if (groups.empty()) {
        groups.push_back(0);
    }
    std::sort(groups.begin(), groups.end());
    groups.erase(std::unique(groups.begin(), groups.end()), groups.end());
    return groups;
}

std::string joinIds(const std::vector<int>& ids) {
    std::ostringstream out;
    out << "[";
    for (std::size_t i = 0; i < ids.size(); ++i) {
        out << (i == 0 ? "" : ", ") << ids[i];
    }
    out << "]";
    return out.str();
}

bool sameList(const AdList& desired, const AdList& existing) {
    return desired.comment == existing.comment &&
           desired.enabled == existing.enabled &&
           normalizedGroups(desired.groups) == normalizedGroups(existing.groups);
}

void warn(const std::string& message, std::vector<std::string>& warnings) {
    spdlog::warn("{}", message);
    warnings.push_back(message);
}

} // namespace

std::vector<int> resolveListGroups(const AdList& list,
                                   const std::map<int, std::string>& mainGroupNames,
                                   const std::map<std::string, int>& secondaryGroupIds,
                                   bool syncGroupsEnabled,
                                   const std::string& secondaryLabel,
                                   std::vector<std::string>& warnings) {
    const std::vector<int> mainIds = normalizedGroups(list.groups);

    if (!syncGroupsEnabled) {
        if (mainIds != std::vector<int>{0}) {
            warn("[" + secondaryLabel + "] sync_lists is enabled without sync_groups; assigning list " +
                 list.address + " to the default group (groups on main: " + joinIds(mainIds) + ")", warnings);
        }
        return {0};
    }

    std::vector<int> mapped;
    for (int id : mainIds) {
        auto name = mainGroupNames.find(id);
        const std::string groupName = name != mainGroupNames.end() ? name->second : "id:" + std::to_string(id);

        auto target = secondaryGroupIds.find(groupName);
        if (target != secondaryGroupIds.end()) {
            mapped.push_back(target->second);
        } else if (id == 0) {
            mapped.push_back(0);
        } else {
            warn("[" + secondaryLabel + "] group '" + groupName + "' is missing on the secondary; assigning list " +
                 list.address + " to the default group", warnings);
            mapped.push_back(0);
        }
    }
    return normalizedGroups(std::move(mapped));
}

GroupListSync::GroupListSync(const ConfigApiTransport& transport) : m_transport(transport) {}

bool GroupListSync::syncGroups(const Session& secondary, const std::vector<Group>& mainGroups) const {
    std::map<std::string, Group> existing;
    for (auto& group : m_transport.fetchGroups(secondary)) {
        existing.emplace(group.name, std::move(group));
    }

    bool changed = false;
    for (const auto& group : mainGroups) {
        auto it = existing.find(group.name);
        if (it == existing.end()) {
            m_transport.addGroup(secondary, group);
            changed = true;
        } else if (it->second.comment != group.comment || it->second.enabled != group.enabled) {
            m_transport.updateGroup(secondary, it->second.name, group);
            changed = true;
        }
    }

    if (!changed) {
        spdlog::debug("[{}] groups already in sync", secondary.label());
    }
    return changed;
}

bool GroupListSync::syncLists(const Session& secondary,
                              const std::vector<AdList>& mainLists,
                              const std::vector<Group>& mainGroups,
                              bool syncGroupsEnabled,
                              std::vector<std::string>& warnings) const {
    std::map<int, std::string> mainGroupNames;
    for (const auto& group : mainGroups) {
        if (group.id) {
            mainGroupNames.emplace(*group.id, group.name);
        }
    }

    // group sync may just have added groups, so read the secondary's ids now
    std::map<std::string, int> secondaryGroupIds;
    for (const auto& group : m_transport.fetchGroups(secondary)) {
        if (group.id) {
            secondaryGroupIds.emplace(group.name, *group.id);
        }
    }

    std::map<std::pair<std::string, std::string>, AdList> existing;
    for (auto& list : m_transport.fetchLists(secondary)) {
        auto key = std::make_pair(list.address, list.type);
        existing.emplace(std::move(key), std::move(list));
    }

    bool changed = false;
    for (const auto& list : mainLists) {
        AdList desired = list;
        desired.id.reset();
        desired.groups = resolveListGroups(list, mainGroupNames, secondaryGroupIds, syncGroupsEnabled,
                                           secondary.label(), warnings);

        auto it = existing.find(std::make_pair(list.address, list.type));
        if (it == existing.end()) {
            m_transport.addList(secondary, desired);
            changed = true;
        } else if (!sameList(desired, it->second)) {
            m_transport.updateList(secondary, desired);
            changed = true;
        }
    }

    if (!changed) {
        spdlog::debug("[{}] lists already in sync", secondary.label());
    }
    return changed;
}
