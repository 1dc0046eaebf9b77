#ifndef GROUP_LIST_SYNC_HPP
#define GROUP_LIST_SYNC_HPP

#include <map>
#include <string>
#include <vector>

#include "config_api_transport.hpp"

/// @brief Map a main list's group ids onto the secondary's group ids
///
/// Ids travel by name: main id -> main group name -> secondary id. An empty
/// group set means the default group 0. Without group sync every list lands
/// in group 0, and a list that used other groups on main gets a warning; a
/// group missing on the secondary maps to 0 with a warning as well.
/// @return sorted, de-duplicated secondary group ids
std::vector<int> resolveListGroups(const AdList& list,
                                   const std::map<int, std::string>& mainGroupNames,
                                   const std::map<std::string, int>& secondaryGroupIds,
                                   bool syncGroupsEnabled,
                                   const std::string& secondaryLabel,
                                   std::vector<std::string>& warnings);

/// Reconciles groups (by name) and adlists (by address and type) on one
/// secondary. Only adds and updates; nothing is deleted.
class GroupListSync {
public:
    explicit GroupListSync(const ConfigApiTransport& transport);

    /// @return true when a group was added or updated
    bool syncGroups(const Session& secondary, const std::vector<Group>& mainGroups) const;

    /// @return true when a list was added or updated
    bool syncLists(const Session& secondary,
                   const std::vector<AdList>& mainLists,
                   const std::vector<Group>& mainGroups,
                   bool syncGroupsEnabled,
                   std::vector<std::string>& warnings) const;

private:
    const ConfigApiTransport& m_transport;
};

#endif // GROUP_LIST_SYNC_HPP
