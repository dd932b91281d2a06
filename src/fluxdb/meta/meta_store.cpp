#include "fluxdb/meta/meta_store.h"

namespace fluxdb {
namespace meta {

const char* PrivilegeName(Privilege privilege) {
    switch (privilege) {
        case Privilege::NO_PRIVILEGES: return "NO PRIVILEGES";
        case Privilege::READ: return "READ";
        case Privilege::WRITE: return "WRITE";
        case Privilege::ALL: return "ALL PRIVILEGES";
    }
    return "UNKNOWN";
}

bool UserInfo::Authorize(Privilege privilege, const std::string& database) const {
    if (admin) {
        return true;
    }
    auto it = privileges.find(database);
    if (it == privileges.end()) {
        return false;
    }
    return it->second == privilege || it->second == Privilege::ALL;
}

} // namespace meta
} // namespace fluxdb
