#include "i_item_store.hpp"

namespace itemvault {
namespace store {

const char *store_status_to_string(StoreStatus status) {
    switch (status) {
        case StoreStatus::OK:
            return "OK";
        case StoreStatus::NOT_FOUND:
            return "NOT_FOUND";
        case StoreStatus::CONFLICT:
            return "CONFLICT";
        case StoreStatus::UNAVAILABLE:
            return "UNAVAILABLE";
        default:
            return "UNAVAILABLE";
    }
}

}  // namespace store
}  // namespace itemvault
