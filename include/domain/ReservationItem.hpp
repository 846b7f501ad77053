#pragma once

#include <string>
#include <cstdint>

namespace inventory::domain {

struct ReservationItem {
    std::string skuId;
    int64_t quantity = 0;
};

} // namespace inventory::domain
