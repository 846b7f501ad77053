#pragma once

#include "ports/output/IInventoryStore.hpp"
#include "domain/StockMutation.hpp"
#include <vector>

namespace inventory::application {

/**
 * @brief Одна мутация - mutate(), несколько - batchMutate()
 */
inline std::vector<domain::StockRecord> applyMutations(
    ports::output::IInventoryStore& store,
    const std::vector<domain::StockMutation>& mutations)
{
    if (mutations.size() == 1) {
        return {store.mutate(mutations.front())};
    }
    return store.batchMutate(mutations);
}

} // namespace inventory::application
