// SPDX-License-Identifier: MIT

#include "rowkit/table.hpp"

#include <fmt/format.h>

namespace rowkit {

std::string MemoryTable::describe() const {
    return fmt::format("MemoryTable[{} fields, {} rows]", schema_.size(), rows_.size());
}

}  // namespace rowkit
