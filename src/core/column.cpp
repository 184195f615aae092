#include <tbl/core/column.hpp>

#include <utility>

namespace tbl {

auto Column::find(RowNumber row) const -> std::optional<std::string_view> {
    auto it = cells_.find(row);
    if (it == cells_.end()) {
        return std::nullopt;
    }
    return std::string_view(it->second);
}

auto Column::value_or_empty(RowNumber row) const -> std::string_view {
    return find(row).value_or(std::string_view{});
}

void Column::set(RowNumber row, std::string value) {
    if (value.empty()) {
        cells_.erase(row);
        return;
    }
    cells_.insert_or_assign(row, std::move(value));
}

}  // namespace tbl
