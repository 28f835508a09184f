#include <shroud/core/column.hpp>
#include <shroud/core/time.hpp>

#include <cstdint>
#include <string>

// Column<T> is header-only; the cell types a sheet can hold are
// instantiated once here.

namespace shroud {

template class Column<std::int64_t>;
template class Column<double>;
template class Column<std::string>;
template class Column<Date>;

}  // namespace shroud
