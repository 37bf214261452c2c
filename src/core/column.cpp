#include <strata/core/column.hpp>

#include <cstdint>
#include <string>

namespace strata {

// Explicit instantiations for the most common element types to reduce
// compile times in dependent translation units.
template class Column<bool>;
template class Column<std::int64_t>;
template class Column<double>;
template class Column<std::string>;

}  // namespace strata
