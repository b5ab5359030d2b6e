#include <tabula/core/column.hpp>
#include <tabula/core/value.hpp>

#include <cstdint>
#include <string>

// Column<T> is fully header-only (template class).
// This translation unit instantiates every storage type a ColumnValue can
// hold, so each is checked against the ColumnElement requirements once.

namespace tabula {

template class Column<bool>;
template class Column<std::int64_t>;
template class Column<double>;
template class Column<std::string>;
template class Column<Date>;
template class Column<Timestamp>;
template class Column<Scalar>;

}  // namespace tabula
