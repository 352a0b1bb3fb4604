#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace tuplestore::db::sql {

/*
  Parameter abstraction.

  Postgres: $1 $2 $3
  SQLite:   ? ? ?

  Both use ordered binding, so one Params vector serves both.
*/

using Param = std::variant<
    int64_t,
    uint64_t,
    std::string
>;

using Params = std::vector<Param>;

// Debug rendering used in log lines and leak reports.
std::string ParamToString(const Param& param);
std::string ParamsToString(const Params& params);

}
