#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace catalog::db::sql {

/*
  Parameter abstraction.

  SQLite: ? ? ? bound in order.
  nullptr binds SQL NULL, Blob binds raw bytes.
*/

struct Blob {
  std::string bytes;
};

using Param = std::variant<
    std::nullptr_t,
    int64_t,
    std::string,
    Blob
>;

using Params = std::vector<Param>;

}
