#pragma once

#include "rpcbridge/handler/procedure_table.hpp"

#include <memory>

namespace rpcbridge::cli {

// Procedures served by rpcbridge-cli:
//   health   query     {"status": "ok"}
//   echo     query     returns its input (null when absent)
//   add      mutation  {"a": n, "b": m} -> n + m, integer when both are
//   fail     query     always throws
//   slow     query     waits `input` milliseconds (default 50)
[[nodiscard]] std::shared_ptr<ProcedureTable> make_demo_router();

}  // namespace rpcbridge::cli
