#pragma once

#include "rpcbridge/error/rpc_error.hpp"
#include "rpcbridge/handler/input.hpp"
#include "rpcbridge/handler/procedure_type.hpp"

#include <asio/awaitable.hpp>
#include <nlohmann/json.hpp>

#include <string_view>

namespace rpcbridge {

using Json = nlohmann::json;

/// Per-request value built once by HandlerConfig::create_context and shared,
/// read-only, by every call of the request.
using Context = Json;

using ProcedureResult = RpcResult<Json>;

struct ProcedureCall {
    const Context& ctx;
    std::string_view path;
    const Input& input;
    ProcedureType type;
};

// ═══════════════════════════════════════════════════════════════════════════
// Procedure Router
// ═══════════════════════════════════════════════════════════════════════════
// The registry the handler dispatches into. Implementations resolve the path,
// check the procedure's type and run it. Failures may be returned as
// tl::unexpected(RpcError) or thrown; unknown paths should return NOT_FOUND.
//
// Calls of one batch run concurrently on the handler's executor, so an
// implementation must not rely on being called in path order.

class IProcedureRouter {
public:
    virtual ~IProcedureRouter() = default;

    [[nodiscard]] virtual asio::awaitable<ProcedureResult> call_procedure(ProcedureCall call) = 0;
};

}  // namespace rpcbridge
