#pragma once

#include "rpcbridge/handler/router.hpp"

#include <asio/awaitable.hpp>

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace rpcbridge {

// ─────────────────────────────────────────────────────────────────────────────
// ProcedureTable
// ─────────────────────────────────────────────────────────────────────────────
// Map-backed IProcedureRouter. A path resolves only for the type it was
// registered with, so a mutation cannot be invoked through GET.

using ProcedureFn = std::function<asio::awaitable<ProcedureResult>(const ProcedureCall&)>;

class ProcedureTable final : public IProcedureRouter {
public:
    ProcedureTable& query(std::string path, ProcedureFn fn);
    ProcedureTable& mutation(std::string path, ProcedureFn fn);

    /// Replaces any procedure already registered under path
    ProcedureTable& add(ProcedureType type, std::string path, ProcedureFn fn);

    [[nodiscard]] bool contains(std::string_view path) const;
    [[nodiscard]] std::vector<std::string> paths() const;

    [[nodiscard]] asio::awaitable<ProcedureResult> call_procedure(ProcedureCall call) override;

private:
    struct Entry {
        ProcedureType type;
        ProcedureFn fn;
    };

    std::map<std::string, Entry, std::less<>> entries_;
};

}  // namespace rpcbridge
