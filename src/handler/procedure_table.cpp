#include "rpcbridge/handler/procedure_table.hpp"

#include <format>
#include <stdexcept>

namespace rpcbridge {

ProcedureTable& ProcedureTable::query(std::string path, ProcedureFn fn) {
    return add(ProcedureType::Query, std::move(path), std::move(fn));
}

ProcedureTable& ProcedureTable::mutation(std::string path, ProcedureFn fn) {
    return add(ProcedureType::Mutation, std::move(path), std::move(fn));
}

ProcedureTable& ProcedureTable::add(ProcedureType type, std::string path, ProcedureFn fn) {
    if (!fn) {
        throw std::invalid_argument(std::format("Procedure '{}' has no implementation", path));
    }
    entries_.insert_or_assign(std::move(path), Entry{type, std::move(fn)});
    return *this;
}

bool ProcedureTable::contains(std::string_view path) const {
    return entries_.find(path) != entries_.end();
}

std::vector<std::string> ProcedureTable::paths() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& [path, entry] : entries_) {
        result.push_back(path);
    }
    return result;
}

asio::awaitable<ProcedureResult> ProcedureTable::call_procedure(ProcedureCall call) {
    const auto it = entries_.find(call.path);
    if ((it == entries_.end()) || (it->second.type != call.type)) {
        co_return tl::unexpected(RpcError::not_found(
            std::format("No \"{}\"-procedure on path \"{}\"", to_string(call.type), call.path)));
    }
    co_return co_await it->second.fn(call);
}

}  // namespace rpcbridge
