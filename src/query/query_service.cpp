#include "query/query_service.hpp"

#include <utility>

QueryService::QueryService(std::shared_ptr<const AttackerIndex> index)
    : index_{std::move(index)}
{}

std::expected<AttackerList, QueryError>
QueryService::attackers_of(const std::string& vm_id) const {
    const AttackerSet* attackers = index_ ? index_->find(vm_id) : nullptr;
    if (attackers == nullptr) {
        return std::unexpected(QueryError{
            .code  = QueryErrorCode::kNotFound,
            .vm_id = vm_id,
        });
    }
    return AttackerList(attackers->begin(), attackers->end());
}

std::size_t QueryService::vm_count() const noexcept {
    return index_ ? index_->vm_count() : 0;
}
