#include "codec.hpp"

namespace bsonkit::detail {

CycleGuard::Scope::Scope(CycleGuard& guard, const void* id, const char* what)
    : guard_(guard), id_(id) {
    if (!guard_.in_progress_.insert(id_).second) {
        throw MarshalError(ErrorKind::CycleDetected, std::string(what) + " contains itself");
    }
}

CycleGuard::Scope::~Scope() {
    guard_.in_progress_.erase(id_);
}

bool CycleGuard::active(const void* id) const {
    return in_progress_.find(id) != in_progress_.end();
}

std::size_t CycleGuard::depth() const noexcept {
    return in_progress_.size();
}

} // namespace bsonkit::detail
