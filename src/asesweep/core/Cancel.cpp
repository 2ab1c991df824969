#include "asesweep/core/Cancel.hpp"
#include "asesweep/core/Errors.hpp"

namespace asesweep {

void CancelToken::throwIfRequested() const {
    if (requested()) throw CancelledError();
}

} // namespace asesweep
