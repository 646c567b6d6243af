#pragma once

#include <stdexcept>
#include <string>

namespace camper {

/// Raised when a collection or wishlist query cannot be completed.
/// No partial result accompanies it.
class QueryError : public std::runtime_error {
public:
    enum class Kind {
        Transport,   // network failure, timeout or non-2xx status
        Decode,      // body not JSON, wrong shape, bad date
        Cancelled,   // cancel() observed before the next page fetch
    };

    QueryError(Kind kind, const std::string& what)
        : std::runtime_error(what)
        , mKind(kind) {}

    Kind kind() const noexcept { return mKind; }

private:
    Kind mKind;
};

} // namespace camper
