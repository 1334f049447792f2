#include "utils/ErrorCodes.hpp"

namespace lockstore::utils
{

namespace
{

class LockStoreCategory final : public std::error_category
{
  public:
    const char *name() const noexcept override { return "lockstore"; }

    std::string message(int ev) const override
    {
        switch (static_cast<LockStoreErrc>(ev))
        {
        case LockStoreErrc::acquisition_timeout:
            return "timed out waiting for lock";
        case LockStoreErrc::document_parse_error:
            return "backing document is not valid JSON";
        case LockStoreErrc::document_not_object:
            return "backing document is not a JSON object";
        case LockStoreErrc::key_not_found:
            return "key not found";
        case LockStoreErrc::reentrant_access:
            return "re-entrant access to the same store";
        }
        return "unknown lockstore error";
    }

    std::error_condition default_error_condition(int ev) const noexcept override
    {
        switch (static_cast<LockStoreErrc>(ev))
        {
        case LockStoreErrc::acquisition_timeout:
            return std::errc::timed_out;
        case LockStoreErrc::reentrant_access:
            return std::errc::resource_deadlock_would_occur;
        default:
            return std::error_condition(ev, *this);
        }
    }
};

} // namespace

const std::error_category &lockstore_category() noexcept
{
    static const LockStoreCategory category;
    return category;
}

std::error_code make_error_code(LockStoreErrc e) noexcept
{
    return {static_cast<int>(e), lockstore_category()};
}

} // namespace lockstore::utils
