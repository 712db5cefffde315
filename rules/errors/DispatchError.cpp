/**
 * @file rules/errors/DispatchError.cpp
 * @brief Error category for rule dispatch.
 */
#include "DispatchError.hpp"

namespace RuleGate::Rules {
namespace {

class DispatchCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "rulegate.dispatch"; }

    std::string message(int ev) const override {
        switch (static_cast<DispatchErrc>(ev)) {
            case DispatchErrc::DuplicateRegistration:
                return "duplicate handler registration";
            case DispatchErrc::RegistryAlreadySealed:
                return "registry already sealed";
            case DispatchErrc::MissingRegistration:
                return "required rule has no registered handler";
            case DispatchErrc::InvalidRegistration:
                return "invalid handler registration";
            case DispatchErrc::HandlerNotFound:
                return "handler not found";
            case DispatchErrc::HandlerTagMismatch:
                return "handler received parameters of another tag";
            case DispatchErrc::HandlerException:
                return "handler threw an exception";
            case DispatchErrc::DeadlineExceeded:
                return "handler deadline exceeded";
            case DispatchErrc::InvalidParameters:
                return "invalid rule parameters";
        }
        return "unknown dispatch error";
    }
};

} // anonymous namespace

const std::error_category& dispatch_category() noexcept {
    static DispatchCategory category;
    return category;
}

bool is_setup_error(const std::error_code& ec) noexcept {
    if (ec.category() != dispatch_category()) {
        return false;
    }
    switch (static_cast<DispatchErrc>(ec.value())) {
        case DispatchErrc::DuplicateRegistration:
        case DispatchErrc::RegistryAlreadySealed:
        case DispatchErrc::MissingRegistration:
        case DispatchErrc::InvalidRegistration:
            return true;
        default:
            return false;
    }
}

void throw_dispatch_error(DispatchErrc e, const std::string& what) {
    throw std::system_error(make_error_code(e), what);
}

} // namespace RuleGate::Rules
