#pragma once

#include <stdexcept>
#include <string>

namespace sfuctl {

enum class RtcErrorCode {
    NoError,
    InvalidConstraintsType,
    InvalidCandidateType,
    InvalidState,
    InvalidSessionDescription,
    IncompatibleSessionDescription,
    IncompatibleConstraints,
    InternalError,
};

const char* ReasonName(RtcErrorCode code);

class RtcError : public std::runtime_error {
public:
    explicit RtcError(RtcErrorCode code);
    RtcError(RtcErrorCode code, const std::string& message);

    RtcErrorCode Code() const {
        return Code_;
    }

    const char* Reason() const {
        return ReasonName(Code_);
    }

private:
    RtcErrorCode Code_;
};

} // namespace sfuctl
