#include "errors.hpp"

namespace sfuctl {

const char* ReasonName(RtcErrorCode code) {
    switch (code) {
        case RtcErrorCode::NoError: return "NO_ERROR";
        case RtcErrorCode::InvalidConstraintsType: return "INVALID_CONSTRAINTS_TYPE";
        case RtcErrorCode::InvalidCandidateType: return "INVALID_CANDIDATE_TYPE";
        case RtcErrorCode::InvalidState: return "INVALID_STATE";
        case RtcErrorCode::InvalidSessionDescription: return "INVALID_SESSION_DESCRIPTION";
        case RtcErrorCode::IncompatibleSessionDescription: return "INCOMPATIBLE_SESSION_DESCRIPTION";
        case RtcErrorCode::IncompatibleConstraints: return "INCOMPATIBLE_CONSTRAINTS";
        case RtcErrorCode::InternalError: return "INTERNAL_ERROR";
    }
    return "INTERNAL_ERROR";
}

RtcError::RtcError(RtcErrorCode code)
    : std::runtime_error(ReasonName(code))
    , Code_(code)
{ }

RtcError::RtcError(RtcErrorCode code, const std::string& message)
    : std::runtime_error(message)
    , Code_(code)
{ }

} // namespace sfuctl
