#include "OlcError.hpp"

namespace olc {

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:
            return "None";
        case ErrorKind::InvalidLength:
            return "InvalidLength";
        case ErrorKind::NotFullCode:
            return "NotFullCode";
        case ErrorKind::NotValidShortCode:
            return "NotValidShortCode";
        case ErrorKind::PaddedCode:
            return "PaddedCode";
        case ErrorKind::InvalidCoordinate:
            return "InvalidCoordinate";
    }
    return "";
}

OlcError::OlcError(ErrorKind kind, const std::string& message)
    : std::invalid_argument(message), kind_(kind) {}

}  // namespace olc
