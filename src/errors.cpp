#include "imgmgr/errors.hpp"

namespace imgmgr {

const char* to_string(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::InvalidInput:           return "InvalidInput";
    case ErrorKind::UnsupportedFormat:      return "UnsupportedFormat";
    case ErrorKind::DecodeFailure:          return "DecodeFailure";
    case ErrorKind::DirectoryCreateFailure: return "DirectoryCreateFailure";
    case ErrorKind::EncodeFailure:          return "EncodeFailure";
    }
    return "Unknown";
}

} // namespace imgmgr
