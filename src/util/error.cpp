#include <sshcopy/error.hpp>

namespace sshcopy {

const char* CopyError::code_name(Code c) {
    switch (c) {
        case IO:              return "IO";
        case Parse:           return "Parse";
        case Config:          return "Config";
        case Connection:      return "Connection";
        case DirectoryCreate: return "DirectoryCreate";
        case Transfer:        return "Transfer";
        case Command:         return "Command";
        case NotFound:        return "NotFound";
        case InvalidArg:      return "InvalidArg";
    }
    return "Unknown";
}

std::string CopyError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    if (!file.empty()) {
        result += "\n  --> ";
        result += file;
        if (line > 0) {
            result += ":";
            result += std::to_string(line);
        }
    }

    return result;
}

} // namespace sshcopy
