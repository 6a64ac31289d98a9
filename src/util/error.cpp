#include <cfgonce/error.hpp>

namespace cfgonce {

CfgError CfgError::io(std::string what, const std::filesystem::path& path,
                      std::error_code ec) {
    CfgError err{IO, std::move(what), "", path.string()};
    if (ec) {
        err.message += ": ";
        err.message += ec.message();
    }
    err.os_error = ec;
    return err;
}

const char* CfgError::code_name(Code c) {
    switch (c) {
        case IO:                           return "IO";
        case PlatformDirectoryUnavailable: return "PlatformDirectoryUnavailable";
        case NoPathResolved:               return "NoPathResolved";
        case UnsupportedExtension:         return "UnsupportedExtension";
        case Decode:                       return "Decode";
        case Encode:                       return "Encode";
        case InvalidArg:                   return "InvalidArg";
    }
    return "Unknown";
}

std::string CfgError::format() const {
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
    }

    return result;
}

} // namespace cfgonce
