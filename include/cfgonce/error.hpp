#pragma once

#include <filesystem>
#include <string>
#include <system_error>

namespace cfgonce {

struct CfgError {
    enum Code {
        IO,
        PlatformDirectoryUnavailable,
        NoPathResolved,
        UnsupportedExtension,
        Decode,
        Encode,
        InvalidArg
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;       // config file the error refers to, if any
    std::error_code os_error;

    CfgError() = default;
    CfgError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    CfgError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    CfgError(Code c, std::string msg, std::string h, std::string f)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)) {}

    // IO error wrapping the underlying OS error for `path`
    static CfgError io(std::string what, const std::filesystem::path& path,
                       std::error_code ec);

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace cfgonce
