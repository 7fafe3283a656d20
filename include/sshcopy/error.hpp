#pragma once

#include <string>

namespace sshcopy {

struct CopyError {
    enum Code {
        IO,
        Parse,
        Config,
        Connection,
        DirectoryCreate,
        Transfer,
        Command,
        NotFound,
        InvalidArg
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    CopyError() = default;
    CopyError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    CopyError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    CopyError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace sshcopy
