#include "io/ProcUtil.hpp"

#include <cstdio>
#include <cstdlib>
#include <sys/wait.h>

namespace procutil {

static int decode_status(int status) {
    if (status == -1) return -1;
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    return -1;
}

std::string run_capture_stdout(const std::string& cmdline) {
    FILE* pipe = ::popen(cmdline.c_str(), "r");
    if (!pipe) return "";

    std::string out;
    out.reserve(8192);

    char buf[4096];
    size_t n = 0;
    while ((n = std::fread(buf, 1, sizeof(buf), pipe)) > 0) {
        out.append(buf, buf + n);
    }

    const int code = decode_status(::pclose(pipe));
    if (code != 0) return "";
    return out;
}

int run_wait_exitcode(const std::string& cmdline) {
    return decode_status(std::system(cmdline.c_str()));
}

std::string shell_quote(const std::string& arg) {
    std::string o = "'";
    for (char c : arg) {
        if (c == '\'') o += "'\\''";
        else o += c;
    }
    o += "'";
    return o;
}

} // namespace procutil
