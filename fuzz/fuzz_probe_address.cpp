// Fuzz target for probe address parsing
// Probe addresses arrive from a remote control plane and must never crash
// the splitter or the numeric validators

#include "util/netaddress.hpp"
#include "util/string_parsing.hpp"
#include <cstddef>
#include <cstdint>
#include <string>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    using namespace liveprobe::util;

    std::string input(reinterpret_cast<const char *>(data), size);

    std::string host;
    std::string port;
    std::string error;
    bool split = SplitHostPort(input, host, port, &error);

    if (!split) {
        // A failed split must always explain itself
        if (error.empty()) {
            __builtin_trap();
        }
        return 0;
    }

    // Host and port are carved out of the input, never invented
    if (host.size() + port.size() + 1 > input.size()) {
        __builtin_trap();
    }
    if (port.find(':') != std::string::npos) {
        __builtin_trap();
    }

    auto ip = ValidateAndNormalizeIP(host);
    if (ip && host.find('%') != std::string::npos) {
        // Zoned addresses are never accepted as literals
        __builtin_trap();
    }
    if (ip) {
        // Normalized form must itself be valid and stable
        auto again = ValidateAndNormalizeIP(*ip);
        if (!again || *again != *ip) {
            __builtin_trap();
        }
    }

    auto port_number = SafeParsePortNumber(port);
    if (port_number) {
        // Only pure digit strings are accepted
        for (char c : port) {
            if (c < '0' || c > '9') {
                __builtin_trap();
            }
        }
    }

    return 0;
}
